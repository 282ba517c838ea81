#include "console.hpp"
#include "theme.hpp"
#include <platform/platform.hpp>
#include <iostream>

Console::Console(Verbosity level, std::ostream& out, std::ostream& err, bool tty)
    : level_(level), out_(out), err_(err), tty_(tty) {}

Console::Console(Verbosity level)
    : Console(level, std::cout, std::cerr, platform::stdout_is_tty()) {}

void Console::emit(std::ostream& os, const std::string& text) {
    std::lock_guard<std::mutex> lock(mu_);
    os << text;
    os.flush();
}

void Console::ok(const std::string& msg) {
    if (!quiet()) emit(out_, theme::ok(msg));
}

void Console::info(const std::string& msg) {
    if (!quiet()) emit(out_, theme::info(msg));
}

void Console::step(const std::string& msg) {
    if (!quiet()) emit(out_, theme::step(msg));
}

void Console::warn(const std::string& msg) {
    if (!quiet()) emit(err_, theme::warn(msg));
}

void Console::detail(const std::string& msg) {
    if (verbose()) emit(out_, theme::log(msg));
}

void Console::error(const std::string& msg) {
    emit(err_, theme::fail(msg));
}

void Console::result(const std::string& msg) {
    emit(out_, msg + "\n");
}
