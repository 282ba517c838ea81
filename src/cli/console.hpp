#pragma once

#include <string>
#include <mutex>
#include <ostream>

enum class Verbosity { Quiet, Normal, Verbose };

// Serialized, level-aware wrapper around the theme helpers. Shared by every
// worker of a transfer.
class Console {
public:
    Console(Verbosity level, std::ostream& out, std::ostream& err, bool tty);
    explicit Console(Verbosity level = Verbosity::Normal);

    Console(const Console&) = delete;
    Console& operator=(const Console&) = delete;

    Verbosity level() const { return level_; }
    bool quiet() const { return level_ == Verbosity::Quiet; }
    bool verbose() const { return level_ == Verbosity::Verbose; }

    // Progress bars are drawn only on an interactive, non-quiet console.
    bool show_progress() const { return tty_ && !quiet(); }
    std::ostream& out() { return out_; }

    void ok(const std::string& msg);
    void info(const std::string& msg);
    void step(const std::string& msg);
    void warn(const std::string& msg);

    // Verbose-only detail line
    void detail(const std::string& msg);

    // Printed even when quiet
    void error(const std::string& msg);
    void result(const std::string& msg);

private:
    void emit(std::ostream& os, const std::string& text);

    Verbosity level_;
    std::ostream& out_;
    std::ostream& err_;
    bool tty_;
    std::mutex mu_;
};
