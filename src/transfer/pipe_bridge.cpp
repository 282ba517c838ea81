#include "pipe_bridge.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cstring>

// ── PipeBridge ─────────────────────────────────────────────

PipeBridge::PipeBridge() : writer_(*this), reader_(*this) {}

void PipeBridge::write(const char* data, size_t len) {
    if (len == 0) return;

    std::unique_lock<std::mutex> lock(mu_);
    if (read_closed_) throw PipeClosedError();
    if (write_closed_) throw NexcliError("write after close");

    pending_ = data;
    pending_len_ = len;
    cv_.notify_all();

    cv_.wait(lock, [this]() { return pending_len_ == 0 || read_closed_; });
    if (pending_len_ > 0) {
        pending_ = nullptr;
        pending_len_ = 0;
        throw PipeClosedError();
    }
}

size_t PipeBridge::read(char* buf, size_t len) {
    if (len == 0) return 0;

    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this]() { return pending_len_ > 0 || write_closed_ || read_closed_; });

    if (read_closed_) return 0;
    if (pending_len_ == 0) {
        if (write_aborted_) throw NexcliError("stream producer failed");
        return 0;
    }

    size_t n = std::min(len, pending_len_);
    std::memcpy(buf, pending_, n);
    pending_ += n;
    pending_len_ -= n;
    if (pending_len_ == 0) {
        pending_ = nullptr;
        cv_.notify_all();
    }
    return n;
}

void PipeBridge::close_write(bool aborted) {
    std::lock_guard<std::mutex> lock(mu_);
    if (write_closed_) return;
    write_closed_ = true;
    write_aborted_ = aborted;
    cv_.notify_all();
}

void PipeBridge::close_read() {
    std::lock_guard<std::mutex> lock(mu_);
    read_closed_ = true;
    cv_.notify_all();
}

// ── ProducerTask ───────────────────────────────────────────

namespace {

struct WriteCloser {
    PipeBridge& pipe;
    bool aborted = false;
    ~WriteCloser() { pipe.close_write(aborted); }
};

} // namespace

ProducerTask::ProducerTask(PipeBridge& pipe, Producer producer)
    : pipe_(pipe), result_(slot_.get_future()) {
    thread_ = std::thread([this, producer = std::move(producer)]() {
        WriteCloser closer{pipe_};
        try {
            producer(pipe_.writer());
            slot_.set_value();
        } catch (...) {
            closer.aborted = true;
            slot_.set_exception(std::current_exception());
        }
    });
}

ProducerTask::~ProducerTask() {
    if (thread_.joinable()) {
        pipe_.close_read();
        thread_.join();
    }
}

void ProducerTask::wait() {
    if (thread_.joinable()) thread_.join();
    result_.get();
}

// ── run_bridged ────────────────────────────────────────────

void run_bridged(const ProducerTask::Producer& produce,
                 const std::function<void(ByteSource&)>& consume) {
    PipeBridge pipe;
    ProducerTask producer(pipe, produce);

    std::exception_ptr consumer_error;
    try {
        consume(pipe.reader());
    } catch (const std::exception& e) {
        nexcli_log(fmt::format("pipe consumer failed: {}", e.what()));
        consumer_error = std::current_exception();
    }
    // Unblocks a producer the consumer stopped listening to
    pipe.close_read();

    try {
        producer.wait();
    } catch (const PipeClosedError&) {
        if (consumer_error) std::rethrow_exception(consumer_error);
        throw NexcliError("stream consumer stopped before the producer finished");
    } catch (const std::exception& e) {
        nexcli_log(fmt::format("pipe producer failed: {}", e.what()));
        throw;
    }

    if (consumer_error) std::rethrow_exception(consumer_error);
}
