#pragma once

#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <thread>
#include "streams.hpp"

// Unbuffered rendezvous conduit between one producer thread and one consumer.
//
// write() hands its buffer to the reader and blocks until every byte has been
// taken; nothing is copied into an intermediate store. read() blocks until
// bytes are offered or the write side closes (then returns 0).
//
// Closing the read side wakes a blocked writer with PipeClosedError, and any
// later write fails the same way.
class PipeBridge {
public:
    PipeBridge();

    PipeBridge(const PipeBridge&) = delete;
    PipeBridge& operator=(const PipeBridge&) = delete;

    void write(const char* data, size_t len);
    size_t read(char* buf, size_t len);

    // `aborted` makes a reader that drains the pipe see an error instead of
    // a clean end of stream.
    void close_write(bool aborted = false);
    void close_read();

    ByteSink& writer() { return writer_; }
    ByteSource& reader() { return reader_; }

private:
    class Writer : public ByteSink {
    public:
        explicit Writer(PipeBridge& p) : p_(p) {}
        void write(const char* data, size_t len) override { p_.write(data, len); }
    private:
        PipeBridge& p_;
    };

    class Reader : public ByteSource {
    public:
        explicit Reader(PipeBridge& p) : p_(p) {}
        size_t read(char* buf, size_t len) override { return p_.read(buf, len); }
    private:
        PipeBridge& p_;
    };

    std::mutex mu_;
    std::condition_variable cv_;
    const char* pending_ = nullptr;
    size_t pending_len_ = 0;
    bool write_closed_ = false;
    bool write_aborted_ = false;
    bool read_closed_ = false;

    Writer writer_;
    Reader reader_;
};

// Runs a producer on its own thread, writing into a PipeBridge. The write
// side is closed exactly once when the producer returns or throws. The
// producer's exception is kept in a single slot and rethrown by wait().
class ProducerTask {
public:
    using Producer = std::function<void(ByteSink&)>;

    ProducerTask(PipeBridge& pipe, Producer producer);
    ~ProducerTask();

    ProducerTask(const ProducerTask&) = delete;
    ProducerTask& operator=(const ProducerTask&) = delete;

    // Join the producer thread; rethrow its exception, if any.
    void wait();

private:
    PipeBridge& pipe_;
    std::promise<void> slot_;
    std::future<void> result_;
    std::thread thread_;
};

// Connect `produce` to `consume` through a PipeBridge. The consumer runs on
// the calling thread. A producer failure wins over the consumer failure it
// caused; a PipeClosedError in the producer is reported as the consumer's
// error.
void run_bridged(const ProducerTask::Producer& produce,
                 const std::function<void(ByteSource&)>& consume);
