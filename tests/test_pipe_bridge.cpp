#include <gtest/gtest.h>
#include <transfer/pipe_bridge.hpp>
#include <transfer/streams.hpp>
#include <core/errors.hpp>
#include <string>

TEST(PipeBridge, CarriesEveryByteInOrder) {
    std::string payload;
    for (int i = 0; i < 100000; i++) payload += static_cast<char>('a' + i % 26);

    std::string received;
    run_bridged(
        [&](ByteSink& sink) {
            for (size_t off = 0; off < payload.size(); off += 4093) {
                sink.write(payload.data() + off, std::min<size_t>(4093, payload.size() - off));
            }
        },
        [&](ByteSource& src) {
            StringSink out;
            copy_stream(src, out);
            received = out.data();
        });

    EXPECT_EQ(received, payload);
}

TEST(PipeBridge, ProducerErrorReachesCaller) {
    try {
        run_bridged(
            [](ByteSink& sink) {
                sink.write("abc", 3);
                throw ProtocolError("download failed with status 500", 500);
            },
            [](ByteSource& src) {
                StringSink out;
                copy_stream(src, out);
            });
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.status(), 500);
    }
}

TEST(PipeBridge, ConsumerErrorUnblocksProducer) {
    // The consumer gives up after the first read; the producer must not hang.
    EXPECT_THROW(
        run_bridged(
            [](ByteSink& sink) {
                std::string chunk(1024, 'x');
                for (int i = 0; i < 100; i++) sink.write(chunk.data(), chunk.size());
            },
            [](ByteSource& src) {
                char buf[16];
                src.read(buf, sizeof(buf));
                throw IntegrityError("bad data");
            }),
        IntegrityError);
}

TEST(PipeBridge, ConsumerStoppingEarlyIsAnError) {
    EXPECT_THROW(
        run_bridged(
            [](ByteSink& sink) {
                std::string chunk(1024, 'x');
                for (int i = 0; i < 10; i++) sink.write(chunk.data(), chunk.size());
            },
            [](ByteSource& src) {
                char buf[16];
                src.read(buf, sizeof(buf));
            }),
        NexcliError);
}

TEST(PipeBridge, WriteAfterReadCloseFails) {
    PipeBridge pipe;
    pipe.close_read();
    EXPECT_THROW(pipe.write("x", 1), PipeClosedError);
    char c;
    EXPECT_EQ(pipe.read(&c, 1), 0u);
}

TEST(PipeBridge, AbortedWriterIsNotACleanEnd) {
    PipeBridge pipe;
    pipe.close_write(true);
    char c;
    EXPECT_THROW(pipe.read(&c, 1), NexcliError);

    PipeBridge clean;
    clean.close_write();
    EXPECT_EQ(clean.read(&c, 1), 0u);
}
