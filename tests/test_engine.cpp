#include <atomic>
#include <chrono>
#include <condition_variable>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "crypto/digest.hpp"
#include "mem_sink.hpp"
#include "proto/classify.hpp"
#include "xfer/engine.hpp"

using namespace xfer;
using proto::Chunk;

namespace
{

struct Recorder
{
    std::vector<Event> events;
    OnEvent            fn()
    {
        return [this](const Event &ev) { events.push_back(ev); };
    }
    std::size_t count(EventKind k) const
    {
        std::size_t n = 0;
        for (const auto &e : events)
            n += (e.kind == k);
        return n;
    }
};

std::string tag_of(const std::string &body)
{
    return integrity::sha256_hex(reinterpret_cast<const std::uint8_t *>(body.data()),
                                 body.size());
}

Options body_scope()
{
    Options o;
    o.scope = integrity::Scope::BodyOnly;
    return o;
}

void feed(Engine &e, const std::vector<Chunk> &chunks)
{
    for (const auto &c : chunks)
        e.on_chunk(c);
}

}  // namespace

TEST(Engine, StartsIdle)
{
    MemSink sink;
    Engine  e(sink);
    EXPECT_EQ(e.phase(), Phase::Idle);
    EXPECT_EQ(e.bytes_received(), 0u);
    EXPECT_EQ(e.last_error(), Error::None);
}

TEST(Engine, IgnoresChunksWhileIdle)
{
    MemSink  sink;
    Engine   e(sink);
    Recorder rec;
    e.set_listener(rec.fn());

    e.on_chunk({0x41, 0x42});
    e.on_chunk({0x03});  // stray end marker, lenient
    e.on_chunk({});

    EXPECT_EQ(e.phase(), Phase::Idle);
    EXPECT_TRUE(rec.events.empty());
    EXPECT_TRUE(sink.written.empty());
}

TEST(Engine, StartEntersReceiving)
{
    MemSink  sink;
    Engine   e(sink);
    Recorder rec;
    e.set_listener(rec.fn());

    e.on_chunk({0x02, 0x41, 0x42});  // start chunk carries no payload
    EXPECT_EQ(e.phase(), Phase::Receiving);
    EXPECT_EQ(e.bytes_received(), 0u);
    ASSERT_EQ(rec.events.size(), 1u);
    EXPECT_EQ(rec.events[0].kind, EventKind::Started);
}

TEST(Engine, ProgressCountsBytes)
{
    MemSink  sink;
    Engine   e(sink);
    Recorder rec;
    e.set_listener(rec.fn());

    feed(e, {{0x02}, {0x41, 0x42}, {0x43}, {0x44, 0x45, 0x46}});
    EXPECT_EQ(e.bytes_received(), 6u);
    ASSERT_EQ(rec.count(EventKind::Progress), 3u);
    EXPECT_EQ(rec.events[1].bytes, 2u);
    EXPECT_EQ(rec.events[2].bytes, 3u);
    EXPECT_EQ(rec.events[3].bytes, 6u);
}

TEST(Engine, CompletesWithBodyScope)
{
    MemSink     sink;
    Engine      e(sink, body_scope());
    Recorder    rec;
    std::string body = "payload split over several notifications";
    e.set_listener(rec.fn());

    feed(e, proto::make_transfer(bytes_of(body), 5));

    EXPECT_EQ(e.phase(), Phase::Completed);
    EXPECT_EQ(e.last_error(), Error::None);
    ASSERT_EQ(sink.written.size(), 1u);
    EXPECT_EQ(sink.written[0], bytes_of(body + tag_of(body)));
    EXPECT_TRUE(sink.removed.empty());

    ASSERT_FALSE(rec.events.empty());
    const Event &last = rec.events.back();
    EXPECT_EQ(last.kind, EventKind::Completed);
    EXPECT_EQ(last.handle, "mem-1");
    EXPECT_EQ(last.bytes, body.size() + integrity::TAG_HEX_LEN);
}

// Start, "AB", "C", hex(sha256("ABC")), End: 67 bytes persisted and hashed in full.
TEST(Engine, ConcreteScenarioFullScope)
{
    MemSink  sink;
    Engine   e(sink);
    Recorder rec;
    e.set_listener(rec.fn());

    feed(e, {{0x02}, {0x41, 0x42}, {0x43}, bytes_of(tag_of("ABC")), {0x03}});

    ASSERT_EQ(sink.written.size(), 1u);
    EXPECT_EQ(sink.written[0].size(), 67u);
    EXPECT_EQ(e.phase(), Phase::Failed);
    EXPECT_EQ(e.last_error(), Error::IntegrityMismatch);
    ASSERT_EQ(rec.events.back().kind, EventKind::Failed);
    EXPECT_EQ(rec.events.back().error, Error::IntegrityMismatch);
    // the rejected file does not stay in storage
    EXPECT_EQ(sink.removed, std::vector<store::FileHandle>{"mem-1"});
    EXPECT_TRUE(sink.files.empty());
}

TEST(Engine, ConcreteScenarioBodyScope)
{
    MemSink sink;
    Engine  e(sink, body_scope());

    feed(e, {{0x02}, {0x41, 0x42}, {0x43}, bytes_of(tag_of("ABC")), {0x03}});

    EXPECT_EQ(e.phase(), Phase::Completed);
    ASSERT_EQ(sink.files.size(), 1u);
    EXPECT_EQ(sink.files.begin()->second.size(), 67u);
}

TEST(Engine, EndChunkBytesAreDropped)
{
    MemSink sink;
    Engine  e(sink, body_scope());

    const std::string body = "xyz";
    feed(e, {{0x02}, bytes_of(body), bytes_of(tag_of(body)), {0x5a, 0x5a, 0x03}});

    EXPECT_EQ(e.phase(), Phase::Completed);
    ASSERT_EQ(sink.written.size(), 1u);
    EXPECT_EQ(sink.written[0], bytes_of(body + tag_of(body)));
}

TEST(Engine, StartThenEndIsEmptyContent)
{
    MemSink sink;
    Engine  e(sink);

    feed(e, {{0x02}, {0x03}});

    EXPECT_EQ(e.phase(), Phase::Failed);
    EXPECT_EQ(e.last_error(), Error::EmptyContent);
    EXPECT_TRUE(sink.files.empty());
}

TEST(Engine, ShortContentIsMalformed)
{
    MemSink sink;
    Engine  e(sink);

    feed(e, {{0x02}, {0x41, 0x42, 0x43}, {0x03}});

    EXPECT_EQ(e.last_error(), Error::MalformedTrailer);
    EXPECT_TRUE(sink.files.empty());
}

TEST(Engine, DuplicateStartKeepsBufferedBytes)
{
    MemSink  sink;
    Engine   e(sink);
    Recorder rec;
    e.set_listener(rec.fn());

    feed(e, {{0x02}, {0x41}, {0x42}, {0x43}, {0x02}});

    EXPECT_EQ(e.phase(), Phase::Receiving);
    EXPECT_EQ(rec.count(EventKind::Started), 1u);
    // a second start marker is ordinary payload once receiving
    EXPECT_EQ(e.bytes_received(), 4u);

    e.on_chunk({0x03});
    ASSERT_EQ(sink.written.size(), 1u);
    EXPECT_EQ(sink.written[0], (std::vector<std::uint8_t>{0x41, 0x42, 0x43, 0x02}));
}

TEST(Engine, PayloadEndingInEndMarkerTerminates)
{
    MemSink sink;
    Engine  e(sink);

    // no escaping: a payload chunk whose last byte is 0x03 ends the transfer
    feed(e, {{0x02}, {0x41, 0x42}, {0x10, 0x03}});

    EXPECT_NE(e.phase(), Phase::Receiving);
    ASSERT_EQ(sink.written.size(), 1u);
    EXPECT_EQ(sink.written[0], (std::vector<std::uint8_t>{0x41, 0x42}));
}

TEST(Engine, WriteFailureIsIoError)
{
    MemSink sink;
    sink.fail_write = true;
    Engine e(sink, body_scope());

    feed(e, proto::make_transfer(bytes_of("abc"), 16));

    EXPECT_EQ(e.phase(), Phase::Failed);
    EXPECT_EQ(e.last_error(), Error::IoError);
}

TEST(Engine, ReadBackFailureIsIoErrorAndRemoves)
{
    MemSink sink;
    sink.fail_read = true;
    Engine e(sink, body_scope());

    feed(e, proto::make_transfer(bytes_of("abc"), 16));

    EXPECT_EQ(e.last_error(), Error::IoError);
    EXPECT_EQ(sink.removed.size(), 1u);
    EXPECT_TRUE(sink.files.empty());
}

TEST(Engine, NewTransferAfterFailure)
{
    MemSink sink;
    Engine  e(sink, body_scope());

    feed(e, {{0x02}, {0x41}, {0x03}});
    ASSERT_EQ(e.phase(), Phase::Failed);

    // anything but a start marker keeps the failed state
    e.on_chunk({0x41});
    EXPECT_EQ(e.phase(), Phase::Failed);

    feed(e, proto::make_transfer(bytes_of("second"), 8));
    EXPECT_EQ(e.phase(), Phase::Completed);
    EXPECT_EQ(e.last_error(), Error::None);
    ASSERT_EQ(sink.written.size(), 2u);
    EXPECT_EQ(sink.written[1], bytes_of("second" + tag_of("second")));
}

TEST(Engine, NewTransferAfterCompletion)
{
    MemSink sink;
    Engine  e(sink, body_scope());

    feed(e, proto::make_transfer(bytes_of("one"), 8));
    ASSERT_EQ(e.phase(), Phase::Completed);

    e.on_chunk({0x02});
    EXPECT_EQ(e.phase(), Phase::Receiving);
    EXPECT_EQ(e.bytes_received(), 0u);

    feed(e, {bytes_of("two"), bytes_of(tag_of("two")), {0x03}});
    EXPECT_EQ(e.phase(), Phase::Completed);
    EXPECT_EQ(sink.files.size(), 2u);
}

TEST(Engine, OversizeFailsAndDiscards)
{
    MemSink sink;
    Options o;
    o.max_transfer_bytes = 4;
    Engine e(sink, o);

    feed(e, {{0x02}, {0x41, 0x42, 0x43}});
    EXPECT_EQ(e.phase(), Phase::Receiving);
    e.on_chunk({0x44, 0x45});

    EXPECT_EQ(e.phase(), Phase::Failed);
    EXPECT_EQ(e.last_error(), Error::Oversize);
    EXPECT_EQ(e.bytes_received(), 0u);

    // rest of the stream is ignored until the next start
    feed(e, {{0x46}, {0x03}});
    EXPECT_EQ(e.phase(), Phase::Failed);
    EXPECT_TRUE(sink.written.empty());
}

TEST(Engine, StrictModeReportsStrayEnd)
{
    MemSink sink;
    Options o;
    o.strict = true;
    Engine   e(sink, o);
    Recorder rec;
    e.set_listener(rec.fn());

    e.on_chunk({0x41, 0x03});

    EXPECT_EQ(e.phase(), Phase::Idle);
    EXPECT_EQ(e.last_error(), Error::ProtocolViolation);
    ASSERT_EQ(rec.events.size(), 1u);
    EXPECT_EQ(rec.events[0].kind, EventKind::Failed);
    EXPECT_EQ(rec.events[0].error, Error::ProtocolViolation);

    // the next transfer is unaffected
    e.on_chunk({0x02});
    EXPECT_EQ(e.phase(), Phase::Receiving);
    EXPECT_EQ(e.last_error(), Error::None);
}

TEST(Engine, DisconnectWhileReceivingCancels)
{
    MemSink  sink;
    Engine   e(sink);
    Recorder rec;
    e.set_listener(rec.fn());

    feed(e, {{0x02}, {0x41, 0x42}});
    e.on_disconnect();

    EXPECT_EQ(e.phase(), Phase::Failed);
    EXPECT_EQ(e.last_error(), Error::Cancelled);
    EXPECT_EQ(e.bytes_received(), 0u);
    EXPECT_EQ(rec.events.back().error, Error::Cancelled);
    EXPECT_TRUE(sink.written.empty());
}

TEST(Engine, AbortWhileIdleIsNoop)
{
    MemSink  sink;
    Engine   e(sink);
    Recorder rec;
    e.set_listener(rec.fn());

    e.abort();
    e.on_disconnect();

    EXPECT_EQ(e.phase(), Phase::Idle);
    EXPECT_EQ(e.last_error(), Error::None);
    EXPECT_TRUE(rec.events.empty());
}

namespace
{

// Blocks write() until released so a test can act while the engine is finalizing.
struct GatedSink : MemSink
{
    std::mutex              mu;
    std::condition_variable cv;
    bool                    entered = false;
    bool                    open    = false;

    std::optional<store::FileHandle> write(const std::vector<std::uint8_t> &content) override
    {
        std::unique_lock<std::mutex> lk(mu);
        entered = true;
        cv.notify_all();
        cv.wait(lk, [this] { return open; });
        return MemSink::write(content);
    }

    void wait_entered()
    {
        std::unique_lock<std::mutex> lk(mu);
        cv.wait(lk, [this] { return entered; });
    }

    void release()
    {
        std::lock_guard<std::mutex> lk(mu);
        open = true;
        cv.notify_all();
    }
};

}  // namespace

TEST(Engine, AbortWhileFinalizingCancelsAndRemoves)
{
    GatedSink sink;
    Engine    e(sink, body_scope());
    Recorder  rec;
    e.set_listener(rec.fn());

    const auto chunks = proto::make_transfer(bytes_of("gated"), 64);
    for (std::size_t i = 0; i + 1 < chunks.size(); ++i)
        e.on_chunk(chunks[i]);

    std::thread th([&] { e.on_chunk(chunks.back()); });
    sink.wait_entered();

    EXPECT_EQ(e.phase(), Phase::Finalizing);
    // chunks arriving while finalizing are dropped
    e.on_chunk({0x02});
    e.on_chunk({0x41});
    e.abort();

    sink.release();
    th.join();

    EXPECT_EQ(e.phase(), Phase::Failed);
    EXPECT_EQ(e.last_error(), Error::Cancelled);
    EXPECT_EQ(sink.removed, std::vector<store::FileHandle>{"mem-1"});
    EXPECT_TRUE(sink.files.empty());
    EXPECT_EQ(rec.count(EventKind::Completed), 0u);
    EXPECT_EQ(rec.events.back().error, Error::Cancelled);
}

TEST(Engine, EventsFromOtherThreadsKeepStateOrder)
{
    MemSink sink;
    Engine  e(sink);

    std::mutex              mu;
    std::condition_variable cv;
    std::vector<EventKind>  seen;
    bool                    in_progress = false;
    bool                    open        = false;

    e.set_listener([&](const Event &ev) {
        std::unique_lock<std::mutex> lk(mu);
        seen.push_back(ev.kind);
        if (ev.kind == EventKind::Progress)
        {
            in_progress = true;
            cv.notify_all();
            cv.wait(lk, [&] { return open; });
        }
    });

    e.on_chunk({0x02});
    std::thread rx([&] { e.on_chunk({0x41}); });
    {
        std::unique_lock<std::mutex> lk(mu);
        cv.wait(lk, [&] { return in_progress; });
    }

    // the Progress listener call is still running; cancel from another thread
    std::thread ctl([&] { e.abort(); });
    for (int i = 0; i < 200 && e.phase() != Phase::Failed; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_EQ(e.phase(), Phase::Failed);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    {
        std::lock_guard<std::mutex> lk(mu);
        EXPECT_EQ(seen.size(), 2u);  // Failed waits for Progress
        open = true;
        cv.notify_all();
    }

    rx.join();
    ctl.join();
    const std::vector<EventKind> want{EventKind::Started, EventKind::Progress, EventKind::Failed};
    EXPECT_EQ(seen, want);
}
