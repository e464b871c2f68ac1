// tests/test_transfer_engine.cpp
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "core/event_loop.hpp"
#include "transfer/transfer_engine.hpp"
#include "transport/subscribers.hpp"

using namespace std::chrono_literals;
using namespace transfer;
using core::EventLoop;

namespace
{

// Scripted dispenser link: records every write with the loop time it happened at.
class FakeChannel : public transport::IChannel
{
  public:
    explicit FakeChannel(const EventLoop::Clock::time_point &now) : now_(now) {}

    bool        start(const transport::Settings &) override { return true; }
    void        stop() override {}
    std::string name() const override { return "fake"; }
    bool        is_connected() const override { return connected; }

    bool write(const transport::Bytes &frame, std::string &err) override
    {
        if (!fail_with.empty())
        {
            err = fail_with;
            return false;
        }
        frames.push_back(frame);
        times.push_back(now_);
        return true;
    }

    transport::SubscriptionId subscribe_inbound(transport::OnData cb) override
    {
        return subs.add_inbound(std::move(cb));
    }
    transport::SubscriptionId on_disconnected(transport::OnDisconnected cb) override
    {
        return subs.add_disconnected(std::move(cb));
    }
    void unsubscribe(transport::SubscriptionId id) override { subs.remove(id); }

    void notify(const std::string &s)
    {
        subs.notify_inbound(transport::Bytes(s.begin(), s.end()));
    }
    void drop(const std::string &why)
    {
        connected = false;
        subs.notify_disconnected(why);
    }

    bool                                      connected = true;
    std::string                               fail_with;
    std::vector<transport::Bytes>             frames;
    std::vector<EventLoop::Clock::time_point> times;
    transport::SubscriberSet                  subs;

  private:
    const EventLoop::Clock::time_point &now_;
};

framer::Payload gen_bytes(std::size_t n)
{
    framer::Payload v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>('a' + i % 26);
    return v;
}

bool is_ready(const TransferHandle &h)
{
    return h.completion().wait_for(0s) == std::future_status::ready;
}

class TransferEngineTest : public ::testing::Test
{
  protected:
    TransferEngineTest() : loop([this] { return now; }), ch(now), engine(loop)
    {
        opt.chunk_size        = 20;
        opt.inter_frame_delay = 500ms;
        opt.timeout           = 10000ms;
        opt.ack_marker        = "A";
    }

    void advance(std::chrono::milliseconds d)
    {
        now += d;
        loop.run_pending();
    }

    EventLoop::Clock::time_point now{};
    EventLoop                    loop;
    FakeChannel                  ch;
    TransferEngine               engine;
    Options                      opt;
};

}  // namespace

TEST_F(TransferEngineTest, ThreeFramesThenMarkerCompletes)
{
    TransferHandle h;
    ASSERT_EQ(engine.begin_transfer(gen_bytes(45), ch, opt, h), Status::Ok);
    ASSERT_TRUE(h.valid());
    EXPECT_EQ(h.total_frames(), 3u);
    EXPECT_EQ(engine.state(), State::Sending);

    advance(0ms);
    advance(500ms);
    advance(500ms);
    ASSERT_EQ(ch.frames.size(), 3u);
    EXPECT_EQ(ch.frames[0].size(), 20u);
    EXPECT_EQ(ch.frames[1].size(), 20u);
    EXPECT_EQ(ch.frames[2].size(), 5u);
    const auto t0 = EventLoop::Clock::time_point{};
    EXPECT_EQ(ch.times[0], t0);
    EXPECT_EQ(ch.times[1], t0 + 500ms);
    EXPECT_EQ(ch.times[2], t0 + 1000ms);
    EXPECT_EQ(engine.state(), State::AwaitingAck);
    EXPECT_FALSE(is_ready(h));

    now += 50ms;
    ch.notify("A");
    loop.run_pending();

    ASSERT_TRUE(is_ready(h));
    const TransferResult r = h.completion().get();
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.outcome, Outcome::Completed);
    EXPECT_FALSE(r.detail.has_value());
    EXPECT_EQ(engine.state(), State::Idle);
    EXPECT_EQ(ch.subs.size(), 0u);

    std::vector<std::uint32_t> seqs;
    ProgressEvent              ev;
    while (h.progress().next(ev))
    {
        EXPECT_EQ(ev.total, 3u);
        seqs.push_back(ev.seq);
    }
    EXPECT_EQ(seqs, (std::vector<std::uint32_t>{1, 2, 3}));
}

TEST_F(TransferEngineTest, TimesOutExactlyAfterLastFrame)
{
    TransferHandle h;
    ASSERT_EQ(engine.begin_transfer(gen_bytes(45), ch, opt, h), Status::Ok);
    advance(0ms);
    advance(500ms);
    advance(500ms);  // last frame at t=1000

    advance(9999ms);
    EXPECT_FALSE(is_ready(h));
    advance(1ms);
    ASSERT_TRUE(is_ready(h));

    const TransferResult r = h.completion().get();
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.outcome, Outcome::TimedOut);
    EXPECT_EQ(r.detail.value_or(""), DETAIL_TIMED_OUT);
}

TEST_F(TransferEngineTest, MarkerAfterTimeoutIsIgnored)
{
    TransferHandle h;
    opt.timeout = 100ms;
    ASSERT_EQ(engine.begin_transfer(gen_bytes(5), ch, opt, h), Status::Ok);
    advance(0ms);
    advance(100ms);
    ASSERT_TRUE(is_ready(h));

    ch.notify("A");
    loop.run_pending();
    EXPECT_EQ(h.completion().get().outcome, Outcome::TimedOut);
}

TEST_F(TransferEngineTest, NonMarkerNotificationsAreIgnored)
{
    TransferHandle h;
    ASSERT_EQ(engine.begin_transfer(gen_bytes(5), ch, opt, h), Status::Ok);
    advance(0ms);

    ch.notify("OK?");
    ch.notify("");
    loop.run_pending();
    EXPECT_FALSE(is_ready(h));

    ch.notify("xxAxx");
    loop.run_pending();
    ASSERT_TRUE(is_ready(h));
    EXPECT_TRUE(h.completion().get().success);
}

TEST_F(TransferEngineTest, CancelStopsFurtherFrames)
{
    TransferHandle h;
    ASSERT_EQ(engine.begin_transfer(gen_bytes(45), ch, opt, h), Status::Ok);
    advance(0ms);
    ASSERT_EQ(ch.frames.size(), 1u);

    EXPECT_TRUE(engine.cancel());
    EXPECT_FALSE(engine.cancel());
    ASSERT_TRUE(is_ready(h));
    const TransferResult r = h.completion().get();
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.outcome, Outcome::Cancelled);
    EXPECT_EQ(r.detail.value_or(""), DETAIL_CANCELLED);

    advance(20000ms);
    EXPECT_EQ(ch.frames.size(), 1u);
    EXPECT_EQ(loop.pending_timers(), 0u);
    EXPECT_TRUE(h.progress().closed());
}

TEST_F(TransferEngineTest, NewTransferSupersedesActiveOne)
{
    TransferHandle first;
    ASSERT_EQ(engine.begin_transfer(gen_bytes(45), ch, opt, first), Status::Ok);
    advance(0ms);

    TransferHandle second;
    ASSERT_EQ(engine.begin_transfer(gen_bytes(10), ch, opt, second), Status::Ok);
    ASSERT_TRUE(is_ready(first));
    const TransferResult r1 = first.completion().get();
    EXPECT_EQ(r1.outcome, Outcome::Superseded);
    EXPECT_EQ(r1.detail.value_or(""), DETAIL_SUPERSEDED);
    EXPECT_NE(first.session_id(), second.session_id());
    EXPECT_EQ(engine.session_id(), second.session_id());

    advance(0ms);
    advance(500ms);
    // one frame of the first payload, one of the second; no stray 20-byte frame
    ASSERT_EQ(ch.frames.size(), 2u);
    EXPECT_EQ(ch.frames[1].size(), 10u);

    ch.notify("A");
    loop.run_pending();
    EXPECT_TRUE(second.completion().get().success);
}

TEST_F(TransferEngineTest, DisconnectDuringTransferFails)
{
    TransferHandle h;
    ASSERT_EQ(engine.begin_transfer(gen_bytes(45), ch, opt, h), Status::Ok);
    advance(0ms);

    ch.drop("peer went away");
    loop.run_pending();
    ASSERT_TRUE(is_ready(h));
    const TransferResult r = h.completion().get();
    EXPECT_EQ(r.outcome, Outcome::Disconnected);
    EXPECT_EQ(r.detail.value_or(""), DETAIL_DISCONNECTED);

    advance(1000ms);
    EXPECT_EQ(ch.frames.size(), 1u);
}

TEST_F(TransferEngineTest, ChannelDownAtNextFrameFails)
{
    TransferHandle h;
    ASSERT_EQ(engine.begin_transfer(gen_bytes(45), ch, opt, h), Status::Ok);
    advance(0ms);

    ch.connected = false;  // no disconnect notification
    advance(500ms);
    ASSERT_TRUE(is_ready(h));
    EXPECT_EQ(h.completion().get().outcome, Outcome::Disconnected);
    EXPECT_EQ(ch.frames.size(), 1u);
}

TEST_F(TransferEngineTest, WriteErrorReportsLinkDetail)
{
    TransferHandle h;
    ASSERT_EQ(engine.begin_transfer(gen_bytes(45), ch, opt, h), Status::Ok);
    advance(0ms);

    ch.fail_with = "org.bluez.Error.Failed: Not connected";
    advance(500ms);
    ASSERT_TRUE(is_ready(h));
    const TransferResult r = h.completion().get();
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.outcome, Outcome::LinkError);
    EXPECT_EQ(r.detail.value_or(""), "org.bluez.Error.Failed: Not connected");

    // the progress stream only carries the frame that went out
    ProgressEvent ev;
    ASSERT_TRUE(h.progress().next(ev));
    EXPECT_EQ(ev.seq, 1u);
    EXPECT_FALSE(h.progress().next(ev));
}

TEST_F(TransferEngineTest, FailFastLeavesActiveSessionAlone)
{
    TransferHandle active;
    ASSERT_EQ(engine.begin_transfer(gen_bytes(5), ch, opt, active), Status::Ok);
    advance(0ms);
    const auto id = engine.session_id();

    Options        bad = opt;
    TransferHandle h;
    bad.chunk_size = 0;
    EXPECT_EQ(engine.begin_transfer(gen_bytes(5), ch, bad, h), Status::InvalidArgument);
    bad            = opt;
    bad.ack_marker = "";
    EXPECT_EQ(engine.begin_transfer(gen_bytes(5), ch, bad, h), Status::InvalidArgument);
    EXPECT_FALSE(h.valid());

    FakeChannel offline(now);
    offline.connected = false;
    EXPECT_EQ(engine.begin_transfer(gen_bytes(5), offline, opt, h), Status::NotConnected);
    EXPECT_TRUE(offline.frames.empty());
    EXPECT_EQ(offline.subs.size(), 0u);

    EXPECT_EQ(engine.session_id(), id);
    EXPECT_FALSE(is_ready(active));
    ch.notify("A");
    loop.run_pending();
    EXPECT_TRUE(active.completion().get().success);
}

TEST_F(TransferEngineTest, EarlyMarkerFinishesSession)
{
    TransferHandle h;
    ASSERT_EQ(engine.begin_transfer(gen_bytes(45), ch, opt, h), Status::Ok);
    advance(0ms);

    ch.notify("A");
    loop.run_pending();
    ASSERT_TRUE(is_ready(h));
    EXPECT_TRUE(h.completion().get().success);

    advance(1000ms);
    EXPECT_EQ(ch.frames.size(), 1u);
}

TEST_F(TransferEngineTest, EmptyPayloadSendsOneEmptyFrame)
{
    TransferHandle h;
    ASSERT_EQ(engine.begin_transfer(framer::Payload{}, ch, opt, h), Status::Ok);
    EXPECT_EQ(h.total_frames(), 1u);
    advance(0ms);
    ASSERT_EQ(ch.frames.size(), 1u);
    EXPECT_TRUE(ch.frames[0].empty());

    ch.notify("A");
    loop.run_pending();
    EXPECT_TRUE(h.completion().get().success);
}

TEST_F(TransferEngineTest, DestroyingEngineCancelsSession)
{
    TransferHandle h;
    {
        TransferEngine local(loop);
        ASSERT_EQ(local.begin_transfer(gen_bytes(45), ch, opt, h), Status::Ok);
    }
    ASSERT_TRUE(is_ready(h));
    EXPECT_EQ(h.completion().get().outcome, Outcome::Cancelled);

    // the dispatch tick it left behind was cancelled
    advance(1000ms);
    EXPECT_TRUE(ch.frames.empty());
}
