// tests/test_dispenser_service.cpp
#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "app/dispenser_service.hpp"
#include "proto/envelope.hpp"
#include "transport/loopback_channel.hpp"

using namespace std::chrono_literals;

static framer::Payload schedule_bytes()
{
    const std::string s =
        "{\"schedules\":[{\"slot\":1,\"time\":\"08:00\"},{\"slot\":2,\"time\":\"20:00\"}]}";
    return framer::Payload(s.begin(), s.end());
}

static transfer::Options fast_options()
{
    transfer::Options o;
    o.chunk_size        = 20;
    o.inter_frame_delay = 2ms;
    o.timeout           = 300ms;
    return o;
}

TEST(DispenserService, SendsWrappedScheduleOverLoopback)
{
    transport::LoopbackChannel ch;
    app::DispenserService      svc(ch, fast_options());
    ASSERT_TRUE(svc.start());

    const framer::Payload    schedule = schedule_bytes();
    transfer::TransferHandle h;
    ASSERT_EQ(svc.send_schedule(schedule, h), transfer::Status::Ok);

    const std::size_t wire = envelope::wrap(schedule).size();
    EXPECT_EQ(h.total_frames(), framer::frame_count(wire, 20));

    std::uint32_t           last = 0;
    transfer::ProgressEvent ev;
    while (h.progress().next(ev))
    {
        EXPECT_EQ(ev.seq, last + 1);
        last = ev.seq;
    }
    EXPECT_EQ(last, h.total_frames());

    const transfer::TransferResult r = h.completion().get();
    EXPECT_TRUE(r.success);
    EXPECT_EQ(ch.last_message(), schedule);
    EXPECT_EQ(ch.frames_written(), h.total_frames());

    const app::StatusReport st = svc.status();
    EXPECT_EQ(st.state, transfer::State::Idle);
    EXPECT_TRUE(st.connected);
    EXPECT_EQ(st.transport, "loopback");
    svc.stop();
    EXPECT_FALSE(svc.running());
}

TEST(DispenserService, SilentDispenserTimesOut)
{
    transport::LoopbackChannel ch;
    app::DispenserService      svc(ch, fast_options());
    ASSERT_TRUE(svc.start());
    ch.set_auto_ack(false);

    transfer::TransferHandle h;
    ASSERT_EQ(svc.send_schedule(schedule_bytes(), h), transfer::Status::Ok);
    const transfer::TransferResult r = h.completion().get();
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.outcome, transfer::Outcome::TimedOut);
}

TEST(DispenserService, CancelAndStopAnswerWaitingCallers)
{
    transfer::Options o = fast_options();
    o.inter_frame_delay = 200ms;

    transport::LoopbackChannel ch;
    app::DispenserService      svc(ch, o);
    ASSERT_TRUE(svc.start());
    EXPECT_FALSE(svc.cancel());

    transfer::TransferHandle h;
    ASSERT_EQ(svc.send_schedule(schedule_bytes(), h), transfer::Status::Ok);
    EXPECT_NE(svc.status().session, 0u);
    EXPECT_TRUE(svc.cancel());
    EXPECT_EQ(h.completion().get().outcome, transfer::Outcome::Cancelled);

    transfer::TransferHandle h2;
    ASSERT_EQ(svc.send_schedule(schedule_bytes(), h2), transfer::Status::Ok);
    svc.stop();
    ASSERT_EQ(h2.completion().wait_for(0s), std::future_status::ready);
    EXPECT_EQ(h2.completion().get().outcome, transfer::Outcome::Cancelled);
}

TEST(DispenserService, DisconnectedChannelFailsFast)
{
    transport::LoopbackChannel ch;
    app::DispenserService      svc(ch, fast_options());
    ASSERT_TRUE(svc.start());
    ch.disconnect();

    transfer::TransferHandle h;
    EXPECT_EQ(svc.send_schedule(schedule_bytes(), h), transfer::Status::NotConnected);
    EXPECT_FALSE(h.valid());
    EXPECT_EQ(ch.frames_written(), 0u);
    EXPECT_FALSE(svc.status().connected);
}

TEST(DispenserService, CallsBeforeStartFailQuietly)
{
    transport::LoopbackChannel ch;
    app::DispenserService      svc(ch, fast_options());

    transfer::TransferHandle h;
    EXPECT_EQ(svc.send_schedule(schedule_bytes(), h), transfer::Status::NotConnected);
    EXPECT_FALSE(svc.cancel());
    EXPECT_EQ(svc.status().state, transfer::State::Idle);
}
