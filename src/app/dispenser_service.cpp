#include <utility>

#include "app/dispenser_service.hpp"
#include "proto/envelope.hpp"
#include "util/log.hpp"

namespace app
{

DispenserService::DispenserService(transport::IChannel &ch, transfer::Options opt)
    : ch_(ch), opt_(std::move(opt))
{
}

DispenserService::~DispenserService()
{
    stop();
}

// Run fn on the loop thread and wait for its result.
template <typename R>
R DispenserService::call(std::function<R()> fn, R fallback)
{
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    auto fut  = task->get_future();
    {
        std::lock_guard<std::mutex> lk(post_mu_);
        if (!running_.load())
            return fallback;
        if (loop_->in_loop_thread())
        {
            (*task)();
            return fut.get();
        }
        loop_->post([task] { (*task)(); });
    }
    return fut.get();
}

// ======================================================================
// Function: DispenserService::start
// - Out: channel started and loop thread running
// - Note: the channel may still be connecting, send_schedule reports it
// ======================================================================
bool DispenserService::start()
{
    if (running_.load())
        return true;

    transport::Settings s{};
    s.mtu_payload = opt_.chunk_size;
    if (!ch_.start(s))
    {
        LOG_ERROR("channel %s failed to start", ch_.name().c_str());
        return false;
    }

    loop_   = std::make_unique<core::EventLoop>();
    engine_ = std::make_unique<transfer::TransferEngine>(*loop_);
    running_.store(true);
    thr_ = std::thread([this] { loop_->run(); });

    LOG_SYSTEM("Dispenser service up: transport=%s chunk=%zu delay=%lldms timeout=%lldms "
               "marker='%s'",
               ch_.name().c_str(), opt_.chunk_size, (long long)opt_.inter_frame_delay.count(),
               (long long)opt_.timeout.count(), opt_.ack_marker.c_str());
    return true;
}

void DispenserService::stop()
{
    if (!running_.load())
        return;

    // an active transfer ends as Cancelled so waiting clients get their answer
    (void)call<bool>([this] { return engine_->cancel(); }, false);
    {
        std::lock_guard<std::mutex> lk(post_mu_);
        running_.store(false);
    }
    loop_->stop();
    if (thr_.joinable())
        thr_.join();
    // answer calls that were posted before the flag flipped
    (void)loop_->run_pending();
    engine_.reset();
    ch_.stop();
    loop_.reset();
    LOG_SYSTEM("Dispenser service stopped");
}

transfer::Status DispenserService::send_schedule(const framer::Payload    &schedule,
                                                 transfer::TransferHandle &out)
{
    framer::Payload payload = envelope::wrap(schedule);
    LOG_INFO("send_schedule: %zu schedule bytes, %zu on the wire", schedule.size(),
             payload.size());

    struct Started
    {
        transfer::Status         st{transfer::Status::NotConnected};
        transfer::TransferHandle h;
    };
    auto started = call<Started>(
        [this, &payload] {
            Started s;
            s.st = engine_->begin_transfer(std::move(payload), ch_, opt_, s.h);
            return s;
        },
        Started{});
    out = std::move(started.h);
    return started.st;
}

bool DispenserService::cancel()
{
    return call<bool>([this] { return engine_->cancel(); }, false);
}

StatusReport DispenserService::status()
{
    StatusReport fallback;
    fallback.connected = ch_.is_connected();
    fallback.transport = ch_.name();
    return call<StatusReport>(
        [this] {
            StatusReport r;
            r.state     = engine_->state();
            r.session   = engine_->session_id();
            r.connected = ch_.is_connected();
            r.transport = ch_.name();
            return r;
        },
        fallback);
}

}  // namespace app
