#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/event_loop.hpp"
#include "proto/framer.hpp"
#include "transfer/transfer_engine.hpp"
#include "transport/ichannel.hpp"

namespace app
{

struct StatusReport
{
    transfer::State state{transfer::State::Idle};
    bool            connected{false};
    std::string     transport;
    std::uint64_t   session{0};  // 0 when idle
};

// Owns the event-loop thread and the transfer engine for one channel.
// Every public call is marshalled onto the loop and may be made from any
// thread (control-socket workers).
class DispenserService
{
  public:
    DispenserService(transport::IChannel &ch, transfer::Options opt);
    ~DispenserService();
    DispenserService(const DispenserService &)            = delete;
    DispenserService &operator=(const DispenserService &) = delete;

    bool start();
    void stop();
    bool running() const { return running_.load(); }

    // Wraps the schedule in the start/end sentinels and starts a transfer.
    // A transfer already running is superseded.
    transfer::Status send_schedule(const framer::Payload &schedule, transfer::TransferHandle &out);
    bool             cancel();
    StatusReport     status();

    const transfer::Options &options() const { return opt_; }
    transport::IChannel     &channel() { return ch_; }

  private:
    template <typename R>
    R call(std::function<R()> fn, R fallback);

    transport::IChannel                      &ch_;
    transfer::Options                         opt_;
    std::unique_ptr<core::EventLoop>          loop_;
    std::unique_ptr<transfer::TransferEngine> engine_;
    std::thread                               thr_;
    std::atomic_bool                          running_{false};
    std::mutex                                post_mu_;  // orders posts against stop()
};

}  // namespace app
