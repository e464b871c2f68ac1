#pragma once
#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "core/event_loop.hpp"
#include "proto/framer.hpp"
#include "transfer/progress_stream.hpp"
#include "transfer/transfer_types.hpp"
#include "transport/ichannel.hpp"

namespace transfer
{

// What the caller keeps from begin_transfer(): the progress stream for this
// session and a future that resolves exactly once with its result.
class TransferHandle
{
  public:
    bool          valid() const { return progress_ != nullptr; }
    std::uint64_t session_id() const { return id_; }
    std::uint32_t total_frames() const { return total_; }

    ProgressStream                    &progress() const { return *progress_; }
    std::shared_future<TransferResult> completion() const { return done_; }

  private:
    friend class TransferEngine;
    std::uint64_t                      id_{0};
    std::uint32_t                      total_{0};
    std::shared_ptr<ProgressStream>    progress_;
    std::shared_future<TransferResult> done_;
};

/**
 * TransferEngine: chunked schedule upload over one IChannel.
 *
 *   Idle -> Sending -> AwaitingAck -> Completed | TimedOut | Cancelled |
 *                                     Disconnected | LinkError | Superseded
 *
 * All methods must run on the loop the engine was built with. Channel
 * callbacks are re-posted onto that loop and every timer/callback carries the
 * session generation, so late events from a resolved or superseded session
 * are dropped.
 */
class TransferEngine
{
  public:
    explicit TransferEngine(core::EventLoop &loop);
    ~TransferEngine();
    TransferEngine(const TransferEngine &)            = delete;
    TransferEngine &operator=(const TransferEngine &) = delete;

    // Fails fast (nothing sent, active session untouched) on a bad option or
    // a disconnected channel. Otherwise supersedes any active session and
    // schedules the first frame.
    Status begin_transfer(framer::Payload      payload,
                          transport::IChannel &channel,
                          const Options       &opt,
                          TransferHandle      &out);

    // false when there is nothing to cancel
    bool cancel();

    State         state() const;
    bool          active() const { return session_ != nullptr; }
    std::uint64_t session_id() const;

  private:
    struct Session;

    bool live(std::uint64_t gen) const;
    void dispatch(std::uint64_t gen);
    void on_inbound(std::uint64_t gen, const transport::Bytes &data);
    void on_channel_lost(std::uint64_t gen, const std::string &reason);
    void on_timeout(std::uint64_t gen);
    void resolve(bool success, Outcome outcome, std::optional<std::string> detail);

    core::EventLoop         &loop_;
    std::unique_ptr<Session> session_;
    std::uint64_t            next_gen_{1};
    std::shared_ptr<bool>    alive_;  // posted callbacks hold a weak_ptr
};

}  // namespace transfer
