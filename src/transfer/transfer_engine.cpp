#include <algorithm>
#include <vector>

#include "transfer/transfer_engine.hpp"
#include "util/log.hpp"

namespace transfer
{

const char *to_string(Status s)
{
    switch (s)
    {
        case Status::Ok:
            return "ok";
        case Status::InvalidArgument:
            return "invalid argument";
        case Status::NotConnected:
            return "device not connected";
    }
    return "?";
}

const char *to_string(Outcome o)
{
    switch (o)
    {
        case Outcome::Completed:
            return "completed";
        case Outcome::TimedOut:
            return "timed-out";
        case Outcome::Cancelled:
            return "cancelled";
        case Outcome::Disconnected:
            return "disconnected";
        case Outcome::LinkError:
            return "link-error";
        case Outcome::Superseded:
            return "superseded";
    }
    return "?";
}

const char *to_string(State s)
{
    switch (s)
    {
        case State::Idle:
            return "idle";
        case State::Sending:
            return "sending";
        case State::AwaitingAck:
            return "awaiting-ack";
    }
    return "?";
}

struct TransferEngine::Session
{
    std::uint64_t                       gen{0};
    std::vector<framer::Frame>          frames;
    std::size_t                         next_index{0};
    bool                                active{true};
    core::EventLoop::Clock::time_point  started_at{};
    std::size_t                         payload_len{0};
    Options                             opt;
    transport::IChannel                *channel{nullptr};
    transport::SubscriptionId           inbound_sub{0};
    transport::SubscriptionId           lost_sub{0};
    core::EventLoop::TimerId            dispatch_timer{0};
    core::EventLoop::TimerId            timeout_timer{0};
    std::promise<TransferResult>        done;
    std::shared_ptr<ProgressStream>     progress;
};

static bool contains_marker(const transport::Bytes &data, const std::string &marker)
{
    if (marker.empty() || data.size() < marker.size())
        return false;
    return std::search(data.begin(), data.end(), marker.begin(), marker.end(),
                       [](std::uint8_t a, char b) { return a == static_cast<std::uint8_t>(b); }) !=
           data.end();
}

TransferEngine::TransferEngine(core::EventLoop &loop)
    : loop_(loop), alive_(std::make_shared<bool>(true))
{
}

TransferEngine::~TransferEngine()
{
    if (session_)
        resolve(false, Outcome::Cancelled, std::string(DETAIL_CANCELLED));
    alive_.reset();
}

std::uint64_t TransferEngine::session_id() const
{
    return session_ ? session_->gen : 0;
}

State TransferEngine::state() const
{
    if (!session_)
        return State::Idle;
    return session_->next_index < session_->frames.size() ? State::Sending : State::AwaitingAck;
}

bool TransferEngine::live(std::uint64_t gen) const
{
    return session_ && session_->gen == gen && session_->active;
}

// ======================================================================
// Function: TransferEngine::begin_transfer
// - In: payload (moved in), a connected channel, transfer options
// - Out: Status::Ok and a filled handle, or a fail-fast status with no I/O
// - Note: an active session is resolved as Superseded before the new one
//         schedules its first frame
// ======================================================================
Status TransferEngine::begin_transfer(framer::Payload      payload,
                                      transport::IChannel &channel,
                                      const Options       &opt,
                                      TransferHandle      &out)
{
    if (opt.chunk_size == 0)
    {
        LOG_ERROR("[XFER] begin_transfer: chunk_size must be > 0");
        return Status::InvalidArgument;
    }
    if (opt.ack_marker.empty())
    {
        LOG_ERROR("[XFER] begin_transfer: empty completion marker");
        return Status::InvalidArgument;
    }
    if (!channel.is_connected())
    {
        LOG_ERROR("[XFER] begin_transfer: channel %s not connected", channel.name().c_str());
        return Status::NotConnected;
    }

    auto frames = framer::split(payload, opt.chunk_size);
    if (frames.empty())
        return Status::InvalidArgument;

    if (session_)
    {
        LOG_SYSTEM("[XFER] session %llu superseded by a new transfer",
                   (unsigned long long)session_->gen);
        resolve(false, Outcome::Superseded, std::string(DETAIL_SUPERSEDED));
    }

    auto s         = std::make_unique<Session>();
    s->gen         = next_gen_++;
    s->frames      = std::move(frames);
    s->started_at  = loop_.now();
    s->payload_len = payload.size();
    s->opt         = opt;
    s->channel     = &channel;
    s->progress    = std::make_shared<ProgressStream>();

    // Channel callbacks may come from the channel's I/O thread: hop onto the loop.
    const std::uint64_t gen  = s->gen;
    core::EventLoop    *loop = &loop_;
    std::weak_ptr<bool> alive = alive_;
    s->inbound_sub = channel.subscribe_inbound([this, loop, alive, gen](const transport::Bytes &d) {
        loop->post([this, alive, gen, d] {
            if (alive.lock())
                on_inbound(gen, d);
        });
    });
    s->lost_sub = channel.on_disconnected([this, loop, alive, gen](const std::string &why) {
        loop->post([this, alive, gen, why] {
            if (alive.lock())
                on_channel_lost(gen, why);
        });
    });

    out.id_       = gen;
    out.total_    = s->frames.front().total;
    out.progress_ = s->progress;
    out.done_     = s->done.get_future().share();

    s->dispatch_timer = loop_.post_after(std::chrono::milliseconds(0), [this, alive, gen] {
        if (alive.lock())
            dispatch(gen);
    });

    LOG_SYSTEM("[XFER] session %llu started: %zu bytes in %u frames (chunk=%zu delay=%lldms "
               "timeout=%lldms) via %s",
               (unsigned long long)gen, s->payload_len, (unsigned)out.total_, opt.chunk_size,
               (long long)opt.inter_frame_delay.count(), (long long)opt.timeout.count(),
               channel.name().c_str());
    session_ = std::move(s);
    return Status::Ok;
}

bool TransferEngine::cancel()
{
    if (!session_)
        return false;
    LOG_SYSTEM("[XFER] session %llu cancelled by caller", (unsigned long long)session_->gen);
    resolve(false, Outcome::Cancelled, std::string(DETAIL_CANCELLED));
    return true;
}

// ======================================================================
// Function: TransferEngine::dispatch
// - In: generation of the session that scheduled this tick
// - Out: writes one frame, emits its progress event, schedules the next
//        frame or, after the last one, the acknowledgment timeout
// - Note: fire-and-forget write, the only ack is the end-of-transfer marker
// ======================================================================
void TransferEngine::dispatch(std::uint64_t gen)
{
    if (!live(gen))
        return;  // cancelled or superseded before this tick fired

    Session &s       = *session_;
    s.dispatch_timer = 0;

    if (!s.channel->is_connected())
    {
        LOG_SYSTEM("[XFER] session %llu: channel down before frame %zu/%zu",
                   (unsigned long long)gen, s.next_index + 1, s.frames.size());
        resolve(false, Outcome::Disconnected, std::string(DETAIL_DISCONNECTED));
        return;
    }

    const framer::Frame &f = s.frames[s.next_index];
    std::string          err;
    if (!s.channel->write(f.bytes, err))
    {
        if (err.empty())
            err = "write failed";
        LOG_SYSTEM("[XFER] session %llu: link error on frame %u/%u: %s", (unsigned long long)gen,
                   (unsigned)f.seq, (unsigned)f.total, err.c_str());
        resolve(false, Outcome::LinkError, err);
        return;
    }

    s.progress->push(ProgressEvent{f.seq, f.total});
    s.next_index++;
    LOG_DEBUG("[XFER] frame %u/%u sent (%zu bytes)", (unsigned)f.seq, (unsigned)f.total,
              f.bytes.size());

    std::weak_ptr<bool> alive = alive_;
    if (s.next_index < s.frames.size())
    {
        s.dispatch_timer = loop_.post_after(s.opt.inter_frame_delay, [this, alive, gen] {
            if (alive.lock())
                dispatch(gen);
        });
        return;
    }

    LOG_INFO("[XFER] all %zu frames sent, waiting for '%s'", s.frames.size(),
             s.opt.ack_marker.c_str());
    s.timeout_timer = loop_.post_after(s.opt.timeout, [this, alive, gen] {
        if (alive.lock())
            on_timeout(gen);
    });
}

void TransferEngine::on_inbound(std::uint64_t gen, const transport::Bytes &data)
{
    if (!live(gen))
        return;
    if (!contains_marker(data, session_->opt.ack_marker))
    {
        LOG_DEBUG("[XFER] ignoring %zu inbound bytes (no marker)", data.size());
        return;
    }
    if (session_->next_index < session_->frames.size())
    {
        LOG_WARN("[XFER] marker arrived after %zu/%zu frames; finishing early",
                 session_->next_index, session_->frames.size());
    }
    resolve(true, Outcome::Completed, std::nullopt);
}

void TransferEngine::on_channel_lost(std::uint64_t gen, const std::string &reason)
{
    if (!live(gen))
        return;
    LOG_SYSTEM("[XFER] session %llu: device disconnected (%s)", (unsigned long long)gen,
               reason.c_str());
    resolve(false, Outcome::Disconnected, std::string(DETAIL_DISCONNECTED));
}

void TransferEngine::on_timeout(std::uint64_t gen)
{
    if (!live(gen))
        return;
    session_->timeout_timer = 0;
    resolve(false, Outcome::TimedOut, std::string(DETAIL_TIMED_OUT));
}

// ======================================================================
// Function: TransferEngine::resolve
// - In: terminal outcome of the live session
// - Out: timers cancelled, channel unsubscribed, progress closed, future set,
//        session destroyed
// - Note: the only place a session ends, so the result is set exactly once
// ======================================================================
void TransferEngine::resolve(bool success, Outcome outcome, std::optional<std::string> detail)
{
    if (!session_)
        return;
    std::unique_ptr<Session> s = std::move(session_);
    s->active                  = false;

    if (s->dispatch_timer)
        loop_.cancel(s->dispatch_timer);
    if (s->timeout_timer)
        loop_.cancel(s->timeout_timer);
    s->channel->unsubscribe(s->inbound_sub);
    s->channel->unsubscribe(s->lost_sub);
    s->progress->close();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(loop_.now() -
                                                                               s->started_at);
    if (success)
    {
        LOG_SYSTEM("[XFER] session %llu complete: %zu/%zu frames acknowledged in %lldms",
                   (unsigned long long)s->gen, s->next_index, s->frames.size(),
                   (long long)elapsed.count());
    }
    else
    {
        LOG_SYSTEM("[XFER] session %llu failed (%s) after %zu/%zu frames: %s",
                   (unsigned long long)s->gen, to_string(outcome), s->next_index,
                   s->frames.size(), detail ? detail->c_str() : "");
    }

    TransferResult r;
    r.success = success;
    r.detail  = std::move(detail);
    r.outcome = outcome;
    s->done.set_value(std::move(r));
}

}  // namespace transfer
