#include "transport/loopback_channel.hpp"
#include "proto/envelope.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackChannel: a fake dispenser to test the pipeline (CLI -> daemon -> engine) without BLE.
LoopbackChannel::LoopbackChannel(std::string ack_marker) : ack_marker_(std::move(ack_marker)) {}

bool LoopbackChannel::start(const Settings &s)
{
    mtu_ = s.mtu_payload;
    {
        std::lock_guard<std::mutex> lk(mu_);
        rx_buf_.clear();
    }
    started_.store(true);
    connected_.store(true);
    return true;
}

void LoopbackChannel::stop()
{
    started_.store(false);
    connected_.store(false);
    subs_.clear();
    std::lock_guard<std::mutex> lk(mu_);
    rx_buf_.clear();
}

bool LoopbackChannel::is_connected() const
{
    return started_.load() && connected_.load();
}

bool LoopbackChannel::write(const Bytes &frame, std::string &err)
{
    if (!is_connected())
    {
        err = "not connected";
        return false;
    }
    if (mtu_ != 0 && frame.size() > mtu_)
    {
        err = "frame of " + std::to_string(frame.size()) + " bytes exceeds mtu " +
              std::to_string(mtu_);
        return false;
    }
    frames_.fetch_add(1);

    bool complete = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        rx_buf_.insert(rx_buf_.end(), frame.begin(), frame.end());
        if (auto msg = envelope::take_message(rx_buf_))
        {
            last_msg_ = std::move(*msg);
            complete  = true;
        }
    }
    if (complete)
    {
        messages_.fetch_add(1);
        LOG_DEBUG("[LOOPBACK] message complete (%zu bytes)", last_message().size());
        if (auto_ack_.load())
            subs_.notify_inbound(Bytes(ack_marker_.begin(), ack_marker_.end()));
    }
    return true;
}

SubscriptionId LoopbackChannel::subscribe_inbound(OnData cb)
{
    return subs_.add_inbound(std::move(cb));
}

SubscriptionId LoopbackChannel::on_disconnected(OnDisconnected cb)
{
    return subs_.add_disconnected(std::move(cb));
}

void LoopbackChannel::unsubscribe(SubscriptionId id)
{
    subs_.remove(id);
}

void LoopbackChannel::disconnect(const std::string &reason)
{
    if (!connected_.exchange(false))
        return;
    LOG_DEBUG("[LOOPBACK] disconnect: %s", reason.c_str());
    subs_.notify_disconnected(reason);
}

void LoopbackChannel::reconnect()
{
    if (started_.load())
        connected_.store(true);
}

Bytes LoopbackChannel::last_message() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return last_msg_;
}

}  // namespace transport
