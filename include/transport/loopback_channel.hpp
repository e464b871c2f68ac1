#pragma once
#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>

#include "transport/ichannel.hpp"
#include "transport/subscribers.hpp"
#include "util/constants.hpp"

namespace transport
{

// LoopbackChannel: a simulated dispenser. Writes are accumulated; once a full
// "#START#...#END#" message has arrived the completion marker is notified back.
class LoopbackChannel final : public IChannel
{
  public:
    explicit LoopbackChannel(std::string ack_marker = std::string(constants::ACK_MARKER));

    bool        start(const Settings &s) override;
    void        stop() override;
    std::string name() const override { return "loopback"; }

    bool is_connected() const override;
    bool write(const Bytes &frame, std::string &err) override;

    SubscriptionId subscribe_inbound(OnData cb) override;
    SubscriptionId on_disconnected(OnDisconnected cb) override;
    void           unsubscribe(SubscriptionId id) override;

    // test/dev controls
    void        disconnect(const std::string &reason = "link dropped");
    void        reconnect();
    void        set_auto_ack(bool on) { auto_ack_.store(on); }
    std::size_t frames_written() const { return frames_.load(); }
    std::size_t messages_received() const { return messages_.load(); }
    Bytes       last_message() const;

  private:
    std::string         ack_marker_;
    std::size_t         mtu_{0};
    std::atomic_bool    started_{false};
    std::atomic_bool    connected_{false};
    std::atomic_bool    auto_ack_{true};
    std::atomic<std::size_t> frames_{0};
    std::atomic<std::size_t> messages_{0};
    mutable std::mutex  mu_;
    Bytes               rx_buf_;
    Bytes               last_msg_;
    SubscriberSet       subs_;
};

}  // namespace transport
