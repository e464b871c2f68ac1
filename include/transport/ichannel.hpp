#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace transport
{

using Bytes          = std::vector<std::uint8_t>;
using OnData         = std::function<void(const Bytes &)>;
using OnDisconnected = std::function<void(const std::string &reason)>;
using SubscriptionId = std::uint64_t;

// Per-start link settings. Addressing (adapter, UUIDs, peer) belongs to the
// concrete channel's own config.
struct Settings
{
    std::size_t mtu_payload = 20;
};

// An established link to one dispenser. Callbacks may fire on the channel's
// own I/O thread; consumers must hop onto their own queue.
struct IChannel
{
    virtual bool        start(const Settings &s) = 0;
    virtual void        stop()                   = 0;
    virtual std::string name() const { return ""; }

    virtual bool is_connected() const = 0;
    // one frame == one link write; false + err filled on link error
    virtual bool write(const Bytes &frame, std::string &err) = 0;

    virtual SubscriptionId subscribe_inbound(OnData cb)          = 0;
    virtual SubscriptionId on_disconnected(OnDisconnected cb)    = 0;
    virtual void           unsubscribe(SubscriptionId id)        = 0;

    virtual ~IChannel() = default;
};

}  // namespace transport
