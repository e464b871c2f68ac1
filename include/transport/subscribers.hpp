#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "transport/ichannel.hpp"

namespace transport
{

// Thread-safe callback registry shared by the channel implementations.
// Inbound and disconnect subscriptions share one id space so a single
// unsubscribe(id) works for both. Callbacks run outside the lock, so a
// callback may unsubscribe itself.
class SubscriberSet
{
  public:
    SubscriptionId add_inbound(OnData cb)
    {
        std::lock_guard<std::mutex> lk(mu_);
        const SubscriptionId        id = next_id_++;
        inbound_.emplace(id, std::move(cb));
        return id;
    }

    SubscriptionId add_disconnected(OnDisconnected cb)
    {
        std::lock_guard<std::mutex> lk(mu_);
        const SubscriptionId        id = next_id_++;
        disconnected_.emplace(id, std::move(cb));
        return id;
    }

    void remove(SubscriptionId id)
    {
        std::lock_guard<std::mutex> lk(mu_);
        inbound_.erase(id);
        disconnected_.erase(id);
    }

    void clear()
    {
        std::lock_guard<std::mutex> lk(mu_);
        inbound_.clear();
        disconnected_.clear();
    }

    void notify_inbound(const Bytes &data) const
    {
        std::vector<OnData> cbs;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (const auto &kv : inbound_)
                cbs.push_back(kv.second);
        }
        for (const auto &cb : cbs)
            if (cb)
                cb(data);
    }

    void notify_disconnected(const std::string &reason) const
    {
        std::vector<OnDisconnected> cbs;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (const auto &kv : disconnected_)
                cbs.push_back(kv.second);
        }
        for (const auto &cb : cbs)
            if (cb)
                cb(reason);
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return inbound_.size() + disconnected_.size();
    }

  private:
    mutable std::mutex                       mu_;
    SubscriptionId                           next_id_{1};
    std::map<SubscriptionId, OnData>         inbound_;
    std::map<SubscriptionId, OnDisconnected> disconnected_;
};

}  // namespace transport
