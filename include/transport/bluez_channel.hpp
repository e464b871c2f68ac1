#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "transport/ichannel.hpp"
#include "transport/subscribers.hpp"
#include "util/constants.hpp"

#if PILLBOX_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace
{
// TU-local wrapper to unref and null a slot ptr
inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}
}  // namespace

#endif

namespace transport
{

struct BluezConfig
{
    std::string                adapter   = "hci0";
    std::string                svc_uuid  = std::string(constants::SVC_UUID);
    std::string                data_uuid = std::string(constants::DATA_UUID);  // write + notify
    std::optional<std::string> peer_addr{};  // dispenser to connect to, if known
};

struct PeerInfo
{
    std::string addr;
    int16_t     rssi{0};
    std::string name;
};

// BLE central link to one dispenser over BlueZ (sd-bus).
// Ready (is_connected) means Device1.Connected and notifications enabled on
// the data characteristic.
class BluezChannel final : public IChannel
{
  public:
    explicit BluezChannel(BluezConfig cfg);
    ~BluezChannel() override;

    bool        start(const Settings &s) override;
    void        stop() override;
    std::string name() const override;

    bool is_connected() const override;
    bool write(const Bytes &frame, std::string &err) override;

    SubscriptionId subscribe_inbound(OnData cb) override;
    SubscriptionId on_disconnected(OnDisconnected cb) override;
    void           unsubscribe(SubscriptionId id) override;

    // discovery / connection control
    std::vector<PeerInfo> list_peers();
    bool                  connect_to(const std::string &addr);  // "" drops the link
    void                  request_candidate_refresh();

    const BluezConfig &config() const { return cfg_; }
    bool is_running() const noexcept { return running_.load(std::memory_order_relaxed); }

    // called from the D-Bus signal handlers (bus thread, bus_mu held)
    const std::string &dev_path() const;
    void               adopt_device(const std::string &path);
    bool               connected() const;
    void               set_connected(bool v);
    void               set_services_resolved(bool v);
    void               set_connect_inflight(bool v);
    void               set_next_connect_at_ms(uint64_t ms);
    void               note_candidate(const std::string &addr, int16_t rssi,
                                      const std::string &name);
    void               deliver_inbound(const uint8_t *data, size_t len);
    void               link_lost(const std::string &reason);
    bool               is_data_path(const char *path) const;

  private:
    BluezConfig      cfg_;
    Settings         settings_{};
    std::atomic_bool running_{false};
    SubscriberSet    subs_;

    struct Impl;
    std::unique_ptr<Impl> impl_;

    bool set_discovery_filter();
    bool start_discovery();
    bool cold_scan(bool refresh_only = false);
    bool request_connect();
    bool discover_services();
    bool find_data_char();
    bool enable_notify();
    bool write_value(const uint8_t *data, size_t len, std::string &err);
    void pump();
};

}  // namespace transport
