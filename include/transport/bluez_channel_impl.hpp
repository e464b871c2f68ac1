// include/transport/bluez_channel_impl.hpp
#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

struct sd_bus;
struct sd_bus_slot;

#include "bluez_channel.hpp"

namespace transport
{
struct BluezChannel::Impl
{
#if PILLBOX_HAVE_SDBUS
    sd_bus *bus = nullptr;

    // serialize all sd-bus access
    std::mutex bus_mu;

    sd_bus_slot     *added_slot        = nullptr;
    sd_bus_slot     *removed_slot      = nullptr;
    sd_bus_slot     *props_slot        = nullptr;
    sd_bus_slot     *connect_call_slot = nullptr;
    std::atomic_bool discovery_on{false};
#endif
    std::thread loop;
    std::string adapter_path;  // "/org/bluez/hci0"
    std::string dev_path;      // chosen dispenser
    std::string data_path;     // remote FFE1 characteristic

    std::atomic_bool connected{false};
    std::atomic_bool notifying{false};
    std::atomic_bool connect_inflight{false};
    std::atomic_bool services_resolved{false};
    std::atomic_bool discover_submitted{false};
    uint64_t         next_connect_at_ms{0};

    // ---- Candidate cache (updated from BlueZ callbacks, guarded by bus_mu) ----
    struct Candidate
    {
        std::string addr;          // "AA:BB:CC:DD:EE:FF"
        int16_t     rssi;          // 0 if unknown
        std::string name;          // Device1.Name / Alias, may be empty
        uint64_t    last_seen_ms;  // steady_clock ms
    };
    std::unordered_map<std::string, Candidate> candidates;
    std::atomic<bool>                          refresh_req{false};
    uint64_t                                   last_refresh_ms{0};
    uint32_t                                   refresh_min_interval_ms{2000};
    uint32_t                                   refresh_periodic_ms{5000};
};
}  // namespace transport
