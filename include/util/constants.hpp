#pragma once
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// HM-10 style serial service exposed by the dispenser: one characteristic
// (FFE1) carries both the schedule writes and the completion notifications.
inline constexpr std::string_view SVC_UUID  = "0000ffe0-0000-1000-8000-00805f9b34fb";
inline constexpr std::string_view DATA_UUID = "0000ffe1-0000-1000-8000-00805f9b34fb";

// Transfer defaults
inline constexpr std::size_t               CHUNK_SIZE     = 20;  // one ATT write at default MTU
inline constexpr std::size_t               MAX_CHUNK_SIZE = 512;  // ATT attribute value limit
inline constexpr std::chrono::milliseconds FRAME_DELAY{500};
inline constexpr std::chrono::milliseconds ACK_TIMEOUT{10000};
inline constexpr std::string_view          ACK_MARKER = "A";

// Message sentinels understood by the dispenser firmware
inline constexpr std::string_view START_SENTINEL = "#START#";
inline constexpr std::string_view END_SENTINEL   = "#END#";

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("PILLBOX_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    const char *home      = std::getenv("HOME");
    std::string base      = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/pillbox/ctl.sock";
    LOG_SYSTEM("Control socket defaults to %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
