#pragma once
#include <optional>
#include <string>

#include "transfer/transfer_types.hpp"

namespace app
{

// Daemon settings, read once from PILLBOX_* environment variables.
struct Config
{
    std::string                transport = "loopback";  // "loopback" | "bluez"
    std::string                adapter   = "hci0";
    std::optional<std::string> peer;  // normalized "AA:BB:CC:DD:EE:FF"
    transfer::Options          transfer{};
    std::string                ctl_sock;
    std::string                log_level = "debug";
};

// Invalid values are logged and replaced by their defaults.
Config config_from_env();

// Parses a decimal integer in [lo, hi]; false on junk or out of range.
bool parse_bounded(const char *s, long lo, long hi, long &out);

}  // namespace app
