#include <cerrno>
#include <cstdlib>
#include <string>

#include "app/config.hpp"
#include "ctl/ipc.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

bool parse_bounded(const char *s, long lo, long hi, long &out)
{
    if (!s || !*s)
        return false;
    char *end = nullptr;
    errno     = 0;
    long v    = std::strtol(s, &end, 10);
    if (errno != 0 || !end || *end != '\0' || v < lo || v > hi)
        return false;
    out = v;
    return true;
}

static const char *env(const char *key)
{
    const char *v = std::getenv(key);
    return (v && *v) ? v : nullptr;
}

// ======================================================================
// Function: config_from_env
// - In: PILLBOX_* environment
// - Out: a Config with every field valid
// - Note: the log level is applied first so later warnings honor it
// ======================================================================
Config config_from_env()
{
    Config c;

    if (const char *v = env("PILLBOX_LOG_LEVEL"))
    {
        pillbox::Level lv;
        if (pillbox::parse_level(v, lv))
        {
            pillbox::set_log_level(lv);
            c.log_level = v;
        }
        else
        {
            LOG_WARN("Ignoring invalid PILLBOX_LOG_LEVEL='%s' (expect debug|info|warn|error)", v);
        }
    }

    if (const char *v = env("PILLBOX_TRANSPORT"))
    {
        const std::string t = v;
        if (t == "loopback" || t == "bluez")
            c.transport = t;
        else
            LOG_WARN("Ignoring invalid PILLBOX_TRANSPORT='%s' (expect loopback|bluez)", v);
    }

    if (const char *v = env("PILLBOX_ADAPTER"))
        c.adapter = v;

    if (const char *v = env("PILLBOX_PEER"))
    {
        const std::string mac = upper_mac(v);
        if (is_valid_mac(mac))
            c.peer = mac;
        else
            LOG_WARN("Ignoring invalid PILLBOX_PEER='%s' (expect AA:BB:CC:DD:EE:FF)", v);
    }

    long n = 0;
    if (const char *v = env("PILLBOX_CHUNK_SIZE"))
    {
        if (parse_bounded(v, 1, (long)constants::MAX_CHUNK_SIZE, n))
            c.transfer.chunk_size = (std::size_t)n;
        else
            LOG_WARN("Ignoring invalid PILLBOX_CHUNK_SIZE='%s' (expect 1..%zu)", v,
                     constants::MAX_CHUNK_SIZE);
    }
    if (const char *v = env("PILLBOX_FRAME_DELAY_MS"))
    {
        if (parse_bounded(v, 0, 10000, n))
            c.transfer.inter_frame_delay = std::chrono::milliseconds(n);
        else
            LOG_WARN("Ignoring invalid PILLBOX_FRAME_DELAY_MS='%s' (expect 0..10000)", v);
    }
    if (const char *v = env("PILLBOX_ACK_TIMEOUT_MS"))
    {
        if (parse_bounded(v, 1, 600000, n))
            c.transfer.timeout = std::chrono::milliseconds(n);
        else
            LOG_WARN("Ignoring invalid PILLBOX_ACK_TIMEOUT_MS='%s' (expect 1..600000)", v);
    }
    // an unset marker keeps "A"; set-but-empty is rejected by env() already
    if (const char *v = env("PILLBOX_ACK_MARKER"))
        c.transfer.ack_marker = v;

    c.ctl_sock = ipc::expand_user(constants::ctl_sock_path());
    return c;
}

}  // namespace app
