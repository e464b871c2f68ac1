// include/transport/bluez_dbus_util.hpp
#pragma once
#include <cctype>
#include <cstdint>
#include <cstring>
#include <string>

#if PILLBOX_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

static inline bool ieq(std::string a, std::string b)
{
    auto norm = [](std::string s) {
        for (auto &c : s)
            c = (char)std::tolower((unsigned char)c);
        return s;
    };
    return norm(std::move(a)) == norm(std::move(b));
}

static inline std::string upper_mac(std::string s)
{
    for (auto &c : s)
        c = (char)std::toupper((unsigned char)c);
    return s;
}

static inline bool mac_eq(const std::string &a, const std::string &b)
{
    return upper_mac(a) == upper_mac(b);
}

// "AA:BB:CC:DD:EE:FF"
[[maybe_unused]] static inline bool is_valid_mac(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else if (!std::isxdigit(static_cast<unsigned char>(mac[i])))
        {
            return false;
        }
    }
    return true;
}

// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF" -> "AA:BB:CC:DD:EE:FF" ("" if not a device path)
[[maybe_unused]] static inline std::string mac_from_path(const std::string &obj_path)
{
    auto pos = obj_path.rfind("/dev_");
    if (pos == std::string::npos)
        return {};
    std::string tail = obj_path.substr(pos + 5);
    if (tail.find('/') != std::string::npos)
        return {};
    for (auto &c : tail)
        if (c == '_')
            c = ':';
    return upper_mac(tail);
}

#if PILLBOX_HAVE_SDBUS
[[maybe_unused]] static inline int read_var_s(sd_bus_message *m, std::string &out)
{
    // read variant "s"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "s", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_i16(sd_bus_message *m, int16_t &out)
{
    // read variant "n" (int16)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "n");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "n", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_b(sd_bus_message *m, bool &out)
{
    // read variant "b"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b  = 0;
    r      = sd_bus_message_read(m, "b", &b);
    int r2 = sd_bus_message_exit_container(m);
    out    = (b != 0);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int var_as_has_uuid(sd_bus_message    *m,
                                                   const std::string &want_uuid,
                                                   bool              &hit)
{
    // read variant "as" and check if list contains want_uuid (case-insensitive)
    hit   = false;
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0)
        return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    while (true)
    {
        const char *u  = nullptr;
        int         rr = sd_bus_message_read_basic(m, 's', &u);
        if (rr <= 0)
            break;
        if (u && ieq(u, want_uuid))
            hit = true;
    }
    int r1 = sd_bus_message_exit_container(m);
    int r2 = sd_bus_message_exit_container(m);
    return (r < 0 || r1 < 0 || r2 < 0) ? -1 : 0;
}

// Device1 / GattCharacteristic1 properties of one object, filled from the
// a{sa{sv}} of InterfacesAdded or of a GetManagedObjects entry.
struct ObjectProps
{
    bool        is_device = false;
    bool        is_char   = false;
    bool        svc_hit   = false;  // Device1.UUIDs lists the wanted service
    std::string addr;
    std::string name;  // Name, or Alias when the device has no Name
    std::string uuid;  // characteristic UUID
    int16_t     rssi = 0;
};

[[maybe_unused]] static inline int read_object_props(sd_bus_message    *m,
                                                     const std::string &svc_uuid,
                                                     ObjectProps       &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;

        const bool dev = iface && std::strcmp(iface, "org.bluez.Device1") == 0;
        const bool chr = iface && std::strcmp(iface, "org.bluez.GattCharacteristic1") == 0;
        if (!dev && !chr)
        {
            if ((r = sd_bus_message_skip(m, "a{sv}")) < 0)
                return r;
            if ((r = sd_bus_message_exit_container(m)) < 0)
                return r;
            continue;
        }

        out.is_device |= dev;
        out.is_char |= chr;
        std::string alias;
        if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
            return r;
        while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
        {
            const char *key = nullptr;
            if ((r = sd_bus_message_read(m, "s", &key)) < 0)
                return r;
            const std::string k = key ? key : "";
            if (dev && k == "UUIDs")
            {
                bool hit = false;
                r        = var_as_has_uuid(m, svc_uuid, hit);
                out.svc_hit |= hit;
            }
            else if (dev && k == "Address")
                r = read_var_s(m, out.addr);
            else if (dev && k == "Name")
                r = read_var_s(m, out.name);
            else if (dev && k == "Alias")
                r = read_var_s(m, alias);
            else if (dev && k == "RSSI")
                r = read_var_i16(m, out.rssi);
            else if (chr && k == "UUID")
                r = read_var_s(m, out.uuid);
            else
                r = sd_bus_message_skip(m, "v");
            if (r < 0 || (r = sd_bus_message_exit_container(m)) < 0)
                return r;
        }
        if (r < 0 || (r = sd_bus_message_exit_container(m)) < 0)
            return r;  // a{sv}
        if (out.name.empty())
            out.name = alias;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;  // {sa{sv}}
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

[[maybe_unused]] static inline const char *bus_err_text(const sd_bus_error &err, int r)
{
    if (err.message && *err.message)
        return err.message;
    return strerror(-r);
}
#endif
