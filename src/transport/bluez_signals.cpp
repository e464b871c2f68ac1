// src/transport/bluez_signals.cpp
#include "transport/bluez_channel.hpp"
#include "transport/bluez_signals.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <string>

#if PILLBOX_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace transport
{
namespace
{
uint64_t steady_now_ms()
{
    using namespace std::chrono;
    return (uint64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

// What one PropertiesChanged signal told us about the device or the data char.
struct Changed
{
    std::optional<bool> connected;
    std::optional<bool> services_resolved;
    const void         *value     = nullptr;
    size_t              value_len = 0;
    bool                has_value = false;
};

int read_changed(sd_bus_message *m, bool is_dev, bool is_char, Changed &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;
        const std::string k = key ? key : "";

        bool b = false;
        if (is_dev && (k == "Connected" || k == "ServicesResolved"))
        {
            if ((r = read_var_b(m, b)) < 0)
                return r;
            (k == "Connected" ? out.connected : out.services_resolved) = b;
        }
        else if (is_char && k == "Value")
        {
            if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay")) < 0)
                return r;
            if ((r = sd_bus_message_read_array(m, 'y', &out.value, &out.value_len)) < 0)
                return r;
            out.has_value = true;
            if ((r = sd_bus_message_exit_container(m)) < 0)
                return r;
        }
        else if ((r = sd_bus_message_skip(m, "v")) < 0)
        {
            return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;
    return sd_bus_message_skip(m, "as");  // invalidated properties
}
}  // namespace

// InterfacesAdded: a device showed up (or came back) in BlueZ's object tree.
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<transport::BluezChannel *>(userdata);

    const char *obj = nullptr;
    int         r   = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    const std::string obj_path(obj);
    const std::string prefix = "/org/bluez/" + self->config().adapter + "/dev_";
    if (obj_path.rfind(prefix, 0) != 0 || obj_path.find('/', prefix.size()) != std::string::npos)
        return 0;  // services and characteristics live below the device

    ObjectProps p;
    if ((r = read_object_props(m, self->config().svc_uuid, p)) < 0)
        return r;
    if (!p.is_device)
        return 0;

    const std::string addr     = p.addr.empty() ? mac_from_path(obj_path) : p.addr;
    const auto       &peer     = self->config().peer_addr;
    const bool        peer_hit = peer && !peer->empty() && mac_eq(addr, *peer);
    if (!p.svc_hit && !peer_hit)
        return 0;

    self->note_candidate(addr, p.rssi, p.name);
    LOG_INFO("[BLUEZ][central] found dispenser %s rssi=%d name=%s", addr.c_str(), (int)p.rssi,
             p.name.empty() ? "?" : p.name.c_str());

    if (peer_hit && self->dev_path().empty())
    {
        self->adopt_device(obj_path);
        LOG_SYSTEM("[BLUEZ][central] target %s appeared at %s", addr.c_str(), obj);
    }
    return 0;
}

int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<transport::BluezChannel *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;
    if ((r = sd_bus_message_skip(m, "as")) < 0)
        return r;

    if (!self->dev_path().empty() && self->dev_path() == obj)
    {
        LOG_SYSTEM("[BLUEZ][central] InterfacesRemoved -> cleared device %s", obj);
        // tell subscribers first, adopt_device("") wipes the ready state
        self->link_lost("device removed");
        self->adopt_device("");
    }
    return 0;
}

// ======================================================================
// Function: bluez_on_props_changed
// - In: PropertiesChanged on any BlueZ object
// - Out: link state of our device updated; notifications on the data
//        characteristic handed to the inbound subscribers
// ======================================================================
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret_error*/)
{
    auto       *self  = static_cast<transport::BluezChannel *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;

    Changed ch;
    r = read_changed(m, iface && std::strcmp(iface, "org.bluez.Device1") == 0,
                     iface && std::strcmp(iface, "org.bluez.GattCharacteristic1") == 0, ch);
    if (r < 0)
        return r;

    const char *path = sd_bus_message_get_path(m);
    if (!path)
        return 0;

    if (ch.has_value && self->is_data_path(path))
    {
        LOG_DEBUG("[BLUEZ][central] notify on %s len=%zu", path, ch.value_len);
        if (ch.value && ch.value_len)
            self->deliver_inbound(static_cast<const uint8_t *>(ch.value), ch.value_len);
        return 0;
    }

    if (self->dev_path().empty() || self->dev_path() != path)
        return 0;

    if (ch.connected && *ch.connected && !self->connected())
    {
        self->set_connected(true);
        LOG_SYSTEM("[BLUEZ][central] Connected property became true (%s)", path);
    }
    else if (ch.connected && !*ch.connected && self->connected())
    {
        LOG_SYSTEM("[BLUEZ][central] Disconnected (%s)", path);
        self->link_lost("device disconnected");
    }

    if (ch.services_resolved)
    {
        self->set_services_resolved(*ch.services_resolved);
        LOG_INFO("[BLUEZ][central] ServicesResolved=%s on %s",
                 *ch.services_resolved ? "true" : "false", path);
    }
    return 0;
}

int bluez_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<transport::BluezChannel *>(userdata);
    self->set_connect_inflight(false);

    if (!sd_bus_message_is_method_error(m, nullptr))
    {
        self->set_connected(true);
        self->set_services_resolved(false);
        LOG_SYSTEM("[BLUEZ][central] Device connected: %s", self->dev_path().c_str());
        return 1;
    }

    const sd_bus_error *e     = sd_bus_message_get_error(m);
    const std::string   ename = (e && e->name) ? e->name : "unknown";
    const std::string   emsg  = (e && e->message) ? e->message : "no message";

    // a slow or busy controller gets a longer pause than a hard failure
    const bool busy = ename == "org.freedesktop.DBus.Error.NoReply" ||
                      ename == "org.bluez.Error.InProgress" ||
                      (ename == "org.bluez.Error.Failed" &&
                       emsg.find("already in progress") != std::string::npos);
    const uint32_t backoff_ms = busy ? 5000 : 2000;
    if (busy)
        LOG_WARN("[BLUEZ][central] Connect busy, retry in %ums: %s: %s", backoff_ms,
                 ename.c_str(), emsg.c_str());
    else
        LOG_ERROR("[BLUEZ][central] Device1.Connect failed, retry in %ums: %s: %s", backoff_ms,
                  ename.c_str(), emsg.c_str());

    self->set_connected(false);
    if (ename == "org.freedesktop.DBus.Error.UnknownObject" ||
        ename == "org.freedesktop.DBus.Error.UnknownMethod")
    {
        // the device object is gone; cold_scan will find it again
        self->adopt_device("");
    }
    self->set_next_connect_at_ms(steady_now_ms() + backoff_ms);
    return 1;
}

}  // namespace transport
#endif  // PILLBOX_HAVE_SDBUS
