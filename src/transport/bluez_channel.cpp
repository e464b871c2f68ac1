/* ======================================================================
 * BlueZ central channel to one pill dispenser
 *
 *  Loop thread                      Bus thread                 BlueZ/DBus           Dispenser
 *  -----------                      -----------                -----------          ---------
 *  start()
 *    └─ set_discovery_filter ─────────────────────────────────────────────────────▶  Adapter.SetDiscoveryFilter
 *    └─ start_discovery ──────────────────────────────────────────────────────────▶  Adapter.StartDiscovery
 *    └─ cold_scan (candidates already known to BlueZ)
 *    └─ spawn bus loop
 *
 *  pump() (bus thread, every wakeup)
 *    └─ target set, no device yet → cold_scan ───────────────────────────────────▶  ObjectManager.GetManagedObjects
 *    └─ device known → request_connect ──────────────────────────────────────────▶  Device1.Connect
 *                                         ◀── on_connect_reply ─────────────────────
 *    └─ discover_services ────────────────────────────────────────────────────────▶  Device1.DiscoverServices
 *    └─ find_data_char (FFE1 under the device)
 *    └─ enable_notify ────────────────────────────────────────────────────────────▶  GattCharacteristic1.StartNotify
 *
 *  Data
 *    write(frame) ────────────────────────────────────────────────────────────────▶  WriteValue(type=command)
 *                                         ◀── on_props_changed: Value ("A" when the schedule is stored)
 *                                         ◀── on_props_changed: Connected=false → link_lost
 *
 *  Ready condition: connected && notifying
 *  DBus calls outside the bus thread are under impl_->bus_mu
 * ====================================================================== */

#include <algorithm>
#include <chrono>
#include <cstring>
#include <errno.h>
#include <mutex>
#include <thread>
#include <utility>

// clang-format off
#include "transport/bluez_channel.hpp"
#include "transport/bluez_channel_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"
// clang-format on

#if PILLBOX_HAVE_SDBUS
#include <systemd/sd-bus.h>
#include "transport/bluez_signals.hpp"
#endif

namespace
{
uint64_t steady_now_ms()
{
    using namespace std::chrono;
    return (uint64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

#if PILLBOX_HAVE_SDBUS
// ======================================================================
// Function: adapter_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: true when discovery ends up in the wanted state
// - Note: InProgress on start and any failure on stop count as done
// ======================================================================
bool adapter_discovery_locked(sd_bus            *bus,
                              const std::string &adapter_path,
                              std::atomic_bool  &discovery_on,
                              bool               on)
{
    if (!bus)
        return false;
    if (discovery_on.load() == on)
        return true;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               on ? "StartDiscovery" : "StopDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);

    bool ok = true;
    if (r < 0)
    {
        if (on && !(err.name && std::strcmp(err.name, "org.bluez.Error.InProgress") == 0))
        {
            LOG_WARN("[BLUEZ][central] StartDiscovery failed: %s", bus_err_text(err, r));
            ok = false;
        }
        else if (!on)
        {
            LOG_WARN("[BLUEZ][central] StopDiscovery failed (treat as off): %s",
                     bus_err_text(err, r));
        }
    }
    sd_bus_error_free(&err);
    if (ok)
    {
        discovery_on.store(on);
        LOG_INFO("[BLUEZ][central] discovery %s on %s", on ? "on" : "off", adapter_path.c_str());
    }
    return ok;
}

// GetManagedObjects and hand each object path + props to fn. Caller holds bus_mu.
template <typename Fn>
bool walk_managed_objects_locked(sd_bus *bus, const std::string &svc_uuid, Fn &&fn)
{
    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        if (-r == EBADMSG)
            LOG_INFO("[BLUEZ][central] GetManagedObjects transient EBADMSG; will retry");
        else
            LOG_WARN("[BLUEZ][central] GetManagedObjects failed: %s", bus_err_text(err, r));
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return false;
    }

    // a{oa{sa{sv}}}
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    while (r >= 0 &&
           (r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0 || !obj)
            break;
        ObjectProps props;
        if ((r = read_object_props(reply, svc_uuid, props)) < 0)
            break;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            break;
        fn(std::string(obj), props);
    }

    sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] malformed GetManagedObjects reply: %s", strerror(-r));
        return false;
    }
    return true;
}
#endif
}  // namespace

namespace transport
{
BluezChannel::BluezChannel(BluezConfig cfg) : cfg_(std::move(cfg)) {}

BluezChannel::~BluezChannel()
{
    stop();
}

std::string BluezChannel::name() const
{
    return "bluez";
}

// ============== Impl accessors (bus thread) ==============
const std::string &BluezChannel::dev_path() const
{
    return impl_->dev_path;
}
bool BluezChannel::connected() const
{
    return impl_ && impl_->connected.load();
}
void BluezChannel::set_connected(bool v)
{
    impl_->connected.store(v);
}
void BluezChannel::set_services_resolved(bool v)
{
    impl_->services_resolved.store(v);
}
void BluezChannel::set_connect_inflight(bool v)
{
    impl_->connect_inflight.store(v);
}
void BluezChannel::set_next_connect_at_ms(uint64_t ms)
{
    impl_->next_connect_at_ms = ms;
}
bool BluezChannel::is_data_path(const char *path) const
{
    return path && !impl_->data_path.empty() && impl_->data_path == path;
}

void BluezChannel::adopt_device(const std::string &path)
{
    impl_->dev_path = path;
    impl_->data_path.clear();
    impl_->connected.store(false);
    impl_->notifying.store(false);
    impl_->services_resolved.store(false);
    impl_->discover_submitted.store(false);
}
// ============= End of Impl accessors =============

void BluezChannel::note_candidate(const std::string &addr, int16_t rssi, const std::string &name)
{
    if (!impl_ || addr.empty())
        return;
    const std::string key = upper_mac(addr);
    auto              it  = impl_->candidates.find(key);
    if (it == impl_->candidates.end())
    {
        impl_->candidates.emplace(key, Impl::Candidate{key, rssi, name, steady_now_ms()});
        return;
    }
    if (rssi != 0)
        it->second.rssi = rssi;
    if (!name.empty())
        it->second.name = name;
    it->second.last_seen_ms = steady_now_ms();
}

void BluezChannel::deliver_inbound(const uint8_t *data, size_t len)
{
    if (!data || len == 0 || !is_running())
        return;
    subs_.notify_inbound(Bytes(data, data + len));
}

// ======================================================================
// Function: BluezChannel::link_lost
// - In: reason shown to the disconnect subscribers
// - Out: ready state cleared, subscribers told once per lost link
// - Note: the device path is kept so pump() reconnects to the same dispenser
// ======================================================================
void BluezChannel::link_lost(const std::string &reason)
{
    const bool was_ready = impl_->connected.exchange(false) && impl_->notifying.load();
    impl_->notifying.store(false);
    impl_->services_resolved.store(false);
    impl_->discover_submitted.store(false);
    impl_->data_path.clear();
    if (was_ready)
        subs_.notify_disconnected(reason);
}

// ======================================================================
// Function: BluezChannel::start
// - In: channel settings (mtu_payload is the frame size limit we warn on)
// - Out: true when the bus is up and the bus loop thread runs
// - Note: the dispenser may connect later, is_connected() tells when
// ======================================================================
bool BluezChannel::start(const Settings &s)
{
    if (running_.load(std::memory_order_relaxed))
        return true;

    settings_ = s;
#if !PILLBOX_HAVE_SDBUS
    LOG_ERROR("[BLUEZ][central] sd-bus not available (PILLBOX_HAVE_SDBUS=0)");
    return false;
#else
    impl_ = std::make_unique<Impl>();

    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[BLUEZ][central] failed to connect system bus: %s", strerror(-r));
        impl_.reset();
        return false;
    }
    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;

    struct Match
    {
        sd_bus_slot           **slot;
        const char             *iface;
        const char             *member;
        sd_bus_message_handler_t cb;
    };
    const Match matches[] = {
        {&impl_->added_slot, "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
         bluez_on_iface_added},
        {&impl_->removed_slot, "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
         bluez_on_iface_removed},
        {&impl_->props_slot, "org.freedesktop.DBus.Properties", "PropertiesChanged",
         bluez_on_props_changed},
    };
    for (const auto &mt : matches)
    {
        r = sd_bus_match_signal(impl_->bus, mt.slot, "org.bluez", nullptr, mt.iface, mt.member,
                                mt.cb, this);
        if (r < 0)
        {
            LOG_ERROR("[BLUEZ][central] subscribe to %s failed: %s", mt.member, strerror(-r));
            unref_slot(impl_->added_slot);
            unref_slot(impl_->removed_slot);
            unref_slot(impl_->props_slot);
            sd_bus_flush_close_unref(impl_->bus);
            impl_.reset();
            return false;
        }
    }
    LOG_INFO("[BLUEZ][central] watching %s for svc=%s data=%s peer=%s", impl_->adapter_path.c_str(),
             cfg_.svc_uuid.c_str(), cfg_.data_uuid.c_str(),
             cfg_.peer_addr ? cfg_.peer_addr->c_str() : "-");

    (void)set_discovery_filter();
    if (!start_discovery())
        LOG_WARN("[BLUEZ][central] StartDiscovery failed (continue without scan)");
    (void)cold_scan();

    running_.store(true, std::memory_order_relaxed);
    impl_->loop = std::thread([this] {
        while (running_.load(std::memory_order_relaxed))
        {
            {
                std::lock_guard<std::mutex> lk(impl_->bus_mu);
                while (sd_bus_process(impl_->bus, nullptr) > 0)
                {
                }
            }
            // wait without the lock so writes from the loop thread get through
            const uint64_t WAIT_USEC = 100000;  // 100ms
            sd_bus_wait(impl_->bus, WAIT_USEC);
            pump();
        }
    });
    return true;
#endif
}

// ======================================================================
// Function: BluezChannel::stop
// - In: may be called anytime
// - Out: device disconnected, discovery off, bus loop joined, subscribers dropped
// - Note: joins the bus thread outside of bus_mu
// ======================================================================
void BluezChannel::stop()
{
    if (!running_.exchange(false, std::memory_order_relaxed))
    {
        subs_.clear();
        return;
    }
#if PILLBOX_HAVE_SDBUS
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (impl_->bus && !impl_->dev_path.empty() && impl_->connected.load())
        {
            sd_bus_error    derr{};
            sd_bus_message *drep = nullptr;
            (void)sd_bus_call_method(impl_->bus, "org.bluez", impl_->dev_path.c_str(),
                                     "org.bluez.Device1", "Disconnect", &derr, &drep, "");
            if (drep)
                sd_bus_message_unref(drep);
            sd_bus_error_free(&derr);
        }
        (void)adapter_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on,
                                       false);
        // wakes the bus thread out of sd_bus_wait()
        sd_bus_close(impl_->bus);
    }

    if (impl_->loop.joinable())
        impl_->loop.join();

    unref_slot(impl_->added_slot);
    unref_slot(impl_->removed_slot);
    unref_slot(impl_->props_slot);
    unref_slot(impl_->connect_call_slot);
    sd_bus_flush_close_unref(impl_->bus);
    impl_->bus = nullptr;
#endif
    subs_.clear();
    impl_.reset();
    LOG_SYSTEM("[BLUEZ][central] stopped");
}

bool BluezChannel::is_connected() const
{
    return impl_ && impl_->connected.load() && impl_->notifying.load();
}

bool BluezChannel::write(const Bytes &frame, std::string &err)
{
    if (!running_.load(std::memory_order_relaxed) || !is_connected())
    {
        err = "not connected";
        return false;
    }
    if (settings_.mtu_payload > 0 && frame.size() > settings_.mtu_payload)
    {
        LOG_WARN("[BLUEZ][central] write len=%zu > mtu_payload=%zu (sending anyway)",
                 frame.size(), settings_.mtu_payload);
    }
    return write_value(frame.data(), frame.size(), err);
}

SubscriptionId BluezChannel::subscribe_inbound(OnData cb)
{
    return subs_.add_inbound(std::move(cb));
}

SubscriptionId BluezChannel::on_disconnected(OnDisconnected cb)
{
    return subs_.add_disconnected(std::move(cb));
}

void BluezChannel::unsubscribe(SubscriptionId id)
{
    subs_.remove(id);
}

// ======================================================================
// Function: BluezChannel::list_peers
// - Out: dispensers seen in the last two minutes, strongest first
// - Note: asks the bus thread for a cache refresh when it is stale
// ======================================================================
std::vector<PeerInfo> BluezChannel::list_peers()
{
    std::vector<PeerInfo> out;
#if PILLBOX_HAVE_SDBUS
    if (!impl_ || !impl_->bus)
        return out;

    const uint64_t now_ms       = steady_now_ms();
    const uint64_t TTL_MS       = 120000;
    bool           need_refresh = false;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        need_refresh = impl_->candidates.empty() ||
                       now_ms - impl_->last_refresh_ms > impl_->refresh_min_interval_ms;
        for (const auto &kv : impl_->candidates)
        {
            const auto &c = kv.second;
            if (now_ms - c.last_seen_ms <= TTL_MS)
                out.push_back(PeerInfo{c.addr, c.rssi, c.name});
        }
    }
    if (need_refresh)
        request_candidate_refresh();

    std::sort(out.begin(), out.end(),
              [](const PeerInfo &a, const PeerInfo &b) { return a.rssi > b.rssi; });
#endif
    return out;
}

void BluezChannel::request_candidate_refresh()
{
    if (impl_)
        impl_->refresh_req.store(true, std::memory_order_release);
}

// ======================================================================
// Function: BluezChannel::connect_to
// - In: addr in AA:BB:CC:DD:EE:FF format, or "" to only drop the current link
// - Out: true when the old link is dropped and the new target recorded
// - Note: the actual connect is done in pump()
// ======================================================================
bool BluezChannel::connect_to(const std::string &addr)
{
#if !PILLBOX_HAVE_SDBUS
    (void)addr;
    return false;
#else
    if (!impl_ || !impl_->bus)
        return false;
    if (!addr.empty() && !is_valid_mac(addr))
    {
        LOG_ERROR("[BLUEZ][central] connect_to: bad address '%s'", addr.c_str());
        return false;
    }

    bool was_ready = false;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (impl_->connect_inflight.load())
        {
            unref_slot(impl_->connect_call_slot);
            impl_->connect_inflight.store(false);
        }
        if (!impl_->dev_path.empty())
        {
            sd_bus_error    derr = SD_BUS_ERROR_NULL;
            sd_bus_message *drep = nullptr;
            (void)sd_bus_call_method(impl_->bus, "org.bluez", impl_->dev_path.c_str(),
                                     "org.bluez.Device1", "Disconnect", &derr, &drep, "");
            if (drep)
                sd_bus_message_unref(drep);
            sd_bus_error_free(&derr);
        }
        was_ready = impl_->connected.load() && impl_->notifying.load();
        adopt_device("");

        if (addr.empty())
            cfg_.peer_addr.reset();
        else
            cfg_.peer_addr = upper_mac(addr);
        impl_->next_connect_at_ms = steady_now_ms() + 300;
        impl_->last_refresh_ms    = 0;
    }
    if (was_ready)
        subs_.notify_disconnected("link dropped by operator");

    if (addr.empty())
    {
        LOG_SYSTEM("[BLUEZ][central] link dropped, no target");
        return true;
    }
    request_candidate_refresh();
    (void)start_discovery();
    LOG_SYSTEM("[BLUEZ][central] target=%s", cfg_.peer_addr->c_str());
    return true;
#endif
}

// ======================================================================
// Function: BluezChannel::set_discovery_filter
// - Out: true when Adapter1.SetDiscoveryFilter accepted LE + our service UUID
// ======================================================================
bool BluezChannel::set_discovery_filter()
{
#if !PILLBOX_HAVE_SDBUS
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    sd_bus_error                err{};
    sd_bus_message             *rep = nullptr;
    int r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                               "org.bluez.Adapter1", "SetDiscoveryFilter", &err, &rep, "a{sv}", 3,
                               "Transport", "s", "le", "DuplicateData", "b", 0, "UUIDs", "as", 1,
                               cfg_.svc_uuid.c_str());
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] SetDiscoveryFilter failed: %s", bus_err_text(err, r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_INFO("[BLUEZ][central] SetDiscoveryFilter OK (Transport=le, UUID=%s)",
             cfg_.svc_uuid.c_str());
    return true;
#endif
}

bool BluezChannel::start_discovery()
{
#if !PILLBOX_HAVE_SDBUS
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    return adapter_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on, true);
#endif
}

// ======================================================================
// Function: BluezChannel::cold_scan
// - In: refresh_only = only update the candidate cache
// - Out: true if the object walk succeeded; may adopt the target device
// - Note: reads what BlueZ already knows, no active discovery
// ======================================================================
bool BluezChannel::cold_scan(bool refresh_only)
{
#if !PILLBOX_HAVE_SDBUS
    (void)refresh_only;
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return false;

    const std::string dev_prefix = "/org/bluez/" + cfg_.adapter + "/dev_";
    const bool        has_peer   = cfg_.peer_addr && !cfg_.peer_addr->empty();

    bool ok = walk_managed_objects_locked(
        impl_->bus, cfg_.svc_uuid, [&](const std::string &path, const ObjectProps &p) {
            if (!p.is_device || path.rfind(dev_prefix, 0) != 0)
                return;
            const std::string addr    = p.addr.empty() ? mac_from_path(path) : p.addr;
            const bool        peer_ok = has_peer && mac_eq(addr, *cfg_.peer_addr);
            if (!p.svc_hit && !peer_ok)
                return;
            note_candidate(addr, p.rssi, p.name);
            if (peer_ok && !refresh_only && impl_->dev_path.empty())
            {
                adopt_device(path);
                LOG_SYSTEM("[BLUEZ][central] cold-scan found %s addr=%s rssi=%d", path.c_str(),
                           addr.c_str(), (int)p.rssi);
            }
        });
    impl_->last_refresh_ms = steady_now_ms();
    return ok;
#endif
}

// ======================================================================
// Function: BluezChannel::request_connect
// - Out: true after Device1.Connect is submitted (reply lands in on_connect_reply)
// - Note: discovery is stopped first, some controllers abort connects while scanning
// ======================================================================
bool BluezChannel::request_connect()
{
#if !PILLBOX_HAVE_SDBUS
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->dev_path.empty())
        return false;
    if (impl_->connect_inflight.load() || impl_->connected.load())
        return true;

    (void)adapter_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on, false);

    unref_slot(impl_->connect_call_slot);
    int r = sd_bus_call_method_async(impl_->bus, &impl_->connect_call_slot, "org.bluez",
                                     impl_->dev_path.c_str(), "org.bluez.Device1", "Connect",
                                     bluez_on_connect_reply, this, "");
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][central] submit Connect() failed: %s", strerror(-r));
        impl_->next_connect_at_ms = steady_now_ms() + 2000;
        return false;
    }
    impl_->connect_inflight.store(true);
    LOG_INFO("[BLUEZ][central] Connect() submitted to %s", impl_->dev_path.c_str());
    return true;
#endif
}

// ======================================================================
// Function: BluezChannel::discover_services
// - Out: true after Device1.DiscoverServices(svc_uuid) is accepted
// - Note: completion shows up as ServicesResolved=true
// ======================================================================
bool BluezChannel::discover_services()
{
#if !PILLBOX_HAVE_SDBUS
    return false;
#else
    if (impl_->discover_submitted.load())
        return true;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->dev_path.empty())
        return false;
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->dev_path.c_str(),
                               "org.bluez.Device1", "DiscoverServices", &err, &rep, "s",
                               cfg_.svc_uuid.c_str());
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (err.name && std::strcmp(err.name, "org.freedesktop.DBus.Error.UnknownMethod") == 0)
        {
            // older BlueZ resolves services on its own after Connect
            LOG_DEBUG("[BLUEZ][central] DiscoverServices not supported; rely on auto-discovery");
            impl_->discover_submitted.store(true);
        }
        else
        {
            LOG_WARN("[BLUEZ][central] DiscoverServices('%s') failed: %s", cfg_.svc_uuid.c_str(),
                     bus_err_text(err, r));
        }
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    impl_->discover_submitted.store(true);
    LOG_INFO("[BLUEZ][central] DiscoverServices('%s') submitted", cfg_.svc_uuid.c_str());
    return true;
#endif
}

// ======================================================================
// Function: BluezChannel::find_data_char
// - Out: true when the data characteristic under our device is known
// ======================================================================
bool BluezChannel::find_data_char()
{
#if !PILLBOX_HAVE_SDBUS
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->data_path.empty())
        return true;
    if (impl_->dev_path.empty())
        return false;

    const std::string dev_prefix = impl_->dev_path + "/";
    std::string       found;
    (void)walk_managed_objects_locked(
        impl_->bus, cfg_.svc_uuid, [&](const std::string &path, const ObjectProps &p) {
            if (found.empty() && p.is_char && path.rfind(dev_prefix, 0) == 0 &&
                ieq(p.uuid, cfg_.data_uuid))
                found = path;
        });
    if (found.empty())
        return false;
    impl_->data_path = found;
    LOG_INFO("[BLUEZ][central] data characteristic %s at %s", cfg_.data_uuid.c_str(),
             found.c_str());
    return true;
#endif
}

// ======================================================================
// Function: BluezChannel::enable_notify
// - Out: true when StartNotify on the data characteristic succeeded
// - Note: transient failures (CCCD race, BlueZ busy) are retried by pump()
// ======================================================================
bool BluezChannel::enable_notify()
{
#if !PILLBOX_HAVE_SDBUS
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->data_path.empty())
        return false;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->data_path.c_str(),
                               "org.bluez.GattCharacteristic1", "StartNotify", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        const char *ename     = err.name ? err.name : "";
        const char *emsg      = err.message ? err.message : "";
        const bool  transient = std::strstr(emsg, "ATT error: 0x0e") != nullptr ||
                               std::strcmp(ename, "org.freedesktop.DBus.Error.NoReply") == 0 ||
                               std::strcmp(ename, "org.bluez.Error.InProgress") == 0;
        if (transient)
            LOG_INFO("[BLUEZ][central] StartNotify transient failure (%s); will retry",
                     *emsg ? emsg : ename);
        else
            LOG_WARN("[BLUEZ][central] StartNotify failed: %s", bus_err_text(err, r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    impl_->notifying.store(true);
    return true;
#endif
}

// ======================================================================
// Function: BluezChannel::write_value
// - In: frame bytes, data characteristic known
// - Out: true if WriteValue was accepted; err filled otherwise
// - Note: type=command is an ATT write without response, the dispenser
//         acknowledges the whole schedule once
// ======================================================================
bool BluezChannel::write_value(const uint8_t *data, size_t len, std::string &err)
{
#if !PILLBOX_HAVE_SDBUS
    (void)data;
    (void)len;
    err = "sd-bus not available";
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus || impl_->data_path.empty())
    {
        err = "data characteristic not resolved";
        return false;
    }

    sd_bus_message *msg = nullptr;
    sd_bus_message *rep = nullptr;
    sd_bus_error    berr{};
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", impl_->data_path.c_str(),
                                           "org.bluez.GattCharacteristic1", "WriteValue");
    if (r >= 0)
        r = sd_bus_message_append_array(msg, 'y', data, len);
    if (r >= 0)
        r = sd_bus_message_append(msg, "a{sv}", 1, "type", "s", "command");
    if (r < 0)
    {
        err = std::string("building WriteValue failed: ") + strerror(-r);
        LOG_WARN("[BLUEZ][central] %s", err.c_str());
        if (msg)
            sd_bus_message_unref(msg);
        return false;
    }

    r = sd_bus_call(impl_->bus, msg, 0, &berr, &rep);
    sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0 && -r != EBADMSG)
    {
        err = bus_err_text(berr, r);
        LOG_WARN("[BLUEZ][central] WriteValue failed: %s", err.c_str());
        sd_bus_error_free(&berr);
        return false;
    }
    if (r < 0)
    {
        // some BlueZ builds surface EBADMSG despite a successful ATT write
        LOG_INFO("[BLUEZ][central] WriteValue returned EBADMSG; treating as sent (len=%zu)", len);
    }
    sd_bus_error_free(&berr);
    LOG_DEBUG("[BLUEZ][central] WriteValue OK (len=%zu)", len);
    return true;
#endif
}

// ======================================================================
// Function: BluezChannel::pump
// - In: called from the bus thread after each wakeup
// - Out: advances find -> connect -> resolve -> notify, keeps discovery and
//        the candidate cache fresh
// ======================================================================
void BluezChannel::pump()
{
#if PILLBOX_HAVE_SDBUS
    const uint64_t now_ms   = steady_now_ms();
    const bool     has_peer = cfg_.peer_addr && !cfg_.peer_addr->empty();

    bool scan_for_target = false;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        scan_for_target = has_peer && impl_->dev_path.empty() &&
                          now_ms - impl_->last_refresh_ms >= impl_->refresh_min_interval_ms;
    }
    if (scan_for_target)
        (void)cold_scan();

    bool want_connect = false;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        want_connect = has_peer && !impl_->dev_path.empty() && !impl_->connected.load() &&
                       !impl_->connect_inflight.load() && now_ms >= impl_->next_connect_at_ms;
    }
    if (want_connect)
        (void)request_connect();

    if (impl_->connected.load() && !impl_->notifying.load())
    {
        if (!impl_->services_resolved.load())
            (void)discover_services();
        if (find_data_char() && enable_notify())
            LOG_SYSTEM("[BLUEZ][central] Notifications enabled on %s; dispenser ready",
                       cfg_.data_uuid.c_str());
    }

    // Discovery stays on until a link exists or a connect is in flight
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        const bool want_scan = !impl_->connected.load() && !impl_->connect_inflight.load();
        (void)adapter_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on,
                                       want_scan);
    }

    bool do_refresh = impl_->refresh_req.exchange(false, std::memory_order_acq_rel);
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (!do_refresh && now_ms - impl_->last_refresh_ms >= impl_->refresh_periodic_ms)
            do_refresh = true;
    }
    if (do_refresh)
        (void)cold_scan(true);
#endif
}

}  // namespace transport
