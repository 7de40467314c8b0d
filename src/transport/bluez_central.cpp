/* ======================================================================
 * BlueZ Central - overall flow
 *
 *  Caller thread                               Bus thread (loop)
 *  -------------                               -----------------
 *  start(sink)
 *    └─ open system bus, add signal matches
 *    └─ Adapter1.Powered ─▶ StateUpdated (queued)
 *    └─ cold scan Device1 objects
 *    └─ spawn loop ───────────────────────────▶ while running:
 *                                                 └─ sd_bus_process (bus_mu)
 *                                                 │    └─ InterfacesAdded / PropertiesChanged
 *                                                 │    │    └─ note_device / note_value / note_powered
 *                                                 │    └─ async replies ─▶ on_call_reply
 *                                                 └─ pump(): GATT walk for pending discovery
 *                                                 └─ deliver_pending(): sink(ev), lock released
 *                                                 └─ sd_bus_wait(100ms)
 *
 *  connect / cancel_connection / set_notify / read / write
 *    └─ sd_bus_call_async under bus_mu, reply handled on the bus thread
 *
 *  scan / stop_scan
 *    └─ SetDiscoveryFilter + StartDiscovery / StopDiscovery (synchronous)
 *
 *  discover_services / discover_characteristics
 *    └─ mark the device, pump() answers once ServicesResolved is true
 *
 *  stop()
 *    └─ best-effort Disconnect, StopDiscovery, sd_bus_close under bus_mu
 *    └─ join loop outside the lock, release slots, flush & unref bus
 *
 *  Notes
 *    └─ ids are MAC addresses, object paths are derived from the adapter path
 *    └─ events are only ever handed to the sink from the bus thread
 * ====================================================================== */

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

// clang-format off
#include "transport/bluez_central.hpp"
#include "transport/bluez_central_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"
// clang-format on

#if BLELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>
#include "transport/bluez_helper_central.hpp"
#endif

namespace transport
{

#if BLELINK_HAVE_SDBUS
// ======================================================================
// Function: adapter_start_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: true if StartDiscovery succeeds and discovery_on becomes true
// - Note: safe to call repeatedly, only starts when off
// ======================================================================
static bool adapter_start_discovery_locked(sd_bus            *bus,
                                           const std::string &adapter_path,
                                           std::atomic_bool  &discovery_on)
{
    if (!bus)
        return false;
    if (discovery_on.load())
        return true;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StartDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (err.name && std::string(err.name) == "org.bluez.Error.InProgress")
        {
            discovery_on.store(true);
            LOG_INFO("[BLUEZ][central] StartDiscovery already in progress on %s",
                     adapter_path.c_str());
            sd_bus_error_free(&err);
            return true;
        }
        LOG_WARN("[BLUEZ][central] StartDiscovery failed: %s",
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    discovery_on.store(true);
    LOG_SYSTEM("[BLUEZ][central] StartDiscovery OK on %s", adapter_path.c_str());
    return true;
}

// ======================================================================
// Function: adapter_stop_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: discovery_on is false afterwards
// - Note: a failing StopDiscovery usually means it was already off
// ======================================================================
static void adapter_stop_discovery_locked(sd_bus            *bus,
                                          const std::string &adapter_path,
                                          std::atomic_bool  &discovery_on)
{
    if (!bus)
        return;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StopDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
        LOG_WARN("[BLUEZ][central] StopDiscovery failed (treat as off): %s",
                 err.message ? err.message : strerror(-r));
    else
        LOG_SYSTEM("[BLUEZ][central] StopDiscovery OK");
    discovery_on.store(false);
    sd_bus_error_free(&err);
}

static ControllerState powered_state(bool powered)
{
    return powered ? ControllerState::PoweredOn : ControllerState::PoweredOff;
}
#endif

BluezCentral::BluezCentral(BluezConfig cfg) : cfg_(std::move(cfg)), impl_(std::make_unique<Impl>())
{
    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
}

BluezCentral::~BluezCentral()
{
    stop();
}

ControllerState BluezCentral::state() const
{
    return impl_->state.load();
}

std::string BluezCentral::name() const
{
    return "bluez";
}

void BluezCentral::post_locked(Event ev)
{
    impl_->pending.push_back(std::move(ev));
}

// ======================================================================
// Function: BluezCentral::start
// - In: sink receives every event, always on the bus thread
// - Out: false when the bus or the signal matches cannot be set up
// - Note: the initial StateUpdated is queued and delivered by the loop
// ======================================================================
bool BluezCentral::start(EventSink sink)
{
#if !BLELINK_HAVE_SDBUS
    LOG_ERROR("[BLUEZ][central] sd-bus not available (BLELINK_HAVE_SDBUS=0)");
    impl_->state = ControllerState::Unsupported;
    if (sink)
        sink(StateUpdated{ControllerState::Unsupported});
    return false;
#else
    if (running_.load())
        return true;
    impl_->sink = std::move(sink);

    // connect system bus
    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[BLUEZ][central] failed to connect system bus: %s", strerror(-r));
        impl_->bus   = nullptr;
        impl_->state = ControllerState::Unsupported;
        if (impl_->sink)
            impl_->sink(StateUpdated{ControllerState::Unsupported});
        return false;
    }

    const char *unique = nullptr;
    if (sd_bus_get_unique_name(impl_->bus, &unique) >= 0 && unique)
        impl_->unique_name = unique;

    auto fail = [this](const char *what, int rc) {
        LOG_ERROR("[BLUEZ][central] subscribe to %s failed: %s", what, strerror(-rc));
        unref_slot(impl_->added_slot);
        unref_slot(impl_->removed_slot);
        unref_slot(impl_->props_slot);
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
        return false;
    };

    r = sd_bus_match_signal(impl_->bus, &impl_->added_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
                            bluez_on_iface_added, this);
    if (r < 0)
        return fail("InterfacesAdded", r);
    r = sd_bus_match_signal(impl_->bus, &impl_->removed_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
                            bluez_on_iface_removed, this);
    if (r < 0)
        return fail("InterfacesRemoved", r);
    // any path: Adapter1.Powered, Device1.*, GattCharacteristic1.Value
    r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, "org.bluez", nullptr,
                            "org.freedesktop.DBus.Properties", "PropertiesChanged",
                            bluez_on_props_changed, this);
    if (r < 0)
        return fail("PropertiesChanged", r);

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);

        sd_bus_error err{};
        int          powered = 0;
        r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                        "org.bluez.Adapter1", "Powered", &err, 'b', &powered);
        ControllerState s;
        if (r < 0)
        {
            const bool denied = sd_bus_error_has_name(&err, SD_BUS_ERROR_ACCESS_DENIED);
            s = denied ? ControllerState::Unauthorized : ControllerState::Unsupported;
            LOG_WARN("[BLUEZ][central] adapter %s unavailable: %s", impl_->adapter_path.c_str(),
                     err.message ? err.message : strerror(-r));
        }
        else
        {
            s = powered_state(powered != 0);
        }
        sd_bus_error_free(&err);
        impl_->state = s;
        post_locked(StateUpdated{s});

        if (r >= 0 && !cold_scan_locked())
            LOG_WARN("[BLUEZ][central] cold scan failed, continuing with signals only");
    }

    LOG_INFO("[BLUEZ][central] started on %s as %s, state=%s", impl_->adapter_path.c_str(),
             impl_->unique_name.c_str(), state_name(impl_->state.load()));

    running_.store(true, std::memory_order_relaxed);
    impl_->loop = std::thread([this] { loop(); });
    return true;
#endif
}

// ======================================================================
// Function: BluezCentral::stop
// - In: may be called anytime, will take bus_mu as needed
// - Out: matches, in-flight calls and the bus are released
// - Note: joins the bus loop thread outside of locks
// ======================================================================
void BluezCentral::stop()
{
#if BLELINK_HAVE_SDBUS
    if (!running_.exchange(false))
        return;

    // clang-format off
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        // Disconnect live links (best-effort)
        for (const auto &kv : impl_->devices) {
            if (!kv.second.connected && !kv.second.connecting)
                continue;
            sd_bus_error    derr{};
            sd_bus_message *drep = nullptr;
            (void)sd_bus_call_method(impl_->bus, "org.bluez", kv.second.path.c_str(),
                                     "org.bluez.Device1", "Disconnect", &derr, &drep, "");
            if (drep) sd_bus_message_unref(drep);
            sd_bus_error_free(&derr);
        }
        if (impl_->discovery_on.load())
            adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
        // Wake the event loop thread if it's in sd_bus_wait()
        sd_bus_close(impl_->bus);
    }

    // Join OUTSIDE of the mutex to avoid deadlocks with the loop thread.
    if (impl_->loop.joinable()) {
        if (impl_->loop.get_id() == std::this_thread::get_id()) {
            LOG_WARN("[BLUEZ][central] stop() called from the bus thread, detaching");
            impl_->loop.detach();
        } else {
            impl_->loop.join();
        }
    }
    // clang-format on

    unref_slot(impl_->added_slot);
    unref_slot(impl_->removed_slot);
    unref_slot(impl_->props_slot);
    for (auto &kv : impl_->calls)
        unref_slot(kv.second->slot);
    impl_->calls.clear();

    sd_bus_flush_close_unref(impl_->bus);
    impl_->bus = nullptr;

    impl_->devices.clear();
    impl_->char_index.clear();
    impl_->notifying.clear();
    impl_->pending.clear();
    impl_->state = ControllerState::Unknown;
    LOG_SYSTEM("[BLUEZ][central] stopped");
#endif
}

void BluezCentral::loop()
{
#if BLELINK_HAVE_SDBUS
    while (running_.load(std::memory_order_relaxed))
    {
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            while (1)
            {
                int pr = sd_bus_process(impl_->bus, nullptr);
                if (pr <= 0)
                    break;
            }
        }
        pump();
        deliver_pending();
        // do not hold the lock while waiting, callers issue calls meanwhile
        const uint64_t WAIT_USEC = 100000;  // 100ms
        sd_bus_wait(impl_->bus, WAIT_USEC);
    }
#endif
}

void BluezCentral::deliver_pending()
{
    std::vector<Event> events;
#if BLELINK_HAVE_SDBUS
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        events.swap(impl_->pending);
    }
#endif
    for (auto &ev : events)
    {
        if (!running_.load(std::memory_order_relaxed))
            break;
        if (impl_->sink)
            impl_->sink(ev);
    }
}

// ======================================================================
// Function: BluezCentral::pump
// - In: bus thread, bus_mu not held
// - Out: answers discovery requests of devices whose services resolved
// - Note: the GATT tree is walked once per resolution, later requests
//         are answered from the cached walk
// ======================================================================
void BluezCentral::pump()
{
#if BLELINK_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    for (auto &kv : impl_->devices)
    {
        const std::string &id = kv.first;
        auto              &d  = kv.second;
        if (!d.want_services && d.want_characteristics.empty())
            continue;
        if (!d.connected || !d.services_resolved)
            continue;

        blelink::MaybeError err;
        if (!d.gatt_ready && !walk_gatt_locked(id))
            err = blelink::Error::transport("GATT object walk failed");

        if (d.want_services)
        {
            post_locked(PeripheralEvent{ServicesDiscovered{
                id, err ? std::vector<std::string>{} : d.services, err}});
            d.want_services = false;
        }
        for (const auto &svc : d.want_characteristics)
        {
            std::vector<std::string> chars;
            auto                     it = d.characteristics.find(svc);
            if (!err && it != d.characteristics.end())
                chars = it->second;
            post_locked(PeripheralEvent{CharacteristicsDiscovered{id, svc, chars, err}});
        }
        d.want_characteristics.clear();
    }
#endif
}

// ---- sd-bus callbacks (bus thread, bus_mu held) ----

void BluezCentral::note_device(const std::string &path, const BluezDeviceProps &props, bool added)
{
    const std::string prefix = impl_->adapter_path + "/dev_";
    if (path.rfind(prefix, 0) != 0)
        return;
    const std::string id = mac_from_path(path);
    if (id.empty())
        return;

    auto &d = impl_->devices[id];
    d.path  = path;
    if (props.name)
        d.name = props.name;
    if (props.rssi)
        d.rssi = props.rssi;
    if (props.uuids)
        d.uuids = *props.uuids;
    for (const auto &kv : props.advertisement)
        d.advertisement[kv.first] = kv.second;

    if (props.services_resolved)
    {
        d.services_resolved = *props.services_resolved;
        if (!d.services_resolved)
            impl_->forget_gatt(d);
    }

    if (props.connected)
    {
        if (*props.connected && !d.connected)
        {
            d.connected = true;
            LOG_DEBUG("[BLUEZ][central] %s Connected=true", id.c_str());
        }
        else if (!*props.connected && d.connected)
        {
            d.connected         = false;
            d.services_resolved = false;
            d.want_services     = false;
            d.want_characteristics.clear();
            impl_->forget_gatt(d);
            LOG_SYSTEM("[BLUEZ][central] %s disconnected", id.c_str());
            // while Connect() is in flight its reply reports the outcome
            if (!d.connecting)
                post_locked(DeviceDisconnected{id, std::nullopt});
        }
    }

    if (impl_->discovery_on.load() && (added || props.rssi || !props.advertisement.empty()))
        post_locked(DeviceDiscovered{id, d.name, d.advertisement, d.rssi});
}

void BluezCentral::note_device_removed(const std::string &path)
{
    const std::string id = mac_from_path(path);
    auto              it = impl_->devices.find(id);
    if (it == impl_->devices.end())
        return;
    if (it->second.connected)
        post_locked(DeviceDisconnected{id, std::nullopt});
    impl_->forget_gatt(it->second);
    impl_->devices.erase(it);
    LOG_DEBUG("[BLUEZ][central] %s removed", id.c_str());
}

void BluezCentral::note_powered(bool powered)
{
#if BLELINK_HAVE_SDBUS
    const ControllerState s = powered_state(powered);
    if (!powered)
        impl_->discovery_on.store(false);
    if (impl_->state.exchange(s) != s)
    {
        LOG_SYSTEM("[BLUEZ][central] adapter %s", state_name(s));
        post_locked(StateUpdated{s});
    }
#else
    (void)powered;
#endif
}

void BluezCentral::note_value(const std::string &char_path, Bytes value)
{
    auto it = impl_->char_index.find(char_path);
    if (it == impl_->char_index.end() || !impl_->notifying.count(char_path))
    {
        // ReadValue replies also touch Value; those are reported by the reply
        LOG_DEBUG("[BLUEZ][central] Value change on %s ignored", char_path.c_str());
        return;
    }
    post_locked(PeripheralEvent{
        ValueUpdated{it->second.first, it->second.second, std::move(value), std::nullopt}});
}

#if BLELINK_HAVE_SDBUS
// ======================================================================
// Function: BluezCentral::on_call_reply
// - In: bus thread, bus_mu held, seq of a call in impl_->calls
// - Out: the matching completion event is queued
// - Note: releases the call's slot, which is safe from inside its callback
// ======================================================================
void BluezCentral::on_call_reply(std::uint64_t seq, sd_bus_message *m)
{
    auto it = impl_->calls.find(seq);
    if (it == impl_->calls.end())
        return;
    const PendingCall::Op   op = it->second->op;
    const std::string       id = it->second->id;
    const CharacteristicRef c  = it->second->characteristic;
    unref_slot(it->second->slot);
    impl_->calls.erase(it);

    blelink::MaybeError err;
    if (sd_bus_message_is_method_error(m, nullptr))
        err = dbus_error(sd_bus_message_get_error(m), -EIO);

    auto dev = impl_->devices.find(id);
    switch (op)
    {
        case PendingCall::Op::Connect:
            if (dev != impl_->devices.end())
                dev->second.connecting = false;
            if (err)
            {
                LOG_WARN("[BLUEZ][central] Connect %s failed: %s", id.c_str(),
                         err->message.c_str());
                post_locked(DeviceConnectFailed{id, err});
            }
            else
            {
                if (dev != impl_->devices.end())
                    dev->second.connected = true;
                LOG_SYSTEM("[BLUEZ][central] connected to %s", id.c_str());
                post_locked(DeviceConnected{id});
            }
            break;

        case PendingCall::Op::Disconnect:
        {
            bool live = false;
            if (dev != impl_->devices.end())
            {
                live                        = dev->second.cancel_was_live;
                dev->second.cancel_was_live = false;
            }
            if (err)
                LOG_WARN("[BLUEZ][central] Disconnect %s failed: %s", id.c_str(),
                         err->message.c_str());
            // a live link reports through Connected=false or the Connect() reply
            if (!live)
                post_locked(DeviceDisconnected{id, std::nullopt});
            break;
        }

        case PendingCall::Op::StartNotify:
        case PendingCall::Op::StopNotify:
        {
            const bool enabled = op == PendingCall::Op::StartNotify;
            if (!err)
            {
                if (auto path = char_path_locked(id, c))
                {
                    if (enabled)
                        impl_->notifying.insert(*path);
                    else
                        impl_->notifying.erase(*path);
                }
            }
            post_locked(PeripheralEvent{NotifyStateUpdated{id, c, enabled, err}});
            break;
        }

        case PendingCall::Op::Read:
        {
            Bytes value;
            if (!err && read_ay(m, value) < 0)
                err = blelink::Error::transport("malformed ReadValue reply");
            post_locked(PeripheralEvent{ValueUpdated{id, c, std::move(value), err}});
            break;
        }

        case PendingCall::Op::Write:
            post_locked(PeripheralEvent{ValueWritten{id, c, err}});
            break;
    }
}

bool BluezCentral::submit_locked(sd_bus_message *msg, PendingCall call)
{
    auto pc  = std::make_unique<PendingCall>(std::move(call));
    pc->self = this;
    pc->seq  = impl_->next_seq++;

    const std::uint64_t seq = pc->seq;
    int r = sd_bus_call_async(impl_->bus, &pc->slot, msg, bluez_on_call_reply, pc.get(), 0);
    sd_bus_message_unref(msg);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][central] submit %s failed: %s", pc->id.c_str(), strerror(-r));
        return false;
    }
    impl_->calls.emplace(seq, std::move(pc));
    return true;
}

// ======================================================================
// Function: BluezCentral::cold_scan_locked
// - In: bus_mu locked
// - Out: devices already known to BlueZ are cached (no events)
// ======================================================================
bool BluezCentral::cold_scan_locked()
{
    const std::string prefix = impl_->adapter_path + "/dev_";
    sd_bus_error      err{};
    int               r = bluez_walk_managed_objects(
        impl_->bus,
        [&](const std::string &path, const char *iface, sd_bus_message *m) -> int {
            if (!iface || strcmp(iface, "org.bluez.Device1") != 0 || path.rfind(prefix, 0) != 0)
                return 0;
            BluezDeviceProps props;
            int              rr = bluez_read_device_props(m, props);
            if (rr < 0)
                return rr;
            note_device(path, props, /*added=*/false);
            return 1;
        },
        &err);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] GetManagedObjects failed: %s",
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_INFO("[BLUEZ][central] cold scan: %zu known devices", impl_->devices.size());
    return true;
}

// ======================================================================
// Function: BluezCentral::walk_gatt_locked
// - In: bus_mu locked, the device is connected with services resolved
// - Out: services, characteristics and their object paths are cached
// ======================================================================
bool BluezCentral::walk_gatt_locked(const std::string &id)
{
    auto &d = impl_->devices[id];

    struct Chr
    {
        std::string path, uuid, service_path;
    };
    const std::string                  prefix = d.path + "/";
    std::map<std::string, std::string> svc_by_path;  // service object -> uuid
    std::vector<std::string>           svc_order;
    std::vector<Chr>                   chars;

    sd_bus_error err{};
    int          r = bluez_walk_managed_objects(
        impl_->bus,
        [&](const std::string &path, const char *iface, sd_bus_message *m) -> int {
            if (!iface || path.rfind(prefix, 0) != 0)
                return 0;
            const bool svc = strcmp(iface, "org.bluez.GattService1") == 0;
            const bool chr = strcmp(iface, "org.bluez.GattCharacteristic1") == 0;
            if (!svc && !chr)
                return 0;
            std::string uuid, owner;
            int         rr = bluez_read_gatt_props(m, uuid, owner);
            if (rr < 0)
                return rr;
            if (svc)
            {
                svc_by_path[path] = normalize_uuid(uuid);
                svc_order.push_back(path);
            }
            else
            {
                chars.push_back({path, normalize_uuid(uuid), owner});
            }
            return 1;
        },
        &err);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] GATT walk of %s failed: %s", id.c_str(),
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);

    impl_->forget_gatt(d);
    for (const auto &p : svc_order)
        d.services.push_back(svc_by_path[p]);
    for (const auto &c : chars)
    {
        auto s = svc_by_path.find(c.service_path);
        if (s == svc_by_path.end())
            continue;
        const CharacteristicRef ref{s->second, c.uuid};
        d.characteristics[s->second].push_back(c.uuid);
        d.char_paths[composite_key(ref)] = c.path;
        impl_->char_index[c.path]        = {id, ref};
    }
    d.gatt_ready = true;
    LOG_INFO("[BLUEZ][central] GATT of %s: %zu services, %zu characteristics", id.c_str(),
             d.services.size(), d.char_paths.size());
    return true;
}

// ======================================================================
// Function: BluezCentral::set_discovery_filter_locked
// - In: bus_mu locked
// - Out: true if Adapter1.SetDiscoveryFilter accepted the filter
// - Note: LE only; DuplicateData follows allow_duplicates
// ======================================================================
bool BluezCentral::set_discovery_filter_locked(const ScanOptions &opts)
{
    sd_bus_message *msg = nullptr;
    sd_bus_message *rep = nullptr;
    sd_bus_error    err{};

    int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez",
                                           impl_->adapter_path.c_str(), "org.bluez.Adapter1",
                                           "SetDiscoveryFilter");
    if (r < 0)
        goto out;
    if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
        goto out;
    if ((r = append_entry_s(msg, "Transport", "le")) < 0)
        goto out;
    if ((r = append_entry_b(msg, "DuplicateData", opts.allow_duplicates)) < 0)
        goto out;
    if (!opts.services.empty() && (r = append_entry_as(msg, "UUIDs", opts.services)) < 0)
        goto out;
    if ((r = sd_bus_message_close_container(msg)) < 0)
        goto out;
    r = sd_bus_call(impl_->bus, msg, 0, &err, &rep);

out:
    if (r < 0)
        LOG_WARN("[BLUEZ][central] SetDiscoveryFilter failed: %s",
                 err.message ? err.message : strerror(-r));
    if (rep)
        sd_bus_message_unref(rep);
    if (msg)
        sd_bus_message_unref(msg);
    sd_bus_error_free(&err);
    return r >= 0;
}

std::optional<std::string> BluezCentral::char_path_locked(const std::string       &id,
                                                          const CharacteristicRef &c)
{
    auto dev = impl_->devices.find(id);
    if (dev == impl_->devices.end())
        return std::nullopt;
    auto it = dev->second.char_paths.find(composite_key(c));
    if (it == dev->second.char_paths.end())
        return std::nullopt;
    return it->second;
}
#endif

// ---- ICentral commands (caller thread) ----

bool BluezCentral::scan(const ScanOptions &opts)
{
#if !BLELINK_HAVE_SDBUS
    (void)opts;
    return false;
#else
    if (!running_.load() || impl_->state.load() != ControllerState::PoweredOn)
    {
        LOG_WARN("[BLUEZ][central] scan refused, adapter %s", state_name(impl_->state.load()));
        return false;
    }
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    (void)set_discovery_filter_locked(opts);
    return adapter_start_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
#endif
}

void BluezCentral::stop_scan()
{
#if BLELINK_HAVE_SDBUS
    if (!running_.load())
        return;
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->discovery_on.load())
        adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
#endif
}

// ======================================================================
// Function: BluezCentral::connect
// - In: id is a MAC address, adapter powered
// - Out: true once Device1.Connect() is submitted
// - Note: BlueZ has no connect options; they are accepted and ignored
// ======================================================================
bool BluezCentral::connect(const std::string &id, const ConnectOptions &opts)
{
#if !BLELINK_HAVE_SDBUS
    (void)id;
    (void)opts;
    return false;
#else
    (void)opts;
    if (!running_.load() || impl_->state.load() != ControllerState::PoweredOn)
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto dev = impl_->devices.find(id);
    if (dev != impl_->devices.end() && dev->second.connecting)
    {
        LOG_WARN("[BLUEZ][central] Connect %s already in flight", id.c_str());
        return false;
    }

    const std::string path = path_from_mac(impl_->adapter_path, id);
    sd_bus_message   *msg  = nullptr;
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", path.c_str(),
                                           "org.bluez.Device1", "Connect");
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][central] build Connect() failed: %s", strerror(-r));
        return false;
    }
    PendingCall call;
    call.op = PendingCall::Op::Connect;
    call.id = id;
    if (!submit_locked(msg, std::move(call)))
        return false;
    if (dev != impl_->devices.end())
        dev->second.connecting = true;
    LOG_DEBUG("[BLUEZ][central] Connect() %s submitted", id.c_str());
    return true;
#endif
}

bool BluezCentral::cancel_connection(const std::string &id)
{
#if !BLELINK_HAVE_SDBUS
    (void)id;
    return false;
#else
    if (!running_.load())
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    const std::string path = path_from_mac(impl_->adapter_path, id);
    sd_bus_message   *msg  = nullptr;
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", path.c_str(),
                                           "org.bluez.Device1", "Disconnect");
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][central] build Disconnect() failed: %s", strerror(-r));
        return false;
    }
    auto       dev  = impl_->devices.find(id);
    const bool live = dev != impl_->devices.end() &&
                      (dev->second.connected || dev->second.connecting);
    PendingCall call;
    call.op = PendingCall::Op::Disconnect;
    call.id = id;
    if (!submit_locked(msg, std::move(call)))
        return false;
    if (dev != impl_->devices.end())
        dev->second.cancel_was_live = live;
    LOG_DEBUG("[BLUEZ][central] Disconnect() %s submitted (live=%d)", id.c_str(), live ? 1 : 0);
    return true;
#endif
}

std::vector<PeripheralInfo> BluezCentral::retrieve_known(const std::vector<std::string> &ids)
{
    std::vector<PeripheralInfo> out;
#if BLELINK_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    for (const auto &id : ids)
    {
        auto it = impl_->devices.find(id);
        if (it != impl_->devices.end())
            out.push_back(PeripheralInfo{id, it->second.name});
    }
#else
    (void)ids;
#endif
    return out;
}

std::vector<PeripheralInfo> BluezCentral::retrieve_connected(
    const std::vector<std::string> &services)
{
    std::vector<PeripheralInfo> out;
#if BLELINK_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    for (const auto &kv : impl_->devices)
    {
        if (!kv.second.connected)
            continue;
        bool match = services.empty();
        for (const auto &s : services)
            for (const auto &u : kv.second.uuids)
                match = match || uuid_eq(s, u);
        if (match)
            out.push_back(PeripheralInfo{kv.first, kv.second.name});
    }
#else
    (void)services;
#endif
    return out;
}

bool BluezCentral::discover_services(const std::string                             &id,
                                     const std::optional<std::vector<std::string>> &uuids)
{
    // BlueZ resolves the whole database on connect; the filter only narrows the caller's view
    (void)uuids;
#if !BLELINK_HAVE_SDBUS
    (void)id;
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto                        it = impl_->devices.find(id);
    if (it == impl_->devices.end() || !it->second.connected)
    {
        LOG_WARN("[BLUEZ][central] discover services on %s: not connected", id.c_str());
        return false;
    }
    it->second.want_services = true;
    return true;
#endif
}

bool BluezCentral::discover_characteristics(const std::string &id, const std::string &service,
                                            const std::optional<std::vector<std::string>> &uuids)
{
    (void)uuids;
#if !BLELINK_HAVE_SDBUS
    (void)id;
    (void)service;
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto                        it = impl_->devices.find(id);
    if (it == impl_->devices.end() || !it->second.connected)
    {
        LOG_WARN("[BLUEZ][central] discover characteristics on %s: not connected", id.c_str());
        return false;
    }
    it->second.want_characteristics.push_back(normalize_uuid(service));
    return true;
#endif
}

bool BluezCentral::set_notify(const std::string &id, const CharacteristicRef &c, bool enabled)
{
#if !BLELINK_HAVE_SDBUS
    (void)id;
    (void)c;
    (void)enabled;
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto                        path = char_path_locked(id, c);
    if (!path)
    {
        LOG_WARN("[BLUEZ][central] %s: no object for %s", id.c_str(), composite_key(c).c_str());
        return false;
    }
    sd_bus_message *msg = nullptr;
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", path->c_str(),
                                           "org.bluez.GattCharacteristic1",
                                           enabled ? "StartNotify" : "StopNotify");
    if (r < 0)
        return false;
    PendingCall call;
    call.op             = enabled ? PendingCall::Op::StartNotify : PendingCall::Op::StopNotify;
    call.id             = id;
    call.characteristic = c;
    return submit_locked(msg, std::move(call));
#endif
}

bool BluezCentral::read(const std::string &id, const CharacteristicRef &c)
{
#if !BLELINK_HAVE_SDBUS
    (void)id;
    (void)c;
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto                        path = char_path_locked(id, c);
    if (!path)
        return false;
    sd_bus_message *msg = nullptr;
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", path->c_str(),
                                           "org.bluez.GattCharacteristic1", "ReadValue");
    if (r >= 0)
        r = sd_bus_message_append(msg, "a{sv}", 0);
    if (r < 0)
    {
        if (msg)
            sd_bus_message_unref(msg);
        return false;
    }
    PendingCall call;
    call.op             = PendingCall::Op::Read;
    call.id             = id;
    call.characteristic = c;
    return submit_locked(msg, std::move(call));
#endif
}

// ======================================================================
// Function: BluezCentral::write
// - In: characteristic walked by a previous discovery
// - Out: true once WriteValue() is submitted
// - Note: type=request for WithResponse, type=command otherwise; both
//         complete with ValueWritten when BlueZ replies
// ======================================================================
bool BluezCentral::write(const std::string &id, const CharacteristicRef &c, const Bytes &data,
                         WriteMode mode)
{
#if !BLELINK_HAVE_SDBUS
    (void)id;
    (void)c;
    (void)data;
    (void)mode;
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto                        path = char_path_locked(id, c);
    if (!path)
        return false;

    sd_bus_message *msg = nullptr;
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", path->c_str(),
                                           "org.bluez.GattCharacteristic1", "WriteValue");
    if (r < 0)
        goto fail;
    if ((r = sd_bus_message_append_array(msg, 'y', data.data(), data.size())) < 0)
        goto fail;
    if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
        goto fail;
    if ((r = append_entry_s(msg, "type",
                            mode == WriteMode::WithResponse ? "request" : "command")) < 0)
        goto fail;
    if ((r = sd_bus_message_close_container(msg)) < 0)
        goto fail;
    {
        PendingCall call;
        call.op             = PendingCall::Op::Write;
        call.id             = id;
        call.characteristic = c;
        return submit_locked(msg, std::move(call));
    }

fail:
    LOG_ERROR("[BLUEZ][central] build WriteValue() failed: %s", strerror(-r));
    if (msg)
        sd_bus_message_unref(msg);
    return false;
#endif
}

}  // namespace transport
