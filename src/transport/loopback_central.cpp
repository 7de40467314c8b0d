#include <algorithm>
#include <utility>

#include "transport/loopback_central.hpp"
#include "util/log.hpp"

namespace transport
{

static bool contains_uuid(const std::vector<std::string> &list, const std::string &uuid)
{
    return std::any_of(list.begin(), list.end(),
                       [&](const std::string &u) { return uuid_eq(u, uuid); });
}

LoopbackCentral::LoopbackCentral(bool auto_complete, ControllerState initial)
    : auto_complete_(auto_complete), state_(initial)
{
}

bool LoopbackCentral::start(EventSink sink)
{
    ControllerState s;
    {
        std::lock_guard<std::mutex> lk(mu_);
        sink_    = std::move(sink);
        started_ = true;
        s        = state_;
    }
    LOG_DEBUG("[LOOPBACK] start (state=%s auto=%d)", state_name(s), (int)auto_complete_);
    emit(StateUpdated{s});
    return true;
}

void LoopbackCentral::stop()
{
    std::lock_guard<std::mutex> lk(mu_);
    started_  = false;
    scanning_ = false;
    sink_     = nullptr;
}

ControllerState LoopbackCentral::state() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

void LoopbackCentral::emit(const Event &ev)
{
    EventSink sink;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
            return;
        sink = sink_;
    }
    if (sink)
        sink(ev);
}

bool LoopbackCentral::record_locked(const std::string &op, const std::string &id,
                                    const std::string &detail)
{
    calls_.push_back(LoopbackCall{op, id, detail});
    auto it = refusals_.find(op);
    if (it != refusals_.end() && it->second > 0)
    {
        if (--it->second == 0)
            refusals_.erase(it);
        LOG_DEBUG("[LOOPBACK] refusing %s on %s", op.c_str(), id.c_str());
        return false;
    }
    return true;
}

blelink::MaybeError LoopbackCentral::take_failure_locked(const std::string &op)
{
    auto it = failures_.find(op);
    if (it == failures_.end())
        return std::nullopt;
    blelink::Error e = it->second;
    failures_.erase(it);
    return e;
}

// ---------------- scan ----------------
bool LoopbackCentral::scan(const ScanOptions &opts)
{
    std::vector<Event> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!record_locked("scan", "", std::to_string(opts.services.size())))
            return false;
        if (state_ != ControllerState::PoweredOn)
            return false;
        scanning_  = true;
        last_scan_ = opts;
        if (auto_complete_)
        {
            for (const auto &kv : sims_)
            {
                const auto &p   = kv.second.peripheral;
                bool        hit = opts.services.empty();
                for (const auto &svc : p.services)
                    hit = hit || contains_uuid(opts.services, svc.uuid);
                if (hit)
                    out.emplace_back(DeviceDiscovered{p.id, p.name, p.advertisement, p.rssi});
            }
        }
    }
    for (const auto &ev : out)
        emit(ev);
    return true;
}

void LoopbackCentral::stop_scan()
{
    std::lock_guard<std::mutex> lk(mu_);
    (void)record_locked("stop_scan", "", "");
    scanning_ = false;
}

// ---------------- connection ----------------
bool LoopbackCentral::connect(const std::string &id, const ConnectOptions &opts)
{
    std::optional<Event> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        std::string flags = std::string(opts.notify_on_connection ? "c" : "") +
                            (opts.notify_on_disconnection ? "d" : "") +
                            (opts.notify_on_notification ? "n" : "");
        if (!record_locked("connect", id, flags))
            return false;
        if (!auto_complete_)
            return true;
        auto it = sims_.find(id);
        auto fail = take_failure_locked("connect");
        if (it == sims_.end() || fail)
        {
            out = DeviceConnectFailed{
                id, fail ? fail : blelink::MaybeError(blelink::Error::transport("unknown device"))};
        }
        else
        {
            it->second.connected = true;
            out                  = DeviceConnected{id};
        }
    }
    emit(*out);
    return true;
}

bool LoopbackCentral::cancel_connection(const std::string &id)
{
    std::optional<Event> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!record_locked("cancel_connection", id, ""))
            return false;
        if (!auto_complete_)
            return true;
        auto it = sims_.find(id);
        if (it == sims_.end())
            return false;
        it->second.connected = false;
        out                  = DeviceDisconnected{id, std::nullopt};
    }
    emit(*out);
    return true;
}

std::vector<PeripheralInfo> LoopbackCentral::retrieve_known(const std::vector<std::string> &ids)
{
    std::lock_guard<std::mutex> lk(mu_);
    (void)record_locked("retrieve_known", "", std::to_string(ids.size()));
    std::vector<PeripheralInfo> out;
    for (const auto &id : ids)
    {
        auto it = sims_.find(id);
        if (it != sims_.end())
            out.push_back(PeripheralInfo{id, it->second.peripheral.name});
    }
    return out;
}

std::vector<PeripheralInfo> LoopbackCentral::retrieve_connected(
    const std::vector<std::string> &services)
{
    std::lock_guard<std::mutex> lk(mu_);
    (void)record_locked("retrieve_connected", "", std::to_string(services.size()));
    std::vector<PeripheralInfo> out;
    for (const auto &kv : sims_)
    {
        if (!kv.second.connected)
            continue;
        for (const auto &svc : kv.second.peripheral.services)
        {
            if (contains_uuid(services, svc.uuid))
            {
                out.push_back(PeripheralInfo{kv.first, kv.second.peripheral.name});
                break;
            }
        }
    }
    return out;
}

// ---------------- GATT ----------------
bool LoopbackCentral::discover_services(const std::string                             &id,
                                        const std::optional<std::vector<std::string>> &uuids)
{
    std::optional<Event> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!record_locked("discover_services", id,
                           uuids ? std::to_string(uuids->size()) : std::string("all")))
            return false;
        if (!auto_complete_)
            return true;
        auto it = sims_.find(id);
        if (it == sims_.end() || !it->second.connected)
            return false;
        ServicesDiscovered ev{id, {}, take_failure_locked("discover_services")};
        if (!ev.error)
        {
            for (const auto &svc : it->second.peripheral.services)
                if (!uuids || contains_uuid(*uuids, svc.uuid))
                    ev.services.push_back(svc.uuid);
        }
        out = std::move(ev);
    }
    emit(*out);
    return true;
}

bool LoopbackCentral::discover_characteristics(const std::string &id, const std::string &service,
                                               const std::optional<std::vector<std::string>> &uuids)
{
    std::optional<Event> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!record_locked("discover_characteristics", id, service))
            return false;
        if (!auto_complete_)
            return true;
        auto it = sims_.find(id);
        if (it == sims_.end() || !it->second.connected)
            return false;
        CharacteristicsDiscovered ev{id, service, {},
                                     take_failure_locked("discover_characteristics")};
        if (!ev.error)
        {
            for (const auto &svc : it->second.peripheral.services)
            {
                if (!uuid_eq(svc.uuid, service))
                    continue;
                for (const auto &c : svc.characteristics)
                    if (!uuids || contains_uuid(*uuids, c))
                        ev.characteristics.push_back(c);
            }
        }
        out = std::move(ev);
    }
    emit(*out);
    return true;
}

bool LoopbackCentral::set_notify(const std::string &id, const CharacteristicRef &c, bool enabled)
{
    std::optional<Event> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!record_locked("set_notify", id, composite_key(c) + (enabled ? ":on" : ":off")))
            return false;
        if (!auto_complete_)
            return true;
        out = NotifyStateUpdated{id, c, enabled, take_failure_locked("set_notify")};
    }
    emit(*out);
    return true;
}

bool LoopbackCentral::read(const std::string &id, const CharacteristicRef &c)
{
    std::optional<Event> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!record_locked("read", id, composite_key(c)))
            return false;
        if (!auto_complete_)
            return true;
        ValueUpdated ev{id, c, {}, take_failure_locked("read")};
        auto         it = sims_.find(id);
        if (!ev.error && it != sims_.end())
        {
            auto v = it->second.values.find(composite_key(c));
            if (v != it->second.values.end())
                ev.value = v->second;
        }
        out = std::move(ev);
    }
    emit(*out);
    return true;
}

bool LoopbackCentral::write(const std::string &id, const CharacteristicRef &c, const Bytes &data,
                            WriteMode mode)
{
    std::optional<Event> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!record_locked("write", id,
                           composite_key(c) +
                               (mode == WriteMode::WithResponse ? ":req" : ":cmd")))
            return false;
        auto it = sims_.find(id);
        if (it != sims_.end())
            it->second.values[composite_key(c)] = data;
        if (!auto_complete_)
            return true;
        out = ValueWritten{id, c, take_failure_locked("write")};
    }
    emit(*out);
    return true;
}

// ---------------- simulation controls ----------------
void LoopbackCentral::add_peripheral(SimPeripheral p)
{
    std::lock_guard<std::mutex> lk(mu_);
    std::string                 id = p.id;
    sims_[id]                      = Sim{std::move(p), false, {}};
}

void LoopbackCentral::set_state(ControllerState s)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        state_ = s;
        if (s != ControllerState::PoweredOn)
            scanning_ = false;
    }
    emit(StateUpdated{s});
}

void LoopbackCentral::deliver(const Event &ev)
{
    // keep connection flags coherent with injected connection events
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (auto *c = std::get_if<DeviceConnected>(&ev))
        {
            auto it = sims_.find(c->id);
            if (it != sims_.end())
                it->second.connected = true;
        }
        else if (auto *d = std::get_if<DeviceDisconnected>(&ev))
        {
            auto it = sims_.find(d->id);
            if (it != sims_.end())
                it->second.connected = false;
        }
    }
    emit(ev);
}

void LoopbackCentral::notify(const std::string &id, const CharacteristicRef &c, Bytes value)
{
    set_value(id, c, value);
    emit(ValueUpdated{id, c, std::move(value), std::nullopt});
}

void LoopbackCentral::set_value(const std::string &id, const CharacteristicRef &c, Bytes value)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = sims_.find(id);
    if (it != sims_.end())
        it->second.values[composite_key(c)] = std::move(value);
}

void LoopbackCentral::fail_next(const std::string &op, blelink::Error err)
{
    std::lock_guard<std::mutex> lk(mu_);
    failures_[op] = std::move(err);
}

void LoopbackCentral::refuse_next(const std::string &op)
{
    std::lock_guard<std::mutex> lk(mu_);
    refusals_[op]++;
}

std::vector<LoopbackCall> LoopbackCentral::calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return calls_;
}

std::size_t LoopbackCentral::count(const std::string &op) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return static_cast<std::size_t>(std::count_if(
        calls_.begin(), calls_.end(), [&](const LoopbackCall &c) { return c.op == op; }));
}

void LoopbackCentral::clear_calls()
{
    std::lock_guard<std::mutex> lk(mu_);
    calls_.clear();
}

bool LoopbackCentral::scanning() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return scanning_;
}

std::optional<ScanOptions> LoopbackCentral::last_scan() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return last_scan_;
}

std::optional<Bytes> LoopbackCentral::value(const std::string &id, const CharacteristicRef &c) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = sims_.find(id);
    if (it == sims_.end())
        return std::nullopt;
    auto v = it->second.values.find(composite_key(c));
    if (v == it->second.values.end())
        return std::nullopt;
    return v->second;
}

}  // namespace transport
