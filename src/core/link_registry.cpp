#include <algorithm>
#include <utility>

#include "core/link_registry.hpp"
#include "util/log.hpp"

namespace core
{

using transport::ControllerState;

LinkRegistry::LinkRegistry(transport::ICentral &central, EventBus &bus,
                           blelink::Scheduler &scheduler, bool allow_duplicates)
    : central_(central), bus_(bus), scheduler_(scheduler), allow_duplicates_(allow_duplicates)
{
    LOG_DEBUG("[REGISTRY] starting central '%s'", central_.name().c_str());
    // last: a loopback central reports its state from inside start()
    if (!central_.start([this](const transport::Event &ev) { handle(ev); }))
        LOG_ERROR("[REGISTRY] central '%s' failed to start", central_.name().c_str());
}

LinkRegistry::~LinkRegistry()
{
    {
        std::lock_guard<std::mutex> lk(lifetime_->mu);
        lifetime_->alive = false;
    }
    central_.stop();
    std::map<std::string, PendingTimeout> timeouts;
    {
        std::lock_guard<std::mutex> lk(mu_);
        timeouts.swap(timeouts_);
    }
    for (auto &kv : timeouts)
        if (kv.second.timer)
            kv.second.timer->invalidate();
}

// ============================================================================
// Function: wait_ready
// - In: timeout (nullopt = wait forever)
// - Out: true once the controller reported a known state
// - Note: the gate opens exactly once; afterwards every call returns at once.
// ============================================================================
bool LinkRegistry::wait_ready(std::optional<std::chrono::milliseconds> timeout) const
{
    std::unique_lock<std::mutex> lk(gate_mu_);
    if (!timeout)
    {
        gate_cv_.wait(lk, [this] { return ready_; });
        return true;
    }
    return gate_cv_.wait_for(lk, *timeout, [this] { return ready_; });
}

void LinkRegistry::open_gate()
{
    {
        std::lock_guard<std::mutex> lk(gate_mu_);
        if (ready_)
            return;
        ready_ = true;
    }
    LOG_DEBUG("[REGISTRY] controller ready");
    gate_cv_.notify_all();
}

void LinkRegistry::publish(LifecycleKind kind, const std::string &id) const
{
    LOG_DEBUG("[REGISTRY] -> %s %s", lifecycle_name(kind), id.c_str());
    bus_.publish(LifecycleEvent{kind, id});
}

// ---------------- scanning ----------------
void LinkRegistry::start_scan(std::vector<std::string> services)
{
    wait_ready();

    bool begin = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (transport::is_unavailable_state(state_))
        {
            LOG_WARN("[REGISTRY] start_scan ignored: controller %s", transport::state_name(state_));
            return;
        }
        scan_requested_ = true;
        filter_         = std::move(services);
        begin           = (state_ == ControllerState::PoweredOn);
    }
    if (begin)
        begin_scan();
    else
        LOG_INFO("[REGISTRY] scan deferred until the controller is powered on");
}

void LinkRegistry::begin_scan()
{
    transport::ScanOptions opts;
    {
        std::lock_guard<std::mutex> lk(mu_);
        scanning_             = true;
        opts.services         = filter_;
        opts.allow_duplicates = allow_duplicates_;
    }
    LOG_INFO("[REGISTRY] scanning (filter=%zu services)", opts.services.size());
    publish(LifecycleKind::ScanStarted);
    if (!central_.scan(opts))
    {
        LOG_WARN("[REGISTRY] central refused scan");
        std::lock_guard<std::mutex> lk(mu_);
        scanning_ = false;
    }
}

void LinkRegistry::stop_scan()
{
    central_.stop_scan();
    {
        std::lock_guard<std::mutex> lk(mu_);
        scanning_       = false;
        scan_requested_ = false;
    }
    publish(LifecycleKind::ScanStopped);
}

void LinkRegistry::refresh_peripherals()
{
    stop_scan();

    std::vector<std::string> filter;
    std::size_t              dropped = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        filter = filter_;
        for (auto it = links_.begin(); it != links_.end();)
        {
            if (it->second->state() == ConnectionState::Disconnected)
            {
                it = links_.erase(it);
                ++dropped;
            }
            else
            {
                ++it;
            }
        }
    }
    LOG_INFO("[REGISTRY] refresh dropped %zu peripherals", dropped);
    publish(LifecycleKind::DeviceListInvalidated);
    start_scan(std::move(filter));
}

// ---------------- connections ----------------
void LinkRegistry::connect(const DeviceLinkPtr &link, std::optional<std::chrono::milliseconds> timeout,
                           const transport::ConnectOptions &opts)
{
    wait_ready();
    if (!link)
        return;

    const std::string id = link->id();
    {
        // a held link may have been dropped by an earlier disconnect; events only
        // reach links in the table
        std::lock_guard<std::mutex> lk(mu_);
        auto                        ins = links_.emplace(id, link);
        if (ins.second)
            LOG_DEBUG("[REGISTRY] %s back in the table for connect", id.c_str());
        else if (ins.first->second != link)
            LOG_WARN("[REGISTRY] connect: %s already tracked by another link", id.c_str());
    }
    publish(LifecycleKind::WillConnect, id);
    link->set_state(ConnectionState::Connecting);
    // armed first: the connect event may arrive before connect() returns
    if (timeout)
        arm_timeout(id, *timeout);

    if (!central_.connect(id, opts))
    {
        LOG_WARN("[REGISTRY] central refused connect to %s", id.c_str());
        cancel_timeout(id);
        link->set_state(ConnectionState::Disconnected);
        publish(LifecycleKind::DidDisconnect, id);
    }
}

bool LinkRegistry::connect(const std::string &id, std::optional<std::chrono::milliseconds> timeout,
                           const transport::ConnectOptions &opts)
{
    auto link = peripheral(id);
    if (!link)
    {
        LOG_WARN("[REGISTRY] connect: unknown peripheral %s", id.c_str());
        return false;
    }
    connect(link, timeout, opts);
    return true;
}

void LinkRegistry::disconnect(const DeviceLinkPtr &link)
{
    if (!link)
        return;
    const std::string id = link->id();
    LOG_INFO("[REGISTRY] disconnect %s", id.c_str());
    publish(LifecycleKind::WillDisconnect, id);
    if (!central_.cancel_connection(id))
    {
        LOG_WARN("[REGISTRY] central refused disconnect of %s", id.c_str());
        cancel_timeout(id);
        link->disconnected();
        link->set_state(ConnectionState::Disconnected);
        publish(LifecycleKind::DidDisconnect, id);
    }
}

bool LinkRegistry::reconnect(const std::vector<std::string> &ids,
                             const std::vector<std::string> &services,
                             std::optional<std::chrono::milliseconds> timeout)
{
    wait_ready();

    auto wanted = [&ids](std::vector<transport::PeripheralInfo> found) {
        found.erase(std::remove_if(found.begin(), found.end(),
                                   [&ids](const transport::PeripheralInfo &p) {
                                       return std::find(ids.begin(), ids.end(), p.id) == ids.end();
                                   }),
                    found.end());
        return found;
    };

    auto matches = wanted(central_.retrieve_known(ids));
    if (matches.empty())
    {
        LOG_DEBUG("[REGISTRY] reconnect: no known peripherals, trying connected ones");
        matches = wanted(central_.retrieve_connected(services));
    }

    bool reconnecting = false;
    for (const auto &p : matches)
    {
        auto link = discovered(p.id, p.name, {}, std::nullopt);
        connect(link, timeout);
        reconnecting = true;
    }
    LOG_INFO("[REGISTRY] reconnect: %zu of %zu peripherals", matches.size(), ids.size());
    return reconnecting;
}

// ---------------- timeouts ----------------
void LinkRegistry::arm_timeout(const std::string &id, std::chrono::milliseconds timeout)
{
    std::uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        gen       = next_gen_++;
        auto prev = timeouts_.find(id);
        if (prev != timeouts_.end() && prev->second.timer)
            prev->second.timer->invalidate();
        timeouts_[id] = PendingTimeout{gen, nullptr};
    }

    std::weak_ptr<Lifetime> life = lifetime_;
    auto timer = scheduler_.schedule(timeout, [this, life, id, gen] {
        auto l = life.lock();
        if (!l)
            return;
        std::lock_guard<std::mutex> lk(l->mu);
        if (l->alive)
            connection_timed_out(id, gen);
    });

    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = timeouts_.find(id);
    if (it != timeouts_.end() && it->second.gen == gen)
        it->second.timer = std::move(timer);
}

bool LinkRegistry::cancel_timeout(const std::string &id)
{
    blelink::TimerPtr timer;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = timeouts_.find(id);
        if (it == timeouts_.end())
            return false;
        timer = std::move(it->second.timer);
        timeouts_.erase(it);
    }
    if (timer)
        timer->invalidate();
    return true;
}

// ============================================================================
// Function: connection_timed_out
// - In: id, gen (the arm_timeout generation this timer belongs to)
// - Out: will-disconnect, then cancel; did-disconnect is synthesized when the
//        device is gone, since the central has nothing to cancel then
// - Note: a stale generation (connected or re-armed meanwhile) is ignored.
// ============================================================================
void LinkRegistry::connection_timed_out(const std::string &id, std::uint64_t gen)
{
    DeviceLinkPtr link;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = timeouts_.find(id);
        if (it == timeouts_.end() || it->second.gen != gen)
            return;
        timeouts_.erase(it);
        auto l = links_.find(id);
        if (l != links_.end())
            link = l->second;
    }

    LOG_INFO("[REGISTRY] connection timeout: %s", id.c_str());
    publish(LifecycleKind::WillDisconnect, id);

    if (link && central_.cancel_connection(id))
        return;

    LOG_DEBUG("[REGISTRY] synthesizing disconnect for %s", id.c_str());
    if (link)
    {
        link->disconnected();
        link->set_state(ConnectionState::Disconnected);
    }
    publish(LifecycleKind::DidDisconnect, id);
}

// ---------------- table ----------------
DeviceLinkPtr LinkRegistry::discovered(const std::string &id, const std::optional<std::string> &name,
                                       const transport::AdvertisementData &advertisement,
                                       const std::optional<int>           &rssi)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = links_.find(id);
    if (it != links_.end())
    {
        it->second->rediscovered(name, advertisement, rssi);
        return it->second;
    }
    auto link = std::make_shared<DeviceLink>(id, central_, scheduler_);
    link->rediscovered(name, advertisement, rssi);
    links_.emplace(id, link);
    LOG_DEBUG("[REGISTRY] new peripheral %s (%zu known)", id.c_str(), links_.size());
    return link;
}

std::vector<DeviceLinkPtr> LinkRegistry::peripherals() const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<DeviceLinkPtr>  out;
    out.reserve(links_.size());
    for (const auto &kv : links_)
        out.push_back(kv.second);
    return out;
}

DeviceLinkPtr LinkRegistry::peripheral(const std::string &id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = links_.find(id);
    return it == links_.end() ? nullptr : it->second;
}

ControllerState LinkRegistry::state() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

bool LinkRegistry::is_scanning() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return scanning_;
}

// ---------------- transport events ----------------
void LinkRegistry::handle(const transport::Event &ev)
{
    std::visit(transport::overloaded{
                   [this](const transport::StateUpdated &e) { on_state(e); },
                   [this](const transport::DeviceDiscovered &e) { on_discovered(e); },
                   [this](const transport::DeviceConnected &e) { on_connected(e); },
                   [this](const transport::DeviceConnectFailed &e) { on_connect_failed(e); },
                   [this](const transport::DeviceDisconnected &e) { on_disconnected(e); },
                   [this](const transport::PeripheralEvent &e) { on_peripheral_event(e); },
               },
               ev);
}

void LinkRegistry::on_state(const transport::StateUpdated &ev)
{
    bool resume = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        state_ = ev.state;
        if (ev.state == ControllerState::PoweredOn)
            resume = scan_requested_ && !scanning_;
        else
            scanning_ = false;
    }
    LOG_INFO("[REGISTRY] controller %s", transport::state_name(ev.state));

    if (transport::is_known_state(ev.state))
        open_gate();
    if (resume)
        begin_scan();
    publish(LifecycleKind::ControllerStateChanged);
}

void LinkRegistry::on_discovered(const transport::DeviceDiscovered &ev)
{
    discovered(ev.id, ev.name, ev.advertisement, ev.rssi);
    publish(LifecycleKind::DeviceDiscovered, ev.id);
}

void LinkRegistry::on_connected(const transport::DeviceConnected &ev)
{
    cancel_timeout(ev.id);
    if (auto link = peripheral(ev.id))
        link->set_state(ConnectionState::Connected);
    LOG_INFO("[REGISTRY] connected: %s", ev.id.c_str());
    publish(LifecycleKind::DidConnect, ev.id);
}

void LinkRegistry::on_connect_failed(const transport::DeviceConnectFailed &ev)
{
    cancel_timeout(ev.id);
    if (auto link = peripheral(ev.id))
    {
        link->disconnected();
        link->set_state(ConnectionState::Disconnected);
    }
    LOG_WARN("[REGISTRY] connect to %s failed: %s", ev.id.c_str(),
             blelink::describe(ev.error).c_str());
    publish(LifecycleKind::DidDisconnect, ev.id);
}

void LinkRegistry::on_disconnected(const transport::DeviceDisconnected &ev)
{
    cancel_timeout(ev.id);
    if (auto link = peripheral(ev.id))
    {
        link->disconnected();
        link->set_state(ConnectionState::Disconnected);
    }
    LOG_INFO("[REGISTRY] disconnected: %s%s%s", ev.id.c_str(), ev.error ? " " : "",
             ev.error ? ev.error->message.c_str() : "");
    publish(LifecycleKind::DidDisconnect, ev.id);

    // removed after the event so observers can still look the device up
    std::lock_guard<std::mutex> lk(mu_);
    links_.erase(ev.id);
}

void LinkRegistry::on_peripheral_event(const transport::PeripheralEvent &ev)
{
    const std::string &id   = transport::peripheral_id(ev);
    auto               link = peripheral(id);
    if (!link)
    {
        LOG_DEBUG("[REGISTRY] event for unknown peripheral %s dropped", id.c_str());
        return;
    }
    link->handle(ev);
}

}  // namespace core
