#include <utility>
#include <vector>

#include "core/event_bus.hpp"

namespace core
{

const char *lifecycle_name(LifecycleKind k)
{
    switch (k)
    {
        case LifecycleKind::ControllerStateChanged:
            return "controller-state-changed";
        case LifecycleKind::ScanStarted:
            return "scan-started";
        case LifecycleKind::ScanStopped:
            return "scan-stopped";
        case LifecycleKind::DeviceDiscovered:
            return "device-discovered";
        case LifecycleKind::DeviceListInvalidated:
            return "device-list-invalidated";
        case LifecycleKind::WillConnect:
            return "will-connect";
        case LifecycleKind::DidConnect:
            return "did-connect";
        case LifecycleKind::WillDisconnect:
            return "will-disconnect";
        case LifecycleKind::DidDisconnect:
            return "did-disconnect";
    }
    return "?";
}

EventBus::SubscriptionId EventBus::subscribe(Handler h)
{
    std::lock_guard<std::mutex> lk(mu_);
    const SubscriptionId        id = next_id_++;
    handlers_.emplace(id, std::move(h));
    return id;
}

void EventBus::unsubscribe(SubscriptionId id)
{
    std::lock_guard<std::mutex> lk(mu_);
    handlers_.erase(id);
}

void EventBus::publish(const LifecycleEvent &ev) const
{
    // snapshot so handlers may (un)subscribe while being called
    std::vector<Handler> snapshot;
    {
        std::lock_guard<std::mutex> lk(mu_);
        snapshot.reserve(handlers_.size());
        for (const auto &kv : handlers_)
            snapshot.push_back(kv.second);
    }
    for (const auto &h : snapshot)
    {
        if (h)
            h(ev);
    }
}

}  // namespace core
