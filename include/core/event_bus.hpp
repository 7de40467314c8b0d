#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace core
{

enum class LifecycleKind
{
    ControllerStateChanged,
    ScanStarted,
    ScanStopped,
    DeviceDiscovered,
    DeviceListInvalidated,
    WillConnect,
    DidConnect,
    WillDisconnect,
    DidDisconnect
};

const char *lifecycle_name(LifecycleKind k);

struct LifecycleEvent
{
    LifecycleKind kind;
    std::string   device_id{};  // empty for controller/scan-wide events
};

// Process-wide publish/subscribe for lifecycle events. Handlers run on the
// publishing thread, in subscription order, outside the bus lock.
class EventBus
{
  public:
    using Handler        = std::function<void(const LifecycleEvent &)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId subscribe(Handler h);
    void           unsubscribe(SubscriptionId id);
    void           publish(const LifecycleEvent &ev) const;

  private:
    mutable std::mutex                  mu_;
    SubscriptionId                      next_id_{1};
    std::map<SubscriptionId, Handler>   handlers_;
};

}  // namespace core
