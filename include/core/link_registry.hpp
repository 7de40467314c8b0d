#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/device_link.hpp"
#include "core/event_bus.hpp"
#include "transport/icentral.hpp"
#include "util/timer.hpp"

namespace core
{

// Owns the controller session: discovered-device table, scan state and
// connection timeouts. Lifecycle changes are republished on the EventBus.
//
// Scan/connect requests block until the controller first reports a known
// availability state (see wait_ready()).
class LinkRegistry
{
  public:
    // Starts the central with this registry as its event sink. Destruction stops the
    // central and waits for a connection-timeout callback that is already running.
    LinkRegistry(transport::ICentral &central, EventBus &bus, blelink::Scheduler &scheduler,
                 bool allow_duplicates = false);
    ~LinkRegistry();

    LinkRegistry(const LinkRegistry &)            = delete;
    LinkRegistry &operator=(const LinkRegistry &) = delete;

    // Blocks until the first known controller state; false on timeout.
    bool wait_ready(std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    // ---- scanning ----
    void start_scan(std::vector<std::string> services = {});
    void stop_scan();
    void refresh_peripherals();

    // ---- connections ----
    void connect(const DeviceLinkPtr &link,
                 std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                 const transport::ConnectOptions &opts = {});
    // false when `id` is not in the table
    bool connect(const std::string &id, std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                 const transport::ConnectOptions &opts = {});
    void disconnect(const DeviceLinkPtr &link);
    // true when at least one reconnect was started
    bool reconnect(const std::vector<std::string> &ids, const std::vector<std::string> &services,
                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // ---- table queries ----
    std::vector<DeviceLinkPtr> peripherals() const;
    DeviceLinkPtr              peripheral(const std::string &id) const;
    transport::ControllerState state() const;
    bool                       is_scanning() const;

    // Transport event entry point (the central's sink).
    void handle(const transport::Event &ev);

  private:
    // Timer callbacks run under `mu` and only while `alive`; the destructor clears
    // it, so it waits out a callback already past the timer's own check.
    struct Lifetime
    {
        std::mutex mu;
        bool       alive = true;
    };

    struct PendingTimeout
    {
        std::uint64_t     gen = 0;
        blelink::TimerPtr timer{};
    };

    DeviceLinkPtr discovered(const std::string &id, const std::optional<std::string> &name,
                             const transport::AdvertisementData &advertisement,
                             const std::optional<int>           &rssi);
    void          begin_scan();
    void          arm_timeout(const std::string &id, std::chrono::milliseconds timeout);
    bool          cancel_timeout(const std::string &id);
    void          connection_timed_out(const std::string &id, std::uint64_t gen);
    void          open_gate();
    void          publish(LifecycleKind kind, const std::string &id = {}) const;

    void on_state(const transport::StateUpdated &ev);
    void on_discovered(const transport::DeviceDiscovered &ev);
    void on_connected(const transport::DeviceConnected &ev);
    void on_connect_failed(const transport::DeviceConnectFailed &ev);
    void on_disconnected(const transport::DeviceDisconnected &ev);
    void on_peripheral_event(const transport::PeripheralEvent &ev);

    transport::ICentral &central_;
    EventBus            &bus_;
    blelink::Scheduler  &scheduler_;
    const bool           allow_duplicates_;

    // one-shot readiness gate
    mutable std::mutex              gate_mu_;
    mutable std::condition_variable gate_cv_;
    bool                            ready_{false};

    mutable std::mutex                    mu_;  // guards everything below
    transport::ControllerState            state_{transport::ControllerState::Unknown};
    bool                                  scanning_{false};
    bool                                  scan_requested_{false};
    std::vector<std::string>              filter_{};
    std::map<std::string, DeviceLinkPtr>  links_{};
    std::map<std::string, PendingTimeout> timeouts_{};
    std::uint64_t                         next_gen_{1};

    std::shared_ptr<Lifetime> lifetime_{std::make_shared<Lifetime>()};
};

}  // namespace core
