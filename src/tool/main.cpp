#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/device_link.hpp"
#include "core/event_bus.hpp"
#include "core/link_registry.hpp"
#include "transport/bluez_central.hpp"
#include "transport/loopback_central.hpp"
#include "util/config.hpp"
#include "util/log.hpp"
#include "util/timer.hpp"

// Seeds the loopback radio so the tool has something to find without BLE.
static void seed_loopback(transport::LoopbackCentral &lb)
{
    transport::SimPeripheral p;
    p.id   = "00:11:22:33:44:55";
    p.name = "blelink-sim";
    p.rssi = -48;
    const std::string name = *p.name;
    p.advertisement["local_name"] = transport::Bytes(name.begin(), name.end());
    p.services = {
        {"0000180f-0000-1000-8000-00805f9b34fb", {"00002a19-0000-1000-8000-00805f9b34fb"}},
        {"0000180a-0000-1000-8000-00805f9b34fb",
         {"00002a29-0000-1000-8000-00805f9b34fb", "00002a24-0000-1000-8000-00805f9b34fb"}},
    };
    lb.add_peripheral(std::move(p));
}

std::unique_ptr<transport::ICentral> make_central_from_config(const blelink::Config &cfg)
{
    if (cfg.transport == "bluez")
    {
        transport::BluezConfig bc;
        bc.adapter = cfg.adapter;
        return std::make_unique<transport::BluezCentral>(std::move(bc));
    }
    // default - loopback
    auto lb = std::make_unique<transport::LoopbackCentral>();
    seed_loopback(*lb);
    return lb;
}

// Records lifecycle events so the tool can wait for a specific one. Publishing
// snapshots handlers, so the recorded state outlives the subscription.
class LifecycleWaiter
{
  public:
    explicit LifecycleWaiter(core::EventBus &bus) : bus_(bus), st_(std::make_shared<State>())
    {
        auto st = st_;
        sub_    = bus_.subscribe([st](const core::LifecycleEvent &ev) {
            std::lock_guard<std::mutex> lk(st->mu);
            st->seen.push_back(ev);
            st->cv.notify_all();
        });
    }
    ~LifecycleWaiter() { bus_.unsubscribe(sub_); }

    // Waits for the first of `a` / `b` on `id`; returns it, or nullopt on timeout.
    std::optional<core::LifecycleKind> wait_any(core::LifecycleKind a, core::LifecycleKind b,
                                                const std::string        &id,
                                                std::chrono::milliseconds timeout)
    {
        std::optional<core::LifecycleKind> hit;
        std::unique_lock<std::mutex>       lk(st_->mu);
        st_->cv.wait_for(lk, timeout, [&] {
            for (const auto &ev : st_->seen)
            {
                if (ev.device_id == id && (ev.kind == a || ev.kind == b))
                {
                    hit = ev.kind;
                    return true;
                }
            }
            return false;
        });
        return hit;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lk(st_->mu);
        st_->seen.clear();
    }

  private:
    struct State
    {
        std::mutex                        mu;
        std::condition_variable           cv;
        std::vector<core::LifecycleEvent> seen;
    };

    core::EventBus                &bus_;
    std::shared_ptr<State>         st_;
    core::EventBus::SubscriptionId sub_{};
};

// Runs one command on the link and blocks until its completion fired. The state
// is shared so a completion arriving after the timeout has somewhere to go.
template <typename Submit>
static blelink::MaybeError run_blocking(Submit submit, std::chrono::milliseconds timeout)
{
    struct State
    {
        std::mutex              mu;
        std::condition_variable cv;
        bool                    done = false;
        blelink::MaybeError     result;
    };
    auto st = std::make_shared<State>();

    submit([st](const blelink::MaybeError &err) {
        std::lock_guard<std::mutex> lk(st->mu);
        st->result = err;
        st->done   = true;
        st->cv.notify_all();
    });

    std::unique_lock<std::mutex> lk(st->mu);
    if (!st->cv.wait_for(lk, timeout, [&] { return st->done; }))
        return blelink::Error::timeout();
    return st->result;
}

static void print_table(const std::vector<core::DeviceLinkPtr> &links)
{
    if (links.empty())
    {
        LOG_SYSTEM("[SCAN] no peripherals found");
        return;
    }
    std::printf("%-17s  %5s  %-10s  %s\n", "ID", "RSSI", "STATE", "NAME");
    for (const auto &l : links)
    {
        const auto rssi = l->rssi();
        const auto name = l->name();
        std::printf("%-17s  %5s  %-10s  %s\n", l->id().c_str(),
                    rssi ? std::to_string(*rssi).c_str() : "-",
                    core::connection_state_name(l->state()), name ? name->c_str() : "");
    }
    std::fflush(stdout);
}

// Connects, walks the whole GATT database, logs it and disconnects again.
static int explore_peer(core::LinkRegistry &registry, core::EventBus &bus,
                        const blelink::Config &cfg, const std::string &peer)
{
    const auto timeout = cfg.connect_timeout.count() > 0
                             ? std::optional<std::chrono::milliseconds>(cfg.connect_timeout)
                             : std::nullopt;
    // without a registry timeout the tool still needs an upper bound
    const std::chrono::milliseconds wait_cap =
        timeout ? *timeout + std::chrono::seconds(2) : std::chrono::milliseconds(30000);

    LifecycleWaiter waiter(bus);
    bool            started = registry.connect(peer, timeout);
    if (!started)
        started = registry.reconnect({peer}, cfg.scan_services, timeout);
    if (!started)
    {
        LOG_ERROR("[CONNECT] %s is unknown to the controller", peer.c_str());
        return 1;
    }
    auto outcome = waiter.wait_any(core::LifecycleKind::DidConnect,
                                   core::LifecycleKind::DidDisconnect, peer, wait_cap);
    if (outcome != core::LifecycleKind::DidConnect)
    {
        LOG_ERROR("[CONNECT] %s did not connect", peer.c_str());
        return 1;
    }

    auto link = registry.peripheral(peer);
    if (!link)
    {
        LOG_ERROR("[CONNECT] %s vanished from the table", peer.c_str());
        return 1;
    }

    const std::chrono::milliseconds op_timeout(15000);
    auto err = run_blocking([&](core::Completion done) { link->discover_services(std::nullopt, done); },
                            op_timeout);
    if (err)
    {
        LOG_ERROR("[GATT] service discovery failed: %s", blelink::describe(err).c_str());
    }
    else
    {
        for (const auto &svc : link->services())
        {
            auto cerr = run_blocking(
                [&](core::Completion done) { link->discover_characteristics(std::nullopt, svc, done); },
                op_timeout);
            if (cerr)
            {
                LOG_WARN("[GATT] %s: %s", svc.c_str(), blelink::describe(cerr).c_str());
                continue;
            }
            LOG_SYSTEM("[GATT] service %s", svc.c_str());
            for (const auto &chr : link->characteristics(svc))
                LOG_SYSTEM("[GATT]   characteristic %s", chr.c_str());
        }
    }

    waiter.clear();
    registry.disconnect(link);
    if (!waiter.wait_any(core::LifecycleKind::DidDisconnect, core::LifecycleKind::DidDisconnect,
                         peer, wait_cap))
        LOG_WARN("[CONNECT] no did-disconnect from %s", peer.c_str());
    return err ? 1 : 0;
}

int main()
{
    const blelink::Config cfg = blelink::Config::from_env();
    blelink::set_log_level_by_name(cfg.log_level.c_str());

    LOG_SYSTEM("Config: transport=%s adapter=%s scan=%llds timeout=%lldms peer=%s",
               cfg.transport.c_str(), cfg.adapter.c_str(), (long long)cfg.scan_duration.count(),
               (long long)cfg.connect_timeout.count(), cfg.peer ? cfg.peer->c_str() : "(none)");

    auto central = make_central_from_config(cfg);

    core::EventBus           bus;
    blelink::ThreadScheduler scheduler;
    bus.subscribe([](const core::LifecycleEvent &ev) {
        if (ev.device_id.empty())
            LOG_INFO("[EVENT] %s", core::lifecycle_name(ev.kind));
        else
            LOG_INFO("[EVENT] %s %s", core::lifecycle_name(ev.kind), ev.device_id.c_str());
    });

    core::LinkRegistry registry(*central, bus, scheduler, cfg.allow_duplicates);
    if (!registry.wait_ready(std::chrono::seconds(5)))
    {
        LOG_ERROR("controller did not report its state");
        return 1;
    }
    if (registry.state() != transport::ControllerState::PoweredOn)
    {
        LOG_ERROR("controller is %s", transport::state_name(registry.state()));
        return 1;
    }

    registry.start_scan(cfg.scan_services);
    std::this_thread::sleep_for(cfg.scan_duration);
    registry.stop_scan();

    auto links = registry.peripherals();
    std::sort(links.begin(), links.end(), [](const core::DeviceLinkPtr &a, const core::DeviceLinkPtr &b) {
        return a->rssi().value_or(-127) > b->rssi().value_or(-127);
    });
    print_table(links);

    int rc = 0;
    if (cfg.peer)
        rc = explore_peer(registry, bus, cfg, *cfg.peer);
    return rc;
}
