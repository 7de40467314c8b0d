#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/event_bus.hpp"
#include "core/link_registry.hpp"
#include "test_support.hpp"
#include "transport/loopback_central.hpp"

using namespace transport;
using core::ConnectionState;
using core::LifecycleKind;
using core::LinkRegistry;
using namespace std::chrono_literals;

namespace
{
const std::string kHrm   = "AA:BB:CC:DD:EE:01";
const std::string kScale = "AA:BB:CC:DD:EE:02";
const std::string kHrSvc = "0000180d-0000-1000-8000-00805f9b34fb";
const std::string kWsSvc = "0000181d-0000-1000-8000-00805f9b34fb";
const std::string kMeas  = "00002a37-0000-1000-8000-00805f9b34fb";

class LinkRegistryTest : public ::testing::Test
{
  protected:
    explicit LinkRegistryTest(bool            auto_complete = true,
                              ControllerState initial       = ControllerState::PoweredOn)
        : central(auto_complete, initial), rec(bus)
    {
        SimPeripheral hrm;
        hrm.id       = kHrm;
        hrm.name     = "hrm";
        hrm.rssi     = -50;
        hrm.services = {{kHrSvc, {kMeas}}};
        central.add_peripheral(hrm);

        SimPeripheral scale;
        scale.id       = kScale;
        scale.name     = "scale";
        scale.rssi     = -80;
        scale.services = {{kWsSvc, {}}};
        central.add_peripheral(scale);
    }

    void SetUp() override { registry = std::make_unique<LinkRegistry>(central, bus, sched); }

    // discovered through a scan, table populated
    core::DeviceLinkPtr discover(const std::string &id)
    {
        central.deliver(DeviceDiscovered{id, std::nullopt, {}, -60});
        return registry->peripheral(id);
    }

    LoopbackCentral               central;
    ManualScheduler               sched;
    core::EventBus                bus;
    LifecycleRecorder             rec;
    std::unique_ptr<LinkRegistry> registry;
};

// Hands out timers that cannot be stopped: run_all() fires every callback even
// after invalidate(), like a worker that already claimed the timer.
class UnstoppableScheduler final : public blelink::Scheduler
{
  public:
    blelink::TimerPtr schedule(std::chrono::milliseconds, std::function<void()> fn) override
    {
        fns_.push_back(std::move(fn));
        return std::make_shared<Handle>();
    }

    void run_all()
    {
        auto fns = std::move(fns_);
        fns_.clear();
        for (auto &fn : fns)
            fn();
    }

  private:
    struct Handle final : blelink::TimerHandle
    {
        void invalidate() override {}
        bool is_valid() const override { return true; }
    };
    std::vector<std::function<void()>> fns_;
};

class LinkRegistryManualTest : public LinkRegistryTest
{
  protected:
    LinkRegistryManualTest() : LinkRegistryTest(false) {}
};

class LinkRegistryUnknownStateTest : public LinkRegistryTest
{
  protected:
    LinkRegistryUnknownStateTest() : LinkRegistryTest(true, ControllerState::Unknown) {}
};
}  // namespace

// ---------------- readiness gate ----------------

TEST_F(LinkRegistryTest, GateOpenAfterInitialState)
{
    EXPECT_TRUE(registry->wait_ready(0ms));
    EXPECT_EQ(registry->state(), ControllerState::PoweredOn);
    EXPECT_EQ(rec.count(LifecycleKind::ControllerStateChanged), 1u);
}

TEST_F(LinkRegistryUnknownStateTest, GateWaitsForKnownState)
{
    EXPECT_FALSE(registry->wait_ready(10ms));
    central.set_state(ControllerState::Resetting);
    EXPECT_FALSE(registry->wait_ready(10ms));
    central.set_state(ControllerState::PoweredOff);
    EXPECT_TRUE(registry->wait_ready(0ms));

    // one-shot: later states do not close it again
    central.set_state(ControllerState::Unknown);
    EXPECT_TRUE(registry->wait_ready(0ms));
}

TEST_F(LinkRegistryUnknownStateTest, ScanBlocksUntilControllerReports)
{
    std::atomic_bool returned{false};
    std::thread      caller([&] {
        registry->start_scan();
        returned = true;
    });

    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(returned.load());
    EXPECT_EQ(central.count("scan"), 0u);

    central.set_state(ControllerState::PoweredOn);
    caller.join();
    EXPECT_TRUE(returned.load());
    EXPECT_EQ(central.count("scan"), 1u);
    EXPECT_TRUE(registry->is_scanning());
}

// ---------------- scanning ----------------

TEST_F(LinkRegistryTest, ScanPublishesAndFillsTable)
{
    registry->start_scan();
    EXPECT_TRUE(registry->is_scanning());
    EXPECT_TRUE(central.scanning());
    EXPECT_EQ(rec.count(LifecycleKind::ScanStarted), 1u);
    EXPECT_EQ(rec.count(LifecycleKind::DeviceDiscovered), 2u);
    EXPECT_EQ(registry->peripherals().size(), 2u);

    auto hrm = registry->peripheral(kHrm);
    ASSERT_TRUE(hrm);
    EXPECT_EQ(hrm->name().value_or(""), "hrm");
    EXPECT_EQ(hrm->rssi().value_or(0), -50);
    EXPECT_EQ(hrm->state(), ConnectionState::Disconnected);
}

TEST_F(LinkRegistryTest, ScanFilterIsPassedToController)
{
    registry->start_scan({kWsSvc});
    auto opts = central.last_scan();
    ASSERT_TRUE(opts);
    ASSERT_EQ(opts->services.size(), 1u);
    EXPECT_EQ(opts->services[0], kWsSvc);
    EXPECT_FALSE(opts->allow_duplicates);

    ASSERT_EQ(registry->peripherals().size(), 1u);
    EXPECT_TRUE(registry->peripheral(kScale));
    EXPECT_FALSE(registry->peripheral(kHrm));
}

TEST_F(LinkRegistryTest, DuplicatesOptionReachesController)
{
    LinkRegistry dup(central, bus, sched, /*allow_duplicates=*/true);
    dup.start_scan();
    auto opts = central.last_scan();
    ASSERT_TRUE(opts);
    EXPECT_TRUE(opts->allow_duplicates);
}

TEST_F(LinkRegistryTest, ScanIgnoredWhenControllerUnavailable)
{
    central.set_state(ControllerState::PoweredOff);
    rec.clear();
    registry->start_scan();
    EXPECT_FALSE(registry->is_scanning());
    EXPECT_EQ(central.count("scan"), 0u);
    EXPECT_EQ(rec.count(LifecycleKind::ScanStarted), 0u);

    // not remembered either
    central.set_state(ControllerState::PoweredOn);
    EXPECT_EQ(central.count("scan"), 0u);
}

TEST_F(LinkRegistryTest, ScanDeferredWhileResettingThenResumed)
{
    central.set_state(ControllerState::Resetting);
    registry->start_scan();
    EXPECT_EQ(central.count("scan"), 0u);
    EXPECT_FALSE(registry->is_scanning());

    central.set_state(ControllerState::PoweredOn);
    EXPECT_EQ(central.count("scan"), 1u);
    EXPECT_TRUE(registry->is_scanning());
}

TEST_F(LinkRegistryTest, PowerLossStopsScanning)
{
    registry->start_scan();
    rec.clear();
    central.set_state(ControllerState::PoweredOff);
    EXPECT_FALSE(registry->is_scanning());
    EXPECT_EQ(registry->state(), ControllerState::PoweredOff);
    EXPECT_EQ(rec.count(LifecycleKind::ControllerStateChanged), 1u);
}

TEST_F(LinkRegistryTest, StopScanAlwaysPublishes)
{
    registry->stop_scan();
    registry->start_scan();
    registry->stop_scan();
    EXPECT_EQ(rec.count(LifecycleKind::ScanStopped), 2u);
    EXPECT_FALSE(registry->is_scanning());
    EXPECT_FALSE(central.scanning());
}

TEST_F(LinkRegistryTest, RediscoveryMergesIntoExistingLink)
{
    central.deliver(DeviceDiscovered{kHrm, std::string("hrm"), {{"local_name", {'h'}}}, -70});
    auto first = registry->peripheral(kHrm);
    ASSERT_TRUE(first);
    const auto seen = first->last_seen();

    std::this_thread::sleep_for(2ms);
    central.deliver(DeviceDiscovered{kHrm, std::nullopt, {{"tx_power", {4}}}, -40});
    auto again = registry->peripheral(kHrm);
    EXPECT_EQ(again, first);
    EXPECT_EQ(registry->peripherals().size(), 1u);

    auto adv = again->advertisement();
    EXPECT_EQ(adv.size(), 2u);
    EXPECT_EQ(adv.count("local_name"), 1u);
    EXPECT_EQ(adv.count("tx_power"), 1u);
    EXPECT_EQ(again->rssi().value_or(0), -40);
    EXPECT_TRUE(again->last_seen() > seen);
    EXPECT_EQ(rec.count(LifecycleKind::DeviceDiscovered, kHrm), 2u);
}

TEST_F(LinkRegistryManualTest, RefreshDropsIdleButKeepsConnecting)
{
    auto hrm   = discover(kHrm);
    auto scale = discover(kScale);
    ASSERT_TRUE(hrm && scale);
    registry->connect(hrm);
    EXPECT_EQ(hrm->state(), ConnectionState::Connecting);

    rec.clear();
    registry->refresh_peripherals();
    EXPECT_TRUE(registry->peripheral(kHrm));
    EXPECT_FALSE(registry->peripheral(kScale));

    auto kinds = rec.kinds();
    ASSERT_EQ(kinds.size(), 3u);
    EXPECT_EQ(kinds[0], LifecycleKind::ScanStopped);
    EXPECT_EQ(kinds[1], LifecycleKind::DeviceListInvalidated);
    EXPECT_EQ(kinds[2], LifecycleKind::ScanStarted);
}

// ---------------- connections ----------------

TEST_F(LinkRegistryTest, ConnectPublishesWillThenDid)
{
    auto hrm = discover(kHrm);
    ASSERT_TRUE(hrm);
    rec.clear();

    registry->connect(hrm, 5000ms);
    auto kinds = rec.kinds();
    ASSERT_EQ(kinds.size(), 2u);
    EXPECT_EQ(kinds[0], LifecycleKind::WillConnect);
    EXPECT_EQ(kinds[1], LifecycleKind::DidConnect);
    EXPECT_EQ(hrm->state(), ConnectionState::Connected);
    EXPECT_EQ(sched.armed(), 0u);

    // a stale timer would have nothing to do
    sched.advance(6000ms);
    EXPECT_EQ(rec.count(LifecycleKind::WillDisconnect), 0u);
}

TEST_F(LinkRegistryTest, ConnectByIdNeedsKnownDevice)
{
    EXPECT_FALSE(registry->connect(kHrm));
    EXPECT_EQ(central.count("connect"), 0u);

    discover(kHrm);
    EXPECT_TRUE(registry->connect(kHrm));
    EXPECT_EQ(registry->peripheral(kHrm)->state(), ConnectionState::Connected);
}

TEST_F(LinkRegistryTest, ConnectOptionsReachController)
{
    auto             hrm = discover(kHrm);
    ConnectOptions   opts;
    opts.notify_on_disconnection = true;
    registry->connect(hrm, std::nullopt, opts);
    auto calls = central.calls();
    ASSERT_FALSE(calls.empty());
    EXPECT_EQ(calls.back().op, "connect");
    EXPECT_EQ(calls.back().detail, "d");
}

TEST_F(LinkRegistryManualTest, ConnectTimeoutEndsWithOneDidDisconnect)
{
    auto hrm = discover(kHrm);
    registry->connect(hrm, 100ms);
    EXPECT_EQ(rec.count(LifecycleKind::WillConnect, kHrm), 1u);

    sched.advance(99ms);
    EXPECT_EQ(rec.count(LifecycleKind::WillDisconnect, kHrm), 0u);
    EXPECT_EQ(central.count("cancel_connection"), 0u);

    sched.advance(1ms);
    EXPECT_EQ(rec.count(LifecycleKind::WillDisconnect, kHrm), 1u);
    EXPECT_EQ(central.count("cancel_connection"), 1u);

    // the controller answers the cancel
    central.deliver(DeviceDisconnected{kHrm, std::nullopt});
    sched.advance(1000ms);

    EXPECT_EQ(rec.count(LifecycleKind::WillDisconnect, kHrm), 1u);
    EXPECT_EQ(rec.count(LifecycleKind::DidDisconnect, kHrm), 1u);
    EXPECT_EQ(rec.count(LifecycleKind::DidConnect, kHrm), 0u);
}

TEST_F(LinkRegistryManualTest, ConnectTimeoutSynthesizesDisconnectWhenCancelRefused)
{
    auto hrm = discover(kHrm);
    registry->connect(hrm, 10ms);
    central.refuse_next("cancel_connection");

    sched.advance(10ms);
    EXPECT_EQ(rec.count(LifecycleKind::WillDisconnect, kHrm), 1u);
    EXPECT_EQ(rec.count(LifecycleKind::DidDisconnect, kHrm), 1u);
    EXPECT_EQ(rec.count(LifecycleKind::DidConnect, kHrm), 0u);
    EXPECT_EQ(hrm->state(), ConnectionState::Disconnected);
}

TEST_F(LinkRegistryManualTest, ConnectSuccessDisarmsTimeout)
{
    auto hrm = discover(kHrm);
    registry->connect(hrm, 100ms);
    central.deliver(DeviceConnected{kHrm});
    EXPECT_EQ(hrm->state(), ConnectionState::Connected);

    sched.advance(500ms);
    EXPECT_EQ(rec.count(LifecycleKind::DidConnect, kHrm), 1u);
    EXPECT_EQ(rec.count(LifecycleKind::WillDisconnect, kHrm), 0u);
    EXPECT_EQ(central.count("cancel_connection"), 0u);
}

TEST_F(LinkRegistryManualTest, ReconnectRearmsTimeout)
{
    auto hrm = discover(kHrm);
    registry->connect(hrm, 100ms);
    sched.advance(60ms);
    registry->connect(hrm, 100ms);  // superseded: only the second deadline counts
    sched.advance(60ms);
    EXPECT_EQ(rec.count(LifecycleKind::WillDisconnect, kHrm), 0u);
    sched.advance(40ms);
    EXPECT_EQ(rec.count(LifecycleKind::WillDisconnect, kHrm), 1u);
}

TEST_F(LinkRegistryTest, RefusedConnectSynthesizesDidDisconnect)
{
    auto hrm = discover(kHrm);
    central.refuse_next("connect");
    rec.clear();

    registry->connect(hrm, 1000ms);
    auto kinds = rec.kinds();
    ASSERT_EQ(kinds.size(), 2u);
    EXPECT_EQ(kinds[0], LifecycleKind::WillConnect);
    EXPECT_EQ(kinds[1], LifecycleKind::DidDisconnect);
    EXPECT_EQ(hrm->state(), ConnectionState::Disconnected);
    EXPECT_EQ(sched.armed(), 0u);
}

TEST_F(LinkRegistryTest, FailedConnectKeepsDeviceInTable)
{
    auto hrm = discover(kHrm);
    central.fail_next("connect", blelink::Error::transport("le-connection-abort-by-local"));
    registry->connect(hrm, 1000ms);

    EXPECT_EQ(rec.count(LifecycleKind::DidDisconnect, kHrm), 1u);
    EXPECT_EQ(rec.count(LifecycleKind::DidConnect, kHrm), 0u);
    EXPECT_EQ(registry->peripheral(kHrm), hrm);
    EXPECT_EQ(hrm->state(), ConnectionState::Disconnected);
    EXPECT_EQ(sched.armed(), 0u);
}

TEST_F(LinkRegistryTest, DisconnectRemovesOnlyAfterDidDisconnect)
{
    auto hrm = discover(kHrm);
    registry->connect(hrm);

    bool present_during_event = false;
    bus.subscribe([&](const core::LifecycleEvent &ev) {
        if (ev.kind == LifecycleKind::DidDisconnect && ev.device_id == kHrm)
            present_during_event = registry->peripheral(kHrm) != nullptr;
    });

    registry->disconnect(hrm);
    EXPECT_TRUE(present_during_event);
    EXPECT_FALSE(registry->peripheral(kHrm));
    EXPECT_EQ(rec.count(LifecycleKind::WillDisconnect, kHrm), 1u);
    EXPECT_EQ(rec.count(LifecycleKind::DidDisconnect, kHrm), 1u);
    EXPECT_EQ(hrm->state(), ConnectionState::Disconnected);
}

TEST_F(LinkRegistryTest, ReconnectingHeldLinkRestoresEventRouting)
{
    auto hrm = discover(kHrm);
    registry->connect(hrm);
    registry->disconnect(hrm);
    ASSERT_FALSE(registry->peripheral(kHrm));

    registry->connect(hrm, 1000ms);
    EXPECT_EQ(registry->peripheral(kHrm), hrm);
    EXPECT_EQ(hrm->state(), ConnectionState::Connected);
    EXPECT_EQ(rec.count(LifecycleKind::DidConnect, kHrm), 2u);
    EXPECT_EQ(sched.armed(), 0u);

    bool done = false;
    hrm->discover_services(std::nullopt, [&](const blelink::MaybeError &e) { done = !e; });
    EXPECT_TRUE(done);
    EXPECT_EQ(hrm->pending_commands(), 0u);
    EXPECT_TRUE(hrm->has_service(kHrSvc));
}

TEST_F(LinkRegistryTest, RemoteDisconnectTearsDownLink)
{
    auto hrm = discover(kHrm);
    registry->connect(hrm);

    int notified = 0;
    hrm->discover_characteristics(std::nullopt, kHrSvc);
    hrm->set_notify(CharacteristicRef{kHrSvc, kMeas}, true,
                    [&](const blelink::MaybeError &, const Bytes &) { ++notified; });
    ASSERT_TRUE(hrm->has_notify_handler(CharacteristicRef{kHrSvc, kMeas}));

    central.deliver(DeviceDisconnected{kHrm, blelink::Error::transport("supervision timeout")});
    EXPECT_FALSE(hrm->has_notify_handler(CharacteristicRef{kHrSvc, kMeas}));
    EXPECT_TRUE(hrm->services().empty());
    EXPECT_FALSE(registry->peripheral(kHrm));
    EXPECT_EQ(rec.count(LifecycleKind::DidDisconnect, kHrm), 1u);
}

TEST_F(LinkRegistryTest, RefusedDisconnectStillCompletes)
{
    auto hrm = discover(kHrm);
    registry->connect(hrm);
    central.refuse_next("cancel_connection");

    registry->disconnect(hrm);
    EXPECT_EQ(rec.count(LifecycleKind::WillDisconnect, kHrm), 1u);
    EXPECT_EQ(rec.count(LifecycleKind::DidDisconnect, kHrm), 1u);
    EXPECT_EQ(hrm->state(), ConnectionState::Disconnected);
}

TEST_F(LinkRegistryTest, PeripheralEventsReachTheirLink)
{
    auto hrm = discover(kHrm);
    registry->connect(hrm);

    bool ok = false;
    hrm->discover_services(std::nullopt, [&](const blelink::MaybeError &e) { ok = !e; });
    EXPECT_TRUE(ok);
    EXPECT_TRUE(hrm->has_service(kHrSvc));

    // events for devices not in the table are dropped
    central.deliver(PeripheralEvent{ServicesDiscovered{"00:00:00:00:00:00", {kHrSvc}, std::nullopt}});
}

TEST_F(LinkRegistryTest, ReconnectUsesKnownPeripherals)
{
    rec.clear();
    EXPECT_TRUE(registry->reconnect({kHrm}, {kHrSvc}, 1000ms));
    EXPECT_EQ(central.count("retrieve_known"), 1u);
    EXPECT_EQ(central.count("retrieve_connected"), 0u);

    auto hrm = registry->peripheral(kHrm);
    ASSERT_TRUE(hrm);
    EXPECT_EQ(hrm->state(), ConnectionState::Connected);
    // synthesized discovery is not announced
    EXPECT_EQ(rec.count(LifecycleKind::DeviceDiscovered), 0u);
    EXPECT_EQ(rec.count(LifecycleKind::WillConnect, kHrm), 1u);
    EXPECT_EQ(rec.count(LifecycleKind::DidConnect, kHrm), 1u);
}

TEST_F(LinkRegistryTest, ReconnectFallsBackToConnectedThenGivesUp)
{
    EXPECT_FALSE(registry->reconnect({"11:22:33:44:55:66"}, {kHrSvc}));
    EXPECT_EQ(central.count("retrieve_known"), 1u);
    EXPECT_EQ(central.count("retrieve_connected"), 1u);
    EXPECT_EQ(central.count("connect"), 0u);
    EXPECT_EQ(rec.count(LifecycleKind::WillConnect), 0u);
}

TEST(LinkRegistryLifetime, TimeoutAfterDestructionIsIgnored)
{
    LoopbackCentral      central(false);
    UnstoppableScheduler sched;
    core::EventBus       bus;
    LifecycleRecorder    rec(bus);
    {
        LinkRegistry registry(central, bus, sched);
        central.deliver(DeviceDiscovered{kHrm, std::nullopt, {}, -60});
        registry.connect(kHrm, 100ms);
        EXPECT_EQ(rec.count(LifecycleKind::WillConnect, kHrm), 1u);
    }

    sched.run_all();
    EXPECT_EQ(rec.count(LifecycleKind::WillDisconnect), 0u);
    EXPECT_EQ(central.count("cancel_connection"), 0u);
}

TEST_F(LinkRegistryTest, DestructionStopsCentral)
{
    registry->start_scan();
    ASSERT_TRUE(central.scanning());
    registry.reset();
    EXPECT_FALSE(central.scanning());

    // nothing is listening any more
    central.deliver(DeviceDiscovered{kHrm, std::nullopt, {}, -60});
}
