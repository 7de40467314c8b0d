#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/device_link.hpp"
#include "test_support.hpp"
#include "transport/loopback_central.hpp"

using namespace transport;
using core::DeviceLink;
using core::DeviceLinkPtr;
using namespace std::chrono_literals;

namespace
{
const std::string kDev  = "AA:BB:CC:DD:EE:01";
const std::string kSvc  = "0000180d-0000-1000-8000-00805f9b34fb";
const std::string kMeas = "00002a37-0000-1000-8000-00805f9b34fb";  // notifies
const std::string kCtl  = "00002a39-0000-1000-8000-00805f9b34fb";  // control point

// Routes the central's peripheral events into the link under test.
class DeviceLinkTest : public ::testing::Test
{
  protected:
    explicit DeviceLinkTest(bool auto_complete = true) : central(auto_complete) {}

    void SetUp() override
    {
        SimPeripheral p;
        p.id       = kDev;
        p.name     = "hrm";
        p.services = {{kSvc, {kMeas, kCtl}}};
        central.add_peripheral(p);
        ASSERT_TRUE(central.start([this](const Event &ev) {
            if (const auto *pe = std::get_if<PeripheralEvent>(&ev))
                if (link)
                    link->handle(*pe);
        }));
        ASSERT_TRUE(central.connect(kDev, {}));
        link = std::make_shared<DeviceLink>(kDev, central, sched);
        central.clear_calls();
    }

    LoopbackCentral   central;
    ManualScheduler   sched;
    DeviceLinkPtr     link;
    CharacteristicRef meas{kSvc, kMeas};
    CharacteristicRef ctl{kSvc, kCtl};
};

// Completions are delivered by hand.
class DeviceLinkManualTest : public DeviceLinkTest
{
  protected:
    DeviceLinkManualTest() : DeviceLinkTest(false) {}
};

struct ValueLog
{
    int                 calls = 0;
    blelink::MaybeError last_error{};
    Bytes               last_value{};

    core::ValueCompletion fn()
    {
        return [this](const blelink::MaybeError &err, const Bytes &v) {
            ++calls;
            last_error = err;
            last_value = v;
        };
    }
};
}  // namespace

TEST_F(DeviceLinkManualTest, CommandsRunOneAtATimeInOrder)
{
    std::vector<int> done;
    link->write(ctl, {1}, WriteMode::WithResponse, [&](const blelink::MaybeError &) { done.push_back(1); });
    link->write(ctl, {2}, WriteMode::WithResponse, [&](const blelink::MaybeError &) { done.push_back(2); });
    link->read(meas, [&](const blelink::MaybeError &, const Bytes &) { done.push_back(3); });

    // only the head reached the transport
    EXPECT_EQ(central.count("write"), 1u);
    EXPECT_EQ(central.count("read"), 0u);
    EXPECT_EQ(link->pending_commands(), 3u);

    central.deliver(PeripheralEvent{ValueWritten{kDev, ctl, std::nullopt}});
    EXPECT_EQ(central.count("write"), 2u);
    EXPECT_EQ(central.count("read"), 0u);

    central.deliver(PeripheralEvent{ValueWritten{kDev, ctl, std::nullopt}});
    EXPECT_EQ(central.count("read"), 1u);

    central.deliver(PeripheralEvent{ValueUpdated{kDev, meas, {9}, std::nullopt}});
    EXPECT_EQ(done, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(link->pending_commands(), 0u);

    auto calls = central.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].op, "write");
    EXPECT_EQ(calls[1].op, "write");
    EXPECT_EQ(calls[2].op, "read");
}

TEST_F(DeviceLinkTest, InlineCompletionsKeepSubmissionOrder)
{
    std::vector<int> done;
    for (int i = 0; i < 20; ++i)
        link->write(ctl, {static_cast<std::uint8_t>(i)}, WriteMode::WithoutResponse,
                    [&done, i](const blelink::MaybeError &err) {
                        EXPECT_FALSE(err);
                        done.push_back(i);
                    });
    ASSERT_EQ(done.size(), 20u);
    for (int i = 0; i < 20; ++i)
        EXPECT_EQ(done[i], i);
    EXPECT_EQ(central.count("write"), 20u);
}

TEST_F(DeviceLinkManualTest, UnsolicitedEventsDoNotCompleteHead)
{
    int completions = 0;
    link->write(ctl, {1}, WriteMode::WithResponse,
                [&](const blelink::MaybeError &) { ++completions; });

    central.deliver(PeripheralEvent{ServicesDiscovered{kDev, {kSvc}, std::nullopt}});
    central.deliver(PeripheralEvent{ValueWritten{kDev, meas, std::nullopt}});  // other characteristic
    central.deliver(PeripheralEvent{NotifyStateUpdated{kDev, ctl, true, std::nullopt}});
    EXPECT_EQ(completions, 0);
    EXPECT_EQ(link->pending_commands(), 1u);

    // the services event still fed the cache
    EXPECT_TRUE(link->has_service(kSvc));

    central.deliver(PeripheralEvent{ValueWritten{kDev, ctl, std::nullopt}});
    EXPECT_EQ(completions, 1);
}

TEST_F(DeviceLinkTest, DiscoverServicesForCachedIdsSkipsTransport)
{
    blelink::MaybeError first = blelink::Error::transport("unset");
    link->discover_services(std::nullopt, [&](const blelink::MaybeError &e) { first = e; });
    EXPECT_FALSE(first);
    EXPECT_EQ(central.count("discover_services"), 1u);

    central.clear_calls();
    bool called = false;
    link->discover_services(std::vector<std::string>{kSvc}, [&](const blelink::MaybeError &e) {
        called = true;
        EXPECT_FALSE(e);
    });
    EXPECT_TRUE(called);
    EXPECT_EQ(central.count("discover_services"), 0u);
}

TEST_F(DeviceLinkManualTest, DiscoverServicesAsksOnlyForMissingIds)
{
    central.deliver(PeripheralEvent{ServicesDiscovered{kDev, {kSvc}, std::nullopt}});
    link->discover_services(std::vector<std::string>{kSvc, "0000180f-0000-1000-8000-00805f9b34fb"});

    auto calls = central.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].op, "discover_services");
    EXPECT_EQ(calls[0].detail, "1");
}

TEST_F(DeviceLinkTest, DiscoverCharacteristicsDiscoversServiceFirst)
{
    bool ok = false;
    link->discover_characteristics(std::nullopt, kSvc, [&](const blelink::MaybeError &e) {
        ok = !e;
    });
    EXPECT_TRUE(ok);

    auto calls = central.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].op, "discover_services");
    EXPECT_EQ(calls[1].op, "discover_characteristics");
    EXPECT_TRUE(link->has_characteristic(kMeas, kSvc));
    EXPECT_TRUE(link->has_characteristic(kCtl, kSvc));
    EXPECT_EQ(link->characteristics(kSvc).size(), 2u);
}

TEST_F(DeviceLinkTest, DiscoverCharacteristicsOfMissingServiceFails)
{
    const std::string missing = "0000ffff-0000-1000-8000-00805f9b34fb";
    blelink::MaybeError got;
    link->discover_characteristics(std::nullopt, missing,
                                   [&](const blelink::MaybeError &e) { got = e; });
    ASSERT_TRUE(got);
    EXPECT_EQ(got->code, blelink::ErrorCode::InvalidService);
    EXPECT_EQ(central.count("discover_characteristics"), 0u);
    EXPECT_EQ(link->pending_commands(), 0u);
}

TEST_F(DeviceLinkTest, DiscoverCharacteristicsPassesDiscoveryError)
{
    central.fail_next("discover_services", blelink::Error::transport("att 0x0e"));
    blelink::MaybeError got;
    link->discover_characteristics(std::nullopt, kSvc, [&](const blelink::MaybeError &e) { got = e; });
    ASSERT_TRUE(got);
    EXPECT_EQ(got->code, blelink::ErrorCode::Transport);
    EXPECT_EQ(got->message, "att 0x0e");
}

TEST_F(DeviceLinkTest, ResolvesCharacteristicThroughDiscovery)
{
    std::optional<CharacteristicRef> ref;
    blelink::MaybeError              err = blelink::Error::transport("unset");
    link->characteristic(kMeas, kSvc, [&](const std::optional<CharacteristicRef> &c,
                                          const blelink::MaybeError               &e) {
        ref = c;
        err = e;
    });
    EXPECT_FALSE(err);
    ASSERT_TRUE(ref);
    EXPECT_EQ(*ref, meas);

    // second time from cache, no transport traffic
    central.clear_calls();
    bool cached = false;
    link->characteristic(kMeas, kSvc, [&](const std::optional<CharacteristicRef> &c,
                                          const blelink::MaybeError &) { cached = c.has_value(); });
    EXPECT_TRUE(cached);
    EXPECT_TRUE(central.calls().empty());
}

TEST_F(DeviceLinkTest, UnknownCharacteristicResolvesToError)
{
    blelink::MaybeError err;
    bool                had_ref = true;
    link->characteristic("00002aff-0000-1000-8000-00805f9b34fb", kSvc,
                         [&](const std::optional<CharacteristicRef> &c,
                             const blelink::MaybeError               &e) {
                             had_ref = c.has_value();
                             err     = e;
                         });
    EXPECT_FALSE(had_ref);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->code, blelink::ErrorCode::InvalidCharacteristic);
}

TEST_F(DeviceLinkTest, UnknownServiceResolvesToError)
{
    blelink::MaybeError err;
    link->service("0000ffff-0000-1000-8000-00805f9b34fb",
                  [&](const std::optional<std::string> &s, const blelink::MaybeError &e) {
                      EXPECT_FALSE(s);
                      err = e;
                  });
    ASSERT_TRUE(err);
    EXPECT_EQ(err->code, blelink::ErrorCode::InvalidService);
}

TEST_F(DeviceLinkTest, ReadCompletesWithValue)
{
    central.set_value(kDev, meas, {0x06, 0x48});
    ValueLog log;
    link->read(meas, log.fn());
    EXPECT_EQ(log.calls, 1);
    EXPECT_FALSE(log.last_error);
    EXPECT_EQ(log.last_value, (Bytes{0x06, 0x48}));
}

TEST_F(DeviceLinkTest, FailedCommandStillAdvancesQueue)
{
    central.fail_next("set_notify", blelink::Error::transport("not permitted"));
    blelink::MaybeError notify_err;
    bool                wrote = false;
    link->set_notify(meas, true, nullptr, [&](const blelink::MaybeError &e) { notify_err = e; });
    link->write(ctl, {1}, WriteMode::WithResponse, [&](const blelink::MaybeError &e) {
        wrote = !e;
    });
    ASSERT_TRUE(notify_err);
    EXPECT_EQ(notify_err->message, "not permitted");
    EXPECT_TRUE(wrote);
}

TEST_F(DeviceLinkTest, RefusedSubmissionCompletesNotConnected)
{
    central.refuse_next("write");
    blelink::MaybeError first;
    bool                second = false;
    link->write(ctl, {1}, WriteMode::WithResponse, [&](const blelink::MaybeError &e) { first = e; });
    link->write(ctl, {2}, WriteMode::WithResponse, [&](const blelink::MaybeError &e) { second = !e; });
    ASSERT_TRUE(first);
    EXPECT_EQ(first->code, blelink::ErrorCode::NotConnected);
    EXPECT_TRUE(second);
}

TEST_F(DeviceLinkManualTest, CancelledCommandSuppressesCompletion)
{
    int  first  = 0;
    bool second = false;
    auto cmd    = link->write(ctl, {1}, WriteMode::WithResponse,
                              [&](const blelink::MaybeError &) { ++first; });
    link->write(ctl, {2}, WriteMode::WithResponse, [&](const blelink::MaybeError &) { second = true; });
    cmd->cancel();

    central.deliver(PeripheralEvent{ValueWritten{kDev, ctl, std::nullopt}});
    EXPECT_EQ(first, 0);
    EXPECT_EQ(central.count("write"), 2u);  // queue advanced anyway

    central.deliver(PeripheralEvent{ValueWritten{kDev, ctl, std::nullopt}});
    EXPECT_TRUE(second);
}

TEST_F(DeviceLinkTest, NotifyHandlerGetsEveryUpdateUntilDisabled)
{
    ValueLog handler;
    link->set_notify(meas, true, handler.fn());
    EXPECT_TRUE(link->has_notify_handler(meas));

    central.notify(kDev, meas, {1});
    central.notify(kDev, meas, {2});
    EXPECT_EQ(handler.calls, 2);
    EXPECT_EQ(handler.last_value, (Bytes{2}));

    link->set_notify(meas, false);
    EXPECT_FALSE(link->has_notify_handler(meas));
    central.notify(kDev, meas, {3});
    EXPECT_EQ(handler.calls, 2);
}

TEST_F(DeviceLinkTest, FailedWriteNeverCreatesCapture)
{
    central.fail_next("write", blelink::Error::transport("att 0x03"));
    blelink::MaybeError write_err;
    ValueLog            capture;
    link->write_and_capture_notify(ctl, {0x01}, WriteMode::WithResponse,
                                   [&](const blelink::MaybeError &e) { write_err = e; }, meas,
                                   1000ms, capture.fn());
    ASSERT_TRUE(write_err);
    EXPECT_EQ(link->pending_captures(), 0u);
    EXPECT_EQ(sched.armed(), 0u);

    central.notify(kDev, meas, {0x10});
    sched.advance(2000ms);
    EXPECT_EQ(capture.calls, 0);
}

TEST_F(DeviceLinkTest, CaptureGetsNextUpdateAndHandlerToo)
{
    ValueLog handler, capture;
    link->set_notify(meas, true, handler.fn());

    bool wrote = false;
    link->write_and_capture_notify(ctl, {0x01}, WriteMode::WithResponse,
                                   [&](const blelink::MaybeError &e) { wrote = !e; }, meas, 1000ms,
                                   capture.fn());
    EXPECT_TRUE(wrote);
    EXPECT_EQ(link->pending_captures(), 1u);
    EXPECT_EQ(sched.armed(), 1u);

    central.notify(kDev, meas, {0xAB});
    EXPECT_EQ(capture.calls, 1);
    EXPECT_FALSE(capture.last_error);
    EXPECT_EQ(capture.last_value, (Bytes{0xAB}));
    EXPECT_EQ(handler.calls, 1);
    EXPECT_EQ(link->pending_captures(), 0u);
    EXPECT_EQ(sched.armed(), 0u);  // timer cancelled

    // one-shot
    central.notify(kDev, meas, {0xAC});
    EXPECT_EQ(capture.calls, 1);
    EXPECT_EQ(handler.calls, 2);
}

TEST_F(DeviceLinkTest, CaptureCanOmitPersistentHandler)
{
    ValueLog handler, capture;
    link->set_notify(meas, true, handler.fn());
    link->write_and_capture_notify(ctl, {0x01}, WriteMode::WithResponse, nullptr, meas,
                                   std::nullopt, capture.fn(), /*omit_notify=*/true);

    central.notify(kDev, meas, {0x01});
    EXPECT_EQ(capture.calls, 1);
    EXPECT_EQ(handler.calls, 0);

    central.notify(kDev, meas, {0x02});
    EXPECT_EQ(handler.calls, 1);
}

TEST_F(DeviceLinkTest, CaptureTimesOutAndLateUpdateGoesToHandler)
{
    ValueLog handler, capture;
    link->set_notify(meas, true, handler.fn());
    link->write_and_capture_notify(ctl, {0x01}, WriteMode::WithResponse, nullptr, meas, 1ms,
                                   capture.fn());

    sched.advance(1ms);
    EXPECT_EQ(capture.calls, 1);
    ASSERT_TRUE(capture.last_error);
    EXPECT_EQ(capture.last_error->code, blelink::ErrorCode::Timeout);
    EXPECT_EQ(link->pending_captures(), 0u);

    central.notify(kDev, meas, {0x33});
    EXPECT_EQ(capture.calls, 1);
    EXPECT_EQ(handler.calls, 1);
    EXPECT_EQ(handler.last_value, (Bytes{0x33}));
}

TEST_F(DeviceLinkTest, CapturesOnOneCharacteristicMatchOldestFirst)
{
    ValueLog first, second;
    link->write_and_capture_notify(ctl, {1}, WriteMode::WithResponse, nullptr, meas, 1000ms,
                                   first.fn());
    link->write_and_capture_notify(ctl, {2}, WriteMode::WithResponse, nullptr, meas, 1000ms,
                                   second.fn());
    EXPECT_EQ(link->pending_captures(), 2u);

    central.notify(kDev, meas, {0xA1});
    EXPECT_EQ(first.calls, 1);
    EXPECT_EQ(second.calls, 0);

    central.notify(kDev, meas, {0xA2});
    EXPECT_EQ(second.calls, 1);
    EXPECT_EQ(second.last_value, (Bytes{0xA2}));
}

TEST_F(DeviceLinkTest, TimedOutCaptureDoesNotBlockTheNextOne)
{
    ValueLog first, second;
    link->write_and_capture_notify(ctl, {1}, WriteMode::WithResponse, nullptr, meas, 5ms,
                                   first.fn());
    sched.advance(2ms);
    link->write_and_capture_notify(ctl, {2}, WriteMode::WithResponse, nullptr, meas, 100ms,
                                   second.fn());
    sched.advance(3ms);
    EXPECT_EQ(first.calls, 1);
    EXPECT_EQ(link->pending_captures(), 1u);

    central.notify(kDev, meas, {0x55});
    EXPECT_EQ(second.calls, 1);
    EXPECT_FALSE(second.last_error);
}

TEST_F(DeviceLinkTest, DisconnectedDropsHandlersCapturesAndCache)
{
    ValueLog handler, capture;
    link->discover_characteristics(std::nullopt, kSvc);
    link->set_notify(meas, true, handler.fn());
    link->write_and_capture_notify(ctl, {1}, WriteMode::WithResponse, nullptr, meas, 50ms,
                                   capture.fn());
    ASSERT_EQ(link->pending_captures(), 1u);

    link->disconnected();
    EXPECT_EQ(link->pending_captures(), 0u);
    EXPECT_FALSE(link->has_notify_handler(meas));
    EXPECT_TRUE(link->services().empty());
    EXPECT_FALSE(link->has_characteristic(kMeas, kSvc));
    EXPECT_EQ(sched.armed(), 0u);

    // dropped silently
    sched.advance(100ms);
    central.notify(kDev, meas, {1});
    EXPECT_EQ(capture.calls, 0);
    EXPECT_EQ(handler.calls, 0);
}

TEST_F(DeviceLinkManualTest, DisconnectedDropsQueuedCommands)
{
    int completions = 0;
    link->write(ctl, {1}, WriteMode::WithResponse, [&](const blelink::MaybeError &) { ++completions; });
    link->write(ctl, {2}, WriteMode::WithResponse, [&](const blelink::MaybeError &) { ++completions; });
    link->disconnected();
    EXPECT_EQ(link->pending_commands(), 0u);

    // a late reply finds no head
    central.deliver(PeripheralEvent{ValueWritten{kDev, ctl, std::nullopt}});
    EXPECT_EQ(completions, 0);
}

TEST_F(DeviceLinkManualTest, TeardownInsideCompletionKeepsOneCommandInFlight)
{
    std::vector<int> done;
    link->write(ctl, {1}, WriteMode::WithResponse, [&](const blelink::MaybeError &) {
        done.push_back(1);
        link->disconnected();
        link->write(ctl, {2}, WriteMode::WithResponse,
                    [&](const blelink::MaybeError &) { done.push_back(2); });
        link->write(ctl, {3}, WriteMode::WithResponse,
                    [&](const blelink::MaybeError &) { done.push_back(3); });
    });

    central.deliver(PeripheralEvent{ValueWritten{kDev, ctl, std::nullopt}});
    // the first write's result must not pop the freshly dispatched second one
    EXPECT_EQ(central.count("write"), 2u);
    EXPECT_EQ(link->pending_commands(), 2u);
    EXPECT_EQ(done, (std::vector<int>{1}));

    central.deliver(PeripheralEvent{ValueWritten{kDev, ctl, std::nullopt}});
    EXPECT_EQ(done, (std::vector<int>{1, 2}));
    EXPECT_EQ(central.count("write"), 3u);

    central.deliver(PeripheralEvent{ValueWritten{kDev, ctl, std::nullopt}});
    EXPECT_EQ(done, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(link->pending_commands(), 0u);
}

TEST_F(DeviceLinkTest, RediscoveryMergesAdvertisementAndRefreshesLastSeen)
{
    link->rediscovered(std::string("hrm"), {{"local_name", {'h'}}, {"tx_power", {4}}}, -70);
    const auto first_seen = link->last_seen();

    std::this_thread::sleep_for(2ms);
    link->rediscovered(std::nullopt, {{"manufacturer_data", {0x4c, 0x00}}, {"tx_power", {8}}}, -55);

    auto adv = link->advertisement();
    EXPECT_EQ(adv.size(), 3u);
    EXPECT_EQ(adv["local_name"], (Bytes{'h'}));
    EXPECT_EQ(adv["tx_power"], (Bytes{8}));
    EXPECT_EQ(adv["manufacturer_data"], (Bytes{0x4c, 0x00}));
    EXPECT_EQ(link->rssi().value_or(0), -55);
    EXPECT_EQ(link->name().value_or(""), "hrm");
    EXPECT_TRUE(link->last_seen() > first_seen);
}
