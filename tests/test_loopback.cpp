#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "transport/loopback_central.hpp"

using namespace transport;

namespace
{
const std::string kDev = "00:11:22:33:44:55";
const std::string kSvc = "0000180f-0000-1000-8000-00805f9b34fb";
const std::string kChr = "00002a19-0000-1000-8000-00805f9b34fb";

SimPeripheral battery()
{
    SimPeripheral p;
    p.id       = kDev;
    p.name     = "battery";
    p.services = {{kSvc, {kChr}}};
    return p;
}
}  // namespace

TEST(Loopback, StartReportsInitialState)
{
    LoopbackCentral    c(true, ControllerState::PoweredOff);
    std::vector<Event> got;
    ASSERT_TRUE(c.start([&](const Event &ev) { got.push_back(ev); }));
    ASSERT_EQ(got.size(), 1u);
    auto *st = std::get_if<StateUpdated>(&got[0]);
    ASSERT_NE(st, nullptr);
    EXPECT_EQ(st->state, ControllerState::PoweredOff);
}

TEST(Loopback, ScanRefusedWhenNotPoweredOn)
{
    LoopbackCentral c(true, ControllerState::PoweredOff);
    c.add_peripheral(battery());
    std::vector<Event> got;
    c.start([&](const Event &ev) { got.push_back(ev); });
    got.clear();

    EXPECT_FALSE(c.scan(ScanOptions{}));
    EXPECT_FALSE(c.scanning());
    EXPECT_TRUE(got.empty());
}

TEST(Loopback, ScanThenConnectThenRead)
{
    LoopbackCentral c;
    c.add_peripheral(battery());
    c.set_value(kDev, CharacteristicRef{kSvc, kChr}, {87});

    std::vector<Event> got;
    c.start([&](const Event &ev) { got.push_back(ev); });
    got.clear();

    ASSERT_TRUE(c.scan(ScanOptions{}));
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(std::get<DeviceDiscovered>(got[0]).id, kDev);

    // GATT is refused until connected
    EXPECT_FALSE(c.discover_services(kDev, std::nullopt));

    ASSERT_TRUE(c.connect(kDev, ConnectOptions{}));
    ASSERT_TRUE(std::holds_alternative<DeviceConnected>(got.back()));

    ASSERT_TRUE(c.read(kDev, CharacteristicRef{kSvc, kChr}));
    auto &pe = std::get<PeripheralEvent>(got.back());
    auto &vu = std::get<ValueUpdated>(pe);
    EXPECT_EQ(vu.value, (Bytes{87}));
    EXPECT_FALSE(vu.error.has_value());
}

TEST(Loopback, FailAndRefuseAreOneShot)
{
    LoopbackCentral c;
    c.add_peripheral(battery());
    std::vector<Event> got;
    c.start([&](const Event &ev) { got.push_back(ev); });

    c.refuse_next("connect");
    EXPECT_FALSE(c.connect(kDev, ConnectOptions{}));

    c.fail_next("connect", blelink::Error::transport("page timeout"));
    ASSERT_TRUE(c.connect(kDev, ConnectOptions{}));
    auto *failed = std::get_if<DeviceConnectFailed>(&got.back());
    ASSERT_NE(failed, nullptr);
    ASSERT_TRUE(failed->error.has_value());
    EXPECT_EQ(failed->error->message, "page timeout");

    ASSERT_TRUE(c.connect(kDev, ConnectOptions{}));
    EXPECT_TRUE(std::holds_alternative<DeviceConnected>(got.back()));
    EXPECT_EQ(c.count("connect"), 3u);
}

TEST(Loopback, WriteStoresValueEvenWithoutAutoComplete)
{
    LoopbackCentral c(false);
    c.add_peripheral(battery());
    std::vector<Event> got;
    c.start([&](const Event &ev) { got.push_back(ev); });
    got.clear();

    ASSERT_TRUE(c.write(kDev, CharacteristicRef{kSvc, kChr}, {1, 2}, WriteMode::WithoutResponse));
    EXPECT_TRUE(got.empty());
    EXPECT_EQ(c.value(kDev, CharacteristicRef{kSvc, kChr}).value_or(Bytes{}), (Bytes{1, 2}));

    auto calls = c.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].op, "write");
    EXPECT_EQ(calls[0].detail, composite_key(CharacteristicRef{kSvc, kChr}) + ":cmd");
}

TEST(Loopback, StopSilencesSink)
{
    LoopbackCentral c;
    int             events = 0;
    c.start([&](const Event &) { ++events; });
    c.stop();
    c.set_state(ControllerState::PoweredOff);
    c.deliver(DeviceConnected{kDev});
    EXPECT_EQ(events, 1);  // only the initial state
}
