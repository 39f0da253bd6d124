#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "central/device_registry.hpp"
#include "transport/loopback_adapter.hpp"
#include "util/cancel.hpp"

using namespace std::chrono_literals;

namespace
{
gatt::Device dev(const std::string &addr, const char *name = nullptr, int16_t rssi = -60)
{
    gatt::Device d;
    d.address = addr;
    if (name)
        d.name = name;
    gatt::Advertisement adv;
    adv.rssi        = rssi;
    d.advertisement = adv;
    return d;
}
}  // namespace

TEST(Registry, SnapshotOrdersNamedFirstThenAddress)
{
    transport::LoopbackAdapter a;
    a.script_scan({{dev("00:00:00:00:00:03"), 0ms},
                   {dev("00:00:00:00:00:01", "beta"), 0ms},
                   {dev("00:00:00:00:00:02"), 0ms},
                   {dev("00:00:00:00:00:04", "Alpha"), 0ms},
                   {dev("00:00:00:00:00:05", "alpha"), 0ms}});
    central::DeviceRegistry   reg(a);
    std::vector<gatt::Device> out;
    ASSERT_TRUE(reg.discover(100ms, {}, out).ok());

    std::vector<std::string> order;
    for (const auto &d : out)
        order.push_back(d.address);
    // case-sensitive name order: "Alpha" < "alpha" < "beta"
    EXPECT_EQ(order, (std::vector<std::string>{"00:00:00:00:00:04", "00:00:00:00:00:05",
                                               "00:00:00:00:00:01", "00:00:00:00:00:02",
                                               "00:00:00:00:00:03"}));
}

TEST(Registry, LaterSightingReplacesEntryAndIsYieldedOnce)
{
    transport::LoopbackAdapter a;
    a.script_scan({{dev("AA:00:00:00:00:01", "first", -80), 0ms},
                   {dev("aa:00:00:00:00:01", nullptr, -40), 20ms}});
    central::DeviceRegistry        reg(a);
    std::unique_ptr<central::DiscoveryScan> scan;
    ASSERT_TRUE(reg.start_discovery(150ms, scan).ok());

    int          yielded = 0;
    gatt::Device d;
    while (scan->next(d))
        ++yielded;
    EXPECT_EQ(yielded, 1);
    ASSERT_EQ(reg.size(), 1u);

    gatt::Device got;
    ASSERT_TRUE(reg.find("AA:00:00:00:00:01", got));
    // replaced, not merged: the name from the first sighting is gone
    EXPECT_FALSE(got.has_name());
    ASSERT_TRUE(got.advertisement.has_value());
    EXPECT_EQ(got.advertisement->rssi, -40);
}

TEST(Registry, NewDiscoveryClearsCatalog)
{
    transport::LoopbackAdapter a;
    a.script_scan({{dev("00:00:00:00:00:01"), 0ms}});
    central::DeviceRegistry   reg(a);
    std::vector<gatt::Device> out;
    ASSERT_TRUE(reg.discover(50ms, {}, out).ok());
    EXPECT_EQ(out.size(), 1u);

    a.script_scan({});
    ASSERT_TRUE(reg.discover(50ms, {}, out).ok());
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(reg.size(), 0u);
}

TEST(Registry, UnavailableRadio)
{
    transport::LoopbackAdapter a;
    a.set_scan_available(false);
    central::DeviceRegistry   reg(a);
    std::vector<gatt::Device> out;
    EXPECT_EQ(reg.discover(50ms, {}, out).code, gatt::Errc::DiscoveryUnavailable);
}

TEST(Registry, CancelReturnsPartialSnapshot)
{
    transport::LoopbackAdapter a;
    a.script_scan({{dev("00:00:00:00:00:01"), 0ms}, {dev("00:00:00:00:00:02"), 5s}});
    central::DeviceRegistry reg(a);
    util::CancelSource      src;

    std::thread canceller([&] {
        std::this_thread::sleep_for(100ms);
        src.cancel();
    });
    std::vector<gatt::Device> out;
    const auto                t0 = std::chrono::steady_clock::now();
    auto                      st = reg.discover(10s, src.token(), out);
    canceller.join();

    EXPECT_TRUE(st.ok());
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].address, "00:00:00:00:00:01");
}

TEST(Registry, IndependentScansSeeTheSameDevices)
{
    auto                    a = transport::LoopbackAdapter::with_demo_peripherals();
    central::DeviceRegistry r1(*a), r2(*a);

    std::vector<gatt::Device> o1, o2;
    std::thread               t([&] { (void)r2.discover(100ms, {}, o2); });
    ASSERT_TRUE(r1.discover(100ms, {}, o1).ok());
    t.join();
    EXPECT_EQ(o1.size(), 2u);
    EXPECT_EQ(o2.size(), 2u);
}
