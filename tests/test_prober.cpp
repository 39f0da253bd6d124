#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "central/prober.hpp"
#include "transport/loopback_adapter.hpp"
#include "util/cancel.hpp"

using namespace std::chrono_literals;
using transport::ConnectBehavior;

namespace
{
transport::SimPeripheral periph(const std::string &addr, ConnectBehavior b)
{
    transport::SimPeripheral p;
    p.device.address = addr;
    p.connect        = b;
    return p;
}

gatt::Device dev(const std::string &addr)
{
    gatt::Device d;
    d.address = addr;
    return d;
}
}  // namespace

TEST(Prober, SplitsConnectableAndFailuresInInputOrder)
{
    transport::LoopbackAdapter a;
    a.add_peripheral(periph("00:00:00:00:00:01", ConnectBehavior::Accept));
    a.add_peripheral(periph("00:00:00:00:00:02", ConnectBehavior::Refuse));
    a.add_peripheral(periph("00:00:00:00:00:03", ConnectBehavior::NoAnswer));
    a.add_peripheral(periph("00:00:00:00:00:04", ConnectBehavior::Accept));

    central::ConnectabilityProber p(a);
    auto rep = p.probe({dev("00:00:00:00:00:04"), dev("00:00:00:00:00:02"), dev("00:00:00:00:00:03"),
                        dev("00:00:00:00:00:01")},
                       100ms);

    ASSERT_EQ(rep.connectable.size(), 2u);
    EXPECT_EQ(rep.connectable[0].address, "00:00:00:00:00:04");
    EXPECT_EQ(rep.connectable[1].address, "00:00:00:00:00:01");
    ASSERT_EQ(rep.failures.size(), 2u);
    EXPECT_EQ(rep.failures[0].device.address, "00:00:00:00:00:02");
    EXPECT_EQ(rep.failures[0].reason.code, gatt::Errc::ConnectRefused);
    EXPECT_EQ(rep.failures[1].reason.code, gatt::Errc::ConnectTimeout);

    // every successful probe connection is handed back
    EXPECT_EQ(a.open_connections(), 0u);
    EXPECT_EQ(a.disconnect_calls(), 2u);
}

TEST(Prober, EmptyInput)
{
    transport::LoopbackAdapter    a;
    central::ConnectabilityProber p(a);
    auto                          rep = p.probe({}, 100ms);
    EXPECT_TRUE(rep.connectable.empty());
    EXPECT_TRUE(rep.failures.empty());
    EXPECT_EQ(a.connect_calls(), 0u);
}

TEST(Prober, CancelledBeforeStart)
{
    transport::LoopbackAdapter a;
    a.add_peripheral(periph("00:00:00:00:00:01", ConnectBehavior::Accept));
    util::CancelSource src;
    src.cancel();

    central::ConnectabilityProber p(a);
    auto                          rep = p.probe({dev("00:00:00:00:00:01")}, 100ms, src.token());
    ASSERT_EQ(rep.failures.size(), 1u);
    EXPECT_EQ(rep.failures[0].reason.code, gatt::Errc::Cancelled);
    EXPECT_EQ(a.connect_calls(), 0u);
}

TEST(Prober, ParallelKeepsOrderAndBoundsTime)
{
    transport::LoopbackAdapter a(3);
    std::vector<gatt::Device>  devices;
    for (int i = 1; i <= 6; ++i)
    {
        const std::string addr = "00:00:00:00:00:0" + std::to_string(i);
        a.add_peripheral(periph(addr, i % 2 ? ConnectBehavior::NoAnswer : ConnectBehavior::Accept));
        devices.push_back(dev(addr));
    }

    central::ConnectabilityProber p(a);
    const auto                    t0 = std::chrono::steady_clock::now();
    auto                          rep = p.probe(devices, 200ms, {}, true);
    const auto                    took = std::chrono::steady_clock::now() - t0;

    ASSERT_EQ(rep.connectable.size(), 3u);
    EXPECT_EQ(rep.connectable[0].address, "00:00:00:00:00:02");
    EXPECT_EQ(rep.connectable[1].address, "00:00:00:00:00:04");
    EXPECT_EQ(rep.connectable[2].address, "00:00:00:00:00:06");
    ASSERT_EQ(rep.failures.size(), 3u);
    EXPECT_EQ(rep.failures[0].device.address, "00:00:00:00:00:01");
    // three 200 ms timeouts on three workers overlap
    EXPECT_LT(took, 550ms);
    EXPECT_EQ(a.open_connections(), 0u);
}
