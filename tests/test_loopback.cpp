#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "transport/loopback_adapter.hpp"
#include "util/constants.hpp"

using namespace std::chrono_literals;
using transport::ConnectBehavior;
using transport::LoopbackAdapter;

namespace
{
const std::string ECHO(constants::DEMO_ECHO_ADDR);
const std::string BEACON(constants::DEMO_BEACON_ADDR);

gatt::Characteristic find_char(const std::vector<gatt::Service> &svcs, std::string_view uuid)
{
    for (const auto &s : svcs)
        for (const auto &c : s.characteristics)
            if (gatt::uuid_eq(c.uuid, std::string(uuid)))
                return c;
    return {};
}
}  // namespace

TEST(Loopback, DemoScanListsEveryPeripheral)
{
    auto                                     a = LoopbackAdapter::with_demo_peripherals();
    std::unique_ptr<transport::IScanStream> s;
    ASSERT_TRUE(a->scan(100ms, s).ok());

    std::vector<std::string> seen;
    gatt::Device             d;
    while (s->next(d, {}))
        seen.push_back(d.address);
    EXPECT_EQ(seen, (std::vector<std::string>{ECHO, BEACON}));
}

TEST(Loopback, ScanUnavailable)
{
    LoopbackAdapter a;
    a.set_scan_available(false);
    std::unique_ptr<transport::IScanStream> s;
    EXPECT_EQ(a.scan(100ms, s).code, gatt::Errc::DiscoveryUnavailable);
}

TEST(Loopback, ConnectOutcomes)
{
    auto                        a = LoopbackAdapter::with_demo_peripherals();
    transport::ConnectionHandle h = 0;

    EXPECT_EQ(a->connect(BEACON, 200ms, {}, nullptr, h).code, gatt::Errc::ConnectRefused);
    EXPECT_EQ(a->connect("02:00:00:00:00:99", 200ms, {}, nullptr, h).code,
              gatt::Errc::ConnectRefused);

    a->set_connect_behavior(BEACON, ConnectBehavior::NoAnswer);
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(a->connect(BEACON, 100ms, {}, nullptr, h).code, gatt::Errc::ConnectTimeout);
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 100ms);

    a->set_connect_behavior(BEACON, ConnectBehavior::Unavailable);
    EXPECT_EQ(a->connect(BEACON, 100ms, {}, nullptr, h).code, gatt::Errc::AdapterError);

    ASSERT_TRUE(a->connect(ECHO, 200ms, {}, nullptr, h).ok());
    EXPECT_NE(h, 0u);
    EXPECT_EQ(a->open_connections(), 1u);
    EXPECT_EQ(a->connect_calls(), 5u);
}

TEST(Loopback, CapacityIsEnforced)
{
    auto                        a  = LoopbackAdapter::with_demo_peripherals(1);
    transport::ConnectionHandle h1 = 0, h2 = 0;
    ASSERT_TRUE(a->connect(ECHO, 200ms, {}, nullptr, h1).ok());
    EXPECT_EQ(a->connect(ECHO, 200ms, {}, nullptr, h2).code, gatt::Errc::AdapterCapacityExceeded);
    a->disconnect(h1);
    a->disconnect(h1);  // unknown handle, ignored
    EXPECT_EQ(a->open_connections(), 0u);
    EXPECT_EQ(a->disconnect_calls(), 2u);
    EXPECT_TRUE(a->connect(ECHO, 200ms, {}, nullptr, h2).ok());
}

TEST(Loopback, WriteEchoesToSubscribersAndIsReadable)
{
    auto                        a = LoopbackAdapter::with_demo_peripherals();
    transport::ConnectionHandle h = 0;
    ASSERT_TRUE(a->connect(ECHO, 200ms, {}, nullptr, h).ok());
    std::vector<gatt::Service> svcs;
    ASSERT_TRUE(a->resolve_services(h, 1s, svcs).ok());
    ASSERT_EQ(svcs.size(), 2u);

    const auto rx   = find_char(svcs, constants::UART_RX_UUID);
    const auto tx   = find_char(svcs, constants::UART_TX_UUID);
    const auto name = find_char(svcs, constants::DEVICE_NAME_UUID);
    EXPECT_EQ(rx.service_uuid, std::string(constants::UART_SVC_UUID));

    std::vector<gatt::Bytes>      got;
    transport::SubscriptionHandle sh = 0;
    ASSERT_TRUE(a->subscribe(h, tx, [&](const gatt::Bytes &v) { got.push_back(v); }, sh).ok());

    ASSERT_TRUE(a->write_characteristic(h, rx, {'h', 'i'}, true, 1s, {}).ok());
    ASSERT_TRUE(a->write_characteristic(h, rx, {'!'}, false, 1s, {}).ok());
    EXPECT_EQ(got, (std::vector<gatt::Bytes>{{'h', 'i'}, {'!'}}));
    EXPECT_EQ(a->writes_to(ECHO).size(), 2u);

    gatt::Bytes v;
    ASSERT_TRUE(a->read_characteristic(h, name, 1s, {}, v).ok());
    EXPECT_EQ(std::string(v.begin(), v.end()), "gattlink-echo");

    // capability checks
    EXPECT_EQ(a->read_characteristic(h, rx, 1s, {}, v).code, gatt::Errc::ReadError);
    EXPECT_EQ(a->write_characteristic(h, tx, {1}, true, 1s, {}).code, gatt::Errc::WriteRejected);
    EXPECT_EQ(a->subscribe(h, rx, nullptr, sh).code, gatt::Errc::PeerRejected);
}

TEST(Loopback, OpDelayTimesOutAndLinkDropIsReported)
{
    auto                        a = LoopbackAdapter::with_demo_peripherals();
    transport::ConnectionHandle h = 0;
    bool                        lost = false;
    ASSERT_TRUE(a->connect(ECHO, 200ms, {}, [&] { lost = true; }, h).ok());
    std::vector<gatt::Service> svcs;
    ASSERT_TRUE(a->resolve_services(h, 1s, svcs).ok());
    const auto name = find_char(svcs, constants::DEVICE_NAME_UUID);

    a->set_op_delay(300ms);
    gatt::Bytes v;
    EXPECT_EQ(a->read_characteristic(h, name, 50ms, {}, v).code, gatt::Errc::Timeout);

    a->set_op_delay(0ms);
    a->drop_link(ECHO);
    EXPECT_TRUE(lost);
    EXPECT_EQ(a->read_characteristic(h, name, 1s, {}, v).code, gatt::Errc::LinkLost);
    EXPECT_EQ(a->open_connections(), 0u);
}
