#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "app/central_service.hpp"
#include "transport/loopback_adapter.hpp"
#include "util/constants.hpp"

using namespace std::chrono_literals;
using app::CentralService;
using transport::LoopbackAdapter;

namespace
{
const std::string ECHO(constants::DEMO_ECHO_ADDR);
const std::string BEACON(constants::DEMO_BEACON_ADDR);
const std::string NOTE_ADDR = "02:00:00:00:00:03";
const std::string NOTE_UUID = "0000fff1-0000-1000-8000-00805f9b34fb";

app::ServiceOptions quick_options()
{
    app::ServiceOptions o;
    o.connect_timeout = 300ms;
    o.probe_timeout   = 300ms;
    o.op_timeout      = 300ms;
    return o;
}

// Readable and writable note: what was written is read back.
transport::SimPeripheral note_peripheral()
{
    transport::SimPeripheral p;
    p.device.address = NOTE_ADDR;
    p.device.name    = "note";
    gatt::Service svc;
    svc.uuid = "0000fff0-0000-1000-8000-00805f9b34fb";
    gatt::Characteristic c;
    c.uuid         = NOTE_UUID;
    c.capabilities = gatt::Capability::Read | gatt::Capability::Write;
    svc.characteristics.push_back(c);
    p.services.push_back(svc);
    return p;
}
}  // namespace

TEST(CentralService, InteractiveScenario)
{
    auto           adapter = LoopbackAdapter::with_demo_peripherals();
    CentralService svc(*adapter, quick_options());

    std::vector<gatt::Device> found;
    ASSERT_TRUE(svc.discover(100ms, {}, found).ok());
    ASSERT_EQ(found.size(), 2u);

    ASSERT_TRUE(svc.open_session(ECHO).ok());
    std::vector<gatt::Service> services;
    ASSERT_TRUE(svc.resolve(services).ok());
    ASSERT_EQ(services.size(), 2u);

    std::shared_ptr<central::Subscription> sub;
    ASSERT_TRUE(svc.subscribe("auto", sub).ok());
    EXPECT_EQ(sub->source().uuid, std::string(constants::UART_TX_UUID));

    gatt::Characteristic used;
    ASSERT_TRUE(svc.write("auto", payload::Payload::text("hi"), true, used).ok());
    EXPECT_EQ(used.uuid, std::string(constants::UART_RX_UUID));

    central::Notification n;
    ASSERT_TRUE(sub->next_for(n, 500ms));
    EXPECT_EQ(n.value, (gatt::Bytes{'h', 'i'}));

    gatt::Bytes value;
    ASSERT_TRUE(svc.read("auto", value, used).ok());
    EXPECT_EQ(used.uuid, std::string(constants::DEVICE_NAME_UUID));
    EXPECT_EQ(std::string(value.begin(), value.end()), "gattlink-echo");

    // explicit UUID, case-insensitive
    std::string upper_rx(constants::UART_RX_UUID);
    for (auto &c : upper_rx)
        c = (char)std::toupper((unsigned char)c);
    ASSERT_TRUE(svc.write(upper_rx, payload::Payload::hex("0102"), false, used).ok());
    EXPECT_EQ(adapter->writes_to(ECHO).back(), (gatt::Bytes{0x01, 0x02}));

    svc.close_session();
    EXPECT_FALSE(sub->active());
    EXPECT_EQ(svc.session().state(), central::SessionState::Disconnected);
    EXPECT_EQ(adapter->open_connections(), 0u);
}

TEST(CentralService, SecondSubscribeEndsTheFirst)
{
    auto           adapter = LoopbackAdapter::with_demo_peripherals();
    CentralService svc(*adapter, quick_options());
    ASSERT_TRUE(svc.open_session(ECHO).ok());

    std::shared_ptr<central::Subscription> a, b;
    ASSERT_TRUE(svc.subscribe("auto", a).ok());
    ASSERT_TRUE(svc.subscribe("auto", b).ok());
    EXPECT_FALSE(a->active());
    EXPECT_TRUE(b->active());
    EXPECT_EQ(adapter->active_subscriptions(), 1u);

    svc.unsubscribe();
    EXPECT_FALSE(b->active());
    EXPECT_EQ(adapter->active_subscriptions(), 0u);
}

TEST(CentralService, OperationsWithoutSession)
{
    auto                 adapter = LoopbackAdapter::with_demo_peripherals();
    CentralService       svc(*adapter, quick_options());
    gatt::Characteristic used;
    gatt::Bytes          value;
    EXPECT_EQ(svc.write("auto", payload::Payload::text("x"), true, used).code, gatt::Errc::InvalidState);
    EXPECT_EQ(svc.read("auto", value, used).code, gatt::Errc::InvalidState);
    EXPECT_EQ(adapter->connect_calls(), 0u);
}

TEST(CentralService, UnknownUuidTarget)
{
    auto           adapter = LoopbackAdapter::with_demo_peripherals();
    CentralService svc(*adapter, quick_options());
    ASSERT_TRUE(svc.open_session(ECHO).ok());
    gatt::Characteristic used;
    EXPECT_EQ(svc.write("0000abcd-0000-1000-8000-00805f9b34fb", payload::Payload::text("x"), true, used)
                  .code,
              gatt::Errc::UnknownCharacteristic);
    EXPECT_TRUE(adapter->writes_to(ECHO).empty());
}

TEST(CentralService, SendAndReadBack)
{
    auto adapter = LoopbackAdapter::with_demo_peripherals();
    adapter->add_peripheral(note_peripheral());
    CentralService svc(*adapter, quick_options());

    app::SendReadResult res;
    ASSERT_TRUE(svc.send_and_read_back(NOTE_ADDR, payload::Payload::text("memo"), res).ok());
    EXPECT_EQ(res.written.uuid, NOTE_UUID);
    EXPECT_TRUE(res.read_back);
    EXPECT_EQ(std::string(res.response.begin(), res.response.end()), "memo");
    EXPECT_EQ(adapter->open_connections(), 0u);

    // echo RX is write-only: nothing to read back
    app::SendReadResult echo;
    ASSERT_TRUE(svc.send_and_read_back(ECHO, payload::Payload::text("x"), echo).ok());
    EXPECT_FALSE(echo.read_back);
    EXPECT_TRUE(echo.response.empty());

    app::SendReadResult refused;
    EXPECT_EQ(svc.send_and_read_back(BEACON, payload::Payload::text("x"), refused).code,
              gatt::Errc::ConnectRefused);
    EXPECT_EQ(adapter->open_connections(), 0u);
}

TEST(CentralService, BroadcastReportsPerDevice)
{
    auto adapter = LoopbackAdapter::with_demo_peripherals();
    adapter->add_peripheral(note_peripheral());
    CentralService svc(*adapter, quick_options());

    auto rep = svc.broadcast(payload::Payload::text("all"), 100ms);
    ASSERT_EQ(rep.results.size(), 3u);
    EXPECT_EQ(rep.succeeded, 2u);
    for (const auto &r : rep.results)
    {
        if (r.device.address == BEACON)
            EXPECT_EQ(r.status.code, gatt::Errc::ConnectRefused);
        else
            EXPECT_TRUE(r.status.ok()) << r.device.address << ": " << r.status.to_string();
    }
    EXPECT_EQ(adapter->writes_to(ECHO).size(), 1u);
    EXPECT_EQ(adapter->open_connections(), 0u);
}

TEST(CentralService, BroadcastWithRadioOff)
{
    auto adapter = LoopbackAdapter::with_demo_peripherals();
    adapter->set_scan_available(false);
    CentralService svc(*adapter, quick_options());

    auto rep = svc.broadcast(payload::Payload::text("x"), 50ms);
    EXPECT_EQ(rep.status.code, gatt::Errc::DiscoveryUnavailable);
    EXPECT_FALSE(rep.status.detail.empty());
    EXPECT_TRUE(rep.results.empty());
    EXPECT_EQ(rep.succeeded, 0u);
    EXPECT_EQ(adapter->connect_calls(), 0u);

    // radio back on: the report carries Ok
    adapter->set_scan_available(true);
    rep = svc.broadcast(payload::Payload::text("x"), 50ms);
    EXPECT_TRUE(rep.status.ok());
    EXPECT_EQ(rep.results.size(), 2u);
}

TEST(CentralService, ConnectableScanThenWritePing)
{
    auto           adapter = LoopbackAdapter::with_demo_peripherals();
    CentralService svc(*adapter, quick_options());

    std::vector<gatt::Device> found;
    ASSERT_TRUE(svc.discover(100ms, {}, found).ok());
    ASSERT_EQ(found.size(), 2u);

    // the beacon refuses every connection
    central::ConnectabilityProber prober(*adapter);
    auto                          rep = prober.probe(found, 2s, {});
    ASSERT_EQ(rep.connectable.size(), 1u);
    const gatt::Device x = rep.connectable[0];
    EXPECT_EQ(x.address, ECHO);

    ASSERT_TRUE(svc.open_session(x.address).ok());
    std::vector<gatt::Service> services;
    ASSERT_TRUE(svc.resolve(services).ok());

    gatt::Characteristic target;
    ASSERT_TRUE(svc.select_characteristic("auto", {gatt::Capability::Write}, target).ok());
    EXPECT_TRUE(target.can(gatt::Capability::Write));

    central::ExchangeEngine engine(300ms);
    central::ExchangeResult res;
    EXPECT_TRUE(engine
                    .execute(svc.session(),
                             central::ExchangeRequest::write(target, payload::Payload::text("PING")), res)
                    .ok());
    EXPECT_EQ(svc.session().state(), central::SessionState::ServicesResolved);
    EXPECT_EQ(adapter->writes_to(ECHO).back(), (gatt::Bytes{'P', 'I', 'N', 'G'}));
}

TEST(CentralService, ProbeUsesDiscoveredDevices)
{
    auto           adapter = LoopbackAdapter::with_demo_peripherals();
    CentralService svc(*adapter, quick_options());
    std::vector<gatt::Device> found;
    ASSERT_TRUE(svc.discover(100ms, {}, found).ok());

    auto rep = svc.probe_connectable(found);
    ASSERT_EQ(rep.connectable.size(), 1u);
    EXPECT_EQ(rep.connectable[0].address, ECHO);
    ASSERT_EQ(rep.failures.size(), 1u);
    EXPECT_EQ(rep.failures[0].device.address, BEACON);
}

TEST(CentralService, Describe)
{
    gatt::Service svc;
    svc.uuid = "1234";
    gatt::Characteristic c;
    c.uuid         = "abcd";
    c.capabilities = gatt::Capability::Read | gatt::Capability::Notify;
    svc.characteristics.push_back(c);

    const std::string text = CentralService::describe({svc});
    EXPECT_NE(text.find("[Service] 1234"), std::string::npos);
    EXPECT_NE(text.find("  [Characteristic] abcd (read, notify)"), std::string::npos);
}

TEST(CentralService, DescribeDevice)
{
    gatt::Device d;
    d.address = "AA:BB:CC:DD:EE:FF";
    d.name    = "sensor";
    gatt::Advertisement adv;
    adv.rssi                      = -60;
    adv.tx_power                  = 4;
    adv.manufacturer_data[0x004C] = {0x02, 0x15};
    adv.service_uuids.insert("0000180f-0000-1000-8000-00805f9b34fb");
    adv.service_data["0000180f-0000-1000-8000-00805f9b34fb"] = {0x64};
    d.advertisement = adv;

    const std::string text = CentralService::describe_device(d);
    EXPECT_NE(text.find("[Device] AA:BB:CC:DD:EE:FF sensor"), std::string::npos);
    EXPECT_NE(text.find("  RSSI: -60 dBm"), std::string::npos);
    EXPECT_NE(text.find("  TX power: 4 dBm"), std::string::npos);
    EXPECT_NE(text.find("  Manufacturer 0x004C: 0215"), std::string::npos);
    EXPECT_NE(text.find("  Service UUID: 0000180f-0000-1000-8000-00805f9b34fb"), std::string::npos);
    EXPECT_NE(text.find("  Service data 0000180f-0000-1000-8000-00805f9b34fb: 64"), std::string::npos);

    gatt::Device bare;
    bare.address = "11:22:33:44:55:66";
    EXPECT_EQ(CentralService::describe_device(bare), "[Device] 11:22:33:44:55:66 Unknown Device\n");
}
