#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "central/session.hpp"
#include "transport/loopback_adapter.hpp"
#include "util/cancel.hpp"
#include "util/constants.hpp"

using namespace std::chrono_literals;
using central::Session;
using central::SessionState;
using transport::ConnectBehavior;
using transport::LoopbackAdapter;

namespace
{
const std::string ECHO(constants::DEMO_ECHO_ADDR);
const std::string BEACON(constants::DEMO_BEACON_ADDR);
}  // namespace

TEST(Session, OpenResolveClose)
{
    auto    a = LoopbackAdapter::with_demo_peripherals();
    Session s(*a);
    EXPECT_EQ(s.state(), SessionState::Idle);

    ASSERT_TRUE(s.open(ECHO, 500ms).ok());
    EXPECT_EQ(s.state(), SessionState::Connected);
    EXPECT_EQ(s.address(), ECHO);
    EXPECT_TRUE(s.services().empty());

    std::vector<gatt::Service> svcs;
    ASSERT_TRUE(s.resolve_services(svcs).ok());
    EXPECT_EQ(s.state(), SessionState::ServicesResolved);
    ASSERT_EQ(svcs.size(), 2u);
    EXPECT_EQ(svcs[0].uuid, std::string(constants::GAP_SVC_UUID));
    for (const auto &svc : svcs)
        for (const auto &c : svc.characteristics)
            EXPECT_EQ(c.service_uuid, svc.uuid);

    s.close();
    EXPECT_EQ(s.state(), SessionState::Disconnected);
    EXPECT_EQ(a->disconnect_calls(), 1u);
    EXPECT_EQ(a->open_connections(), 0u);
}

TEST(Session, ResolveIsCachedPerConnection)
{
    auto    a = LoopbackAdapter::with_demo_peripherals();
    Session s(*a);
    ASSERT_TRUE(s.open(ECHO, 500ms).ok());
    std::vector<gatt::Service> first, second;
    ASSERT_TRUE(s.resolve_services(first).ok());
    ASSERT_TRUE(s.resolve_services(second).ok());
    EXPECT_EQ(a->resolve_calls(), 1u);
    EXPECT_EQ(first.size(), second.size());
}

TEST(Session, CloseIsIdempotentAndDisconnectsOnce)
{
    auto a = LoopbackAdapter::with_demo_peripherals();
    {
        Session s(*a);
        ASSERT_TRUE(s.open(ECHO, 500ms).ok());
        s.close();
        s.close();
    }  // destructor closes again
    EXPECT_EQ(a->disconnect_calls(), 1u);

    {
        Session s(*a);
        ASSERT_TRUE(s.open(ECHO, 500ms).ok());
    }  // destructor alone
    EXPECT_EQ(a->disconnect_calls(), 2u);
    EXPECT_EQ(a->open_connections(), 0u);
}

TEST(Session, ClosingIdleDisconnectsWithoutAdapterCall)
{
    auto    a = LoopbackAdapter::with_demo_peripherals();
    Session s(*a);
    s.close();
    EXPECT_EQ(s.state(), SessionState::Disconnected);
    EXPECT_EQ(a->disconnect_calls(), 0u);

    // still reusable
    ASSERT_TRUE(s.open(ECHO, 200ms).ok());
    s.close();
    EXPECT_EQ(a->disconnect_calls(), 1u);
}

TEST(Session, FailedConnectLeavesFailedAndReopens)
{
    auto    a = LoopbackAdapter::with_demo_peripherals();
    Session s(*a);
    EXPECT_EQ(s.open(BEACON, 200ms).code, gatt::Errc::ConnectRefused);
    EXPECT_EQ(s.state(), SessionState::Failed);

    a->set_connect_behavior(BEACON, ConnectBehavior::NoAnswer);
    EXPECT_EQ(s.open(BEACON, 50ms).code, gatt::Errc::ConnectTimeout);
    EXPECT_EQ(s.state(), SessionState::Failed);

    ASSERT_TRUE(s.open(ECHO, 200ms).ok());
    EXPECT_EQ(s.state(), SessionState::Connected);
    // no disconnect for the failed attempts
    s.close();
    EXPECT_EQ(a->disconnect_calls(), 1u);
}

TEST(Session, OpenTwiceIsInvalid)
{
    auto    a = LoopbackAdapter::with_demo_peripherals();
    Session s(*a);
    ASSERT_TRUE(s.open(ECHO, 200ms).ok());
    EXPECT_EQ(s.open(ECHO, 200ms).code, gatt::Errc::InvalidState);
    EXPECT_EQ(s.state(), SessionState::Connected);
}

TEST(Session, ResolveBeforeOpenIsInvalid)
{
    auto                       a = LoopbackAdapter::with_demo_peripherals();
    Session                    s(*a);
    std::vector<gatt::Service> svcs;
    EXPECT_EQ(s.resolve_services(svcs).code, gatt::Errc::InvalidState);
}

TEST(Session, CapacityExceededOnSecondSession)
{
    auto    a = LoopbackAdapter::with_demo_peripherals(1);
    Session s1(*a), s2(*a);
    ASSERT_TRUE(s1.open(ECHO, 200ms).ok());
    EXPECT_EQ(s2.open(ECHO, 200ms).code, gatt::Errc::AdapterCapacityExceeded);
    EXPECT_EQ(s2.state(), SessionState::Failed);
}

TEST(Session, LinkLossObservedOnNextCall)
{
    auto    a = LoopbackAdapter::with_demo_peripherals();
    Session s(*a);
    ASSERT_TRUE(s.open(ECHO, 200ms).ok());
    std::vector<gatt::Service> svcs;
    ASSERT_TRUE(s.resolve_services(svcs).ok());

    a->drop_link(ECHO);
    EXPECT_EQ(s.state(), SessionState::Disconnected);
    EXPECT_TRUE(s.services().empty());
    // the release after a loss still pairs with the successful open
    EXPECT_EQ(a->disconnect_calls(), 1u);
    s.close();
    EXPECT_EQ(a->disconnect_calls(), 1u);

    // a new connection is allowed afterwards
    EXPECT_TRUE(s.open(ECHO, 200ms).ok());
}

TEST(Session, CancelDuringConnect)
{
    auto    a = LoopbackAdapter::with_demo_peripherals();
    a->set_connect_behavior(ECHO, ConnectBehavior::NoAnswer);
    Session            s(*a);
    util::CancelSource src;
    std::thread        t([&] {
        std::this_thread::sleep_for(50ms);
        src.cancel();
    });
    const auto t0 = std::chrono::steady_clock::now();
    auto       st = s.open(ECHO, 5s, src.token());
    t.join();
    EXPECT_EQ(st.code, gatt::Errc::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
    EXPECT_EQ(s.state(), SessionState::Disconnected);
    EXPECT_EQ(a->open_connections(), 0u);
}

TEST(Session, StateNames)
{
    EXPECT_STREQ(central::state_name(SessionState::ServicesResolved), "ServicesResolved");
    EXPECT_STREQ(central::state_name(SessionState::Busy), "Busy");
}
