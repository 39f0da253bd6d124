#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "central/selector.hpp"

using central::CharacteristicSelector;
using gatt::Capability;

namespace
{
gatt::Characteristic ch(const std::string &uuid, gatt::CapabilitySet caps)
{
    gatt::Characteristic c;
    c.uuid         = uuid;
    c.capabilities = caps;
    return c;
}

// svc A: a1 (read), a2 (write-without-response, notify)
// svc B: b1 (write, read), b2 (indicate)
std::vector<gatt::Service> sample()
{
    gatt::Service a{"0000aaaa-0000-1000-8000-00805f9b34fb",
                    {ch("a1", gatt::caps(Capability::Read)),
                     ch("a2", Capability::WriteNoResponse | Capability::Notify)}};
    gatt::Service b{"0000bbbb-0000-1000-8000-00805f9b34fb",
                    {ch("b1", Capability::Write | Capability::Read),
                     ch("b2", gatt::caps(Capability::Indicate))}};
    return {a, b};
}
}  // namespace

TEST(Selector, CandidatesKeepEnumerationOrder)
{
    std::vector<gatt::Characteristic> out;
    ASSERT_TRUE(CharacteristicSelector::select(sample(), Capability::Read, out).ok());
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].uuid, "a1");
    EXPECT_EQ(out[1].uuid, "b1");
}

TEST(Selector, NoCandidate)
{
    std::vector<gatt::Characteristic> out{ch("stale", 0)};
    gatt::Service                     only{"s", {ch("r", gatt::caps(Capability::Read))}};
    auto st = CharacteristicSelector::select({only}, Capability::Notify, out);
    EXPECT_EQ(st.code, gatt::Errc::NoCapableCharacteristic);
    EXPECT_TRUE(out.empty());

    std::vector<gatt::Characteristic> none;
    EXPECT_EQ(CharacteristicSelector::select({}, Capability::Read, none).code,
              gatt::Errc::NoCapableCharacteristic);
}

TEST(Selector, PickFollowsFallbackOrder)
{
    gatt::Characteristic out;
    // Write is preferred even though a write-without-response characteristic comes first
    ASSERT_TRUE(CharacteristicSelector::pick(sample(), {Capability::Write, Capability::WriteNoResponse},
                                             out)
                    .ok());
    EXPECT_EQ(out.uuid, "b1");

    ASSERT_TRUE(CharacteristicSelector::pick(sample(), {Capability::WriteNoResponse, Capability::Write},
                                             out)
                    .ok());
    EXPECT_EQ(out.uuid, "a2");

    gatt::Service notify_less{"s", {ch("r", gatt::caps(Capability::Read))}};
    auto          st = CharacteristicSelector::pick({notify_less}, {Capability::Notify, Capability::Indicate}, out);
    EXPECT_EQ(st.code, gatt::Errc::NoCapableCharacteristic);
    EXPECT_NE(st.detail.find("notify, indicate"), std::string::npos);
}

TEST(Selector, FindByUuidIsCaseInsensitive)
{
    auto svcs           = sample();
    svcs[1].characteristics[0].uuid = "6E400002-B5A3-F393-E0A9-E50E24DCCA9E";
    gatt::Characteristic out;
    ASSERT_TRUE(CharacteristicSelector::find_by_uuid(svcs, "6e400002-b5a3-f393-e0a9-e50e24dcca9e", out).ok());
    EXPECT_TRUE(out.can(Capability::Write));
    EXPECT_EQ(CharacteristicSelector::find_by_uuid(svcs, "ffff", out).code,
              gatt::Errc::UnknownCharacteristic);
}
