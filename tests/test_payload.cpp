#include <gtest/gtest.h>
#include <string>

#include "gatt/types.hpp"
#include "proto/payload.hpp"

using payload::Encoding;
using payload::Payload;

TEST(Payload, TextEncodesUtf8Bytes)
{
    gatt::Bytes out;
    ASSERT_TRUE(payload::encode(Payload::text("h\xC3\xA9!"), out).ok());
    EXPECT_EQ(out, (gatt::Bytes{'h', 0xC3, 0xA9, '!'}));
}

TEST(Payload, HexAcceptsSeparators)
{
    const gatt::Bytes want{0x48, 0x65, 0x6c, 0x6c, 0x6f};
    for (const char *in : {"48656c6c6f", "48 65 6c 6c 6f", "48:65:6C:6C:6F", "  48656c6c6f\n"})
    {
        gatt::Bytes out;
        auto        st = payload::encode(Payload::hex(in), out);
        ASSERT_TRUE(st.ok()) << in << ": " << st.to_string();
        EXPECT_EQ(out, want) << in;
    }
}

TEST(Payload, HexRejectsOddDigitsAndJunk)
{
    gatt::Bytes out;
    EXPECT_EQ(payload::encode(Payload::hex("abc"), out).code, gatt::Errc::MalformedPayload);
    EXPECT_EQ(payload::encode(Payload::hex("zz"), out).code, gatt::Errc::MalformedPayload);
    // a separator may not split a byte
    EXPECT_EQ(payload::encode(Payload::hex("4 8"), out).code, gatt::Errc::MalformedPayload);
}

TEST(Payload, EmptyHexIsEmptyBytes)
{
    gatt::Bytes out{1, 2};
    ASSERT_TRUE(payload::encode(Payload::hex(""), out).ok());
    EXPECT_TRUE(out.empty());
}

TEST(Payload, RawPassesThrough)
{
    gatt::Bytes out;
    ASSERT_TRUE(payload::encode(Payload::raw({0x00, 0xff, 0x10}), out).ok());
    EXPECT_EQ(out, (gatt::Bytes{0x00, 0xff, 0x10}));

    auto p = payload::from_text(Encoding::Raw, "AB");
    EXPECT_EQ(p.encoding(), Encoding::Raw);
    EXPECT_EQ(p.raw_value(), (gatt::Bytes{'A', 'B'}));
}

TEST(Payload, ParseEncodingNames)
{
    Encoding e;
    ASSERT_TRUE(payload::parse_encoding("TEXT", e));
    EXPECT_EQ(e, Encoding::Utf8Text);
    ASSERT_TRUE(payload::parse_encoding("hex", e));
    EXPECT_EQ(e, Encoding::Hex);
    ASSERT_TRUE(payload::parse_encoding("bytes", e));
    EXPECT_EQ(e, Encoding::Raw);
    EXPECT_FALSE(payload::parse_encoding("base64", e));
    EXPECT_STREQ(payload::encoding_name(Encoding::Hex), "hex");
}

TEST(Payload, Presentation)
{
    const gatt::Bytes v{'h', 'i', 0x00, 0xC3, 0xA9, 0xFF, '\n'};
    EXPECT_EQ(payload::to_hex(v), "686900c3a9ff0a");
    EXPECT_EQ(payload::to_printable(v), "hi\xC3\xA9");
    EXPECT_EQ(payload::to_hex({}), "");
}

TEST(GattTypes, CapabilityFlags)
{
    auto set = gatt::capabilities_from_flags({"read", "Write-Without-Response", "notify", "bogus"});
    EXPECT_TRUE(gatt::has_capability(set, gatt::Capability::Read));
    EXPECT_TRUE(gatt::has_capability(set, gatt::Capability::WriteNoResponse));
    EXPECT_TRUE(gatt::has_capability(set, gatt::Capability::Notify));
    EXPECT_FALSE(gatt::has_capability(set, gatt::Capability::Write));
    EXPECT_EQ(gatt::capabilities_to_string(set), "read, write-without-response, notify");
    EXPECT_EQ(gatt::capabilities_to_string(0), "none");
}

TEST(GattTypes, DisplayNameAndStatus)
{
    gatt::Device d;
    d.address = "AA:BB:CC:DD:EE:FF";
    EXPECT_EQ(d.display_name(), "Unknown Device");
    d.name = "";
    EXPECT_FALSE(d.has_name());
    d.name = "thermo";
    EXPECT_EQ(d.display_name(), "thermo");

    gatt::Status st{gatt::Errc::WriteRejected, "ATT 0x03"};
    EXPECT_FALSE(st);
    EXPECT_EQ(st.to_string(), "WriteRejected: ATT 0x03");
    EXPECT_EQ(gatt::Status::Ok().to_string(), "Ok");
    EXPECT_TRUE(gatt::uuid_eq("6E400001-B5A3", "6e400001-b5a3"));
}
