#include <gtest/gtest.h>
#include <string>

#include "gatt/types.hpp"
#include "transport/bluez_dbus_util.hpp"

using transport::classify_bluez_error;
using transport::classify_connect_error;

TEST(BluezUtil, DevicePaths)
{
    EXPECT_EQ(transport::dev_path_for("/org/bluez/hci0/dev_", "aa:bb:cc:dd:ee:0f"),
              "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_0F");
    EXPECT_EQ(transport::mac_from_path("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_0F"), "AA:BB:CC:DD:EE:0F");
    // characteristic paths are not device paths
    EXPECT_EQ(transport::mac_from_path("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_0F/service000a/char000b"), "");
    EXPECT_EQ(transport::mac_from_path("/org/bluez/hci0"), "");
}

TEST(BluezUtil, CharacteristicFlags)
{
    auto set = gatt::capabilities_from_flags({"read", "write-without-response", "indicate", "reliable-write"});
    EXPECT_TRUE(gatt::has_capability(set, gatt::Capability::Read));
    EXPECT_TRUE(gatt::has_capability(set, gatt::Capability::WriteNoResponse));
    EXPECT_TRUE(gatt::has_capability(set, gatt::Capability::Indicate));
    EXPECT_FALSE(gatt::has_capability(set, gatt::Capability::Write));
    EXPECT_FALSE(gatt::has_capability(set, gatt::Capability::Notify));
}

TEST(BluezUtil, ClassifyOperationErrors)
{
    EXPECT_EQ(classify_bluez_error("org.freedesktop.DBus.Error.NoReply", "", gatt::Errc::ReadError),
              gatt::Errc::Timeout);
    EXPECT_EQ(classify_bluez_error("org.freedesktop.DBus.Error.UnknownObject", "", gatt::Errc::ReadError),
              gatt::Errc::LinkLost);
    EXPECT_EQ(classify_bluez_error("org.bluez.Error.Failed", "Not connected", gatt::Errc::WriteRejected),
              gatt::Errc::LinkLost);
    EXPECT_EQ(classify_bluez_error("org.bluez.Error.NotReady", "", gatt::Errc::ReadError),
              gatt::Errc::AdapterError);
    EXPECT_EQ(classify_bluez_error("org.bluez.Error.NotPermitted", "Write not permitted",
                                   gatt::Errc::WriteRejected),
              gatt::Errc::WriteRejected);
    EXPECT_EQ(classify_bluez_error("org.bluez.Error.NotSupported", "", gatt::Errc::PeerRejected),
              gatt::Errc::PeerRejected);
}

TEST(BluezUtil, ClassifyConnectErrors)
{
    EXPECT_EQ(classify_connect_error("org.bluez.Error.Failed", "le-connection-abort-by-local"),
              gatt::Errc::ConnectRefused);
    EXPECT_EQ(classify_connect_error("org.bluez.Error.Failed", "Page Timeout"), gatt::Errc::ConnectTimeout);
    EXPECT_EQ(classify_connect_error("org.freedesktop.DBus.Error.NoReply", ""), gatt::Errc::ConnectTimeout);
    EXPECT_EQ(classify_connect_error("org.bluez.Error.NotReady", "Resource Not Ready"),
              gatt::Errc::AdapterError);
    EXPECT_EQ(classify_connect_error("org.freedesktop.DBus.Error.UnknownObject", ""),
              gatt::Errc::ConnectRefused);
}
