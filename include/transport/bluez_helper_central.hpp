// include/transport/bluez_helper_central.hpp
#pragma once
#include <systemd/sd-bus.h>

namespace transport
{

// Central-side DBus callbacks. userdata is BluezAdapter::Impl*, except for
// bluez_on_method_reply where it is the PendingCall*. All run on the bus thread under bus_mu.
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_method_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);

}  // namespace transport
