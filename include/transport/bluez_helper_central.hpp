// include/transport/bluez_helper_central.hpp
#pragma once

#if BLELINK_HAVE_SDBUS
#include <functional>
#include <string>

#include <systemd/sd-bus.h>

#include "transport/bluez_central.hpp"

namespace transport
{

// Central-side DBus callbacks, userdata is the BluezCentral
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
// userdata is the BluezCentral::PendingCall of the call
int bluez_on_call_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);

// Reads a Device1 a{sv} property map (the container is entered and exited here).
int bluez_read_device_props(sd_bus_message *m, BluezDeviceProps &out);
// Reads UUID and the owning object ("Service" / "Device") of a GATT a{sv} map.
int bluez_read_gatt_props(sd_bus_message *m, std::string &uuid, std::string &owner);

// Calls ObjectManager.GetManagedObjects and walks a{oa{sa{sv}}}. `visit` gets each
// (object, interface) with the message positioned at its a{sv}; it returns > 0
// when it consumed the a{sv}, 0 to have it skipped, < 0 to abort the walk.
using ObjectVisitor =
    std::function<int(const std::string &path, const char *iface, sd_bus_message *m)>;
int bluez_walk_managed_objects(sd_bus *bus, const ObjectVisitor &visit, sd_bus_error *err);

}  // namespace transport
#endif  // BLELINK_HAVE_SDBUS
