// src/transport/bluez_helper_central.cpp
#include "transport/bluez_helper_central.hpp"
#include "transport/bluez_central.hpp"
#include "transport/bluez_central_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"

#include <cstring>
#include <string>

#if BLELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace transport
{

int bluez_read_device_props(sd_bus_message *m, BluezDeviceProps &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;

    // --- Found props: Address/Alias/Name (s), RSSI/TxPower (n), Connected/ServicesResolved (b),
    //     UUIDs (as), ManufacturerData (a{qv}), ServiceData (a{sv})
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (key && strcmp(key, "Address") == 0)
        {
            std::string s;
            if ((r = read_var_s(m, s)) < 0)
                return r;
            out.address = s;
        }
        else if (key && (strcmp(key, "Name") == 0 || strcmp(key, "Alias") == 0))
        {
            std::string s;
            if ((r = read_var_s(m, s)) < 0)
                return r;
            // Alias falls back to the address; prefer Name when both are present
            if (strcmp(key, "Name") == 0)
                out.advertisement["local_name"] = Bytes(s.begin(), s.end());
            if (strcmp(key, "Name") == 0 || !out.name)
                out.name = s;
        }
        else if (key && strcmp(key, "RSSI") == 0)
        {
            int16_t v = 0;
            if ((r = read_var_i16(m, v)) < 0)
                return r;
            out.rssi = v;
        }
        else if (key && strcmp(key, "TxPower") == 0)
        {
            int16_t v = 0;
            if ((r = read_var_i16(m, v)) < 0)
                return r;
            out.advertisement["tx_power"] = Bytes{(std::uint8_t)(int8_t)v};
        }
        else if (key && strcmp(key, "Connected") == 0)
        {
            bool b = false;
            if ((r = read_var_b(m, b)) < 0)
                return r;
            out.connected = b;
        }
        else if (key && strcmp(key, "ServicesResolved") == 0)
        {
            bool b = false;
            if ((r = read_var_b(m, b)) < 0)
                return r;
            out.services_resolved = b;
        }
        else if (key && strcmp(key, "UUIDs") == 0)
        {
            std::vector<std::string> uuids;
            if ((r = read_var_as(m, uuids)) < 0)
                return r;
            std::string joined;
            for (const auto &u : uuids)
                joined += (joined.empty() ? "" : ",") + u;
            out.advertisement["service_uuids"] = Bytes(joined.begin(), joined.end());
            out.uuids                          = std::move(uuids);
        }
        else if (key && strcmp(key, "ManufacturerData") == 0)
        {
            if ((r = read_var_manufacturer(m, out.advertisement)) < 0)
                return r;
        }
        else if (key && strcmp(key, "ServiceData") == 0)
        {
            if ((r = read_var_service_data(m, out.advertisement)) < 0)
                return r;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "v")) < 0)
                return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;  // dict-entry
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);  // a{sv}
}

int bluez_read_gatt_props(sd_bus_message *m, std::string &uuid, std::string &owner)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;
        if (key && strcmp(key, "UUID") == 0)
            r = read_var_s(m, uuid);
        else if (key && (strcmp(key, "Service") == 0 || strcmp(key, "Device") == 0))
            r = read_var_o(m, owner);
        else
            r = sd_bus_message_skip(m, "v");
        if (r < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

int bluez_walk_managed_objects(sd_bus *bus, const ObjectVisitor &visit, sd_bus_error *err)
{
    sd_bus_message *reply = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", err, &reply, "");
    if (r < 0)
    {
        if (reply)
            sd_bus_message_unref(reply);
        return r;
    }

    // =========================
    // Hierarchy:
    // Object path (o)
    // |- Interfaces (a{sa{sv}})
    //     |- Properties ({sv})
    // =========================
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto out;
    // --- Objects
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            goto out;
        if (!obj)
        {
            r = -EINVAL;
            goto out;
        }
        const std::string path(obj);

        // --- Interfaces
        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            goto out;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                goto out;
            if ((r = visit(path, iface, reply)) < 0)
                goto out;
            if (r == 0 && (r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;  // {sa{sv}} dict-entry
        }
        if (r < 0)
            goto out;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // {oa{sa{sv}}}
    }

out:
    if (reply)
        sd_bus_message_unref(reply);
    return r < 0 ? r : 0;
}

int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<BluezCentral *>(userdata);

    const char *obj = nullptr;
    int         r   = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    const std::string obj_path(obj);
    const std::string prefix = "/org/bluez/" + self->config().adapter + "/dev_";
    if (obj_path.rfind(prefix, 0) != 0)
        return 0;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;

        if (iface && strcmp(iface, "org.bluez.Device1") == 0)
        {
            BluezDeviceProps props;
            if ((r = bluez_read_device_props(m, props)) < 0)
                return r;
            self->note_device(obj_path, props, /*added=*/true);
        }
        else
        {
            // GATT objects are picked up by the walk once services resolve
            if ((r = sd_bus_message_skip(m, "a{sv}")) < 0)
                return r;
        }

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    r = sd_bus_message_exit_container(m);
    return r < 0 ? r : 0;
}

int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<BluezCentral *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    bool device_gone = false;
    r                = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    while (true)
    {
        const char *iface = nullptr;
        int         rr    = sd_bus_message_read_basic(m, 's', &iface);
        if (rr < 0)
            return rr;
        if (rr == 0)
            break;
        if (iface && strcmp(iface, "org.bluez.Device1") == 0)
            device_gone = true;
    }
    r = sd_bus_message_exit_container(m);
    if (r < 0)
        return r;

    if (device_gone)
        self->note_device_removed(obj);
    return 0;
}

int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret_error*/)
{
    auto       *self  = static_cast<BluezCentral *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;
    const char *path = sd_bus_message_get_path(m);
    if (!iface || !path)
        return 0;

    if (strcmp(iface, "org.bluez.Device1") == 0)
    {
        BluezDeviceProps props;
        if ((r = bluez_read_device_props(m, props)) < 0)
            return r;
        self->note_device(path, props, /*added=*/false);
        return 0;
    }

    const bool adapter = strcmp(iface, "org.bluez.Adapter1") == 0;
    const bool chr     = strcmp(iface, "org.bluez.GattCharacteristic1") == 0;
    if (!adapter && !chr)
        return 0;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (adapter && key && strcmp(key, "Powered") == 0)
        {
            bool powered = false;
            if ((r = read_var_b(m, powered)) < 0)
                return r;
            self->note_powered(powered);
        }
        else if (chr && key && strcmp(key, "Value") == 0)
        {
            Bytes value;
            if ((r = read_var_ay(m, value)) < 0)
                return r;
            self->note_value(path, std::move(value));
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "v")) < 0)
                return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    r = sd_bus_message_exit_container(m);
    return r < 0 ? r : 0;
}

int bluez_on_call_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *call = static_cast<BluezCentral::PendingCall *>(userdata);
    call->self->on_call_reply(call->seq, m);
    return 1;
}

}  // namespace transport

#endif
