// include/transport/bluez_dbus_util.hpp
#pragma once
#include <cctype>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "transport/types.hpp"

#if BLELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

namespace transport
{

// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF" -> "AA:BB:CC:DD:EE:FF" ("" when not a device path)
[[maybe_unused]] static inline std::string mac_from_path(const std::string &obj_path)
{
    auto pos = obj_path.rfind("/dev_");
    if (pos == std::string::npos)
        return {};
    std::string tail = obj_path.substr(pos + 5);
    if (tail.find('/') != std::string::npos)
        return {};
    for (auto &c : tail)
        c = (c == '_') ? ':' : (char)std::toupper((unsigned char)c);
    return tail;
}

// inverse of mac_from_path for a given adapter path
[[maybe_unused]] static inline std::string path_from_mac(const std::string &adapter_path,
                                                         const std::string &mac)
{
    std::string tail = mac;
    for (auto &c : tail)
        c = (c == ':') ? '_' : (char)std::toupper((unsigned char)c);
    return adapter_path + "/dev_" + tail;
}

#if BLELINK_HAVE_SDBUS
[[maybe_unused]] static inline int read_var_s(sd_bus_message *m, std::string &out)
{
    // read variant "s"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "s", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_o(sd_bus_message *m, std::string &out)
{
    // read variant "o"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "o");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "o", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_i16(sd_bus_message *m, int16_t &out)
{
    // read variant "n" (int16)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "n");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "n", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_b(sd_bus_message *m, bool &out)
{
    // read variant "b"; sd-bus hands booleans out as int
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b = 0;
    r     = sd_bus_message_read(m, "b", &b);
    out   = (b != 0);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_as(sd_bus_message *m, std::vector<std::string> &out)
{
    // read variant "as"
    out.clear();
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0)
        return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    while (true)
    {
        const char *u  = nullptr;
        int         rr = sd_bus_message_read_basic(m, 's', &u);
        if (rr < 0)
            return rr;
        if (rr == 0)
            break;
        if (u)
            out.push_back(normalize_uuid(u));
    }
    int r1 = sd_bus_message_exit_container(m);
    int r2 = sd_bus_message_exit_container(m);
    return (r1 < 0) ? r1 : r2;
}

// reads a bare "ay" (not wrapped in a variant)
[[maybe_unused]] static inline int read_ay(sd_bus_message *m, Bytes &out)
{
    const void *buf = nullptr;
    size_t      len = 0;
    int         r   = sd_bus_message_read_array(m, 'y', &buf, &len);
    if (r < 0)
        return r;
    const auto *p = static_cast<const std::uint8_t *>(buf);
    out.assign(p, p + len);
    return r;
}

[[maybe_unused]] static inline int read_var_ay(sd_bus_message *m, Bytes &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay");
    if (r < 0)
        return r;
    r      = read_ay(m, out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

// Device1.ManufacturerData, variant a{qv}: each entry becomes
// "manufacturer_data" = company id (LE16) + payload; the last entry wins.
[[maybe_unused]] static inline int read_var_manufacturer(sd_bus_message *m, AdvertisementData &adv)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "a{qv}");
    if (r < 0)
        return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{qv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "qv")) > 0)
    {
        uint16_t company = 0;
        if ((r = sd_bus_message_read(m, "q", &company)) < 0)
            return r;
        Bytes payload;
        if ((r = read_var_ay(m, payload)) < 0)
            return r;
        Bytes v{(std::uint8_t)(company & 0xff), (std::uint8_t)(company >> 8)};
        v.insert(v.end(), payload.begin(), payload.end());
        adv["manufacturer_data"] = std::move(v);
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    int r1 = sd_bus_message_exit_container(m);
    int r2 = sd_bus_message_exit_container(m);
    return (r1 < 0) ? r1 : r2;
}

// Device1.ServiceData, variant a{sv} of ay: "service_data:<uuid>" per entry
[[maybe_unused]] static inline int read_var_service_data(sd_bus_message *m, AdvertisementData &adv)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "a{sv}");
    if (r < 0)
        return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *uuid = nullptr;
        if ((r = sd_bus_message_read(m, "s", &uuid)) < 0)
            return r;
        Bytes payload;
        if ((r = read_var_ay(m, payload)) < 0)
            return r;
        if (uuid)
            adv["service_data:" + normalize_uuid(uuid)] = std::move(payload);
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    int r1 = sd_bus_message_exit_container(m);
    int r2 = sd_bus_message_exit_container(m);
    return (r1 < 0) ? r1 : r2;
}

// "{sv}" entry with a string value
[[maybe_unused]] static inline int append_entry_s(sd_bus_message *msg, const char *key,
                                                  const char *val)
{
    int r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0)
        return r;
    if ((r = sd_bus_message_append(msg, "s", key)) < 0)
        return r;
    if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "s")) < 0)
        return r;
    if ((r = sd_bus_message_append(msg, "s", val)) < 0)
        return r;
    if ((r = sd_bus_message_close_container(msg)) < 0)  // variant
        return r;
    return sd_bus_message_close_container(msg);  // dict
}

[[maybe_unused]] static inline int append_entry_b(sd_bus_message *msg, const char *key, bool val)
{
    int r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0)
        return r;
    if ((r = sd_bus_message_append(msg, "s", key)) < 0)
        return r;
    if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "b")) < 0)
        return r;
    if ((r = sd_bus_message_append(msg, "b", val ? 1 : 0)) < 0)
        return r;
    if ((r = sd_bus_message_close_container(msg)) < 0)
        return r;
    return sd_bus_message_close_container(msg);
}

[[maybe_unused]] static inline int append_entry_as(sd_bus_message *msg, const char *key,
                                                   const std::vector<std::string> &vals)
{
    int r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0)
        return r;
    if ((r = sd_bus_message_append(msg, "s", key)) < 0)
        return r;
    if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "as")) < 0)
        return r;
    if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "s")) < 0)
        return r;
    for (const auto &v : vals)
        if ((r = sd_bus_message_append(msg, "s", v.c_str())) < 0)
            return r;
    if ((r = sd_bus_message_close_container(msg)) < 0)  // array
        return r;
    if ((r = sd_bus_message_close_container(msg)) < 0)  // variant
        return r;
    return sd_bus_message_close_container(msg);  // dict
}

[[maybe_unused]] static inline blelink::Error dbus_error(const sd_bus_error *e, int r)
{
    std::string msg = (e && e->name) ? e->name : "sd-bus";
    msg += ": ";
    msg += (e && e->message) ? e->message : strerror(r < 0 ? -r : r);
    return blelink::Error::transport(std::move(msg));
}
#endif

}  // namespace transport
