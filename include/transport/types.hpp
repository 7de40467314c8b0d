#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "util/error.hpp"

namespace transport
{

using Bytes = std::vector<std::uint8_t>;

// Accumulated advertisement payload, keyed by field name ("local_name",
// "service_uuids", "tx_power", "manufacturer_data", "service_data:<uuid>").
using AdvertisementData = std::map<std::string, Bytes>;

enum class ControllerState
{
    Unknown,
    Resetting,
    PoweredOff,
    Unauthorized,
    Unsupported,
    PoweredOn
};

enum class WriteMode
{
    WithResponse,    // acknowledged (ATT write request)
    WithoutResponse  // unacknowledged (ATT write command)
};

struct CharacteristicRef
{
    std::string service;  // service UUID
    std::string uuid;     // characteristic UUID

    bool operator==(const CharacteristicRef &o) const;
    bool operator!=(const CharacteristicRef &o) const { return !(*this == o); }
};

// "<service>-<characteristic>", both lowercased
std::string composite_key(const CharacteristicRef &c);

bool        uuid_eq(const std::string &a, const std::string &b);
std::string normalize_uuid(std::string uuid);  // lowercase

const char *state_name(ControllerState s);

// True once the controller reported something other than Unknown/Resetting.
inline bool is_known_state(ControllerState s)
{
    return s == ControllerState::PoweredOn || s == ControllerState::PoweredOff ||
           s == ControllerState::Unauthorized || s == ControllerState::Unsupported;
}

inline bool is_unavailable_state(ControllerState s)
{
    return s == ControllerState::PoweredOff || s == ControllerState::Unauthorized ||
           s == ControllerState::Unsupported;
}

struct PeripheralInfo
{
    std::string                id;
    std::optional<std::string> name{};
};

// ---- central-scoped events ----
struct StateUpdated
{
    ControllerState state = ControllerState::Unknown;
};

struct DeviceDiscovered
{
    std::string                id;
    std::optional<std::string> name{};
    AdvertisementData          advertisement{};
    std::optional<int>         rssi{};
};

struct DeviceConnected
{
    std::string id;
};

struct DeviceConnectFailed
{
    std::string         id;
    blelink::MaybeError error{};
};

struct DeviceDisconnected
{
    std::string         id;
    blelink::MaybeError error{};
};

// ---- peripheral-scoped events ----
struct ServicesDiscovered
{
    std::string              id;
    std::vector<std::string> services{};  // full set known after discovery
    blelink::MaybeError      error{};
};

struct CharacteristicsDiscovered
{
    std::string              id;
    std::string              service;
    std::vector<std::string> characteristics{};  // full set known for the service
    blelink::MaybeError      error{};
};

struct NotifyStateUpdated
{
    std::string         id;
    CharacteristicRef   characteristic;
    bool                enabled = false;
    blelink::MaybeError error{};
};

struct ValueUpdated
{
    std::string         id;
    CharacteristicRef   characteristic;
    Bytes               value{};
    blelink::MaybeError error{};
};

struct ValueWritten
{
    std::string         id;
    CharacteristicRef   characteristic;
    blelink::MaybeError error{};
};

using PeripheralEvent = std::variant<ServicesDiscovered, CharacteristicsDiscovered,
                                     NotifyStateUpdated, ValueUpdated, ValueWritten>;

using Event = std::variant<StateUpdated, DeviceDiscovered, DeviceConnected, DeviceConnectFailed,
                           DeviceDisconnected, PeripheralEvent>;

const std::string &peripheral_id(const PeripheralEvent &ev);

// std::visit helper
template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace transport
