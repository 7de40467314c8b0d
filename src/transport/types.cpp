#include <algorithm>
#include <cctype>

#include "transport/types.hpp"

namespace transport
{

std::string normalize_uuid(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool uuid_eq(const std::string &a, const std::string &b)
{
    return a.size() == b.size() && normalize_uuid(a) == normalize_uuid(b);
}

bool CharacteristicRef::operator==(const CharacteristicRef &o) const
{
    return uuid_eq(service, o.service) && uuid_eq(uuid, o.uuid);
}

std::string composite_key(const CharacteristicRef &c)
{
    return normalize_uuid(c.service) + "-" + normalize_uuid(c.uuid);
}

const char *state_name(ControllerState s)
{
    switch (s)
    {
        case ControllerState::Unknown:
            return "unknown";
        case ControllerState::Resetting:
            return "resetting";
        case ControllerState::PoweredOff:
            return "powered-off";
        case ControllerState::Unauthorized:
            return "unauthorized";
        case ControllerState::Unsupported:
            return "unsupported";
        case ControllerState::PoweredOn:
            return "powered-on";
    }
    return "?";
}

const std::string &peripheral_id(const PeripheralEvent &ev)
{
    return std::visit([](const auto &e) -> const std::string & { return e.id; }, ev);
}

}  // namespace transport
