#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <vector>

#include "util/config.hpp"
#include "util/log.hpp"

namespace blelink
{

static std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_uuid_list(const std::string &csv)
{
    std::vector<std::string> out;
    std::string::size_type   pos = 0;
    while (pos <= csv.size())
    {
        auto        comma = csv.find(',', pos);
        std::string item  = csv.substr(pos, comma == std::string::npos ? std::string::npos
                                                                        : comma - pos);
        auto        l     = item.find_first_not_of(" \t\r\n");
        auto        r     = item.find_last_not_of(" \t\r\n");
        if (l != std::string::npos)
            out.push_back(lower(item.substr(l, r - l + 1)));
        if (comma == std::string::npos)
            break;
        pos = comma + 1;
    }
    return out;
}

std::optional<std::uint32_t> parse_u32(const char *s, std::uint32_t min_v, std::uint32_t max_v)
{
    if (!s || !*s)
        return std::nullopt;
    char         *p = nullptr;
    unsigned long v = std::strtoul(s, &p, 10);
    if (!p || *p != '\0' || v < min_v || v > max_v)
        return std::nullopt;
    return static_cast<std::uint32_t>(v);
}

Config Config::from_env()
{
    Config cfg;

    if (const char *e = std::getenv("BLELINK_LOG_LEVEL"); e && *e)
    {
        Level lv;
        if (parse_level(e, lv))
            cfg.log_level = lower(e);
        else
            LOG_WARN("Ignoring unknown BLELINK_LOG_LEVEL='%s' (expect debug|info|warn|error)", e);
    }

    if (const char *e = std::getenv("BLELINK_TRANSPORT"); e && *e)
    {
        std::string t = lower(e);
        if (t == "bluez" || t == "loopback")
            cfg.transport = t;
        else
            LOG_WARN("Ignoring unknown BLELINK_TRANSPORT='%s' (expect bluez|loopback)", e);
    }

    if (const char *e = std::getenv("BLELINK_ADAPTER"); e && *e)
        cfg.adapter = e;

    if (const char *e = std::getenv("BLELINK_SCAN_SERVICES"))
        cfg.scan_services = split_uuid_list(e);

    if (const char *e = std::getenv("BLELINK_ALLOW_DUPLICATES"))
        cfg.allow_duplicates = (*e == '1');

    if (const char *e = std::getenv("BLELINK_CONNECT_TIMEOUT_MS"))
    {
        if (auto v = parse_u32(e, 0, 600000))
            cfg.connect_timeout = std::chrono::milliseconds(*v);
        else
            LOG_WARN("Ignoring invalid BLELINK_CONNECT_TIMEOUT_MS='%s' (expect 0..600000)", e);
    }

    if (const char *e = std::getenv("BLELINK_SCAN_SECONDS"))
    {
        if (auto v = parse_u32(e, 1, 3600))
            cfg.scan_duration = std::chrono::seconds(*v);
        else
            LOG_WARN("Ignoring invalid BLELINK_SCAN_SECONDS='%s' (expect 1..3600)", e);
    }

    if (const char *e = std::getenv("BLELINK_PEER"); e && *e)
    {
        std::string peer = e;
        std::transform(peer.begin(), peer.end(), peer.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        cfg.peer = peer;
    }

    return cfg;
}

}  // namespace blelink
