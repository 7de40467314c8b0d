#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blelink
{

// Defaults used when an env variable is missing or malformed.
inline constexpr const char *DEFAULT_ADAPTER            = "hci0";
inline constexpr std::uint32_t DEFAULT_CONNECT_TIMEOUT_MS = 10000;
inline constexpr std::uint32_t DEFAULT_SCAN_SECONDS       = 5;

struct Config
{
    std::string                log_level = "info";
    std::string                transport = "loopback";  // "bluez" | "loopback"
    std::string                adapter   = DEFAULT_ADAPTER;
    std::vector<std::string>   scan_services{};          // empty = no filter
    bool                       allow_duplicates = false;
    std::chrono::milliseconds  connect_timeout{DEFAULT_CONNECT_TIMEOUT_MS};  // 0 = none
    std::chrono::seconds       scan_duration{DEFAULT_SCAN_SECONDS};
    std::optional<std::string> peer{};

    // Reads BLELINK_* variables; never fails, bad values are logged and defaulted.
    static Config from_env();
};

// "a, B ,c" -> {"a","b","c"}; empty items dropped, UUIDs lowercased.
std::vector<std::string> split_uuid_list(const std::string &csv);

// Parses a base-10 unsigned value in [min_v, max_v].
std::optional<std::uint32_t> parse_u32(const char *s, std::uint32_t min_v, std::uint32_t max_v);

}  // namespace blelink
