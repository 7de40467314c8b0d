// include/transport/bluez_central_impl.hpp
#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct sd_bus;
struct sd_bus_slot;

#include "transport/bluez_central.hpp"

namespace transport
{

#if BLELINK_HAVE_SDBUS
// One async method call in flight; userdata of its reply callback.
struct BluezCentral::PendingCall
{
    enum class Op
    {
        Connect,
        Disconnect,
        StartNotify,
        StopNotify,
        Read,
        Write
    };

    BluezCentral     *self = nullptr;
    std::uint64_t     seq  = 0;
    Op                op   = Op::Connect;
    std::string       id;
    CharacteristicRef characteristic{};
    sd_bus_slot      *slot = nullptr;
};
#endif

struct BluezCentral::Impl
{
#if BLELINK_HAVE_SDBUS
    sd_bus *bus = nullptr;

    // serialize all sd-bus access
    std::mutex bus_mu;

    sd_bus_slot     *added_slot   = nullptr;
    sd_bus_slot     *removed_slot = nullptr;
    sd_bus_slot     *props_slot   = nullptr;

    // in-flight async calls, keyed by seq; guarded by bus_mu
    std::map<std::uint64_t, std::unique_ptr<PendingCall>> calls;
    std::uint64_t                                         next_seq{1};
#endif
    std::thread      loop;
    std::atomic_bool discovery_on{false};
    std::string adapter_path;  // "/org/bluez/hci0"
    std::string unique_name;   // our bus unique name (debug)

    std::atomic<ControllerState> state{ControllerState::Unknown};
    EventSink                    sink{};

    // ---- per-device cache, guarded by bus_mu ----
    struct Device
    {
        std::string                path;
        std::optional<std::string> name{};
        std::optional<int>         rssi{};
        AdvertisementData          advertisement{};
        std::vector<std::string>   uuids{};  // advertised / resolved service UUIDs
        bool                       connected{false};
        bool                       connecting{false};        // Connect() reply pending
        bool                       cancel_was_live{false};   // Disconnect() hit a live link
        bool                       services_resolved{false};
        // GATT, filled by walk_gatt_locked once services are resolved
        bool                                            gatt_ready{false};
        std::vector<std::string>                        services{};
        std::map<std::string, std::vector<std::string>> characteristics{};  // svc -> chars
        std::map<std::string, std::string>              char_paths{};       // composite -> path
        // discovery requests waiting for ServicesResolved
        bool                     want_services{false};
        std::vector<std::string> want_characteristics{};  // service UUIDs
    };
    std::map<std::string, Device> devices;  // by MAC id

    // characteristic object path -> (id, ref), for Value notifications
    std::map<std::string, std::pair<std::string, CharacteristicRef>> char_index;
    std::set<std::string>                                            notifying;  // char paths

    // events collected under bus_mu, delivered by the bus thread without it
    std::vector<Event> pending;

    // drops the walked GATT of one device (services no longer resolved)
    void forget_gatt(Device &d)
    {
        for (const auto &kv : d.char_paths)
        {
            char_index.erase(kv.second);
            notifying.erase(kv.second);
        }
        d.gatt_ready = false;
        d.services.clear();
        d.characteristics.clear();
        d.char_paths.clear();
    }
};

}  // namespace transport
