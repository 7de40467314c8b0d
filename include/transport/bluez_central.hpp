#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "transport/icentral.hpp"

#if BLELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace
{
// TU-local wrapper to unref and null a slot ptr
inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}
}  // namespace
#endif

namespace transport
{

struct BluezConfig
{
    std::string adapter = "hci0";
};

// Device1 properties as carried by InterfacesAdded / PropertiesChanged /
// GetManagedObjects; only the present ones are set.
struct BluezDeviceProps
{
    std::optional<std::string>              address{};
    std::optional<std::string>              name{};
    std::optional<int>                      rssi{};
    std::optional<bool>                     connected{};
    std::optional<bool>                     services_resolved{};
    std::optional<std::vector<std::string>> uuids{};
    AdvertisementData                       advertisement{};
};

// BlueZ central over the system bus. Peripheral ids are the MAC addresses
// ("AA:BB:CC:DD:EE:FF"). All sd-bus traffic is serialized by the bus mutex and
// processed on one bus thread; events are collected while it is held and handed
// to the sink after it is released, always on the bus thread.
class BluezCentral final : public ICentral
{
  public:
    explicit BluezCentral(BluezConfig cfg);
    ~BluezCentral() override;

    bool            start(EventSink sink) override;
    void            stop() override;
    ControllerState state() const override;
    std::string     name() const override;

    bool scan(const ScanOptions &opts) override;
    void stop_scan() override;

    bool connect(const std::string &id, const ConnectOptions &opts) override;
    bool cancel_connection(const std::string &id) override;

    std::vector<PeripheralInfo> retrieve_known(const std::vector<std::string> &ids) override;
    std::vector<PeripheralInfo> retrieve_connected(
        const std::vector<std::string> &services) override;

    bool discover_services(const std::string                             &id,
                           const std::optional<std::vector<std::string>> &uuids) override;
    bool discover_characteristics(const std::string &id, const std::string &service,
                                  const std::optional<std::vector<std::string>> &uuids) override;

    bool set_notify(const std::string &id, const CharacteristicRef &c, bool enabled) override;
    bool read(const std::string &id, const CharacteristicRef &c) override;
    bool write(const std::string &id, const CharacteristicRef &c, const Bytes &data,
               WriteMode mode) override;

    const BluezConfig &config() const { return cfg_; }
    bool is_running() const noexcept { return running_.load(std::memory_order_relaxed); }

    // ---- called from sd-bus callbacks (bus thread, bus mutex held) ----
    void note_device(const std::string &path, const BluezDeviceProps &props, bool added);
    void note_device_removed(const std::string &path);
    void note_powered(bool powered);
    void note_value(const std::string &char_path, Bytes value);
#if BLELINK_HAVE_SDBUS
    struct PendingCall;
    void on_call_reply(std::uint64_t seq, sd_bus_message *m);
#endif

  private:
    BluezConfig      cfg_;
    std::atomic_bool running_{false};

    struct Impl;
    std::unique_ptr<Impl> impl_;

    // bus-thread work
    void loop();
    void pump();
    void deliver_pending();
    void post_locked(Event ev);

#if BLELINK_HAVE_SDBUS
    bool submit_locked(sd_bus_message *msg, PendingCall call);
    bool cold_scan_locked();
    bool walk_gatt_locked(const std::string &id);
    bool set_discovery_filter_locked(const ScanOptions &opts);
    std::optional<std::string> char_path_locked(const std::string &id, const CharacteristicRef &c);
#endif
};

}  // namespace transport
