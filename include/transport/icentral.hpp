#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "transport/types.hpp"

namespace transport
{

using EventSink = std::function<void(const Event &)>;

struct ScanOptions
{
    std::vector<std::string> services{};  // empty = every advertiser
    bool                     allow_duplicates = false;
};

struct ConnectOptions
{
    bool notify_on_connection    = false;
    bool notify_on_disconnection = false;
    bool notify_on_notification  = false;
};

// Radio controller capability. Every operation is a submission: false means it was
// refused synchronously, true means exactly one completion event will follow on the
// sink (from the transport's own thread, never from inside the submitting call for
// BlueZ; the loopback may complete inline).
struct ICentral
{
    virtual bool            start(EventSink sink) = 0;
    virtual void            stop()                = 0;
    virtual ControllerState state() const         = 0;
    virtual std::string     name() const { return ""; }

    virtual bool scan(const ScanOptions &opts) = 0;
    virtual void stop_scan()                   = 0;

    virtual bool connect(const std::string &id, const ConnectOptions &opts) = 0;
    virtual bool cancel_connection(const std::string &id)                  = 0;

    virtual std::vector<PeripheralInfo> retrieve_known(const std::vector<std::string> &ids) = 0;
    virtual std::vector<PeripheralInfo> retrieve_connected(
        const std::vector<std::string> &services) = 0;

    // std::nullopt = discover everything
    virtual bool discover_services(const std::string                            &id,
                                   const std::optional<std::vector<std::string>> &uuids) = 0;
    virtual bool discover_characteristics(const std::string &id, const std::string &service,
                                          const std::optional<std::vector<std::string>> &uuids) = 0;

    virtual bool set_notify(const std::string &id, const CharacteristicRef &c, bool enabled) = 0;
    virtual bool read(const std::string &id, const CharacteristicRef &c)                    = 0;
    virtual bool write(const std::string &id, const CharacteristicRef &c, const Bytes &data,
                       WriteMode mode)                                                       = 0;

    virtual ~ICentral() = default;
};

}  // namespace transport
