#pragma once
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "transport/icentral.hpp"

namespace transport
{

struct SimService
{
    std::string              uuid;
    std::vector<std::string> characteristics{};
};

struct SimPeripheral
{
    std::string                id;
    std::optional<std::string> name{};
    AdvertisementData          advertisement{};
    int                        rssi = -60;
    std::vector<SimService>    services{};
};

// One recorded submission, e.g. {"write", "AA:..", "<svc>-<chr>"}.
struct LoopbackCall
{
    std::string op;
    std::string id;
    std::string detail;
};

// In-process controller: a fake radio to exercise registry and links without BLE.
// With auto_complete every accepted submission is answered inline on the calling
// thread; without it the owner drives completions through deliver().
class LoopbackCentral final : public ICentral
{
  public:
    explicit LoopbackCentral(bool            auto_complete = true,
                             ControllerState initial       = ControllerState::PoweredOn);

    bool            start(EventSink sink) override;
    void            stop() override;
    ControllerState state() const override;
    std::string     name() const override { return "loopback"; }

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

    // ---- simulation controls ----
    void add_peripheral(SimPeripheral p);
    void set_state(ControllerState s);  // emits StateUpdated
    void deliver(const Event &ev);      // inject any event on the sink
    void notify(const std::string &id, const CharacteristicRef &c, Bytes value);
    void set_value(const std::string &id, const CharacteristicRef &c, Bytes value);
    // Next auto completion of `op` carries this error.
    void fail_next(const std::string &op, blelink::Error err);
    // Next submission of `op` is refused (returns false).
    void refuse_next(const std::string &op);

    std::vector<LoopbackCall> calls() const;
    std::size_t               count(const std::string &op) const;
    void                      clear_calls();
    bool                      scanning() const;
    std::optional<ScanOptions> last_scan() const;
    std::optional<Bytes>       value(const std::string &id, const CharacteristicRef &c) const;

  private:
    struct Sim
    {
        SimPeripheral                peripheral;
        bool                         connected = false;
        std::map<std::string, Bytes> values{};  // composite key -> value
    };

    // Records the call; returns false when refused. Caller holds mu_.
    bool                record_locked(const std::string &op, const std::string &id,
                                      const std::string &detail);
    blelink::MaybeError take_failure_locked(const std::string &op);
    void                emit(const Event &ev);

    const bool                          auto_complete_;
    mutable std::mutex                  mu_;
    EventSink                           sink_{};
    bool                                started_{false};
    ControllerState                     state_;
    bool                                scanning_{false};
    std::optional<ScanOptions>          last_scan_{};
    std::map<std::string, Sim>          sims_{};
    std::vector<LoopbackCall>           calls_{};
    std::map<std::string, blelink::Error> failures_{};
    std::map<std::string, int>          refusals_{};
};

}  // namespace transport
