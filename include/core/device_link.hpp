#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/command.hpp"
#include "core/command_queue.hpp"
#include "transport/icentral.hpp"
#include "util/timer.hpp"

namespace core
{

enum class ConnectionState
{
    Disconnected,
    Connecting,
    Connected
};

const char *connection_state_name(ConnectionState s);

using ServiceCompletion = std::function<void(const std::optional<std::string> &service,
                                             const blelink::MaybeError   &err)>;
using CharacteristicCompletion =
    std::function<void(const std::optional<transport::CharacteristicRef> &characteristic,
                       const blelink::MaybeError                          &err)>;

// One remote peripheral and the serialized command channel bound to its connection.
//
// Commands run strictly one at a time in submission order. Completions are driven
// by handle() with the transport's peripheral events; an event only completes the
// head when it matches the head's kind (and characteristic/service where the event
// carries one), anything else is treated as unsolicited.
//
// Must be owned by a shared_ptr: capture timers hold a weak reference.
class DeviceLink : public std::enable_shared_from_this<DeviceLink>
{
  public:
    using Clock = std::chrono::steady_clock;

    DeviceLink(std::string id, transport::ICentral &central, blelink::Scheduler &scheduler);
    ~DeviceLink();

    DeviceLink(const DeviceLink &)            = delete;
    DeviceLink &operator=(const DeviceLink &) = delete;

    // ---- discovered-device attributes ----
    const std::string            &id() const { return id_; }
    std::optional<std::string>    name() const;
    std::optional<int>            rssi() const;
    transport::AdvertisementData  advertisement() const;
    Clock::time_point             last_seen() const;
    ConnectionState               state() const;
    void                          set_state(ConnectionState s);

    // Rediscovery: refresh last-seen and rssi, merge (not replace) advertisement keys.
    void rediscovered(const std::optional<std::string>   &name,
                      const transport::AdvertisementData &advertisement,
                      const std::optional<int>           &rssi);

    // ---- commands ----
    CommandPtr discover_services(std::optional<std::vector<std::string>> uuids,
                                 Completion                              completion = nullptr);
    // Discovers the owning service first when it is not known yet.
    void       discover_characteristics(std::optional<std::vector<std::string>> uuids,
                                        const std::string                      &service,
                                        Completion completion = nullptr);
    CommandPtr set_notify(const transport::CharacteristicRef &c, bool enabled,
                          NotifyHandler handler = nullptr, Completion completion = nullptr);
    CommandPtr read(const transport::CharacteristicRef &c, ValueCompletion completion = nullptr);
    CommandPtr write(const transport::CharacteristicRef &c, transport::Bytes data,
                     transport::WriteMode mode, Completion completion = nullptr);
    // The write completes (and the queue advances) on the write callback; the next
    // update of `capture` is then routed to `on_capture`, or Timeout after `timeout`.
    CommandPtr write_and_capture_notify(const transport::CharacteristicRef      &c,
                                        transport::Bytes                         data,
                                        transport::WriteMode                     mode,
                                        Completion                               write_completion,
                                        const transport::CharacteristicRef      &capture,
                                        std::optional<std::chrono::milliseconds> timeout,
                                        CaptureCompletion                        on_capture,
                                        bool omit_notify = false);

    // ---- resolution (check cache, else discover then re-check) ----
    void service(const std::string &uuid, ServiceCompletion completion);
    void characteristic(const std::string &uuid, const std::string &service,
                        CharacteristicCompletion completion);

    // ---- cache / bookkeeping queries ----
    bool                     has_service(const std::string &uuid) const;
    bool                     has_characteristic(const std::string &uuid,
                                                const std::string &service) const;
    std::vector<std::string> services() const;
    std::vector<std::string> characteristics(const std::string &service) const;
    bool                     has_notify_handler(const transport::CharacteristicRef &c) const;
    std::size_t              pending_captures() const;
    std::size_t              pending_commands() const { return queue_.size(); }

    // Single entry point for this device's transport events.
    void handle(const transport::PeripheralEvent &ev);

    // Drops handlers, captures (silently, timers cancelled), queued commands and
    // the GATT cache.
    void disconnected();

  private:
    struct Capture
    {
        std::uint64_t     seq = 0;
        CaptureCompletion completion{};
        blelink::TimerPtr timer{};
        bool              omit_notify = false;
    };

    CommandPtr enqueue(Operation op, Completion completion);
    void       execute(CommandPtr cmd);
    void       execute_discover_services(const DiscoverServicesOp &op);
    void       execute_discover_characteristics(const DiscoverCharacteristicsOp &op);
    void       finish(const blelink::MaybeError &err, const transport::Bytes &value = {});
    void       refuse(const char *what);

    void on_services(const transport::ServicesDiscovered &ev);
    void on_characteristics(const transport::CharacteristicsDiscovered &ev);
    void on_notify_state(const transport::NotifyStateUpdated &ev);
    void on_written(const transport::ValueWritten &ev);
    void on_value(const transport::ValueUpdated &ev);

    void add_capture(const WriteAndCaptureOp &op);
    void capture_timed_out(const std::string &key, std::uint64_t seq);

    const std::string    id_;
    transport::ICentral &central_;
    blelink::Scheduler  &scheduler_;

    CommandQueue<CommandPtr> queue_;

    mutable std::mutex                                     mu_;  // guards everything below
    std::optional<std::string>                             name_{};
    std::optional<int>                                     rssi_{};
    transport::AdvertisementData                           advertisement_{};
    Clock::time_point                                      last_seen_{};
    ConnectionState                                        state_{ConnectionState::Disconnected};
    std::vector<std::string>                               services_{};
    std::map<std::string, std::vector<std::string>>        characteristics_{};  // lowercase svc
    std::map<std::string, NotifyHandler>                   notify_handlers_{};  // composite key
    // composite key -> registrations, oldest first; only the front is matched
    std::map<std::string, std::deque<Capture>>             captures_{};
    std::uint64_t                                          next_capture_seq_{1};
};

using DeviceLinkPtr = std::shared_ptr<DeviceLink>;

}  // namespace core
