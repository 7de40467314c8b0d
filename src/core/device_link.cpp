/* ======================================================================
 * DeviceLink command flow
 *
 *  Caller thread                     DeviceLink                         Transport (bus thread)
 *  -------------                     ----------                         ----------------------
 *  write(c, data)
 *    └─ queue_.append ──▶ execute(head) ─────────────────────────────▶  write(id, c, data)
 *                                                                        ...
 *                          handle(ValueWritten) ◀────────────────────────  write reply
 *                            └─ finish(err): head->end_execution, queue_.next(head)
 *                                 └─ execute(new head) ───────────────▶  ...
 *
 *  write_and_capture_notify
 *    └─ as write; on a successful ValueWritten a capture is registered for the
 *       target key before the queue advances
 *                          handle(ValueUpdated) ◀────────────────────────  notification
 *                            └─ capture front for key? -> its completion
 *                            └─ persistent handler unless omitted
 *                            └─ head is a read of key? -> finish(err, value)
 *
 *  Locks: mu_ guards caches/handlers/captures, the queue has its own lock.
 *  No callback is ever invoked while mu_ is held.
 * ====================================================================== */

#include <algorithm>
#include <utility>

#include "core/device_link.hpp"
#include "util/log.hpp"

namespace core
{

using transport::CharacteristicRef;
using transport::normalize_uuid;
using transport::uuid_eq;

static bool contains_uuid(const std::vector<std::string> &list, const std::string &uuid)
{
    return std::any_of(list.begin(), list.end(),
                       [&](const std::string &u) { return uuid_eq(u, uuid); });
}

static void merge_uuids(std::vector<std::string> &into, const std::vector<std::string> &from)
{
    for (const auto &u : from)
    {
        if (!contains_uuid(into, u))
            into.push_back(normalize_uuid(u));
    }
}

const char *connection_state_name(ConnectionState s)
{
    switch (s)
    {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Connected:
            return "connected";
    }
    return "?";
}

DeviceLink::DeviceLink(std::string id, transport::ICentral &central, blelink::Scheduler &scheduler)
    : id_(std::move(id)), central_(central), scheduler_(scheduler), last_seen_(Clock::now())
{
    queue_.set_execute_handler([this](CommandPtr cmd) { execute(std::move(cmd)); });
}

DeviceLink::~DeviceLink()
{
    for (auto &kv : captures_)
        for (auto &c : kv.second)
            if (c.timer)
                c.timer->invalidate();
    LOG_DEBUG("[LINK] %s released", id_.c_str());
}

// -------- attributes --------
std::optional<std::string> DeviceLink::name() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return name_;
}

std::optional<int> DeviceLink::rssi() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return rssi_;
}

transport::AdvertisementData DeviceLink::advertisement() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return advertisement_;
}

DeviceLink::Clock::time_point DeviceLink::last_seen() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return last_seen_;
}

ConnectionState DeviceLink::state() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

void DeviceLink::set_state(ConnectionState s)
{
    std::lock_guard<std::mutex> lk(mu_);
    state_ = s;
}

void DeviceLink::rediscovered(const std::optional<std::string>   &name,
                              const transport::AdvertisementData &advertisement,
                              const std::optional<int>           &rssi)
{
    std::lock_guard<std::mutex> lk(mu_);
    last_seen_ = Clock::now();
    rssi_      = rssi;
    if (name)
        name_ = name;
    for (const auto &kv : advertisement)
        advertisement_[kv.first] = kv.second;
}

// -------- commands --------
CommandPtr DeviceLink::enqueue(Operation op, Completion completion)
{
    auto cmd = std::make_shared<Command>(std::move(op), std::move(completion));
    LOG_DEBUG("[LINK] %s queue %s (pending=%zu)", id_.c_str(), command_kind_name(cmd->kind()),
              queue_.size());
    queue_.append(cmd);
    return cmd;
}

CommandPtr DeviceLink::discover_services(std::optional<std::vector<std::string>> uuids,
                                         Completion                              completion)
{
    return enqueue(DiscoverServicesOp{std::move(uuids)}, std::move(completion));
}

void DeviceLink::discover_characteristics(std::optional<std::vector<std::string>> uuids,
                                          const std::string                      &service,
                                          Completion                              completion)
{
    if (has_service(service))
    {
        enqueue(DiscoverCharacteristicsOp{std::move(uuids), service}, std::move(completion));
        return;
    }

    // runs inside finish() of the service discovery, so the append below lands
    // behind the current head and is dispatched by next()
    discover_services(
        std::vector<std::string>{service},
        [this, uuids = std::move(uuids), service, completion](const blelink::MaybeError &err) {
            if (err)
            {
                if (completion)
                    completion(err);
                return;
            }
            if (!has_service(service))
            {
                if (completion)
                    completion(blelink::Error{blelink::ErrorCode::InvalidService, service});
                return;
            }
            enqueue(DiscoverCharacteristicsOp{uuids, service}, completion);
        });
}

CommandPtr DeviceLink::set_notify(const CharacteristicRef &c, bool enabled, NotifyHandler handler,
                                  Completion completion)
{
    return enqueue(SetNotifyOp{c, enabled, std::move(handler)}, std::move(completion));
}

CommandPtr DeviceLink::read(const CharacteristicRef &c, ValueCompletion completion)
{
    return enqueue(ReadOp{c, std::move(completion)}, nullptr);
}

CommandPtr DeviceLink::write(const CharacteristicRef &c, transport::Bytes data,
                             transport::WriteMode mode, Completion completion)
{
    return enqueue(WriteOp{c, mode, std::move(data)}, std::move(completion));
}

CommandPtr DeviceLink::write_and_capture_notify(const CharacteristicRef                 &c,
                                                transport::Bytes                         data,
                                                transport::WriteMode                     mode,
                                                Completion                  write_completion,
                                                const CharacteristicRef    &capture,
                                                std::optional<std::chrono::milliseconds> timeout,
                                                CaptureCompletion                        on_capture,
                                                bool omit_notify)
{
    return enqueue(WriteAndCaptureOp{c, mode, std::move(data), capture, timeout,
                                     std::move(on_capture), omit_notify},
                   std::move(write_completion));
}

// -------- resolution --------
void DeviceLink::service(const std::string &uuid, ServiceCompletion completion)
{
    if (has_service(uuid))
    {
        if (completion)
            completion(normalize_uuid(uuid), std::nullopt);
        return;
    }
    discover_services(std::vector<std::string>{uuid},
                      [this, uuid, completion](const blelink::MaybeError &err) {
                          if (!completion)
                              return;
                          if (err)
                              completion(std::nullopt, err);
                          else if (has_service(uuid))
                              completion(normalize_uuid(uuid), std::nullopt);
                          else
                              completion(std::nullopt,
                                         blelink::Error{blelink::ErrorCode::InvalidService, uuid});
                      });
}

void DeviceLink::characteristic(const std::string &uuid, const std::string &service,
                                CharacteristicCompletion completion)
{
    if (has_characteristic(uuid, service))
    {
        if (completion)
            completion(CharacteristicRef{normalize_uuid(service), normalize_uuid(uuid)},
                       std::nullopt);
        return;
    }

    this->service(service, [this, uuid, completion](const std::optional<std::string> &svc,
                                                    const blelink::MaybeError         &err) {
        if (!svc)
        {
            if (completion)
                completion(std::nullopt, err);
            return;
        }
        const std::string service_uuid = *svc;
        auto resolve = [this, uuid, service_uuid, completion](const blelink::MaybeError &e) {
            if (!completion)
                return;
            if (e)
                completion(std::nullopt, e);
            else if (has_characteristic(uuid, service_uuid))
                completion(CharacteristicRef{service_uuid, normalize_uuid(uuid)}, std::nullopt);
            else
                completion(std::nullopt,
                           blelink::Error{blelink::ErrorCode::InvalidCharacteristic, uuid});
        };
        if (has_characteristic(uuid, service_uuid))
            resolve(std::nullopt);
        else
            enqueue(DiscoverCharacteristicsOp{std::vector<std::string>{uuid}, service_uuid},
                    resolve);
    });
}

// -------- cache queries --------
bool DeviceLink::has_service(const std::string &uuid) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return contains_uuid(services_, uuid);
}

bool DeviceLink::has_characteristic(const std::string &uuid, const std::string &service) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = characteristics_.find(normalize_uuid(service));
    return it != characteristics_.end() && contains_uuid(it->second, uuid);
}

std::vector<std::string> DeviceLink::services() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return services_;
}

std::vector<std::string> DeviceLink::characteristics(const std::string &service) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = characteristics_.find(normalize_uuid(service));
    return it == characteristics_.end() ? std::vector<std::string>{} : it->second;
}

bool DeviceLink::has_notify_handler(const CharacteristicRef &c) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return notify_handlers_.count(transport::composite_key(c)) != 0;
}

std::size_t DeviceLink::pending_captures() const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t                 n = 0;
    for (const auto &kv : captures_)
        n += kv.second.size();
    return n;
}

// -------- execution --------
void DeviceLink::refuse(const char *what)
{
    LOG_WARN("[LINK] %s transport refused %s", id_.c_str(), what);
    finish(blelink::Error{blelink::ErrorCode::NotConnected, std::string("refused ") + what});
}

void DeviceLink::execute(CommandPtr cmd)
{
    LOG_DEBUG("[LINK] %s execute %s", id_.c_str(), command_kind_name(cmd->kind()));
    std::visit(transport::overloaded{
                   [this](const DiscoverServicesOp &op) { execute_discover_services(op); },
                   [this](const DiscoverCharacteristicsOp &op) {
                       execute_discover_characteristics(op);
                   },
                   [this](const SetNotifyOp &op) {
                       {
                           std::lock_guard<std::mutex> lk(mu_);
                           const auto key = transport::composite_key(op.characteristic);
                           if (op.enabled && op.handler)
                               notify_handlers_[key] = op.handler;
                           else if (!op.enabled)
                               notify_handlers_.erase(key);
                       }
                       if (!central_.set_notify(id_, op.characteristic, op.enabled))
                           refuse("set-notify");
                   },
                   [this](const ReadOp &op) {
                       if (!central_.read(id_, op.characteristic))
                           refuse("read");
                   },
                   [this](const WriteOp &op) {
                       if (!central_.write(id_, op.characteristic, op.data, op.mode))
                           refuse("write");
                   },
                   [this](const WriteAndCaptureOp &op) {
                       if (!central_.write(id_, op.characteristic, op.data, op.mode))
                           refuse("write");
                   },
               },
               cmd->operation());
}

void DeviceLink::execute_discover_services(const DiscoverServicesOp &op)
{
    if (!op.uuids)
    {
        if (!central_.discover_services(id_, std::nullopt))
            refuse("discover-services");
        return;
    }

    std::vector<std::string> missing;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto &u : *op.uuids)
            if (!contains_uuid(services_, u))
                missing.push_back(u);
    }
    if (missing.empty())
    {
        LOG_DEBUG("[LINK] %s services already known", id_.c_str());
        finish(std::nullopt);
        return;
    }
    if (!central_.discover_services(id_, missing))
        refuse("discover-services");
}

void DeviceLink::execute_discover_characteristics(const DiscoverCharacteristicsOp &op)
{
    if (!op.uuids)
    {
        if (!central_.discover_characteristics(id_, op.service, std::nullopt))
            refuse("discover-characteristics");
        return;
    }

    std::vector<std::string> missing;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = characteristics_.find(normalize_uuid(op.service));
        for (const auto &u : *op.uuids)
            if (it == characteristics_.end() || !contains_uuid(it->second, u))
                missing.push_back(u);
    }
    if (missing.empty())
    {
        LOG_DEBUG("[LINK] %s characteristics of %s already known", id_.c_str(),
                  op.service.c_str());
        finish(std::nullopt);
        return;
    }
    if (!central_.discover_characteristics(id_, op.service, missing))
        refuse("discover-characteristics");
}

void DeviceLink::finish(const blelink::MaybeError &err, const transport::Bytes &value)
{
    auto head = queue_.first();
    if (!head)
    {
        LOG_DEBUG("[LINK] %s completion with no command in flight (ignored)", id_.c_str());
        return;
    }
    if (err)
        LOG_INFO("[LINK] %s %s failed: %s", id_.c_str(), command_kind_name((*head)->kind()),
                 blelink::describe(err).c_str());
    (*head)->end_execution(err, value);
    // the completion may have torn the queue down and refilled it
    queue_.next(*head);
}

// -------- transport events --------
void DeviceLink::handle(const transport::PeripheralEvent &ev)
{
    std::visit(transport::overloaded{
                   [this](const transport::ServicesDiscovered &e) { on_services(e); },
                   [this](const transport::CharacteristicsDiscovered &e) { on_characteristics(e); },
                   [this](const transport::NotifyStateUpdated &e) { on_notify_state(e); },
                   [this](const transport::ValueWritten &e) { on_written(e); },
                   [this](const transport::ValueUpdated &e) { on_value(e); },
               },
               ev);
}

void DeviceLink::on_services(const transport::ServicesDiscovered &ev)
{
    if (!ev.error)
    {
        std::lock_guard<std::mutex> lk(mu_);
        merge_uuids(services_, ev.services);
    }
    auto head = queue_.first();
    if (!head || (*head)->kind() != CommandKind::DiscoverServices)
    {
        LOG_DEBUG("[LINK] %s unsolicited services event", id_.c_str());
        return;
    }
    finish(ev.error);
}

void DeviceLink::on_characteristics(const transport::CharacteristicsDiscovered &ev)
{
    if (!ev.error)
    {
        std::lock_guard<std::mutex> lk(mu_);
        merge_uuids(characteristics_[normalize_uuid(ev.service)], ev.characteristics);
    }
    auto head = queue_.first();
    const auto *op = head ? std::get_if<DiscoverCharacteristicsOp>(&(*head)->operation())
                          : nullptr;
    if (!op || !uuid_eq(op->service, ev.service))
    {
        LOG_DEBUG("[LINK] %s unsolicited characteristics event for %s", id_.c_str(),
                  ev.service.c_str());
        return;
    }
    finish(ev.error);
}

void DeviceLink::on_notify_state(const transport::NotifyStateUpdated &ev)
{
    auto        head = queue_.first();
    const auto *op   = head ? std::get_if<SetNotifyOp>(&(*head)->operation()) : nullptr;
    if (!op || op->characteristic != ev.characteristic)
    {
        LOG_DEBUG("[LINK] %s unsolicited notify-state event", id_.c_str());
        return;
    }
    finish(ev.error);
}

void DeviceLink::on_written(const transport::ValueWritten &ev)
{
    auto head = queue_.first();
    if (!head)
    {
        LOG_DEBUG("[LINK] %s unsolicited write event", id_.c_str());
        return;
    }
    const Operation &operation = (*head)->operation();
    if (const auto *w = std::get_if<WriteOp>(&operation); w && w->characteristic == ev.characteristic)
    {
        finish(ev.error);
        return;
    }
    if (const auto *wc = std::get_if<WriteAndCaptureOp>(&operation);
        wc && wc->characteristic == ev.characteristic)
    {
        if (!ev.error && !(*head)->is_cancelled())
            add_capture(*wc);
        finish(ev.error);
        return;
    }
    LOG_DEBUG("[LINK] %s unsolicited write event", id_.c_str());
}

void DeviceLink::on_value(const transport::ValueUpdated &ev)
{
    const std::string      key = transport::composite_key(ev.characteristic);
    std::optional<Capture> capture;
    NotifyHandler          handler;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = captures_.find(key);
        if (it != captures_.end() && !it->second.empty())
        {
            capture = std::move(it->second.front());
            it->second.pop_front();
            if (it->second.empty())
                captures_.erase(it);
        }
        auto h = notify_handlers_.find(key);
        if (h != notify_handlers_.end())
            handler = h->second;
    }

    bool omit = false;
    if (capture)
    {
        if (capture->timer)
            capture->timer->invalidate();
        if (capture->completion)
            capture->completion(ev.error, ev.value);
        omit = capture->omit_notify;
    }
    if (!omit && handler)
        handler(ev.error, ev.value);

    auto        head = queue_.first();
    const auto *op   = head ? std::get_if<ReadOp>(&(*head)->operation()) : nullptr;
    if (op && op->characteristic == ev.characteristic)
        finish(ev.error, ev.value);
}

// -------- captures --------
void DeviceLink::add_capture(const WriteAndCaptureOp &op)
{
    const std::string key = transport::composite_key(op.capture);
    std::uint64_t     seq = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        seq        = next_capture_seq_++;
        auto &list = captures_[key];
        if (!list.empty())
            LOG_WARN("[LINK] %s capture on %s queued behind %zu pending", id_.c_str(), key.c_str(),
                     list.size());
        list.push_back(Capture{seq, op.on_capture, nullptr, op.omit_notify});
    }
    if (!op.timeout)
        return;

    // armed after registration so an immediate fire still finds it
    std::weak_ptr<DeviceLink> weak  = weak_from_this();
    auto                      timer = scheduler_.schedule(*op.timeout, [weak, key, seq] {
        if (auto self = weak.lock())
            self->capture_timed_out(key, seq);
    });

    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = captures_.find(key);
    if (it != captures_.end())
    {
        for (auto &c : it->second)
        {
            if (c.seq == seq)
            {
                c.timer = timer;
                return;
            }
        }
    }
}

void DeviceLink::capture_timed_out(const std::string &key, std::uint64_t seq)
{
    std::optional<Capture> capture;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = captures_.find(key);
        if (it == captures_.end())
            return;
        auto &list = it->second;
        auto  c    = std::find_if(list.begin(), list.end(),
                                  [seq](const Capture &x) { return x.seq == seq; });
        if (c == list.end())
            return;
        capture = std::move(*c);
        list.erase(c);
        if (list.empty())
            captures_.erase(it);
    }
    LOG_INFO("[LINK] %s capture on %s timed out", id_.c_str(), key.c_str());
    if (capture->completion)
        capture->completion(blelink::Error::timeout(), {});
}

// -------- teardown --------
void DeviceLink::disconnected()
{
    std::map<std::string, std::deque<Capture>> dropped;
    {
        std::lock_guard<std::mutex> lk(mu_);
        rssi_.reset();
        notify_handlers_.clear();
        dropped.swap(captures_);
        services_.clear();
        characteristics_.clear();
    }
    for (auto &kv : dropped)
        for (auto &c : kv.second)
            if (c.timer)
                c.timer->invalidate();
    const std::size_t pending = queue_.size();
    queue_.remove_all();
    LOG_DEBUG("[LINK] %s cleaned up (commands=%zu captures=%zu)", id_.c_str(), pending,
              dropped.size());
}

}  // namespace core
