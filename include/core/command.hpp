#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "transport/types.hpp"
#include "util/error.hpp"

namespace core
{

using Completion      = std::function<void(const blelink::MaybeError &)>;
using ValueCompletion = std::function<void(const blelink::MaybeError &, const transport::Bytes &)>;
// Persistent handler: every update of one characteristic until notify is disabled.
using NotifyHandler     = ValueCompletion;
using CaptureCompletion = ValueCompletion;

enum class CommandKind
{
    DiscoverServices,
    DiscoverCharacteristics,
    SetNotify,
    Read,
    Write,
    WriteAndCaptureNotify
};

const char *command_kind_name(CommandKind k);

struct DiscoverServicesOp
{
    std::optional<std::vector<std::string>> uuids{};  // nullopt = all
};

struct DiscoverCharacteristicsOp
{
    std::optional<std::vector<std::string>> uuids{};
    std::string                             service;
};

struct SetNotifyOp
{
    transport::CharacteristicRef characteristic;
    bool                         enabled = false;
    NotifyHandler                handler{};
};

struct ReadOp
{
    transport::CharacteristicRef characteristic;
    ValueCompletion              on_value{};
};

struct WriteOp
{
    transport::CharacteristicRef characteristic;
    transport::WriteMode         mode = transport::WriteMode::WithResponse;
    transport::Bytes             data{};
};

struct WriteAndCaptureOp
{
    transport::CharacteristicRef             characteristic;
    transport::WriteMode                     mode = transport::WriteMode::WithResponse;
    transport::Bytes                         data{};
    transport::CharacteristicRef             capture;
    std::optional<std::chrono::milliseconds> timeout{};
    CaptureCompletion                        on_capture{};
    bool                                     omit_notify = false;
};

using Operation = std::variant<DiscoverServicesOp, DiscoverCharacteristicsOp, SetNotifyOp, ReadOp,
                               WriteOp, WriteAndCaptureOp>;

class Command
{
  public:
    Command(Operation op, Completion completion);

    CommandKind      kind() const;
    const Operation &operation() const { return op_; }

    // Cooperative: suppresses the completion, does not abort the transport call.
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

    // Fires the completion unless cancelled. `value` is used by reads only.
    void end_execution(const blelink::MaybeError &err, const transport::Bytes &value = {});

    // Queue bookkeeping compares kinds only.
    bool operator==(const Command &o) const { return kind() == o.kind(); }

  private:
    Operation        op_;
    Completion       completion_;
    std::atomic_bool cancelled_{false};
};

using CommandPtr = std::shared_ptr<Command>;

}  // namespace core
