#include <utility>

#include "core/command.hpp"

namespace core
{

const char *command_kind_name(CommandKind k)
{
    switch (k)
    {
        case CommandKind::DiscoverServices:
            return "discover-services";
        case CommandKind::DiscoverCharacteristics:
            return "discover-characteristics";
        case CommandKind::SetNotify:
            return "set-notify";
        case CommandKind::Read:
            return "read";
        case CommandKind::Write:
            return "write";
        case CommandKind::WriteAndCaptureNotify:
            return "write-capture-notify";
    }
    return "?";
}

Command::Command(Operation op, Completion completion)
    : op_(std::move(op)), completion_(std::move(completion))
{
}

CommandKind Command::kind() const
{
    return std::visit(transport::overloaded{
                          [](const DiscoverServicesOp &) { return CommandKind::DiscoverServices; },
                          [](const DiscoverCharacteristicsOp &) {
                              return CommandKind::DiscoverCharacteristics;
                          },
                          [](const SetNotifyOp &) { return CommandKind::SetNotify; },
                          [](const ReadOp &) { return CommandKind::Read; },
                          [](const WriteOp &) { return CommandKind::Write; },
                          [](const WriteAndCaptureOp &) {
                              return CommandKind::WriteAndCaptureNotify;
                          },
                      },
                      op_);
}

void Command::end_execution(const blelink::MaybeError &err, const transport::Bytes &value)
{
    if (is_cancelled())
        return;
    if (const auto *r = std::get_if<ReadOp>(&op_); r && r->on_value)
        r->on_value(err, value);
    if (completion_)
        completion_(err);
}

}  // namespace core
