#pragma once

#include <QString>
#include <optional>

namespace todo {
namespace domain {

// Lifecycle of a todo. Any status may follow any other; no transition guard exists.
enum class Status
{
    NotStarted,
    InProgress,
    Completed,
    Cancelled,
};

QString toString(Status status);
std::optional<Status> statusFromString(const QString &value);

} // namespace domain
} // namespace todo
