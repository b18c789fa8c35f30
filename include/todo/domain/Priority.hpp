#pragma once

#include <QString>
#include <optional>

namespace todo {
namespace domain {

// No ordering is part of the contract; consumers that sort define their own.
enum class Priority
{
    Low,
    Medium,
    High,
    Critical,
};

QString toString(Priority priority);
std::optional<Priority> priorityFromString(const QString &value);

} // namespace domain
} // namespace todo
