#include "todo/domain/Status.hpp"

namespace todo {
namespace domain {

QString toString(Status status)
{
    switch (status) {
    case Status::NotStarted:
        return QStringLiteral("NotStarted");
    case Status::InProgress:
        return QStringLiteral("InProgress");
    case Status::Completed:
        return QStringLiteral("Completed");
    case Status::Cancelled:
        return QStringLiteral("Cancelled");
    }
    return QString();
}

std::optional<Status> statusFromString(const QString &value)
{
    if (value == QLatin1String("NotStarted")) {
        return Status::NotStarted;
    }
    if (value == QLatin1String("InProgress")) {
        return Status::InProgress;
    }
    if (value == QLatin1String("Completed")) {
        return Status::Completed;
    }
    if (value == QLatin1String("Cancelled")) {
        return Status::Cancelled;
    }
    return std::nullopt;
}

} // namespace domain
} // namespace todo
