#include "todo/domain/Priority.hpp"

namespace todo {
namespace domain {

QString toString(Priority priority)
{
    switch (priority) {
    case Priority::Low:
        return QStringLiteral("Low");
    case Priority::Medium:
        return QStringLiteral("Medium");
    case Priority::High:
        return QStringLiteral("High");
    case Priority::Critical:
        return QStringLiteral("Critical");
    }
    return QString();
}

std::optional<Priority> priorityFromString(const QString &value)
{
    if (value == QLatin1String("Low")) {
        return Priority::Low;
    }
    if (value == QLatin1String("Medium")) {
        return Priority::Medium;
    }
    if (value == QLatin1String("High")) {
        return Priority::High;
    }
    if (value == QLatin1String("Critical")) {
        return Priority::Critical;
    }
    return std::nullopt;
}

} // namespace domain
} // namespace todo
