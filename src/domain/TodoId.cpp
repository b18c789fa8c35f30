#include "todo/domain/TodoId.hpp"

namespace todo {
namespace domain {

TodoId::TodoId(const QUuid &uuid)
    : m_uuid(uuid)
{
}

TodoId TodoId::generate()
{
    return TodoId(QUuid::createUuid());
}

std::optional<TodoId> TodoId::fromUuid(const QUuid &uuid)
{
    if (uuid.isNull()) {
        return std::nullopt;
    }
    return TodoId(uuid);
}

std::optional<TodoId> TodoId::fromString(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.startsWith(QLatin1Char('{'))) {
        return fromUuid(QUuid(trimmed));
    }
    return fromUuid(QUuid(QStringLiteral("{%1}").arg(trimmed)));
}

QString TodoId::toString() const
{
    return m_uuid.toString(QUuid::WithoutBraces);
}

} // namespace domain
} // namespace todo
