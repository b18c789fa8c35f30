#pragma once

#include <QHash>
#include <QString>
#include <QUuid>
#include <optional>

namespace todo {
namespace domain {

class TodoId
{
public:
    static TodoId generate();
    static std::optional<TodoId> fromUuid(const QUuid &uuid);
    static std::optional<TodoId> fromString(const QString &value);

    QUuid uuid() const { return m_uuid; }
    QString toString() const;

    friend bool operator==(const TodoId &lhs, const TodoId &rhs) { return lhs.m_uuid == rhs.m_uuid; }
    friend bool operator!=(const TodoId &lhs, const TodoId &rhs) { return !(lhs == rhs); }

private:
    explicit TodoId(const QUuid &uuid);

    QUuid m_uuid;
};

inline uint qHash(const TodoId &id, uint seed = 0) noexcept
{
    return qHash(id.uuid(), seed);
}

} // namespace domain
} // namespace todo
