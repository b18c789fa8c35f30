#include "todo/domain/Todo.hpp"

#include "todo/core/Logging.hpp"

namespace todo {
namespace domain {

namespace {
QDateTime now()
{
    return QDateTime::currentDateTimeUtc();
}

// Wall clock steps backwards must not put updatedAt behind the previous snapshot.
QDateTime nextTimestamp(const QDateTime &previous)
{
    const QDateTime current = now();
    return current < previous ? previous : current;
}

std::optional<QDateTime> toUtc(const std::optional<QDateTime> &value)
{
    if (!value) {
        return std::nullopt;
    }
    return value->toUTC();
}

core::Result<Todo> reject(const TodoId &id, const QString &message)
{
    qCDebug(lcTodoDomain) << "Rejected todo" << id.toString() << ':' << message;
    return core::Result<Todo>::fail(message);
}
} // namespace

Todo::Todo(TodoId id, Title title, QDateTime createdAt)
    : m_id(std::move(id))
    , m_title(std::move(title))
    , m_description(Description::empty())
    , m_createdAt(createdAt)
    , m_updatedAt(std::move(createdAt))
{
}

Todo Todo::create(Title title)
{
    return Todo(TodoId::generate(), std::move(title), now());
}

core::Result<Todo> Todo::restore(TodoId id,
                                 Title title,
                                 Description description,
                                 Status status,
                                 Priority priority,
                                 std::optional<QDateTime> dueDate,
                                 QDateTime createdAt,
                                 QDateTime updatedAt,
                                 std::optional<QDateTime> completedAt)
{
    if (!createdAt.isValid() || !updatedAt.isValid()) {
        return reject(id, QStringLiteral("Todo timestamps must be valid"));
    }
    if (updatedAt < createdAt) {
        return reject(id, QStringLiteral("Todo cannot be updated before it was created"));
    }
    if (status == Status::Completed && !(completedAt && completedAt->isValid())) {
        return reject(id, QStringLiteral("Completed todo requires a completion time"));
    }
    if (dueDate && !dueDate->isValid()) {
        dueDate.reset();
    }
    if (completedAt && !completedAt->isValid()) {
        completedAt.reset();
    }
    if (completedAt && (*completedAt < createdAt || *completedAt > updatedAt)) {
        return reject(id, QStringLiteral("Todo cannot be completed outside its lifetime"));
    }

    Todo todo(std::move(id), std::move(title), createdAt.toUTC());
    todo.m_description = std::move(description);
    todo.m_status = status;
    todo.m_priority = priority;
    todo.m_dueDate = toUtc(dueDate);
    todo.m_updatedAt = updatedAt.toUTC();
    todo.m_completedAt = toUtc(completedAt);
    return core::Result<Todo>::ok(std::move(todo));
}

Todo complete(const Todo &todo)
{
    const QDateTime timestamp = nextTimestamp(todo.updatedAt());
    Todo next = todo;
    next.m_status = Status::Completed;
    next.m_completedAt = timestamp;
    next.m_updatedAt = timestamp;
    return next;
}

Todo updateTitle(Title title, const Todo &todo)
{
    Todo next = todo;
    next.m_title = std::move(title);
    next.m_updatedAt = nextTimestamp(todo.updatedAt());
    return next;
}

Todo setPriority(Priority priority, const Todo &todo)
{
    Todo next = todo;
    next.m_priority = priority;
    next.m_updatedAt = nextTimestamp(todo.updatedAt());
    return next;
}

bool operator==(const Todo &lhs, const Todo &rhs)
{
    return lhs.m_id == rhs.m_id
        && lhs.m_title == rhs.m_title
        && lhs.m_description == rhs.m_description
        && lhs.m_status == rhs.m_status
        && lhs.m_priority == rhs.m_priority
        && lhs.m_dueDate == rhs.m_dueDate
        && lhs.m_createdAt == rhs.m_createdAt
        && lhs.m_updatedAt == rhs.m_updatedAt
        && lhs.m_completedAt == rhs.m_completedAt;
}

} // namespace domain
} // namespace todo
