#pragma once

#include <QDateTime>
#include <optional>

#include "todo/core/Result.hpp"
#include "todo/domain/Description.hpp"
#include "todo/domain/Priority.hpp"
#include "todo/domain/Status.hpp"
#include "todo/domain/Title.hpp"
#include "todo/domain/TodoId.hpp"

namespace todo {
namespace domain {

// Immutable snapshot of a todo. Every transition returns a new snapshot;
// id and creation time carry over unchanged.
class Todo
{
public:
    // NotStarted, Medium priority, no description, no due date.
    // createdAt and updatedAt share the same UTC instant.
    static Todo create(Title title);

    // Rebuilds a snapshot from fields that were stored elsewhere. Title and
    // Description are already validated by their types. The aggregate rules
    // are checked here: valid timestamps, updatedAt >= createdAt, a completion
    // time for Completed, and any completion time within [createdAt, updatedAt].
    static core::Result<Todo> restore(TodoId id,
                                      Title title,
                                      Description description,
                                      Status status,
                                      Priority priority,
                                      std::optional<QDateTime> dueDate,
                                      QDateTime createdAt,
                                      QDateTime updatedAt,
                                      std::optional<QDateTime> completedAt);

    const TodoId &id() const { return m_id; }
    const Title &title() const { return m_title; }
    const Description &description() const { return m_description; }
    Status status() const { return m_status; }
    Priority priority() const { return m_priority; }
    const std::optional<QDateTime> &dueDate() const { return m_dueDate; }
    const QDateTime &createdAt() const { return m_createdAt; }
    const QDateTime &updatedAt() const { return m_updatedAt; }
    const std::optional<QDateTime> &completedAt() const { return m_completedAt; }

    friend Todo complete(const Todo &todo);
    friend Todo updateTitle(Title title, const Todo &todo);
    friend Todo setPriority(Priority priority, const Todo &todo);

    friend bool operator==(const Todo &lhs, const Todo &rhs);
    friend bool operator!=(const Todo &lhs, const Todo &rhs) { return !(lhs == rhs); }

private:
    Todo(TodoId id, Title title, QDateTime createdAt);

    TodoId m_id;
    Title m_title;
    Description m_description;
    Status m_status = Status::NotStarted;
    Priority m_priority = Priority::Medium;
    std::optional<QDateTime> m_dueDate;
    QDateTime m_createdAt;
    QDateTime m_updatedAt;
    std::optional<QDateTime> m_completedAt;
};

// Unconditional: a Cancelled or already Completed todo is completed again
// and both completedAt and updatedAt move to the current time.
Todo complete(const Todo &todo);

// Does not compare against the current title.
Todo updateTitle(Title title, const Todo &todo);

Todo setPriority(Priority priority, const Todo &todo);

} // namespace domain
} // namespace todo
