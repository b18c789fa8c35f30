#include "todo/data/TodoMime.hpp"

#include <QDataStream>
#include <QDateTime>
#include <QString>
#include <QUuid>

#include "todo/core/Logging.hpp"

namespace todo {
namespace data {

namespace {
constexpr quint32 CurrentTodoMimeVersion = 1;
constexpr QDataStream::Version StreamVersion = QDataStream::Qt_5_12;

struct TodoMimeEntry
{
    QUuid id;
    QString title;
    bool hasDescription = false;
    QString description;
    QString status;
    QString priority;
    bool hasDueDate = false;
    QDateTime dueDate;
    QDateTime createdAt;
    QDateTime updatedAt;
    bool hasCompletedAt = false;
    QDateTime completedAt;
};

void writeOptional(QDataStream &stream, const std::optional<QDateTime> &value)
{
    stream << value.has_value() << value.value_or(QDateTime());
}

std::optional<QDateTime> optionalDateTime(bool present, const QDateTime &value)
{
    if (!present) {
        return std::nullopt;
    }
    return value;
}

QDataStream &operator>>(QDataStream &stream, TodoMimeEntry &entry)
{
    stream >> entry.id >> entry.title >> entry.hasDescription >> entry.description >> entry.status
        >> entry.priority >> entry.hasDueDate >> entry.dueDate >> entry.createdAt >> entry.updatedAt
        >> entry.hasCompletedAt >> entry.completedAt;
    return stream;
}

std::optional<domain::Todo> toTodo(const TodoMimeEntry &entry)
{
    const auto id = domain::TodoId::fromUuid(entry.id);
    if (!id) {
        qCWarning(lcTodoData) << "Skipping todo without id";
        return std::nullopt;
    }
    auto title = domain::Title::create(entry.title);
    if (title.isError()) {
        qCWarning(lcTodoData) << "Skipping todo" << id->toString() << ':' << title.error().message;
        return std::nullopt;
    }
    const auto status = domain::statusFromString(entry.status);
    const auto priority = domain::priorityFromString(entry.priority);
    if (!status || !priority) {
        qCWarning(lcTodoData) << "Skipping todo" << id->toString() << "with unknown status or priority"
                              << entry.status << entry.priority;
        return std::nullopt;
    }
    const auto description = entry.hasDescription ? domain::Description::create(entry.description)
                                                   : domain::Description::empty();

    auto todo = domain::Todo::restore(*id,
                                      std::move(title).value(),
                                      description,
                                      *status,
                                      *priority,
                                      optionalDateTime(entry.hasDueDate, entry.dueDate),
                                      entry.createdAt,
                                      entry.updatedAt,
                                      optionalDateTime(entry.hasCompletedAt, entry.completedAt));
    if (todo.isError()) {
        qCWarning(lcTodoData) << "Skipping todo" << id->toString() << ':' << todo.error().message;
        return std::nullopt;
    }
    return std::move(todo).value();
}
} // namespace

QByteArray encodeTodoMime(const QList<domain::Todo> &todos)
{
    QByteArray buffer;
    QDataStream stream(&buffer, QIODevice::WriteOnly);
    stream.setVersion(StreamVersion);
    stream << TodoMimeMagic << CurrentTodoMimeVersion << quint32(todos.size());
    for (const auto &todo : todos) {
        const auto &description = todo.description().value();
        stream << todo.id().uuid() << todo.title().value() << description.has_value()
               << description.value_or(QString()) << domain::toString(todo.status())
               << domain::toString(todo.priority());
        writeOptional(stream, todo.dueDate());
        stream << todo.createdAt() << todo.updatedAt();
        writeOptional(stream, todo.completedAt());
    }
    return buffer;
}

QVector<domain::Todo> decodeTodoMime(const QByteArray &payload)
{
    QVector<domain::Todo> todos;
    if (payload.isEmpty()) {
        return todos;
    }
    QDataStream stream(payload);
    stream.setVersion(StreamVersion);

    quint32 magic = 0;
    quint32 version = 0;
    quint32 count = 0;
    stream >> magic;
    if (magic != TodoMimeMagic) {
        qCWarning(lcTodoData) << "Payload is not a todo snapshot";
        return todos;
    }
    stream >> version >> count;
    if (version != CurrentTodoMimeVersion) {
        qCWarning(lcTodoData) << "Unsupported todo snapshot version" << version;
        return todos;
    }

    for (quint32 i = 0; i < count && !stream.atEnd(); ++i) {
        TodoMimeEntry entry;
        stream >> entry;
        if (stream.status() != QDataStream::Ok) {
            qCWarning(lcTodoData) << "Truncated todo snapshot after" << todos.size() << "entries";
            break;
        }
        if (auto todo = toTodo(entry)) {
            todos.append(std::move(*todo));
        }
    }
    return todos;
}

std::optional<domain::Todo> firstTodoMime(const QByteArray &payload)
{
    const auto todos = decodeTodoMime(payload);
    if (todos.isEmpty()) {
        return std::nullopt;
    }
    return todos.front();
}

} // namespace data
} // namespace todo
