#pragma once

#include <QByteArray>
#include <QList>
#include <QVector>
#include <QtGlobal>
#include <optional>

#include "todo/domain/Todo.hpp"

namespace todo {
namespace data {

constexpr const char *TodoMimeType = "application/x-todo-snapshot";
constexpr quint32 TodoMimeMagic = 0x544F444F; // "TODO"

QByteArray encodeTodoMime(const QList<domain::Todo> &todos);

// Every entry is rebuilt through the validating factories; entries that fail
// are skipped. A foreign payload, or one of another format version, decodes
// to an empty list.
QVector<domain::Todo> decodeTodoMime(const QByteArray &payload);
std::optional<domain::Todo> firstTodoMime(const QByteArray &payload);

} // namespace data
} // namespace todo
