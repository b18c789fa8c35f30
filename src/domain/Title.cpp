#include "todo/domain/Title.hpp"

#include "todo/core/Logging.hpp"

namespace todo {
namespace domain {

Title::Title(QString value)
    : m_value(std::move(value))
{
}

core::Result<Title> Title::create(const QString &value)
{
    if (value.trimmed().isEmpty()) {
        qCDebug(lcTodoDomain) << "Rejected empty title";
        return core::Result<Title>::fail(QStringLiteral("Title cannot be empty"));
    }
    if (value.size() > MaxLength) {
        qCDebug(lcTodoDomain) << "Rejected title of length" << value.size();
        return core::Result<Title>::fail(QStringLiteral("Title cannot exceed 200 characters"));
    }
    return core::Result<Title>::ok(Title(value));
}

} // namespace domain
} // namespace todo
