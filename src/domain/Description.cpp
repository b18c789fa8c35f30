#include "todo/domain/Description.hpp"

namespace todo {
namespace domain {

Description::Description(std::optional<QString> value)
    : m_value(std::move(value))
{
}

Description Description::create(const QString &value)
{
    if (value.trimmed().isEmpty()) {
        return empty();
    }
    return Description(value);
}

Description Description::empty()
{
    return Description(std::nullopt);
}

} // namespace domain
} // namespace todo
