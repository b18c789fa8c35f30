#pragma once

#include <QString>
#include <optional>

namespace todo {
namespace domain {

// Optional free text. Blank input is stored as "no description", never as an empty string.
class Description
{
public:
    static Description create(const QString &value);
    static Description empty();

    const std::optional<QString> &value() const { return m_value; }
    bool isEmpty() const { return !m_value.has_value(); }

    friend bool operator==(const Description &lhs, const Description &rhs) { return lhs.m_value == rhs.m_value; }
    friend bool operator!=(const Description &lhs, const Description &rhs) { return !(lhs == rhs); }

private:
    explicit Description(std::optional<QString> value);

    std::optional<QString> m_value;
};

} // namespace domain
} // namespace todo
