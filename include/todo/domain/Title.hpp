#pragma once

#include <QString>

#include "todo/core/Result.hpp"

namespace todo {
namespace domain {

// A title that passed validation. Title::create is the only way to get one.
class Title
{
public:
    static constexpr int MaxLength = 200;

    // Rejects null, empty and whitespace-only input as well as anything
    // longer than MaxLength UTF-16 code units. The input is kept verbatim.
    static core::Result<Title> create(const QString &value);

    const QString &value() const { return m_value; }

    friend bool operator==(const Title &lhs, const Title &rhs) { return lhs.m_value == rhs.m_value; }
    friend bool operator!=(const Title &lhs, const Title &rhs) { return !(lhs == rhs); }

private:
    explicit Title(QString value);

    QString m_value;
};

} // namespace domain
} // namespace todo
