#pragma once

#include <QString>
#include <cstddef>
#include <utility>
#include <variant>

namespace todo {
namespace core {

struct ValidationError
{
    QString message;
};

inline bool operator==(const ValidationError &lhs, const ValidationError &rhs)
{
    return lhs.message == rhs.message;
}

inline bool operator!=(const ValidationError &lhs, const ValidationError &rhs)
{
    return !(lhs == rhs);
}

// Either a value or the ValidationError explaining why it could not be built.
template<typename T>
class Result
{
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result fail(ValidationError error) { return Result(std::in_place_index<1>, std::move(error)); }
    static Result fail(QString message) { return fail(ValidationError{ std::move(message) }); }

    bool isOk() const { return m_state.index() == 0; }
    bool isError() const { return !isOk(); }
    explicit operator bool() const { return isOk(); }

    const T &value() const & { return std::get<0>(m_state); }
    T &&value() && { return std::get<0>(std::move(m_state)); }
    const ValidationError &error() const { return std::get<1>(m_state); }

private:
    template<std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U &&payload)
        : m_state(tag, std::forward<U>(payload))
    {
    }

    std::variant<T, ValidationError> m_state;
};

} // namespace core
} // namespace todo
