#pragma once

#include <QString>
#include <optional>
#include <utility>

namespace reminder {
namespace core {

enum class ErrorKind
{
    NotFound,
    InvalidInput,
    PersistenceFailure,
    PlaybackFailure,
};

struct Error
{
    ErrorKind kind = ErrorKind::InvalidInput;
    QString message;
};

QString errorKindName(ErrorKind kind);

// Value-or-error return for operations that cross the core boundary.
template <typename T>
class Result
{
public:
    static Result success(T value)
    {
        Result result;
        result.m_value = std::move(value);
        return result;
    }

    static Result failure(Error error)
    {
        Result result;
        result.m_error = std::move(error);
        return result;
    }

    static Result failure(ErrorKind kind, QString message)
    {
        return failure(Error{ kind, std::move(message) });
    }

    bool ok() const { return m_value.has_value(); }
    explicit operator bool() const { return ok(); }

    const T &value() const { return *m_value; }
    T &value() { return *m_value; }
    const Error &error() const { return *m_error; }

private:
    Result() = default;

    std::optional<T> m_value;
    std::optional<Error> m_error;
};

} // namespace core
} // namespace reminder
