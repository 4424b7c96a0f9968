#pragma once
#include "avroinfer/exceptions.hpp"

#include <string>
#include <utility>
#include <variant>

namespace avroinfer
{

/// Failure carried by value through the engine instead of unwinding.
struct DeriveError
{
    ErrorKind kind;
    std::string message;
};

/// Either a value or the DeriveError that prevented it.
template <typename T>
class Result
{
  public:
    Result(T value) : data_(std::move(value)) {}
    Result(DeriveError error) : data_(std::move(error)) {}

    bool ok() const
    {
        return std::holds_alternative<T>(data_);
    }

    explicit operator bool() const
    {
        return ok();
    }

    const T& value() const
    {
        return std::get<T>(data_);
    }

    T& value()
    {
        return std::get<T>(data_);
    }

    T take()
    {
        return std::move(std::get<T>(data_));
    }

    const DeriveError& error() const
    {
        return std::get<DeriveError>(data_);
    }

  private:
    std::variant<T, DeriveError> data_;
};

inline DeriveError make_error(ErrorKind kind, std::string message)
{
    return DeriveError{kind, std::move(message)};
}

/// Throw the exception type matching error.kind.
[[noreturn]] void raise(const DeriveError& error);

/// Return the value of a successful result or throw its error.
template <typename T>
T unwrap(Result<T> result)
{
    if (!result.ok())
        raise(result.error());
    return result.take();
}

} // namespace avroinfer
