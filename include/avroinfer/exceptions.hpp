#pragma once
#include <stdexcept>
#include <string>

namespace avroinfer
{

/// Failure categories shared by exceptions and Result values.
enum class ErrorKind
{
    InvalidName,      ///< Empty field or record name
    Range,            ///< Integer literal outside 64 bits (strict mode)
    TypeConflict,     ///< Incompatible primitive/array types, no viable union
    InvalidStructure, ///< Record shapes that defeat union synthesis
    NoSchemaDerived,  ///< Every document of a batch failed
    Parse,            ///< Document text is not JSON
    DepthLimit        ///< Nesting deeper than the configured bound
};

std::string to_string(ErrorKind kind);

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Base of every failure the derivation engine reports.
struct DeriveFailure : public Error
{
    DeriveFailure(ErrorKind kind, const std::string& message) : Error(message), kind_(kind) {}

    ErrorKind kind() const
    {
        return kind_;
    }

  private:
    ErrorKind kind_;
};

struct InvalidNameError : public DeriveFailure
{
    explicit InvalidNameError(const std::string& message)
        : DeriveFailure(ErrorKind::InvalidName, message)
    {
    }
};

struct RangeError : public DeriveFailure
{
    explicit RangeError(const std::string& message) : DeriveFailure(ErrorKind::Range, message) {}
};

struct TypeConflictError : public DeriveFailure
{
    explicit TypeConflictError(const std::string& message)
        : DeriveFailure(ErrorKind::TypeConflict, message)
    {
    }
};

struct InvalidStructureError : public DeriveFailure
{
    explicit InvalidStructureError(const std::string& message)
        : DeriveFailure(ErrorKind::InvalidStructure, message)
    {
    }
};

struct NoSchemaDerivedError : public DeriveFailure
{
    explicit NoSchemaDerivedError(const std::string& message)
        : DeriveFailure(ErrorKind::NoSchemaDerived, message)
    {
    }
};

struct ParseError : public DeriveFailure
{
    explicit ParseError(const std::string& message) : DeriveFailure(ErrorKind::Parse, message) {}
};

struct DepthLimitError : public DeriveFailure
{
    explicit DepthLimitError(const std::string& message)
        : DeriveFailure(ErrorKind::DepthLimit, message)
    {
    }
};

/// A value does not conform to a rendered schema.
struct ValidationError : public Error
{
    using Error::Error;
};

} // namespace avroinfer
