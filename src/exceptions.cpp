#include "avroinfer/exceptions.hpp"
#include "avroinfer/result.hpp"

namespace avroinfer
{

std::string to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::InvalidName:
        return "InvalidNameError";
    case ErrorKind::Range:
        return "RangeError";
    case ErrorKind::TypeConflict:
        return "TypeConflictError";
    case ErrorKind::InvalidStructure:
        return "InvalidStructureError";
    case ErrorKind::NoSchemaDerived:
        return "NoSchemaDerivedError";
    case ErrorKind::Parse:
        return "ParseError";
    case ErrorKind::DepthLimit:
        return "DepthLimitError";
    }
    return "Error";
}

void raise(const DeriveError& error)
{
    switch (error.kind)
    {
    case ErrorKind::InvalidName:
        throw InvalidNameError(error.message);
    case ErrorKind::Range:
        throw RangeError(error.message);
    case ErrorKind::TypeConflict:
        throw TypeConflictError(error.message);
    case ErrorKind::InvalidStructure:
        throw InvalidStructureError(error.message);
    case ErrorKind::NoSchemaDerived:
        throw NoSchemaDerivedError(error.message);
    case ErrorKind::Parse:
        throw ParseError(error.message);
    case ErrorKind::DepthLimit:
        throw DepthLimitError(error.message);
    }
    throw DeriveFailure(error.kind, error.message);
}

} // namespace avroinfer
