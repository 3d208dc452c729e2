#include "thermal_error.h"

const char* errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:               return "None";
    case ErrorKind::UnsupportedVersion: return "UnsupportedVersion";
    case ErrorKind::MalformedBlock:     return "MalformedBlock";
    case ErrorKind::MissingField:       return "MissingField";
    case ErrorKind::InvalidParameter:   return "InvalidParameter";
    case ErrorKind::NumericDomainError: return "NumericDomainError";
    case ErrorKind::Io:                 return "Io";
    }
    return "Unknown";
}

std::string ThermalError::describe() const
{
    return std::string(errorKindName(kind_)) + ": " + what();
}
