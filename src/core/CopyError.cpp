#include "CopyError.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::InvalidPlan: return "InvalidPlan";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
        case ErrorKind::SourceUnreadable: return "SourceUnreadable";
        case ErrorKind::DestUnwritable: return "DestUnwritable";
        case ErrorKind::ShortRead: return "ShortRead";
        case ErrorKind::IOFailure: return "IOFailure";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

CopyError::CopyError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message), kind_(kind) {}
