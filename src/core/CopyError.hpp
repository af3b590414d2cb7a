#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    None,
    InvalidPlan,
    InvalidConfig,
    SourceUnreadable,
    DestUnwritable,
    ShortRead,
    IOFailure,
    Cancelled
};

const char* error_kind_name(ErrorKind kind);

// Thrown for failures detected before any worker starts.
class CopyError : public std::runtime_error {
private:
    ErrorKind kind_;

public:
    CopyError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }
};
