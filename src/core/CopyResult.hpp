#pragma once
#include "CopyError.hpp"
#include "SliceRange.hpp"
#include <cstdint>
#include <string>
#include <vector>

enum class Outcome { Success, Failure };

class SliceResult {
public:
    int index = 0;
    int64_t bytes_copied = 0;
    Outcome outcome = Outcome::Success;

    // Failure details, meaningful only when outcome == Failure
    ErrorKind error = ErrorKind::None;
    int64_t offset_reached = 0;
    int sys_errno = 0;
    std::string reason;

    static SliceResult success(const SliceRange& range);
    static SliceResult failure(const SliceRange& range, int64_t bytes_copied, ErrorKind error,
                               int sys_errno, const std::string& reason);
    static SliceResult cancelled(const SliceRange& range);

    bool ok() const { return outcome == Outcome::Success; }
    json to_json() const;
};

class CopyRunResult {
public:
    int64_t file_size = 0;
    int64_t total_bytes_copied = 0;
    std::vector<SliceResult> slices; // ordered by index
    Outcome outcome = Outcome::Success;

    static CopyRunResult assemble(int64_t file_size, std::vector<SliceResult> results);

    bool ok() const { return outcome == Outcome::Success; }
    std::vector<SliceResult> failed_slices() const;
    json to_json() const;
};
