#include "CopyResult.hpp"
#include <algorithm>

SliceResult SliceResult::success(const SliceRange& range) {
    SliceResult result;
    result.index = range.index;
    result.bytes_copied = range.length();
    result.offset_reached = range.end;
    return result;
}

SliceResult SliceResult::failure(const SliceRange& range, int64_t bytes_copied, ErrorKind error,
                                 int sys_errno, const std::string& reason) {
    SliceResult result;
    result.index = range.index;
    result.bytes_copied = bytes_copied;
    result.outcome = Outcome::Failure;
    result.error = error;
    result.offset_reached = range.start + bytes_copied;
    result.sys_errno = sys_errno;
    result.reason = reason;
    return result;
}

SliceResult SliceResult::cancelled(const SliceRange& range) {
    return failure(range, 0, ErrorKind::Cancelled, 0, "not started after an earlier slice failed");
}

json SliceResult::to_json() const {
    json out;
    out["index"] = index;
    out["bytes_copied"] = bytes_copied;
    out["outcome"] = ok() ? "success" : "failure";
    if (!ok()) {
        out["error"] = error_kind_name(error);
        out["offset"] = offset_reached;
        out["errno"] = sys_errno;
        out["reason"] = reason;
    }
    return out;
}

CopyRunResult CopyRunResult::assemble(int64_t file_size, std::vector<SliceResult> results) {
    std::sort(results.begin(), results.end(),
              [](const SliceResult& a, const SliceResult& b) { return a.index < b.index; });

    CopyRunResult run;
    run.file_size = file_size;
    for (const auto& r : results) {
        run.total_bytes_copied += r.bytes_copied;
        if (!r.ok()) {
            run.outcome = Outcome::Failure;
        }
    }
    run.slices = std::move(results);
    return run;
}

std::vector<SliceResult> CopyRunResult::failed_slices() const {
    std::vector<SliceResult> failed;
    for (const auto& r : slices) {
        if (!r.ok()) {
            failed.push_back(r);
        }
    }
    return failed;
}

json CopyRunResult::to_json() const {
    json out;
    out["file_size"] = file_size;
    out["total_bytes_copied"] = total_bytes_copied;
    out["outcome"] = ok() ? "success" : "failure";
    out["slices"] = json::array();
    for (const auto& r : slices) {
        out["slices"].push_back(r.to_json());
    }
    return out;
}
