#include "SliceCalculator.hpp"
#include "CopyError.hpp"
#include <algorithm>
#include <limits>
#include <string>

std::vector<SliceRange> SliceCalculator::plan(int64_t file_size, int slice_count) {
    if (file_size < 0) {
        throw CopyError(ErrorKind::InvalidPlan, "negative file size " + std::to_string(file_size));
    }
    if (slice_count <= 0) {
        throw CopyError(ErrorKind::InvalidPlan, "slice count must be at least 1, got " +
                                                    std::to_string(slice_count));
    }

    std::vector<SliceRange> slices;

    // Empty file still gets one slice so completion can be reported
    if (file_size == 0) {
        slices.emplace_back(0, 0, 0);
        return slices;
    }

    // No empty slices
    int64_t count = std::min(static_cast<int64_t>(slice_count), file_size);
    int64_t base = file_size / count;
    int64_t remainder = file_size % count;

    slices.reserve(static_cast<size_t>(count));
    int64_t offset = 0;
    for (int64_t i = 0; i < count; ++i) {
        int64_t length = base + (i < remainder ? 1 : 0);
        slices.emplace_back(static_cast<int>(i), offset, offset + length);
        offset += length;
    }
    return slices;
}

int SliceCalculator::slice_count_for_size(int64_t file_size, int64_t slice_size) {
    if (slice_size <= 0) {
        throw CopyError(ErrorKind::InvalidPlan, "slice size must be positive, got " +
                                                    std::to_string(slice_size));
    }
    if (file_size < 0) {
        throw CopyError(ErrorKind::InvalidPlan, "negative file size " + std::to_string(file_size));
    }
    int64_t count = file_size / slice_size + (file_size % slice_size != 0 ? 1 : 0);
    if (count > std::numeric_limits<int>::max()) {
        throw CopyError(ErrorKind::InvalidPlan, "slice size " + std::to_string(slice_size) +
                                                    " yields too many slices");
    }
    return static_cast<int>(std::max<int64_t>(count, 1));
}

std::vector<SliceRange> SliceCalculator::plan_by_size(int64_t file_size, int64_t slice_size) {
    return plan(file_size, slice_count_for_size(file_size, slice_size));
}
