#pragma once
#include "SliceRange.hpp"
#include <cstdint>
#include <vector>

class SliceCalculator {
public:
    // Splits [0, file_size) into slice_count contiguous ranges. The first
    // (file_size % slice_count) slices are one byte longer than the rest.
    // Throws CopyError(InvalidPlan) on a negative size or a count below 1.
    static std::vector<SliceRange> plan(int64_t file_size, int slice_count);

    static std::vector<SliceRange> plan_by_size(int64_t file_size, int64_t slice_size);
    static int slice_count_for_size(int64_t file_size, int64_t slice_size);
};
