#pragma once
#include "../core/SliceRange.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

struct ProgressEvent {
    int index;
    int64_t bytes_copied; // cumulative for this slice
};

// Per-slice atomic counters. Workers call record(); any thread may read.
// A counter only moves forward, so the overall fraction never decreases.
class ProgressAggregator {
private:
    std::vector<int64_t> slice_lengths;
    std::unique_ptr<std::atomic<int64_t>[]> copied;
    std::unique_ptr<std::atomic<bool>[]> reported;
    std::atomic<int> completed{0};
    int64_t total_bytes;
    int total_slices;

public:
    explicit ProgressAggregator(const std::vector<SliceRange>& slices);

    void record(const ProgressEvent& event);

    int64_t bytes_copied() const;
    int64_t total() const { return total_bytes; }
    double overall_fraction() const;

    bool is_slice_complete(int index) const;
    bool is_complete() const;
    int completed_count() const;
    int slice_count() const { return total_slices; }
};
