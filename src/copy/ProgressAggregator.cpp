#include "ProgressAggregator.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

ProgressAggregator::ProgressAggregator(const std::vector<SliceRange>& slices)
    : copied(std::make_unique<std::atomic<int64_t>[]>(slices.size())),
      reported(std::make_unique<std::atomic<bool>[]>(slices.size())),
      total_bytes(0),
      total_slices(static_cast<int>(slices.size())) {
    slice_lengths.resize(slices.size());
    for (const auto& slice : slices) {
        if (slice.index < 0 || slice.index >= total_slices) {
            throw std::invalid_argument("Slice index " + std::to_string(slice.index) + " out of range");
        }
        slice_lengths[slice.index] = slice.length();
        total_bytes += slice.length();
    }
    for (int i = 0; i < total_slices; ++i) {
        copied[i].store(0, std::memory_order_relaxed);
        reported[i].store(false, std::memory_order_relaxed);
    }
}

void ProgressAggregator::record(const ProgressEvent& event) {
    if (event.index < 0 || event.index >= total_slices) {
        throw std::out_of_range("Progress event for unknown slice " + std::to_string(event.index));
    }

    std::atomic<int64_t>& counter = copied[event.index];
    int64_t current = counter.load(std::memory_order_relaxed);
    while (current < event.bytes_copied &&
           !counter.compare_exchange_weak(current, event.bytes_copied, std::memory_order_relaxed)) {
    }

    if (event.bytes_copied >= slice_lengths[event.index] &&
        !reported[event.index].exchange(true, std::memory_order_acq_rel)) {
        completed.fetch_add(1, std::memory_order_acq_rel);
    }
}

int64_t ProgressAggregator::bytes_copied() const {
    int64_t sum = 0;
    for (int i = 0; i < total_slices; ++i) {
        sum += copied[i].load(std::memory_order_relaxed);
    }
    return sum;
}

double ProgressAggregator::overall_fraction() const {
    if (is_complete()) {
        return 1.0;
    }
    if (total_bytes == 0) {
        return 0.0;
    }
    double fraction = static_cast<double>(bytes_copied()) / static_cast<double>(total_bytes);
    // Rounding must not report completion early
    return std::fmin(fraction, std::nextafter(1.0, 0.0));
}

bool ProgressAggregator::is_slice_complete(int index) const {
    if (index < 0 || index >= total_slices) {
        return false;
    }
    return reported[index].load(std::memory_order_acquire);
}

bool ProgressAggregator::is_complete() const {
    return completed.load(std::memory_order_acquire) == total_slices;
}

int ProgressAggregator::completed_count() const {
    return completed.load(std::memory_order_acquire);
}
