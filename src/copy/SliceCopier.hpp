#pragma once
#include "../core/SliceRange.hpp"
#include "../core/CopyResult.hpp"
#include "../io/FileHandle.hpp"
#include "ProgressAggregator.hpp"
#include "WorkQueue.hpp"
#include <cstddef>
#include <functional>
#include <vector>

using ProgressSink = std::function<void(const ProgressEvent&)>;
using ResultSink = std::function<void(const SliceResult&)>;

class SliceCopier {
public:
    /**
     * Copy [range.start, range.end) from source to the same offsets in dest.
     * Never writes outside the range. Stops at the first error without retrying.
     * @param sink Called after every chunk with the cumulative byte count
     * @return Success, or Failure with ShortRead / IOFailure and the offset reached
     */
    static SliceResult copy_slice(FileHandle& source, FileHandle& dest, const SliceRange& range,
                                  const ProgressSink& sink, size_t chunk_size);

    // Pulls slice indices until the queue is drained or cancelled.
    static void copy_worker(FileHandle& source, FileHandle& dest,
                            const std::vector<SliceRange>& slices, size_t chunk_size,
                            WorkQueue& work_queue, ProgressAggregator& progress,
                            const ResultSink& on_result);
};
