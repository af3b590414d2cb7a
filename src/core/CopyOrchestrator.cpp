#include "CopyOrchestrator.hpp"
#include "CopyError.hpp"
#include "SliceCalculator.hpp"
#include "../copy/ProgressAggregator.hpp"
#include "../copy/SliceCopier.hpp"
#include "../copy/WorkQueue.hpp"
#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <iostream>
#include <mutex>
#include <thread>

namespace {

// Joins the workers on every exit from the copy. When the copy is abandoned
// by an exception, queued slices are dropped first so only in-flight ones finish.
class WorkerPoolGuard {
private:
    std::vector<std::thread>& workers;
    WorkQueue& work_queue;
    bool joined = false;

public:
    WorkerPoolGuard(std::vector<std::thread>& workers, WorkQueue& work_queue)
        : workers(workers), work_queue(work_queue) {}

    ~WorkerPoolGuard() {
        if (!joined) {
            work_queue.cancel();
            join_all();
        }
    }

    WorkerPoolGuard(const WorkerPoolGuard&) = delete;
    WorkerPoolGuard& operator=(const WorkerPoolGuard&) = delete;

    void join_all() {
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        joined = true;
    }
};

} // namespace

void CopyOrchestrator::validate(const CopyOptions& options) {
    if (options.concurrency < 1) {
        throw CopyError(ErrorKind::InvalidConfig, "concurrency limit must be at least 1, got " +
                                                      std::to_string(options.concurrency));
    }
    if (options.chunk_size == 0) {
        throw CopyError(ErrorKind::InvalidConfig, "chunk size must be positive");
    }
    if (options.progress_interval.count() <= 0) {
        throw CopyError(ErrorKind::InvalidConfig, "progress interval must be positive");
    }
    if (options.slice_size < 0) {
        throw CopyError(ErrorKind::InvalidPlan, "slice size must be positive, got " +
                                                    std::to_string(options.slice_size));
    }
    if (options.slice_size == 0 && options.slice_count < 1) {
        throw CopyError(ErrorKind::InvalidPlan, "slice count must be at least 1, got " +
                                                    std::to_string(options.slice_count));
    }
}

std::vector<SliceRange> CopyOrchestrator::plan_slices(int64_t file_size, const CopyOptions& options) {
    if (options.slice_size > 0) {
        return SliceCalculator::plan_by_size(file_size, options.slice_size);
    }
    return SliceCalculator::plan(file_size, options.slice_count);
}

CopyRunResult CopyOrchestrator::run(const std::string& source_path, const std::string& dest_path,
                                    const CopyOptions& options, const ProgressCallback& on_progress) {
    validate(options);

    auto source = FileHandle::open_source(source_path);
    int64_t file_size = source->size();
    if (file_size < 0) {
        throw CopyError(ErrorKind::SourceUnreadable,
                        "cannot determine size of " + source_path + ": " + strerror(errno));
    }

    // Reject a bad plan before the destination is truncated
    plan_slices(file_size, options);

    // Truncating the destination would destroy the source
    if (source->same_file(dest_path)) {
        throw CopyError(ErrorKind::DestUnwritable, dest_path + " is the same file as the source");
    }

    auto dest = FileHandle::open_destination(dest_path, static_cast<mode_t>(options.dest_mode));

    return copy_planned(*source, *dest, file_size, options, on_progress);
}

CopyRunResult CopyOrchestrator::run(FileHandle& source, FileHandle& dest,
                                    const CopyOptions& options, const ProgressCallback& on_progress) {
    validate(options);

    int64_t file_size = source.size();
    if (file_size < 0) {
        throw CopyError(ErrorKind::SourceUnreadable,
                        "cannot determine size of " + source.path() + ": " + strerror(errno));
    }

    return copy_planned(source, dest, file_size, options, on_progress);
}

CopyRunResult CopyOrchestrator::copy_planned(FileHandle& source, FileHandle& dest, int64_t file_size,
                                             const CopyOptions& options,
                                             const ProgressCallback& on_progress) {
    std::vector<SliceRange> slices = plan_slices(file_size, options);

    // Every worker writes at its own offsets, so the file must already have its final size
    if (dest.resize(file_size) != 0) {
        throw CopyError(ErrorKind::DestUnwritable,
                        "cannot extend " + dest.path() + " to " + std::to_string(file_size) +
                            " bytes: " + strerror(errno));
    }

    const int total_slices = static_cast<int>(slices.size());
    ProgressAggregator progress(slices);
    WorkQueue work_queue;

    // FIFO by slice index
    for (const auto& slice : slices) {
        work_queue.add_slice(slice.index);
    }
    work_queue.mark_finished();

    std::vector<SliceResult> results(slices.size());
    std::vector<char> recorded(slices.size(), 0);
    std::mutex results_mtx;

    ResultSink on_result = [&](const SliceResult& result) {
        std::lock_guard<std::mutex> lock(results_mtx);
        results[result.index] = result;
        recorded[result.index] = 1;

        if (!result.ok()) {
            std::cerr << "Slice " << result.index << " failed at offset " << result.offset_reached
                      << " (" << error_kind_name(result.error) << "): " << result.reason << std::endl;
            if (options.cancel_pending_on_failure && !work_queue.is_cancelled()) {
                std::vector<int> dropped = work_queue.cancel();
                if (!dropped.empty()) {
                    std::cerr << "Cancelled " << dropped.size() << " pending slices" << std::endl;
                }
            }
        }
    };

    // Start worker threads
    const int num_workers = std::min(options.concurrency, total_slices);
    std::mutex done_mtx;
    std::condition_variable done_cv;
    int workers_done = 0;

    std::vector<std::thread> workers;
    workers.reserve(num_workers);
    WorkerPoolGuard guard(workers, work_queue);
    for (int i = 0; i < num_workers; ++i) {
        workers.emplace_back([&]() {
            SliceCopier::copy_worker(source, dest, slices, options.chunk_size, work_queue, progress,
                                     on_result);
            std::lock_guard<std::mutex> lock(done_mtx);
            ++workers_done;
            done_cv.notify_all();
        });
    }

    // Report progress on this thread until every worker has exited
    {
        std::unique_lock<std::mutex> lock(done_mtx);
        while (!done_cv.wait_for(lock, options.progress_interval,
                                 [&] { return workers_done == num_workers; })) {
            if (on_progress) {
                lock.unlock();
                on_progress(progress.bytes_copied(), progress.total());
                lock.lock();
            }
        }
    }

    guard.join_all();

    if (on_progress) {
        on_progress(progress.bytes_copied(), progress.total());
    }

    // Slices dropped from the queue never ran
    for (int i = 0; i < total_slices; ++i) {
        if (!recorded[i]) {
            results[i] = SliceResult::cancelled(slices[i]);
        }
    }

    return CopyRunResult::assemble(file_size, std::move(results));
}
