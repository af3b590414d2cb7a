#pragma once
#include "Config.hpp"
#include "CopyResult.hpp"
#include "SliceRange.hpp"
#include "../io/FileHandle.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

struct CopyOptions {
    int slice_count = Config::DEFAULT_PARTS;
    int64_t slice_size = 0; // overrides slice_count when positive
    int concurrency = Config::DEFAULT_WORKERS;
    size_t chunk_size = Config::CHUNK_SIZE;
    bool cancel_pending_on_failure = true;
    std::chrono::milliseconds progress_interval{Config::PROGRESS_INTERVAL_MS};
    unsigned dest_mode = Config::DEST_FILE_MODE;
};

// (bytes copied so far, total bytes); invoked on the thread that called run()
using ProgressCallback = std::function<void(int64_t, int64_t)>;

class CopyOrchestrator {
public:
    // Throws CopyError for invalid options or an unreadable source or
    // unwritable destination. Per-slice failures are reported in the result.
    static CopyRunResult run(const std::string& source_path, const std::string& dest_path,
                             const CopyOptions& options, const ProgressCallback& on_progress = nullptr);

    static CopyRunResult run(FileHandle& source, FileHandle& dest,
                             const CopyOptions& options, const ProgressCallback& on_progress = nullptr);

    static void validate(const CopyOptions& options);
    static std::vector<SliceRange> plan_slices(int64_t file_size, const CopyOptions& options);

private:
    // file_size is the size measured once when the source was opened
    static CopyRunResult copy_planned(FileHandle& source, FileHandle& dest, int64_t file_size,
                                      const CopyOptions& options, const ProgressCallback& on_progress);
};
