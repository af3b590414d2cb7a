#include "SliceCopier.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <exception>
#include <string>

namespace {

std::string describe(const char* what, int64_t offset, int err) {
    std::string msg = std::string(what) + " at offset " + std::to_string(offset);
    if (err != 0) {
        msg += ": ";
        msg += strerror(err);
    }
    return msg;
}

} // namespace

SliceResult SliceCopier::copy_slice(FileHandle& source, FileHandle& dest, const SliceRange& range,
                                    const ProgressSink& sink, size_t chunk_size) {
    const int64_t length = range.length();

    if (length == 0) {
        if (sink) {
            sink(ProgressEvent{range.index, 0});
        }
        return SliceResult::success(range);
    }

    size_t buffer_size = static_cast<size_t>(std::min<int64_t>(static_cast<int64_t>(chunk_size), length));
    std::vector<uint8_t> buffer(buffer_size);
    int64_t copied = 0;

    while (copied < length) {
        size_t want = static_cast<size_t>(std::min<int64_t>(static_cast<int64_t>(buffer_size), length - copied));
        int64_t offset = range.start + copied;

        ssize_t got = source.read_at(buffer.data(), want, offset);
        if (got < 0) {
            int err = errno;
            return SliceResult::failure(range, copied, ErrorKind::IOFailure, err,
                                        describe("read failed", offset, err));
        }
        if (got == 0) {
            return SliceResult::failure(range, copied, ErrorKind::ShortRead, 0,
                                        describe("source ended early", offset, 0) + ", " +
                                            std::to_string(length - copied) + " bytes missing");
        }

        size_t written = 0;
        while (written < static_cast<size_t>(got)) {
            ssize_t n = dest.write_at(buffer.data() + written, static_cast<size_t>(got) - written,
                                      offset + static_cast<int64_t>(written));
            if (n < 0) {
                int err = errno;
                return SliceResult::failure(range, copied + static_cast<int64_t>(written),
                                            ErrorKind::IOFailure, err,
                                            describe("write failed", offset + static_cast<int64_t>(written), err));
            }
            if (n == 0) {
                return SliceResult::failure(range, copied + static_cast<int64_t>(written),
                                            ErrorKind::IOFailure, 0,
                                            describe("write made no progress", offset + static_cast<int64_t>(written), 0));
            }
            written += static_cast<size_t>(n);
        }

        copied += got;
        if (sink) {
            sink(ProgressEvent{range.index, copied});
        }
    }

    return SliceResult::success(range);
}

void SliceCopier::copy_worker(FileHandle& source, FileHandle& dest,
                              const std::vector<SliceRange>& slices, size_t chunk_size,
                              WorkQueue& work_queue, ProgressAggregator& progress,
                              const ResultSink& on_result) {
    ProgressSink sink = [&progress](const ProgressEvent& event) { progress.record(event); };

    while (true) {
        int slice_index;
        if (!work_queue.get_slice(slice_index)) {
            break; // No more work
        }

        const SliceRange& range = slices[slice_index];
        SliceResult result;
        try {
            result = copy_slice(source, dest, range, sink, chunk_size);
        } catch (const std::exception& e) {
            result = SliceResult::failure(range, 0, ErrorKind::IOFailure, 0, e.what());
        }
        on_result(result);
    }
}
