#pragma once
#include <queue>
#include <vector>
#include <mutex>
#include <condition_variable>

// FIFO of slice indices shared by the worker threads.
class WorkQueue {
private:
    std::queue<int> slices;
    mutable std::mutex mtx;
    std::condition_variable cv;
    bool finished = false;
    bool cancelled = false;

public:
    void add_slice(int slice_index);
    bool get_slice(int& slice_index);
    void mark_finished();

    // Drops every queued slice and refuses new ones; returns the dropped indices.
    std::vector<int> cancel();
    bool is_cancelled() const;
    size_t size() const;
};
