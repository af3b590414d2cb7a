#include "WorkQueue.hpp"

void WorkQueue::add_slice(int slice_index) {
    std::lock_guard<std::mutex> lock(mtx);
    if (cancelled) {
        return;
    }
    slices.push(slice_index);
    cv.notify_one();
}

bool WorkQueue::get_slice(int& slice_index) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return !slices.empty() || finished || cancelled; });

    if (slices.empty()) {
        return false; // No more work
    }

    slice_index = slices.front();
    slices.pop();
    return true;
}

void WorkQueue::mark_finished() {
    std::lock_guard<std::mutex> lock(mtx);
    finished = true;
    cv.notify_all();
}

std::vector<int> WorkQueue::cancel() {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<int> dropped;
    while (!slices.empty()) {
        dropped.push_back(slices.front());
        slices.pop();
    }
    cancelled = true;
    cv.notify_all();
    return dropped;
}

bool WorkQueue::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mtx);
    return cancelled;
}

size_t WorkQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return slices.size();
}
