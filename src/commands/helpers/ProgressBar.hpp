#pragma once
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

// Terminal progress line: "copied/total  (pct%)  [=====>    ]  ETA 0:12"
class ProgressBar {
private:
    int64_t total_bytes;
    std::ostream& out;
    std::chrono::steady_clock::time_point start_time;
    bool finished = false;

public:
    explicit ProgressBar(int64_t total, std::ostream& out = std::cerr);

    void update(int64_t copied);
    void finish(int64_t copied);

    std::string render(int64_t copied, double elapsed_seconds) const;
    static std::string format_bytes(double bytes);
};
