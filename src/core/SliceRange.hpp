#pragma once
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Half-open byte range [start, end) of the source assigned to one worker.
class SliceRange {
public:
    int index = 0;
    int64_t start = 0;
    int64_t end = 0;

    SliceRange() = default;
    SliceRange(int index, int64_t start, int64_t end) : index(index), start(start), end(end) {}

    int64_t length() const { return end - start; }
    bool empty() const { return start == end; }

    json to_json() const;

    bool operator==(const SliceRange& other) const {
        return index == other.index && start == other.start && end == other.end;
    }
    bool operator!=(const SliceRange& other) const { return !(*this == other); }
};

json plan_to_json(int64_t file_size, const std::vector<SliceRange>& slices);
