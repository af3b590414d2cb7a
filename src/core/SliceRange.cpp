#include "SliceRange.hpp"

json SliceRange::to_json() const {
    return json{{"index", index}, {"start", start}, {"end", end}, {"length", length()}};
}

json plan_to_json(int64_t file_size, const std::vector<SliceRange>& slices) {
    json out;
    out["file_size"] = file_size;
    out["slice_count"] = slices.size();
    out["slices"] = json::array();
    for (const auto& slice : slices) {
        out["slices"].push_back(slice.to_json());
    }
    return out;
}
