#include "gigastream/vad/timeline.hpp"

#include <algorithm>

namespace gigastream {
namespace vad {

Timeline::Timeline(std::vector<Segment> segments)
    : segments_(std::move(segments)) {}

void Timeline::add(Segment segment) {
    segments_.push_back(segment);
}

const std::vector<Segment>& Timeline::segments() const {
    return segments_;
}

bool Timeline::empty() const {
    return segments_.empty();
}

std::vector<Segment> Timeline::support() const {
    std::vector<Segment> sorted;
    sorted.reserve(segments_.size());
    for (const auto& segment : segments_) {
        if (segment.end > segment.start) {
            sorted.push_back(segment);
        }
    }
    std::sort(sorted.begin(), sorted.end(), [](const Segment& a, const Segment& b) {
        return a.start < b.start || (a.start == b.start && a.end < b.end);
    });

    std::vector<Segment> merged;
    for (const auto& segment : sorted) {
        if (merged.empty() || segment.start > merged.back().end) {
            merged.push_back(segment);
            continue;
        }
        auto& last = merged.back();
        last.end = std::max(last.end, segment.end);
        if (segment.score) {
            last.score = last.score ? std::max(*last.score, *segment.score) : *segment.score;
        }
    }
    return merged;
}

}
}
