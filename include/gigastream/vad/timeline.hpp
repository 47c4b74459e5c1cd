#pragma once

#include <optional>
#include <vector>

namespace gigastream {
namespace vad {

struct Segment {
    double start = 0.0;
    double end = 0.0;
    std::optional<double> score;

    double duration() const { return end - start; }
};

class Timeline {
public:
    Timeline() = default;
    explicit Timeline(std::vector<Segment> segments);

    void add(Segment segment);
    const std::vector<Segment>& segments() const;
    bool empty() const;

    // Time-ordered union of overlapping or touching segments. A merged
    // segment keeps the highest score among its members.
    std::vector<Segment> support() const;

private:
    std::vector<Segment> segments_;
};

}
}
