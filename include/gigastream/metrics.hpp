#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gigastream {

class Metrics {
public:
    static Metrics& instance();

    void increment_chunks_appended();
    void add_evicted_samples(uint64_t samples);
    void increment_vad_fallback();
    void increment_result(const std::string& kind);
    void observe_latency(const std::string& operation, double seconds);

    uint64_t chunks_appended() const;
    uint64_t evicted_samples() const;
    uint64_t vad_fallbacks() const;
    uint64_t results(const std::string& kind) const;

    std::string render_prometheus() const;
    void reset();

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(const std::string& operation);

    mutable std::mutex mutex_;
    uint64_t chunks_appended_ = 0;
    uint64_t evicted_samples_ = 0;
    uint64_t vad_fallbacks_ = 0;
    std::map<std::string, uint64_t> results_;
    std::unordered_map<std::string, HistogramSeries> latency_histograms_;
    std::vector<double> histogram_bounds_;
};

}
