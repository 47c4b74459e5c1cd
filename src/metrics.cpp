#include "gigastream/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace gigastream {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.005, 0.01, 0.025, 0.05, 0.075, 0.1, 0.25, 0.5,
                         0.75, 1.0, 2.5, 5.0, 7.5, 10.0};
}

void Metrics::increment_chunks_appended() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++chunks_appended_;
}

void Metrics::add_evicted_samples(uint64_t samples) {
    std::lock_guard<std::mutex> lock(mutex_);
    evicted_samples_ += samples;
}

void Metrics::increment_vad_fallback() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++vad_fallbacks_;
}

void Metrics::increment_result(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++results_[kind];
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& operation) {
    auto& series = latency_histograms_[operation];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_latency(const std::string& operation, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histogram_for(operation);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

uint64_t Metrics::chunks_appended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_appended_;
}

uint64_t Metrics::evicted_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_samples_;
}

uint64_t Metrics::vad_fallbacks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return vad_fallbacks_;
}

uint64_t Metrics::results(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = results_.find(kind);
    return it == results_.end() ? 0 : it->second;
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_appended_ = 0;
    evicted_samples_ = 0;
    vad_fallbacks_ = 0;
    results_.clear();
    latency_histograms_.clear();
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP audio_chunks_appended_total Audio chunks accepted by stream ingestors\n";
    out << "# TYPE audio_chunks_appended_total counter\n";
    out << "audio_chunks_appended_total " << chunks_appended_ << "\n";

    out << "# HELP audio_samples_evicted_total Samples dropped by buffer overflow\n";
    out << "# TYPE audio_samples_evicted_total counter\n";
    out << "audio_samples_evicted_total " << evicted_samples_ << "\n";

    out << "# HELP vad_fallbacks_total VAD calls answered by the energy detector\n";
    out << "# TYPE vad_fallbacks_total counter\n";
    out << "vad_fallbacks_total " << vad_fallbacks_ << "\n";

    out << "# HELP transcription_results_total Emitted transcription results\n";
    out << "# TYPE transcription_results_total counter\n";
    for (const auto& item : results_) {
        out << "transcription_results_total{kind=\"" << item.first << "\"} "
            << item.second << "\n";
    }

    out << "# HELP operation_latency_seconds Latency of blocking inference calls\n";
    out << "# TYPE operation_latency_seconds histogram\n";
    std::vector<std::string> operations;
    operations.reserve(latency_histograms_.size());
    for (const auto& item : latency_histograms_) {
        operations.push_back(item.first);
    }
    std::sort(operations.begin(), operations.end());
    for (const auto& operation : operations) {
        const auto& series = latency_histograms_.at(operation);
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "operation_latency_seconds_bucket{operation=\"" << operation
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "operation_latency_seconds_bucket{operation=\"" << operation
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "operation_latency_seconds_count{operation=\"" << operation << "\"} "
            << series.count << "\n";
        out << "operation_latency_seconds_sum{operation=\"" << operation << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}
