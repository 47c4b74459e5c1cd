#include "gigastream/stream/results.hpp"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>

#include "gigastream/logging.hpp"
#include "gigastream/metrics.hpp"

namespace gigastream::stream {

std::string format_time(double seconds) {
    if (seconds < 0.0) {
        seconds = 0.0;
    }
    const auto centis = static_cast<int64_t>(std::llround(seconds * 100.0));
    const int64_t full_seconds = centis / 100;
    const int64_t hundredths = centis % 100;
    const int64_t hours = full_seconds / 3600;
    const int64_t minutes = (full_seconds % 3600) / 60;
    const int64_t secs = full_seconds % 60;

    std::ostringstream out;
    out << std::setfill('0');
    if (hours > 0) {
        out << std::setw(2) << hours << ':';
    }
    out << std::setw(2) << minutes << ':'
        << std::setw(2) << secs << ':'
        << std::setw(2) << hundredths;
    return out.str();
}

TranscriptionResult make_result(std::string text,
                                double start_sec,
                                double end_sec,
                                bool is_final) {
    TranscriptionResult result;
    result.text = std::move(text);
    result.start_sec = start_sec;
    result.end_sec = end_sec;
    result.duration_sec = end_sec - start_sec;
    result.start_time = format_time(start_sec);
    result.end_time = format_time(end_sec);
    result.duration = format_time(result.duration_sec);
    result.is_final = is_final;
    return result;
}

nlohmann::json to_json(const TranscriptionResult& result) {
    return nlohmann::json{
        {"text", result.text},
        {"start_time", result.start_time},
        {"end_time", result.end_time},
        {"duration", result.duration},
        {"is_final", result.is_final},
    };
}

nlohmann::json to_json(const std::vector<TranscriptionResult>& results) {
    auto items = nlohmann::json::array();
    for (const auto& result : results) {
        items.push_back(to_json(result));
    }
    return items;
}

ResultSink::ResultSink(ResultCallback callback)
    : callback_(std::move(callback)) {}

void ResultSink::emit(const TranscriptionResult& result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.is_final) {
            final_.push_back(result);
        } else {
            interim_.push_back(result);
        }
    }
    Metrics::instance().increment_result(result.is_final ? "final" : "interim");
    logging::debug(
        result.is_final ? "Final result" : "Interim result",
        {kv("text", result.text),
         kv("start", result.start_time),
         kv("duration", result.duration)});
    if (!callback_) {
        return;
    }
    try {
        callback_(result);
    } catch (const std::exception& ex) {
        logging::error(
            "Result callback failed",
            {kv("error", ex.what()),
             kv("is_final", result.is_final)});
    }
}

std::vector<TranscriptionResult> ResultSink::interim_results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interim_;
}

std::vector<TranscriptionResult> ResultSink::final_results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return final_;
}

void ResultSink::clear_interim() {
    std::lock_guard<std::mutex> lock(mutex_);
    interim_.clear();
}

}
