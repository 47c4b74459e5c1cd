#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace gigastream {
namespace stream {

struct TranscriptionResult {
    std::string text;
    std::string start_time;
    std::string end_time;
    std::string duration;
    bool is_final = false;

    double start_sec = 0.0;
    double end_sec = 0.0;
    double duration_sec = 0.0;
};

using ResultCallback = std::function<void(const TranscriptionResult&)>;

// Renders MM:SS:cc, or HH:MM:SS:cc from one hour on. Input is rounded to
// centiseconds first.
std::string format_time(double seconds);

TranscriptionResult make_result(std::string text,
                                double start_sec,
                                double end_sec,
                                bool is_final);

nlohmann::json to_json(const TranscriptionResult& result);
nlohmann::json to_json(const std::vector<TranscriptionResult>& results);

class ResultSink {
public:
    explicit ResultSink(ResultCallback callback = {});

    void emit(const TranscriptionResult& result);

    std::vector<TranscriptionResult> interim_results() const;
    std::vector<TranscriptionResult> final_results() const;
    void clear_interim();

private:
    ResultCallback callback_;
    mutable std::mutex mutex_;
    std::vector<TranscriptionResult> interim_;
    std::vector<TranscriptionResult> final_;
};

}
}
