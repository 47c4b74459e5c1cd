#pragma once

#include <memory>
#include <string>
#include <vector>

#include "gigastream/stream/options.hpp"
#include "gigastream/vad/oracle.hpp"

namespace gigastream {
namespace vad {

class SpeechDetector {
public:
    virtual ~SpeechDetector() = default;

    virtual bool is_speech(const std::vector<float>& audio) = 0;
    // Drops any accumulated detection context.
    virtual void reset() {}
    virtual std::string name() const = 0;
};

double mean_square(const std::vector<float>& audio);

class EnergyDetector : public SpeechDetector {
public:
    explicit EnergyDetector(double threshold);

    bool is_speech(const std::vector<float>& audio) override;
    std::string name() const override;

    double threshold() const;

private:
    double threshold_;
};

class VadDetector : public SpeechDetector {
public:
    VadDetector(std::shared_ptr<VadOracle> oracle,
                int sample_rate,
                size_t window_samples,
                double tail_sec,
                double vad_threshold,
                double energy_threshold);

    bool is_speech(const std::vector<float>& audio) override;
    void reset() override;
    std::string name() const override;

    size_t window_samples() const;
    size_t buffered_samples() const;

private:
    bool classify_window(const std::vector<float>& window) const;

    std::shared_ptr<VadOracle> oracle_;
    int sample_rate_;
    size_t window_samples_;
    double tail_sec_;
    double vad_threshold_;
    EnergyDetector fallback_;
    std::vector<std::vector<float>> window_;
    size_t buffered_ = 0;
};

// Wraps a gated detector and reports speech for every sub-chunk.
class ForcedSpeechDetector : public SpeechDetector {
public:
    explicit ForcedSpeechDetector(std::unique_ptr<SpeechDetector> inner);

    bool is_speech(const std::vector<float>& audio) override;
    void reset() override;
    std::string name() const override;

private:
    std::unique_ptr<SpeechDetector> inner_;
};

std::unique_ptr<SpeechDetector> make_detector(const stream::StreamOptions& options,
                                              std::shared_ptr<VadOracle> oracle);

}
}
