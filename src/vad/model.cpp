#include "gigastream/vad/model.hpp"

#include <array>
#include <stdexcept>

#include "onnx_env.hpp"

namespace gigastream {
namespace vad {

namespace {

// Silero consumes 512-sample windows at 16 kHz and 256 at 8 kHz.
int window_for_rate(int sampling_rate) {
    return sampling_rate == 8000 ? 256 : 512;
}

}

#ifdef GIGASTREAM_HAS_ONNX

struct VadModel::Impl {
    Ort::Session session;
    std::vector<std::string> input_names;
    std::vector<std::string> output_names;
    int sampling_rate;
    bool has_sr;
    bool has_state;
    bool has_state_out;

    Impl(const std::filesystem::path& model_path, int sampling_rate_in, const std::string& device)
        : session(onnx::ort_env(), model_path.string().c_str(),
                  onnx::make_session_options(device)),
          input_names(onnx::get_input_names(session)),
          output_names(onnx::get_output_names(session)),
          sampling_rate(sampling_rate_in),
          has_sr(onnx::has_name(input_names, "sr")),
          has_state(onnx::has_name(input_names, "state")),
          has_state_out(onnx::has_name(output_names, "stateN")) {
        if (!onnx::has_name(input_names, "input")) {
            throw std::runtime_error("VAD model missing input node 'input'");
        }
        if (!onnx::has_name(output_names, "output")) {
            throw std::runtime_error("VAD model missing output node 'output'");
        }
    }
};

VadModel::VadModel(const std::filesystem::path& model_path,
                   int sampling_rate,
                   const std::string& device)
    : impl_(std::make_unique<Impl>(model_path, sampling_rate, device)) {}

VadModel::~VadModel() = default;

int VadModel::sampling_rate() const {
    return impl_->sampling_rate;
}

int VadModel::window_size_samples() const {
    return window_for_rate(impl_->sampling_rate);
}

std::vector<float> VadModel::initialize_state() const {
    if (!impl_->has_state) {
        return {};
    }
    return std::vector<float>(2 * 1 * 128, 0.0f);
}

float VadModel::get_speech_prob(const std::vector<float>& audio,
                                std::vector<float>* state) const {
    if (audio.empty()) {
        return 0.0f;
    }

    Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(
        OrtArenaAllocator, OrtMemTypeDefault);

    std::vector<int64_t> input_shape{1, static_cast<int64_t>(audio.size())};
    std::vector<Ort::Value> inputs;
    std::vector<const char*> input_names;
    inputs.reserve(3);
    input_names.reserve(3);
    input_names.push_back("input");
    inputs.emplace_back(Ort::Value::CreateTensor<float>(
        mem_info, const_cast<float*>(audio.data()),
        audio.size(), input_shape.data(), input_shape.size()));

    std::vector<int64_t> sr_shape{1};
    std::array<int64_t, 1> sr_value{impl_->sampling_rate};
    if (impl_->has_sr) {
        input_names.push_back("sr");
        inputs.emplace_back(Ort::Value::CreateTensor<int64_t>(
            mem_info, sr_value.data(), sr_value.size(),
            sr_shape.data(), sr_shape.size()));
    }

    std::vector<int64_t> state_shape{2, 1, 128};
    std::vector<float> local_state;
    if (impl_->has_state) {
        if (state && !state->empty()) {
            local_state = *state;
        } else {
            local_state = initialize_state();
        }
        input_names.push_back("state");
        inputs.emplace_back(Ort::Value::CreateTensor<float>(
            mem_info, local_state.data(), local_state.size(),
            state_shape.data(), state_shape.size()));
    }

    std::vector<const char*> output_names{"output"};
    if (impl_->has_state_out) {
        output_names.push_back("stateN");
    }

    auto outputs = impl_->session.Run(
        Ort::RunOptions{nullptr},
        input_names.data(), inputs.data(), inputs.size(),
        output_names.data(), output_names.size());

    float prob = 0.0f;
    if (!outputs.empty() && outputs[0].IsTensor()) {
        const auto* data = outputs[0].GetTensorData<float>();
        prob = data ? data[0] : 0.0f;
    }

    if (impl_->has_state_out && outputs.size() > 1 && outputs[1].IsTensor()) {
        const auto* data = outputs[1].GetTensorData<float>();
        const auto count = outputs[1].GetTensorTypeAndShapeInfo().GetElementCount();
        if (state && data && count > 0) {
            state->assign(data, data + count);
        }
    }

    return prob;
}

#else

struct VadModel::Impl {
    explicit Impl(int sampling_rate_in) : sampling_rate(sampling_rate_in) {}
    int sampling_rate;
};

VadModel::VadModel(const std::filesystem::path&, int sampling_rate, const std::string&)
    : impl_(std::make_unique<Impl>(sampling_rate)) {
    throw std::runtime_error("ONNX Runtime not enabled");
}

VadModel::~VadModel() = default;

int VadModel::sampling_rate() const {
    return impl_->sampling_rate;
}

int VadModel::window_size_samples() const {
    return window_for_rate(impl_->sampling_rate);
}

std::vector<float> VadModel::initialize_state() const {
    return {};
}

float VadModel::get_speech_prob(const std::vector<float>&,
                                std::vector<float>*) const {
    return 0.0f;
}

#endif

}
}
