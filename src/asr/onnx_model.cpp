#include "gigastream/asr/onnx_model.hpp"

#include <stdexcept>

#include "onnx_env.hpp"

namespace gigastream {
namespace asr {

#ifdef GIGASTREAM_HAS_ONNX

namespace {

struct OnnxSession {
    Ort::Session session;
    std::vector<std::string> input_names;
    std::vector<std::string> output_names;

    OnnxSession(const std::filesystem::path& model_path,
                const std::string& device,
                size_t min_inputs,
                size_t min_outputs)
        : session(onnx::ort_env(), model_path.string().c_str(),
                  onnx::make_session_options(device)),
          input_names(onnx::get_input_names(session)),
          output_names(onnx::get_output_names(session)) {
        if (input_names.size() < min_inputs || output_names.size() < min_outputs) {
            throw std::runtime_error("ONNX model has unexpected signature: " +
                                     model_path.string());
        }
    }

    std::vector<Ort::Value> run(std::vector<Ort::Value>& inputs) {
        const auto in_names = onnx::as_c_names(input_names);
        const auto out_names = onnx::as_c_names(output_names);
        return session.Run(Ort::RunOptions{nullptr},
                           in_names.data(), inputs.data(), inputs.size(),
                           out_names.data(), out_names.size());
    }
};

Ort::MemoryInfo cpu_memory() {
    return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

Tensor float_output(Ort::Value& value) {
    const auto info = value.GetTensorTypeAndShapeInfo();
    const auto shape = info.GetShape();
    const auto count = info.GetElementCount();
    const auto* data = value.GetTensorData<float>();
    return Tensor::floats(std::vector<float>(data, data + count), shape);
}

Tensor int_output(Ort::Value& value) {
    const auto info = value.GetTensorTypeAndShapeInfo();
    const auto shape = info.GetShape();
    const auto count = info.GetElementCount();
    const auto* data = value.GetTensorData<int64_t>();
    return Tensor::ints(std::vector<int64_t>(data, data + count), shape);
}

}

struct OnnxEncoder::Impl {
    OnnxSession model;

    Impl(const std::filesystem::path& path, const std::string& device)
        : model(path, device, 2, 2) {}
};

OnnxEncoder::OnnxEncoder(const std::filesystem::path& model_path, const std::string& device)
    : model_path_(model_path),
      impl_(std::make_unique<Impl>(model_path, device)) {}

OnnxEncoder::~OnnxEncoder() = default;

EncoderOutput OnnxEncoder::encode(const Tensor& features, const Tensor& lengths) {
    auto mem_info = cpu_memory();
    auto feature_shape = features.shape;
    auto length_shape = lengths.shape;
    std::vector<Ort::Value> inputs;
    inputs.emplace_back(Ort::Value::CreateTensor<float>(
        mem_info, const_cast<float*>(features.values.data()), features.values.size(),
        feature_shape.data(), feature_shape.size()));
    inputs.emplace_back(Ort::Value::CreateTensor<int64_t>(
        mem_info, const_cast<int64_t*>(lengths.indices.data()), lengths.indices.size(),
        length_shape.data(), length_shape.size()));

    auto outputs = impl_->model.run(inputs);
    EncoderOutput result;
    result.encoded = float_output(outputs[0]);
    result.lengths = int_output(outputs[1]);
    return result;
}

void OnnxEncoder::to(const std::string& device) {
    impl_ = std::make_unique<Impl>(model_path_, device);
}

struct OnnxCtcHead::Impl {
    OnnxSession model;

    Impl(const std::filesystem::path& path, const std::string& device)
        : model(path, device, 1, 1) {}
};

OnnxCtcHead::OnnxCtcHead(const std::filesystem::path& model_path, const std::string& device)
    : model_path_(model_path),
      impl_(std::make_unique<Impl>(model_path, device)) {}

OnnxCtcHead::~OnnxCtcHead() = default;

Tensor OnnxCtcHead::log_probs(const Tensor& encoded) {
    auto mem_info = cpu_memory();
    auto shape = encoded.shape;
    std::vector<Ort::Value> inputs;
    inputs.emplace_back(Ort::Value::CreateTensor<float>(
        mem_info, const_cast<float*>(encoded.values.data()), encoded.values.size(),
        shape.data(), shape.size()));
    auto outputs = impl_->model.run(inputs);
    return float_output(outputs[0]);
}

void OnnxCtcHead::to(const std::string& device) {
    impl_ = std::make_unique<Impl>(model_path_, device);
}

struct OnnxRnntHead::Impl {
    OnnxSession decoder;
    OnnxSession joint;
    std::vector<int64_t> state_shape;
    size_t state_size = 0;

    Impl(const std::filesystem::path& decoder_path,
         const std::filesystem::path& joint_path,
         const std::string& device)
        : decoder(decoder_path, device, 3, 3),
          joint(joint_path, device, 2, 1),
          state_shape(onnx::get_input_shape(decoder.session, 1)) {
        state_size = 1;
        for (auto& dim : state_shape) {
            if (dim < 0) {
                dim = 1;
            }
            state_size *= static_cast<size_t>(dim);
        }
    }
};

OnnxRnntHead::OnnxRnntHead(const std::filesystem::path& decoder_path,
                           const std::filesystem::path& joint_path,
                           size_t vocabulary_size,
                           const std::string& device)
    : decoder_path_(decoder_path),
      joint_path_(joint_path),
      vocabulary_size_(vocabulary_size),
      impl_(std::make_unique<Impl>(decoder_path, joint_path, device)) {}

OnnxRnntHead::~OnnxRnntHead() = default;

int64_t OnnxRnntHead::blank_id() const {
    return static_cast<int64_t>(vocabulary_size_);
}

RnntState OnnxRnntHead::initial_state() const {
    RnntState state;
    state.hidden.assign(impl_->state_size, 0.0f);
    state.cell.assign(impl_->state_size, 0.0f);
    return state;
}

std::vector<float> OnnxRnntHead::predict(std::optional<int64_t> token, RnntState& state) {
    if (state.hidden.size() != impl_->state_size || state.cell.size() != impl_->state_size) {
        state = initial_state();
    }
    auto mem_info = cpu_memory();
    std::vector<int64_t> token_value{token.value_or(blank_id())};
    std::vector<int64_t> token_shape{1, 1};
    auto state_shape = impl_->state_shape;

    std::vector<Ort::Value> inputs;
    inputs.emplace_back(Ort::Value::CreateTensor<int64_t>(
        mem_info, token_value.data(), token_value.size(),
        token_shape.data(), token_shape.size()));
    inputs.emplace_back(Ort::Value::CreateTensor<float>(
        mem_info, state.hidden.data(), state.hidden.size(),
        state_shape.data(), state_shape.size()));
    inputs.emplace_back(Ort::Value::CreateTensor<float>(
        mem_info, state.cell.data(), state.cell.size(),
        state_shape.data(), state_shape.size()));

    auto outputs = impl_->decoder.run(inputs);
    auto prediction = float_output(outputs[0]);
    auto hidden = float_output(outputs[1]);
    auto cell = float_output(outputs[2]);
    state.hidden = std::move(hidden.values);
    state.cell = std::move(cell.values);
    return std::move(prediction.values);
}

std::vector<float> OnnxRnntHead::joint(const std::vector<float>& encoded_frame,
                                       const std::vector<float>& prediction) {
    auto mem_info = cpu_memory();
    std::vector<float> frame = encoded_frame;
    std::vector<float> pred = prediction;
    std::vector<int64_t> frame_shape{1, static_cast<int64_t>(frame.size()), 1};
    std::vector<int64_t> pred_shape{1, static_cast<int64_t>(pred.size()), 1};

    std::vector<Ort::Value> inputs;
    inputs.emplace_back(Ort::Value::CreateTensor<float>(
        mem_info, frame.data(), frame.size(), frame_shape.data(), frame_shape.size()));
    inputs.emplace_back(Ort::Value::CreateTensor<float>(
        mem_info, pred.data(), pred.size(), pred_shape.data(), pred_shape.size()));

    auto outputs = impl_->joint.run(inputs);
    return std::move(float_output(outputs[0]).values);
}

void OnnxRnntHead::to(const std::string& device) {
    impl_ = std::make_unique<Impl>(decoder_path_, joint_path_, device);
}

#else

struct OnnxEncoder::Impl {};
struct OnnxCtcHead::Impl {};
struct OnnxRnntHead::Impl {};

OnnxEncoder::OnnxEncoder(const std::filesystem::path& model_path, const std::string&)
    : model_path_(model_path) {
    throw std::runtime_error("ONNX Runtime not enabled");
}

OnnxEncoder::~OnnxEncoder() = default;

EncoderOutput OnnxEncoder::encode(const Tensor&, const Tensor&) {
    return {};
}

void OnnxEncoder::to(const std::string&) {}

OnnxCtcHead::OnnxCtcHead(const std::filesystem::path& model_path, const std::string&)
    : model_path_(model_path) {
    throw std::runtime_error("ONNX Runtime not enabled");
}

OnnxCtcHead::~OnnxCtcHead() = default;

Tensor OnnxCtcHead::log_probs(const Tensor&) {
    return {};
}

void OnnxCtcHead::to(const std::string&) {}

OnnxRnntHead::OnnxRnntHead(const std::filesystem::path& decoder_path,
                           const std::filesystem::path& joint_path,
                           size_t vocabulary_size,
                           const std::string&)
    : decoder_path_(decoder_path),
      joint_path_(joint_path),
      vocabulary_size_(vocabulary_size) {
    throw std::runtime_error("ONNX Runtime not enabled");
}

OnnxRnntHead::~OnnxRnntHead() = default;

int64_t OnnxRnntHead::blank_id() const {
    return static_cast<int64_t>(vocabulary_size_);
}

RnntState OnnxRnntHead::initial_state() const {
    return {};
}

std::vector<float> OnnxRnntHead::predict(std::optional<int64_t>, RnntState&) {
    return {};
}

std::vector<float> OnnxRnntHead::joint(const std::vector<float>&, const std::vector<float>&) {
    return {};
}

void OnnxRnntHead::to(const std::string&) {}

#endif

}
}
