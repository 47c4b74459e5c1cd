#include "onnx_env.hpp"

#ifdef GIGASTREAM_HAS_ONNX

#include <algorithm>

namespace gigastream::onnx {

Ort::Env& ort_env() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "gigastream");
    return env;
}

Ort::SessionOptions make_session_options(const std::string& device) {
    Ort::SessionOptions options;
    options.SetIntraOpNumThreads(1);
    if (device.rfind("cuda", 0) == 0) {
        OrtCUDAProviderOptions cuda_options{};
        const auto colon = device.find(':');
        if (colon != std::string::npos) {
            cuda_options.device_id = std::stoi(device.substr(colon + 1));
        }
        options.AppendExecutionProvider_CUDA(cuda_options);
    }
    return options;
}

std::vector<std::string> get_input_names(const Ort::Session& session) {
    Ort::AllocatorWithDefaultOptions allocator;
    const size_t count = session.GetInputCount();
    std::vector<std::string> names;
    names.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto name = session.GetInputNameAllocated(i, allocator);
        names.emplace_back(name ? name.get() : "");
    }
    return names;
}

std::vector<std::string> get_output_names(const Ort::Session& session) {
    Ort::AllocatorWithDefaultOptions allocator;
    const size_t count = session.GetOutputCount();
    std::vector<std::string> names;
    names.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto name = session.GetOutputNameAllocated(i, allocator);
        names.emplace_back(name ? name.get() : "");
    }
    return names;
}

std::vector<int64_t> get_input_shape(const Ort::Session& session, size_t index) {
    return session.GetInputTypeInfo(index).GetTensorTypeAndShapeInfo().GetShape();
}

bool has_name(const std::vector<std::string>& names, const std::string& needle) {
    return std::find(names.begin(), names.end(), needle) != names.end();
}

std::vector<const char*> as_c_names(const std::vector<std::string>& names) {
    std::vector<const char*> result;
    result.reserve(names.size());
    for (const auto& name : names) {
        result.push_back(name.c_str());
    }
    return result;
}

}

#endif
