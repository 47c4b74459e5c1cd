#pragma once

#ifdef GIGASTREAM_HAS_ONNX

#include <cstdint>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

namespace gigastream::onnx {

Ort::Env& ort_env();

// "cpu", "cuda" or "cuda:<id>".
Ort::SessionOptions make_session_options(const std::string& device);

std::vector<std::string> get_input_names(const Ort::Session& session);
std::vector<std::string> get_output_names(const Ort::Session& session);
std::vector<int64_t> get_input_shape(const Ort::Session& session, size_t index);
bool has_name(const std::vector<std::string>& names, const std::string& needle);

std::vector<const char*> as_c_names(const std::vector<std::string>& names);

}

#endif
