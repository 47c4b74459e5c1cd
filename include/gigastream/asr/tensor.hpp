#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gigastream {
namespace asr {

enum class DType {
    Float32,
    Int64
};

// Dense row-major tensor. Float data lives in `values`, integer data in
// `indices`; only the member matching `dtype` is populated.
struct Tensor {
    DType dtype = DType::Float32;
    std::vector<int64_t> shape;
    std::vector<float> values;
    std::vector<int64_t> indices;
    std::string device = "cpu";

    static Tensor floats(std::vector<float> data, std::vector<int64_t> shape);
    static Tensor ints(std::vector<int64_t> data, std::vector<int64_t> shape);

    size_t rank() const;
    int64_t dim(size_t axis) const;
    size_t numel() const;
    Tensor to(const std::string& target_device) const;
};

std::string shape_to_string(const std::vector<int64_t>& shape);

}
}
