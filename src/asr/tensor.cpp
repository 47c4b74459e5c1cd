#include "gigastream/asr/tensor.hpp"

#include <sstream>
#include <stdexcept>

namespace gigastream::asr {

namespace {

size_t element_count(const std::vector<int64_t>& shape) {
    size_t count = 1;
    for (auto dim : shape) {
        if (dim < 0) {
            throw std::invalid_argument("tensor dimensions must not be negative");
        }
        count *= static_cast<size_t>(dim);
    }
    return count;
}

}

Tensor Tensor::floats(std::vector<float> data, std::vector<int64_t> shape) {
    if (element_count(shape) != data.size()) {
        throw std::invalid_argument("tensor data does not match shape " +
                                    shape_to_string(shape));
    }
    Tensor tensor;
    tensor.dtype = DType::Float32;
    tensor.shape = std::move(shape);
    tensor.values = std::move(data);
    return tensor;
}

Tensor Tensor::ints(std::vector<int64_t> data, std::vector<int64_t> shape) {
    if (element_count(shape) != data.size()) {
        throw std::invalid_argument("tensor data does not match shape " +
                                    shape_to_string(shape));
    }
    Tensor tensor;
    tensor.dtype = DType::Int64;
    tensor.shape = std::move(shape);
    tensor.indices = std::move(data);
    return tensor;
}

size_t Tensor::rank() const {
    return shape.size();
}

int64_t Tensor::dim(size_t axis) const {
    if (axis >= shape.size()) {
        throw std::out_of_range("tensor axis out of range");
    }
    return shape[axis];
}

size_t Tensor::numel() const {
    return element_count(shape);
}

Tensor Tensor::to(const std::string& target_device) const {
    Tensor copy = *this;
    copy.device = target_device;
    return copy;
}

std::string shape_to_string(const std::vector<int64_t>& shape) {
    std::ostringstream out;
    out << '[';
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << shape[i];
    }
    out << ']';
    return out.str();
}

}
