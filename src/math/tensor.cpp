#include "../../include/math/tensor.hpp"
#include <numeric>
#include <sstream>
#include <algorithm>
#include <functional>

namespace cpp_tagger {
namespace math {

// =============================================================================
// Shape Helpers
// =============================================================================

Tensor::size_type Tensor::compute_size(const Shape& shape) {
    if (shape.empty()) {
        return 0;
    }
    return std::accumulate(shape.begin(), shape.end(),
                           size_type{1}, std::multiplies<size_type>{});
}

void Tensor::validate_shape(const Shape& shape) {
    if (shape.size() > 2) {
        throw std::invalid_argument(
            "Tensor supports at most 2 dimensions, got " + std::to_string(shape.size()));
    }
    for (auto dim : shape) {
        if (dim == 0) {
            throw std::invalid_argument("Tensor dimensions cannot be zero");
        }
    }
}

void Tensor::check_matrix_row(size_type index) const {
    if (ndim() != 2) {
        throw std::invalid_argument("Row access requires a 2D tensor, got " + shape_string());
    }
    if (index >= shape_[0]) {
        throw std::out_of_range("Row index " + std::to_string(index) +
                                " out of range for " + shape_string());
    }
}

// =============================================================================
// Constructors
// =============================================================================

Tensor::Tensor() : shape_{}, data_{} {}

Tensor::Tensor(const Shape& shape)
    : shape_(shape), data_(compute_size(shape), 0.0f) {
    validate_shape(shape);
}

Tensor::Tensor(const Shape& shape, value_type fill_value)
    : shape_(shape), data_(compute_size(shape), fill_value) {
    validate_shape(shape);
}

Tensor::Tensor(const Shape& shape, std::vector<value_type> data)
    : shape_(shape), data_(std::move(data)) {
    validate_shape(shape);
    if (data_.size() != compute_size(shape)) {
        throw std::invalid_argument(
            "Data size does not match shape: expected " +
            std::to_string(compute_size(shape)) + ", got " +
            std::to_string(data_.size()));
    }
}

Tensor::Tensor(std::initializer_list<value_type> values)
    : shape_{values.size()}, data_(values) {
    if (values.size() == 0) {
        shape_.clear();
    }
}

Tensor::Tensor(std::initializer_list<std::initializer_list<value_type>> values) {
    if (values.size() == 0) {
        return;
    }

    size_type rows = values.size();
    size_type cols = values.begin()->size();
    if (cols == 0) {
        throw std::invalid_argument("Rows cannot be empty");
    }

    data_.reserve(rows * cols);
    for (const auto& row : values) {
        if (row.size() != cols) {
            throw std::invalid_argument("All rows must have the same length");
        }
        data_.insert(data_.end(), row.begin(), row.end());
    }
    shape_ = {rows, cols};
}

// =============================================================================
// Element Access
// =============================================================================

Tensor::size_type Tensor::dim(size_type axis) const {
    if (axis >= shape_.size()) {
        return 1;
    }
    return shape_[axis];
}

Tensor::value_type& Tensor::at(size_type index) {
    if (index >= data_.size()) {
        throw std::out_of_range("Tensor index out of range: " +
                                std::to_string(index) + " >= " +
                                std::to_string(data_.size()));
    }
    return data_[index];
}

const Tensor::value_type& Tensor::at(size_type index) const {
    if (index >= data_.size()) {
        throw std::out_of_range("Tensor index out of range: " +
                                std::to_string(index) + " >= " +
                                std::to_string(data_.size()));
    }
    return data_[index];
}

Tensor::size_type Tensor::offset(size_type row, size_type col) const {
    if (ndim() != 2) {
        throw std::invalid_argument("2D indexing requires 2D tensor, got " + shape_string());
    }
    if (row >= shape_[0] || col >= shape_[1]) {
        throw std::out_of_range("2D index (" + std::to_string(row) + ", " +
                                std::to_string(col) + ") out of range for " +
                                shape_string());
    }
    return row * shape_[1] + col;
}

Tensor::value_type& Tensor::at(size_type row, size_type col) {
    return data_[offset(row, col)];
}

const Tensor::value_type& Tensor::at(size_type row, size_type col) const {
    return data_[offset(row, col)];
}

// =============================================================================
// Rows
// =============================================================================

Tensor Tensor::row(size_type index) const {
    check_matrix_row(index);
    size_type cols = shape_[1];
    std::vector<value_type> values(data_.begin() + index * cols,
                                   data_.begin() + (index + 1) * cols);
    return Tensor(Shape{cols}, std::move(values));
}

const Tensor::value_type* Tensor::row_data(size_type index) const {
    check_matrix_row(index);
    return data_.data() + index * shape_[1];
}

Tensor::value_type* Tensor::row_data(size_type index) {
    check_matrix_row(index);
    return data_.data() + index * shape_[1];
}

// =============================================================================
// Fill
// =============================================================================

void Tensor::fill(value_type value) {
    std::fill(data_.begin(), data_.end(), value);
}

bool Tensor::shapes_equal(const Tensor& a, const Tensor& b) {
    return a.shape_ == b.shape_;
}

// =============================================================================
// Shape Description
// =============================================================================

std::string Tensor::shape_string() const {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < shape_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << shape_[i];
    }
    oss << "]";
    return oss.str();
}

} // namespace math
} // namespace cpp_tagger
