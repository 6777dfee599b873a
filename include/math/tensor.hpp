#ifndef CPP_TAGGER_MATH_TENSOR_HPP
#define CPP_TAGGER_MATH_TENSOR_HPP

#include <vector>
#include <cstddef>
#include <stdexcept>
#include <initializer_list>
#include <string>

namespace cpp_tagger {
namespace math {

/// Dense float32 tensor with value semantics.
/// Only vectors (1D) and matrices (2D) are needed by the tagger; storage is
/// row-major so row(i) of a matrix is a contiguous run.
class Tensor {
public:
    using value_type = float;
    using size_type = std::size_t;
    using Shape = std::vector<size_type>;

    // Empty tensor (ndim 0, size 0)
    Tensor();

    // Zero-filled tensor of the given shape
    explicit Tensor(const Shape& shape);

    Tensor(const Shape& shape, value_type fill_value);

    Tensor(const Shape& shape, std::vector<value_type> data);

    // 1D tensor from values
    Tensor(std::initializer_list<value_type> values);

    // 2D tensor from rows
    Tensor(std::initializer_list<std::initializer_list<value_type>> values);

    Tensor(const Tensor&) = default;
    Tensor(Tensor&&) noexcept = default;
    Tensor& operator=(const Tensor&) = default;
    Tensor& operator=(Tensor&&) noexcept = default;

    const Shape& shape() const noexcept { return shape_; }
    size_type ndim() const noexcept { return shape_.size(); }
    size_type size() const noexcept { return data_.size(); }
    bool empty() const noexcept { return data_.empty(); }

    // Size of an axis, 1 for axes the tensor does not have
    size_type dim(size_type axis) const;

    // Unchecked flat access
    value_type& operator[](size_type index) { return data_[index]; }
    const value_type& operator[](size_type index) const { return data_[index]; }

    // Checked flat access
    value_type& at(size_type index);
    const value_type& at(size_type index) const;

    // Checked (row, col) access, 2D only
    value_type& at(size_type row, size_type col);
    const value_type& at(size_type row, size_type col) const;

    value_type* data() noexcept { return data_.data(); }
    const value_type* data() const noexcept { return data_.data(); }
    std::vector<value_type>& storage() noexcept { return data_; }
    const std::vector<value_type>& storage() const noexcept { return data_; }

    // Copy of row `index` of a matrix as a 1D tensor
    Tensor row(size_type index) const;

    // Pointer to the first element of row `index` of a matrix
    const value_type* row_data(size_type index) const;
    value_type* row_data(size_type index);

    void fill(value_type value);

    static bool shapes_equal(const Tensor& a, const Tensor& b);

    // e.g. "[3, 4]"
    std::string shape_string() const;

private:
    Shape shape_;
    std::vector<value_type> data_;

    static size_type compute_size(const Shape& shape);
    static void validate_shape(const Shape& shape);

    void check_matrix_row(size_type index) const;

    // Flat index of (row, col); throws like at()
    size_type offset(size_type row, size_type col) const;
};

} // namespace math
} // namespace cpp_tagger

#endif // CPP_TAGGER_MATH_TENSOR_HPP
