#ifndef CPP_TAGGER_MATH_OPS_HPP
#define CPP_TAGGER_MATH_OPS_HPP

#include "tensor.hpp"

namespace cpp_tagger {
namespace math {

// =============================================================================
// Matrix/Vector Products
// =============================================================================

/// Matrix-vector product: y = W @ x
/// W: (M, K), x: (K,) -> y: (M,)
Tensor matvec(const Tensor& w, const Tensor& x);

/// Transposed matrix-vector product: y = W^T @ x
/// W: (M, K), x: (M,) -> y: (K,)
/// Used to push a gradient back through an affine map.
Tensor matvec_transposed(const Tensor& w, const Tensor& x);

/// Rank-1 update: W += scale * (a outer b)
/// W: (M, K), a: (M,), b: (K,)
void add_outer(Tensor& w, const Tensor& a, const Tensor& b, float scale = 1.0f);

/// Add `scale * x` into row `row` of matrix `w`
void add_to_row(Tensor& w, Tensor::size_type row, const Tensor& x, float scale = 1.0f);

// =============================================================================
// Element-wise Operations
// =============================================================================

/// Element-wise addition: C = A + B (shapes must match exactly)
Tensor add(const Tensor& a, const Tensor& b);

/// In-place element-wise addition: A += B
void add_inplace(Tensor& a, const Tensor& b);

/// Element-wise multiplication (Hadamard product): C = A * B
Tensor multiply(const Tensor& a, const Tensor& b);

// =============================================================================
// Activation Functions
// =============================================================================

/// Sigmoid activation: 1 / (1 + exp(-x)), evaluated without overflow for
/// large |x|
Tensor sigmoid(const Tensor& x);

/// Tanh activation
Tensor tanh_activation(const Tensor& x);

/// Log-softmax of a 1D tensor: x_i - log(sum_j exp(x_j)), max-shifted
Tensor log_softmax(const Tensor& x);

// =============================================================================
// Reductions
// =============================================================================

/// Sum all elements
float sum(const Tensor& x);

/// Index of the largest element of a 1D tensor. Ties resolve to the lowest
/// index. Throws std::invalid_argument on an empty tensor.
Tensor::size_type argmax(const Tensor& x);

} // namespace math
} // namespace cpp_tagger

#endif // CPP_TAGGER_MATH_OPS_HPP
