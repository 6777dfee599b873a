#include "../../include/math/ops.hpp"
#include <cmath>
#include <algorithm>
#include <stdexcept>

namespace cpp_tagger {
namespace math {

namespace {

void require_vector(const Tensor& x, const char* op) {
    if (x.ndim() != 1) {
        throw std::invalid_argument(std::string(op) + ": expected 1D tensor, got " +
                                    x.shape_string());
    }
}

void require_same_shape(const Tensor& a, const Tensor& b, const char* op) {
    if (!Tensor::shapes_equal(a, b)) {
        throw std::invalid_argument(std::string(op) + ": shapes must match, got " +
                                    a.shape_string() + " and " + b.shape_string());
    }
}

} // anonymous namespace

// =============================================================================
// Matrix/Vector Products
// =============================================================================

Tensor matvec(const Tensor& w, const Tensor& x) {
    if (w.ndim() != 2 || x.ndim() != 1 || w.dim(1) != x.dim(0)) {
        throw std::invalid_argument(
            "matvec: matrix cols must match vector length. Got matrix" +
            w.shape_string() + " and vector" + x.shape_string());
    }

    Tensor::size_type M = w.dim(0);
    Tensor::size_type K = w.dim(1);
    Tensor result({M}, 0.0f);

    for (Tensor::size_type i = 0; i < M; ++i) {
        const float* w_row = w.data() + i * K;
        float acc = 0.0f;
        for (Tensor::size_type k = 0; k < K; ++k) {
            acc += w_row[k] * x[k];
        }
        result[i] = acc;
    }
    return result;
}

Tensor matvec_transposed(const Tensor& w, const Tensor& x) {
    if (w.ndim() != 2 || x.ndim() != 1 || w.dim(0) != x.dim(0)) {
        throw std::invalid_argument(
            "matvec_transposed: matrix rows must match vector length. Got matrix" +
            w.shape_string() + " and vector" + x.shape_string());
    }

    Tensor::size_type M = w.dim(0);
    Tensor::size_type K = w.dim(1);
    Tensor result({K}, 0.0f);

    for (Tensor::size_type i = 0; i < M; ++i) {
        const float* w_row = w.data() + i * K;
        float xi = x[i];
        for (Tensor::size_type k = 0; k < K; ++k) {
            result[k] += w_row[k] * xi;
        }
    }
    return result;
}

void add_outer(Tensor& w, const Tensor& a, const Tensor& b, float scale) {
    if (w.ndim() != 2 || a.ndim() != 1 || b.ndim() != 1 ||
        w.dim(0) != a.dim(0) || w.dim(1) != b.dim(0)) {
        throw std::invalid_argument(
            "add_outer: incompatible shapes " + w.shape_string() + ", " +
            a.shape_string() + ", " + b.shape_string());
    }

    Tensor::size_type M = w.dim(0);
    Tensor::size_type K = w.dim(1);
    for (Tensor::size_type i = 0; i < M; ++i) {
        float* w_row = w.data() + i * K;
        float ai = scale * a[i];
        for (Tensor::size_type k = 0; k < K; ++k) {
            w_row[k] += ai * b[k];
        }
    }
}

void add_to_row(Tensor& w, Tensor::size_type row, const Tensor& x, float scale) {
    require_vector(x, "add_to_row");
    float* w_row = w.row_data(row);
    if (w.dim(1) != x.dim(0)) {
        throw std::invalid_argument("add_to_row: row width " + std::to_string(w.dim(1)) +
                                    " does not match vector" + x.shape_string());
    }
    for (Tensor::size_type k = 0; k < x.size(); ++k) {
        w_row[k] += scale * x[k];
    }
}

// =============================================================================
// Element-wise Operations
// =============================================================================

Tensor add(const Tensor& a, const Tensor& b) {
    require_same_shape(a, b, "add");
    Tensor result = a;
    for (Tensor::size_type i = 0; i < result.size(); ++i) {
        result[i] += b[i];
    }
    return result;
}

void add_inplace(Tensor& a, const Tensor& b) {
    require_same_shape(a, b, "add_inplace");
    for (Tensor::size_type i = 0; i < a.size(); ++i) {
        a[i] += b[i];
    }
}

Tensor multiply(const Tensor& a, const Tensor& b) {
    require_same_shape(a, b, "multiply");
    Tensor result = a;
    for (Tensor::size_type i = 0; i < result.size(); ++i) {
        result[i] *= b[i];
    }
    return result;
}

// =============================================================================
// Activation Functions
// =============================================================================

Tensor sigmoid(const Tensor& x) {
    Tensor result = x;
    for (Tensor::size_type i = 0; i < result.size(); ++i) {
        float v = result[i];
        if (v >= 0.0f) {
            result[i] = 1.0f / (1.0f + std::exp(-v));
        } else {
            float e = std::exp(v);
            result[i] = e / (1.0f + e);
        }
    }
    return result;
}

Tensor tanh_activation(const Tensor& x) {
    Tensor result = x;
    for (Tensor::size_type i = 0; i < result.size(); ++i) {
        result[i] = std::tanh(result[i]);
    }
    return result;
}

Tensor log_softmax(const Tensor& x) {
    require_vector(x, "log_softmax");

    float max_val = x[0];
    for (Tensor::size_type i = 1; i < x.size(); ++i) {
        max_val = std::max(max_val, x[i]);
    }

    float sum_exp = 0.0f;
    for (Tensor::size_type i = 0; i < x.size(); ++i) {
        sum_exp += std::exp(x[i] - max_val);
    }
    float log_sum = std::log(sum_exp);

    Tensor result = x;
    for (Tensor::size_type i = 0; i < result.size(); ++i) {
        result[i] = (x[i] - max_val) - log_sum;
    }
    return result;
}

// =============================================================================
// Reductions
// =============================================================================

float sum(const Tensor& x) {
    float total = 0.0f;
    for (Tensor::size_type i = 0; i < x.size(); ++i) {
        total += x[i];
    }
    return total;
}

Tensor::size_type argmax(const Tensor& x) {
    if (x.empty()) {
        throw std::invalid_argument("argmax: empty tensor");
    }
    require_vector(x, "argmax");

    Tensor::size_type best = 0;
    for (Tensor::size_type i = 1; i < x.size(); ++i) {
        // strict comparison keeps the lowest index on ties
        if (x[i] > x[best]) {
            best = i;
        }
    }
    return best;
}

} // namespace math
} // namespace cpp_tagger
