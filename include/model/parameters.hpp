#ifndef CPP_TAGGER_MODEL_PARAMETERS_HPP
#define CPP_TAGGER_MODEL_PARAMETERS_HPP

#include "../math/tensor.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace cpp_tagger {
namespace model {

// =============================================================================
// Dimensions
// =============================================================================

/// Sizes fixed at cell construction time
struct CellDimensions {
    std::size_t vocab_size = 0;
    std::size_t embedding_dim = 0;
    std::size_t hidden_dim = 0;
    std::size_t tagset_size = 0;

    /// Throws std::invalid_argument if any size is zero
    void validate() const;

    bool operator==(const CellDimensions& other) const;
    bool operator!=(const CellDimensions& other) const { return !(*this == other); }
};

// =============================================================================
// Weight Structures
// =============================================================================

/// y = weight @ x + bias
struct AffineMap {
    math::Tensor weight;  // (out, in)
    math::Tensor bias;    // (out,)
};

/// A gate reads the current embedding and the previous hidden state
/// through two separate affine maps whose outputs are summed.
struct GateWeights {
    AffineMap from_input;   // (hidden_dim, embedding_dim)
    AffineMap from_hidden;  // (hidden_dim, hidden_dim)
};

/// Every learned tensor of the conditional-gate cell.
/// The same structure doubles as the gradient buffer for backpropagation.
struct CellParameters {
    math::Tensor embeddings;         // (vocab_size, embedding_dim)
    GateWeights forget;
    GateWeights input;               // used when the token is lowercase-initial
    GateWeights input_capitalized;   // used when the token is uppercase-initial
    GateWeights candidate;
    GateWeights output;
    AffineMap projection;            // (tagset_size, hidden_dim)

    using NamedTensor = std::pair<std::string, math::Tensor*>;
    using ConstNamedTensor = std::pair<std::string, const math::Tensor*>;

    /// All tensors in a fixed order with their serialized names
    std::vector<NamedTensor> named_tensors();
    std::vector<ConstNamedTensor> named_tensors() const;

    /// Dimensions implied by the tensor shapes; throws std::invalid_argument
    /// if the shapes are inconsistent with each other
    CellDimensions dimensions() const;

    /// Total number of scalar parameters
    std::size_t parameter_count() const;

    /// Zero-filled parameters of the given dimensions
    static CellParameters zeros(const CellDimensions& dims);

    /// Random parameters drawn from a seeded generator. Embedding rows are
    /// uniform in [-1, 1]; every affine weight and bias is uniform in
    /// [-1/sqrt(fan_in), 1/sqrt(fan_in)].
    static CellParameters random(const CellDimensions& dims, unsigned seed);
};

/// Names of every tensor a complete parameter set contains, in
/// serialization order
std::vector<std::string> required_tensor_names();

} // namespace model
} // namespace cpp_tagger

#endif // CPP_TAGGER_MODEL_PARAMETERS_HPP
