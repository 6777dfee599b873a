#include "../../include/model/parameters.hpp"
#include <cmath>
#include <random>
#include <stdexcept>

namespace cpp_tagger {
namespace model {

using math::Tensor;

namespace {

// Serialized names follow the W_<source><gate> convention: W_if maps the
// input embedding into the forget gate, W_hf the previous hidden state.
struct GateNames {
    const char* from_input;
    const char* from_hidden;
};

constexpr GateNames FORGET_NAMES{"W_if", "W_hf"};
constexpr GateNames INPUT_NAMES{"W_ii", "W_hi"};
constexpr GateNames INPUT_CAP_NAMES{"W_ii_cap", "W_hi_cap"};
constexpr GateNames CANDIDATE_NAMES{"W_ic", "W_hc"};
constexpr GateNames OUTPUT_NAMES{"W_io", "W_ho"};
constexpr const char* EMBEDDING_NAME = "word_embeddings.weight";
constexpr const char* PROJECTION_NAME = "hidden2tag";

template <typename Named, typename Affine>
void append_affine(std::vector<Named>& out, const std::string& prefix, Affine& map) {
    out.emplace_back(prefix + ".weight", &map.weight);
    out.emplace_back(prefix + ".bias", &map.bias);
}

template <typename Named, typename Gate>
void append_gate(std::vector<Named>& out, const GateNames& names, Gate& gate) {
    append_affine(out, names.from_input, gate.from_input);
    append_affine(out, names.from_hidden, gate.from_hidden);
}

template <typename Named, typename Params>
std::vector<Named> collect(Params& params) {
    std::vector<Named> out;
    out.reserve(23);
    out.emplace_back(EMBEDDING_NAME, &params.embeddings);
    append_gate(out, FORGET_NAMES, params.forget);
    append_gate(out, INPUT_NAMES, params.input);
    append_gate(out, INPUT_CAP_NAMES, params.input_capitalized);
    append_gate(out, CANDIDATE_NAMES, params.candidate);
    append_gate(out, OUTPUT_NAMES, params.output);
    append_affine(out, PROJECTION_NAME, params.projection);
    return out;
}

AffineMap zero_affine(std::size_t out, std::size_t in) {
    AffineMap map;
    map.weight = Tensor(Tensor::Shape{out, in});
    map.bias = Tensor(Tensor::Shape{out});
    return map;
}

GateWeights zero_gate(const CellDimensions& dims) {
    GateWeights gate;
    gate.from_input = zero_affine(dims.hidden_dim, dims.embedding_dim);
    gate.from_hidden = zero_affine(dims.hidden_dim, dims.hidden_dim);
    return gate;
}

void check_shape(const Tensor& t, const Tensor::Shape& expected, const std::string& name) {
    if (t.shape() != expected) {
        Tensor reference(expected);
        throw std::invalid_argument("Tensor " + name + " has shape " + t.shape_string() +
                                    ", expected " + reference.shape_string());
    }
}

} // anonymous namespace

// =============================================================================
// CellDimensions
// =============================================================================

void CellDimensions::validate() const {
    if (vocab_size == 0) {
        throw std::invalid_argument("Vocabulary size must be at least 1");
    }
    if (embedding_dim == 0) {
        throw std::invalid_argument("Embedding width must be at least 1");
    }
    if (hidden_dim == 0) {
        throw std::invalid_argument("Hidden width must be at least 1");
    }
    if (tagset_size == 0) {
        throw std::invalid_argument("Tag set size must be at least 1");
    }
}

bool CellDimensions::operator==(const CellDimensions& other) const {
    return vocab_size == other.vocab_size &&
           embedding_dim == other.embedding_dim &&
           hidden_dim == other.hidden_dim &&
           tagset_size == other.tagset_size;
}

// =============================================================================
// CellParameters
// =============================================================================

std::vector<CellParameters::NamedTensor> CellParameters::named_tensors() {
    return collect<NamedTensor>(*this);
}

std::vector<CellParameters::ConstNamedTensor> CellParameters::named_tensors() const {
    return collect<ConstNamedTensor>(*this);
}

CellDimensions CellParameters::dimensions() const {
    if (embeddings.ndim() != 2 || projection.weight.ndim() != 2) {
        throw std::invalid_argument("Embedding table and projection must be 2D");
    }

    CellDimensions dims;
    dims.vocab_size = embeddings.dim(0);
    dims.embedding_dim = embeddings.dim(1);
    dims.tagset_size = projection.weight.dim(0);
    dims.hidden_dim = projection.weight.dim(1);

    // Every other tensor must agree with the sizes read above
    const CellParameters reference = zeros(dims);
    auto expected = reference.named_tensors();
    auto actual = named_tensors();
    for (std::size_t i = 0; i < actual.size(); ++i) {
        check_shape(*actual[i].second, expected[i].second->shape(), actual[i].first);
    }
    return dims;
}

std::size_t CellParameters::parameter_count() const {
    std::size_t count = 0;
    for (const auto& named : named_tensors()) {
        count += named.second->size();
    }
    return count;
}

CellParameters CellParameters::zeros(const CellDimensions& dims) {
    dims.validate();

    CellParameters params;
    params.embeddings = Tensor(Tensor::Shape{dims.vocab_size, dims.embedding_dim});
    params.forget = zero_gate(dims);
    params.input = zero_gate(dims);
    params.input_capitalized = zero_gate(dims);
    params.candidate = zero_gate(dims);
    params.output = zero_gate(dims);
    params.projection = zero_affine(dims.tagset_size, dims.hidden_dim);
    return params;
}

CellParameters CellParameters::random(const CellDimensions& dims, unsigned seed) {
    CellParameters params = zeros(dims);
    std::mt19937 gen(seed);

    std::uniform_real_distribution<float> embedding_dist(-1.0f, 1.0f);
    for (auto& v : params.embeddings.storage()) {
        v = embedding_dist(gen);
    }

    auto fill_affine = [&gen](AffineMap& map) {
        // fan_in is the width of the map's input
        float bound = 1.0f / std::sqrt(static_cast<float>(map.weight.dim(1)));
        std::uniform_real_distribution<float> dist(-bound, bound);
        for (auto& v : map.weight.storage()) v = dist(gen);
        for (auto& v : map.bias.storage()) v = dist(gen);
    };
    auto fill_gate = [&fill_affine](GateWeights& gate) {
        fill_affine(gate.from_input);
        fill_affine(gate.from_hidden);
    };

    fill_gate(params.forget);
    fill_gate(params.input);
    fill_gate(params.input_capitalized);
    fill_gate(params.candidate);
    fill_gate(params.output);
    fill_affine(params.projection);
    return params;
}

std::vector<std::string> required_tensor_names() {
    CellParameters empty;
    std::vector<std::string> names;
    for (const auto& named : empty.named_tensors()) {
        names.push_back(named.first);
    }
    return names;
}

} // namespace model
} // namespace cpp_tagger
