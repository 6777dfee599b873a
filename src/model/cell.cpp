#include "../../include/model/cell.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace cpp_tagger {
namespace model {

using math::Tensor;

namespace {

Tensor affine(const AffineMap& map, const Tensor& x) {
    Tensor y = math::matvec(map.weight, x);
    math::add_inplace(y, map.bias);
    return y;
}

// Gradient of a gate pre-activation pushed into both of its affine maps and
// back to the embedding and the previous hidden state
void backprop_gate(const GateWeights& weights, GateWeights& grads,
                   const Tensor& d_pre, const Tensor& embedding,
                   const Tensor& hidden_prev, Tensor& d_embedding,
                   Tensor& d_hidden_prev) {
    math::add_outer(grads.from_input.weight, d_pre, embedding);
    math::add_inplace(grads.from_input.bias, d_pre);
    math::add_outer(grads.from_hidden.weight, d_pre, hidden_prev);
    math::add_inplace(grads.from_hidden.bias, d_pre);

    math::add_inplace(d_embedding, math::matvec_transposed(weights.from_input.weight, d_pre));
    math::add_inplace(d_hidden_prev, math::matvec_transposed(weights.from_hidden.weight, d_pre));
}

} // anonymous namespace

// =============================================================================
// RecurrentState
// =============================================================================

RecurrentState RecurrentState::zeros(std::size_t hidden_dim) {
    RecurrentState state;
    state.hidden = Tensor(Tensor::Shape{hidden_dim});
    state.cell = Tensor(Tensor::Shape{hidden_dim});
    return state;
}

// =============================================================================
// Construction
// =============================================================================

ConditionalGateCell::ConditionalGateCell(const CellDimensions& dims, unsigned seed)
    : dims_(dims), params_(CellParameters::random(dims, seed)) {}

ConditionalGateCell::ConditionalGateCell(CellParameters parameters)
    : params_(std::move(parameters)) {
    dims_ = params_.dimensions();
}

// =============================================================================
// Forward
// =============================================================================

void ConditionalGateCell::validate_inputs(int word_id, int cap_flag,
                                          const Tensor& hidden_prev,
                                          const Tensor& cell_prev) const {
    if (word_id < 0 || static_cast<std::size_t>(word_id) >= dims_.vocab_size) {
        throw std::out_of_range("Word id " + std::to_string(word_id) +
                                " outside embedding table of size " +
                                std::to_string(dims_.vocab_size));
    }
    if (cap_flag != 0 && cap_flag != 1) {
        throw std::invalid_argument("Capitalization flag must be 0 or 1, got " +
                                    std::to_string(cap_flag));
    }
    if (hidden_prev.ndim() != 1 || hidden_prev.size() != dims_.hidden_dim) {
        throw std::invalid_argument("Hidden state must have width " +
                                    std::to_string(dims_.hidden_dim) + ", got " +
                                    hidden_prev.shape_string());
    }
    if (cell_prev.ndim() != 1 || cell_prev.size() != dims_.hidden_dim) {
        throw std::invalid_argument("Cell state must have width " +
                                    std::to_string(dims_.hidden_dim) + ", got " +
                                    cell_prev.shape_string());
    }
}

const GateWeights& ConditionalGateCell::input_gate_weights(int cap_flag) const {
    if (cap_flag == 1) {
        return params_.input_capitalized;
    }
    return params_.input;
}

Tensor ConditionalGateCell::gate_preactivation(const GateWeights& weights,
                                               const Tensor& embedding,
                                               const Tensor& hidden) {
    Tensor pre = affine(weights.from_input, embedding);
    math::add_inplace(pre, affine(weights.from_hidden, hidden));
    return pre;
}

StepOutput ConditionalGateCell::step(int word_id, int cap_flag,
                                     const Tensor& hidden_prev,
                                     const Tensor& cell_prev) const {
    StepCache cache;
    RecurrentState previous{hidden_prev, cell_prev};
    return step(word_id, cap_flag, previous, cache);
}

StepOutput ConditionalGateCell::step(int word_id, int cap_flag,
                                     const RecurrentState& previous) const {
    StepCache cache;
    return step(word_id, cap_flag, previous, cache);
}

StepOutput ConditionalGateCell::step(int word_id, int cap_flag,
                                     const RecurrentState& previous,
                                     StepCache& cache) const {
    validate_inputs(word_id, cap_flag, previous.hidden, previous.cell);

    // Step 1: embedding lookup
    Tensor embedding = params_.embeddings.row(static_cast<std::size_t>(word_id));

    // Steps 2-4: gates. Only the input gate depends on the flag.
    Tensor forget_gate = math::sigmoid(
        gate_preactivation(params_.forget, embedding, previous.hidden));
    Tensor input_gate = math::sigmoid(
        gate_preactivation(input_gate_weights(cap_flag), embedding, previous.hidden));
    Tensor candidate = math::tanh_activation(
        gate_preactivation(params_.candidate, embedding, previous.hidden));

    // Step 5: new memory
    Tensor cell_next = math::multiply(forget_gate, previous.cell);
    math::add_inplace(cell_next, math::multiply(input_gate, candidate));

    // Steps 6-7: output gate and new hidden state
    Tensor output_gate = math::sigmoid(
        gate_preactivation(params_.output, embedding, previous.hidden));
    Tensor cell_tanh = math::tanh_activation(cell_next);
    Tensor hidden_next = math::multiply(output_gate, cell_tanh);

    // Step 8: tag distribution
    Tensor log_probs = math::log_softmax(affine(params_.projection, hidden_next));

    cache.word_id = word_id;
    cache.cap_flag = cap_flag;
    cache.embedding = std::move(embedding);
    cache.previous = previous;
    cache.forget_gate = std::move(forget_gate);
    cache.input_gate = std::move(input_gate);
    cache.candidate = std::move(candidate);
    cache.output_gate = std::move(output_gate);
    cache.cell_tanh = std::move(cell_tanh);
    cache.hidden = hidden_next;
    cache.log_probs = log_probs;

    StepOutput out;
    out.log_probs = std::move(log_probs);
    out.state.hidden = std::move(hidden_next);
    out.state.cell = std::move(cell_next);
    return out;
}

// =============================================================================
// Backward
// =============================================================================

RecurrentState ConditionalGateCell::step_backward(const StepCache& cache,
                                                  const Tensor& d_log_probs,
                                                  const RecurrentState& d_next,
                                                  CellParameters& grads) const {
    const std::size_t H = dims_.hidden_dim;
    if (d_log_probs.size() != dims_.tagset_size ||
        d_next.hidden.size() != H || d_next.cell.size() != H) {
        throw std::invalid_argument("step_backward: gradient shapes do not match the cell");
    }

    // log_softmax: ds_k = dy_k - p_k * sum(dy)
    float dy_total = math::sum(d_log_probs);
    Tensor d_scores = d_log_probs;
    for (std::size_t k = 0; k < d_scores.size(); ++k) {
        d_scores[k] -= std::exp(cache.log_probs[k]) * dy_total;
    }

    math::add_outer(grads.projection.weight, d_scores, cache.hidden);
    math::add_inplace(grads.projection.bias, d_scores);

    Tensor d_hidden = math::matvec_transposed(params_.projection.weight, d_scores);
    math::add_inplace(d_hidden, d_next.hidden);

    Tensor d_forget_pre({H}, 0.0f);
    Tensor d_input_pre({H}, 0.0f);
    Tensor d_candidate_pre({H}, 0.0f);
    Tensor d_output_pre({H}, 0.0f);

    RecurrentState d_prev = RecurrentState::zeros(H);

    for (std::size_t j = 0; j < H; ++j) {
        float o = cache.output_gate[j];
        float tc = cache.cell_tanh[j];
        float f = cache.forget_gate[j];
        float i = cache.input_gate[j];
        float g = cache.candidate[j];

        d_output_pre[j] = d_hidden[j] * tc * o * (1.0f - o);

        float d_cell = d_next.cell[j] + d_hidden[j] * o * (1.0f - tc * tc);

        d_forget_pre[j] = d_cell * cache.previous.cell[j] * f * (1.0f - f);
        d_input_pre[j] = d_cell * g * i * (1.0f - i);
        d_candidate_pre[j] = d_cell * i * (1.0f - g * g);

        d_prev.cell[j] = d_cell * f;
    }

    Tensor d_embedding({dims_.embedding_dim}, 0.0f);
    const Tensor& embedding = cache.embedding;
    const Tensor& hidden_prev = cache.previous.hidden;

    backprop_gate(params_.forget, grads.forget, d_forget_pre,
                  embedding, hidden_prev, d_embedding, d_prev.hidden);
    if (cache.cap_flag == 1) {
        backprop_gate(params_.input_capitalized, grads.input_capitalized, d_input_pre,
                      embedding, hidden_prev, d_embedding, d_prev.hidden);
    } else {
        backprop_gate(params_.input, grads.input, d_input_pre,
                      embedding, hidden_prev, d_embedding, d_prev.hidden);
    }
    backprop_gate(params_.candidate, grads.candidate, d_candidate_pre,
                  embedding, hidden_prev, d_embedding, d_prev.hidden);
    backprop_gate(params_.output, grads.output, d_output_pre,
                  embedding, hidden_prev, d_embedding, d_prev.hidden);

    math::add_to_row(grads.embeddings, static_cast<std::size_t>(cache.word_id), d_embedding);

    return d_prev;
}

} // namespace model
} // namespace cpp_tagger
