#ifndef CPP_TAGGER_MODEL_CELL_HPP
#define CPP_TAGGER_MODEL_CELL_HPP

#include "parameters.hpp"
#include "../math/tensor.hpp"
#include "../math/ops.hpp"
#include <cstddef>

namespace cpp_tagger {
namespace model {

constexpr unsigned DEFAULT_SEED = 1;

// =============================================================================
// Recurrent State
// =============================================================================

/// (hidden, cell) pair threaded through a sentence
struct RecurrentState {
    math::Tensor hidden;  // (hidden_dim,)
    math::Tensor cell;    // (hidden_dim,)

    static RecurrentState zeros(std::size_t hidden_dim);
};

/// Result of one timestep
struct StepOutput {
    math::Tensor log_probs;  // (tagset_size,)
    RecurrentState state;
};

/// Forward values of one timestep kept for the backward pass
struct StepCache {
    int word_id = 0;
    int cap_flag = 0;
    math::Tensor embedding;
    RecurrentState previous;
    math::Tensor forget_gate;
    math::Tensor input_gate;
    math::Tensor candidate;
    math::Tensor output_gate;
    math::Tensor cell_tanh;   // tanh(cell_next)
    math::Tensor hidden;      // hidden_next
    math::Tensor log_probs;
};

// =============================================================================
// Conditional-Gate Recurrent Cell
// =============================================================================

/// LSTM cell whose input gate has two parameter sets. The capitalization
/// flag of each token selects which one is used:
///
///   f  = sigmoid(W_if e + W_hf h)
///   i  = sigmoid(W_ii e + W_hi h)            if cap_flag == 0
///   i  = sigmoid(W_ii_cap e + W_hi_cap h)    if cap_flag == 1
///   c~ = tanh(W_ic e + W_hc h)
///   c' = f * c + i * c~
///   o  = sigmoid(W_io e + W_ho h)
///   h' = o * tanh(c')
///   y  = log_softmax(W_out h' + b_out)
class ConditionalGateCell {
public:
    /// Randomly initialized cell, reproducible for a given seed
    explicit ConditionalGateCell(const CellDimensions& dims, unsigned seed = DEFAULT_SEED);

    /// Cell over existing parameters (e.g. loaded from disk).
    /// Throws std::invalid_argument if the tensor shapes are inconsistent.
    explicit ConditionalGateCell(CellParameters parameters);

    /// One timestep. Does not modify the previous state.
    /// Throws std::out_of_range for a word id outside the embedding table and
    /// std::invalid_argument for a flag other than 0/1 or a state of the
    /// wrong width.
    StepOutput step(int word_id, int cap_flag,
                    const math::Tensor& hidden_prev,
                    const math::Tensor& cell_prev) const;

    StepOutput step(int word_id, int cap_flag, const RecurrentState& previous) const;

    /// Same as step(), also recording the intermediate values needed by
    /// step_backward()
    StepOutput step(int word_id, int cap_flag, const RecurrentState& previous,
                    StepCache& cache) const;

    /// Backpropagate through one timestep.
    /// d_log_probs: gradient of the loss w.r.t. this step's log-probabilities
    /// d_next: gradient flowing back from the following timestep
    /// Parameter gradients are accumulated into `grads`; the gradient w.r.t.
    /// the previous state is returned.
    RecurrentState step_backward(const StepCache& cache,
                                 const math::Tensor& d_log_probs,
                                 const RecurrentState& d_next,
                                 CellParameters& grads) const;

    RecurrentState initial_state() const { return RecurrentState::zeros(dims_.hidden_dim); }

    const CellDimensions& dimensions() const { return dims_; }

    const CellParameters& parameters() const { return params_; }
    CellParameters& parameters() { return params_; }

    /// Zero-filled buffer shaped like the parameters
    CellParameters zero_gradients() const { return CellParameters::zeros(dims_); }

private:
    CellDimensions dims_;
    CellParameters params_;

    void validate_inputs(int word_id, int cap_flag,
                         const math::Tensor& hidden_prev,
                         const math::Tensor& cell_prev) const;

    const GateWeights& input_gate_weights(int cap_flag) const;

    /// weights.from_input(e) + weights.from_hidden(h)
    static math::Tensor gate_preactivation(const GateWeights& weights,
                                           const math::Tensor& embedding,
                                           const math::Tensor& hidden);
};

} // namespace model
} // namespace cpp_tagger

#endif // CPP_TAGGER_MODEL_CELL_HPP
