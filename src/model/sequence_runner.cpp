#include "../../include/model/sequence_runner.hpp"
#include <stdexcept>
#include <string>

namespace cpp_tagger {
namespace model {

using math::Tensor;

SequenceRunner::SequenceRunner(const ConditionalGateCell& cell)
    : cell_(cell) {}

void SequenceRunner::check_lengths(const std::vector<int>& word_ids,
                                   const std::vector<int>& cap_flags) {
    if (word_ids.empty()) {
        throw std::invalid_argument("Empty input sequence");
    }
    if (word_ids.size() != cap_flags.size()) {
        throw std::invalid_argument(
            "Sequence length mismatch: " + std::to_string(word_ids.size()) +
            " word ids, " + std::to_string(cap_flags.size()) + " capitalization flags");
    }
}

std::vector<Tensor> SequenceRunner::forward(const std::vector<int>& word_ids,
                                            const std::vector<int>& cap_flags) const {
    check_lengths(word_ids, cap_flags);

    std::vector<Tensor> outputs;
    outputs.reserve(word_ids.size());

    RecurrentState state = cell_.initial_state();
    for (std::size_t t = 0; t < word_ids.size(); ++t) {
        StepOutput out = cell_.step(word_ids[t], cap_flags[t], state);
        state = std::move(out.state);
        outputs.push_back(std::move(out.log_probs));
    }
    return outputs;
}

TrainStepResult SequenceRunner::train_step(const std::vector<int>& word_ids,
                                           const std::vector<int>& cap_flags,
                                           const std::vector<int>& tag_ids) const {
    check_lengths(word_ids, cap_flags);
    if (tag_ids.size() != word_ids.size()) {
        throw std::invalid_argument(
            "Sequence length mismatch: " + std::to_string(word_ids.size()) +
            " word ids, " + std::to_string(tag_ids.size()) + " tag ids");
    }

    const std::size_t tagset_size = cell_.dimensions().tagset_size;
    for (int tag : tag_ids) {
        if (tag < 0 || static_cast<std::size_t>(tag) >= tagset_size) {
            throw std::out_of_range("Tag id " + std::to_string(tag) +
                                    " outside tag set of size " +
                                    std::to_string(tagset_size));
        }
    }

    // =================================================================
    // Forward: keep every step's intermediates
    // =================================================================

    const std::size_t length = word_ids.size();
    std::vector<StepCache> caches(length);

    TrainStepResult result;
    result.outputs.reserve(length);

    RecurrentState state = cell_.initial_state();
    for (std::size_t t = 0; t < length; ++t) {
        StepOutput out = cell_.step(word_ids[t], cap_flags[t], state, caches[t]);
        state = std::move(out.state);
        result.outputs.push_back(std::move(out.log_probs));
    }

    // =================================================================
    // Sentence loss: mean NLL over all positions
    // =================================================================

    const float inv_length = 1.0f / static_cast<float>(length);
    float total = 0.0f;
    for (std::size_t t = 0; t < length; ++t) {
        total -= result.outputs[t][static_cast<std::size_t>(tag_ids[t])];
    }
    result.loss = total * inv_length;

    // =================================================================
    // Backward through time, last position first
    // =================================================================

    result.gradients = cell_.zero_gradients();
    RecurrentState d_state = cell_.initial_state();
    for (std::size_t t = length; t-- > 0;) {
        Tensor d_log_probs({tagset_size}, 0.0f);
        d_log_probs[static_cast<std::size_t>(tag_ids[t])] = -inv_length;
        d_state = cell_.step_backward(caches[t], d_log_probs, d_state, result.gradients);
    }

    return result;
}

std::vector<int> SequenceRunner::predict(const std::vector<int>& word_ids,
                                         const std::vector<int>& cap_flags) const {
    std::vector<Tensor> outputs = forward(word_ids, cap_flags);

    std::vector<int> tags;
    tags.reserve(outputs.size());
    for (const auto& log_probs : outputs) {
        tags.push_back(static_cast<int>(math::argmax(log_probs)));
    }
    return tags;
}

} // namespace model
} // namespace cpp_tagger
