#ifndef CPP_TAGGER_MODEL_SEQUENCE_RUNNER_HPP
#define CPP_TAGGER_MODEL_SEQUENCE_RUNNER_HPP

#include "cell.hpp"
#include <vector>

namespace cpp_tagger {
namespace model {

/// Outcome of one training pass over a sentence
struct TrainStepResult {
    std::vector<math::Tensor> outputs;  // per-position log-probabilities
    float loss = 0.0f;                  // mean negative log-likelihood
    CellParameters gradients;           // d loss / d parameter
};

/// Folds the cell over a whole sentence. Every run starts from the zero
/// state; nothing carries over between sentences.
class SequenceRunner {
public:
    explicit SequenceRunner(const ConditionalGateCell& cell);

    /// Log-probability rows for every position
    std::vector<math::Tensor> forward(const std::vector<int>& word_ids,
                                      const std::vector<int>& cap_flags) const;

    /// Forward pass, sentence loss and its gradient w.r.t. every parameter.
    /// The loss is the mean over positions of -log p(tag_ids[t]); one
    /// backward pass covers the whole sentence. Parameters are not updated.
    TrainStepResult train_step(const std::vector<int>& word_ids,
                               const std::vector<int>& cap_flags,
                               const std::vector<int>& tag_ids) const;

    /// Greedy decoding: arg-max tag per position, lowest id on ties
    std::vector<int> predict(const std::vector<int>& word_ids,
                             const std::vector<int>& cap_flags) const;

private:
    const ConditionalGateCell& cell_;

    static void check_lengths(const std::vector<int>& word_ids,
                              const std::vector<int>& cap_flags);
};

} // namespace model
} // namespace cpp_tagger

#endif // CPP_TAGGER_MODEL_SEQUENCE_RUNNER_HPP
