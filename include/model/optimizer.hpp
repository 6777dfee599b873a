#ifndef CPP_TAGGER_MODEL_OPTIMIZER_HPP
#define CPP_TAGGER_MODEL_OPTIMIZER_HPP

#include "parameters.hpp"

namespace cpp_tagger {
namespace model {

/// Plain stochastic gradient descent with optional element-wise clipping
class Sgd {
public:
    /// clip_value <= 0 disables clipping.
    /// Throws std::invalid_argument unless learning_rate > 0.
    explicit Sgd(float learning_rate, float clip_value = 0.0f);

    /// params -= learning_rate * clip(grads)
    void apply(CellParameters& params, const CellParameters& grads) const;

    float learning_rate() const { return learning_rate_; }
    float clip_value() const { return clip_value_; }

private:
    float learning_rate_;
    float clip_value_;

    float clip(float g) const;
};

} // namespace model
} // namespace cpp_tagger

#endif // CPP_TAGGER_MODEL_OPTIMIZER_HPP
