#include "../../include/model/optimizer.hpp"
#include <stdexcept>
#include <string>

namespace cpp_tagger {
namespace model {

Sgd::Sgd(float learning_rate, float clip_value)
    : learning_rate_(learning_rate), clip_value_(clip_value) {
    if (!(learning_rate > 0.0f)) {
        throw std::invalid_argument("Learning rate must be positive, got " +
                                    std::to_string(learning_rate));
    }
}

float Sgd::clip(float g) const {
    if (clip_value_ <= 0.0f) return g;
    if (g > clip_value_) return clip_value_;
    if (g < -clip_value_) return -clip_value_;
    return g;
}

void Sgd::apply(CellParameters& params, const CellParameters& grads) const {
    auto targets = params.named_tensors();
    auto sources = grads.named_tensors();

    for (std::size_t n = 0; n < targets.size(); ++n) {
        math::Tensor& p = *targets[n].second;
        const math::Tensor& g = *sources[n].second;
        if (!math::Tensor::shapes_equal(p, g)) {
            throw std::invalid_argument("Gradient for " + targets[n].first + " has shape " +
                                        g.shape_string() + ", parameter has " +
                                        p.shape_string());
        }
        for (std::size_t i = 0; i < p.size(); ++i) {
            p[i] -= learning_rate_ * clip(g[i]);
        }
    }
}

} // namespace model
} // namespace cpp_tagger
