#include "../include/model/cell.hpp"
#include <iostream>
#include <cmath>
#include <cassert>
#include <stdexcept>

using namespace cpp_tagger;
using namespace cpp_tagger::model;
using namespace cpp_tagger::math;

// =============================================================================
// Test Utilities
// =============================================================================

namespace {

constexpr float EPSILON = 1e-5f;

bool approx_equal(float a, float b, float eps = EPSILON) {
    return std::abs(a - b) < eps;
}

bool tensors_equal(const Tensor& a, const Tensor& b) {
    if (!Tensor::shapes_equal(a, b)) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) return false;
    }
    return true;
}

CellDimensions small_dims() {
    CellDimensions dims;
    dims.vocab_size = 3;
    dims.embedding_dim = 3;
    dims.hidden_dim = 4;
    dims.tagset_size = 2;
    return dims;
}

RecurrentState some_state(size_t hidden_dim) {
    RecurrentState state = RecurrentState::zeros(hidden_dim);
    for (size_t j = 0; j < hidden_dim; ++j) {
        state.hidden[j] = 0.1f * static_cast<float>(j + 1) - 0.25f;
        state.cell[j] = 0.3f - 0.2f * static_cast<float>(j);
    }
    return state;
}

} // anonymous namespace

// =============================================================================
// Forward
// =============================================================================

void test_step_shapes_and_distribution() {
    std::cout << "Testing step output shapes..." << std::endl;

    ConditionalGateCell cell(small_dims(), 7);
    StepOutput out = cell.step(0, 1, cell.initial_state());

    assert(out.log_probs.size() == 2);
    assert(out.state.hidden.size() == 4);
    assert(out.state.cell.size() == 4);

    float total = 0.0f;
    for (size_t k = 0; k < out.log_probs.size(); ++k) {
        assert(out.log_probs[k] <= 0.0f);
        total += std::exp(out.log_probs[k]);
    }
    assert(approx_equal(total, 1.0f));

    // |h| < 1 since h = o * tanh(c) with o in (0, 1)
    for (size_t j = 0; j < out.state.hidden.size(); ++j) {
        assert(std::abs(out.state.hidden[j]) < 1.0f);
    }

    std::cout << "  Step output shapes: PASSED" << std::endl;
}

void test_step_is_deterministic() {
    std::cout << "Testing step determinism..." << std::endl;

    ConditionalGateCell a(small_dims(), 3);
    ConditionalGateCell b(small_dims(), 3);
    RecurrentState prev = some_state(4);

    StepOutput out_a = a.step(2, 0, prev);
    StepOutput out_b = b.step(2, 0, prev);
    StepOutput out_a2 = a.step(2, 0, prev);

    assert(tensors_equal(out_a.log_probs, out_b.log_probs));
    assert(tensors_equal(out_a.state.cell, out_b.state.cell));
    assert(tensors_equal(out_a.log_probs, out_a2.log_probs));

    // The previous state is left untouched
    RecurrentState expected = some_state(4);
    assert(tensors_equal(prev.hidden, expected.hidden));
    assert(tensors_equal(prev.cell, expected.cell));

    // A different seed gives a different cell
    ConditionalGateCell c(small_dims(), 4);
    assert(!tensors_equal(c.step(2, 0, prev).log_probs, out_a.log_probs));

    std::cout << "  Step determinism: PASSED" << std::endl;
}

void test_capitalization_selects_input_gate() {
    std::cout << "Testing input gate selection..." << std::endl;

    ConditionalGateCell cell(small_dims(), 11);
    RecurrentState prev = some_state(4);

    StepOutput lower = cell.step(1, 0, prev);
    StepOutput upper = cell.step(1, 1, prev);

    // Two independently initialized input gates give different memories
    assert(!tensors_equal(lower.state.cell, upper.state.cell));

    // Changing the capitalized set leaves lowercase steps unchanged
    ConditionalGateCell modified = cell;
    modified.parameters().input_capitalized.from_input.bias.fill(3.0f);
    assert(tensors_equal(modified.step(1, 0, prev).state.cell, lower.state.cell));
    assert(!tensors_equal(modified.step(1, 1, prev).state.cell, upper.state.cell));

    // ...and vice versa
    ConditionalGateCell modified_lower = cell;
    modified_lower.parameters().input.from_hidden.weight.fill(-2.0f);
    assert(tensors_equal(modified_lower.step(1, 1, prev).state.cell, upper.state.cell));

    std::cout << "  Input gate selection: PASSED" << std::endl;
}

void test_handcrafted_step() {
    std::cout << "Testing step against hand computation..." << std::endl;

    CellDimensions dims;
    dims.vocab_size = 1;
    dims.embedding_dim = 1;
    dims.hidden_dim = 1;
    dims.tagset_size = 2;

    CellParameters params = CellParameters::zeros(dims);
    params.embeddings.at(0, 0) = 1.0f;
    params.forget.from_input.weight.at(0, 0) = 1.0f;      // f = sigmoid(1)
    params.input.from_input.weight.at(0, 0) = -1.0f;      // i = sigmoid(-1)
    params.candidate.from_input.bias[0] = 0.5f;           // c~ = tanh(0.5)
    params.output.from_hidden.weight.at(0, 0) = 2.0f;     // o = sigmoid(2 h)
    params.projection.weight.at(0, 0) = 1.0f;
    params.projection.weight.at(1, 0) = -1.0f;

    ConditionalGateCell cell(params);
    RecurrentState prev = RecurrentState::zeros(1);
    prev.hidden[0] = 0.5f;
    prev.cell[0] = 2.0f;

    StepOutput out = cell.step(0, 0, prev);

    auto sig = [](float v) { return 1.0f / (1.0f + std::exp(-v)); };
    float f = sig(1.0f);
    float i = sig(-1.0f);
    float g = std::tanh(0.5f);
    float o = sig(1.0f);
    float c = f * 2.0f + i * g;
    float h = o * std::tanh(c);

    assert(approx_equal(out.state.cell[0], c));
    assert(approx_equal(out.state.hidden[0], h));

    // Scores are [h, -h]
    float log_norm = std::log(std::exp(h) + std::exp(-h));
    assert(approx_equal(out.log_probs[0], h - log_norm));
    assert(approx_equal(out.log_probs[1], -h - log_norm));

    std::cout << "  Hand computation: PASSED" << std::endl;
}

void test_step_errors() {
    std::cout << "Testing step errors..." << std::endl;

    ConditionalGateCell cell(small_dims());

    bool threw = false;
    try {
        cell.step(3, 0, cell.initial_state());
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        cell.step(-1, 0, cell.initial_state());
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        cell.step(0, 2, cell.initial_state());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        cell.step(0, 0, Tensor(Tensor::Shape{3}), Tensor(Tensor::Shape{4}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Parameters with inconsistent shapes are rejected
    CellParameters params = CellParameters::zeros(small_dims());
    params.candidate.from_hidden.weight = Tensor(Tensor::Shape{4, 5});
    threw = false;
    try {
        ConditionalGateCell broken(params);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Step errors: PASSED" << std::endl;
}

// =============================================================================
// Parameters
// =============================================================================

void test_parameter_layout() {
    std::cout << "Testing parameter layout..." << std::endl;

    CellDimensions dims = small_dims();
    CellParameters params = CellParameters::random(dims, 5);

    auto names = required_tensor_names();
    assert(names.size() == 23);
    assert(names.front() == "word_embeddings.weight");
    assert(names.back() == "hidden2tag.bias");

    auto named = params.named_tensors();
    assert(named.size() == names.size());
    for (size_t n = 0; n < named.size(); ++n) {
        assert(named[n].first == names[n]);
    }

    // 3*3 embeddings + 5 gates * (4*3 + 4 + 4*4 + 4) + 2*4 + 2
    assert(params.parameter_count() == 9 + 5 * 36 + 10);
    assert(params.dimensions() == dims);

    // Initialization ranges
    for (float v : params.embeddings.storage()) {
        assert(v >= -1.0f && v <= 1.0f);
    }
    float bound = 1.0f / std::sqrt(4.0f);
    for (float v : params.forget.from_hidden.weight.storage()) {
        assert(std::abs(v) <= bound);
    }

    std::cout << "  Parameter layout: PASSED" << std::endl;
}

// =============================================================================
// Backward
// =============================================================================

namespace {

// -log p(tag) + <probe, h'> + <probe, c'> for one step
float probe_loss(const CellParameters& params, int word_id, int cap_flag,
                 const RecurrentState& prev, int tag, const RecurrentState& probe) {
    ConditionalGateCell cell(params);
    StepOutput out = cell.step(word_id, cap_flag, prev);
    float loss = -out.log_probs[static_cast<size_t>(tag)];
    for (size_t j = 0; j < probe.hidden.size(); ++j) {
        loss += probe.hidden[j] * out.state.hidden[j] + probe.cell[j] * out.state.cell[j];
    }
    return loss;
}

bool gradient_close(float analytic, float numeric) {
    return std::abs(analytic - numeric) <= 2e-3f + 0.05f * std::abs(numeric);
}

} // anonymous namespace

void test_step_backward_matches_finite_differences() {
    std::cout << "Testing step backward against finite differences..." << std::endl;

    const float h = 1e-3f;
    const int tag = 1;
    RecurrentState prev = some_state(4);

    // Gradient arriving from a following step
    RecurrentState probe = RecurrentState::zeros(4);
    probe.hidden = Tensor{0.3f, -0.1f, 0.2f, 0.05f};
    probe.cell = Tensor{-0.2f, 0.1f, 0.0f, 0.15f};

    for (int cap_flag = 0; cap_flag <= 1; ++cap_flag) {
        ConditionalGateCell cell(small_dims(), 21);
        const int word_id = 1;

        StepCache cache;
        cell.step(word_id, cap_flag, prev, cache);

        Tensor d_log_probs(Tensor::Shape{2});
        d_log_probs[tag] = -1.0f;

        CellParameters grads = cell.zero_gradients();
        RecurrentState d_prev = cell.step_backward(cache, d_log_probs, probe, grads);

        CellParameters params = cell.parameters();
        auto param_list = params.named_tensors();
        auto grad_list = grads.named_tensors();
        for (size_t n = 0; n < param_list.size(); ++n) {
            Tensor& p = *param_list[n].second;
            for (size_t i = 0; i < p.size(); ++i) {
                float saved = p[i];
                p[i] = saved + h;
                float up = probe_loss(params, word_id, cap_flag, prev, tag, probe);
                p[i] = saved - h;
                float down = probe_loss(params, word_id, cap_flag, prev, tag, probe);
                p[i] = saved;

                float numeric = (up - down) / (2.0f * h);
                float analytic = (*grad_list[n].second)[i];
                if (!gradient_close(analytic, numeric)) {
                    std::cout << "  mismatch in " << param_list[n].first << "[" << i
                              << "]: analytic " << analytic << ", numeric " << numeric
                              << std::endl;
                }
                assert(gradient_close(analytic, numeric));
            }
        }

        // Gradient w.r.t. the previous state
        for (size_t j = 0; j < 4; ++j) {
            RecurrentState moved = prev;
            moved.hidden[j] += h;
            float up = probe_loss(params, word_id, cap_flag, moved, tag, probe);
            moved.hidden[j] -= 2.0f * h;
            float down = probe_loss(params, word_id, cap_flag, moved, tag, probe);
            assert(gradient_close(d_prev.hidden[j], (up - down) / (2.0f * h)));

            moved = prev;
            moved.cell[j] += h;
            up = probe_loss(params, word_id, cap_flag, moved, tag, probe);
            moved.cell[j] -= 2.0f * h;
            down = probe_loss(params, word_id, cap_flag, moved, tag, probe);
            assert(gradient_close(d_prev.cell[j], (up - down) / (2.0f * h)));
        }
    }

    std::cout << "  Step backward: PASSED" << std::endl;
}

void test_unused_input_gate_gets_no_gradient() {
    std::cout << "Testing gradient routing through the selected gate..." << std::endl;

    ConditionalGateCell cell(small_dims(), 2);
    RecurrentState prev = some_state(4);
    Tensor d_log_probs = {-1.0f, 0.0f};

    StepCache cache;
    cell.step(0, 1, prev, cache);
    CellParameters grads = cell.zero_gradients();
    cell.step_backward(cache, d_log_probs, RecurrentState::zeros(4), grads);

    for (float v : grads.input.from_input.weight.storage()) assert(v == 0.0f);
    for (float v : grads.input.from_hidden.bias.storage()) assert(v == 0.0f);
    assert(std::abs(sum(grads.input_capitalized.from_input.bias)) > 0.0f);

    // Only the looked-up embedding row receives gradient
    for (size_t row = 1; row < 3; ++row) {
        for (size_t k = 0; k < 3; ++k) {
            assert(grads.embeddings.at(row, k) == 0.0f);
        }
    }

    std::cout << "  Gradient routing: PASSED" << std::endl;
}

int main() {
    std::cout << "=== Conditional-Gate Cell Test Suite ===" << std::endl << std::endl;

    test_step_shapes_and_distribution();
    test_step_is_deterministic();
    test_capitalization_selects_input_gate();
    test_handcrafted_step();
    test_step_errors();
    test_parameter_layout();
    test_step_backward_matches_finite_differences();
    test_unused_input_gate_gets_no_gradient();

    std::cout << std::endl << "=== All tests PASSED ===" << std::endl;
    return 0;
}
