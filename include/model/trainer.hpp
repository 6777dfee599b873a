#ifndef CPP_TAGGER_MODEL_TRAINER_HPP
#define CPP_TAGGER_MODEL_TRAINER_HPP

#include "tagger.hpp"
#include "optimizer.hpp"
#include "../corpus/corpus.hpp"
#include <memory>
#include <vector>

#include "spdlog/spdlog.h"

namespace cpp_tagger {
namespace model {

struct TrainerConfig {
    size_t epochs = 5;
    float learning_rate = 0.1f;
    float clip_value = 5.0f;     // <= 0 disables gradient clipping
    unsigned seed = DEFAULT_SEED;
    bool shuffle = true;         // reshuffle sentence order every epoch
};

struct EpochStats {
    size_t epoch = 0;
    float mean_loss = 0.0f;
    size_t sentences = 0;
};

// Sentence-at-a-time training: forward, backward and update complete for one
// sentence before the next begins
class Trainer {
public:
    explicit Trainer(const TrainerConfig& config);

    // Vocabulary and tag set built from `sentences`, then a fresh tagger
    static Tagger create_tagger(const std::vector<corpus::TaggedSentence>& sentences,
                                const CellConfig& config);

    // Runs config.epochs passes over `sentences`; returns one entry per epoch
    std::vector<EpochStats> train(Tagger& tagger,
                                  const std::vector<corpus::TaggedSentence>& sentences) const;

    // One train_step followed by one optimizer update; returns the
    // sentence loss before the update
    float train_sentence(Tagger& tagger, const corpus::EncodedSentence& sentence) const;

    // Fraction of tokens whose predicted tag equals the gold tag.
    // Gold tags outside the tagger's tag set count as errors.
    static double evaluate(const Tagger& tagger,
                           const std::vector<corpus::TaggedSentence>& sentences);

    const TrainerConfig& config() const { return config_; }

private:
    static std::shared_ptr<spdlog::logger> log_;

    TrainerConfig config_;
    Sgd optimizer_;
};

} // namespace model
} // namespace cpp_tagger

#endif // CPP_TAGGER_MODEL_TRAINER_HPP
