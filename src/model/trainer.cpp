#include "../../include/model/trainer.hpp"
#include "../../include/model/sequence_runner.hpp"
#include <algorithm>
#include <chrono>
#include <numeric>
#include <random>
#include <stdexcept>

#include "spdlog/sinks/stdout_color_sinks.h"

namespace cpp_tagger {
namespace model {

std::shared_ptr<spdlog::logger> Trainer::log_ = spdlog::stderr_color_mt("Trainer");

Trainer::Trainer(const TrainerConfig& config)
    : config_(config), optimizer_(config.learning_rate, config.clip_value) {}

Tagger Trainer::create_tagger(const std::vector<corpus::TaggedSentence>& sentences,
                              const CellConfig& config) {
    if (sentences.empty()) {
        throw std::invalid_argument("Cannot build a tagger from an empty corpus");
    }

    std::vector<std::vector<std::string>> words;
    std::vector<std::vector<std::string>> tags;
    words.reserve(sentences.size());
    tags.reserve(sentences.size());
    for (const auto& sentence : sentences) {
        words.push_back(sentence.words);
        tags.push_back(sentence.tags);
    }

    corpus::Vocab vocab = corpus::Vocab::build(words);
    corpus::TagSet tag_set = corpus::TagSet::build(tags);
    log_->info("vocabulary: {} words (unknown id {}), tag set: {} tags",
               vocab.size(), vocab.unk_id(), tag_set.size());

    return Tagger(std::move(vocab), std::move(tag_set), config);
}

float Trainer::train_sentence(Tagger& tagger, const corpus::EncodedSentence& sentence) const {
    SequenceRunner runner(tagger.cell());
    TrainStepResult result = runner.train_step(sentence.word_ids, sentence.cap_flags,
                                               sentence.tag_ids);
    optimizer_.apply(tagger.cell().parameters(), result.gradients);
    return result.loss;
}

std::vector<EpochStats> Trainer::train(Tagger& tagger,
                                       const std::vector<corpus::TaggedSentence>& sentences) const {
    if (sentences.empty()) {
        throw std::invalid_argument("No training sentences");
    }

    std::vector<corpus::EncodedSentence> encoded;
    encoded.reserve(sentences.size());
    for (const auto& sentence : sentences) {
        encoded.push_back(corpus::encode_tagged(sentence, tagger.vocab(), tagger.tags()));
    }

    std::vector<size_t> order(encoded.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::mt19937 gen(config_.seed);

    log_->info("training on {} sentences for {} epochs (lr {}, clip {})",
               encoded.size(), config_.epochs, config_.learning_rate, config_.clip_value);

    std::vector<EpochStats> history;
    history.reserve(config_.epochs);

    for (size_t epoch = 1; epoch <= config_.epochs; ++epoch) {
        auto start = std::chrono::steady_clock::now();
        if (config_.shuffle) {
            std::shuffle(order.begin(), order.end(), gen);
        }

        double total_loss = 0.0;
        for (size_t n = 0; n < order.size(); ++n) {
            total_loss += train_sentence(tagger, encoded[order[n]]);
            if ((n + 1) % 1000 == 0) {
                log_->debug("epoch {}: {} / {} sentences, running loss {:.4f}",
                            epoch, n + 1, order.size(), total_loss / static_cast<double>(n + 1));
            }
        }

        EpochStats stats;
        stats.epoch = epoch;
        stats.sentences = order.size();
        stats.mean_loss = static_cast<float>(total_loss / static_cast<double>(order.size()));
        history.push_back(stats);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        log_->info("epoch {}/{}: mean loss {:.4f} ({} ms)",
                   epoch, config_.epochs, stats.mean_loss, elapsed.count());
    }

    return history;
}

double Trainer::evaluate(const Tagger& tagger,
                         const std::vector<corpus::TaggedSentence>& sentences) {
    size_t total = 0;
    size_t correct = 0;

    for (const auto& sentence : sentences) {
        if (sentence.size() == 0) {
            continue;
        }
        std::vector<std::string> predicted = tagger.tag(sentence.words);
        for (size_t t = 0; t < predicted.size() && t < sentence.tags.size(); ++t) {
            if (predicted[t] == sentence.tags[t]) {
                ++correct;
            }
        }
        total += sentence.tags.size();
    }

    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(correct) / static_cast<double>(total);
}

} // namespace model
} // namespace cpp_tagger
