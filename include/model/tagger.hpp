#ifndef CPP_TAGGER_MODEL_TAGGER_HPP
#define CPP_TAGGER_MODEL_TAGGER_HPP

#include "cell.hpp"
#include "weights.hpp"
#include "../corpus/vocab.hpp"
#include "../corpus/corpus.hpp"
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

namespace cpp_tagger {
namespace model {

// Cell sizes not implied by the vocabulary and tag set
struct CellConfig {
    size_t embedding_dim = 32;
    size_t hidden_dim = 32;
    unsigned seed = DEFAULT_SEED;
};

// Part-of-speech tagger: words -> vocabulary ids -> conditional-gate cell ->
// greedy tag labels
class Tagger {
public:
    // Fresh, randomly initialized tagger
    Tagger(corpus::Vocab vocab, corpus::TagSet tags, const CellConfig& config);

    // Tagger over saved parameters
    explicit Tagger(SavedModel model);

    static Tagger load(const std::string& path);

    void save(const std::string& path) const;
    void save(std::ostream& stream) const;

    // Unknown words fall back to the vocabulary's unknown id.
    // Throws std::invalid_argument on an empty sentence.
    std::vector<int> tag_ids(const std::vector<std::string>& words) const;
    std::vector<std::string> tag(const std::vector<std::string>& words) const;

    const corpus::Vocab& vocab() const { return vocab_; }
    const corpus::TagSet& tags() const { return tags_; }

    const ConditionalGateCell& cell() const { return cell_; }
    ConditionalGateCell& cell() { return cell_; }

private:
    static std::shared_ptr<spdlog::logger> log_;

    corpus::Vocab vocab_;
    corpus::TagSet tags_;
    ConditionalGateCell cell_;

    static CellDimensions dimensions_for(const corpus::Vocab& vocab,
                                         const corpus::TagSet& tags,
                                         const CellConfig& config);
};

} // namespace model
} // namespace cpp_tagger

#endif // CPP_TAGGER_MODEL_TAGGER_HPP
