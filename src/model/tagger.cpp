#include "../../include/model/tagger.hpp"
#include "../../include/model/sequence_runner.hpp"
#include <stdexcept>

#include "spdlog/sinks/stdout_color_sinks.h"

namespace cpp_tagger {
namespace model {

std::shared_ptr<spdlog::logger> Tagger::log_ = spdlog::stderr_color_mt("Tagger");

CellDimensions Tagger::dimensions_for(const corpus::Vocab& vocab,
                                      const corpus::TagSet& tags,
                                      const CellConfig& config) {
    CellDimensions dims;
    dims.vocab_size = vocab.size();
    dims.embedding_dim = config.embedding_dim;
    dims.hidden_dim = config.hidden_dim;
    dims.tagset_size = tags.size();
    return dims;
}

Tagger::Tagger(corpus::Vocab vocab, corpus::TagSet tags, const CellConfig& config)
    : vocab_(std::move(vocab)),
      tags_(std::move(tags)),
      cell_(dimensions_for(vocab_, tags_, config), config.seed) {
    log_->debug("new tagger: {} words, {} tags, embedding {}, hidden {}, {} parameters",
                vocab_.size(), tags_.size(), config.embedding_dim, config.hidden_dim,
                cell_.parameters().parameter_count());
}

Tagger::Tagger(SavedModel model)
    : vocab_(std::move(model.vocab)),
      tags_(std::move(model.tags)),
      cell_(std::move(model.parameters)) {
    const CellDimensions& dims = cell_.dimensions();
    if (dims.vocab_size != vocab_.size() || dims.tagset_size != tags_.size()) {
        throw std::invalid_argument("Parameters do not match vocabulary/tag set sizes");
    }
}

Tagger Tagger::load(const std::string& path) {
    Tagger tagger(WeightLoader::load(path));
    const CellDimensions& dims = tagger.cell_.dimensions();
    log_->info("loaded {}: {} words, {} tags, embedding {}, hidden {}",
               path, dims.vocab_size, dims.tagset_size, dims.embedding_dim, dims.hidden_dim);
    return tagger;
}

void Tagger::save(const std::string& path) const {
    SavedModel model{cell_.parameters(), vocab_, tags_};
    WeightWriter::save(model, path);
    log_->info("saved model to {}", path);
}

void Tagger::save(std::ostream& stream) const {
    SavedModel model{cell_.parameters(), vocab_, tags_};
    WeightWriter::save(model, stream);
}

std::vector<int> Tagger::tag_ids(const std::vector<std::string>& words) const {
    corpus::EncodedSentence encoded = corpus::encode_sentence(words, vocab_);
    SequenceRunner runner(cell_);
    return runner.predict(encoded.word_ids, encoded.cap_flags);
}

std::vector<std::string> Tagger::tag(const std::vector<std::string>& words) const {
    std::vector<std::string> labels;
    for (int id : tag_ids(words)) {
        labels.push_back(tags_.id_to_tag(id));
    }
    return labels;
}

} // namespace model
} // namespace cpp_tagger
