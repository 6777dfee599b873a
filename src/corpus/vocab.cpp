#include "corpus/vocab.hpp"
#include <stdexcept>

namespace cpp_tagger {
namespace corpus {

// =============================================================================
// Vocab
// =============================================================================

Vocab Vocab::from_tokens(const std::vector<std::string>& tokens,
                         const std::string& unk_token) {
    Vocab vocab;
    vocab.unk_token_ = unk_token;

    for (const auto& token : tokens) {
        TokenId id = static_cast<TokenId>(vocab.id_to_token_.size());
        if (!vocab.token_to_id_.emplace(token, id).second) {
            throw std::invalid_argument("Duplicate vocabulary token: " + token);
        }
        vocab.id_to_token_.push_back(token);
    }

    auto it = vocab.token_to_id_.find(unk_token);
    if (it == vocab.token_to_id_.end()) {
        throw std::invalid_argument("Vocabulary lacks the unknown token '" + unk_token + "'");
    }
    vocab.unk_id_ = it->second;
    return vocab;
}

Vocab Vocab::build(const std::vector<std::vector<std::string>>& sentences,
                   const std::string& unk_token) {
    std::vector<std::string> tokens;
    std::unordered_map<std::string, TokenId> seen;

    for (const auto& sentence : sentences) {
        for (const auto& word : sentence) {
            if (word == unk_token) {
                continue;
            }
            if (seen.emplace(word, static_cast<TokenId>(tokens.size())).second) {
                tokens.push_back(word);
            }
        }
    }
    tokens.push_back(unk_token);
    return from_tokens(tokens, unk_token);
}

Vocab::TokenId Vocab::token_to_id(const std::string& token) const {
    auto it = token_to_id_.find(token);
    if (it != token_to_id_.end()) {
        return it->second;
    }
    return unk_id_;
}

std::optional<std::string> Vocab::id_to_token(TokenId id) const {
    if (id >= 0 && static_cast<size_t>(id) < id_to_token_.size()) {
        return id_to_token_[id];
    }
    return std::nullopt;
}

bool Vocab::contains(const std::string& token) const {
    return token_to_id_.find(token) != token_to_id_.end();
}

// =============================================================================
// TagSet
// =============================================================================

void TagSet::insert(const std::string& tag) {
    TagId id = static_cast<TagId>(id_to_tag_.size());
    if (tag_to_id_.emplace(tag, id).second) {
        id_to_tag_.push_back(tag);
    }
}

TagSet TagSet::from_tags(const std::vector<std::string>& tags) {
    TagSet set;
    for (const auto& tag : tags) {
        if (set.contains(tag)) {
            throw std::invalid_argument("Duplicate tag: " + tag);
        }
        set.insert(tag);
    }
    return set;
}

TagSet TagSet::build(const std::vector<std::vector<std::string>>& tag_sequences) {
    TagSet set;
    for (const auto& sequence : tag_sequences) {
        for (const auto& tag : sequence) {
            set.insert(tag);
        }
    }
    return set;
}

TagSet::TagId TagSet::tag_to_id(const std::string& tag) const {
    auto it = tag_to_id_.find(tag);
    if (it == tag_to_id_.end()) {
        throw std::invalid_argument("Unknown tag: " + tag);
    }
    return it->second;
}

const std::string& TagSet::id_to_tag(TagId id) const {
    if (id < 0 || static_cast<size_t>(id) >= id_to_tag_.size()) {
        throw std::out_of_range("Tag id " + std::to_string(id) + " outside tag set of size " +
                                std::to_string(id_to_tag_.size()));
    }
    return id_to_tag_[id];
}

bool TagSet::contains(const std::string& tag) const {
    return tag_to_id_.find(tag) != tag_to_id_.end();
}

} // namespace corpus
} // namespace cpp_tagger
