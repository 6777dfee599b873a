#ifndef CPP_TAGGER_CORPUS_VOCAB_HPP
#define CPP_TAGGER_CORPUS_VOCAB_HPP

#include <string>
#include <unordered_map>
#include <vector>
#include <optional>
#include <cstdint>

namespace cpp_tagger {
namespace corpus {

// Word <-> id mapping with one reserved id for unknown words
class Vocab {
public:
    using TokenId = int32_t;

    static constexpr const char* UNK_TOKEN = "UNK";

    Vocab() = default;

    // Ids follow list order. `unk_token` must appear in `tokens`.
    // Throws std::invalid_argument on duplicates or a missing unknown token.
    static Vocab from_tokens(const std::vector<std::string>& tokens,
                             const std::string& unk_token = UNK_TOKEN);

    // Ids in order of first appearance, unknown token appended last
    static Vocab build(const std::vector<std::vector<std::string>>& sentences,
                       const std::string& unk_token = UNK_TOKEN);

    size_t size() const { return id_to_token_.size(); }

    // Returns the unknown id for words not in the vocabulary
    TokenId token_to_id(const std::string& token) const;

    std::optional<std::string> id_to_token(TokenId id) const;

    bool contains(const std::string& token) const;

    TokenId unk_id() const { return unk_id_; }
    const std::string& unk_token() const { return unk_token_; }

    const std::vector<std::string>& tokens() const { return id_to_token_; }

private:
    std::unordered_map<std::string, TokenId> token_to_id_;
    std::vector<std::string> id_to_token_;
    std::string unk_token_;
    TokenId unk_id_ = -1;
};

// Tag label <-> id mapping. Unlike Vocab there is no fallback id.
class TagSet {
public:
    using TagId = int32_t;

    TagSet() = default;

    // Throws std::invalid_argument on duplicates
    static TagSet from_tags(const std::vector<std::string>& tags);

    // Ids in order of first appearance
    static TagSet build(const std::vector<std::vector<std::string>>& tag_sequences);

    size_t size() const { return id_to_tag_.size(); }

    // Throws std::invalid_argument for a label outside the set
    TagId tag_to_id(const std::string& tag) const;

    // Throws std::out_of_range for an id outside the set
    const std::string& id_to_tag(TagId id) const;

    bool contains(const std::string& tag) const;

    const std::vector<std::string>& tags() const { return id_to_tag_; }

private:
    std::unordered_map<std::string, TagId> tag_to_id_;
    std::vector<std::string> id_to_tag_;

    // Adds `tag` if absent
    void insert(const std::string& tag);
};

} // namespace corpus
} // namespace cpp_tagger

#endif // CPP_TAGGER_CORPUS_VOCAB_HPP
