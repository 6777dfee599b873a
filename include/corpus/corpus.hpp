#ifndef CPP_TAGGER_CORPUS_CORPUS_HPP
#define CPP_TAGGER_CORPUS_CORPUS_HPP

#include "vocab.hpp"
#include <istream>
#include <string>
#include <vector>

namespace cpp_tagger {
namespace corpus {

// A sentence with one gold tag per word
struct TaggedSentence {
    std::vector<std::string> words;
    std::vector<std::string> tags;

    size_t size() const { return words.size(); }
};

// Integer form of a sentence as consumed by the sequence runner.
// tag_ids is empty for untagged input.
struct EncodedSentence {
    std::vector<int> word_ids;
    std::vector<int> cap_flags;
    std::vector<int> tag_ids;
};

struct CorpusSplit {
    std::vector<TaggedSentence> train;
    std::vector<TaggedSentence> test;
};

// 1 if the first byte of `token` is an ASCII uppercase letter, else 0
int capitalization_flag(const std::string& token);

std::vector<int> capitalization_flags(const std::vector<std::string>& tokens);

// Split on runs of whitespace
std::vector<std::string> split_whitespace(const std::string& text);

// Parse one "word/TAG word/TAG ..." line. The last '/' of each token
// separates word and tag, so words may themselves contain slashes.
// Throws std::runtime_error naming `line_number` on a malformed token.
TaggedSentence parse_tagged_line(const std::string& line, size_t line_number);

// One sentence per line; blank lines are skipped
std::vector<TaggedSentence> read_tagged_corpus(std::istream& stream);
std::vector<TaggedSentence> read_tagged_corpus(const std::string& path);

// Unknown words map to the vocabulary's unknown id
EncodedSentence encode_sentence(const std::vector<std::string>& words, const Vocab& vocab);

// Throws std::invalid_argument for a tag outside `tags`
EncodedSentence encode_tagged(const TaggedSentence& sentence,
                              const Vocab& vocab, const TagSet& tags);

// The last round(n * test_fraction) sentences become the test portion.
// test_fraction must lie in [0, 1).
CorpusSplit split_corpus(const std::vector<TaggedSentence>& sentences, double test_fraction);

} // namespace corpus
} // namespace cpp_tagger

#endif // CPP_TAGGER_CORPUS_CORPUS_HPP
