#include "corpus/corpus.hpp"
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cpp_tagger {
namespace corpus {

int capitalization_flag(const std::string& token) {
    if (token.empty()) {
        return 0;
    }
    unsigned char first = static_cast<unsigned char>(token[0]);
    return (first >= 'A' && first <= 'Z') ? 1 : 0;
}

std::vector<int> capitalization_flags(const std::vector<std::string>& tokens) {
    std::vector<int> flags;
    flags.reserve(tokens.size());
    for (const auto& token : tokens) {
        flags.push_back(capitalization_flag(token));
    }
    return flags;
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

TaggedSentence parse_tagged_line(const std::string& line, size_t line_number) {
    TaggedSentence sentence;

    for (const auto& token : split_whitespace(line)) {
        size_t slash = token.rfind('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 == token.size()) {
            throw std::runtime_error("Line " + std::to_string(line_number) +
                                     ": expected word/TAG, got '" + token + "'");
        }
        sentence.words.push_back(token.substr(0, slash));
        sentence.tags.push_back(token.substr(slash + 1));
    }
    return sentence;
}

std::vector<TaggedSentence> read_tagged_corpus(std::istream& stream) {
    std::vector<TaggedSentence> sentences;
    std::string line;
    size_t line_number = 0;

    while (std::getline(stream, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        TaggedSentence sentence = parse_tagged_line(line, line_number);
        if (sentence.size() > 0) {
            sentences.push_back(std::move(sentence));
        }
    }
    return sentences;
}

std::vector<TaggedSentence> read_tagged_corpus(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open corpus file: " + path);
    }
    return read_tagged_corpus(file);
}

EncodedSentence encode_sentence(const std::vector<std::string>& words, const Vocab& vocab) {
    EncodedSentence encoded;
    encoded.word_ids.reserve(words.size());
    for (const auto& word : words) {
        encoded.word_ids.push_back(vocab.token_to_id(word));
    }
    encoded.cap_flags = capitalization_flags(words);
    return encoded;
}

EncodedSentence encode_tagged(const TaggedSentence& sentence,
                              const Vocab& vocab, const TagSet& tags) {
    if (sentence.words.size() != sentence.tags.size()) {
        throw std::invalid_argument("Sentence has " + std::to_string(sentence.words.size()) +
                                    " words but " + std::to_string(sentence.tags.size()) +
                                    " tags");
    }
    EncodedSentence encoded = encode_sentence(sentence.words, vocab);
    encoded.tag_ids.reserve(sentence.tags.size());
    for (const auto& tag : sentence.tags) {
        encoded.tag_ids.push_back(tags.tag_to_id(tag));
    }
    return encoded;
}

CorpusSplit split_corpus(const std::vector<TaggedSentence>& sentences, double test_fraction) {
    if (!(test_fraction >= 0.0 && test_fraction < 1.0)) {
        throw std::invalid_argument("Test fraction must lie in [0, 1)");
    }

    size_t test_count = static_cast<size_t>(
        std::lround(static_cast<double>(sentences.size()) * test_fraction));
    size_t train_count = sentences.size() - test_count;

    CorpusSplit split;
    split.train.assign(sentences.begin(), sentences.begin() + train_count);
    split.test.assign(sentences.begin() + train_count, sentences.end());
    return split;
}

} // namespace corpus
} // namespace cpp_tagger
