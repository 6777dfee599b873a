#include "../include/corpus/corpus.hpp"
#include "../include/corpus/vocab.hpp"
#include <iostream>
#include <sstream>
#include <cassert>
#include <stdexcept>

using namespace cpp_tagger::corpus;

void test_capitalization() {
    std::cout << "Testing capitalization flags..." << std::endl;

    assert(capitalization_flag("The") == 1);
    assert(capitalization_flag("dog") == 0);
    assert(capitalization_flag("Z") == 1);
    assert(capitalization_flag("") == 0);
    assert(capitalization_flag("1984") == 0);
    assert(capitalization_flag(".") == 0);
    assert(capitalization_flag("\xC3\x89t\xC3\xA9") == 0);  // non-ASCII initial

    // Only ASCII A-Z counts; UTF-8 uppercase initials are treated as lowercase
    assert(capitalization_flag("\xC3\x89mile") == 0);     // "Émile"
    assert(capitalization_flag("\xD0\x9C\xD0\xBE\xD1\x81\xD0\xBA\xD0\xB2\xD0\xB0") == 0);  // "Москва"
    Vocab vocab = Vocab::from_tokens({"UNK"});
    EncodedSentence accented = encode_sentence({"\xC3\x89mile", "Emile"}, vocab);
    assert((accented.cap_flags == std::vector<int>{0, 1}));

    std::vector<int> flags = capitalization_flags({"Mary", "had", "A", "lamb"});
    assert((flags == std::vector<int>{1, 0, 1, 0}));

    std::cout << "  Capitalization flags: PASSED" << std::endl;
}

void test_vocab() {
    std::cout << "Testing vocabulary..." << std::endl;

    Vocab vocab = Vocab::build({{"The", "dog", "barks"}, {"the", "dog", "sleeps"}});

    // First-appearance order, case-sensitive, UNK last
    assert(vocab.size() == 6);
    assert(vocab.token_to_id("The") == 0);
    assert(vocab.token_to_id("dog") == 1);
    assert(vocab.token_to_id("barks") == 2);
    assert(vocab.token_to_id("the") == 3);
    assert(vocab.token_to_id("sleeps") == 4);
    assert(vocab.unk_id() == 5);
    assert(vocab.unk_token() == "UNK");

    assert(vocab.token_to_id("cat") == vocab.unk_id());
    assert(vocab.contains("dog"));
    assert(!vocab.contains("cat"));
    assert(vocab.id_to_token(2).value() == "barks");
    assert(!vocab.id_to_token(6).has_value());
    assert(!vocab.id_to_token(-1).has_value());

    Vocab fixed = Vocab::from_tokens({"The", "dog", "UNK"});
    assert(fixed.unk_id() == 2);

    bool threw = false;
    try {
        Vocab::from_tokens({"a", "b", "a", "UNK"});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Vocab::from_tokens({"a", "b"});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Vocabulary: PASSED" << std::endl;
}

void test_tag_set() {
    std::cout << "Testing tag set..." << std::endl;

    TagSet tags = TagSet::build({{"DET", "NN", "VB"}, {"DET", "NN", "VB", "."}});
    assert(tags.size() == 4);
    assert(tags.tag_to_id("DET") == 0);
    assert(tags.tag_to_id(".") == 3);
    assert(tags.id_to_tag(2) == "VB");
    assert(tags.contains("NN"));

    bool threw = false;
    try {
        tags.tag_to_id("JJ");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        tags.id_to_tag(4);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        TagSet::from_tags({"DET", "DET"});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Tag set: PASSED" << std::endl;
}

void test_parse_tagged_lines() {
    std::cout << "Testing tagged line parsing..." << std::endl;

    TaggedSentence sentence = parse_tagged_line("The/DET  dog/NN\tbarks/VB ./.", 1);
    assert(sentence.size() == 4);
    assert(sentence.words[0] == "The" && sentence.tags[0] == "DET");
    assert(sentence.words[2] == "barks" && sentence.tags[2] == "VB");
    assert(sentence.words[3] == "." && sentence.tags[3] == ".");

    // The last slash separates word from tag
    TaggedSentence slashed = parse_tagged_line("1/2/CD and/or/CC", 1);
    assert(slashed.words[0] == "1/2" && slashed.tags[0] == "CD");
    assert(slashed.words[1] == "and/or" && slashed.tags[1] == "CC");

    for (const char* bad : {"dog", "/NN", "dog/"}) {
        bool threw = false;
        try {
            parse_tagged_line(std::string("The/DET ") + bad, 7);
        } catch (const std::runtime_error& e) {
            threw = true;
            assert(std::string(e.what()).find("Line 7") != std::string::npos);
        }
        assert(threw);
    }

    std::cout << "  Tagged line parsing: PASSED" << std::endl;
}

void test_read_corpus() {
    std::cout << "Testing corpus reading..." << std::endl;

    std::istringstream stream(
        "The/DET dog/NN barks/VB\r\n"
        "\n"
        "   \n"
        "A/DET cat/NN sleeps/VB ./.\n");

    std::vector<TaggedSentence> sentences = read_tagged_corpus(stream);
    assert(sentences.size() == 2);
    assert(sentences[0].size() == 3);
    assert(sentences[0].tags[2] == "VB");  // trailing \r stripped
    assert(sentences[1].words[0] == "A");

    std::istringstream broken("The/DET dog/NN\nno tags here\n");
    bool threw = false;
    try {
        read_tagged_corpus(broken);
    } catch (const std::runtime_error& e) {
        threw = true;
        assert(std::string(e.what()).find("Line 2") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        read_tagged_corpus(std::string("/nonexistent/corpus.txt"));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Corpus reading: PASSED" << std::endl;
}

void test_encoding() {
    std::cout << "Testing sentence encoding..." << std::endl;

    Vocab vocab = Vocab::from_tokens({"The", "dog", "UNK"});
    TagSet tags = TagSet::from_tags({"DET", "NOUN"});

    EncodedSentence plain = encode_sentence(split_whitespace("The cat  dog"), vocab);
    assert((plain.word_ids == std::vector<int>{0, 2, 1}));
    assert((plain.cap_flags == std::vector<int>{1, 0, 0}));
    assert(plain.tag_ids.empty());

    TaggedSentence sentence;
    sentence.words = {"The", "dog"};
    sentence.tags = {"DET", "NOUN"};
    EncodedSentence tagged = encode_tagged(sentence, vocab, tags);
    assert((tagged.word_ids == std::vector<int>{0, 1}));
    assert((tagged.tag_ids == std::vector<int>{0, 1}));

    sentence.tags = {"DET", "VERB"};
    bool threw = false;
    try {
        encode_tagged(sentence, vocab, tags);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    sentence.tags = {"DET"};
    threw = false;
    try {
        encode_tagged(sentence, vocab, tags);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Sentence encoding: PASSED" << std::endl;
}

void test_split() {
    std::cout << "Testing corpus split..." << std::endl;

    std::vector<TaggedSentence> sentences(10);
    for (size_t i = 0; i < sentences.size(); ++i) {
        sentences[i].words = {"w" + std::to_string(i)};
        sentences[i].tags = {"T"};
    }

    CorpusSplit split = split_corpus(sentences, 0.2);
    assert(split.train.size() == 8);
    assert(split.test.size() == 2);
    assert(split.train.front().words[0] == "w0");
    assert(split.test.front().words[0] == "w8");

    CorpusSplit all_train = split_corpus(sentences, 0.0);
    assert(all_train.train.size() == 10);
    assert(all_train.test.empty());

    // round(10 * 0.25) = 3
    assert(split_corpus(sentences, 0.25).test.size() == 3);

    for (double bad : {-0.1, 1.0, 1.5}) {
        bool threw = false;
        try {
            split_corpus(sentences, bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "  Corpus split: PASSED" << std::endl;
}

int main() {
    std::cout << "=== Corpus Test Suite ===" << std::endl << std::endl;

    test_capitalization();
    test_vocab();
    test_tag_set();
    test_parse_tagged_lines();
    test_read_corpus();
    test_encoding();
    test_split();

    std::cout << std::endl << "=== All tests PASSED ===" << std::endl;
    return 0;
}
