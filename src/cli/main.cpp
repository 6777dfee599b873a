#include "cli/args.hpp"
#include "corpus/corpus.hpp"
#include "model/tagger.hpp"
#include "model/trainer.hpp"

#include <iostream>
#include <fstream>
#include <iomanip>

#include "spdlog/spdlog.h"

namespace {

std::vector<std::string> read_lines_from_file(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }

    return lines;
}

void write_tagged(std::ostream& out,
                  const std::vector<std::string>& words,
                  const std::vector<std::string>& tags) {
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) out << ' ';
        out << words[i] << '/' << tags[i];
    }
    out << '\n';
}

int run_train(const cpp_tagger::cli::ParsedArgs& args) {
    using namespace cpp_tagger;

    auto sentences = corpus::read_tagged_corpus(args.corpus_path);
    if (sentences.empty()) {
        std::cerr << "Error: No sentences in " << args.corpus_path << "\n";
        return 1;
    }

    corpus::CorpusSplit split = corpus::split_corpus(sentences, args.test_fraction);
    if (split.train.empty()) {
        std::cerr << "Error: Test fraction leaves no training sentences\n";
        return 1;
    }
    spdlog::info("{} sentences: {} train, {} test",
                 sentences.size(), split.train.size(), split.test.size());

    model::Tagger tagger = model::Trainer::create_tagger(split.train, args.cell);
    model::Trainer trainer(args.trainer);
    auto history = trainer.train(tagger, split.train);

    tagger.save(args.output_path);

    std::cout << "Final training loss: " << std::fixed << std::setprecision(4)
              << history.back().mean_loss << "\n";
    if (!split.test.empty()) {
        double accuracy = model::Trainer::evaluate(tagger, split.test);
        std::cout << "Held-out accuracy: " << std::setprecision(4) << accuracy << "\n";
    }
    return 0;
}

int run_tag(const cpp_tagger::cli::ParsedArgs& args) {
    using namespace cpp_tagger;

    model::Tagger tagger = model::Tagger::load(args.model_path);

    std::vector<std::string> texts = args.texts;
    if (args.input_file.has_value()) {
        auto file_texts = read_lines_from_file(args.input_file.value());
        texts.insert(texts.end(), file_texts.begin(), file_texts.end());
    }

    for (const auto& text : texts) {
        std::vector<std::string> words = corpus::split_whitespace(text);
        if (words.empty()) {
            continue;
        }
        write_tagged(std::cout, words, tagger.tag(words));
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        cpp_tagger::cli::ArgParser::print_usage(argv[0]);
        return 1;
    }

    cpp_tagger::cli::ArgParser parser(argc, argv);
    auto args = parser.parse();

    if (args.has_error) {
        std::cerr << "Error: " << args.error_message << "\n";
        cpp_tagger::cli::ArgParser::print_usage(argv[0]);
        return 1;
    }

    if (args.show_help) {
        cpp_tagger::cli::ArgParser::print_help(argv[0]);
        return 0;
    }

    spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::info);

    try {
        if (args.command == cpp_tagger::cli::Command::TRAIN) {
            return run_train(args);
        }
        return run_tag(args);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
