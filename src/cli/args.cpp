#include "cli/args.hpp"
#include <cctype>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace cpp_tagger {
namespace cli {

namespace {

// Whole-string numeric parsing; returns false on trailing garbage or overflow
bool parse_unsigned(const char* text, unsigned long& out) {
    // stoul accepts leading whitespace and wraps negative values
    const char* p = text;
    while (std::isspace(static_cast<unsigned char>(*p))) ++p;
    if (*p == '-') return false;
    try {
        size_t pos = 0;
        out = std::stoul(text, &pos);
        return pos == std::strlen(text);
    } catch (const std::logic_error&) {
        return false;
    }
}

bool parse_double(const char* text, double& out) {
    try {
        size_t pos = 0;
        out = std::stod(text, &pos);
        return pos == std::strlen(text);
    } catch (const std::logic_error&) {
        return false;
    }
}

} // anonymous namespace

ArgParser::ArgParser(int argc, char* argv[])
    : argc_(argc), argv_(argv), current_index_(1) {}

bool ArgParser::has_more() const {
    return current_index_ < argc_;
}

const char* ArgParser::advance() {
    if (current_index_ < argc_) {
        return argv_[current_index_++];
    }
    return nullptr;
}

bool ArgParser::is_option(const char* arg) const {
    return arg != nullptr && arg[0] == '-' && arg[1] != '\0';
}

bool ArgParser::matches(const char* arg, const char* short_opt, const char* long_opt) const {
    if (arg == nullptr) return false;
    return (short_opt && std::strcmp(arg, short_opt) == 0) ||
           (long_opt && std::strcmp(arg, long_opt) == 0);
}

const char* ArgParser::value_for() {
    const char* value = advance();
    if (value == nullptr || is_option(value)) {
        return nullptr;
    }
    return value;
}

ParsedArgs ArgParser::error(const std::string& message) {
    ParsedArgs args;
    args.has_error = true;
    args.error_message = message;
    return args;
}

ParsedArgs ArgParser::parse() {
    ParsedArgs args;

    const char* command = advance();
    if (command == nullptr) {
        return error("A command is required (train or tag)");
    }
    if (matches(command, "-h", "--help")) {
        args.show_help = true;
        return args;
    }
    if (std::strcmp(command, "train") == 0) {
        args.command = Command::TRAIN;
    } else if (std::strcmp(command, "tag") == 0) {
        args.command = Command::TAG;
    } else {
        return error("Unknown command: " + std::string(command));
    }
    const bool training = args.command == Command::TRAIN;

    while (has_more()) {
        const char* arg = advance();
        std::string name(arg);

        if (matches(arg, "-h", "--help")) {
            args.show_help = true;
            return args;
        }
        else if (matches(arg, "-v", "--verbose")) {
            args.verbose = true;
        }
        else if (training && matches(arg, "-c", "--corpus")) {
            const char* value = value_for();
            if (value == nullptr) return error("Option " + name + " requires a path argument");
            args.corpus_path = value;
        }
        else if (training && matches(arg, "-o", "--output")) {
            const char* value = value_for();
            if (value == nullptr) return error("Option " + name + " requires a path argument");
            args.output_path = value;
        }
        else if (training && (matches(arg, nullptr, "--epochs") ||
                              matches(arg, nullptr, "--emb") ||
                              matches(arg, nullptr, "--hidden") ||
                              matches(arg, nullptr, "--seed"))) {
            const char* value = value_for();
            unsigned long number = 0;
            if (value == nullptr || !parse_unsigned(value, number)) {
                return error("Option " + name + " requires a non-negative integer");
            }
            if (name == "--epochs") {
                args.trainer.epochs = number;
            } else if (name == "--emb") {
                args.cell.embedding_dim = number;
            } else if (name == "--hidden") {
                args.cell.hidden_dim = number;
            } else {
                args.cell.seed = static_cast<unsigned>(number);
                args.trainer.seed = static_cast<unsigned>(number);
            }
        }
        else if (training && (matches(arg, nullptr, "--lr") ||
                              matches(arg, nullptr, "--clip") ||
                              matches(arg, nullptr, "--test-fraction"))) {
            const char* value = value_for();
            double number = 0.0;
            if (value == nullptr || !parse_double(value, number)) {
                return error("Option " + name + " requires a number");
            }
            if (name == "--lr") {
                args.trainer.learning_rate = static_cast<float>(number);
            } else if (name == "--clip") {
                args.trainer.clip_value = static_cast<float>(number);
            } else {
                args.test_fraction = number;
            }
        }
        else if (training && matches(arg, nullptr, "--no-shuffle")) {
            args.trainer.shuffle = false;
        }
        else if (!training && matches(arg, "-m", "--model")) {
            const char* value = value_for();
            if (value == nullptr) return error("Option " + name + " requires a path argument");
            args.model_path = value;
        }
        else if (!training && matches(arg, "-t", "--text")) {
            const char* value = value_for();
            if (value == nullptr) return error("Option " + name + " requires a text argument");
            args.texts.push_back(value);
        }
        else if (!training && matches(arg, "-f", "--file")) {
            const char* value = value_for();
            if (value == nullptr) return error("Option " + name + " requires a path argument");
            args.input_file = value;
        }
        else if (is_option(arg)) {
            return error("Unknown option for '" + std::string(command) + "': " + name);
        }
        else {
            return error("Unexpected argument: " + name);
        }
    }

    return finish(std::move(args));
}

ParsedArgs ArgParser::finish(ParsedArgs args) {
    if (args.command == Command::TRAIN) {
        if (args.corpus_path.empty()) {
            return error("Corpus path is required (-c/--corpus)");
        }
        if (args.output_path.empty()) {
            return error("Output path is required (-o/--output)");
        }
        if (args.cell.embedding_dim == 0 || args.cell.hidden_dim == 0) {
            return error("--emb and --hidden must be at least 1");
        }
        if (args.trainer.epochs == 0) {
            return error("--epochs must be at least 1");
        }
        if (args.trainer.learning_rate <= 0.0f) {
            return error("--lr must be positive");
        }
        if (args.test_fraction < 0.0 || args.test_fraction >= 1.0) {
            return error("--test-fraction must lie in [0, 1)");
        }
    } else if (args.command == Command::TAG) {
        if (args.model_path.empty()) {
            return error("Model path is required (-m/--model)");
        }
        if (args.texts.empty() && !args.input_file.has_value()) {
            return error("Either -t/--text or -f/--file is required");
        }
    }
    return args;
}

void ArgParser::print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <train|tag> [options]\n";
    std::cerr << "Try '" << program_name << " --help' for more information.\n";
}

void ArgParser::print_help(const char* program_name) {
    std::cout << "cpp_tag - conditional-gate LSTM part-of-speech tagger\n\n";
    std::cout << "Usage: " << program_name << " <train|tag> [options]\n\n";
    std::cout << "train options:\n";
    std::cout << "  -c, --corpus PATH     Tagged corpus, one sentence per line of word/TAG tokens\n";
    std::cout << "  -o, --output PATH     Where to write the trained model (required)\n";
    std::cout << "  --epochs N            Passes over the training sentences (default: 5)\n";
    std::cout << "  --lr X                SGD learning rate (default: 0.1)\n";
    std::cout << "  --clip X              Element-wise gradient clip, 0 disables (default: 5)\n";
    std::cout << "  --emb N               Word embedding width (default: 32)\n";
    std::cout << "  --hidden N            Hidden state width (default: 32)\n";
    std::cout << "  --seed N              Seed for initialization and shuffling (default: 1)\n";
    std::cout << "  --test-fraction X     Hold out the last X of the corpus for accuracy\n";
    std::cout << "  --no-shuffle          Keep corpus order in every epoch\n\n";
    std::cout << "tag options:\n";
    std::cout << "  -m, --model PATH      Trained model file (required)\n";
    std::cout << "  -t, --text TEXT       Whitespace-tokenized sentence (can be repeated)\n";
    std::cout << "  -f, --file PATH       File with one tokenized sentence per line\n\n";
    std::cout << "Common options:\n";
    std::cout << "  -v, --verbose         Debug logging\n";
    std::cout << "  -h, --help            Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " train -c brown.txt -o tagger.bin --epochs 10\n";
    std::cout << "  " << program_name << " tag -m tagger.bin -t \"The dog barks .\"\n";
}

} // namespace cli
} // namespace cpp_tagger
