#ifndef CPP_TAGGER_CLI_ARGS_HPP
#define CPP_TAGGER_CLI_ARGS_HPP

#include "model/tagger.hpp"
#include "model/trainer.hpp"
#include <string>
#include <vector>
#include <optional>

namespace cpp_tagger {
namespace cli {

enum class Command {
    NONE,
    TRAIN,
    TAG
};

struct ParsedArgs {
    Command command = Command::NONE;

    // train
    std::string corpus_path;
    std::string output_path;
    model::CellConfig cell;
    model::TrainerConfig trainer;
    double test_fraction = 0.0;

    // tag
    std::string model_path;
    std::vector<std::string> texts;
    std::optional<std::string> input_file;

    bool verbose = false;
    bool show_help = false;
    std::string error_message;
    bool has_error = false;
};

class ArgParser {
public:
    ArgParser(int argc, char* argv[]);

    ParsedArgs parse();

    static void print_usage(const char* program_name);
    static void print_help(const char* program_name);

private:
    int argc_;
    char** argv_;
    int current_index_;

    bool has_more() const;
    const char* advance();

    bool is_option(const char* arg) const;
    bool matches(const char* arg, const char* short_opt, const char* long_opt) const;

    // Next argument as an option value; nullptr if missing
    const char* value_for();

    ParsedArgs error(const std::string& message);

    // Checks required options of the selected command
    ParsedArgs finish(ParsedArgs args);
};

} // namespace cli
} // namespace cpp_tagger

#endif // CPP_TAGGER_CLI_ARGS_HPP
