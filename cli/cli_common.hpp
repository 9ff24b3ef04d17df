#ifndef VOXLASM_CLI_COMMON_HPP
#define VOXLASM_CLI_COMMON_HPP

#include <lexer/tokenizer.hpp>
#include <serialization/config_json.hpp>
#include <serialization/token_document.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace voxlasm::cli {

// Common context for all CLI commands
struct CommandContext {
    std::vector<std::string> input_paths;
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<lexer::NumericMode> numeric_mode;
    bool verbose = false;
    bool help = false;
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                ctx.output_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-o/--output requires an argument");
            }
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                ctx.config_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-c/--config requires an argument");
            }
        } else if (arg == "-n" || arg == "--numeric") {
            if (i + 1 < argc) {
                std::string name = argv[++i];
                ctx.numeric_mode = lexer::numeric_mode_from_name(name);
                if (!ctx.numeric_mode) {
                    throw std::runtime_error("Unknown numeric mode: " + name +
                                             " (expected signed, unsigned or float)");
                }
                ++i;
            } else {
                throw std::runtime_error("-n/--numeric requires an argument");
            }
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (!arg.empty() && arg[0] != '-') {
            ctx.input_paths.push_back(arg);
            ++i;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Resolve output path: if empty, generate from input path with given suffix
inline std::string resolve_output_path(const std::string& input,
                                       const std::string& suffix,
                                       const std::string& provided_output) {
    if (!provided_output.empty()) {
        return provided_output;
    }

    size_t dot_pos = input.find_last_of('.');
    size_t slash_pos = input.find_last_of('/');

    // Make sure dot comes after last slash (if any)
    if (dot_pos != std::string::npos &&
        (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        return input.substr(0, dot_pos) + suffix;
    } else {
        return input + suffix;
    }
}

// Config file first, then the --numeric override
inline lexer::TokenizerConfig load_tokenizer_config(const CommandContext& ctx) {
    lexer::TokenizerConfig config;
    if (ctx.config_path.has_value()) {
        config = tokenizer_config_from_json(json::read_json_file(ctx.config_path.value()));
    }
    if (ctx.numeric_mode.has_value()) {
        config.default_numeric = ctx.numeric_mode.value();
    }
    return config;
}

// Exit codes shared by all commands
constexpr int EXIT_OK = 0;
constexpr int EXIT_SOURCE_ERROR = 1;
constexpr int EXIT_INTERNAL_ERROR = 2;

// Command function declarations
int command_tokenize(int argc, char** argv);
int command_check(int argc, char** argv);
int command_show(int argc, char** argv);

}  // namespace voxlasm::cli

#endif // VOXLASM_CLI_COMMON_HPP
