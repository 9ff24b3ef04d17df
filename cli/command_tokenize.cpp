#include "cli_common.hpp"
#include <common/logging.hpp>
#include <diagnostics/diagnostics.hpp>
#include <lexer/tokenizer.hpp>
#include <serialization/token_document.hpp>
#include <text/file_registry.hpp>
#include <iostream>

namespace voxlasm::cli {

int command_tokenize(int argc, char** argv) {
    auto log = voxlasm::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_paths.size() != 1) {
            std::cerr << "Usage: voxlasm tokenize <input.vasm> [-o <output.tokens.json>] [-c <config.json>]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -n, --numeric <mode>  Default numeric literal mode: signed, unsigned, float\n";
            std::cerr << "  -c, --config <file>   Configuration file with a \"tokenizer\" section\n";
            return ctx.help ? EXIT_OK : EXIT_SOURCE_ERROR;
        }

        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        const std::string& input_path = ctx.input_paths.front();
        std::string output_path = resolve_output_path(input_path, ".tokens.json", ctx.output_path);
        lexer::TokenizerConfig config = load_tokenizer_config(ctx);

        log->info("Tokenizing: {}", input_path);

        text::FileRegistry registry;
        auto file = registry.load(input_path);

        std::vector<lexer::Token> tokens;
        try {
            tokens = lexer::Tokenizer::tokenize(file, config.default_numeric);
        } catch (const lexer::LexError& e) {
            log->error("Lex error: {} ({})", e.what(), e.kind_name());
            std::cerr << diagnostics::render(e);
            return EXIT_SOURCE_ERROR;
        }

        size_t token_count = tokens.size();
        json::write_token_document(output_path,
                                   json::make_token_document(file, std::move(tokens), config));

        log->info("Wrote tokens to {}", output_path);
        std::cerr << "Wrote " << output_path << " (" << token_count << " tokens)\n";

        return EXIT_OK;

    } catch (const NotImplementedError& e) {
        log->error("Internal error: {}", e.what());
        std::cerr << "Internal error: " << e.what() << "\n";
        return EXIT_INTERNAL_ERROR;
    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_SOURCE_ERROR;
    }
}

}  // namespace voxlasm::cli
