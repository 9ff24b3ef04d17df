#include "cli_common.hpp"
#include <common/logging.hpp>
#include <diagnostics/diagnostics.hpp>
#include <lexer/tokenizer.hpp>
#include <text/file_registry.hpp>
#include <omp.h>
#include <iostream>

namespace voxlasm::cli {

namespace {

struct CheckResult {
    size_t token_count = 0;
    std::string diagnostic;      // Rendered lex error, empty on success
    std::string internal_error;  // Unimplemented feature or other failure
};

}  // namespace

int command_check(int argc, char** argv) {
    auto log = voxlasm::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_paths.empty()) {
            std::cerr << "Usage: voxlasm check <input.vasm>... [-n <mode>] [-c <config.json>]\n";
            std::cerr << "Lexes every input and reports the first error in each file.\n";
            return ctx.help ? EXIT_OK : EXIT_SOURCE_ERROR;
        }

        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        lexer::TokenizerConfig config = load_tokenizer_config(ctx);

        // Registration is sequential; lexing only reads the shared files
        text::FileRegistry registry;
        for (const auto& path : ctx.input_paths) {
            registry.load(path);
        }

        const auto& files = registry.files();
        std::vector<CheckResult> results(files.size());

        log->info("Checking {} files with up to {} threads", files.size(), omp_get_max_threads());

        // Independent tokenizers share no mutable state
        #pragma omp parallel for schedule(dynamic) if(files.size() > 1)
        for (size_t i = 0; i < files.size(); ++i) {
            try {
                results[i].token_count =
                    lexer::Tokenizer::tokenize(files[i], config.default_numeric).size();
            } catch (const lexer::LexError& e) {
                results[i].diagnostic = diagnostics::render(e);
            } catch (const std::exception& e) {
                results[i].internal_error = e.what();
            }
        }

        size_t failed = 0;
        bool internal = false;
        for (size_t i = 0; i < files.size(); ++i) {
            const auto& result = results[i];
            if (!result.internal_error.empty()) {
                log->error("{}: internal error: {}", files[i]->name, result.internal_error);
                internal = true;
                ++failed;
            } else if (!result.diagnostic.empty()) {
                std::cerr << result.diagnostic;
                ++failed;
            } else {
                log->debug("{}: {} tokens", files[i]->name, result.token_count);
            }
        }

        std::cerr << "Checked " << files.size() << " file(s): " << failed << " failed\n";

        if (internal) return EXIT_INTERNAL_ERROR;
        return failed == 0 ? EXIT_OK : EXIT_SOURCE_ERROR;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_SOURCE_ERROR;
    }
}

}  // namespace voxlasm::cli
