#include "cli_common.hpp"
#include <common/logging.hpp>
#include <isa/instruction_set.hpp>
#include <serialization/token_document.hpp>
#include <text/file_registry.hpp>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace voxlasm::cli {

namespace {

// "<line>:<col>  <type>  <text>  <payload>"
std::string format_token(const lexer::Token& token) {
    std::ostringstream oss;
    oss << token.range.start.row + 1 << ":" << token.range.start.column + 1 << "\t"
        << lexer::token_type_name(token.type) << "\t" << token.range.text();

    if (lexer::is_directive(token.type)) {
        if (auto keyword = lexer::directive_keyword(token.type)) {
            oss << "\tdirective " << *keyword;
        }
    } else if (token.opcode) {
        oss << "\topcode 0x" << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<unsigned>(*token.opcode) << std::dec;
        if (auto name = isa::instruction_name(*token.opcode)) {
            oss << " (" << *name << ")";
        }
    } else if (token.reg) {
        oss << "\tregister " << static_cast<unsigned>(*token.reg);
    } else if (token.unsigned_value) {
        oss << "\tvalue " << *token.unsigned_value;
    } else if (token.signed_value) {
        oss << "\tvalue " << *token.signed_value;
    }

    return oss.str();
}

}  // namespace

int command_show(int argc, char** argv) {
    auto log = voxlasm::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_paths.size() != 1) {
            std::cerr << "Usage: voxlasm show <input.tokens.json>\n";
            std::cerr << "Lists a token file against its source, one token per line.\n";
            return ctx.help ? EXIT_OK : EXIT_SOURCE_ERROR;
        }

        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        log->info("Reading tokens from: {}", ctx.input_paths.front());

        text::FileRegistry registry;
        json::TokenDocument doc = json::read_token_document(ctx.input_paths.front(), registry);

        log->debug("{} tokens from {} ({} mode, written {})", doc.tokens.size(), doc.file->name,
                   lexer::numeric_mode_name(doc.config.default_numeric), doc.timestamp);

        for (const auto& token : doc.tokens) {
            std::cout << format_token(token) << "\n";
        }

        return EXIT_OK;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_SOURCE_ERROR;
    }
}

}  // namespace voxlasm::cli
