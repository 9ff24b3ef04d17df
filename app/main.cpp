#include <iostream>
#include <string>

#include "cli_common.hpp"
#include "logging.hpp"

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Lexical analysis for Voxl VM assembly sources.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  tokenize <input.vasm> [-o out.tokens.json]  Write the token stream as JSON\n";
    std::cerr << "  check <input.vasm>...                       Lex files and report errors\n";
    std::cerr << "  show <input.tokens.json>                    List a token file against its source\n";
    std::cerr << "  help                                        Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Common options:\n";
    std::cerr << "  -n, --numeric <mode>  Default numeric literal mode (signed, unsigned, float)\n";
    std::cerr << "  -c, --config <file>   JSON configuration file\n";
    std::cerr << "  -v, --verbose         Debug logging\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  VOXLASM_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    if (command == "help" || command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    auto log = voxlasm::logging::get_logger();
    log->debug("Running command: {}", command);

    if (command == "tokenize") {
        return voxlasm::cli::command_tokenize(argc, argv);
    }
    if (command == "check") {
        return voxlasm::cli::command_check(argc, argv);
    }
    if (command == "show") {
        return voxlasm::cli::command_show(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
