#ifndef VOXLASM_SERIALIZATION_TOKEN_DOCUMENT_HPP
#define VOXLASM_SERIALIZATION_TOKEN_DOCUMENT_HPP

#include <nlohmann/json.hpp>
#include <lexer/token.hpp>
#include <lexer/tokenizer.hpp>
#include <serialization/config_json.hpp>
#include <serialization/token_json.hpp>
#include <text/file_registry.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace voxlasm::json {

// Bumped whenever the token object layout changes
constexpr const char* TOKEN_FORMAT_VERSION = "1";
constexpr const char* TOKENS_STEP = "tokens";

// The output of `voxlasm tokenize`: one lexed file plus the settings it was
// lexed with. Tokens point into `file`.
struct TokenDocument {
    std::string version = TOKEN_FORMAT_VERSION;
    std::string timestamp;
    std::shared_ptr<const text::FileInfo> file;
    lexer::TokenizerConfig config;
    std::vector<lexer::Token> tokens;
};

// Current time in ISO 8601 format
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return j;
}

inline TokenDocument make_token_document(std::shared_ptr<const text::FileInfo> file,
                                         std::vector<lexer::Token> tokens,
                                         const lexer::TokenizerConfig& config) {
    if (!file) {
        throw std::invalid_argument("Token document requires a source file");
    }
    TokenDocument doc;
    doc.timestamp = get_timestamp();
    doc.file = std::move(file);
    doc.config = config;
    doc.tokens = std::move(tokens);
    return doc;
}

inline nlohmann::json token_document_to_json(const TokenDocument& doc) {
    nlohmann::json j;
    j["version"] = doc.version;
    j["step"] = TOKENS_STEP;
    if (!doc.timestamp.empty()) j["timestamp"] = doc.timestamp;
    j["source_file"] = doc.file->name;
    j["config"] = {{"tokenizer", doc.config}};
    j["stats"] = {
        {"token_count", doc.tokens.size()},
        {"line_count", doc.file->line_count()}
    };
    j["data"] = tokens_to_json(doc.tokens);
    return j;
}

// Rebuild a document against the source it was produced from. Rejects other
// pipeline steps, other format versions, count mismatches and any token whose
// recorded text no longer matches the source.
inline TokenDocument token_document_from_json(const nlohmann::json& j,
                                              std::shared_ptr<const text::FileInfo> file) {
    if (!file) {
        throw std::invalid_argument("Token document requires a source file");
    }

    std::string step = j.value("step", "");
    if (step != TOKENS_STEP) {
        throw std::runtime_error("Expected a \"tokens\" document, found step \"" + step + "\"");
    }

    TokenDocument doc;
    doc.version = j.value("version", "");
    if (doc.version != TOKEN_FORMAT_VERSION) {
        throw std::runtime_error("Unsupported token format version \"" + doc.version + "\"");
    }
    doc.timestamp = j.value("timestamp", "");
    doc.file = file;

    if (j.contains("config")) {
        doc.config = tokenizer_config_from_json(j.at("config"));
    }

    const auto& data = j.at("data");
    if (!data.is_array()) {
        throw std::runtime_error("Token document \"data\" must be an array");
    }
    size_t expected = j.at("stats").at("token_count").get<size_t>();
    if (expected != data.size()) {
        throw std::runtime_error("Token document lists " + std::to_string(data.size()) +
                                 " tokens but records token_count " + std::to_string(expected));
    }

    doc.tokens = tokens_from_json(data, file);

    for (size_t i = 0; i < doc.tokens.size(); ++i) {
        const auto& range = doc.tokens[i].range;
        if (range.end.offset > file->chars.size() || range.start.offset > range.end.offset) {
            throw std::runtime_error("Token " + std::to_string(i) + " lies outside " + file->name);
        }
        if (range.text() != data[i].at("text").get<std::string>()) {
            throw std::runtime_error("Token " + std::to_string(i) + " does not match " +
                                     file->name + "; the source changed after tokenizing");
        }
    }

    return doc;
}

inline void write_token_document(const std::string& path, const TokenDocument& doc) {
    write_json_file(path, token_document_to_json(doc));
}

// Read a tokens file and the source file it names
inline TokenDocument read_token_document(const std::string& path, text::FileRegistry& registry) {
    nlohmann::json j = read_json_file(path);
    auto file = registry.load(j.at("source_file").get<std::string>());
    return token_document_from_json(j, std::move(file));
}

}  // namespace voxlasm::json

#endif // VOXLASM_SERIALIZATION_TOKEN_DOCUMENT_HPP
