#ifndef VOXLASM_SERIALIZATION_TOKEN_JSON_HPP
#define VOXLASM_SERIALIZATION_TOKEN_JSON_HPP

#include <nlohmann/json.hpp>
#include <isa/instruction_set.hpp>
#include <lexer/lex_error.hpp>
#include <lexer/token.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace voxlasm {
namespace text {

// Positions serialize as [offset, row, column]
inline void to_json(nlohmann::json& j, const Position& p) {
    j = nlohmann::json::array({p.offset, p.row, p.column});
}

inline void from_json(const nlohmann::json& j, Position& p) {
    p.offset = j.at(0).get<size_t>();
    p.row = j.at(1).get<size_t>();
    p.column = j.at(2).get<size_t>();
}

}  // namespace text

inline nlohmann::json token_to_json(const lexer::Token& token) {
    nlohmann::json j;
    j["type"] = std::string(lexer::token_type_name(token.type));
    j["start"] = token.range.start;
    j["end"] = token.range.end;
    j["text"] = token.range.text();

    if (token.reg) {
        j["register"] = std::string(isa::register_name(*token.reg));
    }
    if (token.opcode) {
        j["opcode"] = *token.opcode;
    }
    if (token.unsigned_value) {
        j["value"] = *token.unsigned_value;
    }
    if (token.signed_value) {
        j["value"] = *token.signed_value;
    }

    return j;
}

// Rebuild a token against the file it was lexed from
inline lexer::Token token_from_json(const nlohmann::json& j,
                                    std::shared_ptr<const text::FileInfo> file) {
    std::string type_name = j.at("type").get<std::string>();
    auto type = lexer::token_type_from_name(type_name);
    if (!type) {
        throw std::runtime_error("Unknown token type: " + type_name);
    }

    lexer::Token token{*type,
                       text::TextRange(j.at("start").get<text::Position>(),
                                       j.at("end").get<text::Position>(),
                                       std::move(file)),
                       std::nullopt, std::nullopt, std::nullopt, std::nullopt};

    switch (token.type) {
        case lexer::TokenType::Register: {
            std::string name = j.at("register").get<std::string>();
            for (uint8_t i = 0; i < isa::REGISTER_COUNT; ++i) {
                auto reg = isa::register_from_ordinal(i);
                if (reg && isa::register_name(*reg) == name) {
                    token.reg = reg;
                }
            }
            if (!token.reg) {
                throw std::runtime_error("Unknown register: " + name);
            }
            break;
        }
        case lexer::TokenType::Opcode:
            token.opcode = j.at("opcode").get<isa::Opcode>();
            break;
        case lexer::TokenType::UnsignedIntegerLiteral:
            token.unsigned_value = j.at("value").get<uint64_t>();
            break;
        case lexer::TokenType::SignedIntegerLiteral:
            token.signed_value = j.at("value").get<int64_t>();
            break;
        default:
            break;
    }

    return token;
}

inline nlohmann::json tokens_to_json(const std::vector<lexer::Token>& tokens) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& token : tokens) {
        j.push_back(token_to_json(token));
    }
    return j;
}

inline std::vector<lexer::Token> tokens_from_json(const nlohmann::json& j,
                                                  const std::shared_ptr<const text::FileInfo>& file) {
    std::vector<lexer::Token> tokens;
    tokens.reserve(j.size());
    for (const auto& item : j) {
        tokens.push_back(token_from_json(item, file));
    }
    return tokens;
}

inline nlohmann::json lex_error_to_json(const lexer::LexError& error) {
    return {
        {"kind", std::string(error.kind_name())},
        {"message", error.what()},
        {"start", error.start()},
        {"end", error.end()}
    };
}

}  // namespace voxlasm

#endif // VOXLASM_SERIALIZATION_TOKEN_JSON_HPP
