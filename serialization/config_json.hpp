#ifndef VOXLASM_SERIALIZATION_CONFIG_JSON_HPP
#define VOXLASM_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <lexer/tokenizer.hpp>
#include <stdexcept>
#include <string>

namespace voxlasm {
namespace lexer {

// Same spellings as numeric_mode_name()
inline void to_json(nlohmann::json& j, const NumericMode& mode) {
    j = std::string(numeric_mode_name(mode));
}

inline void from_json(const nlohmann::json& j, NumericMode& mode) {
    std::string name = j.get<std::string>();
    auto parsed = numeric_mode_from_name(name);
    if (!parsed) {
        throw std::runtime_error("Unknown numeric mode in config: " + name);
    }
    mode = *parsed;
}

inline void to_json(nlohmann::json& j, const TokenizerConfig& config) {
    j = {
        {"default_numeric", config.default_numeric}
    };
}

inline void from_json(const nlohmann::json& j, TokenizerConfig& config) {
    if (j.contains("default_numeric")) {
        config.default_numeric = j.at("default_numeric").get<NumericMode>();
    }
}

}  // namespace lexer

// Read the "tokenizer" section of a full config document; missing keys keep
// their defaults
inline lexer::TokenizerConfig tokenizer_config_from_json(const nlohmann::json& full_config) {
    lexer::TokenizerConfig config;
    if (full_config.contains("tokenizer")) {
        config = full_config["tokenizer"].get<lexer::TokenizerConfig>();
    }
    return config;
}

}  // namespace voxlasm

#endif // VOXLASM_SERIALIZATION_CONFIG_JSON_HPP
