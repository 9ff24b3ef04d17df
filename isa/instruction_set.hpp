#ifndef VOXLASM_ISA_INSTRUCTION_SET_HPP
#define VOXLASM_ISA_INSTRUCTION_SET_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace voxlasm {
namespace isa {

// Machine registers of the Voxl VM, in ordinal order.
// Named registers come first, positional R0-R9 follow.
enum class Register : uint8_t {
    RSP,  // Stack pointer
    RFP,  // Frame pointer
    ROU,  // Output register
    RFL,  // Frame limit
    RRA,  // Return register A
    RRB,  // Return register B
    R0, R1, R2, R3, R4, R5, R6, R7, R8, R9
};

constexpr size_t REGISTER_COUNT = 16;

using Opcode = uint8_t;

std::optional<Register> register_from_ordinal(uint8_t ordinal);

// Positional register for a decimal digit value 0-9
std::optional<Register> positional_register(uint8_t digit);

// Assembly spelling without the '$' sigil, e.g. "rsp" or "r0"
std::string_view register_name(Register reg);

// Spelling table for named registers: the two letters that follow "$r"
struct RegisterSuffix {
    char first;
    char second;
    Register reg;
};

const std::array<RegisterSuffix, 6>& named_register_suffixes();

// Mnemonic lookup; mnemonics are lowercase and matched case-sensitively
std::optional<Opcode> instruction_from_string(std::string_view mnemonic);
std::optional<std::string_view> instruction_name(Opcode code);

struct InstructionInfo {
    std::string_view mnemonic;
    Opcode code;
};

const std::array<InstructionInfo, 38>& instruction_table();

}  // namespace isa
}  // namespace voxlasm

#endif // VOXLASM_ISA_INSTRUCTION_SET_HPP
