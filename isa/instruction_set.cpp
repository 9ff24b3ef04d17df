#include "instruction_set.hpp"
#include <algorithm>

namespace voxlasm {
namespace isa {

namespace {

constexpr std::array<std::string_view, REGISTER_COUNT> REGISTER_NAMES = {
    "rsp", "rfp", "rou", "rfl", "rra", "rrb",
    "r0", "r1", "r2", "r3", "r4", "r5", "r6", "r7", "r8", "r9"
};

// Order matters: entries sharing a first letter are tried top to bottom
constexpr std::array<RegisterSuffix, 6> NAMED_REGISTER_SUFFIXES = {{
    {'f', 'p', Register::RFP},
    {'f', 'l', Register::RFL},
    {'s', 'p', Register::RSP},
    {'o', 'u', Register::ROU},
    {'r', 'a', Register::RRA},
    {'r', 'b', Register::RRB},
}};

constexpr std::array<InstructionInfo, 38> INSTRUCTIONS = {{
    // Data movement
    {"nop", 0x00},
    {"halt", 0x01},
    {"mov", 0x02},
    {"ldi", 0x03},
    {"ld", 0x04},
    {"st", 0x05},
    {"push", 0x06},
    {"pop", 0x07},

    // Heap
    {"malloc", 0x08},
    {"free", 0x09},
    {"realloc", 0x0A},

    // Arithmetic
    {"add", 0x10},
    {"sub", 0x11},
    {"mul", 0x12},
    {"div", 0x13},
    {"mod", 0x14},
    {"neg", 0x15},
    {"inc", 0x16},
    {"dec", 0x17},

    // Bitwise
    {"and", 0x20},
    {"or", 0x21},
    {"xor", 0x22},
    {"not", 0x23},
    {"shl", 0x24},
    {"shr", 0x25},

    // Comparison
    {"cmp", 0x30},
    {"test", 0x31},

    // Control flow
    {"jmp", 0x40},
    {"jz", 0x41},
    {"jnz", 0x42},
    {"call", 0x43},
    {"ret", 0x44},
    {"jlt", 0x45},
    {"jgt", 0x46},
    {"jle", 0x47},
    {"jge", 0x48},

    // I/O
    {"out", 0x50},
    {"syscall", 0x51},
}};

}  // namespace

std::optional<Register> register_from_ordinal(uint8_t ordinal) {
    if (ordinal >= REGISTER_COUNT) return std::nullopt;
    return static_cast<Register>(ordinal);
}

std::optional<Register> positional_register(uint8_t digit) {
    if (digit > 9) return std::nullopt;
    return static_cast<Register>(static_cast<uint8_t>(Register::R0) + digit);
}

std::string_view register_name(Register reg) {
    return REGISTER_NAMES[static_cast<uint8_t>(reg)];
}

const std::array<RegisterSuffix, 6>& named_register_suffixes() {
    return NAMED_REGISTER_SUFFIXES;
}

std::optional<Opcode> instruction_from_string(std::string_view mnemonic) {
    auto it = std::find_if(INSTRUCTIONS.begin(), INSTRUCTIONS.end(),
        [&](const InstructionInfo& info) { return info.mnemonic == mnemonic; });
    if (it == INSTRUCTIONS.end()) return std::nullopt;
    return it->code;
}

std::optional<std::string_view> instruction_name(Opcode code) {
    auto it = std::find_if(INSTRUCTIONS.begin(), INSTRUCTIONS.end(),
        [&](const InstructionInfo& info) { return info.code == code; });
    if (it == INSTRUCTIONS.end()) return std::nullopt;
    return it->mnemonic;
}

const std::array<InstructionInfo, 38>& instruction_table() {
    return INSTRUCTIONS;
}

}  // namespace isa
}  // namespace voxlasm
