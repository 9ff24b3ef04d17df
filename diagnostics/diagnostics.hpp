#ifndef VOXLASM_DIAGNOSTICS_DIAGNOSTICS_HPP
#define VOXLASM_DIAGNOSTICS_DIAGNOSTICS_HPP

#include <lexer/lex_error.hpp>
#include <string>

namespace voxlasm {
namespace diagnostics {

// Render a lex error as
//
//   <file>:<line>:<column>: error: <message>
//    <source line>
//    ^~~~
//
// Lines and columns are one-based in the output. Position errors get a single
// caret; range errors get a caret followed by one tilde per extra character.
std::string render(const lexer::LexError& error);

// Only the "<file>:<line>:<column>: error: <message>" header
std::string headline(const lexer::LexError& error);

// Source line plus marker line, or an empty string when the file is unknown
std::string source_excerpt(const lexer::LexError& error);

}  // namespace diagnostics
}  // namespace voxlasm

#endif // VOXLASM_DIAGNOSTICS_DIAGNOSTICS_HPP
