#pragma once

#include <cstdint>
#include <string>

namespace Forthic::Lang {

enum class TokenKind : uint8_t {
  End,
  Word,
  String,
  Number,
  ArrayOpen,
  ArrayClose,
  ModuleOpen,
  ModuleClose,
  DefinitionOpen,
  MemoDefinitionOpen,
  DefinitionClose,
  DotSymbol,
  Comment,
};

struct CodeLocation {
  std::string source;
  uint32_t line = 1;
  uint32_t column = 1;
  size_t start_pos = 0;
  size_t end_pos = 0;
};

// text holds the word name, string contents, definition or module name,
// or the dot symbol without its leading '.'.
struct Token {
  TokenKind kind = TokenKind::End;
  std::string text;
  CodeLocation location;
};

const char* ToString(TokenKind kind);
std::string FormatLocation(const CodeLocation& location);

} // namespace Forthic::Lang
