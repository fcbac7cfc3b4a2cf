#pragma once

#include <string>
#include <vector>

#include "lang_token.h"

namespace Forthic::Lang {

class Tokenizer {
public:
  explicit Tokenizer(std::string source, CodeLocation reference = CodeLocation());

  const std::string& Error() const { return error_; }
  const CodeLocation& ErrorLocation() const { return error_location_; }

  // Produces the next token. Returns false on a lexical error. Once an End
  // token has been produced every further call yields End again.
  bool Next(Token* out);

  bool TokenizeAll(std::vector<Token>* out);

private:
  char Peek(size_t offset = 0) const;
  char Advance();
  bool IsAtEnd() const;

  void SkipWhitespace();
  CodeLocation Here() const;
  void Finish(Token* token, TokenKind kind, std::string text, const CodeLocation& start);
  bool Fail(const std::string& message, const CodeLocation& where);

  bool LexComment(Token* out);
  bool LexString(Token* out);
  bool LexTripleString(char delim, const CodeLocation& start, Token* out);
  bool LexDefinitionStart(TokenKind kind, Token* out);
  bool LexModuleStart(Token* out);
  bool LexDotSymbol(Token* out);
  bool LexWord(Token* out);

  bool OpenBracket(char bracket);
  bool CloseBracket(char bracket, const CodeLocation& where);

  std::string source_;
  CodeLocation reference_;
  size_t index_ = 0;
  uint32_t line_ = 1;
  uint32_t column_ = 1;
  std::string brackets_;
  bool done_ = false;
  std::string error_;
  CodeLocation error_location_;
};

bool TokenizeString(const std::string& source, std::vector<Token>* out, std::string* error);

// Renders tokens back to source text that re-tokenizes to an equivalent
// sequence. Comment tokens are dropped.
std::string RenderTokens(const std::vector<Token>& tokens);

} // namespace Forthic::Lang
