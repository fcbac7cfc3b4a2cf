#include "lang_tokenizer.h"

#include "lang_literals.h"

namespace Forthic::Lang {

namespace {

bool IsWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
         c == '(' || c == ')' || c == ',';
}

bool IsQuote(char c) {
  return c == '"' || c == '\'' || c == '^';
}

bool IsWordTerminator(char c) {
  return c == ';' || c == '[' || c == ']' || c == '{' || c == '}' || c == '#';
}

std::string Unescape(std::string text) {
  static const struct {
    const char* entity;
    char replacement;
  } kEntities[] = {{"&lt;", '<'}, {"&gt;", '>'}};
  for (const auto& entry : kEntities) {
    const std::string entity = entry.entity;
    size_t pos = 0;
    while ((pos = text.find(entity, pos)) != std::string::npos) {
      text.replace(pos, entity.size(), 1, entry.replacement);
      ++pos;
    }
  }
  return text;
}

bool ContainsTriple(const std::string& text, char delim) {
  return text.find(std::string(3, delim)) != std::string::npos;
}

std::string RenderString(const std::string& text) {
  for (char delim : {'"', '\'', '^'}) {
    if (text.find(delim) == std::string::npos) {
      return std::string(1, delim) + text + std::string(1, delim);
    }
  }
  for (char delim : {'"', '\'', '^'}) {
    if (!ContainsTriple(text, delim)) {
      const std::string fence(3, delim);
      return fence + text + fence;
    }
  }
  return "\"\"\"" + text + "\"\"\"";
}

} // namespace

const char* ToString(TokenKind kind) {
  switch (kind) {
    case TokenKind::End: return "end";
    case TokenKind::Word: return "word";
    case TokenKind::String: return "string";
    case TokenKind::Number: return "number";
    case TokenKind::ArrayOpen: return "[";
    case TokenKind::ArrayClose: return "]";
    case TokenKind::ModuleOpen: return "{";
    case TokenKind::ModuleClose: return "}";
    case TokenKind::DefinitionOpen: return ":";
    case TokenKind::MemoDefinitionOpen: return "@:";
    case TokenKind::DefinitionClose: return ";";
    case TokenKind::DotSymbol: return "dot-symbol";
    case TokenKind::Comment: return "comment";
  }
  return "unknown";
}

std::string FormatLocation(const CodeLocation& location) {
  std::string out = location.source.empty() ? "<input>" : location.source;
  out += ":" + std::to_string(location.line) + ":" + std::to_string(location.column);
  return out;
}

Tokenizer::Tokenizer(std::string source, CodeLocation reference)
    : source_(Unescape(std::move(source))), reference_(std::move(reference)) {}

char Tokenizer::Peek(size_t offset) const {
  if (index_ + offset >= source_.size()) return '\0';
  return source_[index_ + offset];
}

char Tokenizer::Advance() {
  if (IsAtEnd()) return '\0';
  char c = source_[index_++];
  if (c == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  return c;
}

bool Tokenizer::IsAtEnd() const {
  return index_ >= source_.size();
}

void Tokenizer::SkipWhitespace() {
  while (!IsAtEnd() && IsWhitespace(Peek())) {
    Advance();
  }
}

CodeLocation Tokenizer::Here() const {
  CodeLocation loc;
  loc.source = reference_.source;
  loc.line = reference_.line + line_ - 1;
  loc.column = line_ == 1 ? reference_.column + column_ - 1 : column_;
  loc.start_pos = reference_.start_pos + index_;
  loc.end_pos = loc.start_pos;
  return loc;
}

void Tokenizer::Finish(Token* token, TokenKind kind, std::string text, const CodeLocation& start) {
  token->kind = kind;
  token->text = std::move(text);
  token->location = start;
  token->location.end_pos = reference_.start_pos + index_;
}

bool Tokenizer::Fail(const std::string& message, const CodeLocation& where) {
  error_ = message;
  error_location_ = where;
  return false;
}

bool Tokenizer::OpenBracket(char bracket) {
  brackets_.push_back(bracket);
  return true;
}

bool Tokenizer::CloseBracket(char bracket, const CodeLocation& where) {
  const char opener = bracket == ']' ? '[' : '{';
  if (brackets_.empty()) {
    return Fail(std::string("unmatched '") + bracket + "'", where);
  }
  if (brackets_.back() != opener) {
    return Fail(std::string("mismatched '") + bracket + "', expected closer for '" +
                    brackets_.back() + "'",
                where);
  }
  brackets_.pop_back();
  return true;
}

bool Tokenizer::Next(Token* out) {
  if (done_) {
    Finish(out, TokenKind::End, "", Here());
    return true;
  }
  SkipWhitespace();
  const CodeLocation start = Here();
  if (IsAtEnd()) {
    if (!brackets_.empty()) {
      return Fail(std::string("unclosed '") + brackets_.back() + "' at end of input", start);
    }
    done_ = true;
    Finish(out, TokenKind::End, "", start);
    return true;
  }

  const char c = Peek();
  switch (c) {
    case '#':
      return LexComment(out);
    case ':':
      Advance();
      return LexDefinitionStart(TokenKind::DefinitionOpen, out);
    case ';':
      Advance();
      Finish(out, TokenKind::DefinitionClose, ";", start);
      return true;
    case '[':
      Advance();
      Finish(out, TokenKind::ArrayOpen, "[", start);
      return OpenBracket('[');
    case ']':
      Advance();
      Finish(out, TokenKind::ArrayClose, "]", start);
      return CloseBracket(']', start);
    case '{':
      Advance();
      return LexModuleStart(out);
    case '}':
      Advance();
      Finish(out, TokenKind::ModuleClose, "}", start);
      return CloseBracket('}', start);
    case '.':
      return LexDotSymbol(out);
    default:
      break;
  }
  if (c == '@' && Peek(1) == ':') {
    Advance();
    Advance();
    return LexDefinitionStart(TokenKind::MemoDefinitionOpen, out);
  }
  if (IsQuote(c)) {
    return LexString(out);
  }
  return LexWord(out);
}

bool Tokenizer::TokenizeAll(std::vector<Token>* out) {
  out->clear();
  for (;;) {
    Token token;
    if (!Next(&token)) return false;
    if (token.kind == TokenKind::End) break;
    out->push_back(std::move(token));
  }
  return true;
}

bool Tokenizer::LexComment(Token* out) {
  const CodeLocation start = Here();
  Advance();
  size_t begin = index_;
  while (!IsAtEnd() && Peek() != '\n') {
    Advance();
  }
  Finish(out, TokenKind::Comment, source_.substr(begin, index_ - begin), start);
  return true;
}

bool Tokenizer::LexString(Token* out) {
  const CodeLocation start = Here();
  const char delim = Advance();
  if (Peek() == delim && Peek(1) == delim) {
    Advance();
    Advance();
    return LexTripleString(delim, start, out);
  }
  std::string text;
  while (!IsAtEnd()) {
    char c = Advance();
    if (c == delim) {
      Finish(out, TokenKind::String, std::move(text), start);
      return true;
    }
    text.push_back(c);
  }
  return Fail(std::string("unterminated string starting with ") + delim, start);
}

bool Tokenizer::LexTripleString(char delim, const CodeLocation& start, Token* out) {
  std::string text;
  while (!IsAtEnd()) {
    if (Peek() == delim && Peek(1) == delim && Peek(2) == delim) {
      // A longer run of delimiters closes on its last three.
      if (Peek(3) == delim) {
        text.push_back(Advance());
        continue;
      }
      Advance();
      Advance();
      Advance();
      Finish(out, TokenKind::String, std::move(text), start);
      return true;
    }
    text.push_back(Advance());
  }
  return Fail(std::string("unterminated triple-quoted string starting with ") + delim, start);
}

bool Tokenizer::LexDefinitionStart(TokenKind kind, Token* out) {
  const CodeLocation start = Here();
  SkipWhitespace();
  std::string name;
  while (!IsAtEnd() && !IsWhitespace(Peek())) {
    char c = Peek();
    if (IsQuote(c) || c == '[' || c == ']' || c == '{' || c == '}') {
      return Fail("invalid definition name: '" + name + c + "'", start);
    }
    name.push_back(Advance());
  }
  if (name.empty()) {
    return Fail("definition name missing", start);
  }
  Finish(out, kind, std::move(name), start);
  return true;
}

bool Tokenizer::LexModuleStart(Token* out) {
  const CodeLocation start = Here();
  std::string name;
  while (!IsAtEnd() && !IsWhitespace(Peek()) && Peek() != '}') {
    name.push_back(Advance());
  }
  Finish(out, TokenKind::ModuleOpen, std::move(name), start);
  return OpenBracket('{');
}

bool Tokenizer::LexDotSymbol(Token* out) {
  const CodeLocation start = Here();
  Advance();
  std::string symbol;
  while (!IsAtEnd() && !IsWhitespace(Peek()) && !IsWordTerminator(Peek())) {
    symbol.push_back(Advance());
  }
  if (symbol.empty()) {
    Finish(out, TokenKind::Word, ".", start);
    return true;
  }
  Finish(out, TokenKind::DotSymbol, std::move(symbol), start);
  return true;
}

bool Tokenizer::LexWord(Token* out) {
  const CodeLocation start = Here();
  std::string text;
  while (!IsAtEnd() && !IsWhitespace(Peek()) && !IsWordTerminator(Peek())) {
    text.push_back(Advance());
  }
  const TokenKind kind = IsNumberLiteral(text) ? TokenKind::Number : TokenKind::Word;
  Finish(out, kind, std::move(text), start);
  return true;
}

bool TokenizeString(const std::string& source, std::vector<Token>* out, std::string* error) {
  Tokenizer tokenizer(source);
  if (!tokenizer.TokenizeAll(out)) {
    if (error) *error = FormatLocation(tokenizer.ErrorLocation()) + ": " + tokenizer.Error();
    return false;
  }
  return true;
}

std::string RenderTokens(const std::vector<Token>& tokens) {
  std::string out;
  for (const Token& token : tokens) {
    std::string piece;
    switch (token.kind) {
      case TokenKind::End:
      case TokenKind::Comment:
        continue;
      case TokenKind::Word:
      case TokenKind::Number:
        piece = token.text;
        break;
      case TokenKind::String:
        piece = token.text.empty() ? "\"\"" : RenderString(token.text);
        break;
      case TokenKind::DotSymbol: piece = "." + token.text; break;
      case TokenKind::ArrayOpen: piece = "["; break;
      case TokenKind::ArrayClose: piece = "]"; break;
      case TokenKind::ModuleOpen: piece = "{" + token.text; break;
      case TokenKind::ModuleClose: piece = "}"; break;
      case TokenKind::DefinitionOpen: piece = ": " + token.text; break;
      case TokenKind::MemoDefinitionOpen: piece = "@: " + token.text; break;
      case TokenKind::DefinitionClose: piece = ";"; break;
    }
    if (!out.empty()) out.push_back(' ');
    out += piece;
  }
  return out;
}

} // namespace Forthic::Lang
