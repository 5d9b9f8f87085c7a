#include "helena/Lexer.h"

namespace helena {

std::string tokenKindName(TokenKind kind) {
  switch (kind) {
  case TokenKind::Word:
    return "word";
  case TokenKind::Space:
    return "space";
  case TokenKind::Newline:
    return "newline";
  case TokenKind::LParen:
    return "lparen";
  case TokenKind::RParen:
    return "rparen";
  case TokenKind::Colon:
    return "colon";
  case TokenKind::Comma:
    return "comma";
  case TokenKind::End:
    return "end";
  }
  return "unknown";
}

Lexer::Lexer(const std::string &source) : source_(source) {}

std::vector<Token> Lexer::tokenize() {
  std::vector<Token> tokens;
  while (true) {
    if (pos_ >= source_.size()) {
      tokens.push_back({TokenKind::End, "", line_, offset_});
      break;
    }
    char c = source_[pos_];
    if (isNewlineStart()) {
      tokens.push_back(readNewline());
    } else if (c == ' ' || c == '\t') {
      tokens.push_back(readSpace());
    } else if (isWordChar(c)) {
      tokens.push_back(readWord());
    } else {
      tokens.push_back(readPunct());
    }
  }
  return tokens;
}

bool Lexer::isWordChar(char c) const {
  return c != ' ' && c != '\t' && c != '\r' && c != '\n' && c != '(' && c != ')' && c != ':' && c != ',';
}

bool Lexer::isNewlineStart() const {
  if (source_[pos_] == '\n') {
    return true;
  }
  return source_[pos_] == '\r' && pos_ + 1 < source_.size() && source_[pos_ + 1] == '\n';
}

void Lexer::advance() {
  if (pos_ >= source_.size()) {
    return;
  }
  if (source_[pos_] == '\n') {
    ++line_;
    offset_ = 0;
  } else {
    ++offset_;
  }
  ++pos_;
}

Token Lexer::readWord() {
  int startLine = line_;
  int startOffset = offset_;
  size_t start = pos_;
  while (pos_ < source_.size() && isWordChar(source_[pos_])) {
    advance();
  }
  return {TokenKind::Word, source_.substr(start, pos_ - start), startLine, startOffset};
}

Token Lexer::readSpace() {
  int startLine = line_;
  int startOffset = offset_;
  size_t start = pos_;
  while (pos_ < source_.size() && (source_[pos_] == ' ' || source_[pos_] == '\t')) {
    advance();
  }
  return {TokenKind::Space, source_.substr(start, pos_ - start), startLine, startOffset};
}

Token Lexer::readNewline() {
  int startLine = line_;
  int startOffset = offset_;
  size_t start = pos_;
  if (source_[pos_] == '\r') {
    advance();
  }
  advance();
  return {TokenKind::Newline, source_.substr(start, pos_ - start), startLine, startOffset};
}

Token Lexer::readPunct() {
  int startLine = line_;
  int startOffset = offset_;
  char c = source_[pos_];
  advance();
  switch (c) {
  case '(':
    return {TokenKind::LParen, "(", startLine, startOffset};
  case ')':
    return {TokenKind::RParen, ")", startLine, startOffset};
  case ':':
    return {TokenKind::Colon, ":", startLine, startOffset};
  case ',':
    return {TokenKind::Comma, ",", startLine, startOffset};
  default:
    // A lone carriage return; the grammar rejects it wherever it lands.
    return {TokenKind::Word, std::string(1, c), startLine, startOffset};
  }
}

} // namespace helena
