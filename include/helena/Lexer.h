#pragma once

#include <string>
#include <vector>

#include "helena/Token.h"

namespace helena {

class Lexer {
public:
  explicit Lexer(const std::string &source);

  std::vector<Token> tokenize();

private:
  bool isWordChar(char c) const;
  bool isNewlineStart() const;
  void advance();

  Token readWord();
  Token readSpace();
  Token readNewline();
  Token readPunct();

  const std::string &source_;
  size_t pos_ = 0;
  int line_ = 1;
  int offset_ = 0;
};

} // namespace helena
