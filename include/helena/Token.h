#pragma once

#include <string>

namespace helena {

enum class TokenKind { Word, Space, Newline, LParen, RParen, Colon, Comma, End };

struct Token {
  TokenKind kind = TokenKind::End;
  std::string text;
  int line = 1;
  int offset = 0;
};

std::string tokenKindName(TokenKind kind);

} // namespace helena
