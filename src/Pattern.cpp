#include "helena/Pattern.h"

namespace helena {
namespace {

bool isAsciiAlpha(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool isAsciiDigit(char c) {
  return c >= '0' && c <= '9';
}

bool isWordChar(char c) {
  return isAsciiAlpha(c) || isAsciiDigit(c) || c == '_';
}

std::string escapeText(const std::string &text) {
  std::string escaped;
  for (char c : text) {
    if (c == '\n') {
      escaped += "\\n";
    } else if (c == '\r') {
      escaped += "\\r";
    } else if (c == '\t') {
      escaped += "\\t";
    } else {
      escaped += c;
    }
  }
  return escaped;
}

bool mismatch(const std::string &text, const std::string &pattern, std::string &error) {
  error = "Textual representation of node (\"" + escapeText(text) + "\") does not match \"" + pattern + "\".";
  return false;
}

bool matchesExactly(const std::string &expected, const std::string &text, std::string &error) {
  if (text != expected) {
    return mismatch(text, escapeText(expected), error);
  }
  return true;
}

bool isKeywordLiteral(const std::string &text) {
  for (const auto &literal : keywordLiterals()) {
    if (literal == text) {
      return true;
    }
  }
  return false;
}

std::string keywordPattern() {
  std::string pattern;
  for (const auto &literal : keywordLiterals()) {
    if (!pattern.empty()) {
      pattern += "|";
    }
    pattern += literal;
  }
  return pattern;
}

bool validateOperation(const std::string &text, std::string &error) {
  if (text.empty()) {
    return mismatch(text, "\\w+", error);
  }
  for (char c : text) {
    if (!isWordChar(c)) {
      return mismatch(text, "\\w+", error);
    }
  }
  return true;
}

} // namespace

std::string nodeKindName(NodeKind kind) {
  switch (kind) {
  case NodeKind::Root:
    return "Root";
  case NodeKind::Keyword:
    return "Keyword";
  case NodeKind::Identifier:
    return "Identifier";
  case NodeKind::TypeName:
    return "TypeName";
  case NodeKind::Spacing:
    return "Spacing";
  case NodeKind::Newline:
    return "Newline";
  case NodeKind::ListSeparator:
    return "ListSeparator";
  case NodeKind::Operation:
    return "Operation";
  }
  return "Unknown";
}

const std::vector<std::string> &keywordLiterals() {
  static const std::vector<std::string> literals = {"func", "(", ")", ":", ","};
  return literals;
}

bool validatePattern(NodeKind kind, const std::string &text, std::string &error) {
  switch (kind) {
  case NodeKind::Root:
    return matchesExactly("", text, error);
  case NodeKind::Keyword:
    if (!isKeywordLiteral(text)) {
      return mismatch(text, keywordPattern(), error);
    }
    return true;
  case NodeKind::Identifier:
    return validateIdentifier(text, error);
  case NodeKind::TypeName:
    return validateTypeName(text, error);
  case NodeKind::Spacing:
    return matchesExactly(kSpacing, text, error);
  case NodeKind::Newline:
    return matchesExactly(kNewline, text, error);
  case NodeKind::ListSeparator:
    return matchesExactly(kListSeparator, text, error);
  case NodeKind::Operation:
    return validateOperation(text, error);
  }
  error = "unknown node kind";
  return false;
}

bool validateKeyword(const std::string &keyword, const std::string &text, std::string &error) {
  if (!matchesExactly(keyword, text, error)) {
    return false;
  }
  return validatePattern(NodeKind::Keyword, text, error);
}

bool validateIdentifier(const std::string &text, std::string &error) {
  if (text.empty()) {
    error = "Expected an identifier.";
    return false;
  }
  for (char c : text) {
    if (!isAsciiAlpha(c) && !isAsciiDigit(c)) {
      error = text + " is invalid. An identifier can only contain letters A–Z and digits.";
      return false;
    }
  }
  return true;
}

bool validateTypeName(const std::string &text, std::string &error) {
  if (text.empty()) {
    error = "Expected a type name.";
    return false;
  }
  size_t end = text.size();
  while (end >= 2 && text[end - 2] == '[' && text[end - 1] == ']') {
    end -= 2;
  }
  bool valid = end > 0;
  for (size_t i = 0; valid && i < end; ++i) {
    valid = isWordChar(text[i]);
  }
  if (!valid) {
    error = text + " is invalid. A type name can only contain letters A–Z, digits, underscores and trailing [] pairs.";
    return false;
  }
  return true;
}

} // namespace helena
