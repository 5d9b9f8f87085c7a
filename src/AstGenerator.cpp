#include "helena/AstGenerator.h"

#include "helena/Grammar.h"
#include "helena/Lexer.h"

#include <algorithm>
#include <utility>

namespace helena {

namespace {
const TopLevelRule kTopLevelRules[] = {TopLevelRule::Function, TopLevelRule::Newline};

class TokenCursor {
public:
  TokenCursor(const std::vector<Token> &tokens, size_t &pos) : tokens_(tokens), pos_(pos) {}

  const Token &peek(size_t ahead = 0) const {
    size_t index = pos_ + ahead;
    return index < tokens_.size() ? tokens_[index] : tokens_.back();
  }

  // The end token is never consumed; reading past it yields empty text for the grammar to reject.
  std::string take() {
    const Token &token = peek();
    if (token.kind == TokenKind::End) {
      return "";
    }
    ++pos_;
    return token.text;
  }

private:
  const std::vector<Token> &tokens_;
  size_t &pos_;
};

std::string describeLocation(const Token &token) {
  return std::to_string(token.line) + ":" + std::to_string(token.offset) + ": ";
}

FunctionDeclaration readFunctionDeclaration(TokenCursor &cursor) {
  FunctionDeclaration declaration;
  declaration.keyword = cursor.take();
  declaration.spacing = cursor.take();
  declaration.name = cursor.take();
  declaration.open = cursor.take();
  if (cursor.peek().kind != TokenKind::RParen) {
    while (true) {
      ValueParameter parameter;
      parameter.typeName = cursor.take();
      parameter.spacing = cursor.take();
      parameter.identifier = cursor.take();
      if (cursor.peek().kind != TokenKind::Comma) {
        declaration.parameters.push_back(std::move(parameter));
        break;
      }
      parameter.separator = cursor.take();
      parameter.separator += cursor.take();
      declaration.parameters.push_back(std::move(parameter));
    }
  }
  declaration.close = cursor.take();
  declaration.delimiter = cursor.take();
  if (cursor.peek().kind == TokenKind::Space && cursor.peek(1).kind == TokenKind::Word) {
    FunctionBody body;
    body.spacing = cursor.take();
    body.operation = cursor.take();
    declaration.body = std::move(body);
  }
  if (cursor.peek().kind == TokenKind::Newline) {
    declaration.terminator = cursor.take();
  }
  return declaration;
}
} // namespace

std::string topLevelRuleName(TopLevelRule rule) {
  switch (rule) {
  case TopLevelRule::Function:
    return "function";
  case TopLevelRule::Newline:
    return "newline";
  }
  return "unknown";
}

bool parseTopLevelRule(const std::string &name, TopLevelRule &out) {
  for (TopLevelRule rule : kTopLevelRules) {
    if (topLevelRuleName(rule) == name) {
      out = rule;
      return true;
    }
  }
  return false;
}

AstGenerator::AstGenerator(AstGeneratorOptions options) : options_(std::move(options)) {}

bool AstGenerator::generate(const std::string &source, Ast &ast, std::string &error) const {
  Lexer lexer(source);
  const std::vector<Token> tokens = lexer.tokenize();
  Ast result;
  std::unordered_map<TopLevelRule, size_t> occurrences;
  size_t pos = 0;
  while (tokens[pos].kind != TokenKind::End) {
    const Token &start = tokens[pos];
    const size_t mark = result.tree.size();
    const NodeId root = result.tree.addRoot({start.line, std::min(start.offset, kMaxRow)});
    bool matched = false;
    std::string firstError;
    for (TopLevelRule rule : kTopLevelRules) {
      size_t cursor = pos;
      std::string ruleError;
      if (!attempt(rule, tokens, cursor, result.tree, root, ruleError)) {
        if (firstError.empty()) {
          firstError = ruleError;
        }
        continue;
      }
      const size_t cap = options_.maxLeafingFor(rule);
      if (++occurrences[rule] > cap) {
        error = describeLocation(start) + topLevelRuleName(rule) + " exceeds its maximum of " +
                std::to_string(cap) + " top-level occurrence(s).";
        return false;
      }
      pos = cursor;
      matched = true;
      break;
    }
    if (!matched) {
      result.tree.truncate(mark);
      error = describeLocation(start) + firstError;
      return false;
    }
    result.roots.push_back(root);
  }
  ast = std::move(result);
  return true;
}

bool AstGenerator::attempt(TopLevelRule rule,
                           const std::vector<Token> &tokens,
                           size_t &pos,
                           Tree &tree,
                           NodeId root,
                           std::string &error) const {
  TokenCursor cursor(tokens, pos);
  switch (rule) {
  case TopLevelRule::Function: {
    const FunctionDeclaration declaration = readFunctionDeclaration(cursor);
    return expectFunction(tree, root, declaration, error);
  }
  case TopLevelRule::Newline:
    return expectNewline(tree, root, cursor.take(), {}, error);
  }
  error = "unknown top-level rule";
  return false;
}

} // namespace helena
