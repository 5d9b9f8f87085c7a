#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

#include "helena/Token.h"
#include "helena/Tree.h"

namespace helena {

enum class TopLevelRule { Function, Newline };

constexpr size_t kUnboundedLeafing = std::numeric_limits<size_t>::max();

std::string topLevelRuleName(TopLevelRule rule);
bool parseTopLevelRule(const std::string &name, TopLevelRule &out);

struct AstGeneratorOptions {
  // Maximum standalone top-level occurrences per rule. A rule without an entry, or with 0, may
  // only appear nested inside another production.
  std::unordered_map<TopLevelRule, size_t> maxLeafing = {
      {TopLevelRule::Function, kUnboundedLeafing},
      {TopLevelRule::Newline, kUnboundedLeafing},
  };

  size_t maxLeafingFor(TopLevelRule rule) const {
    auto it = maxLeafing.find(rule);
    return it == maxLeafing.end() ? 0 : it->second;
  }
};

struct Ast {
  Tree tree;
  std::vector<NodeId> roots;
};

class AstGenerator {
public:
  explicit AstGenerator(AstGeneratorOptions options = {});

  bool generate(const std::string &source, Ast &ast, std::string &error) const;

private:
  bool attempt(TopLevelRule rule,
               const std::vector<Token> &tokens,
               size_t &pos,
               Tree &tree,
               NodeId root,
               std::string &error) const;

  AstGeneratorOptions options_;
};

} // namespace helena
