#pragma once

#include <optional>
#include <string>
#include <vector>

#include "helena/Pattern.h"
#include "helena/Tree.h"

namespace helena {

bool expectKeyword(Tree &tree,
                   NodeId id,
                   const std::string &keyword,
                   const std::string &text,
                   const Chain &chain,
                   std::string &error);
bool expectIdentifier(Tree &tree, NodeId id, const std::string &text, const Chain &chain, std::string &error);
bool expectTypeName(Tree &tree, NodeId id, const std::string &text, const Chain &chain, std::string &error);
bool expectOperation(Tree &tree, NodeId id, const std::string &text, const Chain &chain, std::string &error);
bool expectSpacing(Tree &tree, NodeId id, const std::string &text, const Chain &chain, std::string &error);
bool expectSpacing(Tree &tree, NodeId id, const Chain &chain, std::string &error);
bool expectNewline(Tree &tree, NodeId id, const std::string &text, const Chain &chain, std::string &error);
bool expectNewline(Tree &tree, NodeId id, const Chain &chain, std::string &error);
bool expectListSeparator(Tree &tree, NodeId id, const std::string &text, const Chain &chain, std::string &error);
bool expectListSeparator(Tree &tree, NodeId id, const Chain &chain, std::string &error);

struct ValueParameter {
  std::string typeName;
  std::string identifier;
  std::string spacing = kSpacing;
  // Text between this parameter and the next one; ignored on the last parameter.
  std::string separator = kListSeparator;
};

struct FunctionBody {
  std::string spacing = kSpacing;
  std::string operation;
};

// Texts of a single-line function declaration. The defaults are the canonical literals, so
// only the name and parameters are needed to describe well-formed source.
struct FunctionDeclaration {
  std::string keyword = "func";
  std::string spacing = kSpacing;
  std::string name;
  std::string open = "(";
  std::vector<ValueParameter> parameters;
  std::string close = ")";
  std::string delimiter = ":";
  std::optional<FunctionBody> body;
  std::optional<std::string> terminator;
};

bool expectFunction(Tree &tree, NodeId id, const FunctionDeclaration &declaration, std::string &error);

} // namespace helena
