#include "helena/Grammar.h"

namespace helena {

bool expectKeyword(Tree &tree,
                   NodeId id,
                   const std::string &keyword,
                   const std::string &text,
                   const Chain &chain,
                   std::string &error) {
  if (!validateKeyword(keyword, text, error)) {
    return false;
  }
  return tree.expect(id, NodeKind::Keyword, text, chain, error);
}

bool expectIdentifier(Tree &tree, NodeId id, const std::string &text, const Chain &chain, std::string &error) {
  return tree.expect(id, NodeKind::Identifier, text, chain, error);
}

bool expectTypeName(Tree &tree, NodeId id, const std::string &text, const Chain &chain, std::string &error) {
  return tree.expect(id, NodeKind::TypeName, text, chain, error);
}

bool expectOperation(Tree &tree, NodeId id, const std::string &text, const Chain &chain, std::string &error) {
  return tree.expect(id, NodeKind::Operation, text, chain, error);
}

bool expectSpacing(Tree &tree, NodeId id, const std::string &text, const Chain &chain, std::string &error) {
  return tree.expect(id, NodeKind::Spacing, text, chain, error);
}

bool expectSpacing(Tree &tree, NodeId id, const Chain &chain, std::string &error) {
  return expectSpacing(tree, id, kSpacing, chain, error);
}

bool expectNewline(Tree &tree, NodeId id, const std::string &text, const Chain &chain, std::string &error) {
  return tree.expect(id, NodeKind::Newline, text, chain, error);
}

bool expectNewline(Tree &tree, NodeId id, const Chain &chain, std::string &error) {
  return expectNewline(tree, id, kNewline, chain, error);
}

bool expectListSeparator(Tree &tree, NodeId id, const std::string &text, const Chain &chain, std::string &error) {
  return tree.expect(id, NodeKind::ListSeparator, text, chain, error);
}

bool expectListSeparator(Tree &tree, NodeId id, const Chain &chain, std::string &error) {
  return expectListSeparator(tree, id, kListSeparator, chain, error);
}

} // namespace helena
