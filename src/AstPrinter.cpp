#include "helena/AstPrinter.h"

#include <cctype>
#include <sstream>

namespace helena {

namespace {
void indent(std::ostringstream &out, int depth) {
  for (int i = 0; i < depth; ++i) {
    out << "   ";
  }
}

bool isBlank(const std::string &text) {
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::string label(const Node &node) {
  const std::string kind = nodeKindName(node.kind);
  if (kind == node.text || isBlank(node.text)) {
    return kind;
  }
  return kind + " \"" + node.text + "\"";
}

void printNode(std::ostringstream &out, const Tree &tree, NodeId id, int depth) {
  const Node &node = tree.node(id);
  indent(out, depth);
  out << "├─ " << label(node) << "\n";
  for (const auto &continuation : node.continuations) {
    // The leaf marker ends the listing of this node's continuations.
    if (!continuation.has_value()) {
      return;
    }
    printNode(out, tree, *continuation, depth + 1);
  }
}
} // namespace

std::string AstPrinter::print(const Tree &tree, NodeId root) const {
  std::ostringstream out;
  printNode(out, tree, root, 0);
  return out.str();
}

std::string AstPrinter::print(const Ast &ast) const {
  std::ostringstream out;
  for (NodeId root : ast.roots) {
    printNode(out, ast.tree, root, 0);
  }
  return out.str();
}

} // namespace helena
