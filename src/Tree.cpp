#include "helena/Tree.h"

#include <utility>

namespace helena {

bool Node::isLeaf() const {
  for (const auto &continuation : continuations) {
    if (!continuation.has_value()) {
      return true;
    }
  }
  return false;
}

NodeId Tree::addRoot(const Position &position) {
  Node root;
  root.kind = NodeKind::Root;
  root.position = position;
  nodes_.push_back(std::move(root));
  return nodes_.size() - 1;
}

const Node &Tree::node(NodeId id) const {
  return nodes_.at(id);
}

size_t Tree::size() const {
  return nodes_.size();
}

bool Tree::leaf(NodeId id) {
  if (nodes_.at(id).isLeaf()) {
    return true;
  }
  nodes_[id].continuations.push_back(std::nullopt);
  return true;
}

bool Tree::expect(NodeId id, NodeKind kind, const std::string &text, const Chain &chain, std::string &error) {
  const size_t mark = nodes_.size();
  if (!grow(id, kind, text, chain, error)) {
    truncate(mark);
    return false;
  }
  return true;
}

bool Tree::grow(NodeId id, NodeKind kind, const std::string &text, const Chain &chain, std::string &error) {
  if (!validatePattern(kind, text, error)) {
    return false;
  }
  Node candidate;
  candidate.kind = kind;
  candidate.text = text;
  candidate.position = nextPosition(nodes_.at(id).position, text);
  nodes_.push_back(std::move(candidate));
  const NodeId candidateId = nodes_.size() - 1;
  // `nodes_` may reallocate while the chain runs; only indices survive it.
  const bool grown = chain ? chain(candidateId, error) : leaf(candidateId);
  if (!grown) {
    return false;
  }
  nodes_[id].continuations.push_back(candidateId);
  return true;
}

void Tree::truncate(size_t size) {
  if (size < nodes_.size()) {
    nodes_.resize(size);
  }
}

} // namespace helena
