#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "helena/Pattern.h"
#include "helena/Position.h"

namespace helena {

using NodeId = size_t;

// `std::nullopt` marks that the production may end at the owning node.
using Continuation = std::optional<NodeId>;

struct Node {
  NodeKind kind = NodeKind::Root;
  std::string text;
  Position position;
  std::vector<Continuation> continuations;

  bool isLeaf() const;
};

// Receives the node that was just accepted and grows whatever may follow it.
using Chain = std::function<bool(NodeId, std::string &)>;

class Tree {
public:
  NodeId addRoot(const Position &position = {});

  const Node &node(NodeId id) const;
  size_t size() const;

  bool leaf(NodeId id);

  // Proposes a `kind` node with `text` after `id`. The candidate joins `id` only when `text`
  // matches the kind's pattern and `chain` succeeds on it; otherwise `id` and the arena are left
  // exactly as they were. An empty chain ends the production at the candidate.
  bool expect(NodeId id, NodeKind kind, const std::string &text, const Chain &chain, std::string &error);

  // Drops every node created at or after `size`. Only used to abandon whole productions.
  void truncate(size_t size);

private:
  bool grow(NodeId id, NodeKind kind, const std::string &text, const Chain &chain, std::string &error);

  std::vector<Node> nodes_;
};

} // namespace helena
