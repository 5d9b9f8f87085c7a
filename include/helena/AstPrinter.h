#pragma once

#include <string>

#include "helena/AstGenerator.h"
#include "helena/Tree.h"

namespace helena {

class AstPrinter {
public:
  std::string print(const Tree &tree, NodeId root) const;
  std::string print(const Ast &ast) const;
};

} // namespace helena
