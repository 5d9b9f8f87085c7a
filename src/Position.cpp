#include "helena/Position.h"

#include <algorithm>

namespace helena {

Position nextPosition(const Position &current, const std::string &consumedText) {
  Position next;
  const size_t advanced = static_cast<size_t>(current.row) + consumedText.size();
  next.row = static_cast<int>(std::min(advanced, static_cast<size_t>(kMaxRow)));
  // Only reachable for empty text at offset zero. Kept as is until the intended
  // roles of row and column are settled.
  if (current.column > 0 && next.row == 0) {
    next.column = current.column + 1;
  } else {
    next.column = current.column;
  }
  return next;
}

} // namespace helena
