#pragma once

#include <string>

namespace helena {

constexpr int kMaxRow = 100;

// `column` is the 1-based line number and `row` the 0-based offset inside that line.
struct Position {
  int column = 1;
  int row = 0;
};

Position nextPosition(const Position &current, const std::string &consumedText);

inline bool operator==(const Position &lhs, const Position &rhs) {
  return lhs.column == rhs.column && lhs.row == rhs.row;
}

inline bool operator!=(const Position &lhs, const Position &rhs) {
  return !(lhs == rhs);
}

} // namespace helena
