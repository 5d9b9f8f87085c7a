#pragma once

#include <string>

#include "helena/AstGenerator.h"

namespace helena {
struct Options {
  std::string inputPath;
  std::string dumpStage = "ast";
  AstGeneratorOptions generator;
};
} // namespace helena
