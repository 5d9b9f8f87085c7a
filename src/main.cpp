#include "helena/AstGenerator.h"
#include "helena/AstPrinter.h"
#include "helena/Lexer.h"
#include "helena/Options.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {
std::string trimWhitespace(const std::string &text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(start, end - start);
}

bool parseCount(const std::string &text, size_t &out) {
  if (text == "unbounded") {
    out = helena::kUnboundedLeafing;
    return true;
  }
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  out = static_cast<size_t>(std::strtoull(text.c_str(), nullptr, 10));
  return true;
}

// Accepts "rule=count[,rule=count...]" where count is a number or "unbounded".
bool parseMaxLeafing(const std::string &text, helena::AstGeneratorOptions &out, std::string &error) {
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find(',', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    std::string entry = trimWhitespace(text.substr(start, end - start));
    if (!entry.empty()) {
      size_t equals = entry.find('=');
      if (equals == std::string::npos) {
        error = "expected rule=count in max leafing entry: " + entry;
        return false;
      }
      std::string name = trimWhitespace(entry.substr(0, equals));
      std::string countText = trimWhitespace(entry.substr(equals + 1));
      helena::TopLevelRule rule;
      if (!helena::parseTopLevelRule(name, rule)) {
        error = "unknown top-level rule: " + name;
        return false;
      }
      size_t count = 0;
      if (!parseCount(countText, count)) {
        error = "invalid max leafing count: " + countText;
        return false;
      }
      out.maxLeafing[rule] = count;
    }
    if (end == text.size()) {
      break;
    }
    start = end + 1;
  }
  return true;
}

bool parseArgs(int argc, char **argv, helena::Options &out, std::string &error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--dump-stage" && i + 1 < argc) {
      out.dumpStage = argv[++i];
    } else if (arg.rfind("--dump-stage=", 0) == 0) {
      out.dumpStage = arg.substr(std::string("--dump-stage=").size());
    } else if (arg == "--max-leafing" && i + 1 < argc) {
      if (!parseMaxLeafing(argv[++i], out.generator, error)) {
        return false;
      }
    } else if (arg.rfind("--max-leafing=", 0) == 0) {
      if (!parseMaxLeafing(arg.substr(std::string("--max-leafing=").size()), out.generator, error)) {
        return false;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      error = "unknown option: " + arg;
      return false;
    } else {
      if (!out.inputPath.empty()) {
        error = "only one input file is supported";
        return false;
      }
      out.inputPath = arg;
    }
  }
  if (out.dumpStage != "tokens" && out.dumpStage != "ast") {
    error = "unsupported dump stage: " + out.dumpStage;
    return false;
  }
  return !out.inputPath.empty();
}

bool readFile(const std::string &path, std::string &out) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

std::string escapeTokenText(const std::string &text) {
  std::string escaped;
  for (char c : text) {
    if (c == '\n') {
      escaped += "\\n";
    } else if (c == '\r') {
      escaped += "\\r";
    } else if (c == '\t') {
      escaped += "\\t";
    } else {
      escaped += c;
    }
  }
  return escaped;
}
} // namespace

int main(int argc, char **argv) {
  helena::Options options;
  std::string argError;
  if (!parseArgs(argc, argv, options, argError)) {
    if (!argError.empty()) {
      std::cerr << "Argument error: " << argError << "\n";
    }
    std::cerr << "Usage: helena [--dump-stage tokens|ast] [--max-leafing <rule>=<count>[,...]] <input.hln>\n";
    return 2;
  }

  std::string source;
  if (!readFile(options.inputPath, source)) {
    std::cerr << "Input error: failed to read " << options.inputPath << "\n";
    return 2;
  }

  if (options.dumpStage == "tokens") {
    helena::Lexer lexer(source);
    for (const auto &token : lexer.tokenize()) {
      std::cout << token.line << ":" << token.offset << " " << helena::tokenKindName(token.kind) << " \""
                << escapeTokenText(token.text) << "\"\n";
    }
    return 0;
  }

  helena::AstGenerator generator(options.generator);
  helena::Ast ast;
  std::string error;
  if (!generator.generate(source, ast, error)) {
    std::cerr << "AST error: " << error << "\n";
    return 2;
  }
  helena::AstPrinter printer;
  std::cout << printer.print(ast);
  return 0;
}
