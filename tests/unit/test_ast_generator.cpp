#include "helena/AstGenerator.h"
#include "helena/AstPrinter.h"

#include "test_tree_helpers.h"

#include <doctest/doctest.h>

using helena::NodeKind;
using Path = std::vector<std::string>;

namespace {
std::string lines(std::initializer_list<const char *> parts) {
  std::string source;
  for (const char *part : parts) {
    source += part;
    source += helena::kNewline;
  }
  return source;
}
} // namespace

TEST_SUITE_BEGIN("helena.generator");

TEST_CASE("generates nothing for empty source") {
  helena::AstGenerator generator;
  helena::Ast ast;
  std::string error;
  CHECK(generator.generate("", ast, error));
  CHECK(ast.roots.empty());
  CHECK(ast.tree.size() == 0);
}

TEST_CASE("generates a single parameterless function") {
  helena::AstGenerator generator;
  helena::Ast ast;
  std::string error;
  REQUIRE(generator.generate("func main():", ast, error));
  REQUIRE(ast.roots.size() == 1);
  CHECK((helena::test::firstPath(ast.tree, ast.roots[0]) == Path{"func", " ", "main", "(", ")", ":", "<leaf>"}));
}

TEST_CASE("nests the newline that ends a declaration") {
  helena::AstGenerator generator;
  helena::Ast ast;
  std::string error;
  REQUIRE(generator.generate(lines({"func main(string[] args):"}), ast, error));
  REQUIRE(ast.roots.size() == 1);
  CHECK((helena::test::firstPath(ast.tree, ast.roots[0]) ==
        Path{"func", " ", "main", "(", "string[]", " ", "args", ")", ":", helena::kNewline, "<leaf>"}));
}

TEST_CASE("keeps blank lines as top-level newlines") {
  helena::AstGenerator generator;
  helena::Ast ast;
  std::string error;
  const std::string source = lines({"func main(string[] args, int count): run", "", "func other():"});
  REQUIRE(generator.generate(source, ast, error));
  REQUIRE(ast.roots.size() == 3);

  const helena::Node &blank = ast.tree.node(ast.roots[1]);
  REQUIRE(blank.continuations.size() == 1);
  CHECK(ast.tree.node(*blank.continuations[0]).kind == NodeKind::Newline);
  CHECK((blank.position == helena::Position{2, 0}));

  CHECK((helena::test::firstPath(ast.tree, ast.roots[0]) ==
        Path{"func", " ",     "main", "(", "string[]", " ",      "args",          ", ",   "int",
             " ",    "count", ")",    ":", " ",        "run",    helena::kNewline, "<leaf>"}));
  CHECK((ast.tree.node(ast.roots[2]).position == helena::Position{3, 0}));

  for (helena::NodeId root : ast.roots) {
    std::string invariantError;
    CHECK(helena::test::holdsInvariants(ast.tree, root, invariantError));
  }
}

TEST_CASE("positions follow the source text") {
  helena::AstGenerator generator;
  helena::Ast ast;
  std::string error;
  REQUIRE(generator.generate("func main(string[] args, int count): run", ast, error));
  const auto ids = helena::test::firstPathIds(ast.tree, ast.roots[0]);
  REQUIRE(ids.size() == 15);
  const int expectedRows[] = {4, 5, 9, 10, 18, 19, 23, 25, 28, 29, 34, 35, 36, 37, 40};
  for (size_t i = 0; i < ids.size(); ++i) {
    CHECK(ast.tree.node(ids[i]).position.row == expectedRows[i]);
    CHECK(ast.tree.node(ids[i]).position.column == 1);
  }
}

TEST_CASE("caps rows for productions starting past offset one hundred") {
  std::string source = "func a(";
  for (int i = 0; i < 12; ++i) {
    if (i > 0) {
      source += ", ";
    }
    source += "int p" + std::to_string(i);
  }
  source += "):func b():";
  helena::AstGenerator generator;
  helena::Ast ast;
  std::string error;
  REQUIRE(generator.generate(source, ast, error));
  REQUIRE(ast.roots.size() == 2);
  CHECK((ast.tree.node(ast.roots[1]).position == helena::Position{1, helena::kMaxRow}));
  for (helena::NodeId id = 0; id < ast.tree.size(); ++id) {
    CHECK(ast.tree.node(id).position.row <= helena::kMaxRow);
  }
  for (helena::NodeId id : helena::test::firstPathIds(ast.tree, ast.roots[1])) {
    CHECK(ast.tree.node(id).position.row == helena::kMaxRow);
  }
}

TEST_CASE("rejects a bare newline when newlines may not lead") {
  helena::AstGeneratorOptions options;
  options.maxLeafing[helena::TopLevelRule::Newline] = 0;
  helena::AstGenerator generator(options);
  helena::Ast ast;
  std::string error;
  CHECK_FALSE(generator.generate(helena::kNewline, ast, error));
  CHECK(error == "1:0: newline exceeds its maximum of 0 top-level occurrence(s).");
}

TEST_CASE("still nests newlines when bare newlines are capped") {
  helena::AstGeneratorOptions options;
  options.maxLeafing[helena::TopLevelRule::Newline] = 0;
  helena::AstGenerator generator(options);
  helena::Ast ast;
  std::string error;
  CHECK(generator.generate(lines({"func a():", "func b():"}), ast, error));
  CHECK(ast.roots.size() == 2);
}

TEST_CASE("enforces the function cap") {
  helena::AstGeneratorOptions options;
  options.maxLeafing[helena::TopLevelRule::Function] = 1;
  helena::AstGenerator generator(options);
  helena::Ast ast;
  std::string error;
  CHECK_FALSE(generator.generate(lines({"func a():", "func b():"}), ast, error));
  CHECK(error == "2:0: function exceeds its maximum of 1 top-level occurrence(s).");
  CHECK(ast.roots.empty());
}

TEST_CASE("treats a rule missing from the options as never top-level") {
  helena::AstGeneratorOptions options;
  options.maxLeafing.erase(helena::TopLevelRule::Function);
  helena::AstGenerator generator(options);
  helena::Ast ast;
  std::string error;
  CHECK_FALSE(generator.generate("func main():", ast, error));
  CHECK(error == "1:0: function exceeds its maximum of 0 top-level occurrence(s).");
}

TEST_CASE("reports the first rule's mismatch for unmatched input") {
  helena::AstGenerator generator;
  helena::Ast ast;
  std::string error;
  CHECK_FALSE(generator.generate("fun main():", ast, error));
  CHECK(error == "1:0: Textual representation of node (\"fun\") does not match \"func\".");
}

TEST_CASE("fails on an unterminated parameter list") {
  helena::AstGenerator generator;
  helena::Ast ast;
  std::string error;
  CHECK_FALSE(generator.generate("func main(string[] args", ast, error));
  CHECK(error == "1:0: Textual representation of node (\"\") does not match \")\".");
}

TEST_CASE("fails on a later line without keeping earlier roots") {
  helena::AstGenerator generator;
  helena::Ast ast;
  std::string error;
  CHECK_FALSE(generator.generate(lines({"func main():", "func bad name():"}), ast, error));
  CHECK(error.rfind("2:0: ", 0) == 0);
  CHECK(ast.roots.empty());
  CHECK(ast.tree.size() == 0);
}

TEST_CASE("rejects double spacing") {
  helena::AstGenerator generator;
  helena::Ast ast;
  std::string error;
  CHECK_FALSE(generator.generate("func  main():", ast, error));
  CHECK(error == "1:0: Textual representation of node (\"  \") does not match \" \".");
}

TEST_CASE("renders a generated function") {
  helena::AstGenerator generator;
  helena::Ast ast;
  std::string error;
  REQUIRE(generator.generate("func main(): run", ast, error));
  helena::AstPrinter printer;
  const std::string expected =
      "├─ Root\n"
      "   ├─ Keyword \"func\"\n"
      "      ├─ Spacing\n"
      "         ├─ Identifier \"main\"\n"
      "            ├─ Keyword \"(\"\n"
      "               ├─ Keyword \")\"\n"
      "                  ├─ Keyword \":\"\n"
      "                     ├─ Spacing\n"
      "                        ├─ Operation \"run\"\n";
  CHECK(printer.print(ast) == expected);
}

TEST_CASE("names and parses top-level rules") {
  helena::TopLevelRule rule = helena::TopLevelRule::Function;
  CHECK(helena::parseTopLevelRule("newline", rule));
  CHECK(rule == helena::TopLevelRule::Newline);
  CHECK(helena::topLevelRuleName(helena::TopLevelRule::Function) == "function");
  CHECK_FALSE(helena::parseTopLevelRule("statement", rule));
}

TEST_SUITE_END();
