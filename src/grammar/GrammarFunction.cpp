#include "helena/Grammar.h"

namespace helena {
namespace {

Chain endOfDeclaration(Tree &tree, const FunctionDeclaration &declaration) {
  if (!declaration.terminator.has_value()) {
    return [&tree](NodeId id, std::string &) { return tree.leaf(id); };
  }
  return [&tree, &declaration](NodeId id, std::string &error) {
    return expectNewline(tree, id, *declaration.terminator, {}, error);
  };
}

Chain scopeDelimiter(Tree &tree, const FunctionDeclaration &declaration) {
  Chain end = endOfDeclaration(tree, declaration);
  Chain afterDelimiter = end;
  if (declaration.body.has_value()) {
    const FunctionBody &body = *declaration.body;
    afterDelimiter = [&tree, &body, end](NodeId id, std::string &error) {
      return expectSpacing(
          tree,
          id,
          body.spacing,
          [&tree, &body, end](NodeId spacing, std::string &spacingError) {
            return expectOperation(tree, spacing, body.operation, end, spacingError);
          },
          error);
    };
  }
  return [&tree, &declaration, afterDelimiter](NodeId id, std::string &error) {
    return expectKeyword(tree, id, ":", declaration.delimiter, afterDelimiter, error);
  };
}

Chain valueParameter(Tree &tree, const ValueParameter &parameter, Chain afterIdentifier) {
  return [&tree, &parameter, afterIdentifier](NodeId id, std::string &error) {
    return expectTypeName(
        tree,
        id,
        parameter.typeName,
        [&tree, &parameter, afterIdentifier](NodeId typeName, std::string &typeError) {
          return expectSpacing(
              tree,
              typeName,
              parameter.spacing,
              [&tree, &parameter, afterIdentifier](NodeId spacing, std::string &spacingError) {
                return expectIdentifier(tree, spacing, parameter.identifier, afterIdentifier, spacingError);
              },
              typeError);
        },
        error);
  };
}

} // namespace

bool expectFunction(Tree &tree, NodeId id, const FunctionDeclaration &declaration, std::string &error) {
  const Chain delimiter = scopeDelimiter(tree, declaration);
  Chain parameters = [&tree, &declaration, delimiter](NodeId open, std::string &closeError) {
    return expectKeyword(tree, open, ")", declaration.close, delimiter, closeError);
  };
  // Folded right to left: the last parameter runs straight into ")", every earlier one reaches
  // its successor through a list separator.
  const auto &list = declaration.parameters;
  for (size_t i = list.size(); i > 0; --i) {
    const ValueParameter &parameter = list[i - 1];
    Chain afterIdentifier = parameters;
    if (i < list.size()) {
      const Chain next = parameters;
      afterIdentifier = [&tree, &parameter, next](NodeId identifier, std::string &separatorError) {
        return expectListSeparator(tree, identifier, parameter.separator, next, separatorError);
      };
    }
    parameters = valueParameter(tree, parameter, afterIdentifier);
  }

  return expectKeyword(
      tree,
      id,
      "func",
      declaration.keyword,
      [&tree, &declaration, parameters](NodeId keyword, std::string &keywordError) {
        return expectSpacing(
            tree,
            keyword,
            declaration.spacing,
            [&tree, &declaration, parameters](NodeId spacing, std::string &spacingError) {
              return expectIdentifier(
                  tree,
                  spacing,
                  declaration.name,
                  [&tree, &declaration, parameters](NodeId name, std::string &nameError) {
                    return expectKeyword(tree, name, "(", declaration.open, parameters, nameError);
                  },
                  spacingError);
            },
            keywordError);
      },
      error);
}

} // namespace helena
