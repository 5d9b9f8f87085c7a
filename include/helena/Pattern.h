#pragma once

#include <string>
#include <vector>

namespace helena {

enum class NodeKind { Root, Keyword, Identifier, TypeName, Spacing, Newline, ListSeparator, Operation };

#if defined(_WIN32)
inline const char *const kNewline = "\r\n";
#else
inline const char *const kNewline = "\n";
#endif

inline const char *const kSpacing = " ";
inline const char *const kListSeparator = ", ";

std::string nodeKindName(NodeKind kind);
const std::vector<std::string> &keywordLiterals();

bool validatePattern(NodeKind kind, const std::string &text, std::string &error);
bool validateKeyword(const std::string &keyword, const std::string &text, std::string &error);
bool validateIdentifier(const std::string &text, std::string &error);
bool validateTypeName(const std::string &text, std::string &error);

} // namespace helena
