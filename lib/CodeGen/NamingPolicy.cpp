//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements Go naming helpers shared by the registry and the renderer.
///
//===----------------------------------------------------------------------===//

#include "llvmgateway/CodeGen/NamingPolicy.h"

#include <cctype>
#include <cstddef>

#include "llvm/ADT/StringSet.h"

namespace llvmgateway
{
namespace
{

bool isAsciiLower(const char c)
{
    return c >= 'a' && c <= 'z';
}

bool isAsciiDigit(const char c)
{
    return c >= '0' && c <= '9';
}

}  // namespace

bool goIsKeyword(const llvm::StringRef name)
{
    static const llvm::StringSet<> goKeywords = {"break",    "default",     "func",   "interface", "select",
                                                 "case",     "defer",       "go",     "map",       "struct",
                                                 "chan",     "else",        "goto",   "package",   "switch",
                                                 "const",    "fallthrough", "if",     "range",     "type",
                                                 "continue", "for",         "import", "return",    "var"};
    return goKeywords.contains(name);
}

std::string goSanitizeIdentifier(const llvm::StringRef name)
{
    std::string out = name.str();
    if (out.empty())
    {
        return "_";
    }
    for (char& c : out)
    {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_'))
        {
            c = '_';
        }
    }
    if (std::isdigit(static_cast<unsigned char>(out.front())))
    {
        out.insert(out.begin(), '_');
    }
    if (goIsKeyword(out))
    {
        out += "_";
    }
    return out;
}

std::string goCamelCase(const llvm::StringRef name)
{
    std::string out;
    out.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i)
    {
        char c = name[i];
        if (c == '.' && i + 1 < name.size() && isAsciiLower(name[i + 1]))
        {
            continue;
        }
        if (c == '.')
        {
            out.push_back('_');
            continue;
        }
        if (c == '_' && (i == 0 || name[i - 1] == '.'))
        {
            out.push_back('X');
            continue;
        }
        if (c == '_' && i + 1 < name.size() && isAsciiLower(name[i + 1]))
        {
            continue;
        }
        if (isAsciiDigit(c))
        {
            out.push_back(c);
            continue;
        }
        if (isAsciiLower(c))
        {
            c = static_cast<char>(c - 'a' + 'A');
        }
        out.push_back(c);
        while (i + 1 < name.size() && isAsciiLower(name[i + 1]))
        {
            out.push_back(name[++i]);
        }
    }
    return out;
}

std::string goPackageNameFromPath(const llvm::StringRef importPath)
{
    const llvm::StringRef trimmed = importPath.rtrim('/');
    if (trimmed.empty())
    {
        return "main";
    }
    const auto split = trimmed.find_last_of('/');
    const auto leaf  = split == llvm::StringRef::npos ? trimmed : trimmed.substr(split + 1);
    return goSanitizeIdentifier(leaf);
}

}  // namespace llvmgateway
