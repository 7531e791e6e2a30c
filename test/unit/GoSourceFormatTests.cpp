//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "llvmgateway/CodeGen/GoSourceFormat.h"
#include "llvm/Support/Error.h"

namespace
{

bool expectFormatted(const std::string& source, const std::string& expected, const char* what)
{
    auto formatted = llvmgateway::formatGoSource(source);
    if (!formatted)
    {
        std::cerr << what << ": unexpected error: " << llvm::toString(formatted.takeError()) << "\n";
        return false;
    }
    if (*formatted != expected)
    {
        std::cerr << what << ": expected\n" << expected << "got\n" << *formatted;
        return false;
    }
    return true;
}

bool expectRejected(const std::string& source, const std::string& fragment, const char* what)
{
    auto formatted = llvmgateway::formatGoSource(source);
    if (formatted)
    {
        std::cerr << what << ": expected a validation error\n";
        return false;
    }
    const auto message = llvm::toString(formatted.takeError());
    if (message.find(fragment) == std::string::npos || message.find(source) == std::string::npos)
    {
        std::cerr << what << ": error must contain '" << fragment << "' and the raw text: " << message << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runGoSourceFormatTests()
{
    if (!expectFormatted("package foo", "package foo\n", "final newline"))
    {
        return false;
    }
    if (!expectFormatted("\n\n// header\npackage foo   \n\n\n\nvar x = 1\t\n\n\n",
                         "// header\npackage foo\n\nvar x = 1\n",
                         "blank lines and trailing whitespace"))
    {
        return false;
    }
    if (!expectFormatted("package foo\n\nfunc f() {\n\treturn\n}\n",
                         "package foo\n\nfunc f() {\n\treturn\n}\n",
                         "already normalized"))
    {
        return false;
    }
    if (!expectFormatted("package foo\n\nvar s = `a  \n\n\n\nb`\n",
                         "package foo\n\nvar s = `a  \n\n\n\nb`\n",
                         "raw string preserved"))
    {
        return false;
    }
    if (!expectFormatted("package foo\n\nvar s = \"}{)\" // ]\nvar r = '('\n",
                         "package foo\n\nvar s = \"}{)\" // ]\nvar r = '('\n",
                         "brackets inside literals and comments"))
    {
        return false;
    }
    if (!expectFormatted("/* a\n\n\n\nb */\npackage foo\n", "/* a\n\nb */\npackage foo\n", "block comment"))
    {
        return false;
    }

    if (!expectRejected("package foo\n\nfunc f() {\n", "is never closed", "unclosed brace"))
    {
        return false;
    }
    if (!expectRejected("package foo\n\nvar x = (1]\n", "unexpected ']'", "mismatched bracket"))
    {
        return false;
    }
    if (!expectRejected("package foo\n\nvar s = \"abc\n", "newline in string literal", "unterminated string"))
    {
        return false;
    }
    if (!expectRejected("package foo\n\nvar s = `abc", "raw string literal not terminated", "unterminated raw string"))
    {
        return false;
    }
    if (!expectRejected("package foo\n/* open", "comment not terminated", "unterminated comment"))
    {
        return false;
    }
    if (!expectRejected("func f() {}\n", "expected 'package' clause", "missing package clause"))
    {
        return false;
    }
    if (!expectRejected("package _\n", "invalid package name _", "blank package name"))
    {
        return false;
    }
    if (!expectRejected("// only a comment\n", "expected 'package' clause", "empty file"))
    {
        return false;
    }

    {
        auto formatted = llvmgateway::formatGoSource("package foo\n\nvar x = )\n");
        if (formatted)
        {
            std::cerr << "stray closing bracket must be rejected\n";
            return false;
        }
        const auto message = llvm::toString(formatted.takeError());
        if (message.rfind("3:9:", 0) != 0)
        {
            std::cerr << "error must start with line:column: " << message << "\n";
            return false;
        }
    }

    return true;
}
