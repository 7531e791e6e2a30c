//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements lexical validation and normalization of generated Go source.
///
/// A single forward scan tracks comments, literals and bracket nesting while
/// building the normalized output, so raw string literals are copied verbatim.
///
//===----------------------------------------------------------------------===//

#include "llvmgateway/CodeGen/GoSourceFormat.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "llvm/Support/FormatVariadic.h"

namespace llvmgateway
{
namespace
{

bool isIdentStart(const char c)
{
    const auto u = static_cast<unsigned char>(c);
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || u >= 0x80;
}

bool isIdentContinue(const char c)
{
    return isIdentStart(c) || (c >= '0' && c <= '9');
}

struct OpenBracket final
{
    char          kind;
    std::uint32_t line;
    std::uint32_t column;
};

char closingFor(const char open)
{
    switch (open)
    {
    case '(':
        return ')';
    case '[':
        return ']';
    default:
        return '}';
    }
}

class GoSourceScanner final
{
public:
    explicit GoSourceScanner(const llvm::StringRef source)
        : source_(source)
    {
    }

    llvm::Expected<std::string> run()
    {
        while (pos_ < source_.size())
        {
            const char c = source_[pos_];
            if (c == '\n' || c == ' ' || c == '\t' || c == '\r' || c == '\f')
            {
                emitWhitespace(c);
                advance();
                continue;
            }
            if (source_.substr(pos_).starts_with("//"))
            {
                scanLineComment();
                continue;
            }
            if (source_.substr(pos_).starts_with("/*"))
            {
                if (!scanBlockComment())
                {
                    return fail("comment not terminated");
                }
                continue;
            }
            if ((c == '"' || c == '\'' || c == '`') && tokenCount_ < 2)
            {
                return fail("expected 'package' clause");
            }
            if (c == '"' || c == '\'')
            {
                if (auto message = scanQuoted(c))
                {
                    return fail(*message);
                }
                ++tokenCount_;
                continue;
            }
            if (c == '`')
            {
                if (!scanRawString())
                {
                    return fail("raw string literal not terminated");
                }
                ++tokenCount_;
                continue;
            }
            if (isIdentStart(c))
            {
                if (auto message = scanIdentifier())
                {
                    return fail(*message);
                }
                continue;
            }
            if (tokenCount_ < 2)
            {
                return fail("expected 'package' clause");
            }
            if (c == '(' || c == '[' || c == '{')
            {
                open_.push_back(OpenBracket{c, line_, column_});
            }
            else if (c == ')' || c == ']' || c == '}')
            {
                if (open_.empty() || closingFor(open_.back().kind) != c)
                {
                    return fail(llvm::formatv("unexpected '{0}'", std::string(1, c)).str());
                }
                open_.pop_back();
            }
            ++tokenCount_;
            emitChar(c);
            advance();
        }

        if (!open_.empty())
        {
            const auto& open = open_.back();
            return failAt(open.line,
                          open.column,
                          llvm::formatv("'{0}' is never closed", std::string(1, open.kind)).str());
        }
        if (tokenCount_ < 2)
        {
            return fail("expected 'package' clause");
        }
        out_.push_back('\n');
        return std::move(out_);
    }

private:
    void advance()
    {
        if (source_[pos_] == '\n')
        {
            ++line_;
            column_ = 1;
        }
        else
        {
            ++column_;
        }
        ++pos_;
    }

    void emitWhitespace(const char c)
    {
        if (c == '\n')
        {
            pendingSpace_.clear();
            ++pendingNewlines_;
            return;
        }
        if (c != '\r')
        {
            pendingSpace_.push_back(c);
        }
    }

    void flushPending()
    {
        if (!out_.empty())
        {
            out_.append(pendingNewlines_ > 2 ? 2 : pendingNewlines_, '\n');
            out_ += pendingSpace_;
        }
        pendingNewlines_ = 0;
        pendingSpace_.clear();
    }

    void emitChar(const char c)
    {
        if (c == '\n' || c == ' ' || c == '\t' || c == '\r' || c == '\f')
        {
            emitWhitespace(c);
            return;
        }
        flushPending();
        out_.push_back(c);
    }

    void scanLineComment()
    {
        while (pos_ < source_.size() && source_[pos_] != '\n')
        {
            emitChar(source_[pos_]);
            advance();
        }
    }

    bool scanBlockComment()
    {
        emitChar('/');
        advance();
        emitChar('*');
        advance();
        while (pos_ < source_.size())
        {
            if (source_.substr(pos_).starts_with("*/"))
            {
                emitChar('*');
                advance();
                emitChar('/');
                advance();
                return true;
            }
            emitChar(source_[pos_]);
            advance();
        }
        return false;
    }

    std::optional<std::string> scanQuoted(const char quote)
    {
        const char* const what = quote == '"' ? "string literal" : "rune literal";
        emitChar(quote);
        advance();
        while (pos_ < source_.size())
        {
            const char c = source_[pos_];
            if (c == '\n')
            {
                return llvm::formatv("newline in {0}", what).str();
            }
            if (c == '\\')
            {
                flushPending();
                out_.push_back(c);
                advance();
                if (pos_ >= source_.size() || source_[pos_] == '\n')
                {
                    return llvm::formatv("{0} not terminated", what).str();
                }
                out_.push_back(source_[pos_]);
                advance();
                continue;
            }
            if (c == quote)
            {
                emitChar(c);
                advance();
                return std::nullopt;
            }
            flushPending();
            out_.push_back(c);
            advance();
        }
        return llvm::formatv("{0} not terminated", what).str();
    }

    bool scanRawString()
    {
        flushPending();
        out_.push_back('`');
        advance();
        while (pos_ < source_.size())
        {
            const char c = source_[pos_];
            out_.push_back(c);
            advance();
            if (c == '`')
            {
                return true;
            }
        }
        return false;
    }

    std::optional<std::string> scanIdentifier()
    {
        const std::size_t start = pos_;
        while (pos_ < source_.size() && isIdentContinue(source_[pos_]))
        {
            emitChar(source_[pos_]);
            advance();
        }
        const llvm::StringRef ident = source_.slice(start, pos_);
        if (tokenCount_ == 0 && ident != "package")
        {
            return std::string("expected 'package' clause");
        }
        if (tokenCount_ == 1 && ident == "_")
        {
            return std::string("invalid package name _");
        }
        ++tokenCount_;
        return std::nullopt;
    }

    llvm::Error failAt(const std::uint32_t line, const std::uint32_t column, const std::string& message) const
    {
        const auto text = llvm::formatv("{0}:{1}: {2}: {3}", line, column, message, source_).str();
        return llvm::createStringError(llvm::inconvertibleErrorCode(), text.c_str());
    }

    llvm::Error fail(const std::string& message) const
    {
        return failAt(line_, column_, message);
    }

    llvm::StringRef          source_;
    std::size_t              pos_{0};
    std::uint32_t            line_{1};
    std::uint32_t            column_{1};
    std::size_t              tokenCount_{0};
    std::vector<OpenBracket> open_;
    std::string              out_;
    std::string              pendingSpace_;
    std::size_t              pendingNewlines_{0};
};

}  // namespace

llvm::Expected<std::string> formatGoSource(const llvm::StringRef source)
{
    GoSourceScanner scanner(source);
    return scanner.run();
}

}  // namespace llvmgateway
