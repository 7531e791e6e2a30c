//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `google.api.http` annotation decoding and path template parsing.
///
//===----------------------------------------------------------------------===//

#include "llvmgateway/Descriptor/HttpRule.h"

#include <cstddef>
#include <utility>

namespace llvmgateway
{
namespace
{

using google::protobuf::UnknownField;
using google::protobuf::UnknownFieldSet;

// google.api.HttpRule field numbers.
constexpr int RuleGet                = 2;
constexpr int RulePut                = 3;
constexpr int RulePost               = 4;
constexpr int RuleDelete             = 5;
constexpr int RulePatch              = 6;
constexpr int RuleBody               = 7;
constexpr int RuleCustom             = 8;
constexpr int RuleAdditionalBindings = 11;
constexpr int RuleResponseBody       = 12;

// google.api.CustomHttpPattern field numbers.
constexpr int CustomKind = 1;
constexpr int CustomPath = 2;

llvm::Error malformed(const llvm::StringRef what)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(), "malformed google.api.http rule: %s", what.data());
}

llvm::Expected<std::vector<HttpRuleSpec>> decodeRule(const UnknownFieldSet& rule, const bool nested)
{
    HttpRuleSpec             primary;
    bool                     hasPattern = false;
    std::vector<std::string> additional;

    for (int i = 0; i < rule.field_count(); ++i)
    {
        const UnknownField& field = rule.field(i);
        if (field.type() != UnknownField::TYPE_LENGTH_DELIMITED)
        {
            continue;
        }
        const std::string& payload = field.length_delimited();
        switch (field.number())
        {
        case RuleGet:
        case RulePut:
        case RulePost:
        case RuleDelete:
        case RulePatch: {
            static const HttpMethod methods[] =
                {HttpMethod::Get, HttpMethod::Put, HttpMethod::Post, HttpMethod::Delete, HttpMethod::Patch};
            primary.method       = methods[field.number() - RuleGet];
            primary.verb         = httpMethodVerb(primary.method).str();
            primary.pathTemplate = payload;
            hasPattern           = true;
            break;
        }
        case RuleCustom: {
            UnknownFieldSet custom;
            if (!custom.ParseFromString(payload))
            {
                return malformed("custom pattern");
            }
            primary.method = HttpMethod::Custom;
            primary.verb.clear();
            primary.pathTemplate.clear();
            for (int j = 0; j < custom.field_count(); ++j)
            {
                const UnknownField& part = custom.field(j);
                if (part.type() != UnknownField::TYPE_LENGTH_DELIMITED)
                {
                    continue;
                }
                if (part.number() == CustomKind)
                {
                    primary.verb = part.length_delimited();
                }
                else if (part.number() == CustomPath)
                {
                    primary.pathTemplate = part.length_delimited();
                }
            }
            hasPattern = true;
            break;
        }
        case RuleBody:
            primary.body = payload;
            break;
        case RuleResponseBody:
            primary.responseBody = payload;
            break;
        case RuleAdditionalBindings: {
            if (nested)
            {
                return malformed("additional_bindings may not be nested");
            }
            additional.push_back(payload);
            break;
        }
        default:
            break;
        }
    }

    if (!hasPattern)
    {
        return malformed("no pattern specified");
    }
    if (primary.method == HttpMethod::Custom && primary.verb.empty())
    {
        return malformed("custom pattern without a kind");
    }

    std::vector<HttpRuleSpec> rules{std::move(primary)};
    for (const auto& encoded : additional)
    {
        UnknownFieldSet binding;
        if (!binding.ParseFromString(encoded))
        {
            return malformed("additional binding");
        }
        auto decoded = decodeRule(binding, true);
        if (!decoded)
        {
            return decoded.takeError();
        }
        rules.insert(rules.end(), decoded->begin(), decoded->end());
    }
    return rules;
}

}  // namespace

llvm::StringRef httpMethodVerb(const HttpMethod method)
{
    switch (method)
    {
    case HttpMethod::Get:
        return "GET";
    case HttpMethod::Put:
        return "PUT";
    case HttpMethod::Post:
        return "POST";
    case HttpMethod::Delete:
        return "DELETE";
    case HttpMethod::Patch:
        return "PATCH";
    case HttpMethod::Custom:
        break;
    }
    return "";
}

llvm::Expected<std::vector<HttpRuleSpec>> decodeHttpRule(const UnknownFieldSet& rule)
{
    return decodeRule(rule, false);
}

llvm::Expected<std::vector<HttpRuleSpec>> decodeMethodHttpRules(const google::protobuf::MethodOptions& options)
{
    // Repeated occurrences of a singular message field merge, which is the
    // same as parsing their concatenation.
    std::string payload;
    bool        present = false;
    const auto& unknown = options.unknown_fields();
    for (int i = 0; i < unknown.field_count(); ++i)
    {
        const UnknownField& field = unknown.field(i);
        if (field.number() == HttpRuleExtensionNumber && field.type() == UnknownField::TYPE_LENGTH_DELIMITED)
        {
            payload += field.length_delimited();
            present = true;
        }
    }
    if (!present)
    {
        return std::vector<HttpRuleSpec>{};
    }

    UnknownFieldSet rule;
    if (!rule.ParseFromString(payload))
    {
        return malformed("undecodable payload");
    }
    return decodeHttpRule(rule);
}

llvm::Expected<std::vector<PathTemplateVariable>> parsePathTemplate(const llvm::StringRef pathTemplate)
{
    if (!pathTemplate.starts_with("/"))
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "path template %s must start with '/'",
                                       pathTemplate.str().c_str());
    }

    std::vector<PathTemplateVariable> variables;
    std::size_t                       pos = 0;
    while (pos < pathTemplate.size())
    {
        const char c = pathTemplate[pos];
        if (c == '}')
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "unbalanced '}' in path template %s",
                                           pathTemplate.str().c_str());
        }
        if (c != '{')
        {
            ++pos;
            continue;
        }

        const std::size_t close = pathTemplate.find('}', pos + 1);
        const std::size_t reopen = pathTemplate.find('{', pos + 1);
        if (close == llvm::StringRef::npos || (reopen != llvm::StringRef::npos && reopen < close))
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "unterminated variable in path template %s",
                                           pathTemplate.str().c_str());
        }

        const auto body  = pathTemplate.slice(pos + 1, close);
        const auto parts = body.split('=');
        const auto field = parts.first.trim();
        if (field.empty() || field.starts_with(".") || field.ends_with(".") || field.contains(".."))
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "invalid variable {%s} in path template %s",
                                           body.str().c_str(),
                                           pathTemplate.str().c_str());
        }
        variables.push_back(PathTemplateVariable{field.str(), parts.second.str()});
        pos = close + 1;
    }
    return variables;
}

}  // namespace llvmgateway
