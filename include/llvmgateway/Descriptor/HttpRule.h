//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Decoding of `google.api.http` method annotations and path templates.
///
/// The plugin does not link the `google.api` descriptors, so the annotation
/// arrives as an unknown field of `MethodOptions` and is decoded from its wire
/// form.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMGATEWAY_DESCRIPTOR_HTTP_RULE_H
#define LLVMGATEWAY_DESCRIPTOR_HTTP_RULE_H

#include <string>
#include <vector>

#include <google/protobuf/descriptor.pb.h>
#include <google/protobuf/unknown_field_set.h>

#include "llvmgateway/Descriptor/Model.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace llvmgateway
{

/// @brief Field number of the `google.api.http` extension of `MethodOptions`.
inline constexpr int HttpRuleExtensionNumber = 72295728;

/// @brief One HTTP rule before it is resolved against the request message.
struct HttpRuleSpec final
{
    HttpMethod  method{HttpMethod::Get};
    std::string verb;
    std::string pathTemplate;
    std::string body;
    std::string responseBody;
};

/// @brief One `{field.path}` or `{field.path=pattern}` template variable.
struct PathTemplateVariable final
{
    std::string fieldPath;

    /// @brief Segment pattern; empty when the variable matches one segment.
    std::string pattern;
};

/// @brief Returns the upper-case HTTP verb for a non-custom method.
llvm::StringRef httpMethodVerb(HttpMethod method);

/// @brief Decodes an encoded `HttpRule` message.
/// @details The primary rule comes first, followed by its additional bindings
/// in declaration order. Additional bindings may not nest further.
/// @param[in] rule Unknown-field view of the `HttpRule` payload.
/// @return Flattened rules, or an error for a rule without a pattern.
llvm::Expected<std::vector<HttpRuleSpec>> decodeHttpRule(const google::protobuf::UnknownFieldSet& rule);

/// @brief Extracts the HTTP rules attached to a method.
/// @param[in] options Method options as received from protoc.
/// @return Flattened rules; empty when the method carries no annotation.
llvm::Expected<std::vector<HttpRuleSpec>> decodeMethodHttpRules(const google::protobuf::MethodOptions& options);

/// @brief Parses the variables of a path template.
/// @param[in] pathTemplate Template such as `/v1/{name=messages/*}:cancel`.
/// @return Variables in order of appearance, or an error when the template
///         does not start with `/`, has unbalanced or nested braces, or
///         declares an empty variable.
llvm::Expected<std::vector<PathTemplateVariable>> parsePathTemplate(llvm::StringRef pathTemplate);

}  // namespace llvmgateway

#endif  // LLVMGATEWAY_DESCRIPTOR_HTTP_RULE_H
