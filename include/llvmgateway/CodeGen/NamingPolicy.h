//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Go naming helpers shared by the registry and the template renderer.
///
/// Identifier projection follows the conventions of the Go protobuf code
/// generator so that generated gateway code refers to the same symbols.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMGATEWAY_CODEGEN_NAMING_POLICY_H
#define LLVMGATEWAY_CODEGEN_NAMING_POLICY_H

#include <string>

#include "llvm/ADT/StringRef.h"

namespace llvmgateway
{

/// @brief Returns true when `name` is a Go keyword.
bool goIsKeyword(llvm::StringRef name);

/// @brief Sanitizes one identifier for Go.
/// @param[in] name Candidate identifier.
/// @return Identifier with invalid characters replaced, a leading digit
///         prefixed and keywords suffixed with `_`.
std::string goSanitizeIdentifier(llvm::StringRef name);

/// @brief Projects a proto name into an exported Go CamelCase identifier.
/// @details Underscores followed by a lower-case letter start a new word, a
/// leading underscore becomes `X`, dots separate words, and a lower-case
/// letter after a digit is upper-cased.
/// @param[in] name Proto identifier, e.g. `get_message`.
/// @return Go identifier, e.g. `GetMessage`.
std::string goCamelCase(llvm::StringRef name);

/// @brief Derives a Go package name from an import path.
/// @param[in] importPath Import path such as `example.com/foo/v1`.
/// @return Sanitized last path element; `main` for an empty path.
std::string goPackageNameFromPath(llvm::StringRef importPath);

}  // namespace llvmgateway

#endif  // LLVMGATEWAY_CODEGEN_NAMING_POLICY_H
