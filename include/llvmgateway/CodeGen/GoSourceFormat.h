//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Lexical validation and whitespace normalization of generated Go source.
///
/// The check rejects text a Go parser would reject at the lexical level:
/// unterminated comments and literals, mismatched brackets, and a missing
/// package clause. Normalization removes trailing whitespace and collapses
/// blank-line runs; raw string literal contents are preserved.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMGATEWAY_CODEGEN_GO_SOURCE_FORMAT_H
#define LLVMGATEWAY_CODEGEN_GO_SOURCE_FORMAT_H

#include <string>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace llvmgateway
{

/// @brief Validates and normalizes Go source text.
/// @param[in] source Raw generated text.
/// @return Normalized text ending in exactly one newline, or an error whose
///         message names `line:column` and echoes `source`.
llvm::Expected<std::string> formatGoSource(llvm::StringRef source);

}  // namespace llvmgateway

#endif  // LLVMGATEWAY_CODEGEN_GO_SOURCE_FORMAT_H
