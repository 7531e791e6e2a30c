//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Output path projection for generated gateway files.
///
/// Three mutually exclusive rules pick the output location of a file:
/// module-prefix stripping, import-path relative placement, and
/// source-relative placement. A module prefix is only meaningful with
/// import-relative placement; combining it with any other mode is rejected.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMGATEWAY_CODEGEN_OUTPUT_PATH_RESOLVER_H
#define LLVMGATEWAY_CODEGEN_OUTPUT_PATH_RESOLVER_H

#include <string>

#include "llvmgateway/Descriptor/Model.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace llvmgateway
{

/// @brief Placement of generated files relative to the output root.
enum class AddressingMode
{
    /// @brief Place files under their Go import path (`paths=import`).
    Import,

    /// @brief Place files next to their source proto (`paths=source_relative`).
    SourceRelative,
};

/// @brief Path placement settings fixed for the whole run.
struct PathConfig final
{
    /// @brief Addressing mode.
    AddressingMode mode{AddressingMode::Import};

    /// @brief Go module prefix stripped from import paths (`module=`).
    std::string modulePrefix;
};

/// @brief Suffix replacing the proto extension of emitted gateway files.
inline constexpr const char GatewayFileSuffix[] = ".pb.gw.go";

/// @brief Parses a `paths=` value.
/// @param[in] text `import`, `source_relative`, or empty for the default.
/// @return Parsed mode or an error naming the accepted values.
llvm::Expected<AddressingMode> parseAddressingMode(llvm::StringRef text);

/// @brief Rejects a module prefix combined with a non-import addressing mode.
/// @param[in] config Path settings.
/// @return Success or a configuration-conflict error.
llvm::Error validatePathConfig(const PathConfig& config);

/// @brief Computes the output path of a file's gateway companion.
/// @param[in] fileName Proto file name as given to protoc.
/// @param[in] goPackagePath Go import path of the file, possibly empty.
/// @param[in] config Path settings.
/// @return Output path still carrying the proto extension, or an error.
llvm::Expected<std::string> resolveOutputPath(llvm::StringRef   fileName,
                                              llvm::StringRef   goPackagePath,
                                              const PathConfig& config);

/// @brief Computes the output path of a file's gateway companion.
/// @param[in] file Source file.
/// @param[in] config Path settings.
/// @return Output path still carrying the proto extension, or an error.
llvm::Expected<std::string> resolveOutputPath(const File& file, const PathConfig& config);

/// @brief Replaces the extension of a resolved path with `.pb.gw.go`.
/// @param[in] resolvedPath Result of `resolveOutputPath`.
/// @return Emitted file name.
std::string renderGatewayFileName(llvm::StringRef resolvedPath);

}  // namespace llvmgateway

#endif  // LLVMGATEWAY_CODEGEN_OUTPUT_PATH_RESOLVER_H
