//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Public entry points and options for gateway file generation.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMGATEWAY_CODEGEN_GATEWAY_GENERATOR_H
#define LLVMGATEWAY_CODEGEN_GATEWAY_GENERATOR_H

#include <functional>
#include <string>
#include <vector>

#include "llvmgateway/CodeGen/ImportCollector.h"
#include "llvmgateway/CodeGen/OutputPathResolver.h"
#include "llvmgateway/Descriptor/Model.h"
#include "llvmgateway/Support/Diagnostics.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace llvmgateway
{

/// @brief Configuration options for gateway generation.
struct GatewayOptions final
{
    /// @brief Packages every generated file imports.
    std::vector<GoPackage> baseImports{defaultGatewayBaseImports()};

    /// @brief Derives handler contexts from `req.Context()` when true.
    bool useRequestContext{true};

    /// @brief Suffix of generated `Register*` functions.
    std::string registerFuncSuffix{"Handler"};

    /// @brief Raw `paths=` value; empty selects `import`.
    std::string pathType;

    /// @brief Go module prefix stripped from output paths.
    std::string modulePrefix;

    /// @brief Derives update masks for PATCH bodies when true.
    bool allowPatchFeature{true};

    /// @brief Generates into a separate package importing the source package.
    bool standalone{false};

    /// @brief Omits the package documentation comment.
    bool omitPackageDoc{false};
};

/// @brief Everything the template renderer needs for one file.
struct RenderRequest final
{
    /// @brief Source file.
    const File* file{nullptr};

    /// @brief Import list from `collectGatewayImports`.
    std::vector<GoPackage> imports;

    /// @brief See `GatewayOptions::useRequestContext`.
    bool useRequestContext{true};

    /// @brief See `GatewayOptions::registerFuncSuffix`.
    std::string registerFuncSuffix;

    /// @brief See `GatewayOptions::allowPatchFeature`.
    bool allowPatchFeature{true};

    /// @brief See `GatewayOptions::omitPackageDoc`.
    bool omitPackageDoc{false};

    /// @brief See `GatewayOptions::standalone`.
    bool standalone{false};
};

/// @brief One generated file.
struct GatewayArtifact final
{
    /// @brief Go package of the source file.
    GoPackage goPackage;

    /// @brief Output file name, e.g. `example.com/foo/svc.pb.gw.go`.
    std::string name;

    /// @brief Normalized Go source.
    std::string content;
};

/// @brief Renders Go source for a render request.
using GatewayRenderFn = std::function<llvm::Expected<std::string>(const RenderRequest&)>;

/// @brief Validates and normalizes Go source text.
using SourceFormatFn = std::function<llvm::Expected<std::string>(llvm::StringRef)>;

/// @brief Returns true when some service of `file` has a method with bindings.
/// @param[in] file Source file.
/// @return True when a gateway file must be generated.
bool hasTargetService(const File& file);

/// @brief Drives per-file gateway generation for a batch of proto files.
class GatewayGenerator final
{
public:
    /// @brief Builds a generator after validating path settings.
    /// @param[in] options Run configuration.
    /// @param[in] enums Enum resolver for path parameter imports.
    /// @param[in] render Template renderer.
    /// @param[in] format Source validator and normalizer.
    /// @param[in,out] diagnostics Diagnostic sink.
    /// @return Generator, or an error for unknown or conflicting path settings.
    static llvm::Expected<GatewayGenerator> create(GatewayOptions           options,
                                                   const EnumPackageLookup& enums,
                                                   GatewayRenderFn          render,
                                                   SourceFormatFn           format,
                                                   DiagnosticEngine&        diagnostics);

    /// @brief Generates gateway files for all targets, in order.
    /// @details Files without a bound method are skipped. Any other failure
    /// aborts the whole batch.
    /// @param[in] targets Files to generate for.
    /// @return Artifacts of the files that were not skipped, or the first error.
    llvm::Expected<std::vector<GatewayArtifact>> generate(const std::vector<const File*>& targets) const;

    /// @brief Returns the validated path settings.
    [[nodiscard]] const PathConfig& pathConfig() const
    {
        return pathConfig_;
    }

private:
    GatewayGenerator(GatewayOptions           options,
                     PathConfig               pathConfig,
                     const EnumPackageLookup& enums,
                     GatewayRenderFn          render,
                     SourceFormatFn           format,
                     DiagnosticEngine&        diagnostics);

    llvm::Expected<std::string> renderFile(const File& file) const;

    GatewayOptions           options_;
    PathConfig               pathConfig_;
    const EnumPackageLookup* enums_;
    GatewayRenderFn          render_;
    SourceFormatFn           format_;
    DiagnosticEngine*        diagnostics_;
};

}  // namespace llvmgateway

#endif  // LLVMGATEWAY_CODEGEN_GATEWAY_GENERATOR_H
