//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Parsing of the protoc plugin parameter string.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMGATEWAY_PLUGIN_PLUGIN_PARAMETERS_H
#define LLVMGATEWAY_PLUGIN_PLUGIN_PARAMETERS_H

#include <map>
#include <string>

#include "llvmgateway/CodeGen/GatewayGenerator.h"
#include "llvmgateway/Descriptor/Registry.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace llvmgateway
{

/// @brief Settings carried by `--grpc-gateway_opt` values.
struct PluginParameters final
{
    std::string pathType;
    std::string modulePrefix;
    std::string registerFuncSuffix{"Handler"};
    bool        useRequestContext{true};
    bool        allowPatchFeature{true};
    bool        standalone{false};
    bool        omitPackageDoc{false};
    bool        generateUnboundMethods{false};

    /// @brief Verbosity; notes are printed from level 1.
    unsigned verbosity{0};

    /// @brief `M<file>=<import path>` overrides.
    std::map<std::string, std::string> importMap;

    /// @brief Projects the registry settings.
    [[nodiscard]] RegistryOptions registryOptions() const;

    /// @brief Projects the generator settings.
    [[nodiscard]] GatewayOptions gatewayOptions() const;
};

/// @brief Parses a comma-separated `key[=value]` list.
/// @param[in] parameter Raw `CodeGeneratorRequest.parameter`.
/// @return Parameters, or an error for unknown keys, malformed booleans or a
///         non-numeric verbosity.
llvm::Expected<PluginParameters> parsePluginParameters(llvm::StringRef parameter);

}  // namespace llvmgateway

#endif  // LLVMGATEWAY_PLUGIN_PLUGIN_PARAMETERS_H
