//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements protoc plugin parameter parsing.
///
//===----------------------------------------------------------------------===//

#include "llvmgateway/Plugin/PluginParameters.h"

#include <utility>

#include "llvm/ADT/SmallVector.h"

namespace llvmgateway
{
namespace
{

llvm::Error parseBool(const llvm::StringRef key, const llvm::StringRef value, bool& out)
{
    if (value == "true" || value == "1")
    {
        out = true;
        return llvm::Error::success();
    }
    if (value == "false" || value == "0")
    {
        out = false;
        return llvm::Error::success();
    }
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "invalid boolean value for %s: \"%s\"",
                                   key.str().c_str(),
                                   value.str().c_str());
}

llvm::Error applyParameter(PluginParameters&     params,
                           const llvm::StringRef key,
                           const llvm::StringRef value,
                           const bool            hasValue)
{
    if (key == "paths")
    {
        params.pathType = value.str();
        return llvm::Error::success();
    }
    if (key == "module")
    {
        params.modulePrefix = value.str();
        return llvm::Error::success();
    }
    if (key == "register_func_suffix")
    {
        params.registerFuncSuffix = hasValue ? value.str() : std::string();
        return llvm::Error::success();
    }
    if (key == "request_context")
    {
        return parseBool(key, value, params.useRequestContext);
    }
    if (key == "allow_patch_feature")
    {
        return parseBool(key, value, params.allowPatchFeature);
    }
    if (key == "standalone")
    {
        return parseBool(key, value, params.standalone);
    }
    if (key == "omit_package_doc")
    {
        return parseBool(key, value, params.omitPackageDoc);
    }
    if (key == "generate_unbound_methods")
    {
        return parseBool(key, value, params.generateUnboundMethods);
    }
    if (key == "v")
    {
        if (value.getAsInteger(10, params.verbosity))
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "invalid verbosity: \"%s\"",
                                           value.str().c_str());
        }
        return llvm::Error::success();
    }
    if (key == "logtostderr")
    {
        bool ignored = false;
        return parseBool(key, value, ignored);
    }
    return llvm::createStringError(llvm::inconvertibleErrorCode(), "unknown parameter: %s", key.str().c_str());
}

}  // namespace

RegistryOptions PluginParameters::registryOptions() const
{
    RegistryOptions options;
    options.importMap              = importMap;
    options.standalone             = standalone;
    options.generateUnboundMethods = generateUnboundMethods;
    options.omitPackageDoc         = omitPackageDoc;
    return options;
}

GatewayOptions PluginParameters::gatewayOptions() const
{
    GatewayOptions options;
    options.useRequestContext  = useRequestContext;
    options.registerFuncSuffix = registerFuncSuffix;
    options.pathType           = pathType;
    options.modulePrefix       = modulePrefix;
    options.allowPatchFeature  = allowPatchFeature;
    options.standalone         = standalone;
    options.omitPackageDoc     = omitPackageDoc;
    return options;
}

llvm::Expected<PluginParameters> parsePluginParameters(const llvm::StringRef parameter)
{
    PluginParameters params;

    llvm::SmallVector<llvm::StringRef, 8> entries;
    parameter.split(entries, ',', -1, false);
    for (const auto entry : entries)
    {
        const auto split    = entry.split('=');
        const auto key      = split.first.trim();
        const bool hasValue = entry.contains('=');
        const auto value    = hasValue ? split.second.trim() : llvm::StringRef("true");

        if (key.starts_with("M") && key.size() > 1)
        {
            if (!hasValue)
            {
                return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                               "missing import path for %s",
                                               key.str().c_str());
            }
            params.importMap[key.drop_front().str()] = value.str();
            continue;
        }

        if (auto err = applyParameter(params, key, value, hasValue))
        {
            return std::move(err);
        }
    }
    return params;
}

}  // namespace llvmgateway
