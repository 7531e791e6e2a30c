//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the plugin run: parameters, registry, generator, response.
///
//===----------------------------------------------------------------------===//

#include "llvmgateway/Plugin/PluginDriver.h"

#include <string>
#include <utility>
#include <vector>

#include "llvmgateway/CodeGen/GatewayGenerator.h"
#include "llvmgateway/CodeGen/GoSourceFormat.h"
#include "llvmgateway/CodeGen/GoTemplateRenderer.h"
#include "llvmgateway/Descriptor/Registry.h"
#include "llvmgateway/Plugin/PluginParameters.h"

namespace llvmgateway
{
namespace
{

using google::protobuf::compiler::CodeGeneratorRequest;
using google::protobuf::compiler::CodeGeneratorResponse;

PluginRunResult makeResult(const unsigned verbosity)
{
    PluginRunResult result;
    result.verbosity = verbosity;
    result.response.set_supported_features(CodeGeneratorResponse::FEATURE_PROTO3_OPTIONAL);
    return result;
}

PluginRunResult failed(llvm::Error err, DiagnosticEngine& diagnostics, const unsigned verbosity)
{
    auto result = makeResult(verbosity);
    result.response.set_error(llvm::toString(std::move(err)));
    if (!diagnostics.hasErrors())
    {
        diagnostics.error("", result.response.error());
    }
    return result;
}

}  // namespace

PluginRunResult runGatewayPlugin(const CodeGeneratorRequest& request, DiagnosticEngine& diagnostics)
{
    auto params = parsePluginParameters(request.parameter());
    if (!params)
    {
        return failed(params.takeError(), diagnostics, 0);
    }

    auto     options = params->gatewayOptions();
    Registry registry(params->registryOptions());
    for (const auto& pkg : options.baseImports)
    {
        if (auto err = registry.reserveGoPackageAlias(pkg.qualifier(), pkg.path))
        {
            return failed(std::move(err), diagnostics, params->verbosity);
        }
    }
    const std::vector<google::protobuf::FileDescriptorProto> protoFiles(request.proto_file().begin(),
                                                                        request.proto_file().end());
    if (auto err = registry.load(protoFiles, diagnostics))
    {
        return failed(std::move(err), diagnostics, params->verbosity);
    }

    auto targets = registry.filesToGenerate(
        std::vector<std::string>(request.file_to_generate().begin(), request.file_to_generate().end()));
    if (!targets)
    {
        return failed(targets.takeError(), diagnostics, params->verbosity);
    }

    options.omitPackageDoc = registry.omitPackageDoc();
    auto generator         = GatewayGenerator::create(std::move(options),
                                              registry,
                                              renderGatewayTemplate,
                                              formatGoSource,
                                              diagnostics);
    if (!generator)
    {
        return failed(generator.takeError(), diagnostics, params->verbosity);
    }

    auto artifacts = generator->generate(*targets);
    if (!artifacts)
    {
        return failed(artifacts.takeError(), diagnostics, params->verbosity);
    }

    auto result = makeResult(params->verbosity);
    for (auto& artifact : *artifacts)
    {
        auto* file = result.response.add_file();
        file->set_name(std::move(artifact.name));
        file->set_content(std::move(artifact.content));
    }
    return result;
}

}  // namespace llvmgateway
