//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the per-file gateway generation pipeline.
///
/// Each target runs detect, collect imports, render, validate, resolve path
/// and emit to completion before the next one starts. A file without a bound
/// method is skipped; every other failure aborts the batch.
///
//===----------------------------------------------------------------------===//

#include "llvmgateway/CodeGen/GatewayGenerator.h"

#include <utility>

namespace llvmgateway
{

bool hasTargetService(const File& file)
{
    for (const auto& service : file.services)
    {
        for (const auto& method : service.methods)
        {
            if (!method.bindings.empty())
            {
                return true;
            }
        }
    }
    return false;
}

GatewayGenerator::GatewayGenerator(GatewayOptions           options,
                                   PathConfig               pathConfig,
                                   const EnumPackageLookup& enums,
                                   GatewayRenderFn          render,
                                   SourceFormatFn           format,
                                   DiagnosticEngine&        diagnostics)
    : options_(std::move(options))
    , pathConfig_(std::move(pathConfig))
    , enums_(&enums)
    , render_(std::move(render))
    , format_(std::move(format))
    , diagnostics_(&diagnostics)
{
}

llvm::Expected<GatewayGenerator> GatewayGenerator::create(GatewayOptions           options,
                                                          const EnumPackageLookup& enums,
                                                          GatewayRenderFn          render,
                                                          SourceFormatFn           format,
                                                          DiagnosticEngine&        diagnostics)
{
    auto mode = parseAddressingMode(options.pathType);
    if (!mode)
    {
        return mode.takeError();
    }

    PathConfig pathConfig;
    pathConfig.mode         = *mode;
    pathConfig.modulePrefix = options.modulePrefix;
    if (auto err = validatePathConfig(pathConfig))
    {
        return std::move(err);
    }

    if (!render || !format)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "gateway generator requires a renderer and a source formatter");
    }

    return GatewayGenerator(std::move(options),
                            std::move(pathConfig),
                            enums,
                            std::move(render),
                            std::move(format),
                            diagnostics);
}

llvm::Expected<std::string> GatewayGenerator::renderFile(const File& file) const
{
    RenderRequest request;
    request.file               = &file;
    request.imports            = collectGatewayImports(file, options_.baseImports, options_.standalone, *enums_);
    request.useRequestContext  = options_.useRequestContext;
    request.registerFuncSuffix = options_.registerFuncSuffix;
    request.allowPatchFeature  = options_.allowPatchFeature;
    request.omitPackageDoc     = options_.omitPackageDoc;
    request.standalone         = options_.standalone;

    auto code = render_(request);
    if (!code)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "failed to render gateway code for %s: %s",
                                       file.name.c_str(),
                                       llvm::toString(code.takeError()).c_str());
    }
    return code;
}

llvm::Expected<std::vector<GatewayArtifact>> GatewayGenerator::generate(const std::vector<const File*>& targets) const
{
    std::vector<GatewayArtifact> files;
    for (const File* file : targets)
    {
        diagnostics_->note(file->name, "processing " + file->name);

        if (!hasTargetService(*file))
        {
            diagnostics_->note(file->name, "no target service defined in the file");
            continue;
        }

        auto code = renderFile(*file);
        if (!code)
        {
            const auto message = llvm::toString(code.takeError());
            diagnostics_->error(file->name, message);
            return llvm::createStringError(llvm::inconvertibleErrorCode(), message.c_str());
        }

        auto formatted = format_(*code);
        if (!formatted)
        {
            const auto message = llvm::toString(formatted.takeError());
            diagnostics_->error(file->name, message);
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "%s: generated code is not valid Go: %s",
                                           file->name.c_str(),
                                           message.c_str());
        }

        auto path = resolveOutputPath(*file, pathConfig_);
        if (!path)
        {
            const auto message = llvm::toString(path.takeError());
            diagnostics_->error(file->name, message + ": " + *code);
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "%s: %s",
                                           file->name.c_str(),
                                           message.c_str());
        }

        files.push_back(GatewayArtifact{file->goPackage, renderGatewayFileName(*path), std::move(*formatted)});
    }
    return files;
}

}  // namespace llvmgateway
