//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements output path projection for generated gateway files.
///
/// All paths are forward-slash paths regardless of host platform.
///
//===----------------------------------------------------------------------===//

#include "llvmgateway/CodeGen/OutputPathResolver.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Path.h"

namespace llvmgateway
{
namespace
{

constexpr auto PosixStyle = llvm::sys::path::Style::posix;

llvm::StringRef baseName(const llvm::StringRef fileName)
{
    return llvm::sys::path::filename(fileName, PosixStyle);
}

}  // namespace

llvm::Expected<AddressingMode> parseAddressingMode(const llvm::StringRef text)
{
    if (text.empty() || text == "import")
    {
        return AddressingMode::Import;
    }
    if (text == "source_relative")
    {
        return AddressingMode::SourceRelative;
    }
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "unknown path type \"%s\": want \"import\" or \"source_relative\"",
                                   text.str().c_str());
}

llvm::Error validatePathConfig(const PathConfig& config)
{
    if (!config.modulePrefix.empty() && config.mode != AddressingMode::Import)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "cannot use module= with paths=");
    }
    return llvm::Error::success();
}

llvm::Expected<std::string> resolveOutputPath(const llvm::StringRef fileName,
                                              const llvm::StringRef goPackagePath,
                                              const PathConfig&     config)
{
    if (auto err = validatePathConfig(config))
    {
        return std::move(err);
    }

    if (!config.modulePrefix.empty())
    {
        const std::string trimPath = config.modulePrefix + "/";
        const std::string pkgPath  = goPackagePath.str() + "/";
        llvm::StringRef   rest(pkgPath);
        if (!rest.consume_front(trimPath))
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "%s: file go path does not match module prefix: %s",
                                           goPackagePath.str().c_str(),
                                           trimPath.c_str());
        }
        llvm::SmallString<128> out(rest.rtrim('/'));
        llvm::sys::path::append(out, PosixStyle, baseName(fileName));
        llvm::sys::path::remove_dots(out, true, PosixStyle);
        return std::string(out.str());
    }

    if (config.mode == AddressingMode::Import && !goPackagePath.empty())
    {
        return goPackagePath.str() + "/" + baseName(fileName).str();
    }

    return fileName.str();
}

llvm::Expected<std::string> resolveOutputPath(const File& file, const PathConfig& config)
{
    return resolveOutputPath(file.name, file.goPackage.path, config);
}

std::string renderGatewayFileName(const llvm::StringRef resolvedPath)
{
    const llvm::StringRef ext = llvm::sys::path::extension(resolvedPath, PosixStyle);
    return resolvedPath.drop_back(ext.size()).str() + GatewayFileSuffix;
}

}  // namespace llvmgateway
