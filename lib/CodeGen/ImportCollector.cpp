//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements Go import-set collection for generated gateway files.
///
//===----------------------------------------------------------------------===//

#include "llvmgateway/CodeGen/ImportCollector.h"

#include <utility>

namespace llvmgateway
{
namespace
{

void addEnumPathParamImports(const File&              file,
                             const Method&            method,
                             const EnumPackageLookup& enums,
                             ImportSet&               imports)
{
    for (const auto& binding : method.bindings)
    {
        for (const auto& param : binding.pathParams)
        {
            if (param.target == nullptr)
            {
                continue;
            }
            const GoPackage* pkg = enums.lookupEnumPackage(param.target->typeName);
            if (pkg == nullptr || *pkg == file.goPackage)
            {
                continue;
            }
            imports.add(*pkg);
        }
    }
}

}  // namespace

bool ImportSet::add(const GoPackage& pkg)
{
    if (!seen_.insert(pkg.path).second)
    {
        return false;
    }
    packages_.push_back(pkg);
    return true;
}

std::vector<GoPackage> defaultGatewayBaseImports()
{
    return {
        GoPackage{"context", "context", ""},
        GoPackage{"errors", "errors", ""},
        GoPackage{"io", "io", ""},
        GoPackage{"net/http", "http", ""},
        GoPackage{"github.com/grpc-ecosystem/grpc-gateway/v2/runtime", "runtime", ""},
        GoPackage{"github.com/grpc-ecosystem/grpc-gateway/v2/utilities", "utilities", ""},
        GoPackage{"google.golang.org/grpc", "grpc", ""},
        GoPackage{"google.golang.org/grpc/codes", "codes", ""},
        GoPackage{"google.golang.org/grpc/grpclog", "grpclog", ""},
        GoPackage{"google.golang.org/grpc/metadata", "metadata", ""},
        GoPackage{"google.golang.org/grpc/status", "status", ""},
        GoPackage{"google.golang.org/protobuf/proto", "proto", ""},
    };
}

std::vector<GoPackage> collectGatewayImports(const File&                   file,
                                             const std::vector<GoPackage>& baseImports,
                                             const bool                    standalone,
                                             const EnumPackageLookup&      enums)
{
    ImportSet imports;
    for (const auto& pkg : baseImports)
    {
        imports.add(pkg);
    }
    if (standalone)
    {
        imports.add(file.goPackage);
    }

    for (const auto& service : file.services)
    {
        for (const auto& method : service.methods)
        {
            addEnumPathParamImports(file, method, enums, imports);
            if (method.bindings.empty() || method.requestType == nullptr || method.requestType->file == nullptr)
            {
                continue;
            }
            const GoPackage& pkg = method.requestType->file->goPackage;
            if (pkg == file.goPackage)
            {
                continue;
            }
            imports.add(pkg);
        }
    }
    return imports.take();
}

}  // namespace llvmgateway
