//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Go import-set collection for generated gateway files.
///
/// The collected list starts with the fixed base packages and then grows with
/// the packages of enum path parameters and request messages, in method
/// declaration order, first occurrence wins.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMGATEWAY_CODEGEN_IMPORT_COLLECTOR_H
#define LLVMGATEWAY_CODEGEN_IMPORT_COLLECTOR_H

#include <utility>
#include <vector>

#include "llvmgateway/Descriptor/Model.h"
#include "llvm/ADT/StringSet.h"

namespace llvmgateway
{

/// @brief Ordered package list with a membership set keyed by import path.
class ImportSet final
{
public:
    /// @brief Appends a package unless its import path was already added.
    /// @param[in] pkg Package to add.
    /// @return True when the package was appended.
    bool add(const GoPackage& pkg);

    /// @brief Returns true when the import path was already added.
    [[nodiscard]] bool contains(const GoPackage& pkg) const
    {
        return seen_.contains(pkg.path);
    }

    /// @brief Returns the packages in insertion order.
    [[nodiscard]] const std::vector<GoPackage>& packages() const
    {
        return packages_;
    }

    /// @brief Releases the ordered package list.
    [[nodiscard]] std::vector<GoPackage> take()
    {
        seen_.clear();
        return std::move(packages_);
    }

private:
    std::vector<GoPackage> packages_;
    llvm::StringSet<>      seen_;
};

/// @brief Returns the packages every generated gateway file imports.
/// @return Base packages in import-block order.
std::vector<GoPackage> defaultGatewayBaseImports();

/// @brief Collects the packages a gateway file for `file` must import.
/// @param[in] file Source file.
/// @param[in] baseImports Always-imported packages, kept first and in order.
/// @param[in] standalone Adds the file's own package when true.
/// @param[in] enums Enum resolver used for path parameter targets.
/// @return Deduplicated import list.
std::vector<GoPackage> collectGatewayImports(const File&                   file,
                                             const std::vector<GoPackage>& baseImports,
                                             bool                          standalone,
                                             const EnumPackageLookup&      enums);

}  // namespace llvmgateway

#endif  // LLVMGATEWAY_CODEGEN_IMPORT_COLLECTOR_H
