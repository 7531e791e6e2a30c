//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Descriptor registry built from the files of a protoc plugin request.
///
/// The registry resolves Go packages, indexes messages and enums by their
/// fully-qualified names, and turns `google.api.http` annotations into
/// bindings whose path parameters point at request fields.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMGATEWAY_DESCRIPTOR_REGISTRY_H
#define LLVMGATEWAY_DESCRIPTOR_REGISTRY_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <google/protobuf/descriptor.pb.h>

#include "llvmgateway/Descriptor/Model.h"
#include "llvmgateway/Support/Diagnostics.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace llvmgateway
{

/// @brief Registry configuration derived from plugin parameters.
struct RegistryOptions final
{
    /// @brief `M<file>=<import path>` overrides keyed by proto file name.
    std::map<std::string, std::string> importMap;

    /// @brief Gives every file package an `ext` alias.
    bool standalone{false};

    /// @brief Synthesizes a POST binding for methods without an http rule.
    bool generateUnboundMethods{false};

    /// @brief Omits the package documentation comment in generated files.
    bool omitPackageDoc{false};
};

/// @brief Owns the descriptor graph of one plugin run.
class Registry final : public EnumPackageLookup
{
public:
    explicit Registry(RegistryOptions options);

    Registry(const Registry&)            = delete;
    Registry& operator=(const Registry&) = delete;

    /// @brief Loads files in dependency order.
    /// @details Types are indexed across all files before services are
    /// resolved, so a request type may come from any loaded file.
    /// @param[in] files Descriptors as received from protoc.
    /// @param[in,out] diagnostics Diagnostic sink.
    /// @return Error for duplicate files, unresolved types, malformed http
    ///         rules, or path parameters naming unknown fields.
    llvm::Error load(const std::vector<google::protobuf::FileDescriptorProto>& files, DiagnosticEngine& diagnostics);

    /// @brief Claims a Go package identifier for an import path.
    /// @details Files loaded afterwards whose package name or alias is already
    /// claimed by another path get a numbered alias instead.
    /// @param[in] alias Identifier to claim.
    /// @param[in] path Import path the identifier stands for.
    /// @return Error when the identifier is taken by a different path.
    llvm::Error reserveGoPackageAlias(llvm::StringRef alias, llvm::StringRef path);

    /// @brief Finds a loaded file by name.
    [[nodiscard]] const File* findFile(llvm::StringRef name) const;

    /// @brief Finds a message by fully-qualified name with a leading dot.
    [[nodiscard]] const Message* lookupMessage(llvm::StringRef fullName) const;

    const GoPackage* lookupEnumPackage(const std::string& typeName) const override;

    /// @brief Returns the files protoc asked to generate, in request order.
    /// @param[in] names `file_to_generate` entries.
    /// @return Files, or an error naming the first unknown file.
    llvm::Expected<std::vector<const File*>> filesToGenerate(const std::vector<std::string>& names) const;

    [[nodiscard]] bool omitPackageDoc() const
    {
        return options_.omitPackageDoc;
    }

private:
    GoPackage resolveGoPackage(const google::protobuf::FileDescriptorProto& proto) const;

    bool claimAlias(llvm::StringRef alias, llvm::StringRef path);

    void assignUniqueAlias(GoPackage& pkg);

    void indexMessage(File&                                   file,
                      const google::protobuf::DescriptorProto& proto,
                      const std::string&                      scope,
                      const std::string&                      relativeScope);

    void indexEnum(File&                                        file,
                   const google::protobuf::EnumDescriptorProto& proto,
                   const std::string&                           scope,
                   const std::string&                           relativeScope);

    llvm::Error loadServices(File& file, const google::protobuf::FileDescriptorProto& proto);

    llvm::Error resolveBinding(const Service& service, const Method& method, Binding& binding) const;

    RegistryOptions                    options_;
    std::vector<std::unique_ptr<File>> files_;
    llvm::StringMap<File*>             fileIndex_;
    llvm::StringMap<const Message*>    messages_;
    llvm::StringMap<const Enum*>       enums_;
    llvm::StringMap<std::string>       packageAliases_;
};

}  // namespace llvmgateway

#endif  // LLVMGATEWAY_DESCRIPTOR_REGISTRY_H
