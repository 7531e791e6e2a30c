//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Descriptor object graph consumed by the gateway generator.
///
/// The registry owns every object declared here; the generator only reads
/// them and copies `GoPackage` values.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMGATEWAY_DESCRIPTOR_MODEL_H
#define LLVMGATEWAY_DESCRIPTOR_MODEL_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace llvmgateway
{

struct File;

/// @brief Go package identity. Two packages are the same package when their
/// import paths match.
struct GoPackage final
{
    /// @brief Import path, e.g. `example.com/foo/bar`.
    std::string path;

    /// @brief Package name used in the package clause.
    std::string name;

    /// @brief Import alias; empty when the package is imported by name.
    std::string alias;

    /// @brief Returns the identifier used to qualify symbols of this package.
    /// @return Alias when set, otherwise the package name.
    [[nodiscard]] const std::string& qualifier() const
    {
        return alias.empty() ? name : alias;
    }

    friend bool operator==(const GoPackage& lhs, const GoPackage& rhs)
    {
        return lhs.path == rhs.path;
    }

    friend bool operator!=(const GoPackage& lhs, const GoPackage& rhs)
    {
        return !(lhs == rhs);
    }
};

/// @brief Protobuf field type category relevant to path and body handling.
enum class FieldKind
{
    /// @brief Any scalar type.
    Scalar,

    /// @brief Enum reference; `Field::typeName` names the enum.
    Enum,

    /// @brief Message reference; `Field::typeName` names the message.
    Message,
};

/// @brief One message field.
struct Field final
{
    /// @brief Field name as declared.
    std::string name;

    /// @brief Go field name.
    std::string goName;

    /// @brief Field number.
    std::int32_t number{0};

    /// @brief Kind of the declared type.
    FieldKind kind{FieldKind::Scalar};

    /// @brief Fully-qualified type name with a leading dot; empty for scalars.
    std::string typeName;

    /// @brief True for repeated fields.
    bool repeated{false};
};

/// @brief One message declaration, nested messages flattened.
struct Message final
{
    /// @brief Unqualified name.
    std::string name;

    /// @brief Fully-qualified name with a leading dot.
    std::string fullName;

    /// @brief Go type name; nested types are joined with `_`.
    std::string goName;

    /// @brief Declaring file.
    const File* file{nullptr};

    /// @brief Fields in declaration order.
    std::vector<Field> fields;

    /// @brief Finds a field by declared name.
    /// @param[in] fieldName Field name.
    /// @return Matching field, or `nullptr` when missing.
    [[nodiscard]] const Field* findField(const std::string& fieldName) const
    {
        for (const auto& field : fields)
        {
            if (field.name == fieldName)
            {
                return &field;
            }
        }
        return nullptr;
    }
};

/// @brief One enum declaration, nested enums flattened.
struct Enum final
{
    /// @brief Fully-qualified name with a leading dot.
    std::string fullName;

    /// @brief Go type name.
    std::string goName;

    /// @brief Declaring file.
    const File* file{nullptr};
};

/// @brief HTTP verb of a binding.
enum class HttpMethod
{
    Get,
    Put,
    Post,
    Delete,
    Patch,
    Custom,
};

/// @brief Path template variable bound to a request field.
struct PathParam final
{
    /// @brief Dotted field path as written in the template.
    std::string fieldPath;

    /// @brief Leaf field the path resolves to.
    const Field* target{nullptr};

    /// @brief Enum type of the leaf field; `nullptr` for other kinds or when
    ///        the enum is not loaded.
    const Enum* enumType{nullptr};
};

/// @brief One HTTP route bound to a method.
struct Binding final
{
    /// @brief Position among the method's bindings.
    std::uint32_t index{0};

    /// @brief Verb.
    HttpMethod httpMethod{HttpMethod::Get};

    /// @brief Verb text for custom bindings, upper-case verb otherwise.
    std::string verb;

    /// @brief Path template, e.g. `/v1/{name=messages/*}`.
    std::string pathTemplate;

    /// @brief Template variables in order of appearance.
    std::vector<PathParam> pathParams;

    /// @brief Body selector: empty, `*`, or a field name.
    std::string body;

    /// @brief Response body selector: empty or a field name.
    std::string responseBody;
};

/// @brief One RPC.
struct Method final
{
    /// @brief Declared method name.
    std::string name;

    /// @brief Go method name.
    std::string goName;

    /// @brief Request message, possibly declared in another file.
    const Message* requestType{nullptr};

    /// @brief Response message, possibly declared in another file.
    const Message* responseType{nullptr};

    /// @brief Client-streaming flag.
    bool clientStreaming{false};

    /// @brief Server-streaming flag.
    bool serverStreaming{false};

    /// @brief HTTP bindings; empty for unbound methods.
    std::vector<Binding> bindings;
};

/// @brief One service.
struct Service final
{
    /// @brief Declared name.
    std::string name;

    /// @brief Fully-qualified name without a leading dot.
    std::string fullName;

    /// @brief Go identifier.
    std::string goName;

    /// @brief Methods in declaration order.
    std::vector<Method> methods;
};

/// @brief One parsed proto file.
struct File final
{
    /// @brief File name as passed to protoc, e.g. `bar/svc.proto`.
    std::string name;

    /// @brief Proto package.
    std::string protoPackage;

    /// @brief Owning Go package.
    GoPackage goPackage;

    /// @brief Messages; pointers stay stable for the registry's lifetime.
    std::vector<std::unique_ptr<Message>> messages;

    /// @brief Enums; pointers stay stable for the registry's lifetime.
    std::vector<std::unique_ptr<Enum>> enums;

    /// @brief Services in declaration order.
    std::vector<Service> services;
};

/// @brief Resolves enum type names to the package of their declaring file.
class EnumPackageLookup
{
public:
    virtual ~EnumPackageLookup() = default;

    /// @brief Looks up an enum by fully-qualified type name.
    /// @param[in] typeName Type name with a leading dot.
    /// @return Package of the enum's declaring file, or `nullptr` when the name
    ///         does not denote an enum.
    virtual const GoPackage* lookupEnumPackage(const std::string& typeName) const = 0;
};

}  // namespace llvmgateway

#endif  // LLVMGATEWAY_DESCRIPTOR_MODEL_H
