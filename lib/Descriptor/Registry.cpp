//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the descriptor registry.
///
//===----------------------------------------------------------------------===//

#include "llvmgateway/Descriptor/Registry.h"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "llvmgateway/CodeGen/NamingPolicy.h"
#include "llvmgateway/Descriptor/HttpRule.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Path.h"

namespace llvmgateway
{
namespace
{

using google::protobuf::FieldDescriptorProto;

FieldKind fieldKindOf(const FieldDescriptorProto& proto)
{
    switch (proto.type())
    {
    case FieldDescriptorProto::TYPE_ENUM:
        return FieldKind::Enum;
    case FieldDescriptorProto::TYPE_MESSAGE:
    case FieldDescriptorProto::TYPE_GROUP:
        return FieldKind::Message;
    default:
        return FieldKind::Scalar;
    }
}

std::string capitalize(std::string text)
{
    if (!text.empty())
    {
        text.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(text.front())));
    }
    return text;
}

std::string joinScope(const std::string& scope, const std::string& name)
{
    return scope.empty() ? name : scope + "." + name;
}

}  // namespace

Registry::Registry(RegistryOptions options)
    : options_(std::move(options))
{
}

bool Registry::claimAlias(const llvm::StringRef alias, const llvm::StringRef path)
{
    const auto inserted = packageAliases_.try_emplace(alias, path.str());
    return inserted.second || inserted.first->second == path;
}

llvm::Error Registry::reserveGoPackageAlias(const llvm::StringRef alias, const llvm::StringRef path)
{
    if (!claimAlias(alias, path))
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "package name %s is already used by %s",
                                       alias.str().c_str(),
                                       packageAliases_.lookup(alias).c_str());
    }
    return llvm::Error::success();
}

void Registry::assignUniqueAlias(GoPackage& pkg)
{
    const std::string preferred = pkg.qualifier();
    if (claimAlias(preferred, pkg.path))
    {
        return;
    }
    for (unsigned i = 0;; ++i)
    {
        std::string candidate = preferred + "_" + std::to_string(i);
        if (claimAlias(candidate, pkg.path))
        {
            pkg.alias = std::move(candidate);
            return;
        }
    }
}

GoPackage Registry::resolveGoPackage(const google::protobuf::FileDescriptorProto& proto) const
{
    std::string goPackageValue;
    const auto  mapped = options_.importMap.find(proto.name());
    if (mapped != options_.importMap.end())
    {
        goPackageValue = mapped->second;
    }
    else if (proto.options().has_go_package())
    {
        goPackageValue = proto.options().go_package();
    }
    else
    {
        goPackageValue = llvm::sys::path::parent_path(proto.name(), llvm::sys::path::Style::posix).str();
    }

    const auto parts = llvm::StringRef(goPackageValue).split(';');
    GoPackage  pkg;
    pkg.path = parts.first.str();
    if (!parts.second.empty())
    {
        pkg.name = goSanitizeIdentifier(parts.second);
    }
    else if (pkg.path.empty() && !proto.package().empty())
    {
        std::string flattened = proto.package();
        for (char& c : flattened)
        {
            c = c == '.' ? '_' : c;
        }
        pkg.name = goSanitizeIdentifier(flattened);
    }
    else
    {
        pkg.name = goPackageNameFromPath(pkg.path);
    }
    if (options_.standalone)
    {
        pkg.alias = "ext" + capitalize(pkg.name);
    }
    return pkg;
}

void Registry::indexMessage(File&                                   file,
                            const google::protobuf::DescriptorProto& proto,
                            const std::string&                      scope,
                            const std::string&                      relativeScope)
{
    auto message      = std::make_unique<Message>();
    message->name     = proto.name();
    message->fullName = scope + "." + proto.name();
    message->goName   = goCamelCase(joinScope(relativeScope, proto.name()));
    message->file     = &file;
    for (const auto& fieldProto : proto.field())
    {
        Field field;
        field.name     = fieldProto.name();
        field.goName   = goCamelCase(fieldProto.name());
        field.number   = fieldProto.number();
        field.kind     = fieldKindOf(fieldProto);
        field.typeName = field.kind == FieldKind::Scalar ? std::string() : fieldProto.type_name();
        field.repeated = fieldProto.label() == FieldDescriptorProto::LABEL_REPEATED;
        message->fields.push_back(std::move(field));
    }

    const std::string nestedScope    = message->fullName;
    const std::string nestedRelative = joinScope(relativeScope, proto.name());
    messages_[message->fullName]     = message.get();
    file.messages.push_back(std::move(message));

    for (const auto& nested : proto.nested_type())
    {
        indexMessage(file, nested, nestedScope, nestedRelative);
    }
    for (const auto& nested : proto.enum_type())
    {
        indexEnum(file, nested, nestedScope, nestedRelative);
    }
}

void Registry::indexEnum(File&                                        file,
                         const google::protobuf::EnumDescriptorProto& proto,
                         const std::string&                           scope,
                         const std::string&                           relativeScope)
{
    auto value      = std::make_unique<Enum>();
    value->fullName = scope + "." + proto.name();
    value->goName   = goCamelCase(joinScope(relativeScope, proto.name()));
    value->file     = &file;
    enums_[value->fullName] = value.get();
    file.enums.push_back(std::move(value));
}

llvm::Error Registry::load(const std::vector<google::protobuf::FileDescriptorProto>& files,
                           DiagnosticEngine&                                         diagnostics)
{
    std::vector<File*> loaded;
    for (const auto& proto : files)
    {
        if (fileIndex_.count(proto.name()) != 0)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "duplicate file %s",
                                           proto.name().c_str());
        }
        auto file          = std::make_unique<File>();
        file->name         = proto.name();
        file->protoPackage = proto.package();
        file->goPackage    = resolveGoPackage(proto);
        assignUniqueAlias(file->goPackage);

        const std::string scope = proto.package().empty() ? std::string() : "." + proto.package();
        for (const auto& message : proto.message_type())
        {
            indexMessage(*file, message, scope, "");
        }
        for (const auto& value : proto.enum_type())
        {
            indexEnum(*file, value, scope, "");
        }

        fileIndex_[file->name] = file.get();
        loaded.push_back(file.get());
        files_.push_back(std::move(file));
    }

    for (std::size_t i = 0; i < files.size(); ++i)
    {
        if (auto err = loadServices(*loaded[i], files[i]))
        {
            return err;
        }
        diagnostics.note(loaded[i]->name, "loaded into Go package " + loaded[i]->goPackage.path);
    }
    return llvm::Error::success();
}

llvm::Error Registry::loadServices(File& file, const google::protobuf::FileDescriptorProto& proto)
{
    for (const auto& serviceProto : proto.service())
    {
        Service service;
        service.name     = serviceProto.name();
        service.fullName = proto.package().empty() ? serviceProto.name() : proto.package() + "." + serviceProto.name();
        service.goName   = goCamelCase(serviceProto.name());

        for (const auto& methodProto : serviceProto.method())
        {
            Method method;
            method.name            = methodProto.name();
            method.goName          = goCamelCase(methodProto.name());
            method.requestType     = lookupMessage(methodProto.input_type());
            method.responseType    = lookupMessage(methodProto.output_type());
            method.clientStreaming = methodProto.client_streaming();
            method.serverStreaming = methodProto.server_streaming();
            if (method.requestType == nullptr || method.responseType == nullptr)
            {
                return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                               "%s: types of method %s.%s are not defined: %s, %s",
                                               file.name.c_str(),
                                               service.fullName.c_str(),
                                               method.name.c_str(),
                                               methodProto.input_type().c_str(),
                                               methodProto.output_type().c_str());
            }

            auto rules = decodeMethodHttpRules(methodProto.options());
            if (!rules)
            {
                return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                               "%s: method %s.%s: %s",
                                               file.name.c_str(),
                                               service.fullName.c_str(),
                                               method.name.c_str(),
                                               llvm::toString(rules.takeError()).c_str());
            }
            if (rules->empty() && options_.generateUnboundMethods)
            {
                HttpRuleSpec unbound;
                unbound.method       = HttpMethod::Post;
                unbound.verb         = httpMethodVerb(HttpMethod::Post).str();
                unbound.pathTemplate = "/" + service.fullName + "/" + method.name;
                unbound.body         = "*";
                rules->push_back(std::move(unbound));
            }

            for (auto& rule : *rules)
            {
                Binding binding;
                binding.index        = static_cast<std::uint32_t>(method.bindings.size());
                binding.httpMethod   = rule.method;
                binding.verb         = std::move(rule.verb);
                binding.pathTemplate = std::move(rule.pathTemplate);
                binding.body         = std::move(rule.body);
                binding.responseBody = std::move(rule.responseBody);
                if (auto err = resolveBinding(service, method, binding))
                {
                    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                                   "%s: %s",
                                                   file.name.c_str(),
                                                   llvm::toString(std::move(err)).c_str());
                }
                method.bindings.push_back(std::move(binding));
            }
            service.methods.push_back(std::move(method));
        }
        file.services.push_back(std::move(service));
    }
    return llvm::Error::success();
}

llvm::Error Registry::resolveBinding(const Service& service, const Method& method, Binding& binding) const
{
    auto variables = parsePathTemplate(binding.pathTemplate);
    if (!variables)
    {
        return variables.takeError();
    }

    for (auto& variable : *variables)
    {
        llvm::SmallVector<llvm::StringRef, 4> components;
        llvm::StringRef(variable.fieldPath).split(components, '.');

        const Message* scope  = method.requestType;
        const Field*   target = nullptr;
        for (const auto component : components)
        {
            if (scope == nullptr)
            {
                target = nullptr;
                break;
            }
            target = scope->findField(component.str());
            if (target == nullptr)
            {
                break;
            }
            scope = target->kind == FieldKind::Message ? lookupMessage(target->typeName) : nullptr;
        }
        if (target == nullptr)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "no field %s found in %s for method %s.%s",
                                           variable.fieldPath.c_str(),
                                           method.requestType->fullName.c_str(),
                                           service.fullName.c_str(),
                                           method.name.c_str());
        }
        const Enum* enumType = nullptr;
        if (target->kind == FieldKind::Enum)
        {
            enumType = enums_.lookup(target->typeName);
        }
        binding.pathParams.push_back(PathParam{std::move(variable.fieldPath), target, enumType});
    }
    return llvm::Error::success();
}

const File* Registry::findFile(const llvm::StringRef name) const
{
    const auto it = fileIndex_.find(name);
    return it == fileIndex_.end() ? nullptr : it->second;
}

const Message* Registry::lookupMessage(const llvm::StringRef fullName) const
{
    const auto it = messages_.find(fullName);
    return it == messages_.end() ? nullptr : it->second;
}

const GoPackage* Registry::lookupEnumPackage(const std::string& typeName) const
{
    const auto it = enums_.find(typeName);
    if (it == enums_.end() || it->second->file == nullptr)
    {
        return nullptr;
    }
    return &it->second->file->goPackage;
}

llvm::Expected<std::vector<const File*>> Registry::filesToGenerate(const std::vector<std::string>& names) const
{
    std::vector<const File*> targets;
    for (const auto& name : names)
    {
        const File* file = findFile(name);
        if (file == nullptr)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "no such file: %s",
                                           name.c_str());
        }
        targets.push_back(file);
    }
    return targets;
}

}  // namespace llvmgateway
