//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Descriptor graph builders shared by the unit tests.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMGATEWAY_TEST_UNIT_GATEWAY_TEST_FIXTURES_H
#define LLVMGATEWAY_TEST_UNIT_GATEWAY_TEST_FIXTURES_H

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>

#include "llvmgateway/Descriptor/Model.h"
#include "llvmgateway/CodeGen/NamingPolicy.h"

namespace llvmgateway::test
{

class FakeEnumLookup final : public EnumPackageLookup
{
public:
    void add(const std::string& typeName, GoPackage pkg)
    {
        enums_[typeName] = std::move(pkg);
    }

    const GoPackage* lookupEnumPackage(const std::string& typeName) const override
    {
        const auto it = enums_.find(typeName);
        return it == enums_.end() ? nullptr : &it->second;
    }

private:
    std::map<std::string, GoPackage> enums_;
};

inline std::unique_ptr<File> makeFile(const std::string& name, const std::string& pkgPath, const std::string& pkgName)
{
    auto file            = std::make_unique<File>();
    file->name           = name;
    file->protoPackage   = pkgName;
    file->goPackage.path = pkgPath;
    file->goPackage.name = pkgName;
    return file;
}

inline Message& addMessage(File& file, const std::string& name)
{
    auto message      = std::make_unique<Message>();
    message->name     = name;
    message->fullName = "." + file.protoPackage + "." + name;
    message->goName   = name;
    message->file     = &file;
    file.messages.push_back(std::move(message));
    return *file.messages.back();
}

inline Enum& addEnum(File& file, const std::string& name)
{
    auto value      = std::make_unique<Enum>();
    value->fullName = "." + file.protoPackage + "." + name;
    value->goName   = name;
    value->file     = &file;
    file.enums.push_back(std::move(value));
    return *file.enums.back();
}

inline Field& addField(Message&           message,
                       const std::string& name,
                       const FieldKind    kind     = FieldKind::Scalar,
                       const std::string& typeName = "")
{
    Field field;
    field.name     = name;
    field.goName   = goCamelCase(name);
    field.number   = static_cast<std::int32_t>(message.fields.size() + 1);
    field.kind     = kind;
    field.typeName = typeName;
    message.fields.push_back(std::move(field));
    return message.fields.back();
}

inline Binding makeBinding(const HttpMethod   method,
                           const std::string& verb,
                           const std::string& pathTemplate,
                           const std::string& body = "")
{
    Binding binding;
    binding.httpMethod   = method;
    binding.verb         = verb;
    binding.pathTemplate = pathTemplate;
    binding.body         = body;
    return binding;
}

inline Method makeMethod(const std::string& name, const Message* request, const Message* response)
{
    Method method;
    method.name         = name;
    method.goName       = goCamelCase(name);
    method.requestType  = request;
    method.responseType = response;
    return method;
}

inline Service& addService(File& file, const std::string& name)
{
    Service service;
    service.name     = name;
    service.fullName = file.protoPackage + "." + name;
    service.goName   = name;
    file.services.push_back(std::move(service));
    return file.services.back();
}

}  // namespace llvmgateway::test

#endif  // LLVMGATEWAY_TEST_UNIT_GATEWAY_TEST_FIXTURES_H
