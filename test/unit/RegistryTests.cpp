//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <vector>

#include <google/protobuf/descriptor.pb.h>
#include <google/protobuf/unknown_field_set.h>

#include "llvmgateway/Descriptor/HttpRule.h"
#include "llvmgateway/Descriptor/Registry.h"
#include "llvm/Support/Error.h"

namespace
{

using google::protobuf::DescriptorProto;
using google::protobuf::FieldDescriptorProto;
using google::protobuf::FileDescriptorProto;
using google::protobuf::MethodDescriptorProto;

void addField(DescriptorProto&                  message,
              const std::string&                name,
              const int                         number,
              const FieldDescriptorProto::Type  type,
              const std::string&                typeName = "")
{
    auto* field = message.add_field();
    field->set_name(name);
    field->set_number(number);
    field->set_type(type);
    field->set_label(FieldDescriptorProto::LABEL_OPTIONAL);
    if (!typeName.empty())
    {
        field->set_type_name(typeName);
    }
}

void annotate(MethodDescriptorProto& method, const int verbField, const std::string& path, const std::string& body)
{
    google::protobuf::UnknownFieldSet rule;
    rule.AddLengthDelimited(verbField, path);
    if (!body.empty())
    {
        rule.AddLengthDelimited(7, body);
    }
    std::string encoded;
    rule.SerializeToString(&encoded);
    method.mutable_options()->mutable_unknown_fields()->AddLengthDelimited(llvmgateway::HttpRuleExtensionNumber,
                                                                           encoded);
}

FileDescriptorProto makeTypesFile()
{
    FileDescriptorProto file;
    file.set_name("types/types.proto");
    file.set_package("types");
    file.mutable_options()->set_go_package("example.com/types;typespb");

    auto* kind = file.add_enum_type();
    kind->set_name("Kind");
    kind->add_value()->set_name("KIND_UNSPECIFIED");

    auto* selector = file.add_message_type();
    selector->set_name("Selector");
    addField(*selector, "kind", 1, FieldDescriptorProto::TYPE_ENUM, ".types.Kind");
    addField(*selector, "id", 2, FieldDescriptorProto::TYPE_STRING);

    auto* nested = selector->add_nested_type();
    nested->set_name("Inner");
    auto* nestedEnum = selector->add_enum_type();
    nestedEnum->set_name("Mode");
    nestedEnum->add_value()->set_name("MODE_UNSPECIFIED");
    return file;
}

FileDescriptorProto makeServiceFile(const bool annotateGet, const std::string& getPath)
{
    FileDescriptorProto file;
    file.set_name("svc/echo.proto");
    file.set_package("echo.v1");
    file.add_dependency("types/types.proto");

    auto* request = file.add_message_type();
    request->set_name("EchoRequest");
    addField(*request, "selector", 1, FieldDescriptorProto::TYPE_MESSAGE, ".types.Selector");
    addField(*request, "name", 2, FieldDescriptorProto::TYPE_STRING);

    auto* service = file.add_service();
    service->set_name("EchoService");

    auto* get = service->add_method();
    get->set_name("Get");
    get->set_input_type(".echo.v1.EchoRequest");
    get->set_output_type(".echo.v1.EchoRequest");
    if (annotateGet)
    {
        annotate(*get, 2, getPath, "");
    }

    auto* ping = service->add_method();
    ping->set_name("ping_all");
    ping->set_input_type(".types.Selector");
    ping->set_output_type(".echo.v1.EchoRequest");
    return file;
}

}  // namespace

bool runRegistryTests()
{
    using llvmgateway::DiagnosticEngine;
    using llvmgateway::FieldKind;
    using llvmgateway::HttpMethod;
    using llvmgateway::Registry;
    using llvmgateway::RegistryOptions;

    {
        DiagnosticEngine diagnostics;
        Registry         registry(RegistryOptions{});
        if (auto err = registry.load({makeTypesFile(), makeServiceFile(true, "/v1/{selector.kind}/{name}")},
                                     diagnostics))
        {
            std::cerr << "registry load failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }

        const auto* types = registry.findFile("types/types.proto");
        const auto* svc   = registry.findFile("svc/echo.proto");
        if (types == nullptr || svc == nullptr)
        {
            std::cerr << "loaded files must be indexed by name\n";
            return false;
        }
        if (types->goPackage.path != "example.com/types" || types->goPackage.name != "typespb" ||
            !types->goPackage.alias.empty())
        {
            std::cerr << "go_package option must set path and name\n";
            return false;
        }
        if (svc->goPackage.path != "svc" || svc->goPackage.name != "svc")
        {
            std::cerr << "files without go_package must use their directory\n";
            return false;
        }

        const auto* inner = registry.lookupMessage(".types.Selector.Inner");
        if (inner == nullptr || inner->goName != "Selector_Inner" || inner->file != types)
        {
            std::cerr << "nested message indexing mismatch\n";
            return false;
        }
        const auto* kindPkg = registry.lookupEnumPackage(".types.Kind");
        const auto* modePkg = registry.lookupEnumPackage(".types.Selector.Mode");
        if (kindPkg == nullptr || kindPkg->path != "example.com/types" || modePkg == nullptr ||
            registry.lookupEnumPackage(".types.Selector") != nullptr ||
            registry.lookupEnumPackage(".types.Missing") != nullptr)
        {
            std::cerr << "enum lookup mismatch\n";
            return false;
        }

        if (svc->services.size() != 1 || svc->services[0].fullName != "echo.v1.EchoService" ||
            svc->services[0].methods.size() != 2)
        {
            std::cerr << "service loading mismatch\n";
            return false;
        }
        const auto& get = svc->services[0].methods[0];
        if (get.bindings.size() != 1 || get.bindings[0].httpMethod != HttpMethod::Get ||
            get.bindings[0].pathParams.size() != 2)
        {
            std::cerr << "binding loading mismatch\n";
            return false;
        }
        const auto& kindParam = get.bindings[0].pathParams[0];
        if (kindParam.fieldPath != "selector.kind" || kindParam.target == nullptr ||
            kindParam.target->kind != FieldKind::Enum || kindParam.target->typeName != ".types.Kind" ||
            kindParam.enumType == nullptr || kindParam.enumType->goName != "Kind" ||
            get.bindings[0].pathParams[1].enumType != nullptr)
        {
            std::cerr << "nested path parameter must resolve to the leaf field\n";
            return false;
        }
        const auto& ping = svc->services[0].methods[1];
        if (ping.goName != "PingAll" || !ping.bindings.empty() || ping.requestType == nullptr ||
            ping.requestType->file != types)
        {
            std::cerr << "unbound method mismatch\n";
            return false;
        }

        auto targets = registry.filesToGenerate({"svc/echo.proto"});
        if (!targets || targets->size() != 1 || (*targets)[0] != svc)
        {
            std::cerr << "files to generate mismatch\n";
            if (!targets)
            {
                llvm::consumeError(targets.takeError());
            }
            return false;
        }
        auto unknown = registry.filesToGenerate({"svc/missing.proto"});
        if (unknown)
        {
            std::cerr << "unknown file to generate must be rejected\n";
            return false;
        }
        llvm::consumeError(unknown.takeError());
    }

    {
        RegistryOptions options;
        options.standalone                       = true;
        options.generateUnboundMethods           = true;
        options.importMap["svc/echo.proto"]      = "example.com/echo/v1;echov1";
        DiagnosticEngine diagnostics;
        Registry         registry(options);
        if (auto err = registry.load({makeTypesFile(), makeServiceFile(false, "")}, diagnostics))
        {
            std::cerr << "registry load failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        const auto* svc = registry.findFile("svc/echo.proto");
        if (svc == nullptr || svc->goPackage.path != "example.com/echo/v1" || svc->goPackage.name != "echov1" ||
            svc->goPackage.alias != "extEchov1")
        {
            std::cerr << "M mapping and standalone alias mismatch\n";
            return false;
        }
        const auto& methods = svc->services[0].methods;
        if (methods[0].bindings.size() != 1 || methods[0].bindings[0].pathTemplate != "/echo.v1.EchoService/Get" ||
            methods[0].bindings[0].body != "*" || methods[0].bindings[0].verb != "POST" ||
            methods[1].bindings[0].pathTemplate != "/echo.v1.EchoService/ping_all")
        {
            std::cerr << "unbound methods must get a POST binding\n";
            return false;
        }
    }

    {
        DiagnosticEngine diagnostics;
        Registry         registry(RegistryOptions{});
        auto             err = registry.load({makeTypesFile(), makeServiceFile(true, "/v1/{selector.missing}")},
                                 diagnostics);
        if (!err)
        {
            std::cerr << "path parameter naming an unknown field must be rejected\n";
            return false;
        }
        const auto message = llvm::toString(std::move(err));
        if (message.find("selector.missing") == std::string::npos ||
            message.find("echo.v1.EchoService.Get") == std::string::npos)
        {
            std::cerr << "unknown field error must name the field path and method: " << message << "\n";
            return false;
        }
    }

    {
        DiagnosticEngine diagnostics;
        Registry         registry(RegistryOptions{});
        auto             err = registry.load({makeServiceFile(false, "")}, diagnostics);
        if (!err)
        {
            std::cerr << "undefined request type must be rejected\n";
            return false;
        }
        llvm::consumeError(std::move(err));
    }

    {
        auto makePackageFile = [](const std::string& name, const std::string& goPackage) {
            FileDescriptorProto file;
            file.set_name(name);
            file.set_package("pkg");
            file.mutable_options()->set_go_package(goPackage);
            return file;
        };

        DiagnosticEngine diagnostics;
        Registry         registry(RegistryOptions{});
        if (auto err = registry.reserveGoPackageAlias("runtime", "github.com/grpc-ecosystem/grpc-gateway/v2/runtime"))
        {
            std::cerr << "reserving a free name failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (auto err = registry.load({makePackageFile("a/one.proto", "example.com/a/v1"),
                                      makePackageFile("a/two.proto", "example.com/a/v1"),
                                      makePackageFile("b/one.proto", "example.com/b/v1"),
                                      makePackageFile("c/one.proto", "example.com/c/v1"),
                                      makePackageFile("r/one.proto", "example.com/mine/runtime")},
                                     diagnostics))
        {
            std::cerr << "registry load failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        const auto* a1 = registry.findFile("a/one.proto");
        const auto* a2 = registry.findFile("a/two.proto");
        const auto* b  = registry.findFile("b/one.proto");
        const auto* c  = registry.findFile("c/one.proto");
        const auto* r  = registry.findFile("r/one.proto");
        if (a1->goPackage.qualifier() != "v1" || a2->goPackage.qualifier() != "v1" ||
            b->goPackage.alias != "v1_0" || c->goPackage.alias != "v1_1" || r->goPackage.name != "runtime" ||
            r->goPackage.alias != "runtime_0")
        {
            std::cerr << "clashing package names must get unique aliases\n";
            return false;
        }

        auto taken = registry.reserveGoPackageAlias("v1_0", "example.com/other");
        if (!taken)
        {
            std::cerr << "an alias claimed by another path must be rejected\n";
            return false;
        }
        llvm::consumeError(std::move(taken));
        if (auto err = registry.reserveGoPackageAlias("v1_0", "example.com/b/v1"))
        {
            std::cerr << "reclaiming an alias for the same path must succeed\n";
            llvm::consumeError(std::move(err));
            return false;
        }
    }

    return true;
}
