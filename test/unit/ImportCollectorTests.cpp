//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include "GatewayTestFixtures.h"
#include "llvmgateway/CodeGen/ImportCollector.h"

namespace
{

using llvmgateway::FieldKind;
using llvmgateway::GoPackage;
using llvmgateway::HttpMethod;
using llvmgateway::PathParam;

std::vector<std::string> paths(const std::vector<GoPackage>& packages)
{
    std::vector<std::string> out;
    for (const auto& pkg : packages)
    {
        out.push_back(pkg.path);
    }
    return out;
}

bool countIs(const std::vector<GoPackage>& packages, const std::string& path, const std::size_t expected)
{
    std::size_t count = 0;
    for (const auto& pkg : packages)
    {
        count += pkg.path == path ? 1U : 0U;
    }
    return count == expected;
}

}  // namespace

bool runImportCollectorTests()
{
    using namespace llvmgateway::test;
    using llvmgateway::collectGatewayImports;
    using llvmgateway::defaultGatewayBaseImports;
    using llvmgateway::ImportSet;

    const auto base = defaultGatewayBaseImports();

    {
        ImportSet set;
        if (!set.add(GoPackage{"example.com/a", "a", ""}) || set.add(GoPackage{"example.com/a", "other", "x"}) ||
            set.packages().size() != 1 || !set.contains(GoPackage{"example.com/a", "", ""}))
        {
            std::cerr << "import set must keep the first occurrence of a path only\n";
            return false;
        }
    }

    {
        auto                 file = makeFile("svc.proto", "example.com/foo", "foo");
        const FakeEnumLookup enums;
        const auto           imports = collectGatewayImports(*file, base, false, enums);
        if (paths(imports) != paths(base))
        {
            std::cerr << "file without services must import the base packages only\n";
            return false;
        }
    }

    {
        auto  other   = makeFile("other.proto", "example.com/other", "other");
        auto& request = addMessage(*other, "Request");
        auto  file    = makeFile("svc.proto", "example.com/foo", "foo");
        auto& reply   = addMessage(*file, "Reply");
        auto& local   = addMessage(*file, "LocalRequest");

        auto& service = addService(*file, "Echo");
        auto  first   = makeMethod("First", &request, &reply);
        first.bindings.push_back(makeBinding(HttpMethod::Get, "GET", "/v1/first"));
        auto second = makeMethod("Second", &request, &reply);
        second.bindings.push_back(makeBinding(HttpMethod::Post, "POST", "/v1/second", "*"));
        auto third = makeMethod("Third", &local, &reply);
        third.bindings.push_back(makeBinding(HttpMethod::Get, "GET", "/v1/third"));
        service.methods.push_back(std::move(first));
        service.methods.push_back(std::move(second));
        service.methods.push_back(std::move(third));

        const FakeEnumLookup enums;
        const auto           imports = collectGatewayImports(*file, base, false, enums);
        if (imports.size() != base.size() + 1 || imports.back().path != "example.com/other")
        {
            std::cerr << "foreign request package must be appended exactly once\n";
            return false;
        }
        if (!countIs(imports, "example.com/foo", 0))
        {
            std::cerr << "file's own package must not be imported\n";
            return false;
        }

        const auto standalone = collectGatewayImports(*file, base, true, enums);
        if (standalone.size() != base.size() + 2 || standalone[base.size()].path != "example.com/foo" ||
            !countIs(standalone, "example.com/foo", 1))
        {
            std::cerr << "standalone mode must import the file's own package once, right after the base\n";
            return false;
        }
    }

    {
        auto  file    = makeFile("svc.proto", "example.com/foo", "foo");
        auto& request = addMessage(*file, "Request");
        addField(request, "kind", FieldKind::Enum, ".enums.Kind");
        addField(request, "local", FieldKind::Enum, ".foo.Local");
        addField(request, "name");

        auto& service = addService(*file, "Echo");
        auto  method  = makeMethod("Get", &request, &request);
        auto  binding = makeBinding(HttpMethod::Get, "GET", "/v1/{kind}/{local}/{name}");
        binding.pathParams.push_back(PathParam{"kind", &request.fields[0]});
        binding.pathParams.push_back(PathParam{"local", &request.fields[1]});
        binding.pathParams.push_back(PathParam{"name", &request.fields[2]});
        auto second = binding;
        second.index = 1;
        method.bindings.push_back(binding);
        method.bindings.push_back(second);
        service.methods.push_back(std::move(method));

        auto unbound = makeMethod("Unbound", &request, &request);
        service.methods.push_back(std::move(unbound));

        FakeEnumLookup enums;
        enums.add(".enums.Kind", GoPackage{"example.com/enums", "enums", ""});
        enums.add(".foo.Local", file->goPackage);

        const auto imports = collectGatewayImports(*file, base, false, enums);
        if (!countIs(imports, "example.com/enums", 1) || imports.size() != base.size() + 1)
        {
            std::cerr << "enum path parameter package must be imported exactly once\n";
            return false;
        }
        if (!countIs(imports, "example.com/foo", 0))
        {
            std::cerr << "enum declared in the file's own package must not be imported\n";
            return false;
        }
    }

    {
        auto  other   = makeFile("other.proto", "example.com/other", "other");
        auto& request = addMessage(*other, "Request");
        addField(request, "kind", FieldKind::Enum, ".enums.Kind");
        auto  file    = makeFile("svc.proto", "example.com/foo", "foo");
        auto& service = addService(*file, "Echo");

        auto method  = makeMethod("Get", &request, &request);
        auto binding = makeBinding(HttpMethod::Get, "GET", "/v1/{kind}");
        binding.pathParams.push_back(PathParam{"kind", &request.fields[0]});
        method.bindings.push_back(binding);
        service.methods.push_back(std::move(method));

        auto idle = makeMethod("Idle", &request, &request);
        service.methods.push_back(std::move(idle));

        FakeEnumLookup enums;
        enums.add(".enums.Kind", GoPackage{"example.com/enums", "enums", ""});
        const auto imports = collectGatewayImports(*file, base, false, enums);
        const auto                     all = paths(imports);
        const std::vector<std::string> tail(all.begin() + static_cast<std::ptrdiff_t>(base.size()), all.end());
        if (tail != std::vector<std::string>{"example.com/enums", "example.com/other"})
        {
            std::cerr << "enum imports must precede the request type import of the same method\n";
            return false;
        }
    }

    {
        auto  other   = makeFile("other.proto", "example.com/other", "other");
        auto& request = addMessage(*other, "Request");
        auto  file    = makeFile("svc.proto", "example.com/foo", "foo");
        auto& service = addService(*file, "Echo");
        service.methods.push_back(makeMethod("Idle", &request, &request));

        const FakeEnumLookup enums;
        if (collectGatewayImports(*file, base, false, enums).size() != base.size())
        {
            std::cerr << "methods without bindings must not contribute imports\n";
            return false;
        }
    }

    return true;
}
