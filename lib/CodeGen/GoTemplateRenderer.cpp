//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements Go reverse-proxy template rendering for gateway files.
///
/// The rendered file forwards each HTTP binding to the gRPC client (or, for
/// in-process registration, the server implementation) through the
/// grpc-gateway runtime package. Route matching is delegated to
/// `runtime.ServeMux.HandlePath`, which compiles the binding's template.
///
//===----------------------------------------------------------------------===//

#include "llvmgateway/CodeGen/GoTemplateRenderer.h"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringMap.h"
#include "llvmgateway/CodeGen/NamingPolicy.h"

namespace llvmgateway
{
namespace
{

void emitLine(std::ostringstream& out, const int indent, const std::string& line)
{
    out << std::string(static_cast<std::size_t>(indent), '\t') << line << '\n';
}

std::string goQuote(const llvm::StringRef text)
{
    std::string out = "\"";
    for (const char c : text)
    {
        if (c == '"' || c == '\\')
        {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

/// Expression keeping an imported package referenced when the generated code
/// happens not to use it.
llvm::StringRef unusedImportGuard(const llvm::StringRef path)
{
    static const llvm::StringMap<llvm::StringRef> guards = {
        {"google.golang.org/grpc/codes", "_ codes.Code"},
        {"io", "_ io.Reader"},
        {"google.golang.org/grpc/status", "_ status.Status"},
        {"errors", "_ = errors.New"},
        {"github.com/grpc-ecosystem/grpc-gateway/v2/runtime", "_ = runtime.String"},
        {"github.com/grpc-ecosystem/grpc-gateway/v2/utilities", "_ = utilities.NewDoubleArray"},
        {"google.golang.org/grpc/metadata", "_ = metadata.Join"},
    };
    const auto it = guards.find(path);
    return it == guards.end() ? llvm::StringRef() : it->second;
}

bool isStreaming(const Method& method)
{
    return method.clientStreaming || method.serverStreaming;
}

class TemplateContext final
{
public:
    explicit TemplateContext(const RenderRequest& request)
        : request_(request)
        , file_(*request.file)
    {
    }

    const RenderRequest& request() const
    {
        return request_;
    }

    const File& file() const
    {
        return file_;
    }

    /// Qualifies a symbol declared in the source file's own package.
    std::string local(const std::string& symbol) const
    {
        if (!request_.standalone)
        {
            return symbol;
        }
        return file_.goPackage.qualifier() + "." + symbol;
    }

    llvm::Expected<std::string> typeRef(const Message& message) const
    {
        return qualify(message.file, message.goName, "message", message.fullName);
    }

    llvm::Expected<std::string> enumRef(const Enum& value) const
    {
        return qualify(value.file, value.goName, "enum", value.fullName);
    }

private:
    llvm::Expected<std::string> qualify(const File*        declaring,
                                        const std::string& goName,
                                        const char*        kind,
                                        const std::string& fullName) const
    {
        if (declaring == nullptr)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "%s %s has no declaring file",
                                           kind,
                                           fullName.c_str());
        }
        const GoPackage& pkg = declaring->goPackage;
        if (pkg == file_.goPackage)
        {
            return local(goName);
        }
        for (const auto& imported : request_.imports)
        {
            if (imported == pkg)
            {
                return imported.qualifier() + "." + goName;
            }
        }
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "package %s of %s %s is not imported",
                                       pkg.path.c_str(),
                                       kind,
                                       fullName.c_str());
    }

    const RenderRequest& request_;
    const File&          file_;
};

std::string bindingSymbol(const Service& service, const Method& method, const Binding& binding)
{
    return service.goName + "_" + method.goName + "_" + std::to_string(binding.index);
}

std::string goFieldPath(const llvm::StringRef fieldPath)
{
    llvm::SmallVector<llvm::StringRef, 4> parts;
    fieldPath.split(parts, '.');
    std::string out;
    for (const auto part : parts)
    {
        if (!out.empty())
        {
            out += ".";
        }
        out += goCamelCase(part);
    }
    return out;
}

bool needsUpdateMask(const TemplateContext& ctx, const Method& method, const Binding& binding)
{
    if (!ctx.request().allowPatchFeature || binding.httpMethod != HttpMethod::Patch || binding.body.empty() ||
        binding.body == "*")
    {
        return false;
    }
    const Field* mask = method.requestType->findField("update_mask");
    return mask != nullptr && mask->typeName == ".google.protobuf.FieldMask";
}

void emitDecodeFailure(std::ostringstream& out, const int indent, const std::string& args)
{
    emitLine(out, indent, "return nil, metadata, status.Errorf(codes.InvalidArgument, " + args + ")");
}

/// Emits the body, path parameter and query decoding shared by the client and
/// server request functions.
llvm::Error emitRequestDecoding(std::ostringstream&    out,
                                const TemplateContext& ctx,
                                const Method&          method,
                                const Binding&         binding,
                                const std::string&     symbol)
{
    if (binding.body == "*")
    {
        emitLine(out, 1, "if err := marshaler.NewDecoder(req.Body).Decode(&protoReq); err != nil && !errors.Is(err, io.EOF) {");
        emitDecodeFailure(out, 2, "\"%v\", err");
        emitLine(out, 1, "}");
    }
    else if (!binding.body.empty())
    {
        const auto head = llvm::StringRef(binding.body).split('.').first;
        if (method.requestType->findField(head.str()) == nullptr)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "body field %s not found in %s",
                                           binding.body.c_str(),
                                           method.requestType->fullName.c_str());
        }
        const auto target = "protoReq." + goFieldPath(binding.body);
        emitLine(out, 1, "newReader, berr := utilities.IOReaderFactory(req.Body)");
        emitLine(out, 1, "if berr != nil {");
        emitDecodeFailure(out, 2, "\"%v\", berr");
        emitLine(out, 1, "}");
        emitLine(out,
                 1,
                 "if err := marshaler.NewDecoder(newReader()).Decode(&" + target +
                     "); err != nil && !errors.Is(err, io.EOF) {");
        emitDecodeFailure(out, 2, "\"%v\", err");
        emitLine(out, 1, "}");
        if (needsUpdateMask(ctx, method, binding))
        {
            emitLine(out, 1, "if protoReq.UpdateMask == nil || len(protoReq.UpdateMask.GetPaths()) == 0 {");
            emitLine(out, 2, "if fieldMask, err := runtime.FieldMaskFromRequestBody(newReader(), " + target + "); err != nil {");
            emitDecodeFailure(out, 3, "\"%v\", err");
            emitLine(out, 2, "} else {");
            emitLine(out, 3, "protoReq.UpdateMask = fieldMask");
            emitLine(out, 2, "}");
            emitLine(out, 1, "}");
        }
    }

    for (const auto& param : binding.pathParams)
    {
        const auto name = goQuote(param.fieldPath);
        emitLine(out, 1, "val, ok = pathParams[" + name + "]");
        emitLine(out, 1, "if !ok {");
        emitDecodeFailure(out, 2, "\"missing parameter %s\", " + name);
        emitLine(out, 1, "}");
        emitLine(out, 1, "err = runtime.PopulateFieldFromPath(&protoReq, " + name + ", val)");
        emitLine(out, 1, "if err != nil {");
        emitDecodeFailure(out, 2, "\"type mismatch, parameter: %s, error: %v\", " + name + ", err");
        emitLine(out, 1, "}");
        if (param.enumType == nullptr)
        {
            continue;
        }

        auto enumType = ctx.enumRef(*param.enumType);
        if (!enumType)
        {
            return enumType.takeError();
        }
        const auto target = "protoReq." + goFieldPath(param.fieldPath);
        if (param.target->repeated)
        {
            emitLine(out, 1, "es, err = runtime.EnumSlice(val, \",\", " + *enumType + "_value)");
        }
        else
        {
            emitLine(out, 1, "e, err = runtime.Enum(val, " + *enumType + "_value)");
        }
        emitLine(out, 1, "if err != nil {");
        emitDecodeFailure(out, 2, "\"could not parse path as enum value, parameter: %s, error: %v\", " + name + ", err");
        emitLine(out, 1, "}");
        if (param.target->repeated)
        {
            emitLine(out, 1, "{");
            emitLine(out, 2, "s := make([]" + *enumType + ", len(es))");
            emitLine(out, 2, "for i, v := range es {");
            emitLine(out, 3, "s[i] = " + *enumType + "(v)");
            emitLine(out, 2, "}");
            emitLine(out, 2, target + " = s");
            emitLine(out, 1, "}");
        }
        else
        {
            emitLine(out, 1, target + " = " + *enumType + "(e)");
        }
    }

    if (binding.body != "*")
    {
        emitLine(out, 1, "if err := req.ParseForm(); err != nil {");
        emitDecodeFailure(out, 2, "\"%v\", err");
        emitLine(out, 1, "}");
        emitLine(out, 1, "if err := runtime.PopulateQueryParameters(&protoReq, req.Form, filter_" + symbol + "); err != nil {");
        emitDecodeFailure(out, 2, "\"%v\", err");
        emitLine(out, 1, "}");
    }
    return llvm::Error::success();
}

void emitRequestPreamble(std::ostringstream& out, const std::string& requestType, const Binding& binding)
{
    emitLine(out, 1, "var (");
    emitLine(out, 2, "protoReq " + requestType);
    emitLine(out, 2, "metadata runtime.ServerMetadata");
    if (!binding.pathParams.empty())
    {
        emitLine(out, 2, "err      error");
        emitLine(out, 2, "val      string");
        emitLine(out, 2, "ok       bool");
    }
    for (const auto& param : binding.pathParams)
    {
        if (param.enumType != nullptr && !param.target->repeated)
        {
            emitLine(out, 2, "e        int32");
            break;
        }
    }
    for (const auto& param : binding.pathParams)
    {
        if (param.enumType != nullptr && param.target->repeated)
        {
            emitLine(out, 2, "es       []int32");
            break;
        }
    }
    emitLine(out, 1, ")");
    if (!binding.pathParams.empty())
    {
        emitLine(out, 1, "_ = err");
    }
}

std::string queryFilter(const Binding& binding)
{
    std::vector<std::string> sequences;
    auto                     addSequence = [&sequences](const llvm::StringRef path) {
        llvm::SmallVector<llvm::StringRef, 4> parts;
        path.split(parts, '.');
        std::vector<std::string> quoted;
        for (const auto part : parts)
        {
            quoted.push_back(goQuote(part));
        }
        sequences.push_back("{" + llvm::join(quoted, ", ") + "}");
    };
    if (!binding.body.empty())
    {
        addSequence(binding.body);
    }
    for (const auto& param : binding.pathParams)
    {
        addSequence(param.fieldPath);
    }
    return "utilities.NewDoubleArray([][]string{" + llvm::join(sequences, ", ") + "})";
}

llvm::Error emitClientRequest(std::ostringstream&    out,
                              const TemplateContext& ctx,
                              const Service&         service,
                              const Method&          method,
                              const Binding&         binding)
{
    const auto symbol      = bindingSymbol(service, method, binding);
    auto       requestType = ctx.typeRef(*method.requestType);
    if (!requestType)
    {
        return requestType.takeError();
    }
    const auto clientType = ctx.local(service.goName + "Client");

    if (binding.body != "*")
    {
        emitLine(out, 0, "var filter_" + symbol + " = " + queryFilter(binding));
        emitLine(out, 0, "");
    }

    if (method.clientStreaming)
    {
        emitLine(out,
                 0,
                 "func request_" + symbol +
                     "(ctx context.Context, marshaler runtime.Marshaler, client " + clientType +
                     ", req *http.Request, pathParams map[string]string) (proto.Message, runtime.ServerMetadata, error) {");
        emitLine(out, 1, "var metadata runtime.ServerMetadata");
        emitLine(out, 1, "return nil, metadata, status.Errorf(codes.Unimplemented, \"client streaming is not supported by this gateway\")");
        emitLine(out, 0, "}");
        emitLine(out, 0, "");
        return llvm::Error::success();
    }

    const auto resultType = method.serverStreaming ? ctx.local(service.goName + "_" + method.goName + "Client")
                                                   : std::string("proto.Message");
    emitLine(out,
             0,
             "func request_" + symbol + "(ctx context.Context, marshaler runtime.Marshaler, client " + clientType +
                 ", req *http.Request, pathParams map[string]string) (" + resultType +
                 ", runtime.ServerMetadata, error) {");
    emitRequestPreamble(out, *requestType, binding);
    if (auto err = emitRequestDecoding(out, ctx, method, binding, symbol))
    {
        return err;
    }
    if (method.serverStreaming)
    {
        emitLine(out, 1, "stream, err := client." + method.goName + "(ctx, &protoReq)");
        emitLine(out, 1, "if err != nil {");
        emitLine(out, 2, "return nil, metadata, err");
        emitLine(out, 1, "}");
        emitLine(out, 1, "header, err := stream.Header()");
        emitLine(out, 1, "if err != nil {");
        emitLine(out, 2, "return nil, metadata, err");
        emitLine(out, 1, "}");
        emitLine(out, 1, "metadata.HeaderMD = header");
        emitLine(out, 1, "return stream, metadata, nil");
    }
    else
    {
        emitLine(out,
                 1,
                 "msg, err := client." + method.goName +
                     "(ctx, &protoReq, grpc.Header(&metadata.HeaderMD), grpc.Trailer(&metadata.TrailerMD))");
        emitLine(out, 1, "return msg, metadata, err");
    }
    emitLine(out, 0, "}");
    emitLine(out, 0, "");
    return llvm::Error::success();
}

llvm::Error emitServerRequest(std::ostringstream&    out,
                              const TemplateContext& ctx,
                              const Service&         service,
                              const Method&          method,
                              const Binding&         binding)
{
    const auto symbol      = bindingSymbol(service, method, binding);
    auto       requestType = ctx.typeRef(*method.requestType);
    if (!requestType)
    {
        return requestType.takeError();
    }
    emitLine(out,
             0,
             "func local_request_" + symbol + "(ctx context.Context, marshaler runtime.Marshaler, server " +
                 ctx.local(service.goName + "Server") +
                 ", req *http.Request, pathParams map[string]string) (proto.Message, runtime.ServerMetadata, error) {");
    emitRequestPreamble(out, *requestType, binding);
    if (auto err = emitRequestDecoding(out, ctx, method, binding, symbol))
    {
        return err;
    }
    emitLine(out, 1, "msg, err := server." + method.goName + "(ctx, &protoReq)");
    emitLine(out, 1, "return msg, metadata, err");
    emitLine(out, 0, "}");
    emitLine(out, 0, "");
    return llvm::Error::success();
}

std::string handlerContext(const TemplateContext& ctx)
{
    return ctx.request().useRequestContext ? "req.Context()" : "ctx";
}

void emitHandlePathOpen(std::ostringstream& out, const Binding& binding)
{
    emitLine(out,
             1,
             "if err := mux.HandlePath(" + goQuote(binding.verb) + ", " + goQuote(binding.pathTemplate) +
                 ", func(w http.ResponseWriter, req *http.Request, pathParams map[string]string) {");
}

void emitHandlePathClose(std::ostringstream& out)
{
    emitLine(out, 1, "}); err != nil {");
    emitLine(out, 2, "return err");
    emitLine(out, 1, "}");
}

std::string rpcName(const Service& service, const Method& method)
{
    return goQuote("/" + service.fullName + "/" + method.name);
}

void emitRegisterServer(std::ostringstream& out, const TemplateContext& ctx, const Service& service)
{
    const auto& suffix = ctx.request().registerFuncSuffix;
    const auto  name   = "Register" + service.goName + suffix + "Server";
    emitLine(out, 0, "// " + name + " registers the http handlers for service " + service.goName + " to \"mux\".");
    emitLine(out, 0, "// UnaryRPC     :call " + service.goName + "Server directly.");
    emitLine(out, 0, "// StreamingRPC :currently unsupported pending https://github.com/grpc/grpc-go/issues/906.");
    emitLine(out,
             0,
             "func " + name + "(ctx context.Context, mux *runtime.ServeMux, server " +
                 ctx.local(service.goName + "Server") + ") error {");
    for (const auto& method : service.methods)
    {
        for (const auto& binding : method.bindings)
        {
            const auto symbol = bindingSymbol(service, method, binding);
            emitHandlePathOpen(out, binding);
            if (isStreaming(method))
            {
                emitLine(out,
                         2,
                         "err := status.Error(codes.Unimplemented, \"streaming calls are not yet supported in the "
                         "in-process transport\")");
                emitLine(out, 2, "_, outboundMarshaler := runtime.MarshalerForRequest(mux, req)");
                emitLine(out, 2, "runtime.HTTPError(ctx, mux, outboundMarshaler, w, req, err)");
                emitHandlePathClose(out);
                continue;
            }
            emitLine(out, 2, "ctx, cancel := context.WithCancel(" + handlerContext(ctx) + ")");
            emitLine(out, 2, "defer cancel()");
            emitLine(out, 2, "var stream runtime.ServerTransportStream");
            emitLine(out, 2, "ctx = grpc.NewContextWithServerTransportStream(ctx, &stream)");
            emitLine(out, 2, "inboundMarshaler, outboundMarshaler := runtime.MarshalerForRequest(mux, req)");
            emitLine(out,
                     2,
                     "annotatedContext, err := runtime.AnnotateIncomingContext(ctx, mux, req, " +
                         rpcName(service, method) + ", runtime.WithHTTPPathPattern(" + goQuote(binding.pathTemplate) +
                         "))");
            emitLine(out, 2, "if err != nil {");
            emitLine(out, 3, "runtime.HTTPError(ctx, mux, outboundMarshaler, w, req, err)");
            emitLine(out, 3, "return");
            emitLine(out, 2, "}");
            emitLine(out,
                     2,
                     "resp, md, err := local_request_" + symbol +
                         "(annotatedContext, inboundMarshaler, server, req, pathParams)");
            emitLine(out,
                     2,
                     "md.HeaderMD, md.TrailerMD = metadata.Join(md.HeaderMD, stream.Header()), "
                     "metadata.Join(md.TrailerMD, stream.Trailer())");
            emitLine(out, 2, "annotatedContext = runtime.NewServerMetadataContext(annotatedContext, md)");
            emitLine(out, 2, "if err != nil {");
            emitLine(out, 3, "runtime.HTTPError(annotatedContext, mux, outboundMarshaler, w, req, err)");
            emitLine(out, 3, "return");
            emitLine(out, 2, "}");
            const auto payload = binding.responseBody.empty() ? std::string("resp")
                                                              : "response_" + symbol + "{resp}";
            emitLine(out,
                     2,
                     "forward_" + symbol + "(annotatedContext, mux, outboundMarshaler, w, req, " + payload +
                         ", mux.GetForwardResponseOptions()...)");
            emitHandlePathClose(out);
        }
    }
    emitLine(out, 1, "return nil");
    emitLine(out, 0, "}");
    emitLine(out, 0, "");
}

void emitRegisterFromEndpoint(std::ostringstream& out, const TemplateContext& ctx, const Service& service)
{
    const auto base = "Register" + service.goName + ctx.request().registerFuncSuffix;
    emitLine(out, 0, "// " + base + "FromEndpoint is same as " + base + " but");
    emitLine(out, 0, "// automatically dials to \"endpoint\" and closes the connection when \"ctx\" gets done.");
    emitLine(out,
             0,
             "func " + base +
                 "FromEndpoint(ctx context.Context, mux *runtime.ServeMux, endpoint string, opts []grpc.DialOption) (err error) {");
    emitLine(out, 1, "conn, err := grpc.NewClient(endpoint, opts...)");
    emitLine(out, 1, "if err != nil {");
    emitLine(out, 2, "return err");
    emitLine(out, 1, "}");
    emitLine(out, 1, "defer func() {");
    emitLine(out, 2, "if err != nil {");
    emitLine(out, 3, "if cerr := conn.Close(); cerr != nil {");
    emitLine(out, 4, "grpclog.Errorf(\"Failed to close conn to %s: %v\", endpoint, cerr)");
    emitLine(out, 3, "}");
    emitLine(out, 3, "return");
    emitLine(out, 2, "}");
    emitLine(out, 2, "go func() {");
    emitLine(out, 3, "<-ctx.Done()");
    emitLine(out, 3, "if cerr := conn.Close(); cerr != nil {");
    emitLine(out, 4, "grpclog.Errorf(\"Failed to close conn to %s: %v\", endpoint, cerr)");
    emitLine(out, 3, "}");
    emitLine(out, 2, "}()");
    emitLine(out, 1, "}()");
    emitLine(out, 1, "return " + base + "(ctx, mux, conn)");
    emitLine(out, 0, "}");
    emitLine(out, 0, "");

    emitLine(out, 0, "// " + base + " registers the http handlers for service " + service.goName + " to \"mux\".");
    emitLine(out, 0, "// The handlers forward requests to the grpc endpoint over \"conn\".");
    emitLine(out, 0, "func " + base + "(ctx context.Context, mux *runtime.ServeMux, conn *grpc.ClientConn) error {");
    emitLine(out, 1, "return " + base + "Client(ctx, mux, " + ctx.local("New" + service.goName + "Client") + "(conn))");
    emitLine(out, 0, "}");
    emitLine(out, 0, "");
}

void emitRegisterClient(std::ostringstream& out, const TemplateContext& ctx, const Service& service)
{
    const auto name = "Register" + service.goName + ctx.request().registerFuncSuffix + "Client";
    emitLine(out, 0, "// " + name + " registers the http handlers for service " + service.goName);
    emitLine(out, 0, "// to \"mux\". The handlers forward requests to the grpc endpoint over the given implementation of \"" +
                         service.goName + "Client\".");
    emitLine(out,
             0,
             "func " + name + "(ctx context.Context, mux *runtime.ServeMux, client " +
                 ctx.local(service.goName + "Client") + ") error {");
    for (const auto& method : service.methods)
    {
        for (const auto& binding : method.bindings)
        {
            const auto symbol = bindingSymbol(service, method, binding);
            emitHandlePathOpen(out, binding);
            emitLine(out, 2, "ctx, cancel := context.WithCancel(" + handlerContext(ctx) + ")");
            emitLine(out, 2, "defer cancel()");
            emitLine(out, 2, "inboundMarshaler, outboundMarshaler := runtime.MarshalerForRequest(mux, req)");
            emitLine(out,
                     2,
                     "annotatedContext, err := runtime.AnnotateContext(ctx, mux, req, " + rpcName(service, method) +
                         ", runtime.WithHTTPPathPattern(" + goQuote(binding.pathTemplate) + "))");
            emitLine(out, 2, "if err != nil {");
            emitLine(out, 3, "runtime.HTTPError(ctx, mux, outboundMarshaler, w, req, err)");
            emitLine(out, 3, "return");
            emitLine(out, 2, "}");
            emitLine(out,
                     2,
                     "resp, md, err := request_" + symbol +
                         "(annotatedContext, inboundMarshaler, client, req, pathParams)");
            emitLine(out, 2, "annotatedContext = runtime.NewServerMetadataContext(annotatedContext, md)");
            emitLine(out, 2, "if err != nil {");
            emitLine(out, 3, "runtime.HTTPError(annotatedContext, mux, outboundMarshaler, w, req, err)");
            emitLine(out, 3, "return");
            emitLine(out, 2, "}");
            if (method.serverStreaming && !method.clientStreaming)
            {
                emitLine(out,
                         2,
                         "forward_" + symbol +
                             "(annotatedContext, mux, outboundMarshaler, w, req, func() (proto.Message, error) {");
                emitLine(out, 3, "return resp.Recv()");
                emitLine(out, 2, "}, mux.GetForwardResponseOptions()...)");
            }
            else
            {
                const auto payload = binding.responseBody.empty() ? std::string("resp")
                                                                  : "response_" + symbol + "{resp}";
                emitLine(out,
                         2,
                         "forward_" + symbol + "(annotatedContext, mux, outboundMarshaler, w, req, " + payload +
                             ", mux.GetForwardResponseOptions()...)");
            }
            emitHandlePathClose(out);
        }
    }
    emitLine(out, 1, "return nil");
    emitLine(out, 0, "}");
    emitLine(out, 0, "");
}

llvm::Error emitResponseBodyWrappers(std::ostringstream& out, const TemplateContext& ctx, const Service& service)
{
    for (const auto& method : service.methods)
    {
        for (const auto& binding : method.bindings)
        {
            if (binding.responseBody.empty() || method.serverStreaming)
            {
                continue;
            }
            if (method.responseType == nullptr)
            {
                return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                               "method %s has no resolved response type",
                                               method.name.c_str());
            }
            auto responseType = ctx.typeRef(*method.responseType);
            if (!responseType)
            {
                return responseType.takeError();
            }
            const auto symbol = bindingSymbol(service, method, binding);
            emitLine(out, 0, "type response_" + symbol + " struct {");
            emitLine(out, 1, "proto.Message");
            emitLine(out, 0, "}");
            emitLine(out, 0, "");
            emitLine(out, 0, "func (m response_" + symbol + ") XXX_ResponseBody() interface{} {");
            emitLine(out, 1, "response := m.Message.(*" + *responseType + ")");
            emitLine(out, 1, "return response." + goFieldPath(binding.responseBody));
            emitLine(out, 0, "}");
            emitLine(out, 0, "");
        }
    }
    return llvm::Error::success();
}

void emitForwarders(std::ostringstream& out, const Service& service)
{
    std::vector<std::string> lines;
    for (const auto& method : service.methods)
    {
        for (const auto& binding : method.bindings)
        {
            const auto forwarder = method.serverStreaming && !method.clientStreaming ? "runtime.ForwardResponseStream"
                                                                                     : "runtime.ForwardResponseMessage";
            lines.push_back("forward_" + bindingSymbol(service, method, binding) + " = " + forwarder);
        }
    }
    if (lines.empty())
    {
        return;
    }
    emitLine(out, 0, "var (");
    for (const auto& line : lines)
    {
        emitLine(out, 1, line);
    }
    emitLine(out, 0, ")");
    emitLine(out, 0, "");
}

void emitHeader(std::ostringstream& out, const TemplateContext& ctx)
{
    const File& file = ctx.file();
    emitLine(out, 0, "// Code generated by protoc-gen-grpc-gateway. DO NOT EDIT.");
    emitLine(out, 0, "// source: " + file.name);
    emitLine(out, 0, "");
    if (!ctx.request().omitPackageDoc)
    {
        emitLine(out, 0, "/*");
        emitLine(out, 0, "Package " + file.goPackage.name + " is a reverse proxy.");
        emitLine(out, 0, "");
        emitLine(out, 0, "It translates gRPC into RESTful JSON APIs.");
        emitLine(out, 0, "*/");
    }
    emitLine(out, 0, "package " + file.goPackage.name);
    emitLine(out, 0, "");

    emitLine(out, 0, "import (");
    for (const auto& pkg : ctx.request().imports)
    {
        const auto importSpec = pkg.alias.empty() ? goQuote(pkg.path) : pkg.alias + " " + goQuote(pkg.path);
        emitLine(out, 1, importSpec);
    }
    emitLine(out, 0, ")");
    emitLine(out, 0, "");

    std::vector<std::string> guards;
    for (const auto& pkg : ctx.request().imports)
    {
        const auto guard = unusedImportGuard(pkg.path);
        if (!guard.empty())
        {
            guards.push_back(guard.str());
        }
    }
    if (!guards.empty())
    {
        emitLine(out, 0, "// Suppress \"imported and not used\" errors");
        emitLine(out, 0, "var (");
        for (const auto& guard : guards)
        {
            emitLine(out, 1, guard);
        }
        emitLine(out, 0, ")");
        emitLine(out, 0, "");
    }
}

}  // namespace

llvm::Expected<std::string> renderGatewayTemplate(const RenderRequest& request)
{
    if (request.file == nullptr)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "render request has no file");
    }
    const TemplateContext ctx(request);
    std::ostringstream    out;
    emitHeader(out, ctx);

    for (const auto& service : request.file->services)
    {
        for (const auto& method : service.methods)
        {
            if (method.bindings.empty())
            {
                continue;
            }
            if (method.requestType == nullptr)
            {
                return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                               "method %s.%s has no resolved request type",
                                               service.fullName.c_str(),
                                               method.name.c_str());
            }
            for (const auto& binding : method.bindings)
            {
                if (auto err = emitClientRequest(out, ctx, service, method, binding))
                {
                    return std::move(err);
                }
                if (isStreaming(method))
                {
                    continue;
                }
                if (auto err = emitServerRequest(out, ctx, service, method, binding))
                {
                    return std::move(err);
                }
            }
        }
    }

    for (const auto& service : request.file->services)
    {
        bool bound = false;
        for (const auto& method : service.methods)
        {
            bound = bound || !method.bindings.empty();
        }
        if (!bound)
        {
            continue;
        }
        emitRegisterServer(out, ctx, service);
        emitRegisterFromEndpoint(out, ctx, service);
        emitRegisterClient(out, ctx, service);
        if (auto err = emitResponseBodyWrappers(out, ctx, service))
        {
            return std::move(err);
        }
        emitForwarders(out, service);
    }
    return out.str();
}

}  // namespace llvmgateway
