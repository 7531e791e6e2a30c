//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `protoc-gen-grpc-gateway` protoc plugin.
///
/// protoc writes a serialized `CodeGeneratorRequest` to stdin and reads the
/// `CodeGeneratorResponse` from stdout. Generation failures travel back
/// inside the response; only I/O and protocol failures exit non-zero.
///
//===----------------------------------------------------------------------===//

#include <memory>
#include <string>

#include <google/protobuf/compiler/plugin.pb.h>
#include <google/protobuf/stubs/common.h>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Program.h"
#include "llvm/Support/raw_ostream.h"
#include "llvmgateway/Plugin/PluginDriver.h"
#include "llvmgateway/Support/Diagnostics.h"

#ifndef LLVMGATEWAY_VERSION
#define LLVMGATEWAY_VERSION "0.0.0"
#endif

namespace
{

/// @brief Checks whether a token is a help switch.
///
/// @param[in] arg Argument token from argv.
/// @return `true` when the argument is `--help` or `-h`.
bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: protoc --grpc-gateway_out=<dir> [--grpc-gateway_opt=<key>=<value>] <file.proto>...\n"
                 << "Try: protoc-gen-grpc-gateway --help\n";
}

/// @brief Prints the full help text.
void printHelp()
{
    llvm::errs()
        << "NAME\n"
        << "  protoc-gen-grpc-gateway - gRPC to JSON reverse-proxy generator plugin for protoc\n\n"
        << "SYNOPSIS\n"
        << "  protoc --grpc-gateway_out=<dir> [--grpc-gateway_opt=<option>] <file.proto>...\n"
        << "  protoc-gen-grpc-gateway --help\n"
        << "  protoc-gen-grpc-gateway --version\n\n"
        << "DESCRIPTION\n"
        << "  Reads a CodeGeneratorRequest from stdin and writes one <name>.pb.gw.go file per proto\n"
        << "  file that declares a service method with a google.api.http binding.\n\n"
        << "OPTIONS (comma-separated, passed through --grpc-gateway_opt)\n"
        << "  paths=<import|source_relative>\n"
        << "      Output path addressing (default: import).\n"
        << "  module=<prefix>\n"
        << "      Go module prefix stripped from output paths. Requires paths=import.\n"
        << "  register_func_suffix=<suffix>\n"
        << "      Suffix of generated Register functions (default: Handler).\n"
        << "  request_context=<bool>\n"
        << "      Derive handler contexts from the HTTP request (default: true).\n"
        << "  allow_patch_feature=<bool>\n"
        << "      Populate update masks from PATCH request bodies (default: true).\n"
        << "  standalone=<bool>\n"
        << "      Generate into a separate package importing the source package (default: false).\n"
        << "  omit_package_doc=<bool>\n"
        << "      Omit the package documentation comment (default: false).\n"
        << "  generate_unbound_methods=<bool>\n"
        << "      Bind methods without an http rule to POST /<package.Service>/<Method> (default: false).\n"
        << "  M<file>=<go import path>\n"
        << "      Override the Go package of a proto file.\n"
        << "  v=<level>\n"
        << "      Print notes to stderr when level >= 1.\n"
        << "  logtostderr=<bool>\n"
        << "      Accepted for compatibility.\n\n"
        << "EXIT STATUS\n"
        << "  0 when a response was written, including responses that carry a generation error;\n"
        << "  non-zero on I/O failure or an undecodable request.\n";
}

}  // namespace

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    for (int i = 1; i < argc; ++i)
    {
        const llvm::StringRef arg = argv[i];
        if (isHelpToken(arg))
        {
            printHelp();
            return 0;
        }
        if (arg == "--version")
        {
            llvm::outs() << "protoc-gen-grpc-gateway " << LLVMGATEWAY_VERSION << "\n";
            return 0;
        }
        llvm::errs() << "error: unexpected argument '" << arg << "'\n";
        printUsage();
        return 1;
    }

    if (auto ec = llvm::sys::ChangeStdinToBinary())
    {
        llvm::errs() << "error: cannot switch stdin to binary mode: " << ec.message() << "\n";
        return 1;
    }
    auto input = llvm::MemoryBuffer::getSTDIN();
    if (!input)
    {
        llvm::errs() << "error: failed to read CodeGeneratorRequest: " << input.getError().message() << "\n";
        return 1;
    }

    const llvm::StringRef                           bytes = (*input)->getBuffer();
    google::protobuf::compiler::CodeGeneratorRequest request;
    if (!request.ParseFromArray(bytes.data(), static_cast<int>(bytes.size())))
    {
        llvm::errs() << "error: failed to parse CodeGeneratorRequest\n";
        return 1;
    }

    llvmgateway::DiagnosticEngine diagnostics;
    const auto                    result = llvmgateway::runGatewayPlugin(request, diagnostics);
    diagnostics.print(llvm::errs(), result.verbosity >= 1);

    if (auto ec = llvm::sys::ChangeStdoutToBinary())
    {
        llvm::errs() << "error: cannot switch stdout to binary mode: " << ec.message() << "\n";
        return 1;
    }
    std::string encoded;
    if (!result.response.SerializeToString(&encoded))
    {
        llvm::errs() << "error: failed to serialize CodeGeneratorResponse\n";
        return 1;
    }
    llvm::outs() << encoded;
    llvm::outs().flush();
    if (llvm::outs().has_error())
    {
        llvm::outs().clear_error();
        llvm::errs() << "error: failed to write CodeGeneratorResponse\n";
        return 1;
    }
    return 0;
}
