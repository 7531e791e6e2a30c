//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// End-to-end plugin run from a decoded request to a response.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMGATEWAY_PLUGIN_PLUGIN_DRIVER_H
#define LLVMGATEWAY_PLUGIN_PLUGIN_DRIVER_H

#include <google/protobuf/compiler/plugin.pb.h>

#include "llvmgateway/Support/Diagnostics.h"

namespace llvmgateway
{

/// @brief Result of one plugin run.
struct PluginRunResult final
{
    google::protobuf::compiler::CodeGeneratorResponse response;

    /// @brief Verbosity requested through the `v` parameter.
    unsigned verbosity{0};
};

/// @brief Parses parameters, loads the registry and generates gateway files.
/// @details Every failure is reported through the response `error` field; the
/// response then carries no files. Proto3 optional support is always advertised.
/// @param[in] request Decoded request.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Response to send back to protoc.
PluginRunResult runGatewayPlugin(const google::protobuf::compiler::CodeGeneratorRequest& request,
                                 DiagnosticEngine&                                         diagnostics);

}  // namespace llvmgateway

#endif  // LLVMGATEWAY_PLUGIN_PLUGIN_DRIVER_H
