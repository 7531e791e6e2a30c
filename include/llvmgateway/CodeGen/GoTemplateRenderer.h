//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Go reverse-proxy template rendering for gateway files.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMGATEWAY_CODEGEN_GO_TEMPLATE_RENDERER_H
#define LLVMGATEWAY_CODEGEN_GO_TEMPLATE_RENDERER_H

#include <string>

#include "llvmgateway/CodeGen/GatewayGenerator.h"
#include "llvm/Support/Error.h"

namespace llvmgateway
{

/// @brief Renders the `*.pb.gw.go` source for one file.
/// @details Emits request decoders, `Register*` functions and forwarders for
/// every bound method. Types of other packages are qualified through the
/// request's import list.
/// @param[in] request Render request built by the gateway generator.
/// @return Unformatted Go source, or an error for unresolved request types,
///         unknown body fields, or response types whose package is not imported.
llvm::Expected<std::string> renderGatewayTemplate(const RenderRequest& request);

}  // namespace llvmgateway

#endif  // LLVMGATEWAY_CODEGEN_GO_TEMPLATE_RENDERER_H
