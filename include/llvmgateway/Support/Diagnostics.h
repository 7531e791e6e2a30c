//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for diagnostic reporting used by the registry, the gateway
/// generator, and the plugin front-end.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMGATEWAY_SUPPORT_DIAGNOSTICS_H
#define LLVMGATEWAY_SUPPORT_DIAGNOSTICS_H

#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

namespace llvmgateway
{

/// @brief Severity level for a diagnostic message.
enum class DiagnosticLevel
{

    /// @brief Informational note, printed only in verbose mode.
    Note,

    /// @brief Non-fatal warning.
    Warning,

    /// @brief Fatal error.
    Error,
};

/// @brief Single diagnostic record produced by the pipeline.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Proto file the message refers to, empty for run-level messages.
    std::string file;

    /// @brief Human-readable message text.
    std::string message;

    /// @brief Formats this record as `<file>: <level>: <message>`.
    /// @return Formatted text without a trailing newline.
    [[nodiscard]] std::string str() const;
};

/// @brief Accumulates diagnostics emitted across registry loading and generation.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] file Proto file associated with the message.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, llvm::StringRef file, std::string message);

    /// @brief Emits a note-level diagnostic.
    void note(llvm::StringRef file, std::string message);

    /// @brief Emits a warning-level diagnostic.
    void warning(llvm::StringRef file, std::string message);

    /// @brief Emits an error-level diagnostic.
    void error(llvm::StringRef file, std::string message);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Returns all recorded diagnostics in insertion order.
    /// @return Immutable diagnostic list.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

    /// @brief Prints recorded diagnostics, one per line.
    /// @param[in,out] os Destination stream.
    /// @param[in] verbose Includes note-level records when true.
    void print(llvm::raw_ostream& os, bool verbose) const;

private:
    /// @brief Backing storage for collected diagnostics.
    std::vector<Diagnostic> diagnostics_;
};

}  // namespace llvmgateway

#endif  // LLVMGATEWAY_SUPPORT_DIAGNOSTICS_H
