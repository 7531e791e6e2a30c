//===----------------------------------------------------------------------===//
//
// Part of the llvm-gateway project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection and formatting helpers.
///
/// The diagnostic engine records per-file notes, warnings, and errors that the
/// plugin front-end prints once a run completes.
///
//===----------------------------------------------------------------------===//

#include "llvmgateway/Support/Diagnostics.h"

#include <utility>

namespace llvmgateway
{
namespace
{

llvm::StringRef levelName(const DiagnosticLevel level)
{
    switch (level)
    {
    case DiagnosticLevel::Note:
        return "note";
    case DiagnosticLevel::Warning:
        return "warning";
    case DiagnosticLevel::Error:
        return "error";
    }
    return "note";
}

}  // namespace

std::string Diagnostic::str() const
{
    std::string out;
    if (!file.empty())
    {
        out += file;
        out += ": ";
    }
    out += levelName(level).str();
    out += ": ";
    out += message;
    return out;
}

void DiagnosticEngine::report(const DiagnosticLevel level, const llvm::StringRef file, std::string message)
{
    diagnostics_.push_back(Diagnostic{level, file.str(), std::move(message)});
}

void DiagnosticEngine::note(const llvm::StringRef file, std::string message)
{
    report(DiagnosticLevel::Note, file, std::move(message));
}

void DiagnosticEngine::warning(const llvm::StringRef file, std::string message)
{
    report(DiagnosticLevel::Warning, file, std::move(message));
}

void DiagnosticEngine::error(const llvm::StringRef file, std::string message)
{
    report(DiagnosticLevel::Error, file, std::move(message));
}

bool DiagnosticEngine::hasErrors() const
{
    for (const Diagnostic& d : diagnostics_)
    {
        if (d.level == DiagnosticLevel::Error)
        {
            return true;
        }
    }
    return false;
}

void DiagnosticEngine::print(llvm::raw_ostream& os, const bool verbose) const
{
    for (const Diagnostic& d : diagnostics_)
    {
        if (d.level == DiagnosticLevel::Note && !verbose)
        {
            continue;
        }
        os << d.str() << "\n";
    }
}

}  // namespace llvmgateway
