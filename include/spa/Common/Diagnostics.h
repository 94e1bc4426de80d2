//===-- Diagnostics.h - Non-fatal SPA diagnostics ---------------*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//
//
// Structured, non-fatal diagnostic events. A diagnostic never changes the
// outcome of the operation that emitted it; it is delivered to the handler
// found through the ambient configuration.
//
//===----------------------------------------------------------------------===//

#ifndef SPA_COMMON_DIAGNOSTICS_H
#define SPA_COMMON_DIAGNOSTICS_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include <functional>
#include <string>
#include <vector>

namespace spa {

enum class DiagnosticSeverity { Note, Warning };

struct Diagnostic {
  DiagnosticSeverity severity = DiagnosticSeverity::Warning;
  std::string code;
  std::string message;
  std::string location;
};

using DiagnosticHandler = std::function<void(const Diagnostic &)>;

/// Print \p diag as "warning: [CODE] message (at location)".
void printDiagnostic(const Diagnostic &diag, llvm::raw_ostream &os);

/// Handler used when no configuration installs one. Prints to llvm::errs().
void defaultDiagnosticHandler(const Diagnostic &diag);

/// Records every diagnostic it receives.
class DiagnosticCollector {
public:
  DiagnosticHandler handler() {
    return [this](const Diagnostic &diag) { diagnostics_.push_back(diag); };
  }

  const std::vector<Diagnostic> &getDiagnostics() const {
    return diagnostics_;
  }

  /// Number of recorded diagnostics with the given code.
  size_t count(llvm::StringRef code) const;

  void clear() { diagnostics_.clear(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

} // namespace spa

#endif // SPA_COMMON_DIAGNOSTICS_H
