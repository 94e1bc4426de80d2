//===-- Diagnostics.cpp - Non-fatal SPA diagnostics -------------*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#include "spa/Common/Diagnostics.h"

namespace spa {

void printDiagnostic(const Diagnostic &diag, llvm::raw_ostream &os) {
  switch (diag.severity) {
  case DiagnosticSeverity::Note:    os << "note: "; break;
  case DiagnosticSeverity::Warning: os << "warning: "; break;
  }
  os << "[" << diag.code << "] " << diag.message;
  if (!diag.location.empty())
    os << " (at " << diag.location << ")";
  os << "\n";
}

void defaultDiagnosticHandler(const Diagnostic &diag) {
  printDiagnostic(diag, llvm::errs());
}

size_t DiagnosticCollector::count(llvm::StringRef code) const {
  size_t n = 0;
  for (const auto &diag : diagnostics_)
    if (diag.code == code)
      ++n;
  return n;
}

} // namespace spa
