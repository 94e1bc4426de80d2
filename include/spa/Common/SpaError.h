//===-- SpaError.h - Centralized SPA error codes and payload ----*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//
//
// Single source of truth for all SPA_ error code symbols and the llvm::Error
// payload used to report them. Files that report SPA errors should include
// this header and use these constants instead of inline string literals.
//
//===----------------------------------------------------------------------===//

#ifndef SPA_COMMON_SPAERROR_H
#define SPA_COMMON_SPAERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <string>
#include <vector>

namespace spa {

/// Error taxonomy. Every SpaError belongs to exactly one kind.
enum class ErrorKind {
  Reassignment,
  ModuleNotFound,
  PortNotFound,
  StructuralIntegrity,
  InvalidDimension,
  Validation,
  VocabularyNotFound,
  ProbeDataMissing,
};

/// Return a stable printable name for \p kind (e.g. "ReassignmentError").
llvm::StringRef getErrorKindName(ErrorKind kind);

/// Centralized error code constants.
///
/// Each constant is used as the `code` field of a SpaError or a Diagnostic.
/// Codes are grouped by the component that reports them.
namespace ErrorCode {

// --- Registration Errors ---
inline constexpr const char *MODULE_REASSIGNED = "SPA_MODULE_REASSIGNED";
inline constexpr const char *MODULE_NOT_NESTED = "SPA_MODULE_NOT_NESTED";

// --- Resolution Errors ---
inline constexpr const char *MODULE_NOT_FOUND = "SPA_MODULE_NOT_FOUND";
inline constexpr const char *INPUT_NOT_FOUND = "SPA_INPUT_NOT_FOUND";
inline constexpr const char *OUTPUT_NOT_FOUND = "SPA_OUTPUT_NOT_FOUND";

// --- Validation Errors ---
inline constexpr const char *MODULE_UNREGISTERED = "SPA_MODULE_UNREGISTERED";
inline constexpr const char *PARAM_UNKNOWN = "SPA_PARAM_UNKNOWN";
inline constexpr const char *PARAM_TYPE = "SPA_PARAM_TYPE";
inline constexpr const char *PARAM_LOW_BOUND = "SPA_PARAM_LOW_BOUND";

// --- Vocabulary Errors ---
inline constexpr const char *VOCAB_DIMENSION = "SPA_VOCAB_DIMENSION";
inline constexpr const char *VOCAB_NOT_FOUND = "SPA_VOCAB_NOT_FOUND";
inline constexpr const char *VOCAB_POINTER_WIDTH = "SPA_VOCAB_POINTER_WIDTH";
inline constexpr const char *VOCAB_POINTER_EXISTS = "SPA_VOCAB_POINTER_EXISTS";

// --- Data Errors ---
inline constexpr const char *PROBE_DATA_MISSING = "SPA_PROBE_DATA_MISSING";
inline constexpr const char *MATRIX_RAGGED = "SPA_MATRIX_RAGGED";

// --- Diagnostics (non-fatal) ---
inline constexpr const char *DEPRECATED_UNDERSCORE_NAME =
    "SPA_DEPRECATED_UNDERSCORE_NAME";

} // namespace ErrorCode

/// Format a bracketed error prefix: "[SPA_FOO] msg"
inline std::string spaErrMsg(const char *code, llvm::StringRef msg) {
  return std::string("[") + code + "] " + msg.str();
}

//===----------------------------------------------------------------------===//
// SpaError
//===----------------------------------------------------------------------===//

/// llvm::Error payload for every failure reported by this library.
///
/// The cause chain lists the internal checks that led to the failure,
/// outermost first. It is dropped when the error passes a boundary whose
/// error-reporting policy is ErrorReporting::Simplified.
class SpaError : public llvm::ErrorInfo<SpaError> {
public:
  static char ID;

  SpaError(ErrorKind kind, const char *code, std::string message,
           std::string location = "", std::vector<std::string> causes = {});

  ErrorKind getKind() const { return kind_; }
  llvm::StringRef getCode() const { return code_; }
  llvm::StringRef getMessage() const { return message_; }
  llvm::StringRef getLocation() const { return location_; }
  const std::vector<std::string> &getCauses() const { return causes_; }

  void addCause(llvm::StringRef cause) { causes_.push_back(cause.str()); }
  void clearCauses() { causes_.clear(); }

  void log(llvm::raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;

private:
  ErrorKind kind_;
  std::string code_;
  std::string message_;
  std::string location_;
  std::vector<std::string> causes_;
};

/// Create an llvm::Error holding a SpaError.
llvm::Error makeError(ErrorKind kind, const char *code, const llvm::Twine &msg,
                      llvm::StringRef location = "");

/// Drop the cause chain of every SpaError in \p err. Other payloads pass
/// through untouched.
llvm::Error stripErrorCauses(llvm::Error err);

} // namespace spa

#endif // SPA_COMMON_SPAERROR_H
