//===-- SpaError.cpp - SPA error payload ------------------------*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#include "spa/Common/SpaError.h"

namespace spa {

char SpaError::ID = 0;

llvm::StringRef getErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Reassignment:        return "ReassignmentError";
  case ErrorKind::ModuleNotFound:      return "ModuleNotFoundError";
  case ErrorKind::PortNotFound:        return "PortNotFoundError";
  case ErrorKind::StructuralIntegrity: return "StructuralIntegrityError";
  case ErrorKind::InvalidDimension:    return "InvalidDimensionError";
  case ErrorKind::Validation:          return "ValidationError";
  case ErrorKind::VocabularyNotFound:  return "VocabularyNotFoundError";
  case ErrorKind::ProbeDataMissing:    return "ProbeDataMissingError";
  }
  return "SpaError"; // fallback
}

SpaError::SpaError(ErrorKind kind, const char *code, std::string message,
                   std::string location, std::vector<std::string> causes)
    : kind_(kind), code_(code), message_(std::move(message)),
      location_(std::move(location)), causes_(std::move(causes)) {}

void SpaError::log(llvm::raw_ostream &os) const {
  os << getErrorKindName(kind_) << ": " << spaErrMsg(code_.c_str(), message_);
  if (!location_.empty())
    os << " (at " << location_ << ")";
  for (const auto &cause : causes_)
    os << "\n  caused by: " << cause;
}

std::error_code SpaError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

llvm::Error makeError(ErrorKind kind, const char *code, const llvm::Twine &msg,
                      llvm::StringRef location) {
  return llvm::make_error<SpaError>(kind, code, msg.str(), location.str());
}

llvm::Error stripErrorCauses(llvm::Error err) {
  return llvm::handleErrors(
      std::move(err), [](std::unique_ptr<SpaError> payload) -> llvm::Error {
        payload->clearCauses();
        return llvm::Error(std::move(payload));
      });
}

} // namespace spa
