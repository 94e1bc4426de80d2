//===-- PathResolver.cpp - Dotted and legacy port name helpers --*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#include "spa/Module/PathResolver.h"
#include "spa/Module/Port.h"

#include "llvm/ADT/Twine.h"

namespace spa {

DottedPath::DottedPath(llvm::StringRef path) {
  size_t pos = path.find(PATH_DELIMITER);
  if (pos == llvm::StringRef::npos) {
    head_ = path;
    return;
  }
  head_ = path.take_front(pos);
  remainder_ = path.drop_front(pos + 1);
  hasRemainder_ = true;
}

std::optional<LegacyPortName> splitLegacyPortName(llvm::StringRef name) {
  size_t pos = name.rfind(LEGACY_DELIMITER);
  if (pos == llvm::StringRef::npos)
    return std::nullopt;
  return LegacyPortName{name.take_front(pos), name.drop_front(pos + 1)};
}

std::string joinLegacyPortName(llvm::StringRef module, llvm::StringRef port) {
  if (port == DEFAULT_PORT)
    return module.str();
  return (module + llvm::Twine(LEGACY_DELIMITER) + port).str();
}

} // namespace spa
