//===-- PathResolver.h - Dotted and legacy port name helpers ----*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//
//
// Registry-independent helpers used by Module's name resolution:
//
//   "a.b.c"      dotted path, walked one head segment at a time
//   "mod_port"   legacy underscore form, split on the LAST underscore
//
// The legacy split is ambiguous when module or port names contain
// underscores ("my_module_x" -> module "my_module", port "x"). Last
// underscore wins.
//
//===----------------------------------------------------------------------===//

#ifndef SPA_MODULE_PATHRESOLVER_H
#define SPA_MODULE_PATHRESOLVER_H

#include "llvm/ADT/StringRef.h"

#include <optional>
#include <string>

namespace spa {

inline constexpr char PATH_DELIMITER = '.';
inline constexpr char LEGACY_DELIMITER = '_';

/// Head/remainder view of a dotted path. Does not own the string.
class DottedPath {
public:
  explicit DottedPath(llvm::StringRef path);

  /// First segment ("a" for "a.b.c").
  llvm::StringRef head() const { return head_; }

  /// Everything after the first delimiter ("b.c"), empty for a single segment.
  llvm::StringRef remainder() const { return remainder_; }

  bool hasRemainder() const { return hasRemainder_; }

  /// The path formed by the remainder. Only valid when hasRemainder().
  DottedPath next() const { return DottedPath(remainder_); }

private:
  llvm::StringRef head_;
  llvm::StringRef remainder_;
  bool hasRemainder_ = false;
};

struct LegacyPortName {
  llvm::StringRef module;
  llvm::StringRef port;
};

/// Split \p name on its last underscore. Returns std::nullopt when \p name
/// contains no underscore.
std::optional<LegacyPortName> splitLegacyPortName(llvm::StringRef name);

/// Legacy listing name of a port: the module name for the "default" port,
/// "module_port" otherwise.
std::string joinLegacyPortName(llvm::StringRef module, llvm::StringRef port);

} // namespace spa

#endif // SPA_MODULE_PATHRESOLVER_H
