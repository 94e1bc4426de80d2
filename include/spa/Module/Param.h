//===-- Param.h - Validated module parameters -------------------*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#ifndef SPA_MODULE_PARAM_H
#define SPA_MODULE_PARAM_H

#include "spa/Network/Config.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace spa {

/// Descriptor of one module parameter: its value kind, built-in default and
/// lower bound.
struct ParamSpec {
  const char *name;
  ParamValue::Kind kind;
  ParamValue defaultValue;
  double low;
  bool lowInclusive;

  /// Check \p value (never the Default sentinel) and return it coerced to
  /// this parameter's kind. Failures are ValidationErrors whose cause chain
  /// names the failing check. \p owner prefixes the field name in messages.
  llvm::Expected<ParamValue> validate(llvm::StringRef owner,
                                      const ParamValue &value) const;
};

namespace ModuleParam {
inline constexpr const char *DIM_PER_ENSEMBLE = "dim_per_ensemble";
inline constexpr const char *PRODUCT_NEURONS = "product_neurons";
inline constexpr const char *CCONV_NEURONS = "cconv_neurons";
inline constexpr const char *SYNAPSE = "synapse";
} // namespace ModuleParam

/// All parameters every Module carries.
llvm::ArrayRef<ParamSpec> getModuleParamSpecs();

/// Descriptor for \p name, or nullptr.
const ParamSpec *findModuleParamSpec(llvm::StringRef name);

} // namespace spa

#endif // SPA_MODULE_PARAM_H
