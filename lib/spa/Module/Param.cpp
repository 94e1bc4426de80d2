//===-- Param.cpp - Validated module parameters -----------------*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#include "spa/Module/Param.h"
#include "spa/Common/SpaError.h"

#include <sstream>

namespace spa {

static const ParamSpec moduleParamSpecs[] = {
    {ModuleParam::DIM_PER_ENSEMBLE, ParamValue::Integer,
     ParamValue::integer(16), 1.0, true},
    {ModuleParam::PRODUCT_NEURONS, ParamValue::Integer,
     ParamValue::integer(100), 1.0, true},
    {ModuleParam::CCONV_NEURONS, ParamValue::Integer,
     ParamValue::integer(200), 1.0, true},
    {ModuleParam::SYNAPSE, ParamValue::Real, ParamValue::real(0.01), 0.0,
     true},
};

llvm::ArrayRef<ParamSpec> getModuleParamSpecs() { return moduleParamSpecs; }

const ParamSpec *findModuleParamSpec(llvm::StringRef name) {
  for (const auto &spec : moduleParamSpecs)
    if (name == spec.name)
      return &spec;
  return nullptr;
}

static const char *kindName(ParamValue::Kind kind) {
  switch (kind) {
  case ParamValue::Default: return "default";
  case ParamValue::Integer: return "integer";
  case ParamValue::Real:    return "real";
  }
  return "unknown";
}

static std::string formatBound(double v) {
  std::ostringstream os;
  os << v;
  return os.str();
}

llvm::Expected<ParamValue>
ParamSpec::validate(llvm::StringRef owner, const ParamValue &value) const {
  std::string field = (owner + "." + name).str();
  std::string frame = std::string("ParamSpec::validate(") + name + ")";

  // Kind check. Integers widen to real; reals never narrow.
  ParamValue coerced = value;
  if (value.getKind() != kind) {
    if (kind == ParamValue::Real && value.getKind() == ParamValue::Integer) {
      coerced = ParamValue::real(value.getReal());
    } else {
      return llvm::make_error<SpaError>(
          ErrorKind::Validation, ErrorCode::PARAM_TYPE,
          field + ": must be " + kindName(kind) + ", got " +
              kindName(value.getKind()) + " " + value.toString(),
          field,
          std::vector<std::string>{
              frame, std::string("ParamSpec::checkKind(expected ") +
                         kindName(kind) + ")"});
    }
  }

  double v = coerced.getReal();
  bool ok = lowInclusive ? v >= low : v > low;
  if (!ok) {
    std::string relation = lowInclusive ? "greater than or equal to"
                                        : "greater than";
    return llvm::make_error<SpaError>(
        ErrorKind::Validation, ErrorCode::PARAM_LOW_BOUND,
        field + ": value must be " + relation + " " + formatBound(low) +
            " (got " + coerced.toString() + ")",
        field,
        std::vector<std::string>{
            frame, "ParamSpec::checkLowBound(low=" + formatBound(low) +
                       (lowInclusive ? ", inclusive)" : ", exclusive)")});
  }
  return coerced;
}

} // namespace spa
