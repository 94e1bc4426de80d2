//===-- Config.cpp - Ambient per-network configuration ----------*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#include "spa/Network/Config.h"

#include <cassert>
#include <sstream>

namespace spa {

//===----------------------------------------------------------------------===//
// ParamValue
//===----------------------------------------------------------------------===//

int64_t ParamValue::getInteger() const {
  assert(kind_ == Integer && "not an integer parameter value");
  return int_;
}

double ParamValue::getReal() const {
  assert(kind_ != Default && "Default sentinel has no value");
  if (kind_ == Integer)
    return static_cast<double>(int_);
  return real_;
}

std::string ParamValue::toString() const {
  switch (kind_) {
  case Default:
    return "Default";
  case Integer:
    return std::to_string(int_);
  case Real: {
    std::ostringstream os;
    os << real_;
    return os.str();
  }
  }
  return "Default"; // fallback
}

bool ParamValue::operator==(const ParamValue &other) const {
  if (kind_ != other.kind_)
    return false;
  switch (kind_) {
  case Default: return true;
  case Integer: return int_ == other.int_;
  case Real:    return real_ == other.real_;
  }
  return false;
}

//===----------------------------------------------------------------------===//
// Config
//===----------------------------------------------------------------------===//

void Config::setDefault(llvm::StringRef typeName, llvm::StringRef param,
                        ParamValue value) {
  defaults_[typeName][param] = value;
}

std::optional<ParamValue> Config::getDefault(llvm::StringRef typeName,
                                             llvm::StringRef param) const {
  auto typeIt = defaults_.find(typeName);
  if (typeIt == defaults_.end())
    return std::nullopt;
  auto paramIt = typeIt->second.find(param);
  if (paramIt == typeIt->second.end())
    return std::nullopt;
  return paramIt->second;
}

} // namespace spa
