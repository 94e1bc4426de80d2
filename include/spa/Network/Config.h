//===-- Config.h - Ambient per-network configuration ------------*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//
//
// Every Network carries a Config. Settings left unset in one Config are
// looked up in the enclosing networks' Configs (see
// Network::getAmbientConfigs), so a setting applies to everything built
// inside the network that holds it.
//
//===----------------------------------------------------------------------===//

#ifndef SPA_NETWORK_CONFIG_H
#define SPA_NETWORK_CONFIG_H

#include "spa/Common/Diagnostics.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace spa {

class VocabularyMap;

//===----------------------------------------------------------------------===//
// ParamValue
//===----------------------------------------------------------------------===//

/// Value written to a module parameter. The Default sentinel asks the write
/// to use the configured default for the parameter.
class ParamValue {
public:
  enum Kind { Default, Integer, Real };

  ParamValue() = default;

  static ParamValue useDefault() { return ParamValue(); }
  static ParamValue integer(int64_t v) { return ParamValue(Integer, v, 0.0); }
  static ParamValue real(double v) { return ParamValue(Real, 0, v); }

  Kind getKind() const { return kind_; }
  bool isDefault() const { return kind_ == Default; }

  int64_t getInteger() const;
  /// Integer values widen to double.
  double getReal() const;

  /// Printable form ("Default", "16", "0.01").
  std::string toString() const;

  bool operator==(const ParamValue &other) const;
  bool operator!=(const ParamValue &other) const { return !(*this == other); }

private:
  ParamValue(Kind k, int64_t i, double r) : kind_(k), int_(i), real_(r) {}
  Kind kind_ = Default;
  int64_t int_ = 0;
  double real_ = 0.0;
};

/// How errors from validated field writes are reported. Simplified drops
/// the internal cause chain.
enum class ErrorReporting { Full, Simplified };

//===----------------------------------------------------------------------===//
// Config
//===----------------------------------------------------------------------===//

class Config {
public:
  /// Set the default for \p param on objects of type \p typeName.
  void setDefault(llvm::StringRef typeName, llvm::StringRef param,
                  ParamValue value);
  std::optional<ParamValue> getDefault(llvm::StringRef typeName,
                                       llvm::StringRef param) const;

  /// Default VocabularyMap for modules constructed inside this network.
  void setVocabs(std::shared_ptr<VocabularyMap> vocabs) {
    vocabs_ = std::move(vocabs);
  }
  const std::shared_ptr<VocabularyMap> &getVocabs() const { return vocabs_; }

  void setErrorReporting(ErrorReporting policy) { errorReporting_ = policy; }
  std::optional<ErrorReporting> getErrorReporting() const {
    return errorReporting_;
  }

  void setDiagnosticHandler(DiagnosticHandler handler) {
    diagHandler_ = std::move(handler);
  }
  /// Empty when unset.
  const DiagnosticHandler &getDiagnosticHandler() const {
    return diagHandler_;
  }

private:
  llvm::StringMap<llvm::StringMap<ParamValue>> defaults_;
  std::shared_ptr<VocabularyMap> vocabs_;
  std::optional<ErrorReporting> errorReporting_;
  DiagnosticHandler diagHandler_;
};

} // namespace spa

#endif // SPA_NETWORK_CONFIG_H
