//===-- Port.h - Module ports and vocabulary bindings -----------*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//
//
// A port pairs the network object that carries a signal with the vocabulary
// the signal is expressed in. Modules may declare a port with only a
// dimensionality; registration later upgrades it to a shared Vocabulary.
//
//===----------------------------------------------------------------------===//

#ifndef SPA_MODULE_PORT_H
#define SPA_MODULE_PORT_H

#include "spa/Module/Vocabulary.h"

#include "llvm/ADT/MapVector.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace spa {

class Node;

//===----------------------------------------------------------------------===//
// VocabBinding
//===----------------------------------------------------------------------===//

/// Either a raw dimensionality or a resolved Vocabulary handle. A resolved
/// binding never reverts to raw form.
class VocabBinding {
public:
  enum Kind { Raw, Resolved };

  VocabBinding() = default;

  static VocabBinding raw(int64_t dimensions) {
    return VocabBinding(dimensions, nullptr);
  }
  static VocabBinding resolved(std::shared_ptr<Vocabulary> vocab);

  Kind getKind() const { return vocab_ ? Resolved : Raw; }
  bool isRaw() const { return !vocab_; }
  bool isResolved() const { return vocab_ != nullptr; }

  /// Declared dimensionality for raw bindings, the vocabulary's for resolved.
  int64_t getDimensions() const;

  /// Null for raw bindings.
  Vocabulary *getVocab() const { return vocab_.get(); }
  const std::shared_ptr<Vocabulary> &getVocabRef() const { return vocab_; }

  /// Upgrade a raw binding through \p vocabs. No-op when already resolved.
  llvm::Error resolve(VocabularyMap &vocabs);

  bool operator==(const VocabBinding &other) const;
  bool operator!=(const VocabBinding &other) const {
    return !(*this == other);
  }

private:
  VocabBinding(int64_t dimensions, std::shared_ptr<Vocabulary> vocab)
      : dimensions_(dimensions), vocab_(std::move(vocab)) {}

  int64_t dimensions_ = 0;
  std::shared_ptr<Vocabulary> vocab_;
};

//===----------------------------------------------------------------------===//
// Port
//===----------------------------------------------------------------------===//

struct Port {
  Node *object = nullptr;
  VocabBinding vocab;

  bool operator==(const Port &other) const {
    return object == other.object && vocab == other.vocab;
  }
  bool operator!=(const Port &other) const { return !(*this == other); }
};

enum class PortDirection { Input, Output };

/// Port name -> port, iterated in declaration order.
using PortMap =
    llvm::MapVector<std::string, Port, std::map<std::string, unsigned>>;

/// Name of the port a module is addressed through by its bare name.
inline constexpr const char *DEFAULT_PORT = "default";

} // namespace spa

#endif // SPA_MODULE_PORT_H
