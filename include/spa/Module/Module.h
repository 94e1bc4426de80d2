//===-- Module.h - SPA module composition API -------------------*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//
//
// A Module is a Network that exposes named input and output ports, each bound
// to a Vocabulary (or to a dimensionality that registration turns into one),
// and that keeps a registry of named submodules.
//
// Building a composition:
//
//   Module model("model");
//   llvm::Error err = model.build([&]() -> llvm::Error {
//     auto vision = model.addModule<Buffer>("vision", 64);
//     if (!vision)
//       return vision.takeError();
//     ...
//     return llvm::Error::success();
//   });
//
// Names are bound once. Every module nested in a Module must be registered
// under a name by the time the Module's build scope closes.
//
//===----------------------------------------------------------------------===//

#ifndef SPA_MODULE_MODULE_H
#define SPA_MODULE_MODULE_H

#include "spa/Common/Diagnostics.h"
#include "spa/Module/Param.h"
#include "spa/Module/Port.h"
#include "spa/Module/Similarity.h"
#include "spa/Module/Vocabulary.h"
#include "spa/Network/Network.h"

#include "llvm/ADT/MapVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace spa {

class Module;

/// Submodule name -> module, iterated in registration order.
using ModuleMap =
    llvm::MapVector<std::string, Module *, std::map<std::string, unsigned>>;

//===----------------------------------------------------------------------===//
// PortNameRange - lazy legacy-name listing of submodule ports
//===----------------------------------------------------------------------===//

/// Yields, for every registered submodule in registration order and every
/// port of that submodule in declaration order, the submodule name for a
/// "default" port and "submodule_port" otherwise. Each begin() restarts.
class PortNameRange {
public:
  class iterator {
  public:
    using difference_type = std::ptrdiff_t;
    using value_type = std::string;
    using pointer = const std::string *;
    using reference = std::string;
    using iterator_category = std::forward_iterator_tag;

    iterator() = default;

    reference operator*() const;

    iterator &operator++() {
      ++port_;
      advance();
      return *this;
    }

    iterator operator++(int) {
      auto tmp = *this;
      ++(*this);
      return tmp;
    }

    bool operator==(const iterator &other) const {
      return module_ == other.module_ &&
             (module_ == moduleEnd_ || port_ == other.port_);
    }
    bool operator!=(const iterator &other) const { return !(*this == other); }

  private:
    friend class PortNameRange;
    using ModuleIter = ModuleMap::const_iterator;
    using PortIter = PortMap::const_iterator;

    iterator(ModuleIter module, ModuleIter moduleEnd, PortDirection dir);

    const PortMap &ports() const;
    void enterModule();
    void advance();

    ModuleIter module_;
    ModuleIter moduleEnd_;
    PortIter port_;
    PortDirection dir_ = PortDirection::Input;
  };

  PortNameRange(const ModuleMap &modules, PortDirection dir)
      : modules_(&modules), dir_(dir) {}

  iterator begin() const {
    return iterator(modules_->begin(), modules_->end(), dir_);
  }
  iterator end() const {
    return iterator(modules_->end(), modules_->end(), dir_);
  }

private:
  const ModuleMap *modules_;
  PortDirection dir_;
};

//===----------------------------------------------------------------------===//
// Module
//===----------------------------------------------------------------------===//

class Module : public Network {
public:
  /// Without \p vocabs the module uses the VocabularyMap configured by the
  /// enclosing networks, or a new map (seeded with \p seed if given).
  explicit Module(llvm::StringRef label = "",
                  std::optional<uint64_t> seed = std::nullopt,
                  std::shared_ptr<VocabularyMap> vocabs = nullptr);
  ~Module() override;

  static bool classof(const Network *net) {
    return net->getKind() == NK_Module;
  }

  llvm::StringRef getTypeName() const override { return "Module"; }

  // --- Registration ---

  /// Bind \p value, which must be nested in this module, to \p name.
  /// Sets an empty label to \p name, resolves raw port bindings through this
  /// module's VocabularyMap and then calls value.onAdd(*this).
  llvm::Error registerSubmodule(llvm::StringRef name, Module &value);

  /// Nest the root module \p value in this module, then register it.
  llvm::Error registerSubmodule(llvm::StringRef name,
                                std::unique_ptr<Module> value);

  /// Construct a T nested in this module and register it as \p name.
  template <typename T, typename... Args>
  llvm::Expected<T &> addModule(llvm::StringRef name, Args &&...args) {
    if (llvm::Error err = checkNameFree(name))
      return std::move(err);
    T &module = create<T>(std::forward<Args>(args)...);
    if (llvm::Error err = registerSubmodule(name, module))
      return std::move(err);
    return module;
  }

  bool hasSubmodule(llvm::StringRef name) const {
    return modules_.count(name.str()) != 0;
  }
  const ModuleMap &getSubmodules() const { return modules_; }

  // --- Ports ---

  /// Declare (or redeclare) a port. A raw binding is resolved when this
  /// module is registered in a parent.
  void addInput(llvm::StringRef name, Node &object, VocabBinding vocab);
  void addOutput(llvm::StringRef name, Node &object, VocabBinding vocab);

  const PortMap &getInputs() const { return inputs_; }
  const PortMap &getOutputs() const { return outputs_; }

  // --- Name resolution ---

  /// Resolve a dotted path to a submodule. With \p stripOutput, a leaf that
  /// names one of the current module's own ports resolves to that module.
  llvm::Expected<Module &> getModule(llvm::StringRef path,
                                     bool stripOutput = false);

  /// Resolve a dotted path ("a.b.port"), a bare submodule name (its
  /// "default" port) or a deprecated underscore name ("a_port") to a port.
  llvm::Expected<const Port &> getModuleInput(llvm::StringRef path);
  llvm::Expected<const Port &> getModuleOutput(llvm::StringRef path);

  /// Legacy names of every submodule port. Never yields dotted names.
  PortNameRange getModuleInputs() const {
    return PortNameRange(modules_, PortDirection::Input);
  }
  PortNameRange getModuleOutputs() const {
    return PortNameRange(modules_, PortDirection::Output);
  }

  llvm::Expected<VocabBinding> getInputVocab(llvm::StringRef path);
  llvm::Expected<VocabBinding> getOutputVocab(llvm::StringRef path);

  // --- Parameters ---

  /// Validated write of a module parameter. ParamValue::useDefault() takes
  /// the default configured for this module's type by the enclosing
  /// networks, and by this module itself while inside its own build().
  /// Errors follow the ambient ErrorReporting policy.
  llvm::Error setParam(llvm::StringRef name, ParamValue value);

  /// Current value: the written one, else the built-in default. Configured
  /// defaults only take effect through setParam(useDefault()).
  llvm::Expected<ParamValue> getParam(llvm::StringRef name) const;

  int64_t getDimPerEnsemble() const;
  int64_t getProductNeurons() const;
  int64_t getCconvNeurons() const;
  double getSynapse() const;

  // --- Vocabularies ---

  VocabularyMap &getVocabs() { return *vocabs_; }
  const VocabularyMap &getVocabs() const { return *vocabs_; }
  const std::shared_ptr<VocabularyMap> &getVocabsRef() const {
    return vocabs_;
  }

  /// Similarity of the data recorded by \p probe to \p vocab. Without a
  /// vocabulary, the one matching the data's width in this module's
  /// VocabularyMap is used.
  llvm::Expected<Matrix> similarity(const ProbeData &data, const Probe &probe,
                                    const Vocabulary *vocab = nullptr) const;

  // --- Ambient settings ---

  ErrorReporting getErrorReporting() const;
  void emitDiagnostic(const Diagnostic &diag) const;

protected:
  /// Called once this module is registered in \p parent, after its ports
  /// are resolved. Override to wire up things that need the parent (such as
  /// sibling modules).
  virtual llvm::Error onAdd(Module &parent) { return llvm::Error::success(); }

  /// Checks that every nested module was registered, unless \p inFlight
  /// holds an error, which is returned unchanged.
  llvm::Error onExit(llvm::Error inFlight) override;

private:
  llvm::Error checkNameFree(llvm::StringRef name) const;
  llvm::Error resolvePortBindings(Module &value);
  llvm::Error validateRegistration() const;

  llvm::Expected<const Port &> resolvePort(PortDirection dir,
                                           llvm::StringRef path);
  llvm::Expected<const Port &> resolveLeafPort(PortDirection dir,
                                               llvm::StringRef name,
                                               llvm::StringRef requested);
  ParamValue resolveDefault(const ParamSpec &spec) const;

  ModuleMap modules_;
  PortMap inputs_;
  PortMap outputs_;
  std::shared_ptr<VocabularyMap> vocabs_;
  llvm::StringMap<ParamValue> params_;
};

} // namespace spa

#endif // SPA_MODULE_MODULE_H
