//===-- Network.h - Base composable network ---------------------*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//
//
// A Network owns the objects, probes and nested networks created inside it.
// Nesting is structural and independent of naming: a nested network is
// listed by getNetworks() whether or not anything ever refers to it by name.
//
// Construction scopes are explicit. Network::build() runs a body between
// enterScope() and exitScope(); the error the body returns (if any) is handed
// to the onExit() hook, which subclasses override to check the finished
// structure.
//
//===----------------------------------------------------------------------===//

#ifndef SPA_NETWORK_NETWORK_H
#define SPA_NETWORK_NETWORK_H

#include "spa/Network/Config.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spa {

//===----------------------------------------------------------------------===//
// Node / Probe
//===----------------------------------------------------------------------===//

/// A signal-carrying object inside a network. Ports refer to Nodes.
class Node {
public:
  Node(llvm::StringRef label, unsigned dimensions)
      : label_(label.str()), dimensions_(dimensions) {}

  llvm::StringRef getLabel() const { return label_; }
  unsigned getDimensions() const { return dimensions_; }

private:
  std::string label_;
  unsigned dimensions_;
};

/// Records the signal of a Node during simulation.
class Probe {
public:
  Probe(Node &target, llvm::StringRef label)
      : target_(&target), label_(label.str()) {}

  Node &getTarget() const { return *target_; }
  llvm::StringRef getLabel() const { return label_; }

private:
  Node *target_;
  std::string label_;
};

//===----------------------------------------------------------------------===//
// Network
//===----------------------------------------------------------------------===//

class Network {
public:
  /// LLVM-style RTTI discriminator.
  enum NetworkKind { NK_Network, NK_Module };

  explicit Network(llvm::StringRef label = "",
                   std::optional<uint64_t> seed = std::nullopt);
  virtual ~Network();

  Network(const Network &) = delete;
  Network &operator=(const Network &) = delete;

  NetworkKind getKind() const { return kind_; }

  /// Name of the concrete type, used for per-type configuration.
  virtual llvm::StringRef getTypeName() const { return "Network"; }

  llvm::StringRef getLabel() const { return label_; }
  bool hasLabel() const { return !label_.empty(); }
  void setLabel(llvm::StringRef label) { label_ = label.str(); }

  std::optional<uint64_t> getSeed() const { return seed_; }

  /// The network this one is nested in, or nullptr for a root.
  Network *getParent() const { return parent_; }

  Config &getConfig() { return config_; }
  const Config &getConfig() const { return config_; }

  // --- Objects ---

  Node &addNode(llvm::StringRef label, unsigned dimensions);
  Probe &addProbe(Node &target, llvm::StringRef label = "");

  const std::vector<std::unique_ptr<Node>> &getNodes() const { return nodes_; }
  const std::vector<std::unique_ptr<Probe>> &getProbes() const {
    return probes_;
  }

  // --- Nested networks ---

  /// Construct a network of type T nested in this one. This network is part
  /// of the construction context while T's constructor runs, so T sees this
  /// network's configuration.
  template <typename T, typename... Args> T &create(Args &&...args) {
    ContextGuard guard(this);
    auto net = std::make_unique<T>(std::forward<Args>(args)...);
    T &ref = *net;
    adopt(std::move(net));
    return ref;
  }

  /// Take ownership of a root network, nesting it in this one.
  Network &adopt(std::unique_ptr<Network> net);

  /// Directly nested networks, in nesting order.
  const std::vector<std::unique_ptr<Network>> &getNetworks() const {
    return networks_;
  }

  /// True if \p net is directly nested in this network.
  bool isDirectlyNested(const Network &net) const {
    return net.parent_ == this;
  }

  // --- Construction scope ---

  /// Run \p body inside this network's construction scope. If \p body fails,
  /// its error is returned as is; otherwise onExit() decides.
  llvm::Error build(llvm::function_ref<llvm::Error()> body);

  void enterScope();
  llvm::Error exitScope(llvm::Error inFlight);

  /// Networks currently inside build() or create(), outermost first.
  static llvm::ArrayRef<Network *> getContext();

  /// True while this network is on the construction context.
  bool isInScope() const;

  /// Configs that apply to this network, innermost first: its own (if
  /// \p includeSelf), then its ancestors', then, above a root, the
  /// construction context.
  std::vector<const Config *> getAmbientConfigs(bool includeSelf) const;

  /// Short printable identity, e.g. `<Module "vision">`.
  std::string describe() const;

protected:
  Network(NetworkKind kind, llvm::StringRef label,
          std::optional<uint64_t> seed);

  virtual void onEnter() {}

  /// Called when a construction scope closes. \p inFlight is the error the
  /// scope body returned, or success.
  virtual llvm::Error onExit(llvm::Error inFlight) { return inFlight; }

  /// Pushes a network on the construction context for its lifetime.
  class ContextGuard {
  public:
    explicit ContextGuard(Network *net);
    ~ContextGuard();

    ContextGuard(const ContextGuard &) = delete;
    ContextGuard &operator=(const ContextGuard &) = delete;

  private:
    Network *net_;
  };

private:
  NetworkKind kind_;
  std::string label_;
  std::optional<uint64_t> seed_;
  Network *parent_ = nullptr;
  Config config_;
  std::vector<std::unique_ptr<Node>> nodes_;
  std::vector<std::unique_ptr<Probe>> probes_;
  std::vector<std::unique_ptr<Network>> networks_;
};

} // namespace spa

#endif // SPA_NETWORK_NETWORK_H
