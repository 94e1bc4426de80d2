//===-- Network.cpp - Base composable network -------------------*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#include "spa/Network/Network.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallPtrSet.h"
#include "llvm/Support/Debug.h"

#include <cassert>

#define DEBUG_TYPE "spa-network"

namespace spa {

//===----------------------------------------------------------------------===//
// Construction context
//===----------------------------------------------------------------------===//

static std::vector<Network *> &contextStack() {
  thread_local std::vector<Network *> stack;
  return stack;
}

Network::ContextGuard::ContextGuard(Network *net) : net_(net) {
  contextStack().push_back(net);
}

Network::ContextGuard::~ContextGuard() {
  auto &stack = contextStack();
  assert(!stack.empty() && stack.back() == net_ &&
         "construction context popped out of order");
  stack.pop_back();
}

llvm::ArrayRef<Network *> Network::getContext() { return contextStack(); }

bool Network::isInScope() const {
  return llvm::is_contained(getContext(), this);
}

//===----------------------------------------------------------------------===//
// Network
//===----------------------------------------------------------------------===//

Network::Network(llvm::StringRef label, std::optional<uint64_t> seed)
    : Network(NK_Network, label, seed) {}

Network::Network(NetworkKind kind, llvm::StringRef label,
                 std::optional<uint64_t> seed)
    : kind_(kind), label_(label.str()), seed_(seed) {}

Network::~Network() = default;

Node &Network::addNode(llvm::StringRef label, unsigned dimensions) {
  nodes_.push_back(std::make_unique<Node>(label, dimensions));
  return *nodes_.back();
}

Probe &Network::addProbe(Node &target, llvm::StringRef label) {
  probes_.push_back(std::make_unique<Probe>(target, label));
  return *probes_.back();
}

Network &Network::adopt(std::unique_ptr<Network> net) {
  assert(net && "cannot nest a null network");
  assert(!net->parent_ && "network is already nested");
  assert(net.get() != this && "network cannot nest itself");
  net->parent_ = this;
  LLVM_DEBUG(llvm::dbgs() << "[spa.network] nest " << net->describe()
                          << " in " << describe() << "\n");
  networks_.push_back(std::move(net));
  return *networks_.back();
}

llvm::Error Network::build(llvm::function_ref<llvm::Error()> body) {
  enterScope();
  llvm::Error err = body();
  return exitScope(std::move(err));
}

void Network::enterScope() {
  contextStack().push_back(this);
  onEnter();
}

llvm::Error Network::exitScope(llvm::Error inFlight) {
  auto &stack = contextStack();
  assert(!stack.empty() && stack.back() == this &&
         "exitScope without matching enterScope");
  stack.pop_back();
  return onExit(std::move(inFlight));
}

std::vector<const Config *>
Network::getAmbientConfigs(bool includeSelf) const {
  std::vector<const Config *> configs;
  llvm::SmallPtrSet<const Network *, 8> seen;
  seen.insert(this);
  if (includeSelf)
    configs.push_back(&config_);

  for (const Network *p = parent_; p; p = p->parent_) {
    seen.insert(p);
    configs.push_back(&p->config_);
  }

  auto stack = getContext();
  for (auto it = stack.rbegin(); it != stack.rend(); ++it)
    if (seen.insert(*it).second)
      configs.push_back(&(*it)->config_);
  return configs;
}

std::string Network::describe() const {
  std::string s = "<" + getTypeName().str();
  if (hasLabel())
    s += " \"" + label_ + "\"";
  s += ">";
  return s;
}

} // namespace spa
