//===-- ModuleResolve.cpp - Hierarchical module and port lookup -*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//
//
// Dotted paths are walked iteratively, one head segment per submodule. Only
// the leaf of a path needs the fallbacks: a bare submodule name means its
// "default" port, and "module_port" is the deprecated spelling of
// "module.port".
//
//===----------------------------------------------------------------------===//

#include "spa/Module/Module.h"
#include "spa/Common/SpaError.h"
#include "spa/Module/PathResolver.h"

#include "llvm/Support/Debug.h"

#define DEBUG_TYPE "spa-module"

namespace spa {

//===----------------------------------------------------------------------===//
// Error helpers
//===----------------------------------------------------------------------===//

static const char *directionName(PortDirection dir) {
  return dir == PortDirection::Input ? "input" : "output";
}

static llvm::Error moduleNotFound(llvm::StringRef requested,
                                  llvm::StringRef segment,
                                  const Module &scope) {
  return makeError(ErrorKind::ModuleNotFound, ErrorCode::MODULE_NOT_FOUND,
                   "could not find module '" + requested + "' (no '" +
                       segment + "' in " + scope.describe() + ")",
                   requested);
}

static llvm::Error portNotFound(PortDirection dir, llvm::StringRef requested,
                                llvm::StringRef segment, const Module &scope) {
  const char *code = dir == PortDirection::Input ? ErrorCode::INPUT_NOT_FOUND
                                                 : ErrorCode::OUTPUT_NOT_FOUND;
  return makeError(ErrorKind::PortNotFound, code,
                   llvm::Twine("could not find module ") + directionName(dir) +
                       " '" + requested + "' (no '" + segment + "' in " +
                       scope.describe() + ")",
                   requested);
}

//===----------------------------------------------------------------------===//
// Module lookup
//===----------------------------------------------------------------------===//

llvm::Expected<Module &> Module::getModule(llvm::StringRef path,
                                           bool stripOutput) {
  Module *current = this;
  DottedPath segment(path);
  while (segment.hasRemainder()) {
    auto it = current->modules_.find(segment.head().str());
    if (it == current->modules_.end())
      return moduleNotFound(path, segment.head(), *current);
    current = it->second;
    segment = segment.next();
  }

  std::string leaf = segment.head().str();
  auto it = current->modules_.find(leaf);
  if (it != current->modules_.end())
    return *it->second;
  // A module may be addressed through one of its own port names.
  if (stripOutput &&
      (current->inputs_.count(leaf) || current->outputs_.count(leaf)))
    return *current;
  return moduleNotFound(path, leaf, *current);
}

//===----------------------------------------------------------------------===//
// Port lookup
//===----------------------------------------------------------------------===//

llvm::Expected<const Port &> Module::getModuleInput(llvm::StringRef path) {
  return resolvePort(PortDirection::Input, path);
}

llvm::Expected<const Port &> Module::getModuleOutput(llvm::StringRef path) {
  return resolvePort(PortDirection::Output, path);
}

llvm::Expected<const Port &> Module::resolvePort(PortDirection dir,
                                                 llvm::StringRef path) {
  Module *current = this;
  DottedPath segment(path);
  while (segment.hasRemainder()) {
    auto it = current->modules_.find(segment.head().str());
    if (it == current->modules_.end())
      return portNotFound(dir, path, segment.head(), *current);
    current = it->second;
    segment = segment.next();
  }
  return current->resolveLeafPort(dir, segment.head(), path);
}

llvm::Expected<const Port &>
Module::resolveLeafPort(PortDirection dir, llvm::StringRef name,
                        llvm::StringRef requested) {
  const PortMap &ports = dir == PortDirection::Input ? inputs_ : outputs_;
  auto portIt = ports.find(name.str());
  if (portIt != ports.end())
    return portIt->second;

  auto moduleIt = modules_.find(name.str());
  if (moduleIt != modules_.end())
    return moduleIt->second->resolveLeafPort(dir, DEFAULT_PORT, requested);

  if (auto legacy = splitLegacyPortName(name)) {
    auto legacyIt = modules_.find(legacy->module.str());
    if (legacyIt != modules_.end()) {
      auto port = legacyIt->second->resolveLeafPort(dir, legacy->port,
                                                    requested);
      if (!port)
        return port.takeError();
      LLVM_DEBUG(llvm::dbgs() << "[spa.module] legacy " << directionName(dir)
                              << " '" << name << "' in " << describe()
                              << "\n");
      Diagnostic diag;
      diag.code = ErrorCode::DEPRECATED_UNDERSCORE_NAME;
      diag.message = ("underscore notation for inputs and outputs is "
                      "deprecated; use dot notation '" +
                      legacy->module + "." + legacy->port + "' instead")
                         .str();
      diag.location = requested.str();
      emitDiagnostic(diag);
      return *port;
    }
  }

  return portNotFound(dir, requested, name, *this);
}

//===----------------------------------------------------------------------===//
// PortNameRange
//===----------------------------------------------------------------------===//

PortNameRange::iterator::iterator(ModuleIter module, ModuleIter moduleEnd,
                                  PortDirection dir)
    : module_(module), moduleEnd_(moduleEnd), dir_(dir) {
  enterModule();
}

const PortMap &PortNameRange::iterator::ports() const {
  const Module *module = module_->second;
  return dir_ == PortDirection::Input ? module->getInputs()
                                      : module->getOutputs();
}

void PortNameRange::iterator::enterModule() {
  for (; module_ != moduleEnd_; ++module_) {
    port_ = ports().begin();
    if (port_ != ports().end())
      return;
  }
}

void PortNameRange::iterator::advance() {
  if (port_ != ports().end())
    return;
  ++module_;
  enterModule();
}

PortNameRange::iterator::reference
PortNameRange::iterator::operator*() const {
  return joinLegacyPortName(module_->first, port_->first);
}

} // namespace spa
