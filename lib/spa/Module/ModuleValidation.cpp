//===-- ModuleValidation.cpp - Structural checks on scope exit --*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#include "spa/Module/Module.h"
#include "spa/Common/SpaError.h"

#include "llvm/ADT/SmallPtrSet.h"
#include "llvm/Support/Casting.h"
#include "llvm/Support/Debug.h"

#define DEBUG_TYPE "spa-module"

namespace spa {

llvm::Error Module::validateRegistration() const {
  llvm::SmallPtrSet<const Module *, 16> registered;
  for (const auto &entry : modules_)
    registered.insert(entry.second);

  for (const auto &net : getNetworks()) {
    const auto *module = llvm::dyn_cast<Module>(net.get());
    if (!module || registered.count(module))
      continue;
    return makeError(ErrorKind::StructuralIntegrity,
                     ErrorCode::MODULE_UNREGISTERED,
                     module->describe() +
                         " must be registered as a submodule of " + describe() +
                         " before its construction scope closes",
                     describe());
  }
  return llvm::Error::success();
}

llvm::Error Module::onExit(llvm::Error inFlight) {
  // A failing body already explains what went wrong.
  if (inFlight)
    return inFlight;
  LLVM_DEBUG(llvm::dbgs() << "[spa.module] validate " << describe() << " ("
                          << modules_.size() << " submodules)\n");
  return validateRegistration();
}

} // namespace spa
