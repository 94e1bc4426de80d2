//===-- Module.cpp - SPA module registration and parameters -----*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#include "spa/Module/Module.h"
#include "spa/Common/SpaError.h"

#include "llvm/Support/Debug.h"

#include <cassert>

#define DEBUG_TYPE "spa-module"

namespace spa {

//===----------------------------------------------------------------------===//
// Construction
//===----------------------------------------------------------------------===//

/// VocabularyMap published by the closest enclosing network, if any.
static std::shared_ptr<VocabularyMap>
findAmbientVocabs(const Network &net) {
  for (const Config *config : net.getAmbientConfigs(/*includeSelf=*/false))
    if (config->getVocabs())
      return config->getVocabs();
  return nullptr;
}

Module::Module(llvm::StringRef label, std::optional<uint64_t> seed,
               std::shared_ptr<VocabularyMap> vocabs)
    : Network(NK_Module, label, seed) {
  if (!vocabs)
    vocabs = findAmbientVocabs(*this);
  if (!vocabs)
    vocabs = seed ? std::make_shared<VocabularyMap>(*seed)
                  : std::make_shared<VocabularyMap>();
  vocabs_ = std::move(vocabs);
  // Modules built inside this one share its vocabularies by default.
  getConfig().setVocabs(vocabs_);
}

Module::~Module() = default;

//===----------------------------------------------------------------------===//
// Registration
//===----------------------------------------------------------------------===//

llvm::Error Module::checkNameFree(llvm::StringRef name) const {
  auto it = modules_.find(name.str());
  if (it == modules_.end())
    return llvm::Error::success();
  return makeError(ErrorKind::Reassignment, ErrorCode::MODULE_REASSIGNED,
                   "cannot re-assign module-attribute '" + name + "' of " +
                       describe() + " (bound to " + it->second->describe() +
                       "); module-attributes can only be assigned once",
                   name);
}

llvm::Error Module::resolvePortBindings(Module &value) {
  for (auto &entry : value.inputs_)
    if (llvm::Error err = entry.second.vocab.resolve(*vocabs_))
      return err;
  for (auto &entry : value.outputs_)
    if (llvm::Error err = entry.second.vocab.resolve(*vocabs_))
      return err;
  return llvm::Error::success();
}

llvm::Error Module::registerSubmodule(llvm::StringRef name, Module &value) {
  if (llvm::Error err = checkNameFree(name))
    return err;
  if (!isDirectlyNested(value))
    return makeError(ErrorKind::StructuralIntegrity,
                     ErrorCode::MODULE_NOT_NESTED,
                     value.describe() + " is not nested in " + describe() +
                         " and cannot be registered as '" + name + "'",
                     name);

  if (!value.hasLabel())
    value.setLabel(name);
  modules_.insert(std::make_pair(name.str(), &value));
  LLVM_DEBUG(llvm::dbgs() << "[spa.module] register '" << name << "' -> "
                          << value.describe() << " in " << describe()
                          << "\n");

  // Ports are upgraded through the parent's map so that siblings declaring
  // the same dimensionality share one vocabulary.
  if (llvm::Error err = resolvePortBindings(value))
    return err;

  return value.onAdd(*this);
}

llvm::Error Module::registerSubmodule(llvm::StringRef name,
                                      std::unique_ptr<Module> value) {
  assert(value && "cannot register a null module");
  if (llvm::Error err = checkNameFree(name))
    return err;
  Module &ref = *value;
  adopt(std::move(value));
  return registerSubmodule(name, ref);
}

//===----------------------------------------------------------------------===//
// Ports
//===----------------------------------------------------------------------===//

void Module::addInput(llvm::StringRef name, Node &object, VocabBinding vocab) {
  inputs_[name.str()] = Port{&object, std::move(vocab)};
}

void Module::addOutput(llvm::StringRef name, Node &object,
                       VocabBinding vocab) {
  outputs_[name.str()] = Port{&object, std::move(vocab)};
}

llvm::Expected<VocabBinding> Module::getInputVocab(llvm::StringRef path) {
  auto port = getModuleInput(path);
  if (!port)
    return port.takeError();
  return port->vocab;
}

llvm::Expected<VocabBinding> Module::getOutputVocab(llvm::StringRef path) {
  auto port = getModuleOutput(path);
  if (!port)
    return port.takeError();
  return port->vocab;
}

//===----------------------------------------------------------------------===//
// Parameters
//===----------------------------------------------------------------------===//

ParamValue Module::resolveDefault(const ParamSpec &spec) const {
  for (const Config *config : getAmbientConfigs(/*includeSelf=*/isInScope())) {
    if (auto value = config->getDefault(getTypeName(), spec.name))
      return *value;
    if (auto value = config->getDefault("Module", spec.name))
      return *value;
  }
  return spec.defaultValue;
}

llvm::Error Module::setParam(llvm::StringRef name, ParamValue value) {
  const ParamSpec *spec = findModuleParamSpec(name);
  if (!spec)
    return makeError(ErrorKind::Validation, ErrorCode::PARAM_UNKNOWN,
                     describe() + " has no parameter '" + name + "'", name);

  if (value.isDefault())
    value = resolveDefault(*spec);

  auto checked = spec->validate(getTypeName(), value);
  if (!checked) {
    llvm::Error err = checked.takeError();
    if (getErrorReporting() == ErrorReporting::Simplified)
      return stripErrorCauses(std::move(err));
    return err;
  }
  params_[name] = *checked;
  return llvm::Error::success();
}

llvm::Expected<ParamValue> Module::getParam(llvm::StringRef name) const {
  const ParamSpec *spec = findModuleParamSpec(name);
  if (!spec)
    return makeError(ErrorKind::Validation, ErrorCode::PARAM_UNKNOWN,
                     describe() + " has no parameter '" + name + "'", name);
  auto it = params_.find(name);
  if (it != params_.end())
    return it->second;
  return spec->defaultValue;
}

static ParamValue getKnownParam(const Module &module, const char *name) {
  return llvm::cantFail(module.getParam(name), "built-in parameter missing");
}

int64_t Module::getDimPerEnsemble() const {
  return getKnownParam(*this, ModuleParam::DIM_PER_ENSEMBLE).getInteger();
}

int64_t Module::getProductNeurons() const {
  return getKnownParam(*this, ModuleParam::PRODUCT_NEURONS).getInteger();
}

int64_t Module::getCconvNeurons() const {
  return getKnownParam(*this, ModuleParam::CCONV_NEURONS).getInteger();
}

double Module::getSynapse() const {
  return getKnownParam(*this, ModuleParam::SYNAPSE).getReal();
}

//===----------------------------------------------------------------------===//
// Similarity
//===----------------------------------------------------------------------===//

llvm::Expected<Matrix> Module::similarity(const ProbeData &data,
                                          const Probe &probe,
                                          const Vocabulary *vocab) const {
  const Matrix *probed = data.lookup(probe);
  if (!probed)
    return makeError(ErrorKind::ProbeDataMissing,
                     ErrorCode::PROBE_DATA_MISSING,
                     "no data recorded for probe on '" +
                         probe.getTarget().getLabel() + "'",
                     describe());

  std::shared_ptr<Vocabulary> inferred;
  if (!vocab) {
    inferred = vocabs_->lookup(static_cast<int64_t>(probed->getCols()));
    if (!inferred)
      return makeError(ErrorKind::VocabularyNotFound,
                       ErrorCode::VOCAB_NOT_FOUND,
                       "no vocabulary with " +
                           llvm::Twine(probed->getCols()) + " dimensions in " +
                           describe(),
                       describe());
    vocab = inferred.get();
  }

  if (vocab->getDimensions() != probed->getCols())
    return makeError(ErrorKind::InvalidDimension,
                     ErrorCode::VOCAB_DIMENSION,
                     "probed data has " + llvm::Twine(probed->getCols()) +
                         " dimensions, vocabulary has " +
                         llvm::Twine(vocab->getDimensions()),
                     describe());
  return spa::similarity(*probed, *vocab);
}

//===----------------------------------------------------------------------===//
// Ambient settings
//===----------------------------------------------------------------------===//

ErrorReporting Module::getErrorReporting() const {
  for (const Config *config : getAmbientConfigs(/*includeSelf=*/true))
    if (auto policy = config->getErrorReporting())
      return *policy;
  return ErrorReporting::Simplified;
}

void Module::emitDiagnostic(const Diagnostic &diag) const {
  for (const Config *config : getAmbientConfigs(/*includeSelf=*/true)) {
    if (config->getDiagnosticHandler()) {
      config->getDiagnosticHandler()(diag);
      return;
    }
  }
  defaultDiagnosticHandler(diag);
}

} // namespace spa
