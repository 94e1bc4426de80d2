//===-- module_params.cpp - Validated module parameter test -----*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//
//
// Built-in defaults, per-type defaults written through the Default sentinel,
// bound and kind checks, and the simplified/full reporting policy.
//
//===----------------------------------------------------------------------===//

#include "TestModules.h"
#include "TestUtil.h"

#include <cmath>

using namespace spa;
using namespace spa::test;

static bool near(double a, double b) { return std::fabs(a - b) < 1e-12; }

int main() {
  // Built-in defaults.
  {
    Module model("model");
    TEST_ASSERT(model.getDimPerEnsemble() == 16);
    TEST_ASSERT(model.getProductNeurons() == 100);
    TEST_ASSERT(model.getCconvNeurons() == 200);
    TEST_ASSERT(near(model.getSynapse(), 0.01));
    TEST_ASSERT(getModuleParamSpecs().size() == 4);
  }

  // Valid writes; integers widen to real.
  {
    Module model("model");
    TEST_ASSERT_SUCCESS(model.setParam(ModuleParam::DIM_PER_ENSEMBLE,
                                       ParamValue::integer(32)));
    TEST_ASSERT(model.getDimPerEnsemble() == 32);
    TEST_ASSERT_SUCCESS(
        model.setParam(ModuleParam::SYNAPSE, ParamValue::integer(1)));
    auto synapse = model.getParam(ModuleParam::SYNAPSE);
    TEST_ASSERT(synapse);
    TEST_ASSERT(synapse->getKind() == ParamValue::Real);
    TEST_ASSERT(near(synapse->getReal(), 1.0));
    TEST_ASSERT_SUCCESS(
        model.setParam(ModuleParam::SYNAPSE, ParamValue::real(0.0)));
  }

  // Defaults configured on an enclosing network, by type then for "Module".
  // They are written by the Default sentinel, never read implicitly.
  {
    Module model("model");
    model.getConfig().setDefault("Buffer", ModuleParam::PRODUCT_NEURONS,
                                 ParamValue::integer(50));
    model.getConfig().setDefault("Module", ModuleParam::PRODUCT_NEURONS,
                                 ParamValue::integer(70));
    model.getConfig().setDefault("Module", ModuleParam::CCONV_NEURONS,
                                 ParamValue::integer(300));

    auto buffer = model.addModule<Buffer>("buffer", 16);
    auto gate =
        model.addModule<Gate>("gate", std::vector<std::string>{"a"}, 16u);
    TEST_ASSERT(buffer && gate);
    TEST_ASSERT(buffer->getProductNeurons() == 100);
    TEST_ASSERT(buffer->getCconvNeurons() == 200);

    TEST_ASSERT_SUCCESS(buffer->setParam(ModuleParam::PRODUCT_NEURONS,
                                         ParamValue::useDefault()));
    TEST_ASSERT_SUCCESS(gate->setParam(ModuleParam::PRODUCT_NEURONS,
                                       ParamValue::useDefault()));
    TEST_ASSERT_SUCCESS(buffer->setParam(ModuleParam::CCONV_NEURONS,
                                         ParamValue::useDefault()));
    TEST_ASSERT(buffer->getProductNeurons() == 50);
    TEST_ASSERT(gate->getProductNeurons() == 70);
    TEST_ASSERT(buffer->getCconvNeurons() == 300);

    // An explicit value replaces it, and the sentinel restores it.
    TEST_ASSERT_SUCCESS(buffer->setParam(ModuleParam::PRODUCT_NEURONS,
                                         ParamValue::integer(10)));
    TEST_ASSERT(buffer->getProductNeurons() == 10);
    TEST_ASSERT_SUCCESS(buffer->setParam(ModuleParam::PRODUCT_NEURONS,
                                         ParamValue::useDefault()));
    TEST_ASSERT(buffer->getProductNeurons() == 50);

    // The innermost config wins.
    auto state = model.addModule<Composite>("state", 16);
    TEST_ASSERT(state);
    state->getConfig().setDefault("Buffer", ModuleParam::PRODUCT_NEURONS,
                                  ParamValue::integer(5));
    TEST_ASSERT(state->memory.getProductNeurons() == 100);
    TEST_ASSERT_SUCCESS(state->memory.setParam(ModuleParam::PRODUCT_NEURONS,
                                               ParamValue::useDefault()));
    TEST_ASSERT(state->memory.getProductNeurons() == 5);
  }

  // Reading an unwritten parameter ignores whatever network is being built.
  {
    Buffer lone(16);
    Module other("other");
    other.getConfig().setDefault("Buffer", ModuleParam::PRODUCT_NEURONS,
                                 ParamValue::integer(7));
    int64_t inside = 0;
    TEST_ASSERT_SUCCESS(other.build([&]() -> llvm::Error {
      inside = lone.getProductNeurons();
      return llvm::Error::success();
    }));
    TEST_ASSERT(inside == 100);
    TEST_ASSERT(lone.getProductNeurons() == 100);
  }

  // A module's own config supplies its defaults only inside its build().
  {
    Module model("model");
    model.getConfig().setDefault("Module", ModuleParam::PRODUCT_NEURONS,
                                 ParamValue::integer(70));
    TEST_ASSERT_SUCCESS(model.setParam(ModuleParam::PRODUCT_NEURONS,
                                       ParamValue::useDefault()));
    TEST_ASSERT(model.getProductNeurons() == 100);

    TEST_ASSERT_SUCCESS(model.build([&]() -> llvm::Error {
      return model.setParam(ModuleParam::PRODUCT_NEURONS,
                            ParamValue::useDefault());
    }));
    TEST_ASSERT(model.getProductNeurons() == 70);
  }

  // Simplified reporting (the default) drops the cause chain.
  {
    Module model("model");
    CaughtError info = inspectError(model.setParam(
        ModuleParam::DIM_PER_ENSEMBLE, ParamValue::integer(0)));
    TEST_ASSERT(info.kind == ErrorKind::Validation);
    TEST_ASSERT(info.code == ErrorCode::PARAM_LOW_BOUND);
    TEST_ASSERT(info.numCauses == 0);
    TEST_ASSERT(info.message.find("dim_per_ensemble") != std::string::npos);
    TEST_ASSERT(info.message.find("greater than or equal to 1") !=
                std::string::npos);
    // The failed write left the old value.
    TEST_ASSERT(model.getDimPerEnsemble() == 16);
  }

  // Full reporting, set on an enclosing network, keeps it.
  {
    Module model("model");
    model.getConfig().setErrorReporting(ErrorReporting::Full);
    auto buffer = model.addModule<Buffer>("buffer", 16);
    TEST_ASSERT(buffer);
    TEST_ASSERT(buffer->getErrorReporting() == ErrorReporting::Full);
    CaughtError info = inspectError(buffer->setParam(
        ModuleParam::SYNAPSE, ParamValue::real(-0.5)));
    TEST_ASSERT(info.code == ErrorCode::PARAM_LOW_BOUND);
    TEST_ASSERT(info.numCauses == 2);

    // A module's own setting overrides its parent's.
    buffer->getConfig().setErrorReporting(ErrorReporting::Simplified);
    CaughtError simplified = inspectError(buffer->setParam(
        ModuleParam::SYNAPSE, ParamValue::real(-0.5)));
    TEST_ASSERT(simplified.numCauses == 0);
  }

  // Kind mismatch and unknown names.
  {
    Module model("model");
    CaughtError kind = inspectError(model.setParam(
        ModuleParam::CCONV_NEURONS, ParamValue::real(1.5)));
    TEST_ASSERT(kind.kind == ErrorKind::Validation);
    TEST_ASSERT(kind.code == ErrorCode::PARAM_TYPE);

    CaughtError unknown =
        inspectError(model.setParam("neurons", ParamValue::integer(1)));
    TEST_ASSERT(unknown.kind == ErrorKind::Validation);
    TEST_ASSERT(unknown.code == ErrorCode::PARAM_UNKNOWN);
    TEST_ASSERT(errorIsKind(model.getParam("neurons").takeError(),
                            ErrorKind::Validation));
  }

  return 0;
}
