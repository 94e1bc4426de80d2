//===-- resolver_legacy.cpp - Underscore name fallback test -----*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//
//
// "module_port" resolves like "module.port" and emits one deprecation
// diagnostic. The split is on the last underscore.
//
//===----------------------------------------------------------------------===//

#include "TestModules.h"
#include "TestUtil.h"

using namespace spa;
using namespace spa::test;

int main() {
  DiagnosticCollector diags;
  Module model("model");
  model.getConfig().setDiagnosticHandler(diags.handler());

  auto m = model.addModule<Buffer>("M", 16);
  auto gate = model.addModule<Gate>("gate", std::vector<std::string>{"a", "b"},
                                    8u);
  TEST_ASSERT(m && gate);

  // Bare name: no diagnostic.
  auto bare = model.getModuleOutput("M");
  TEST_ASSERT(bare);
  TEST_ASSERT(diags.getDiagnostics().empty());

  // Legacy name: same port, one diagnostic.
  auto legacy = model.getModuleOutput("M_default");
  TEST_ASSERT(legacy);
  TEST_ASSERT(&*legacy == &*bare);
  TEST_ASSERT(diags.getDiagnostics().size() == 1);
  const Diagnostic &diag = diags.getDiagnostics().front();
  TEST_ASSERT(diag.severity == DiagnosticSeverity::Warning);
  TEST_ASSERT(diag.code == ErrorCode::DEPRECATED_UNDERSCORE_NAME);
  TEST_ASSERT(diag.location == "M_default");
  TEST_ASSERT(diag.message.find("M.default") != std::string::npos);

  auto gateA = model.getModuleInput("gate_a");
  TEST_ASSERT(gateA);
  TEST_ASSERT(&*gateA == &gate->getInputs().find("a")->second);
  TEST_ASSERT(diags.count(ErrorCode::DEPRECATED_UNDERSCORE_NAME) == 2);

  // Failed legacy lookups emit nothing.
  diags.clear();
  TEST_ASSERT(errorIsKind(model.getModuleInput("gate_c").takeError(),
                          ErrorKind::PortNotFound));
  TEST_ASSERT(errorIsKind(model.getModuleInput("nomodule_a").takeError(),
                          ErrorKind::PortNotFound));
  TEST_ASSERT(diags.getDiagnostics().empty());

  // Last underscore wins: "my_mod_x" is module "my_mod", port "x".
  {
    Module top("top");
    top.getConfig().setDiagnosticHandler(diags.handler());
    auto myMod = top.addModule<Gate>("my_mod", std::vector<std::string>{"x"},
                                     4u);
    auto my = top.addModule<Gate>("my", std::vector<std::string>{"mod_y"}, 4u);
    TEST_ASSERT(myMod && my);

    auto x = top.getModuleInput("my_mod_x");
    TEST_ASSERT(x);
    TEST_ASSERT(&*x == &myMod->getInputs().find("x")->second);

    // Module "my", port "mod_y" is not reachable in legacy form.
    CaughtError info = inspectError(top.getModuleInput("my_mod_y").takeError());
    TEST_ASSERT(info.kind == ErrorKind::PortNotFound);
    TEST_ASSERT(info.location == "my_mod_y");
    TEST_ASSERT(top.getModuleInput("my.mod_y"));
  }

  // Legacy names also work below a dotted prefix; the warning goes to the
  // nearest handler up the tree.
  {
    diags.clear();
    auto state = model.addModule<Composite>("state", 16);
    TEST_ASSERT(state);
    auto nested = model.getModuleInput("state.memory_default");
    TEST_ASSERT(nested);
    TEST_ASSERT(&*nested ==
                &state->memory.getInputs().find(DEFAULT_PORT)->second);
    TEST_ASSERT(diags.getDiagnostics().size() == 1);
    TEST_ASSERT(diags.getDiagnostics().front().location ==
                "state.memory_default");
  }

  return 0;
}
