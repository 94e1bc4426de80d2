//===-- port_enumeration.cpp - Legacy port name listing test ----*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#include "TestModules.h"
#include "TestUtil.h"

#include <vector>

using namespace spa;
using namespace spa::test;

static std::vector<std::string> collect(const PortNameRange &range) {
  std::vector<std::string> names;
  for (const std::string &name : range)
    names.push_back(name);
  return names;
}

int main() {
  // Empty registry.
  {
    Module model("model");
    TEST_ASSERT(collect(model.getModuleInputs()).empty());
    TEST_ASSERT(model.getModuleInputs().begin() ==
                model.getModuleInputs().end());
  }

  DiagnosticCollector diags;
  Module parent("parent");
  parent.getConfig().setDiagnosticHandler(diags.handler());
  TEST_ASSERT(parent.addModule<Empty>("m0"));
  TEST_ASSERT(parent.addModule<Buffer>("m1", 16));
  TEST_ASSERT(
      parent.addModule<Gate>("m2", std::vector<std::string>{"a", "b"}, 16u));
  TEST_ASSERT(parent.addModule<Empty>("m3"));

  // Registration order, then declaration order; modules without ports are
  // skipped.
  std::vector<std::string> inputs = collect(parent.getModuleInputs());
  std::vector<std::string> expected = {"m1", "m2_a", "m2_b"};
  TEST_ASSERT(inputs == expected);

  // Restartable.
  PortNameRange range = parent.getModuleInputs();
  TEST_ASSERT(collect(range) == expected);
  TEST_ASSERT(collect(range) == expected);

  // Gate has no outputs.
  std::vector<std::string> outputs = collect(parent.getModuleOutputs());
  TEST_ASSERT(outputs.size() == 1);
  TEST_ASSERT(outputs[0] == "m1");

  // Every listed name resolves.
  for (const std::string &name : parent.getModuleInputs())
    TEST_ASSERT(parent.getModuleInput(name));
  TEST_ASSERT(diags.count(ErrorCode::DEPRECATED_UNDERSCORE_NAME) == 2);

  // Lazy: a port added after the range is taken shows up.
  PortNameRange later = parent.getModuleInputs();
  TEST_ASSERT(parent.addModule<Buffer>("m4", 16));
  std::vector<std::string> grown = collect(later);
  TEST_ASSERT(grown.size() == 4);
  TEST_ASSERT(grown.back() == "m4");

  return 0;
}
