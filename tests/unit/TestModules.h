//===-- TestModules.h - Module fixtures for SPA unit tests ------*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#ifndef SPA_TEST_UNIT_TESTMODULES_H
#define SPA_TEST_UNIT_TESTMODULES_H

#include "spa/Module/Module.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"

#include <string>

namespace spa {
namespace test {

/// One "default" input and one "default" output of the given width.
class Buffer : public Module {
public:
  explicit Buffer(int64_t dims, llvm::StringRef label = "") : Module(label) {
    Node &in = addNode("in", dims > 0 ? static_cast<unsigned>(dims) : 0);
    Node &out = addNode("out", dims > 0 ? static_cast<unsigned>(dims) : 0);
    addInput(DEFAULT_PORT, in, VocabBinding::raw(dims));
    addOutput(DEFAULT_PORT, out, VocabBinding::raw(dims));
  }

  llvm::StringRef getTypeName() const override { return "Buffer"; }
};

/// Named inputs of one width and no outputs.
class Gate : public Module {
public:
  Gate(llvm::ArrayRef<std::string> inputs, unsigned dims) {
    for (const auto &name : inputs)
      addInput(name, addNode(name, dims), VocabBinding::raw(dims));
  }

  llvm::StringRef getTypeName() const override { return "Gate"; }
};

/// A module with no ports at all.
class Empty : public Module {
public:
  Empty() = default;
};

/// A registered "memory" Buffer plus an own output "X".
class Composite : public Module {
public:
  explicit Composite(unsigned dims)
      : memory(llvm::cantFail(addModule<Buffer>("memory", dims))) {
    addOutput("X", addNode("x", dims), VocabBinding::raw(dims));
  }

  llvm::StringRef getTypeName() const override { return "Composite"; }

  Buffer &memory;
};

} // namespace test
} // namespace spa

#endif // SPA_TEST_UNIT_TESTMODULES_H
