//===-- Port.cpp - Module ports and vocabulary bindings ---------*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#include "spa/Module/Port.h"

#include <cassert>

namespace spa {

VocabBinding VocabBinding::resolved(std::shared_ptr<Vocabulary> vocab) {
  assert(vocab && "resolved binding requires a vocabulary");
  int64_t d = vocab->getDimensions();
  return VocabBinding(d, std::move(vocab));
}

int64_t VocabBinding::getDimensions() const {
  if (vocab_)
    return vocab_->getDimensions();
  return dimensions_;
}

llvm::Error VocabBinding::resolve(VocabularyMap &vocabs) {
  if (vocab_)
    return llvm::Error::success();
  auto vocab = vocabs.getOrCreate(dimensions_);
  if (!vocab)
    return vocab.takeError();
  vocab_ = std::move(*vocab);
  return llvm::Error::success();
}

bool VocabBinding::operator==(const VocabBinding &other) const {
  if (isResolved() || other.isResolved())
    return vocab_ == other.vocab_;
  return dimensions_ == other.dimensions_;
}

} // namespace spa
