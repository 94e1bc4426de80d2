//===-- Vocabulary.cpp - Vocabularies and VocabularyMap ---------*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#include "spa/Module/Vocabulary.h"
#include "spa/Common/SpaError.h"

#include "llvm/Support/Debug.h"

#include <cassert>
#include <cmath>
#include <limits>

#define DEBUG_TYPE "spa-vocab"

namespace spa {

//===----------------------------------------------------------------------===//
// Vocabulary
//===----------------------------------------------------------------------===//

static uint64_t nondeterministicSeed() {
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

Vocabulary::Vocabulary(unsigned dimensions, std::optional<uint64_t> seed)
    : dimensions_(dimensions), seed_(seed),
      rng_(seed ? *seed : nondeterministicSeed()) {
  assert(dimensions > 0 && "vocabulary dimensionality must be positive");
}

llvm::Error Vocabulary::add(llvm::StringRef key, std::vector<double> vector) {
  if (vector.size() != dimensions_)
    return makeError(ErrorKind::InvalidDimension,
                     ErrorCode::VOCAB_POINTER_WIDTH,
                     "pointer '" + key + "' has " +
                         llvm::Twine(vector.size()) +
                         " dimensions, vocabulary has " +
                         llvm::Twine(dimensions_));
  if (pointers_.count(key))
    return makeError(ErrorKind::Validation, ErrorCode::VOCAB_POINTER_EXISTS,
                     "pointer '" + key + "' already exists");
  keys_.push_back(key.str());
  pointers_[key] = std::move(vector);
  return llvm::Error::success();
}

const std::vector<double> &Vocabulary::create(llvm::StringRef key) {
  auto it = pointers_.find(key);
  if (it != pointers_.end())
    return it->second;

  // Random direction on the unit hypersphere.
  std::normal_distribution<double> normal(0.0, 1.0);
  std::vector<double> v(dimensions_);
  double norm = 0.0;
  for (auto &x : v) {
    x = normal(rng_);
    norm += x * x;
  }
  norm = std::sqrt(norm);
  if (norm > 0.0)
    for (auto &x : v)
      x /= norm;

  keys_.push_back(key.str());
  return pointers_[key] = std::move(v);
}

const std::vector<double> *Vocabulary::lookup(llvm::StringRef key) const {
  auto it = pointers_.find(key);
  if (it == pointers_.end())
    return nullptr;
  return &it->second;
}

//===----------------------------------------------------------------------===//
// VocabularyMap
//===----------------------------------------------------------------------===//

/// Vocabularies are keyed by unsigned width; anything outside (0, UINT_MAX]
/// has no entry.
static bool isStorableDimension(int64_t dimensions) {
  return dimensions > 0 &&
         static_cast<uint64_t>(dimensions) <=
             std::numeric_limits<unsigned>::max();
}

VocabularyMap::VocabularyMap(uint64_t seed) : seed_(seed), rng_(seed) {}

llvm::Expected<std::shared_ptr<Vocabulary>>
VocabularyMap::getOrCreate(int64_t dimensions) {
  if (!isStorableDimension(dimensions))
    return makeError(ErrorKind::InvalidDimension, ErrorCode::VOCAB_DIMENSION,
                     "vocabulary dimensionality must be a positive integer "
                     "no greater than " +
                         llvm::Twine(std::numeric_limits<unsigned>::max()) +
                         ", got " + llvm::Twine(dimensions));

  auto it = vocabs_.find(static_cast<unsigned>(dimensions));
  if (it != vocabs_.end())
    return it->second;

  std::optional<uint64_t> vocabSeed;
  if (seed_)
    vocabSeed = rng_();
  auto vocab = std::make_shared<Vocabulary>(static_cast<unsigned>(dimensions),
                                            vocabSeed);
  LLVM_DEBUG(llvm::dbgs() << "[spa.vocab] create d=" << dimensions << "\n");
  vocabs_.emplace(static_cast<unsigned>(dimensions), vocab);
  return vocab;
}

bool VocabularyMap::add(std::shared_ptr<Vocabulary> vocab) {
  assert(vocab && "cannot register a null vocabulary");
  unsigned d = vocab->getDimensions();
  auto result = vocabs_.insert({d, vocab});
  if (result.second)
    return false;
  LLVM_DEBUG(llvm::dbgs() << "[spa.vocab] replace d=" << d << "\n");
  result.first->second = std::move(vocab);
  return true;
}

std::shared_ptr<Vocabulary> VocabularyMap::lookup(int64_t dimensions) const {
  if (!isStorableDimension(dimensions))
    return nullptr;
  auto it = vocabs_.find(static_cast<unsigned>(dimensions));
  if (it == vocabs_.end())
    return nullptr;
  return it->second;
}

bool VocabularyMap::erase(int64_t dimensions) {
  if (!isStorableDimension(dimensions))
    return false;
  return vocabs_.erase(static_cast<unsigned>(dimensions)) > 0;
}

} // namespace spa
