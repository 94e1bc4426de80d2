//===-- Vocabulary.h - Vocabularies and the dimension registry --*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//
//
// A Vocabulary is an opaque, identity-compared handle for a symbolic vector
// space of fixed dimensionality. A VocabularyMap keys vocabularies by
// dimensionality so that every port declaring the same dimensionality within
// one composition shares one Vocabulary.
//
//===----------------------------------------------------------------------===//

#ifndef SPA_MODULE_VOCABULARY_H
#define SPA_MODULE_VOCABULARY_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace spa {

//===----------------------------------------------------------------------===//
// Vocabulary
//===----------------------------------------------------------------------===//

class Vocabulary {
public:
  /// \p dimensions must be positive; VocabularyMap checks this before
  /// constructing. Without a seed the generator is seeded nondeterministically.
  explicit Vocabulary(unsigned dimensions,
                      std::optional<uint64_t> seed = std::nullopt);

  Vocabulary(const Vocabulary &) = delete;
  Vocabulary &operator=(const Vocabulary &) = delete;

  unsigned getDimensions() const { return dimensions_; }
  std::optional<uint64_t> getSeed() const { return seed_; }

  /// Add a named pointer. Fails if the key exists or the width is wrong.
  llvm::Error add(llvm::StringRef key, std::vector<double> vector);

  /// Return the pointer for \p key, drawing a random unit vector first if it
  /// does not exist yet.
  const std::vector<double> &create(llvm::StringRef key);

  /// Return the pointer for \p key, or nullptr.
  const std::vector<double> *lookup(llvm::StringRef key) const;

  /// Keys in insertion order.
  llvm::ArrayRef<std::string> getKeys() const { return keys_; }

  size_t size() const { return keys_.size(); }

private:
  unsigned dimensions_;
  std::optional<uint64_t> seed_;
  std::mt19937_64 rng_;
  std::vector<std::string> keys_;
  llvm::StringMap<std::vector<double>> pointers_;
};

//===----------------------------------------------------------------------===//
// VocabularyMap
//===----------------------------------------------------------------------===//

class VocabularyMap {
public:
  using Storage = std::map<unsigned, std::shared_ptr<Vocabulary>>;
  using const_iterator = Storage::const_iterator;

  /// Unseeded map: vocabularies it creates are seeded nondeterministically.
  VocabularyMap() = default;

  /// Seeded map: vocabularies it creates draw their seeds from a generator
  /// seeded with \p seed, in creation order.
  explicit VocabularyMap(uint64_t seed);

  VocabularyMap(const VocabularyMap &) = delete;
  VocabularyMap &operator=(const VocabularyMap &) = delete;

  /// Return the vocabulary registered for \p dimensions, creating and caching
  /// one on first request. Fails with InvalidDimension if \p dimensions is
  /// not positive or does not fit in an unsigned.
  llvm::Expected<std::shared_ptr<Vocabulary>> getOrCreate(int64_t dimensions);

  /// Register \p vocab under its own dimensionality. Returns true if this
  /// replaced a previously registered vocabulary.
  bool add(std::shared_ptr<Vocabulary> vocab);

  /// Return the vocabulary for \p dimensions, or nullptr. Out-of-range
  /// widths are never present.
  std::shared_ptr<Vocabulary> lookup(int64_t dimensions) const;

  bool contains(int64_t dimensions) const {
    return lookup(dimensions) != nullptr;
  }

  /// Remove the entry for \p dimensions. Returns true if one was removed.
  bool erase(int64_t dimensions);

  size_t size() const { return vocabs_.size(); }
  bool empty() const { return vocabs_.empty(); }

  /// Iterate in ascending dimensionality.
  const_iterator begin() const { return vocabs_.begin(); }
  const_iterator end() const { return vocabs_.end(); }

  std::optional<uint64_t> getSeed() const { return seed_; }

private:
  std::optional<uint64_t> seed_;
  std::mt19937_64 rng_;
  Storage vocabs_;
};

} // namespace spa

#endif // SPA_MODULE_VOCABULARY_H
