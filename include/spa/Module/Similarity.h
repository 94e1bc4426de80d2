//===-- Similarity.h - Probe data and vocabulary similarity -----*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#ifndef SPA_MODULE_SIMILARITY_H
#define SPA_MODULE_SIMILARITY_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <utility>
#include <vector>

namespace spa {

class Probe;
class Vocabulary;

/// Dense row-major matrix.
class Matrix {
public:
  Matrix() = default;
  Matrix(size_t rows, size_t cols) : rows_(rows), cols_(cols),
                                     data_(rows * cols, 0.0) {}

  /// One row per vector. Fails with InvalidDimension if the rows differ in
  /// width.
  static llvm::Expected<Matrix>
  fromRows(const std::vector<std::vector<double>> &rows);

  size_t getRows() const { return rows_; }
  size_t getCols() const { return cols_; }

  double &at(size_t r, size_t c) { return data_[r * cols_ + c]; }
  double at(size_t r, size_t c) const { return data_[r * cols_ + c]; }

  llvm::ArrayRef<double> row(size_t r) const {
    return llvm::ArrayRef<double>(data_).slice(r * cols_, cols_);
  }

private:
  size_t rows_ = 0;
  size_t cols_ = 0;
  std::vector<double> data_;
};

/// Simulation output keyed by probe (timesteps x probed dimensions).
class ProbeData {
public:
  void set(const Probe &probe, Matrix data) { data_[&probe] = std::move(data); }

  /// Data recorded for \p probe, or nullptr.
  const Matrix *lookup(const Probe &probe) const;

private:
  llvm::DenseMap<const Probe *, Matrix> data_;
};

/// Dot product of every row of \p data with every pointer of \p vocab, in
/// the vocabulary's key order (rows x keys). \p data must be as wide as the
/// vocabulary.
Matrix similarity(const Matrix &data, const Vocabulary &vocab);

} // namespace spa

#endif // SPA_MODULE_SIMILARITY_H
