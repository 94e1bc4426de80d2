//===-- Similarity.cpp - Probe data and vocabulary similarity ---*- C++ -*-===//
//
// Part of the SPA project.
//
//===----------------------------------------------------------------------===//

#include "spa/Module/Similarity.h"
#include "spa/Common/SpaError.h"
#include "spa/Module/Vocabulary.h"

#include "llvm/ADT/Twine.h"

#include <cassert>

namespace spa {

llvm::Expected<Matrix>
Matrix::fromRows(const std::vector<std::vector<double>> &rows) {
  size_t cols = rows.empty() ? 0 : rows.front().size();
  Matrix m(rows.size(), cols);
  for (size_t r = 0; r < rows.size(); ++r) {
    if (rows[r].size() != cols)
      return makeError(ErrorKind::InvalidDimension, ErrorCode::MATRIX_RAGGED,
                       "matrix row " + llvm::Twine(r) + " has " +
                           llvm::Twine(rows[r].size()) +
                           " columns, expected " + llvm::Twine(cols));
    for (size_t c = 0; c < cols; ++c)
      m.at(r, c) = rows[r][c];
  }
  return m;
}

const Matrix *ProbeData::lookup(const Probe &probe) const {
  auto it = data_.find(&probe);
  if (it == data_.end())
    return nullptr;
  return &it->second;
}

Matrix similarity(const Matrix &data, const Vocabulary &vocab) {
  assert(data.getCols() == vocab.getDimensions() &&
         "data width does not match vocabulary");
  auto keys = vocab.getKeys();
  Matrix result(data.getRows(), keys.size());
  for (size_t k = 0; k < keys.size(); ++k) {
    const std::vector<double> *pointer = vocab.lookup(keys[k]);
    assert(pointer && "vocabulary key without pointer");
    for (size_t r = 0; r < data.getRows(); ++r) {
      auto row = data.row(r);
      double dot = 0.0;
      for (size_t c = 0; c < row.size(); ++c)
        dot += row[c] * (*pointer)[c];
      result.at(r, k) = dot;
    }
  }
  return result;
}

} // namespace spa
