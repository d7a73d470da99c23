#pragma once

#include <Eigen/Dense>
#include <cassert>
#include <vector>

typedef Eigen::VectorXf EVector;
typedef Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> EMatrix;

namespace math {

// A vector of N elements as an N x 1 matrix, one element per row.
static inline EMatrix AsColumn(const EVector &v) {
  EMatrix result(v.rows(), 1);
  for (int i = 0; i < v.rows(); i++) {
    result(i, 0) = v(i);
  }
  return result;
}

// Row i of the result is row indices[i] of the source.
static inline EMatrix GatherRows(const EMatrix &m, const std::vector<unsigned> &indices) {
  EMatrix result(indices.size(), m.cols());
  for (unsigned i = 0; i < indices.size(); i++) {
    assert(indices[i] < static_cast<unsigned>(m.rows()));
    result.row(i) = m.row(indices[i]);
  }
  return result;
}
}
