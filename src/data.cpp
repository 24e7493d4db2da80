/*! Copyright (c) 2024 bayestree authors. All rights reserved. */
#include <bayestree/data.h>

namespace BayesTree {

ColumnMatrix::ColumnMatrix(const double* data_ptr, data_size_t num_row, int num_col, bool is_row_major) {
  LoadData(data_ptr, num_row, num_col, is_row_major);
}

void ColumnMatrix::LoadData(const double* data_ptr, data_size_t num_row, int num_col, bool is_row_major) {
  CHECK_NOTNULL(data_ptr);
  CHECK_GE(num_row, 0);
  CHECK_GE(num_col, 0);
  data_.resize(num_row, num_col);

  double temp_value;
  for (data_size_t i = 0; i < num_row; ++i) {
    for (int j = 0; j < num_col; ++j) {
      if (is_row_major) {
        temp_value = *(data_ptr + static_cast<data_size_t>(num_col) * i + j);
      } else {
        temp_value = *(data_ptr + static_cast<data_size_t>(num_row) * j + i);
      }
      data_(i, j) = temp_value;
    }
  }
}

ColumnVector::ColumnVector(const double* data_ptr, data_size_t num_row) {
  LoadData(data_ptr, num_row);
}

void ColumnVector::LoadData(const double* data_ptr, data_size_t num_row) {
  CHECK_NOTNULL(data_ptr);
  CHECK_GE(num_row, 0);
  data_.resize(num_row);
  for (data_size_t i = 0; i < num_row; ++i) {
    data_(i) = *(data_ptr + i);
  }
}

void ColumnVector::OverwriteData(const double* data_ptr, data_size_t num_row) {
  CHECK_NOTNULL(data_ptr);
  CHECK_EQ(num_row, NumRows());
  for (data_size_t i = 0; i < num_row; ++i) {
    data_(i) = *(data_ptr + i);
  }
}

OutcomeScaler::OutcomeScaler(const Eigen::VectorXd& outcome) {
  if (outcome.size() == 0) {
    Log::Fatal("Cannot rescale an empty outcome");
  }
  min_ = outcome.minCoeff();
  range_ = outcome.maxCoeff() - min_;
  if (!(range_ > 0.0)) {
    Log::Fatal("Cannot rescale a constant outcome (every value equals %f)", min_);
  }
}

Eigen::VectorXd OutcomeScaler::Transform(const Eigen::VectorXd& outcome) const {
  return ((outcome.array() - min_) / range_ - 0.5).matrix();
}

Eigen::VectorXd OutcomeScaler::InverseTransform(const Eigen::VectorXd& scaled) const {
  return ((scaled.array() + 0.5) * range_ + min_).matrix();
}

double OutcomeScaler::InverseTransform(double scaled) const {
  return (scaled + 0.5) * range_ + min_;
}

} // namespace BayesTree
