/*!
 * Copyright (c) 2024 bayestree authors. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#ifndef BAYESTREE_DATA_H_
#define BAYESTREE_DATA_H_

#include <Eigen/Dense>
#include <bayestree/log.h>
#include <bayestree/meta.h>

namespace BayesTree {

/*!
 * \defgroup data_group Dataset API
 *
 * \brief Containers for the covariates and outcome that trees are fit against.
 *
 * \{
 */

/*!
 * \brief Internal wrapper around `Eigen::MatrixXd` interface for multidimensional floating point data.
 */
class ColumnMatrix {
 public:
  ColumnMatrix() {}
  /*!
   * \brief Construct a new `ColumnMatrix` object from in-memory data buffer.
   *
   * \param data_ptr Pointer to first element of a contiguous array of data storing a matrix.
   * \param num_row Number of rows in the matrix.
   * \param num_col Number of columns / covariates in the matrix.
   * \param is_row_major Whether or not the data in `data_ptr` are organized in a row-major or column-major fashion.
   */
  ColumnMatrix(const double* data_ptr, data_size_t num_row, int num_col, bool is_row_major);
  ~ColumnMatrix() {}
  /*!
   * \brief Overwrite the matrix with the contents of an in-memory data buffer.
   */
  void LoadData(const double* data_ptr, data_size_t num_row, int num_col, bool is_row_major);
  double GetElement(data_size_t row_num, int32_t col_num) const {return data_(row_num, col_num);}
  void SetElement(data_size_t row_num, int32_t col_num, double value) {data_(row_num, col_num) = value;}
  data_size_t NumRows() const {return data_.rows();}
  int NumCols() const {return data_.cols();}
  const Eigen::MatrixXd& GetData() const {return data_;}
 private:
  Eigen::MatrixXd data_;
};

/*!
 * \brief Internal wrapper around `Eigen::VectorXd` interface for univariate floating point data.
 */
class ColumnVector {
 public:
  ColumnVector() {}
  /*!
   * \brief Construct a new `ColumnVector` object from in-memory data buffer.
   *
   * \param data_ptr Pointer to first element of a contiguous array of data storing a vector.
   * \param num_row Number of rows / elements in the vector.
   */
  ColumnVector(const double* data_ptr, data_size_t num_row);
  ~ColumnVector() {}
  void LoadData(const double* data_ptr, data_size_t num_row);
  /*! \brief Overwrite the vector in place, `num_row` must match the current size */
  void OverwriteData(const double* data_ptr, data_size_t num_row);
  double GetElement(data_size_t row_num) const {return data_(row_num);}
  void SetElement(data_size_t row_num, double value) {data_(row_num) = value;}
  data_size_t NumRows() const {return data_.size();}
  const Eigen::VectorXd& GetData() const {return data_;}
 private:
  Eigen::VectorXd data_;
};

/*!
 * \brief Affine map of an outcome onto [-0.5, 0.5], so that tree priors can be stated on a fixed scale.
 */
class OutcomeScaler {
 public:
  /*!
   * \brief Record the range of `outcome`. A constant outcome has no range and is fatal.
   */
  explicit OutcomeScaler(const Eigen::VectorXd& outcome);
  ~OutcomeScaler() {}
  /*! \brief Map onto the scaled range: `(y - min) / (max - min) - 0.5` */
  Eigen::VectorXd Transform(const Eigen::VectorXd& outcome) const;
  /*! \brief Map from the scaled range back to the original outcome scale */
  Eigen::VectorXd InverseTransform(const Eigen::VectorXd& scaled) const;
  double InverseTransform(double scaled) const;
  /*! \brief Convert a variance on the scaled range to a variance on the original scale */
  double InverseTransformVariance(double scaled_variance) const {return scaled_variance * range_ * range_;}
  double Minimum() const {return min_;}
  double Range() const {return range_;}
 private:
  double min_;
  double range_;
};

/*! \} */ // end of data_group

} // namespace BayesTree

#endif // BAYESTREE_DATA_H_
