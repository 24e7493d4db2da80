/*!
 * Copyright (c) 2024 bayestree authors. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#include <gtest/gtest.h>
#include <bayestree/data.h>

#include <vector>

TEST(Data, ColumnMatrixRowMajor) {
  std::vector<double> buffer = {1.0, 2.0, 3.0,
                                4.0, 5.0, 6.0};
  BayesTree::ColumnMatrix matrix(buffer.data(), 2, 3, true);
  ASSERT_EQ(matrix.NumRows(), 2);
  ASSERT_EQ(matrix.NumCols(), 3);
  ASSERT_EQ(matrix.GetElement(0, 2), 3.0);
  ASSERT_EQ(matrix.GetElement(1, 0), 4.0);
  matrix.SetElement(1, 0, -4.0);
  ASSERT_EQ(matrix.GetData()(1, 0), -4.0);
}

TEST(Data, ColumnMatrixColumnMajor) {
  std::vector<double> buffer = {1.0, 4.0,
                                2.0, 5.0,
                                3.0, 6.0};
  BayesTree::ColumnMatrix matrix(buffer.data(), 2, 3, false);
  ASSERT_EQ(matrix.GetElement(0, 2), 3.0);
  ASSERT_EQ(matrix.GetElement(1, 0), 4.0);
  ASSERT_EQ(matrix.GetElement(1, 1), 5.0);
  EXPECT_THROW(matrix.LoadData(nullptr, 2, 3, false), std::runtime_error);
}

TEST(Data, ColumnVector) {
  std::vector<double> buffer = {0.5, 1.5, 2.5};
  BayesTree::ColumnVector vec(buffer.data(), 3);
  ASSERT_EQ(vec.NumRows(), 3);
  ASSERT_EQ(vec.GetElement(1), 1.5);
  std::vector<double> replacement = {-1.0, -2.0, -3.0};
  vec.OverwriteData(replacement.data(), 3);
  ASSERT_EQ(vec.GetData()(2), -3.0);
  EXPECT_THROW(vec.OverwriteData(replacement.data(), 2), std::runtime_error);
}

TEST(OutcomeScaler, TransformAndInverse) {
  Eigen::VectorXd outcome(4);
  outcome << 2.0, 6.0, 4.0, 10.0;
  BayesTree::OutcomeScaler scaler(outcome);
  ASSERT_EQ(scaler.Minimum(), 2.0);
  ASSERT_EQ(scaler.Range(), 8.0);
  Eigen::VectorXd scaled = scaler.Transform(outcome);
  ASSERT_NEAR(scaled(0), -0.5, 1e-12);
  ASSERT_NEAR(scaled(1), 0.0, 1e-12);
  ASSERT_NEAR(scaled(3), 0.5, 1e-12);
  Eigen::VectorXd restored = scaler.InverseTransform(scaled);
  for (int i = 0; i < 4; i++) {
    ASSERT_NEAR(restored(i), outcome(i), 1e-12);
  }
  ASSERT_NEAR(scaler.InverseTransform(0.25), 8.0, 1e-12);
  ASSERT_NEAR(scaler.InverseTransformVariance(0.01), 0.64, 1e-12);

  Eigen::VectorXd constant = Eigen::VectorXd::Constant(5, 3.0);
  EXPECT_THROW(BayesTree::OutcomeScaler scaler_constant(constant), std::runtime_error);
  Eigen::VectorXd empty(0);
  EXPECT_THROW(BayesTree::OutcomeScaler scaler_empty(empty), std::runtime_error);
}
