/*!
 * Copyright (c) 2024 bayestree authors. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#include <gtest/gtest.h>
#include <testutils.h>

#include <algorithm>
#include <random>

namespace BayesTree {

namespace TestUtils {

TestDataset LoadGridDataset() {
  TestDataset output;
  output.n = 40;
  output.x_cols = 2;
  output.covariates.resize(output.n, output.x_cols);
  output.outcome.resize(output.n);
  for (int i = 0; i < output.n; i++) {
    output.covariates(i, 0) = i / 40.0;
    output.covariates(i, 1) = ((7 * i) % 40) / 40.0;
    output.outcome(i) = output.covariates(i, 0) - output.covariates(i, 1);
  }
  return output;
}

TestDataset SimulatePartitionDataset(int n, int seed, double noise_sd) {
  TestDataset output;
  output.n = n;
  output.x_cols = 2;
  output.covariates.resize(n, 2);
  output.outcome.resize(n);
  std::mt19937 gen(seed);
  std::uniform_real_distribution<double> covariate_dist(0., 1.);
  std::normal_distribution<double> noise_dist(0., noise_sd);
  for (int i = 0; i < n; i++) {
    double x0 = covariate_dist(gen);
    double x1 = covariate_dist(gen);
    output.covariates(i, 0) = x0;
    output.covariates(i, 1) = x1;
    double mean;
    if (x0 <= 0.5) {
      mean = -2.0;
    } else if (x1 <= 0.5) {
      mean = 1.0;
    } else {
      mean = 3.0;
    }
    output.outcome(i) = mean + noise_dist(gen);
  }
  return output;
}

std::shared_ptr<const Eigen::MatrixXd> SharedCovariates(const TestDataset& dataset) {
  return std::make_shared<const Eigen::MatrixXd>(dataset.covariates);
}

std::vector<std::pair<int, double>> NeighborhoodRules(const BinaryTree& tree, node_t nid) {
  std::vector<std::pair<int, double>> rules;
  std::vector<node_t> nodes = {nid, tree.LeftChild(nid), tree.RightChild(nid)};
  for (node_t node : nodes) {
    std::optional<SplitRule> rule = tree.Rule(node);
    if (rule.has_value()) rules.emplace_back(rule->feature, rule->threshold);
  }
  std::sort(rules.begin(), rules.end());
  return rules;
}

void ExpectTreeInvariants(const BinaryTree& tree) {
  EXPECT_EQ(tree.NumLeaves() + tree.NumSplitNodes(), tree.NumValidNodes());
  EXPECT_EQ(tree.Depth(BinaryTree::kRoot), 0);
  for (node_t nid : tree.GetLeaves()) {
    EXPECT_FALSE(tree.Rule(nid).has_value());
    EXPECT_EQ(tree.RightChild(nid), BinaryTree::kInvalidNodeId);
    EXPECT_GE(tree.NodeSampleSize(nid), tree.MinSamplesLeaf());
    if (!tree.IsRoot(nid)) {
      EXPECT_EQ(tree.Depth(nid), tree.Depth(tree.Parent(nid)) + 1);
    }
  }
  for (node_t nid : tree.GetInternalNodes()) {
    EXPECT_TRUE(tree.Rule(nid).has_value());
    ASSERT_NE(tree.LeftChild(nid), BinaryTree::kInvalidNodeId);
    ASSERT_NE(tree.RightChild(nid), BinaryTree::kInvalidNodeId);
    EXPECT_EQ(tree.Parent(tree.LeftChild(nid)), nid);
    EXPECT_EQ(tree.Parent(tree.RightChild(nid)), nid);
    if (!tree.IsRoot(nid)) {
      EXPECT_EQ(tree.Depth(nid), tree.Depth(tree.Parent(nid)) + 1);
    }
  }
  for (node_t nid : tree.GetLeafParents()) {
    EXPECT_TRUE(tree.IsLeafParent(nid));
  }
}

} // namespace TestUtils

} // namespace BayesTree
