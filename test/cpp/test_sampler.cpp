/*!
 * Copyright (c) 2024 bayestree authors. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#include <gtest/gtest.h>
#include <testutils.h>
#include <bayestree/leaf_model.h>
#include <bayestree/prior.h>
#include <bayestree/regression_tree.h>
#include <bayestree/tree_sampler.h>
#include <bayestree/variance_model.h>

#include <cmath>
#include <random>
#include <vector>

namespace {

std::vector<std::pair<int, double>> InternalRules(const BayesTree::BinaryTree& tree) {
  std::vector<std::pair<int, double>> rules;
  for (BayesTree::node_t nid : tree.GetInternalNodes()) {
    BayesTree::SplitRule rule = tree.Rule(nid).value();
    rules.emplace_back(rule.feature, rule.threshold);
  }
  return rules;
}

} // namespace

TEST(TreeProposal, NormalizesWeights) {
  BayesTree::TreeProposal proposal(1.0, 1.0, 2.0, 0.0);
  ASSERT_NEAR(proposal.MoveProbability(BayesTree::TreeMoveType::kGrow), 0.25, 1e-12);
  ASSERT_NEAR(proposal.MoveProbability(BayesTree::TreeMoveType::kPrune), 0.25, 1e-12);
  ASSERT_NEAR(proposal.MoveProbability(BayesTree::TreeMoveType::kChange), 0.5, 1e-12);
  ASSERT_EQ(proposal.MoveProbability(BayesTree::TreeMoveType::kSwap), 0.0);

  std::mt19937 gen(42);
  int num_draws = 10000;
  int num_change = 0;
  for (int i = 0; i < num_draws; i++) {
    BayesTree::TreeMoveType move = proposal.DrawMove(gen);
    ASSERT_NE(move, BayesTree::TreeMoveType::kSwap);
    if (move == BayesTree::TreeMoveType::kChange) num_change++;
  }
  ASSERT_NEAR(static_cast<double>(num_change) / num_draws, 0.5, 0.03);

  BayesTree::TreeProposal ensemble = BayesTree::TreeProposal::EnsembleDefault();
  ASSERT_NEAR(ensemble.MoveProbability(BayesTree::TreeMoveType::kChange), 0.4, 1e-12);
  ASSERT_NEAR(ensemble.MoveProbability(BayesTree::TreeMoveType::kSwap), 0.1, 1e-12);
}

TEST(TreeProposal, InvalidWeights) {
  EXPECT_THROW(BayesTree::TreeProposal(-0.1, 0.5, 0.3, 0.3), std::runtime_error);
  EXPECT_THROW(BayesTree::TreeProposal(0.0, 0.0, 0.0, 0.0), std::runtime_error);
}

TEST(TreeProposal, MovesOnSingleLeaf) {
  BayesTree::TestUtils::TestDataset dataset = BayesTree::TestUtils::LoadGridDataset();
  BayesTree::BinaryTree tree(BayesTree::TestUtils::SharedCovariates(dataset), dataset.outcome, 3);
  std::mt19937 gen(5);
  ASSERT_FALSE(BayesTree::TreeProposal::ApplyMove(BayesTree::TreeMoveType::kPrune, tree, gen));
  ASSERT_FALSE(BayesTree::TreeProposal::ApplyMove(BayesTree::TreeMoveType::kChange, tree, gen));
  ASSERT_FALSE(BayesTree::TreeProposal::ApplyMove(BayesTree::TreeMoveType::kSwap, tree, gen));
  ASSERT_EQ(tree.NumValidNodes(), 1);
  ASSERT_EQ(BayesTree::TreeMoveTypeToString(BayesTree::TreeMoveType::kSwap), "swap");
}

TEST(TreeMHStep, RejectionRestoresTree) {
  BayesTree::TestUtils::TestDataset dataset = BayesTree::TestUtils::SimulatePartitionDataset(200, 21, 0.5);
  BayesTree::RegressionTree model(BayesTree::TestUtils::SharedCovariates(dataset), dataset.outcome,
                                  BayesTree::NormalInverseGammaPrior(3.0, 0.25, 0.0, 0.1),
                                  BayesTree::TreePrior(0.95, 2.0, 5), "tree");
  std::mt19937 gen(314);
  int num_steps = 300;
  int num_rejected = 0;
  for (int i = 0; i < num_steps; i++) {
    std::vector<BayesTree::node_t> leaves = model.Tree().GetLeaves();
    std::vector<std::pair<int, double>> rules = InternalRules(model.Tree());
    double log_density = model.LogDensity();
    BayesTree::MHStepResult result = model.SampleTopology(gen);
    if (!result.committed || !result.accepted) {
      ASSERT_EQ(model.Tree().GetLeaves(), leaves);
      ASSERT_EQ(InternalRules(model.Tree()), rules);
      ASSERT_NEAR(model.LogDensity(), log_density, 1e-9);
    }
    if (result.committed && !result.accepted) num_rejected++;
    if (result.accepted) {
      ASSERT_NEAR(model.LogDensity() - log_density, result.log_mh_ratio, 1e-9);
    }
    BayesTree::TestUtils::ExpectTreeInvariants(model.Tree());
  }
  ASSERT_GT(num_rejected, 0);

  std::int64_t total_proposed = 0;
  for (int m = 0; m < BayesTree::kNumTreeMoveTypes; m++) {
    BayesTree::TreeMoveType move = static_cast<BayesTree::TreeMoveType>(m);
    total_proposed += model.Sampler().NumProposed(move);
    ASSERT_LE(model.Sampler().NumAccepted(move), model.Sampler().NumProposed(move));
    ASSERT_GE(model.Sampler().AcceptanceRate(move), 0.0);
    ASSERT_LE(model.Sampler().AcceptanceRate(move), 1.0);
  }
  ASSERT_EQ(total_proposed, num_steps);
}

TEST(TreeMHStep, FindsStrongPartition) {
  BayesTree::TestUtils::TestDataset dataset = BayesTree::TestUtils::SimulatePartitionDataset(300, 77, 0.3);
  BayesTree::RegressionTree model(BayesTree::TestUtils::SharedCovariates(dataset), dataset.outcome,
                                  BayesTree::NormalInverseGammaPrior(3.0, 0.1, 0.0, 0.1),
                                  BayesTree::TreePrior(0.95, 2.0, 5), "tree");
  std::mt19937 gen(2718);
  double initial_log_density = model.LogDensity();
  for (int i = 0; i < 2000; i++) {
    model.RandomPosterior(gen);
  }
  ASSERT_GT(model.LogDensity(), initial_log_density);
  ASSERT_GE(model.Tree().NumLeaves(), 3);
}

TEST(LeafModel, PosteriorMoments) {
  BayesTree::TestUtils::TestDataset dataset = BayesTree::TestUtils::LoadGridDataset();
  double mubar = 0.3, a = 2.0, sigma2 = 0.5;
  BayesTree::ConjugateLeafModel leaf_model(BayesTree::NormalInverseGammaPrior(3.0, 1.0, mubar, a));
  BayesTree::BinaryTree tree(BayesTree::TestUtils::SharedCovariates(dataset), dataset.outcome, 3);
  double n = dataset.n;
  double expected_mean = (n * dataset.outcome.mean() + a * mubar) / (n + a);
  double expected_variance = sigma2 / (n + a);

  BayesTree::LeafSuffStat suff_stat = BayesTree::AccumulateNodeSuffStat(tree, 0);
  ASSERT_EQ(suff_stat.SampleSize(), dataset.n);
  ASSERT_NEAR(leaf_model.PosteriorParameterMean(suff_stat), expected_mean, 1e-12);
  ASSERT_NEAR(leaf_model.PosteriorParameterVariance(suff_stat, sigma2), expected_variance, 1e-12);

  std::mt19937 gen(11);
  int num_draws = 20000;
  Eigen::VectorXd draws(num_draws);
  for (int i = 0; i < num_draws; i++) {
    leaf_model.SampleLeafParameters(tree, sigma2, gen);
    draws(i) = tree.LeafValue(0);
  }
  double sample_mean = draws.mean();
  double sample_variance = (draws.array() - sample_mean).square().sum() / (num_draws - 1);
  ASSERT_NEAR(sample_mean, expected_mean, 0.005);
  ASSERT_NEAR(sample_variance / expected_variance, 1.0, 0.05);

  EXPECT_THROW(leaf_model.SampleLeafParameters(tree, 0.0, gen), std::runtime_error);
  BayesTree::LeafSuffStat empty;
  EXPECT_THROW(leaf_model.LeafLogMarginalLikelihood(empty), std::runtime_error);
}

TEST(LeafModel, PriorDraws) {
  BayesTree::TestUtils::TestDataset dataset = BayesTree::TestUtils::LoadGridDataset();
  double mubar = -1.0, a = 4.0, sigma2 = 2.0;
  BayesTree::ConjugateLeafModel leaf_model(BayesTree::NormalInverseGammaPrior(3.0, 1.0, mubar, a));
  BayesTree::BinaryTree tree(BayesTree::TestUtils::SharedCovariates(dataset), dataset.outcome, 3);
  std::mt19937 gen(12);
  int num_draws = 20000;
  Eigen::VectorXd draws(num_draws);
  for (int i = 0; i < num_draws; i++) {
    leaf_model.SampleLeafPrior(tree, sigma2, gen);
    draws(i) = tree.LeafValue(0);
  }
  double sample_mean = draws.mean();
  double sample_variance = (draws.array() - sample_mean).square().sum() / (num_draws - 1);
  ASSERT_NEAR(sample_mean, mubar, 0.02);
  ASSERT_NEAR(sample_variance / (sigma2 / a), 1.0, 0.05);
}

TEST(VarianceModel, PosteriorMoments) {
  Eigen::VectorXd residual(20);
  for (int i = 0; i < 20; i++) {
    residual(i) = 0.1 * (i - 9.5);
  }
  double nu = 3.0, lambda = 0.5;
  BayesTree::ErrorVarianceParameter variance(residual, nu, lambda, 1.0, "sigma2");
  double shape = 0.5 * (nu + 20.0);
  double scale = 0.5 * (nu * lambda + residual.squaredNorm());
  double expected_mean = scale / (shape - 1.0);

  BayesTree::GlobalHomoskedasticVarianceModel variance_model;
  ASSERT_NEAR(variance_model.PosteriorShape(residual, nu), shape, 1e-12);
  ASSERT_NEAR(variance_model.PosteriorScale(residual, nu, lambda), scale, 1e-12);

  std::mt19937 gen(13);
  int num_draws = 20000;
  double total = 0.0;
  for (int i = 0; i < num_draws; i++) {
    variance.RandomPosterior(gen);
    ASSERT_GT(variance.GetVariance(), 0.0);
    total += variance.GetVariance();
  }
  ASSERT_NEAR(total / num_draws / expected_mean, 1.0, 0.02);

  variance.SetStartingValue(gen);
  ASSERT_EQ(variance.GetVariance(), 1.0);
  ASSERT_EQ(variance.Value()(0), 1.0);
  EXPECT_THROW(variance.SetVariance(0.0), std::runtime_error);
  EXPECT_THROW(BayesTree::ErrorVarianceParameter(residual, 0.0, lambda, 1.0, "bad"), std::runtime_error);
}

TEST(VarianceModel, CalibratePriorScale) {
  // 0.95 quantile of a chi-square with 3 degrees of freedom
  double chi_sq_quantile = 7.814727903251178;
  ASSERT_NEAR(BayesTree::CalibrateVariancePriorScale(1.0, 3.0, 0.9), chi_sq_quantile / 3.0, 1e-8);
  ASSERT_NEAR(BayesTree::CalibrateVariancePriorScale(2.0, 3.0, 0.9), 4.0 * chi_sq_quantile / 3.0, 1e-8);
  EXPECT_THROW(BayesTree::CalibrateVariancePriorScale(1.0, 3.0, 1.0), std::runtime_error);
  EXPECT_THROW(BayesTree::CalibrateVariancePriorScale(1.0, 0.0, 0.9), std::runtime_error);
}

TEST(VarianceModel, ResidualStandardDeviation) {
  // Residuals (1, -1, -1, 1) are orthogonal to the intercept and the covariate
  Eigen::MatrixXd covariates(4, 1);
  covariates << 0.0, 1.0, 2.0, 3.0;
  Eigen::VectorXd outcome(4);
  outcome << 1.0 + 1.0, 3.0 - 1.0, 5.0 - 1.0, 7.0 + 1.0;
  ASSERT_NEAR(BayesTree::EstimateResidualStandardDeviation(covariates, outcome), std::sqrt(2.0), 1e-9);

  // Too few rows for least squares falls back to the sample standard deviation
  Eigen::MatrixXd wide(3, 3);
  wide.setIdentity();
  Eigen::VectorXd small_outcome(3);
  small_outcome << 1.0, 2.0, 3.0;
  ASSERT_NEAR(BayesTree::EstimateResidualStandardDeviation(wide, small_outcome), 1.0, 1e-12);

  Eigen::MatrixXd one_row(1, 1);
  one_row << 0.0;
  Eigen::VectorXd one_outcome(1);
  one_outcome << 1.0;
  EXPECT_THROW(BayesTree::EstimateResidualStandardDeviation(one_row, one_outcome), std::runtime_error);
}
