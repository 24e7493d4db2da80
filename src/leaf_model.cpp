/*! Copyright (c) 2024 bayestree authors. All rights reserved. */
#include <bayestree/leaf_model.h>
#include <bayestree/regression_tree.h>
#include <bayestree/variance_model.h>

#include <boost/math/special_functions/gamma.hpp>

#include <cmath>
#include <utility>

namespace BayesTree {

LeafSuffStat AccumulateNodeSuffStat(const BinaryTree& tree, node_t nid) {
  LeafSuffStat suff_stat;
  BoolVector rows = tree.RowMask(nid);
  const Eigen::VectorXd& outcome = tree.Outcome();
  for (data_size_t i = 0; i < tree.NumObservations(); i++) {
    if (rows(i)) suff_stat.IncrementSuffStat(outcome(i));
  }
  return suff_stat;
}

double ConjugateLeafModel::LeafLogMarginalLikelihood(const LeafSuffStat& suff_stat) const {
  CHECK_GT(suff_stat.n, 0);
  double n = static_cast<double>(suff_stat.n);
  double nu = prior_.GetNu();
  double lambda = prior_.GetLambda();
  double a = prior_.GetPrecisionMultiplier();
  double mean_shift = suff_stat.mean - prior_.GetPriorMean();

  double t1 = -0.5 * n * std::log(pi_constant);
  double t2 = 0.5 * nu * std::log(nu * lambda);
  double t3 = 0.5 * std::log(a / (n + a));
  double t4 = boost::math::lgamma(0.5 * (n + nu)) - boost::math::lgamma(0.5 * nu);
  double t5 = -0.5 * (n + nu) * std::log(suff_stat.sum_sq_dev + (n * a) / (n + a) * mean_shift * mean_shift + nu * lambda);
  return t1 + t2 + t3 + t4 + t5;
}

double ConjugateLeafModel::PosteriorParameterMean(const LeafSuffStat& suff_stat) const {
  double a = prior_.GetPrecisionMultiplier();
  return (suff_stat.n * suff_stat.mean + a * prior_.GetPriorMean()) / (suff_stat.n + a);
}

double ConjugateLeafModel::PosteriorParameterVariance(const LeafSuffStat& suff_stat, double global_variance) const {
  return global_variance / (suff_stat.n + prior_.GetPrecisionMultiplier());
}

void ConjugateLeafModel::SampleLeafParameters(BinaryTree& tree, double global_variance, std::mt19937& gen) {
  CHECK_GT(global_variance, 0.0);
  LeafSuffStat node_suff_stat;
  double node_mean;
  double node_variance;
  for (node_t leaf_id : tree.GetLeaves()) {
    node_suff_stat = AccumulateNodeSuffStat(tree, leaf_id);
    node_mean = PosteriorParameterMean(node_suff_stat);
    node_variance = PosteriorParameterVariance(node_suff_stat, global_variance);
    tree.SetLeafValue(leaf_id, normal_sampler_.Sample(node_mean, node_variance, gen));
  }
}

void ConjugateLeafModel::SampleLeafPrior(BinaryTree& tree, double global_variance, std::mt19937& gen) {
  CHECK_GT(global_variance, 0.0);
  double prior_variance = global_variance / prior_.GetPrecisionMultiplier();
  for (node_t leaf_id : tree.GetLeaves()) {
    tree.SetLeafValue(leaf_id, normal_sampler_.Sample(prior_.GetPriorMean(), prior_variance, gen));
  }
}

LeafMeanParameter::LeafMeanParameter(RegressionTree& tree, const ErrorVarianceParameter& variance, std::string name, bool track)
    : tree_(tree), variance_(variance), name_(std::move(name)), track_(track) {}

Eigen::VectorXd LeafMeanParameter::Value() const {
  return tree_.Value();
}

void LeafMeanParameter::SetStartingValue(std::mt19937& gen) {
  tree_.LeafModel().SampleLeafPrior(tree_.Tree(), variance_.GetVariance(), gen);
}

void LeafMeanParameter::RandomPosterior(std::mt19937& gen) {
  tree_.LeafModel().SampleLeafParameters(tree_.Tree(), variance_.GetVariance(), gen);
}

} // namespace BayesTree
