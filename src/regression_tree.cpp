/*! Copyright (c) 2024 bayestree authors. All rights reserved. */
#include <bayestree/regression_tree.h>

#include <cmath>
#include <string>
#include <utility>

namespace BayesTree {

RegressionTree::RegressionTree(std::shared_ptr<const Eigen::MatrixXd> covariates, const Eigen::VectorXd& outcome,
                               const NormalInverseGammaPrior& leaf_prior, const TreePrior& tree_prior, std::string name,
                               bool track, const TreeProposal& proposal)
    : tree_(std::move(covariates), outcome, tree_prior.GetMinSamplesLeaf()), tree_prior_(tree_prior),
      leaf_model_(leaf_prior), proposal_(proposal), name_(std::move(name)), track_(track) {}

double RegressionTree::LogPrior(const BinaryTree& tree) const {
  double log_prior = 0.0;
  for (node_t nid : tree.GetLeaves()) {
    log_prior += std::log(1.0 - tree_prior_.SplitProbability(tree.Depth(nid)));
  }

  for (node_t nid : tree.GetInternalNodes()) {
    log_prior += std::log(tree_prior_.GetAlpha()) - tree_prior_.GetBeta() * std::log(1.0 + tree.Depth(nid));
    feature_size_t num_features = tree.NumEligibleFeatures(nid);
    data_size_t num_rows = tree.NodeSampleSize(nid);
    if (num_features < 1 || num_rows < 1) {
      Log::Fatal("Internal node %d has %d eligible features and %d routed rows", nid, num_features, num_rows);
    }
    log_prior -= std::log(static_cast<double>(num_features)) + std::log(static_cast<double>(num_rows));
  }
  return log_prior;
}

double RegressionTree::LogLikelihood(const BinaryTree& tree) const {
  double log_likelihood = 0.0;
  for (node_t nid : tree.GetLeaves()) {
    LeafSuffStat suff_stat = AccumulateNodeSuffStat(tree, nid);
    if (suff_stat.n == 0) {
      Log::Fatal("Leaf %d has no routed rows", nid);
    }
    log_likelihood += leaf_model_.LeafLogMarginalLikelihood(suff_stat);
  }
  return log_likelihood;
}

Eigen::VectorXd RegressionTree::Value() const {
  const std::vector<node_t>& leaves = tree_.GetLeaves();
  Eigen::VectorXd result(leaves.size());
  for (std::size_t i = 0; i < leaves.size(); i++) {
    result(i) = tree_.LeafValue(leaves[i]);
  }
  return result;
}

void RegressionTree::SetStartingValue(std::mt19937& gen) {
  tree_.Reset();
  tree_.BuildUniform(BinaryTree::kRoot, tree_prior_.GetAlpha(), tree_prior_.GetBeta(), gen);
  Log::Debug("%s: starting tree has %d leaves", name_.c_str(), tree_.NumLeaves());
}

void RegressionTree::RandomPosterior(std::mt19937& gen) {
  SampleTopology(gen);
}

MHStepResult RegressionTree::SampleTopology(std::mt19937& gen) {
  return mh_step_.Step(*this, proposal_, gen);
}

json RegressionTree::to_json() const {
  json result_obj;
  result_obj.emplace("name", name_);
  result_obj.emplace("alpha", tree_prior_.GetAlpha());
  result_obj.emplace("beta", tree_prior_.GetBeta());
  result_obj.emplace("nu", GetLeafPrior().GetNu());
  result_obj.emplace("lambda", GetLeafPrior().GetLambda());
  result_obj.emplace("mubar", GetLeafPrior().GetPriorMean());
  result_obj.emplace("a", GetLeafPrior().GetPrecisionMultiplier());
  result_obj.emplace("tree", tree_.to_json());
  return result_obj;
}

void RegressionTree::from_json(const json& model_json) {
  TreePrior tree_prior(model_json.at("alpha").get<double>(), model_json.at("beta").get<double>(),
                       model_json.at("tree").at("min_samples_leaf").get<data_size_t>());
  NormalInverseGammaPrior leaf_prior(model_json.at("nu").get<double>(), model_json.at("lambda").get<double>(),
                                     model_json.at("mubar").get<double>(), model_json.at("a").get<double>());
  std::string name = model_json.at("name").get<std::string>();
  // The tree validates itself before replacing anything, so nothing changes if it is rejected
  tree_.from_json(model_json.at("tree"));
  tree_prior_ = tree_prior;
  leaf_model_ = ConjugateLeafModel(leaf_prior);
  name_ = name;
}

} // namespace BayesTree
