/*! Copyright (c) 2024 bayestree authors. All rights reserved. */
#include <bayestree/ensemble.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace BayesTree {

EnsembleModel::EnsembleModel(const Eigen::MatrixXd& covariates, const Eigen::VectorXd& outcome, const Config& config, std::mt19937& gen)
    : covariates_(std::make_shared<const Eigen::MatrixXd>(covariates)), scaler_(outcome), config_(config) {
  if (covariates.rows() != outcome.size()) {
    Log::Fatal("Covariates have %d rows but the outcome has %d entries",
               static_cast<int>(covariates.rows()), static_cast<int>(outcome.size()));
  }
  if (config_.num_trees < 1) {
    Log::Fatal("num_trees must be positive, got %d", config_.num_trees);
  }
  if (!(config_.k > 0.0)) {
    Log::Fatal("k must be positive, got %f", config_.k);
  }
  outcome_ = scaler_.Transform(outcome);
  num_trees_ = config_.num_trees;
  sigmu_ = 0.5 / (config_.k * std::sqrt(static_cast<double>(num_trees_)));
  a_ = 1.0 / (sigmu_ * sigmu_);

  double sigma_hat = EstimateResidualStandardDeviation(*covariates_, outcome_);
  lambda_ = CalibrateVariancePriorScale(sigma_hat, config_.nu, config_.q);
  Log::Info("Error variance prior: nu = %f, lambda = %f (sigma hat %f on the scaled outcome)", config_.nu, lambda_, sigma_hat);

  NormalInverseGammaPrior leaf_prior(config_.nu, lambda_, 0.0, a_);
  TreePrior tree_prior(config_.alpha, config_.beta, config_.min_samples_leaf);
  TreeProposal proposal(config_.prob_grow, config_.prob_prune, config_.prob_change, config_.prob_swap);

  data_size_t n = outcome_.size();
  total_fit_ = Eigen::VectorXd::Zero(n);
  residual_ = outcome_;
  variance_.reset(new ErrorVarianceParameter(residual_, config_.nu, lambda_, sigma_hat * sigma_hat, "sigma2"));

  trees_.resize(num_trees_);
  leaf_means_.resize(num_trees_);
  tree_fits_.resize(num_trees_);
  for (int j = 0; j < num_trees_; j++) {
    std::string tree_name = "tree_" + std::to_string(j);
    trees_[j].reset(new RegressionTree(covariates_, outcome_, leaf_prior, tree_prior, tree_name, true, proposal));
    leaf_means_[j].reset(new LeafMeanParameter(*trees_[j], *variance_, "mu_" + std::to_string(j)));
    tree_fits_[j] = Eigen::VectorXd::Zero(n);
  }

  variance_->SetStartingValue(gen);
  for (int j = 0; j < num_trees_; j++) {
    trees_[j]->SetStartingValue(gen);
    leaf_means_[j]->SetStartingValue(gen);
    RefreshTreeFit(j);
  }
  residual_ = outcome_ - total_fit_;
  fit_sum_ = Eigen::VectorXd::Zero(n);
}

void EnsembleModel::RefreshTreeFit(int tree_num) {
  Eigen::VectorXd new_fit = trees_[tree_num]->Tree().Predict(*covariates_);
  total_fit_ += new_fit - tree_fits_[tree_num];
  tree_fits_[tree_num] = new_fit;
}

void EnsembleModel::SampleOneIter(std::mt19937& gen) {
  for (int j = 0; j < num_trees_; j++) {
    // Partial residual net of every other tree
    Eigen::VectorXd partial_residual = outcome_ - (total_fit_ - tree_fits_[j]);
    trees_[j]->Tree().SetOutcome(partial_residual);
    trees_[j]->RandomPosterior(gen);
    leaf_means_[j]->RandomPosterior(gen);
    RefreshTreeFit(j);
  }
  residual_ = outcome_ - total_fit_;
  variance_->RandomPosterior(gen);
}

void EnsembleModel::Run(std::mt19937& gen) {
  int num_iter = config_.num_burnin + config_.num_samples;
  int progress_interval = std::max(1, num_iter / 10);
  for (int iter = 0; iter < num_iter; iter++) {
    SampleOneIter(gen);
    if (iter >= config_.num_burnin) {
      variance_samples_.push_back(variance_->GetVariance());
      fit_sum_ += total_fit_;
      num_retained_++;
    }
    if ((iter + 1) % progress_interval == 0 || iter + 1 == num_iter) {
      Log::Info("Iteration %d of %d (%s): sigma = %f", iter + 1, num_iter, iter < config_.num_burnin ? "burn-in" : "sampling",
                std::sqrt(scaler_.InverseTransformVariance(variance_->GetVariance())));
    }
  }
}

Eigen::VectorXd EnsembleModel::Predict(const Eigen::MatrixXd& covariates) const {
  Eigen::VectorXd scaled = Eigen::VectorXd::Zero(covariates.rows());
  for (int j = 0; j < num_trees_; j++) {
    scaled += trees_[j]->Tree().Predict(covariates);
  }
  return scaler_.InverseTransform(scaled);
}

std::vector<double> EnsembleModel::ErrorVarianceSamples() const {
  std::vector<double> result;
  result.reserve(variance_samples_.size());
  for (double variance : variance_samples_) {
    result.push_back(scaler_.InverseTransformVariance(variance));
  }
  return result;
}

Eigen::VectorXd EnsembleModel::PosteriorMeanFit() const {
  if (num_retained_ == 0) {
    Log::Fatal("No retained samples, run the sampler with num_samples > 0 first");
  }
  return scaler_.InverseTransform(Eigen::VectorXd(fit_sum_ / num_retained_));
}

double EnsembleModel::AcceptanceRate(TreeMoveType move) const {
  std::int64_t proposed = 0;
  std::int64_t accepted = 0;
  for (const auto& tree : trees_) {
    proposed += tree->Sampler().NumProposed(move);
    accepted += tree->Sampler().NumAccepted(move);
  }
  if (proposed == 0) return 0.0;
  return static_cast<double>(accepted) / static_cast<double>(proposed);
}

json EnsembleModel::to_json() const {
  json result_obj;
  result_obj.emplace("num_trees", num_trees_);
  result_obj.emplace("k", config_.k);
  result_obj.emplace("sigmu", sigmu_);
  result_obj.emplace("a", a_);
  result_obj.emplace("nu", config_.nu);
  result_obj.emplace("lambda", lambda_);
  result_obj.emplace("sigma2", variance_->GetVariance());
  result_obj.emplace("outcome_min", scaler_.Minimum());
  result_obj.emplace("outcome_range", scaler_.Range());
  for (int i = 0; i < num_trees_; i++) {
    std::string tree_label = "tree_" + std::to_string(i);
    result_obj.emplace(tree_label, trees_[i]->to_json());
  }
  return result_obj;
}

} // namespace BayesTree
