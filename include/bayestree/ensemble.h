/*!
 * Copyright (c) 2024 bayestree authors. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#ifndef BAYESTREE_ENSEMBLE_H_
#define BAYESTREE_ENSEMBLE_H_

#include <Eigen/Dense>
#include <bayestree/config.h>
#include <bayestree/data.h>
#include <bayestree/leaf_model.h>
#include <bayestree/regression_tree.h>
#include <bayestree/tree_sampler.h>
#include <bayestree/variance_model.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <random>
#include <vector>

namespace BayesTree {

/*!
 * \defgroup ensemble_group Ensemble API
 *
 * \brief Sum-of-trees regression model fit by Bayesian backfitting.
 *
 * \{
 */

/*!
 * \brief Sum of `m` regression trees fit to an outcome rescaled onto [-0.5, 0.5].
 *
 * Each tree's leaf means have prior precision multiplier `a = 1 / sigmu^2` with
 * `sigmu = 0.5 / (k * sqrt(m))`, so that the sum of `m` leaf means keeps the same
 * prior scale whatever the ensemble size.
 */
class EnsembleModel {
 public:
  /*!
   * \brief Build the ensemble, calibrate the error variance prior and draw a starting state
   *
   * \param covariates Covariate matrix (rows are observations)
   * \param outcome Outcome on its original scale
   * \param config Hyperparameters and sampler settings
   * \param gen C++ random number generator used for the starting trees and leaf means
   */
  EnsembleModel(const Eigen::MatrixXd& covariates, const Eigen::VectorXd& outcome, const Config& config, std::mt19937& gen);
  ~EnsembleModel() {}
  EnsembleModel(EnsembleModel const&) = delete;
  EnsembleModel& operator=(EnsembleModel const&) = delete;

  /*!
   * \brief One backfitting sweep: each tree is updated against the outcome net of every other
   * tree's fit (one topology move, then a leaf mean draw), then the error variance is drawn
   */
  void SampleOneIter(std::mt19937& gen);
  /*! \brief `num_burnin` discarded sweeps followed by `num_samples` retained sweeps */
  void Run(std::mt19937& gen);

  int NumTrees() const {return num_trees_;}
  double LeafPriorScale() const {return sigmu_;}
  double LeafPrecisionMultiplier() const {return a_;}
  const OutcomeScaler& Scaler() const {return scaler_;}
  /*! \brief Outcome on the [-0.5, 0.5] scale */
  const Eigen::VectorXd& ScaledOutcome() const {return outcome_;}
  /*! \brief Current sum of tree fits on the [-0.5, 0.5] scale */
  const Eigen::VectorXd& TotalFit() const {return total_fit_;}
  const Eigen::VectorXd& TreeFit(int tree_num) const {return tree_fits_.at(tree_num);}
  const Eigen::VectorXd& Residual() const {return residual_;}
  RegressionTree& GetTree(int tree_num) {return *trees_.at(tree_num);}
  const RegressionTree& GetTree(int tree_num) const {return *trees_.at(tree_num);}
  const ErrorVarianceParameter& ErrorVariance() const {return *variance_;}

  /*! \brief Predictions of the current state on the original outcome scale */
  Eigen::VectorXd Predict(const Eigen::MatrixXd& covariates) const;
  /*! \brief Retained error variance draws, on the original outcome scale */
  std::vector<double> ErrorVarianceSamples() const;
  /*! \brief In-sample fit averaged over retained iterations, on the original outcome scale */
  Eigen::VectorXd PosteriorMeanFit() const;
  int NumRetainedSamples() const {return num_retained_;}
  /*! \brief Topology acceptance rate of `move`, pooled over every tree */
  double AcceptanceRate(TreeMoveType move) const;

  json to_json() const;

 private:
  void RefreshTreeFit(int tree_num);

  std::shared_ptr<const Eigen::MatrixXd> covariates_;
  OutcomeScaler scaler_;
  Eigen::VectorXd outcome_;
  Config config_;
  int num_trees_;
  double sigmu_;
  double a_;
  double lambda_;

  std::vector<std::unique_ptr<RegressionTree>> trees_;
  std::vector<std::unique_ptr<LeafMeanParameter>> leaf_means_;
  std::vector<Eigen::VectorXd> tree_fits_;
  Eigen::VectorXd total_fit_;
  Eigen::VectorXd residual_;
  std::unique_ptr<ErrorVarianceParameter> variance_;

  std::vector<double> variance_samples_;
  Eigen::VectorXd fit_sum_;
  int num_retained_{0};
};

/*! \} */ // end of ensemble_group

} // namespace BayesTree

#endif // BAYESTREE_ENSEMBLE_H_
