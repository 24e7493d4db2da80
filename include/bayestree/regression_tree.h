/*!
 * Copyright (c) 2024 bayestree authors. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#ifndef BAYESTREE_REGRESSION_TREE_H_
#define BAYESTREE_REGRESSION_TREE_H_

#include <Eigen/Dense>
#include <bayestree/leaf_model.h>
#include <bayestree/log.h>
#include <bayestree/meta.h>
#include <bayestree/parameter.h>
#include <bayestree/prior.h>
#include <bayestree/tree.h>
#include <bayestree/tree_sampler.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <random>
#include <string>

namespace BayesTree {

/*!
 * \brief A single Bayesian regression tree: a `BinaryTree` together with its tree prior and
 * conjugate leaf model, exposing the log posterior density of a topology.
 *
 * As a `TrackedParameter`, the starting value is a tree drawn from the prior and each posterior
 * update is one Metropolis-Hastings topology move.
 */
class RegressionTree : public TrackedParameter {
 public:
  /*!
   * \brief Construct a single-node regression tree
   *
   * \param covariates Covariate matrix, shared with other trees
   * \param outcome Outcome (or partial residual) the tree is fit against
   * \param leaf_prior Conjugate prior hyperparameters (nu, lambda, mubar, a)
   * \param tree_prior Split prior (alpha, beta) and minimum leaf size
   * \param name Name under which the driver records this tree
   * \param track Whether the driver should keep a trace of the leaf values
   * \param proposal Mixture of topology moves used by `RandomPosterior`
   */
  RegressionTree(std::shared_ptr<const Eigen::MatrixXd> covariates, const Eigen::VectorXd& outcome,
                 const NormalInverseGammaPrior& leaf_prior, const TreePrior& tree_prior, std::string name,
                 bool track = true, const TreeProposal& proposal = TreeProposal());
  ~RegressionTree() {}

  BinaryTree& Tree() {return tree_;}
  const BinaryTree& Tree() const {return tree_;}
  ConjugateLeafModel& LeafModel() {return leaf_model_;}
  const TreePrior& GetTreePrior() const {return tree_prior_;}
  const NormalInverseGammaPrior& GetLeafPrior() const {return leaf_model_.GetPrior();}
  const TreeMHStep& Sampler() const {return mh_step_;}

  /*!
   * \brief Log prior probability of the topology of `tree`
   *
   * Each leaf contributes the probability of not splitting at its depth. Each internal node
   * contributes the probability of splitting at its depth and a uniform choice among its
   * eligible features and routed rows.
   */
  double LogPrior(const BinaryTree& tree) const;
  /*! \brief Log marginal likelihood of the outcome held by `tree`, summed over its leaves. A leaf with no rows is fatal */
  double LogLikelihood(const BinaryTree& tree) const;
  /*! \brief Unnormalized log posterior density, the Metropolis-Hastings target */
  double LogDensity(const BinaryTree& tree) const {return LogLikelihood(tree) + LogPrior(tree);}
  double LogDensity() const {return LogDensity(tree_);}

  const std::string& Name() const override {return name_;}
  bool Track() const override {return track_;}
  /*! \brief Leaf values, in the tree's leaf order */
  Eigen::VectorXd Value() const override;
  /*! \brief Replace the tree with a fresh draw from the tree prior */
  void SetStartingValue(std::mt19937& gen) override;
  /*! \brief One Metropolis-Hastings topology update */
  void RandomPosterior(std::mt19937& gen) override;
  /*! \brief One Metropolis-Hastings topology update, reporting the drawn move and its outcome */
  MHStepResult SampleTopology(std::mt19937& gen);

  json to_json() const;
  void from_json(const json& model_json);

 private:
  BinaryTree tree_;
  TreePrior tree_prior_;
  ConjugateLeafModel leaf_model_;
  TreeProposal proposal_;
  TreeMHStep mh_step_;
  std::string name_;
  bool track_;
};

} // namespace BayesTree

#endif // BAYESTREE_REGRESSION_TREE_H_
