/*!
 * Copyright (c) 2024 bayestree authors. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#ifndef BAYESTREE_LEAF_MODEL_H_
#define BAYESTREE_LEAF_MODEL_H_

#include <Eigen/Dense>
#include <bayestree/log.h>
#include <bayestree/meta.h>
#include <bayestree/normal_sampler.h>
#include <bayestree/parameter.h>
#include <bayestree/prior.h>
#include <bayestree/tree.h>

#include <random>
#include <string>

namespace BayesTree {

/*!
 * \defgroup leaf_model_group Leaf Model API
 *
 * \brief Conjugate normal / inverse gamma model for the outcome within each leaf of a tree.
 *
 * Within leaf \f$\ell\f$ the outcome is modeled as \f$y_i \sim N(\mu_{\ell}, \sigma^2)\f$, with
 *
 *  \f[
 *    \sigma^2 \sim IG\left(\frac{\nu}{2}, \frac{\nu \lambda}{2}\right), \quad \mu_{\ell} \mid \sigma^2 \sim N\left(\bar{\mu}, \frac{\sigma^2}{a}\right)
 *  \f]
 *
 * Integrating out \f$\mu_{\ell}\f$ and \f$\sigma^2\f$ gives a leaf's log marginal likelihood
 *
 *  \f[
 *    -\frac{n}{2}\log \pi + \frac{\nu}{2}\log(\nu\lambda) + \frac{1}{2}\log\frac{a}{n + a} + \log\Gamma\left(\frac{n + \nu}{2}\right) - \log\Gamma\left(\frac{\nu}{2}\right) - \frac{n + \nu}{2}\log\left(s + \frac{n a}{n + a}(\bar{y} - \bar{\mu})^2 + \nu\lambda\right)
 *  \f]
 *
 * where \f$n\f$, \f$\bar{y}\f$ and \f$s = \sum_i (y_i - \bar{y})^2\f$ are computed over the rows routed to the leaf.
 * The conditional posterior of a leaf mean is
 *
 *  \f[
 *    \mu_{\ell} \mid \sigma^2, y \sim N\left(\frac{n\bar{y} + a\bar{\mu}}{n + a}, \frac{\sigma^2}{n + a}\right)
 *  \f]
 *
 * \{
 */

/*! \brief Count, mean and sum of squared deviations of the outcome in a node, accumulated with Welford's update */
class LeafSuffStat {
 public:
  data_size_t n;
  double mean;
  double sum_sq_dev;
  LeafSuffStat() {
    n = 0;
    mean = 0.0;
    sum_sq_dev = 0.0;
  }
  void IncrementSuffStat(double y) {
    n += 1;
    double delta = y - mean;
    mean += delta / n;
    sum_sq_dev += delta * (y - mean);
  }
  void ResetSuffStat() {
    n = 0;
    mean = 0.0;
    sum_sq_dev = 0.0;
  }
  data_size_t SampleSize() const {
    return n;
  }
};

/*! \brief Accumulate the outcome of the rows routed to node `nid` of `tree` */
LeafSuffStat AccumulateNodeSuffStat(const BinaryTree& tree, node_t nid);

/*! \brief Marginal likelihood and posterior computation for the conjugate constant leaf model */
class ConjugateLeafModel {
 public:
  explicit ConjugateLeafModel(const NormalInverseGammaPrior& prior) : prior_(prior) {normal_sampler_ = UnivariateNormalSampler();}
  ~ConjugateLeafModel() {}
  /*!
   * \brief Log marginal likelihood of the outcome in one leaf, integrating out the leaf mean and the variance
   *
   * \param suff_stat Sufficient statistics of a leaf with at least one row
   */
  double LeafLogMarginalLikelihood(const LeafSuffStat& suff_stat) const;
  double PosteriorParameterMean(const LeafSuffStat& suff_stat) const;
  double PosteriorParameterVariance(const LeafSuffStat& suff_stat, double global_variance) const;
  /*!
   * \brief Draw new parameters for every leaf node in `tree` from their conditional posterior, given the tree's current outcome
   *
   * \param tree Tree to be updated
   * \param global_variance Value of the error variance parameter
   * \param gen C++ random number generator
   */
  void SampleLeafParameters(BinaryTree& tree, double global_variance, std::mt19937& gen);
  /*! \brief Draw every leaf parameter of `tree` from the prior `N(mubar, global_variance / a)` */
  void SampleLeafPrior(BinaryTree& tree, double global_variance, std::mt19937& gen);
  const NormalInverseGammaPrior& GetPrior() const {return prior_;}
 private:
  NormalInverseGammaPrior prior_;
  UnivariateNormalSampler normal_sampler_;
};

class RegressionTree;
class ErrorVarianceParameter;

/*!
 * \brief Tracked parameter holding the leaf means of one regression tree, updated by a conditional Gibbs draw
 */
class LeafMeanParameter : public TrackedParameter {
 public:
  /*!
   * \param tree Tree whose leaf values are sampled, must outlive this object
   * \param variance Error variance supplying sigma^2, must outlive this object
   */
  LeafMeanParameter(RegressionTree& tree, const ErrorVarianceParameter& variance, std::string name, bool track = true);
  ~LeafMeanParameter() {}
  const std::string& Name() const override {return name_;}
  bool Track() const override {return track_;}
  /*! \brief Leaf values, in the tree's leaf order */
  Eigen::VectorXd Value() const override;
  void SetStartingValue(std::mt19937& gen) override;
  void RandomPosterior(std::mt19937& gen) override;
 private:
  RegressionTree& tree_;
  const ErrorVarianceParameter& variance_;
  std::string name_;
  bool track_;
};

/*! \} */ // end of leaf_model_group

} // namespace BayesTree

#endif // BAYESTREE_LEAF_MODEL_H_
