/*!
 * Copyright (c) 2024 bayestree authors. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#ifndef BAYESTREE_PRIOR_H_
#define BAYESTREE_PRIOR_H_

#include <bayestree/log.h>
#include <bayestree/meta.h>

#include <cmath>

namespace BayesTree {

/*! \brief Depth-decaying split prior: a node at depth d splits with probability `alpha * (1 + d)^(-beta)` */
class TreePrior {
 public:
  TreePrior(double alpha, double beta, data_size_t min_samples_in_leaf) {
    if (!(alpha > 0.0 && alpha < 1.0)) {
      Log::Fatal("alpha must lie in (0, 1), got %f", alpha);
    }
    if (!(beta >= 0.0)) {
      Log::Fatal("beta must be non-negative, got %f", beta);
    }
    if (min_samples_in_leaf < 1) {
      Log::Fatal("min_samples_leaf must be at least 1, got %d", min_samples_in_leaf);
    }
    alpha_ = alpha;
    beta_ = beta;
    min_samples_in_leaf_ = min_samples_in_leaf;
  }
  ~TreePrior() {}
  double GetAlpha() const {return alpha_;}
  double GetBeta() const {return beta_;}
  data_size_t GetMinSamplesLeaf() const {return min_samples_in_leaf_;}
  double SplitProbability(std::int32_t depth) const {
    return alpha_ * std::pow(1.0 + depth, -beta_);
  }
 private:
  double alpha_;
  double beta_;
  data_size_t min_samples_in_leaf_;
};

/*!
 * \brief Conjugate normal / inverse gamma prior on a leaf's (mean, variance) pair
 *
 * sigma^2 ~ IG(nu / 2, nu * lambda / 2) and mu | sigma^2 ~ N(mubar, sigma^2 / a).
 */
class NormalInverseGammaPrior {
 public:
  NormalInverseGammaPrior(double nu, double lambda, double mubar, double a) {
    if (!(nu > 0.0)) {
      Log::Fatal("nu must be positive, got %f", nu);
    }
    if (!(lambda > 0.0)) {
      Log::Fatal("lambda must be positive, got %f", lambda);
    }
    if (!(a > 0.0)) {
      Log::Fatal("Leaf mean precision multiplier a must be positive, got %f", a);
    }
    nu_ = nu;
    lambda_ = lambda;
    mubar_ = mubar;
    a_ = a;
  }
  ~NormalInverseGammaPrior() {}
  double GetNu() const {return nu_;}
  double GetLambda() const {return lambda_;}
  double GetPriorMean() const {return mubar_;}
  double GetPrecisionMultiplier() const {return a_;}
 private:
  double nu_;
  double lambda_;
  double mubar_;
  double a_;
};

} // namespace BayesTree

#endif // BAYESTREE_PRIOR_H_
