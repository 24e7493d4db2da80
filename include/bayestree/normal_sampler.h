/*! Copyright (c) 2024 bayestree authors. All rights reserved. */
#ifndef BAYESTREE_NORMAL_SAMPLER_H_
#define BAYESTREE_NORMAL_SAMPLER_H_

#include <cmath>
#include <random>

namespace BayesTree {

class UnivariateNormalSampler {
 public:
  UnivariateNormalSampler() {std_normal_dist_ = std::normal_distribution<double>(0.,1.);}
  ~UnivariateNormalSampler() {}
  double Sample(double mean, double variance, std::mt19937& gen) {
    return mean + std::sqrt(variance) * std_normal_dist_(gen);
  }
 private:
  /*! \brief Standard normal distribution */
  std::normal_distribution<double> std_normal_dist_;
};

} // namespace BayesTree

#endif // BAYESTREE_NORMAL_SAMPLER_H_
