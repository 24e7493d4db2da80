/*! Copyright (c) 2024 bayestree authors. All rights reserved. */
#ifndef BAYESTREE_IG_SAMPLER_H_
#define BAYESTREE_IG_SAMPLER_H_

#include <random>

namespace BayesTree {

class InverseGammaSampler {
 public:
  InverseGammaSampler() {}
  ~InverseGammaSampler() {}
  /*!
   * \brief Draw from IG(a, b)
   *
   * \param a Shape
   * \param b Scale, or rate if `scale_param` is false
   */
  double Sample(double a, double b, std::mt19937& gen, bool scale_param = true) {
    // 1 / gamma(a, b) ~ IG(a, b) when b is a rate parameter, and std::gamma_distribution
    // is parameterized by scale, so an IG scale becomes a gamma scale of 1 / b.
    double gamma_scale = scale_param ? 1./b : b;
    gamma_dist_ = std::gamma_distribution<double>(a, gamma_scale);
    return (1/gamma_dist_(gen));
  }
 private:
  std::gamma_distribution<double> gamma_dist_;
};

} // namespace BayesTree

#endif // BAYESTREE_IG_SAMPLER_H_
