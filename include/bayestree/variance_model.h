/*!
 * Copyright (c) 2024 bayestree authors. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#ifndef BAYESTREE_VARIANCE_MODEL_H_
#define BAYESTREE_VARIANCE_MODEL_H_

#include <Eigen/Dense>
#include <bayestree/ig_sampler.h>
#include <bayestree/log.h>
#include <bayestree/meta.h>
#include <bayestree/parameter.h>

#include <random>
#include <string>

namespace BayesTree {

/*!
 * \brief Rough estimate of the error standard deviation of `outcome`.
 *
 * Uses the residuals of a least squares fit with intercept when there are more rows than
 * columns + 1, and the sample standard deviation otherwise (or when the fit is exact).
 */
double EstimateResidualStandardDeviation(const Eigen::MatrixXd& covariates, const Eigen::VectorXd& outcome);

/*!
 * \brief Prior scale `lambda` of the error variance, placing `sigma_hat^2` at the `(1 + q) / 2` quantile
 * of a chi-square with `nu` degrees of freedom: `lambda = sigma_hat^2 * chi2_quantile(nu, (1 + q) / 2) / nu`
 */
double CalibrateVariancePriorScale(double sigma_hat, double nu, double q);

/*! \brief Posterior computation for a global homoskedastic error variance with an IG(nu / 2, nu * lambda / 2) prior */
class GlobalHomoskedasticVarianceModel {
 public:
  GlobalHomoskedasticVarianceModel() {ig_sampler_ = InverseGammaSampler();}
  ~GlobalHomoskedasticVarianceModel() {}
  double PosteriorShape(const Eigen::VectorXd& residuals, double nu) const {
    data_size_t n = residuals.rows();
    return (nu/2.0) + (n/2.0);
  }
  double PosteriorScale(const Eigen::VectorXd& residuals, double nu, double lambda) const {
    return (nu*lambda/2.0) + (residuals.squaredNorm()/2.0);
  }
  double SampleVarianceParameter(const Eigen::VectorXd& residuals, double nu, double lambda, std::mt19937& gen) {
    double ig_shape = PosteriorShape(residuals, nu);
    double ig_scale = PosteriorScale(residuals, nu, lambda);
    return ig_sampler_.Sample(ig_shape, ig_scale, gen);
  }
 private:
  InverseGammaSampler ig_sampler_;
};

/*!
 * \brief Tracked error variance, updated by a conditional Gibbs draw given the current residuals
 */
class ErrorVarianceParameter : public TrackedParameter {
 public:
  /*!
   * \param residual Residual vector maintained by the caller, must outlive this object
   * \param nu Prior degrees of freedom
   * \param lambda Prior scale
   * \param starting_variance Value restored by `SetStartingValue`
   */
  ErrorVarianceParameter(const Eigen::VectorXd& residual, double nu, double lambda, double starting_variance,
                         std::string name, bool track = true);
  ~ErrorVarianceParameter() {}
  const std::string& Name() const override {return name_;}
  bool Track() const override {return track_;}
  Eigen::VectorXd Value() const override {return Eigen::VectorXd::Constant(1, variance_);}
  void SetStartingValue(std::mt19937& gen) override;
  void RandomPosterior(std::mt19937& gen) override;
  double GetVariance() const {return variance_;}
  void SetVariance(double variance);
  double GetNu() const {return nu_;}
  double GetLambda() const {return lambda_;}
 private:
  const Eigen::VectorXd& residual_;
  double nu_;
  double lambda_;
  double starting_variance_;
  double variance_;
  std::string name_;
  bool track_;
  GlobalHomoskedasticVarianceModel variance_model_;
};

} // namespace BayesTree

#endif // BAYESTREE_VARIANCE_MODEL_H_
