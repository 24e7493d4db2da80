/*! Copyright (c) 2024 bayestree authors. All rights reserved. */
#include <bayestree/variance_model.h>

#include <boost/math/distributions/chi_squared.hpp>

#include <cmath>
#include <limits>
#include <utility>

namespace BayesTree {

double EstimateResidualStandardDeviation(const Eigen::MatrixXd& covariates, const Eigen::VectorXd& outcome) {
  data_size_t n = outcome.size();
  data_size_t p = covariates.cols();
  CHECK_EQ(static_cast<data_size_t>(covariates.rows()), n);
  if (n < 2) {
    Log::Fatal("At least two observations are needed to estimate the error variance, got %d", n);
  }

  double sample_variance = (outcome.array() - outcome.mean()).square().sum() / (n - 1);
  if (n <= p + 1) {
    return std::sqrt(sample_variance);
  }

  Eigen::MatrixXd design(n, p + 1);
  design.col(0).setOnes();
  design.rightCols(p) = covariates;
  Eigen::VectorXd coefficients = design.colPivHouseholderQr().solve(outcome);
  Eigen::VectorXd residuals = outcome - design * coefficients;
  double residual_variance = residuals.squaredNorm() / (n - p - 1);
  if (!(residual_variance > std::numeric_limits<double>::epsilon() * sample_variance)) {
    Log::Warning("Least squares fit is exact, using the sample standard deviation of the outcome instead");
    return std::sqrt(sample_variance);
  }
  return std::sqrt(residual_variance);
}

double CalibrateVariancePriorScale(double sigma_hat, double nu, double q) {
  if (!(q > 0.0 && q < 1.0)) {
    Log::Fatal("Quantile q must lie in (0, 1), got %f", q);
  }
  if (!(nu > 0.0)) {
    Log::Fatal("nu must be positive, got %f", nu);
  }
  boost::math::chi_squared chi_sq(nu);
  double q_chi = boost::math::quantile(chi_sq, 0.5 * (1.0 + q));
  return sigma_hat * sigma_hat * q_chi / nu;
}

ErrorVarianceParameter::ErrorVarianceParameter(const Eigen::VectorXd& residual, double nu, double lambda,
                                               double starting_variance, std::string name, bool track)
    : residual_(residual), nu_(nu), lambda_(lambda), name_(std::move(name)), track_(track) {
  if (!(nu_ > 0.0) || !(lambda_ > 0.0)) {
    Log::Fatal("Error variance prior needs positive nu and lambda, got %f and %f", nu_, lambda_);
  }
  SetVariance(starting_variance);
  starting_variance_ = starting_variance;
}

void ErrorVarianceParameter::SetVariance(double variance) {
  if (!(variance > 0.0)) {
    Log::Fatal("Error variance must be positive, got %f", variance);
  }
  variance_ = variance;
}

void ErrorVarianceParameter::SetStartingValue(std::mt19937& gen) {
  variance_ = starting_variance_;
}

void ErrorVarianceParameter::RandomPosterior(std::mt19937& gen) {
  variance_ = variance_model_.SampleVarianceParameter(residual_, nu_, lambda_, gen);
  Log::Debug("%s: sampled error variance %f", name_.c_str(), variance_);
}

} // namespace BayesTree
