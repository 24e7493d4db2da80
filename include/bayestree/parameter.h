/*!
 * Copyright (c) 2024 bayestree authors. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#ifndef BAYESTREE_PARAMETER_H_
#define BAYESTREE_PARAMETER_H_

#include <Eigen/Dense>

#include <random>
#include <string>

namespace BayesTree {

/*!
 * \brief Capability shared by every model quantity that an MCMC driver updates and records.
 *
 * A driver holds a list of `TrackedParameter*` and, each iteration, calls `RandomPosterior` on
 * each one, recording `Value()` whenever `Track()` is true.
 */
class TrackedParameter {
 public:
  virtual ~TrackedParameter() = default;
  virtual const std::string& Name() const = 0;
  /*! \brief Whether the driver should keep a trace of `Value()` */
  virtual bool Track() const = 0;
  /*! \brief Current value, flattened to a vector */
  virtual Eigen::VectorXd Value() const = 0;
  /*! \brief Draw an initial state */
  virtual void SetStartingValue(std::mt19937& gen) = 0;
  /*! \brief Update the state with one draw conditional on everything else */
  virtual void RandomPosterior(std::mt19937& gen) = 0;
};

} // namespace BayesTree

#endif // BAYESTREE_PARAMETER_H_
