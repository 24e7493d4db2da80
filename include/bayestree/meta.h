/*!
 * Constants and type definitions used elsewhere in the codebase
 *
 * Parts of this file are adapted from LightGBM, which carries
 * the following copyright information:
 *
 * Copyright (c) 2016 Microsoft Corporation. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#ifndef BAYESTREE_META_H_
#define BAYESTREE_META_H_

#include <cstdint>
#include <boost/math/constants/constants.hpp>

namespace BayesTree {

/*! \brief Double precision pi constant */
static constexpr double pi_constant = boost::math::constants::pi<double>();

/*! \brief Type of data size */
typedef int32_t data_size_t;

/*! \brief Type of feature index */
typedef int32_t feature_size_t;

/*! \brief Type of node index */
typedef int32_t node_t;

/*! \brief Type of split condition */
typedef double split_cond_t;

}  // namespace BayesTree

#endif  // BAYESTREE_META_H_
