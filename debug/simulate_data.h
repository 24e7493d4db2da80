/*!
 * Copyright (c) 2024 bayestree authors
 */
#ifndef BAYESTREE_DEBUG_SIMULATE_DATA_H_
#define BAYESTREE_DEBUG_SIMULATE_DATA_H_

#include <bayestree/meta.h>

#include <random>
#include <vector>

namespace BayesTree {

/*! \brief Function that generates a regression dataset in row-major order, outcome in column 0
 *  Feature X_i are U(0,1) and outcome is f(X) + epsilon, where epsilon ~ N(0, noise_sd^2) and
 *  f(X) = 5 * 1(X_1 > 0.5) - 3 * 1(X_2 <= 0.3) + 2 X_3
 *  (terms referring to a missing column are dropped)
 */
inline std::vector<double> SimulateTabularDataset(data_size_t n, int p, int seed = 1234, double noise_sd = 1.0) {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<double> covariate_dist(0., 1.);
  std::normal_distribution<double> outcome_noise_dist(0., noise_sd);

  std::vector<double> data_vector(static_cast<size_t>(n) * (p + 1));
  for (data_size_t i = 0; i < n; i++) {
    double* row = data_vector.data() + static_cast<size_t>(i) * (p + 1);
    for (int j = 1; j < (p + 1); j++) {
      row[j] = covariate_dist(gen);
    }
    double mean = 5. * (row[1] > 0.5);
    if (p > 1) mean -= 3. * (row[2] <= 0.3);
    if (p > 2) mean += 2. * row[3];
    row[0] = mean + outcome_noise_dist(gen);
  }
  return data_vector;
}

} // namespace BayesTree

#endif  // BAYESTREE_DEBUG_SIMULATE_DATA_H_
