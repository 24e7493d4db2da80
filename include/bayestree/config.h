/*!
 * Copyright (c) 2024 bayestree authors. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 *
 * Parameter parsing is adapted from LightGBM's config, which carries the following copyright:
 * Copyright (c) 2016 Microsoft Corporation. All rights reserved.
 */
#ifndef BAYESTREE_CONFIG_H_
#define BAYESTREE_CONFIG_H_

#include <bayestree/common.h>
#include <bayestree/log.h>
#include <bayestree/meta.h>

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace BayesTree {

struct Config {
 public:
  std::string ToString() const;
  inline static bool GetInt(
    const std::unordered_map<std::string, std::string>& params,
    const std::string& name, int* out);

  inline static bool GetDouble(
    const std::unordered_map<std::string, std::string>& params,
    const std::string& name, double* out);

  static void KeepFirstValues(const std::unordered_map<std::string, std::vector<std::string>>& params, std::unordered_map<std::string, std::string>* out);

  static void SetVerbosity(const std::unordered_map<std::string, std::vector<std::string>>& params);

  /*! \brief Parse whitespace separated `key=value` pairs, keeping the first value of each key */
  static std::unordered_map<std::string, std::string> Str2Map(const char* parameters);

  static void KV2Map(std::unordered_map<std::string, std::vector<std::string>>* params, const char* kv);

  /*!
   * \brief Add every `key=value` line of a config file to `params`, ignoring text after `#`
   * \return false if the file could not be read
   */
  static bool ReadConfigFile(const std::string& filename, std::unordered_map<std::string, std::vector<std::string>>* params);

  /*! \brief Names of every supported parameter */
  static const std::unordered_set<std::string>& parameter_set();

  // desc = number of trees in the sum-of-trees ensemble
  // check = >0
  int num_trees = 200;

  // desc = base split probability of the tree prior, alpha * (1 + depth)^(-beta)
  // check = >0.0 and <1.0
  double alpha = 0.95;

  // desc = depth decay exponent of the tree prior
  // check = >=0.0
  double beta = 2.0;

  // desc = number of prior standard deviations between the scaled outcome mean and the edge of its range
  // check = >0.0
  double k = 2.0;

  // desc = degrees of freedom of the error variance prior
  // check = >0.0
  double nu = 3.0;

  // desc = quantile of the error variance prior placed at the data-based variance estimate
  // check = >0.0 and <1.0
  double q = 0.90;

  // desc = minimal number of rows in one leaf
  // check = >0
  int min_samples_leaf = 5;

  // desc = number of sampler iterations to discard
  // check = >=0
  int num_burnin = 100;

  // desc = number of sampler iterations to retain
  // check = >=0
  int num_samples = 100;

  // desc = seed of the random number generator, -1 draws a seed from std::random_device
  int random_seed = -1;

  // desc = controls the level of logging
  // desc = ``< 0``: Fatal, ``= 0``: Warning, ``= 1``: Info, ``> 1``: Debug
  int verbosity = 1;

  // desc = relative weight of the grow move
  // check = >=0.0
  double prob_grow = 0.25;

  // desc = relative weight of the prune move
  // check = >=0.0
  double prob_prune = 0.25;

  // desc = relative weight of the change move
  // check = >=0.0
  double prob_change = 0.40;

  // desc = relative weight of the swap move
  // check = >=0.0
  double prob_swap = 0.10;

  // desc = number of rows of the simulated dataset used by the debug program
  // check = >1
  int num_observations = 500;

  // desc = number of columns of the simulated dataset used by the debug program
  // check = >0
  int num_features = 5;

  /*!
   * \brief Apply and validate parameters. Unknown keys are ignored with a warning, malformed or out-of-range values are fatal
   */
  void Set(const std::unordered_map<std::string, std::string>& params);

 private:
  void GetMembersFromString(const std::unordered_map<std::string, std::string>& params);
  void CheckParamConflict();
};

inline bool Config::GetInt(
  const std::unordered_map<std::string, std::string>& params,
  const std::string& name, int* out) {
  if (params.count(name) > 0 && !params.at(name).empty()) {
    if (!Common::AtoiAndCheck(params.at(name).c_str(), out)) {
      Log::Fatal("Parameter %s should be of type int, got \"%s\"",
                 name.c_str(), params.at(name).c_str());
    }
    return true;
  }
  return false;
}

inline bool Config::GetDouble(
  const std::unordered_map<std::string, std::string>& params,
  const std::string& name, double* out) {
  if (params.count(name) > 0 && !params.at(name).empty()) {
    if (!Common::AtofAndCheck(params.at(name).c_str(), out)) {
      Log::Fatal("Parameter %s should be of type double, got \"%s\"",
                 name.c_str(), params.at(name).c_str());
    }
    return true;
  }
  return false;
}

}   // namespace BayesTree

#endif   // BAYESTREE_CONFIG_H_
