/*!
 * Based on the design of the LightGBM command line program, released under the following terms
 *
 * Copyright (c) 2016 Microsoft Corporation. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#include "simulate_data.h"
#include <bayestree/config.h>
#include <bayestree/data.h>
#include <bayestree/ensemble.h>
#include <bayestree/log.h>

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace BayesTree {

Config LoadConfig(int argc, char** argv) {
  Config config_;
  std::unordered_map<std::string, std::vector<std::string>> all_params;
  std::unordered_map<std::string, std::string> params;
  for (int i = 1; i < argc; ++i) {
    Config::KV2Map(&all_params, argv[i]);
  }
  // read parameters from config file
  bool config_file_ok = true;
  if (all_params.count("config") > 0) {
    config_file_ok = Config::ReadConfigFile(all_params["config"][0], &all_params);
  }
  Config::SetVerbosity(all_params);
  // de-duplicate params
  Config::KeepFirstValues(all_params, &params);
  if (!config_file_ok) {
    Log::Warning("Config file %s doesn't exist, will ignore", params["config"].c_str());
  }
  config_.Set(params);
  Log::Info("Finished loading parameters");
  Log::Debug("Parameters:\n%s", config_.ToString().c_str());
  return config_;
}

void RunDebug(const Config& config) {
  std::mt19937 gen;
  if (config.random_seed < 0) {
    std::random_device rd;
    gen = std::mt19937(rd());
  } else {
    gen = std::mt19937(config.random_seed);
  }

  // Generate simulated dataset and load it
  Log::Info("Generating a simulated dataset with %d rows and %d features", config.num_observations, config.num_features);
  data_size_t n = config.num_observations;
  int p = config.num_features;
  std::vector<double> raw_data = SimulateTabularDataset(n, p, 1234);
  ColumnMatrix data(raw_data.data(), n, p + 1, true);
  Eigen::MatrixXd covariates = data.GetData().rightCols(p);
  Eigen::VectorXd outcome = data.GetData().col(0);

  EnsembleModel model(covariates, outcome, config, gen);
  model.Run(gen);

  Eigen::VectorXd fit = model.NumRetainedSamples() > 0 ? model.PosteriorMeanFit() : model.Predict(covariates);
  double rmse = std::sqrt((fit - outcome).squaredNorm() / n);
  std::vector<double> variance_draws = model.ErrorVarianceSamples();
  double mean_sigma = 0.0;
  for (double variance : variance_draws) mean_sigma += std::sqrt(variance);
  if (!variance_draws.empty()) mean_sigma /= variance_draws.size();

  Log::Info("In-sample RMSE: %f", rmse);
  Log::Info("Posterior mean of sigma: %f (simulated noise sd 1.0)", mean_sigma);
  for (int m = 0; m < kNumTreeMoveTypes; m++) {
    TreeMoveType move = static_cast<TreeMoveType>(m);
    Log::Info("Acceptance rate of %s moves: %f", TreeMoveTypeToString(move).c_str(), model.AcceptanceRate(move));
  }
  Log::Debug("Final state of the first tree:\n%s", model.GetTree(0).Tree().ToString().c_str());
}

} // namespace BayesTree

int main(int argc, char** argv) {
  bool success = false;
  try {
    BayesTree::Config config_ = BayesTree::LoadConfig(argc, argv);
    BayesTree::RunDebug(config_);

    // Set the exit condition to indicate the program ran without exceptions
    success = true;
  }
  catch (const std::exception& ex) {
    std::cerr << "Met Exceptions:" << std::endl;
    std::cerr << ex.what() << std::endl;
  }
  catch (const std::string& ex) {
    std::cerr << "Met Exceptions:" << std::endl;
    std::cerr << ex << std::endl;
  }
  catch (...) {
    std::cerr << "Unknown Exceptions" << std::endl;
  }

  if (!success) {
    exit(-1);
  }
}
