/*!
 * Copyright (c) 2016 Microsoft Corporation. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#include <bayestree/config.h>

#include <fstream>
#include <sstream>

namespace BayesTree {

void Config::KV2Map(std::unordered_map<std::string, std::vector<std::string>>* params, const char* kv) {
  std::vector<std::string> tmp_strs = Common::Split(kv, '=');
  if (tmp_strs.size() == 2 || tmp_strs.size() == 1) {
    std::string key = Common::RemoveQuotationSymbol(Common::Trim(tmp_strs[0]));
    std::string value = "";
    if (tmp_strs.size() == 2) {
      value = Common::RemoveQuotationSymbol(Common::Trim(tmp_strs[1]));
    }
    if (key.size() > 0) {
      params->operator[](key).emplace_back(value);
    }
  } else {
    Log::Warning("Unknown parameter %s", kv);
  }
}

void GetFirstValueAsInt(const std::unordered_map<std::string, std::vector<std::string>>& params, std::string key, int* out) {
  const auto pair = params.find(key);
  if (pair != params.end()) {
    auto candidate = pair->second[0].c_str();
    if (!Common::AtoiAndCheck(candidate, out)) {
      Log::Fatal("Parameter %s should be of type int, got \"%s\"", key.c_str(), candidate);
    }
  }
}

void Config::SetVerbosity(const std::unordered_map<std::string, std::vector<std::string>>& params) {
  int verbosity = Config().verbosity;
  GetFirstValueAsInt(params, "verbose", &verbosity);
  GetFirstValueAsInt(params, "verbosity", &verbosity);
  if (verbosity < 0) {
    BayesTree::Log::ResetLogLevel(BayesTree::LogLevel::Fatal);
  } else if (verbosity == 0) {
    BayesTree::Log::ResetLogLevel(BayesTree::LogLevel::Warning);
  } else if (verbosity == 1) {
    BayesTree::Log::ResetLogLevel(BayesTree::LogLevel::Info);
  } else {
    BayesTree::Log::ResetLogLevel(BayesTree::LogLevel::Debug);
  }
}

void Config::KeepFirstValues(const std::unordered_map<std::string, std::vector<std::string>>& params, std::unordered_map<std::string, std::string>* out) {
  for (auto pair = params.begin(); pair != params.end(); ++pair) {
    auto name = pair->first.c_str();
    auto values = pair->second;
    out->emplace(name, values[0]);
    for (size_t i = 1; i < pair->second.size(); ++i) {
      Log::Warning("%s is set=%s, %s=%s will be ignored. Current value: %s=%s",
        name, values[0].c_str(),
        name, values[i].c_str(),
        name, values[0].c_str());
    }
  }
}

std::unordered_map<std::string, std::string> Config::Str2Map(const char* parameters) {
  std::unordered_map<std::string, std::vector<std::string>> all_params;
  std::unordered_map<std::string, std::string> params;
  auto args = Common::Split(parameters, " \t\n\r");
  for (auto arg : args) {
    KV2Map(&all_params, Common::Trim(arg).c_str());
  }
  SetVerbosity(all_params);
  KeepFirstValues(all_params, &params);
  return params;
}

bool Config::ReadConfigFile(const std::string& filename, std::unordered_map<std::string, std::vector<std::string>>* params) {
  std::ifstream config_file(filename);
  if (!config_file.is_open()) {
    return false;
  }
  std::string line;
  while (std::getline(config_file, line)) {
    // remove str after "#"
    if (line.size() > 0 && std::string::npos != line.find_first_of("#")) {
      line.erase(line.find_first_of("#"));
    }
    line = Common::Trim(line);
    if (line.size() == 0) {
      continue;
    }
    KV2Map(params, line.c_str());
  }
  return true;
}

const std::unordered_set<std::string>& Config::parameter_set() {
  static std::unordered_set<std::string> params({
    "config",
    "verbose",
    "verbosity",
    "num_trees",
    "alpha",
    "beta",
    "k",
    "nu",
    "q",
    "min_samples_leaf",
    "num_burnin",
    "num_samples",
    "random_seed",
    "prob_grow",
    "prob_prune",
    "prob_change",
    "prob_swap",
    "num_observations",
    "num_features",
  });
  return params;
}

void Config::Set(const std::unordered_map<std::string, std::string>& params) {
  for (const auto& pair : params) {
    if (parameter_set().count(pair.first) == 0) {
      Log::Warning("Unknown parameter: %s", pair.first.c_str());
    }
  }
  GetMembersFromString(params);
  CheckParamConflict();
}

void Config::GetMembersFromString(const std::unordered_map<std::string, std::string>& params) {
  GetInt(params, "num_trees", &num_trees);
  CHECK_GT(num_trees, 0);

  GetDouble(params, "alpha", &alpha);
  CHECK_GT(alpha, 0.0);
  CHECK_LT(alpha, 1.0);

  GetDouble(params, "beta", &beta);
  CHECK_GE(beta, 0.0);

  GetDouble(params, "k", &k);
  CHECK_GT(k, 0.0);

  GetDouble(params, "nu", &nu);
  CHECK_GT(nu, 0.0);

  GetDouble(params, "q", &q);
  CHECK_GT(q, 0.0);
  CHECK_LT(q, 1.0);

  GetInt(params, "min_samples_leaf", &min_samples_leaf);
  CHECK_GT(min_samples_leaf, 0);

  GetInt(params, "num_burnin", &num_burnin);
  CHECK_GE(num_burnin, 0);

  GetInt(params, "num_samples", &num_samples);
  CHECK_GE(num_samples, 0);

  GetInt(params, "random_seed", &random_seed);

  GetInt(params, "verbose", &verbosity);
  GetInt(params, "verbosity", &verbosity);

  GetDouble(params, "prob_grow", &prob_grow);
  CHECK_GE(prob_grow, 0.0);

  GetDouble(params, "prob_prune", &prob_prune);
  CHECK_GE(prob_prune, 0.0);

  GetDouble(params, "prob_change", &prob_change);
  CHECK_GE(prob_change, 0.0);

  GetDouble(params, "prob_swap", &prob_swap);
  CHECK_GE(prob_swap, 0.0);

  GetInt(params, "num_observations", &num_observations);
  CHECK_GT(num_observations, 1);

  GetInt(params, "num_features", &num_features);
  CHECK_GT(num_features, 0);
}

void Config::CheckParamConflict() {
  if (!(prob_grow + prob_prune + prob_change + prob_swap > 0.0)) {
    Log::Fatal("At least one of prob_grow, prob_prune, prob_change and prob_swap must be positive");
  }
  if (num_observations < min_samples_leaf) {
    Log::Warning("num_observations=%d is below min_samples_leaf=%d, trees will not split", num_observations, min_samples_leaf);
  }
}

std::string Config::ToString() const {
  std::stringstream str_buf;
  str_buf << "[num_trees: " << num_trees << "]\n";
  str_buf << "[alpha: " << alpha << "]\n";
  str_buf << "[beta: " << beta << "]\n";
  str_buf << "[k: " << k << "]\n";
  str_buf << "[nu: " << nu << "]\n";
  str_buf << "[q: " << q << "]\n";
  str_buf << "[min_samples_leaf: " << min_samples_leaf << "]\n";
  str_buf << "[num_burnin: " << num_burnin << "]\n";
  str_buf << "[num_samples: " << num_samples << "]\n";
  str_buf << "[random_seed: " << random_seed << "]\n";
  str_buf << "[verbosity: " << verbosity << "]\n";
  str_buf << "[prob_grow: " << prob_grow << "]\n";
  str_buf << "[prob_prune: " << prob_prune << "]\n";
  str_buf << "[prob_change: " << prob_change << "]\n";
  str_buf << "[prob_swap: " << prob_swap << "]\n";
  str_buf << "[num_observations: " << num_observations << "]\n";
  str_buf << "[num_features: " << num_features << "]\n";
  return str_buf.str();
}

} // namespace BayesTree
