/*! Copyright (c) 2024 bayestree authors. All rights reserved. */
#include <bayestree/regression_tree.h>
#include <bayestree/tree_sampler.h>

#include <cmath>

namespace BayesTree {

std::string TreeMoveTypeToString(TreeMoveType move) {
  switch (move) {
    case TreeMoveType::kGrow:
      return "grow";
    case TreeMoveType::kPrune:
      return "prune";
    case TreeMoveType::kChange:
      return "change";
    case TreeMoveType::kSwap:
      return "swap";
  }
  return "";
}

TreeProposal::TreeProposal(double prob_grow, double prob_prune, double prob_change, double prob_swap) {
  move_probs_ = {prob_grow, prob_prune, prob_change, prob_swap};
  double total = 0.0;
  for (double prob : move_probs_) {
    if (!(prob >= 0.0)) {
      Log::Fatal("Tree move probabilities must be non-negative, got %f", prob);
    }
    total += prob;
  }
  if (!(total > 0.0)) {
    Log::Fatal("At least one tree move must have positive probability");
  }
  for (double& prob : move_probs_) {
    prob /= total;
  }
  move_dist_ = std::discrete_distribution<int>(move_probs_.begin(), move_probs_.end());
}

TreeMoveType TreeProposal::DrawMove(std::mt19937& gen) {
  return static_cast<TreeMoveType>(move_dist_(gen));
}

bool TreeProposal::ApplyMove(TreeMoveType move, BinaryTree& tree, std::mt19937& gen) {
  switch (move) {
    case TreeMoveType::kGrow:
      return tree.Grow(gen);
    case TreeMoveType::kPrune:
      return tree.Prune(gen);
    case TreeMoveType::kChange:
      return tree.Change(gen);
    case TreeMoveType::kSwap:
      return tree.Swap(gen);
  }
  return false;
}

MHStepResult TreeMHStep::Step(RegressionTree& model, TreeProposal& proposal, std::mt19937& gen) {
  BinaryTree& tree = model.Tree();
  MHStepResult result{proposal.DrawMove(gen), false, false, 0.0};
  num_proposed_[static_cast<int>(result.move)]++;

  TreeSnapshot snapshot = tree.Snapshot();
  double old_log_density = model.LogDensity(tree);
  result.committed = TreeProposal::ApplyMove(result.move, tree, gen);
  if (!result.committed) {
    return result;
  }

  double new_log_density = model.LogDensity(tree);
  result.log_mh_ratio = new_log_density - old_log_density;

  // Draw a uniform random variable and accept/reject the proposal on this basis
  std::uniform_real_distribution<double> mh_accept(0.0, 1.0);
  double log_acceptance_prob = std::log(mh_accept(gen));
  if (log_acceptance_prob <= result.log_mh_ratio) {
    result.accepted = true;
    num_accepted_[static_cast<int>(result.move)]++;
  } else {
    tree.Restore(snapshot);
  }
  Log::Debug("%s: %s proposal %s (log MH ratio %f)", model.Name().c_str(), TreeMoveTypeToString(result.move).c_str(),
             result.accepted ? "accepted" : "rejected", result.log_mh_ratio);
  return result;
}

double TreeMHStep::AcceptanceRate(TreeMoveType move) const {
  std::int64_t proposed = NumProposed(move);
  if (proposed == 0) return 0.0;
  return static_cast<double>(NumAccepted(move)) / static_cast<double>(proposed);
}

} // namespace BayesTree
