/*!
 * Copyright (c) 2024 bayestree authors. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#ifndef BAYESTREE_TREE_SAMPLER_H_
#define BAYESTREE_TREE_SAMPLER_H_

#include <bayestree/log.h>
#include <bayestree/meta.h>
#include <bayestree/tree.h>

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace BayesTree {

class RegressionTree;

/*! \brief Topology move drawn by a `TreeProposal` */
enum class TreeMoveType : std::int8_t {
  kGrow = 0,
  kPrune = 1,
  kChange = 2,
  kSwap = 3
};

constexpr int kNumTreeMoveTypes = 4;

/*! \brief Get string representation of TreeMoveType */
std::string TreeMoveTypeToString(TreeMoveType move);

/*!
 * \brief Mixture proposal over the grow / prune / change / swap moves.
 *
 * Grow and prune, and change and swap, are treated as symmetric pairs so the proposal
 * contributes nothing to the Metropolis-Hastings ratio.
 */
class TreeProposal {
 public:
  /*! \brief Mixture weights, normalized internally; all must be non-negative with a positive sum */
  TreeProposal(double prob_grow = 0.25, double prob_prune = 0.25, double prob_change = 0.25, double prob_swap = 0.25);
  ~TreeProposal() {}
  /*! \brief Weights used for each member of a sum-of-trees ensemble */
  static TreeProposal EnsembleDefault() {return TreeProposal(0.25, 0.25, 0.40, 0.10);}
  TreeMoveType DrawMove(std::mt19937& gen);
  /*! \brief Apply `move` to `tree`. Returns whether the tree changed */
  static bool ApplyMove(TreeMoveType move, BinaryTree& tree, std::mt19937& gen);
  double MoveProbability(TreeMoveType move) const {return move_probs_[static_cast<int>(move)];}
 private:
  std::vector<double> move_probs_;
  std::discrete_distribution<int> move_dist_;
};

/*! \brief Result of one Metropolis-Hastings topology update */
struct MHStepResult {
  TreeMoveType move;
  /*! \brief Whether the drawn move changed the tree before the accept / reject test */
  bool committed;
  bool accepted;
  double log_mh_ratio;
};

/*!
 * \brief Metropolis-Hastings update of a regression tree's topology, rolling the tree back on rejection
 */
class TreeMHStep {
 public:
  TreeMHStep() {
    num_proposed_.fill(0);
    num_accepted_.fill(0);
  }
  ~TreeMHStep() {}
  /*!
   * \brief Snapshot the tree, apply a move drawn from `proposal`, and accept it with probability
   * `min(1, exp(new log density - old log density))`, restoring the snapshot otherwise
   */
  MHStepResult Step(RegressionTree& model, TreeProposal& proposal, std::mt19937& gen);
  std::int64_t NumProposed(TreeMoveType move) const {return num_proposed_[static_cast<int>(move)];}
  std::int64_t NumAccepted(TreeMoveType move) const {return num_accepted_[static_cast<int>(move)];}
  double AcceptanceRate(TreeMoveType move) const;
  void ResetCounts() {
    num_proposed_.fill(0);
    num_accepted_.fill(0);
  }
 private:
  std::array<std::int64_t, kNumTreeMoveTypes> num_proposed_;
  std::array<std::int64_t, kNumTreeMoveTypes> num_accepted_;
};

} // namespace BayesTree

#endif // BAYESTREE_TREE_SAMPLER_H_
