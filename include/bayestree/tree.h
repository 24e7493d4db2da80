/*!
 * Copyright (c) 2024 bayestree authors. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 *
 * Node storage is based largely on the tree classes in xgboost and treelite, both released
 * under the Apache license with the following copyright:
 * Copyright 2015-2023 by XGBoost Contributors
 * Copyright 2017-2021 by [treelite] Contributors
 */
#ifndef BAYESTREE_TREE_H_
#define BAYESTREE_TREE_H_

#include <Eigen/Dense>
#include <bayestree/log.h>
#include <bayestree/meta.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <stack>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace BayesTree {

/*! \brief Boolean mask over the (row, column) entries of the covariate matrix */
typedef Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic> BoolMatrix;
/*! \brief Boolean mask over the rows of the covariate matrix */
typedef Eigen::Array<bool, Eigen::Dynamic, 1> BoolVector;

/*!
 * \brief Numeric split rule carried by an internal node.
 *
 * Rows with `X[feature] <= threshold` are routed to the left child, all other rows to the right child.
 */
struct SplitRule {
  feature_size_t feature;
  split_cond_t threshold;
  bool operator==(const SplitRule& other) const {
    return feature == other.feature && threshold == other.threshold;
  }
  bool operator!=(const SplitRule& other) const { return !(*this == other); }
};

/*! \brief Result of `BinaryTree::Filter` */
struct NodeFilter {
  /*! \brief Per-column conjunction of the ancestor inequalities that constrain each column */
  BoolMatrix column_mask;
  /*! \brief Rows routed to the node (every column of `column_mask` true) */
  BoolVector row_mask;
};

/*! \brief Outcome of an attempted rule change on an internal node */
struct RuleChange {
  SplitRule attempted;
  SplitRule previous;
  bool committed;
};

/*!
 * \brief Complete copy of a tree's topology, used to roll back rejected proposals.
 *
 * Holds every slot vector, the allocator state and the node inventories, but not the data.
 * Its size follows the number of slots in use, not the number of ids ever handed out.
 */
struct TreeSnapshot {
  std::int32_t num_nodes;
  std::unordered_map<node_t, std::int32_t> node_slot;
  std::vector<std::int32_t> free_slots;
  std::vector<node_t> node_id;
  std::vector<node_t> parent;
  std::vector<node_t> cleft;
  std::vector<node_t> cright;
  std::vector<feature_size_t> split_index;
  std::vector<double> threshold;
  std::vector<double> leaf_value;
  std::vector<std::int32_t> depth;
  std::vector<node_t> leaves;
  std::vector<node_t> internal_nodes;
  std::vector<node_t> leaf_parents;
};

/*!
 * \brief Binary decision tree over a fixed covariate matrix, with the stochastic topology moves
 * (grow, prune, change, swap) used by Bayesian tree samplers.
 *
 * Node ids are handed out by a per-tree allocator in strictly increasing order and are never
 * reused once a node is pruned. Node data lives in parallel vectors indexed by storage slot,
 * and a map from live id to slot lets pruned slots be recycled by later splits. Every committing
 * mutation refreshes the leaf / internal / leaf parent inventories before it returns and bumps
 * the tree's generation counter.
 */
class BinaryTree {
 public:
  static constexpr node_t kInvalidNodeId{-1};
  static constexpr node_t kRoot{0};

  /*!
   * \brief Construct a single-node tree
   *
   * \param covariates Covariate matrix (rows are observations, columns are features), shared with other trees
   * \param outcome Outcome vector, one entry per covariate row
   * \param min_samples_leaf Minimum number of rows that each leaf must receive
   */
  BinaryTree(std::shared_ptr<const Eigen::MatrixXd> covariates, const Eigen::VectorXd& outcome,
             data_size_t min_samples_leaf = 5);
  ~BinaryTree() {}
  BinaryTree(BinaryTree const&) = delete;
  BinaryTree& operator=(BinaryTree const&) = delete;
  BinaryTree(BinaryTree&&) noexcept = default;
  BinaryTree& operator=(BinaryTree&&) noexcept = default;

  /*! \brief Drop every node except a fresh root, restarting the id allocator */
  void Reset();

  /** Data access **/
  data_size_t NumObservations() const { return static_cast<data_size_t>(covariates_->rows()); }
  feature_size_t NumFeatures() const { return static_cast<feature_size_t>(covariates_->cols()); }
  const Eigen::MatrixXd& Covariates() const { return *covariates_; }
  std::shared_ptr<const Eigen::MatrixXd> SharedCovariates() const { return covariates_; }
  const Eigen::VectorXd& Outcome() const { return outcome_; }
  /*! \brief Replace the outcome the tree is fit against (for example with a partial residual) */
  void SetOutcome(const Eigen::VectorXd& outcome);
  data_size_t MinSamplesLeaf() const { return min_samples_leaf_; }

  /** Node queries **/
  node_t Parent(node_t nid) const { return parent_[Slot(nid)]; }
  node_t LeftChild(node_t nid) const { return cleft_[Slot(nid)]; }
  node_t RightChild(node_t nid) const { return cright_[Slot(nid)]; }
  feature_size_t SplitIndex(node_t nid) const { return split_index_[Slot(nid)]; }
  double Threshold(node_t nid) const { return threshold_[Slot(nid)]; }
  double LeafValue(node_t nid) const { return leaf_value_[Slot(nid)]; }
  std::int32_t Depth(node_t nid) const { return depth_[Slot(nid)]; }
  bool IsLeaf(node_t nid) const { return cleft_[Slot(nid)] == kInvalidNodeId; }
  bool IsRoot(node_t nid) const { return parent_[Slot(nid)] == kInvalidNodeId; }
  /*! \brief Whether `nid` was handed out by the allocator and has since been pruned */
  bool IsDeleted(node_t nid) const {
    return nid >= 0 && nid < num_nodes_ && node_slot_.find(nid) == node_slot_.end();
  }
  /*! \brief Split rule of node `nid`, empty for leaves */
  std::optional<SplitRule> Rule(node_t nid) const;
  /*! \brief Whether `nid` is an internal node whose two child slots both hold leaves */
  bool IsLeafParent(node_t nid) const {
    if (IsLeaf(nid)) return false;
    return IsLeaf(LeftChild(nid)) && IsLeaf(RightChild(nid));
  }
  void SetLeafValue(node_t nid, double value);

  /** Inventories, in right-before-left preorder **/
  const std::vector<node_t>& GetLeaves() const { return leaves_; }
  const std::vector<node_t>& GetInternalNodes() const { return internal_nodes_; }
  const std::vector<node_t>& GetLeafParents() const { return leaf_parents_; }
  std::int32_t NumLeaves() const { return static_cast<std::int32_t>(leaves_.size()); }
  std::int32_t NumSplitNodes() const { return static_cast<std::int32_t>(internal_nodes_.size()); }
  /*! \brief Total number of ids handed out, including deleted nodes */
  std::int32_t NumNodes() const noexcept { return num_nodes_; }
  std::int32_t NumValidNodes() const noexcept { return static_cast<std::int32_t>(node_slot_.size()); }
  /*! \brief Number of storage slots backing the tree, live or free */
  std::int32_t NumSlots() const noexcept { return static_cast<std::int32_t>(node_id_.size()); }
  /*! \brief Counter incremented by every committing mutation; inventories read under an older generation are stale */
  std::uint64_t Generation() const noexcept { return generation_; }

  /*!
   * \brief Iterate through all live nodes in this tree, visiting right subtrees before left subtrees.
   * \param func Function that accepts a node index, and returns false when iteration should
   *        stop, otherwise returns true.
   */
  template <typename Func>
  void WalkTree(Func func, node_t start = kRoot) const {
    std::stack<node_t> nodes;
    nodes.push(start);
    while (!nodes.empty()) {
      node_t nidx = nodes.top();
      nodes.pop();
      if (!func(nidx)) {
        return;
      }
      node_t left = LeftChild(nidx);
      node_t right = RightChild(nidx);
      if (left != kInvalidNodeId) {
        nodes.push(left);
      }
      if (right != kInvalidNodeId) {
        nodes.push(right);
      }
    }
  }

  /** Data routing **/
  /*!
   * \brief Rows routed to `nid`, with the per-column masks implied by each ancestor's rule
   * \param nid ID of node being queried
   */
  NodeFilter Filter(node_t nid) const;
  /*! \brief Rows routed to `nid` */
  BoolVector RowMask(node_t nid) const;
  /*! \brief Number of rows routed to `nid` */
  data_size_t NodeSampleSize(node_t nid) const;
  /*! \brief Number of features taking more than one distinct value among the rows routed to `nid` */
  feature_size_t NumEligibleFeatures(node_t nid) const;

  /** Topology moves **/
  /*!
   * \brief Draw a feature uniformly, then a threshold uniformly from that feature's observed values among rows routed to `nid`
   *
   * \return Empty if no rows are routed to `nid`
   */
  std::optional<SplitRule> ProposeRule(node_t nid, std::mt19937& gen) const;
  /*!
   * \brief Split leaf `nid` on `rule`
   *
   * \return The (left, right) child ids, or empty if either child would receive fewer than
   *         `MinSamplesLeaf()` rows, in which case the tree is left exactly as before the call
   */
  std::optional<std::pair<node_t, node_t>> Split(node_t nid, const SplitRule& rule);
  /*! \brief Split a uniformly chosen leaf on a proposed rule. Returns whether a split was committed */
  bool Grow(std::mt19937& gen);
  /*! \brief Collapse leaf parent `nid` back into a leaf */
  void PruneNode(node_t nid);
  /*! \brief Collapse a uniformly chosen leaf parent. Returns false if the tree has no leaf parent */
  bool Prune(std::mt19937& gen);
  /*!
   * \brief Replace the rule of internal node `nid`, reverting if any leaf below it would fall under the minimum leaf size
   */
  RuleChange ChangeRule(node_t nid, const SplitRule& rule);
  /*! \brief Change the rule of a uniformly chosen internal node to a proposed rule. Returns whether the change was committed */
  bool Change(std::mt19937& gen);
  /*!
   * \brief Exchange rules between internal node `parent` and its internal child `child`.
   *
   * When both children of `parent` are internal and carry the same rule, the parent rule moves
   * to both children and the shared child rule moves to the parent. Reverts if any leaf below
   * `parent` would fall under the minimum leaf size.
   *
   * \return Whether the exchange was committed
   */
  bool SwapRules(node_t parent, node_t child);
  /*! \brief Swap rules in a uniformly chosen internal parent / internal child pair. Returns whether a swap was committed */
  bool Swap(std::mt19937& gen);
  /*!
   * \brief Grow the subtree below leaf `nid` from the tree prior, splitting each node at depth d
   * with probability `alpha * (1 + d)^(-beta)`
   */
  void BuildUniform(node_t nid, double alpha, double beta, std::mt19937& gen);

  /** Inventory maintenance **/
  void RecomputeTerminalNodes();
  void RecomputeInternalNodes();
  /*! \brief Rebuild leaves, internal nodes and leaf parents, checking node consistency along the way */
  void RecomputeNodeLists();

  /** Prediction **/
  /*! \brief Leaf reached by `row` when routed from the root */
  node_t LeafIndex(const Eigen::Ref<const Eigen::RowVectorXd>& row) const;
  double PredictRow(const Eigen::Ref<const Eigen::RowVectorXd>& row) const;
  Eigen::VectorXd Predict(const Eigen::MatrixXd& covariates) const;
  /*! \brief Leaf reached by every training row */
  std::vector<node_t> LeafIndices() const;

  /*! \brief Human-readable dump of the tree, one node per line in right-before-left preorder, indented by depth */
  std::string ToString() const;

  /** Rollback and serialization **/
  TreeSnapshot Snapshot() const;
  void Restore(const TreeSnapshot& snapshot);
  json to_json() const;
  /*!
   * \brief Load a tree serialized by `to_json`. The node arrays are checked against each other and
   * against the covariate matrix before anything is replaced, so a fatal error leaves the tree intact.
   */
  void from_json(const json& tree_json);

 private:
  std::int32_t Slot(node_t nid) const {
    auto it = node_slot_.find(nid);
    if (it == node_slot_.end()) {
      Log::Fatal("Node %d is not a live node of this tree", nid);
    }
    return it->second;
  }
  node_t AllocNode(node_t parent);
  /*! \brief Retire id `nid` and put its slot on the free list */
  void ReleaseNode(node_t nid);
  void ClearSlot(std::int32_t slot);
  void ValidateNodeId(node_t nid) const;
  bool SubtreeLeavesMeetMinimum(node_t nid) const;
  void SetRule(node_t nid, const SplitRule& rule);

  std::shared_ptr<const Eigen::MatrixXd> covariates_;
  Eigen::VectorXd outcome_;
  data_size_t min_samples_leaf_;

  std::int32_t num_nodes_{0};
  std::uint64_t generation_{0};

  // Live node id -> storage slot, and the slots available for reuse
  std::unordered_map<node_t, std::int32_t> node_slot_;
  std::vector<std::int32_t> free_slots_;

  // Node info, indexed by slot
  std::vector<node_t> node_id_;
  std::vector<node_t> parent_;
  std::vector<node_t> cleft_;
  std::vector<node_t> cright_;
  std::vector<feature_size_t> split_index_;
  std::vector<double> threshold_;
  std::vector<double> leaf_value_;
  std::vector<std::int32_t> depth_;

  std::vector<node_t> leaves_;
  std::vector<node_t> internal_nodes_;
  std::vector<node_t> leaf_parents_;
};

} // namespace BayesTree

#endif // BAYESTREE_TREE_H_
