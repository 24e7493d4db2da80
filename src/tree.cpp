/*!
 * Copyright (c) 2024 bayestree authors. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 *
 * Inspired by the design of the tree in the xgboost and treelite package, both released under the Apache license
 * with the following copyright:
 * Copyright 2015-2023 by XGBoost Contributors
 * Copyright 2017-2021 by [treelite] Contributors
 */
#include <bayestree/tree.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <sstream>
#include <string>

namespace BayesTree {

constexpr node_t BinaryTree::kInvalidNodeId;
constexpr node_t BinaryTree::kRoot;

BinaryTree::BinaryTree(std::shared_ptr<const Eigen::MatrixXd> covariates, const Eigen::VectorXd& outcome,
                       data_size_t min_samples_leaf)
    : covariates_(std::move(covariates)), min_samples_leaf_(min_samples_leaf) {
  CHECK_NOTNULL(covariates_);
  if (min_samples_leaf_ < 1) {
    Log::Fatal("min_samples_leaf must be at least 1, got %d", min_samples_leaf_);
  }
  if (covariates_->cols() < 1) {
    Log::Fatal("Covariate matrix must have at least one column");
  }
  SetOutcome(outcome);
  Reset();
}

void BinaryTree::Reset() {
  num_nodes_ = 0;
  node_slot_.clear();
  free_slots_.clear();
  node_id_.clear();
  parent_.clear();
  cleft_.clear();
  cright_.clear();
  split_index_.clear();
  threshold_.clear();
  leaf_value_.clear();
  depth_.clear();
  AllocNode(kInvalidNodeId);
  RecomputeNodeLists();
  ++generation_;
}

void BinaryTree::SetOutcome(const Eigen::VectorXd& outcome) {
  if (outcome.size() != covariates_->rows()) {
    Log::Fatal("Outcome has %d rows but the covariate matrix has %d rows",
               static_cast<int>(outcome.size()), static_cast<int>(covariates_->rows()));
  }
  outcome_ = outcome;
}

node_t BinaryTree::AllocNode(node_t parent) {
  std::int32_t depth = parent == kInvalidNodeId ? 0 : Depth(parent) + 1;
  node_t nd = num_nodes_++;
  CHECK_LT(num_nodes_, std::numeric_limits<node_t>::max());

  std::int32_t slot;
  if (!free_slots_.empty()) {
    slot = free_slots_.back();
    free_slots_.pop_back();
  } else {
    slot = NumSlots();
    node_id_.push_back(kInvalidNodeId);
    parent_.push_back(kInvalidNodeId);
    cleft_.push_back(kInvalidNodeId);
    cright_.push_back(kInvalidNodeId);
    split_index_.push_back(-1);
    threshold_.push_back(0.0);
    leaf_value_.push_back(0.0);
    depth_.push_back(0);
  }
  node_id_[slot] = nd;
  parent_[slot] = parent;
  depth_[slot] = depth;
  node_slot_.emplace(nd, slot);
  return nd;
}

void BinaryTree::ClearSlot(std::int32_t slot) {
  node_id_[slot] = kInvalidNodeId;
  parent_[slot] = kInvalidNodeId;
  cleft_[slot] = kInvalidNodeId;
  cright_[slot] = kInvalidNodeId;
  split_index_[slot] = -1;
  threshold_[slot] = 0.0;
  leaf_value_[slot] = 0.0;
  depth_[slot] = 0;
}

void BinaryTree::ReleaseNode(node_t nid) {
  std::int32_t slot = Slot(nid);
  node_slot_.erase(nid);
  ClearSlot(slot);
  free_slots_.push_back(slot);
}

void BinaryTree::ValidateNodeId(node_t nid) const {
  if (nid < 0 || nid >= num_nodes_) {
    Log::Fatal("Node %d does not exist in a tree with %d allocated nodes", nid, num_nodes_);
  }
  if (IsDeleted(nid)) {
    Log::Fatal("Node %d has been deleted", nid);
  }
}

std::optional<SplitRule> BinaryTree::Rule(node_t nid) const {
  ValidateNodeId(nid);
  if (IsLeaf(nid)) return std::nullopt;
  return SplitRule{SplitIndex(nid), Threshold(nid)};
}

void BinaryTree::SetLeafValue(node_t nid, double value) {
  ValidateNodeId(nid);
  leaf_value_[Slot(nid)] = value;
}

void BinaryTree::SetRule(node_t nid, const SplitRule& rule) {
  if (rule.feature < 0 || rule.feature >= NumFeatures()) {
    Log::Fatal("Split feature %d is out of range for %d features", rule.feature, NumFeatures());
  }
  std::int32_t slot = Slot(nid);
  split_index_[slot] = rule.feature;
  threshold_[slot] = rule.threshold;
}

BoolVector BinaryTree::RowMask(node_t nid) const {
  ValidateNodeId(nid);
  const Eigen::MatrixXd& X = *covariates_;
  BoolVector result = BoolVector::Constant(X.rows(), true);
  node_t child = nid;
  while (!IsRoot(child)) {
    node_t parent = Parent(child);
    feature_size_t feature = SplitIndex(parent);
    double threshold = Threshold(parent);
    if (LeftChild(parent) == child) {
      result = result && (X.col(feature).array() <= threshold);
    } else {
      result = result && (X.col(feature).array() > threshold);
    }
    child = parent;
  }
  return result;
}

NodeFilter BinaryTree::Filter(node_t nid) const {
  ValidateNodeId(nid);
  const Eigen::MatrixXd& X = *covariates_;
  NodeFilter result;
  result.column_mask = BoolMatrix::Constant(X.rows(), X.cols(), true);
  node_t child = nid;
  while (!IsRoot(child)) {
    node_t parent = Parent(child);
    feature_size_t feature = SplitIndex(parent);
    double threshold = Threshold(parent);
    if (LeftChild(parent) == child) {
      result.column_mask.col(feature) = result.column_mask.col(feature) && (X.col(feature).array() <= threshold);
    } else {
      result.column_mask.col(feature) = result.column_mask.col(feature) && (X.col(feature).array() > threshold);
    }
    child = parent;
  }
  result.row_mask = result.column_mask.rowwise().all();
  return result;
}

data_size_t BinaryTree::NodeSampleSize(node_t nid) const {
  return static_cast<data_size_t>(RowMask(nid).count());
}

feature_size_t BinaryTree::NumEligibleFeatures(node_t nid) const {
  const Eigen::MatrixXd& X = *covariates_;
  BoolVector rows = RowMask(nid);
  feature_size_t num_eligible = 0;
  for (feature_size_t j = 0; j < NumFeatures(); j++) {
    bool seen = false;
    double first_value = 0.0;
    for (data_size_t i = 0; i < NumObservations(); i++) {
      if (!rows(i)) continue;
      if (!seen) {
        first_value = X(i, j);
        seen = true;
      } else if (X(i, j) != first_value) {
        num_eligible++;
        break;
      }
    }
  }
  return num_eligible;
}

std::optional<SplitRule> BinaryTree::ProposeRule(node_t nid, std::mt19937& gen) const {
  std::uniform_int_distribution<feature_size_t> feature_dist(0, NumFeatures() - 1);
  feature_size_t feature = feature_dist(gen);
  BoolVector rows = RowMask(nid);
  std::vector<double> observed;
  observed.reserve(rows.count());
  for (data_size_t i = 0; i < NumObservations(); i++) {
    if (rows(i)) observed.push_back((*covariates_)(i, feature));
  }
  if (observed.empty()) {
    return std::nullopt;
  }
  std::uniform_int_distribution<std::size_t> value_dist(0, observed.size() - 1);
  return SplitRule{feature, observed[value_dist(gen)]};
}

std::optional<std::pair<node_t, node_t>> BinaryTree::Split(node_t nid, const SplitRule& rule) {
  ValidateNodeId(nid);
  if (!IsLeaf(nid)) {
    Log::Fatal("Cannot split node %d, which is not a leaf", nid);
  }
  // Rule validity is checked before anything is allocated so that a fatal error leaves the tree intact
  if (rule.feature < 0 || rule.feature >= NumFeatures()) {
    Log::Fatal("Split feature %d is out of range for %d features", rule.feature, NumFeatures());
  }

  std::int32_t num_slots = NumSlots();
  node_t left = AllocNode(nid);
  node_t right = AllocNode(nid);
  std::int32_t slot = Slot(nid);
  cleft_[slot] = left;
  cright_[slot] = right;
  SetRule(nid, rule);

  data_size_t left_n = NodeSampleSize(left);
  data_size_t right_n = NodeSampleSize(right);
  if (left_n < min_samples_leaf_ || right_n < min_samples_leaf_) {
    Log::Debug("Rejected split of node %d on feature %d at %f: %d / %d rows", nid, rule.feature, rule.threshold, left_n, right_n);
    // Released in reverse allocation order, and slots appended by this call are dropped again,
    // so the slot vectors and the free list end up exactly as before
    ReleaseNode(right);
    ReleaseNode(left);
    free_slots_.erase(std::remove_if(free_slots_.begin(), free_slots_.end(),
                                     [num_slots](std::int32_t s) { return s >= num_slots; }),
                      free_slots_.end());
    node_id_.resize(num_slots);
    parent_.resize(num_slots);
    cleft_.resize(num_slots);
    cright_.resize(num_slots);
    split_index_.resize(num_slots);
    threshold_.resize(num_slots);
    leaf_value_.resize(num_slots);
    depth_.resize(num_slots);
    num_nodes_ -= 2;
    cleft_[slot] = kInvalidNodeId;
    cright_[slot] = kInvalidNodeId;
    split_index_[slot] = -1;
    threshold_[slot] = 0.0;
    return std::nullopt;
  }

  leaf_value_[slot] = 0.0;
  RecomputeNodeLists();
  ++generation_;
  return std::make_pair(left, right);
}

bool BinaryTree::Grow(std::mt19937& gen) {
  std::uniform_int_distribution<std::size_t> leaf_dist(0, leaves_.size() - 1);
  node_t nid = leaves_[leaf_dist(gen)];
  std::optional<SplitRule> rule = ProposeRule(nid, gen);
  if (!rule.has_value()) {
    Log::Debug("Grow: no rows routed to node %d", nid);
    return false;
  }
  bool grown = Split(nid, rule.value()).has_value();
  Log::Debug("Grow: node %d %s", nid, grown ? "split" : "not split");
  return grown;
}

void BinaryTree::PruneNode(node_t nid) {
  ValidateNodeId(nid);
  if (!IsLeafParent(nid)) {
    Log::Fatal("Cannot prune node %d, whose children are not both leaves", nid);
  }
  ReleaseNode(RightChild(nid));
  ReleaseNode(LeftChild(nid));
  std::int32_t slot = Slot(nid);
  cleft_[slot] = kInvalidNodeId;
  cright_[slot] = kInvalidNodeId;
  split_index_[slot] = -1;
  threshold_[slot] = 0.0;
  leaf_value_[slot] = 0.0;
  RecomputeNodeLists();
  ++generation_;
}

bool BinaryTree::Prune(std::mt19937& gen) {
  if (leaf_parents_.empty()) {
    return false;
  }
  std::uniform_int_distribution<std::size_t> parent_dist(0, leaf_parents_.size() - 1);
  node_t nid = leaf_parents_[parent_dist(gen)];
  PruneNode(nid);
  Log::Debug("Prune: node %d collapsed to a leaf", nid);
  return true;
}

bool BinaryTree::SubtreeLeavesMeetMinimum(node_t nid) const {
  bool satisfied = true;
  WalkTree([this, &satisfied](node_t node) {
    if (IsLeaf(node) && NodeSampleSize(node) < min_samples_leaf_) {
      satisfied = false;
      return false;
    }
    return true;
  }, nid);
  return satisfied;
}

RuleChange BinaryTree::ChangeRule(node_t nid, const SplitRule& rule) {
  ValidateNodeId(nid);
  if (IsLeaf(nid)) {
    Log::Fatal("Cannot change the rule of node %d, which is a leaf", nid);
  }
  RuleChange result{rule, SplitRule{SplitIndex(nid), Threshold(nid)}, false};
  SetRule(nid, rule);
  if (!SubtreeLeavesMeetMinimum(nid)) {
    SetRule(nid, result.previous);
    return result;
  }
  result.committed = true;
  ++generation_;
  return result;
}

bool BinaryTree::Change(std::mt19937& gen) {
  if (internal_nodes_.empty()) {
    return false;
  }
  std::uniform_int_distribution<std::size_t> node_dist(0, internal_nodes_.size() - 1);
  node_t nid = internal_nodes_[node_dist(gen)];
  std::optional<SplitRule> rule = ProposeRule(nid, gen);
  if (!rule.has_value()) {
    return false;
  }
  RuleChange change = ChangeRule(nid, rule.value());
  Log::Debug("Change: node %d to feature %d at %f %s", nid, change.attempted.feature,
             change.attempted.threshold, change.committed ? "committed" : "reverted");
  return change.committed;
}

bool BinaryTree::SwapRules(node_t parent, node_t child) {
  ValidateNodeId(parent);
  ValidateNodeId(child);
  if (IsLeaf(parent) || IsLeaf(child) || Parent(child) != parent) {
    Log::Fatal("Nodes %d and %d are not an internal parent / internal child pair", parent, child);
  }
  node_t left = LeftChild(parent);
  node_t right = RightChild(parent);
  SplitRule parent_rule{SplitIndex(parent), Threshold(parent)};
  SplitRule left_rule{SplitIndex(left), Threshold(left)};
  SplitRule right_rule{SplitIndex(right), Threshold(right)};
  bool rotate = !IsLeaf(left) && !IsLeaf(right) && left_rule == right_rule;

  if (rotate) {
    SetRule(parent, left_rule);
    SetRule(left, parent_rule);
    SetRule(right, parent_rule);
  } else {
    SplitRule child_rule{SplitIndex(child), Threshold(child)};
    SetRule(parent, child_rule);
    SetRule(child, parent_rule);
  }

  if (!SubtreeLeavesMeetMinimum(parent)) {
    SetRule(parent, parent_rule);
    if (!IsLeaf(left)) SetRule(left, left_rule);
    if (!IsLeaf(right)) SetRule(right, right_rule);
    return false;
  }
  ++generation_;
  return true;
}

bool BinaryTree::Swap(std::mt19937& gen) {
  std::vector<node_t> parents;
  for (node_t nid : internal_nodes_) {
    if (!IsLeaf(LeftChild(nid)) || !IsLeaf(RightChild(nid))) {
      parents.push_back(nid);
    }
  }
  if (parents.empty()) {
    return false;
  }
  std::uniform_int_distribution<std::size_t> parent_dist(0, parents.size() - 1);
  node_t parent = parents[parent_dist(gen)];
  std::vector<node_t> children;
  if (!IsLeaf(LeftChild(parent))) children.push_back(LeftChild(parent));
  if (!IsLeaf(RightChild(parent))) children.push_back(RightChild(parent));
  std::uniform_int_distribution<std::size_t> child_dist(0, children.size() - 1);
  node_t child = children[child_dist(gen)];
  bool swapped = SwapRules(parent, child);
  Log::Debug("Swap: nodes %d and %d %s", parent, child, swapped ? "committed" : "reverted");
  return swapped;
}

void BinaryTree::BuildUniform(node_t nid, double alpha, double beta, std::mt19937& gen) {
  ValidateNodeId(nid);
  if (!IsLeaf(nid)) {
    Log::Fatal("Cannot grow a prior subtree below node %d, which is not a leaf", nid);
  }
  std::uniform_real_distribution<double> unif(0.0, 1.0);
  std::stack<node_t> pending;
  pending.push(nid);
  while (!pending.empty()) {
    node_t node = pending.top();
    pending.pop();
    double split_prob = alpha * std::pow(1.0 + Depth(node), -beta);
    if (unif(gen) >= split_prob) {
      continue;
    }
    std::optional<SplitRule> rule = ProposeRule(node, gen);
    if (!rule.has_value()) {
      Log::Debug("BuildUniform: no rows routed to node %d", node);
      continue;
    }
    std::optional<std::pair<node_t, node_t>> children = Split(node, rule.value());
    if (!children.has_value()) {
      continue;
    }
    Log::Debug("BuildUniform: extended node %d to depth %d", node, Depth(node) + 1);
    pending.push(children->second);
    pending.push(children->first);
  }
}

void BinaryTree::RecomputeTerminalNodes() {
  leaves_.clear();
  WalkTree([this](node_t nid) {
    bool has_left = LeftChild(nid) != kInvalidNodeId;
    bool has_right = RightChild(nid) != kInvalidNodeId;
    if (has_left != has_right) {
      Log::Fatal("Node %d has exactly one child", nid);
    }
    if (!has_left) {
      if (SplitIndex(nid) != -1) {
        Log::Fatal("Leaf node %d carries a split rule", nid);
      }
      leaves_.push_back(nid);
    }
    return true;
  });
}

void BinaryTree::RecomputeInternalNodes() {
  internal_nodes_.clear();
  WalkTree([this](node_t nid) {
    if (!IsLeaf(nid)) {
      if (SplitIndex(nid) == -1 || RightChild(nid) == kInvalidNodeId) {
        Log::Fatal("Internal node %d does not carry a rule and two children", nid);
      }
      internal_nodes_.push_back(nid);
    }
    return true;
  });
}

void BinaryTree::RecomputeNodeLists() {
  RecomputeTerminalNodes();
  RecomputeInternalNodes();
  leaf_parents_.clear();
  for (node_t nid : internal_nodes_) {
    if (IsLeafParent(nid)) leaf_parents_.push_back(nid);
  }
}

node_t BinaryTree::LeafIndex(const Eigen::Ref<const Eigen::RowVectorXd>& row) const {
  if (row.size() != NumFeatures()) {
    Log::Fatal("Row has %d features but the tree was built on %d features", static_cast<int>(row.size()), NumFeatures());
  }
  node_t nid = kRoot;
  while (!IsLeaf(nid)) {
    if (row(SplitIndex(nid)) <= Threshold(nid)) {
      nid = LeftChild(nid);
    } else {
      nid = RightChild(nid);
    }
  }
  return nid;
}

double BinaryTree::PredictRow(const Eigen::Ref<const Eigen::RowVectorXd>& row) const {
  return LeafValue(LeafIndex(row));
}

Eigen::VectorXd BinaryTree::Predict(const Eigen::MatrixXd& covariates) const {
  Eigen::VectorXd result(covariates.rows());
  for (Eigen::Index i = 0; i < covariates.rows(); i++) {
    result(i) = PredictRow(covariates.row(i));
  }
  return result;
}

std::vector<node_t> BinaryTree::LeafIndices() const {
  const Eigen::MatrixXd& X = *covariates_;
  std::vector<node_t> result(X.rows());
  for (data_size_t i = 0; i < NumObservations(); i++) {
    result[i] = LeafIndex(X.row(i));
  }
  return result;
}

TreeSnapshot BinaryTree::Snapshot() const {
  return TreeSnapshot{num_nodes_, node_slot_, free_slots_, node_id_, parent_, cleft_, cright_, split_index_,
                      threshold_, leaf_value_, depth_, leaves_, internal_nodes_, leaf_parents_};
}

void BinaryTree::Restore(const TreeSnapshot& snapshot) {
  CHECK_EQ(snapshot.node_id.size(), snapshot.parent.size());
  CHECK_LE(snapshot.node_slot.size(), snapshot.node_id.size());
  num_nodes_ = snapshot.num_nodes;
  node_slot_ = snapshot.node_slot;
  free_slots_ = snapshot.free_slots;
  node_id_ = snapshot.node_id;
  parent_ = snapshot.parent;
  cleft_ = snapshot.cleft;
  cright_ = snapshot.cright;
  split_index_ = snapshot.split_index;
  threshold_ = snapshot.threshold;
  leaf_value_ = snapshot.leaf_value;
  depth_ = snapshot.depth;
  leaves_ = snapshot.leaves;
  internal_nodes_ = snapshot.internal_nodes;
  leaf_parents_ = snapshot.leaf_parents;
  ++generation_;
}

std::string BinaryTree::ToString() const {
  std::stringstream str_buf;
  WalkTree([this, &str_buf](node_t nid) {
    str_buf << std::string(2 * Depth(nid), ' ') << "[" << nid << "] ";
    if (IsLeaf(nid)) {
      str_buf << "leaf: " << LeafValue(nid);
    } else {
      str_buf << "x" << SplitIndex(nid) << " <= " << Threshold(nid)
              << " (left " << LeftChild(nid) << ", right " << RightChild(nid) << ")";
    }
    str_buf << "\n";
    return true;
  });
  return str_buf.str();
}

json BinaryTree::to_json() const {
  json result_obj;
  result_obj.emplace("num_nodes", num_nodes_);
  result_obj.emplace("min_samples_leaf", min_samples_leaf_);

  // Live nodes only, in increasing id order
  std::vector<node_t> node_ids;
  node_ids.reserve(node_slot_.size());
  for (const auto& entry : node_slot_) {
    node_ids.push_back(entry.first);
  }
  std::sort(node_ids.begin(), node_ids.end());

  std::map<std::string, json> tree_array_map;
  tree_array_map.emplace(std::pair("node_id", json::array()));
  tree_array_map.emplace(std::pair("parent", json::array()));
  tree_array_map.emplace(std::pair("left", json::array()));
  tree_array_map.emplace(std::pair("right", json::array()));
  tree_array_map.emplace(std::pair("split_index", json::array()));
  tree_array_map.emplace(std::pair("threshold", json::array()));
  tree_array_map.emplace(std::pair("leaf_value", json::array()));
  tree_array_map.emplace(std::pair("depth", json::array()));
  for (node_t nid : node_ids) {
    std::int32_t slot = Slot(nid);
    tree_array_map["node_id"].emplace_back(nid);
    tree_array_map["parent"].emplace_back(parent_[slot]);
    tree_array_map["left"].emplace_back(cleft_[slot]);
    tree_array_map["right"].emplace_back(cright_[slot]);
    tree_array_map["split_index"].emplace_back(split_index_[slot]);
    tree_array_map["threshold"].emplace_back(threshold_[slot]);
    tree_array_map["leaf_value"].emplace_back(leaf_value_[slot]);
    tree_array_map["depth"].emplace_back(depth_[slot]);
  }
  for (auto& pair : tree_array_map) {
    result_obj.emplace(pair);
  }
  return result_obj;
}

void BinaryTree::from_json(const json& tree_json) {
  std::int32_t num_nodes = tree_json.at("num_nodes").get<std::int32_t>();
  if (num_nodes < 1) {
    Log::Fatal("A serialized tree must hold at least one node, got %d", num_nodes);
  }
  data_size_t min_samples_leaf = tree_json.at("min_samples_leaf").get<data_size_t>();
  if (min_samples_leaf < 1) {
    Log::Fatal("min_samples_leaf must be at least 1, got %d", min_samples_leaf);
  }

  const json& node_id_json = tree_json.at("node_id");
  std::size_t num_live = node_id_json.size();
  for (const char* field : {"parent", "left", "right", "split_index", "threshold", "leaf_value", "depth"}) {
    if (tree_json.at(field).size() != num_live) {
      Log::Fatal("Serialized tree has %d live nodes but %d entries in \"%s\"",
                 static_cast<int>(num_live), static_cast<int>(tree_json.at(field).size()), field);
    }
  }

  std::vector<node_t> node_id(num_live);
  std::vector<node_t> parent(num_live);
  std::vector<node_t> cleft(num_live);
  std::vector<node_t> cright(num_live);
  std::vector<feature_size_t> split_index(num_live);
  std::vector<double> threshold(num_live);
  std::vector<double> leaf_value(num_live);
  std::vector<std::int32_t> depth(num_live);
  std::unordered_map<node_t, std::int32_t> node_slot;
  for (std::size_t i = 0; i < num_live; i++) {
    node_id[i] = node_id_json.at(i).get<node_t>();
    parent[i] = tree_json.at("parent").at(i).get<node_t>();
    cleft[i] = tree_json.at("left").at(i).get<node_t>();
    cright[i] = tree_json.at("right").at(i).get<node_t>();
    split_index[i] = tree_json.at("split_index").at(i).get<feature_size_t>();
    threshold[i] = tree_json.at("threshold").at(i).get<double>();
    leaf_value[i] = tree_json.at("leaf_value").at(i).get<double>();
    depth[i] = tree_json.at("depth").at(i).get<std::int32_t>();
    if (node_id[i] < 0 || node_id[i] >= num_nodes) {
      Log::Fatal("Serialized node id %d is outside [0, %d)", node_id[i], num_nodes);
    }
    if (!node_slot.emplace(node_id[i], static_cast<std::int32_t>(i)).second) {
      Log::Fatal("Serialized node id %d appears more than once", node_id[i]);
    }
  }
  if (node_slot.count(kRoot) == 0) {
    Log::Fatal("Serialized tree has no root node");
  }

  // Every live link must point at a live node that links back, with depth increasing by one
  // along each edge. Together these rule out cycles and nodes unreachable from the root.
  auto is_live = [&node_slot](node_t nid) { return node_slot.count(nid) > 0; };
  for (std::size_t i = 0; i < num_live; i++) {
    node_t nid = node_id[i];
    if (nid == kRoot) {
      if (parent[i] != kInvalidNodeId || depth[i] != 0) {
        Log::Fatal("Serialized root must have no parent and depth 0");
      }
    } else {
      if (!is_live(parent[i])) {
        Log::Fatal("Serialized node %d has parent %d, which is not a live node", nid, parent[i]);
      }
      std::int32_t parent_slot = node_slot.at(parent[i]);
      if (cleft[parent_slot] != nid && cright[parent_slot] != nid) {
        Log::Fatal("Serialized node %d names %d as its parent, but %d does not name it as a child",
                   nid, parent[i], parent[i]);
      }
      if (depth[i] != depth[parent_slot] + 1) {
        Log::Fatal("Serialized node %d has depth %d but its parent has depth %d", nid, depth[i], depth[parent_slot]);
      }
    }

    if (cleft[i] == kInvalidNodeId && cright[i] == kInvalidNodeId) {
      if (split_index[i] != -1) {
        Log::Fatal("Serialized leaf %d carries split feature %d", nid, split_index[i]);
      }
      continue;
    }
    for (node_t child : {cleft[i], cright[i]}) {
      if (!is_live(child)) {
        Log::Fatal("Serialized node %d has child %d, which is not a live node", nid, child);
      }
      if (parent[node_slot.at(child)] != nid) {
        Log::Fatal("Serialized node %d names %d as a child, but %d does not name it as its parent",
                   nid, child, child);
      }
    }
    if (cleft[i] == cright[i]) {
      Log::Fatal("Serialized node %d has the same node %d as both children", nid, cleft[i]);
    }
    if (split_index[i] < 0 || split_index[i] >= NumFeatures()) {
      Log::Fatal("Serialized node %d splits on feature %d, out of range for %d features",
                 nid, split_index[i], NumFeatures());
    }
  }

  num_nodes_ = num_nodes;
  min_samples_leaf_ = min_samples_leaf;
  node_slot_ = std::move(node_slot);
  free_slots_.clear();
  node_id_ = std::move(node_id);
  parent_ = std::move(parent);
  cleft_ = std::move(cleft);
  cright_ = std::move(cright);
  split_index_ = std::move(split_index);
  threshold_ = std::move(threshold);
  leaf_value_ = std::move(leaf_value);
  depth_ = std::move(depth);
  RecomputeNodeLists();
  ++generation_;
}

} // namespace BayesTree
