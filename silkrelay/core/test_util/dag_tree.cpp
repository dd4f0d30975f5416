// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "dag_tree.hpp"

#include <silkrelay/core/pow/hashimoto.hpp>

namespace silkrelay::test_util {

SparseDagTree::SparseDagTree(uint32_t full_dataset_num_items)
    : depth_{pow::dag_tree_depth(full_dataset_num_items)} {
    empty_subtrees_.resize(depth_ + 1);
    for (size_t level{1}; level <= depth_; ++level) {
        empty_subtrees_[level] = pow::dag_parent(empty_subtrees_[level - 1], empty_subtrees_[level - 1]);
    }
}

void SparseDagTree::add(uint32_t index, const ethash::hash1024& item) {
    leaves_[index] = pow::dag_leaf(item);
}

pow::DagNode SparseDagTree::node(size_t level, uint64_t position) const {
    const uint64_t first_leaf{position << level};
    const uint64_t end_leaf{(position + 1) << level};
    const auto it{leaves_.lower_bound(first_leaf)};
    if (it == leaves_.end() || it->first >= end_leaf) {
        return empty_subtrees_[level];
    }
    if (level == 0) {
        return it->second;
    }
    return pow::dag_parent(node(level - 1, position * 2), node(level - 1, position * 2 + 1));
}

pow::DagNode SparseDagTree::root() const { return node(depth_, 0); }

std::vector<pow::DagNode> SparseDagTree::branch(uint32_t index) const {
    std::vector<pow::DagNode> nodes;
    nodes.reserve(depth_);
    for (size_t level{0}; level < depth_; ++level) {
        nodes.push_back(node(level, (static_cast<uint64_t>(index) >> level) ^ 1));
    }
    return nodes;
}

DagProofFixture make_dag_proof(const BlockHeader& header, const ethash::epoch_context& context) {
    const auto seal_hash{ethash::hash256_from_bytes(header.hash(/*for_sealing=*/true).bytes)};
    const std::vector<uint32_t> indices{pow::dataset_accesses(context, seal_hash, header.nonce_value())};

    SparseDagTree tree{static_cast<uint32_t>(context.full_dataset_num_items)};
    for (const uint32_t index : indices) {
        tree.add(index, pow::calculate_dataset_item_1024(context, index));
    }

    DagProofFixture fixture;
    fixture.root = tree.root();
    for (const uint32_t index : indices) {
        fixture.proof.push_back({pow::calculate_dataset_item_1024(context, index), tree.branch(index)});
    }
    return fixture;
}

}  // namespace silkrelay::test_util
