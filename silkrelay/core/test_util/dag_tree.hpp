// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include <ethash/ethash.hpp>

#include <silkrelay/core/pow/dag_proof.hpp>
#include <silkrelay/core/types/block.hpp>

namespace silkrelay::test_util {

//! \brief DAG Merkle tree where only some dataset items are known and every other leaf is a zero node
class SparseDagTree {
  public:
    explicit SparseDagTree(uint32_t full_dataset_num_items);

    void add(uint32_t index, const ethash::hash1024& item);

    pow::DagNode root() const;

    std::vector<pow::DagNode> branch(uint32_t index) const;

  private:
    pow::DagNode node(size_t level, uint64_t position) const;

    size_t depth_;
    std::vector<pow::DagNode> empty_subtrees_;  // by level
    std::map<uint64_t, pow::DagNode> leaves_;
};

struct DagProofFixture {
    pow::DagProof proof;
    pow::DagNode root;
};

//! \brief Collects the pages a sealed header touches and proves them against a sparse tree holding only those
DagProofFixture make_dag_proof(const BlockHeader& header, const ethash::epoch_context& context);

}  // namespace silkrelay::test_util
