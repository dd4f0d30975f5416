// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "dag_proof.hpp"

#include <catch2/catch.hpp>

#include <silkrelay/core/common/util.hpp>
#include <silkrelay/core/rlp/encode_vector.hpp>
#include <silkrelay/core/test_util/dag_tree.hpp>

namespace silkrelay::pow {

static ethash::hash1024 sample_item(uint8_t seed) {
    ethash::hash1024 item{};
    for (size_t i{0}; i < sizeof(item); ++i) {
        item.bytes[i] = static_cast<uint8_t>(seed + i);
    }
    return item;
}

TEST_CASE("DAG tree depth") {
    CHECK(dag_tree_depth(0) == 0);
    CHECK(dag_tree_depth(1) == 0);
    CHECK(dag_tree_depth(2) == 1);
    CHECK(dag_tree_depth(3) == 2);
    CHECK(dag_tree_depth(4) == 2);
    CHECK(dag_tree_depth(5) == 3);
    // Epoch 0 dataset
    CHECK(dag_tree_depth(8'388'593) == 23);
}

TEST_CASE("DAG Merkle nodes") {
    const ethash::hash1024 item{sample_item(1)};
    const DagNode leaf{dag_leaf(item)};
    const ethash::hash256 digest{keccak256(ByteView{item.bytes, sizeof(item)})};
    CHECK(ByteView{leaf} == ByteView{&digest.bytes[16], 16});

    const DagNode other{dag_leaf(sample_item(2))};
    CHECK(dag_parent(leaf, other) != dag_parent(other, leaf));
}

TEST_CASE("DAG branch folding") {
    // Full tree over 3 items padded with a zero leaf
    const ethash::hash1024 items[]{sample_item(10), sample_item(20), sample_item(30)};
    const DagNode l0{dag_leaf(items[0])};
    const DagNode l1{dag_leaf(items[1])};
    const DagNode l2{dag_leaf(items[2])};
    const DagNode l3{};
    const DagNode root{dag_parent(dag_parent(l0, l1), dag_parent(l2, l3))};

    CHECK(dag_root_from_branch(items[0], 0, std::vector<DagNode>{l1, dag_parent(l2, l3)}) == root);
    CHECK(dag_root_from_branch(items[1], 1, std::vector<DagNode>{l0, dag_parent(l2, l3)}) == root);
    CHECK(dag_root_from_branch(items[2], 2, std::vector<DagNode>{l3, dag_parent(l0, l1)}) == root);
    // Wrong position
    CHECK(dag_root_from_branch(items[2], 3, std::vector<DagNode>{l3, dag_parent(l0, l1)}) != root);

    test_util::SparseDagTree tree{3};
    for (uint32_t i{0}; i < 3; ++i) {
        tree.add(i, items[i]);
    }
    CHECK(tree.root() == root);
    CHECK(tree.branch(2) == std::vector<DagNode>{l3, dag_parent(l0, l1)});
}

TEST_CASE("Sparse DAG tree") {
    const uint32_t num_items{1000};
    test_util::SparseDagTree tree{num_items};
    tree.add(7, sample_item(7));
    tree.add(999, sample_item(99));

    for (const uint32_t index : {7u, 999u}) {
        const std::vector<DagNode> branch{tree.branch(index)};
        CHECK(branch.size() == dag_tree_depth(num_items));
        const ethash::hash1024 item{sample_item(index == 7 ? 7 : 99)};
        CHECK(dag_root_from_branch(item, index, branch) == tree.root());
    }
}

TEST_CASE("DAG proof RLP") {
    DagProof proof;
    proof.push_back({sample_item(1), {DagNode{}, DagNode{1, 2, 3}}});
    proof.push_back({sample_item(2), {}});

    const Bytes encoded{encode_dag_proof(proof)};
    CHECK(encoded.size() == rlp::length(proof));

    const auto decoded{decode_dag_proof(encoded)};
    REQUIRE(decoded);
    REQUIRE(decoded->size() == 2);
    CHECK(ByteView{(*decoded)[0].item.bytes, 128} == ByteView{proof[0].item.bytes, 128});
    CHECK((*decoded)[0].branch == proof[0].branch);
    CHECK((*decoded)[1].branch.empty());

    SECTION("truncated") {
        const Bytes truncated{encoded.substr(0, encoded.size() - 1)};
        CHECK(decode_dag_proof(truncated).error() == DecodingError::kInputTooShort);
    }

    SECTION("short item") {
        // [[0x01020304, []]]
        const Bytes short_item{*from_hex("c7c68401020304c0")};
        CHECK(decode_dag_proof(short_item).error() == DecodingError::kUnexpectedLength);
    }

    SECTION("not a list") {
        CHECK(decode_dag_proof(*from_hex("820102")).error() == DecodingError::kUnexpectedString);
    }

    SECTION("empty input") {
        CHECK(decode_dag_proof({}).error() == DecodingError::kInputTooShort);
    }
}

}  // namespace silkrelay::pow
