// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

#include <ethash/hash_types.hpp>

#include <silkrelay/core/common/bytes.hpp>
#include <silkrelay/core/common/decoding_result.hpp>
#include <silkrelay/core/rlp/decode.hpp>
#include <silkrelay/core/rlp/encode.hpp>

namespace silkrelay::pow {

//! \brief A node of the DAG Merkle tree: the trailing 16 bytes of a Keccak-256 digest
using DagNode = std::array<uint8_t, 16>;

//! \brief A full dataset item together with its Merkle branch (sibling nodes from the leaf level upwards)
struct DagPage {
    ethash::hash1024 item{};
    std::vector<DagNode> branch;
};

//! \brief Dataset evidence for one nonce: one page per hashimoto access, in access order
using DagProof = std::vector<DagPage>;

//! \brief Depth of the Merkle tree over an epoch dataset, i.e. ceil(log2(full_dataset_num_items))
size_t dag_tree_depth(uint32_t full_dataset_num_items) noexcept;

DagNode dag_leaf(const ethash::hash1024& item) noexcept;

DagNode dag_parent(const DagNode& left, const DagNode& right) noexcept;

//! \brief Folds a branch into the root of the tree holding item at position index
DagNode dag_root_from_branch(const ethash::hash1024& item, uint32_t index, std::span<const DagNode> branch) noexcept;

}  // namespace silkrelay::pow

namespace silkrelay::rlp {

size_t length(const pow::DagPage& page);

void encode(Bytes& to, const pow::DagPage& page);

DecodingResult decode(ByteView& from, pow::DagPage& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace silkrelay::rlp

namespace silkrelay::pow {

Bytes encode_dag_proof(const DagProof& proof);

//! \brief Parses the RLP list [[item, [node, ...]], ...]
tl::expected<DagProof, DecodingError> decode_dag_proof(ByteView data) noexcept;

}  // namespace silkrelay::pow
