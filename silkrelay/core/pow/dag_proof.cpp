// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "dag_proof.hpp"

#include <bit>
#include <cstring>

#include <ethash/keccak.hpp>

#include <silkrelay/core/rlp/decode_vector.hpp>
#include <silkrelay/core/rlp/encode_vector.hpp>

namespace silkrelay::pow {

static DagNode truncate(const ethash::hash256& digest) noexcept {
    DagNode node;
    std::memcpy(node.data(), &digest.bytes[sizeof(digest) - node.size()], node.size());
    return node;
}

size_t dag_tree_depth(uint32_t full_dataset_num_items) noexcept {
    if (full_dataset_num_items <= 1) {
        return 0;
    }
    return static_cast<size_t>(std::bit_width(full_dataset_num_items - 1));
}

DagNode dag_leaf(const ethash::hash1024& item) noexcept {
    return truncate(ethash::keccak256(item.bytes, sizeof(item)));
}

DagNode dag_parent(const DagNode& left, const DagNode& right) noexcept {
    uint8_t data[2 * sizeof(DagNode)];
    std::memcpy(data, left.data(), left.size());
    std::memcpy(&data[left.size()], right.data(), right.size());
    return truncate(ethash::keccak256(data, sizeof(data)));
}

DagNode dag_root_from_branch(const ethash::hash1024& item, uint32_t index, std::span<const DagNode> branch) noexcept {
    DagNode node{dag_leaf(item)};
    for (const DagNode& sibling : branch) {
        node = (index & 1) ? dag_parent(sibling, node) : dag_parent(node, sibling);
        index >>= 1;
    }
    return node;
}

}  // namespace silkrelay::pow

namespace silkrelay::rlp {

static Header page_header(const pow::DagPage& page) {
    return {.list = true,
            .payload_length = length(ByteView{page.item.bytes, sizeof(page.item)}) + length(page.branch)};
}

size_t length(const pow::DagPage& page) {
    const Header h{page_header(page)};
    return length_of_length(h.payload_length) + h.payload_length;
}

void encode(Bytes& to, const pow::DagPage& page) {
    encode_header(to, page_header(page));
    encode(to, ByteView{page.item.bytes, sizeof(page.item)});
    encode(to, page.branch);
}

DecodingResult decode(ByteView& from, pow::DagPage& to, Leftover mode) noexcept {
    return decode(from, mode, to.item.bytes, to.branch);
}

}  // namespace silkrelay::rlp

namespace silkrelay::pow {

Bytes encode_dag_proof(const DagProof& proof) {
    Bytes out;
    rlp::encode(out, proof);
    return out;
}

tl::expected<DagProof, DecodingError> decode_dag_proof(ByteView data) noexcept {
    DagProof proof;
    if (DecodingResult res{rlp::decode(data, proof)}; !res) {
        return tl::unexpected{res.error()};
    }
    return proof;
}

}  // namespace silkrelay::pow
