// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "header_builder.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

#include <silkrelay/core/common/empty_hashes.hpp>
#include <silkrelay/core/common/endian.hpp>
#include <silkrelay/core/common/util.hpp>
#include <silkrelay/core/pow/hashimoto.hpp>
#include <silkrelay/core/protocol/difficulty.hpp>
#include <silkrelay/core/protocol/validation.hpp>

namespace silkrelay::test_util {

BlockHeader header_from_hex(std::string_view rlp_hex) {
    const std::optional<Bytes> rlp{from_hex(rlp_hex)};
    if (!rlp) {
        throw std::runtime_error("invalid hex");
    }
    ByteView view{*rlp};
    BlockHeader header;
    if (!rlp::decode(view, header)) {
        throw std::runtime_error("invalid header RLP");
    }
    return header;
}

Bytes encode_header(const BlockHeader& header) {
    Bytes out;
    rlp::encode(out, header);
    return out;
}

BlockHeader make_root_header(const intx::uint256& difficulty, uint64_t timestamp) {
    BlockHeader header;
    header.ommers_hash = kEmptyListHash;
    header.difficulty = difficulty;
    header.number = 0;
    header.gas_limit = 8'000'000;
    header.timestamp = timestamp;
    return header;
}

BlockHeader make_child(const BlockHeader& parent, uint64_t time_delta, const ChainConfig& config, uint8_t tag) {
    BlockHeader child;
    child.parent_hash = parent.hash();
    child.ommers_hash = kEmptyListHash;
    child.number = parent.number + 1;
    child.timestamp = parent.timestamp + time_delta;
    child.gas_limit = parent.gas_limit;
    child.difficulty = protocol::expected_difficulty(parent, child.timestamp, config);
    if (config.is_london(child.number)) {
        if (config.london_block == child.number) {
            child.gas_limit = parent.gas_limit * 2;
        }
        child.base_fee_per_gas = protocol::expected_base_fee_per_gas(parent);
    }
    if (tag != 0) {
        child.extra_data.push_back(tag);
    }
    return child;
}

void mine(BlockHeader& header, const ethash::epoch_context& context) {
    const auto seal_hash{ethash::hash256_from_bytes(header.hash(/*for_sealing=*/true).bytes)};
    for (uint64_t nonce{0}; nonce < 1'000'000; ++nonce) {
        const ethash::result result{ethash::hash(context, seal_hash, nonce)};
        if (pow::check_against_difficulty(result.final_hash, header.difficulty)) {
            endian::store_big_u64(header.nonce.data(), nonce);
            std::memcpy(header.mix_hash.bytes, result.mix_hash.bytes, kHashLength);
            return;
        }
    }
    throw std::runtime_error("no seal found for difficulty " + intx::to_string(header.difficulty));
}

const ethash::epoch_context& epoch_zero_context() {
    static const ethash::epoch_context_ptr kContext{ethash::create_epoch_context(0)};
    if (!kContext) {
        throw std::runtime_error("cannot create epoch 0 context");
    }
    return *kContext;
}

ChainConfig low_difficulty_config(const intx::uint256& minimum_difficulty) {
    ChainConfig config;
    config.chain_id = 1337;
    config.homestead_block = 0;
    config.minimum_difficulty = minimum_difficulty;
    return config;
}

}  // namespace silkrelay::test_util
