// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string_view>

#include <ethash/ethash.hpp>
#include <intx/intx.hpp>

#include <silkrelay/core/chain/config.hpp>
#include <silkrelay/core/common/bytes.hpp>
#include <silkrelay/core/types/block.hpp>

namespace silkrelay::test_util {

//! \brief Decodes a hex encoded RLP header
//! \throws std::runtime_error on malformed input
BlockHeader header_from_hex(std::string_view rlp_hex);

Bytes encode_header(const BlockHeader& header);

//! \brief Root of a synthetic chain
BlockHeader make_root_header(const intx::uint256& difficulty, uint64_t timestamp = 1'000'000);

//! \brief Builds a child carrying the difficulty and base fee expected under config.
//! \param [in] tag : stored in extra data so that siblings get distinct hashes
BlockHeader make_child(const BlockHeader& parent, uint64_t time_delta, const ChainConfig& config, uint8_t tag = 0);

//! \brief Finds a nonce satisfying the header difficulty and fills nonce and mix hash accordingly
//! \remarks Meant for low difficulties only
void mine(BlockHeader& header, const ethash::epoch_context& context);

//! \brief Light cache of the first epoch, shared by all tests of the process
const ethash::epoch_context& epoch_zero_context();

//! \brief Chain config of a private network sealing at very low difficulty
ChainConfig low_difficulty_config(const intx::uint256& minimum_difficulty);

}  // namespace silkrelay::test_util
