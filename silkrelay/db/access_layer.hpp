// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Database Access Layer
// See Erigon core/rawdb/accessors_chain.go

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <silkrelay/core/chain/config.hpp>
#include <silkrelay/core/common/base.hpp>
#include <silkrelay/core/types/block.hpp>
#include <silkrelay/core/types/block_id.hpp>
#include <silkrelay/db/mdbx.hpp>

namespace silkrelay::db {

// Erigon EncodeBlockNumber
Bytes block_key(BlockNum block_num);

// Erigon HeaderKey
Bytes block_key(BlockNum block_num, const evmc::bytes32& hash);

//! \brief Reads a header from table::kHeaders
//! \throws DecodingException if the stored RLP is malformed
std::optional<BlockHeader> read_header(ROTxn& txn, BlockNum block_num, const evmc::bytes32& hash);

//! \brief Writes a header RLP into table::kHeaders and its number into table::kHeaderNumbers
void write_header(RWTxn& txn, const BlockHeader& header, const evmc::bytes32& hash);

//! \brief Deletes a header with its number and total difficulty
void delete_header(RWTxn& txn, BlockNum block_num, const evmc::bytes32& hash);

std::optional<BlockNum> read_block_num(ROTxn& txn, const evmc::bytes32& hash);

std::optional<intx::uint256> read_total_difficulty(ROTxn& txn, BlockNum block_num, const evmc::bytes32& hash);
void write_total_difficulty(RWTxn& txn, BlockNum block_num, const evmc::bytes32& hash,
                            const intx::uint256& total_difficulty);

std::optional<evmc::bytes32> read_canonical_hash(ROTxn& txn, BlockNum block_num);
void write_canonical_hash(RWTxn& txn, BlockNum block_num, const evmc::bytes32& hash);

//! \brief Deletes canonical hashes of all blocks strictly above block_num
void delete_canonical_hashes_above(RWTxn& txn, BlockNum block_num);

//! \brief Deletes canonical hashes of all blocks strictly below block_num
void delete_canonical_hashes_below(RWTxn& txn, BlockNum block_num);

std::optional<evmc::bytes32> read_head_header_hash(ROTxn& txn);
void write_head_header_hash(RWTxn& txn, const evmc::bytes32& hash);

std::optional<evmc::bytes32> read_checkpoint_hash(ROTxn& txn);
void write_checkpoint_hash(RWTxn& txn, const evmc::bytes32& hash);

//! \brief Reads the chain config stored along the checkpoint
//! \return std::nullopt when missing or not parsable
std::optional<ChainConfig> read_chain_config(ROTxn& txn, const evmc::bytes32& checkpoint_hash);
void write_chain_config(RWTxn& txn, const evmc::bytes32& checkpoint_hash, const ChainConfig& config);

//! \brief Walks all stored headers by ascending block number
//! \throws DecodingException if a stored RLP is malformed
void for_each_header(ROTxn& txn, absl::FunctionRef<void(const BlockHeader&, const evmc::bytes32&)> func);

}  // namespace silkrelay::db
