// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "access_layer.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include <silkrelay/core/common/endian.hpp>
#include <silkrelay/core/common/util.hpp>
#include <silkrelay/core/rlp/decode.hpp>
#include <silkrelay/core/rlp/encode.hpp>
#include <silkrelay/db/tables.hpp>
#include <silkrelay/infra/common/decoding_exception.hpp>

namespace silkrelay::db {

Bytes block_key(BlockNum block_num) {
    Bytes key(8, '\0');
    endian::store_big_u64(&key[0], block_num);
    return key;
}

Bytes block_key(BlockNum block_num, const evmc::bytes32& hash) {
    Bytes key(8 + kHashLength, '\0');
    endian::store_big_u64(&key[0], block_num);
    std::memcpy(&key[8], hash.bytes, kHashLength);
    return key;
}

static std::optional<evmc::bytes32> read_hash(ROTxn& txn, const MapConfig& config, ByteView key) {
    auto cursor{open_cursor(*txn, config)};
    const auto data{cursor.find(to_slice(key), /*throw_notfound=*/false)};
    if (!data || data.value.length() != kHashLength) {
        return std::nullopt;
    }
    return to_bytes32(from_slice(data.value));
}

static void write_hash(RWTxn& txn, const MapConfig& config, ByteView key, const evmc::bytes32& hash) {
    auto cursor{open_cursor(*txn, config)};
    cursor.upsert(to_slice(key), to_slice(hash.bytes));
}

static ByteView string_key(const char* key) {
    return {reinterpret_cast<const uint8_t*>(key), std::strlen(key)};
}

std::optional<BlockHeader> read_header(ROTxn& txn, BlockNum block_num, const evmc::bytes32& hash) {
    auto cursor{open_cursor(*txn, table::kHeaders)};
    const Bytes key{block_key(block_num, hash)};
    const auto data{cursor.find(to_slice(key), /*throw_notfound=*/false)};
    if (!data) {
        return std::nullopt;
    }
    BlockHeader header;
    ByteView encoded_header{from_slice(data.value)};
    success_or_throw(rlp::decode(encoded_header, header));
    return header;
}

void write_header(RWTxn& txn, const BlockHeader& header, const evmc::bytes32& hash) {
    Bytes value;
    rlp::encode(value, header);
    const Bytes key{block_key(header.number, hash)};

    auto headers{open_cursor(*txn, table::kHeaders)};
    headers.upsert(to_slice(key), to_slice(value));

    auto header_numbers{open_cursor(*txn, table::kHeaderNumbers)};
    const Bytes block_num{block_key(header.number)};
    header_numbers.upsert(to_slice(hash.bytes), to_slice(block_num));
}

void delete_header(RWTxn& txn, BlockNum block_num, const evmc::bytes32& hash) {
    const Bytes key{block_key(block_num, hash)};
    // Missing records are fine, erase reports them with false
    (void)txn->erase(open_map(*txn, table::kHeaders), to_slice(key));
    (void)txn->erase(open_map(*txn, table::kDifficulty), to_slice(key));
    (void)txn->erase(open_map(*txn, table::kHeaderNumbers), to_slice(hash.bytes));
}

std::optional<BlockNum> read_block_num(ROTxn& txn, const evmc::bytes32& hash) {
    auto cursor{open_cursor(*txn, table::kHeaderNumbers)};
    const auto data{cursor.find(to_slice(hash.bytes), /*throw_notfound=*/false)};
    if (!data || data.value.length() != sizeof(BlockNum)) {
        return std::nullopt;
    }
    return endian::load_big_u64(static_cast<const uint8_t*>(data.value.data()));
}

std::optional<intx::uint256> read_total_difficulty(ROTxn& txn, BlockNum block_num, const evmc::bytes32& hash) {
    auto cursor{open_cursor(*txn, table::kDifficulty)};
    const Bytes key{block_key(block_num, hash)};
    const auto data{cursor.find(to_slice(key), /*throw_notfound=*/false)};
    if (!data) {
        return std::nullopt;
    }
    intx::uint256 total_difficulty{0};
    ByteView data_view{from_slice(data.value)};
    success_or_throw(rlp::decode(data_view, total_difficulty));
    return total_difficulty;
}

void write_total_difficulty(RWTxn& txn, BlockNum block_num, const evmc::bytes32& hash,
                            const intx::uint256& total_difficulty) {
    Bytes value;
    rlp::encode(value, total_difficulty);
    const Bytes key{block_key(block_num, hash)};
    auto cursor{open_cursor(*txn, table::kDifficulty)};
    cursor.upsert(to_slice(key), to_slice(value));
}

std::optional<evmc::bytes32> read_canonical_hash(ROTxn& txn, BlockNum block_num) {
    return read_hash(txn, table::kCanonicalHashes, block_key(block_num));
}

void write_canonical_hash(RWTxn& txn, BlockNum block_num, const evmc::bytes32& hash) {
    write_hash(txn, table::kCanonicalHashes, block_key(block_num), hash);
}

void delete_canonical_hashes_above(RWTxn& txn, BlockNum block_num) {
    if (block_num == kMaxBlockNum) {
        return;
    }
    auto cursor{open_cursor(*txn, table::kCanonicalHashes)};
    (void)cursor_erase(cursor, block_key(block_num + 1), CursorMoveDirection::kForward);
}

void delete_canonical_hashes_below(RWTxn& txn, BlockNum block_num) {
    auto cursor{open_cursor(*txn, table::kCanonicalHashes)};
    (void)cursor_erase(cursor, block_key(block_num), CursorMoveDirection::kReverse);
}

std::optional<evmc::bytes32> read_head_header_hash(ROTxn& txn) {
    return read_hash(txn, table::kLastHeader, string_key(table::kLastHeaderKey));
}

void write_head_header_hash(RWTxn& txn, const evmc::bytes32& hash) {
    write_hash(txn, table::kLastHeader, string_key(table::kLastHeaderKey), hash);
}

std::optional<evmc::bytes32> read_checkpoint_hash(ROTxn& txn) {
    return read_hash(txn, table::kLastHeader, string_key(table::kCheckpointKey));
}

void write_checkpoint_hash(RWTxn& txn, const evmc::bytes32& hash) {
    write_hash(txn, table::kLastHeader, string_key(table::kCheckpointKey), hash);
}

std::optional<ChainConfig> read_chain_config(ROTxn& txn, const evmc::bytes32& checkpoint_hash) {
    auto cursor{open_cursor(*txn, table::kConfig)};
    const auto data{cursor.find(to_slice(checkpoint_hash.bytes), /*throw_notfound=*/false)};
    if (!data) {
        return std::nullopt;
    }
    // https://github.com/nlohmann/json/issues/2204
    const auto json = nlohmann::json::parse(data.value.as_string(), nullptr, /*allow_exceptions=*/false);
    return ChainConfig::from_json(json);
}

void write_chain_config(RWTxn& txn, const evmc::bytes32& checkpoint_hash, const ChainConfig& config) {
    const std::string config_data{config.to_json().dump()};
    auto cursor{open_cursor(*txn, table::kConfig)};
    cursor.upsert(to_slice(checkpoint_hash.bytes), ::mdbx::slice{config_data.data(), config_data.length()});
}

void for_each_header(ROTxn& txn, absl::FunctionRef<void(const BlockHeader&, const evmc::bytes32&)> func) {
    auto cursor{open_cursor(*txn, table::kHeaders)};
    cursor_for_each(cursor, [&func](ByteView key, ByteView value) {
        if (key.length() != sizeof(BlockNum) + kHashLength) {
            throw std::runtime_error{"Malformed key in table " + std::string{table::kHeaders.name}};
        }
        BlockHeader header;
        success_or_throw(rlp::decode(value, header));
        func(header, to_bytes32(key.substr(sizeof(BlockNum))));
    });
}

}  // namespace silkrelay::db
