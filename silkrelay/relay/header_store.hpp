// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <absl/functional/function_ref.h>
#include <evmc/evmc.hpp>

#include <silkrelay/core/common/base.hpp>
#include <silkrelay/core/common/hash_maps.hpp>
#include <silkrelay/core/types/block.hpp>
#include <silkrelay/core/types/block_id.hpp>

namespace silkrelay::relay {

//! \brief A verified header together with its hash and cumulative difficulty
struct HeaderRecord {
    BlockHeader header;
    evmc::bytes32 hash;
    TotalDifficulty total_difficulty;

    BlockNum block_num() const noexcept { return header.number; }
    const evmc::bytes32& parent_hash() const noexcept { return header.parent_hash; }
    BlockId id() const { return {header.number, hash}; }
};

enum class InsertResult {
    kInserted,
    kDuplicate,  // Already known, nothing changed
    kOrphan,     // Parent unknown, nothing changed
};

//! \brief Tells whether a record below the pruning horizon stays
using KeepRecordFunc = absl::FunctionRef<bool(const HeaderRecord&)>;

//! \brief Arena of verified headers keyed by hash, linked to their parents by hash.
//! \details Every record descends from the checkpoint record (or from the lowest record left by pruning).
//! Records are never modified once stored.
class HeaderStore {
  public:
    HeaderStore() = default;

    // Not copyable nor movable
    HeaderStore(const HeaderStore&) = delete;
    HeaderStore& operator=(const HeaderStore&) = delete;

    //! \brief Empties the store and seeds it with the trusted root record
    void init_checkpoint(const BlockHeader& header, const evmc::bytes32& hash, const TotalDifficulty& total_difficulty);

    //! \brief Adds a header whose parent is stored
    //! \remarks The record total difficulty is the parent's one plus the header difficulty
    InsertResult insert(const BlockHeader& header, const evmc::bytes32& hash);

    //! \brief Puts back a record loaded from persistent storage, without requiring its parent
    void restore(HeaderRecord record);

    //! \return The stored record or nullptr. Pointers stay valid until the record is pruned.
    const HeaderRecord* get(const evmc::bytes32& hash) const;

    bool contains(const evmc::bytes32& hash) const { return records_.contains(hash); }

    //! \brief Up to depth stored ancestors of the given record, parent first
    std::vector<const HeaderRecord*> ancestors(const evmc::bytes32& hash, size_t depth) const;

    //! \brief Whether candidate is the record of or one of its stored ancestors
    bool is_ancestor(const evmc::bytes32& candidate, const evmc::bytes32& of) const;

    //! \brief Hashes of every stored record at the given height, in insertion order
    std::vector<evmc::bytes32> hashes_at(BlockNum block_num) const;

    //! \brief Forgets the records strictly below below_height for which keep returns false,
    //! together with their descendants
    //! \remarks Only heights from pruned_below() up are visited: records left below a previous horizon are all kept
    //! \return Identifiers of the forgotten records, ascending by block number
    std::vector<BlockId> prune(BlockNum below_height, KeepRecordFunc keep);

    //! \brief Height up to which records have already been pruned
    BlockNum pruned_below() const { return pruned_below_; }

    //! \brief Forgets every record strictly below below_height
    //! \return Identifiers of the forgotten records
    std::vector<BlockId> forget_below(BlockNum below_height);

    size_t size() const { return records_.size(); }

    void clear();

    std::optional<BlockNum> lowest_block_num() const;
    std::optional<BlockNum> highest_block_num() const;

  private:
    void add(HeaderRecord record);
    void erase(const evmc::bytes32& hash, BlockNum block_num);

    NodeHashMap<evmc::bytes32, HeaderRecord> records_;
    BTreeMap<BlockNum, std::vector<evmc::bytes32>> hashes_by_block_num_;
    BlockNum pruned_below_{0};
};

}  // namespace silkrelay::relay
