// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>

#include <silkrelay/core/common/hash_maps.hpp>
#include <silkrelay/core/types/block_id.hpp>
#include <silkrelay/core/types/chain_head.hpp>
#include <silkrelay/relay/header_store.hpp>

namespace silkrelay::relay {

enum class ChainUpdateKind {
    kExtended,     // New head is a child of the previous one
    kReorganized,  // New head is on another branch
    kStale,        // Head unchanged
};

struct ChainUpdate {
    ChainUpdateKind kind{ChainUpdateKind::kStale};
    std::optional<BlockId> fork_point;  // only for kReorganized
    uint64_t reorg_depth{0};            // number of canonical records replaced

    //! \brief (block_num, hash) pairs which became canonical, ascending
    std::vector<BlockId> canonized;
};

// ChainSelector maintains the canonical chain over the records of a HeaderStore using the heaviest total
// difficulty rule. On equal total difficulty the numerically lowest hash wins, so that every verifier fed with
// the same records agrees on the same head whatever the submission order.
class ChainSelector {
  public:
    explicit ChainSelector(const HeaderStore& store) : store_{store} {}

    // Not copyable nor movable
    ChainSelector(const ChainSelector&) = delete;
    ChainSelector& operator=(const ChainSelector&) = delete;

    //! \brief Makes the given record the head and the only canonical one
    void reset_head(const HeaderRecord& record);

    //! \brief Makes the given stored record the head and rebuilds the canonical index from its ancestors
    void restore_head(const evmc::bytes32& hash);

    //! \brief Applies the fork choice rule to a freshly inserted record
    ChainUpdate update(const HeaderRecord& record);

    ChainHead head() const { return head_; }
    BlockNum head_block_num() const { return head_.block_num; }
    const evmc::bytes32& head_hash() const { return head_.hash; }

    std::optional<evmc::bytes32> canonical_hash(BlockNum block_num) const;

    //! \brief Canonical hash at block_num only if confirmed by at least confirmations descendants
    std::optional<evmc::bytes32> canonical_hash_safe(BlockNum block_num, uint64_t confirmations) const;

    bool is_canonical(const HeaderRecord& record) const;

    //! \brief Drops canonical index entries strictly below below_height
    void forget_below(BlockNum below_height);

    static bool is_heavier(const HeaderRecord& record, const ChainHead& head);

  private:
    const HeaderStore& store_;
    ChainHead head_;
    BTreeMap<BlockNum, evmc::bytes32> canonical_;
};

}  // namespace silkrelay::relay
