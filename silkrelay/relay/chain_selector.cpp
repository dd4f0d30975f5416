// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "chain_selector.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include <silkrelay/core/common/util.hpp>

namespace silkrelay::relay {

void ChainSelector::reset_head(const HeaderRecord& record) {
    head_ = {record.block_num(), record.hash, record.total_difficulty};
    canonical_.clear();
    canonical_[record.block_num()] = record.hash;
}

void ChainSelector::restore_head(const evmc::bytes32& hash) {
    const HeaderRecord* record{store_.get(hash)};
    if (!record) {
        throw std::invalid_argument{"ChainSelector: head not found hash=" + to_hex(hash)};
    }
    head_ = {record->block_num(), record->hash, record->total_difficulty};
    canonical_.clear();
    for (; record; record = store_.get(record->parent_hash())) {
        canonical_[record->block_num()] = record->hash;
    }
}

bool ChainSelector::is_heavier(const HeaderRecord& record, const ChainHead& head) {
    if (record.total_difficulty != head.total_difficulty) {
        return record.total_difficulty > head.total_difficulty;
    }
    return record.hash < head.hash;
}

ChainUpdate ChainSelector::update(const HeaderRecord& record) {
    ChainUpdate update;
    if (record.hash == head_.hash || !is_heavier(record, head_)) {
        return update;
    }

    if (record.parent_hash() == head_.hash) {
        update.kind = ChainUpdateKind::kExtended;
        update.canonized.push_back(record.id());
    } else {
        // Walk the new branch down until it meets the current canonical chain
        std::vector<BlockId> branch;
        const HeaderRecord* cursor{&record};
        while (cursor && !is_canonical(*cursor)) {
            branch.push_back(cursor->id());
            cursor = store_.get(cursor->parent_hash());
        }
        if (!cursor) {
            throw std::logic_error{"ChainSelector: no common ancestor with canonical chain for hash=" +
                                   to_hex(record.hash)};
        }
        std::ranges::reverse(branch);

        update.kind = ChainUpdateKind::kReorganized;
        update.fork_point = cursor->id();
        update.reorg_depth = head_.block_num - cursor->block_num();
        update.canonized = std::move(branch);

        canonical_.erase(canonical_.upper_bound(cursor->block_num()), canonical_.end());
    }

    for (const BlockId& id : update.canonized) {
        canonical_[id.block_num] = id.hash;
    }
    head_ = {record.block_num(), record.hash, record.total_difficulty};
    return update;
}

std::optional<evmc::bytes32> ChainSelector::canonical_hash(BlockNum block_num) const {
    const auto it{canonical_.find(block_num)};
    if (it == canonical_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<evmc::bytes32> ChainSelector::canonical_hash_safe(BlockNum block_num, uint64_t confirmations) const {
    if (block_num > head_.block_num || head_.block_num - block_num < confirmations) {
        return std::nullopt;
    }
    return canonical_hash(block_num);
}

bool ChainSelector::is_canonical(const HeaderRecord& record) const {
    const auto it{canonical_.find(record.block_num())};
    return it != canonical_.end() && it->second == record.hash;
}

void ChainSelector::forget_below(BlockNum below_height) {
    canonical_.erase(canonical_.begin(), canonical_.lower_bound(below_height));
}

}  // namespace silkrelay::relay
