// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "header_store.hpp"

#include <algorithm>
#include <utility>

namespace silkrelay::relay {

void HeaderStore::init_checkpoint(const BlockHeader& header, const evmc::bytes32& hash,
                                  const TotalDifficulty& total_difficulty) {
    clear();
    add({header, hash, total_difficulty});
}

void HeaderStore::clear() {
    records_.clear();
    hashes_by_block_num_.clear();
    pruned_below_ = 0;
}

InsertResult HeaderStore::insert(const BlockHeader& header, const evmc::bytes32& hash) {
    if (records_.contains(hash)) {
        return InsertResult::kDuplicate;
    }
    const HeaderRecord* parent{get(header.parent_hash)};
    if (!parent) {
        return InsertResult::kOrphan;
    }
    add({header, hash, parent->total_difficulty + header.difficulty});
    return InsertResult::kInserted;
}

void HeaderStore::restore(HeaderRecord record) {
    if (records_.contains(record.hash)) {
        return;
    }
    add(std::move(record));
}

void HeaderStore::add(HeaderRecord record) {
    const BlockNum block_num{record.block_num()};
    const evmc::bytes32 hash{record.hash};
    records_.emplace(hash, std::move(record));
    hashes_by_block_num_[block_num].push_back(hash);
}

void HeaderStore::erase(const evmc::bytes32& hash, BlockNum block_num) {
    records_.erase(hash);
    const auto it{hashes_by_block_num_.find(block_num)};
    if (it == hashes_by_block_num_.end()) {
        return;
    }
    std::erase(it->second, hash);
    if (it->second.empty()) {
        hashes_by_block_num_.erase(it);
    }
}

const HeaderRecord* HeaderStore::get(const evmc::bytes32& hash) const {
    const auto it{records_.find(hash)};
    return it != records_.end() ? &it->second : nullptr;
}

std::vector<const HeaderRecord*> HeaderStore::ancestors(const evmc::bytes32& hash, size_t depth) const {
    std::vector<const HeaderRecord*> result;
    const HeaderRecord* record{get(hash)};
    while (record && result.size() < depth) {
        record = get(record->parent_hash());
        if (record) {
            result.push_back(record);
        }
    }
    return result;
}

bool HeaderStore::is_ancestor(const evmc::bytes32& candidate, const evmc::bytes32& of) const {
    const HeaderRecord* target{get(candidate)};
    const HeaderRecord* record{get(of)};
    if (!target || !record) {
        return false;
    }
    while (record && record->block_num() > target->block_num()) {
        record = get(record->parent_hash());
    }
    return record && record->hash == target->hash;
}

std::vector<evmc::bytes32> HeaderStore::hashes_at(BlockNum block_num) const {
    const auto it{hashes_by_block_num_.find(block_num)};
    if (it == hashes_by_block_num_.end()) {
        return {};
    }
    return it->second;
}

std::vector<BlockId> HeaderStore::prune(BlockNum below_height, KeepRecordFunc keep) {
    std::vector<BlockId> pruned;
    if (below_height <= pruned_below_) {
        return pruned;
    }
    for (auto it{hashes_by_block_num_.lower_bound(pruned_below_)};
         it != hashes_by_block_num_.end() && it->first < below_height; ++it) {
        for (const evmc::bytes32& hash : it->second) {
            if (!keep(records_.at(hash))) {
                pruned.push_back({it->first, hash});
            }
        }
    }
    pruned_below_ = below_height;
    if (pruned.empty()) {
        return pruned;
    }

    // Records above the horizon descending from a pruned record are unreachable as well
    FlatHashSet<evmc::bytes32> dropped;
    for (const BlockId& id : pruned) {
        dropped.insert(id.hash);
    }
    for (auto it{hashes_by_block_num_.lower_bound(below_height)}; it != hashes_by_block_num_.end(); ++it) {
        for (const evmc::bytes32& hash : it->second) {
            if (dropped.contains(records_.at(hash).parent_hash())) {
                dropped.insert(hash);
                pruned.push_back({it->first, hash});
            }
        }
    }

    for (const BlockId& id : pruned) {
        erase(id.hash, id.block_num);
    }
    return pruned;
}

std::vector<BlockId> HeaderStore::forget_below(BlockNum below_height) {
    std::vector<BlockId> forgotten;
    for (auto it{hashes_by_block_num_.begin()}; it != hashes_by_block_num_.end() && it->first < below_height; ++it) {
        for (const evmc::bytes32& hash : it->second) {
            forgotten.push_back({it->first, hash});
        }
    }
    for (const BlockId& id : forgotten) {
        erase(id.hash, id.block_num);
    }
    pruned_below_ = std::max(pruned_below_, below_height);
    return forgotten;
}

std::optional<BlockNum> HeaderStore::lowest_block_num() const {
    if (hashes_by_block_num_.empty()) {
        return std::nullopt;
    }
    return hashes_by_block_num_.begin()->first;
}

std::optional<BlockNum> HeaderStore::highest_block_num() const {
    if (hashes_by_block_num_.empty()) {
        return std::nullopt;
    }
    return hashes_by_block_num_.rbegin()->first;
}

}  // namespace silkrelay::relay
