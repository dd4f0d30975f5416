// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "epoch_cache.hpp"

#include <algorithm>
#include <utility>

namespace silkrelay::pow {

EpochContextPtr EpochContextCache::get(uint64_t epoch_number) {
    if (epoch_number >= kMaxEpochNumber) {
        return nullptr;
    }
    const int epoch{static_cast<int>(epoch_number)};

    std::scoped_lock lock{mutex_};
    const auto it{std::ranges::find_if(contexts_, [epoch](const EpochContextPtr& ctx) {
        return ctx->epoch_number == epoch;
    })};
    if (it != contexts_.end()) {
        EpochContextPtr context{*it};
        contexts_.erase(it);
        contexts_.push_front(context);
        return context;
    }

    ethash::epoch_context_ptr created{ethash::create_epoch_context(epoch)};
    if (!created) {
        return nullptr;
    }

    EpochContextPtr context{std::move(created)};
    contexts_.push_front(context);
    while (contexts_.size() > capacity_) {
        contexts_.pop_back();
    }
    return context;
}

bool EpochContextCache::contains(uint64_t epoch_number) const {
    std::scoped_lock lock{mutex_};
    return std::ranges::any_of(contexts_, [epoch_number](const EpochContextPtr& ctx) {
        return static_cast<uint64_t>(ctx->epoch_number) == epoch_number;
    });
}

size_t EpochContextCache::size() const {
    std::scoped_lock lock{mutex_};
    return contexts_.size();
}

}  // namespace silkrelay::pow
