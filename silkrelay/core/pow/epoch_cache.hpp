// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

#include <ethash/ethash.hpp>

namespace silkrelay::pow {

//! First epoch never generated (block 61'440'000 on mainnet)
inline constexpr uint64_t kMaxEpochNumber{2048};

using EpochContextPtr = std::shared_ptr<const ethash::epoch_context>;

//! \brief Keeps the Ethash light caches of the most recently used epochs.
//! \details A context handed out stays valid for as long as the caller holds it, even once evicted.
class EpochContextCache {
  public:
    explicit EpochContextCache(size_t capacity = 2) : capacity_{capacity == 0 ? 1 : capacity} {}

    // Not copyable nor movable
    EpochContextCache(const EpochContextCache&) = delete;
    EpochContextCache& operator=(const EpochContextCache&) = delete;

    //! \brief Returns the context of the given epoch, generating it on first use
    //! \return nullptr if the epoch is not below kMaxEpochNumber or the context cannot be generated
    EpochContextPtr get(uint64_t epoch_number);

    //! \brief Whether the context of the given epoch is currently held
    bool contains(uint64_t epoch_number) const;

    size_t size() const;

  private:
    mutable std::mutex mutex_;
    size_t capacity_;
    std::deque<EpochContextPtr> contexts_;  // most recently used first
};

}  // namespace silkrelay::pow
