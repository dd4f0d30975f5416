// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <absl/functional/function_ref.h>
#include <ethash/ethash.hpp>
#include <ethash/hash_types.hpp>
#include <intx/intx.hpp>

namespace silkrelay::pow {

//! Size in bytes of a full dataset item, the unit fetched by each hashimoto access
inline constexpr size_t kDatasetItemSize{128};

//! Number of full dataset items read while hashing one nonce
inline constexpr uint32_t kNumDatasetAccesses{64};

//! Number of light cache parents mixed into each 512-bit dataset half
inline constexpr uint32_t kDatasetItemParents{256};

//! \brief Supplies full dataset items by index, std::nullopt when the item is not available
using DatasetLookup = absl::FunctionRef<std::optional<ethash::hash1024>(uint32_t index)>;

//! \brief Computes a full dataset item out of the epoch light cache
ethash::hash1024 calculate_dataset_item_1024(const ethash::epoch_context& context, uint32_t index) noexcept;

//! \brief Runs the Ethash main loop over items served by lookup
//! \param [in] header_hash : the seal hash of the header
//! \param [in] nonce : the nonce (big endian interpretation of the header field)
//! \param [in] full_dataset_num_items : number of 128 byte items in the epoch dataset
//! \return The final and mix hashes, or std::nullopt as soon as the lookup fails to provide an item
std::optional<ethash::result> hashimoto(const ethash::hash256& header_hash, uint64_t nonce,
                                        uint32_t full_dataset_num_items, DatasetLookup lookup);

//! \brief Indices of the dataset items read while hashing the given nonce, in access order
std::vector<uint32_t> dataset_accesses(const ethash::epoch_context& context, const ethash::hash256& header_hash,
                                       uint64_t nonce);

//! \brief Whether final_hash satisfies final_hash <= 2^256 / difficulty
bool check_against_difficulty(const ethash::hash256& final_hash, const intx::uint256& difficulty) noexcept;

}  // namespace silkrelay::pow
