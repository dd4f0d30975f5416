// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "hashimoto.hpp"

#include <bit>
#include <cstring>

#include <ethash/keccak.hpp>

#include <silkrelay/core/common/endian.hpp>

namespace silkrelay::pow {

// Word access through the hash unions follows the little endian layout of the algorithm
static_assert(std::endian::native == std::endian::little);

static constexpr uint32_t kFnvPrime{0x01000193};

static constexpr uint32_t fnv1(uint32_t u, uint32_t v) noexcept { return (u * kFnvPrime) ^ v; }

static ethash::hash512 fnv1(const ethash::hash512& u, const ethash::hash512& v) noexcept {
    ethash::hash512 r;
    for (size_t i{0}; i < sizeof(r) / sizeof(r.word32s[0]); ++i) {
        r.word32s[i] = fnv1(u.word32s[i], v.word32s[i]);
    }
    return r;
}

static ethash::hash512 calculate_dataset_item_512(const ethash::epoch_context& context, uint32_t index) noexcept {
    const auto num_cache_items{static_cast<uint32_t>(context.light_cache_num_items)};

    ethash::hash512 mix{context.light_cache[index % num_cache_items]};
    mix.word32s[0] ^= index;
    mix = ethash::keccak512(mix.bytes, sizeof(mix));

    for (uint32_t r{0}; r < kDatasetItemParents; ++r) {
        const uint32_t parent{fnv1(index ^ r, mix.word32s[r % 16])};
        mix = fnv1(mix, context.light_cache[parent % num_cache_items]);
    }

    return ethash::keccak512(mix.bytes, sizeof(mix));
}

ethash::hash1024 calculate_dataset_item_1024(const ethash::epoch_context& context, uint32_t index) noexcept {
    ethash::hash1024 item;
    item.hash512s[0] = calculate_dataset_item_512(context, index * 2);
    item.hash512s[1] = calculate_dataset_item_512(context, index * 2 + 1);
    return item;
}

std::optional<ethash::result> hashimoto(const ethash::hash256& header_hash, uint64_t nonce,
                                        uint32_t full_dataset_num_items, DatasetLookup lookup) {
    if (full_dataset_num_items == 0) {
        return std::nullopt;
    }

    uint8_t init_data[sizeof(header_hash) + sizeof(nonce)];
    std::memcpy(init_data, header_hash.bytes, sizeof(header_hash));
    endian::store_little_u64(&init_data[sizeof(header_hash)], nonce);
    const ethash::hash512 seed{ethash::keccak512(init_data, sizeof(init_data))};
    const uint32_t seed_init{seed.word32s[0]};

    ethash::hash1024 mix;
    mix.hash512s[0] = seed;
    mix.hash512s[1] = seed;

    static constexpr size_t kMixWords{sizeof(mix) / sizeof(mix.word32s[0])};
    for (uint32_t i{0}; i < kNumDatasetAccesses; ++i) {
        const uint32_t index{fnv1(i ^ seed_init, mix.word32s[i % kMixWords]) % full_dataset_num_items};
        const std::optional<ethash::hash1024> item{lookup(index)};
        if (!item) {
            return std::nullopt;
        }
        for (size_t j{0}; j < kMixWords; ++j) {
            mix.word32s[j] = fnv1(mix.word32s[j], item->word32s[j]);
        }
    }

    ethash::result result;
    for (size_t i{0}; i < kMixWords; i += 4) {
        const uint32_t h1{fnv1(mix.word32s[i], mix.word32s[i + 1])};
        const uint32_t h2{fnv1(h1, mix.word32s[i + 2])};
        const uint32_t h3{fnv1(h2, mix.word32s[i + 3])};
        result.mix_hash.word32s[i / 4] = h3;
    }

    uint8_t final_data[sizeof(seed) + sizeof(result.mix_hash)];
    std::memcpy(final_data, seed.bytes, sizeof(seed));
    std::memcpy(&final_data[sizeof(seed)], result.mix_hash.bytes, sizeof(result.mix_hash));
    result.final_hash = ethash::keccak256(final_data, sizeof(final_data));
    return result;
}

std::vector<uint32_t> dataset_accesses(const ethash::epoch_context& context, const ethash::hash256& header_hash,
                                       uint64_t nonce) {
    std::vector<uint32_t> indices;
    indices.reserve(kNumDatasetAccesses);
    const auto full_dataset_num_items{static_cast<uint32_t>(context.full_dataset_num_items)};
    const auto record_access{[&](uint32_t index) -> std::optional<ethash::hash1024> {
        indices.push_back(index);
        return calculate_dataset_item_1024(context, index);
    }};
    hashimoto(header_hash, nonce, full_dataset_num_items, record_access);
    return indices;
}

bool check_against_difficulty(const ethash::hash256& final_hash, const intx::uint256& difficulty) noexcept {
    if (difficulty == 0) {
        return false;
    }
    if (difficulty == 1) {
        return true;
    }
    static const intx::uint320 kDividend{intx::uint320{1} << 256};
    const intx::uint256 boundary{kDividend / difficulty};
    return intx::be::load<intx::uint256>(final_hash) <= boundary;
}

}  // namespace silkrelay::pow
