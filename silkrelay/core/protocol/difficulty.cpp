// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "difficulty.hpp"

#include <silkrelay/core/common/empty_hashes.hpp>
#include <silkrelay/core/common/overloaded.hpp>

#include "param.hpp"

namespace silkrelay::protocol {

static uint64_t bomb_delay(BlockNum block_num, const ChainConfig& config) noexcept {
    const evmc_revision rev{config.revision(block_num)};
    if (config.gray_glacier_block && block_num >= *config.gray_glacier_block) {
        // EIP-5133: Delaying Difficulty Bomb to mid-September 2022
        return 11'400'000;
    }
    if (config.arrow_glacier_block && block_num >= *config.arrow_glacier_block) {
        // EIP-4345: Difficulty Bomb Delay to June 2022
        return 10'700'000;
    }
    if (rev >= EVMC_LONDON) {
        // EIP-3554: Difficulty Bomb Delay to December 2021
        return 9'700'000;
    }
    if (config.muir_glacier_block && block_num >= *config.muir_glacier_block) {
        // EIP-2384: Muir Glacier Difficulty Bomb Delay
        return 9'000'000;
    }
    if (rev >= EVMC_CONSTANTINOPLE) {
        // EIP-1234: Constantinople Difficulty Bomb Delay and Block Reward Adjustment
        return 5'000'000;
    }
    // EIP-649: Metropolis Difficulty Bomb Delay and Block Reward Reduction
    return 3'000'000;
}

DifficultyFormula difficulty_formula(BlockNum block_num, const ChainConfig& config) noexcept {
    const evmc_revision rev{config.revision(block_num)};
    if (rev >= EVMC_BYZANTIUM) {
        return ByzantiumFormula{bomb_delay(block_num, config)};
    }
    if (rev >= EVMC_HOMESTEAD) {
        return HomesteadFormula{};
    }
    return FrontierFormula{};
}

intx::uint256 canonical_difficulty(BlockNum block_num, BlockTime block_timestamp,
                                   const intx::uint256& parent_difficulty, BlockTime parent_timestamp,
                                   bool parent_has_uncles, const ChainConfig& config) {
    intx::uint256 difficulty{parent_difficulty};

    const intx::uint256 x{parent_difficulty >> kDifficultyBoundDivisorShift};  // parent_difficulty / 2048
    const uint64_t delta{block_timestamp > parent_timestamp ? block_timestamp - parent_timestamp : 0};

    uint64_t delay{0};
    std::visit(Overloaded{
                   [&](const FrontierFormula&) {
                       if (delta < 13) {
                           difficulty += x;
                       } else {
                           difficulty -= x;
                       }
                   },
                   [&](const HomesteadFormula&) {
                       difficulty -= x * 99;
                       const uint64_t z{delta / 10};
                       if (100 > z) {
                           difficulty += (100 - z) * x;
                       }
                   },
                   [&](const ByzantiumFormula& formula) {
                       difficulty -= x * 99;
                       // https://eips.ethereum.org/EIPS/eip-100
                       const uint64_t y{parent_has_uncles ? 2u : 1u};
                       const uint64_t z{delta / 9};
                       if (99 + y > z) {
                           difficulty += (99 + y - z) * x;
                       }
                       delay = formula.bomb_delay;
                   },
               },
               difficulty_formula(block_num, config));

    // https://eips.ethereum.org/EIPS/eip-649
    const uint64_t fake_block_num{block_num >= delay ? block_num - delay : 0};
    const uint64_t n{fake_block_num / 100'000};
    if (n >= 2 && n - 2 < 256) {
        difficulty += intx::uint256{1} << (n - 2);
    }

    if (difficulty < config.minimum_difficulty) {
        difficulty = config.minimum_difficulty;
    }
    return difficulty;
}

intx::uint256 expected_difficulty(const BlockHeader& parent, BlockTime child_timestamp, const ChainConfig& config) {
    const bool parent_has_uncles{parent.ommers_hash != kEmptyListHash};
    return canonical_difficulty(parent.number + 1, child_timestamp, parent.difficulty, parent.timestamp,
                                parent_has_uncles, config);
}

ValidationResult validate_difficulty(const BlockHeader& header, const BlockHeader& parent, const ChainConfig& config) {
    if (header.difficulty != expected_difficulty(parent, header.timestamp, config)) {
        return ValidationResult::kWrongDifficulty;
    }
    return ValidationResult::kOk;
}

}  // namespace silkrelay::protocol
