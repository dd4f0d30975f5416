// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <variant>

#include <intx/intx.hpp>

#include <silkrelay/core/chain/config.hpp>
#include <silkrelay/core/common/base.hpp>
#include <silkrelay/core/protocol/validation.hpp>
#include <silkrelay/core/types/block.hpp>

namespace silkrelay::protocol {

// Original adjustment: parent ± parent/2048 depending on whether the block came within 13 seconds
struct FrontierFormula {};

// EIP-2: parent + parent/2048 * max(1 - delta/10, -99)
struct HomesteadFormula {};

// EIP-100: parent + parent/2048 * max((uncles ? 2 : 1) - delta/9, -99), plus the delayed difficulty bomb
struct ByzantiumFormula {
    uint64_t bomb_delay{0};

    friend bool operator==(const ByzantiumFormula&, const ByzantiumFormula&) = default;
};

using DifficultyFormula = std::variant<FrontierFormula, HomesteadFormula, ByzantiumFormula>;

//! \brief Selects the adjustment rule in force at the given block
DifficultyFormula difficulty_formula(BlockNum block_num, const ChainConfig& config) noexcept;

//! \brief Difficulty of a block given the relevant parent data, clamped to config.minimum_difficulty
//! \see Yellow Paper, Section 4.3.4 "Block Header Validity"
intx::uint256 canonical_difficulty(BlockNum block_num, BlockTime block_timestamp,
                                   const intx::uint256& parent_difficulty, BlockTime parent_timestamp,
                                   bool parent_has_uncles, const ChainConfig& config);

//! \brief Difficulty the child of parent must carry when sealed at child_timestamp
intx::uint256 expected_difficulty(const BlockHeader& parent, BlockTime child_timestamp, const ChainConfig& config);

ValidationResult validate_difficulty(const BlockHeader& header, const BlockHeader& parent, const ChainConfig& config);

}  // namespace silkrelay::protocol
