// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <silkrelay/core/common/base.hpp>

namespace silkrelay {

//! \brief The tip of the canonical chain as exposed to queries
struct ChainHead {
    BlockNum block_num{0};
    evmc::bytes32 hash;
    intx::uint256 total_difficulty;

    friend bool operator==(const ChainHead&, const ChainHead&) = default;
};

}  // namespace silkrelay
