// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

#include <silkrelay/core/common/base.hpp>

namespace silkrelay {

struct BlockId {
    BlockNum block_num{};
    evmc::bytes32 hash;

    friend bool operator==(const BlockId&, const BlockId&) = default;
};

}  // namespace silkrelay
