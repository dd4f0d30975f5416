// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

namespace silkrelay {

using namespace evmc::literals;

inline constexpr evmc::bytes32 kZeroHash{};

// Keccak-256 hash of the RLP of an empty list, KEC("\xc0"). Ommers hash of a block without uncles.
inline constexpr evmc::bytes32 kEmptyListHash{
    0x1dcc4de8dec75d7aab85b567b6ccd41ad312451b948a7413f0a142fd40d49347_bytes32};

}  // namespace silkrelay
