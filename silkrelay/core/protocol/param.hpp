// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

#include <silkrelay/core/common/base.hpp>

namespace silkrelay::protocol {

inline constexpr size_t kMaxExtraDataBytes{32};

inline constexpr uint64_t kMinGasLimit{5000};
inline constexpr uint64_t kMaxGasLimit{std::numeric_limits<int64_t>::max()};  // EIP-1985
inline constexpr uint64_t kGasLimitBoundDivisor{1024};

// EIP-1559: Fee market change for ETH 1.0 chain
inline constexpr uint64_t kInitialBaseFee{1'000'000'000};
inline constexpr uint64_t kBaseFeeMaxChangeDenominator{8};
inline constexpr uint64_t kElasticityMultiplier{2};

// Yellow Paper, Section 4.3.4 "Block Header Validity"
inline constexpr uint64_t kMinimumDifficulty{131'072};
inline constexpr uint64_t kDifficultyBoundDivisorShift{11};  // parent_difficulty / 2048

}  // namespace silkrelay::protocol
