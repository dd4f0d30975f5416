// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic concepts, types, and constants.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>

#include <intx/intx.hpp>

namespace silkrelay {

using namespace std::string_view_literals;

template <class T>
concept UnsignedIntegral = std::unsigned_integral<T> || std::same_as<T, intx::uint128> ||
                           std::same_as<T, intx::uint256> || std::same_as<T, intx::uint512>;

using BlockNum = uint64_t;

inline constexpr BlockNum kMaxBlockNum = std::numeric_limits<BlockNum>::max();

using BlockTime = uint64_t;

inline constexpr size_t kAddressLength{20};

inline constexpr size_t kHashLength{32};

// https://en.wikipedia.org/wiki/Binary_prefix
inline constexpr uint64_t kKibi{1024};
inline constexpr uint64_t kMebi{1024 * kKibi};
inline constexpr uint64_t kGibi{1024 * kMebi};
inline constexpr uint64_t kTebi{1024 * kGibi};

inline constexpr uint64_t kGiga{1'000'000'000};  // = 10^9

consteval uint64_t operator"" _Kibi(unsigned long long x) { return x * kKibi; }
consteval uint64_t operator"" _Mebi(unsigned long long x) { return x * kMebi; }
consteval uint64_t operator"" _Gibi(unsigned long long x) { return x * kGibi; }
consteval uint64_t operator"" _Tebi(unsigned long long x) { return x * kTebi; }

}  // namespace silkrelay
