// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <silkrelay/core/common/base.hpp>
#include <silkrelay/core/common/bytes.hpp>

// intx does not include operator<< overloading for uint<N>
namespace intx {

template <unsigned N>
inline std::ostream& operator<<(std::ostream& out, const uint<N>& value) {
    out << "0x" << intx::hex(value);
    return out;
}

}  // namespace intx

namespace silkrelay {

using namespace evmc::literals;

//! \brief Strips leftmost zeroed bytes from byte sequence
//! \param [in] data : The view to process
//! \return A new view of the sequence
ByteView zeroless_view(ByteView data);

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

std::string to_hex(const evmc::bytes32& value, bool with_prefix = false);

//! \brief Parses a hex string (with or without 0x prefix) into bytes. An odd number of digits
//! is left padded with a zero nibble.
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

//! \brief Converts bytes to evmc::bytes32; input is cropped if necessary.
//! Short inputs are left-padded with 0s.
evmc::bytes32 to_bytes32(ByteView bytes);

//! \brief Parses either a decimal or a 0x prefixed hex literal into a 256 bits unsigned integer
std::optional<intx::uint256> parse_uint256(std::string_view str) noexcept;

inline ethash::hash256 keccak256(ByteView view) { return ethash::keccak256(view.data(), view.size()); }

inline std::ostream& operator<<(std::ostream& out, ByteView bytes) {
    for (const auto& b : bytes) {
        out << std::hex << std::setw(2) << std::setfill('0') << int{b};
    }
    out << std::dec;
    return out;
}

}  // namespace silkrelay
