// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include <ethash/hash_types.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <silkrelay/core/common/base.hpp>
#include <silkrelay/core/common/bytes.hpp>
#include <silkrelay/core/rlp/decode.hpp>
#include <silkrelay/core/types/bloom.hpp>

namespace silkrelay {

using TotalDifficulty = intx::uint256;

//! \brief An Ethereum proof-of-work block header (Yellow Paper, Section 4.3)
struct BlockHeader {
    using NonceType = std::array<uint8_t, 8>;

    evmc::bytes32 parent_hash{};
    evmc::bytes32 ommers_hash{};
    evmc::address beneficiary{};
    evmc::bytes32 state_root{};
    evmc::bytes32 transactions_root{};
    evmc::bytes32 receipts_root{};
    Bloom logs_bloom{};
    intx::uint256 difficulty{};
    uint64_t number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    uint64_t timestamp{0};

    Bytes extra_data{};

    evmc::bytes32 mix_hash{};
    NonceType nonce{};

    // Added in London
    std::optional<intx::uint256> base_fee_per_gas{std::nullopt};  // EIP-1559

    //! \brief Keccak-256 of the RLP encoding. When for_sealing is set mix_hash and nonce are left out,
    //! which gives the Ethash input hash.
    evmc::bytes32 hash(bool for_sealing = false) const;

    //! \brief Calculates header's boundary. This is described by Equation(50) by the Yellow Paper.
    //! \return A hash of 256 bits with big endian byte order
    ethash::hash256 boundary() const;

    //! \brief The nonce as an unsigned integer (big endian interpretation of the 8 bytes)
    uint64_t nonce_value() const;

    friend bool operator==(const BlockHeader&, const BlockHeader&) = default;
};

namespace rlp {
    size_t length(const BlockHeader&);

    void encode(Bytes& to, const BlockHeader&, bool for_sealing = false);

    //! \remarks Besides RLP well-formedness, extra data longer than protocol::kMaxExtraDataBytes is refused
    DecodingResult decode(ByteView& from, BlockHeader& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace rlp

}  // namespace silkrelay
