// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <intx/intx.hpp>

#include <silkrelay/core/chain/config.hpp>
#include <silkrelay/core/types/block.hpp>

namespace silkrelay {

// Classification of invalid headers.
enum class [[nodiscard]] ValidationResult {
    kOk,  // All checks passed

    // [YP] Section 4.3.4 "Block Header Validity", Eq (50)
    kUnknownParent,     // P(H) = ∅
    kWrongBlockNumber,  // Hi ≠ P(H)Hi + 1
    kWrongDifficulty,   // Hd ≠ D(H)
    kGasAboveLimit,     // Hg > Hl
    kInvalidGasLimit,   // |Hl-P(H)Hl|≥P(H)Hl/1024 ∨ Hl<5000
    kInvalidTimestamp,  // Hs ≤ P(H)Hs
    kInvalidSeal,       // Nonce or mix_hash (invalid Proof of Work)

    kMissingField,     // e.g. missing base fee in a post-London header
    kFieldBeforeFork,  // e.g. base fee present in a pre-London header

    // EIP-1559: Fee market change for ETH 1.0 chain
    kWrongBaseFee,

    // Proof-of-work evidence supplied alongside the header
    kInvalidDagProof,     // Missing, malformed or not matching the epoch's DAG root
    kDatasetUnavailable,  // Epoch verification data could not be produced
};

namespace protocol {

    intx::uint256 expected_base_fee_per_gas(const BlockHeader& parent);

    //! \brief Performs the checks of a header against its parent that don't involve difficulty or proof of work
    ValidationResult validate_header_fields(const BlockHeader& header, const BlockHeader& parent,
                                            const ChainConfig& config);

}  // namespace protocol

}  // namespace silkrelay
