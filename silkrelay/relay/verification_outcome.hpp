// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include <evmc/evmc.hpp>

#include <silkrelay/core/common/decoding_result.hpp>
#include <silkrelay/core/protocol/validation.hpp>
#include <silkrelay/core/types/block_id.hpp>
#include <silkrelay/core/types/chain_head.hpp>

namespace silkrelay::relay {

enum class SubmissionStatus {
    // Accepted
    kExtended,     // Header is the new canonical tip, child of the previous one
    kReorganized,  // Header is the new canonical tip on another branch
    kStale,        // Header stored on a non-canonical branch

    // Not an error, nothing changed
    kDuplicate,

    // Rejected
    kDecodeError,         // Malformed input, permanent
    kOrphan,              // Parent unknown, retry after submitting ancestors
    kBelowFinality,       // Header would fork the chain behind the finality horizon
    kInvalidHeader,       // Structural check against the parent failed
    kDifficultyMismatch,  // Difficulty differs from the expected one
    kPowInvalid,          // Seal does not satisfy the difficulty
    kInvalidProof,        // DAG proof malformed or not matching the epoch root
    kDatasetUnavailable,  // Epoch verification data could not be produced, retryable
};

bool is_accepted(SubmissionStatus status);

//! \brief Result of a header submission
struct VerificationOutcome {
    SubmissionStatus status{SubmissionStatus::kDecodeError};

    std::optional<evmc::bytes32> hash;  // set once the header is decoded
    ChainHead tip;                      // canonical tip after the submission

    // Filled on kReorganized only
    std::optional<BlockId> fork_point;
    uint64_t reorg_depth{0};

    std::optional<DecodingError> decoding_error;
    std::optional<ValidationResult> validation_error;

    bool accepted() const { return is_accepted(status); }

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& out, const VerificationOutcome& outcome);

}  // namespace silkrelay::relay
