// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "verification_outcome.hpp"

#include <sstream>

#include <magic_enum.hpp>

#include <silkrelay/core/common/util.hpp>

namespace silkrelay::relay {

bool is_accepted(SubmissionStatus status) {
    switch (status) {
        case SubmissionStatus::kExtended:
        case SubmissionStatus::kReorganized:
        case SubmissionStatus::kStale:
            return true;
        default:
            return false;
    }
}

std::string VerificationOutcome::to_string() const {
    std::stringstream out;
    out << "status: " << magic_enum::enum_name(status);
    if (hash) {
        out << " hash: " << to_hex(*hash, /*with_prefix=*/true);
    }
    out << " tip: " << tip.block_num << " " << to_hex(tip.hash, /*with_prefix=*/true)
        << " td: " << intx::to_string(tip.total_difficulty);
    if (fork_point) {
        out << " fork_point: " << fork_point->block_num << " reorg_depth: " << reorg_depth;
    }
    if (decoding_error) {
        out << " error: " << magic_enum::enum_name(*decoding_error);
    }
    if (validation_error) {
        out << " error: " << magic_enum::enum_name(*validation_error);
    }
    return out.str();
}

std::ostream& operator<<(std::ostream& out, const VerificationOutcome& outcome) {
    out << outcome.to_string();
    return out;
}

}  // namespace silkrelay::relay
