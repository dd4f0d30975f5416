// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "validation.hpp"

#include "param.hpp"

namespace silkrelay::protocol {

intx::uint256 expected_base_fee_per_gas(const BlockHeader& parent) {
    if (!parent.base_fee_per_gas) {
        return kInitialBaseFee;
    }

    const uint64_t parent_gas_target{parent.gas_limit / kElasticityMultiplier};
    const intx::uint256& parent_base_fee_per_gas{*parent.base_fee_per_gas};

    if (parent.gas_used == parent_gas_target) {
        return parent_base_fee_per_gas;
    }

    if (parent.gas_used > parent_gas_target) {
        const intx::uint256 gas_used_delta{parent.gas_used - parent_gas_target};
        intx::uint256 base_fee_per_gas_delta{parent_base_fee_per_gas * gas_used_delta / parent_gas_target /
                                             kBaseFeeMaxChangeDenominator};
        if (base_fee_per_gas_delta < 1) {
            base_fee_per_gas_delta = 1;
        }
        return parent_base_fee_per_gas + base_fee_per_gas_delta;
    }

    const intx::uint256 gas_used_delta{parent_gas_target - parent.gas_used};
    const intx::uint256 base_fee_per_gas_delta{parent_base_fee_per_gas * gas_used_delta / parent_gas_target /
                                               kBaseFeeMaxChangeDenominator};
    if (parent_base_fee_per_gas > base_fee_per_gas_delta) {
        return parent_base_fee_per_gas - base_fee_per_gas_delta;
    }
    return 0;
}

ValidationResult validate_header_fields(const BlockHeader& header, const BlockHeader& parent,
                                        const ChainConfig& config) {
    if (header.gas_used > header.gas_limit) {
        return ValidationResult::kGasAboveLimit;
    }

    if (header.gas_limit < kMinGasLimit || header.gas_limit > kMaxGasLimit) {
        return ValidationResult::kInvalidGasLimit;
    }

    if (header.number != parent.number + 1) {
        return ValidationResult::kWrongBlockNumber;
    }

    if (header.timestamp <= parent.timestamp) {
        return ValidationResult::kInvalidTimestamp;
    }

    uint64_t parent_gas_limit{parent.gas_limit};
    if (header.number == config.london_block) {
        parent_gas_limit = parent.gas_limit * kElasticityMultiplier;  // EIP-1559
    }

    const uint64_t gas_delta{header.gas_limit > parent_gas_limit ? header.gas_limit - parent_gas_limit
                                                                 : parent_gas_limit - header.gas_limit};
    if (gas_delta >= parent_gas_limit / kGasLimitBoundDivisor) {
        return ValidationResult::kInvalidGasLimit;
    }

    if (!config.is_london(header.number)) {
        if (header.base_fee_per_gas) {
            return ValidationResult::kFieldBeforeFork;
        }
    } else {
        if (!header.base_fee_per_gas) {
            return ValidationResult::kMissingField;
        }
        if (header.base_fee_per_gas != expected_base_fee_per_gas(parent)) {
            return ValidationResult::kWrongBaseFee;
        }
    }

    return ValidationResult::kOk;
}

}  // namespace silkrelay::protocol
