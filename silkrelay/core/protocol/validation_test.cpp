// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "validation.hpp"

#include <catch2/catch.hpp>

#include "param.hpp"

namespace silkrelay::protocol {

static BlockHeader sample_parent() {
    BlockHeader parent;
    parent.number = 1'000'000;
    parent.timestamp = 1'500'000'000;
    parent.gas_limit = 8'000'000;
    parent.gas_used = 4'000'000;
    parent.difficulty = 10'000'000;
    return parent;
}

static BlockHeader sample_child(const BlockHeader& parent) {
    BlockHeader child;
    child.number = parent.number + 1;
    child.timestamp = parent.timestamp + 13;
    child.gas_limit = parent.gas_limit;
    child.gas_used = 21'000;
    child.difficulty = parent.difficulty;
    return child;
}

TEST_CASE("Validate header fields") {
    const BlockHeader parent{sample_parent()};
    BlockHeader header{sample_child(parent)};
    CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kOk);

    SECTION("gas used above limit") {
        header.gas_used = header.gas_limit + 1;
        CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kGasAboveLimit);
    }

    SECTION("gas limit below minimum") {
        header.gas_limit = kMinGasLimit - 1;
        header.gas_used = 0;
        CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kInvalidGasLimit);
    }

    SECTION("gas limit above maximum") {
        header.gas_limit = kMaxGasLimit + 1;
        CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kInvalidGasLimit);
    }

    SECTION("gas limit delta") {
        const uint64_t bound{parent.gas_limit / kGasLimitBoundDivisor};
        header.gas_limit = parent.gas_limit + bound - 1;
        CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kOk);
        header.gas_limit = parent.gas_limit + bound;
        CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kInvalidGasLimit);
        header.gas_limit = parent.gas_limit - bound + 1;
        CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kOk);
        header.gas_limit = parent.gas_limit - bound;
        CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kInvalidGasLimit);
    }

    SECTION("block number") {
        header.number = parent.number + 2;
        CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kWrongBlockNumber);
        header.number = parent.number;
        CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kWrongBlockNumber);
    }

    SECTION("timestamp") {
        header.timestamp = parent.timestamp;
        CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kInvalidTimestamp);
        header.timestamp = parent.timestamp - 1;
        CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kInvalidTimestamp);
    }

    SECTION("base fee before London") {
        header.base_fee_per_gas = kInitialBaseFee;
        CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kFieldBeforeFork);
    }
}

TEST_CASE("Validate London transition") {
    BlockHeader parent{sample_parent()};
    parent.number = *kMainnetConfig.london_block - 1;
    parent.gas_limit = 15'000'000;

    BlockHeader header{sample_child(parent)};
    // EIP-1559 doubles the gas limit at the fork block
    header.gas_limit = parent.gas_limit * kElasticityMultiplier;
    CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kMissingField);

    header.base_fee_per_gas = kInitialBaseFee + 1;
    CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kWrongBaseFee);

    header.base_fee_per_gas = kInitialBaseFee;
    CHECK(validate_header_fields(header, parent, kMainnetConfig) == ValidationResult::kOk);

    BlockHeader next{sample_child(header)};
    next.base_fee_per_gas = expected_base_fee_per_gas(header);
    CHECK(validate_header_fields(next, header, kMainnetConfig) == ValidationResult::kOk);
    next.gas_limit = header.gas_limit * kElasticityMultiplier;
    CHECK(validate_header_fields(next, header, kMainnetConfig) == ValidationResult::kInvalidGasLimit);
}

TEST_CASE("EIP-1559 base fee") {
    BlockHeader parent;
    parent.gas_limit = 30'000'000;

    SECTION("first London block") {
        CHECK(expected_base_fee_per_gas(parent) == kInitialBaseFee);
    }

    parent.base_fee_per_gas = 1'000'000'000;

    SECTION("at target") {
        parent.gas_used = 15'000'000;
        CHECK(expected_base_fee_per_gas(parent) == 1'000'000'000);
    }

    SECTION("full block") {
        parent.gas_used = 30'000'000;
        CHECK(expected_base_fee_per_gas(parent) == 1'125'000'000);
    }

    SECTION("empty block") {
        parent.gas_used = 0;
        CHECK(expected_base_fee_per_gas(parent) == 875'000'000);
    }

    SECTION("minimal increase") {
        parent.base_fee_per_gas = 7;
        parent.gas_used = 15'000'001;
        CHECK(expected_base_fee_per_gas(parent) == 8);
    }
}

}  // namespace silkrelay::protocol
