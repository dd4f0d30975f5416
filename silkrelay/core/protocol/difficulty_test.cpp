// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "difficulty.hpp"

#include <catch2/catch.hpp>

#include <silkrelay/core/common/empty_hashes.hpp>
#include <silkrelay/core/common/util.hpp>
#include <silkrelay/core/test_util/mainnet_headers.hpp>

namespace silkrelay::protocol {

TEST_CASE("DifficultyTest34") {
    uint64_t block_num{0x33e140};
    uint64_t block_timestamp{0x04bdbdaf};
    uint64_t parent_difficulty{0x7268db7b46b0b154};
    uint64_t parent_timestamp{0x04bdbdaf};
    bool parent_has_uncles{false};

    intx::uint256 difficulty{canonical_difficulty(block_num, block_timestamp, parent_difficulty, parent_timestamp,
                                                  parent_has_uncles, kMainnetConfig)};
    CHECK(difficulty == 0x72772897b619876a);
}

TEST_CASE("Difficulty formula selection") {
    CHECK(std::holds_alternative<FrontierFormula>(difficulty_formula(0, kMainnetConfig)));
    CHECK(std::holds_alternative<FrontierFormula>(difficulty_formula(1'149'999, kMainnetConfig)));
    CHECK(std::holds_alternative<HomesteadFormula>(difficulty_formula(1'150'000, kMainnetConfig)));
    CHECK(difficulty_formula(4'370'000, kMainnetConfig) == DifficultyFormula{ByzantiumFormula{3'000'000}});
    CHECK(difficulty_formula(7'280'000, kMainnetConfig) == DifficultyFormula{ByzantiumFormula{5'000'000}});
    CHECK(difficulty_formula(9'200'000, kMainnetConfig) == DifficultyFormula{ByzantiumFormula{9'000'000}});
    CHECK(difficulty_formula(12'965'000, kMainnetConfig) == DifficultyFormula{ByzantiumFormula{9'700'000}});
    CHECK(difficulty_formula(13'773'000, kMainnetConfig) == DifficultyFormula{ByzantiumFormula{10'700'000}});
    CHECK(difficulty_formula(15'050'000, kMainnetConfig) == DifficultyFormula{ByzantiumFormula{11'400'000}});
}

TEST_CASE("Frontier difficulty") {
    // Mainnet block 1 was sealed 1438269988 seconds after the genesis timestamp (0)
    CHECK(canonical_difficulty(1, 1438269988, 17179869184, 0, false, kMainnetConfig) == 17171480576);
    // Mainnet block 2 came 29 seconds after block 1
    CHECK(canonical_difficulty(2, 1438270017, 17171480576, 1438269988, false, kMainnetConfig) == 17163096064);
}

TEST_CASE("Homestead difficulty") {
    const intx::uint256 parent_difficulty{20'000'000'000'000};
    // The bomb adds 2^10 at block 1.2M
    CHECK(canonical_difficulty(1'200'000, 1000, parent_difficulty, 990, false, kMainnetConfig) == 20000000001024);
    CHECK(canonical_difficulty(1'200'000, 1100, parent_difficulty, 990, false, kMainnetConfig) == 19902343751024);
    // The downward adjustment is capped at 99 steps
    CHECK(canonical_difficulty(1'200'000, 3000, parent_difficulty, 990, false, kMainnetConfig) == 19033203126024);
}

TEST_CASE("Byzantium difficulty") {
    const intx::uint256 parent_difficulty{3'000'000'000'000'000};
    CHECK(canonical_difficulty(5'000'000, 1009, parent_difficulty, 1000, true, kMainnetConfig) == 3001464844012144);
    CHECK(canonical_difficulty(5'000'000, 1009, parent_difficulty, 1000, false, kMainnetConfig) == 3000000000262144);
}

TEST_CASE("Difficulty bomb delays") {
    const intx::uint256 parent_difficulty{10'000'000'000'000'000};
    // EIP-3554
    CHECK(canonical_difficulty(13'000'000, 1013, parent_difficulty, 1000, false, kMainnetConfig) ==
          10000002147483648);
    // EIP-5133
    CHECK(canonical_difficulty(15'100'000, 1013, parent_difficulty, 1000, false, kMainnetConfig) ==
          10000034359738368);
}

TEST_CASE("Minimum difficulty") {
    CHECK(canonical_difficulty(1, 100, 131072, 90, false, kMainnetConfig) == 131136);
    CHECK(canonical_difficulty(1, 100, 131072, 50, false, kMainnetConfig) == 131072);

    ChainConfig config{kMainnetConfig};
    config.minimum_difficulty = 1;
    CHECK(canonical_difficulty(1, 100, 131072, 50, false, config) == 131008);
}

TEST_CASE("Validate difficulty of mainnet headers") {
    BlockHeader genesis;
    const Bytes genesis_rlp{*from_hex(test_util::kMainnetGenesisRlp)};
    ByteView genesis_view{genesis_rlp};
    REQUIRE(rlp::decode(genesis_view, genesis));

    for (const std::string_view rlp_hex : {test_util::kMainnetBlock1Rlp, test_util::kMainnetUncle1Rlp}) {
        BlockHeader header;
        const Bytes rlp{*from_hex(rlp_hex)};
        ByteView rlp_view{rlp};
        REQUIRE(rlp::decode(rlp_view, header));
        CHECK(expected_difficulty(genesis, header.timestamp, kMainnetConfig) == header.difficulty);
        CHECK(validate_difficulty(header, genesis, kMainnetConfig) == ValidationResult::kOk);

        header.difficulty += 1;
        CHECK(validate_difficulty(header, genesis, kMainnetConfig) == ValidationResult::kWrongDifficulty);
    }
}

TEST_CASE("Parent uncles affect Byzantium difficulty") {
    BlockHeader parent;
    parent.number = 4'999'999;
    parent.timestamp = 1000;
    parent.difficulty = 3'000'000'000'000'000;
    parent.ommers_hash = kEmptyListHash;
    const intx::uint256 without_uncles{expected_difficulty(parent, 1009, kMainnetConfig)};

    parent.ommers_hash = 0x0102_bytes32;
    const intx::uint256 with_uncles{expected_difficulty(parent, 1009, kMainnetConfig)};
    CHECK(without_uncles == 3000000000262144);
    CHECK(with_uncles == 3001464844012144);
}

}  // namespace silkrelay::protocol
