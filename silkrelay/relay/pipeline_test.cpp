// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "pipeline.hpp"

#include <stdexcept>
#include <vector>

#include <catch2/catch.hpp>

#include <silkrelay/core/common/util.hpp>
#include <silkrelay/core/test_util/dag_tree.hpp>
#include <silkrelay/core/test_util/header_builder.hpp>
#include <silkrelay/core/test_util/mainnet_headers.hpp>
#include <silkrelay/infra/common/directories.hpp>
#include <silkrelay/infra/test_util/log.hpp>

namespace silkrelay::relay {

using test_util::encode_header;
using test_util::header_from_hex;
using test_util::make_child;

static constexpr uint64_t kGenesisDifficulty{17'179'869'184};

static RelaySettings mainnet_settings(pow::PowMode mode) {
    RelaySettings settings;
    settings.chain_config = kMainnetConfig;
    settings.checkpoint = *make_checkpoint(*from_hex(test_util::kMainnetGenesisRlp), kGenesisDifficulty);
    settings.pow_mode = mode;
    return settings;
}

static RelaySettings synthetic_settings(const BlockHeader& root, const ChainConfig& config,
                                        pow::PowMode mode = pow::PowMode::kDisabled) {
    RelaySettings settings;
    settings.chain_config = config;
    settings.checkpoint = {root, root.hash(), root.difficulty};
    settings.pow_mode = mode;
    return settings;
}

// Synthetic chain sealed by nobody: seals are not checked, difficulties are
struct UnsealedChain {
    ChainConfig config{test_util::low_difficulty_config(1)};
    BlockHeader root{test_util::make_root_header(1'000'000)};

    RelaySettings settings() const { return synthetic_settings(root, config); }

    std::vector<BlockHeader> extend(const BlockHeader& parent, size_t count, uint64_t time_delta = 15,
                                    uint8_t tag = 0) const {
        std::vector<BlockHeader> headers;
        headers.reserve(count);
        for (size_t i{0}; i < count; ++i) {
            headers.push_back(make_child(i == 0 ? parent : headers.back(), time_delta, config, tag));
        }
        return headers;
    }
};

static VerificationOutcome submit(Pipeline& pipeline, const BlockHeader& header) {
    return pipeline.submit(encode_header(header));
}

TEST_CASE("Pipeline on mainnet headers") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    Pipeline pipeline{mainnet_settings(pow::PowMode::kLight)};
    CHECK(pipeline.canonical_tip() == ChainHead{0, test_util::kMainnetGenesisHash, kGenesisDifficulty});

    const Bytes block1{*from_hex(test_util::kMainnetBlock1Rlp)};
    const Bytes block2{*from_hex(test_util::kMainnetBlock2Rlp)};
    const Bytes uncle1{*from_hex(test_util::kMainnetUncle1Rlp)};

    // Parent not known yet
    VerificationOutcome outcome{pipeline.submit(block2)};
    CHECK(outcome.status == SubmissionStatus::kOrphan);
    CHECK(outcome.hash == test_util::kMainnetBlock2Hash);
    CHECK(pipeline.size() == 1);

    outcome = pipeline.submit(block1);
    CHECK(outcome.status == SubmissionStatus::kExtended);
    CHECK(outcome.tip == ChainHead{1, test_util::kMainnetBlock1Hash, 34'351'349'760});

    outcome = pipeline.submit(block1);
    CHECK(outcome.status == SubmissionStatus::kDuplicate);
    CHECK(outcome.tip.hash == test_util::kMainnetBlock1Hash);

    // Same total difficulty as block 1, lower hash
    outcome = pipeline.submit(uncle1);
    CHECK(outcome.status == SubmissionStatus::kReorganized);
    CHECK(outcome.reorg_depth == 1);
    CHECK(outcome.fork_point == BlockId{0, test_util::kMainnetGenesisHash});
    CHECK(pipeline.canonical_tip().hash == test_util::kMainnetUncle1Hash);

    outcome = pipeline.submit(block2);
    CHECK(outcome.status == SubmissionStatus::kReorganized);
    CHECK(outcome.reorg_depth == 1);
    CHECK(outcome.tip.block_num == 2);
    CHECK(outcome.tip.hash == test_util::kMainnetBlock2Hash);

    CHECK(pipeline.canonical_hash(1) == test_util::kMainnetBlock1Hash);
    CHECK(pipeline.is_ancestor(test_util::kMainnetGenesisHash, test_util::kMainnetBlock2Hash));
    CHECK(pipeline.is_ancestor(test_util::kMainnetBlock1Hash, test_util::kMainnetBlock2Hash));
    CHECK_FALSE(pipeline.is_ancestor(test_util::kMainnetUncle1Hash, test_util::kMainnetBlock2Hash));
    CHECK(pipeline.header_by_hash(test_util::kMainnetUncle1Hash) == header_from_hex(test_util::kMainnetUncle1Rlp));
    CHECK(pipeline.known_hashes(1).size() == 2);
    CHECK(pipeline.total_difficulty(test_util::kMainnetUncle1Hash) == 34'351'349'760);

    SECTION("tampered seal") {
        BlockHeader header{header_from_hex(test_util::kMainnetBlock2Rlp)};
        header.nonce[0] ^= 0x01;
        outcome = submit(pipeline, header);
        CHECK(outcome.status == SubmissionStatus::kPowInvalid);
        CHECK(outcome.validation_error == ValidationResult::kInvalidSeal);

        header = header_from_hex(test_util::kMainnetBlock2Rlp);
        header.mix_hash.bytes[31] ^= 0x80;
        CHECK(submit(pipeline, header).status == SubmissionStatus::kPowInvalid);
        CHECK(pipeline.size() == 4);
    }

    SECTION("wrong difficulty") {
        BlockHeader header{header_from_hex(test_util::kMainnetBlock2Rlp)};
        header.difficulty += 1;
        outcome = submit(pipeline, header);
        CHECK(outcome.status == SubmissionStatus::kDifficultyMismatch);
        CHECK(outcome.validation_error == ValidationResult::kWrongDifficulty);
    }

    SECTION("undecodable input") {
        const Bytes garbage{0xf9, 0x02, 0x14, 0xa0};
        outcome = pipeline.submit(garbage);
        CHECK(outcome.status == SubmissionStatus::kDecodeError);
        CHECK(outcome.decoding_error == DecodingError::kInputTooShort);
        CHECK_FALSE(outcome.hash);
        CHECK(outcome.tip.hash == test_util::kMainnetBlock2Hash);

        Bytes trailing{block2};
        trailing.push_back(0x00);
        CHECK(pipeline.submit(trailing).status == SubmissionStatus::kDecodeError);
    }
}

TEST_CASE("Pipeline accepts valid chains") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const UnsealedChain chain;
    Pipeline pipeline{chain.settings()};

    intx::uint256 previous_td{chain.root.difficulty};
    for (const BlockHeader& header : chain.extend(chain.root, 20, 9)) {
        const VerificationOutcome outcome{submit(pipeline, header)};
        REQUIRE(outcome.status == SubmissionStatus::kExtended);
        CHECK(outcome.accepted());
        CHECK(outcome.tip.total_difficulty > previous_td);
        previous_td = outcome.tip.total_difficulty;
    }
    CHECK(pipeline.canonical_tip().block_num == 20);
}

TEST_CASE("Pipeline duplicates and orphans") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const UnsealedChain chain;
    Pipeline pipeline{chain.settings()};
    const auto headers{chain.extend(chain.root, 3)};

    REQUIRE(submit(pipeline, headers[0]).status == SubmissionStatus::kExtended);
    const ChainHead tip{pipeline.canonical_tip()};
    CHECK(submit(pipeline, headers[0]).status == SubmissionStatus::kDuplicate);
    CHECK(pipeline.canonical_tip() == tip);

    const VerificationOutcome orphan{submit(pipeline, headers[2])};
    CHECK(orphan.status == SubmissionStatus::kOrphan);
    CHECK_FALSE(orphan.accepted());
    CHECK(pipeline.size() == 2);
    CHECK_FALSE(pipeline.header_by_hash(headers[2].hash()));

    // Accepted once its ancestors are there
    CHECK(submit(pipeline, headers[1]).status == SubmissionStatus::kExtended);
    CHECK(submit(pipeline, headers[2]).status == SubmissionStatus::kExtended);
}

TEST_CASE("Pipeline structural checks") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const UnsealedChain chain;
    Pipeline pipeline{chain.settings()};

    BlockHeader header{make_child(chain.root, 15, chain.config)};

    SECTION("timestamp") {
        header.timestamp = chain.root.timestamp;
        const VerificationOutcome outcome{submit(pipeline, header)};
        CHECK(outcome.status == SubmissionStatus::kInvalidHeader);
        CHECK(outcome.validation_error == ValidationResult::kInvalidTimestamp);
    }

    SECTION("gas used above limit") {
        header.gas_used = header.gas_limit + 1;
        CHECK(submit(pipeline, header).validation_error == ValidationResult::kGasAboveLimit);
    }

    SECTION("block number") {
        header.number = 2;
        CHECK(submit(pipeline, header).validation_error == ValidationResult::kWrongBlockNumber);
    }

    SECTION("difficulty") {
        header.difficulty -= 1;
        CHECK(submit(pipeline, header).status == SubmissionStatus::kDifficultyMismatch);
    }

    CHECK(pipeline.size() == 1);
}

TEST_CASE("Pipeline heavier branch wins whatever the order") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const UnsealedChain chain;

    // Shorter block times raise the difficulty
    const BlockHeader a{make_child(chain.root, 15, chain.config)};
    const BlockHeader b{make_child(chain.root, 1, chain.config, 1)};
    const BlockHeader slow{make_child(chain.root, 40, chain.config, 2)};
    const BlockHeader c{make_child(a, 15, chain.config)};
    REQUIRE(b.difficulty > a.difficulty);
    REQUIRE(slow.difficulty < a.difficulty);

    SECTION("heavier sibling last") {
        Pipeline pipeline{chain.settings()};
        CHECK(submit(pipeline, a).status == SubmissionStatus::kExtended);

        const VerificationOutcome outcome{submit(pipeline, b)};
        CHECK(outcome.status == SubmissionStatus::kReorganized);
        CHECK(outcome.reorg_depth == 1);
        CHECK(outcome.fork_point == BlockId{0, chain.root.hash()});
        CHECK(outcome.tip.hash == b.hash());

        CHECK(submit(pipeline, slow).status == SubmissionStatus::kStale);
        CHECK(pipeline.canonical_tip().hash == b.hash());

        // Two blocks outweigh one
        const VerificationOutcome back{submit(pipeline, c)};
        CHECK(back.status == SubmissionStatus::kReorganized);
        CHECK(back.tip.hash == c.hash());
        CHECK(pipeline.canonical_hash(1) == a.hash());
    }

    SECTION("heavier sibling first") {
        Pipeline pipeline{chain.settings()};
        CHECK(submit(pipeline, b).status == SubmissionStatus::kExtended);
        CHECK(submit(pipeline, a).status == SubmissionStatus::kStale);
        CHECK(submit(pipeline, slow).status == SubmissionStatus::kStale);
        CHECK(pipeline.canonical_tip().hash == b.hash());
        CHECK(submit(pipeline, c).status == SubmissionStatus::kReorganized);
        CHECK(pipeline.canonical_tip().hash == c.hash());
    }
}

TEST_CASE("Pipeline pruning") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const UnsealedChain chain;
    RelaySettings settings{chain.settings()};
    settings.finality_depth = 3;
    settings.num_confirmations = 2;
    Pipeline pipeline{settings};

    const auto canonical{chain.extend(chain.root, 8)};
    const auto branch{chain.extend(canonical[0], 2, 20, 1)};  // blocks 2 and 3 off block 1

    for (size_t i{0}; i < 3; ++i) {
        REQUIRE(submit(pipeline, canonical[i]).status == SubmissionStatus::kExtended);
    }
    for (const BlockHeader& header : branch) {
        REQUIRE(submit(pipeline, header).status == SubmissionStatus::kStale);
    }
    CHECK(pipeline.header_by_hash(branch[1].hash()));

    for (size_t i{3}; i < canonical.size(); ++i) {
        REQUIRE(submit(pipeline, canonical[i]).status == SubmissionStatus::kExtended);
    }
    // Head 8, horizon 5: the branch is gone, canonical history stays
    CHECK_FALSE(pipeline.header_by_hash(branch[0].hash()));
    CHECK_FALSE(pipeline.header_by_hash(branch[1].hash()));
    CHECK(pipeline.known_hashes(2) == std::vector<evmc::bytes32>{canonical[1].hash()});
    CHECK(pipeline.header_by_hash(chain.root.hash()));
    CHECK(pipeline.is_ancestor(chain.root.hash(), canonical[7].hash()));

    // Too late to fork behind the horizon
    const BlockHeader late{make_child(canonical[2], 20, chain.config, 2)};
    CHECK(submit(pipeline, late).status == SubmissionStatus::kBelowFinality);

    CHECK(pipeline.canonical_hash_safe(6) == canonical[5].hash());
    CHECK_FALSE(pipeline.canonical_hash_safe(7));
}

TEST_CASE("Pipeline history depth") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const UnsealedChain chain;
    RelaySettings settings{chain.settings()};
    settings.finality_depth = 2;
    settings.history_depth = 2;
    Pipeline pipeline{settings};

    const auto canonical{chain.extend(chain.root, 10)};
    for (const BlockHeader& header : canonical) {
        REQUIRE(submit(pipeline, header).status == SubmissionStatus::kExtended);
    }
    // Head 10, horizon 8, history kept from 6
    CHECK(pipeline.size() == 5);
    CHECK_FALSE(pipeline.canonical_hash(5));
    CHECK_FALSE(pipeline.header_by_hash(canonical[4].hash()));
    CHECK(pipeline.canonical_hash(6) == canonical[5].hash());
    CHECK(pipeline.is_ancestor(canonical[5].hash(), canonical[9].hash()));
}

TEST_CASE("Pipeline on sealed synthetic chain") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const ChainConfig config{test_util::low_difficulty_config(16)};
    const BlockHeader root{test_util::make_root_header(16)};
    Pipeline pipeline{synthetic_settings(root, config, pow::PowMode::kLight)};

    BlockHeader parent{root};
    for (int i{0}; i < 3; ++i) {
        BlockHeader header{make_child(parent, 13, config)};
        test_util::mine(header, test_util::epoch_zero_context());
        REQUIRE(submit(pipeline, header).status == SubmissionStatus::kExtended);
        parent = header;
    }

    BlockHeader header{make_child(parent, 13, config)};
    test_util::mine(header, test_util::epoch_zero_context());

    BlockHeader wrong_nonce{header};
    wrong_nonce.nonce[7] ^= 0x01;
    BlockHeader wrong_mix_hash{header};
    wrong_mix_hash.mix_hash.bytes[0] ^= 0x01;
    // A wrong nonce may still meet such a low difficulty, but it cannot reproduce the mix hash
    CHECK(submit(pipeline, wrong_nonce).status == SubmissionStatus::kPowInvalid);
    CHECK(submit(pipeline, wrong_mix_hash).status == SubmissionStatus::kPowInvalid);
    CHECK(submit(pipeline, header).status == SubmissionStatus::kExtended);
}

TEST_CASE("Pipeline with DAG proofs") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const BlockHeader block1{header_from_hex(test_util::kMainnetBlock1Rlp)};
    const test_util::DagProofFixture fixture{test_util::make_dag_proof(block1, test_util::epoch_zero_context())};

    RelaySettings settings{mainnet_settings(pow::PowMode::kProof)};
    settings.dag_roots = {.start_epoch = 0, .roots = {fixture.root}};
    Pipeline pipeline{settings};

    const Bytes block1_rlp{*from_hex(test_util::kMainnetBlock1Rlp)};
    const Bytes proof_rlp{pow::encode_dag_proof(fixture.proof)};

    SECTION("missing proof") {
        const VerificationOutcome outcome{pipeline.submit(block1_rlp)};
        CHECK(outcome.status == SubmissionStatus::kInvalidProof);
        CHECK(outcome.validation_error == ValidationResult::kInvalidDagProof);
    }

    SECTION("valid proof") {
        CHECK(pipeline.submit(block1_rlp, proof_rlp).status == SubmissionStatus::kExtended);

        // Pages of block 1 do not prove block 2
        const Bytes block2_rlp{*from_hex(test_util::kMainnetBlock2Rlp)};
        CHECK(pipeline.submit(block2_rlp, proof_rlp).status == SubmissionStatus::kInvalidProof);
    }

    SECTION("epoch without root") {
        RelaySettings rootless{mainnet_settings(pow::PowMode::kProof)};
        Pipeline other{rootless};
        const VerificationOutcome outcome{other.submit(block1_rlp, proof_rlp)};
        CHECK(outcome.status == SubmissionStatus::kDatasetUnavailable);
        CHECK(other.size() == 1);
    }
}

// Storage whose next commits fail once armed
class FailingStorage : public RelayStorage {
  public:
    using RelayStorage::RelayStorage;

    void commit(const StorageUpdate& update) override {
        if (fail_commits) {
            throw std::runtime_error{"commit failed"};
        }
        RelayStorage::commit(update);
    }

    bool fail_commits{false};
};

TEST_CASE("Pipeline commit failure") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const TemporaryDirectory tmp_dir;
    const db::EnvConfig db_config{.path = tmp_dir.path().string(), .create = true};

    const UnsealedChain chain;
    RelaySettings settings{chain.settings()};
    settings.finality_depth = 1;
    const auto canonical{chain.extend(chain.root, 5)};
    const auto branch{chain.extend(canonical[1], 1, 20, 1)};  // block 3 off block 2

    FailingStorage storage{db_config};
    Pipeline pipeline{settings, &storage};
    for (size_t i{0}; i < 4; ++i) {
        REQUIRE(submit(pipeline, canonical[i]).status == SubmissionStatus::kExtended);
    }
    REQUIRE(submit(pipeline, branch[0]).status == SubmissionStatus::kStale);
    const ChainHead tip{pipeline.canonical_tip()};
    const size_t size{pipeline.size()};

    // Block 5 would also move the horizon to 4 and prune the branch
    storage.fail_commits = true;
    CHECK_THROWS_AS(submit(pipeline, canonical[4]), std::runtime_error);

    CHECK(pipeline.canonical_tip() == tip);
    CHECK(pipeline.size() == size);
    CHECK_FALSE(pipeline.header_by_hash(canonical[4].hash()));
    CHECK(pipeline.header_by_hash(branch[0].hash()) == branch[0]);
    CHECK_FALSE(pipeline.canonical_hash(5));
    CHECK(pipeline.canonical_hash(4) == canonical[3].hash());

    storage.fail_commits = false;
    CHECK(submit(pipeline, canonical[4]).status == SubmissionStatus::kExtended);
    CHECK(pipeline.canonical_tip().hash == canonical[4].hash());
    CHECK_FALSE(pipeline.header_by_hash(branch[0].hash()));
}

TEST_CASE("Pipeline persistence") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const TemporaryDirectory tmp_dir;
    const db::EnvConfig db_config{.path = tmp_dir.path().string(), .create = true};

    const UnsealedChain chain;
    RelaySettings settings{chain.settings()};
    settings.finality_depth = 4;
    const auto canonical{chain.extend(chain.root, 6)};
    const auto branch{chain.extend(canonical[3], 1, 20, 1)};  // block 5 off block 4

    ChainHead tip;
    {
        RelayStorage storage{db_config};
        Pipeline pipeline{settings, &storage};
        for (const BlockHeader& header : canonical) {
            REQUIRE(submit(pipeline, header).status == SubmissionStatus::kExtended);
        }
        REQUIRE(submit(pipeline, branch[0]).status == SubmissionStatus::kStale);
        tip = pipeline.canonical_tip();
    }

    RelayStorage storage{db_config};
    CHECK(storage.is_initialized());

    SECTION("reload") {
        Pipeline pipeline{settings, &storage};
        CHECK(pipeline.canonical_tip() == tip);
        CHECK(pipeline.size() == 8);
        CHECK(pipeline.header_by_hash(branch[0].hash()) == branch[0]);
        CHECK(pipeline.canonical_hash(3) == canonical[2].hash());
        CHECK(pipeline.known_hashes(5).size() == 2);

        // Keeps going from where it stopped
        const BlockHeader next{make_child(canonical[5], 15, chain.config)};
        CHECK(submit(pipeline, next).status == SubmissionStatus::kExtended);
        CHECK(submit(pipeline, canonical[5]).status == SubmissionStatus::kDuplicate);
    }

    SECTION("reorg survives reopening") {
        {
            Pipeline pipeline{settings, &storage};
            const auto heavier{chain.extend(branch[0], 3, 15, 1)};
            for (const BlockHeader& header : heavier) {
                REQUIRE(submit(pipeline, header).accepted());
            }
            REQUIRE(pipeline.canonical_tip().hash == heavier[2].hash());
        }
        Pipeline pipeline{settings, &storage};
        CHECK(pipeline.canonical_tip().block_num == 8);
        CHECK(pipeline.canonical_hash(5) == branch[0].hash());
        CHECK(pipeline.canonical_hash(6) != canonical[5].hash());
    }

    SECTION("another checkpoint") {
        RelaySettings other{settings};
        other.checkpoint = {canonical[0], canonical[0].hash(), 5'000'000};
        CHECK_THROWS_AS(Pipeline(other, &storage), std::runtime_error);
    }

    SECTION("another chain config") {
        RelaySettings other{settings};
        other.chain_config.epoch_length = 100;
        CHECK_THROWS_AS(Pipeline(other, &storage), std::runtime_error);
    }
}

}  // namespace silkrelay::relay
