// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "pipeline.hpp"

#include <algorithm>
#include <bit>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <magic_enum.hpp>

#include <silkrelay/core/common/util.hpp>
#include <silkrelay/core/protocol/difficulty.hpp>
#include <silkrelay/core/protocol/validation.hpp>
#include <silkrelay/infra/common/log.hpp>

namespace silkrelay::relay {

static constexpr std::string_view kLogTitle{"Pipeline"};

static SubmissionStatus rejection_status(ValidationResult err) {
    switch (err) {
        case ValidationResult::kWrongDifficulty:
            return SubmissionStatus::kDifficultyMismatch;
        case ValidationResult::kInvalidSeal:
            return SubmissionStatus::kPowInvalid;
        case ValidationResult::kInvalidDagProof:
            return SubmissionStatus::kInvalidProof;
        case ValidationResult::kDatasetUnavailable:
            return SubmissionStatus::kDatasetUnavailable;
        default:
            return SubmissionStatus::kInvalidHeader;
    }
}

static SubmissionStatus accepted_status(ChainUpdateKind kind) {
    switch (kind) {
        case ChainUpdateKind::kExtended:
            return SubmissionStatus::kExtended;
        case ChainUpdateKind::kReorganized:
            return SubmissionStatus::kReorganized;
        case ChainUpdateKind::kStale:
            break;
    }
    return SubmissionStatus::kStale;
}

Pipeline::Pipeline(RelaySettings settings, RelayStorage* storage)
    : settings_{std::move(settings)},
      storage_{storage},
      engine_{settings_.pow_mode, settings_.dag_roots, settings_.cached_epochs} {
    const Checkpoint& checkpoint{settings_.checkpoint};
    if (storage_ && storage_->is_initialized()) {
        storage_->load(checkpoint, settings_.chain_config, store_, selector_);
    } else {
        store_.init_checkpoint(checkpoint.header, checkpoint.hash, checkpoint.total_difficulty);
        selector_.reset_head(*store_.get(checkpoint.hash));
        if (storage_) {
            storage_->initialize(checkpoint, settings_.chain_config);
        }
    }
    SILKRELAY_INFO_M(kLogTitle, {"head", std::to_string(selector_.head_block_num()),
                                 "hash", to_hex(selector_.head_hash(), true),
                                 "pow", std::string{magic_enum::enum_name(settings_.pow_mode)}})
        << "started";
}

BlockNum Pipeline::finality_horizon() const {
    const BlockNum head_block_num{selector_.head_block_num()};
    const BlockNum horizon{head_block_num > settings_.finality_depth ? head_block_num - settings_.finality_depth : 0};
    // Finality never moves back, even when the head does
    return std::max(horizon, store_.pruned_below());
}

ValidationResult Pipeline::verify(const BlockHeader& header, const HeaderRecord& parent, ByteView proof_rlp) {
    const ChainConfig& config{settings_.chain_config};
    if (const ValidationResult err{protocol::validate_header_fields(header, parent.header, config)};
        err != ValidationResult::kOk) {
        return err;
    }
    if (const ValidationResult err{protocol::validate_difficulty(header, parent.header, config)};
        err != ValidationResult::kOk) {
        return err;
    }
    return engine_.verify_seal(header, config.epoch(header.number), proof_rlp);
}

VerificationOutcome Pipeline::submit(ByteView header_rlp, ByteView proof_rlp) {
    std::scoped_lock lock{mutex_};

    VerificationOutcome outcome;
    outcome.tip = selector_.head();

    BlockHeader header;
    ByteView view{header_rlp};
    if (const DecodingResult res{rlp::decode(view, header)}; !res) {
        outcome.status = SubmissionStatus::kDecodeError;
        outcome.decoding_error = res.error();
        SILKRELAY_DEBUG_M(kLogTitle, {"error", std::string{magic_enum::enum_name(res.error())}}) << "undecodable header";
        return outcome;
    }
    // Decoding is strict so the submitted bytes are the canonical encoding
    const auto hash{std::bit_cast<evmc::bytes32>(keccak256(header_rlp))};
    outcome.hash = hash;

    if (store_.contains(hash)) {
        outcome.status = SubmissionStatus::kDuplicate;
        return outcome;
    }
    const HeaderRecord* parent{store_.get(header.parent_hash)};
    if (!parent) {
        outcome.status = SubmissionStatus::kOrphan;
        SILKRELAY_DEBUG_M(kLogTitle, {"block", std::to_string(header.number), "hash", to_hex(hash, true)})
            << "orphan header";
        return outcome;
    }
    if (header.number < finality_horizon()) {
        outcome.status = SubmissionStatus::kBelowFinality;
        return outcome;
    }

    if (const ValidationResult err{verify(header, *parent, proof_rlp)}; err != ValidationResult::kOk) {
        outcome.status = rejection_status(err);
        outcome.validation_error = err;
        if (err == ValidationResult::kDatasetUnavailable) {
            SILKRELAY_WARN_M(kLogTitle, {"block", std::to_string(header.number),
                                         "epoch", std::to_string(settings_.chain_config.epoch(header.number))})
                << "Ethash verification data unavailable";
        } else {
            SILKRELAY_DEBUG_M(kLogTitle, {"block", std::to_string(header.number), "hash", to_hex(hash, true),
                                          "error", std::string{magic_enum::enum_name(err)}})
                << "invalid header";
        }
        return outcome;
    }

    if (store_.insert(header, hash) != InsertResult::kInserted) {
        // Duplicate and orphan cases were ruled out above
        throw std::logic_error{"Pipeline: unexpected insertion failure for hash=" + to_hex(hash)};
    }
    const HeaderRecord& record{*store_.get(hash)};
    ChainUpdate update{selector_.update(record)};

    outcome.status = accepted_status(update.kind);
    outcome.tip = selector_.head();
    outcome.fork_point = update.fork_point;
    outcome.reorg_depth = update.reorg_depth;

    StorageUpdate storage_update{.inserted = &record, .head = outcome.tip, .canonized = std::move(update.canonized)};
    if (update.kind != ChainUpdateKind::kStale) {
        prune(storage_update);
    }
    persist(storage_update);

    if (update.kind == ChainUpdateKind::kReorganized) {
        SILKRELAY_INFO_M(kLogTitle, {"block", std::to_string(outcome.tip.block_num), "hash", to_hex(hash, true),
                                     "fork point", std::to_string(update.fork_point->block_num),
                                     "depth", std::to_string(update.reorg_depth)})
            << "chain reorganized";
    } else {
        SILKRELAY_DEBUG_M(kLogTitle, {"block", std::to_string(header.number), "hash", to_hex(hash, true),
                                      "status", std::string{magic_enum::enum_name(outcome.status)}})
            << "header accepted";
    }
    return outcome;
}

void Pipeline::prune(StorageUpdate& update) {
    const BlockNum horizon{finality_horizon()};
    update.forgotten = store_.prune(horizon, [this](const HeaderRecord& record) {
        return selector_.is_canonical(record);
    });

    if (settings_.history_depth > 0 && horizon > settings_.history_depth) {
        const BlockNum oldest{horizon - settings_.history_depth};
        std::vector<BlockId> forgotten{store_.forget_below(oldest)};
        update.forgotten.insert(update.forgotten.end(), forgotten.begin(), forgotten.end());
        selector_.forget_below(oldest);
        update.canonical_from = oldest;
    }
    if (!update.forgotten.empty()) {
        SILKRELAY_DEBUG_M(kLogTitle, {"records", std::to_string(update.forgotten.size()),
                                      "horizon", std::to_string(horizon)})
            << "pruned";
    }
}

void Pipeline::persist(const StorageUpdate& update) {
    if (!storage_) {
        return;
    }
    try {
        storage_->commit(update);
    } catch (const std::exception& ex) {
        SILKRELAY_ERROR_M(kLogTitle, {"error", ex.what()}) << "persisting header failed, reloading state";
        storage_->load(settings_.checkpoint, settings_.chain_config, store_, selector_);
        throw;
    }
}

ChainHead Pipeline::canonical_tip() const {
    std::scoped_lock lock{mutex_};
    return selector_.head();
}

bool Pipeline::is_ancestor(const evmc::bytes32& candidate, const evmc::bytes32& of) const {
    std::scoped_lock lock{mutex_};
    return store_.is_ancestor(candidate, of);
}

std::optional<BlockHeader> Pipeline::header_by_hash(const evmc::bytes32& hash) const {
    std::scoped_lock lock{mutex_};
    const HeaderRecord* record{store_.get(hash)};
    if (!record) {
        return std::nullopt;
    }
    return record->header;
}

std::optional<evmc::bytes32> Pipeline::canonical_hash(BlockNum block_num) const {
    std::scoped_lock lock{mutex_};
    return selector_.canonical_hash(block_num);
}

std::optional<evmc::bytes32> Pipeline::canonical_hash_safe(BlockNum block_num) const {
    std::scoped_lock lock{mutex_};
    return selector_.canonical_hash_safe(block_num, settings_.num_confirmations);
}

std::vector<evmc::bytes32> Pipeline::known_hashes(BlockNum block_num) const {
    std::scoped_lock lock{mutex_};
    return store_.hashes_at(block_num);
}

std::optional<TotalDifficulty> Pipeline::total_difficulty(const evmc::bytes32& hash) const {
    std::scoped_lock lock{mutex_};
    const HeaderRecord* record{store_.get(hash)};
    if (!record) {
        return std::nullopt;
    }
    return record->total_difficulty;
}

size_t Pipeline::size() const {
    std::scoped_lock lock{mutex_};
    return store_.size();
}

}  // namespace silkrelay::relay
