// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "engine.hpp"

#include <cstring>
#include <utility>

#include <ethash/ethash.hpp>

#include <silkrelay/core/pow/hashimoto.hpp>

namespace silkrelay::pow {

std::optional<DagNode> DagRoots::root_of(uint64_t epoch) const noexcept {
    if (epoch < start_epoch || epoch - start_epoch >= roots.size()) {
        return std::nullopt;
    }
    return roots[epoch - start_epoch];
}

EthashEngine::EthashEngine(PowMode mode, DagRoots dag_roots, size_t cached_epochs)
    : mode_{mode}, dag_roots_{std::move(dag_roots)}, epoch_cache_{cached_epochs} {}

ValidationResult EthashEngine::verify_pow(const evmc::bytes32& seal_hash, uint64_t nonce,
                                          const evmc::bytes32& mix_hash, const intx::uint256& difficulty,
                                          uint64_t epoch, ByteView proof_rlp) {
    if (mode_ == PowMode::kDisabled) {
        return ValidationResult::kOk;
    }
    if (difficulty == 0) {
        return ValidationResult::kInvalidSeal;
    }

    const auto sealh256{ethash::hash256_from_bytes(seal_hash.bytes)};
    const auto mixh256{ethash::hash256_from_bytes(mix_hash.bytes)};
    if (mode_ == PowMode::kProof) {
        return verify_with_proof(sealh256, nonce, mixh256, difficulty, epoch, proof_rlp);
    }
    return verify_light(sealh256, nonce, mixh256, difficulty, epoch);
}

ValidationResult EthashEngine::verify_seal(const BlockHeader& header, uint64_t epoch, ByteView proof_rlp) {
    return verify_pow(header.hash(/*for_sealing=*/true), header.nonce_value(), header.mix_hash, header.difficulty,
                      epoch, proof_rlp);
}

ValidationResult EthashEngine::verify_light(const ethash::hash256& seal_hash, uint64_t nonce,
                                            const ethash::hash256& mix_hash, const intx::uint256& difficulty,
                                            uint64_t epoch) {
    // Keeps the context alive even if another epoch evicts it meanwhile
    const EpochContextPtr context{epoch_cache_.get(epoch)};
    if (!context) {
        return ValidationResult::kDatasetUnavailable;
    }

    const auto diff256{intx::be::store<ethash::hash256>(difficulty)};
    const auto ec{ethash::verify_against_difficulty(*context, seal_hash, mix_hash, nonce, diff256)};
    return ec ? ValidationResult::kInvalidSeal : ValidationResult::kOk;
}

ValidationResult EthashEngine::verify_with_proof(const ethash::hash256& seal_hash, uint64_t nonce,
                                                 const ethash::hash256& mix_hash, const intx::uint256& difficulty,
                                                 uint64_t epoch, ByteView proof_rlp) const {
    const std::optional<DagNode> root{dag_roots_.root_of(epoch)};
    if (!root || epoch >= kMaxEpochNumber) {
        return ValidationResult::kDatasetUnavailable;
    }

    const auto proof{decode_dag_proof(proof_rlp)};
    if (!proof || proof->size() != kNumDatasetAccesses) {
        return ValidationResult::kInvalidDagProof;
    }

    const auto full_dataset_num_items{static_cast<uint32_t>(ethash::calculate_full_dataset_num_items(
        static_cast<int>(epoch)))};
    const size_t depth{dag_tree_depth(full_dataset_num_items)};

    // Pages are consumed in access order, each one checked against the root at the index hashimoto asks for
    size_t next_page{0};
    const auto lookup_page{[&](uint32_t index) -> std::optional<ethash::hash1024> {
        const DagPage& page{(*proof)[next_page++]};
        if (page.branch.size() != depth || dag_root_from_branch(page.item, index, page.branch) != *root) {
            return std::nullopt;
        }
        return page.item;
    }};

    const std::optional<ethash::result> result{hashimoto(seal_hash, nonce, full_dataset_num_items, lookup_page)};
    if (!result) {
        return ValidationResult::kInvalidDagProof;
    }

    if (std::memcmp(result->mix_hash.bytes, mix_hash.bytes, sizeof(mix_hash)) != 0 ||
        !check_against_difficulty(result->final_hash, difficulty)) {
        return ValidationResult::kInvalidSeal;
    }
    return ValidationResult::kOk;
}

}  // namespace silkrelay::pow
