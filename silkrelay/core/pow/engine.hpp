// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <silkrelay/core/common/bytes.hpp>
#include <silkrelay/core/pow/dag_proof.hpp>
#include <silkrelay/core/pow/epoch_cache.hpp>
#include <silkrelay/core/protocol/validation.hpp>
#include <silkrelay/core/types/block.hpp>

namespace silkrelay::pow {

//! \brief How the Ethash seal of a header is established
enum class PowMode {
    kLight,     // Recompute dataset items from the epoch light cache
    kProof,     // Use dataset pages supplied with the header, checked against the epoch DAG root
    kDisabled,  // Don't check seals at all (private test networks)
};

//! \brief Merkle roots of consecutive epoch datasets, starting at start_epoch
struct DagRoots {
    uint64_t start_epoch{0};
    std::vector<DagNode> roots;

    //! \brief Returns the root for the given epoch, if known
    std::optional<DagNode> root_of(uint64_t epoch) const noexcept;
};

//! \brief Verifies Ethash proof-of-work seals
class EthashEngine {
  public:
    explicit EthashEngine(PowMode mode, DagRoots dag_roots = {}, size_t cached_epochs = 2);

    // Not copyable nor movable
    EthashEngine(const EthashEngine&) = delete;
    EthashEngine& operator=(const EthashEngine&) = delete;

    PowMode mode() const noexcept { return mode_; }

    //! \brief Checks a seal
    //! \param [in] seal_hash : hash of the header without mix hash and nonce
    //! \param [in] nonce : the header nonce as integer
    //! \param [in] mix_hash : the mix hash claimed by the header
    //! \param [in] difficulty : the header difficulty
    //! \param [in] epoch : Ethash epoch of the header
    //! \param [in] proof_rlp : RLP encoded DagProof, only read in kProof mode
    ValidationResult verify_pow(const evmc::bytes32& seal_hash, uint64_t nonce, const evmc::bytes32& mix_hash,
                                const intx::uint256& difficulty, uint64_t epoch, ByteView proof_rlp = {});

    //! \brief Convenience overload taking the fields out of a header
    ValidationResult verify_seal(const BlockHeader& header, uint64_t epoch, ByteView proof_rlp = {});

    EpochContextCache& epoch_cache() noexcept { return epoch_cache_; }

  private:
    ValidationResult verify_light(const ethash::hash256& seal_hash, uint64_t nonce, const ethash::hash256& mix_hash,
                                  const intx::uint256& difficulty, uint64_t epoch);

    ValidationResult verify_with_proof(const ethash::hash256& seal_hash, uint64_t nonce,
                                       const ethash::hash256& mix_hash, const intx::uint256& difficulty,
                                       uint64_t epoch, ByteView proof_rlp) const;

    PowMode mode_;
    DagRoots dag_roots_;
    EpochContextCache epoch_cache_;
};

}  // namespace silkrelay::pow
