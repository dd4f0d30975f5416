// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <mutex>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>

#include <silkrelay/core/common/bytes.hpp>
#include <silkrelay/core/pow/engine.hpp>
#include <silkrelay/core/types/block.hpp>
#include <silkrelay/core/types/chain_head.hpp>
#include <silkrelay/relay/chain_selector.hpp>
#include <silkrelay/relay/header_store.hpp>
#include <silkrelay/relay/relay_storage.hpp>
#include <silkrelay/relay/settings.hpp>
#include <silkrelay/relay/verification_outcome.hpp>

namespace silkrelay::relay {

// Pipeline verifies submitted headers one at a time and maintains the canonical chain.
// Every check runs before any mutation, so a rejected submission leaves the state untouched.
// When a storage is given accepted headers are persisted in the same step, and the state found in the storage
// is reloaded on construction.
class Pipeline {
  public:
    //! \throws std::runtime_error if the storage content does not match settings
    explicit Pipeline(RelaySettings settings, RelayStorage* storage = nullptr);

    // Not copyable nor movable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    //! \brief Verifies an RLP encoded header and, if valid, adds it to the header DAG
    //! \param [in] header_rlp : the RLP encoded header
    //! \param [in] proof_rlp : the RLP encoded DAG proof, only read when settings pow_mode is kProof
    //! \throws mdbx::exception when persisting an accepted header fails; in-memory state is then reloaded
    //! from the storage
    VerificationOutcome submit(ByteView header_rlp, ByteView proof_rlp = {});

    ChainHead canonical_tip() const;

    //! \brief Whether candidate is of or one of its known ancestors
    bool is_ancestor(const evmc::bytes32& candidate, const evmc::bytes32& of) const;

    std::optional<BlockHeader> header_by_hash(const evmc::bytes32& hash) const;

    std::optional<evmc::bytes32> canonical_hash(BlockNum block_num) const;

    //! \brief Canonical hash at block_num provided it has at least num_confirmations descendants
    std::optional<evmc::bytes32> canonical_hash_safe(BlockNum block_num) const;

    //! \brief Every known hash at block_num, canonical or not
    std::vector<evmc::bytes32> known_hashes(BlockNum block_num) const;

    std::optional<TotalDifficulty> total_difficulty(const evmc::bytes32& hash) const;

    size_t size() const;

    const RelaySettings& settings() const { return settings_; }

  private:
    //! \brief Lowest block number a new header may have
    BlockNum finality_horizon() const;

    ValidationResult verify(const BlockHeader& header, const HeaderRecord& parent, ByteView proof_rlp);

    //! \brief Drops stale branches and old history after a head change
    void prune(StorageUpdate& update);

    void persist(const StorageUpdate& update);

    RelaySettings settings_;
    RelayStorage* storage_;
    pow::EthashEngine engine_;
    HeaderStore store_;
    ChainSelector selector_{store_};
    mutable std::mutex mutex_;
};

}  // namespace silkrelay::relay
