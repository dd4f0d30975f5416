// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <silkrelay/core/chain/config.hpp>
#include <silkrelay/core/types/block_id.hpp>
#include <silkrelay/core/types/chain_head.hpp>
#include <silkrelay/db/mdbx.hpp>
#include <silkrelay/relay/chain_selector.hpp>
#include <silkrelay/relay/header_store.hpp>
#include <silkrelay/relay/settings.hpp>

namespace silkrelay::relay {

//! \brief Changes produced by one accepted submission, written atomically
struct StorageUpdate {
    const HeaderRecord* inserted{nullptr};
    ChainHead head;
    std::vector<BlockId> canonized;  // new canonical entries, those above head.block_num are dropped
    std::vector<BlockId> forgotten;  // records removed from the store
    BlockNum canonical_from{0};      // canonical entries strictly below are dropped
};

//! \brief Durable copy of the header store and canonical chain, kept in MDBX
class RelayStorage {
  public:
    //! \throws std::runtime_error and mdbx::exception on environment failures
    explicit RelayStorage(const db::EnvConfig& config);
    virtual ~RelayStorage() = default;

    // Not copyable nor movable
    RelayStorage(const RelayStorage&) = delete;
    RelayStorage& operator=(const RelayStorage&) = delete;

    //! \brief Whether a checkpoint has already been written
    bool is_initialized();

    //! \brief Writes the checkpoint record as the canonical head
    void initialize(const Checkpoint& checkpoint, const ChainConfig& chain_config);

    //! \brief Reloads every stored record and the canonical head
    //! \throws std::runtime_error if the stored state was created for another checkpoint or chain config,
    //! or is inconsistent
    void load(const Checkpoint& checkpoint, const ChainConfig& chain_config, HeaderStore& store,
              ChainSelector& selector);

    //! \brief Writes the update in a single transaction
    //! \throws mdbx::exception when the transaction fails, the stored state is then left unchanged
    virtual void commit(const StorageUpdate& update);

    ::mdbx::env& env() { return env_; }

  private:
    ::mdbx::env_managed env_;
};

}  // namespace silkrelay::relay
