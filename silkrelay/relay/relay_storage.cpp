// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "relay_storage.hpp"

#include <stdexcept>
#include <string>

#include <silkrelay/core/common/util.hpp>
#include <silkrelay/db/access_layer.hpp>
#include <silkrelay/db/tables.hpp>
#include <silkrelay/infra/common/log.hpp>

namespace silkrelay::relay {

RelayStorage::RelayStorage(const db::EnvConfig& config) : env_{db::open_env(config)} {
    db::RWTxn txn{env_};
    db::table::check_or_create_chaindata_tables(txn);
    txn.commit();
}

bool RelayStorage::is_initialized() {
    db::ROTxn txn{env_};
    return db::read_checkpoint_hash(txn).has_value();
}

void RelayStorage::initialize(const Checkpoint& checkpoint, const ChainConfig& chain_config) {
    db::RWTxn txn{env_};
    db::write_header(txn, checkpoint.header, checkpoint.hash);
    db::write_total_difficulty(txn, checkpoint.header.number, checkpoint.hash, checkpoint.total_difficulty);
    db::write_canonical_hash(txn, checkpoint.header.number, checkpoint.hash);
    db::write_head_header_hash(txn, checkpoint.hash);
    db::write_checkpoint_hash(txn, checkpoint.hash);
    db::write_chain_config(txn, checkpoint.hash, chain_config);
    txn.commit();
    SILKRELAY_INFO_M("RelayStorage", {"checkpoint", to_hex(checkpoint.hash, true),
                                      "block", std::to_string(checkpoint.header.number)})
        << "initialized";
}

void RelayStorage::load(const Checkpoint& checkpoint, const ChainConfig& chain_config, HeaderStore& store,
                        ChainSelector& selector) {
    db::ROTxn txn{env_};

    const auto stored_checkpoint{db::read_checkpoint_hash(txn)};
    if (stored_checkpoint != checkpoint.hash) {
        throw std::runtime_error{"RelayStorage: database was created for another checkpoint"};
    }
    const auto stored_config{db::read_chain_config(txn, checkpoint.hash)};
    if (stored_config != chain_config) {
        throw std::runtime_error{"RelayStorage: incompatible chain config, stored " +
                                 (stored_config ? stored_config->to_json().dump() : std::string{"none"})};
    }
    const auto head_hash{db::read_head_header_hash(txn)};
    if (!head_hash) {
        throw std::runtime_error{"RelayStorage: missing head"};
    }

    store.clear();
    db::for_each_header(txn, [&](const BlockHeader& header, const evmc::bytes32& hash) {
        const auto total_difficulty{db::read_total_difficulty(txn, header.number, hash)};
        if (!total_difficulty) {
            throw std::runtime_error{"RelayStorage: missing total difficulty for hash=" + to_hex(hash)};
        }
        store.restore({header, hash, *total_difficulty});
    });
    selector.restore_head(*head_hash);

    SILKRELAY_INFO_M("RelayStorage", {"headers", std::to_string(store.size()),
                                      "head", std::to_string(selector.head_block_num())})
        << "loaded";
}

void RelayStorage::commit(const StorageUpdate& update) {
    db::RWTxn txn{env_};
    if (update.inserted) {
        const HeaderRecord& record{*update.inserted};
        db::write_header(txn, record.header, record.hash);
        db::write_total_difficulty(txn, record.block_num(), record.hash, record.total_difficulty);
    }
    db::delete_canonical_hashes_above(txn, update.head.block_num);
    for (const BlockId& id : update.canonized) {
        db::write_canonical_hash(txn, id.block_num, id.hash);
    }
    for (const BlockId& id : update.forgotten) {
        db::delete_header(txn, id.block_num, id.hash);
    }
    if (update.canonical_from > 0) {
        db::delete_canonical_hashes_below(txn, update.canonical_from);
    }
    db::write_head_header_hash(txn, update.head.hash);
    txn.commit();
}

}  // namespace silkrelay::relay
