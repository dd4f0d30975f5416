// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "tables.hpp"

#include <stdexcept>
#include <string>

namespace silkrelay::db::table {

void check_or_create_chaindata_tables(RWTxn& txn) {
    for (const auto& config : kChainDataTables) {
        if (has_map(*txn, config.name)) {
            const auto table_map{txn->open_map(config.name)};
            const auto table_info{txn->get_handle_info(table_map)};
            const auto table_key_mode{table_info.key_mode()};
            const auto table_value_mode{table_info.value_mode()};
            if (table_key_mode != config.key_mode || table_value_mode != config.value_mode) {
                throw std::runtime_error("MDBX Table " + std::string{config.name} + " has incompatible flags");
            }
        } else {
            (void)txn->create_map(config.name, config.key_mode, config.value_mode);
        }
    }
}

}  // namespace silkrelay::db::table
