// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <silkrelay/db/mdbx.hpp>

/*
Table layout follows the Erigon DB format for headers;
see its common/dbutils/bucket.go.
*/
namespace silkrelay::db::table {

inline constexpr const char* kLastHeaderKey{"LastHeader"};
inline constexpr const char* kCheckpointKey{"Checkpoint"};

//! \details Stores the binding of *canonical* block number with header hash
//! \struct
//! \verbatim
//!   key   : block_num_u64 (BE)
//!   value : header_hash
//! \endverbatim
inline constexpr db::MapConfig kCanonicalHashes{"CanonicalHeader"};

//! \details Stores the verified headers
//! \struct
//! \verbatim
//!   key   : block_num_u64 (BE) + header hash
//!   value : header RLP encoded
//! \endverbatim
inline constexpr db::MapConfig kHeaders{"Header"};

//! \details Stores the total difficulty accrued at each stored header
//! \struct
//! \verbatim
//!   key   : block_num_u64 (BE) + header hash
//!   value : total difficulty (RLP encoded)
//! \endverbatim
inline constexpr db::MapConfig kDifficulty{"HeadersTotalDifficulty"};

//! \details Stores the block number of each stored header
//! \struct
//! \verbatim
//!   key   : header hash
//!   value : block_num_u64 (BE)
//! \endverbatim
inline constexpr db::MapConfig kHeaderNumbers{"HeaderNumber"};

//! \details Stores the hash of the canonical head under kLastHeaderKey and the hash of the trusted
//! checkpoint under kCheckpointKey
inline constexpr db::MapConfig kLastHeader{"LastHeader"};

//! \details Stores the chain configuration
//! \struct
//! \verbatim
//!   key   : checkpoint hash
//!   value : chain config JSON
//! \endverbatim
inline constexpr db::MapConfig kConfig{"Config"};

inline constexpr db::MapConfig kChainDataTables[]{
    kCanonicalHashes,
    kConfig,
    kDifficulty,
    kHeaderNumbers,
    kHeaders,
    kLastHeader,
};

//! \brief Ensures all defined tables are present in db with consistent flags. Should a table not exist it gets
//! created
void check_or_create_chaindata_tables(RWTxn& txn);

}  // namespace silkrelay::db::table
