// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <silkrelay/core/chain/config.hpp>
#include <silkrelay/core/pow/engine.hpp>
#include <silkrelay/core/types/block.hpp>
#include <silkrelay/infra/common/log.hpp>

namespace silkrelay::relay {

inline constexpr uint64_t kDefaultFinalityDepth{500};
inline constexpr uint64_t kDefaultNumConfirmations{30};

//! \brief Trust anchor from which the header DAG is rooted
struct Checkpoint {
    BlockHeader header;
    evmc::bytes32 hash;
    TotalDifficulty total_difficulty;

    friend bool operator==(const Checkpoint&, const Checkpoint&) = default;
};

struct RelaySettings {
    ChainConfig chain_config{kMainnetConfig};
    Checkpoint checkpoint;

    //! Distance behind the tip beyond which non-canonical branches are pruned
    uint64_t finality_depth{kDefaultFinalityDepth};

    //! Canonical records retained behind the finality horizon, 0 means unlimited
    uint64_t history_depth{0};

    //! Descendants required for canonical_hash_safe to answer
    uint64_t num_confirmations{kDefaultNumConfirmations};

    pow::PowMode pow_mode{pow::PowMode::kLight};
    pow::DagRoots dag_roots;
    size_t cached_epochs{2};

    //! Logging configuration, applied by the host through log::init
    log::Settings log_settings;

    /*Sample JSON input:
    {
        "chain": "mainnet",
        "checkpoint": {
            "header": "0xf90214a0...",
            "totalDifficulty": "17179869184"
        },
        "finalityDepth": 500,
        "historyDepth": 0,
        "numConfirmations": 30,
        "powMode": "proof",
        "dagsStartEpoch": 0,
        "dagsMerkleRoots": ["0x55b891e842e58f58956a847cbbf67821", ...],
        "log": {"verbosity": "debug", "stdout": false, "utc": true, "color": true, "threads": false, "file": ""}
    }
    */
    //! \brief Try parse a JSON object into strongly typed RelaySettings
    //! \remark Should this return std::nullopt the parsing has failed
    static std::optional<RelaySettings> from_json(const nlohmann::json& json) noexcept;

    nlohmann::json to_json() const;
};

//! \brief Builds a checkpoint out of an RLP encoded header
//! \return std::nullopt if the header does not decode
std::optional<Checkpoint> make_checkpoint(ByteView header_rlp, const TotalDifficulty& total_difficulty);

std::optional<pow::PowMode> pow_mode_from_string(std::string_view name);

}  // namespace silkrelay::relay
