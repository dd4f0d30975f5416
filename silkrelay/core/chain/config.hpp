// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

#include <evmc/evmc.h>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <silkrelay/core/common/base.hpp>
#include <silkrelay/core/protocol/param.hpp>

namespace silkrelay {

using ChainId = uint64_t;

//! Number of blocks sharing the same Ethash light cache and dataset
inline constexpr uint64_t kDefaultEpochLength{30'000};

//! \brief Network era boundaries and proof-of-work parameters of the relayed chain
struct ChainConfig {
    //! \brief Returns the chain identifier
    //! \see https://eips.ethereum.org/EIPS/eip-155
    ChainId chain_id{0};

    // https://github.com/ethereum/execution-specs/tree/master/network-upgrades/mainnet-upgrades
    std::optional<BlockNum> homestead_block{std::nullopt};
    std::optional<BlockNum> byzantium_block{std::nullopt};
    std::optional<BlockNum> constantinople_block{std::nullopt};
    std::optional<BlockNum> muir_glacier_block{std::nullopt};
    std::optional<BlockNum> london_block{std::nullopt};
    std::optional<BlockNum> arrow_glacier_block{std::nullopt};
    std::optional<BlockNum> gray_glacier_block{std::nullopt};

    uint64_t epoch_length{kDefaultEpochLength};

    //! \brief Lower clamp of the difficulty adjustment
    intx::uint256 minimum_difficulty{protocol::kMinimumDifficulty};

    //! \brief Returns the revision level at given block number
    //! \details Only the revisions relevant to header validity are reported, i.e. Frontier, Homestead,
    //! Byzantium, Constantinople and London
    evmc_revision revision(BlockNum block_num) const noexcept;

    bool is_london(BlockNum block_num) const noexcept;

    //! \brief Returns the Ethash epoch a block belongs to
    uint64_t epoch(BlockNum block_num) const noexcept { return block_num / epoch_length; }

    //! \brief Return the JSON representation of this object
    nlohmann::json to_json() const noexcept;

    /*Sample JSON input:
    {
            "chainId":1,
            "homesteadBlock":1150000,
            "byzantiumBlock":4370000,
            "constantinopleBlock":7280000,
            "muirGlacierBlock":9200000,
            "londonBlock":12965000,
            "arrowGlacierBlock":13773000,
            "grayGlacierBlock":15050000,
            "epochLength":30000,
            "minimumDifficulty":131072
    }
    */
    //! \brief Try parse a JSON object into strongly typed ChainConfig
    //! \remark Should this return std::nullopt the parsing has failed
    static std::optional<ChainConfig> from_json(const nlohmann::json& json) noexcept;

    friend bool operator==(const ChainConfig&, const ChainConfig&) = default;
};

std::ostream& operator<<(std::ostream& out, const ChainConfig& obj);

constinit extern const ChainConfig kMainnetConfig;

//! \brief Returns the config of a known chain by name, e.g. "mainnet"
const ChainConfig* lookup_known_chain(std::string_view name) noexcept;

}  // namespace silkrelay
