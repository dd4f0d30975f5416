// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "config.hpp"

#include <string>
#include <utility>

#include <silkrelay/core/common/util.hpp>

namespace silkrelay {

static constexpr const char* kMinimumDifficulty{"minimumDifficulty"};

static inline void member_to_json(nlohmann::json& json, const std::string& key, const std::optional<uint64_t>& source) {
    if (source) {
        json[key] = source.value();
    }
}

static inline bool read_json_config_member(const nlohmann::json& json, const std::string& key,
                                           std::optional<uint64_t>& target) {
    if (!json.contains(key)) {
        return true;
    }
    if (!json[key].is_number_unsigned()) {
        return false;
    }
    target = json[key].get<uint64_t>();
    return true;
}

nlohmann::json ChainConfig::to_json() const noexcept {
    nlohmann::json ret;

    ret["chainId"] = chain_id;
    member_to_json(ret, "homesteadBlock", homestead_block);
    member_to_json(ret, "byzantiumBlock", byzantium_block);
    member_to_json(ret, "constantinopleBlock", constantinople_block);
    member_to_json(ret, "muirGlacierBlock", muir_glacier_block);
    member_to_json(ret, "londonBlock", london_block);
    member_to_json(ret, "arrowGlacierBlock", arrow_glacier_block);
    member_to_json(ret, "grayGlacierBlock", gray_glacier_block);
    ret["epochLength"] = epoch_length;
    ret[kMinimumDifficulty] = intx::to_string(minimum_difficulty);

    return ret;
}

std::optional<ChainConfig> ChainConfig::from_json(const nlohmann::json& json) noexcept {
    if (json.is_discarded() || !json.is_object() || !json.contains("chainId") ||
        !json["chainId"].is_number_unsigned()) {
        return std::nullopt;
    }

    ChainConfig config{};
    config.chain_id = json["chainId"].get<uint64_t>();

    const bool eras_ok{read_json_config_member(json, "homesteadBlock", config.homestead_block) &&
                       read_json_config_member(json, "byzantiumBlock", config.byzantium_block) &&
                       read_json_config_member(json, "constantinopleBlock", config.constantinople_block) &&
                       read_json_config_member(json, "muirGlacierBlock", config.muir_glacier_block) &&
                       read_json_config_member(json, "londonBlock", config.london_block) &&
                       read_json_config_member(json, "arrowGlacierBlock", config.arrow_glacier_block) &&
                       read_json_config_member(json, "grayGlacierBlock", config.gray_glacier_block)};
    if (!eras_ok) {
        return std::nullopt;
    }

    if (json.contains("epochLength")) {
        if (!json["epochLength"].is_number_unsigned() || json["epochLength"].get<uint64_t>() == 0) {
            return std::nullopt;
        }
        config.epoch_length = json["epochLength"].get<uint64_t>();
    }

    if (json.contains(kMinimumDifficulty)) {
        // Accept both a JSON number and a decimal or hex string
        const auto& value{json[kMinimumDifficulty]};
        std::optional<intx::uint256> parsed;
        if (value.is_number_unsigned()) {
            parsed = value.get<uint64_t>();
        } else if (value.is_string()) {
            parsed = parse_uint256(value.get<std::string>());
        }
        if (!parsed || *parsed == 0) {
            return std::nullopt;
        }
        config.minimum_difficulty = *parsed;
    }

    return config;
}

evmc_revision ChainConfig::revision(BlockNum block_num) const noexcept {
    if (london_block && block_num >= london_block) return EVMC_LONDON;
    if (constantinople_block && block_num >= constantinople_block) return EVMC_CONSTANTINOPLE;
    if (byzantium_block && block_num >= byzantium_block) return EVMC_BYZANTIUM;
    if (homestead_block && block_num >= homestead_block) return EVMC_HOMESTEAD;
    return EVMC_FRONTIER;
}

bool ChainConfig::is_london(BlockNum block_num) const noexcept {
    return revision(block_num) >= EVMC_LONDON;
}

std::ostream& operator<<(std::ostream& out, const ChainConfig& obj) { return out << obj.to_json(); }

constinit const ChainConfig kMainnetConfig{
    .chain_id = 1,
    .homestead_block = 1'150'000,
    .byzantium_block = 4'370'000,
    .constantinople_block = 7'280'000,
    .muir_glacier_block = 9'200'000,
    .london_block = 12'965'000,
    .arrow_glacier_block = 13'773'000,
    .gray_glacier_block = 15'050'000,
};

static constexpr std::pair<std::string_view, const ChainConfig*> kKnownChains[]{
    {"mainnet", &kMainnetConfig},
};

const ChainConfig* lookup_known_chain(std::string_view name) noexcept {
    for (const auto& [chain_name, config] : kKnownChains) {
        if (chain_name == name) {
            return config;
        }
    }
    return nullptr;
}

}  // namespace silkrelay
