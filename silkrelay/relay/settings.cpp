// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "settings.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <absl/strings/match.h>
#include <magic_enum.hpp>

#include <silkrelay/core/common/util.hpp>
#include <silkrelay/core/rlp/encode.hpp>

namespace silkrelay::relay {

static constexpr std::pair<std::string_view, pow::PowMode> kPowModeNames[]{
    {"light", pow::PowMode::kLight},
    {"proof", pow::PowMode::kProof},
    {"disabled", pow::PowMode::kDisabled},
};

std::optional<pow::PowMode> pow_mode_from_string(std::string_view name) {
    for (const auto& [mode_name, mode] : kPowModeNames) {
        if (absl::EqualsIgnoreCase(mode_name, name)) {
            return mode;
        }
    }
    return std::nullopt;
}

static std::string_view pow_mode_to_string(pow::PowMode mode) {
    for (const auto& [mode_name, value] : kPowModeNames) {
        if (value == mode) {
            return mode_name;
        }
    }
    return magic_enum::enum_name(mode);
}

std::optional<Checkpoint> make_checkpoint(ByteView header_rlp, const TotalDifficulty& total_difficulty) {
    Checkpoint checkpoint;
    ByteView view{header_rlp};
    if (!rlp::decode(view, checkpoint.header)) {
        return std::nullopt;
    }
    checkpoint.hash = checkpoint.header.hash();
    checkpoint.total_difficulty = total_difficulty;
    return checkpoint;
}

static bool read_unsigned(const nlohmann::json& json, const char* key, uint64_t& target) {
    if (!json.contains(key)) {
        return true;
    }
    if (!json[key].is_number_unsigned()) {
        return false;
    }
    target = json[key].get<uint64_t>();
    return true;
}

static std::optional<Checkpoint> checkpoint_from_json(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("header") || !json["header"].is_string() ||
        !json.contains("totalDifficulty")) {
        return std::nullopt;
    }
    const auto header_rlp{from_hex(json["header"].get<std::string>())};
    if (!header_rlp) {
        return std::nullopt;
    }

    std::optional<intx::uint256> total_difficulty;
    const auto& td_json{json["totalDifficulty"]};
    if (td_json.is_number_unsigned()) {
        total_difficulty = td_json.get<uint64_t>();
    } else if (td_json.is_string()) {
        total_difficulty = parse_uint256(td_json.get<std::string>());
    }
    if (!total_difficulty) {
        return std::nullopt;
    }

    auto checkpoint{make_checkpoint(*header_rlp, *total_difficulty)};
    if (!checkpoint || checkpoint->header.difficulty == 0 ||
        checkpoint->total_difficulty < checkpoint->header.difficulty) {
        return std::nullopt;
    }

    // An explicit hash must match the header
    if (json.contains("hash")) {
        if (!json["hash"].is_string()) {
            return std::nullopt;
        }
        const auto hash_bytes{from_hex(json["hash"].get<std::string>())};
        if (!hash_bytes || hash_bytes->size() != kHashLength || to_bytes32(*hash_bytes) != checkpoint->hash) {
            return std::nullopt;
        }
    }
    return checkpoint;
}

static std::optional<pow::DagRoots> dag_roots_from_json(const nlohmann::json& json) {
    pow::DagRoots dag_roots;
    if (!read_unsigned(json, "dagsStartEpoch", dag_roots.start_epoch)) {
        return std::nullopt;
    }
    if (!json.contains("dagsMerkleRoots")) {
        return dag_roots;
    }
    if (!json["dagsMerkleRoots"].is_array()) {
        return std::nullopt;
    }
    for (const auto& item : json["dagsMerkleRoots"]) {
        if (!item.is_string()) {
            return std::nullopt;
        }
        const auto root{from_hex(item.get<std::string>())};
        if (!root || root->size() != sizeof(pow::DagNode)) {
            return std::nullopt;
        }
        pow::DagNode& node{dag_roots.roots.emplace_back()};
        std::copy(root->begin(), root->end(), node.begin());
    }
    return dag_roots;
}

static bool read_flag(const nlohmann::json& json, const char* key, bool& target) {
    if (!json.contains(key)) {
        return true;
    }
    if (!json[key].is_boolean()) {
        return false;
    }
    target = json[key].get<bool>();
    return true;
}

static std::optional<log::Settings> log_settings_from_json(const nlohmann::json& json) {
    log::Settings settings;
    if (!json.is_object()) {
        return std::nullopt;
    }
    if (json.contains("verbosity")) {
        if (!json["verbosity"].is_string()) {
            return std::nullopt;
        }
        const auto level{log::level_from_string(json["verbosity"].get<std::string>())};
        if (!level) {
            return std::nullopt;
        }
        settings.log_verbosity = *level;
    }
    bool color{!settings.log_nocolor};
    if (!read_flag(json, "stdout", settings.log_std_out) || !read_flag(json, "utc", settings.log_utc) ||
        !read_flag(json, "color", color) || !read_flag(json, "threads", settings.log_threads)) {
        return std::nullopt;
    }
    settings.log_nocolor = !color;
    if (json.contains("file")) {
        if (!json["file"].is_string()) {
            return std::nullopt;
        }
        settings.log_file = json["file"].get<std::string>();
    }
    return settings;
}

static nlohmann::json log_settings_to_json(const log::Settings& settings) {
    nlohmann::json ret;
    ret["verbosity"] = std::string{magic_enum::enum_name(settings.log_verbosity).substr(1)};
    ret["stdout"] = settings.log_std_out;
    ret["utc"] = settings.log_utc;
    ret["color"] = !settings.log_nocolor;
    ret["threads"] = settings.log_threads;
    ret["file"] = settings.log_file;
    return ret;
}

std::optional<RelaySettings> RelaySettings::from_json(const nlohmann::json& json) noexcept {
    if (json.is_discarded() || !json.is_object() || !json.contains("checkpoint")) {
        return std::nullopt;
    }

    RelaySettings settings;
    if (json.contains("chain")) {
        const auto& chain_json{json["chain"]};
        if (chain_json.is_string()) {
            const ChainConfig* known{lookup_known_chain(chain_json.get<std::string>())};
            if (!known) {
                return std::nullopt;
            }
            settings.chain_config = *known;
        } else {
            auto chain_config{ChainConfig::from_json(chain_json)};
            if (!chain_config) {
                return std::nullopt;
            }
            settings.chain_config = std::move(*chain_config);
        }
    }

    auto checkpoint{checkpoint_from_json(json["checkpoint"])};
    if (!checkpoint) {
        return std::nullopt;
    }
    settings.checkpoint = std::move(*checkpoint);

    if (!read_unsigned(json, "finalityDepth", settings.finality_depth) || settings.finality_depth == 0 ||
        !read_unsigned(json, "historyDepth", settings.history_depth) ||
        !read_unsigned(json, "numConfirmations", settings.num_confirmations)) {
        return std::nullopt;
    }

    if (json.contains("powMode")) {
        if (!json["powMode"].is_string()) {
            return std::nullopt;
        }
        const auto mode{pow_mode_from_string(json["powMode"].get<std::string>())};
        if (!mode) {
            return std::nullopt;
        }
        settings.pow_mode = *mode;
    }

    auto dag_roots{dag_roots_from_json(json)};
    if (!dag_roots) {
        return std::nullopt;
    }
    settings.dag_roots = std::move(*dag_roots);

    uint64_t cached_epochs{settings.cached_epochs};
    if (!read_unsigned(json, "cachedEpochs", cached_epochs) || cached_epochs == 0) {
        return std::nullopt;
    }
    settings.cached_epochs = static_cast<size_t>(cached_epochs);

    if (json.contains("log")) {
        auto log_settings{log_settings_from_json(json["log"])};
        if (!log_settings) {
            return std::nullopt;
        }
        settings.log_settings = std::move(*log_settings);
    }

    return settings;
}

nlohmann::json RelaySettings::to_json() const {
    nlohmann::json ret;
    ret["chain"] = chain_config.to_json();

    Bytes header_rlp;
    rlp::encode(header_rlp, checkpoint.header);
    ret["checkpoint"]["header"] = to_hex(header_rlp, /*with_prefix=*/true);
    ret["checkpoint"]["hash"] = to_hex(checkpoint.hash, /*with_prefix=*/true);
    ret["checkpoint"]["totalDifficulty"] = intx::to_string(checkpoint.total_difficulty);

    ret["finalityDepth"] = finality_depth;
    ret["historyDepth"] = history_depth;
    ret["numConfirmations"] = num_confirmations;
    ret["powMode"] = std::string{pow_mode_to_string(pow_mode)};
    ret["dagsStartEpoch"] = dag_roots.start_epoch;
    ret["dagsMerkleRoots"] = nlohmann::json::array();
    for (const pow::DagNode& root : dag_roots.roots) {
        ret["dagsMerkleRoots"].push_back(to_hex(root, /*with_prefix=*/true));
    }
    ret["cachedEpochs"] = cached_epochs;
    ret["log"] = log_settings_to_json(log_settings);
    return ret;
}

}  // namespace silkrelay::relay
