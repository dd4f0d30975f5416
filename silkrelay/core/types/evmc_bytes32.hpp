// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

#include <silkrelay/core/common/bytes.hpp>
#include <silkrelay/core/rlp/decode.hpp>

namespace silkrelay::rlp {

void encode(Bytes& to, const evmc::bytes32& value);
size_t length(const evmc::bytes32& value) noexcept;

void encode(Bytes& to, const evmc::address& value);
size_t length(const evmc::address& value) noexcept;

DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace silkrelay::rlp
