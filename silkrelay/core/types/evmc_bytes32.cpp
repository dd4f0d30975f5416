// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "evmc_bytes32.hpp"

#include <silkrelay/core/common/util.hpp>

namespace silkrelay::rlp {

void encode(Bytes& to, const evmc::bytes32& value) {
    encode(to, ByteView{value.bytes});
}

size_t length(const evmc::bytes32&) noexcept {
    return kHashLength + 1;
}

void encode(Bytes& to, const evmc::address& value) {
    encode(to, ByteView{value.bytes});
}

size_t length(const evmc::address&) noexcept {
    return kAddressLength + 1;
}

DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode) noexcept {
    return decode(from, to.bytes, mode);
}

}  // namespace silkrelay::rlp
