// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <numeric>
#include <span>
#include <vector>

#include <silkrelay/core/rlp/encode.hpp>

namespace silkrelay::rlp {

template <typename T>
size_t length_items(const std::span<const T>& v) {
    return std::accumulate(v.begin(), v.end(), size_t{0}, [](size_t sum, const T& x) { return sum + length(x); });
}

template <typename T>
size_t length(const std::vector<T>& v) {
    const size_t payload_length = length_items(std::span<const T>{v.data(), v.size()});
    return length_of_length(payload_length) + payload_length;
}

template <typename T>
void encode(Bytes& to, const std::vector<T>& v) {
    const std::span<const T> items{v.data(), v.size()};
    const Header h{.list = true, .payload_length = length_items(items)};
    to.reserve(to.size() + length_of_length(h.payload_length) + h.payload_length);
    encode_header(to, h);
    for (const T& x : items) {
        encode(to, x);
    }
}

}  // namespace silkrelay::rlp
