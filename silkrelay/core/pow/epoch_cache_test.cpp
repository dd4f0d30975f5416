// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "epoch_cache.hpp"

#include <catch2/catch.hpp>

namespace silkrelay::pow {

TEST_CASE("Epoch context cache") {
    EpochContextCache cache{1};
    CHECK(cache.size() == 0);
    CHECK_FALSE(cache.contains(0));

    const EpochContextPtr first{cache.get(0)};
    REQUIRE(first);
    CHECK(first->epoch_number == 0);
    CHECK(cache.get(0) == first);
    CHECK(cache.contains(0));

    SECTION("eviction keeps handed out contexts alive") {
        const EpochContextPtr second{cache.get(1)};
        REQUIRE(second);
        CHECK(second->epoch_number == 1);
        CHECK(cache.size() == 1);
        CHECK_FALSE(cache.contains(0));
        CHECK(first->light_cache_num_items > 0);
        CHECK(second->full_dataset_num_items > first->full_dataset_num_items);
    }

    SECTION("unsupported epoch") {
        CHECK(cache.get(kMaxEpochNumber) == nullptr);
        CHECK(cache.get(kMaxEpochNumber + 1) == nullptr);
        CHECK(cache.contains(0));
    }
}

}  // namespace silkrelay::pow
