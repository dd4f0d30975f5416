// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <absl/container/btree_map.h>
#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <absl/container/node_hash_map.h>

namespace silkrelay {

/*
Alias templates to Abseil containers

FlatHashMap – a hash map that might not have pointer stability.
FlatHashSet – a hash set that might not have pointer stability.
NodeHashMap – a hash map with pointer stability of its values.
BTreeMap – an ordered map, used where iteration by ascending key is needed.

See https://abseil.io/docs/cpp/guides/container#hash-tables
and https://abseil.io/docs/cpp/guides/container#fn:pointer-stability
*/

template <class K, class V>
using FlatHashMap = absl::flat_hash_map<K, V>;

template <class T>
using FlatHashSet = absl::flat_hash_set<T>;

template <class K, class V>
using NodeHashMap = absl::node_hash_map<K, V>;

template <class K, class V>
using BTreeMap = absl::btree_map<K, V>;

}  // namespace silkrelay
