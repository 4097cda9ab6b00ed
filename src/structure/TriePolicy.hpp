#pragma once

#include <algorithm>
#include <functional>
#include <vector>

namespace TrieKit {

// Orders the child keys of a node during iteration. May also drop keys to
// filter whole subtrees out of the walk.
template <typename Key>
using Sorter = std::function<std::vector<Key>(std::vector<Key>)>;

// Turns the keys from the root to a leaf, root key included, into the value
// an iteration produces.
template <typename Key, typename Value>
using Joiner = std::function<Value(const std::vector<Key> &)>;

// Keeps insertion order.
template <typename Key> std::vector<Key> IdentitySorter(std::vector<Key> keys) {
  return keys;
}

template <typename Key>
std::vector<Key> LexicographicSorter(std::vector<Key> keys) {
  std::sort(keys.begin(), keys.end());
  return keys;
}

// Yields the raw key path.
template <typename Key>
std::vector<Key> TupleJoiner(const std::vector<Key> &keys) {
  return keys;
}

} // namespace TrieKit
