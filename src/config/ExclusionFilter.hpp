#pragma once

#include "structure/Trie.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace TrieKit {

// Either a single top-level key or a list of nested keys. {"a", "b"} names
// the entry b inside the namespace a.
using ExclusionItem = std::variant<std::string, std::vector<std::string>>;

/**
 * ExclusionFilter - the set of configuration key paths left out on export
 *
 * Only exact paths are excluded. Excluding {"a", "b"} does not exclude "a",
 * but excluding "a" drops everything below it because the export never
 * descends into an excluded namespace.
 */
class ExclusionFilter {
  Trie<std::string> paths_;

public:
  ExclusionFilter() = default;

  explicit ExclusionFilter(const std::vector<ExclusionItem> &items);

  // Returns false when the path was already excluded.
  bool Add(const ExclusionItem &item);

  bool IsExcluded(const std::vector<std::string> &path) const;

  // "a.b.c" is the nested path {"a", "b", "c"}.
  bool IsExcludedDotted(std::string_view path) const;

  size_t Size() const { return paths_.Size(); }

  // Excluded paths in dotted form, depth first in insertion order.
  std::vector<std::string> Paths() const;
};

} // namespace TrieKit
