#pragma once

#include "common/Status.hpp"
#include "config/ExclusionFilter.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace TrieKit {

/**
 * ConfigTree - nested configuration namespace
 *
 * Every entry is either a string value or a child namespace. Entries keep
 * the order they were first set in. Paths are lists of keys from this tree
 * downward, so {"log", "level"} is the value "level" in the namespace "log".
 */
class ConfigTree {
  struct Entry {
    std::string key_;
    std::string value_;
    // Non-null for a namespace, value_ is unused then.
    std::unique_ptr<ConfigTree> child_;
  };

  std::vector<Entry> entries_;

  Entry *FindEntry(const std::string &key);

  const Entry *FindEntry(const std::string &key) const;

  ConfigTree ExportHelper(const ExclusionFilter &exclude,
                          std::vector<std::string> &prefix,
                          size_t &dropped) const;

  void FlattenHelper(const std::string &prefix,
                     std::vector<std::string> &lines) const;

public:
  ConfigTree() = default;

  ConfigTree(ConfigTree &&) noexcept = default;
  ConfigTree &operator=(ConfigTree &&) noexcept = default;

  ConfigTree(const ConfigTree &) = delete;
  ConfigTree &operator=(const ConfigTree &) = delete;

  // Creates the namespaces leading to the value as needed. A namespace
  // already stored under the last key is replaced by the value.
  Status Set(const std::vector<std::string> &path, std::string value);

  Status Get(const std::vector<std::string> &path, std::string *value) const;

  // Makes sure every key of path names a namespace, creating the missing
  // ones, and hands out the innermost. An empty path yields this tree.
  Status CheckPath(const std::vector<std::string> &path, ConfigTree **tree);

  bool Has(const std::string &key) const { return FindEntry(key) != nullptr; }

  bool IsNamespace(const std::string &key) const;

  size_t Size() const { return entries_.size(); }

  std::vector<std::string> Keys() const;

  // Copy of this tree without the entries whose full path is excluded.
  ConfigTree Export(const ExclusionFilter &exclude) const;

  // "a.b = value" per value, depth first in entry order.
  std::vector<std::string> Flatten() const;
};

} // namespace TrieKit
