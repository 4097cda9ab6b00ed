#pragma once

#include "structure/Trie.hpp"
#include "structure/TriePolicy.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace TrieKit {

// One char per node, iteration yields the stored words.
using StringTrie = Trie<char, std::string>;

// One path segment per node, iteration yields the stored paths.
using PathTrie = Trie<std::string, std::string>;

struct TrieFactory {
  // Root key '\0', children in ascending order, words rebuilt by
  // concatenation.
  static StringTrie Strings();

  // Root key "", mixes absolute and relative paths in the same trie.
  static PathTrie Paths(Sorter<std::string> sorter =
                            &LexicographicSorter<std::string>,
                        Joiner<std::string, std::string> joiner = &PathJoiner);

  // Concatenates everything below the root placeholder.
  static std::string StringJoiner(const std::vector<char> &keys);

  // {""}                    -> "/"
  // {"", "/"}               -> "/"
  // {"", "/", "usr", "bin"} -> "/usr/bin"
  // {"", ".", "a"}          -> "./a"
  // {"", "a", "b"}          -> "a/b"
  static std::string PathJoiner(const std::vector<std::string> &keys);

  // "/usr/bin/" -> {"/", "usr", "bin"}. The root path, when there is one,
  // becomes the first segment; empty segments are dropped.
  static std::vector<std::string> SplitPath(std::string_view path);
};

} // namespace TrieKit
