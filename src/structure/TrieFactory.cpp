#include "structure/TrieFactory.hpp"
#include "common/Config.hpp"
#include "common/util/StringUtil.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TrieKit {

namespace {
// Characters stripped from the end of an absolute first segment. Windows
// accepts both separators.
constexpr std::string_view kTrailingSeparators =
    PATH_SEPARATOR == '/' ? std::string_view("/") : std::string_view("\\/");
} // namespace

StringTrie TrieFactory::Strings() {
  return StringTrie('\0', &LexicographicSorter<char>, &StringJoiner);
}

PathTrie TrieFactory::Paths(Sorter<std::string> sorter,
                            Joiner<std::string, std::string> joiner) {
  return PathTrie("", std::move(sorter),
                  joiner ? std::move(joiner)
                         : Joiner<std::string, std::string>(&PathJoiner));
}

std::string TrieFactory::StringJoiner(const std::vector<char> &keys) {
  if (keys.empty()) {
    return {};
  }
  return {keys.begin() + 1, keys.end()};
}

std::string TrieFactory::PathJoiner(const std::vector<std::string> &keys) {
  const std::string sep(1, PATH_SEPARATOR);
  if (keys.size() < 2) {
    return sep;
  }
  const std::string &first = keys[1];
  std::vector<std::string> parts;
  if (first == ".") {
    parts.emplace_back(".");
  } else if (std::filesystem::path(first).has_root_directory()) {
    // "/" becomes "" so that joining puts exactly one separator in front.
    auto trimmed = StringUtil::TrimRight(first, kTrailingSeparators);
    if (keys.size() == 2) {
      return trimmed.empty() ? sep : trimmed;
    }
    parts.push_back(std::move(trimmed));
  } else {
    parts.push_back(first);
  }
  parts.insert(parts.end(), keys.begin() + 2, keys.end());
  return StringUtil::Join(parts, sep);
}

std::vector<std::string> TrieFactory::SplitPath(std::string_view path) {
  std::vector<std::string> parts;
  std::filesystem::path p(path);
  if (p.has_root_path()) {
    parts.push_back(p.root_path().string());
  }
  for (const auto &part : p.relative_path()) {
    if (auto segment = part.string(); !segment.empty()) {
      parts.push_back(std::move(segment));
    }
  }
  return parts;
}

} // namespace TrieKit
