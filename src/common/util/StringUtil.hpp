#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace TrieKit {
struct StringUtil {

  static bool StartsWith(std::string_view str, std::string_view prefix) {
    return str.starts_with(prefix);
  }

  static bool EndsWith(std::string_view str, std::string_view suffix) {
    return str.ends_with(suffix);
  }

  static bool IsBlank(std::string_view str) {
    return std::all_of(str.begin(), str.end(), [](const char &c) {
      return static_cast<bool>(isspace(static_cast<unsigned char>(c)));
    });
  }

  // "a.b.c" -> {"a", "b", "c"}. Empty pieces are kept, so "a..b" has three.
  static std::vector<std::string> Split(std::string_view str, char delim) {
    std::vector<std::string> parts;
    size_t begin = 0;
    while (true) {
      auto p = str.find(delim, begin);
      if (p == std::string_view::npos) {
        parts.emplace_back(str.substr(begin));
        return parts;
      }
      parts.emplace_back(str.substr(begin, p - begin));
      begin = p + 1;
    }
  }

  static std::string Join(const std::vector<std::string> &parts,
                          std::string_view sep) {
    std::string res;
    for (size_t i = 0; i < parts.size(); i++) {
      if (i > 0) {
        res += sep;
      }
      res += parts[i];
    }
    return res;
  }

  // Strip every trailing character that appears in chars.
  static std::string TrimRight(std::string_view str, std::string_view chars) {
    auto p = str.find_last_not_of(chars);
    if (p == std::string_view::npos) {
      return {};
    }
    return std::string(str.substr(0, p + 1));
  }

  static std::string Trim(std::string_view str) {
    auto begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
      return {};
    }
    auto end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(begin, end - begin + 1));
  }
};

} // namespace TrieKit
