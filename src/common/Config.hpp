#pragma once

#include <cstddef>
#include <filesystem>

#ifdef TESTS
constexpr auto DEFAULT_LOG_FILE = "./logs/triekit_test.log";
#else
constexpr auto DEFAULT_LOG_FILE = "./logs/triekit.log";
#endif

// Each level of Trie::Dump() is indented by this many spaces, the root
// included.
constexpr size_t DUMP_INDENT = 2;

constexpr char PATH_SEPARATOR = std::filesystem::path::preferred_separator;

// Separator understood by ExclusionFilter::IsExcludedDotted.
constexpr char KEY_PATH_DELIMITER = '.';
