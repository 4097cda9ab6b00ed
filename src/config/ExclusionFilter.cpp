#include "config/ExclusionFilter.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "common/util/StringUtil.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace TrieKit {

ExclusionFilter::ExclusionFilter(const std::vector<ExclusionItem> &items) {
  for (const auto &item : items) {
    if (!Add(item)) {
      LOG_DEBUG("ExclusionFilter: duplicate exclusion ignored");
    }
  }
  LOG_DEBUG("ExclusionFilter: {} path(s) from {} item(s)", paths_.Size(),
            items.size());
}

bool ExclusionFilter::Add(const ExclusionItem &item) {
  if (const auto *key = std::get_if<std::string>(&item)) {
    return paths_.Add({*key});
  }
  return paths_.Add(std::get<std::vector<std::string>>(item));
}

bool ExclusionFilter::IsExcluded(const std::vector<std::string> &path) const {
  return paths_.Contains(path);
}

bool ExclusionFilter::IsExcludedDotted(std::string_view path) const {
  return paths_.Contains(StringUtil::Split(path, KEY_PATH_DELIMITER));
}

std::vector<std::string> ExclusionFilter::Paths() const {
  auto dotted = [](const std::vector<std::string> &keys) {
    // keys[0] is the root placeholder
    return StringUtil::Join({keys.begin() + 1, keys.end()},
                            std::string_view(&KEY_PATH_DELIMITER, 1));
  };
  return paths_.Iter(nullptr, dotted).Collect();
}

} // namespace TrieKit
