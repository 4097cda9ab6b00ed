#include "config/ConfigTree.hpp"
#include "common/Config.hpp"
#include "common/EnumClass.hpp"
#include "common/Logger.hpp"
#include "common/util/StringUtil.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TrieKit {

namespace {
std::string DottedPath(const std::vector<std::string> &path, size_t len) {
  return StringUtil::Join({path.begin(), path.begin() + len},
                          std::string_view(&KEY_PATH_DELIMITER, 1));
}
} // namespace

ConfigTree::Entry *ConfigTree::FindEntry(const std::string &key) {
  auto ite = std::ranges::find_if(
      entries_, [&](const Entry &entry) { return entry.key_ == key; });
  return ite == entries_.end() ? nullptr : &*ite;
}

const ConfigTree::Entry *ConfigTree::FindEntry(const std::string &key) const {
  auto ite = std::ranges::find_if(
      entries_, [&](const Entry &entry) { return entry.key_ == key; });
  return ite == entries_.end() ? nullptr : &*ite;
}

bool ConfigTree::IsNamespace(const std::string &key) const {
  const Entry *entry = FindEntry(key);
  return entry != nullptr && entry->child_ != nullptr;
}

Status ConfigTree::CheckPath(const std::vector<std::string> &path,
                             ConfigTree **tree) {
  ConfigTree *current = this;
  for (size_t i = 0; i < path.size(); i++) {
    Entry *entry = current->FindEntry(path[i]);
    if (entry == nullptr) {
      current->entries_.push_back(
          Entry{path[i], {}, std::make_unique<ConfigTree>()});
      entry = &current->entries_.back();
    } else if (entry->child_ == nullptr) {
      return Status::Error(ErrorCode::NotNamespace,
                           DottedPath(path, i + 1) + " holds a value");
    }
    current = entry->child_.get();
  }
  *tree = current;
  return Status::OK();
}

Status ConfigTree::Set(const std::vector<std::string> &path,
                       std::string value) {
  if (path.empty()) {
    return Status::Error(ErrorCode::InvalidArgument, "empty key path");
  }
  ConfigTree *parent = nullptr;
  std::vector<std::string> prefix(path.begin(), path.end() - 1);
  if (Status status = CheckPath(prefix, &parent); !status.ok()) {
    return status;
  }
  if (Entry *entry = parent->FindEntry(path.back()); entry != nullptr) {
    entry->value_ = std::move(value);
    entry->child_.reset();
    return Status::OK();
  }
  parent->entries_.push_back(Entry{path.back(), std::move(value), nullptr});
  return Status::OK();
}

Status ConfigTree::Get(const std::vector<std::string> &path,
                       std::string *value) const {
  if (path.empty()) {
    return Status::Error(ErrorCode::InvalidArgument, "empty key path");
  }
  const ConfigTree *current = this;
  for (size_t i = 0; i < path.size(); i++) {
    const Entry *entry = current->FindEntry(path[i]);
    if (entry == nullptr) {
      return Status::Error(ErrorCode::NotFound,
                           "no such key " + DottedPath(path, i + 1));
    }
    if (i + 1 == path.size()) {
      if (entry->child_ != nullptr) {
        return Status::Error(ErrorCode::NotFound,
                             DottedPath(path, i + 1) + " is a namespace");
      }
      *value = entry->value_;
      return Status::OK();
    }
    if (entry->child_ == nullptr) {
      return Status::Error(ErrorCode::NotNamespace,
                           DottedPath(path, i + 1) + " holds a value");
    }
    current = entry->child_.get();
  }
  return Status::OK();
}

std::vector<std::string> ConfigTree::Keys() const {
  std::vector<std::string> keys;
  keys.reserve(entries_.size());
  for (const auto &entry : entries_) {
    keys.push_back(entry.key_);
  }
  return keys;
}

ConfigTree ConfigTree::Export(const ExclusionFilter &exclude) const {
  std::vector<std::string> prefix;
  size_t dropped = 0;
  ConfigTree res = ExportHelper(exclude, prefix, dropped);
  LOG_DEBUG("ConfigTree::Export: dropped {} excluded entr{}", dropped,
            dropped == 1 ? "y" : "ies");
  return res;
}

ConfigTree ConfigTree::ExportHelper(const ExclusionFilter &exclude,
                                    std::vector<std::string> &prefix,
                                    size_t &dropped) const {
  ConfigTree res;
  for (const auto &entry : entries_) {
    prefix.push_back(entry.key_);
    if (exclude.IsExcluded(prefix)) {
      dropped++;
    } else if (entry.child_ != nullptr) {
      res.entries_.push_back(Entry{
          entry.key_, {},
          std::make_unique<ConfigTree>(
              entry.child_->ExportHelper(exclude, prefix, dropped))});
    } else {
      res.entries_.push_back(Entry{entry.key_, entry.value_, nullptr});
    }
    prefix.pop_back();
  }
  return res;
}

std::vector<std::string> ConfigTree::Flatten() const {
  std::vector<std::string> lines;
  FlattenHelper("", lines);
  return lines;
}

void ConfigTree::FlattenHelper(const std::string &prefix,
                               std::vector<std::string> &lines) const {
  for (const auto &entry : entries_) {
    std::string key =
        prefix.empty() ? entry.key_ : prefix + KEY_PATH_DELIMITER + entry.key_;
    if (entry.child_ != nullptr) {
      entry.child_->FlattenHelper(key, lines);
    } else {
      lines.push_back(key + " = " + entry.value_);
    }
  }
}

} // namespace TrieKit
