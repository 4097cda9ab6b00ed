#pragma once

#include "fmt/format.h"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace TrieKit {

// A single vertex of a Trie. The node owns its children; the parent link is
// only used to rebuild the key path and to prune upward after a removal.
template <typename Key>
  requires std::equality_comparable<Key>
class TrieNode {
  using ChildList = std::vector<std::pair<Key, std::unique_ptr<TrieNode>>>;

  static constexpr size_t npos = static_cast<size_t>(-1);

  Key key_;
  // Not owned, nullptr for the root.
  TrieNode *parent_;
  // A leaf marks the end of an inserted sequence. It may still have children
  // when that sequence is a prefix of a longer one.
  bool leaf_{};
  // Allocated by the first Child() call and released again once the last
  // child is removed, so a childless node carries no list at all.
  std::unique_ptr<ChildList> children_;

  size_t FindIndex(const Key &key) const {
    if (children_ == nullptr) {
      return npos;
    }
    auto ite = std::ranges::find_if(
        *children_, [&](const auto &pair) { return pair.first == key; });
    if (ite == children_->end()) {
      return npos;
    }
    return static_cast<size_t>(ite - children_->begin());
  }

public:
  TrieNode(Key key, TrieNode *parent)
      : key_(std::move(key)), parent_(parent) {}

  TrieNode(const TrieNode &) = delete;
  TrieNode &operator=(const TrieNode &) = delete;

  const Key &GetKey() const { return key_; }

  TrieNode *Parent() const { return parent_; }

  bool IsLeaf() const { return leaf_; }

  void SetLeaf(bool leaf) { leaf_ = leaf; }

  bool IsRoot() const { return parent_ == nullptr; }

  bool IsEmpty() const { return children_ == nullptr; }

  size_t ChildCount() const { return IsEmpty() ? 0 : children_->size(); }

  // A node that is not a leaf, has no children and is not the root serves no
  // purpose and gets pruned.
  bool ShouldExist() const { return leaf_ || !IsEmpty() || IsRoot(); }

  bool HasChild(const Key &key) const { return FindIndex(key) != npos; }

  // Returns the child under key, creating a non-leaf one if it is absent.
  TrieNode &Child(const Key &key) {
    if (auto idx = FindIndex(key); idx != npos) {
      return *(*children_)[idx].second;
    }
    if (children_ == nullptr) {
      children_ = std::make_unique<ChildList>();
    }
    auto &[_, ptr] =
        children_->emplace_back(key, std::make_unique<TrieNode>(key, this));
    return *ptr;
  }

  TrieNode *FindChild(const Key &key) {
    auto idx = FindIndex(key);
    return idx == npos ? nullptr : (*children_)[idx].second.get();
  }

  const TrieNode *FindChild(const Key &key) const {
    auto idx = FindIndex(key);
    return idx == npos ? nullptr : (*children_)[idx].second.get();
  }

  // Destroys the child under key together with its subtree. Missing keys are
  // ignored.
  void RemoveChild(const Key &key) {
    auto idx = FindIndex(key);
    if (idx == npos) {
      return;
    }
    children_->erase(children_->begin() + static_cast<std::ptrdiff_t>(idx));
    if (children_->empty()) {
      children_.reset();
    }
  }

  // Hands every child over to out and leaves this node empty. Lets the owner
  // tear down deep subtrees without recursing.
  void ReleaseChildren(std::vector<std::unique_ptr<TrieNode>> &out) {
    if (children_ == nullptr) {
      return;
    }
    for (auto &[_, child] : *children_) {
      out.push_back(std::move(child));
    }
    children_.reset();
  }

  // Keys from the root down to this node, root key first.
  std::vector<Key> Hierarchy() const {
    std::vector<Key> keys;
    for (const TrieNode *node = this; node != nullptr; node = node->parent_) {
      keys.push_back(node->key_);
    }
    std::reverse(keys.begin(), keys.end());
    return keys;
  }

  // Child keys in insertion order.
  std::vector<Key> ChildKeys() const {
    std::vector<Key> keys;
    if (children_ == nullptr) {
      return keys;
    }
    keys.reserve(children_->size());
    for (const auto &[key, _] : *children_) {
      keys.push_back(key);
    }
    return keys;
  }

  // The key as a quoted literal for text keys, plain otherwise, followed by
  // '*' for a leaf.
  std::string ToString() const
    requires fmt::is_formattable<Key>::value
  {
    std::string res;
    if constexpr (std::is_same_v<Key, char>) {
      // a '\0' root is the empty placeholder of a string trie
      res = fmt::format("{:?}", IsRoot() && key_ == '\0'
                                    ? std::string_view()
                                    : std::string_view(&key_, 1));
    } else if constexpr (std::is_convertible_v<const Key &, std::string_view>) {
      res = fmt::format("{:?}", std::string_view(key_));
    } else {
      res = fmt::format("{}", key_);
    }
    if (leaf_) {
      res += '*';
    }
    return res;
  }
};

} // namespace TrieKit
