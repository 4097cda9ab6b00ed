#pragma once

#include "common/Config.hpp"
#include "common/EnumClass.hpp"
#include "structure/TrieIterator.hpp"
#include "structure/TrieNode.hpp"
#include "structure/TriePolicy.hpp"

#include "fmt/format.h"

#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace TrieKit {

// Any range of keys, e.g. std::string for a char trie or
// std::vector<std::string> for a path trie. Raw arrays are rejected so that a
// string literal does not drag its terminating '\0' into the trie.
template <typename Range, typename Key>
concept KeySequence =
    std::ranges::input_range<Range> &&
    !std::is_array_v<std::remove_cvref_t<Range>> &&
    std::convertible_to<std::ranges::range_reference_t<Range>, Key>;

/**
 * Trie - prefix tree over sequences of keys
 *
 * Every inserted sequence is a path from the root; the node it ends at is
 * marked as a leaf. Size() is the number of leaves. Removing a sequence
 * unmarks its node and prunes the chain of nodes above it that no longer
 * lead to any leaf.
 *
 * Iteration yields joiner(keys from root to leaf) for every leaf, visiting
 * children in the order the sorter returns. The default policies keep
 * insertion order and yield the raw key path, which is why the defaulted
 * constructor is only available when Value is std::vector<Key>.
 */
template <typename Key, typename Value = std::vector<Key>>
  requires std::equality_comparable<Key>
class Trie {
  using Node = TrieNode<Key>;

  std::unique_ptr<Node> root_;
  size_t count_{};
  Sorter<Key> sorter_;
  Joiner<Key, Value> joiner_;

  template <typename Fn>
  using JoinResult =
      std::remove_cvref_t<std::invoke_result_t<Fn &, const std::vector<Key> &>>;

  // Follows sequence without creating nodes, nullptr if it leaves the trie.
  template <typename NodePtr, typename Range>
  static NodePtr Find(NodePtr node, const Range &sequence) {
    for (auto &&key : sequence) {
      node = node->FindChild(key);
      if (node == nullptr) {
        return nullptr;
      }
    }
    return node;
  }

  template <typename Range> bool AddImpl(const Range &sequence) {
    Node *node = root_.get();
    for (auto &&key : sequence) {
      node = &node->Child(key);
    }
    if (node->IsLeaf()) {
      return false;
    }
    node->SetLeaf(true);
    count_++;
    return true;
  }

  template <typename Range> bool RemoveImpl(const Range &sequence) {
    // Only a lookup: a failed removal must not leave new nodes behind.
    Node *node = Find(root_.get(), sequence);
    if (node == nullptr || !node->IsLeaf()) {
      return false;
    }
    node->SetLeaf(false);
    count_--;
    Prune(node);
    return true;
  }

  // Walks up from node, dropping every node that no longer has a reason to
  // exist. Stops at the first one that does; the root always does.
  void Prune(Node *node) {
    while (!node->ShouldExist()) {
      Node *parent = node->Parent();
      Key key = node->GetKey();
      parent->RemoveChild(key);
      node = parent;
    }
  }

  static Joiner<Key, Value> DefaultJoiner(Joiner<Key, Value> joiner) {
    if (joiner) {
      return joiner;
    }
    if constexpr (std::same_as<Value, std::vector<Key>>) {
      return &TupleJoiner<Key>;
    } else {
      throw std::invalid_argument("trie joiner must be set for this value type");
    }
  }

  // Hands the nodes over and leaves this trie empty under a fresh root with
  // the same key.
  std::unique_ptr<Node> TakeRoot() {
    auto fresh = std::make_unique<Node>(root_->GetKey(), nullptr);
    auto taken = std::exchange(root_, std::move(fresh));
    count_ = 0;
    sorter_ = &IdentitySorter<Key>;
    return taken;
  }

  void DumpNode(const Node &node, size_t indent, std::string &out) const {
    out += '\n';
    out.append(indent, ' ');
    out += node.ToString();
    for (const auto &key : sorter_(node.ChildKeys())) {
      if (const Node *child = node.FindChild(key); child != nullptr) {
        DumpNode(*child, indent + DUMP_INDENT, out);
      }
    }
  }

public:
  using key_type = Key;
  using value_type = Value;
  using size_type = size_t;
  using iterator = TrieIterator<Key, Value>;
  using range = TrieRange<Key, Value>;

  // Trie with the default policies, root key is empty.
  explicit Trie(Key empty = Key{})
    requires std::same_as<Value, std::vector<Key>>
      : Trie(std::move(empty), &IdentitySorter<Key>, &TupleJoiner<Key>) {}

  // An empty sorter means insertion order. An empty joiner means the raw key
  // path, which only exists when Value is std::vector<Key>; for any other
  // Value it throws std::invalid_argument.
  Trie(Key empty, Sorter<Key> sorter, Joiner<Key, Value> joiner)
      : root_(std::make_unique<Node>(std::move(empty), nullptr)),
        sorter_(sorter ? std::move(sorter) : Sorter<Key>(&IdentitySorter<Key>)),
        joiner_(DefaultJoiner(std::move(joiner))) {}

  Trie(const Trie &) = delete;
  Trie &operator=(const Trie &) = delete;

  // The moved-from trie is left empty and usable.
  Trie(Trie &&rhs)
      : count_(rhs.count_), sorter_(std::move(rhs.sorter_)),
        joiner_(rhs.joiner_) {
    root_ = rhs.TakeRoot();
  }

  Trie &operator=(Trie &&rhs) {
    if (this != &rhs) {
      Clear();
      count_ = rhs.count_;
      sorter_ = std::move(rhs.sorter_);
      joiner_ = rhs.joiner_;
      root_ = rhs.TakeRoot();
    }
    return *this;
  }

  ~Trie() { Clear(); }

  // Returns false when sequence was already in the trie. The empty sequence
  // marks the root itself.
  template <KeySequence<Key> Range> bool Add(const Range &sequence) {
    return AddImpl(sequence);
  }

  bool Add(std::initializer_list<Key> sequence) { return AddImpl(sequence); }

  bool Add(std::string_view sequence)
    requires std::same_as<Key, char>
  {
    return AddImpl(sequence);
  }

  // Returns false, changing nothing, when sequence is not in the trie.
  template <KeySequence<Key> Range> bool Remove(const Range &sequence) {
    return RemoveImpl(sequence);
  }

  bool Remove(std::initializer_list<Key> sequence) {
    return RemoveImpl(sequence);
  }

  bool Remove(std::string_view sequence)
    requires std::same_as<Key, char>
  {
    return RemoveImpl(sequence);
  }

  // True only if sequence ends at a leaf, not merely at some node.
  template <KeySequence<Key> Range> bool Contains(const Range &sequence) const {
    const Node *node = Find(static_cast<const Node *>(root_.get()), sequence);
    return node != nullptr && node->IsLeaf();
  }

  bool Contains(std::initializer_list<Key> sequence) const {
    const Node *node = Find(static_cast<const Node *>(root_.get()), sequence);
    return node != nullptr && node->IsLeaf();
  }

  bool Contains(std::string_view sequence) const
    requires std::same_as<Key, char>
  {
    const Node *node = Find(static_cast<const Node *>(root_.get()), sequence);
    return node != nullptr && node->IsLeaf();
  }

  size_t Size() const { return count_; }

  bool Empty() const { return count_ == 0; }

  // Drops every node below the root and unmarks the root. Runs without
  // recursion so very deep tries do not exhaust the stack.
  void Clear() {
    if (!root_) {
      return;
    }
    std::vector<std::unique_ptr<Node>> pending;
    root_->ReleaseChildren(pending);
    while (!pending.empty()) {
      auto node = std::move(pending.back());
      pending.pop_back();
      node->ReleaseChildren(pending);
    }
    root_->SetLeaf(false);
    count_ = 0;
  }

  const Node &Root() const { return *root_; }

  const Sorter<Key> &GetSorter() const { return sorter_; }

  const Joiner<Key, Value> &GetJoiner() const { return joiner_; }

  void SetSorter(Sorter<Key> sorter) {
    sorter_ = sorter ? std::move(sorter) : Sorter<Key>(&IdentitySorter<Key>);
  }

  // Same fallback as the constructor.
  void SetJoiner(Joiner<Key, Value> joiner) {
    joiner_ = DefaultJoiner(std::move(joiner));
  }

  range Iter(TraversalOrder order = TraversalOrder::DepthFirst) const {
    return range(root_.get(), sorter_, joiner_, order);
  }

  // An empty sorter falls back to the configured one.
  range Iter(Sorter<Key> sorter,
             TraversalOrder order = TraversalOrder::DepthFirst) const {
    return range(root_.get(), sorter ? std::move(sorter) : sorter_, joiner_,
                 order);
  }

  // Walk with a joiner of any result type, e.g. strings out of a trie whose
  // configured joiner yields key paths.
  template <typename Fn>
    requires std::invocable<Fn &, const std::vector<Key> &>
  TrieRange<Key, JoinResult<Fn>>
  Iter(Sorter<Key> sorter, Fn joiner,
       TraversalOrder order = TraversalOrder::DepthFirst) const {
    return TrieRange<Key, JoinResult<Fn>>(
        root_.get(), sorter ? std::move(sorter) : sorter_,
        Joiner<Key, JoinResult<Fn>>(std::move(joiner)), order);
  }

  iterator begin() const {
    return iterator(root_.get(), sorter_, joiner_, TraversalOrder::DepthFirst);
  }

  std::default_sentinel_t end() const { return std::default_sentinel; }

  // One line per node, indented by depth, children in sorter order:
  //   Trie@0x...
  //     ""
  //       "a"*
  std::string Dump() const
    requires fmt::is_formattable<Key>::value
  {
    std::string res = fmt::format("Trie@{}", fmt::ptr(this));
    DumpNode(*root_, DUMP_INDENT, res);
    return res;
  }
};

} // namespace TrieKit
