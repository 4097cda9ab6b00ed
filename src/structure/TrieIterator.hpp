#pragma once

#include "common/EnumClass.hpp"
#include "structure/TrieNode.hpp"
#include "structure/TriePolicy.hpp"

#include <cstddef>
#include <deque>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace TrieKit {

/**
 * TrieIterator - lazy leaf walk over a Trie
 *
 * Every increment advances the traversal just far enough to reach the next
 * leaf, whose key path is passed through the joiner. Depth-first order keeps
 * an explicit stack of frames in place of recursion; breadth-first order
 * keeps a FIFO queue. The sorter is consulted for a node's children only
 * after the node itself has been produced, the same moment a recursive
 * generator would ask for them.
 *
 * The iterator never modifies the trie. Keys the sorter returns that are not
 * children of the node are skipped. The trie must not be modified while an
 * iterator over it is alive.
 */
template <typename Key, typename Value> class TrieIterator {
  using Node = TrieNode<Key>;

  struct Frame {
    const Node *node_;
    bool visited_{};
    // Filled by the sorter once the frame is resumed after its own node.
    std::optional<std::vector<Key>> keys_;
    size_t next_{};
  };

  Sorter<Key> sorter_;
  Joiner<Key, Value> joiner_;
  TraversalOrder order_{TraversalOrder::DepthFirst};

  std::vector<Frame> stack_;
  std::deque<const Node *> queue_;
  // Breadth-first: node whose children are queued on the next pull.
  const Node *expand_{};

  std::optional<Value> current_;

  void AdvanceDepthFirst() {
    while (!stack_.empty()) {
      Frame &frame = stack_.back();
      if (!frame.visited_) {
        frame.visited_ = true;
        if (frame.node_->IsLeaf()) {
          current_.emplace(joiner_(frame.node_->Hierarchy()));
          return;
        }
      }
      if (!frame.keys_) {
        frame.keys_ = sorter_(frame.node_->ChildKeys());
      }
      if (frame.next_ < frame.keys_->size()) {
        const Node *child = frame.node_->FindChild((*frame.keys_)[frame.next_]);
        frame.next_++;
        if (child != nullptr) {
          // frame is invalidated from here on
          stack_.push_back(Frame{child});
        }
        continue;
      }
      stack_.pop_back();
    }
  }

  void AdvanceBreadthFirst() {
    while (true) {
      if (expand_ != nullptr) {
        const Node *node = expand_;
        expand_ = nullptr;
        for (const auto &key : sorter_(node->ChildKeys())) {
          if (const Node *child = node->FindChild(key); child != nullptr) {
            queue_.push_back(child);
          }
        }
      }
      if (queue_.empty()) {
        return;
      }
      const Node *node = queue_.front();
      queue_.pop_front();
      expand_ = node;
      if (node->IsLeaf()) {
        current_.emplace(joiner_(node->Hierarchy()));
        return;
      }
    }
  }

  void Advance() {
    current_.reset();
    if (order_ == TraversalOrder::DepthFirst) {
      AdvanceDepthFirst();
    } else {
      AdvanceBreadthFirst();
    }
  }

public:
  using value_type = Value;
  using difference_type = std::ptrdiff_t;
  using reference = const Value &;
  using iterator_concept = std::input_iterator_tag;

  // An exhausted iterator.
  TrieIterator() = default;

  TrieIterator(const Node *root, Sorter<Key> sorter, Joiner<Key, Value> joiner,
               TraversalOrder order)
      : sorter_(std::move(sorter)), joiner_(std::move(joiner)), order_(order) {
    if (root != nullptr) {
      if (order_ == TraversalOrder::DepthFirst) {
        stack_.push_back(Frame{root});
      } else {
        queue_.push_back(root);
      }
      Advance();
    }
  }

  const Value &operator*() const { return *current_; }

  const Value *operator->() const { return &*current_; }

  TrieIterator &operator++() {
    Advance();
    return *this;
  }

  void operator++(int) { Advance(); }

  bool Done() const { return !current_.has_value(); }

  friend bool operator==(const TrieIterator &ite, std::default_sentinel_t) {
    return ite.Done();
  }
};

/**
 * TrieRange - the result of Trie::Iter()
 *
 * Holds the policies for one kind of walk. Each begin() starts a fresh,
 * independent traversal, so the same range can be iterated any number of
 * times.
 */
template <typename Key, typename Value> class TrieRange {
  const TrieNode<Key> *root_;
  Sorter<Key> sorter_;
  Joiner<Key, Value> joiner_;
  TraversalOrder order_;

public:
  TrieRange(const TrieNode<Key> *root, Sorter<Key> sorter,
            Joiner<Key, Value> joiner, TraversalOrder order)
      : root_(root), sorter_(std::move(sorter)), joiner_(std::move(joiner)),
        order_(order) {}

  TrieIterator<Key, Value> begin() const {
    return TrieIterator<Key, Value>(root_, sorter_, joiner_, order_);
  }

  std::default_sentinel_t end() const { return std::default_sentinel; }

  std::vector<Value> Collect() const {
    std::vector<Value> values;
    for (auto ite = begin(); ite != end(); ++ite) {
      values.push_back(*ite);
    }
    return values;
  }
};

} // namespace TrieKit
