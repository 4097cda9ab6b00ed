#include "structure/TrieNode.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace TrieKit;

TEST(TrieNodeTest, ChildCreatesOnce) {
  TrieNode<std::string> root("", nullptr);
  EXPECT_TRUE(root.IsEmpty());
  EXPECT_TRUE(root.IsRoot());

  auto &a = root.Child("a");
  EXPECT_FALSE(root.IsEmpty());
  EXPECT_FALSE(a.IsLeaf());
  EXPECT_EQ(&root, a.Parent());
  EXPECT_EQ("a", a.GetKey());
  // second lookup returns the same node
  EXPECT_EQ(&a, &root.Child("a"));
  EXPECT_EQ(1U, root.ChildCount());
}

TEST(TrieNodeTest, HasChildDoesNotCreate) {
  TrieNode<std::string> root("", nullptr);
  EXPECT_FALSE(root.HasChild("x"));
  EXPECT_EQ(nullptr, root.FindChild("x"));
  EXPECT_TRUE(root.IsEmpty());
}

TEST(TrieNodeTest, RemoveChildReleasesList) {
  TrieNode<std::string> root("", nullptr);
  root.Child("a");
  root.Child("b");
  root.RemoveChild("a");
  EXPECT_FALSE(root.HasChild("a"));
  EXPECT_FALSE(root.IsEmpty());
  root.RemoveChild("b");
  EXPECT_TRUE(root.IsEmpty());
  EXPECT_EQ(0U, root.ChildCount());
  // missing keys are ignored
  root.RemoveChild("zzz");
  EXPECT_TRUE(root.IsEmpty());
}

TEST(TrieNodeTest, ShouldExist) {
  TrieNode<std::string> root("", nullptr);
  EXPECT_TRUE(root.ShouldExist());

  auto &a = root.Child("a");
  EXPECT_FALSE(a.ShouldExist());
  a.SetLeaf(true);
  EXPECT_TRUE(a.ShouldExist());
  a.SetLeaf(false);
  a.Child("b");
  EXPECT_TRUE(a.ShouldExist());
}

TEST(TrieNodeTest, HierarchyAndChildKeys) {
  TrieNode<std::string> root("", nullptr);
  auto &c = root.Child("a").Child("b").Child("c");
  EXPECT_EQ((std::vector<std::string>{"", "a", "b", "c"}), c.Hierarchy());
  EXPECT_EQ((std::vector<std::string>{""}), root.Hierarchy());

  auto &b = *root.FindChild("a")->FindChild("b");
  b.Child("z");
  b.Child("d");
  // insertion order, not sorted
  EXPECT_EQ((std::vector<std::string>{"c", "z", "d"}), b.ChildKeys());
}

TEST(TrieNodeTest, IntegerKeys) {
  TrieNode<int> root(0, nullptr);
  auto &n = root.Child(7).Child(3);
  EXPECT_EQ((std::vector<int>{0, 7, 3}), n.Hierarchy());
  n.SetLeaf(true);
  EXPECT_EQ("3*", n.ToString());
  EXPECT_EQ("0", root.ToString());
}

TEST(TrieNodeTest, ToStringQuotesText) {
  TrieNode<std::string> root("", nullptr);
  auto &a = root.Child("ab");
  a.SetLeaf(true);
  EXPECT_EQ("\"\"", root.ToString());
  EXPECT_EQ("\"ab\"*", a.ToString());

  TrieNode<char> chars('\0', nullptr);
  EXPECT_EQ("\"x\"", chars.Child('x').ToString());
  // the placeholder root of a string trie renders as an empty string
  EXPECT_EQ("\"\"", chars.ToString());
}

TEST(TrieNodeTest, ReleaseChildren) {
  TrieNode<std::string> root("", nullptr);
  root.Child("a").Child("b");
  root.Child("c");
  std::vector<std::unique_ptr<TrieNode<std::string>>> out;
  root.ReleaseChildren(out);
  EXPECT_TRUE(root.IsEmpty());
  ASSERT_EQ(2U, out.size());
  EXPECT_EQ("a", out[0]->GetKey());
  EXPECT_EQ(1U, out[0]->ChildCount());
}
