#include "common/EnumClass.hpp"
#include "config/ConfigTree.hpp"
#include "config/ExclusionFilter.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace TrieKit;

namespace {
ConfigTree MakeConfig() {
  ConfigTree config;
  EXPECT_TRUE(config.Set({"name"}, "demo").ok());
  EXPECT_TRUE(config.Set({"db", "host"}, "localhost").ok());
  EXPECT_TRUE(config.Set({"db", "password"}, "hunter2").ok());
  EXPECT_TRUE(config.Set({"log", "level"}, "info").ok());
  EXPECT_TRUE(config.Set({"log", "sink", "file"}, "out.log").ok());
  return config;
}
} // namespace

TEST(ConfigTreeTest, SetAndGet) {
  auto config = MakeConfig();
  std::string value;
  ASSERT_TRUE(config.Get({"db", "host"}, &value).ok());
  EXPECT_EQ("localhost", value);
  ASSERT_TRUE(config.Get({"log", "sink", "file"}, &value).ok());
  EXPECT_EQ("out.log", value);
  EXPECT_EQ((std::vector<std::string>{"name", "db", "log"}), config.Keys());
  EXPECT_TRUE(config.IsNamespace("db"));
  EXPECT_FALSE(config.IsNamespace("name"));
}

TEST(ConfigTreeTest, SetOverwrites) {
  auto config = MakeConfig();
  ASSERT_TRUE(config.Set({"db", "host"}, "remote").ok());
  std::string value;
  ASSERT_TRUE(config.Get({"db", "host"}, &value).ok());
  EXPECT_EQ("remote", value);
  // a namespace replaced by a plain value
  ASSERT_TRUE(config.Set({"log"}, "off").ok());
  ASSERT_TRUE(config.Get({"log"}, &value).ok());
  EXPECT_EQ("off", value);
  EXPECT_EQ(3U, config.Size());
}

TEST(ConfigTreeTest, GetErrors) {
  auto config = MakeConfig();
  std::string value;
  auto status = config.Get({"db", "port"}, &value);
  EXPECT_EQ(ErrorCode::NotFound, status.Code());
  EXPECT_EQ("no such key db.port", status.GetMessage());

  status = config.Get({"name", "first"}, &value);
  EXPECT_EQ(ErrorCode::NotNamespace, status.Code());

  status = config.Get({"db"}, &value);
  EXPECT_FALSE(status.ok());

  status = config.Get({}, &value);
  EXPECT_EQ(ErrorCode::InvalidArgument, status.Code());
}

TEST(ConfigTreeTest, SetThroughValueFails) {
  auto config = MakeConfig();
  auto status = config.Set({"name", "first"}, "x");
  EXPECT_EQ(ErrorCode::NotNamespace, status.Code());
  EXPECT_EQ("NotNamespace: name holds a value", status.ToString());
  EXPECT_EQ(ErrorCode::InvalidArgument, config.Set({}, "x").Code());
}

TEST(ConfigTreeTest, CheckPathCreatesNamespaces) {
  ConfigTree config;
  ConfigTree *tree = nullptr;
  ASSERT_TRUE(config.CheckPath({"a", "b", "c"}, &tree).ok());
  ASSERT_NE(nullptr, tree);
  EXPECT_EQ(0U, tree->Size());
  ASSERT_TRUE(tree->Set({"d"}, "1").ok());

  std::string value;
  ASSERT_TRUE(config.Get({"a", "b", "c", "d"}, &value).ok());
  EXPECT_EQ("1", value);

  ConfigTree *same = nullptr;
  ASSERT_TRUE(config.CheckPath({"a", "b", "c"}, &same).ok());
  EXPECT_EQ(tree, same);

  ConfigTree *self = nullptr;
  ASSERT_TRUE(config.CheckPath({}, &self).ok());
  EXPECT_EQ(&config, self);
}

TEST(ConfigTreeTest, CheckPathRejectsValues) {
  auto config = MakeConfig();
  ConfigTree *tree = nullptr;
  auto status = config.CheckPath({"db", "host", "x"}, &tree);
  EXPECT_EQ(ErrorCode::NotNamespace, status.Code());
  EXPECT_EQ("db.host holds a value", status.GetMessage());
  EXPECT_EQ(nullptr, tree);
}

TEST(ConfigTreeTest, ExportWithoutExclusions) {
  auto config = MakeConfig();
  auto exported = config.Export(ExclusionFilter());
  EXPECT_EQ(config.Flatten(), exported.Flatten());
}

TEST(ConfigTreeTest, ExportDropsExcludedPaths) {
  auto config = MakeConfig();
  ExclusionFilter exclude({std::vector<std::string>{"db", "password"},
                           std::string("name"),
                           std::vector<std::string>{"log", "sink"}});
  auto exported = config.Export(exclude);
  EXPECT_EQ((std::vector<std::string>{"db.host = localhost",
                                      "log.level = info"}),
            exported.Flatten());
  // the source is untouched
  EXPECT_EQ(5U, config.Flatten().size());
}

TEST(ConfigTreeTest, ExportKeepsEmptiedNamespace) {
  auto config = MakeConfig();
  ExclusionFilter exclude({std::vector<std::string>{"db", "host"},
                           std::vector<std::string>{"db", "password"}});
  auto exported = config.Export(exclude);
  EXPECT_TRUE(exported.IsNamespace("db"));
  ConfigTree *db = nullptr;
  ASSERT_TRUE(exported.CheckPath({"db"}, &db).ok());
  EXPECT_EQ(0U, db->Size());
}

TEST(ConfigTreeTest, Flatten) {
  auto config = MakeConfig();
  EXPECT_EQ((std::vector<std::string>{
                "name = demo", "db.host = localhost", "db.password = hunter2",
                "log.level = info", "log.sink.file = out.log"}),
            config.Flatten());
}
