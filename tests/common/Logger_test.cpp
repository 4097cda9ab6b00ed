#include "common/Config.hpp"
#include "common/EnumClass.hpp"
#include "common/Logger.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

TEST(LoggerTest, WritesToFileAfterInit) {
  using namespace TrieKit;
  std::filesystem::remove(DEFAULT_LOG_FILE);
  // nothing happens before Init
  LOG_INFO("dropped {}", 1);

  Logger::Init();
  LOG_INFO("trie holds {} leaves", 3);
  LOG_DEBUG("hidden at info level");
  Logger::SetLevel(LogLevel::Debug);
  LOG_DEBUG("visible at debug level");
  Logger::Shutdown();

  std::ifstream file(DEFAULT_LOG_FILE);
  ASSERT_TRUE(file.is_open());
  std::stringstream content;
  content << file.rdbuf();
  auto text = content.str();
  EXPECT_EQ(std::string::npos, text.find("dropped"));
  EXPECT_NE(std::string::npos, text.find("trie holds 3 leaves"));
  EXPECT_NE(std::string::npos, text.find("Logger_test.cpp"));
  EXPECT_EQ(std::string::npos, text.find("hidden at info level"));
  EXPECT_NE(std::string::npos, text.find("visible at debug level"));
}
