#include "common/EnumClass.hpp"
#include "common/Logger.hpp"
#include "common/Status.hpp"
#include "common/util/StringUtil.hpp"
#include "structure/TrieFactory.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace TrieKit {

struct ToolOptions {
  bool paths_{};
  bool dump_{};
  bool verbose_{};
  TraversalOrder order_{TraversalOrder::DepthFirst};
  std::vector<std::string> removals_;
  std::vector<std::string> files_;
};

class TrieToolRunner {
public:
  explicit TrieToolRunner(const ToolOptions &options) : options_(options) {}

  int Run() {
    for (const auto &file : options_.files_) {
      if (Status status = LoadFile(file); !status.ok()) {
        std::cerr << status.ToString() << "\n";
        LOG_ERROR("{}", status.ToString());
        return 1;
      }
    }
    for (const auto &entry : options_.removals_) {
      if (!Remove(entry)) {
        std::cerr << "Not stored: " << entry << "\n";
        LOG_WARN("remove {}: not stored", entry);
      }
    }
    LOG_INFO("{} entries after {} file(s)", Size(), options_.files_.size());

    if (options_.paths_) {
      Print(paths_);
    } else {
      Print(words_);
    }
    return 0;
  }

private:
  Status LoadFile(const std::string &file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
      return Status::Error(ErrorCode::IOError,
                           "failed to open file: " + file_path);
    }
    std::string line;
    size_t added = 0;
    size_t total = 0;
    while (std::getline(file, line)) {
      auto entry = StringUtil::Trim(line);
      if (entry.empty() || entry[0] == '#') {
        continue;
      }
      total++;
      if (Add(entry)) {
        added++;
      } else {
        LOG_DEBUG("{}: duplicate entry {}", file_path, entry);
      }
    }
    LOG_INFO("{}: {} new of {} entries", file_path, added, total);
    return Status::OK();
  }

  bool Add(const std::string &entry) {
    if (options_.paths_) {
      return paths_.Add(TrieFactory::SplitPath(entry));
    }
    return words_.Add(entry);
  }

  bool Remove(const std::string &entry) {
    if (options_.paths_) {
      return paths_.Remove(TrieFactory::SplitPath(entry));
    }
    return words_.Remove(entry);
  }

  size_t Size() const {
    return options_.paths_ ? paths_.Size() : words_.Size();
  }

  template <typename TrieType> void Print(const TrieType &trie) {
    for (const auto &value : trie.Iter(options_.order_)) {
      std::cout << value << "\n";
    }
    if (options_.dump_) {
      std::cout << trie.Dump() << "\n";
    }
    std::cout << "(" << trie.Size() << " entries)\n";
  }

  ToolOptions options_;
  StringTrie words_ = TrieFactory::Strings();
  PathTrie paths_ = TrieFactory::Paths();
};

} // namespace TrieKit

static void PrintUsage() {
  std::cerr << "Usage: trietool [--paths] [--bfs] [--dump] [--verbose] "
               "[--remove <entry>] <file> [file ...]\n";
  std::cerr << "       one word (or path with --paths) per line, '#' starts "
               "a comment line\n";
}

int main(int argc, char *argv[]) {
  TrieKit::ToolOptions options;
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--paths") {
      options.paths_ = true;
    } else if (arg == "--bfs") {
      options.order_ = TraversalOrder::BreadthFirst;
    } else if (arg == "--dump") {
      options.dump_ = true;
    } else if (arg == "--verbose") {
      options.verbose_ = true;
    } else if (arg == "--remove") {
      if (i + 1 >= argc) {
        PrintUsage();
        return 1;
      }
      options.removals_.emplace_back(argv[++i]);
    } else if (TrieKit::StringUtil::StartsWith(arg, "--")) {
      std::cerr << "Unknown option: " << arg << "\n";
      PrintUsage();
      return 1;
    } else {
      options.files_.push_back(arg);
    }
  }
  if (options.files_.empty()) {
    PrintUsage();
    return 1;
  }

  TrieKit::Logger::Init("./logs/trietool.log",
                        options.verbose_ ? LogLevel::Debug : LogLevel::Info);
  int code = TrieKit::TrieToolRunner(options).Run();
  TrieKit::Logger::Shutdown();
  return code;
}
