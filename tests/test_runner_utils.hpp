#pragma once

#include "log.hpp"
#include "sync_engine.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace dcimsync::test {

// Scratch directory under the system temp dir, removed on destruction.
class TempTree {
public:
  explicit TempTree(const std::string& name)
    : root_(std::filesystem::temp_directory_path() / ("dcimsync_" + name)) {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
  }

  ~TempTree() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempTree(const TempTree&) = delete;
  TempTree& operator=(const TempTree&) = delete;

  const std::filesystem::path& root() const { return root_; }

  std::filesystem::path dir(const std::string& relative) const {
    auto path = root_ / relative;
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return path;
  }

  std::filesystem::path file(const std::string& relative,
                             const std::string& content = "data") const {
    auto path = root_ / relative;
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return path;
  }

  // Files prefix0001.ext .. prefixNNNN.ext for each number in [first, last].
  void numbered_files(const std::string& dir_relative,
                      int first,
                      int last,
                      const std::string& prefix = "IMG_",
                      const std::string& extension = "JPG") const {
    for(int n = first; n <= last; ++n) {
      std::string number = std::to_string(n);
      number.insert(0, number.size() < 4 ? 4 - number.size() : 0, '0');
      file(dir_relative + "/" + prefix + number + "." + extension, "frame " + std::to_string(n));
    }
  }

  bool exists(const std::string& relative) const {
    std::error_code ec;
    return std::filesystem::exists(root_ / relative, ec);
  }

  std::string read(const std::string& relative) const {
    std::ifstream in(root_ / relative, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

private:
  std::filesystem::path root_;
};

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        lines_.emplace_back((label.empty() ? channel : label) + ": " + message);
        return false;
      },
      nullptr);
    attachments_.push_back({logger, handle});
  }

  void attach(SyncEngine& engine, const std::string& label = std::string()) {
    attach(engine.logger(), label);
  }

  void detach_all() {
    for(auto& attachment : attachments_) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
    attachments_.clear();
  }

  void clear() { lines_.clear(); }

  const std::vector<std::string>& snapshot() const { return lines_; }

  bool contains(const std::string& needle) const {
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  std::vector<std::string> lines_;
  std::vector<Attachment> attachments_;
};

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
  std::vector<std::string> failures;

  // Records a failed expectation and passes the condition through so tests
  // can chain: ok &= ctx.expect(...)
  bool expect(bool condition, const std::string& what) {
    if(!condition) failures.push_back(what);
    return condition;
  }
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

template<typename Exception, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch(const Exception&) {
    return true;
  }
  return false;
}

inline int run_tests(const char* suite, const std::vector<TestCase>& tests, int argc, char** argv) {
  bool verbose = (std::getenv("DCIMSYNC_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("DCIMSYNC_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  init(verbose ? 2 : 0);
  if(suppress_logs) {
    set_log_passthrough(false);
  }

  LogCapture logs;
  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    TestContext ctx{logs, verbose, {}};
    bool passed = false;
    try {
      passed = test.fn(ctx) && ctx.failures.empty();
    } catch(const std::exception& e) {
      passed = false;
      ctx.failures.push_back(std::string("exception: ") + e.what());
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& failure : ctx.failures) {
        std::cout << "    expected: " << failure << "\n";
      }
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace dcimsync::test
