#pragma once

#include "log.hpp"
#include "outcome.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fimbl::test {

// Scratch directory under the system temp dir, wiped on entry and exit.
class TempWorkspace {
public:
  explicit TempWorkspace(const std::string& name)
    : root_(std::filesystem::temp_directory_path() / ("fimbl_" + name)) {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
  }

  ~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempWorkspace(const TempWorkspace&) = delete;
  TempWorkspace& operator=(const TempWorkspace&) = delete;

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path path(const std::string& relative) const { return root_ / relative; }
  std::filesystem::path db() const { return root_ / "ledger.db"; }

private:
  std::filesystem::path root_;
};

inline std::string write_file(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  return path.string();
}

inline void append_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::app);
  out << content;
}

// Rewrites the stored digest of `key` as a 16-byte blob through a separate
// connection, leaving a row the store cannot decode. Returns false when no
// row was changed.
inline bool truncate_stored_digest(const std::filesystem::path& db, const std::string& key) {
  sqlite3* handle = nullptr;
  if(sqlite3_open(db.string().c_str(), &handle) != SQLITE_OK) {
    sqlite3_close(handle);
    return false;
  }
  sqlite3_stmt* stmt = nullptr;
  bool changed = false;
  if(sqlite3_prepare_v2(handle, "UPDATE records SET digest = zeroblob(16) WHERE path = ?1",
                        -1, &stmt, nullptr) == SQLITE_OK) {
    sqlite3_bind_text(stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
    changed = sqlite3_step(stmt) == SQLITE_DONE && sqlite3_changes(handle) == 1;
  }
  sqlite3_finalize(stmt);
  sqlite3_close(handle);
  return changed;
}

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
      [this, label](const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.emplace_back((label.empty() ? channel : label) + ": " + message);
        return true;
      });
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

struct TestContext {
  LogCapture& logs;
  std::shared_ptr<Logger> logger;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Prints a note about why a check failed; always returns false.
inline bool fail(TestContext& ctx, const std::string& why) {
  ctx.logger->report("check failed: {}", why);
  return false;
}

inline bool expect_kinds(TestContext& ctx,
                         const std::vector<Outcome>& outcomes,
                         const std::vector<OutcomeKind>& kinds) {
  if(outcomes.size() != kinds.size()) {
    return fail(ctx, "expected " + std::to_string(kinds.size()) + " outcomes, got " +
                     std::to_string(outcomes.size()));
  }
  for(std::size_t i = 0; i < kinds.size(); ++i) {
    if(outcomes[i].kind != kinds[i]) {
      return fail(ctx, "outcome " + std::to_string(i) + " for " + outcomes[i].path + " is " +
                       outcome_kind_name(outcomes[i].kind) + ", expected " +
                       outcome_kind_name(kinds[i]));
    }
  }
  return true;
}

// Shared main loop: '.' per pass, 'F' plus captured log lines per failure.
inline int run_tests(const char* suite, std::vector<TestCase> tests, int argc, char** argv) {
  bool verbose = (std::getenv("FIMBL_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("FIMBL_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  init_logging(verbose);
  if(suppress_logs) {
    set_log_passthrough(false);
  }

  LogCapture logs;
  auto logger = std::make_shared<Logger>("test");
  logs.attach(logger);
  TestContext ctx{logs, logger, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  logs.detach_all();
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

} // namespace fimbl::test
