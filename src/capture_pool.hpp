#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "record.hpp"

struct Capture {
  std::string path;
  std::optional<Record> record;
  std::string error; // IoError reason when `record` is empty
};

// Digests and stats files on a bounded asio thread pool. Only file reads run
// on the workers; callers keep store access on their own thread.
class CapturePool {
public:
  // 0 selects std::thread::hardware_concurrency().
  explicit CapturePool(std::size_t workers = 0);

  std::size_t workers() const { return workers_; }

  // One Capture per path, in input order. IoError becomes Capture::error;
  // anything else is rethrown on the calling thread after all tasks finish.
  std::vector<Capture> capture(const std::vector<std::string>& paths) const;

private:
  std::size_t workers_;
};
