#include "capture_pool.hpp"

#include <asio.hpp>

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>

#include "errors.hpp"

namespace {

void capture_one(Capture& out) {
  try {
    out.record = capture_record(out.path);
  } catch(const IoError& e) {
    out.error = e.reason();
  }
}

} // namespace

CapturePool::CapturePool(std::size_t workers)
  : workers_(workers) {
  if(workers_ == 0) {
    workers_ = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  }
}

std::vector<Capture> CapturePool::capture(const std::vector<std::string>& paths) const {
  std::vector<Capture> results(paths.size());
  for(std::size_t i = 0; i < paths.size(); ++i) {
    results[i].path = paths[i];
  }

  const std::size_t threads = std::min(workers_, paths.size());
  if(threads <= 1) {
    for(auto& result : results) capture_one(result);
    return results;
  }

  std::mutex error_mutex;
  std::exception_ptr first_error;
  asio::thread_pool pool(threads);
  for(auto& result : results) {
    asio::post(pool, [&result, &error_mutex, &first_error](){
      try {
        capture_one(result);
      } catch(...) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if(!first_error) first_error = std::current_exception();
      }
    });
  }
  pool.join();

  if(first_error) std::rethrow_exception(first_error);
  return results;
}
