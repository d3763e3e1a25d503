#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "record.hpp"

struct sqlite3;
struct sqlite3_stmt;

// Persisted map canonical path -> Record, backed by one SQLite file.
//
// Every operation is a single statement in its own transaction, so a Record
// is always either the old or the new one, also across concurrent processes.
// Nothing is transactional across keys: a scan may observe writes made by
// another invocation while it runs. All failures throw StoreError.
class RecordStore {
public:
  struct Options {
    std::chrono::milliseconds busy_timeout{5000};
  };

  // Lazy, key-ordered walk over the store. Holds a prepared statement, so it
  // must not outlive the store it came from.
  class Cursor {
  public:
    Cursor(Cursor&& other) noexcept;
    Cursor& operator=(Cursor&& other) noexcept;
    Cursor(const Cursor&) = delete;
    Cursor& operator=(const Cursor&) = delete;
    ~Cursor();

    // Fills `out` and returns true, or returns false once exhausted.
    bool next(Record& out);

  private:
    friend class RecordStore;
    Cursor(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
  };

  explicit RecordStore(std::filesystem::path location);
  RecordStore(std::filesystem::path location, Options options);
  ~RecordStore();

  RecordStore(const RecordStore&) = delete;
  RecordStore& operator=(const RecordStore&) = delete;

  std::optional<Record> get(const std::string& path);
  void put(const Record& record);
  bool erase(const std::string& path);

  // Writes only when no Record exists for the key; true if written.
  bool insert_if_absent(const Record& record);
  // Writes only when a Record exists for the key; true if written.
  bool replace_if_present(const Record& record);

  std::size_t size();
  Cursor scan();
  void for_each(const std::function<void(const Record&)>& fn);

  const std::filesystem::path& location() const { return location_; }

private:
  void open();
  void configure();
  void initialize_schema();
  void execute(const char* sql);
  bool write(const char* sql, const Record& record);

  std::filesystem::path location_;
  Options options_;
  sqlite3* db_ = nullptr;
};
