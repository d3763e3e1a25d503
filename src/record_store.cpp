#include "record_store.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>

#include "errors.hpp"

namespace {

constexpr const char* kSchema =
  "CREATE TABLE IF NOT EXISTS records ("
  "  path        TEXT    PRIMARY KEY NOT NULL,"
  "  digest      BLOB    NOT NULL,"
  "  size        INTEGER NOT NULL,"
  "  modified_ns INTEGER NOT NULL,"
  "  permissions INTEGER NOT NULL,"
  "  recorded_at INTEGER NOT NULL"
  ") WITHOUT ROWID";

constexpr const char* kSelectColumns =
  "SELECT path, digest, size, modified_ns, permissions, recorded_at FROM records";

constexpr const char* kUpsert =
  "INSERT OR REPLACE INTO records (path, digest, size, modified_ns, permissions, recorded_at) "
  "VALUES (?1, ?2, ?3, ?4, ?5, ?6)";

constexpr const char* kInsertIfAbsent =
  "INSERT OR IGNORE INTO records (path, digest, size, modified_ns, permissions, recorded_at) "
  "VALUES (?1, ?2, ?3, ?4, ?5, ?6)";

constexpr const char* kReplaceIfPresent =
  "UPDATE records SET digest = ?2, size = ?3, modified_ns = ?4, permissions = ?5, recorded_at = ?6 "
  "WHERE path = ?1";

StoreError sqlite_failure(sqlite3* db, const std::string& context) {
  std::string message = "record store: " + context;
  if(db) {
    message += ": ";
    message += sqlite3_errmsg(db);
  }
  return StoreError(message);
}

// Owns one prepared statement.
class Statement {
public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
      throw sqlite_failure(db_, "prepare");
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bind_text(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }
  void bind_blob(int index, const void* data, std::size_t len) {
    check(sqlite3_bind_blob(stmt_, index, data, static_cast<int>(len), SQLITE_TRANSIENT));
  }
  void bind_int64(int index, std::int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
  }

  // True while rows are produced.
  bool step() {
    int rc = sqlite3_step(stmt_);
    if(rc == SQLITE_ROW) return true;
    if(rc == SQLITE_DONE) return false;
    throw sqlite_failure(db_, "step");
  }

  sqlite3_stmt* get() const { return stmt_; }
  sqlite3_stmt* release() { return std::exchange(stmt_, nullptr); }

private:
  void check(int rc) {
    if(rc != SQLITE_OK) throw sqlite_failure(db_, "bind");
  }

  sqlite3* db_;
  sqlite3_stmt* stmt_ = nullptr;
};

void bind_record(Statement& stmt, const Record& record) {
  stmt.bind_text(1, record.path);
  stmt.bind_blob(2, record.digest.data(), record.digest.size());
  stmt.bind_int64(3, static_cast<std::int64_t>(record.attributes.size));
  stmt.bind_int64(4, record.attributes.modified_ns);
  stmt.bind_int64(5, static_cast<std::int64_t>(record.attributes.permissions));
  stmt.bind_int64(6, record.recorded_at);
}

Record read_row(sqlite3_stmt* stmt) {
  Record r;
  const auto* path = sqlite3_column_text(stmt, 0);
  r.path = path ? reinterpret_cast<const char*>(path) : "";

  const void* blob = sqlite3_column_blob(stmt, 1);
  int blob_len = sqlite3_column_bytes(stmt, 1);
  if(!blob || blob_len != static_cast<int>(r.digest.size())) {
    throw StoreError("record store: corrupt digest for " + r.path +
                     " (" + std::to_string(blob_len) + " bytes)");
  }
  std::memcpy(r.digest.data(), blob, r.digest.size());

  r.attributes.size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 2));
  r.attributes.modified_ns = static_cast<std::int64_t>(sqlite3_column_int64(stmt, 3));
  r.attributes.permissions = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 4));
  r.recorded_at = static_cast<std::int64_t>(sqlite3_column_int64(stmt, 5));
  return r;
}

} // namespace

// ---- Cursor ----------------------------------------------------------------

RecordStore::Cursor::Cursor(Cursor&& other) noexcept
  : db_(std::exchange(other.db_, nullptr)),
    stmt_(std::exchange(other.stmt_, nullptr)) {}

RecordStore::Cursor& RecordStore::Cursor::operator=(Cursor&& other) noexcept {
  if(this != &other) {
    sqlite3_finalize(stmt_);
    db_ = std::exchange(other.db_, nullptr);
    stmt_ = std::exchange(other.stmt_, nullptr);
  }
  return *this;
}

RecordStore::Cursor::~Cursor() {
  sqlite3_finalize(stmt_);
}

bool RecordStore::Cursor::next(Record& out) {
  if(!stmt_) return false;
  int rc = sqlite3_step(stmt_);
  if(rc == SQLITE_ROW) {
    out = read_row(stmt_);
    return true;
  }
  if(rc == SQLITE_DONE) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    return false;
  }
  throw sqlite_failure(db_, "scan");
}

// ---- RecordStore -----------------------------------------------------------

RecordStore::RecordStore(std::filesystem::path location)
  : RecordStore(std::move(location), Options{}) {}

RecordStore::RecordStore(std::filesystem::path location, Options options)
  : location_(std::move(location)), options_(options) {
  open();
  try {
    configure();
    initialize_schema();
  } catch(...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

RecordStore::~RecordStore() {
  if(db_) sqlite3_close(db_);
}

void RecordStore::open() {
  if(location_.empty()) {
    throw StoreError("record store: empty location");
  }
  if(location_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(location_.parent_path(), ec);
    if(ec) {
      throw StoreError("record store: cannot create " + location_.parent_path().string() + ": " + ec.message());
    }
  }
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
  if(sqlite3_open_v2(location_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    auto error = sqlite_failure(db_, "open " + location_.string());
    sqlite3_close(db_);
    db_ = nullptr;
    throw error;
  }
}

void RecordStore::configure() {
  auto timeout = options_.busy_timeout.count();
  if(sqlite3_busy_timeout(db_, timeout < 0 ? 0 : static_cast<int>(timeout)) != SQLITE_OK) {
    throw sqlite_failure(db_, "busy timeout");
  }
  execute("PRAGMA journal_mode = WAL");
  execute("PRAGMA synchronous = FULL");
}

void RecordStore::initialize_schema() {
  execute(kSchema);
}

void RecordStore::execute(const char* sql) {
  char* error = nullptr;
  if(sqlite3_exec(db_, sql, nullptr, nullptr, &error) != SQLITE_OK) {
    std::string message = error ? error : "unknown error";
    sqlite3_free(error);
    throw StoreError("record store: " + message + " (" + location_.string() + ")");
  }
}

bool RecordStore::write(const char* sql, const Record& record) {
  Statement stmt(db_, sql);
  bind_record(stmt, record);
  stmt.step();
  return sqlite3_changes(db_) > 0;
}

std::optional<Record> RecordStore::get(const std::string& path) {
  Statement stmt(db_, std::string(kSelectColumns) + " WHERE path = ?1");
  stmt.bind_text(1, path);
  if(!stmt.step()) return std::nullopt;
  return read_row(stmt.get());
}

void RecordStore::put(const Record& record) {
  write(kUpsert, record);
}

bool RecordStore::insert_if_absent(const Record& record) {
  return write(kInsertIfAbsent, record);
}

bool RecordStore::replace_if_present(const Record& record) {
  return write(kReplaceIfPresent, record);
}

bool RecordStore::erase(const std::string& path) {
  Statement stmt(db_, "DELETE FROM records WHERE path = ?1");
  stmt.bind_text(1, path);
  stmt.step();
  return sqlite3_changes(db_) > 0;
}

std::size_t RecordStore::size() {
  Statement stmt(db_, "SELECT COUNT(*) FROM records");
  if(!stmt.step()) return 0;
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

RecordStore::Cursor RecordStore::scan() {
  Statement stmt(db_, std::string(kSelectColumns) + " ORDER BY path");
  return Cursor(db_, stmt.release());
}

void RecordStore::for_each(const std::function<void(const Record&)>& fn) {
  auto cursor = scan();
  Record record;
  while(cursor.next(record)) {
    fn(record);
  }
}
