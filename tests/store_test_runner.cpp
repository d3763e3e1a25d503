#include "errors.hpp"
#include "record_store.hpp"
#include "store_location.hpp"
#include "test_runner_utils.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

using fimbl::test::TempWorkspace;
using fimbl::test::TestCase;
using fimbl::test::TestContext;
using fimbl::test::fail;
using fimbl::test::truncate_stored_digest;
using fimbl::test::write_file;

namespace {

Record make_record(const std::string& path, const std::string& content, std::uint64_t size = 0) {
  Record r;
  r.path = path;
  r.digest = digest_bytes(content);
  r.attributes.size = size ? size : content.size();
  r.attributes.modified_ns = 1700000000123456789LL;
  r.attributes.permissions = 0644;
  r.recorded_at = 1700000000;
  return r;
}

bool same_record(const Record& a, const Record& b) {
  return a.path == b.path && a.digest == b.digest &&
         a.attributes == b.attributes && a.recorded_at == b.recorded_at;
}

bool test_put_get_erase(TestContext& ctx) {
  TempWorkspace ws("store_basic");
  RecordStore store(ws.db());
  auto r = make_record("/data/a", "alpha");
  if(store.get(r.path)) return fail(ctx, "empty store returned a record");

  store.put(r);
  auto got = store.get(r.path);
  if(!got || !same_record(*got, r)) return fail(ctx, "get did not return what put stored");

  auto replaced = make_record("/data/a", "alpha v2");
  store.put(replaced);
  got = store.get(r.path);
  if(!got || got->digest != replaced.digest) return fail(ctx, "put did not overwrite");
  if(store.size() != 1) return fail(ctx, "overwrite changed the record count");

  if(!store.erase(r.path)) return fail(ctx, "erase of an existing key returned false");
  if(store.erase(r.path)) return fail(ctx, "second erase returned true");
  return !store.get(r.path) && store.size() == 0;
}

bool test_conditional_writes(TestContext& ctx) {
  TempWorkspace ws("store_conditional");
  RecordStore store(ws.db());
  auto first = make_record("/data/b", "first");
  auto second = make_record("/data/b", "second");

  if(store.replace_if_present(first)) return fail(ctx, "replace_if_present wrote a missing key");
  if(store.size() != 0) return fail(ctx, "replace_if_present created a record");
  if(!store.insert_if_absent(first)) return fail(ctx, "insert_if_absent refused a new key");
  if(store.insert_if_absent(second)) return fail(ctx, "insert_if_absent overwrote an existing key");
  if(store.get("/data/b")->digest != first.digest) return fail(ctx, "insert_if_absent changed the record");
  if(!store.replace_if_present(second)) return fail(ctx, "replace_if_present refused an existing key");
  return store.get("/data/b")->digest == second.digest;
}

bool test_scan_is_ordered(TestContext& ctx) {
  TempWorkspace ws("store_scan");
  RecordStore store(ws.db());
  const std::vector<std::string> keys = {"/z/last", "/a/first", "/m/middle", "/a/first2"};
  for(const auto& k : keys) store.put(make_record(k, k));

  std::vector<std::string> seen;
  auto cursor = store.scan();
  Record r;
  while(cursor.next(r)) seen.push_back(r.path);
  if(cursor.next(r)) return fail(ctx, "exhausted cursor produced another record");

  const std::vector<std::string> expected = {"/a/first", "/a/first2", "/m/middle", "/z/last"};
  if(seen != expected) return fail(ctx, "scan is not ordered by path");

  std::vector<std::string> walked;
  store.for_each([&walked](const Record& rec){ walked.push_back(rec.path); });
  return walked == expected;
}

bool test_corrupt_digest_is_store_error(TestContext& ctx) {
  TempWorkspace ws("store_corrupt");
  RecordStore store(ws.db());
  store.put(make_record("/data/bad", "bad"));
  if(!truncate_stored_digest(ws.db(), "/data/bad")) return fail(ctx, "could not rewrite the stored digest");

  try {
    store.get("/data/bad");
    return fail(ctx, "get decoded a 16-byte digest");
  } catch(const StoreError&) {
  }
  auto cursor = store.scan();
  Record r;
  try {
    cursor.next(r);
    return fail(ctx, "scan decoded a 16-byte digest");
  } catch(const StoreError&) {
  }
  return true;
}

bool test_cursor_moves(TestContext& ctx) {
  TempWorkspace ws("store_cursor_move");
  RecordStore store(ws.db());
  store.put(make_record("/one", "1"));
  store.put(make_record("/two", "2"));

  auto cursor = store.scan();
  Record r;
  if(!cursor.next(r) || r.path != "/one") return fail(ctx, "first record");
  auto moved = std::move(cursor);
  if(!moved.next(r) || r.path != "/two") return fail(ctx, "moved cursor lost its position");
  return !moved.next(r);
}

bool test_persists_across_reopen(TestContext& ctx) {
  TempWorkspace ws("store_reopen");
  auto r = make_record("/keep/me", "durable", 123456789012ULL);
  {
    RecordStore store(ws.db());
    store.put(r);
  }
  RecordStore store(ws.db());
  auto got = store.get(r.path);
  if(!got) return fail(ctx, "record lost after reopen");
  return same_record(*got, r);
}

bool test_creates_parent_directories(TestContext& ctx) {
  TempWorkspace ws("store_parents");
  auto location = ws.path("nested/deeper/ledger.db");
  RecordStore store(location);
  store.put(make_record("/x", "x"));
  if(!std::filesystem::exists(location)) return fail(ctx, "database file was not created");
  return store.location() == location;
}

bool test_unusable_location_throws(TestContext& ctx) {
  TempWorkspace ws("store_bad");
  write_file(ws.path("blocker"), "a file where a directory should be");
  try {
    RecordStore store(ws.path("blocker/ledger.db"));
  } catch(const StoreError& e) {
    ctx.logger->debug("expected: {}", e.what());
    return true;
  }
  return fail(ctx, "opening under a regular file should fail");
}

bool test_two_handles_share_state(TestContext& ctx) {
  TempWorkspace ws("store_shared");
  RecordStore::Options options;
  options.busy_timeout = std::chrono::milliseconds(2000);
  RecordStore first(ws.db(), options);
  RecordStore second(ws.db(), options);

  if(!first.insert_if_absent(make_record("/shared", "a"))) return fail(ctx, "first insert");
  if(second.insert_if_absent(make_record("/shared", "b"))) return fail(ctx, "second handle did not see the record");
  if(!second.erase("/shared")) return fail(ctx, "second handle could not erase");
  return !first.get("/shared");
}

bool test_store_location(TestContext& ctx) {
  TempWorkspace ws("store_location");
  auto explicit_location = resolve_store_location(ws.path("x/../ledger.db").string());
  if(explicit_location != ws.path("ledger.db")) {
    return fail(ctx, "override not normalized: " + explicit_location.string());
  }
  auto relative = resolve_store_location("rel.db");
  if(!relative.is_absolute()) return fail(ctx, "relative override not made absolute");

  const char* previous = std::getenv("XDG_CONFIG_HOME");
  const bool had_previous = previous != nullptr;
  std::string saved = had_previous ? previous : "";
  ::setenv("XDG_CONFIG_HOME", ws.root().c_str(), 1);
  auto fallback = resolve_store_location("");
  if(had_previous) {
    ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
  } else {
    ::unsetenv("XDG_CONFIG_HOME");
  }
  return fallback == ws.root() / "fimbl" / "ledger.db";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"put_get_erase", test_put_get_erase},
    {"conditional_writes", test_conditional_writes},
    {"scan_is_ordered", test_scan_is_ordered},
    {"cursor_moves", test_cursor_moves},
    {"corrupt_digest_is_store_error", test_corrupt_digest_is_store_error},
    {"persists_across_reopen", test_persists_across_reopen},
    {"creates_parent_directories", test_creates_parent_directories},
    {"unusable_location_throws", test_unusable_location_throws},
    {"two_handles_share_state", test_two_handles_share_state},
    {"store_location", test_store_location}
  };
  return fimbl::test::run_tests("store", std::move(tests), argc, argv);
}
