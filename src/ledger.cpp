#include "ledger.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <utility>

#include "errors.hpp"
#include "utils.hpp"

namespace {

Outcome make_outcome(OutcomeKind kind, std::string path) {
  Outcome o;
  o.kind = kind;
  o.path = std::move(path);
  return o;
}

// Turns the per-path exceptions into that path's outcome. StoreError and
// anything unexpected pass through and end the batch.
template<typename Fn>
Outcome guarded(const std::string& path, Fn&& fn) {
  try {
    return fn();
  } catch(const IoError& e) {
    auto o = make_outcome(OutcomeKind::io_failure, path);
    o.detail = e.reason();
    return o;
  } catch(const AlreadyTrackedError& e) {
    auto o = make_outcome(OutcomeKind::already_tracked_error, path);
    o.detail = e.what();
    return o;
  } catch(const NotTrackedError& e) {
    auto o = make_outcome(OutcomeKind::not_tracked_error, path);
    o.detail = e.what();
    return o;
  }
}

template<typename T, typename Fn>
void for_each_chunk(const std::vector<T>& items, std::size_t chunk, Fn&& fn) {
  if(chunk == 0) chunk = 1;
  for(std::size_t begin = 0; begin < items.size(); begin += chunk) {
    const std::size_t end = std::min(items.size(), begin + chunk);
    std::vector<T> slice(items.begin() + static_cast<std::ptrdiff_t>(begin),
                         items.begin() + static_cast<std::ptrdiff_t>(end));
    fn(slice);
  }
}

} // namespace

Ledger::Ledger(RecordStore& store, Options options)
  : store_(store),
    options_(std::move(options)),
    logger_(options_.logger ? options_.logger : std::make_shared<Logger>("ledger")),
    pool_(options_.jobs) {
  if(options_.batch_size == 0) options_.batch_size = 1;
  logger_->debug("Ledger on {} ({} mode, {} capture workers)",
                 store_.location().string(),
                 options_.tolerant ? "tolerant" : "strict",
                 pool_.workers());
}

std::vector<Ledger::Target> Ledger::resolve(const std::vector<std::string>& paths) const {
  std::vector<Target> targets;
  targets.reserve(paths.size());
  for(const auto& input : paths) {
    Target t;
    t.input = input;
    try {
      t.key = canonical_path(input).string();
    } catch(const IoError& e) {
      t.error = e.reason();
    }
    targets.push_back(std::move(t));
  }
  return targets;
}

std::vector<Capture> Ledger::capture(const std::vector<Target>& targets) const {
  std::vector<std::string> keys;
  for(const auto& t : targets) {
    if(t.error.empty()) keys.push_back(t.key);
  }
  auto captured = pool_.capture(keys);

  std::vector<Capture> out;
  out.reserve(targets.size());
  std::size_t next = 0;
  for(const auto& t : targets) {
    if(t.error.empty()) {
      out.push_back(std::move(captured[next++]));
    } else {
      Capture failed;
      failed.path = t.input;
      failed.error = t.error;
      out.push_back(std::move(failed));
    }
  }
  return out;
}

void Ledger::emit(std::vector<Outcome>& out, Outcome outcome) {
  if(outcome.kind == OutcomeKind::io_failure) {
    logger_->warn("{}: {}", outcome.path, outcome.detail);
  } else {
    logger_->debug("{}: {}", outcome.path, outcome_kind_name(outcome.kind));
  }
  if(options_.on_outcome) options_.on_outcome(outcome);
  out.push_back(std::move(outcome));
}

// ---- add -------------------------------------------------------------------

std::vector<Outcome> Ledger::add(const std::vector<std::string>& paths) {
  std::vector<Outcome> out;
  for_each_chunk(paths, options_.batch_size, [&](const std::vector<std::string>& chunk){
    auto targets = resolve(chunk);
    auto captures = capture(targets);
    for(std::size_t i = 0; i < targets.size(); ++i) {
      const auto& target = targets[i];
      const auto& path = target.error.empty() ? target.key : target.input;
      emit(out, guarded(path, [&]{ return add_one(target, captures[i]); }));
    }
  });
  return out;
}

Outcome Ledger::add_one(const Target& target, const Capture& capture) {
  if(!target.error.empty()) throw IoError(target.input, target.error);
  if(!capture.record) throw IoError(target.key, capture.error);
  const Record& observed = *capture.record;

  auto added = make_outcome(OutcomeKind::added, target.key);
  added.observed = observed;
  if(store_.insert_if_absent(observed)) return added;

  if(!options_.tolerant) throw AlreadyTrackedError(target.key);

  // The baseline is left as it is; a differing digest is still reported.
  auto stored = store_.get(target.key);
  if(!stored) {
    // Removed by a concurrent invocation between the two statements.
    if(store_.insert_if_absent(observed)) return added;
    stored = store_.get(target.key);
    if(!stored) throw StoreError("record store: " + target.key + " vanished during add");
  }
  auto o = make_outcome(stored->digest == observed.digest ? OutcomeKind::already_tracked
                                                          : OutcomeKind::changed,
                        target.key);
  o.expected = std::move(stored);
  o.observed = observed;
  return o;
}

// ---- verify ----------------------------------------------------------------

std::vector<Outcome> Ledger::verify(const std::vector<std::string>& paths) {
  std::vector<Outcome> out;
  for_each_chunk(paths, options_.batch_size, [&](const std::vector<std::string>& chunk){
    auto targets = resolve(chunk);

    // Only tracked files are worth hashing.
    std::vector<std::optional<Record>> stored(targets.size());
    std::vector<Target> to_capture;
    for(std::size_t i = 0; i < targets.size(); ++i) {
      if(!targets[i].error.empty()) continue;
      stored[i] = store_.get(targets[i].key);
      if(stored[i]) to_capture.push_back(targets[i]);
    }
    auto captures = capture(to_capture);

    std::size_t next = 0;
    for(std::size_t i = 0; i < targets.size(); ++i) {
      const auto& target = targets[i];
      if(!target.error.empty()) {
        auto o = make_outcome(OutcomeKind::io_failure, target.input);
        o.detail = target.error;
        emit(out, std::move(o));
        continue;
      }
      if(!stored[i]) {
        // Tolerant mode does not apply: an unregistered file is always a finding.
        auto o = make_outcome(OutcomeKind::not_tracked_error, target.key);
        o.detail = NotTrackedError(target.key).what();
        emit(out, std::move(o));
        continue;
      }
      emit(out, verify_one(target.key, stored[i], captures[next++]));
    }
  });
  return out;
}

std::vector<Outcome> Ledger::verify_all() {
  std::vector<Outcome> out;
  auto cursor = store_.scan();
  std::vector<Record> batch;
  Record record;
  bool exhausted = false;
  std::exception_ptr store_failure;
  while(!exhausted) {
    batch.clear();
    try {
      while(batch.size() < options_.batch_size) {
        if(!cursor.next(record)) {
          exhausted = true;
          break;
        }
        batch.push_back(record);
      }
    } catch(const StoreError&) {
      // Records read before the failing row are still verified.
      store_failure = std::current_exception();
      exhausted = true;
    }
    if(batch.empty()) break;

    std::vector<std::string> keys;
    keys.reserve(batch.size());
    for(const auto& r : batch) keys.push_back(r.path);
    auto captures = pool_.capture(keys);
    for(std::size_t i = 0; i < batch.size(); ++i) {
      emit(out, verify_one(batch[i].path, batch[i], captures[i]));
    }
  }
  if(store_failure) std::rethrow_exception(store_failure);
  logger_->debug("verify-all checked {} tracked files", out.size());
  return out;
}

Outcome Ledger::verify_one(const std::string& key,
                           const std::optional<Record>& stored,
                           const Capture& capture) {
  if(!capture.record) {
    auto o = make_outcome(OutcomeKind::io_failure, key);
    o.expected = stored;
    o.detail = capture.error;
    return o;
  }
  const bool same = stored->digest == capture.record->digest;
  auto o = make_outcome(same ? OutcomeKind::unchanged : OutcomeKind::changed, key);
  o.expected = stored;
  o.observed = capture.record;
  if(same && stored->attributes != capture.record->attributes) {
    logger_->debug("{}: content unchanged, metadata differs", key);
  }
  return o;
}

// ---- accept ----------------------------------------------------------------

std::vector<Outcome> Ledger::accept(const std::vector<std::string>& paths) {
  std::vector<Outcome> out;
  for_each_chunk(paths, options_.batch_size, [&](const std::vector<std::string>& chunk){
    auto targets = resolve(chunk);
    auto captures = capture(targets);
    for(std::size_t i = 0; i < targets.size(); ++i) {
      const auto& target = targets[i];
      const auto& path = target.error.empty() ? target.key : target.input;
      emit(out, guarded(path, [&]{ return accept_one(target, captures[i]); }));
    }
  });
  return out;
}

Outcome Ledger::accept_one(const Target& target, const Capture& capture) {
  if(!target.error.empty()) throw IoError(target.input, target.error);
  if(!capture.record) throw IoError(target.key, capture.error);
  const Record& observed = *capture.record;

  auto previous = store_.get(target.key);
  if(options_.tolerant) {
    store_.put(observed);
  } else if(!store_.replace_if_present(observed)) {
    throw NotTrackedError(target.key);
  }
  auto o = make_outcome(previous ? OutcomeKind::accepted : OutcomeKind::added, target.key);
  o.expected = std::move(previous);
  o.observed = observed;
  return o;
}

// ---- remove ----------------------------------------------------------------

std::vector<Outcome> Ledger::remove(const std::vector<std::string>& paths) {
  std::vector<Outcome> out;
  for(const auto& target : resolve(paths)) {
    const auto& path = target.error.empty() ? target.key : target.input;
    emit(out, guarded(path, [&]{ return remove_one(target); }));
  }
  return out;
}

Outcome Ledger::remove_one(const Target& target) {
  if(!target.error.empty()) throw IoError(target.input, target.error);

  auto previous = store_.get(target.key);
  if(store_.erase(target.key)) {
    auto o = make_outcome(OutcomeKind::removed, target.key);
    o.expected = std::move(previous);
    return o;
  }
  if(!options_.tolerant) throw NotTrackedError(target.key);
  return make_outcome(OutcomeKind::not_tracked, target.key);
}

// ---- list ------------------------------------------------------------------

std::vector<Record> Ledger::list() {
  std::vector<Record> records;
  store_.for_each([&records](const Record& r){ records.push_back(r); });
  return records;
}
