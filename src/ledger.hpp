#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "capture_pool.hpp"
#include "log.hpp"
#include "outcome.hpp"
#include "record_store.hpp"

// Implements add / verify / verify-all / accept / remove over a RecordStore.
//
// Every batch call processes each path on its own: an unreadable file or a
// policy violation becomes that path's Outcome and the batch continues. A
// StoreError propagates and ends the batch; outcomes produced before it have
// already reached `on_outcome`.
//
// The ledger never caches Records. It borrows the store for its lifetime.
class Ledger {
public:
  struct Options {
    // Downgrades AlreadyTracked/NotTracked policy errors to outcomes.
    bool tolerant = false;
    std::size_t jobs = 0;
    std::size_t batch_size = 64;
    std::shared_ptr<Logger> logger;
    OutcomeListener on_outcome;
  };

  Ledger(RecordStore& store, Options options);

  std::vector<Outcome> add(const std::vector<std::string>& paths);
  std::vector<Outcome> verify(const std::vector<std::string>& paths);
  std::vector<Outcome> verify_all();
  std::vector<Outcome> accept(const std::vector<std::string>& paths);
  std::vector<Outcome> remove(const std::vector<std::string>& paths);

  // All Records, ordered by path.
  std::vector<Record> list();

private:
  struct Target {
    std::string input;
    std::string key;
    std::string error; // canonicalization failure
  };

  std::vector<Target> resolve(const std::vector<std::string>& paths) const;
  std::vector<Capture> capture(const std::vector<Target>& targets) const;

  Outcome add_one(const Target& target, const Capture& capture);
  Outcome verify_one(const std::string& key, const std::optional<Record>& stored, const Capture& capture);
  Outcome accept_one(const Target& target, const Capture& capture);
  Outcome remove_one(const Target& target);

  void emit(std::vector<Outcome>& out, Outcome outcome);

  RecordStore& store_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  CapturePool pool_;
};
