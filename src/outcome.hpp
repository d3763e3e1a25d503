#pragma once

#include <functional>
#include <optional>
#include <string>

#include "record.hpp"

enum class OutcomeKind {
  added,
  already_tracked,
  unchanged,
  changed,
  accepted,
  removed,
  not_tracked,
  io_failure,
  already_tracked_error,
  not_tracked_error
};

// Per-path result of one ledger operation. Never persisted.
//
// `expected` is the stored baseline when one was read, `observed` the fresh
// capture when one was taken. `detail` carries the error text of failures.
struct Outcome {
  OutcomeKind kind = OutcomeKind::io_failure;
  std::string path;
  std::optional<Record> expected;
  std::optional<Record> observed;
  std::string detail;
};

using OutcomeListener = std::function<void(const Outcome&)>;

const char* outcome_kind_name(OutcomeKind kind);

// Changed, IoFailure and the strict-mode policy errors.
bool is_failure(OutcomeKind kind);
inline bool is_failure(const Outcome& outcome) { return is_failure(outcome.kind); }
