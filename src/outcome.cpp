#include "outcome.hpp"

const char* outcome_kind_name(OutcomeKind kind) {
  switch(kind) {
    case OutcomeKind::added: return "added";
    case OutcomeKind::already_tracked: return "already_tracked";
    case OutcomeKind::unchanged: return "unchanged";
    case OutcomeKind::changed: return "changed";
    case OutcomeKind::accepted: return "accepted";
    case OutcomeKind::removed: return "removed";
    case OutcomeKind::not_tracked: return "not_tracked";
    case OutcomeKind::io_failure: return "io_failure";
    case OutcomeKind::already_tracked_error: return "already_tracked_error";
    case OutcomeKind::not_tracked_error: return "not_tracked_error";
  }
  return "unknown";
}

bool is_failure(OutcomeKind kind) {
  switch(kind) {
    case OutcomeKind::changed:
    case OutcomeKind::io_failure:
    case OutcomeKind::already_tracked_error:
    case OutcomeKind::not_tracked_error:
      return true;
    default:
      return false;
  }
}
