#include "report.hpp"

#include <algorithm>

#include "utils.hpp"

bool should_report(const Outcome& outcome, bool verbose) {
  if(verbose) return true;
  switch(outcome.kind) {
    case OutcomeKind::added:
    case OutcomeKind::unchanged:
    case OutcomeKind::accepted:
    case OutcomeKind::removed:
      return false;
    default:
      return true;
  }
}

std::string describe_outcome(const Outcome& outcome) {
  switch(outcome.kind) {
    case OutcomeKind::added: return "file added: " + outcome.path;
    case OutcomeKind::already_tracked: return "file already tracked: " + outcome.path;
    case OutcomeKind::unchanged: return "file unchanged: " + outcome.path;
    case OutcomeKind::changed: return "file content changed: " + outcome.path;
    case OutcomeKind::accepted: return "file accepted: " + outcome.path;
    case OutcomeKind::removed: return "file removed: " + outcome.path;
    case OutcomeKind::not_tracked: return "file is untracked: " + outcome.path;
    case OutcomeKind::io_failure:
      return "file unreadable: " + outcome.path +
             (outcome.detail.empty() ? std::string() : " (" + outcome.detail + ")");
    case OutcomeKind::already_tracked_error: return "error: file already tracked: " + outcome.path;
    case OutcomeKind::not_tracked_error: return "error: file is untracked: " + outcome.path;
  }
  return outcome.path;
}

void report_outcome(Logger& out, const Outcome& outcome) {
  out.report("- {}", describe_outcome(outcome));
  if(outcome.kind != OutcomeKind::changed || !outcome.expected || !outcome.observed) return;

  const auto& before = *outcome.expected;
  const auto& after = *outcome.observed;
  out.report("    digest:      {} -> {}", digest_to_hex(before.digest), digest_to_hex(after.digest));
  if(before.attributes.size != after.attributes.size) {
    out.report("    size:        {} -> {}", before.attributes.size, after.attributes.size);
  }
  if(before.attributes.modified_ns != after.attributes.modified_ns) {
    out.report("    modified:    {} -> {}",
               format_timestamp_ns(before.attributes.modified_ns),
               format_timestamp_ns(after.attributes.modified_ns));
  }
  if(before.attributes.permissions != after.attributes.permissions) {
    out.report("    permissions: {} -> {}",
               format_permissions(before.attributes.permissions),
               format_permissions(after.attributes.permissions));
  }
}

void report_records(Logger& out, const std::vector<Record>& records, bool verbose) {
  for(const auto& r : records) {
    if(!verbose) {
      out.report("{}", r.path);
      continue;
    }
    out.report("{}  {}  {} bytes  {}  {}",
               digest_to_hex(r.digest),
               format_permissions(r.attributes.permissions),
               r.attributes.size,
               format_timestamp_ns(r.attributes.modified_ns),
               r.path);
  }
}

nlohmann::json record_to_json(const Record& record) {
  return nlohmann::json{
    {"path", record.path},
    {"digest", digest_to_hex(record.digest)},
    {"size", record.attributes.size},
    {"modified_ns", record.attributes.modified_ns},
    {"permissions", format_permissions(record.attributes.permissions)},
    {"recorded_at", record.recorded_at}
  };
}

nlohmann::json outcome_to_json(const Outcome& outcome) {
  nlohmann::json j{
    {"path", outcome.path},
    {"outcome", outcome_kind_name(outcome.kind)},
    {"failure", is_failure(outcome)}
  };
  if(outcome.expected) j["expected"] = record_to_json(*outcome.expected);
  if(outcome.observed) j["observed"] = record_to_json(*outcome.observed);
  if(!outcome.detail.empty()) j["detail"] = outcome.detail;
  return j;
}

std::string json_text(const nlohmann::json& doc) {
  return doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

int exit_status(const std::vector<Outcome>& outcomes) {
  const bool failed = std::any_of(outcomes.begin(), outcomes.end(),
                                  [](const Outcome& o){ return is_failure(o); });
  return failed ? kExitFindings : kExitOk;
}
