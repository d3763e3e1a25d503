#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "outcome.hpp"

constexpr int kExitOk = 0;
constexpr int kExitFindings = 1;
constexpr int kExitFatal = 2;

// Findings and policy notices always; routine successes only when verbose.
bool should_report(const Outcome& outcome, bool verbose);

std::string describe_outcome(const Outcome& outcome);

// One "- ..." line, followed for changes by expected -> observed details.
void report_outcome(Logger& out, const Outcome& outcome);
void report_records(Logger& out, const std::vector<Record>& records, bool verbose);

nlohmann::json record_to_json(const Record& record);
nlohmann::json outcome_to_json(const Outcome& outcome);

// Pretty-printed document. Paths are raw bytes, so invalid UTF-8 is replaced
// with U+FFFD instead of failing the whole report.
std::string json_text(const nlohmann::json& doc);

// kExitOk iff no outcome is a failure.
int exit_status(const std::vector<Outcome>& outcomes);
