#include <cpptrace/cpptrace.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "ledger.hpp"
#include "log.hpp"
#include "record_store.hpp"
#include "report.hpp"
#include "settings_manager.hpp"
#include "store_location.hpp"

namespace {

std::vector<Outcome> run_command(Ledger& ledger, const CommandLine& cmd) {
  if(cmd.command == "add") return ledger.add(cmd.files);
  if(cmd.command == "remove") return ledger.remove(cmd.files);
  if(cmd.command == "verify") return ledger.verify(cmd.files);
  if(cmd.command == "verify-all") return ledger.verify_all();
  if(cmd.command == "accept") return ledger.accept(cmd.files);
  throw UsageError("Unknown command '" + cmd.command + "'");
}

int run_list(Ledger& ledger, const RecordStore& store, Logger& out, bool json, bool verbose) {
  auto records = ledger.list();
  if(json) {
    nlohmann::json doc{{"database", store.location().string()}, {"records", nlohmann::json::array()}};
    for(const auto& r : records) doc["records"].push_back(record_to_json(r));
    out.report("{}", json_text(doc));
    return kExitOk;
  }
  if(verbose) {
    out.report("Ledger at {}", store.location().string());
    out.report("Files tracked:");
    out.report("");
  }
  report_records(out, records, verbose);
  return kExitOk;
}

nlohmann::json outcomes_document(const CommandLine& cmd,
                                 const RecordStore& store,
                                 const std::vector<Outcome>& outcomes) {
  nlohmann::json doc{
    {"command", cmd.command},
    {"database", store.location().string()},
    {"ok", exit_status(outcomes) == kExitOk},
    {"outcomes", nlohmann::json::array()}
  };
  for(const auto& o : outcomes) doc["outcomes"].push_back(outcome_to_json(o));
  return doc;
}

} // namespace

int main(int argc, char** argv) {
  init_logging(false);
  auto logger = std::make_shared<Logger>();
  auto ledger_logger = std::make_shared<Logger>("ledger");

  std::string process_name = (argc > 0 && argv && argv[0])
    ? std::filesystem::path(argv[0]).filename().string()
    : "fimbl";
  CommandLineParser parser(process_name);
  SettingsManager settings;

  try {
    try {
      settings.load();
    } catch(const ConfigError& e) {
      logger->debug("No settings file: {}", e.what());
    }

    CommandLine cmd;
    try {
      cmd = parser.parse(argc, argv, settings);
    } catch(const UsageError& e) {
      logger->report_err("{}", e.what());
      parser.usage(*logger, settings);
      return kExitFatal;
    }
    if(settings.help_requested()) {
      parser.usage(*logger, settings);
      return kExitOk;
    }

    const bool verbose = settings.get<bool>("verbose");
    const bool json = settings.get<std::string>("format") == "json";
    init_logging(verbose);

    if(settings.save_requested() && !settings.save()) {
      logger->error("Unable to persist settings to {}", settings.settings_path().string());
    }

    RecordStore::Options store_options;
    store_options.busy_timeout = std::chrono::milliseconds(settings.get<int>("busy_timeout_ms"));
    RecordStore store(resolve_store_location(settings.get<std::string>("database")), store_options);
    logger->debug("Opened ledger {}", store.location().string());

    // Outcomes seen so far; a StoreError ends the batch but these still count.
    std::vector<Outcome> seen;
    Ledger::Options options;
    options.tolerant = settings.get<bool>("tolerant");
    options.jobs = static_cast<std::size_t>(settings.get<int>("jobs"));
    options.batch_size = static_cast<std::size_t>(settings.get<int>("batch_size"));
    options.logger = ledger_logger;
    options.on_outcome = [&](const Outcome& o){
      seen.push_back(o);
      if(!json && should_report(o, verbose)) report_outcome(*logger, o);
    };
    Ledger ledger(store, std::move(options));

    if(cmd.command == "list") {
      return run_list(ledger, store, *logger, json, verbose);
    }

    try {
      run_command(ledger, cmd);
    } catch(const StoreError& e) {
      logger->error("{}", e.what());
      if(json) {
        auto doc = outcomes_document(cmd, store, seen);
        doc["ok"] = false;
        doc["error"] = e.what();
        logger->report("{}", json_text(doc));
      } else {
        logger->report_err("fatal: {} ({} of the requested paths were processed)", e.what(), seen.size());
      }
      return kExitFatal;
    }

    if(json) {
      logger->report("{}", json_text(outcomes_document(cmd, store, seen)));
    }
    return exit_status(seen);
  } catch(const StoreError& e) {
    logger->error("{}", e.what());
    logger->report_err("fatal: {}", e.what());
    return kExitFatal;
  } catch(const ConfigError& e) {
    logger->report_err("{}", e.what());
    return kExitFatal;
  } catch(const std::exception& e) {
    logger->error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return kExitFatal;
  }
}
