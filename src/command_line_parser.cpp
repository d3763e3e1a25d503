#include "command_line_parser.hpp"

#include <cctype>
#include <sstream>

CommandLineParser::CommandLineParser(std::string process_name)
  : process_name_(std::move(process_name)) {}

const std::vector<CommandLineParser::CommandSpec>& CommandLineParser::commands() {
  static const std::vector<CommandSpec> specs = {
    {"add",        true,  "Fingerprint files and start tracking them"},
    {"remove",     true,  "Stop tracking files"},
    {"list",       false, "List tracked files"},
    {"verify",     true,  "Check files against their recorded fingerprints"},
    {"verify-all", false, "Check every tracked file"},
    {"accept",     true,  "Record the current state of files as their new baseline"}
  };
  return specs;
}

const CommandLineParser::CommandSpec* CommandLineParser::find_command(const std::string& name) {
  for(const auto& spec : commands()) {
    if(name == spec.name) return &spec;
  }
  return nullptr;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?');
}

CommandLine CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  return parse(args, settings);
}

CommandLine CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  CommandLine result;
  std::vector<std::string> positionals;
  bool options_done = false;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(options_done || !is_option_token(token)) {
      positionals.push_back(token);
      continue;
    }
    if(token == "--") {
      options_done = true;
      continue;
    }

    const bool long_form = token.rfind("--", 0) == 0;
    std::string key_token = token.substr(long_form ? 2 : 1);
    std::string inline_value;
    bool has_inline_value = false;
    if(auto eq = key_token.find('='); eq != std::string::npos) {
      inline_value = key_token.substr(eq + 1);
      key_token = key_token.substr(0, eq);
      has_inline_value = true;
    }

    auto resolved = settings.resolve_key(key_token);
    if(!resolved) {
      throw UsageError("Unknown option " + token);
    }

    std::string value;
    if(has_inline_value) {
      value = inline_value;
    } else if(settings.is_bool_setting(*resolved)) {
      if(i + 1 < args.size() && SettingsManager::is_bool_literal(args[i + 1])) {
        value = args[++i];
      } else {
        value = "true";
      }
    } else {
      if(i + 1 >= args.size()) {
        throw UsageError("Missing value for option '" + key_token + "'");
      }
      value = args[++i];
    }

    std::string error;
    if(!settings.set_from_string(*resolved, value, error)) {
      throw UsageError("Invalid value for option '" + key_token + "': " + error);
    }
  }

  if(settings.help_requested()) return result;

  if(positionals.empty()) {
    throw UsageError("Missing command");
  }
  const auto* command = find_command(positionals.front());
  if(!command) {
    throw UsageError("Unknown command '" + positionals.front() + "'");
  }
  result.command = command->name;
  result.files.assign(positionals.begin() + 1, positionals.end());

  if(command->takes_files && result.files.empty()) {
    throw UsageError(std::string("'") + command->name + "' needs at least one file");
  }
  if(!command->takes_files && !result.files.empty()) {
    throw UsageError(std::string("'") + command->name + "' takes no files");
  }
  return result;
}

void CommandLineParser::usage(Logger& out, const SettingsManager& settings) const {
  out.report("{} - file integrity ledger", process_name_);
  out.report("Usage:");
  out.report("  {} [options] <command> [files...]", process_name_);
  out.report("");
  out.report("Commands:");
  for(const auto& command : commands()) {
    out.report("  {:<12} {}", command.name, command.description);
  }
  out.report("");
  out.report("Options:");
  for(const auto& spec : settings.specs()) {
    std::string hint;
    if(spec.type == SettingsManager::Type::boolean) {
      hint = "[true|false]";
    } else if(!spec.choices.empty()) {
      for(const auto& choice : spec.choices) hint += (hint.empty() ? "" : "|") + choice;
    } else {
      hint = "<" + SettingsManager::type_name(spec.type) + ">";
    }
    std::ostringstream aliases;
    for(std::size_t i = 0; i < spec.aliases.size(); ++i) {
      aliases << (i == 0 ? " (alias: " : ", ") << "-" << spec.aliases[i];
    }
    if(!spec.aliases.empty()) aliases << ")";
    std::string default_str = spec.default_value.is_string()
      ? spec.default_value.get<std::string>()
      : spec.default_value.dump();
    out.report("  --{:<16} {:<12} {}{} (default: {})",
               spec.key,
               hint,
               spec.description,
               aliases.str(),
               default_str.empty() ? "\"\"" : default_str);
  }
  out.report("");
}
