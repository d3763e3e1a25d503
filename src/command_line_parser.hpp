#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "log.hpp"
#include "settings_manager.hpp"

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct CommandLine {
  std::string command;
  std::vector<std::string> files;
};

// fimbl [options] <command> [files...]
//
// Options are the settings table: --key [value] or -alias [value]. Boolean
// options take an optional true/false literal. "--" ends option parsing.
class CommandLineParser {
public:
  struct CommandSpec {
    const char* name;
    bool takes_files;
    const char* description;
  };

  explicit CommandLineParser(std::string process_name = "fimbl");

  // Throws UsageError. The command is left empty when help was requested.
  CommandLine parse(int argc, char* argv[], SettingsManager& settings) const;
  CommandLine parse(const std::vector<std::string>& args, SettingsManager& settings) const;

  void usage(Logger& out, const SettingsManager& settings) const;

  static const std::vector<CommandSpec>& commands();

private:
  static const CommandSpec* find_command(const std::string& name);
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
};
