#pragma once
#include <filesystem>
#include <string>

// Where the ledger lives: `override_path` made absolute when non-empty,
// otherwise config_home()/ledger.db. Throws ConfigError without a home.
std::filesystem::path resolve_store_location(const std::string& override_path);
