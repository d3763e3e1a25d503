#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Table of every setting the tool understands. Each entry: key, aliases,
// type (bool|int|string), default, description, persistent, and optionally
// "min" (int) or "choices" (string).
const nlohmann::json& settings_specification();

// Typed settings with defaults from the settings table, overlaid by the
// settings file and then by the command line.
class SettingsManager {
public:
  enum class Type { boolean, integer, string };

  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    Type type = Type::string;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
    std::optional<int> min;
    std::vector<std::string> choices;
  };

  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return it->get<T>();
  }

  bool has(const std::string& key) const { return values_.contains(key); }

  // Both return false and fill `error` when the key is unknown or the value
  // does not satisfy the setting's type and constraints.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // A missing file is not an error; an unreadable or malformed one is.
  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  const std::vector<SettingSpec>& specs() const { return specs_; }
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  // Defaults to config_home()/settings.json.
  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { path_override_ = path; }

  nlohmann::json to_json(bool persistent_only = true) const;

  static bool is_bool_literal(const std::string& value);
  static std::string type_name(Type type);

private:
  const SettingSpec* find_spec(const std::string& token) const;
  bool store(const SettingSpec& spec, nlohmann::json value, std::string& error);

  std::vector<SettingSpec> specs_;
  nlohmann::json values_;
  std::filesystem::path path_override_;
};
