#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>

#include "log.hpp"
#include "utils.hpp"

const nlohmann::json& settings_specification() {
  static const nlohmann::json spec = nlohmann::json::array({
    {{"key","database"},        {"aliases", {"d","db"}},  {"type","string"}, {"default",""},     {"description","Ledger database file (default: ~/.config/fimbl/ledger.db)"}, {"persistent", true}},
    {{"key","tolerant"},        {"aliases", {"t"}},       {"type","bool"},   {"default",false},  {"description","Tolerate already-tracked files on add and untracked files on remove/accept"}, {"persistent", true}},
    {{"key","verbose"},         {"aliases", {"v"}},       {"type","bool"},   {"default",false},  {"description","Debug logging; report every outcome"}, {"persistent", true}},
    {{"key","jobs"},            {"aliases", {"j"}},       {"type","int"},    {"default",0},      {"description","Worker threads for hashing (0 = one per core)"}, {"persistent", true}, {"min",0}},
    {{"key","batch_size"},      {"aliases", {"bs"}},      {"type","int"},    {"default",64},     {"description","Files hashed per worker round"}, {"persistent", true}, {"min",1}},
    {{"key","busy_timeout_ms"}, {"aliases", {"bt"}},      {"type","int"},    {"default",5000},   {"description","Milliseconds to wait for a ledger locked by another run"}, {"persistent", true}, {"min",0}},
    {{"key","format"},          {"aliases", {"f"}},       {"type","string"}, {"default","text"}, {"description","Report format"}, {"persistent", true}, {"choices", {"text","json"}}},
    {{"key","help"},            {"aliases", {"h","?"}},   {"type","bool"},   {"default",false},  {"description","Show command help and exit"}, {"persistent", false}},
    {{"key","save"},            {"aliases", {"persist"}}, {"type","bool"},   {"default",false},  {"description","Persist current settings to disk"}, {"persistent", false}}
  });
  return spec;
}

namespace {

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string trimmed(const std::string& value) {
  auto first = std::find_if_not(value.begin(), value.end(),
                                [](unsigned char ch){ return std::isspace(ch); });
  auto last = std::find_if_not(value.rbegin(), value.rend(),
                               [](unsigned char ch){ return std::isspace(ch); }).base();
  return first < last ? std::string(first, last) : std::string();
}

std::optional<bool> parse_bool(const std::string& text) {
  const auto v = lowercase(trimmed(text));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

SettingsManager::Type parse_type(const std::string& name) {
  if(name == "bool") return SettingsManager::Type::boolean;
  if(name == "int") return SettingsManager::Type::integer;
  if(name == "string") return SettingsManager::Type::string;
  throw std::runtime_error("Unsupported setting type '" + name + "'");
}

} // namespace

SettingsManager::SettingsManager()
  : SettingsManager(settings_specification()) {}

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : values_(nlohmann::json::object()) {
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", nlohmann::json::array())) {
      spec.aliases.push_back(lowercase(alias.get<std::string>()));
    }
    spec.type = parse_type(entry.at("type").get<std::string>());
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    if(entry.contains("min")) spec.min = entry.at("min").get<int>();
    if(entry.contains("choices")) spec.choices = entry.at("choices").get<std::vector<std::string>>();
    values_[spec.key] = spec.default_value;
    specs_.push_back(std::move(spec));
  }
}

const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  const auto lowered = lowercase(token);
  auto it = std::find_if(specs_.begin(), specs_.end(), [&](const SettingSpec& spec){
    return lowered == lowercase(spec.key) ||
           std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end();
  });
  return it == specs_.end() ? nullptr : &*it;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == Type::boolean;
}

bool SettingsManager::store(const SettingSpec& spec, nlohmann::json value, std::string& error) {
  switch(spec.type) {
    case Type::boolean:
      if(value.is_number_integer()) value = value.get<long long>() != 0;
      if(!value.is_boolean()) {
        error = "expected boolean";
        return false;
      }
      break;
    case Type::integer: {
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      const auto n = value.get<long long>();
      if(spec.min && n < *spec.min) {
        error = "must be at least " + std::to_string(*spec.min);
        return false;
      }
      if(n > std::numeric_limits<int>::max()) {
        error = "out of range";
        return false;
      }
      break;
    }
    case Type::string:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      if(!spec.choices.empty() &&
         std::find(spec.choices.begin(), spec.choices.end(), value.get<std::string>()) == spec.choices.end()) {
        std::string allowed;
        for(const auto& choice : spec.choices) {
          allowed += (allowed.empty() ? "" : "|") + choice;
        }
        error = "expected one of " + allowed;
        return false;
      }
      break;
  }
  values_[spec.key] = std::move(value);
  return true;
}

bool SettingsManager::set_from_json(const std::string& key,
                                    const nlohmann::json& value,
                                    std::string& error) {
  error.clear();
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  return store(*spec, value, error);
}

bool SettingsManager::set_from_string(const std::string& key,
                                      const std::string& value,
                                      std::string& error) {
  error.clear();
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  const auto clean = trimmed(value);
  switch(spec->type) {
    case Type::boolean: {
      auto parsed = parse_bool(clean);
      if(!parsed) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      return store(*spec, *parsed, error);
    }
    case Type::integer: {
      long long parsed = 0;
      try {
        std::size_t consumed = 0;
        parsed = std::stoll(clean, &consumed);
        if(consumed != clean.size()) {
          error = "trailing characters";
          return false;
        }
      } catch(const std::exception& e) {
        error = std::string("not a number (") + e.what() + ")";
        return false;
      }
      return store(*spec, parsed, error);
    }
    case Type::string:
      return store(*spec, clean, error);
  }
  error = "unsupported type";
  return false;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!path_override_.empty()) return path_override_;
  return config_home() / "settings.json";
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) return true;

  std::ifstream in(path);
  if(!in) {
    log_error(nullptr, "Unable to read settings {}", path.string());
    return false;
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    log_error(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    log_error(nullptr, "Ignoring {}: not a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec || !spec->persistent) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      log_error(nullptr, "Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    log_error(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << to_json(true).dump(2) << '\n';
  return static_cast<bool>(out);
}

nlohmann::json SettingsManager::to_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = values_.at(spec.key);
  }
  return doc;
}

bool SettingsManager::is_bool_literal(const std::string& value) {
  return parse_bool(value).has_value();
}

std::string SettingsManager::type_name(Type type) {
  switch(type) {
    case Type::boolean: return "bool";
    case Type::integer: return "int";
    case Type::string: return "string";
  }
  return "unknown";
}
