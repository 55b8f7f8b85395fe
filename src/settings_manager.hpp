#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","jobs"},                 {"aliases", {"j","workers"}},      {"type","int"},    {"default",0},          {"description","Files copied concurrently (0 = hardware threads, at most 8)"}},
  {{"key","display_cap"},          {"aliases", {"cap","max_bars"}},   {"type","int"},    {"default",8},          {"description","Progress bars shown at once"}},
  {{"key","buffer_size"},          {"aliases", {"bs"}},               {"type","int"},    {"default",65536},      {"description","Copy buffer size in bytes"}},
  {{"key","symlinks"},             {"aliases", {"links"}},            {"type","string"}, {"default","recreate"}, {"description","Symbolic links: recreate | follow | skip"}},
  {{"key","progress"},             {"aliases", {"p"}},                {"type","bool"},   {"default",true},       {"description","Show live progress bars when stderr is a terminal"}},
  {{"key","label_width"},          {"aliases", {"lw"}},               {"type","int"},    {"default",30},         {"description","Columns used for the file name of each bar"}},
  {{"key","refresh_interval_ms"},  {"aliases", {"refresh"}},          {"type","int"},    {"default",100},        {"description","Milliseconds between progress redraws"}},
  {{"key","finished_linger_ms"},   {"aliases", {"linger"}},           {"type","int"},    {"default",0},          {"description","Remove finished bars after this many milliseconds (0 = when space is needed)"}},
  {{"key","channel_capacity"},     {"aliases", {"queue"}},            {"type","int"},    {"default",1024},       {"description","Progress events buffered between workers and the display"}},
  {{"key","preserve_permissions"}, {"aliases", {"preserve"}},         {"type","bool"},   {"default",true},       {"description","Copy permission bits onto copied files"}},
  {{"key","strict"},               {"aliases", {"s"}},                {"type","bool"},   {"default",false},      {"description","Exit with status 1 when any item fails"}},
  {{"key","color"},                {"aliases", {"c"}},                {"type","bool"},   {"default",true},       {"description","Colorize output"}},
  {{"key","verbose"},              {"aliases", {"v"}},                {"type","bool"},   {"default",false},      {"description","Enable verbose logging"}},
  {{"key","config"},                                                  {"type","string"}, {"default",""},         {"description","JSON file with setting defaults"}},
  {{"key","help"},                 {"aliases", {"h","?"}},            {"type","bool"},   {"default",false},      {"description","Show command help and exit"}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Merges a JSON object of settings. Unknown keys are ignored with a
  // warning; a missing or unparsable file fills `error`.
  bool load_from_file(const std::filesystem::path& path, std::string& error);

  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  nlohmann::json get_json() const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = SettingsManager::to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path, std::string& error) {
  error.clear();
  std::ifstream in(path);
  if(!in) {
    error = "cannot open " + path.string();
    return false;
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    error = "cannot parse " + path.string() + ": " + e.what();
    return false;
  }
  if(!doc.is_object()) {
    error = path.string() + " must contain a JSON object";
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) {
      log_warn(nullptr, "Ignoring unknown setting '{}' in {}", item.key(), path.string());
      continue;
    }
    std::string item_error;
    if(!convert_and_store(*spec, item.value(), item_error)) {
      error = "invalid value for '" + item.key() + "' in " + path.string() + ": " + item_error;
      return false;
    }
  }
  return true;
}

inline nlohmann::json SettingsManager::get_json() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<long long>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      long long parsed = std::stoll(clean, &consumed);
      if(consumed != clean.size()) {
        error = "expected integer";
        return {};
      }
      return parsed;
    } catch(const std::exception&) {
      error = "expected integer";
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
