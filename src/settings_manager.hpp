#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

// "size" settings are strings such as "10MB"; "list" settings are comma-separated.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","index_path"},          {"aliases", {"index","i"}},          {"type","string"}, {"default",".dupescan/index.json"}, {"description","Where the hash index is stored"}, {"persistent", true}},
  {{"key","exclude_folders"},     {"aliases", {"exclude","x"}},        {"type","list"},   {"default",""},        {"description","Folder names/paths to skip (comma-separated, case-insensitive)"}, {"persistent", true}},
  {{"key","file_types"},          {"aliases", {"types","t"}},          {"type","list"},   {"default",""},        {"description","Only scan these extensions (comma-separated, empty = all)"}, {"persistent", true}},
  {{"key","min_size"},            {"aliases", {"min","m"}},            {"type","size"},   {"default","0"},       {"description","Ignore files smaller than this while scanning"}, {"persistent", true}},
  {{"key","scan_subfolders"},     {"aliases", {"recursive","r"}},      {"type","bool"},   {"default",true},      {"description","Descend into subfolders"}, {"persistent", true}},
  {{"key","include_hidden"},      {"aliases", {"hidden"}},             {"type","bool"},   {"default",false},     {"description","Include dot files and dot folders"}, {"persistent", true}},
  {{"key","include_dirs"},        {"aliases", {"dirs","d"}},           {"type","bool"},   {"default",false},     {"description","Also detect duplicate directories (slower)"}, {"persistent", true}},
  {{"key","large_file_threshold"},{"aliases", {"threshold"}},          {"type","int"},    {"default",1048576},   {"description","Files above this size are prefix-hashed first"}, {"persistent", true}},
  {{"key","chunk_size"},          {"aliases", {"chunk"}},              {"type","int"},    {"default",262144},    {"description","Read chunk size for full hashing (min 65536)"}, {"persistent", true}},
  {{"key","checkpoint_interval"}, {"aliases", {"checkpoint"}},         {"type","int"},    {"default",500},       {"description","Save the index every N hashed files (0 = only at the end)"}, {"persistent", true}},
  {{"key","filter_type"},         {"aliases", {"ft"}},                 {"type","string"}, {"default","all"},     {"description","Result filter: all|images|videos|documents|audio|archives|code"}, {"persistent", true}},
  {{"key","filter_min_size"},     {"aliases", {"fms"}},                {"type","size"},   {"default","0"},       {"description","Hide results smaller than this"}, {"persistent", true}},
  {{"key","search"},              {"aliases", {"s","q"}},              {"type","string"}, {"default",""},        {"description","Only show paths containing this text"}, {"persistent", false}},
  {{"key","sort_by"},             {"aliases", {"sort"}},               {"type","string"}, {"default","size"},    {"description","Order within a group: size|name|date|path|none"}, {"persistent", true}},
  {{"key","reverse"},             {"aliases", {"desc"}},               {"type","bool"},   {"default",true},      {"description","Sort descending"}, {"persistent", true}},
  {{"key","group_sort"},          {"aliases", {"gs"}},                 {"type","string"}, {"default","none"},    {"description","Order of groups: group_size|count|none"}, {"persistent", true}},
  {{"key","smart"},               {"aliases", nlohmann::json::array()},                     {"type","bool"},   {"default",false},     {"description","prune: pick temp/download/deepest copies only"}, {"persistent", true}},
  {{"key","dry_run"},             {"aliases", {"n"}},                  {"type","bool"},   {"default",false},     {"description","Report deletions without deleting"}, {"persistent", false}},
  {{"key","verbose"},             {"aliases", {"v"}},                  {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},            {"aliases", {"log"}},                {"type","string"}, {"default",""},        {"description","Also write log lines to this file"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},              {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},            {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  // Parsed value of a "size" setting, in bytes.
  uint64_t get_size(const std::string& key) const;
  // Items of a "list" setting.
  std::vector<std::string> get_list(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::string description(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  void set_json(const nlohmann::json& doc);
  nlohmann::json get_json(bool persistent_only = true) const;

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const std::vector<SettingSpec>& setting_specs() const { return setting_specs_; }

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  static bool is_valid_size(const std::string& value);

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
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
  std::replace(lowered.begin(), lowered.end(), '-', '_');
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

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(setting_specs().size());
  for(const auto& spec : setting_specs()) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline std::string SettingsManager::description(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec ? spec->description : std::string();
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return std::filesystem::current_path() / ".dupescan" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline void SettingsManager::set_json(const nlohmann::json& doc) {
  merge_from_json(doc);
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs()) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

inline bool SettingsManager::is_valid_size(const std::string& value) {
  return try_parse_size(value).has_value();
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
    if(value.is_number_integer() && value.get<int64_t>() >= 0) {
      settings_[spec.key] = value.get<int64_t>();
      return true;
    }
    error = "expected non-negative integer";
    return false;
  }
  if(spec.type == "size") {
    if(value.is_number_unsigned()) {
      settings_[spec.key] = std::to_string(value.get<uint64_t>());
      return true;
    }
    if(value.is_string() && is_valid_size(value.get<std::string>())) {
      settings_[spec.key] = trim_copy(value.get<std::string>());
      return true;
    }
    error = "expected a size such as 500KB, 10MB or 1.5GB";
    return false;
  }
  if(spec.type == "string" || spec.type == "list") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    if(spec.type == "list" && value.is_array()) {
      std::string joined;
      for(const auto& item : value) {
        if(!item.is_string()) {
          error = "expected a list of strings";
          return false;
        }
        if(!joined.empty()) joined += ",";
        joined += item.get<std::string>();
      }
      settings_[spec.key] = joined;
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
      return std::stoll(clean);
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string" || spec.type == "list" || spec.type == "size") {
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

inline uint64_t SettingsManager::get_size(const std::string& key) const {
  return parse_size_string(get<std::string>(key));
}

inline std::vector<std::string> SettingsManager::get_list(const std::string& key) const {
  return split_list(get<std::string>(key));
}
