#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json TRACKER_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","listen_ip"},        {"aliases", {"li"}},             {"type","string"}, {"default","0.0.0.0"}, {"description","Interface/IP the tracker binds"}, {"persistent", true}},
  {{"key","listen_port"},      {"aliases", {"lp","port"}},      {"type","int"},    {"default",5000},      {"description","TCP port the tracker listens on"}, {"persistent", true}},
  {{"key","liveness_timeout"}, {"aliases", {"timeout","lt"}},   {"type","int"},    {"default",300},       {"description","Seconds without heartbeat before a peer is removed"}, {"persistent", true}},
  {{"key","sweep_interval"},   {"aliases", {"sweep","si"}},     {"type","int"},    {"default",60},        {"description","Seconds between liveness sweeps"}, {"persistent", true}},
  {{"key","worker_threads"},   {"aliases", {"threads","wt"}},   {"type","int"},    {"default",4},         {"description","Threads servicing client connections"}, {"persistent", true}},
  {{"key","io_timeout_ms"},    {"aliases", {"io_timeout"}},     {"type","int"},    {"default",5000},      {"description","Milliseconds a client may take to send its command"}, {"persistent", true}},
  {{"key","verbose"},          {"aliases", {"v"}},              {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},             {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},             {"aliases", {"persist"}},        {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

inline const nlohmann::json PEER_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","peer_id"},             {"aliases", {"id"}},             {"type","string"}, {"default",""},          {"description","Peer identifier (derived from host and pid when empty)"}, {"persistent", true}},
  {{"key","listen_ip"},           {"aliases", {"li"}},             {"type","string"}, {"default","0.0.0.0"},   {"description","Interface/IP for inbound peer connections"}, {"persistent", true}},
  {{"key","listen_port"},         {"aliases", {"lp","port"}},      {"type","int"},    {"default",6000},        {"description","TCP port for inbound peer connections"}, {"persistent", true}},
  {{"key","advertise_ip"},        {"aliases", {"ai"}},             {"type","string"}, {"default",""},          {"description","IP registered with the tracker (detected when empty)"}, {"persistent", true}},
  {{"key","tracker_host"},        {"aliases", {"th"}},             {"type","string"}, {"default","127.0.0.1"}, {"description","Tracker host"}, {"persistent", true}},
  {{"key","tracker_port"},        {"aliases", {"tp"}},             {"type","int"},    {"default",5000},        {"description","Tracker port"}, {"persistent", true}},
  {{"key","heartbeat_interval"},  {"aliases", {"hb"}},             {"type","int"},    {"default",60},          {"description","Seconds between tracker heartbeats"}, {"persistent", true}},
  {{"key","io_timeout_ms"},       {"aliases", {"io_timeout"}},     {"type","int"},    {"default",5000},        {"description","Milliseconds allowed for each outbound connection"}, {"persistent", true}},
  {{"key","history_limit"},       {"aliases", {"history"}},        {"type","int"},    {"default",200},         {"description","Received messages kept in memory"}, {"persistent", true}},
  {{"key","audio_notifications"}, {"aliases", {"audio","bell"}},   {"type","bool"},   {"default",false},       {"description","Play terminal bell on incoming messages"}, {"persistent", true}},
  {{"key","verbose"},             {"aliases", {"v"}},              {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},        {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  explicit SettingsManager(const nlohmann::json& specification,
                           std::filesystem::path settings_path = {});

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Validated accessors; throw std::runtime_error naming the key.
  uint16_t get_port(const std::string& key, bool allow_zero) const;
  std::chrono::seconds get_seconds(const std::string& key) const;
  std::chrono::milliseconds get_millis(const std::string& key) const;

  bool save() const;
  bool load();

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  const nlohmann::json& specification() const { return specification_; }

  const std::filesystem::path& settings_path() const { return settings_path_; }

  nlohmann::json get_json(bool persistent_only = true) const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

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
  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json specification_;
  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_;
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
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager(const nlohmann::json& specification,
                                        std::filesystem::path settings_path)
  : specification_(specification),
    setting_specs_(build_setting_specs(specification)),
    settings_path_(std::move(settings_path)) {
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

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline bool SettingsManager::load() {
  if(settings_path_.empty()) return false;
  std::ifstream in(settings_path_);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", settings_path_.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save() const {
  if(settings_path_.empty()) return false;
  std::error_code ec;
  if(settings_path_.has_parent_path()) {
    std::filesystem::create_directories(settings_path_.parent_path(), ec);
  }
  std::ofstream out(settings_path_);
  if(!out) {
    print_err(nullptr, "Unable to write {}", settings_path_.string());
    return false;
  }
  out << get_json(true).dump(2);
  return true;
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

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(persistent_only && !spec.persistent) continue;
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
      settings_[spec.key] = value.get<int>();
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
      int parsed = std::stoi(clean, &consumed);
      if(consumed != clean.size()) {
        error = "expected integer";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
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

inline uint16_t SettingsManager::get_port(const std::string& key, bool allow_zero) const {
  int value = get<int>(key);
  int lowest = allow_zero ? 0 : 1;
  if(value < lowest || value > 65535) {
    throw std::runtime_error("Invalid " + key + " '" + std::to_string(value) + "'");
  }
  return static_cast<uint16_t>(value);
}

inline std::chrono::seconds SettingsManager::get_seconds(const std::string& key) const {
  int value = get<int>(key);
  if(value <= 0) {
    throw std::runtime_error(key + " must be positive (got " + std::to_string(value) + ")");
  }
  return std::chrono::seconds(value);
}

inline std::chrono::milliseconds SettingsManager::get_millis(const std::string& key) const {
  int value = get<int>(key);
  if(value <= 0) {
    throw std::runtime_error(key + " must be positive (got " + std::to_string(value) + ")");
  }
  return std::chrono::milliseconds(value);
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

inline bool SettingsManager::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
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
