#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// Setting tables. "positional" maps a bare argv token (by index) onto the key,
// "required" marks positionals that must be present, "choices" restricts a
// string, "min" bounds an int or size. "size" values accept K/M/G suffixes.
inline const nlohmann::json RCOPY_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","source"},              {"aliases", {"src"}},               {"type","string"}, {"default",""},        {"description","File or directory to copy"}, {"persistent", false}, {"positional", 0}, {"required", true}},
  {{"key","destination"},         {"aliases", {"dst","dest"}},        {"type","string"}, {"default",""},        {"description","Target path on the other side"}, {"persistent", false}, {"positional", 1}, {"required", true}},
  {{"key","direction"},           {"aliases", {"d","dir"}},           {"type","string"}, {"default","push"},    {"description","push (local -> remote) or pull (remote -> local)"}, {"persistent", true}, {"choices", {"push","pull"}}},
  {{"key","host"},                {"aliases", {"remote","rh"}},       {"type","string"}, {"default",""},        {"description","Agent host; empty copies through an in-process agent"}, {"persistent", true}},
  {{"key","port"},                {"aliases", {"p"}},                 {"type","int"},    {"default",9300},      {"description","Agent TCP port"}, {"persistent", true}, {"min", 1}},
  {{"key","remote_root"},         {"aliases", {"rr"}},                {"type","string"}, {"default","."},       {"description","Root of the in-process agent when no host is given"}, {"persistent", true}},
  {{"key","buffer_size"},         {"aliases", {"b","bs"}},            {"type","size"},   {"default",4194304},   {"description","Bytes per buffer"}, {"persistent", true}, {"min", 1}},
  {{"key","max_tries"},           {"aliases", {"tries","mt"}},        {"type","int"},    {"default",100},       {"description","Attempts to open a locked destination"}, {"persistent", true}, {"min", 1}},
  {{"key","retry_delay_ms"},      {"aliases", {"delay","rd"}},        {"type","int"},    {"default",10},        {"description","Milliseconds between lock retries"}, {"persistent", true}, {"min", 0}},
  {{"key","overwrite"},           {"aliases", {"o","y"}},             {"type","bool"},   {"default",false},     {"description","Replace existing destination files"}, {"persistent", true}},
  {{"key","force"},               {"aliases", {"f"}},                 {"type","bool"},   {"default",false},     {"description","Create a missing destination folder chain"}, {"persistent", true}},
  {{"key","progress"},            {"aliases", {"meter","pg"}},        {"type","bool"},   {"default",true},      {"description","Show ASCII progress meter"}, {"persistent", true}},
  {{"key","progress_meter_size"}, {"aliases", {"meter_size","pms"}},  {"type","int"},    {"default",80},        {"description","Characters used for the progress meter"}, {"persistent", true}, {"min", 20}},
  {{"key","verbose"},             {"aliases", {"v"}},                 {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},             {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},           {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

inline const nlohmann::json RCOPYD_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","listen_port"},         {"aliases", {"lp","p"}},            {"type","int"},    {"default",9300},      {"description","TCP port to listen on (0 picks one)"}, {"persistent", true}, {"positional", 0}, {"min", 0}},
  {{"key","root"},                {"aliases", {"r"}},                 {"type","string"}, {"default","."},       {"description","Directory relative request paths resolve against"}, {"persistent", true}, {"positional", 1}},
  {{"key","listen_ip"},           {"aliases", {"li"}},                {"type","string"}, {"default","127.0.0.1"},{"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","verbose"},             {"aliases", {"v"}},                 {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},             {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},           {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
    std::optional<std::size_t> positional;
    bool required = false;
    std::vector<std::string> choices;
    std::optional<int64_t> minimum;
  };

  explicit SettingsManager(const nlohmann::json& specification = RCOPY_SETTINGS_SPECIFICATION,
                           std::string file_name = "rcopy.json");

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  // Keys marked required that still hold an empty string.
  std::vector<std::string> missing_required() const;

  const std::vector<SettingSpec>& setting_specs() const { return setting_specs_; }
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);
  // "4M" -> 4194304. Throws std::invalid_argument.
  static uint64_t parse_size(const std::string& value);
  static std::string default_to_string(const SettingSpec& spec);

private:
  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::string file_name_;
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
    if(entry.contains("positional")) {
      spec.positional = entry.at("positional").get<std::size_t>();
    }
    spec.required = entry.value("required", false);
    if(entry.contains("choices")) {
      spec.choices = entry.at("choices").get<std::vector<std::string>>();
    }
    if(entry.contains("min")) {
      spec.minimum = entry.at("min").get<int64_t>();
    }
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager(const nlohmann::json& specification, std::string file_name)
  : setting_specs_(build_setting_specs(specification)),
    file_name_(std::move(file_name)) {
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

inline std::vector<std::string> SettingsManager::missing_required() const {
  std::vector<std::string> missing;
  for(const auto& spec : setting_specs_) {
    if(!spec.required) continue;
    const auto& value = settings_.at(spec.key);
    if(value.is_string() && trim_copy(value.get<std::string>()).empty()) {
      missing.push_back(spec.key);
    }
  }
  return missing;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return std::filesystem::current_path() / ".config" / file_name_;
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
    if(!spec || !spec->persistent) continue;
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
  auto below_minimum = [&](int64_t v){
    if(spec.minimum && v < *spec.minimum) {
      error = "must be >= " + std::to_string(*spec.minimum);
      return true;
    }
    return false;
  };

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
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    if(below_minimum(value.get<int64_t>())) return false;
    settings_[spec.key] = value.get<int>();
    return true;
  }
  if(spec.type == "size") {
    if(!value.is_number_integer() || (!value.is_number_unsigned() && value.get<int64_t>() < 0)) {
      error = "expected a non-negative byte count";
      return false;
    }
    if(below_minimum(static_cast<int64_t>(value.get<uint64_t>()))) return false;
    settings_[spec.key] = value.get<uint64_t>();
    return true;
  }
  if(spec.type == "string") {
    if(!value.is_string()) {
      error = "expected string";
      return false;
    }
    auto text = value.get<std::string>();
    if(!spec.choices.empty() &&
       std::find(spec.choices.begin(), spec.choices.end(), to_lower(text)) == spec.choices.end()) {
      error = "expected one of";
      for(const auto& choice : spec.choices) error += " " + choice;
      return false;
    }
    settings_[spec.key] = spec.choices.empty() ? text : to_lower(text);
    return true;
  }
  error = "unknown type";
  return false;
}

inline uint64_t SettingsManager::parse_size(const std::string& value) {
  std::string clean = trim_copy(value);
  if(clean.empty()) throw std::invalid_argument("empty size");
  uint64_t multiplier = 1;
  char suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(clean.back())));
  if(suffix == 'B') {
    clean.pop_back();
    if(clean.empty()) throw std::invalid_argument("missing number");
    suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(clean.back())));
  }
  switch(suffix) {
    case 'K': multiplier = 1024ULL; break;
    case 'M': multiplier = 1024ULL * 1024; break;
    case 'G': multiplier = 1024ULL * 1024 * 1024; break;
    default: break;
  }
  if(multiplier != 1) clean.pop_back();
  if(clean.empty() || !std::all_of(clean.begin(), clean.end(),
                                   [](unsigned char ch){ return std::isdigit(ch); })) {
    throw std::invalid_argument("not a size: '" + value + "'");
  }
  uint64_t n = 0;
  try {
    n = std::stoull(clean);
  } catch(const std::out_of_range&) {
    throw std::invalid_argument("size out of range: '" + value + "'");
  }
  if(n > UINT64_MAX / multiplier) {
    throw std::invalid_argument("size out of range: '" + value + "'");
  }
  return n * multiplier;
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
        error = "trailing characters in '" + clean + "'";
        return {};
      }
      return parsed;
    } catch(const std::logic_error& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "size") {
    try {
      return parse_size(clean);
    } catch(const std::logic_error& e) {
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

inline std::string SettingsManager::default_to_string(const SettingSpec& spec) {
  if(spec.type == "bool") {
    return spec.default_value.get<bool>() ? "true" : "false";
  }
  if(spec.default_value.is_string()) {
    return spec.default_value.get<std::string>();
  }
  return spec.default_value.dump();
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
