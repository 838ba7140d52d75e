#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Bad argv; main prints the message and the usage text.
class CommandLineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class CommandLineParser {
public:
  CommandLineParser(std::string process_name,
                    std::string summary,
                    const SettingsManager& settings);

  // --key value, -alias value, bare bool flags, then positionals in the
  // order the settings table gives them. Throws CommandLineError.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;

  void usage() const;

private:
  struct PositionalSpec {
    std::size_t index = 0;
    std::string key;
    bool required = false;
  };

  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::string summary_;
  std::vector<SettingsManager::SettingSpec> specs_;
  std::vector<PositionalSpec> positional_specs_;
};
