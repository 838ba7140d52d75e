#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::string summary,
                                     const SettingsManager& settings)
  : process_name_(std::move(process_name)),
    summary_(std::move(summary)),
    specs_(settings.setting_specs()) {
  for(const auto& spec : specs_) {
    if(!spec.positional) continue;
    positional_specs_.push_back(PositionalSpec{*spec.positional, spec.key, spec.required});
  }
  std::sort(positional_specs_.begin(), positional_specs_.end(),
            [](const PositionalSpec& a, const PositionalSpec& b){ return a.index < b.index; });
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     std::isalpha(static_cast<unsigned char>(candidate[1]))) {
    return true;
  }
  return false;
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    auto handle_option = [&](const std::string& key_token, bool long_form){
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) {
          throw CommandLineError("Unknown option --" + key_token);
        }
        return false; // "-5" and friends fall through to positionals
      }
      std::string value;
      if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
           SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          throw CommandLineError("Missing value for option '" + key_token + "'");
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        throw CommandLineError("Invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(token.rfind("--", 0) == 0 && token.size() > 2) {
      std::string key = token.substr(2);
      auto eq = key.find('=');
      if(eq != std::string::npos) {
        auto resolved = settings.resolve_key(key.substr(0, eq));
        if(!resolved) throw CommandLineError("Unknown option --" + key.substr(0, eq));
        std::string error;
        if(!settings.set_from_string(*resolved, key.substr(eq + 1), error)) {
          throw CommandLineError("Invalid value for option '" + key.substr(0, eq) + "': " + error);
        }
        continue;
      }
      handle_option(key, true);
      continue;
    }

    if(token.size() > 1 && token[0] == '-' && token[1] != '-') {
      if(handle_option(token.substr(1), false)) {
        continue;
      }
    }

    if(positional_index >= positional_specs_.size()) {
      throw CommandLineError("Unexpected argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      throw CommandLineError("Invalid value for " + spec.key + " '" + token + "': " + error);
    }
  }

  if(settings.help_requested()) return;
  auto missing = settings.missing_required();
  if(!missing.empty()) {
    std::string names;
    for(const auto& key : missing) {
      if(!names.empty()) names += ", ";
      names += key;
    }
    throw CommandLineError("Missing required argument: " + names);
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - {}", process_name_, summary_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_ + " [options]";
  for(const auto& pos : positional_specs_) {
    cmd += pos.required ? " <" + pos.key + ">" : " [" + pos.key + "]";
  }
  print_out(nullptr, "  {}", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& spec : specs_) {
    std::string argument_hint;
    if(spec.type == "bool") {
      argument_hint = "[true|false]";
    } else if(!spec.choices.empty()) {
      for(const auto& choice : spec.choices) {
        argument_hint += (argument_hint.empty() ? "<" : "|") + choice;
      }
      argument_hint += ">";
    } else {
      argument_hint = "<" + spec.type + ">";
    }
    std::ostringstream aliases;
    if(!spec.aliases.empty()) {
      aliases << " (alias: ";
      for(std::size_t i = 0; i < spec.aliases.size(); ++i) {
        if(i > 0) aliases << ", ";
        aliases << "-" << spec.aliases[i];
      }
      aliases << ")";
    }
    print_out(nullptr, "  --{:<20} {:<14} {}{} (default: {})",
              spec.key,
              argument_hint,
              spec.description,
              aliases.str(),
              SettingsManager::default_to_string(spec));
  }
  print_out(nullptr, "");
}
