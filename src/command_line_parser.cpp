#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::string summary,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    summary_(std::move(summary)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     std::isalpha(static_cast<unsigned char>(candidate[1]))) {
    return true;
  }
  return false;
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::size_t positional_index = 0;

  auto fail = [&](const std::string& message){
    print_err(nullptr, "{}", message);
    usage(settings);
    return false;
  };

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    std::string key_token;
    bool long_form = false;
    if(token.rfind("--", 0) == 0) {
      key_token = token.substr(2);
      long_form = true;
    } else if(token.size() > 1 && token[0] == '-' && token[1] != '-' &&
              !std::isdigit(static_cast<unsigned char>(token[1]))) {
      key_token = token.substr(1);
    }

    if(!key_token.empty()) {
      auto resolved = settings.resolve_key(key_token);
      if(!resolved && long_form) {
        return fail("Unknown option --" + key_token);
      }
      if(resolved) {
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
            return fail("Missing value for option '" + key_token + "'");
          }
          value = args[++i];
        }
        std::string error;
        if(!settings.set_from_string(*resolved, value, error)) {
          return fail("Invalid value for option '" + key_token + "': " + error);
        }
        continue;
      }
      // unrecognised short alias falls through to positional handling
    }

    if(positional_index >= positional_specs_.size()) {
      return fail("Unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      return fail("Invalid value for " + spec.key + " '" + token + "': " + error);
    }
  }
  return true;
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  print_out(nullptr, "{} - {}", process_name_, summary_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_;
  for(const auto& pos : positional_specs_) {
    cmd += " [" + pos.key + "]";
  }
  print_out(nullptr, "  {} [options]", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings.specification()) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    auto description = entry.value("description", "");
    print_out(nullptr, "  --{:<20} {:<12} {}{} (current: {})",
              key,
              argument_hint,
              description,
              aliases.str(),
              settings.value_as_string(key));
  }
  print_out(nullptr, "");
  print_out(nullptr, "Settings are read from {} when present.", settings.settings_path().string());
}
