#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineParser {
public:
  // argv_spec maps positional arguments onto setting keys, e.g.
  // [{"index":0,"key":"peer_id"},{"index":1,"key":"listen_port"}]
  CommandLineParser(std::string process_name,
                    std::string summary,
                    nlohmann::json argv_spec = nlohmann::json::array());

  // Applies argv on top of the current settings. On a bad argument prints the
  // problem plus usage and returns false.
  bool parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  static std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec);
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::string summary_;
  std::vector<ArgvSpec> positional_specs_;
};
