#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Maps argv onto SettingsManager. Options are `--key value` or `-alias value`;
// a bool option takes an optional literal. `--config FILE` is merged before
// any other option is applied. Everything else, and every token after `--`,
// is positional.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "parcopy",
                             nlohmann::json settings_spec = SETTINGS_SPECIFICATION);

  // Returns the positional arguments in order. Throws UsageError.
  std::vector<std::string> parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  struct Assignment {
    std::string token;
    std::string key;
    std::string value;
  };

  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
};
