#include "command_line_parser.hpp"

#include <cctype>
#include <sstream>

#include <nlohmann/json.hpp>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)) {}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0 && candidate.size() > 2) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?')) {
    return true;
  }
  return false;
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  std::string lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

std::vector<std::string> CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }

  std::vector<std::string> positionals;
  std::vector<Assignment> assignments;
  bool options_done = false;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    if(options_done || !is_option_token(token)) {
      if(token == "--" && !options_done) {
        options_done = true;
        continue;
      }
      positionals.push_back(token);
      continue;
    }

    const bool long_form = token.rfind("--", 0) == 0;
    const std::string name = token.substr(long_form ? 2 : 1);
    auto resolved = settings.resolve_key(name);
    if(!resolved) {
      throw UsageError("Unknown option " + token);
    }

    std::string value;
    if(settings.is_bool_setting(*resolved)) {
      if(i + 1 < args.size() && is_bool_literal(args[i + 1])) {
        value = args[++i];
      } else {
        value = "true";
      }
    } else {
      if(i + 1 >= args.size()) {
        throw UsageError("Missing value for option " + token);
      }
      value = args[++i];
    }
    assignments.push_back(Assignment{token, *resolved, value});
  }

  std::string error;
  for(const auto& assignment : assignments) {
    if(assignment.key != "config") continue;
    if(!settings.set_from_string(assignment.key, assignment.value, error) ||
       !settings.load_from_file(assignment.value, error)) {
      throw UsageError("Invalid --config: " + error);
    }
  }
  for(const auto& assignment : assignments) {
    if(assignment.key == "config") continue;
    if(!settings.set_from_string(assignment.key, assignment.value, error)) {
      throw UsageError("Invalid value for option " + assignment.token + " '" + assignment.value + "': " + error);
    }
  }
  return positionals;
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - copy files and directory trees with live progress", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} [options] <source> [<source>...] <destination>", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "With more than one source, destination must be an existing directory.");
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
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
    auto default_value = entry.at("default");
    std::string default_str;
    if(type == "bool") {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
    } else {
      default_str = default_value.dump();
    }
    print_out(nullptr, "  --{:<22} {:<12} {}{} (default: {})",
              key,
              argument_hint,
              description,
              aliases.str(),
              default_str.empty() ? "none" : default_str);
  }
  print_out(nullptr, "");
}
