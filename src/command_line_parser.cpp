#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <nlohmann/json.hpp>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    argv_spec_(std::move(argv_spec)),
    positional_specs_(build_positional_specs(argv_spec_)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager known(settings_spec_);
  for(const auto& argv_entry : result) {
    if(!known.resolve_key(argv_entry.key)) {
      throw std::runtime_error("ARGV specification references unknown setting '" + argv_entry.key + "'");
    }
  }
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

// "-vvn": each letter must be a flag or a counter on its own.
bool CommandLineParser::apply_short_cluster(const std::string& cluster, SettingsManager& settings) const {
  std::vector<std::string> keys;
  for(char c : cluster) {
    auto resolved = settings.resolve_key(std::string(1, c));
    if(!resolved) return false;
    if(!settings.is_bool_setting(*resolved) && !settings.is_count_setting(*resolved)) return false;
    keys.push_back(*resolved);
  }
  for(const auto& key : keys) {
    std::string error;
    bool ok = settings.is_count_setting(key)
      ? settings.increment(key, error)
      : settings.set_from_json(key, true, error);
    if(!ok) throw UsageError("Invalid option '-" + cluster + "': " + error);
  }
  return true;
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
          throw UsageError("Unknown option --" + key_token);
        }
        return false;
      }
      std::string error;
      if(settings.is_count_setting(*resolved)) {
        if(!settings.increment(*resolved, error)) {
          throw UsageError("Invalid option '" + key_token + "': " + error);
        }
        return true;
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
          throw UsageError("Missing value for option '" + key_token + "'");
        }
        value = args[++i];
      }
      if(!settings.set_from_string(*resolved, value, error)) {
        throw UsageError("Invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(token == "--") {
      // everything after is positional
      for(++i; i < args.size(); ++i) {
        if(positional_index >= positional_specs_.size()) {
          throw UsageError("Unexpected positional argument '" + args[i] + "'");
        }
        const auto& spec = positional_specs_[positional_index++];
        std::string error;
        if(!settings.set_from_string(spec.key, args[i], error)) {
          throw UsageError("Invalid value for " + spec.key + " '" + args[i] + "': " + error);
        }
      }
      break;
    }

    if(token.rfind("--", 0) == 0) {
      handle_option(token.substr(2), true);
      continue;
    }

    if(token.size() > 1 && token[0] == '-') {
      std::string alias = token.substr(1);
      if(handle_option(alias, false)) continue;
      if(apply_short_cluster(alias, settings)) continue;
      // fall through to positional if alias unrecognised
    }

    if(positional_index >= positional_specs_.size()) {
      throw UsageError("Unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      throw UsageError("Invalid value for " + spec.key + " '" + token + "': " + error);
    }
  }

  if(settings.help_requested()) return;

  if(positional_index != positional_specs_.size()) {
    throw UsageError("Expected " + std::to_string(positional_specs_.size()) +
                     " arguments, got " + std::to_string(positional_index));
  }
  if(settings.has("lowercase") && settings.has("uppercase") &&
     settings.get<bool>("lowercase") && settings.get<bool>("uppercase")) {
    throw UsageError("--lowercase and --uppercase can't be combined");
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - copy new camera files between DCIM-style trees", process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_ + " [options]";
  for(const auto& pos : positional_specs_) {
    cmd += " <" + pos.key + ">";
  }
  print_out(nullptr, "  {}", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  std::vector<std::string> positional_keys;
  for(const auto& pos : positional_specs_) positional_keys.push_back(pos.key);

  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    if(std::find(positional_keys.begin(), positional_keys.end(), key) != positional_keys.end()) {
      continue;
    }
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint;
    if(type == "string") {
      argument_hint = "<" + type + ">";
    } else if(type == "count") {
      argument_hint = "(repeatable)";
    }
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
    print_out(nullptr, "  --{:<10} {:<12} {}{}",
              key,
              argument_hint,
              description,
              aliases.str());
  }
  print_out(nullptr, "");
}
