#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json command_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    command_specs_(build_command_specs(command_spec)) {}

std::vector<CommandLineParser::CommandSpec> CommandLineParser::build_command_specs(const nlohmann::json& spec) const {
  std::vector<CommandSpec> result;
  for(const auto& entry : spec) {
    CommandSpec out;
    out.name = entry.at("name").get<std::string>();
    out.args = entry.value("args", "");
    out.min_args = entry.value("min_args", std::size_t{0});
    out.description = entry.value("description", "");
    result.push_back(std::move(out));
  }
  return result;
}

const CommandLineParser::CommandSpec* CommandLineParser::find_command(const std::string& name) const {
  auto lowered = to_lower(name);
  for(const auto& spec : command_specs_) {
    if(spec.name == lowered) return &spec;
  }
  return nullptr;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0 && candidate.size() > 2) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     std::isalpha(static_cast<unsigned char>(candidate[1]))) {
    return true;
  }
  return false;
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

CommandLineParser::Invocation CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  return parse(args, settings);
}

CommandLineParser::Invocation CommandLineParser::parse(const std::vector<std::string>& args,
                                                       SettingsManager& settings) const {
  Invocation invocation;
  bool options_done = false;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    auto handle_option = [&](std::string key_token, bool long_form){
      std::string inline_value;
      bool has_inline = false;
      auto eq = key_token.find('=');
      if(long_form && eq != std::string::npos) {
        inline_value = key_token.substr(eq + 1);
        key_token = key_token.substr(0, eq);
        has_inline = true;
      }
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) {
          throw UsageError("Unknown option --" + key_token);
        }
        return false; // e.g. a negative number: treat as positional
      }
      std::string value;
      if(has_inline) {
        value = inline_value;
      } else if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1])) {
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
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        throw UsageError("Invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(!options_done && token == "--") {
      options_done = true;
      continue;
    }
    if(!options_done && token.rfind("--", 0) == 0) {
      handle_option(token.substr(2), true);
      continue;
    }
    if(!options_done && token.size() > 1 && token[0] == '-' && token[1] != '-') {
      if(handle_option(token.substr(1), false)) {
        continue;
      }
    }

    if(invocation.command.empty()) {
      invocation.command = to_lower(token);
    } else {
      invocation.arguments.push_back(token);
    }
  }

  if(invocation.command.empty()) {
    invocation.command = settings.help_requested() ? "help" : "detect";
  }
  const auto* spec = find_command(invocation.command);
  if(!spec) {
    throw UsageError("Unknown command '" + invocation.command + "'");
  }
  if(invocation.arguments.size() < spec->min_args) {
    throw UsageError("'" + spec->name + "' expects " + spec->args);
  }
  return invocation;
}

std::vector<std::string> CommandLineParser::tokenize(const std::string& line) {
  std::vector<std::string> out;
  std::string current;
  bool in_token = false;
  char quote = 0;
  for(char ch : line) {
    if(quote) {
      if(ch == quote) {
        quote = 0;
      } else {
        current.push_back(ch);
      }
      continue;
    }
    if(ch == '"' || ch == '\'') {
      quote = ch;
      in_token = true;
      continue;
    }
    if(std::isspace(static_cast<unsigned char>(ch))) {
      if(in_token) {
        out.push_back(current);
        current.clear();
        in_token = false;
      }
      continue;
    }
    current.push_back(ch);
    in_token = true;
  }
  if(in_token) out.push_back(current);
  return out;
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - find and remove duplicate files", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} <command> [arguments] [--option value ...]", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Commands:");
  for(const auto& cmd : command_specs_) {
    print_out(nullptr, "  {:<9} {:<11} {}", cmd.name, cmd.args, cmd.description);
  }
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
    print_out(nullptr, "  --{} {:<12} {}{} (default: {})",
              key,
              argument_hint,
              description,
              aliases.str(),
              default_str);
  }
  print_out(nullptr, "");
}
