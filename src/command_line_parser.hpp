#pragma once

#include <string>
#include <vector>

#include "errors.hpp"
#include "settings_manager.hpp"

inline const nlohmann::json COMMAND_SPECIFICATION = nlohmann::json::array({
  {{"name","scan"},   {"args","<root>..."}, {"min_args",1}, {"description","Scan roots for duplicate files (size + prefix pre-filters)"}},
  {{"name","hash"},   {"args","<root>..."}, {"min_args",1}, {"description","Hash every file and directory under the roots"}},
  {{"name","count"},  {"args","<root>..."}, {"min_args",1}, {"description","Count files and directories under the roots"}},
  {{"name","detect"}, {"args",""},          {"min_args",0}, {"description","List duplicate groups from the index"}},
  {{"name","stats"},  {"args",""},          {"min_args",0}, {"description","Summarize the index and recoverable space"}},
  {{"name","delete"}, {"args","<path>..."}, {"min_args",1}, {"description","Delete paths and drop them from the index"}},
  {{"name","prune"},  {"args",""},          {"min_args",0}, {"description","Delete every copy except the canonical member of each group"}},
  {{"name","clear"},  {"args",""},          {"min_args",0}, {"description","Reset the index"}},
  {{"name","settings"},{"args",""},         {"min_args",0}, {"description","Show effective settings"}},
  {{"name","shell"},  {"args",""},          {"min_args",0}, {"description","Interactive prompt"}},
  {{"name","help"},   {"args",""},          {"min_args",0}, {"description","Show this help"}}
});

class UsageError : public DupescanError {
public:
  using DupescanError::DupescanError;
};

class CommandLineParser {
public:
  struct Invocation {
    std::string command;
    std::vector<std::string> arguments;
  };

  CommandLineParser(std::string process_name = "dupescan",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json command_spec = COMMAND_SPECIFICATION);

  // Options update `settings`; the first positional token names the command.
  // Throws UsageError on unknown options, bad values or missing arguments.
  Invocation parse(int argc, char* argv[], SettingsManager& settings) const;
  Invocation parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage() const;

  // Splits a shell line on whitespace, honouring "double" and 'single' quotes.
  static std::vector<std::string> tokenize(const std::string& line);

private:
  struct CommandSpec {
    std::string name;
    std::string args;
    std::size_t min_args = 0;
    std::string description;
  };

  std::vector<CommandSpec> build_command_specs(const nlohmann::json& spec) const;
  const CommandSpec* find_command(const std::string& name) const;
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::vector<CommandSpec> command_specs_;
};
