#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "command_line_parser.hpp"
#include "duplicate_index.hpp"
#include "duplicate_remover.hpp"
#include "log.hpp"
#include "result_filter.hpp"
#include "scan_engine.hpp"
#include "settings_manager.hpp"
#include "size_index_builder.hpp"

// Runs one parsed command (or an interactive shell) against the settings.
// Each command opens the index named by the `index_path` setting.
class DupesCLI {
public:
  explicit DupesCLI(std::shared_ptr<SettingsManager> settings,
                    std::shared_ptr<Logger> logger = nullptr);

  // Returns the process exit status.
  int execute(const CommandLineParser::Invocation& invocation);
  int run_shell();

  // Polled while long commands run; a true value stops the active scan.
  void set_interrupt_flag(std::atomic<bool>* flag) { interrupt_ = flag; }

  WalkOptions walk_options() const;
  ScanEngine::Options engine_options() const;
  FilterOptions filter_options() const;
  GroupSortKey group_sort() const;
  std::shared_ptr<DuplicateIndex> open_index() const;

  static std::string absolute_key(const std::string& path);

private:
  int cmd_scan(const std::vector<std::string>& roots);
  int cmd_hash(const std::vector<std::string>& roots);
  int cmd_count(const std::vector<std::string>& roots);
  int cmd_detect();
  int cmd_stats();
  int cmd_delete(const std::vector<std::string>& paths);
  int cmd_prune();
  int cmd_clear();
  int cmd_settings(const std::vector<std::string>& args);

  DuplicateReport filtered_report(const DuplicateIndex& index, bool keep_discovery_order) const;
  void print_groups(const DuplicateIndex& index, const DuplicateReport& report);
  void print_deletion(const DeletionReport& report);
  void print_progress(const ScanEngine::Stats& stats);
  bool interrupted();
  void print_shell_help();

  std::optional<std::string> read_command_line(const char* prompt);
#ifndef HAVE_READLINE
  void append_history_entry(const std::string& line);
  std::vector<std::string> cli_history_;
  static constexpr std::size_t history_limit_ = 200;
#endif

  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  CommandLineParser parser_;
  std::atomic<bool>* interrupt_ = nullptr;
};
