#include "dupes_cli.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <thread>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "errors.hpp"
#include "selection_planner.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds kProgressInterval{500};

std::string short_hash(const std::string& hash) {
  return hash.substr(0, 12);
}

} // namespace

DupesCLI::DupesCLI(std::shared_ptr<SettingsManager> settings, std::shared_ptr<Logger> logger)
  : settings_(std::move(settings)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("cli")) {
  if(!settings_) {
    throw std::invalid_argument("DupesCLI requires a settings manager");
  }
}

std::string DupesCLI::absolute_key(const std::string& path) {
  std::error_code ec;
  fs::path abs = fs::absolute(fs::path(path), ec);
  if(ec) abs = fs::path(path);
  abs = abs.lexically_normal();
  if(!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
    abs = abs.parent_path();
  }
  return abs.string();
}

WalkOptions DupesCLI::walk_options() const {
  WalkOptions walk;
  walk.exclude_folders = settings_->get_list("exclude_folders");
  for(const auto& ext : settings_->get_list("file_types")) {
    auto normalized = normalize_extension(ext);
    if(!normalized.empty()) walk.file_type_allow_list.insert(normalized);
  }
  walk.min_size_bytes = settings_->get_size("min_size");
  walk.scan_subfolders = settings_->get<bool>("scan_subfolders");
  walk.include_hidden = settings_->get<bool>("include_hidden");
  return walk;
}

ScanEngine::Options DupesCLI::engine_options() const {
  ScanEngine::Options options;
  options.large_file_threshold = settings_->get<uint64_t>("large_file_threshold");
  options.chunk_size = settings_->get<std::size_t>("chunk_size");
  options.include_dirs = settings_->get<bool>("include_dirs");
  options.checkpoint_interval = settings_->get<std::size_t>("checkpoint_interval");
  return options;
}

FilterOptions DupesCLI::filter_options() const {
  FilterOptions options;
  options.file_type = ResultFilterSort::parse_file_type(settings_->get<std::string>("filter_type"));
  options.min_size = settings_->get_size("filter_min_size");
  options.search = settings_->get<std::string>("search");
  auto sort_name = settings_->get<std::string>("sort_by");
  if(auto key = ResultFilterSort::parse_sort_key(sort_name)) {
    options.sort_by = *key;
  } else {
    log_warn(logger_.get(), "Unknown sort_by '{}', using size", sort_name);
  }
  options.reverse = settings_->get<bool>("reverse");
  return options;
}

GroupSortKey DupesCLI::group_sort() const {
  auto name = settings_->get<std::string>("group_sort");
  if(auto key = ResultFilterSort::parse_group_sort_key(name)) return *key;
  log_warn(logger_.get(), "Unknown group_sort '{}', leaving groups unsorted", name);
  return GroupSortKey::None;
}

std::shared_ptr<DuplicateIndex> DupesCLI::open_index() const {
  fs::path store = settings_->get<std::string>("index_path");
  if(store.is_relative()) store = fs::current_path() / store;
  auto index = std::make_shared<DuplicateIndex>(store.lexically_normal(),
                                                std::make_shared<Logger>("index"));
  if(!index->load()) {
    log_debug(logger_.get(), "Starting with an empty index at {}", store.string());
  }
  return index;
}

bool DupesCLI::interrupted() {
  return interrupt_ && interrupt_->exchange(false);
}

int DupesCLI::execute(const CommandLineParser::Invocation& invocation) {
  if(interrupt_) interrupt_->store(false);
  const auto& cmd = invocation.command;
  const auto& args = invocation.arguments;
  if(cmd == "scan") return cmd_scan(args);
  if(cmd == "hash") return cmd_hash(args);
  if(cmd == "count") return cmd_count(args);
  if(cmd == "detect") return cmd_detect();
  if(cmd == "stats") return cmd_stats();
  if(cmd == "delete") return cmd_delete(args);
  if(cmd == "prune") return cmd_prune();
  if(cmd == "clear") return cmd_clear();
  if(cmd == "settings") return cmd_settings(args);
  if(cmd == "shell") return run_shell();
  if(cmd == "help") {
    parser_.usage();
    return 0;
  }
  print_err(logger_.get(), "Unknown command '{}'", cmd);
  return 1;
}

void DupesCLI::print_progress(const ScanEngine::Stats& stats) {
  print_out(logger_.get(), "[{}] files {} dirs {} quick {} full {} errors {}",
            scan_phase_name(stats.phase),
            stats.file_count,
            stats.dir_count,
            stats.quick_hash_count,
            stats.full_hash_count,
            stats.error_count);
}

int DupesCLI::cmd_scan(const std::vector<std::string>& roots) {
  auto index = open_index();
  auto walk = walk_options();
  int status = 0;

  for(const auto& root : roots) {
    ScanEngine engine(index, engine_options(), std::make_shared<Logger>("scan-engine"));
    if(!engine.start_background(root, walk)) {
      print_err(logger_.get(), "A scan is already running");
      return 1;
    }
    auto next_report = std::chrono::steady_clock::now() + kProgressInterval;
    while(engine.running()) {
      if(interrupted()) {
        print_out(logger_.get(), "Stopping scan, saving partial results...");
        engine.request_stop();
      }
      if(std::chrono::steady_clock::now() >= next_report) {
        print_progress(engine.stats());
        next_report += kProgressInterval;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    engine.wait();

    if(auto error = engine.last_error()) {
      print_err(logger_.get(), "Scan of {} failed: {}", root, *error);
      status = 1;
      continue;
    }
    auto stats = engine.stats();
    print_out(logger_.get(),
              "Scan of {} {}: {} files, {} dirs, {} quick hashes, {} full hashes, "
              "{} unique sizes skipped, {} unique prefixes skipped, {} errors",
              root,
              stats.phase == ScanPhase::Cancelled ? "cancelled" : "finished",
              stats.file_count,
              stats.dir_count,
              stats.quick_hash_count,
              stats.full_hash_count,
              stats.size_unique_skipped,
              stats.quick_unique_skipped,
              stats.error_count);
    for(const auto& item : stats.skipped_items) {
      log_debug(logger_.get(), "skipped {}", item);
    }
    if(stats.phase == ScanPhase::Cancelled) {
      return 130;
    }
  }

  auto report = index->detect_duplicates();
  print_out(logger_.get(), "{} duplicate file groups, {} duplicate directory groups",
            report.files.size(), report.dirs.size());
  return status;
}

int DupesCLI::cmd_hash(const std::vector<std::string>& roots) {
  auto index = open_index();
  int status = 0;

  for(const auto& root : roots) {
    ScanEngine engine(index, engine_options(), std::make_shared<Logger>("scan-engine"));
    auto pending = std::async(std::launch::async, [&engine, &root]{
      return engine.recursive_hash(root);
    });
    while(pending.wait_for(kProgressInterval) != std::future_status::ready) {
      if(interrupted()) {
        print_out(logger_.get(), "Stopping, saving partial results...");
        engine.request_stop();
      }
      print_progress(engine.stats());
    }
    auto hash = pending.get();
    if(engine.cancellation()->stop_requested()) {
      print_out(logger_.get(), "Hashing of {} cancelled", root);
      return 130;
    }
    if(!hash) {
      print_err(logger_.get(), "Could not hash {}", root);
      status = 1;
      continue;
    }
    auto stats = engine.stats();
    print_out(logger_.get(), "{}  {}", *hash, root);
    print_out(logger_.get(), "{} files and {} dirs hashed, {} skipped",
              stats.file_count, stats.dir_count, stats.error_count);
  }
  return status;
}

int DupesCLI::cmd_count(const std::vector<std::string>& roots) {
  ScanEngine::ItemCounts total;
  for(const auto& root : roots) {
    auto counts = ScanEngine::count_items(root);
    print_out(logger_.get(), "{}: {} files, {} dirs", root, counts.files, counts.dirs);
    total.files += counts.files;
    total.dirs += counts.dirs;
  }
  if(roots.size() > 1) {
    print_out(logger_.get(), "total: {} files, {} dirs", total.files, total.dirs);
  }
  return 0;
}

DuplicateReport DupesCLI::filtered_report(const DuplicateIndex& index, bool keep_discovery_order) const {
  auto options = filter_options();
  if(keep_discovery_order) options.sort_by = PathSortKey::None;
  auto report = ResultFilterSort::filter(index.detect_duplicates(), options);
  return ResultFilterSort::sort_groups(report, group_sort());
}

void DupesCLI::print_groups(const DuplicateIndex& index, const DuplicateReport& report) {
  for(auto kind : {EntryKind::File, EntryKind::Directory}) {
    for(const auto& group : report.groups(kind)) {
      auto canonical = index.canonical_member(kind, group.hash);
      print_out(logger_.get(), "[{}] {} copies, {} each  {}",
                entry_kind_name(kind),
                group.paths.size(),
                format_size(path_size(group.canonical_member())),
                short_hash(group.hash));
      for(const auto& p : group.paths) {
        bool keep = canonical && *canonical == p;
        print_out(logger_.get(), "  {} {}", keep ? "*" : " ", p);
      }
    }
  }
}

int DupesCLI::cmd_detect() {
  auto index = open_index();
  auto report = filtered_report(*index, false);
  if(report.empty()) {
    print_out(logger_.get(), "No duplicates found");
    return 0;
  }
  print_groups(*index, report);
  print_out(logger_.get(), "{} groups, {} redundant copies, {} recoverable (* = kept copy)",
            report.files.size() + report.dirs.size(),
            report.extra_count(),
            format_size(SelectionPlanner::recoverable_space(report)));
  return 0;
}

int DupesCLI::cmd_stats() {
  auto index = open_index();
  auto report = index->detect_duplicates();
  print_out(logger_.get(), "index: {}", index->store_path().string());
  print_out(logger_.get(), "files: {} paths in {} buckets, {} duplicate groups",
            index->path_count(EntryKind::File),
            index->bucket_count(EntryKind::File),
            report.files.size());
  print_out(logger_.get(), "dirs:  {} paths in {} buckets, {} duplicate groups",
            index->path_count(EntryKind::Directory),
            index->bucket_count(EntryKind::Directory),
            report.dirs.size());
  print_out(logger_.get(), "redundant copies: {}, recoverable: {}",
            report.extra_count(),
            format_size(SelectionPlanner::recoverable_space(report)));
  return 0;
}

void DupesCLI::print_deletion(const DeletionReport& report) {
  const char* verb = report.dry_run ? "Would delete" : "Deleted";
  for(const auto& p : report.deleted) {
    print_out(logger_.get(), "{} {}", verb, p);
  }
  for(const auto& failure : report.failures) {
    print_err(logger_.get(), "Failed to delete {}: {}", failure.first, failure.second);
  }
  print_out(logger_.get(), "{} {} paths, {} freed, {} failures",
            verb, report.deleted.size(), format_size(report.bytes_freed), report.failures.size());
}

int DupesCLI::cmd_delete(const std::vector<std::string>& paths) {
  auto index = open_index();
  std::vector<std::string> targets;
  targets.reserve(paths.size());
  for(const auto& p : paths) targets.push_back(absolute_key(p));

  DuplicateRemover remover(index, {settings_->get<bool>("dry_run")}, std::make_shared<Logger>("remover"));
  auto report = remover.remove(targets);
  print_deletion(report);
  return report.failures.empty() ? 0 : 1;
}

int DupesCLI::cmd_prune() {
  auto index = open_index();
  auto report = filtered_report(*index, true);
  auto selection = settings_->get<bool>("smart")
    ? SelectionPlanner::smart_select(report)
    : SelectionPlanner::select_all_extras(report);

  // The filter may hide groups whose members still sit inside a target.
  auto kept = SelectionPlanner::kept_members(index->detect_duplicates());
  auto shown_kept = SelectionPlanner::kept_members(report);
  kept.insert(kept.end(), shown_kept.begin(), shown_kept.end());
  selection = SelectionPlanner::drop_unsafe(std::move(selection), kept);

  std::vector<std::string> targets;
  for(const auto& selected : selection) {
    auto canonical = index->canonical_member(selected.kind, selected.hash);
    if(canonical && *canonical == selected.path) continue;
    targets.push_back(selected.path);
  }
  if(targets.empty()) {
    print_out(logger_.get(), "Nothing to prune");
    return 0;
  }

  DuplicateRemover remover(index, {settings_->get<bool>("dry_run")}, std::make_shared<Logger>("remover"));
  auto deletion = remover.remove(targets);
  print_deletion(deletion);
  return deletion.failures.empty() ? 0 : 1;
}

int DupesCLI::cmd_clear() {
  auto index = open_index();
  index->clear();
  print_out(logger_.get(), "Cleared {}", index->store_path().string());
  return 0;
}

int DupesCLI::cmd_settings(const std::vector<std::string>& args) {
  const std::string action = args.empty() ? "list" : to_lower(args[0]);

  if(action == "list") {
    auto keys = settings_->keys();
    std::sort(keys.begin(), keys.end());
    for(const auto& key : keys) {
      print_out(logger_.get(), "{} = {}", key, settings_->value_as_string(key));
    }
    return 0;
  }

  if(action == "get") {
    if(args.size() < 2) {
      print_err(logger_.get(), "Usage: settings get <key>");
      return 1;
    }
    auto resolved = settings_->resolve_key(args[1]);
    if(!resolved) {
      print_err(logger_.get(), "Unknown setting '{}'", args[1]);
      return 1;
    }
    print_out(logger_.get(), "{} = {}  ({})", *resolved,
              settings_->value_as_string(*resolved), settings_->description(*resolved));
    return 0;
  }

  if(action == "set") {
    if(args.size() < 3) {
      print_err(logger_.get(), "Usage: settings set <key> <value>");
      return 1;
    }
    auto resolved = settings_->resolve_key(args[1]);
    if(!resolved) {
      print_err(logger_.get(), "Unknown setting '{}'", args[1]);
      return 1;
    }
    std::string value = args[2];
    for(std::size_t i = 3; i < args.size(); ++i) value += " " + args[i];
    std::string error;
    if(!settings_->set_from_string(*resolved, value, error)) {
      print_err(logger_.get(), "Failed to set {}: {}", *resolved, error);
      return 1;
    }
    print_out(logger_.get(), "{} = {}", *resolved, settings_->value_as_string(*resolved));
    return 0;
  }

  if(action == "save") {
    if(!settings_->save()) {
      print_err(logger_.get(), "Failed to save settings to {}", settings_->settings_path().string());
      return 1;
    }
    print_out(logger_.get(), "Saved settings to {}", settings_->settings_path().string());
    return 0;
  }

  if(action == "load") {
    if(settings_->load()) {
      print_out(logger_.get(), "Loaded settings from {}", settings_->settings_path().string());
    } else {
      print_out(logger_.get(), "Settings file not found; keeping current values");
    }
    return 0;
  }

  print_err(logger_.get(), "Unknown settings command '{}'", action);
  return 1;
}

void DupesCLI::print_shell_help() {
  parser_.usage();
  print_out(logger_.get(), "Shell only:");
  print_out(logger_.get(), "  set <key> <value>   Shortcut for settings set");
  print_out(logger_.get(), "  get <key>           Shortcut for settings get");
  print_out(logger_.get(), "  quit|exit           Leave the shell");
}

#ifndef HAVE_READLINE
void DupesCLI::append_history_entry(const std::string& line) {
  if(line.empty()) return;
  if(!cli_history_.empty() && cli_history_.back() == line) return;
  cli_history_.push_back(line);
  if(cli_history_.size() > history_limit_) {
    cli_history_.erase(cli_history_.begin());
  }
}
#endif

std::optional<std::string> DupesCLI::read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
  char* line = readline(prompt);
  if(!line) return std::nullopt;
  std::string result(line);
  if(!result.empty()) add_history(result.c_str());
  free(line);
  return result;
#else
  std::cout << prompt;
  std::cout.flush();
  std::string line;
  if(!std::getline(std::cin, line)) return std::nullopt;
  append_history_entry(line);
  return line;
#endif
}

int DupesCLI::run_shell() {
  print_out(logger_.get(), "dupescan shell, type 'help' for commands");
  while(true) {
    auto input = read_command_line("dupescan> ");
    if(!input) break;
    auto tokens = CommandLineParser::tokenize(*input);
    if(tokens.empty()) continue;

    auto cmd = to_lower(tokens[0]);
    if(cmd == "quit" || cmd == "exit") break;
    if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_shell_help();
      continue;
    }
    if(cmd == "set" || cmd == "get") {
      tokens[0] = cmd;
      tokens.insert(tokens.begin(), "settings");
    }
    if(to_lower(tokens[0]) == "shell") {
      print_err(logger_.get(), "Already in the shell");
      continue;
    }

    try {
      auto invocation = parser_.parse(tokens, *settings_);
      int status = execute(invocation);
      if(status != 0) {
        log_debug(logger_.get(), "'{}' exited with status {}", invocation.command, status);
      }
    } catch(const UsageError& e) {
      print_err(logger_.get(), "{}", e.what());
    } catch(const DupescanError& e) {
      print_err(logger_.get(), "Error: {}", e.what());
    }
  }
  return 0;
}
