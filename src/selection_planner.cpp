#include "selection_planner.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <iterator>

#include "utils.hpp"

namespace {

const std::array<const char*, 8> kDisposableMarkers = {
  "temp", "tmp", "cache", "download", "downloads", "recyclebin", "recycle.bin", "trash"};

} // namespace

bool SelectionPlanner::is_disposable_location(const std::string& path) {
  auto lowered = to_lower(path);
  return std::any_of(kDisposableMarkers.begin(), kDisposableMarkers.end(),
                     [&](const char* marker){ return lowered.find(marker) != std::string::npos; });
}

std::size_t SelectionPlanner::path_depth(const std::string& path) {
  return static_cast<std::size_t>(std::count(path.begin(), path.end(),
                                             std::filesystem::path::preferred_separator));
}

std::vector<SelectedPath> SelectionPlanner::select_all_extras(const DuplicateReport& report) {
  std::vector<SelectedPath> out;
  for(auto kind : {EntryKind::File, EntryKind::Directory}) {
    for(const auto& group : report.groups(kind)) {
      for(const auto& p : group.extra_members()) {
        out.push_back({kind, group.hash, p});
      }
    }
  }
  return drop_unsafe(std::move(out), kept_members(report));
}

std::vector<SelectedPath> SelectionPlanner::smart_select(const DuplicateReport& report) {
  std::vector<SelectedPath> out;
  for(auto kind : {EntryKind::File, EntryKind::Directory}) {
    for(const auto& group : report.groups(kind)) {
      auto extras = group.extra_members();
      if(extras.empty()) continue;

      std::vector<std::string> chosen;
      std::copy_if(extras.begin(), extras.end(), std::back_inserter(chosen),
                   [](const std::string& p){ return is_disposable_location(p); });
      if(chosen.empty()) {
        std::size_t deepest = 0;
        for(const auto& p : extras) deepest = std::max(deepest, path_depth(p));
        std::copy_if(extras.begin(), extras.end(), std::back_inserter(chosen),
                     [deepest](const std::string& p){ return path_depth(p) == deepest; });
      }
      for(auto& p : chosen) out.push_back({kind, group.hash, std::move(p)});
    }
  }
  return drop_unsafe(std::move(out), kept_members(report));
}

std::vector<std::string> SelectionPlanner::kept_members(const DuplicateReport& report) {
  std::vector<std::string> kept;
  for(auto kind : {EntryKind::File, EntryKind::Directory}) {
    for(const auto& group : report.groups(kind)) {
      if(!group.paths.empty()) kept.push_back(group.canonical_member());
    }
  }
  return kept;
}

std::vector<SelectedPath> SelectionPlanner::drop_unsafe(std::vector<SelectedPath> selection,
                                                        const std::vector<std::string>& kept) {
  auto touches_kept = [&kept](const SelectedPath& target) {
    return std::any_of(kept.begin(), kept.end(), [&target](const std::string& k){
      return path_is_within(k, target.path) || path_is_within(target.path, k);
    });
  };
  selection.erase(std::remove_if(selection.begin(), selection.end(), touches_kept), selection.end());

  std::vector<std::string> doomed_dirs;
  for(const auto& target : selection) {
    if(target.kind == EntryKind::Directory) doomed_dirs.push_back(target.path);
  }
  auto covered = [&doomed_dirs](const SelectedPath& target) {
    return std::any_of(doomed_dirs.begin(), doomed_dirs.end(), [&target](const std::string& d){
      return d != target.path && path_is_within(target.path, d);
    });
  };
  selection.erase(std::remove_if(selection.begin(), selection.end(), covered), selection.end());
  return selection;
}

uint64_t SelectionPlanner::recoverable_space(const DuplicateReport& report) {
  uint64_t total = 0;
  for(const auto& selected : select_all_extras(report)) {
    total += path_size(selected.path);
  }
  return total;
}
