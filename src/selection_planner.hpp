#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "duplicate_index.hpp"

struct SelectedPath {
  EntryKind kind = EntryKind::File;
  std::string hash;
  std::string path;
};

// Decides which members of each group are redundant. The canonical member of
// a group is never selected.
class SelectionPlanner {
public:
  static std::vector<SelectedPath> select_all_extras(const DuplicateReport& report);

  // Prefers extras that live under temp/cache/download/trash-like folders;
  // falls back to the most deeply nested extras of the group.
  static std::vector<SelectedPath> smart_select(const DuplicateReport& report);

  static uint64_t recoverable_space(const DuplicateReport& report);

  // Canonical member of every group, files and directories.
  static std::vector<std::string> kept_members(const DuplicateReport& report);

  // Removes targets whose deletion would also delete or alter a kept path
  // (a directory holding one, or anything inside a kept directory), and
  // targets already beneath a selected directory.
  static std::vector<SelectedPath> drop_unsafe(std::vector<SelectedPath> selection,
                                               const std::vector<std::string>& kept);

  static bool is_disposable_location(const std::string& path);
  static std::size_t path_depth(const std::string& path);
};
