#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>

#include "duplicate_index.hpp"

enum class FileTypeCategory { All, Images, Videos, Documents, Audio, Archives, Code };
enum class PathSortKey { None, Size, Name, Date, Path };
enum class GroupSortKey { None, GroupSize, Count };

struct FilterOptions {
  FileTypeCategory file_type = FileTypeCategory::All;
  uint64_t min_size = 0;
  std::string search;
  bool case_sensitive = false;
  PathSortKey sort_by = PathSortKey::Size;
  bool reverse = true; // descending: largest, newest, Z first
};

// Narrows and orders a DuplicateReport for display. Size and mtime lookups
// that fail count as 0.
class ResultFilterSort {
public:
  static DuplicateReport filter(const DuplicateReport& report, const FilterOptions& options);
  static DuplicateReport sort_groups(const DuplicateReport& report, GroupSortKey key);

  static std::vector<std::string> filter_paths(std::vector<std::string> paths,
                                               EntryKind kind,
                                               const FilterOptions& options);
  static void sort_paths(std::vector<std::string>& paths, PathSortKey key, bool reverse);

  static const std::unordered_set<std::string>& extensions_for(FileTypeCategory category);
  static bool matches_category(const std::string& path, FileTypeCategory category);

  // Unknown names map to All.
  static FileTypeCategory parse_file_type(const std::string& name);
  static std::optional<PathSortKey> parse_sort_key(const std::string& name);
  static std::optional<GroupSortKey> parse_group_sort_key(const std::string& name);
  static const char* file_type_name(FileTypeCategory category);

  static int64_t modified_time(const std::string& path);
};
