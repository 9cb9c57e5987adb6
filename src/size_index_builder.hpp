#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "cancellation.hpp"
#include "log.hpp"

struct WalkOptions {
  std::vector<std::string> exclude_folders;          // case-insensitive substrings
  std::unordered_set<std::string> file_type_allow_list; // normalized ".ext"; empty = all
  uint64_t min_size_bytes = 0;
  bool scan_subfolders = true;
  bool include_hidden = false;
};

struct DirectoryRecord {
  std::filesystem::path path;
  std::size_t depth = 0;   // root is 0
  bool descended = false;  // children were listed
};

struct CollectedFile {
  std::filesystem::path path;
  uint64_t size = 0;
};

struct SizeIndex {
  // size -> files of that size, in discovery order
  std::map<uint64_t, std::vector<std::filesystem::path>> size_groups;
  std::vector<DirectoryRecord> directories;
  std::vector<CollectedFile> files;
  std::vector<std::filesystem::path> skipped;
  std::size_t error_count = 0;
  bool cancelled = false;
};

// Walks a tree and buckets admitted files by size without reading them.
class SizeIndexBuilder {
public:
  explicit SizeIndexBuilder(std::shared_ptr<Logger> logger = nullptr);

  // Throws NotFoundError/PermissionError if `root` itself cannot be listed.
  SizeIndex collect(const std::filesystem::path& root,
                    const WalkOptions& options,
                    const CancellationToken* cancel = nullptr) const;

  static bool is_hidden(const std::filesystem::path& path);
  static bool is_excluded(const std::filesystem::path& dir, const WalkOptions& options);
  static bool passes_type_filter(const std::filesystem::path& file, const WalkOptions& options);

private:
  std::shared_ptr<Logger> logger_;
};
