#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "duplicate_index.hpp"
#include "log.hpp"

struct DeletionReport {
  std::vector<std::string> deleted;
  std::vector<std::pair<std::string, std::string>> failures; // path, reason
  uint64_t bytes_freed = 0;
  bool dry_run = false;
};

// Deletes redundant copies and keeps the index in step: every removal from
// disk is followed by remove_path before the next path is touched.
class DuplicateRemover {
public:
  struct Options {
    bool dry_run = false;
  };

  DuplicateRemover(std::shared_ptr<DuplicateIndex> index,
                   Options options,
                   std::shared_ptr<Logger> logger = nullptr);

  // Failures are reported per path and never stop the batch. The index is
  // saved once at the end; a failing save throws IoError.
  DeletionReport remove(const std::vector<std::string>& paths);

  // Deletes every member of the bucket except its canonical member.
  DeletionReport remove_group_extras(EntryKind kind, const std::string& hash);

private:
  bool remove_one(const std::string& path, DeletionReport& report);

  std::shared_ptr<DuplicateIndex> index_;
  Options options_;
  std::shared_ptr<Logger> logger_;
};
