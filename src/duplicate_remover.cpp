#include "duplicate_remover.hpp"

#include <filesystem>
#include <system_error>

#include "errors.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

DuplicateRemover::DuplicateRemover(std::shared_ptr<DuplicateIndex> index,
                                   Options options,
                                   std::shared_ptr<Logger> logger)
  : index_(std::move(index)),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("remover")) {
  if(!index_) throw std::invalid_argument("DuplicateRemover requires an index");
}

bool DuplicateRemover::remove_one(const std::string& path, DeletionReport& report) {
  std::error_code ec;
  auto status = fs::symlink_status(path, ec);
  if(ec || !fs::exists(status)) {
    // Gone already; drop the stale record so it is not reported again.
    if(!options_.dry_run) {
      index_->remove_path(path);
      index_->remove_under(path);
    }
    report.failures.emplace_back(path, "not found");
    return false;
  }

  uint64_t size = path_size(path);
  if(options_.dry_run) {
    report.deleted.push_back(path);
    report.bytes_freed += size;
    return true;
  }

  const bool is_dir = fs::is_directory(status);
  if(is_dir) {
    fs::remove_all(path, ec);
  } else {
    fs::remove(path, ec);
  }
  if(ec) {
    report.failures.emplace_back(path, ec.message());
    logger_->warn("failed to delete {}: {}", path, ec.message());
    return false;
  }

  index_->remove_path(path);
  if(is_dir) {
    auto forgotten = index_->remove_under(path);
    if(forgotten > 0) logger_->debug("dropped {} indexed path(s) under {}", forgotten, path);
  }
  report.deleted.push_back(path);
  report.bytes_freed += size;
  logger_->debug("deleted {} ({})", path, format_size(size));
  return true;
}

DeletionReport DuplicateRemover::remove(const std::vector<std::string>& paths) {
  DeletionReport report;
  report.dry_run = options_.dry_run;
  for(const auto& p : paths) {
    remove_one(p, report);
  }
  if(!options_.dry_run && (!report.deleted.empty() || !report.failures.empty())) {
    index_->save();
  }
  logger_->info("{} {} item(s), freed {}, {} failure(s)",
                options_.dry_run ? "would delete" : "deleted",
                report.deleted.size(), format_size(report.bytes_freed), report.failures.size());
  return report;
}

DeletionReport DuplicateRemover::remove_group_extras(EntryKind kind, const std::string& hash) {
  auto members = index_->members(kind, hash);
  if(members.size() < 2) return DeletionReport{{}, {}, 0, options_.dry_run};
  members.erase(members.begin());
  return remove(members);
}
