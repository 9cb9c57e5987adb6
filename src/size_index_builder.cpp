#include "size_index_builder.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "errors.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

SizeIndexBuilder::SizeIndexBuilder(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

bool SizeIndexBuilder::is_hidden(const fs::path& path) {
  auto name = path.filename().string();
  return !name.empty() && name[0] == '.' && name != "." && name != "..";
}

bool SizeIndexBuilder::is_excluded(const fs::path& dir, const WalkOptions& options) {
  const auto name = dir.filename().string();
  const auto full = dir.string();
  for(const auto& pattern : options.exclude_folders) {
    if(pattern.empty()) continue;
    if(contains_icase(name, pattern) || contains_icase(full, pattern)) return true;
  }
  return false;
}

bool SizeIndexBuilder::passes_type_filter(const fs::path& file, const WalkOptions& options) {
  if(options.file_type_allow_list.empty()) return true;
  return options.file_type_allow_list.count(normalize_extension(file.extension().string())) > 0;
}

SizeIndex SizeIndexBuilder::collect(const fs::path& root,
                                    const WalkOptions& options,
                                    const CancellationToken* cancel) const {
  SizeIndex out;
  Logger* log = logger_.get();

  auto skip = [&](const fs::path& p, const std::error_code& ec) {
    ++out.error_count;
    out.skipped.push_back(p);
    log_debug(log, "skipping {}: {}", p.string(), ec.message());
  };

  auto admit_file = [&](const fs::path& p, uint64_t size) {
    if(size < options.min_size_bytes) return;
    if(!passes_type_filter(p, options)) return;
    out.size_groups[size].push_back(p);
    out.files.push_back({p, size});
  };

  std::error_code ec;
  auto root_status = fs::status(root, ec);
  if(ec) throw_io_error(ec, "cannot access scan root", root);

  if(fs::is_regular_file(root_status)) {
    auto size = fs::file_size(root, ec);
    if(ec) throw_io_error(ec, "cannot stat scan root", root);
    admit_file(root, size);
    return out;
  }
  if(!fs::is_directory(root_status)) {
    throw IoError("scan root is neither a file nor a directory", root);
  }

  // Probe the root so an unreadable root is a hard failure, not a skip.
  { fs::directory_iterator probe(root, ec); }
  if(ec) throw_io_error(ec, "cannot list scan root", root);

  std::vector<std::pair<fs::path, std::size_t>> stack;
  stack.emplace_back(root, 0);

  while(!stack.empty()) {
    if(is_cancelled(cancel)) {
      out.cancelled = true;
      break;
    }
    auto [dir, depth] = std::move(stack.back());
    stack.pop_back();

    bool descend = depth == 0 || options.scan_subfolders;
    out.directories.push_back({dir, depth, descend});
    if(!descend) continue;

    std::vector<fs::directory_entry> entries;
    fs::directory_iterator it(dir, ec);
    if(ec) {
      skip(dir, ec);
      out.directories.back().descended = false;
      continue;
    }
    for(; it != fs::directory_iterator(); it.increment(ec)) {
      if(ec) break;
      entries.push_back(*it);
    }
    if(ec) {
      skip(dir, ec);
      ec.clear();
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b){
                return a.path().filename() < b.path().filename();
              });

    std::vector<fs::path> subdirs;
    for(const auto& entry : entries) {
      if(is_cancelled(cancel)) break;
      const auto& p = entry.path();
      if(!options.include_hidden && is_hidden(p)) continue;

      std::error_code entry_ec;
      auto status = entry.symlink_status(entry_ec);
      if(entry_ec) {
        skip(p, entry_ec);
        continue;
      }
      if(fs::is_symlink(status)) continue;

      if(fs::is_directory(status)) {
        if(is_excluded(p, options)) {
          log_debug(log, "excluded folder {}", p.string());
          continue;
        }
        subdirs.push_back(p);
      } else if(fs::is_regular_file(status)) {
        auto size = entry.file_size(entry_ec);
        if(entry_ec) {
          skip(p, entry_ec);
          continue;
        }
        admit_file(p, size);
      }
    }

    for(auto rit = subdirs.rbegin(); rit != subdirs.rend(); ++rit) {
      stack.emplace_back(*rit, depth + 1);
    }
  }

  log_debug(log, "collected {} files in {} size groups, {} directories ({} errors)",
            out.files.size(), out.size_groups.size(), out.directories.size(), out.error_count);
  return out;
}
