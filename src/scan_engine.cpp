#include "scan_engine.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "errors.hpp"

namespace fs = std::filesystem;

namespace {

// Absolute, normalized, without a trailing separator, so that
// file.parent_path() lines up with the directory records.
fs::path normalize_root(const fs::path& root) {
  std::error_code ec;
  fs::path out = fs::absolute(root, ec);
  if(ec) out = root;
  out = out.lexically_normal();
  if(!out.has_filename() && out.has_parent_path() && out != out.root_path()) {
    out = out.parent_path();
  }
  return out;
}

std::vector<fs::path> list_sorted(const fs::path& dir, std::error_code& ec) {
  std::vector<fs::path> out;
  fs::directory_iterator it(dir, ec);
  if(ec) return out;
  for(; it != fs::directory_iterator(); it.increment(ec)) {
    if(ec) return out;
    out.push_back(it->path());
  }
  std::sort(out.begin(), out.end(),
            [](const fs::path& a, const fs::path& b){ return a.filename() < b.filename(); });
  return out;
}

} // namespace

const char* scan_phase_name(ScanPhase phase) {
  switch(phase) {
    case ScanPhase::Idle: return "idle";
    case ScanPhase::Collecting: return "collecting";
    case ScanPhase::HashingSmall: return "hashing";
    case ScanPhase::QuickHashing: return "quick-hashing";
    case ScanPhase::FullHashing: return "full-hashing";
    case ScanPhase::DirHashing: return "dir-hashing";
    case ScanPhase::Flushing: return "flushing";
    case ScanPhase::Done: return "done";
    case ScanPhase::Cancelled: return "cancelled";
  }
  return "unknown";
}

ScanEngine::ScanEngine(std::shared_ptr<DuplicateIndex> index,
                       Options options,
                       std::shared_ptr<Logger> logger)
  : index_(std::move(index)),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("scan-engine")),
    hasher_(options.chunk_size),
    cancel_(std::make_shared<CancellationToken>()) {
  if(!index_) throw std::invalid_argument("ScanEngine requires an index");
}

ScanEngine::~ScanEngine() {
  if(worker_.joinable()) {
    request_stop();
    worker_.join();
  }
}

void ScanEngine::reset_counters() {
  file_count_ = 0;
  dir_count_ = 0;
  error_count_ = 0;
  quick_hash_count_ = 0;
  full_hash_count_ = 0;
  size_unique_skipped_ = 0;
  quick_unique_skipped_ = 0;
  since_checkpoint_ = 0;
  std::lock_guard<std::mutex> lock(skipped_mutex_);
  skipped_items_.clear();
}

void ScanEngine::set_phase(ScanPhase phase) {
  phase_.store(phase);
  logger_->debug("phase: {}", scan_phase_name(phase));
}

void ScanEngine::record_skip(const fs::path& path, const std::string& reason) {
  ++error_count_;
  {
    std::lock_guard<std::mutex> lock(skipped_mutex_);
    if(skipped_items_.size() < options_.max_skipped_items) {
      skipped_items_.push_back(path.string());
    }
  }
  logger_->debug("skipped {}: {}", path.string(), reason);
}

void ScanEngine::notify(ScanPhase phase, const fs::path& path) {
  HashObserver observer;
  {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer = observer_;
  }
  if(observer) observer(phase, path);
}

void ScanEngine::set_hash_observer(HashObserver observer) {
  std::lock_guard<std::mutex> lock(observer_mutex_);
  observer_ = std::move(observer);
}

std::optional<std::string> ScanEngine::hash_and_record(const fs::path& path, ScanPhase phase) {
  if(stopped()) return std::nullopt;
  notify(phase, path);
  try {
    auto hash = hasher_.full_hash(path, cancel_.get());
    if(!hash) return std::nullopt;
    ++full_hash_count_;
    ++file_count_;
    index_->insert(EntryKind::File, *hash, path.string());
    maybe_checkpoint();
    return hash;
  } catch(const IoError& e) {
    record_skip(path, e.what());
    return std::nullopt;
  }
}

void ScanEngine::maybe_checkpoint() {
  if(options_.checkpoint_interval == 0) return;
  if(++since_checkpoint_ < options_.checkpoint_interval) return;
  since_checkpoint_ = 0;
  try {
    index_->save();
  } catch(const IoError& e) {
    logger_->warn("checkpoint failed: {}", e.what());
  }
}

void ScanEngine::flush() {
  set_phase(ScanPhase::Flushing);
  index_->save();
  set_phase(stopped() ? ScanPhase::Cancelled : ScanPhase::Done);
}

void ScanEngine::scan_optimized(const fs::path& root_in, const WalkOptions& walk) {
  reset_counters();
  const fs::path root = normalize_root(root_in);

  set_phase(ScanPhase::Collecting);
  SizeIndexBuilder builder(logger_);
  SizeIndex collected;
  try {
    collected = builder.collect(root, walk, cancel_.get());
  } catch(const IoError&) {
    set_phase(ScanPhase::Idle);
    throw;
  }
  error_count_ += collected.error_count;
  dir_count_ = collected.directories.size();
  {
    std::lock_guard<std::mutex> lock(skipped_mutex_);
    for(const auto& p : collected.skipped) {
      if(skipped_items_.size() >= options_.max_skipped_items) break;
      skipped_items_.push_back(p.string());
    }
  }
  logger_->info("{}: {} candidate files in {} size groups",
                root.string(), collected.files.size(), collected.size_groups.size());

  std::unordered_map<std::string, std::string> file_hashes;
  std::vector<const std::vector<fs::path>*> large_groups;

  if(!stopped()) {
    set_phase(ScanPhase::HashingSmall);
    for(const auto& [size, paths] : collected.size_groups) {
      if(stopped()) break;
      if(paths.size() < 2) {
        size_unique_skipped_ += paths.size();
        file_count_ += paths.size();
        continue;
      }
      if(size > options_.large_file_threshold) {
        large_groups.push_back(&paths);
        continue;
      }
      for(const auto& p : paths) {
        if(stopped()) break;
        if(auto h = hash_and_record(p, ScanPhase::HashingSmall)) {
          file_hashes[p.string()] = *h;
        }
      }
    }
  }

  std::vector<fs::path> confirmed;
  if(!stopped() && !large_groups.empty()) {
    set_phase(ScanPhase::QuickHashing);
    for(const auto* group : large_groups) {
      if(stopped()) break;
      std::unordered_map<std::string, std::size_t> quick_counts;
      std::vector<std::string> quick_of(group->size());
      for(std::size_t i = 0; i < group->size() && !stopped(); ++i) {
        notify(ScanPhase::QuickHashing, (*group)[i]);
        quick_of[i] = hasher_.quick_hash((*group)[i]);
        ++quick_hash_count_;
        ++quick_counts[quick_of[i]];
      }
      if(stopped()) break;
      for(std::size_t i = 0; i < group->size(); ++i) {
        if(quick_counts[quick_of[i]] < 2) {
          ++quick_unique_skipped_;
          ++file_count_;
        } else {
          confirmed.push_back((*group)[i]);
        }
      }
    }
  }

  if(!stopped() && !confirmed.empty()) {
    set_phase(ScanPhase::FullHashing);
    for(const auto& p : confirmed) {
      if(stopped()) break;
      if(auto h = hash_and_record(p, ScanPhase::FullHashing)) {
        file_hashes[p.string()] = *h;
      }
    }
  }

  if(options_.include_dirs && !stopped()) {
    hash_directories(collected, file_hashes);
  }

  if(stopped()) {
    logger_->info("scan of {} stopped, keeping partial results", root.string());
  }
  flush();
  logger_->info("{}: hashed {} files ({} unique by size, {} unique by prefix), {} errors",
                root.string(), full_hash_count_.load(), size_unique_skipped_.load(),
                quick_unique_skipped_.load(), error_count_.load());
}

void ScanEngine::hash_directories(const SizeIndex& collected,
                                  std::unordered_map<std::string, std::string>& file_hashes) {
  set_phase(ScanPhase::DirHashing);

  std::unordered_map<std::string, std::vector<std::string>> child_hashes;
  for(const auto& file : collected.files) {
    if(stopped()) return;
    auto key = file.path.string();
    auto known = file_hashes.find(key);
    std::string hash;
    if(known != file_hashes.end()) {
      hash = known->second;
    } else {
      notify(ScanPhase::DirHashing, file.path);
      try {
        auto h = hasher_.full_hash(file.path, cancel_.get());
        if(!h) return;
        ++full_hash_count_;
        hash = *h;
        file_hashes.emplace(key, hash);
      } catch(const IoError& e) {
        record_skip(file.path, e.what());
        continue;
      }
    }
    child_hashes[file.path.parent_path().string()].push_back(hash);
  }

  // Deepest first, so every child directory is done before its parent.
  std::vector<const DirectoryRecord*> order;
  for(const auto& dir : collected.directories) {
    if(dir.descended) order.push_back(&dir);
  }
  std::stable_sort(order.begin(), order.end(),
                   [](const DirectoryRecord* a, const DirectoryRecord* b){ return a->depth > b->depth; });

  for(const auto* dir : order) {
    if(stopped()) return;
    auto it = child_hashes.find(dir->path.string());
    std::vector<std::string> children;
    if(it != child_hashes.end()) children = std::move(it->second);
    auto hash = ContentHasher::hash_of_hashes(std::move(children));
    index_->insert(EntryKind::Directory, hash, dir->path.string());
    if(dir->depth > 0) {
      child_hashes[dir->path.parent_path().string()].push_back(hash);
    }
  }
}

std::optional<std::string> ScanEngine::recursive_hash(const fs::path& path) {
  reset_counters();
  const fs::path root = normalize_root(path);
  auto store = index_->store_path();
  auto store_tmp = store;
  store_tmp += ".tmp";
  const auto is_store_file = [&](const fs::path& p) {
    return fs::absolute(p).lexically_normal() == fs::absolute(store).lexically_normal() ||
           fs::absolute(p).lexically_normal() == fs::absolute(store_tmp).lexically_normal();
  };

  std::error_code ec;
  auto status = fs::symlink_status(root, ec);
  if(ec || !fs::exists(status)) {
    record_skip(root, ec ? ec.message() : "does not exist");
    return std::nullopt;
  }

  if(fs::is_regular_file(status)) {
    set_phase(ScanPhase::FullHashing);
    auto hash = hash_and_record(root, ScanPhase::FullHashing);
    flush();
    return hash;
  }

  struct Frame {
    fs::path dir;
    std::vector<fs::path> children;
    std::size_t next = 0;
    std::vector<std::string> hashes;
  };

  set_phase(ScanPhase::FullHashing);
  std::vector<Frame> stack;
  {
    auto children = list_sorted(root, ec);
    if(ec) {
      record_skip(root, ec.message());
      set_phase(ScanPhase::Idle);
      return std::nullopt;
    }
    stack.push_back({root, std::move(children), 0, {}});
  }

  std::optional<std::string> result;
  while(!stack.empty()) {
    if(stopped()) break;
    Frame& top = stack.back();

    if(top.next < top.children.size()) {
      fs::path child = top.children[top.next++];
      if(is_store_file(child)) continue;
      std::error_code child_ec;
      auto child_status = fs::symlink_status(child, child_ec);
      if(child_ec || !fs::exists(child_status)) {
        record_skip(child, child_ec ? child_ec.message() : "vanished");
        continue;
      }
      if(fs::is_symlink(child_status)) continue;
      if(fs::is_regular_file(child_status)) {
        if(auto h = hash_and_record(child, ScanPhase::FullHashing)) {
          top.hashes.push_back(*h);
        }
      } else if(fs::is_directory(child_status)) {
        auto grandchildren = list_sorted(child, child_ec);
        if(child_ec) {
          record_skip(child, child_ec.message());
          continue;
        }
        stack.push_back({child, std::move(grandchildren), 0, {}});
      }
      continue;
    }

    auto dir_hash = ContentHasher::hash_of_hashes(std::move(top.hashes));
    index_->insert(EntryKind::Directory, dir_hash, top.dir.string());
    ++dir_count_;
    maybe_checkpoint();
    stack.pop_back();
    if(stack.empty()) {
      result = dir_hash;
    } else {
      stack.back().hashes.push_back(dir_hash);
    }
  }

  flush();
  if(stopped()) return std::nullopt;
  return result;
}

ScanEngine::ItemCounts ScanEngine::count_items(const fs::path& root) {
  ItemCounts counts;
  std::error_code ec;
  auto status = fs::symlink_status(root, ec);
  if(ec) return counts;
  if(fs::is_regular_file(status)) {
    counts.files = 1;
    return counts;
  }
  if(!fs::is_directory(status)) return counts;

  std::vector<fs::path> stack{root};
  while(!stack.empty()) {
    fs::path dir = std::move(stack.back());
    stack.pop_back();
    ++counts.dirs;
    std::error_code list_ec;
    fs::directory_iterator it(dir, list_ec);
    if(list_ec) continue;
    for(; it != fs::directory_iterator(); it.increment(list_ec)) {
      if(list_ec) break;
      std::error_code entry_ec;
      auto entry_status = it->symlink_status(entry_ec);
      if(entry_ec || fs::is_symlink(entry_status)) continue;
      if(fs::is_directory(entry_status)) {
        stack.push_back(it->path());
      } else if(fs::is_regular_file(entry_status)) {
        ++counts.files;
      }
    }
  }
  return counts;
}

bool ScanEngine::start_background(const fs::path& root, const WalkOptions& walk) {
  if(running_.exchange(true)) return false;
  if(worker_.joinable()) worker_.join();
  cancel_->reset();
  {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_.reset();
  }
  worker_ = std::thread([this, root, walk](){
    try {
      scan_optimized(root, walk);
    } catch(const std::exception& e) {
      logger_->error("scan of {} failed: {}", root.string(), e.what());
      std::lock_guard<std::mutex> lock(error_mutex_);
      last_error_ = e.what();
    }
    running_ = false;
  });
  return true;
}

void ScanEngine::wait() {
  if(worker_.joinable()) worker_.join();
}

std::optional<std::string> ScanEngine::last_error() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_error_;
}

ScanEngine::Stats ScanEngine::stats() const {
  Stats s;
  s.phase = phase_.load();
  s.file_count = file_count_.load();
  s.dir_count = dir_count_.load();
  s.error_count = error_count_.load();
  s.quick_hash_count = quick_hash_count_.load();
  s.full_hash_count = full_hash_count_.load();
  s.size_unique_skipped = size_unique_skipped_.load();
  s.quick_unique_skipped = quick_unique_skipped_.load();
  std::lock_guard<std::mutex> lock(skipped_mutex_);
  s.skipped_items = skipped_items_;
  return s;
}
