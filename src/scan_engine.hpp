#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "cancellation.hpp"
#include "content_hasher.hpp"
#include "duplicate_index.hpp"
#include "log.hpp"
#include "size_index_builder.hpp"

enum class ScanPhase {
  Idle,
  Collecting,
  HashingSmall,
  QuickHashing,
  FullHashing,
  DirHashing,
  Flushing,
  Done,
  Cancelled
};

const char* scan_phase_name(ScanPhase phase);

class ScanEngine {
public:
  struct Options {
    uint64_t large_file_threshold = 1024 * 1024;
    std::size_t chunk_size = ContentHasher::kDefaultChunkSize;
    bool include_dirs = false;
    std::size_t checkpoint_interval = 0; // full hashes between flushes; 0 = end only
    std::size_t max_skipped_items = 1000;
  };

  struct Stats {
    ScanPhase phase = ScanPhase::Idle;
    std::size_t file_count = 0;
    std::size_t dir_count = 0;
    std::size_t error_count = 0;
    std::size_t quick_hash_count = 0;
    std::size_t full_hash_count = 0;
    std::size_t size_unique_skipped = 0;
    std::size_t quick_unique_skipped = 0;
    std::vector<std::string> skipped_items;
  };

  struct ItemCounts {
    std::size_t files = 0;
    std::size_t dirs = 0;
  };

  // Called right before a file is quick- or full-hashed.
  using HashObserver = std::function<void(ScanPhase, const std::filesystem::path&)>;

  ScanEngine(std::shared_ptr<DuplicateIndex> index,
             Options options,
             std::shared_ptr<Logger> logger = nullptr);
  ~ScanEngine();

  ScanEngine(const ScanEngine&) = delete;
  ScanEngine& operator=(const ScanEngine&) = delete;

  // Size pre-filter + quick/full hashing. Partial results are kept and
  // flushed when the scan is stopped. Throws if the root is inaccessible or
  // the final flush fails.
  void scan_optimized(const std::filesystem::path& root, const WalkOptions& walk);

  // Hashes every file and directory under `path` unconditionally. Returns
  // nullopt when stopped or when `path` itself could not be hashed.
  std::optional<std::string> recursive_hash(const std::filesystem::path& path);

  static ItemCounts count_items(const std::filesystem::path& root);

  // Runs scan_optimized on a worker thread. Returns false if one is running.
  bool start_background(const std::filesystem::path& root, const WalkOptions& walk);
  void wait();
  bool running() const { return running_.load(); }
  std::optional<std::string> last_error() const;

  void request_stop() { cancel_->request_stop(); }
  std::shared_ptr<CancellationToken> cancellation() const { return cancel_; }

  Stats stats() const;
  ScanPhase phase() const { return phase_.load(); }
  void set_hash_observer(HashObserver observer);

  std::shared_ptr<DuplicateIndex> index() const { return index_; }
  const ContentHasher& hasher() const { return hasher_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  void reset_counters();
  void set_phase(ScanPhase phase);
  void record_skip(const std::filesystem::path& path, const std::string& reason);
  void notify(ScanPhase phase, const std::filesystem::path& path);
  std::optional<std::string> hash_and_record(const std::filesystem::path& path, ScanPhase phase);
  void maybe_checkpoint();
  void flush();
  bool stopped() const { return cancel_->stop_requested(); }

  void hash_directories(const SizeIndex& collected,
                        std::unordered_map<std::string, std::string>& file_hashes);

  std::shared_ptr<DuplicateIndex> index_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  ContentHasher hasher_;
  std::shared_ptr<CancellationToken> cancel_;

  std::atomic<ScanPhase> phase_{ScanPhase::Idle};
  std::atomic<std::size_t> file_count_{0};
  std::atomic<std::size_t> dir_count_{0};
  std::atomic<std::size_t> error_count_{0};
  std::atomic<std::size_t> quick_hash_count_{0};
  std::atomic<std::size_t> full_hash_count_{0};
  std::atomic<std::size_t> size_unique_skipped_{0};
  std::atomic<std::size_t> quick_unique_skipped_{0};
  std::size_t since_checkpoint_ = 0;

  mutable std::mutex skipped_mutex_;
  std::vector<std::string> skipped_items_;

  mutable std::mutex observer_mutex_;
  HashObserver observer_;

  std::thread worker_;
  std::atomic<bool> running_{false};
  mutable std::mutex error_mutex_;
  std::optional<std::string> last_error_;
};
