#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.hpp"

// SHA-256 content fingerprints for files and directories. Hashes are
// 64-character lowercase hex strings.
class ContentHasher {
public:
  static constexpr std::size_t kQuickHashBytes = 8192;
  static constexpr std::size_t kMinChunkSize = 64 * 1024;
  static constexpr std::size_t kDefaultChunkSize = 256 * 1024;

  explicit ContentHasher(std::size_t chunk_size = kDefaultChunkSize);

  // Digest of the whole file. Returns nullopt if `cancel` fires between two
  // chunk reads. Throws NotFoundError/PermissionError/IoError when the file
  // cannot be opened or read.
  std::optional<std::string> full_hash(const std::filesystem::path& path,
                                       const CancellationToken* cancel = nullptr) const;

  // Digest of the first kQuickHashBytes. Best effort: any I/O failure yields
  // empty_hash() instead of an exception.
  std::string quick_hash(const std::filesystem::path& path) const;

  // Order-invariant digest of a set of hashes. Empty entries are ignored.
  static std::string hash_of_hashes(std::vector<std::string> hashes);
  static const std::string& empty_hash();

  std::size_t chunk_size() const { return chunk_size_; }
  uint64_t full_hash_calls() const { return full_calls_.load(); }
  uint64_t quick_hash_calls() const { return quick_calls_.load(); }

private:
  std::size_t chunk_size_;
  mutable std::atomic<uint64_t> full_calls_{0};
  mutable std::atomic<uint64_t> quick_calls_{0};
};
