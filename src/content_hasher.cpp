#include "content_hasher.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <system_error>

#include "errors.hpp"
#include "utils.hpp"

namespace {

std::string finish_hex(SHA256_CTX& ctx) {
  std::vector<unsigned char> digest(SHA256_DIGEST_LENGTH);
  SHA256_Final(digest.data(), &ctx);
  return hex_from_bytes(digest);
}

} // namespace

ContentHasher::ContentHasher(std::size_t chunk_size)
  : chunk_size_(std::max(chunk_size, kMinChunkSize)) {}

const std::string& ContentHasher::empty_hash() {
  static const std::string value = sha256_hex(std::string());
  return value;
}

std::optional<std::string> ContentHasher::full_hash(const std::filesystem::path& path,
                                                    const CancellationToken* cancel) const {
  full_calls_.fetch_add(1, std::memory_order_relaxed);

  std::error_code ec;
  auto status = std::filesystem::status(path, ec);
  if(ec) throw_io_error(ec, "cannot stat file", path);
  if(!std::filesystem::is_regular_file(status)) {
    throw IoError("not a regular file", path);
  }

  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw_io_error(std::error_code(errno ? errno : EACCES, std::generic_category()),
                   "cannot open file", path);
  }

  SHA256_CTX ctx;
  if(SHA256_Init(&ctx) != 1) throw IoError("SHA256_Init failed", path);

  std::vector<char> buffer(chunk_size_);
  while(in) {
    if(is_cancelled(cancel)) return std::nullopt;
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize read = in.gcount();
    if(read > 0) {
      SHA256_Update(&ctx, reinterpret_cast<const unsigned char*>(buffer.data()),
                    static_cast<size_t>(read));
    }
  }
  if(in.bad()) {
    throw IoError("read failed", path);
  }
  return finish_hex(ctx);
}

std::string ContentHasher::quick_hash(const std::filesystem::path& path) const {
  quick_calls_.fetch_add(1, std::memory_order_relaxed);

  std::ifstream in(path, std::ios::binary);
  if(!in) return empty_hash();

  std::vector<char> buffer(kQuickHashBytes);
  in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  if(in.bad()) return empty_hash();
  buffer.resize(static_cast<std::size_t>(in.gcount()));
  return sha256_hex(std::string(buffer.begin(), buffer.end()));
}

std::string ContentHasher::hash_of_hashes(std::vector<std::string> hashes) {
  hashes.erase(std::remove_if(hashes.begin(), hashes.end(),
                              [](const std::string& h){ return h.empty(); }),
               hashes.end());
  std::sort(hashes.begin(), hashes.end());

  SHA256_CTX ctx;
  SHA256_Init(&ctx);
  for(const auto& h : hashes) {
    SHA256_Update(&ctx, reinterpret_cast<const unsigned char*>(h.data()), h.size());
  }
  return finish_hex(ctx);
}
