#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

class DupescanError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Failure touching the filesystem. Carries the offending path.
class IoError : public DupescanError {
public:
  IoError(const std::string& message, std::filesystem::path path)
    : DupescanError(message + ": " + path.string()), path_(std::move(path)) {}

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

class NotFoundError : public IoError {
public:
  using IoError::IoError;
};

class PermissionError : public IoError {
public:
  using IoError::IoError;
};

// Persisted index could not be parsed. Only raised inside the index loader,
// which recovers by starting empty.
class CorruptStateError : public DupescanError {
public:
  using DupescanError::DupescanError;
};

// Maps an error_code from std::filesystem onto the taxonomy above and throws.
[[noreturn]] inline void throw_io_error(const std::error_code& ec,
                                        const std::string& what,
                                        const std::filesystem::path& path) {
  if(ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
    throw NotFoundError(what + " (" + ec.message() + ")", path);
  }
  if(ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    throw PermissionError(what + " (" + ec.message() + ")", path);
  }
  throw IoError(what + " (" + ec.message() + ")", path);
}
