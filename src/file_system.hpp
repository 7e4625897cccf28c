#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

class FileSystemError : public std::runtime_error {
public:
  FileSystemError(const std::string& operation,
                  const std::filesystem::path& path,
                  const std::error_code& ec);

  const std::filesystem::path& path() const { return path_; }
  const std::error_code& code() const { return code_; }

private:
  std::filesystem::path path_;
  std::error_code code_;
};

// Everything the sync core needs from the disk. Failures throw
// FileSystemError; the query calls report "absent" instead of throwing.
class FileSystem {
public:
  virtual ~FileSystem() = default;

  // Names of the entries directly under path, sorted.
  virtual std::vector<std::string> list_entries(const std::filesystem::path& path) = 0;
  virtual bool is_directory(const std::filesystem::path& path) = 0;
  virtual void create_directory(const std::filesystem::path& path) = 0;
  virtual bool file_exists(const std::filesystem::path& path) = 0;
  virtual std::uintmax_t file_size(const std::filesystem::path& path) = 0;
  virtual void copy_bytes(const std::filesystem::path& source,
                          const std::filesystem::path& destination) = 0;
};

class LocalFileSystem : public FileSystem {
public:
  std::vector<std::string> list_entries(const std::filesystem::path& path) override;
  bool is_directory(const std::filesystem::path& path) override;
  void create_directory(const std::filesystem::path& path) override;
  bool file_exists(const std::filesystem::path& path) override;
  std::uintmax_t file_size(const std::filesystem::path& path) override;
  void copy_bytes(const std::filesystem::path& source,
                  const std::filesystem::path& destination) override;
};
