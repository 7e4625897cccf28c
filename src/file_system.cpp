#include "file_system.hpp"

#include <algorithm>

namespace fs = std::filesystem;

FileSystemError::FileSystemError(const std::string& operation,
                                 const fs::path& path,
                                 const std::error_code& ec)
  : std::runtime_error(operation + " '" + path.string() + "': " + ec.message()),
    path_(path),
    code_(ec) {}

std::vector<std::string> LocalFileSystem::list_entries(const fs::path& path) {
  std::error_code ec;
  fs::directory_iterator it(path, ec);
  if(ec) throw FileSystemError("Unable to list", path, ec);

  std::vector<std::string> names;
  for(; it != fs::directory_iterator(); it.increment(ec)) {
    names.push_back(it->path().filename().string());
  }
  if(ec) throw FileSystemError("Error while listing", path, ec);

  std::sort(names.begin(), names.end());
  return names;
}

bool LocalFileSystem::is_directory(const fs::path& path) {
  std::error_code ec;
  return fs::is_directory(path, ec);
}

void LocalFileSystem::create_directory(const fs::path& path) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if(ec) throw FileSystemError("Unable to create directory", path, ec);
}

bool LocalFileSystem::file_exists(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

std::uintmax_t LocalFileSystem::file_size(const fs::path& path) {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if(ec) return 0;
  return size;
}

void LocalFileSystem::copy_bytes(const fs::path& source, const fs::path& destination) {
  std::error_code ec;
  // a zero-byte leftover at the destination is overwritten
  fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
  if(ec) throw FileSystemError("Unable to copy to", destination, ec);
}
