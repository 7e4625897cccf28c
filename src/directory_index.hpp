#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>

class FileSystem;
class Logger;

// Numeric view of one DCIM-style tree. Construct, then scan() once; every
// query before the first scan throws std::logic_error.
class DirectoryIndex {
public:
  using FileSet = std::set<std::string>;
  using FileMap = std::map<int, FileSet>;

  DirectoryIndex(std::filesystem::path root_path, FileSystem& fs, Logger* logger = nullptr);

  // Throws FileSystemError when the root or a numbered directory can't be listed.
  void scan();

  // Puts the index in the scanned state with no content, for a destination
  // root that doesn't exist yet.
  void mark_empty();

  bool scanned() const { return scanned_; }
  const std::filesystem::path& root_path() const { return root_path_; }

  // Every recognized numbered directory, empty ones included.
  const std::map<int, std::string>& dir_names() const;
  // Only directories holding at least one recognized file.
  const std::map<int, FileMap>& dir_files() const;

  bool has_uppercase() const;
  bool has_lowercase() const;

  // Null when the directory number is unknown.
  const std::string* dir_name(int dir_number) const;
  // Null when the directory holds no recognized files.
  const FileMap* files_in(int dir_number) const;

private:
  void require_scanned() const;
  void note_casing(const std::string& name);

  std::filesystem::path root_path_;
  FileSystem& fs_;
  Logger* logger_ = nullptr;
  std::map<int, std::string> dir_names_;
  std::map<int, FileMap> dir_files_;
  bool has_uppercase_ = false;
  bool has_lowercase_ = false;
  bool scanned_ = false;
};
