#include "directory_index.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "file_system.hpp"
#include "log.hpp"
#include "name_parser.hpp"

namespace {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
  return value;
}

} // namespace

DirectoryIndex::DirectoryIndex(std::filesystem::path root_path, FileSystem& fs, Logger* logger)
  : root_path_(std::move(root_path)), fs_(fs), logger_(logger) {}

void DirectoryIndex::scan() {
  dir_names_.clear();
  dir_files_.clear();
  has_uppercase_ = false;
  has_lowercase_ = false;
  scanned_ = false;

  log_debug(logger_, "Scanning {}", root_path_.string());

  // list_entries() is sorted, so on a number collision the
  // lexicographically greatest name is the one that sticks
  for(const auto& entry : fs_.list_entries(root_path_)) {
    auto subdir = match_subdir(entry);
    if(!subdir) continue;
    if(!fs_.is_directory(root_path_ / entry)) continue;
    auto existing = dir_names_.find(subdir->number);
    if(existing != dir_names_.end()) {
      log_warn(logger_, "{}: '{}' and '{}' share directory number {}, using '{}'",
               root_path_.string(), existing->second, entry, subdir->number, entry);
    }
    dir_names_[subdir->number] = subdir->name;
  }

  for(const auto& [dir_number, dir_name] : dir_names_) {
    FileMap files;
    for(const auto& entry : fs_.list_entries(root_path_ / dir_name)) {
      auto file = match_file(entry);
      if(!file) {
        log_trace(logger_, "Ignoring {}/{}", dir_name, entry);
        continue;
      }
      files[file->number].insert(entry);
      note_casing(entry);
    }
    if(files.empty()) {
      log_debug(logger_, "{}/{} holds no numbered files", root_path_.string(), dir_name);
      continue;
    }
    note_casing(dir_name);
    log_trace(logger_, "{}/{}: {} file numbers ({}..{})",
              root_path_.string(), dir_name, files.size(),
              files.begin()->first, files.rbegin()->first);
    dir_files_.emplace(dir_number, std::move(files));
  }

  scanned_ = true;
  log_debug(logger_, "{}: {} numbered directories, {} with files",
            root_path_.string(), dir_names_.size(), dir_files_.size());
}

void DirectoryIndex::mark_empty() {
  dir_names_.clear();
  dir_files_.clear();
  has_uppercase_ = false;
  has_lowercase_ = false;
  scanned_ = true;
}

void DirectoryIndex::note_casing(const std::string& name) {
  if(name != to_lower(name)) has_uppercase_ = true;
  if(name != to_upper(name)) has_lowercase_ = true;
}

void DirectoryIndex::require_scanned() const {
  if(!scanned_) {
    throw std::logic_error("DirectoryIndex for '" + root_path_.string() + "' queried before scan()");
  }
}

const std::map<int, std::string>& DirectoryIndex::dir_names() const {
  require_scanned();
  return dir_names_;
}

const std::map<int, DirectoryIndex::FileMap>& DirectoryIndex::dir_files() const {
  require_scanned();
  return dir_files_;
}

bool DirectoryIndex::has_uppercase() const {
  require_scanned();
  return has_uppercase_;
}

bool DirectoryIndex::has_lowercase() const {
  require_scanned();
  return has_lowercase_;
}

const std::string* DirectoryIndex::dir_name(int dir_number) const {
  require_scanned();
  auto it = dir_names_.find(dir_number);
  return it == dir_names_.end() ? nullptr : &it->second;
}

const DirectoryIndex::FileMap* DirectoryIndex::files_in(int dir_number) const {
  require_scanned();
  auto it = dir_files_.find(dir_number);
  return it == dir_files_.end() ? nullptr : &it->second;
}
