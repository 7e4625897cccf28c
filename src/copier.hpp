#pragma once

#include <cstddef>

#include "case_fold.hpp"
#include "sync_planner.hpp"

class DirectoryIndex;
class FileSystem;
class Logger;

struct CopyStats {
  std::size_t copied = 0;
  std::size_t skipped = 0;
  std::size_t directories_created = 0;

  CopyStats& operator+=(const CopyStats& other) {
    copied += other.copied;
    skipped += other.skipped;
    directories_created += other.directories_created;
    return *this;
  }
};

// Carries out CopyTasks. Destination names (directory and file) go through
// the case fold; files already present with a non-zero size are left alone.
// In dummy mode nothing is written, the intended copies are only reported
// and counted.
class Copier {
public:
  Copier(FileSystem& fs, CaseFold fold, bool dummy, Logger* logger = nullptr);

  // Throws FileSystemError on the first failed mkdir or copy. Files copied
  // before the failure stay in place.
  CopyStats execute(const CopyTask& task,
                    const DirectoryIndex& source,
                    const DirectoryIndex& destination);

private:
  FileSystem& fs_;
  CaseFold fold_;
  bool dummy_;
  Logger* logger_;
};
