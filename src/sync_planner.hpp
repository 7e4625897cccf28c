#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class DirectoryIndex;
class Logger;

class NoSourceDataError : public std::runtime_error {
public:
  explicit NoSourceDataError(const std::string& source_root);
};

// All files numbered first_file..last_file in one source directory.
// No last_file means "to the end of the directory".
struct CopyTask {
  int dir_number = 0;
  int first_file = 0;
  std::optional<int> last_file;

  bool covers(int file_number) const {
    return file_number >= first_file && (!last_file || file_number <= *last_file);
  }
  bool operator==(const CopyTask& other) const {
    return dir_number == other.dir_number &&
           first_file == other.first_file &&
           last_file == other.last_file;
  }
};

// Tasks that bring destination up to the source high-water mark, in
// ascending directory order. Never copies "backwards": if the destination
// is level with or ahead of the source the plan is empty.
// Throws NoSourceDataError when the source holds no numbered files.
std::vector<CopyTask> plan_sync(const DirectoryIndex& source,
                                const DirectoryIndex& destination,
                                Logger* logger = nullptr);

std::string to_string(const CopyTask& task);
