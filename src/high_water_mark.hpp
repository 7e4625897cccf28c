#pragma once

#include <optional>
#include <string>

class DirectoryIndex;

struct HighWaterMark {
  int dir_number = 0;
  int file_number = 0;

  bool operator==(const HighWaterMark& other) const {
    return dir_number == other.dir_number && file_number == other.file_number;
  }
  bool operator!=(const HighWaterMark& other) const { return !(*this == other); }
};

// Highest file number of the highest numbered directory that holds files.
// Empty numbered directories never count. nullopt when the tree has no files.
std::optional<HighWaterMark> highest_number(const DirectoryIndex& index);

std::string to_string(const std::optional<HighWaterMark>& mark);
