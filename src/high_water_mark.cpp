#include "high_water_mark.hpp"

#include <spdlog/fmt/fmt.h>

#include "directory_index.hpp"

std::optional<HighWaterMark> highest_number(const DirectoryIndex& index) {
  const auto& dirs = index.dir_files();
  if(dirs.empty()) return std::nullopt;
  const auto& last_dir = *dirs.rbegin();
  return HighWaterMark{last_dir.first, last_dir.second.rbegin()->first};
}

std::string to_string(const std::optional<HighWaterMark>& mark) {
  if(!mark) return "none";
  return fmt::format("({}, {})", mark->dir_number, mark->file_number);
}
