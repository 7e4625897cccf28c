#include "sync_planner.hpp"

#include "directory_index.hpp"
#include "high_water_mark.hpp"
#include "log.hpp"

NoSourceDataError::NoSourceDataError(const std::string& source_root)
  : std::runtime_error("No numbered files found under '" + source_root +
                       "'. Point the source at the DCIM directory itself, the one "
                       "holding subdirectories such as 100CANON with files such as "
                       "IMG_0001.JPG.") {}

std::vector<CopyTask> plan_sync(const DirectoryIndex& source,
                                const DirectoryIndex& destination,
                                Logger* logger) {
  auto source_mark = highest_number(source);
  if(!source_mark) {
    throw NoSourceDataError(source.root_path().string());
  }
  // an empty destination sits just below directory 0, file 0
  auto dest_mark = highest_number(destination).value_or(HighWaterMark{0, -1});

  log_debug(logger, "Source mark {}, destination mark {}",
            to_string(source_mark), to_string(highest_number(destination)));

  std::vector<CopyTask> tasks;
  const int src_dir = source_mark->dir_number;
  const int src_file = source_mark->file_number;

  if(src_dir < dest_mark.dir_number ||
     (src_dir == dest_mark.dir_number && src_file <= dest_mark.file_number)) {
    log_debug(logger, "Source is not ahead of destination, nothing to plan");
    return tasks;
  }

  if(src_dir == dest_mark.dir_number) {
    tasks.push_back(CopyTask{src_dir, dest_mark.file_number + 1, src_file});
    return tasks;
  }

  // finish the destination's last directory first
  if(source.files_in(dest_mark.dir_number)) {
    tasks.push_back(CopyTask{dest_mark.dir_number, dest_mark.file_number + 1, std::nullopt});
  }

  const auto& dirs = source.dir_files();
  for(auto it = dirs.upper_bound(dest_mark.dir_number);
      it != dirs.end() && it->first <= src_dir; ++it) {
    const auto& files = it->second;
    tasks.push_back(CopyTask{it->first, files.begin()->first, files.rbegin()->first});
  }

  for(const auto& task : tasks) {
    log_trace(logger, "Planned {}", to_string(task));
  }
  return tasks;
}

std::string to_string(const CopyTask& task) {
  if(task.last_file) {
    return fmt::format("dir {:03} files {}..{}", task.dir_number, task.first_file, *task.last_file);
  }
  return fmt::format("dir {:03} files {}..end", task.dir_number, task.first_file);
}
