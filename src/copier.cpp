#include "copier.hpp"

#include "directory_index.hpp"
#include "file_system.hpp"
#include "log.hpp"

Copier::Copier(FileSystem& fs, CaseFold fold, bool dummy, Logger* logger)
  : fs_(fs), fold_(fold), dummy_(dummy), logger_(logger) {}

CopyStats Copier::execute(const CopyTask& task,
                          const DirectoryIndex& source,
                          const DirectoryIndex& destination) {
  CopyStats stats;
  const auto* files = source.files_in(task.dir_number);
  const auto* source_dir_name = source.dir_name(task.dir_number);
  if(!files || !source_dir_name) {
    log_debug(logger_, "Source has nothing in directory {:03}, skipping {}",
              task.dir_number, to_string(task));
    return stats;
  }

  const auto source_dir = source.root_path() / *source_dir_name;
  const auto dest_dir_name = apply_case_fold(fold_, *source_dir_name);
  const auto dest_dir = destination.root_path() / dest_dir_name;
  bool dest_dir_ready = false;

  log_debug(logger_, "{} -> {}", to_string(task), dest_dir.string());

  for(auto it = files->lower_bound(task.first_file);
      it != files->end() && task.covers(it->first); ++it) {
    if(!dest_dir_ready) {
      if(!fs_.is_directory(dest_dir)) {
        if(dummy_) {
          print_out(logger_, "Would create {}", dest_dir.string());
        } else {
          log_info(logger_, "Creating {}", dest_dir.string());
          fs_.create_directory(dest_dir);
        }
        stats.directories_created++;
      }
      dest_dir_ready = true;
    }

    for(const auto& name : it->second) {
      const auto from = source_dir / name;
      const auto to = dest_dir / apply_case_fold(fold_, name);
      if(fs_.file_exists(to) && fs_.file_size(to) > 0) {
        log_trace(logger_, "{} already present", to.string());
        stats.skipped++;
        continue;
      }
      if(dummy_) {
        print_out(logger_, "Would copy {} -> {}", from.string(), to.string());
      } else {
        log_info(logger_, "{} -> {}", from.string(), to.string());
        fs_.copy_bytes(from, to);
      }
      stats.copied++;
    }
  }
  return stats;
}
