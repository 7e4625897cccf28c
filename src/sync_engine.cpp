#include "sync_engine.hpp"

#include "directory_index.hpp"
#include "file_system.hpp"
#include "settings_manager.hpp"

namespace {

nlohmann::json mark_to_json(const std::optional<HighWaterMark>& mark) {
  if(!mark) return nullptr;
  return {{"dir", mark->dir_number}, {"file", mark->file_number}};
}

} // namespace

nlohmann::json SyncReport::to_json() const {
  nlohmann::json doc;
  doc["source_mark"] = mark_to_json(source_mark);
  doc["destination_mark"] = mark_to_json(destination_mark);
  doc["case_fold"] = to_string(fold);
  doc["dummy"] = dummy;
  doc["tasks"] = nlohmann::json::array();
  for(const auto& task : tasks) {
    nlohmann::json entry = {{"dir", task.dir_number}, {"first_file", task.first_file}};
    entry["last_file"] = task.last_file ? nlohmann::json(*task.last_file) : nlohmann::json(nullptr);
    doc["tasks"].push_back(std::move(entry));
  }
  doc["copied"] = stats.copied;
  doc["skipped"] = stats.skipped;
  doc["directories_created"] = stats.directories_created;
  return doc;
}

SyncEngine::Options SyncEngine::options_from_settings(const SettingsManager& settings) {
  Options options;
  options.source = settings.get<std::string>("source");
  options.destination = settings.get<std::string>("destination");
  options.dummy = settings.get<bool>("dummy");
  options.force_lower = settings.get<bool>("lowercase");
  options.force_upper = settings.get<bool>("uppercase");
  return options;
}

SyncEngine::SyncEngine(Options options, std::shared_ptr<FileSystem> fs)
  : options_(std::move(options)),
    fs_(fs ? std::move(fs) : std::make_shared<LocalFileSystem>()),
    logger_(std::make_shared<Logger>("sync")) {}

// false when the destination doesn't exist and must be treated as empty
bool SyncEngine::prepare_destination() {
  if(fs_->is_directory(options_.destination)) return true;
  if(options_.dummy) {
    print_out(logger_.get(), "Would create {}", options_.destination.string());
    return false;
  }
  logger_->info("Creating destination {}", options_.destination.string());
  fs_->create_directory(options_.destination);
  return true;
}

SyncReport SyncEngine::run() {
  SyncReport report;
  report.dummy = options_.dummy;

  DirectoryIndex source(options_.source, *fs_, logger_.get());
  source.scan();
  report.source_mark = highest_number(source);
  if(!report.source_mark) {
    throw NoSourceDataError(options_.source.string());
  }

  DirectoryIndex destination(options_.destination, *fs_, logger_.get());
  if(prepare_destination()) {
    destination.scan();
  } else {
    destination.mark_empty();
  }
  report.destination_mark = highest_number(destination);

  logger_->info("Source {} at {}, destination {} at {}",
                options_.source.string(), to_string(report.source_mark),
                options_.destination.string(), to_string(report.destination_mark));

  report.tasks = plan_sync(source, destination, logger_.get());
  report.fold = decide_case_fold(destination, options_.force_lower, options_.force_upper);
  logger_->debug("Destination names: {}", to_string(report.fold));

  if(report.tasks.empty()) {
    logger_->info("Destination is up to date");
    return report;
  }

  Copier copier(*fs_, report.fold, options_.dummy, logger_.get());
  for(const auto& task : report.tasks) {
    report.stats += copier.execute(task, source, destination);
  }

  if(options_.dummy) {
    logger_->info("Dummy run: {} files would be copied, {} already present",
                  report.stats.copied, report.stats.skipped);
    return report;
  }

  logger_->info("Copied {} files, skipped {} already present, created {} directories",
                report.stats.copied, report.stats.skipped, report.stats.directories_created);
  if(report.stats.copied > 0) {
    DirectoryIndex after(options_.destination, *fs_);
    after.scan();
    logger_->debug("Destination now at {}", to_string(highest_number(after)));
  }
  return report;
}
