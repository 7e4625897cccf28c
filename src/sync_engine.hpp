#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "case_fold.hpp"
#include "copier.hpp"
#include "high_water_mark.hpp"
#include "log.hpp"
#include "sync_planner.hpp"

class FileSystem;
class SettingsManager;

struct SyncReport {
  std::optional<HighWaterMark> source_mark;
  std::optional<HighWaterMark> destination_mark;
  std::vector<CopyTask> tasks;
  CaseFold fold = CaseFold::Identity;
  CopyStats stats;
  bool dummy = false;

  nlohmann::json to_json() const;
};

// One sync run: scan both trees, plan, pick the case policy, copy.
class SyncEngine {
public:
  struct Options {
    std::filesystem::path source;
    std::filesystem::path destination;
    bool dummy = false;
    bool force_lower = false;
    bool force_upper = false;
  };

  static Options options_from_settings(const SettingsManager& settings);

  // fs defaults to a LocalFileSystem owned by the engine.
  explicit SyncEngine(Options options, std::shared_ptr<FileSystem> fs = nullptr);

  // Throws NoSourceDataError when the source has nothing to offer and
  // FileSystemError on any disk failure.
  SyncReport run();

  std::shared_ptr<Logger> logger() const { return logger_; }
  const Options& options() const { return options_; }

private:
  bool prepare_destination();

  Options options_;
  std::shared_ptr<FileSystem> fs_;
  std::shared_ptr<Logger> logger_;
};
