#include <cpptrace/cpptrace.hpp>

#include "command_line_parser.hpp"
#include "file_system.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"
#include "sync_planner.hpp"

int main(int argc, char** argv) {
  CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "dcimsync");
  SettingsManager settings;
  try {
    parser.parse(argc, argv, settings);
  } catch(const UsageError& e) {
    init(0);
    print_err(nullptr, "{}", e.what());
    parser.usage();
    return 1;
  }
  if(settings.help_requested()) {
    init(0);
    parser.usage();
    return 0;
  }

  init(settings.get<int>("verbose"));
  try {
    SyncEngine engine(SyncEngine::options_from_settings(settings));
    auto report = engine.run();
    if(settings.get<bool>("plan_json")) {
      print_out(nullptr, "{}", report.to_json().dump(2));
    }
    return 0;
  } catch(const NoSourceDataError& e) {
    print_err(nullptr, "{}", e.what());
    return 1;
  } catch(const FileSystemError& e) {
    log_error(nullptr, "{}", e.what());
    return 1;
  } catch(const std::exception& e) {
    log_error(nullptr, "Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
