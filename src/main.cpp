#include <cpptrace/cpptrace.hpp>
#include <filesystem>

#include "watch_engine.hpp"
#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "tickwatch.json");
    const bool loaded = settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "tickwatch");
    parser.parse(argc, argv, *settings);
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    WatchEngine engine(settings, WatchEngine::Options{});
    auto logger = engine.logger();

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }
    if(loaded) {
      logger->debug("Settings loaded from {}", settings->settings_path().string());
    }
    auto failure = engine.run();
    engine.stop();

    if(failure) {
      logger->error("{}: {}", to_string(failure->kind), failure->message);
    }
    return 1;
  } catch(std::exception& e) {
    init(false);
    Logger logger("tickwatch-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
