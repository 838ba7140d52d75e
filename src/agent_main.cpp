#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>

#include "agent_server.hpp"
#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    SettingsManager settings(RCOPYD_SETTINGS_SPECIFICATION, "rcopyd.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0])
                               ? std::filesystem::path(argv[0]).filename().string()
                               : "rcopyd",
                             "remote agent for rcopy",
                             settings);
    try {
      parser.parse(argc, argv, settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("rcopyd");
    if(settings.save_requested() && !settings.save()) {
      logger->error("Unable to persist settings to {}", settings.settings_path().string());
    }

    AgentServer server(AgentServer::options_from(settings), logger);
    server.start();
    logger->print("rcopyd listening on {}:{} (root {})",
                  settings.get<std::string>("listen_ip"), server.listen_port(), server.root().string());
    server.stop_on_signals();
    server.run();
    server.stop();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("rcopyd-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
