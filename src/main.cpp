#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "copy_session.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

namespace {

CopySession* g_session = nullptr;

void handle_interrupt(int) {
  if(g_session) g_session->cancel();
}

} // namespace

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>(RCOPY_SETTINGS_SPECIFICATION, "rcopy.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0])
                               ? std::filesystem::path(argv[0]).filename().string()
                               : "rcopy",
                             "copy files and trees to or from an rcopyd agent",
                             *settings);
    try {
      parser.parse(argc, argv, *settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    CopySession session(settings);
    if(settings->get<bool>("verbose")) {
      init(true);
      session.logger()->debug("Verbose logging enabled");
    }
    if(settings->save_requested()) {
      if(!settings->save()) {
        session.logger()->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    g_session = &session;
    std::signal(SIGINT, handle_interrupt);
    int code = session.run();
    std::signal(SIGINT, SIG_DFL);
    g_session = nullptr;
    return code;
  } catch(std::exception& e) {
    g_session = nullptr;
    init(false);
    Logger logger("rcopy-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
