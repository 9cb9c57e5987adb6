#include <cpptrace/cpptrace.hpp>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "dupes_cli.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void handle_sigint(int) {
  g_interrupted.store(true);
}

} // namespace

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".dupescan" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "dupescan");
    CommandLineParser::Invocation invocation;
    try {
      invocation = parser.parse(argc, argv, *settings);
    } catch(const UsageError& e) {
      init(false);
      parser.usage();
      print_err(nullptr, "{}", e.what());
      return 1;
    }

    init(settings->get<bool>("verbose"), settings->get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("dupescan-main");
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    std::signal(SIGINT, handle_sigint);

    DupesCLI cli(settings, std::make_shared<Logger>("cli"));
    cli.set_interrupt_flag(&g_interrupted);
    return cli.execute(invocation);
  } catch(std::exception& e) {
    init(false);
    Logger logger("dupescan-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
