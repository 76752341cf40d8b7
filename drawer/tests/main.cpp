#define CATCH_CONFIG_RUNNER
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>
#include <drawer/log/log.hpp>

int main(int argc, char *argv[]) {
  drawer::logging::setupDefaultLoggerConditional("test-drawer.log");

  Catch::Session session;

  int returnCode = session.applyCommandLine(argc, argv);
  if (returnCode != 0) // Indicates a command line error
    return returnCode;

  int result = session.run();

  // Flush the log file before exit
  spdlog::shutdown();

  return result;
}
