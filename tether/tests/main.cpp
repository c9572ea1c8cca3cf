#define CATCH_CONFIG_RUNNER
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>
#include <tether/log/log.hpp>

int main(int argc, char *argv[]) {
  tether::logging::setupDefaultLoggerConditional("test-tether.log");

  Catch::Session session;

  int returnCode = session.applyCommandLine(argc, argv);
  if (returnCode != 0) // Indicates a command line error
    return returnCode;

  return session.run();
}
