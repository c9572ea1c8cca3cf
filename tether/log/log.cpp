#include "log.hpp"
#include <cstdlib>
#include <mutex>
#include <shared_mutex>
#include <magic_enum.hpp>
#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tether::logging {

static constexpr const char *DefaultPattern = "[%d/%m %T.%e][T-%t][%n]%^[%l]%$ %v";

static std::optional<std::string> readEnvVar(std::string name) {
  if (const char *val = std::getenv(name.c_str()))
    return val;

  boost::algorithm::to_lower(name);
  if (const char *val = std::getenv(name.c_str()))
    return val;

  boost::algorithm::to_upper(name);
  if (const char *val = std::getenv(name.c_str()))
    return val;
  return std::nullopt;
}

static std::optional<spdlog::level::level_enum> readLevel(const std::string &varName) {
  auto value = readEnvVar(varName);
  if (!value)
    return std::nullopt;

  auto level = magic_enum::enum_cast<spdlog::level::level_enum>(*value);
  if (!level || *level == spdlog::level::n_levels) {
    spdlog::warn("Ignoring {}={}, not a log level", varName, *value);
    return std::nullopt;
  }
  return level;
}

std::optional<spdlog::level::level_enum> getEnvLogLevel(const std::string &loggerName) {
  if (auto level = readLevel(fmt::format("LOG_{}", loggerName)))
    return level;
  return readLevel("LOG");
}

std::string getEnvLogPattern() { return readEnvVar("LOG_FORMAT").value_or(DefaultPattern); }

// stderr, plus a log file once setupDefaultLoggerConditional asks for one
struct SharedOutput {
  std::shared_ptr<spdlog::sinks::dist_sink_mt> sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
  std::string pattern = getEnvLogPattern();

  SharedOutput() {
    sink->add_sink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    sink->set_pattern(pattern);
  }

  void addFile(const std::string &fileName) {
    auto path = boost::filesystem::absolute(fileName).string();
    auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
    file->set_pattern(pattern);
    sink->add_sink(file);
  }
};

static SharedOutput &sharedOutput() {
  static SharedOutput output;
  return output;
}

static std::shared_mutex &creationLock() {
  static std::shared_mutex m;
  return m;
}

static Logger createLogger(const std::string &name, const std::function<void(Logger)> &init) {
  auto logger = std::make_shared<spdlog::logger>(name, sharedOutput().sink);
  logger->flush_on(spdlog::level::err);
#ifdef TETHER_DEFAULT_LOG_LEVEL
  logger->set_level(spdlog::level::level_enum(TETHER_DEFAULT_LOG_LEVEL));
#endif
  if (init)
    init(logger);
  if (auto level = getEnvLogLevel(name))
    logger->set_level(*level);
  return logger;
}

Logger getOrCreate(const std::string &name, const std::function<void(Logger)> &init) {
  {
    std::shared_lock<std::shared_mutex> l(creationLock());
    if (auto logger = spdlog::get(name))
      return logger;
  }

  std::unique_lock<std::shared_mutex> l(creationLock());
  // Another thread may have created it in between
  if (auto logger = spdlog::get(name))
    return logger;

  auto logger = createLogger(name, init);
  spdlog::register_logger(logger);
  return logger;
}

void setupDefaultLoggerConditional(std::string fileName) {
  static std::once_flag once;
  std::call_once(once, [&]() {
    if (!fileName.empty())
      sharedOutput().addFile(fileName);

    std::unique_lock<std::shared_mutex> l(creationLock());
    auto logger = spdlog::get("tether");
    if (!logger)
      logger = createLogger("tether", {});
    spdlog::set_default_logger(logger);
  });
}
} // namespace tether::logging
