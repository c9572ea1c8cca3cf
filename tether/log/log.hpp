#ifndef A3C1F0B2_5E7D_4B9A_8C2E_1D6F4A7B9E30
#define A3C1F0B2_5E7D_4B9A_8C2E_1D6F4A7B9E30

#include <spdlog/spdlog.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tether::logging {
typedef std::shared_ptr<spdlog::logger> Logger;

// Level requested for a logger through LOG_<name>, falling back to LOG
// Values are spdlog level names (trace, debug, info, warn, err, critical, off),
// variable names are also looked up lower and upper cased
std::optional<spdlog::level::level_enum> getEnvLogLevel(const std::string &loggerName);

// Output pattern from LOG_FORMAT, or the default one
std::string getEnvLogPattern();

// Returns the logger registered under name, creating it on first use
// init runs once on creation, the environment level is applied after it and takes precedence
// All loggers created here write to the shared output
Logger getOrCreate(const std::string &name, const std::function<void(Logger)> &init = {});

// Adds fileName (if not empty) to the shared output and installs "tether" as the default logger
// Only the first call has an effect
void setupDefaultLoggerConditional(std::string fileName);
} // namespace tether::logging

#endif /* A3C1F0B2_5E7D_4B9A_8C2E_1D6F4A7B9E30 */
