#ifndef D0228FC4_8F76_431E_88A1_0B5DF3BF64E5
#define D0228FC4_8F76_431E_88A1_0B5DF3BF64E5

#include <tether/log/log.hpp>

namespace tether {
inline const logging::Logger &getLogger() {
  static logging::Logger logger = logging::getOrCreate("registry", [](logging::Logger logger) {
    // Registrations happen often, keep this quiet unless asked for
    logger->set_level(spdlog::level::info);
  });
  return logger;
}
} // namespace tether

#endif /* D0228FC4_8F76_431E_88A1_0B5DF3BF64E5 */
