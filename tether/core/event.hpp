/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright © 2024 Fragcolor Pte. Ltd. */

#ifndef BAFC7E97_7F10_4360_9A6C_B1B8D974502E
#define BAFC7E97_7F10_4360_9A6C_B1B8D974502E

#include "registry.hpp"
#include <exception>
#include <functional>

namespace tether {

// Synchronous observer list
//
// Observers stay registered as long as the entry returned by registerObserver.
// dispatch holds the observer registry's shared lock for its whole duration,
// registering or releasing observers of the same event from inside an observer will deadlock.
// Copies share the same observers.
// Observers are stored as std::function and so must be copyable,
// move-only state (an Entry, a unique_ptr) has to be wrapped in a std::shared_ptr first.
template <typename T> struct Event {
  using Observer = std::function<void(const T &)>;
  using ObserverEntry = Entry<Observer>;

private:
  Registry<Observer> observers;

public:
  template <typename F> [[nodiscard]] ObserverEntry registerObserver(F &&observer) const {
    return observers.registerValue(Observer(std::forward<F>(observer)));
  }

  // Calls observers in the order they were registered
  // An observer that throws does not stop the others, the first exception is rethrown once all were called
  void dispatch(const T &data) const {
    std::exception_ptr error;
    auto guard = observers.read();
    for (auto &[id, observer] : guard) {
      try {
        observer(data);
      } catch (...) {
        if (error) {
          SPDLOG_LOGGER_WARN(getLogger(), "Observer {} threw as well, only the first error is rethrown", id);
        } else {
          error = std::current_exception();
        }
      }
    }
    if (error)
      std::rethrow_exception(error);
  }

  size_t observerCount() const { return observers.size(); }
};

} // namespace tether

#endif /* BAFC7E97_7F10_4360_9A6C_B1B8D974502E */
