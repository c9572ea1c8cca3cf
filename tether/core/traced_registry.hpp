/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright © 2024 Fragcolor Pte. Ltd. */

#ifndef A0728686_840A_425A_BB36_91E16848CD0A
#define A0728686_840A_425A_BB36_91E16848CD0A

#include "event.hpp"
#include "registry.hpp"
#include <magic_enum.hpp>
#include <spdlog/fmt/fmt.h>
#include <type_traits>

namespace tether {

enum class LifecycleEvent {
  Register,
  Unregister,
};

template <typename T> struct LifecycleRecord {
  LifecycleEvent event;
  EntryId id;
  const T &value;
};

// Registry that notifies observers whenever a value is registered or unregistered
//
// Both notifications are sent while the registry's exclusive lock is held, so the order observers see
// matches the order the registrations and removals actually happened in.
// Unregister is sent right before the value is destroyed.
// If an observer throws on Register every observer still receives it, the registration is then undone
// with a matching Unregister and the exception propagates out of registerValue.
// Observers must not touch this registry from inside the notification.
template <typename T> struct TracedRegistry {
  using Record = LifecycleRecord<T>;
  using Events = Event<Record>;
  using ObserverEntry = typename Events::ObserverEntry;

private:
  Registry<T> registry;
  Events events;

public:
  TracedRegistry() {
    registry.setRemoveCallback(
        [events = events](EntryId id, T &value) { events.dispatch(Record{LifecycleEvent::Unregister, id, value}); });
  }

  [[nodiscard]] Entry<T> registerValue(T value) const {
    return registry.registerValue(std::move(value), [&](EntryId id, const T &registered) {
      events.dispatch(Record{LifecycleEvent::Register, id, registered});
    });
  }

  // Accepts either f(const LifecycleRecord<T> &) or f(LifecycleEvent, EntryId, const T &)
  template <typename F> [[nodiscard]] ObserverEntry registerObserver(F &&observer) const {
    if constexpr (std::is_invocable_v<F &, LifecycleEvent, EntryId, const T &>) {
      return events.registerObserver(
          [observer = std::forward<F>(observer)](const Record &record) mutable { observer(record.event, record.id, record.value); });
    } else {
      return events.registerObserver(std::forward<F>(observer));
    }
  }

  typename Registry<T>::ReadGuard read() const { return registry.read(); }
  typename Registry<T>::WriteGuard write() const { return registry.write(); }

  size_t size() const { return registry.size(); }
  bool empty() const { return registry.empty(); }
};

} // namespace tether

template <> struct fmt::formatter<tether::LifecycleEvent> {
  constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }
  template <typename FormatContext> auto format(const tether::LifecycleEvent &event, FormatContext &ctx) const {
    return format_to(ctx.out(), "{}", magic_enum::enum_name(event));
  }
};

#endif /* A0728686_840A_425A_BB36_91E16848CD0A */
