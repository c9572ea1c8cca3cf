/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright © 2024 Fragcolor Pte. Ltd. */

#ifndef A85B0234_3BE5_4953_AEF4_177E6DCCD106
#define A85B0234_3BE5_4953_AEF4_177E6DCCD106

#include "entry.hpp"
#include "slot_table.hpp"
#include "log.hpp"
#include <spdlog/fmt/fmt.h>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace tether {

namespace detail {
template <typename T> struct RegistryStorage final : public TypedRegistryStorage<T> {
  using RemoveCallback = std::function<void(EntryId, T &)>;

  SlotTable<T> table;
  RemoveCallback removeCallback;

  T *find(EntryId id) override { return table.find(id); }

  void remove(EntryId id) override {
    // Declared outside of the locked scope so the value is destroyed after unlocking,
    // values holding entries of this same registry can then release them safely
    typename SlotTable<T>::node_type node;
    {
      std::unique_lock<std::shared_mutex> l(this->lock);
      node = table.extract(id);
      if (!node) {
        SPDLOG_LOGGER_TRACE(getLogger(), "Entry {} was already removed", id);
        return;
      }

      SPDLOG_LOGGER_TRACE(getLogger(), "Removing entry {} ({} left)", id, table.size());
      if (removeCallback)
        removeCallback(id, node.mapped());
    }
  }
};
} // namespace detail

// Holds the shared lock until destroyed, iterates in id order
template <typename T> struct RegistryReadGuard {
  using const_iterator = typename SlotTable<T>::const_iterator;

private:
  std::shared_ptr<detail::RegistryStorage<T>> storage;
  std::shared_lock<std::shared_mutex> l;

public:
  RegistryReadGuard(std::shared_ptr<detail::RegistryStorage<T>> storage_)
      : storage(std::move(storage_)), l(storage->lock) {}

  const T *get(EntryId id) const { return storage->table.find(id); }
  bool contains(EntryId id) const { return storage->table.contains(id); }
  size_t size() const { return storage->table.size(); }
  bool empty() const { return storage->table.empty(); }

  const_iterator begin() const { return std::as_const(storage->table).begin(); }
  const_iterator end() const { return std::as_const(storage->table).end(); }
};

// Holds the exclusive lock until destroyed
template <typename T> struct RegistryWriteGuard {
  using iterator = typename SlotTable<T>::iterator;

private:
  std::shared_ptr<detail::RegistryStorage<T>> storage;
  std::unique_lock<std::shared_mutex> l;

public:
  RegistryWriteGuard(std::shared_ptr<detail::RegistryStorage<T>> storage_)
      : storage(std::move(storage_)), l(storage->lock) {}

  T *get(EntryId id) const { return storage->table.find(id); }
  bool contains(EntryId id) const { return storage->table.contains(id); }
  size_t size() const { return storage->table.size(); }
  bool empty() const { return storage->table.empty(); }

  iterator begin() const { return storage->table.begin(); }
  iterator end() const { return storage->table.end(); }
};

// A container whose elements live exactly as long as the Entry returned when registering them
//
// Copies of a Registry share the same storage, the storage lives as long as any copy (or guard) does.
// Entries only hold a weak reference, once every Registry copy is gone destroying an entry does nothing.
//
// Locking: one reader/writer lock per registry.
// Callbacks run while that lock is held, calling back into the same registry from one will deadlock.
template <typename T> struct Registry {
  using RemoveCallback = typename detail::RegistryStorage<T>::RemoveCallback;
  using ReadGuard = RegistryReadGuard<T>;
  using WriteGuard = RegistryWriteGuard<T>;

private:
  std::shared_ptr<detail::RegistryStorage<T>> storage;

public:
  Registry() : storage(std::make_shared<detail::RegistryStorage<T>>()) {}

  // Discarding the returned entry unregisters the value immediately
  [[nodiscard]] Entry<T> registerValue(T value) const {
    return registerValue(std::move(value), [](EntryId, const T &) {});
  }

  // onRegistered(EntryId, const T &) is called with the new value before the exclusive lock is released
  // If it throws the value is unregistered again, going through the remove callback, and the exception propagates.
  // The id stays consumed.
  template <typename F> [[nodiscard]] Entry<T> registerValue(T value, F &&onRegistered) const {
    std::unique_lock<std::shared_mutex> l(storage->lock);
    EntryId id = storage->table.insert(std::move(value));
    SPDLOG_LOGGER_TRACE(getLogger(), "Registered entry {}", id);

    try {
      onRegistered(id, std::as_const(*storage->table.find(id)));
    } catch (...) {
      auto node = storage->table.extract(id);
      SPDLOG_LOGGER_DEBUG(getLogger(), "Registration of entry {} failed, removing it again", id);
      if (storage->removeCallback)
        storage->removeCallback(id, node.mapped());
      l.unlock();
      throw;
    }

    return Entry<T>(storage, id);
  }

  // Called with the removed value right before it is destroyed, replaces any previous callback
  // Must not throw, removal happens from entry destructors
  void setRemoveCallback(RemoveCallback callback) const {
    std::unique_lock<std::shared_mutex> l(storage->lock);
    storage->removeCallback = std::move(callback);
  }

  ReadGuard read() const { return ReadGuard(storage); }
  WriteGuard write() const { return WriteGuard(storage); }

  size_t size() const {
    std::shared_lock<std::shared_mutex> l(storage->lock);
    return storage->table.size();
  }

  bool empty() const {
    std::shared_lock<std::shared_mutex> l(storage->lock);
    return storage->table.empty();
  }
};

} // namespace tether

// Formats as {id: value, ...}, takes the read lock
template <typename T> struct fmt::formatter<tether::Registry<T>> {
  constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }
  template <typename FormatContext> auto format(const tether::Registry<T> &registry, FormatContext &ctx) const {
    auto out = format_to(ctx.out(), "{{");
    bool first = true;
    for (auto &[id, value] : registry.read()) {
      if (!first)
        out = format_to(out, ", ");
      out = format_to(out, "{}: {}", id, value);
      first = false;
    }
    return format_to(out, "}}");
  }
};

#endif /* A85B0234_3BE5_4953_AEF4_177E6DCCD106 */
