/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright © 2024 Fragcolor Pte. Ltd. */

#ifndef DD55D405_B922_4C20_8729_7C4B91D0A22A
#define DD55D405_B922_4C20_8729_7C4B91D0A22A

#include "storage.hpp"
#include "errors.hpp"
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace tether {

template <typename T> struct Registry;
template <typename K, typename V> struct RegistryMap;
template <typename T> struct Entry;

namespace detail {
// Removes the slot if the registry still exists, silently does nothing otherwise
void releaseEntry(std::weak_ptr<RegistryStorageBase> storage, EntryId id) noexcept;
void logLeakedEntry(EntryId id);
[[noreturn]] void throwMissingEntry(EntryId id);
} // namespace detail

// Type erased entry, all that is left is the ability to unregister
// Use this to keep entries of different registries in a single container
struct AnyEntry {
private:
  std::weak_ptr<RegistryStorageBase> storage;
  EntryId id{};
  bool active{};

  template <typename T> friend struct Entry;
  AnyEntry(std::weak_ptr<RegistryStorageBase> storage, EntryId id) : storage(std::move(storage)), id(id), active(true) {}

public:
  AnyEntry() = default;
  ~AnyEntry() { reset(); }

  // Same as calling asGeneric() on the entry
  template <typename T> AnyEntry(Entry<T> &&entry);

  AnyEntry(const AnyEntry &) = delete;
  AnyEntry &operator=(const AnyEntry &) = delete;
  AnyEntry(AnyEntry &&other) noexcept;
  AnyEntry &operator=(AnyEntry &&other) noexcept;

  EntryId getId() const { return id; }

  // True as long as this handle still owns a registration
  bool valid() const { return active; }
  explicit operator bool() const { return active; }

  // Unregisters now instead of on destruction
  void reset() noexcept;

  // Gives up ownership without unregistering, the value stays until the registry is destroyed
  // Only meant for prototyping and debugging
  void leak();
};

template <typename T> struct EntryReadGuard {
private:
  std::shared_ptr<TypedRegistryStorage<T>> storage;
  std::shared_lock<std::shared_mutex> l;
  EntryId id;

public:
  EntryReadGuard(std::shared_ptr<TypedRegistryStorage<T>> storage_, EntryId id)
      : storage(std::move(storage_)), l(storage->lock), id(id) {}

  const T &get() const {
    if (const T *value = storage->find(id))
      return *value;
    detail::throwMissingEntry(id);
  }
  const T &operator*() const { return get(); }
  const T *operator->() const { return &get(); }
};

template <typename T> struct EntryWriteGuard {
private:
  std::shared_ptr<TypedRegistryStorage<T>> storage;
  std::unique_lock<std::shared_mutex> l;
  EntryId id;

public:
  EntryWriteGuard(std::shared_ptr<TypedRegistryStorage<T>> storage_, EntryId id)
      : storage(std::move(storage_)), l(storage->lock), id(id) {}

  T &get() const {
    if (T *value = storage->find(id))
      return *value;
    detail::throwMissingEntry(id);
  }
  T &operator*() const { return get(); }
  T *operator->() const { return &get(); }
};

// Controls the lifetime of a registered value
// the value is unregistered when this is destroyed, unless the registry is already gone
// Only one entry exists per registration, it can be moved but not copied
template <typename T> struct Entry {
private:
  std::weak_ptr<TypedRegistryStorage<T>> storage;
  EntryId id{};
  bool active{};

  template <typename> friend struct Registry;
  template <typename, typename> friend struct RegistryMap;
  Entry(std::weak_ptr<TypedRegistryStorage<T>> storage, EntryId id) : storage(std::move(storage)), id(id), active(true) {}

public:
  Entry() = default;
  ~Entry() { reset(); }

  Entry(const Entry &) = delete;
  Entry &operator=(const Entry &) = delete;

  Entry(Entry &&other) noexcept
      : storage(std::move(other.storage)), id(other.id), active(std::exchange(other.active, false)) {}
  Entry &operator=(Entry &&other) noexcept {
    if (this != &other) {
      reset();
      storage = std::move(other.storage);
      id = other.id;
      active = std::exchange(other.active, false);
    }
    return *this;
  }

  EntryId getId() const { return id; }

  bool valid() const { return active; }
  explicit operator bool() const { return active; }

  // Locks the registry for reading, blocks until the lock is acquired
  // returns nullopt if the registry no longer exists
  std::optional<EntryReadGuard<T>> read() const {
    if (auto s = storage.lock())
      return std::optional<EntryReadGuard<T>>(std::in_place, std::move(s), id);
    return std::nullopt;
  }

  // Locks the registry for writing, blocks until the lock is acquired
  // returns nullopt if the registry no longer exists
  std::optional<EntryWriteGuard<T>> write() const {
    if (auto s = storage.lock())
      return std::optional<EntryWriteGuard<T>>(std::in_place, std::move(s), id);
    return std::nullopt;
  }

  // Drops the value type, this entry is left empty
  AnyEntry asGeneric() && {
    if (!std::exchange(active, false))
      return AnyEntry();
    return AnyEntry(std::move(storage), id);
  }

  void reset() noexcept {
    if (std::exchange(active, false)) {
      detail::releaseEntry(std::move(storage), id);
      storage.reset();
    }
  }

  // See AnyEntry::leak
  void leak() {
    if (std::exchange(active, false)) {
      detail::logLeakedEntry(id);
      storage.reset();
    }
  }
};

template <typename T> AnyEntry::AnyEntry(Entry<T> &&entry) : AnyEntry(std::move(entry).asGeneric()) {}

} // namespace tether

template <typename T> struct fmt::formatter<tether::Entry<T>> {
  constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }
  template <typename FormatContext> auto format(const tether::Entry<T> &entry, FormatContext &ctx) const {
    return format_to(ctx.out(), "E{}", entry.getId());
  }
};

template <> struct fmt::formatter<tether::AnyEntry> {
  constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }
  template <typename FormatContext> auto format(const tether::AnyEntry &entry, FormatContext &ctx) const {
    return format_to(ctx.out(), "E{}", entry.getId());
  }
};

#endif /* DD55D405_B922_4C20_8729_7C4B91D0A22A */
