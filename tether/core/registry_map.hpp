/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright © 2024 Fragcolor Pte. Ltd. */

#ifndef A7DE8906_00DC_4081_98CD_1223F1AAE00B
#define A7DE8906_00DC_4081_98CD_1223F1AAE00B

#include "entry.hpp"
#include "slot_table.hpp"
#include "log.hpp"
#include <spdlog/fmt/fmt.h>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace tether {

namespace detail {
template <typename K> std::string describeKey(const K &key) {
  if constexpr (fmt::is_formattable<K>::value) {
    return fmt::format("{}", key);
  } else {
    return std::string();
  }
}

template <typename K, typename V> struct RegistryMapStorage final : public TypedRegistryStorage<V> {
  using Map = std::map<K, V>;
  using RemoveCallback = std::function<void(EntryId, const K &, V &)>;

  Map map;
  // Entries are addressed by id, this maps them back to their key
  SlotTable<K> keys;
  RemoveCallback removeCallback;

  V *find(EntryId id) override {
    if (const K *key = keys.find(id)) {
      auto it = map.find(*key);
      return it != map.end() ? &it->second : nullptr;
    }
    return nullptr;
  }

  void remove(EntryId id) override {
    // Destroyed after unlocking, see RegistryStorage::remove
    typename SlotTable<K>::node_type keyNode;
    typename Map::node_type valueNode;
    {
      std::unique_lock<std::shared_mutex> l(this->lock);
      keyNode = keys.extract(id);
      if (!keyNode) {
        SPDLOG_LOGGER_TRACE(getLogger(), "Entry {} was already removed", id);
        return;
      }

      valueNode = map.extract(keyNode.mapped());
      if (!valueNode) {
        SPDLOG_LOGGER_ERROR(getLogger(), "Entry {} has no value in the registry map", id);
        return;
      }

      SPDLOG_LOGGER_TRACE(getLogger(), "Removing entry {} ({} left)", id, map.size());
      if (removeCallback)
        removeCallback(id, valueNode.key(), valueNode.mapped());
    }
  }
};
} // namespace detail

template <typename K, typename V> struct RegistryMapReadGuard {
  using const_iterator = typename std::map<K, V>::const_iterator;

private:
  std::shared_ptr<detail::RegistryMapStorage<K, V>> storage;
  std::shared_lock<std::shared_mutex> l;

public:
  RegistryMapReadGuard(std::shared_ptr<detail::RegistryMapStorage<K, V>> storage_)
      : storage(std::move(storage_)), l(storage->lock) {}

  const V *get(const K &key) const {
    auto it = storage->map.find(key);
    return it != storage->map.end() ? &it->second : nullptr;
  }
  bool contains(const K &key) const { return storage->map.contains(key); }
  size_t size() const { return storage->map.size(); }
  bool empty() const { return storage->map.empty(); }

  const_iterator begin() const { return storage->map.cbegin(); }
  const_iterator end() const { return storage->map.cend(); }
};

template <typename K, typename V> struct RegistryMapWriteGuard {
  using iterator = typename std::map<K, V>::iterator;

private:
  std::shared_ptr<detail::RegistryMapStorage<K, V>> storage;
  std::unique_lock<std::shared_mutex> l;

public:
  RegistryMapWriteGuard(std::shared_ptr<detail::RegistryMapStorage<K, V>> storage_)
      : storage(std::move(storage_)), l(storage->lock) {}

  V *get(const K &key) const {
    auto it = storage->map.find(key);
    return it != storage->map.end() ? &it->second : nullptr;
  }
  bool contains(const K &key) const { return storage->map.contains(key); }
  size_t size() const { return storage->map.size(); }
  bool empty() const { return storage->map.empty(); }

  iterator begin() const { return storage->map.begin(); }
  iterator end() const { return storage->map.end(); }
};

// Same contract as Registry, but values are addressed by a caller supplied key
// Keys are unique, registering a key that is already registered throws DuplicateKeyError
// and leaves the existing registration untouched. The key becomes available again once its entry is destroyed.
template <typename K, typename V> struct RegistryMap {
  using RemoveCallback = typename detail::RegistryMapStorage<K, V>::RemoveCallback;
  using ReadGuard = RegistryMapReadGuard<K, V>;
  using WriteGuard = RegistryMapWriteGuard<K, V>;

private:
  std::shared_ptr<detail::RegistryMapStorage<K, V>> storage;

public:
  RegistryMap() : storage(std::make_shared<detail::RegistryMapStorage<K, V>>()) {}

  [[nodiscard]] Entry<V> registerValue(K key, V value) const {
    std::unique_lock<std::shared_mutex> l(storage->lock);

    auto it = storage->map.lower_bound(key);
    if (it != storage->map.end() && !storage->map.key_comp()(key, it->first)) {
      SPDLOG_LOGGER_DEBUG(getLogger(), "Rejected duplicate key {}", detail::describeKey(key));
      throw DuplicateKeyError(detail::describeKey(key));
    }

    EntryId id = storage->keys.insert(K(key));
    storage->map.emplace_hint(it, std::move(key), std::move(value));
    SPDLOG_LOGGER_TRACE(getLogger(), "Registered entry {}", id);

    return Entry<V>(storage, id);
  }

  // Replaces any previous callback, must not throw
  void setRemoveCallback(RemoveCallback callback) const {
    std::unique_lock<std::shared_mutex> l(storage->lock);
    storage->removeCallback = std::move(callback);
  }

  ReadGuard read() const { return ReadGuard(storage); }
  WriteGuard write() const { return WriteGuard(storage); }

  size_t size() const {
    std::shared_lock<std::shared_mutex> l(storage->lock);
    return storage->map.size();
  }

  bool empty() const {
    std::shared_lock<std::shared_mutex> l(storage->lock);
    return storage->map.empty();
  }
};

} // namespace tether

// Formats as {key: value, ...} in key order, takes the read lock
template <typename K, typename V> struct fmt::formatter<tether::RegistryMap<K, V>> {
  constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }
  template <typename FormatContext> auto format(const tether::RegistryMap<K, V> &registry, FormatContext &ctx) const {
    auto out = format_to(ctx.out(), "{{");
    bool first = true;
    for (auto &[key, value] : registry.read()) {
      if (!first)
        out = format_to(out, ", ");
      out = format_to(out, "{}: {}", key, value);
      first = false;
    }
    return format_to(out, "}}");
  }
};

#endif /* A7DE8906_00DC_4081_98CD_1223F1AAE00B */
