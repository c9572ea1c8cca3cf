/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright © 2024 Fragcolor Pte. Ltd. */

#include "entry.hpp"
#include "log.hpp"
#include <spdlog/fmt/fmt.h>

namespace tether {
namespace detail {
void releaseEntry(std::weak_ptr<RegistryStorageBase> storage, EntryId id) noexcept {
  if (auto s = storage.lock()) {
    s->remove(id);
  } else {
    SPDLOG_LOGGER_TRACE(getLogger(), "Entry {} outlived its registry, nothing to remove", id);
  }
}

void logLeakedEntry(EntryId id) {
  SPDLOG_LOGGER_WARN(getLogger(), "Entry {} leaked, it stays registered until the registry is destroyed", id);
}

void throwMissingEntry(EntryId id) { throw RegistryError(fmt::format("Entry {} not found in the registry", id)); }
} // namespace detail

AnyEntry::AnyEntry(AnyEntry &&other) noexcept
    : storage(std::move(other.storage)), id(other.id), active(std::exchange(other.active, false)) {}

AnyEntry &AnyEntry::operator=(AnyEntry &&other) noexcept {
  if (this != &other) {
    reset();
    storage = std::move(other.storage);
    id = other.id;
    active = std::exchange(other.active, false);
  }
  return *this;
}

void AnyEntry::reset() noexcept {
  if (std::exchange(active, false)) {
    detail::releaseEntry(std::move(storage), id);
    storage.reset();
  }
}

void AnyEntry::leak() {
  if (std::exchange(active, false)) {
    detail::logLeakedEntry(id);
    storage.reset();
  }
}

} // namespace tether
