/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright © 2024 Fragcolor Pte. Ltd. */

#ifndef DEA60BFE_1521_4CEE_B391_9A964609B3B4
#define DEA60BFE_1521_4CEE_B391_9A964609B3B4

#include "storage.hpp"
#include <stdexcept>
#include <string>

namespace tether {

struct RegistryError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Thrown by RegistryMap when the key already has a live registration
// the existing registration is left untouched
struct DuplicateKeyError : public RegistryError {
  // keyDesc may be empty when the key type is not formattable
  DuplicateKeyError(const std::string &keyDesc) : RegistryError(formatError(keyDesc)) {}

  static std::string formatError(const std::string &keyDesc);
};

// Thrown when a registry ran out of entry ids, ids are never reused or wrapped
struct KeySpaceExhaustedError : public RegistryError {
  KeySpaceExhaustedError(EntryId lastId) : RegistryError(formatError(lastId)) {}

  static std::string formatError(EntryId lastId);
};

} // namespace tether

#endif /* DEA60BFE_1521_4CEE_B391_9A964609B3B4 */
