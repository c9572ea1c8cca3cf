/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright © 2024 Fragcolor Pte. Ltd. */

#include "errors.hpp"
#include <spdlog/fmt/fmt.h>

namespace tether {

std::string DuplicateKeyError::formatError(const std::string &keyDesc) {
  if (keyDesc.empty())
    return "Key already exists in registry";
  return fmt::format("Key '{}' already exists in registry", keyDesc);
}

std::string KeySpaceExhaustedError::formatError(EntryId lastId) {
  return fmt::format("Registry ran out of entry ids after {}", lastId);
}

} // namespace tether
