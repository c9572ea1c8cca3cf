/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright © 2024 Fragcolor Pte. Ltd. */

#include <tether/tether.hpp>
#include <tether/log/log.hpp>
#include <spdlog/fmt/fmt.h>
#include <string>

using namespace tether;

static void printRegistry(const Registry<int> &registry) {
  std::string str;
  for (auto &[id, value] : registry.read()) {
    if (!str.empty())
      str += ", ";
    str += fmt::format("{}: {}", id, value);
  }
  fmt::print("{{{}}}\n", str);
}

int main() {
  logging::setupDefaultLoggerConditional("");

  Registry<int> registry;
  auto entry1 = registry.registerValue(0);
  auto entry2 = registry.registerValue(100);
  printRegistry(registry); // {0: 0, 1: 100}

  fmt::print("Mutation via Registry...\n");
  for (auto &[id, value] : registry.write())
    value += 1;
  printRegistry(registry); // {0: 1, 1: 101}

  fmt::print("Mutation via typed Entry...\n");
  **entry1.write() += 10;
  **entry2.write() += 10;
  printRegistry(registry); // {0: 11, 1: 111}
  return 0;
}
