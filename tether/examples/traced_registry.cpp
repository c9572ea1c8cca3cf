/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright © 2024 Fragcolor Pte. Ltd. */

#include <tether/tether.hpp>
#include <tether/log/log.hpp>
#include <spdlog/fmt/fmt.h>
#include <string>

using namespace tether;

int main() {
  logging::setupDefaultLoggerConditional("");

  TracedRegistry<std::string> registry;
  auto observer = registry.registerObserver(
      [](LifecycleEvent event, EntryId id, const std::string &value) { fmt::print("{}, {}, {}\n", event, id, value); });

  auto foo = registry.registerValue("foo");
  auto bar = registry.registerValue("bar");
  foo.reset();
  auto baz = registry.registerValue("baz");
  bar.reset();
  baz.reset();
  return 0;
}
