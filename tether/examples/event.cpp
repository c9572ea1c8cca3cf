/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright © 2024 Fragcolor Pte. Ltd. */

#include <tether/tether.hpp>
#include <tether/log/log.hpp>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <utility>

using namespace tether;

using Message = std::pair<uint32_t, std::string>;

int main() {
  logging::setupDefaultLoggerConditional("");

  Event<Message> event;
  auto entry1 = event.registerObserver(
      [](const Message &data) { fmt::print("Observer #1 called: ({}, {})\n", data.first, data.second); });
  auto entry2 = event.registerObserver(
      [](const Message &data) { fmt::print("Observer #2 called: ({}, {})\n", data.first, data.second); });

  event.dispatch({1, "First event"});

  // Only observer #1 is left
  entry2.reset();
  event.dispatch({2, "Second event"});
  return 0;
}
