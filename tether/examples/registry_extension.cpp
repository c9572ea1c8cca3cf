/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright © 2024 Fragcolor Pte. Ltd. */

#include <tether/tether.hpp>
#include <tether/log/log.hpp>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <vector>

using namespace tether;

struct MenuItem {
  std::string name;
};

struct StyleSheet {
  std::string path;
};

static void printState(const char *step, const Registry<MenuItem> &menu, const Registry<StyleSheet> &styles) {
  fmt::print("{}\n", step);
  fmt::print("\tMenu:\n");
  for (auto &[id, item] : menu.read())
    fmt::print("\t\t{}: {}\n", id, item.name);
  fmt::print("\tStyleSheets:\n");
  for (auto &[id, style] : styles.read())
    fmt::print("\t\t{}: {}\n", id, style.path);
}

int main() {
  logging::setupDefaultLoggerConditional("");

  Registry<MenuItem> menu;
  Registry<StyleSheet> styles;

  std::vector<AnyEntry> websiteStore;
  websiteStore.push_back(menu.registerValue(MenuItem{"Home"}));
  websiteStore.push_back(menu.registerValue(MenuItem{"About"}));
  websiteStore.push_back(styles.registerValue(StyleSheet{"website.css"}));

  printState("Original website", menu, styles);

  // Everything the extension registers lives in its own store
  std::vector<AnyEntry> extensionStore;
  extensionStore.push_back(menu.registerValue(MenuItem{"Weather"}));
  extensionStore.push_back(menu.registerValue(MenuItem{"News"}));
  extensionStore.push_back(styles.registerValue(StyleSheet{"extension.css"}));

  printState("After extension is loaded", menu, styles);

  extensionStore.clear();

  printState("After extension is unloaded", menu, styles);
  return 0;
}
