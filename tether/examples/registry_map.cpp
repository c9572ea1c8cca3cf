/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright © 2024 Fragcolor Pte. Ltd. */

#include <tether/tether.hpp>
#include <tether/log/log.hpp>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>

using namespace tether;

struct EndPoint {
  virtual ~EndPoint() = default;
  virtual void execute() const = 0;
};

struct GetUser : public EndPoint {
  void execute() const override { fmt::print("Getting user\n"); }
};

int main() {
  logging::setupDefaultLoggerConditional("");

  RegistryMap<std::string, std::unique_ptr<EndPoint>> routes;
  auto entry = routes.registerValue("get_user", std::make_unique<GetUser>());

  {
    auto guard = routes.read();
    if (auto endPoint = guard.get("get_user"))
      (*endPoint)->execute();
  }

  try {
    auto duplicate = routes.registerValue("get_user", std::make_unique<GetUser>());
  } catch (const DuplicateKeyError &e) {
    fmt::print("Rejected: {}\n", e.what());
  }
  return 0;
}
