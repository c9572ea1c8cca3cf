#include <catch2/catch_all.hpp>
#include <tether/core/traced_registry.hpp>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tether;

namespace {
struct TestData {
  int value;
};
} // namespace

TEST_CASE("TracedRegistry notifies every observer", "[traced_registry]") {
  TracedRegistry<TestData> registry;
  int counter1{}, counter2{};

  auto observer1 = registry.registerObserver([&](const LifecycleRecord<TestData> &) { counter1++; });
  auto observer2 = registry.registerObserver([&](LifecycleEvent, EntryId, const TestData &) { counter2++; });

  auto entry = registry.registerValue(TestData{42});
  CHECK(counter1 == 1);
  CHECK(counter2 == 1);

  entry.reset();
  CHECK(counter1 == 2);
  CHECK(counter2 == 2);

  observer2.reset();
  auto entry2 = registry.registerValue(TestData{43});
  CHECK(counter1 == 3);
  CHECK(counter2 == 2);
}

TEST_CASE("TracedRegistry event order", "[traced_registry]") {
  TracedRegistry<std::string> registry;
  std::vector<std::string> log;
  auto observer = registry.registerObserver(
      [&](LifecycleEvent event, EntryId id, const std::string &value) { log.push_back(fmt::format("{} {} {}", event, id, value)); });

  auto foo = registry.registerValue("foo");
  auto bar = registry.registerValue("bar");
  foo.reset();
  auto baz = registry.registerValue("baz");
  bar.reset();
  baz.reset();

  CHECK(log == std::vector<std::string>{
                   "Register 0 foo",
                   "Register 1 bar",
                   "Unregister 0 foo",
                   "Register 2 baz",
                   "Unregister 1 bar",
                   "Unregister 2 baz",
               });
}

TEST_CASE("TracedRegistry observers see registry contents", "[traced_registry]") {
  TracedRegistry<int> registry;
  std::vector<int> values;
  auto observer = registry.registerObserver([&](const LifecycleRecord<int> &record) {
    values.push_back(record.event == LifecycleEvent::Register ? record.value : -record.value);
  });

  auto e1 = registry.registerValue(1);
  **e1.write() = 5;
  CHECK(registry.read().get(e1.getId()));
  e1.reset();

  CHECK(values == std::vector<int>{1, -5});
  CHECK(registry.empty());
}

TEST_CASE("TracedRegistry copies share state", "[traced_registry]") {
  TracedRegistry<int> registry;
  TracedRegistry<int> copy = registry;

  int notifications{};
  auto observer = copy.registerObserver([&](const LifecycleRecord<int> &) { ++notifications; });
  {
    auto entry = registry.registerValue(1);
    CHECK(copy.size() == 1);
  }
  CHECK(notifications == 2);
  CHECK(copy.empty());
}

TEST_CASE("LifecycleEvent formatting", "[traced_registry]") {
  CHECK(fmt::format("{}", LifecycleEvent::Register) == "Register");
  CHECK(fmt::format("{}", LifecycleEvent::Unregister) == "Unregister");
}

TEST_CASE("TracedRegistry failed registration is undone", "[traced_registry]") {
  TracedRegistry<std::string> registry;
  std::vector<std::string> first, last;
  auto record = [](std::vector<std::string> &log) {
    return [&log](LifecycleEvent event, EntryId id, const std::string &value) {
      log.push_back(fmt::format("{} {} {}", event, id, value));
    };
  };

  auto observer1 = registry.registerObserver(record(first));
  auto failing = registry.registerObserver([](const LifecycleRecord<std::string> &record) {
    if (record.event == LifecycleEvent::Register)
      throw std::runtime_error("observer failed");
  });
  auto observer2 = registry.registerObserver(record(last));

  CHECK_THROWS_AS((void)registry.registerValue("foo"), std::runtime_error);
  CHECK(registry.empty());
  CHECK(first == std::vector<std::string>{"Register 0 foo", "Unregister 0 foo"});
  CHECK(last == first);

  // The failed id is not handed out again
  failing.reset();
  auto bar = registry.registerValue("bar");
  CHECK(bar.getId() == 1);
  CHECK(first.back() == "Register 1 bar");
  CHECK(registry.size() == 1);
}
