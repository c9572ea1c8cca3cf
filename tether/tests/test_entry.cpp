#include <catch2/catch_all.hpp>
#include <tether/core/registry.hpp>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

using namespace tether;

static_assert(!std::is_copy_constructible_v<Entry<int>>);
static_assert(!std::is_copy_assignable_v<Entry<int>>);
static_assert(std::is_nothrow_move_constructible_v<Entry<int>>);
static_assert(!std::is_copy_constructible_v<AnyEntry>);
static_assert(std::is_nothrow_move_constructible_v<AnyEntry>);
static_assert(std::is_copy_constructible_v<Registry<int>>);

TEST_CASE("Typed entry access", "[entry]") {
  Registry<int> registry;
  auto e1 = registry.registerValue(11);
  auto e2 = registry.registerValue(22);

  CHECK(e1.read()->get() == 11);
  CHECK(**e2.read() == 22);

  e1.write()->get() = 33;
  **e2.write() = 44;

  CHECK(e1.read()->get() == 33);
  CHECK(e2.read()->get() == 44);
}

TEST_CASE("Entry moves", "[entry]") {
  Registry<int> registry;
  auto entry = registry.registerValue(1);
  CHECK(entry.valid());

  Entry<int> moved = std::move(entry);
  CHECK_FALSE(entry.valid());
  CHECK(moved.valid());
  CHECK(registry.size() == 1);

  // Moved-from entries have nothing to release
  entry.reset();
  CHECK(registry.size() == 1);
  CHECK_FALSE(entry.read());

  SECTION("Move assignment releases the previous registration") {
    auto other = registry.registerValue(2);
    CHECK(registry.size() == 2);
    other = std::move(moved);
    CHECK(registry.size() == 1);
    CHECK(other.getId() == 0);
    CHECK(other.read()->get() == 1);
  }

  SECTION("Default constructed entries are empty") {
    Entry<int> empty;
    CHECK_FALSE(empty);
    empty = std::move(moved);
    CHECK(empty);
    CHECK(registry.size() == 1);
  }
}

TEST_CASE("Generic entries", "[entry]") {
  Registry<int> r1;
  Registry<bool> r2;
  std::vector<AnyEntry> entries;

  entries.push_back(r1.registerValue(11).asGeneric());
  CHECK(r1.size() == 1);
  CHECK(r2.size() == 0);

  entries.push_back(r2.registerValue(false));
  CHECK(r1.size() == 1);
  CHECK(r2.size() == 1);

  SECTION("Dropping the container releases everything") {
    entries.clear();
    CHECK(r1.empty());
    CHECK(r2.empty());
  }

  SECTION("Generic entries release the same slot") {
    auto typed = r1.registerValue(12);
    EntryId id = typed.getId();
    AnyEntry generic = std::move(typed).asGeneric();
    CHECK_FALSE(typed.valid());
    CHECK(generic.getId() == id);
    CHECK(r1.read().contains(id));

    generic.reset();
    CHECK_FALSE(r1.read().contains(id));
    CHECK(r1.size() == 1);
  }

  SECTION("Converting an empty entry") {
    Entry<int> empty;
    AnyEntry generic = std::move(empty).asGeneric();
    CHECK_FALSE(generic.valid());
  }
}

TEST_CASE("Entries outliving their registry", "[entry]") {
  std::optional<Registry<int>> registry{std::in_place};
  int removedCount{};
  registry->setRemoveCallback([&](EntryId, int &) { ++removedCount; });

  auto entry = registry->registerValue(11);
  AnyEntry generic = registry->registerValue(12).asGeneric();
  CHECK(entry.write());

  registry.reset();
  CHECK_FALSE(entry.write());
  CHECK_FALSE(entry.read());

  // Silently does nothing
  entry.reset();
  generic.reset();
  CHECK(removedCount == 0);
}

TEST_CASE("Guards keep the registry alive", "[entry]") {
  std::optional<Registry<std::string>> registry{std::in_place};
  auto entry = registry->registerValue("value");

  auto guard = entry.read();
  REQUIRE(guard);
  registry.reset();
  CHECK(guard->get() == "value");
}

TEST_CASE("Shared entries", "[entry]") {
  Registry<int> registry;
  auto shared = std::make_shared<Entry<int>>(registry.registerValue(11));
  auto shared2 = shared;
  CHECK(registry.size() == 1);

  shared.reset();
  CHECK(registry.size() == 1);

  shared2.reset();
  CHECK(registry.size() == 0);
}

TEST_CASE("Leaked entries", "[entry]") {
  Registry<int> registry;
  auto entry = registry.registerValue(11);
  entry.leak();
  CHECK_FALSE(entry.valid());
  CHECK(registry.size() == 1);

  AnyEntry generic = registry.registerValue(12);
  generic.leak();
  CHECK(registry.size() == 2);
}
