#ifndef D8602D91_758F_4A39_A4D7_04E5EC07E95A
#define D8602D91_758F_4A39_A4D7_04E5EC07E95A

#include "storage.hpp"
#include "errors.hpp"
#include <limits>
#include <map>

namespace tether {

// Ordered id -> value storage
// ids are handed out from a counter that only moves forward, so iteration order is insertion order
// Not synchronized, the owning registry locks around it
template <typename T> struct SlotTable {
  using Map = std::map<EntryId, T>;
  using iterator = typename Map::iterator;
  using const_iterator = typename Map::const_iterator;
  using node_type = typename Map::node_type;

private:
  Map slots;
  EntryId nextId{};

public:
  SlotTable() = default;
  // Start counting from the given id instead of 0
  explicit SlotTable(EntryId firstId) : nextId(firstId) {}

  EntryId insert(T &&value) {
    if (nextId == std::numeric_limits<EntryId>::max())
      throw KeySpaceExhaustedError(nextId);

    EntryId id = nextId++;
    slots.emplace_hint(slots.end(), id, std::move(value));
    return id;
  }

  // Empty node if the id is not present
  node_type extract(EntryId id) { return slots.extract(id); }

  T *find(EntryId id) {
    auto it = slots.find(id);
    return it != slots.end() ? &it->second : nullptr;
  }
  const T *find(EntryId id) const {
    auto it = slots.find(id);
    return it != slots.end() ? &it->second : nullptr;
  }

  bool contains(EntryId id) const { return slots.contains(id); }
  EntryId peekNextId() const { return nextId; }

  size_t size() const { return slots.size(); }
  bool empty() const { return slots.empty(); }

  iterator begin() { return slots.begin(); }
  iterator end() { return slots.end(); }
  const_iterator begin() const { return slots.begin(); }
  const_iterator end() const { return slots.end(); }
};

} // namespace tether

#endif /* D8602D91_758F_4A39_A4D7_04E5EC07E95A */
