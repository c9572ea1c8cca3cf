#ifndef CDC9D7BF_7A93_481C_A4B0_BF596FF72F24
#define CDC9D7BF_7A93_481C_A4B0_BF596FF72F24

#include <stdint.h>
#include <shared_mutex>

namespace tether {

typedef uint64_t EntryId;

// The part of a registry an entry handle can see
// handles only keep a weak reference to this, the registry owns it
struct RegistryStorageBase {
  // Guards everything in the derived storage
  std::shared_mutex lock;

  virtual ~RegistryStorageBase() = default;

  // Acquires the exclusive lock itself
  // removing an id that is not (or no longer) present does nothing
  virtual void remove(EntryId id) = 0;
};

template <typename T> struct TypedRegistryStorage : public RegistryStorageBase {
  // Assumes already locked
  virtual T *find(EntryId id) = 0;
};

} // namespace tether

#endif /* CDC9D7BF_7A93_481C_A4B0_BF596FF72F24 */
