#ifndef DC5ECA61_2913_4695_97A1_0ECA52F2C7F1
#define DC5ECA61_2913_4695_97A1_0ECA52F2C7F1

#include <tether/core/entry.hpp>
#include <tether/core/errors.hpp>
#include <tether/core/event.hpp>
#include <tether/core/registry.hpp>
#include <tether/core/registry_map.hpp>
#include <tether/core/traced_registry.hpp>

#endif /* DC5ECA61_2913_4695_97A1_0ECA52F2C7F1 */
