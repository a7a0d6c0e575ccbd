#pragma once
#include "gt/ids/Id.hpp"
#include "gt/scene/ObjectStore.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gt {

enum class DemoSet : std::uint8_t {
  Shapes2d,    // six flat shapes laid out in two rows
  Primitives3d // sphere, cube, cone, torus above the table
};

bool parseDemoSet(const std::string& s, DemoSet& out);
const char* demoSetName(DemoSet s);

// Appends the preset to the store and returns the new ids in creation order.
std::vector<ObjectId> addDemoObjects(ObjectStore& store, DemoSet set);

} // namespace gt
