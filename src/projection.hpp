#pragma once
#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace quasar
{

  // Looks up `field` in an exported mapping: an exact key first, then a
  // dot-separated path through objects (by key) and arrays (by index).
  // Returns nullptr when any segment is absent or not traversable.
  const Value *resolveField(const Value &mapping, std::string_view field);

  // Restricts mapping to fields. Empty fields returns the whole mapping;
  // absent fields are omitted. Result keys are the field strings as given.
  Value project(const Value &mapping, const std::vector<std::string> &fields);

} // namespace quasar
