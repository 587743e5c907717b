#pragma once

#include <functional>
#include <map>
#include <string>

namespace tweenkit
{

// Flat set of named numeric properties. Ordered so that iteration (and thus
// interpolation and filter dispatch) is deterministic.
using PropertyMap = std::map<std::string, double>;

namespace util
{

// Current wall-clock time as milliseconds since the UNIX epoch, with
// sub-millisecond resolution.
double now();

// Calls fn(map, key) for every key in map.
void each(PropertyMap& map, const std::function<void(PropertyMap&, const std::string&)>& fn);

// Copies every property of src into target, overwriting existing keys.
// Keys of target absent from src are left alone. Returns target.
PropertyMap& simple_copy(PropertyMap& target, const PropertyMap& src);

}   // namespace util

}   // namespace tweenkit
