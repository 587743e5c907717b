#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <tweenkit/properties.hpp>

namespace tweenkit
{

using HookId = uint32_t;

inline constexpr HookId INVALID_HOOK = 0;

// Per-engine event hooks. Each event name maps to an ordered list of
// callbacks; callbacks run in the order they were added.
class HookRegistry
{
   public:
    using HookFn = std::function<void(PropertyMap& current)>;

    // Appends fn to the named list, creating it if needed. Returns an id for
    // remove(), or INVALID_HOOK if fn is empty.
    HookId add(const std::string& name, HookFn fn);

    // Removes the entry with this id from the named list. Returns false if
    // no such entry exists.
    bool remove(const std::string& name, HookId id);

    // Empties the named list. The name stays registered.
    void clear(const std::string& name);

    void clear_all() { hooks_.clear(); }

    // True if a list exists for this name, even an empty one.
    bool has(const std::string& name) const { return hooks_.count(name) > 0; }

    size_t count(const std::string& name) const;

    // Runs every callback registered under name. Returns the number run.
    size_t invoke(const std::string& name, PropertyMap& current) const;

   private:
    struct Entry
    {
        HookId id;
        HookFn fn;
    };

    std::map<std::string, std::vector<Entry>> hooks_;
    HookId                                    next_id_ = 1;
};

}   // namespace tweenkit
