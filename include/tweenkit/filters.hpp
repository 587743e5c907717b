#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <tweenkit/properties.hpp>

namespace tweenkit
{

// Lifecycle points at which filters run.
enum class FilterPoint
{
    TweenCreated,   // once, when tween() sets up a run
    BeforeTween,    // every tick, before interpolation
    AfterTween,     // every tick, after interpolation
};

const char* filter_point_name(FilterPoint point);

using FilterFn =
    std::function<void(PropertyMap& current, const PropertyMap& original, const PropertyMap& to)>;

// A filter group. Any callback may be left empty.
struct Filter
{
    FilterFn tween_created;
    FilterFn before_tween;
    FilterFn after_tween;

    const FilterFn& at(FilterPoint point) const;
};

// Filters applied to every tween of every engine that uses this registry.
// Groups run in name order. Engines default to FilterRegistry::global();
// populate it during setup, before tweens start.
class FilterRegistry
{
   public:
    FilterRegistry() = default;

    FilterRegistry(const FilterRegistry&)            = delete;
    FilterRegistry& operator=(const FilterRegistry&) = delete;

    static FilterRegistry& global();

    // Installs or replaces a group.
    void add(const std::string& group, Filter filter);
    bool remove(const std::string& group);
    void clear();

    bool   contains(const std::string& group) const;
    size_t size() const;

    // Runs each group's callback for `point`. Returns the number invoked.
    size_t apply(FilterPoint        point,
                 PropertyMap&       current,
                 const PropertyMap& original,
                 const PropertyMap& to) const;

   private:
    mutable std::mutex            mutex_;
    std::map<std::string, Filter> groups_;
};

}   // namespace tweenkit
