#include <tweenkit/filters.hpp>
#include <tweenkit/logger.hpp>
#include <vector>

namespace tweenkit
{

const char* filter_point_name(FilterPoint point)
{
    switch (point)
    {
        case FilterPoint::TweenCreated:
            return "tweenCreated";
        case FilterPoint::BeforeTween:
            return "beforeTween";
        case FilterPoint::AfterTween:
            return "afterTween";
    }
    return "unknown";
}

const FilterFn& Filter::at(FilterPoint point) const
{
    switch (point)
    {
        case FilterPoint::TweenCreated:
            return tween_created;
        case FilterPoint::BeforeTween:
            return before_tween;
        case FilterPoint::AfterTween:
            break;
    }
    return after_tween;
}

FilterRegistry& FilterRegistry::global()
{
    static FilterRegistry registry;
    return registry;
}

void FilterRegistry::add(const std::string& group, Filter filter)
{
    std::lock_guard lock(mutex_);
    groups_[group] = std::move(filter);
    TWEENKIT_LOG_DEBUG("filter", "filter group '{}' installed", group);
}

bool FilterRegistry::remove(const std::string& group)
{
    std::lock_guard lock(mutex_);
    return groups_.erase(group) > 0;
}

void FilterRegistry::clear()
{
    std::lock_guard lock(mutex_);
    groups_.clear();
}

bool FilterRegistry::contains(const std::string& group) const
{
    std::lock_guard lock(mutex_);
    return groups_.count(group) > 0;
}

size_t FilterRegistry::size() const
{
    std::lock_guard lock(mutex_);
    return groups_.size();
}

size_t FilterRegistry::apply(FilterPoint        point,
                             PropertyMap&       current,
                             const PropertyMap& original,
                             const PropertyMap& to) const
{
    // Snapshot under the lock, run outside it so filters may touch the registry
    std::vector<FilterFn> to_run;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [name, filter] : groups_)
        {
            if (const auto& fn = filter.at(point))
                to_run.push_back(fn);
        }
    }

    for (const auto& fn : to_run)
    {
        fn(current, original, to);
    }
    return to_run.size();
}

}   // namespace tweenkit
