#include <tweenkit/hooks.hpp>
#include <tweenkit/logger.hpp>

namespace tweenkit
{

HookId HookRegistry::add(const std::string& name, HookFn fn)
{
    if (!fn)
        return INVALID_HOOK;

    HookId id = next_id_++;
    hooks_[name].push_back({id, std::move(fn)});
    TWEENKIT_LOG_DEBUG("engine", "hook '{}' added (id {})", name, id);
    return id;
}

bool HookRegistry::remove(const std::string& name, HookId id)
{
    auto it = hooks_.find(name);
    if (it == hooks_.end())
        return false;

    auto& list = it->second;
    for (size_t i = 0; i < list.size(); ++i)
    {
        if (list[i].id == id)
        {
            list.erase(list.begin() + static_cast<std::ptrdiff_t>(i));
            return true;
        }
    }
    return false;
}

void HookRegistry::clear(const std::string& name)
{
    auto it = hooks_.find(name);
    if (it != hooks_.end())
        it->second.clear();
}

size_t HookRegistry::count(const std::string& name) const
{
    auto it = hooks_.find(name);
    return it == hooks_.end() ? 0 : it->second.size();
}

size_t HookRegistry::invoke(const std::string& name, PropertyMap& current) const
{
    auto it = hooks_.find(name);
    if (it == hooks_.end())
        return 0;

    // Copy so a hook may add or remove hooks without invalidating iteration
    const std::vector<Entry> snapshot = it->second;
    for (const auto& entry : snapshot)
    {
        entry.fn(current);
    }
    return snapshot.size();
}

}   // namespace tweenkit
