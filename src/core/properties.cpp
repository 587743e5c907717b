#include <chrono>
#include <tweenkit/properties.hpp>

namespace tweenkit::util
{

double now()
{
    using Millis = std::chrono::duration<double, std::milli>;
    return Millis(std::chrono::system_clock::now().time_since_epoch()).count();
}

void each(PropertyMap& map, const std::function<void(PropertyMap&, const std::string&)>& fn)
{
    if (!fn)
        return;
    for (auto& [key, value] : map)
    {
        fn(map, key);
    }
}

PropertyMap& simple_copy(PropertyMap& target, const PropertyMap& src)
{
    for (const auto& [key, value] : src)
    {
        target[key] = value;
    }
    return target;
}

}   // namespace tweenkit::util
