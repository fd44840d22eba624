#include <algorithm>
#include <cinder/policy/denylist.h>

namespace cinder::policy
{
namespace
{

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& set, std::string_view name)
{
    return std::find(set.begin(), set.end(), name) != set.end();
}

} // namespace

bool is_blocked_module(std::string_view dotted_name)
{
    const std::size_t dot = dotted_name.find('.');
    const std::string_view root =
        (dot == std::string_view::npos) ? dotted_name : dotted_name.substr(0, dot);
    return contains(kBlockedModules, root);
}

bool is_blocked_callable(std::string_view name)
{
    return contains(kBlockedCallables, name);
}

bool is_stripped_builtin(std::string_view name)
{
    return contains(kStrippedBuiltins, name);
}

} // namespace cinder::policy
