#include <algorithm>
#include <cinder/runtime/modules.h>
#include <utility>

namespace cinder::runtime
{

namespace
{

using ModuleFactory = std::shared_ptr<ModuleObject> (*)();

const std::vector<std::pair<std::string, ModuleFactory>>& factories()
{
    static const std::vector<std::pair<std::string, ModuleFactory>> table = {
        {"array", make_array_module},   {"cmath", make_cmath_module},
        {"json", make_json_module},     {"math", make_math_module},
        {"random", make_random_module}, {"statistics", make_statistics_module},
        {"string", make_string_module}, {"time", make_time_module},
    };
    return table;
}

} // namespace

const std::vector<std::string>& native_module_names()
{
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& [name, factory] : factories())
        {
            out.push_back(name);
        }
        return out;
    }();
    return names;
}

std::shared_ptr<ModuleObject> load_native_module(std::string_view name)
{
    const auto& table = factories();
    auto it = std::find_if(table.begin(), table.end(), [name](const auto& entry) { return entry.first == name; });
    if (it == table.end())
    {
        return nullptr;
    }
    return it->second();
}

void define(ModuleObject& module, const std::string& name, NativeFunction fn)
{
    module.members.insert_or_assign(name, make_builtin(name, std::move(fn)));
}

} // namespace cinder::runtime
