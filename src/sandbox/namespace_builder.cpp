#include <cinder/policy/denylist.h>
#include <cinder/runtime/builtins.h>
#include <cinder/sandbox/namespace_builder.h>

namespace cinder::sandbox
{

std::shared_ptr<const cinder::runtime::Builtins> sandbox_builtins()
{
    static const std::shared_ptr<const cinder::runtime::Builtins> table = [] {
        auto builtins = std::make_shared<cinder::runtime::Builtins>(cinder::runtime::make_builtins());
        for (const auto name : cinder::policy::kStrippedBuiltins)
        {
            builtins->erase(std::string(name));
        }
        return builtins;
    }();
    return table;
}

cinder::runtime::EnvPtr build_namespace(const PersistedState& state)
{
    auto env = std::make_shared<cinder::runtime::Environment>();
    env->builtins = sandbox_builtins();
    env->vars.insert_or_assign("__name__", cinder::runtime::make_str("__main__"));
    for (const auto& [name, value] : state)
    {
        env->vars.insert_or_assign(name, value);
    }
    return env;
}

bool is_persistable(std::string_view name)
{
    return !name.starts_with("__") && !cinder::policy::is_blocked_callable(name);
}

PersistedState capture_bindings(const cinder::runtime::Environment& globals)
{
    PersistedState bindings;
    for (const auto& [name, value] : globals.vars)
    {
        if (is_persistable(name))
        {
            bindings.insert_or_assign(name, value);
        }
    }
    return bindings;
}

} // namespace cinder::sandbox
