#include <cinder/policy/denylist.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/value.h>
#include <cinder/sandbox/namespace_builder.h>
#include <cstdlib>
#include <iostream>
#include <string>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

int main()
{
    namespace rt = cinder::runtime;
    using namespace cinder::sandbox;

    // Reflection builtins are removed; ordinary ones stay.
    {
        const auto builtins = sandbox_builtins();
        for (const auto name : cinder::policy::kStrippedBuiltins)
        {
            if (builtins->count(std::string(name)) != 0)
            {
                fail("stripped builtin still present: " + std::string(name));
            }
        }
        for (const char* kept : {"print", "len", "range", "sorted", "isinstance"})
        {
            if (builtins->count(kept) == 0)
            {
                fail(std::string("missing builtin: ") + kept);
            }
        }
        if (sandbox_builtins() != builtins)
        {
            fail("the sandbox builtin table is built once");
        }
    }

    // A namespace carries __name__ and shares persisted values.
    {
        PersistedState state;
        state.emplace("items", rt::make_list({rt::Value::integer(1)}));
        const auto env = build_namespace(state);
        const auto name = env->vars.find("__name__");
        if (name == env->vars.end() || rt::to_str(name->second) != "__main__")
        {
            fail("__name__ should be __main__");
        }
        if (env->builtins != sandbox_builtins() || !env->is_module())
        {
            fail("namespace should be a module scope over the sandbox builtins");
        }
        const auto items = env->vars.find("items");
        if (items == env->vars.end() || items->second.as_object() != state.at("items").as_object())
        {
            fail("persisted values are shared, not copied");
        }
    }

    // Fresh namespaces do not see each other.
    {
        const auto first = build_namespace({});
        first->vars.insert_or_assign("leak", rt::Value::integer(1));
        const auto second = build_namespace({});
        if (second->vars.count("leak") != 0)
        {
            fail("namespaces must be independent");
        }
    }

    if (!is_persistable("total") || !is_persistable("_private") || is_persistable("__name__") ||
        is_persistable("__builtins__") || is_persistable("eval") || is_persistable("open"))
    {
        fail("is_persistable mismatch");
    }

    {
        rt::Environment globals;
        globals.vars.insert_or_assign("__name__", rt::make_str("__main__"));
        globals.vars.insert_or_assign("x", rt::Value::integer(3));
        globals.vars.insert_or_assign("open", rt::Value::none());
        const auto bindings = capture_bindings(globals);
        if (bindings.size() != 1 || bindings.count("x") != 1)
        {
            fail("only persistable names should be captured");
        }
    }

    std::cout << "OK\n";
    return 0;
}
