#include <cinder/runtime/args.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/modules.h>
#include <cinder/runtime/ops.h>
#include <string_view>

namespace cinder::runtime
{

namespace
{

constexpr std::string_view kTypecodes = "bBhHiIlLqQfd";

Value array_construct(Interpreter& interp, CallArgs& args)
{
    reject_keywords(args, "array");
    expect_positional(args, "array", 1, 2);
    const auto* code = args.positional[0].as<StrObject>();
    if (code == nullptr)
    {
        raise("TypeError", "array() argument 1 must be a unicode character, not " + type_name(args.positional[0]));
    }
    if (code->value.size() != 1 || kTypecodes.find(code->value[0]) == std::string_view::npos)
    {
        raise("ValueError", "bad typecode (must be b, B, u, h, H, i, I, l, L, q, Q, f or d)");
    }

    const ArrayObject probe(code->value[0], {});
    std::vector<Value> items;
    if (args.positional.size() == 2)
    {
        const Value& init = args.positional[1];
        if (init.is(ObjectKind::Str))
        {
            raise("TypeError", "cannot use a str to initialize an array with typecode '" + code->value + "'");
        }
        for (const auto& item : interp.collect(init))
        {
            items.push_back(check_array_item(probe, item));
        }
    }
    return make_array(code->value[0], std::move(items));
}

} // namespace

std::shared_ptr<ModuleObject> make_array_module()
{
    auto module = make_module("array");
    auto& m = *module;
    define(m, "array", array_construct);
    m.members["typecodes"] = make_str(std::string(kTypecodes));
    return module;
}

} // namespace cinder::runtime
