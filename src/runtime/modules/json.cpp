#include <algorithm>
#include <cinder/json/json.h>
#include <cinder/runtime/args.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/memory_budget.h>
#include <cinder/runtime/modules.h>
#include <cinder/runtime/ops.h>
#include <cmath>

namespace cinder::runtime
{

namespace
{

using cinder::json::Json;

class Encoder
{
  public:
    explicit Encoder(bool sort_keys) : sort_keys_(sort_keys) {}

    Json encode(const Value& value)
    {
        if (value.is_none())
        {
            return Json{nullptr};
        }
        if (value.is_bool())
        {
            return Json{value.as_bool()};
        }
        if (value.is_int())
        {
            return Json{value.as_int()};
        }
        if (value.is_float())
        {
            return Json{value.as_float()};
        }
        if (const auto* s = value.as<StrObject>())
        {
            return Json{s->value};
        }
        if (value.is(ObjectKind::List) || value.is(ObjectKind::Tuple))
        {
            VisitGuard guard(*this, value);
            const auto& items =
                value.is(ObjectKind::List) ? value.as<ListObject>()->items : value.as<TupleObject>()->items;
            Json::Array out;
            out.reserve(items.size());
            for (const auto& item : items)
            {
                out.push_back(encode(item));
            }
            return Json{std::move(out)};
        }
        if (const auto* dict = value.as<DictObject>())
        {
            VisitGuard guard(*this, value);
            Json::Object out;
            for (const auto& e : dict->table.entries())
            {
                if (e.live)
                {
                    out.emplace_back(key_text(e.key), encode(e.value));
                }
            }
            if (sort_keys_)
            {
                std::stable_sort(out.begin(), out.end(),
                                 [](const auto& a, const auto& b) { return a.first < b.first; });
            }
            return Json{std::move(out)};
        }
        raise("TypeError", "Object of type " + type_name(value) + " is not JSON serializable");
    }

  private:
    static constexpr std::size_t kMaxDepth = 500;

    class VisitGuard
    {
      public:
        VisitGuard(Encoder& encoder, const Value& value) : encoder_(encoder)
        {
            const Object* object = value.as_object().get();
            if (encoder_.visiting_.size() >= kMaxDepth)
            {
                raise("RecursionError", "maximum recursion depth exceeded while encoding a JSON object");
            }
            if (std::find(encoder_.visiting_.begin(), encoder_.visiting_.end(), object) != encoder_.visiting_.end())
            {
                raise("ValueError", "Circular reference detected");
            }
            encoder_.visiting_.push_back(object);
        }
        ~VisitGuard() { encoder_.visiting_.pop_back(); }

        VisitGuard(const VisitGuard&) = delete;
        VisitGuard& operator=(const VisitGuard&) = delete;

      private:
        Encoder& encoder_;
    };

    static std::string key_text(const Value& key)
    {
        if (const auto* s = key.as<StrObject>())
        {
            return s->value;
        }
        if (key.is_bool())
        {
            return key.as_bool() ? "true" : "false";
        }
        if (key.is_int())
        {
            return std::to_string(key.as_int());
        }
        if (key.is_float())
        {
            return float_repr(key.as_float());
        }
        if (key.is_none())
        {
            return "null";
        }
        raise("TypeError", "keys must be str, int, float, bool or None, not " + type_name(key));
    }

    bool sort_keys_;
    std::vector<const Object*> visiting_;
};

Value decode(const Json& json)
{
    if (json.is_null())
    {
        return Value::none();
    }
    if (const auto* b = json.as_bool())
    {
        return Value::boolean(*b);
    }
    if (json.is_int())
    {
        return Value::integer(std::get<std::int64_t>(json.value));
    }
    if (json.is_double())
    {
        return Value::real(std::get<double>(json.value));
    }
    if (const auto* s = json.as_string())
    {
        return make_str(*s);
    }
    if (const auto* array = json.as_array())
    {
        std::vector<Value> items;
        items.reserve(array->size());
        for (const auto& item : *array)
        {
            items.push_back(decode(item));
        }
        return make_list(std::move(items));
    }
    Value dict = make_dict();
    auto& table = dict.as<DictObject>()->table;
    for (const auto& [key, member] : *json.as_object())
    {
        table.insert(make_str(key), decode(member));
    }
    recharge(dict);
    return dict;
}

Value json_dumps(Interpreter&, CallArgs& args)
{
    auto indent = take_keyword(args, "indent");
    auto sort_keys = take_keyword(args, "sort_keys");
    (void)take_keyword(args, "ensure_ascii");
    reject_keywords(args, "dumps");
    expect_positional(args, "dumps", 1, 1);

    std::optional<int> width;
    if (indent.has_value() && !indent->is_none())
    {
        width = static_cast<int>(std::clamp<std::int64_t>(int_arg(*indent, "dumps"), 0, 64));
    }
    Encoder encoder(sort_keys.has_value() && truthy(*sort_keys));
    const Json json = encoder.encode(args.positional[0]);
    std::string text = cinder::json::serialize_pretty(json, width);
    check_allocation(text.size());
    return make_str(std::move(text));
}

Value json_loads(Interpreter&, CallArgs& args)
{
    expect_positional(args, "loads", 1, 1);
    const Value& source = args.positional[0];
    std::string_view text;
    if (const auto* s = source.as<StrObject>())
    {
        text = s->value;
    }
    else if (const auto* b = source.as<BytesObject>())
    {
        text = b->value;
    }
    else
    {
        raise("TypeError", "the JSON object must be str, bytes or bytearray, not " + type_name(source));
    }

    auto parsed = cinder::json::parse_document(text);
    if (auto* error = std::get_if<cinder::json::ParseError>(&parsed))
    {
        const std::string_view before = text.substr(0, error->offset);
        const std::size_t line = static_cast<std::size_t>(std::count(before.begin(), before.end(), '\n')) + 1;
        const std::size_t line_start = before.rfind('\n');
        const std::size_t column = line_start == std::string_view::npos ? error->offset + 1 : error->offset - line_start;
        raise(module_exception_type("JSONDecodeError", "ValueError"),
              error->message + ": line " + std::to_string(line) + " column " + std::to_string(column) + " (char " +
                  std::to_string(error->offset) + ")");
    }
    return decode(std::get<Json>(parsed));
}

} // namespace

std::shared_ptr<ModuleObject> make_json_module()
{
    auto module = make_module("json");
    auto& m = *module;
    define(m, "dumps", json_dumps);
    define(m, "loads", json_loads);
    m.members["JSONDecodeError"] = Value::object(module_exception_type("JSONDecodeError", "ValueError"));
    return module;
}

} // namespace cinder::runtime
