#include <algorithm>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/sandbox/normalizer.h>
#include <cmath>
#include <vector>

namespace cinder::sandbox
{

namespace
{

using cinder::json::Json;
using cinder::runtime::ObjectKind;
using cinder::runtime::Value;

bool valid_utf8(std::string_view bytes)
{
    std::size_t i = 0;
    while (i < bytes.size())
    {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        std::size_t length = 0;
        if (lead < 0x80)
        {
            length = 1;
        }
        else if (lead >= 0xC2 && lead <= 0xDF)
        {
            length = 2;
        }
        else if (lead >= 0xE0 && lead <= 0xEF)
        {
            length = 3;
        }
        else if (lead >= 0xF0 && lead <= 0xF4)
        {
            length = 4;
        }
        else
        {
            return false;
        }
        if (i + length > bytes.size())
        {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k)
        {
            if ((static_cast<unsigned char>(bytes[i + k]) & 0xC0) != 0x80)
            {
                return false;
            }
        }
        i += length;
    }
    return true;
}

Json number(double value)
{
    if (!std::isfinite(value))
    {
        return Json{cinder::runtime::float_repr(value)};
    }
    return Json{value};
}

class Normalizer
{
  public:
    Json convert(const Value& value)
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
            return number(value.as_float());
        }
        if (value.is_complex())
        {
            const auto z = value.as_complex();
            return Json{Json::Array{number(z.real()), number(z.imag())}};
        }
        if (const auto* s = value.as<cinder::runtime::StrObject>())
        {
            return Json{s->value};
        }
        if (const auto* b = value.as<cinder::runtime::BytesObject>())
        {
            if (valid_utf8(b->value))
            {
                return Json{b->value};
            }
            return Json{"<binary data: " + std::to_string(b->value.size()) + " bytes>"};
        }
        if (const auto* range = value.as<cinder::runtime::RangeObject>())
        {
            Json::Array out;
            for (std::int64_t i = 0; i < range->size(); ++i)
            {
                out.push_back(Json{range->at(i)});
            }
            return Json{std::move(out)};
        }
        if (const auto* array = value.as<cinder::runtime::ArrayObject>())
        {
            Json::Array out;
            out.reserve(array->items.size());
            for (const auto& item : array->items)
            {
                out.push_back(item.is_float() ? number(item.as_float()) : Json{item.integral()});
            }
            return Json{std::move(out)};
        }
        if (value.is(ObjectKind::List) || value.is(ObjectKind::Tuple))
        {
            if (active(value) || stack_.size() >= kMaxDepth)
            {
                return repr_text(value);
            }
            Visit visit(*this, value);
            const auto& items = value.is(ObjectKind::List) ? value.as<cinder::runtime::ListObject>()->items
                                                          : value.as<cinder::runtime::TupleObject>()->items;
            Json::Array out;
            out.reserve(items.size());
            for (const auto& item : items)
            {
                out.push_back(convert(item));
            }
            return Json{std::move(out)};
        }
        if (const auto* set = value.as<cinder::runtime::SetObject>())
        {
            Json::Array out;
            for (const auto& e : set->table.entries())
            {
                if (e.live)
                {
                    out.push_back(convert(e.key));
                }
            }
            return Json{std::move(out)};
        }
        if (const auto* dict = value.as<cinder::runtime::DictObject>())
        {
            if (active(value) || stack_.size() >= kMaxDepth)
            {
                return repr_text(value);
            }
            Visit visit(*this, value);
            Json out = cinder::json::make_object();
            for (const auto& e : dict->table.entries())
            {
                if (e.live)
                {
                    out.set(key_text(e.key), convert(e.value));
                }
            }
            return out;
        }
        return repr_text(value);
    }

  private:
    static constexpr std::size_t kMaxDepth = 200;

    std::vector<const cinder::runtime::Object*> stack_;

    /** @brief The value's repr, or a placeholder when even repr cannot render it. */
    static Json repr_text(const Value& value)
    {
        try
        {
            return Json{cinder::runtime::repr(value)};
        }
        catch (const cinder::runtime::ScriptError&)
        {
            return Json{"<unrepresentable " + cinder::runtime::type_name(value) + ">"};
        }
    }

    class Visit
    {
      public:
        Visit(Normalizer& normalizer, const Value& value) : normalizer_(normalizer)
        {
            normalizer_.stack_.push_back(value.as_object().get());
        }
        ~Visit() { normalizer_.stack_.pop_back(); }

        Visit(const Visit&) = delete;
        Visit& operator=(const Visit&) = delete;

      private:
        Normalizer& normalizer_;
    };

    [[nodiscard]] bool active(const Value& value) const
    {
        return std::find(stack_.begin(), stack_.end(), value.as_object().get()) != stack_.end();
    }

    static std::string key_text(const Value& key)
    {
        if (const auto* s = key.as<cinder::runtime::StrObject>())
        {
            return s->value;
        }
        if (key.is_bool())
        {
            return key.as_bool() ? "true" : "false";
        }
        if (key.is_none())
        {
            return "null";
        }
        return cinder::runtime::to_str(key);
    }
};

} // namespace

Json normalize(const Value& value)
{
    Normalizer normalizer;
    return normalizer.convert(value);
}

Json normalize_result(const ExecutionResult& result)
{
    Json out = cinder::json::make_object();
    out.set("success", Json{result.success});
    out.set("output", Json{result.output});
    out.set("error", result.error ? Json{*result.error} : Json{nullptr});
    out.set("result", result.result ? *result.result : Json{nullptr});
    return out;
}

std::string serialize_result(const ExecutionResult& result)
{
    return cinder::json::serialize(normalize_result(result));
}

} // namespace cinder::sandbox
