#include <algorithm>
#include <cinder/parser/ast.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/memory_budget.h>
#include <cinder/runtime/ops.h>
#include <cinder/runtime/value.h>
#include <new>

namespace cinder::runtime
{

namespace
{

constexpr std::int64_t kEmpty = -1;
constexpr std::int64_t kTombstone = -2;
constexpr std::size_t kMinSlots = 8;

std::size_t str_footprint(const StrObject& s)
{
    return sizeof(StrObject) + s.value.capacity();
}

std::size_t items_footprint(std::size_t base, const std::vector<Value>& items)
{
    return base + items.capacity() * sizeof(Value);
}

// Queue of the outermost defer_release call on this thread; null when none is draining.
thread_local std::vector<std::shared_ptr<void>>* t_release_queue = nullptr;

template <typename T, typename... Args> std::shared_ptr<T> charged(std::size_t extra, Args&&... args)
{
    auto obj = std::make_shared<T>(std::forward<Args>(args)...);
    charge_object(*obj, sizeof(T) + extra);
    return obj;
}

} // namespace

Object::~Object()
{
    refund_object(*this);
}

void defer_release(std::shared_ptr<void> ref) noexcept
{
    if (ref == nullptr || ref.use_count() > 1)
    {
        return;
    }
    if (t_release_queue != nullptr)
    {
        try
        {
            t_release_queue->push_back(std::move(ref));
        }
        catch (const std::bad_alloc&)
        {
            ref.reset();
        }
        return;
    }

    std::vector<std::shared_ptr<void>> queue;
    t_release_queue = &queue;
    ref.reset();
    while (!queue.empty())
    {
        std::shared_ptr<void> next = std::move(queue.back());
        queue.pop_back();
        next.reset();
    }
    t_release_queue = nullptr;
}

void defer_release(Value& value) noexcept
{
    defer_release(value.take_object());
}

void defer_release(std::vector<Value>& values) noexcept
{
    for (auto& value : values)
    {
        defer_release(value);
    }
    values.clear();
}

ListObject::~ListObject()
{
    defer_release(items);
}

TupleObject::~TupleObject()
{
    defer_release(items);
}

DictObject::~DictObject()
{
    table.release_entries();
}

SetObject::~SetObject()
{
    table.release_entries();
}

FunctionObject::~FunctionObject()
{
    for (auto& value : defaults)
    {
        if (value.has_value())
        {
            defer_release(*value);
        }
    }
    defer_release(std::move(closure));
}

BoundMethodObject::~BoundMethodObject()
{
    defer_release(self);
}

ExceptionObject::~ExceptionObject()
{
    defer_release(args);
}

StrObject::StrObject(std::string v) : Object(kKind), value(std::move(v))
{
    ascii = std::all_of(value.begin(), value.end(),
                        [](char c) { return static_cast<unsigned char>(c) < 0x80; });
    length = ascii ? value.size() : utf8_length(value);
}

std::int64_t RangeObject::size() const
{
    if (step > 0 && start < stop)
    {
        return static_cast<std::int64_t>((static_cast<unsigned long long>(stop) -
                                          static_cast<unsigned long long>(start) - 1) /
                                         static_cast<unsigned long long>(step)) +
               1;
    }
    if (step < 0 && start > stop)
    {
        return static_cast<std::int64_t>((static_cast<unsigned long long>(start) -
                                          static_cast<unsigned long long>(stop) - 1) /
                                         (0ULL - static_cast<unsigned long long>(step))) +
               1;
    }
    return 0;
}

bool ExceptionTypeObject::is_subclass_of(const ExceptionTypeObject& other) const
{
    for (const ExceptionTypeObject* t = this; t != nullptr; t = t->base.get())
    {
        if (t == &other)
        {
            return true;
        }
    }
    return false;
}

const std::vector<cinder::parser::Param>& FunctionObject::params() const
{
    return def != nullptr ? def->params : lambda->params;
}

const cinder::parser::ScopeInfo& FunctionObject::scope() const
{
    return def != nullptr ? def->scope : lambda->scope;
}

// --- HashTable ---

std::int64_t HashTable::locate(const Value& key, std::size_t hash) const
{
    if (slots_.empty())
    {
        return kEmpty;
    }
    const std::size_t mask = slots_.size() - 1;
    for (std::size_t i = hash & mask;; i = (i + 1) & mask)
    {
        const std::int64_t slot = slots_[i];
        if (slot == kEmpty)
        {
            return kEmpty;
        }
        if (slot >= 0)
        {
            const HashEntry& entry = entries_[static_cast<std::size_t>(slot)];
            if (entry.hash == hash && (identical(entry.key, key) || values_equal(entry.key, key)))
            {
                return static_cast<std::int64_t>(i);
            }
        }
    }
}

void HashTable::rebuild(std::size_t slot_count)
{
    std::vector<HashEntry> compacted;
    compacted.reserve(live_);
    for (auto& entry : entries_)
    {
        if (entry.live)
        {
            compacted.push_back(std::move(entry));
        }
    }
    entries_ = std::move(compacted);

    slots_.assign(slot_count, kEmpty);
    const std::size_t mask = slot_count - 1;
    for (std::size_t idx = 0; idx < entries_.size(); ++idx)
    {
        std::size_t i = entries_[idx].hash & mask;
        while (slots_[i] != kEmpty)
        {
            i = (i + 1) & mask;
        }
        slots_[i] = static_cast<std::int64_t>(idx);
    }
}

const HashEntry* HashTable::find(const Value& key) const
{
    const std::int64_t slot = locate(key, hash_value(key));
    if (slot < 0)
    {
        return nullptr;
    }
    return &entries_[static_cast<std::size_t>(slots_[static_cast<std::size_t>(slot)])];
}

HashEntry* HashTable::find(const Value& key)
{
    return const_cast<HashEntry*>(static_cast<const HashTable&>(*this).find(key));
}

bool HashTable::insert(const Value& key, Value value)
{
    const std::size_t hash = hash_value(key);
    const std::int64_t found = locate(key, hash);
    if (found >= 0)
    {
        entries_[static_cast<std::size_t>(slots_[static_cast<std::size_t>(found)])].value =
            std::move(value);
        return false;
    }

    if ((entries_.size() + 1) * 3 > slots_.size() * 2)
    {
        std::size_t count = kMinSlots;
        while (count < (live_ + 1) * 2)
        {
            count *= 2;
        }
        check_allocation(count, sizeof(std::int64_t) + sizeof(HashEntry));
        rebuild(count);
    }

    const std::size_t mask = slots_.size() - 1;
    std::size_t i = hash & mask;
    while (slots_[i] >= 0)
    {
        i = (i + 1) & mask;
    }
    slots_[i] = static_cast<std::int64_t>(entries_.size());
    entries_.push_back(HashEntry{.key = key, .value = std::move(value), .hash = hash, .live = true});
    ++live_;
    ++version_;
    return true;
}

bool HashTable::erase(const Value& key)
{
    const std::int64_t slot = locate(key, hash_value(key));
    if (slot < 0)
    {
        return false;
    }
    auto& ref = slots_[static_cast<std::size_t>(slot)];
    HashEntry& entry = entries_[static_cast<std::size_t>(ref)];
    entry.live = false;
    entry.key = Value::none();
    entry.value = Value::none();
    ref = kTombstone;
    --live_;
    ++version_;
    return true;
}

void HashTable::clear()
{
    entries_.clear();
    slots_.clear();
    live_ = 0;
    ++version_;
}

std::size_t HashTable::footprint() const
{
    return entries_.capacity() * sizeof(HashEntry) + slots_.capacity() * sizeof(std::int64_t);
}

void HashTable::release_entries()
{
    for (auto& entry : entries_)
    {
        defer_release(entry.key);
        defer_release(entry.value);
    }
}

// --- factories ---

Value make_str(std::string value)
{
    auto obj = std::make_shared<StrObject>(std::move(value));
    charge_object(*obj, str_footprint(*obj));
    return Value::object(std::move(obj));
}

Value make_bytes(std::string value)
{
    const std::size_t extra = value.capacity();
    return Value::object(charged<BytesObject>(extra, std::move(value)));
}

Value make_list(std::vector<Value> items)
{
    const std::size_t extra = items.capacity() * sizeof(Value);
    return Value::object(charged<ListObject>(extra, std::move(items)));
}

Value make_tuple(std::vector<Value> items)
{
    const std::size_t extra = items.capacity() * sizeof(Value);
    return Value::object(charged<TupleObject>(extra, std::move(items)));
}

Value make_dict()
{
    return Value::object(charged<DictObject>(0));
}

Value make_set()
{
    return Value::object(charged<SetObject>(0));
}

Value make_range(std::int64_t start, std::int64_t stop, std::int64_t step)
{
    return Value::object(charged<RangeObject>(0, start, stop, step));
}

Value make_array(char typecode, std::vector<Value> items)
{
    const std::size_t extra = items.capacity() * sizeof(Value);
    return Value::object(charged<ArrayObject>(extra, typecode, std::move(items)));
}

Value make_dict_view(std::shared_ptr<DictObject> dict, DictViewObject::Which which)
{
    return Value::object(charged<DictViewObject>(0, std::move(dict), which));
}

Value make_builtin(std::string name, NativeFunction fn)
{
    return Value::object(charged<BuiltinObject>(0, std::move(name), std::move(fn)));
}

Value make_bound_method(Value self, std::string name, NativeMethod fn)
{
    return Value::object(charged<BoundMethodObject>(0, std::move(self), std::move(name), fn));
}

Value make_iterator(std::string type_name, IteratorObject::Next next)
{
    return Value::object(charged<IteratorObject>(0, std::move(type_name), std::move(next), 1));
}

Value make_wrapping_iterator(std::string type_name, const std::vector<Value>& sources, IteratorObject::Next next)
{
    std::size_t depth = 1;
    for (const auto& source : sources)
    {
        if (const auto* inner = source.as<IteratorObject>())
        {
            depth = std::max(depth, inner->depth + 1);
        }
    }
    if (depth > kMaxIteratorDepth)
    {
        raise("RecursionError", "maximum recursion depth exceeded while wrapping an iterator");
    }
    return Value::object(charged<IteratorObject>(0, std::move(type_name), std::move(next), depth));
}

std::shared_ptr<FunctionObject> make_function()
{
    return charged<FunctionObject>(0);
}

std::shared_ptr<ModuleObject> make_module(std::string name)
{
    return charged<ModuleObject>(0, std::move(name));
}

void recharge(const Value& container)
{
    if (auto* list = container.as<ListObject>())
    {
        recharge_object(*list, items_footprint(sizeof(ListObject), list->items));
    }
    else if (auto* dict = container.as<DictObject>())
    {
        recharge_object(*dict, sizeof(DictObject) + dict->table.footprint());
    }
    else if (auto* set = container.as<SetObject>())
    {
        recharge_object(*set, sizeof(SetObject) + set->table.footprint());
    }
    else if (auto* array = container.as<ArrayObject>())
    {
        recharge_object(*array, items_footprint(sizeof(ArrayObject), array->items));
    }
}

// --- UTF-8 ---

std::size_t utf8_length(std::string_view text)
{
    std::size_t count = 0;
    for (char c : text)
    {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
        {
            ++count;
        }
    }
    return count;
}

std::size_t utf8_offset(std::string_view text, std::size_t index)
{
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80)
        {
            if (seen == index)
            {
                return i;
            }
            ++seen;
        }
    }
    return text.size();
}

namespace
{

// Decodes one code point at `i`; returns bytes consumed (0 on malformed input).
std::size_t decode_one(std::string_view text, std::size_t i, std::uint32_t& out)
{
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t need = 0;
    std::uint32_t cp = 0;
    if (lead < 0x80)
    {
        out = lead;
        return 1;
    }
    if ((lead & 0xE0) == 0xC0)
    {
        need = 1;
        cp = lead & 0x1F;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        need = 2;
        cp = lead & 0x0F;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        need = 3;
        cp = lead & 0x07;
    }
    else
    {
        return 0;
    }
    if (i + need >= text.size())
    {
        return 0;
    }
    for (std::size_t k = 1; k <= need; ++k)
    {
        const auto c = static_cast<unsigned char>(text[i + k]);
        if ((c & 0xC0) != 0x80)
        {
            return 0;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    static constexpr std::uint32_t kMin[] = {0, 0x80, 0x800, 0x10000};
    if (cp < kMin[need] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    {
        return 0;
    }
    out = cp;
    return need + 1;
}

} // namespace

std::vector<std::uint32_t> utf8_decode(std::string_view text)
{
    std::vector<std::uint32_t> out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size())
    {
        std::uint32_t cp = 0;
        const std::size_t used = decode_one(text, i, cp);
        if (used == 0)
        {
            out.push_back(0xFFFD);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += used;
    }
    return out;
}

bool utf8_valid(std::string_view text)
{
    std::size_t i = 0;
    while (i < text.size())
    {
        std::uint32_t cp = 0;
        const std::size_t used = decode_one(text, i, cp);
        if (used == 0)
        {
            return false;
        }
        i += used;
    }
    return true;
}

} // namespace cinder::runtime
