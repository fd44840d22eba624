#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file value.h
 * @brief Runtime value representation used by the interpreter.
 *
 * Scalars (None, bool, int, float, complex) are stored inline; everything else is a
 * reference-counted heap object. Heap objects are charged to the active MemoryBudget when
 * created through the `make_*` factories below.
 */

namespace cinder::parser
{
struct FunctionDef;
struct LambdaExpr;
struct Param;
struct ScopeInfo;
} // namespace cinder::parser

namespace cinder::runtime
{

class Interpreter;
struct CallArgs;
struct Environment;
struct Unit;

/** @brief Kind tag for heap objects. */
enum class ObjectKind
{
    Str,
    Bytes,
    List,
    Tuple,
    Dict,
    Set,
    Range,
    Array,
    DictView,
    Function,
    Builtin,
    BoundMethod,
    Module,
    Type,
    ExceptionType,
    Exception,
    Iterator,
};

/** @brief Base class of every heap object. */
struct Object
{
    explicit Object(ObjectKind k) : kind(k) {}
    virtual ~Object();

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    const ObjectKind kind;
    std::uint64_t budget_epoch = 0; // budget that paid for this object; 0 when uncharged
    std::size_t charged_bytes = 0;
};

using ObjectPtr = std::shared_ptr<Object>;

/**
 * @brief A script value.
 *
 * Construct through the named factories; a default-constructed Value is None.
 */
class Value
{
  public:
    using Storage =
        std::variant<std::monostate, bool, std::int64_t, double, std::complex<double>, ObjectPtr>;

    Value() = default;

    [[nodiscard]] static Value none() { return Value{}; }
    [[nodiscard]] static Value boolean(bool v) { return Value{Storage{v}}; }
    [[nodiscard]] static Value integer(std::int64_t v) { return Value{Storage{v}}; }
    [[nodiscard]] static Value real(double v) { return Value{Storage{v}}; }
    [[nodiscard]] static Value complex(std::complex<double> v) { return Value{Storage{v}}; }
    [[nodiscard]] static Value object(ObjectPtr v) { return Value{Storage{std::move(v)}}; }

    [[nodiscard]] bool is_none() const { return std::holds_alternative<std::monostate>(data_); }
    [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(data_); }
    [[nodiscard]] bool is_int() const { return std::holds_alternative<std::int64_t>(data_); }
    [[nodiscard]] bool is_float() const { return std::holds_alternative<double>(data_); }
    [[nodiscard]] bool is_complex() const
    {
        return std::holds_alternative<std::complex<double>>(data_);
    }
    [[nodiscard]] bool is_object() const { return std::holds_alternative<ObjectPtr>(data_); }

    /** @brief True for bool and int (bool is an int subtype). */
    [[nodiscard]] bool is_integral() const { return is_bool() || is_int(); }
    /** @brief True for bool, int and float. */
    [[nodiscard]] bool is_real() const { return is_integral() || is_float(); }

    [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }
    [[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(data_); }
    [[nodiscard]] double as_float() const { return std::get<double>(data_); }
    [[nodiscard]] std::complex<double> as_complex() const
    {
        return std::get<std::complex<double>>(data_);
    }
    [[nodiscard]] const ObjectPtr& as_object() const { return std::get<ObjectPtr>(data_); }

    /** @brief Integer value of a bool or int. */
    [[nodiscard]] std::int64_t integral() const
    {
        return is_bool() ? (as_bool() ? 1 : 0) : as_int();
    }

    /** @brief Float value of a bool, int or float. */
    [[nodiscard]] double to_double() const
    {
        return is_float() ? as_float() : static_cast<double>(integral());
    }

    [[nodiscard]] bool is(ObjectKind kind) const
    {
        const auto* p = std::get_if<ObjectPtr>(&data_);
        return p != nullptr && *p != nullptr && (*p)->kind == kind;
    }

    /** @brief Downcast to a concrete object type; null when the kind differs. */
    template <typename T> [[nodiscard]] T* as() const
    {
        return is(T::kKind) ? static_cast<T*>(std::get<ObjectPtr>(data_).get()) : nullptr;
    }

    /** @brief Shared downcast; null when the kind differs. */
    template <typename T> [[nodiscard]] std::shared_ptr<T> shared() const
    {
        return is(T::kKind) ? std::static_pointer_cast<T>(std::get<ObjectPtr>(data_)) : nullptr;
    }

    [[nodiscard]] const Storage& storage() const { return data_; }

    /** @brief Move the object reference out, leaving None; null for scalars. */
    [[nodiscard]] ObjectPtr take_object()
    {
        auto* p = std::get_if<ObjectPtr>(&data_);
        if (p == nullptr)
        {
            return nullptr;
        }
        ObjectPtr out = std::move(*p);
        data_ = std::monostate{};
        return out;
    }

  private:
    explicit Value(Storage data) : data_(std::move(data)) {}

    Storage data_;
};

/** @brief One slot of a HashTable. Dead slots stay in place until compaction. */
struct HashEntry
{
    Value key;
    Value value;
    std::size_t hash = 0;
    bool live = true;
};

/**
 * @brief Insertion-ordered hash table backing dicts and sets.
 *
 * Lookups hash and compare keys with script semantics and may therefore raise script errors
 * (for example on unhashable keys).
 */
class HashTable
{
  public:
    [[nodiscard]] const HashEntry* find(const Value& key) const;
    [[nodiscard]] HashEntry* find(const Value& key);

    /** @brief Insert or overwrite; returns true when the key was new. */
    bool insert(const Value& key, Value value);
    /** @brief Remove `key`; returns false when absent. */
    bool erase(const Value& key);
    void clear();

    [[nodiscard]] std::size_t size() const { return live_; }
    [[nodiscard]] bool empty() const { return live_ == 0; }
    [[nodiscard]] const std::vector<HashEntry>& entries() const { return entries_; }
    /** @brief Bumped on every insertion or removal of a key. */
    [[nodiscard]] std::size_t version() const { return version_; }
    /** @brief Approximate heap footprint, used for budget accounting. */
    [[nodiscard]] std::size_t footprint() const;
    /** @brief Hand every key and value to defer_release; the table is left holding Nones. */
    void release_entries();

  private:
    std::vector<HashEntry> entries_;
    std::vector<std::int64_t> slots_; // -1 empty, -2 tombstone, otherwise index into entries_
    std::size_t live_ = 0;
    std::size_t version_ = 0;

    [[nodiscard]] std::int64_t locate(const Value& key, std::size_t hash) const;
    void rebuild(std::size_t slot_count);
};

struct StrObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::Str;
    explicit StrObject(std::string v);

    std::string value; // UTF-8
    bool ascii = true;
    std::size_t length = 0; // in code points
};

struct BytesObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::Bytes;
    explicit BytesObject(std::string v) : Object(kKind), value(std::move(v)) {}

    std::string value;
};

struct ListObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::List;
    explicit ListObject(std::vector<Value> v) : Object(kKind), items(std::move(v)) {}
    ~ListObject() override;

    std::vector<Value> items;
};

struct TupleObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::Tuple;
    explicit TupleObject(std::vector<Value> v) : Object(kKind), items(std::move(v)) {}
    ~TupleObject() override;

    std::vector<Value> items;
};

struct DictObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::Dict;
    DictObject() : Object(kKind) {}
    ~DictObject() override;

    HashTable table;
};

struct SetObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::Set;
    SetObject() : Object(kKind) {}
    ~SetObject() override;

    HashTable table;
};

struct RangeObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::Range;
    RangeObject(std::int64_t b, std::int64_t e, std::int64_t s)
        : Object(kKind), start(b), stop(e), step(s)
    {
    }

    std::int64_t start;
    std::int64_t stop;
    std::int64_t step;

    [[nodiscard]] std::int64_t size() const;
    [[nodiscard]] std::int64_t at(std::int64_t index) const { return start + index * step; }
};

/** @brief Typed numeric buffer from the `array` module. */
struct ArrayObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::Array;
    ArrayObject(char code, std::vector<Value> v) : Object(kKind), typecode(code), items(std::move(v))
    {
    }

    char typecode;
    std::vector<Value> items; // ints for integer codes, floats for 'f' / 'd'

    [[nodiscard]] bool holds_floats() const { return typecode == 'f' || typecode == 'd'; }
};

/** @brief Live view over a dict's keys, values or items. */
struct DictViewObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::DictView;
    enum class Which
    {
        Keys,
        Values,
        Items,
    };

    DictViewObject(std::shared_ptr<DictObject> d, Which w) : Object(kKind), dict(std::move(d)), which(w)
    {
    }

    std::shared_ptr<DictObject> dict;
    Which which;
};

/** @brief Script-defined function (`def` or `lambda`). */
struct FunctionObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::Function;
    FunctionObject() : Object(kKind) {}
    ~FunctionObject() override;

    std::string name;
    std::shared_ptr<const Unit> unit; // owns the AST below
    const cinder::parser::FunctionDef* def = nullptr;
    const cinder::parser::LambdaExpr* lambda = nullptr;
    std::vector<std::optional<Value>> defaults; // parallel to params()
    std::shared_ptr<Environment> closure;

    [[nodiscard]] const std::vector<cinder::parser::Param>& params() const;
    [[nodiscard]] const cinder::parser::ScopeInfo& scope() const;
};

using NativeFunction = std::function<Value(Interpreter&, CallArgs&)>;
using NativeMethod = Value (*)(Interpreter&, const Value& self, CallArgs&);

/** @brief Function implemented in C++ (builtins and native module members). */
struct BuiltinObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::Builtin;
    BuiltinObject(std::string n, NativeFunction f) : Object(kKind), name(std::move(n)), fn(std::move(f))
    {
    }

    std::string name;
    NativeFunction fn;
};

/** @brief Native method bound to its receiver (`"a b".split`). */
struct BoundMethodObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::BoundMethod;
    BoundMethodObject(Value s, std::string n, NativeMethod f)
        : Object(kKind), self(std::move(s)), name(std::move(n)), fn(f)
    {
    }
    ~BoundMethodObject() override;

    Value self;
    std::string name;
    NativeMethod fn;
};

/** @brief Imported native module; members are read-only from scripts. */
struct ModuleObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::Module;
    explicit ModuleObject(std::string n) : Object(kKind), name(std::move(n)) {}

    std::string name;
    std::map<std::string, Value> members;
};

/** @brief Builtin type (`int`, `str`, ...): callable as its constructor. */
struct TypeObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::Type;
    TypeObject(std::string n, NativeFunction ctor)
        : Object(kKind), name(std::move(n)), constructor(std::move(ctor))
    {
    }

    std::string name;
    NativeFunction constructor;
};

struct ExceptionTypeObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::ExceptionType;
    ExceptionTypeObject(std::string n, std::shared_ptr<ExceptionTypeObject> b)
        : Object(kKind), name(std::move(n)), base(std::move(b))
    {
    }

    std::string name;
    std::shared_ptr<ExceptionTypeObject> base;

    [[nodiscard]] bool is_subclass_of(const ExceptionTypeObject& other) const;
};

struct ExceptionObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::Exception;
    ExceptionObject(std::shared_ptr<ExceptionTypeObject> t, std::vector<Value> a)
        : Object(kKind), type(std::move(t)), args(std::move(a))
    {
    }
    ~ExceptionObject() override;

    std::shared_ptr<ExceptionTypeObject> type;
    std::vector<Value> args;
};

/** @brief Lazy iterator; `next` returns nullopt when exhausted. */
struct IteratorObject : Object
{
    static constexpr ObjectKind kKind = ObjectKind::Iterator;
    using Next = std::function<std::optional<Value>(Interpreter&)>;

    IteratorObject(std::string t, Next n, std::size_t d)
        : Object(kKind), type_name(std::move(t)), next(std::move(n)), depth(d)
    {
    }

    std::string type_name;
    Next next;
    bool exhausted = false;
    std::size_t depth; // 1 for a plain iterator, one more per wrapping layer (enumerate, map, ...)
};

/** @brief Deepest chain of iterator wrappers make_iterator accepts. */
inline constexpr std::size_t kMaxIteratorDepth = 1000;

/**
 * @brief Release `ref` through the calling thread's release queue.
 *
 * Destructors of objects that hold other objects pass their references here instead of
 * letting them drop in place. Only the outermost call drains the queue, so freeing a
 * structure nested N levels deep takes N loop iterations rather than N native stack frames.
 */
void defer_release(std::shared_ptr<void> ref) noexcept;
void defer_release(Value& value) noexcept;
void defer_release(std::vector<Value>& values) noexcept;

// Factories. Each charges the active MemoryBudget and raises MemoryError when it is exhausted.

[[nodiscard]] Value make_str(std::string value);
[[nodiscard]] Value make_bytes(std::string value);
[[nodiscard]] Value make_list(std::vector<Value> items);
[[nodiscard]] Value make_tuple(std::vector<Value> items);
[[nodiscard]] Value make_dict();
[[nodiscard]] Value make_set();
[[nodiscard]] Value make_range(std::int64_t start, std::int64_t stop, std::int64_t step);
[[nodiscard]] Value make_array(char typecode, std::vector<Value> items);
[[nodiscard]] Value make_dict_view(std::shared_ptr<DictObject> dict, DictViewObject::Which which);
[[nodiscard]] Value make_builtin(std::string name, NativeFunction fn);
[[nodiscard]] Value make_bound_method(Value self, std::string name, NativeMethod fn);
[[nodiscard]] Value make_iterator(std::string type_name, IteratorObject::Next next);
/**
 * @brief Iterator that pulls from `sources` (enumerate, zip, map, filter).
 *
 * Raises RecursionError when the chain of wrapped iterators would exceed kMaxIteratorDepth.
 */
[[nodiscard]] Value make_wrapping_iterator(std::string type_name, const std::vector<Value>& sources,
                                           IteratorObject::Next next);
[[nodiscard]] std::shared_ptr<FunctionObject> make_function();
[[nodiscard]] std::shared_ptr<ModuleObject> make_module(std::string name);

/** @brief Re-account a mutable container after it grew or shrank. */
void recharge(const Value& container);

/** @brief Number of UTF-8 code points in `text`. */
[[nodiscard]] std::size_t utf8_length(std::string_view text);

/** @brief Byte offset of code point `index` in `text` (text.size() when past the end). */
[[nodiscard]] std::size_t utf8_offset(std::string_view text, std::size_t index);

/** @brief Decode UTF-8 into code points; invalid bytes decode as U+FFFD. */
[[nodiscard]] std::vector<std::uint32_t> utf8_decode(std::string_view text);

/** @brief True when `text` is well-formed UTF-8. */
[[nodiscard]] bool utf8_valid(std::string_view text);

} // namespace cinder::runtime
