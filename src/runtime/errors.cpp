#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

namespace cinder::runtime
{

namespace
{

struct Registry
{
    std::vector<std::shared_ptr<ExceptionTypeObject>> builtins;
    std::unordered_map<std::string, std::shared_ptr<ExceptionTypeObject>> by_name;
    std::mutex module_mutex;
    std::unordered_map<std::string, std::shared_ptr<ExceptionTypeObject>> module_types;

    void add(const char* name, const char* base)
    {
        std::shared_ptr<ExceptionTypeObject> parent;
        if (base != nullptr)
        {
            parent = by_name.at(base);
        }
        auto type = std::make_shared<ExceptionTypeObject>(name, std::move(parent));
        builtins.push_back(type);
        by_name.emplace(name, std::move(type));
    }
};

Registry& registry()
{
    static Registry* instance = [] {
        auto* r = new Registry();
        r->add("BaseException", nullptr);
        r->add("SystemExit", "BaseException");
        r->add("KeyboardInterrupt", "BaseException");
        r->add("Exception", "BaseException");
        r->add("StopIteration", "Exception");
        r->add("ArithmeticError", "Exception");
        r->add("OverflowError", "ArithmeticError");
        r->add("ZeroDivisionError", "ArithmeticError");
        r->add("AssertionError", "Exception");
        r->add("AttributeError", "Exception");
        r->add("EOFError", "Exception");
        r->add("ImportError", "Exception");
        r->add("ModuleNotFoundError", "ImportError");
        r->add("LookupError", "Exception");
        r->add("IndexError", "LookupError");
        r->add("KeyError", "LookupError");
        r->add("MemoryError", "Exception");
        r->add("NameError", "Exception");
        r->add("UnboundLocalError", "NameError");
        r->add("RuntimeError", "Exception");
        r->add("NotImplementedError", "RuntimeError");
        r->add("RecursionError", "RuntimeError");
        r->add("SyntaxError", "Exception");
        r->add("TypeError", "Exception");
        r->add("ValueError", "Exception");
        r->add("UnicodeError", "ValueError");
        r->add("UnicodeDecodeError", "UnicodeError");
        r->add("UnicodeEncodeError", "UnicodeError");
        return r;
    }();
    return *instance;
}

} // namespace

const std::shared_ptr<ExceptionTypeObject>& exception_type(std::string_view name)
{
    auto& r = registry();
    auto it = r.by_name.find(std::string(name));
    if (it == r.by_name.end())
    {
        throw std::out_of_range("unknown exception type: " + std::string(name));
    }
    return it->second;
}

const std::vector<std::shared_ptr<ExceptionTypeObject>>& builtin_exception_types()
{
    return registry().builtins;
}

std::shared_ptr<ExceptionTypeObject> module_exception_type(std::string_view name,
                                                           std::string_view base)
{
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.module_mutex);
    auto it = r.module_types.find(std::string(name));
    if (it != r.module_types.end())
    {
        return it->second;
    }
    auto type = std::make_shared<ExceptionTypeObject>(std::string(name), exception_type(base));
    r.module_types.emplace(std::string(name), type);
    return type;
}

std::shared_ptr<ExceptionObject> make_exception(std::shared_ptr<ExceptionTypeObject> type,
                                                std::string message)
{
    // Exception instances and their messages are never charged so MemoryError stays raisable.
    std::vector<Value> args;
    if (!message.empty())
    {
        args.push_back(Value::object(std::make_shared<StrObject>(std::move(message))));
    }
    return std::make_shared<ExceptionObject>(std::move(type), std::move(args));
}

void raise(std::string_view type, std::string message)
{
    throw ScriptError(make_exception(exception_type(type), std::move(message)));
}

void raise(std::shared_ptr<ExceptionTypeObject> type, std::string message)
{
    throw ScriptError(make_exception(std::move(type), std::move(message)));
}

void raise_with_args(std::string_view type, std::vector<Value> args)
{
    throw ScriptError(std::make_shared<ExceptionObject>(exception_type(type), std::move(args)));
}

std::string exception_message(const ExceptionObject& exception)
{
    if (exception.args.empty())
    {
        return "";
    }
    if (exception.args.size() == 1)
    {
        if (exception.type->name == "KeyError")
        {
            return repr(exception.args.front());
        }
        return to_str(exception.args.front());
    }
    std::string out = "(";
    for (std::size_t i = 0; i < exception.args.size(); ++i)
    {
        if (i > 0)
        {
            out += ", ";
        }
        out += repr(exception.args[i]);
    }
    out += ")";
    return out;
}

ScriptError::ScriptError(std::shared_ptr<ExceptionObject> exception)
    : exception_(std::move(exception)), message_(exception_message(*exception_))
{
    what_ = exception_->type->name;
    if (!message_.empty())
    {
        what_ += ": " + message_;
    }
}

bool ScriptError::is_a(std::string_view type) const
{
    auto& r = registry();
    auto it = r.by_name.find(std::string(type));
    return it != r.by_name.end() && exception_->type->is_subclass_of(*it->second);
}

std::string ScriptError::format_traceback() const
{
    std::string out = "Traceback (most recent call last):\n";
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it)
    {
        out += "  File \"" + it->file + "\", line " + std::to_string(it->line) + ", in " +
               it->function + "\n";
    }
    out += what_;
    out += "\n";
    return out;
}

} // namespace cinder::runtime
