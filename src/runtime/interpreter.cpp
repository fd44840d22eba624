#include <algorithm>
#include <cinder/runtime/builtins.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/memory_budget.h>
#include <cinder/runtime/methods.h>
#include <cinder/runtime/modules.h>
#include <cinder/runtime/ops.h>
#include <cstdio>
#include <type_traits>

namespace cinder::runtime
{

using namespace cinder::parser;
using cinder::lexer::TokenKind;

namespace
{

bool has_name(const std::vector<std::string>& names, const std::string& name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

Environment* module_of(Environment* env)
{
    while (env->parent != nullptr)
    {
        env = env->parent.get();
    }
    return env;
}

std::string join_path(const std::vector<std::string>& path)
{
    std::string out;
    for (const auto& part : path)
    {
        if (!out.empty())
        {
            out += ".";
        }
        out += part;
    }
    return out;
}

// repr() with every non-ASCII code point escaped, for the `!a` conversion.
std::string ascii_repr(const Value& value)
{
    const std::string text = repr(value);
    std::string out;
    for (const std::uint32_t cp : utf8_decode(text))
    {
        char buf[16];
        if (cp < 0x80)
        {
            out += static_cast<char>(cp);
            continue;
        }
        if (cp <= 0xFF)
        {
            std::snprintf(buf, sizeof(buf), "\\x%02x", cp);
        }
        else if (cp <= 0xFFFF)
        {
            std::snprintf(buf, sizeof(buf), "\\u%04x", cp);
        }
        else
        {
            std::snprintf(buf, sizeof(buf), "\\U%08x", cp);
        }
        out += buf;
    }
    return out;
}

std::string quote_list(const std::vector<std::string>& names)
{
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i)
    {
        if (i > 0)
        {
            out += names.size() == 2 ? " and " : (i + 1 == names.size() ? ", and " : ", ");
        }
        out += "'" + names[i] + "'";
    }
    return out;
}

[[noreturn]] void attribute_is_read_only(const Value& target, const std::string& name)
{
    if (const auto* module = target.as<ModuleObject>())
    {
        raise("AttributeError", "module '" + module->name + "' attribute '" + name + "' is read-only");
    }
    raise("AttributeError", "'" + type_name(target) + "' object attribute '" + name + "' is read-only");
}

void grow_checked(std::vector<Value>& items)
{
    if (items.size() == items.capacity())
    {
        check_allocation(std::max<std::size_t>(16, items.capacity() * 2), sizeof(Value));
    }
}

class HandlingGuard
{
  public:
    HandlingGuard(std::vector<std::shared_ptr<ExceptionObject>>& stack,
                  std::shared_ptr<ExceptionObject> exception)
        : stack_(stack)
    {
        stack_.push_back(std::move(exception));
    }
    ~HandlingGuard() { stack_.pop_back(); }

    HandlingGuard(const HandlingGuard&) = delete;
    HandlingGuard& operator=(const HandlingGuard&) = delete;

  private:
    std::vector<std::shared_ptr<ExceptionObject>>& stack_;
};

} // namespace

Environment::~Environment()
{
    for (auto& [name, value] : vars)
    {
        defer_release(value);
    }
    defer_release(std::move(parent));
}

void OutputSink::write(std::string_view text)
{
    if (truncated_)
    {
        return;
    }
    if (text_.size() + text.size() > limit_)
    {
        text_.append(text.substr(0, limit_ - text_.size()));
        truncated_ = true;
        return;
    }
    text_.append(text);
}

class Interpreter::FrameGuard
{
  public:
    FrameGuard(Interpreter& interp, Frame frame) : interp_(interp)
    {
        if (interp_.frames_.size() >= interp_.options_.recursion_limit)
        {
            raise("RecursionError", "maximum recursion depth exceeded");
        }
        interp_.frames_.push_back(std::move(frame));
    }
    ~FrameGuard() { interp_.frames_.pop_back(); }

    FrameGuard(const FrameGuard&) = delete;
    FrameGuard& operator=(const FrameGuard&) = delete;

  private:
    Interpreter& interp_;
};

Interpreter::Interpreter(InterpreterOptions options) : options_(options) {}

void Interpreter::tick()
{
    if (options_.cancel != nullptr && options_.cancel->cancelled())
    {
        throw Interrupted();
    }
}

void Interpreter::write_output(std::string_view text)
{
    if (options_.out != nullptr)
    {
        options_.out->write(text);
    }
}

const EnvPtr& Interpreter::current_globals() const
{
    return frames_.back().globals;
}

const EnvPtr& Interpreter::current_env() const
{
    return frames_.back().env;
}

void Interpreter::add_frame(ScriptError& error, const Frame& frame) const
{
    const auto pos = frame.unit->lines.offset_to_line_col(frame.offset);
    error.add_frame(TraceFrame{.file = frame.unit->file.path, .line = pos.line, .function = frame.function});
}

std::optional<Value> Interpreter::exec_program(const UnitPtr& unit, const EnvPtr& globals)
{
    FrameGuard guard(*this, Frame{.unit = unit,
                                  .function = "<module>",
                                  .offset = 0,
                                  .env = globals,
                                  .globals = globals,
                                  .return_value = Value::none()});
    std::optional<Value> last;
    try
    {
        const Block& body = unit->program.body;
        for (std::size_t i = 0; i < body.size(); ++i)
        {
            const Stmt& stmt = body[i];
            const auto* expr = std::get_if<ExprStmt>(&stmt.node);
            if (expr != nullptr && i + 1 == body.size())
            {
                frames_.back().offset = stmt.span.start;
                tick();
                last = eval(expr->expr, globals);
                continue;
            }
            (void)exec_stmt(stmt, globals);
        }
    }
    catch (ScriptError& error)
    {
        add_frame(error, frames_.back());
        throw;
    }
    return last;
}

Value Interpreter::eval_expression(const UnitPtr& unit, const EnvPtr& globals)
{
    FrameGuard guard(*this, Frame{.unit = unit,
                                  .function = "<module>",
                                  .offset = unit->expression->span.start,
                                  .env = globals,
                                  .globals = globals,
                                  .return_value = Value::none()});
    try
    {
        return eval(*unit->expression, globals);
    }
    catch (ScriptError& error)
    {
        add_frame(error, frames_.back());
        throw;
    }
}

// --- statements ---

Interpreter::Flow Interpreter::exec_block(const Block& block, const EnvPtr& env)
{
    for (const auto& stmt : block)
    {
        const Flow flow = exec_stmt(stmt, env);
        if (flow != Flow::Normal)
        {
            return flow;
        }
    }
    return Flow::Normal;
}

Interpreter::Flow Interpreter::exec_stmt(const Stmt& stmt, const EnvPtr& env)
{
    frames_.back().offset = stmt.span.start;
    tick();

    return std::visit(
        [&](const auto& node) -> Flow {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, ExprStmt>)
            {
                (void)eval(node.expr, env);
            }
            else if constexpr (std::is_same_v<Node, AssignStmt>)
            {
                Value value = eval(node.value, env);
                for (const auto& target : node.targets)
                {
                    assign(target, value, env);
                }
            }
            else if constexpr (std::is_same_v<Node, AugAssignStmt>)
            {
                const Expr& target = node.target;
                if (const auto* name = std::get_if<NameExpr>(&target.node))
                {
                    Value current = lookup(name->name, env);
                    Value rhs = eval(node.value, env);
                    bind(name->name, inplace_op(*this, node.op, current, rhs), env);
                }
                else if (const auto* sub = std::get_if<SubscriptExpr>(&target.node))
                {
                    Value base = eval(*sub->base, env);
                    if (const auto* slice = std::get_if<SliceExpr>(&sub->index->node))
                    {
                        Value lower = slice->lower ? eval(*slice->lower, env) : Value::none();
                        Value upper = slice->upper ? eval(*slice->upper, env) : Value::none();
                        Value step = slice->step ? eval(*slice->step, env) : Value::none();
                        Value current = get_slice(base, lower, upper, step);
                        Value rhs = eval(node.value, env);
                        set_slice(*this, base, lower, upper, step, inplace_op(*this, node.op, current, rhs));
                    }
                    else
                    {
                        Value key = eval(*sub->index, env);
                        Value current = get_item(*this, base, key);
                        Value rhs = eval(node.value, env);
                        set_item(base, key, inplace_op(*this, node.op, current, rhs));
                    }
                }
                else if (const auto* attr = std::get_if<AttributeExpr>(&target.node))
                {
                    Value base = eval(*attr->base, env);
                    (void)get_attribute(base, attr->name);
                    attribute_is_read_only(base, attr->name);
                }
            }
            else if constexpr (std::is_same_v<Node, AnnAssignStmt>)
            {
                if (node.value.has_value())
                {
                    assign(node.target, eval(*node.value, env), env);
                }
            }
            else if constexpr (std::is_same_v<Node, IfStmt>)
            {
                for (const auto& branch : node.branches)
                {
                    if (truthy(eval(branch.cond, env)))
                    {
                        return exec_block(branch.body, env);
                    }
                }
                return exec_block(node.else_body, env);
            }
            else if constexpr (std::is_same_v<Node, WhileStmt>)
            {
                while (true)
                {
                    tick();
                    frames_.back().offset = node.cond.span.start;
                    if (!truthy(eval(node.cond, env)))
                    {
                        break;
                    }
                    const Flow flow = exec_block(node.body, env);
                    if (flow == Flow::Break)
                    {
                        return Flow::Normal;
                    }
                    if (flow == Flow::Return)
                    {
                        return flow;
                    }
                }
                return exec_block(node.else_body, env);
            }
            else if constexpr (std::is_same_v<Node, ForStmt>)
            {
                Value iterator = make_iter(eval(node.iter, env));
                while (auto item = next(iterator))
                {
                    frames_.back().offset = stmt.span.start;
                    assign(node.target, std::move(*item), env);
                    const Flow flow = exec_block(node.body, env);
                    if (flow == Flow::Break)
                    {
                        return Flow::Normal;
                    }
                    if (flow == Flow::Return)
                    {
                        return flow;
                    }
                }
                return exec_block(node.else_body, env);
            }
            else if constexpr (std::is_same_v<Node, BreakStmt>)
            {
                return Flow::Break;
            }
            else if constexpr (std::is_same_v<Node, ContinueStmt>)
            {
                return Flow::Continue;
            }
            else if constexpr (std::is_same_v<Node, PassStmt>)
            {
                return Flow::Normal;
            }
            else if constexpr (std::is_same_v<Node, FunctionDef>)
            {
                define_function(node, env);
            }
            else if constexpr (std::is_same_v<Node, ReturnStmt>)
            {
                frames_.back().return_value = node.value.has_value() ? eval(*node.value, env) : Value::none();
                return Flow::Return;
            }
            else if constexpr (std::is_same_v<Node, ImportStmt>)
            {
                exec_import(node, env);
            }
            else if constexpr (std::is_same_v<Node, FromImportStmt>)
            {
                exec_from_import(node, env);
            }
            else if constexpr (std::is_same_v<Node, TryStmt>)
            {
                return exec_try(node, env);
            }
            else if constexpr (std::is_same_v<Node, RaiseStmt>)
            {
                exec_raise(node, env);
            }
            else if constexpr (std::is_same_v<Node, DelStmt>)
            {
                for (const auto& target : node.targets)
                {
                    delete_target(target, env);
                }
            }
            else if constexpr (std::is_same_v<Node, GlobalStmt> || std::is_same_v<Node, NonlocalStmt>)
            {
                // Declarations are resolved from ScopeInfo at bind time.
            }
            else if constexpr (std::is_same_v<Node, AssertStmt>)
            {
                if (!truthy(eval(node.test, env)))
                {
                    if (node.message.has_value())
                    {
                        raise_with_args("AssertionError", {eval(*node.message, env)});
                    }
                    raise("AssertionError", "");
                }
            }
            return Flow::Normal;
        },
        stmt.node);
}

Interpreter::Flow Interpreter::exec_try(const TryStmt& stmt, const EnvPtr& env)
{
    Flow flow = Flow::Normal;
    try
    {
        bool handled = false;
        try
        {
            flow = exec_block(stmt.body, env);
        }
        catch (ScriptError& error)
        {
            const ExceptHandler* chosen = nullptr;
            for (const auto& handler : stmt.handlers)
            {
                if (!handler.type.has_value())
                {
                    chosen = &handler;
                    break;
                }
                frames_.back().offset = handler.span.start;
                if (matches_handler(eval(*handler.type, env), *error.exception()))
                {
                    chosen = &handler;
                    break;
                }
            }
            if (chosen == nullptr)
            {
                throw;
            }

            handled = true;
            auto exception = error.exception();
            HandlingGuard handling(handling_, exception);
            if (chosen->name.has_value())
            {
                bind(*chosen->name, Value::object(exception), env);
            }
            flow = exec_block(chosen->body, env);
            if (chosen->name.has_value())
            {
                Environment* target = env.get();
                if (env->scope != nullptr && has_name(env->scope->globals, *chosen->name))
                {
                    target = module_of(env.get());
                }
                target->vars.erase(*chosen->name);
            }
        }
        if (!handled && flow == Flow::Normal)
        {
            flow = exec_block(stmt.else_body, env);
        }
    }
    catch (ScriptError&)
    {
        if (!stmt.finally_body.empty())
        {
            const Flow final_flow = exec_block(stmt.finally_body, env);
            if (final_flow != Flow::Normal)
            {
                return final_flow;
            }
        }
        throw;
    }

    if (!stmt.finally_body.empty())
    {
        const Flow final_flow = exec_block(stmt.finally_body, env);
        if (final_flow != Flow::Normal)
        {
            return final_flow;
        }
    }
    return flow;
}

bool Interpreter::matches_handler(const Value& handler_type, const ExceptionObject& exception)
{
    if (const auto* type = handler_type.as<ExceptionTypeObject>())
    {
        return exception.type->is_subclass_of(*type);
    }
    if (const auto* tuple = handler_type.as<TupleObject>())
    {
        return std::any_of(tuple->items.begin(), tuple->items.end(),
                           [&](const Value& item) { return matches_handler(item, exception); });
    }
    raise("TypeError", "catching classes that do not inherit from BaseException is not allowed");
}

void Interpreter::exec_raise(const RaiseStmt& stmt, const EnvPtr& env)
{
    if (!stmt.exception.has_value())
    {
        if (handling_.empty())
        {
            raise("RuntimeError", "No active exception to reraise");
        }
        throw ScriptError(handling_.back());
    }

    Value raised = eval(*stmt.exception, env);
    if (stmt.cause.has_value())
    {
        (void)eval(*stmt.cause, env);
    }
    if (auto type = raised.shared<ExceptionTypeObject>())
    {
        throw ScriptError(std::make_shared<ExceptionObject>(std::move(type), std::vector<Value>{}));
    }
    if (auto exception = raised.shared<ExceptionObject>())
    {
        throw ScriptError(std::move(exception));
    }
    raise("TypeError", "exceptions must derive from BaseException");
}

void Interpreter::exec_import(const ImportStmt& stmt, const EnvPtr& env)
{
    for (const auto& name : stmt.names)
    {
        Value module = import_module(join_path(name.path));
        if (name.alias.has_value())
        {
            bind(*name.alias, module, env);
        }
        else
        {
            bind(name.path.front(), import_module(name.path.front()), env);
        }
    }
}

void Interpreter::exec_from_import(const FromImportStmt& stmt, const EnvPtr& env)
{
    const std::string module_name = join_path(stmt.module);
    Value module = import_module(module_name);
    const auto* members = module.as<ModuleObject>();
    for (const auto& name : stmt.names)
    {
        const std::string& member = name.path.front();
        if (member == "*")
        {
            for (const auto& [key, value] : members->members)
            {
                if (!key.empty() && key.front() != '_')
                {
                    bind(key, value, env);
                }
            }
            continue;
        }
        auto it = members->members.find(member);
        if (it == members->members.end())
        {
            raise("ImportError",
                  "cannot import name '" + member + "' from '" + module_name + "' (unknown location)");
        }
        bind(name.alias.has_value() ? *name.alias : member, it->second, env);
    }
}

Value Interpreter::import_module(const std::string& name)
{
    auto it = modules_.find(name);
    if (it != modules_.end())
    {
        return it->second;
    }
    auto module = load_native_module(name);
    if (module == nullptr)
    {
        raise("ModuleNotFoundError", "No module named '" + name + "'");
    }
    Value value = Value::object(std::move(module));
    modules_.emplace(name, value);
    return value;
}

void Interpreter::track_closure(const EnvPtr& env)
{
    if (env->is_module())
    {
        return;
    }
    if (!closure_scopes_.empty() && closure_scopes_.back().lock() == env)
    {
        return;
    }
    closure_scopes_.push_back(env);
    if (closure_scopes_.size() > 2 * closure_scopes_compacted_ + 64)
    {
        std::erase_if(closure_scopes_, [](const std::weak_ptr<Environment>& w) { return w.expired(); });
        closure_scopes_compacted_ = closure_scopes_.size();
    }
}

void Interpreter::define_function(const FunctionDef& def, const EnvPtr& env)
{
    auto fn = make_function();
    fn->name = def.name;
    fn->unit = frames_.back().unit;
    fn->def = &def;
    fn->defaults = eval_defaults(def.params, env);
    fn->closure = env;
    track_closure(env);
    bind(def.name, Value::object(std::move(fn)), env);
}

Value Interpreter::make_lambda(const LambdaExpr& lambda, const EnvPtr& env)
{
    auto fn = make_function();
    fn->name = "<lambda>";
    fn->unit = frames_.back().unit;
    fn->lambda = &lambda;
    fn->defaults = eval_defaults(lambda.params, env);
    fn->closure = env;
    track_closure(env);
    return Value::object(std::move(fn));
}

std::vector<std::optional<Value>> Interpreter::eval_defaults(const std::vector<Param>& params,
                                                             const EnvPtr& env)
{
    std::vector<std::optional<Value>> defaults;
    defaults.reserve(params.size());
    for (const auto& param : params)
    {
        if (param.default_value)
        {
            defaults.emplace_back(eval(*param.default_value, env));
        }
        else
        {
            defaults.emplace_back(std::nullopt);
        }
    }
    return defaults;
}

// --- names ---

Value Interpreter::lookup(const std::string& name, const EnvPtr& env)
{
    bool innermost = true;
    for (Environment* e = env.get(); e != nullptr; e = e->parent.get())
    {
        if (e->scope != nullptr && has_name(e->scope->globals, name))
        {
            e = module_of(e);
        }
        auto it = e->vars.find(name);
        if (it != e->vars.end())
        {
            return it->second;
        }
        if (e->is_module())
        {
            if (e->builtins != nullptr)
            {
                auto b = e->builtins->find(name);
                if (b != e->builtins->end())
                {
                    return b->second;
                }
            }
            break;
        }
        if (e->scope != nullptr && has_name(e->scope->locals, name))
        {
            if (innermost)
            {
                raise("UnboundLocalError",
                      "cannot access local variable '" + name + "' where it is not associated with a value");
            }
            raise("NameError", "cannot access free variable '" + name +
                                   "' where it is not associated with a value in enclosing scope");
        }
        if (e->scope != nullptr)
        {
            innermost = false;
        }
    }
    raise("NameError", "name '" + name + "' is not defined");
}

namespace
{

Environment* binding_scope(const std::string& name, Environment* env)
{
    if (env->scope == nullptr)
    {
        return env;
    }
    if (has_name(env->scope->globals, name))
    {
        return module_of(env);
    }
    if (has_name(env->scope->nonlocals, name))
    {
        for (Environment* e = env->parent.get(); e != nullptr && !e->is_module(); e = e->parent.get())
        {
            if (e->vars.count(name) != 0 || (e->scope != nullptr && has_name(e->scope->locals, name)))
            {
                return e;
            }
        }
        raise("NameError", "no binding for nonlocal '" + name + "' found");
    }
    return env;
}

} // namespace

void Interpreter::bind(const std::string& name, Value value, const EnvPtr& env)
{
    binding_scope(name, env.get())->vars.insert_or_assign(name, std::move(value));
}

void Interpreter::unbind(const std::string& name, const EnvPtr& env)
{
    if (binding_scope(name, env.get())->vars.erase(name) == 0)
    {
        raise("NameError", "name '" + name + "' is not defined");
    }
}

void Interpreter::assign(const Expr& target, Value value, const EnvPtr& env)
{
    if (const auto* name = std::get_if<NameExpr>(&target.node))
    {
        bind(name->name, std::move(value), env);
        return;
    }

    const std::vector<Expr>* elements = nullptr;
    if (const auto* tuple = std::get_if<TupleExpr>(&target.node))
    {
        elements = &tuple->elements;
    }
    else if (const auto* list = std::get_if<ListExpr>(&target.node))
    {
        elements = &list->elements;
    }
    if (elements != nullptr)
    {
        std::vector<Value> items = collect(value);
        const std::size_t n = elements->size();
        std::optional<std::size_t> star;
        for (std::size_t i = 0; i < n; ++i)
        {
            if (std::holds_alternative<StarredExpr>((*elements)[i].node))
            {
                star = i;
            }
        }
        if (!star.has_value())
        {
            if (items.size() < n)
            {
                raise("ValueError", "not enough values to unpack (expected " + std::to_string(n) +
                                        ", got " + std::to_string(items.size()) + ")");
            }
            if (items.size() > n)
            {
                raise("ValueError", "too many values to unpack (expected " + std::to_string(n) + ")");
            }
            for (std::size_t i = 0; i < n; ++i)
            {
                assign((*elements)[i], items[i], env);
            }
            return;
        }
        if (items.size() < n - 1)
        {
            raise("ValueError", "not enough values to unpack (expected at least " + std::to_string(n - 1) +
                                    ", got " + std::to_string(items.size()) + ")");
        }
        const std::size_t tail = n - 1 - *star;
        for (std::size_t i = 0; i < *star; ++i)
        {
            assign((*elements)[i], items[i], env);
        }
        std::vector<Value> middle(items.begin() + static_cast<std::ptrdiff_t>(*star),
                                  items.end() - static_cast<std::ptrdiff_t>(tail));
        assign(*std::get<StarredExpr>((*elements)[*star].node).value, make_list(std::move(middle)), env);
        for (std::size_t i = 0; i < tail; ++i)
        {
            assign((*elements)[*star + 1 + i], items[items.size() - tail + i], env);
        }
        return;
    }

    if (const auto* sub = std::get_if<SubscriptExpr>(&target.node))
    {
        Value base = eval(*sub->base, env);
        if (const auto* slice = std::get_if<SliceExpr>(&sub->index->node))
        {
            Value lower = slice->lower ? eval(*slice->lower, env) : Value::none();
            Value upper = slice->upper ? eval(*slice->upper, env) : Value::none();
            Value step = slice->step ? eval(*slice->step, env) : Value::none();
            set_slice(*this, base, lower, upper, step, value);
            return;
        }
        Value key = eval(*sub->index, env);
        set_item(base, key, std::move(value));
        return;
    }

    if (const auto* attr = std::get_if<AttributeExpr>(&target.node))
    {
        Value base = eval(*attr->base, env);
        if (!base.is(ObjectKind::Module))
        {
            (void)get_attribute(base, attr->name);
        }
        attribute_is_read_only(base, attr->name);
    }

    if (const auto* star = std::get_if<StarredExpr>(&target.node))
    {
        assign(*star->value, std::move(value), env);
        return;
    }
    raise("TypeError", "cannot assign to expression");
}

void Interpreter::delete_target(const Expr& target, const EnvPtr& env)
{
    if (const auto* name = std::get_if<NameExpr>(&target.node))
    {
        unbind(name->name, env);
    }
    else if (const auto* tuple = std::get_if<TupleExpr>(&target.node))
    {
        for (const auto& e : tuple->elements)
        {
            delete_target(e, env);
        }
    }
    else if (const auto* list = std::get_if<ListExpr>(&target.node))
    {
        for (const auto& e : list->elements)
        {
            delete_target(e, env);
        }
    }
    else if (const auto* sub = std::get_if<SubscriptExpr>(&target.node))
    {
        Value base = eval(*sub->base, env);
        if (const auto* slice = std::get_if<SliceExpr>(&sub->index->node))
        {
            Value lower = slice->lower ? eval(*slice->lower, env) : Value::none();
            Value upper = slice->upper ? eval(*slice->upper, env) : Value::none();
            Value step = slice->step ? eval(*slice->step, env) : Value::none();
            delete_slice(base, lower, upper, step);
            return;
        }
        delete_item(base, eval(*sub->index, env));
    }
    else if (const auto* attr = std::get_if<AttributeExpr>(&target.node))
    {
        Value base = eval(*attr->base, env);
        (void)get_attribute(base, attr->name);
        attribute_is_read_only(base, attr->name);
    }
}

// --- expressions ---

Value Interpreter::eval(const Expr& expr, const EnvPtr& env)
{
    return std::visit(
        [&](const auto& node) -> Value {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, NoneExpr>)
            {
                return Value::none();
            }
            else if constexpr (std::is_same_v<Node, BoolExpr>)
            {
                return Value::boolean(node.value);
            }
            else if constexpr (std::is_same_v<Node, IntExpr>)
            {
                return Value::integer(node.value);
            }
            else if constexpr (std::is_same_v<Node, FloatExpr>)
            {
                return Value::real(node.value);
            }
            else if constexpr (std::is_same_v<Node, ImagExpr>)
            {
                return Value::complex({0.0, node.value});
            }
            else if constexpr (std::is_same_v<Node, StrExpr>)
            {
                return make_str(node.value);
            }
            else if constexpr (std::is_same_v<Node, BytesExpr>)
            {
                return make_bytes(node.value);
            }
            else if constexpr (std::is_same_v<Node, FStringExpr>)
            {
                return make_str(eval_fstring(node.parts, env));
            }
            else if constexpr (std::is_same_v<Node, NameExpr>)
            {
                return lookup(node.name, env);
            }
            else if constexpr (std::is_same_v<Node, AttributeExpr>)
            {
                return get_attribute(eval(*node.base, env), node.name);
            }
            else if constexpr (std::is_same_v<Node, SubscriptExpr>)
            {
                return eval_subscript(node, env);
            }
            else if constexpr (std::is_same_v<Node, SliceExpr>)
            {
                raise("TypeError", "slice is only valid inside a subscript");
            }
            else if constexpr (std::is_same_v<Node, CallExpr>)
            {
                return eval_call(node, env);
            }
            else if constexpr (std::is_same_v<Node, UnaryExpr>)
            {
                return unary_op(node.op, eval(*node.operand, env));
            }
            else if constexpr (std::is_same_v<Node, BinaryExpr>)
            {
                Value lhs = eval(*node.lhs, env);
                Value rhs = eval(*node.rhs, env);
                return binary_op(node.op, lhs, rhs);
            }
            else if constexpr (std::is_same_v<Node, BoolOpExpr>)
            {
                Value lhs = eval(*node.lhs, env);
                const bool lhs_true = truthy(lhs);
                if (node.op == TokenKind::KwAnd ? !lhs_true : lhs_true)
                {
                    return lhs;
                }
                return eval(*node.rhs, env);
            }
            else if constexpr (std::is_same_v<Node, CompareExpr>)
            {
                Value lhs = eval(*node.first, env);
                for (const auto& cmp : node.rest)
                {
                    Value rhs = eval(*cmp.rhs, env);
                    if (!compare(*this, cmp.op, lhs, rhs))
                    {
                        return Value::boolean(false);
                    }
                    lhs = std::move(rhs);
                }
                return Value::boolean(true);
            }
            else if constexpr (std::is_same_v<Node, IfExpr>)
            {
                return truthy(eval(*node.cond, env)) ? eval(*node.then_value, env)
                                                     : eval(*node.else_value, env);
            }
            else if constexpr (std::is_same_v<Node, LambdaExpr>)
            {
                return make_lambda(node, env);
            }
            else if constexpr (std::is_same_v<Node, StarredExpr>)
            {
                raise("TypeError", "can't use starred expression here");
            }
            else if constexpr (std::is_same_v<Node, ListExpr>)
            {
                return make_list(eval_elements(node.elements, env));
            }
            else if constexpr (std::is_same_v<Node, TupleExpr>)
            {
                return make_tuple(eval_elements(node.elements, env));
            }
            else if constexpr (std::is_same_v<Node, SetExpr>)
            {
                Value set = make_set();
                auto& table = set.as<SetObject>()->table;
                for (auto& item : eval_elements(node.elements, env))
                {
                    table.insert(item, Value::none());
                }
                recharge(set);
                return set;
            }
            else if constexpr (std::is_same_v<Node, DictExpr>)
            {
                Value dict = make_dict();
                auto& table = dict.as<DictObject>()->table;
                for (const auto& entry : node.entries)
                {
                    if (!entry.key)
                    {
                        Value mapping = eval(*entry.value, env);
                        const auto* source = mapping.as<DictObject>();
                        if (source == nullptr)
                        {
                            raise("TypeError", "'" + type_name(mapping) + "' object is not a mapping");
                        }
                        for (const auto& e : source->table.entries())
                        {
                            if (e.live)
                            {
                                table.insert(e.key, e.value);
                            }
                        }
                        continue;
                    }
                    Value key = eval(*entry.key, env);
                    Value value = eval(*entry.value, env);
                    table.insert(key, std::move(value));
                }
                recharge(dict);
                return dict;
            }
            else if constexpr (std::is_same_v<Node, ComprehensionExpr>)
            {
                return eval_comprehension(node, env);
            }
        },
        expr.node);
}

std::vector<Value> Interpreter::eval_elements(const std::vector<Expr>& elements, const EnvPtr& env)
{
    std::vector<Value> out;
    out.reserve(elements.size());
    for (const auto& element : elements)
    {
        if (const auto* star = std::get_if<StarredExpr>(&element.node))
        {
            std::vector<Value> expanded = collect(eval(*star->value, env));
            check_allocation(out.size() + expanded.size(), sizeof(Value));
            out.insert(out.end(), expanded.begin(), expanded.end());
            continue;
        }
        out.push_back(eval(element, env));
    }
    return out;
}

Value Interpreter::eval_subscript(const SubscriptExpr& sub, const EnvPtr& env)
{
    Value base = eval(*sub.base, env);
    if (const auto* slice = std::get_if<SliceExpr>(&sub.index->node))
    {
        Value lower = slice->lower ? eval(*slice->lower, env) : Value::none();
        Value upper = slice->upper ? eval(*slice->upper, env) : Value::none();
        Value step = slice->step ? eval(*slice->step, env) : Value::none();
        return get_slice(base, lower, upper, step);
    }
    return get_item(*this, base, eval(*sub.index, env));
}

std::string Interpreter::eval_fstring(const std::vector<FStringPart>& parts, const EnvPtr& env)
{
    std::string out;
    for (const auto& part : parts)
    {
        if (!part.value)
        {
            out += part.literal;
            continue;
        }
        Value value = eval(*part.value, env);
        switch (part.conversion)
        {
        case 'r':
            value = make_str(repr(value));
            break;
        case 's':
            value = make_str(to_str(value));
            break;
        case 'a':
            value = make_str(ascii_repr(value));
            break;
        default:
            break;
        }
        const std::string spec = part.spec.empty() ? std::string() : eval_fstring(part.spec, env);
        out += format_value(value, spec);
        check_allocation(out.size());
    }
    return out;
}

Value Interpreter::eval_comprehension(const ComprehensionExpr& comp, const EnvPtr& env)
{
    auto scope = std::make_shared<Environment>();
    scope->parent = env;

    std::vector<Value> items;
    Value set = comp.kind == ComprehensionExpr::Kind::Set ? make_set() : Value::none();
    Value dict = comp.kind == ComprehensionExpr::Kind::Dict ? make_dict() : Value::none();

    auto emit = [&] {
        switch (comp.kind)
        {
        case ComprehensionExpr::Kind::List:
        case ComprehensionExpr::Kind::Generator:
            grow_checked(items);
            items.push_back(eval(*comp.element, scope));
            break;
        case ComprehensionExpr::Kind::Set:
            set.as<SetObject>()->table.insert(eval(*comp.element, scope), Value::none());
            break;
        case ComprehensionExpr::Kind::Dict: {
            Value key = eval(*comp.element, scope);
            Value value = eval(*comp.value, scope);
            dict.as<DictObject>()->table.insert(key, std::move(value));
            break;
        }
        }
    };

    auto run = [&](auto& self, std::size_t level) -> void {
        const ComprehensionClause& clause = comp.clauses[level];
        // The outermost iterable is evaluated in the enclosing scope.
        Value iterable = eval(*clause.iter, level == 0 ? env : scope);
        Value iterator = make_iter(iterable);
        while (auto item = next(iterator))
        {
            assign(*clause.target, std::move(*item), scope);
            bool keep = true;
            for (const auto& cond : clause.conditions)
            {
                if (!truthy(eval(cond, scope)))
                {
                    keep = false;
                    break;
                }
            }
            if (!keep)
            {
                continue;
            }
            if (level + 1 < comp.clauses.size())
            {
                self(self, level + 1);
            }
            else
            {
                emit();
            }
        }
    };
    run(run, 0);

    switch (comp.kind)
    {
    case ComprehensionExpr::Kind::List:
        return make_list(std::move(items));
    case ComprehensionExpr::Kind::Set:
        recharge(set);
        return set;
    case ComprehensionExpr::Kind::Dict:
        recharge(dict);
        return dict;
    case ComprehensionExpr::Kind::Generator:
        break;
    }

    auto values = std::make_shared<std::vector<Value>>(std::move(items));
    auto index = std::make_shared<std::size_t>(0);
    return make_iterator("generator", [values, index](Interpreter&) -> std::optional<Value> {
        if (*index >= values->size())
        {
            return std::nullopt;
        }
        return std::move((*values)[(*index)++]);
    });
}

// --- calls ---

Value Interpreter::eval_call(const CallExpr& call_expr, const EnvPtr& env)
{
    Value callee = eval(*call_expr.callee, env);
    CallArgs args;
    auto add_keyword = [&](std::string name, Value value) {
        for (const auto& [existing, unused] : args.keywords)
        {
            if (existing == name)
            {
                raise("TypeError", "got multiple values for keyword argument '" + name + "'");
            }
        }
        args.keywords.emplace_back(std::move(name), std::move(value));
    };

    for (const auto& arg : call_expr.args)
    {
        switch (arg.kind)
        {
        case ArgKind::Positional:
            args.positional.push_back(eval(*arg.value, env));
            break;
        case ArgKind::Star: {
            std::vector<Value> expanded = collect(eval(*arg.value, env));
            args.positional.insert(args.positional.end(), expanded.begin(), expanded.end());
            break;
        }
        case ArgKind::Keyword:
            add_keyword(arg.name, eval(*arg.value, env));
            break;
        case ArgKind::DoubleStar: {
            Value mapping = eval(*arg.value, env);
            const auto* dict = mapping.as<DictObject>();
            if (dict == nullptr)
            {
                raise("TypeError", "argument after ** must be a mapping, not " + type_name(mapping));
            }
            for (const auto& e : dict->table.entries())
            {
                if (!e.live)
                {
                    continue;
                }
                const auto* key = e.key.as<StrObject>();
                if (key == nullptr)
                {
                    raise("TypeError", "keywords must be strings");
                }
                add_keyword(key->value, e.value);
            }
            break;
        }
        }
    }
    return call(callee, std::move(args));
}

Value Interpreter::call(const Value& callee, std::vector<Value> positional)
{
    return call(callee, CallArgs{.positional = std::move(positional), .keywords = {}});
}

Value Interpreter::call(const Value& callee, CallArgs args)
{
    tick();
    if (auto fn = callee.shared<FunctionObject>())
    {
        return call_function(fn, args);
    }
    if (const auto* builtin = callee.as<BuiltinObject>())
    {
        return builtin->fn(*this, args);
    }
    if (const auto* method = callee.as<BoundMethodObject>())
    {
        return method->fn(*this, method->self, args);
    }
    if (const auto* type = callee.as<TypeObject>())
    {
        return type->constructor(*this, args);
    }
    if (auto type = callee.shared<ExceptionTypeObject>())
    {
        if (!args.keywords.empty())
        {
            raise("TypeError", type->name + "() takes no keyword arguments");
        }
        return Value::object(std::make_shared<ExceptionObject>(std::move(type), std::move(args.positional)));
    }
    raise("TypeError", "'" + type_name(callee) + "' object is not callable");
}

Value Interpreter::call_function(const std::shared_ptr<FunctionObject>& fn, CallArgs& args)
{
    auto scope = std::make_shared<Environment>();
    scope->parent = fn->closure;
    scope->scope = &fn->scope();
    scope->unit = fn->unit;
    bind_arguments(*fn, args, *scope);

    Environment* globals = module_of(fn->closure.get());
    FrameGuard guard(*this, Frame{.unit = fn->unit,
                                  .function = fn->name,
                                  .offset = fn->def != nullptr ? 0 : fn->lambda->body->span.start,
                                  .env = scope,
                                  .globals = EnvPtr(fn->closure, globals),
                                  .return_value = Value::none()});
    try
    {
        if (fn->def == nullptr)
        {
            return eval(*fn->lambda->body, scope);
        }
        if (exec_block(fn->def->body, scope) == Flow::Return)
        {
            return std::move(frames_.back().return_value);
        }
        return Value::none();
    }
    catch (ScriptError& error)
    {
        add_frame(error, frames_.back());
        throw;
    }
}

void Interpreter::bind_arguments(const FunctionObject& fn, CallArgs& args, Environment& scope)
{
    const auto& params = fn.params();
    std::vector<bool> filled(params.size(), false);
    const Param* varargs = nullptr;
    const Param* varkwargs = nullptr;
    std::size_t positional_params = 0;
    std::size_t positional_defaults = 0;

    std::size_t next_positional = 0;
    for (std::size_t i = 0; i < params.size(); ++i)
    {
        const Param& param = params[i];
        switch (param.kind)
        {
        case Param::Kind::Normal:
            ++positional_params;
            if (fn.defaults[i].has_value())
            {
                ++positional_defaults;
            }
            if (next_positional < args.positional.size())
            {
                scope.vars.insert_or_assign(param.name, std::move(args.positional[next_positional++]));
                filled[i] = true;
            }
            break;
        case Param::Kind::VarArgs:
            varargs = &param;
            break;
        case Param::Kind::VarKwargs:
            varkwargs = &param;
            break;
        case Param::Kind::KwOnly:
            break;
        }
    }

    const std::size_t given = args.positional.size();
    if (next_positional < given)
    {
        if (varargs == nullptr)
        {
            std::string expected;
            if (positional_defaults > 0)
            {
                expected = "from " + std::to_string(positional_params - positional_defaults) + " to " +
                           std::to_string(positional_params);
            }
            else
            {
                expected = std::to_string(positional_params);
            }
            raise("TypeError", fn.name + "() takes " + expected + " positional argument" +
                                   (positional_params == 1 && positional_defaults == 0 ? "" : "s") + " but " +
                                   std::to_string(given) + (given == 1 ? " was" : " were") + " given");
        }
    }
    if (varargs != nullptr)
    {
        std::vector<Value> rest;
        for (std::size_t i = next_positional; i < given; ++i)
        {
            rest.push_back(std::move(args.positional[i]));
        }
        scope.vars.insert_or_assign(varargs->name, make_tuple(std::move(rest)));
    }

    Value extra = varkwargs != nullptr ? make_dict() : Value::none();
    for (auto& [name, value] : args.keywords)
    {
        bool matched = false;
        for (std::size_t i = 0; i < params.size(); ++i)
        {
            const Param& param = params[i];
            if (param.name != name ||
                (param.kind != Param::Kind::Normal && param.kind != Param::Kind::KwOnly))
            {
                continue;
            }
            if (filled[i])
            {
                raise("TypeError", fn.name + "() got multiple values for argument '" + name + "'");
            }
            scope.vars.insert_or_assign(name, std::move(value));
            filled[i] = true;
            matched = true;
            break;
        }
        if (matched)
        {
            continue;
        }
        if (varkwargs == nullptr)
        {
            raise("TypeError", fn.name + "() got an unexpected keyword argument '" + name + "'");
        }
        extra.as<DictObject>()->table.insert(make_str(name), std::move(value));
    }
    if (varkwargs != nullptr)
    {
        recharge(extra);
        scope.vars.insert_or_assign(varkwargs->name, std::move(extra));
    }

    std::vector<std::string> missing_positional;
    std::vector<std::string> missing_keyword;
    for (std::size_t i = 0; i < params.size(); ++i)
    {
        const Param& param = params[i];
        if (filled[i] || (param.kind != Param::Kind::Normal && param.kind != Param::Kind::KwOnly))
        {
            continue;
        }
        if (fn.defaults[i].has_value())
        {
            scope.vars.insert_or_assign(param.name, *fn.defaults[i]);
            continue;
        }
        (param.kind == Param::Kind::Normal ? missing_positional : missing_keyword).push_back(param.name);
    }
    if (!missing_positional.empty())
    {
        const std::size_t n = missing_positional.size();
        raise("TypeError", fn.name + "() missing " + std::to_string(n) + " required positional argument" +
                               (n == 1 ? "" : "s") + ": " + quote_list(missing_positional));
    }
    if (!missing_keyword.empty())
    {
        const std::size_t n = missing_keyword.size();
        raise("TypeError", fn.name + "() missing " + std::to_string(n) + " required keyword-only argument" +
                               (n == 1 ? "" : "s") + ": " + quote_list(missing_keyword));
    }
}

// --- iteration and attributes ---

std::optional<Value> Interpreter::next(const Value& iterator)
{
    tick();
    auto* it = iterator.as<IteratorObject>();
    if (it == nullptr)
    {
        raise("TypeError", "'" + type_name(iterator) + "' object is not an iterator");
    }
    if (it->exhausted)
    {
        return std::nullopt;
    }
    auto value = it->next(*this);
    if (!value.has_value())
    {
        it->exhausted = true;
    }
    return value;
}

std::vector<Value> Interpreter::collect(const Value& iterable)
{
    if (const auto* list = iterable.as<ListObject>())
    {
        return list->items;
    }
    if (const auto* tuple = iterable.as<TupleObject>())
    {
        return tuple->items;
    }
    if (const auto* range = iterable.as<RangeObject>())
    {
        check_allocation(static_cast<std::size_t>(range->size()), sizeof(Value));
    }
    std::vector<Value> out;
    Value iterator = make_iter(iterable);
    while (auto item = next(iterator))
    {
        grow_checked(out);
        out.push_back(std::move(*item));
    }
    return out;
}

Value Interpreter::get_attribute(const Value& value, const std::string& name)
{
    if (const auto* module = value.as<ModuleObject>())
    {
        auto it = module->members.find(name);
        if (it != module->members.end())
        {
            return it->second;
        }
        if (name == "__name__")
        {
            return make_str(module->name);
        }
        raise("AttributeError", "module '" + module->name + "' has no attribute '" + name + "'");
    }

    if (name == "__class__")
    {
        return type_of(value);
    }
    if (name == "__name__")
    {
        if (const auto* type = value.as<TypeObject>())
        {
            return make_str(type->name);
        }
        if (const auto* type = value.as<ExceptionTypeObject>())
        {
            return make_str(type->name);
        }
        if (const auto* fn = value.as<FunctionObject>())
        {
            return make_str(fn->name);
        }
        if (const auto* builtin = value.as<BuiltinObject>())
        {
            return make_str(builtin->name);
        }
    }

    if (const auto* exception = value.as<ExceptionObject>(); exception != nullptr && name == "args")
    {
        return make_tuple(exception->args);
    }
    if (value.is_real() && (name == "real" || name == "imag"))
    {
        if (name == "imag")
        {
            return value.is_float() ? Value::real(0.0) : Value::integer(0);
        }
        return value.is_float() ? value : Value::integer(value.integral());
    }
    if (value.is_integral() && (name == "numerator" || name == "denominator"))
    {
        return Value::integer(name == "numerator" ? value.integral() : 1);
    }
    if (value.is_complex() && (name == "real" || name == "imag"))
    {
        return Value::real(name == "real" ? value.as_complex().real() : value.as_complex().imag());
    }
    if (const auto* range = value.as<RangeObject>())
    {
        if (name == "start" || name == "stop" || name == "step")
        {
            return Value::integer(name == "start" ? range->start : (name == "stop" ? range->stop : range->step));
        }
    }
    if (const auto* array = value.as<ArrayObject>(); array != nullptr && name == "typecode")
    {
        return make_str(std::string(1, array->typecode));
    }

    if (auto method = find_method(value, name))
    {
        return *method;
    }
    if (const auto* type = value.as<TypeObject>())
    {
        raise("AttributeError", "type object '" + type->name + "' has no attribute '" + name + "'");
    }
    raise("AttributeError", "'" + type_name(value) + "' object has no attribute '" + name + "'");
}

} // namespace cinder::runtime
