#pragma once

#include <cinder/parser/ast.h>
#include <cinder/runtime/cancel.h>
#include <cinder/runtime/value.h>
#include <cinder/source/line_map.h>
#include <cinder/source/source_file.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * @file interpreter.h
 * @brief Tree-walking interpreter for the sandboxed script dialect.
 */

namespace cinder::runtime
{

class ScriptError;

/**
 * @brief A parsed script (or standalone expression) together with its source.
 *
 * Functions defined by a unit keep it alive, so units may outlive the run that created them.
 */
struct Unit
{
    cinder::source::SourceFile file;
    cinder::source::LineMap lines;
    cinder::parser::Program program;
    std::optional<cinder::parser::Expr> expression;

    Unit(cinder::source::SourceFile f, cinder::parser::Program p)
        : file(std::move(f)), lines(file.contents), program(std::move(p))
    {
    }
    Unit(cinder::source::SourceFile f, cinder::parser::Expr e)
        : file(std::move(f)), lines(file.contents), expression(std::move(e))
    {
    }
};

using UnitPtr = std::shared_ptr<const Unit>;

/** @brief Name -> value table consulted after globals. */
using Builtins = std::unordered_map<std::string, Value>;

/**
 * @brief A variable scope.
 *
 * The module namespace has no parent and carries the builtins table. Function scopes point at
 * the scope they were defined in; comprehension scopes have no ScopeInfo.
 */
struct Environment
{
    std::unordered_map<std::string, Value> vars;
    std::shared_ptr<Environment> parent;
    const cinder::parser::ScopeInfo* scope = nullptr;
    UnitPtr unit; // keeps `scope` alive
    std::shared_ptr<const Builtins> builtins;

    Environment() = default;
    ~Environment();

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    [[nodiscard]] bool is_module() const { return parent == nullptr; }
};

using EnvPtr = std::shared_ptr<Environment>;

/** @brief Arguments of a call after `*` / `**` expansion. */
struct CallArgs
{
    std::vector<Value> positional;
    std::vector<std::pair<std::string, Value>> keywords;
};

/** @brief Bounded buffer receiving script output. */
class OutputSink
{
  public:
    explicit OutputSink(std::size_t limit) : limit_(limit) {}

    void write(std::string_view text);

    [[nodiscard]] const std::string& text() const { return text_; }
    [[nodiscard]] bool truncated() const { return truncated_; }

  private:
    std::size_t limit_;
    std::string text_;
    bool truncated_ = false;
};

struct InterpreterOptions
{
    const CancelToken* cancel = nullptr;
    OutputSink* out = nullptr; // output is discarded when null
    std::size_t recursion_limit = 200;
};

/**
 * @brief Executes units against a module namespace.
 *
 * One Interpreter serves one run. Script errors surface as ScriptError, cancellation as
 * Interrupted; both carry no partial state beyond what the script already mutated.
 */
class Interpreter
{
  public:
    explicit Interpreter(InterpreterOptions options);

    /**
     * @brief Execute every top-level statement of `unit` in `globals`.
     *
     * Returns the value of the final statement when it is an expression statement.
     */
    [[nodiscard]] std::optional<Value> exec_program(const UnitPtr& unit, const EnvPtr& globals);

    /** @brief Evaluate `unit->expression` in `globals`. */
    [[nodiscard]] Value eval_expression(const UnitPtr& unit, const EnvPtr& globals);

    /** @brief Call any callable value. */
    Value call(const Value& callee, CallArgs args);
    Value call(const Value& callee, std::vector<Value> positional);

    /** @brief Advance the next element of an iterator; nullopt when exhausted. */
    [[nodiscard]] std::optional<Value> next(const Value& iterator);

    /** @brief Materialize any iterable. */
    [[nodiscard]] std::vector<Value> collect(const Value& iterable);

    /** @brief `value.name` for every object kind. */
    [[nodiscard]] Value get_attribute(const Value& value, const std::string& name);

    /** @brief Import a native module by dotted name (cached per run). */
    [[nodiscard]] Value import_module(const std::string& name);

    /** @brief Poll for cancellation; raises Interrupted once cancelled. */
    void tick();

    void write_output(std::string_view text);

    /** @brief Module namespace of the innermost running frame. */
    [[nodiscard]] const EnvPtr& current_globals() const;
    /** @brief Innermost scope (used by `locals()`). */
    [[nodiscard]] const EnvPtr& current_env() const;

    /**
     * @brief Function scopes captured by closures created during this run.
     *
     * A closure stored in its own defining scope forms a reference cycle; the owner of the
     * persisted state clears these scopes when it discards that state.
     */
    [[nodiscard]] const std::vector<std::weak_ptr<Environment>>& closure_scopes() const
    {
        return closure_scopes_;
    }

  private:
    enum class Flow
    {
        Normal,
        Break,
        Continue,
        Return,
    };

    struct Frame
    {
        UnitPtr unit;
        std::string function;
        std::size_t offset = 0; // byte offset of the statement being executed
        EnvPtr env;
        EnvPtr globals;
        Value return_value;
    };

    class FrameGuard;

    InterpreterOptions options_;
    std::vector<Frame> frames_;
    std::vector<std::shared_ptr<ExceptionObject>> handling_; // exceptions being handled
    std::unordered_map<std::string, Value> modules_;
    std::vector<std::weak_ptr<Environment>> closure_scopes_;
    std::size_t closure_scopes_compacted_ = 0;

    Flow exec_block(const cinder::parser::Block& block, const EnvPtr& env);
    Flow exec_stmt(const cinder::parser::Stmt& stmt, const EnvPtr& env);
    Flow exec_try(const cinder::parser::TryStmt& stmt, const EnvPtr& env);
    void exec_import(const cinder::parser::ImportStmt& stmt, const EnvPtr& env);
    void exec_from_import(const cinder::parser::FromImportStmt& stmt, const EnvPtr& env);
    void exec_raise(const cinder::parser::RaiseStmt& stmt, const EnvPtr& env);
    void define_function(const cinder::parser::FunctionDef& def, const EnvPtr& env);

    Value eval(const cinder::parser::Expr& expr, const EnvPtr& env);
    Value eval_call(const cinder::parser::CallExpr& call, const EnvPtr& env);
    Value eval_comprehension(const cinder::parser::ComprehensionExpr& comp, const EnvPtr& env);
    std::string eval_fstring(const std::vector<cinder::parser::FStringPart>& parts,
                             const EnvPtr& env);
    Value eval_subscript(const cinder::parser::SubscriptExpr& sub, const EnvPtr& env);
    Value make_lambda(const cinder::parser::LambdaExpr& lambda, const EnvPtr& env);
    std::vector<Value> eval_elements(const std::vector<cinder::parser::Expr>& elements,
                                     const EnvPtr& env);

    Value lookup(const std::string& name, const EnvPtr& env);
    void bind(const std::string& name, Value value, const EnvPtr& env);
    void unbind(const std::string& name, const EnvPtr& env);
    void assign(const cinder::parser::Expr& target, Value value, const EnvPtr& env);
    void delete_target(const cinder::parser::Expr& target, const EnvPtr& env);

    Value call_function(const std::shared_ptr<FunctionObject>& fn, CallArgs& args);
    void bind_arguments(const FunctionObject& fn, CallArgs& args, Environment& scope);
    std::vector<std::optional<Value>> eval_defaults(const std::vector<cinder::parser::Param>& params,
                                                    const EnvPtr& env);
    void track_closure(const EnvPtr& env);
    void add_frame(ScriptError& error, const Frame& frame) const;
    [[nodiscard]] bool matches_handler(const Value& handler_type, const ExceptionObject& exception);
};

} // namespace cinder::runtime
