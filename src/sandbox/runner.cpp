#include <cctype>
#include <cerrno>
#include <cinder/diag/render.h>
#include <cinder/parser/parser.h>
#include <cinder/policy/checker.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/memory_budget.h>
#include <cinder/sandbox/namespace_builder.h>
#include <cinder/sandbox/normalizer.h>
#include <cinder/sandbox/runner.h>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <limits>
#include <mutex>
#include <new>
#include <unistd.h>

namespace cinder::sandbox
{

namespace
{

using cinder::runtime::EnvPtr;
using cinder::runtime::Interpreter;
using cinder::runtime::ScriptError;
using cinder::runtime::Unit;
using cinder::runtime::Value;

// RLIMIT_AS is process-wide: the first of several overlapping runs sets it, the last restores it.
std::mutex g_rlimit_mutex;
std::size_t g_rlimit_holders = 0;

std::string_view trim(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    {
        text.remove_suffix(1);
    }
    return text;
}

std::string captured_output(const cinder::runtime::OutputSink& sink)
{
    if (!sink.truncated())
    {
        return sink.text();
    }
    return sink.text() + std::string(kOutputTruncatedMarker);
}

std::string fault_message(const ScriptError& error)
{
    return error.type_name() + ": " + error.message() + "\nTraceback:\n" + error.format_traceback();
}

/** @brief Classify a script exception that escaped the run. */
void classify(RawOutcome& outcome, const ScriptError& error, const RunOptions& options)
{
    if (error.is_a("MemoryError"))
    {
        outcome.kind = ErrorKind::MemoryExceeded;
        outcome.error = memory_error_message(options.memory_limit_bytes);
        return;
    }
    outcome.kind = ErrorKind::RuntimeFault;
    outcome.error = fault_message(error);
}

/** @brief Store the normalized result; a value that cannot be converted is replaced by text. */
void store_result(RawOutcome& outcome, const Value& value)
{
    try
    {
        outcome.result = normalize(value);
    }
    catch (const ScriptError& error)
    {
        debug_log(std::string("result normalization failed: ") + error.what());
        outcome.kind = ErrorKind::NormalizationFallback;
        outcome.result = cinder::json::Json{"<unrepresentable " + cinder::runtime::type_name(value) + ">"};
    }
}

/**
 * @brief Re-evaluate the last segment of `code` as an expression.
 *
 * Any script error leaves the result absent; cancellation still propagates.
 */
std::optional<Value> evaluate_last_segment(Interpreter& interp, std::string_view code, const EnvPtr& globals)
{
    auto segment = last_segment(code);
    if (!segment)
    {
        return std::nullopt;
    }
    auto parsed = cinder::parser::parse_expression_source(*segment);
    auto* expr = std::get_if<cinder::parser::Expr>(&parsed);
    if (expr == nullptr)
    {
        return std::nullopt;
    }
    if (std::holds_alternative<cinder::policy::Rejected>(cinder::policy::check_expression(*expr)))
    {
        debug_log("final segment rejected by policy; no result");
        return std::nullopt;
    }

    auto unit = std::make_shared<const Unit>(cinder::source::from_string(*segment), std::move(*expr));
    try
    {
        return interp.eval_expression(unit, globals);
    }
    catch (const ScriptError& error)
    {
        debug_log(std::string("final segment did not evaluate: ") + error.what());
        return std::nullopt;
    }
}

/** @brief Shared try/classify frame around a run body. */
template <typename Body>
RawOutcome guarded_run(const RunOptions& options, const cinder::runtime::CancelToken& cancel, Body&& body)
{
    // Build the shared builtin table before any budget is installed so no run is charged for it.
    (void)sandbox_builtins();

    RawOutcome outcome;
    cinder::runtime::OutputSink sink(options.max_output_bytes);
    Interpreter interp(cinder::runtime::InterpreterOptions{.cancel = &cancel, .out = &sink});
    EnvPtr globals;
    {
        std::optional<ScopedAddressLimit> address_limit;
        if (options.limit_address_space)
        {
            address_limit.emplace(options.memory_limit_bytes);
        }
        cinder::runtime::MemoryBudget budget(options.memory_limit_bytes);
        try
        {
            cinder::runtime::ScopedBudget scoped(budget);
            body(interp, globals, outcome);
            debug_log("run completed, peak budget " + std::to_string(budget.peak()) + " bytes");
        }
        catch (const ScriptError& error)
        {
            classify(outcome, error, options);
        }
        catch (const cinder::runtime::Interrupted&)
        {
            outcome.kind = ErrorKind::TimedOut;
            outcome.error = std::string(kInterruptedMessage);
        }
        catch (const std::bad_alloc&)
        {
            outcome.kind = ErrorKind::MemoryExceeded;
            outcome.error = memory_error_message(options.memory_limit_bytes);
        }
        catch (const std::exception& error)
        {
            outcome.kind = ErrorKind::RuntimeFault;
            outcome.error = std::string("RuntimeError: ") + error.what();
        }
    }

    if (!outcome.succeeded())
    {
        debug_log("run failed (" + std::string(error_kind_name(outcome.kind)) + ")");
        outcome.result.reset();
        outcome.bindings.clear();
    }
    outcome.output = captured_output(sink);
    outcome.scopes = interp.closure_scopes();
    if (globals != nullptr)
    {
        outcome.scopes.emplace_back(globals);
    }
    return outcome;
}

} // namespace

std::optional<std::size_t> current_address_space()
{
    std::ifstream statm("/proc/self/statm");
    std::size_t pages = 0;
    if (!(statm >> pages))
    {
        return std::nullopt;
    }
    const long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0)
    {
        return std::nullopt;
    }
    return pages * static_cast<std::size_t>(page_size);
}

ScopedAddressLimit::ScopedAddressLimit(std::size_t headroom_bytes)
{
    std::lock_guard<std::mutex> lock(g_rlimit_mutex);
    if (g_rlimit_holders > 0)
    {
        ++g_rlimit_holders;
        active_ = true;
        return;
    }
    if (getrlimit(RLIMIT_AS, &previous_) != 0)
    {
        warn(std::string("could not read RLIMIT_AS: ") + std::strerror(errno));
        return;
    }
    const auto current = current_address_space();
    if (!current)
    {
        warn("could not determine the address-space size; memory ceiling not applied");
        return;
    }

    rlim_t soft = std::numeric_limits<rlim_t>::max();
    if (*current <= std::numeric_limits<rlim_t>::max() - headroom_bytes)
    {
        soft = static_cast<rlim_t>(*current + headroom_bytes);
    }
    if (previous_.rlim_max != RLIM_INFINITY && soft > previous_.rlim_max)
    {
        soft = previous_.rlim_max;
    }
    const rlimit next{.rlim_cur = soft, .rlim_max = previous_.rlim_max};
    if (setrlimit(RLIMIT_AS, &next) != 0)
    {
        warn(std::string("could not set memory limit: ") + std::strerror(errno));
        return;
    }
    g_rlimit_holders = 1;
    active_ = true;
    debug_log("RLIMIT_AS soft limit set to " + std::to_string(soft) + " bytes");
}

ScopedAddressLimit::~ScopedAddressLimit()
{
    if (!active_)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(g_rlimit_mutex);
    if (--g_rlimit_holders > 0)
    {
        return;
    }
    if (setrlimit(RLIMIT_AS, &previous_) != 0)
    {
        warn(std::string("could not restore RLIMIT_AS: ") + std::strerror(errno));
    }
}

std::string memory_error_message(std::size_t limit_bytes)
{
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.1f", static_cast<double>(limit_bytes) / 1024.0 / 1024.0);
    return std::string("MemoryError: Exceeded memory limit of ") + buffer + "MB";
}

std::optional<std::string> last_segment(std::string_view code)
{
    std::optional<std::string> last;
    std::size_t start = 0;
    while (start <= code.size())
    {
        std::size_t end = code.find_first_of(";\n", start);
        if (end == std::string_view::npos)
        {
            end = code.size();
        }
        const std::string_view segment = trim(code.substr(start, end - start));
        if (!segment.empty())
        {
            last = std::string(segment);
        }
        start = end + 1;
    }
    return last;
}

RawOutcome run(std::string_view code, const PersistedState& state, const RunOptions& options,
               const cinder::runtime::CancelToken& cancel)
{
    auto parsed = cinder::parser::parse_source(code);
    if (auto* diags = std::get_if<std::vector<cinder::diag::Diagnostic>>(&parsed))
    {
        const auto file = cinder::source::from_string(std::string(code));
        return failed_outcome(ErrorKind::RuntimeFault,
                              "SyntaxError: " + (diags->empty() ? std::string("invalid syntax")
                                                                : cinder::diag::summarize(diags->front(), file)));
    }
    auto unit = std::make_shared<const Unit>(cinder::source::from_string(std::string(code)),
                                             std::move(std::get<cinder::parser::Program>(parsed)));

    return guarded_run(options, cancel, [&](Interpreter& interp, EnvPtr& globals, RawOutcome& outcome) {
        globals = build_namespace(state);
        std::optional<Value> last = interp.exec_program(unit, globals);
        if (!last)
        {
            last = evaluate_last_segment(interp, code, globals);
        }
        if (last)
        {
            store_result(outcome, *last);
        }
        outcome.bindings = capture_bindings(*globals);
    });
}

RawOutcome run_expression(std::string_view expression, const RunOptions& options,
                          const cinder::runtime::CancelToken& cancel)
{
    auto parsed = cinder::parser::parse_expression_source(expression);
    if (auto* diags = std::get_if<std::vector<cinder::diag::Diagnostic>>(&parsed))
    {
        const auto file = cinder::source::from_string(std::string(expression));
        return failed_outcome(ErrorKind::RuntimeFault,
                              "SyntaxError: " + (diags->empty() ? std::string("invalid syntax")
                                                                : cinder::diag::summarize(diags->front(), file)));
    }
    auto unit = std::make_shared<const Unit>(cinder::source::from_string(std::string(expression)),
                                             std::move(std::get<cinder::parser::Expr>(parsed)));

    return guarded_run(options, cancel, [&](Interpreter& interp, EnvPtr& globals, RawOutcome& outcome) {
        globals = build_namespace({});
        store_result(outcome, interp.eval_expression(unit, globals));
    });
}

} // namespace cinder::sandbox
