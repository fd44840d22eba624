#include <algorithm>
#include <cinder/parser/parser.h>
#include <cinder/policy/checker.h>
#include <cinder/sandbox/engine.h>
#include <cinder/sandbox/runner.h>
#include <new>

namespace cinder::sandbox
{

namespace
{

std::string rejection_error(const cinder::policy::Rejected& rejected, std::string_view code)
{
    return std::string(cinder::policy::kSecurityErrorMessage) + "\n" + cinder::policy::describe(rejected, code);
}

ExecutionResult rejected_result(const cinder::policy::Rejected& rejected, std::string_view code)
{
    debug_log("policy rejected code: " + cinder::policy::describe(rejected, code));
    return to_result(failed_outcome(ErrorKind::PolicyRejected, rejection_error(rejected, code)));
}

/** @brief Policy decision for a standalone expression; unparsable text fails closed. */
cinder::policy::Decision check_expression_text(std::string_view expression)
{
    auto parsed = cinder::parser::parse_expression_source(expression);
    if (auto* diags = std::get_if<std::vector<cinder::diag::Diagnostic>>(&parsed))
    {
        cinder::policy::Rejected rejected{.kind = cinder::policy::RejectKind::SyntaxError, .diagnostic = {}};
        if (!diags->empty())
        {
            rejected.diagnostic = diags->front();
        }
        else
        {
            rejected.diagnostic.message = "invalid syntax";
        }
        return rejected;
    }
    return cinder::policy::check_expression(std::get<cinder::parser::Expr>(parsed));
}

ExecutionResult internal_error(const std::exception& error)
{
    return to_result(failed_outcome(ErrorKind::RuntimeFault, std::string("ExecutionError: ") + error.what()));
}

} // namespace

Session::Session(EngineConfig config) : config_(std::move(config)), watchdog_(config_.grace_period) {}

Session::~Session()
{
    std::lock_guard<std::mutex> lock(mutex_);
    state_.clear();
    release_scopes();
}

ExecutionResult Session::execute(std::string_view code, std::optional<int> timeout_seconds,
                                 std::optional<std::size_t> memory_limit_bytes)
{
    const int timeout = timeout_seconds.value_or(0) > 0 ? *timeout_seconds : config_.default_timeout_seconds;
    const std::size_t memory =
        memory_limit_bytes.value_or(0) > 0 ? *memory_limit_bytes : config_.default_memory_limit_bytes;
    try
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return execute_locked(code, timeout, memory);
    }
    catch (const std::bad_alloc&)
    {
        return to_result(failed_outcome(ErrorKind::MemoryExceeded, memory_error_message(memory)));
    }
    catch (const std::exception& error)
    {
        return internal_error(error);
    }
}

ExecutionResult Session::execute(const ExecutionRequest& request)
{
    return execute(request.code, request.timeout_seconds, request.memory_limit_bytes);
}

ExecutionResult Session::execute_locked(std::string_view code, int timeout_seconds, std::size_t memory_limit_bytes)
{
    const auto decision = cinder::policy::check(code);
    if (const auto* rejected = std::get_if<cinder::policy::Rejected>(&decision))
    {
        return rejected_result(*rejected, code);
    }

    const RunOptions options{.memory_limit_bytes = memory_limit_bytes,
                             .max_output_bytes = config_.max_output_bytes,
                             .limit_address_space = config_.limit_address_space};
    RunnerCall call = [source = std::string(code), state = state_, options](const cinder::runtime::CancelToken& cancel) {
        return run(source, state, options, cancel);
    };

    RawOutcome outcome = watchdog_.execute_with_deadline(std::move(call), timeout_seconds, config_.strategy);
    if (outcome.kind != ErrorKind::TimedOut)
    {
        std::erase_if(scopes_, [](const std::weak_ptr<cinder::runtime::Environment>& w) { return w.expired(); });
        scopes_.insert(scopes_.end(), outcome.scopes.begin(), outcome.scopes.end());
    }
    if (outcome.succeeded())
    {
        for (auto& [name, value] : outcome.bindings)
        {
            state_.insert_or_assign(name, std::move(value));
        }
    }
    debug_log("request finished: " + std::string(run_state_name(watchdog_.state())) + ", " +
              std::to_string(state_.size()) + " persisted names");
    return to_result(outcome);
}

ExecutionResult Session::evaluate(std::string_view expression)
{
    try
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto decision = check_expression_text(expression);
        if (const auto* rejected = std::get_if<cinder::policy::Rejected>(&decision))
        {
            return rejected_result(*rejected, expression);
        }

        const RunOptions options{.memory_limit_bytes = config_.default_memory_limit_bytes,
                                 .max_output_bytes = config_.max_output_bytes,
                                 .limit_address_space = config_.limit_address_space};
        RunnerCall call = [source = std::string(expression), options](const cinder::runtime::CancelToken& cancel) {
            return run_expression(source, options, cancel);
        };
        RawOutcome outcome =
            watchdog_.execute_with_deadline(std::move(call), config_.default_timeout_seconds, config_.strategy);
        ExecutionResult result = to_result(outcome);
        outcome.discard();
        return result;
    }
    catch (const std::bad_alloc&)
    {
        return to_result(
            failed_outcome(ErrorKind::MemoryExceeded, memory_error_message(config_.default_memory_limit_bytes)));
    }
    catch (const std::exception& error)
    {
        return internal_error(error);
    }
}

void Session::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    debug_log("session reset, dropping " + std::to_string(state_.size()) + " names");
    state_.clear();
    release_scopes();
}

std::vector<std::string> Session::state_names() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(state_.size());
    for (const auto& [name, value] : state_)
    {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void Session::release_scopes()
{
    for (const auto& weak : scopes_)
    {
        if (auto scope = weak.lock())
        {
            scope->vars.clear();
        }
    }
    scopes_.clear();
}

ExecutionResult execute_code(std::string_view code, int timeout_seconds, std::size_t memory_limit_bytes)
{
    Session session;
    return session.execute(code, timeout_seconds, memory_limit_bytes);
}

ExecutionResult evaluate_expression(std::string_view expression)
{
    Session session;
    return session.evaluate(expression);
}

} // namespace cinder::sandbox
