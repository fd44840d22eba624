#include <cinder/sandbox/result.h>

namespace cinder::sandbox
{

std::string_view error_kind_name(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:
        return "none";
    case ErrorKind::PolicyRejected:
        return "policy-rejected";
    case ErrorKind::MemoryExceeded:
        return "memory-exceeded";
    case ErrorKind::TimedOut:
        return "timed-out";
    case ErrorKind::RuntimeFault:
        return "runtime-fault";
    case ErrorKind::NormalizationFallback:
        return "normalization-fallback";
    }
    return "none";
}

void RawOutcome::discard()
{
    bindings.clear();
    for (const auto& weak : scopes)
    {
        if (auto scope = weak.lock())
        {
            scope->vars.clear();
        }
    }
    scopes.clear();
    result.reset();
}

RawOutcome failed_outcome(ErrorKind kind, std::string error)
{
    RawOutcome outcome;
    outcome.kind = kind;
    outcome.error = std::move(error);
    return outcome;
}

ExecutionResult to_result(const RawOutcome& outcome)
{
    ExecutionResult result;
    result.success = outcome.succeeded();
    result.output = outcome.output;
    if (!result.success)
    {
        result.error = outcome.error;
        return result;
    }
    result.result = outcome.result;
    return result;
}

} // namespace cinder::sandbox
