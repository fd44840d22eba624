#pragma once

#include <cinder/diag/diagnostic.h>
#include <cinder/parser/ast.h>
#include <string>
#include <string_view>
#include <variant>

/**
 * @file checker.h
 * @brief Static policy checker: rejects denylisted imports and calls before execution.
 *
 * The check is syntactic. Aliases, attribute chains and computed names are not resolved, so
 * `f = print; f(...)` style indirection passes through; the runtime namespace is the second
 * line of defense.
 */

namespace cinder::policy
{

/** @brief Code passed the policy check. */
struct Allowed
{
};

/** @brief Why the policy check failed. */
enum class RejectKind
{
    BlockedImport,
    BlockedCall,
    SyntaxError,
};

/** @brief Code was rejected; `diagnostic` locates the offending construct. */
struct Rejected
{
    RejectKind kind = RejectKind::BlockedCall;
    cinder::diag::Diagnostic diagnostic;
};

using Decision = std::variant<Allowed, Rejected>;

/** @brief Error text returned to callers for every rejection. */
inline constexpr std::string_view kSecurityErrorMessage =
    "SecurityError: Unsafe code detected - possible security violation";

/**
 * @brief Parse `code` and walk every node looking for blocked imports and calls.
 *
 * Fails closed: code that does not lex or parse is Rejected with kind SyntaxError. Never
 * executes anything and never throws.
 */
[[nodiscard]] Decision check(std::string_view code);

/** @brief Policy walk over an already parsed program. */
[[nodiscard]] Decision check_program(const cinder::parser::Program& program);

/** @brief Policy walk over a single expression. */
[[nodiscard]] Decision check_expression(const cinder::parser::Expr& expr);

/** @brief One-line description of a rejection: `message (line N)`. */
[[nodiscard]] std::string describe(const Rejected& rejected, std::string_view code);

} // namespace cinder::policy
