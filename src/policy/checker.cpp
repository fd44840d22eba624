#include <cinder/diag/render.h>
#include <cinder/parser/parser.h>
#include <cinder/policy/checker.h>
#include <cinder/policy/denylist.h>
#include <optional>
#include <type_traits>

namespace cinder::policy
{
namespace
{

using namespace cinder::parser;

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

Rejected reject(RejectKind kind, cinder::source::Span span, std::string message)
{
    return Rejected{.kind = kind, .diagnostic = cinder::diag::error_at(span, std::move(message))};
}

class PolicyWalker
{
  public:
    [[nodiscard]] std::optional<Rejected> walk_block(const Block& block)
    {
        for (const auto& stmt : block)
        {
            if (auto r = walk_stmt(stmt))
            {
                return r;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<Rejected> walk_expr(const Expr& expr)
    {
        return std::visit([&](const auto& node) { return walk_expr_node(expr, node); }, expr.node);
    }

  private:
    [[nodiscard]] std::optional<Rejected> walk_opt(const ExprPtr& expr)
    {
        return expr == nullptr ? std::nullopt : walk_expr(*expr);
    }

    [[nodiscard]] std::optional<Rejected> walk_exprs(const std::vector<Expr>& exprs)
    {
        for (const auto& e : exprs)
        {
            if (auto r = walk_expr(e))
            {
                return r;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<Rejected> walk_params(const std::vector<Param>& params)
    {
        for (const auto& p : params)
        {
            if (auto r = walk_opt(p.default_value))
            {
                return r;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<Rejected> walk_fstring(const std::vector<FStringPart>& parts)
    {
        for (const auto& part : parts)
        {
            if (auto r = walk_opt(part.value))
            {
                return r;
            }
            if (auto r = walk_fstring(part.spec))
            {
                return r;
            }
        }
        return std::nullopt;
    }

    template <typename Node>
    [[nodiscard]] std::optional<Rejected> walk_expr_node(const Expr& self, const Node& node)
    {
        if constexpr (std::is_same_v<Node, CallExpr>)
        {
            if (const auto* name = std::get_if<NameExpr>(&node.callee->node))
            {
                if (is_blocked_callable(name->name))
                {
                    return reject(RejectKind::BlockedCall, self.span,
                                  "call to blocked function '" + name->name + "'");
                }
            }
            if (auto r = walk_expr(*node.callee))
            {
                return r;
            }
            for (const auto& arg : node.args)
            {
                if (auto r = walk_expr(*arg.value))
                {
                    return r;
                }
            }
            return std::nullopt;
        }
        else if constexpr (std::is_same_v<Node, FStringExpr>)
        {
            return walk_fstring(node.parts);
        }
        else if constexpr (std::is_same_v<Node, AttributeExpr>)
        {
            return walk_expr(*node.base);
        }
        else if constexpr (std::is_same_v<Node, SubscriptExpr>)
        {
            if (auto r = walk_expr(*node.base))
            {
                return r;
            }
            return walk_expr(*node.index);
        }
        else if constexpr (std::is_same_v<Node, SliceExpr>)
        {
            if (auto r = walk_opt(node.lower))
            {
                return r;
            }
            if (auto r = walk_opt(node.upper))
            {
                return r;
            }
            return walk_opt(node.step);
        }
        else if constexpr (std::is_same_v<Node, UnaryExpr>)
        {
            return walk_expr(*node.operand);
        }
        else if constexpr (std::is_same_v<Node, BinaryExpr> || std::is_same_v<Node, BoolOpExpr>)
        {
            if (auto r = walk_expr(*node.lhs))
            {
                return r;
            }
            return walk_expr(*node.rhs);
        }
        else if constexpr (std::is_same_v<Node, CompareExpr>)
        {
            if (auto r = walk_expr(*node.first))
            {
                return r;
            }
            for (const auto& c : node.rest)
            {
                if (auto r = walk_expr(*c.rhs))
                {
                    return r;
                }
            }
            return std::nullopt;
        }
        else if constexpr (std::is_same_v<Node, IfExpr>)
        {
            if (auto r = walk_expr(*node.cond))
            {
                return r;
            }
            if (auto r = walk_expr(*node.then_value))
            {
                return r;
            }
            return walk_expr(*node.else_value);
        }
        else if constexpr (std::is_same_v<Node, LambdaExpr>)
        {
            if (auto r = walk_params(node.params))
            {
                return r;
            }
            return walk_expr(*node.body);
        }
        else if constexpr (std::is_same_v<Node, StarredExpr>)
        {
            return walk_expr(*node.value);
        }
        else if constexpr (std::is_same_v<Node, ListExpr> || std::is_same_v<Node, TupleExpr> ||
                           std::is_same_v<Node, SetExpr>)
        {
            return walk_exprs(node.elements);
        }
        else if constexpr (std::is_same_v<Node, DictExpr>)
        {
            for (const auto& entry : node.entries)
            {
                if (auto r = walk_opt(entry.key))
                {
                    return r;
                }
                if (auto r = walk_opt(entry.value))
                {
                    return r;
                }
            }
            return std::nullopt;
        }
        else if constexpr (std::is_same_v<Node, ComprehensionExpr>)
        {
            if (auto r = walk_opt(node.element))
            {
                return r;
            }
            if (auto r = walk_opt(node.value))
            {
                return r;
            }
            for (const auto& clause : node.clauses)
            {
                if (auto r = walk_opt(clause.target))
                {
                    return r;
                }
                if (auto r = walk_opt(clause.iter))
                {
                    return r;
                }
                if (auto r = walk_exprs(clause.conditions))
                {
                    return r;
                }
            }
            return std::nullopt;
        }
        else
        {
            // Literals and names.
            (void)self;
            (void)node;
            return std::nullopt;
        }
    }

    [[nodiscard]] std::optional<Rejected> walk_stmt(const Stmt& stmt)
    {
        return std::visit([&](const auto& node) { return walk_stmt_node(stmt, node); }, stmt.node);
    }

    template <typename Node>
    [[nodiscard]] std::optional<Rejected> walk_stmt_node(const Stmt& self, const Node& node)
    {
        if constexpr (std::is_same_v<Node, ImportStmt>)
        {
            for (const auto& name : node.names)
            {
                const std::string dotted = join_path(name.path);
                if (is_blocked_module(dotted))
                {
                    return reject(RejectKind::BlockedImport, name.span,
                                  "import of blocked module '" + dotted + "'");
                }
            }
            return std::nullopt;
        }
        else if constexpr (std::is_same_v<Node, FromImportStmt>)
        {
            const std::string module = join_path(node.module);
            if (is_blocked_module(module))
            {
                return reject(RejectKind::BlockedImport, self.span,
                              "import of blocked module '" + module + "'");
            }
            for (const auto& name : node.names)
            {
                const std::string dotted = module + "." + name.path.front();
                if (is_blocked_module(dotted))
                {
                    return reject(RejectKind::BlockedImport, name.span,
                                  "import of blocked module '" + dotted + "'");
                }
            }
            return std::nullopt;
        }
        else if constexpr (std::is_same_v<Node, ExprStmt>)
        {
            return walk_expr(node.expr);
        }
        else if constexpr (std::is_same_v<Node, AssignStmt>)
        {
            if (auto r = walk_exprs(node.targets))
            {
                return r;
            }
            return walk_expr(node.value);
        }
        else if constexpr (std::is_same_v<Node, AugAssignStmt>)
        {
            if (auto r = walk_expr(node.target))
            {
                return r;
            }
            return walk_expr(node.value);
        }
        else if constexpr (std::is_same_v<Node, AnnAssignStmt>)
        {
            if (auto r = walk_expr(node.target))
            {
                return r;
            }
            return node.value.has_value() ? walk_expr(*node.value) : std::nullopt;
        }
        else if constexpr (std::is_same_v<Node, IfStmt>)
        {
            for (const auto& branch : node.branches)
            {
                if (auto r = walk_expr(branch.cond))
                {
                    return r;
                }
                if (auto r = walk_block(branch.body))
                {
                    return r;
                }
            }
            return walk_block(node.else_body);
        }
        else if constexpr (std::is_same_v<Node, WhileStmt>)
        {
            if (auto r = walk_expr(node.cond))
            {
                return r;
            }
            if (auto r = walk_block(node.body))
            {
                return r;
            }
            return walk_block(node.else_body);
        }
        else if constexpr (std::is_same_v<Node, ForStmt>)
        {
            if (auto r = walk_expr(node.target))
            {
                return r;
            }
            if (auto r = walk_expr(node.iter))
            {
                return r;
            }
            if (auto r = walk_block(node.body))
            {
                return r;
            }
            return walk_block(node.else_body);
        }
        else if constexpr (std::is_same_v<Node, FunctionDef>)
        {
            if (auto r = walk_params(node.params))
            {
                return r;
            }
            return walk_block(node.body);
        }
        else if constexpr (std::is_same_v<Node, ReturnStmt>)
        {
            return node.value.has_value() ? walk_expr(*node.value) : std::nullopt;
        }
        else if constexpr (std::is_same_v<Node, TryStmt>)
        {
            if (auto r = walk_block(node.body))
            {
                return r;
            }
            for (const auto& handler : node.handlers)
            {
                if (handler.type.has_value())
                {
                    if (auto r = walk_expr(*handler.type))
                    {
                        return r;
                    }
                }
                if (auto r = walk_block(handler.body))
                {
                    return r;
                }
            }
            if (auto r = walk_block(node.else_body))
            {
                return r;
            }
            return walk_block(node.finally_body);
        }
        else if constexpr (std::is_same_v<Node, RaiseStmt>)
        {
            if (node.exception.has_value())
            {
                if (auto r = walk_expr(*node.exception))
                {
                    return r;
                }
            }
            return node.cause.has_value() ? walk_expr(*node.cause) : std::nullopt;
        }
        else if constexpr (std::is_same_v<Node, DelStmt>)
        {
            return walk_exprs(node.targets);
        }
        else if constexpr (std::is_same_v<Node, AssertStmt>)
        {
            if (auto r = walk_expr(node.test))
            {
                return r;
            }
            return node.message.has_value() ? walk_expr(*node.message) : std::nullopt;
        }
        else
        {
            (void)self;
            (void)node;
            return std::nullopt;
        }
    }
};

} // namespace

Decision check_program(const cinder::parser::Program& program)
{
    PolicyWalker walker;
    if (auto rejected = walker.walk_block(program.body))
    {
        return std::move(*rejected);
    }
    return Allowed{};
}

Decision check_expression(const cinder::parser::Expr& expr)
{
    PolicyWalker walker;
    if (auto rejected = walker.walk_expr(expr))
    {
        return std::move(*rejected);
    }
    return Allowed{};
}

Decision check(std::string_view code)
{
    auto parsed = cinder::parser::parse_source(code);
    if (auto* diags = std::get_if<std::vector<cinder::diag::Diagnostic>>(&parsed))
    {
        return Rejected{.kind = RejectKind::SyntaxError, .diagnostic = std::move(diags->front())};
    }
    return check_program(std::get<cinder::parser::Program>(parsed));
}

std::string describe(const Rejected& rejected, std::string_view code)
{
    const auto file = cinder::source::from_string(std::string(code));
    std::string line = cinder::diag::summarize(rejected.diagnostic, file);
    if (rejected.kind == RejectKind::SyntaxError)
    {
        return "SyntaxError: " + line;
    }
    return line;
}

} // namespace cinder::policy
