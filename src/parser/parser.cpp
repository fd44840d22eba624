#include <algorithm>
#include <cinder/lexer/lexer.h>
#include <cinder/parser/literal.h>
#include <cinder/parser/parser.h>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <type_traits>
#include <vector>

namespace cinder::parser
{
namespace
{

using cinder::diag::Diagnostic;
using cinder::lexer::Token;
using cinder::lexer::TokenKind;
using cinder::source::cover;
using cinder::source::Span;

template <typename T> using Result = std::variant<T, Diagnostic>;

// Height of the tallest direct child of a node; leaves have none.
template <typename Node> std::size_t child_height(const Node&)
{
    return 0;
}

std::size_t height_of(const ExprPtr& expr)
{
    return expr != nullptr ? expr->height : 0;
}

std::size_t height_of(const std::vector<Expr>& exprs)
{
    std::size_t h = 0;
    for (const auto& e : exprs)
    {
        h = std::max(h, e.height);
    }
    return h;
}

std::size_t height_of(const std::vector<FStringPart>& parts)
{
    std::size_t h = 0;
    for (const auto& part : parts)
    {
        h = std::max({h, height_of(part.value), height_of(part.spec)});
    }
    return h;
}

std::size_t child_height(const FStringExpr& node)
{
    return height_of(node.parts);
}

std::size_t child_height(const AttributeExpr& node)
{
    return height_of(node.base);
}

std::size_t child_height(const SliceExpr& node)
{
    return std::max({height_of(node.lower), height_of(node.upper), height_of(node.step)});
}

std::size_t child_height(const SubscriptExpr& node)
{
    return std::max(height_of(node.base), height_of(node.index));
}

std::size_t child_height(const CallExpr& node)
{
    std::size_t h = height_of(node.callee);
    for (const auto& arg : node.args)
    {
        h = std::max(h, height_of(arg.value));
    }
    return h;
}

std::size_t child_height(const UnaryExpr& node)
{
    return height_of(node.operand);
}

std::size_t child_height(const BinaryExpr& node)
{
    return std::max(height_of(node.lhs), height_of(node.rhs));
}

std::size_t child_height(const BoolOpExpr& node)
{
    return std::max(height_of(node.lhs), height_of(node.rhs));
}

std::size_t child_height(const CompareExpr& node)
{
    std::size_t h = height_of(node.first);
    for (const auto& cmp : node.rest)
    {
        h = std::max(h, height_of(cmp.rhs));
    }
    return h;
}

std::size_t child_height(const IfExpr& node)
{
    return std::max({height_of(node.cond), height_of(node.then_value), height_of(node.else_value)});
}

std::size_t child_height(const LambdaExpr& node)
{
    std::size_t h = height_of(node.body);
    for (const auto& param : node.params)
    {
        h = std::max(h, height_of(param.default_value));
    }
    return h;
}

std::size_t child_height(const StarredExpr& node)
{
    return height_of(node.value);
}

std::size_t child_height(const ListExpr& node)
{
    return height_of(node.elements);
}

std::size_t child_height(const TupleExpr& node)
{
    return height_of(node.elements);
}

std::size_t child_height(const SetExpr& node)
{
    return height_of(node.elements);
}

std::size_t child_height(const DictExpr& node)
{
    std::size_t h = 0;
    for (const auto& entry : node.entries)
    {
        h = std::max({h, height_of(entry.key), height_of(entry.value)});
    }
    return h;
}

std::size_t child_height(const ComprehensionExpr& node)
{
    std::size_t h = std::max(height_of(node.element), height_of(node.value));
    for (const auto& clause : node.clauses)
    {
        h = std::max({h, height_of(clause.target), height_of(clause.iter), height_of(clause.conditions)});
    }
    return h;
}

template <typename Node> Expr make_expr(Span span, Node node)
{
    Expr expr;
    expr.span = span;
    expr.height = child_height(node) + 1;
    expr.node = std::move(node);
    return expr;
}

template <typename Node> Stmt make_stmt(Span span, Node node)
{
    Stmt stmt;
    stmt.span = span;
    stmt.node = std::move(node);
    return stmt;
}

ExprPtr boxed(Expr expr)
{
    return std::make_unique<Expr>(std::move(expr));
}

const char* describe_target(const Expr& expr)
{
    return std::visit(
        [](const auto& node) -> const char*
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, CallExpr>)
            {
                return "function call";
            }
            else if constexpr (std::is_same_v<Node, NoneExpr> || std::is_same_v<Node, BoolExpr> ||
                               std::is_same_v<Node, IntExpr> || std::is_same_v<Node, FloatExpr> ||
                               std::is_same_v<Node, ImagExpr> || std::is_same_v<Node, StrExpr> ||
                               std::is_same_v<Node, BytesExpr>)
            {
                return "literal";
            }
            else if constexpr (std::is_same_v<Node, FStringExpr>)
            {
                return "f-string expression";
            }
            else if constexpr (std::is_same_v<Node, LambdaExpr>)
            {
                return "lambda";
            }
            else if constexpr (std::is_same_v<Node, ComprehensionExpr>)
            {
                return "comprehension";
            }
            else if constexpr (std::is_same_v<Node, CompareExpr>)
            {
                return "comparison";
            }
            else if constexpr (std::is_same_v<Node, IfExpr>)
            {
                return "conditional expression";
            }
            else if constexpr (std::is_same_v<Node, DictExpr> || std::is_same_v<Node, SetExpr>)
            {
                return "display";
            }
            else
            {
                return "expression";
            }
        },
        expr.node);
}

// Checks that `expr` may appear on the left of `=` (or as a `for` / `del` target).
std::optional<Diagnostic> validate_target(const Expr& expr, bool allow_starred, bool for_del)
{
    if (std::holds_alternative<NameExpr>(expr.node) ||
        std::holds_alternative<AttributeExpr>(expr.node) ||
        std::holds_alternative<SubscriptExpr>(expr.node))
    {
        return std::nullopt;
    }

    const std::vector<Expr>* elements = nullptr;
    if (const auto* tuple = std::get_if<TupleExpr>(&expr.node))
    {
        elements = &tuple->elements;
    }
    else if (const auto* list = std::get_if<ListExpr>(&expr.node))
    {
        elements = &list->elements;
    }

    if (elements != nullptr)
    {
        bool seen_star = false;
        for (const auto& element : *elements)
        {
            if (const auto* star = std::get_if<StarredExpr>(&element.node))
            {
                if (for_del)
                {
                    return cinder::diag::error_at(element.span, "cannot delete starred");
                }
                if (seen_star)
                {
                    return cinder::diag::error_at(element.span,
                                                  "multiple starred expressions in assignment");
                }
                seen_star = true;
                if (auto err = validate_target(*star->value, false, for_del))
                {
                    return err;
                }
                continue;
            }
            if (auto err = validate_target(element, true, for_del))
            {
                return err;
            }
        }
        return std::nullopt;
    }

    if (std::holds_alternative<StarredExpr>(expr.node) && !allow_starred)
    {
        return cinder::diag::error_at(expr.span,
                                      "starred assignment target must be in a list or tuple");
    }

    const std::string verb = for_del ? "cannot delete " : "cannot assign to ";
    return cinder::diag::error_at(expr.span, verb + describe_target(expr));
}

// Scope collection: names bound by a function body.
class ScopeCollector
{
  public:
    void add_params(const std::vector<Param>& params)
    {
        for (const auto& p : params)
        {
            bind(p.name);
        }
    }

    void visit_block(const Block& block)
    {
        for (const auto& stmt : block)
        {
            visit_stmt(stmt);
        }
    }

    [[nodiscard]] ScopeInfo finish() const
    {
        ScopeInfo info;
        info.globals = globals_;
        info.nonlocals = nonlocals_;
        for (const auto& name : bound_)
        {
            if (contains(globals_, name) || contains(nonlocals_, name))
            {
                continue;
            }
            info.locals.push_back(name);
        }
        return info;
    }

  private:
    std::vector<std::string> bound_;
    std::vector<std::string> globals_;
    std::vector<std::string> nonlocals_;

    static bool contains(const std::vector<std::string>& names, const std::string& name)
    {
        return std::find(names.begin(), names.end(), name) != names.end();
    }

    void bind(const std::string& name)
    {
        if (!contains(bound_, name))
        {
            bound_.push_back(name);
        }
    }

    void bind_target(const Expr& target)
    {
        if (const auto* name = std::get_if<NameExpr>(&target.node))
        {
            bind(name->name);
        }
        else if (const auto* tuple = std::get_if<TupleExpr>(&target.node))
        {
            for (const auto& e : tuple->elements)
            {
                bind_target(e);
            }
        }
        else if (const auto* list = std::get_if<ListExpr>(&target.node))
        {
            for (const auto& e : list->elements)
            {
                bind_target(e);
            }
        }
        else if (const auto* star = std::get_if<StarredExpr>(&target.node))
        {
            bind_target(*star->value);
        }
    }

    void visit_stmt(const Stmt& stmt)
    {
        std::visit(
            [&](const auto& node)
            {
                using Node = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<Node, AssignStmt>)
                {
                    for (const auto& t : node.targets)
                    {
                        bind_target(t);
                    }
                }
                else if constexpr (std::is_same_v<Node, AugAssignStmt> ||
                                   std::is_same_v<Node, AnnAssignStmt>)
                {
                    bind_target(node.target);
                }
                else if constexpr (std::is_same_v<Node, IfStmt>)
                {
                    for (const auto& b : node.branches)
                    {
                        visit_block(b.body);
                    }
                    visit_block(node.else_body);
                }
                else if constexpr (std::is_same_v<Node, WhileStmt>)
                {
                    visit_block(node.body);
                    visit_block(node.else_body);
                }
                else if constexpr (std::is_same_v<Node, ForStmt>)
                {
                    bind_target(node.target);
                    visit_block(node.body);
                    visit_block(node.else_body);
                }
                else if constexpr (std::is_same_v<Node, FunctionDef>)
                {
                    bind(node.name);
                }
                else if constexpr (std::is_same_v<Node, ImportStmt>)
                {
                    for (const auto& n : node.names)
                    {
                        bind(n.alias.has_value() ? *n.alias : n.path.front());
                    }
                }
                else if constexpr (std::is_same_v<Node, FromImportStmt>)
                {
                    for (const auto& n : node.names)
                    {
                        if (n.path.front() != "*")
                        {
                            bind(n.alias.has_value() ? *n.alias : n.path.front());
                        }
                    }
                }
                else if constexpr (std::is_same_v<Node, TryStmt>)
                {
                    visit_block(node.body);
                    for (const auto& h : node.handlers)
                    {
                        if (h.name.has_value())
                        {
                            bind(*h.name);
                        }
                        visit_block(h.body);
                    }
                    visit_block(node.else_body);
                    visit_block(node.finally_body);
                }
                else if constexpr (std::is_same_v<Node, DelStmt>)
                {
                    for (const auto& t : node.targets)
                    {
                        bind_target(t);
                    }
                }
                else if constexpr (std::is_same_v<Node, GlobalStmt>)
                {
                    for (const auto& n : node.names)
                    {
                        if (!contains(globals_, n))
                        {
                            globals_.push_back(n);
                        }
                    }
                }
                else if constexpr (std::is_same_v<Node, NonlocalStmt>)
                {
                    for (const auto& n : node.names)
                    {
                        if (!contains(nonlocals_, n))
                        {
                            nonlocals_.push_back(n);
                        }
                    }
                }
            },
            stmt.node);
    }
};

ScopeInfo collect_scope(const std::vector<Param>& params, const Block& body)
{
    ScopeCollector collector;
    collector.add_params(params);
    collector.visit_block(body);
    return collector.finish();
}

class Parser
{
  public:
    explicit Parser(std::span<const Token> tokens) : tokens_(tokens) {}

    [[nodiscard]] ParseResult parse_program()
    {
        Program program;
        while (!is_at_end())
        {
            if (match(TokenKind::Newline))
            {
                continue;
            }
            if (check(TokenKind::Indent))
            {
                diagnostics_.push_back(error_at(peek(), "unexpected indent"));
                synchronize_stmt();
                continue;
            }
            if (check(TokenKind::Dedent))
            {
                advance();
                continue;
            }

            if (auto err = parse_statement(program.body))
            {
                diagnostics_.push_back(std::move(*err));
                synchronize_stmt();
            }
        }

        if (!diagnostics_.empty())
        {
            return diagnostics_;
        }
        return program;
    }

    [[nodiscard]] ExprResult parse_single_expression()
    {
        while (check(TokenKind::Indent) || check(TokenKind::Newline))
        {
            advance();
        }
        if (is_at_end())
        {
            return std::vector<Diagnostic>{error_at(peek(), "expected expression")};
        }

        auto res = parse_star_expressions();
        if (auto* d = std::get_if<Diagnostic>(&res))
        {
            return std::vector<Diagnostic>{std::move(*d)};
        }
        while (check(TokenKind::Newline) || check(TokenKind::Dedent))
        {
            advance();
        }
        if (!is_at_end())
        {
            return std::vector<Diagnostic>{error_at(peek(), "invalid syntax")};
        }
        return std::get<Expr>(std::move(res));
    }

  private:
    static constexpr std::size_t kMaxNesting = 1000;

    std::span<const Token> tokens_;
    std::size_t pos_ = 0;
    std::vector<Diagnostic> diagnostics_;
    std::size_t nesting_ = 0;

    /** @brief Counts one level of recursive descent for as long as it lives. */
    class NestingGuard
    {
      public:
        explicit NestingGuard(Parser& parser) : parser_(parser) { ++parser_.nesting_; }
        ~NestingGuard() { --parser_.nesting_; }

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

        [[nodiscard]] bool exceeded() const { return parser_.nesting_ > kMaxNesting; }

      private:
        Parser& parser_;
    };

    [[nodiscard]] bool is_at_end() const { return peek().kind == TokenKind::Eof; }

    [[nodiscard]] const Token& peek() const
    {
        return tokens_[std::min(pos_, tokens_.size() - 1)];
    }

    [[nodiscard]] const Token& peek_next() const
    {
        return tokens_[std::min(pos_ + 1, tokens_.size() - 1)];
    }

    [[nodiscard]] const Token& previous() const { return tokens_[pos_ == 0 ? 0 : pos_ - 1]; }

    [[nodiscard]] bool check(TokenKind kind) const { return peek().kind == kind; }

    const Token& advance()
    {
        if (!is_at_end())
        {
            ++pos_;
        }
        return previous();
    }

    bool match(TokenKind kind)
    {
        if (!check(kind))
        {
            return false;
        }
        advance();
        return true;
    }

    // Skips the rest of the logical line and any block indented under it.
    void synchronize_stmt()
    {
        while (!is_at_end() && !check(TokenKind::Newline))
        {
            advance();
        }
        match(TokenKind::Newline);
        if (check(TokenKind::Indent))
        {
            std::size_t depth = 0;
            while (!is_at_end())
            {
                if (check(TokenKind::Indent))
                {
                    ++depth;
                }
                else if (check(TokenKind::Dedent))
                {
                    --depth;
                    if (depth == 0)
                    {
                        advance();
                        return;
                    }
                }
                advance();
            }
        }
    }

    [[nodiscard]] Diagnostic error_at(const Token& token, std::string_view message) const
    {
        if (token.kind == TokenKind::Indent && message == "invalid syntax")
        {
            return cinder::diag::error_at(token.span, "unexpected indent");
        }
        return cinder::diag::error_at(token.span, std::string(message));
    }

    [[nodiscard]] std::optional<Diagnostic> consume(TokenKind kind, std::string_view message)
    {
        if (check(kind))
        {
            advance();
            return std::nullopt;
        }
        return error_at(peek(), message);
    }

    [[nodiscard]] static bool starts_expression(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::Identifier:
        case TokenKind::IntLiteral:
        case TokenKind::FloatLiteral:
        case TokenKind::ImagLiteral:
        case TokenKind::StringLiteral:
        case TokenKind::KwNone:
        case TokenKind::KwTrue:
        case TokenKind::KwFalse:
        case TokenKind::KwNot:
        case TokenKind::KwLambda:
        case TokenKind::LParen:
        case TokenKind::LBracket:
        case TokenKind::LBrace:
        case TokenKind::Minus:
        case TokenKind::Plus:
        case TokenKind::Tilde:
        case TokenKind::Star:
            return true;
        default:
            return false;
        }
    }

    // ---------------------------------------------------------------- statements

    [[nodiscard]] std::optional<Diagnostic> parse_statement(Block& out)
    {
        NestingGuard guard(*this);
        if (guard.exceeded())
        {
            return error_at(peek(), "too many nested statements");
        }
        switch (peek().kind)
        {
        case TokenKind::KwIf:
            return push_result(out, parse_if());
        case TokenKind::KwWhile:
            return push_result(out, parse_while());
        case TokenKind::KwFor:
            return push_result(out, parse_for());
        case TokenKind::KwTry:
            return push_result(out, parse_try());
        case TokenKind::KwDef:
            return push_result(out, parse_def());
        case TokenKind::At:
            return error_at(peek(), "decorators are not supported");
        case TokenKind::KwReserved:
            return error_at(peek(), "'" + std::string(peek().lexeme) + "' is not supported");
        default:
            return parse_simple_statements(out);
        }
    }

    [[nodiscard]] static std::optional<Diagnostic> push_result(Block& out, Result<Stmt> res)
    {
        if (auto* d = std::get_if<Diagnostic>(&res))
        {
            return std::move(*d);
        }
        out.push_back(std::get<Stmt>(std::move(res)));
        return std::nullopt;
    }

    [[nodiscard]] std::optional<Diagnostic> parse_simple_statements(Block& out)
    {
        while (true)
        {
            auto res = parse_simple_statement();
            if (auto* d = std::get_if<Diagnostic>(&res))
            {
                return std::move(*d);
            }
            out.push_back(std::get<Stmt>(std::move(res)));

            if (!match(TokenKind::Semicolon))
            {
                break;
            }
            if (check(TokenKind::Newline) || is_at_end())
            {
                break;
            }
        }

        if (is_at_end())
        {
            return std::nullopt;
        }
        return consume(TokenKind::Newline, "invalid syntax");
    }

    [[nodiscard]] std::optional<Diagnostic> parse_block(Block& out)
    {
        if (auto err = consume(TokenKind::Colon, "expected ':'"))
        {
            return err;
        }

        if (!match(TokenKind::Newline))
        {
            return parse_simple_statements(out);
        }

        if (!match(TokenKind::Indent))
        {
            return error_at(peek(), "expected an indented block");
        }

        while (!check(TokenKind::Dedent) && !is_at_end())
        {
            if (match(TokenKind::Newline))
            {
                continue;
            }
            if (check(TokenKind::Indent))
            {
                return error_at(peek(), "unexpected indent");
            }
            if (auto err = parse_statement(out))
            {
                return err;
            }
        }
        match(TokenKind::Dedent);
        return std::nullopt;
    }

    [[nodiscard]] Result<Stmt> parse_simple_statement()
    {
        const Token& start = peek();
        switch (start.kind)
        {
        case TokenKind::KwPass:
            advance();
            return make_stmt(start.span, PassStmt{});
        case TokenKind::KwBreak:
            advance();
            return make_stmt(start.span, BreakStmt{});
        case TokenKind::KwContinue:
            advance();
            return make_stmt(start.span, ContinueStmt{});
        case TokenKind::KwReturn:
            return parse_return();
        case TokenKind::KwRaise:
            return parse_raise();
        case TokenKind::KwGlobal:
        case TokenKind::KwNonlocal:
            return parse_scope_decl();
        case TokenKind::KwDel:
            return parse_del();
        case TokenKind::KwAssert:
            return parse_assert();
        case TokenKind::KwImport:
            return parse_import();
        case TokenKind::KwFrom:
            return parse_from_import();
        case TokenKind::KwReserved:
            return error_at(start, "'" + std::string(start.lexeme) + "' is not supported");
        default:
            return parse_expression_statement();
        }
    }

    [[nodiscard]] Result<Stmt> parse_expression_statement()
    {
        auto first_res = parse_star_expressions();
        if (auto* d = std::get_if<Diagnostic>(&first_res))
        {
            return std::move(*d);
        }
        Expr first = std::get<Expr>(std::move(first_res));

        if (check(TokenKind::Colon))
        {
            if (!std::holds_alternative<NameExpr>(first.node) &&
                !std::holds_alternative<AttributeExpr>(first.node) &&
                !std::holds_alternative<SubscriptExpr>(first.node))
            {
                return error_at(peek(), "only single target can be annotated");
            }
            advance();
            auto ann = parse_expression();
            if (auto* d = std::get_if<Diagnostic>(&ann))
            {
                return std::move(*d);
            }
            Span span = cover(first.span, std::get<Expr>(ann).span);
            std::optional<Expr> value;
            if (match(TokenKind::Equal))
            {
                auto v = parse_star_expressions();
                if (auto* d = std::get_if<Diagnostic>(&v))
                {
                    return std::move(*d);
                }
                value = std::get<Expr>(std::move(v));
                span = cover(span, value->span);
            }
            return make_stmt(span, AnnAssignStmt{.target = std::move(first), .value = std::move(value)});
        }

        if (cinder::lexer::is_assignment(peek().kind) && !check(TokenKind::Equal))
        {
            const Token op = advance();
            if (!std::holds_alternative<NameExpr>(first.node) &&
                !std::holds_alternative<AttributeExpr>(first.node) &&
                !std::holds_alternative<SubscriptExpr>(first.node))
            {
                return cinder::diag::error_at(
                    first.span, "'" + std::string(describe_target(first)) +
                                    "' is an illegal expression for augmented assignment");
            }
            auto v = parse_star_expressions();
            if (auto* d = std::get_if<Diagnostic>(&v))
            {
                return std::move(*d);
            }
            Expr value = std::get<Expr>(std::move(v));
            const Span span = cover(first.span, value.span);
            return make_stmt(span, AugAssignStmt{.target = std::move(first),
                                                 .op = augmented_to_binary(op.kind),
                                                 .value = std::move(value)});
        }

        if (check(TokenKind::Equal))
        {
            std::vector<Expr> chain;
            chain.push_back(std::move(first));
            while (match(TokenKind::Equal))
            {
                auto next = parse_star_expressions();
                if (auto* d = std::get_if<Diagnostic>(&next))
                {
                    return std::move(*d);
                }
                chain.push_back(std::get<Expr>(std::move(next)));
            }

            Expr value = std::move(chain.back());
            chain.pop_back();
            for (const auto& target : chain)
            {
                if (auto err = validate_target(target, false, false))
                {
                    return *err;
                }
            }
            const Span span = cover(chain.front().span, value.span);
            return make_stmt(span, AssignStmt{.targets = std::move(chain), .value = std::move(value)});
        }

        if (std::holds_alternative<StarredExpr>(first.node))
        {
            return cinder::diag::error_at(first.span, "can't use starred expression here");
        }

        const Span span = first.span;
        return make_stmt(span, ExprStmt{.expr = std::move(first)});
    }

    [[nodiscard]] static TokenKind augmented_to_binary(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::PlusEqual:
            return TokenKind::Plus;
        case TokenKind::MinusEqual:
            return TokenKind::Minus;
        case TokenKind::StarEqual:
            return TokenKind::Star;
        case TokenKind::DoubleStarEqual:
            return TokenKind::DoubleStar;
        case TokenKind::SlashEqual:
            return TokenKind::Slash;
        case TokenKind::DoubleSlashEqual:
            return TokenKind::DoubleSlash;
        case TokenKind::PercentEqual:
            return TokenKind::Percent;
        case TokenKind::AmpEqual:
            return TokenKind::Amp;
        case TokenKind::PipeEqual:
            return TokenKind::Pipe;
        case TokenKind::CaretEqual:
            return TokenKind::Caret;
        case TokenKind::LeftShiftEqual:
            return TokenKind::LeftShift;
        case TokenKind::RightShiftEqual:
            return TokenKind::RightShift;
        default:
            return kind;
        }
    }

    [[nodiscard]] Result<Stmt> parse_return()
    {
        const Token kw = advance();
        ReturnStmt stmt;
        Span span = kw.span;
        if (starts_expression(peek().kind))
        {
            auto v = parse_star_expressions();
            if (auto* d = std::get_if<Diagnostic>(&v))
            {
                return std::move(*d);
            }
            stmt.value = std::get<Expr>(std::move(v));
            span = cover(span, stmt.value->span);
        }
        return make_stmt(span, std::move(stmt));
    }

    [[nodiscard]] Result<Stmt> parse_raise()
    {
        const Token kw = advance();
        RaiseStmt stmt;
        Span span = kw.span;
        if (starts_expression(peek().kind))
        {
            auto v = parse_expression();
            if (auto* d = std::get_if<Diagnostic>(&v))
            {
                return std::move(*d);
            }
            stmt.exception = std::get<Expr>(std::move(v));
            span = cover(span, stmt.exception->span);

            if (match(TokenKind::KwFrom))
            {
                auto c = parse_expression();
                if (auto* d = std::get_if<Diagnostic>(&c))
                {
                    return std::move(*d);
                }
                stmt.cause = std::get<Expr>(std::move(c));
                span = cover(span, stmt.cause->span);
            }
        }
        return make_stmt(span, std::move(stmt));
    }

    [[nodiscard]] Result<Stmt> parse_scope_decl()
    {
        const Token kw = advance();
        std::vector<std::string> names;
        Span span = kw.span;
        do
        {
            if (!check(TokenKind::Identifier))
            {
                return error_at(peek(), "expected name");
            }
            const Token name = advance();
            names.emplace_back(name.lexeme);
            span = cover(span, name.span);
        } while (match(TokenKind::Comma));

        if (kw.kind == TokenKind::KwGlobal)
        {
            return make_stmt(span, GlobalStmt{.names = std::move(names)});
        }
        return make_stmt(span, NonlocalStmt{.names = std::move(names)});
    }

    [[nodiscard]] Result<Stmt> parse_del()
    {
        const Token kw = advance();
        std::vector<Expr> targets;
        Span span = kw.span;
        do
        {
            if (!starts_expression(peek().kind))
            {
                break;
            }
            auto t = parse_bitor();
            if (auto* d = std::get_if<Diagnostic>(&t))
            {
                return std::move(*d);
            }
            Expr target = std::get<Expr>(std::move(t));
            if (auto err = validate_target(target, false, true))
            {
                return *err;
            }
            span = cover(span, target.span);
            targets.push_back(std::move(target));
        } while (match(TokenKind::Comma));

        if (targets.empty())
        {
            return error_at(peek(), "invalid syntax");
        }
        return make_stmt(span, DelStmt{.targets = std::move(targets)});
    }

    [[nodiscard]] Result<Stmt> parse_assert()
    {
        const Token kw = advance();
        auto t = parse_expression();
        if (auto* d = std::get_if<Diagnostic>(&t))
        {
            return std::move(*d);
        }
        AssertStmt stmt{.test = std::get<Expr>(std::move(t)), .message = std::nullopt};
        Span span = cover(kw.span, stmt.test.span);
        if (match(TokenKind::Comma))
        {
            auto m = parse_expression();
            if (auto* d = std::get_if<Diagnostic>(&m))
            {
                return std::move(*d);
            }
            stmt.message = std::get<Expr>(std::move(m));
            span = cover(span, stmt.message->span);
        }
        return make_stmt(span, std::move(stmt));
    }

    [[nodiscard]] Result<std::vector<std::string>> parse_dotted_name()
    {
        std::vector<std::string> path;
        if (!check(TokenKind::Identifier))
        {
            return error_at(peek(), "expected module name");
        }
        path.emplace_back(advance().lexeme);
        while (match(TokenKind::Dot))
        {
            if (!check(TokenKind::Identifier))
            {
                return error_at(peek(), "expected identifier after '.'");
            }
            path.emplace_back(advance().lexeme);
        }
        return path;
    }

    [[nodiscard]] std::optional<Diagnostic> parse_alias(ImportName& name)
    {
        if (!match(TokenKind::KwAs))
        {
            return std::nullopt;
        }
        if (!check(TokenKind::Identifier))
        {
            return error_at(peek(), "expected name after 'as'");
        }
        const Token alias = advance();
        name.alias = std::string(alias.lexeme);
        name.span = cover(name.span, alias.span);
        return std::nullopt;
    }

    [[nodiscard]] Result<Stmt> parse_import()
    {
        const Token kw = advance();
        ImportStmt stmt;
        Span span = kw.span;
        do
        {
            const Span name_start = peek().span;
            auto path = parse_dotted_name();
            if (auto* d = std::get_if<Diagnostic>(&path))
            {
                return std::move(*d);
            }
            ImportName name{.span = cover(name_start, previous().span),
                            .path = std::get<std::vector<std::string>>(std::move(path)),
                            .alias = std::nullopt};
            if (auto err = parse_alias(name))
            {
                return *err;
            }
            span = cover(span, name.span);
            stmt.names.push_back(std::move(name));
        } while (match(TokenKind::Comma));

        return make_stmt(span, std::move(stmt));
    }

    [[nodiscard]] Result<Stmt> parse_from_import()
    {
        const Token kw = advance();
        if (check(TokenKind::Dot))
        {
            return error_at(peek(), "relative imports are not supported");
        }
        auto module = parse_dotted_name();
        if (auto* d = std::get_if<Diagnostic>(&module))
        {
            return std::move(*d);
        }
        if (auto err = consume(TokenKind::KwImport, "expected 'import'"))
        {
            return *err;
        }

        FromImportStmt stmt;
        stmt.module = std::get<std::vector<std::string>>(std::move(module));
        Span span = cover(kw.span, previous().span);

        if (match(TokenKind::Star))
        {
            stmt.names.push_back(
                ImportName{.span = previous().span, .path = {"*"}, .alias = std::nullopt});
            return make_stmt(cover(span, previous().span), std::move(stmt));
        }

        const bool parenthesized = match(TokenKind::LParen);
        do
        {
            if (parenthesized && check(TokenKind::RParen))
            {
                break;
            }
            if (!check(TokenKind::Identifier))
            {
                return error_at(peek(), "expected name to import");
            }
            const Token name_tok = advance();
            ImportName name{
                .span = name_tok.span, .path = {std::string(name_tok.lexeme)}, .alias = std::nullopt};
            if (auto err = parse_alias(name))
            {
                return *err;
            }
            span = cover(span, name.span);
            stmt.names.push_back(std::move(name));
        } while (match(TokenKind::Comma));

        if (parenthesized)
        {
            if (auto err = consume(TokenKind::RParen, "expected ')'"))
            {
                return *err;
            }
            span = cover(span, previous().span);
        }
        if (stmt.names.empty())
        {
            return error_at(peek(), "expected name to import");
        }
        return make_stmt(span, std::move(stmt));
    }

    [[nodiscard]] Result<Stmt> parse_if()
    {
        const Token kw = advance();
        IfStmt stmt;

        auto cond = parse_expression();
        if (auto* d = std::get_if<Diagnostic>(&cond))
        {
            return std::move(*d);
        }
        IfBranch first{.cond = std::get<Expr>(std::move(cond)), .body = {}};
        if (auto err = parse_block(first.body))
        {
            return *err;
        }
        stmt.branches.push_back(std::move(first));

        while (match(TokenKind::KwElif))
        {
            auto c = parse_expression();
            if (auto* d = std::get_if<Diagnostic>(&c))
            {
                return std::move(*d);
            }
            IfBranch branch{.cond = std::get<Expr>(std::move(c)), .body = {}};
            if (auto err = parse_block(branch.body))
            {
                return *err;
            }
            stmt.branches.push_back(std::move(branch));
        }

        if (match(TokenKind::KwElse))
        {
            if (auto err = parse_block(stmt.else_body))
            {
                return *err;
            }
        }

        return make_stmt(cover(kw.span, previous().span), std::move(stmt));
    }

    [[nodiscard]] Result<Stmt> parse_while()
    {
        const Token kw = advance();
        auto cond = parse_expression();
        if (auto* d = std::get_if<Diagnostic>(&cond))
        {
            return std::move(*d);
        }
        WhileStmt stmt{.cond = std::get<Expr>(std::move(cond)), .body = {}, .else_body = {}};
        if (auto err = parse_block(stmt.body))
        {
            return *err;
        }
        if (match(TokenKind::KwElse))
        {
            if (auto err = parse_block(stmt.else_body))
            {
                return *err;
            }
        }
        return make_stmt(cover(kw.span, previous().span), std::move(stmt));
    }

    [[nodiscard]] Result<Stmt> parse_for()
    {
        const Token kw = advance();
        auto target = parse_target_list();
        if (auto* d = std::get_if<Diagnostic>(&target))
        {
            return std::move(*d);
        }
        if (auto err = consume(TokenKind::KwIn, "expected 'in'"))
        {
            return *err;
        }
        auto iter = parse_star_expressions();
        if (auto* d = std::get_if<Diagnostic>(&iter))
        {
            return std::move(*d);
        }

        ForStmt stmt{.target = std::get<Expr>(std::move(target)),
                     .iter = std::get<Expr>(std::move(iter)),
                     .body = {},
                     .else_body = {}};
        if (auto err = parse_block(stmt.body))
        {
            return *err;
        }
        if (match(TokenKind::KwElse))
        {
            if (auto err = parse_block(stmt.else_body))
            {
                return *err;
            }
        }
        return make_stmt(cover(kw.span, previous().span), std::move(stmt));
    }

    [[nodiscard]] Result<Stmt> parse_try()
    {
        const Token kw = advance();
        TryStmt stmt;
        if (auto err = parse_block(stmt.body))
        {
            return *err;
        }

        while (check(TokenKind::KwExcept))
        {
            const Token except_kw = advance();
            if (!stmt.handlers.empty() && !stmt.handlers.back().type.has_value())
            {
                return error_at(except_kw, "default 'except:' must be last");
            }
            ExceptHandler handler{
                .span = except_kw.span, .type = std::nullopt, .name = std::nullopt, .body = {}};
            if (!check(TokenKind::Colon))
            {
                auto t = parse_expression();
                if (auto* d = std::get_if<Diagnostic>(&t))
                {
                    return std::move(*d);
                }
                handler.type = std::get<Expr>(std::move(t));
                if (match(TokenKind::Comma))
                {
                    // `except A, B:` is a Python 2 form.
                    return error_at(previous(), "multiple exception types must be parenthesized");
                }
                if (match(TokenKind::KwAs))
                {
                    if (!check(TokenKind::Identifier))
                    {
                        return error_at(peek(), "expected name after 'as'");
                    }
                    handler.name = std::string(advance().lexeme);
                }
            }
            if (auto err = parse_block(handler.body))
            {
                return *err;
            }
            stmt.handlers.push_back(std::move(handler));
        }

        if (check(TokenKind::KwElse))
        {
            if (stmt.handlers.empty())
            {
                return error_at(peek(), "expected 'except' or 'finally' block");
            }
            advance();
            if (auto err = parse_block(stmt.else_body))
            {
                return *err;
            }
        }

        bool has_finally = false;
        if (match(TokenKind::KwFinally))
        {
            has_finally = true;
            if (auto err = parse_block(stmt.finally_body))
            {
                return *err;
            }
        }

        if (stmt.handlers.empty() && !has_finally)
        {
            return error_at(peek(), "expected 'except' or 'finally' block");
        }
        return make_stmt(cover(kw.span, previous().span), std::move(stmt));
    }

    [[nodiscard]] Result<Stmt> parse_def()
    {
        const Token kw = advance();
        if (!check(TokenKind::Identifier))
        {
            return error_at(peek(), "expected function name");
        }
        const Token name = advance();
        if (auto err = consume(TokenKind::LParen, "expected '('"))
        {
            return *err;
        }

        auto params = parse_params(TokenKind::RParen, true);
        if (auto* d = std::get_if<Diagnostic>(&params))
        {
            return std::move(*d);
        }
        if (auto err = consume(TokenKind::RParen, "expected ')'"))
        {
            return *err;
        }

        if (match(TokenKind::Arrow))
        {
            auto ret = parse_expression();
            if (auto* d = std::get_if<Diagnostic>(&ret))
            {
                return std::move(*d);
            }
        }

        FunctionDef def;
        def.name = std::string(name.lexeme);
        def.params = std::get<std::vector<Param>>(std::move(params));
        if (auto err = parse_block(def.body))
        {
            return *err;
        }
        def.scope = collect_scope(def.params, def.body);
        return make_stmt(cover(kw.span, previous().span), std::move(def));
    }

    [[nodiscard]] Result<std::vector<Param>> parse_params(TokenKind close, bool annotations)
    {
        std::vector<Param> params;
        bool seen_default = false;
        bool keyword_only = false;
        bool seen_kwargs = false;

        while (!check(close))
        {
            const Token start = peek();
            if (seen_kwargs)
            {
                return error_at(start, "arguments cannot follow var-keyword argument");
            }

            Param param;
            param.span = start.span;

            if (match(TokenKind::Slash))
            {
                if (!match(TokenKind::Comma))
                {
                    break;
                }
                continue;
            }

            if (match(TokenKind::Star))
            {
                if (keyword_only)
                {
                    return error_at(start, "* argument may appear only once");
                }
                keyword_only = true;
                if (!check(TokenKind::Identifier))
                {
                    if (!match(TokenKind::Comma))
                    {
                        return error_at(peek(), "named arguments must follow bare *");
                    }
                    continue;
                }
                param.kind = Param::Kind::VarArgs;
            }
            else if (match(TokenKind::DoubleStar))
            {
                param.kind = Param::Kind::VarKwargs;
                seen_kwargs = true;
            }
            else if (keyword_only)
            {
                param.kind = Param::Kind::KwOnly;
            }

            if (!check(TokenKind::Identifier))
            {
                return error_at(peek(), "expected parameter name");
            }
            const Token name = advance();
            param.name = std::string(name.lexeme);
            param.span = cover(start.span, name.span);

            for (const auto& existing : params)
            {
                if (existing.name == param.name)
                {
                    return error_at(name, "duplicate argument '" + param.name +
                                              "' in function definition");
                }
            }

            if (annotations && match(TokenKind::Colon))
            {
                auto ann = parse_expression();
                if (auto* d = std::get_if<Diagnostic>(&ann))
                {
                    return std::move(*d);
                }
            }

            if (match(TokenKind::Equal))
            {
                if (param.kind == Param::Kind::VarArgs || param.kind == Param::Kind::VarKwargs)
                {
                    return error_at(previous(), "var-positional argument cannot have default value");
                }
                auto def = parse_expression();
                if (auto* d = std::get_if<Diagnostic>(&def))
                {
                    return std::move(*d);
                }
                param.default_value = boxed(std::get<Expr>(std::move(def)));
                if (param.kind == Param::Kind::Normal)
                {
                    seen_default = true;
                }
            }
            else if (param.kind == Param::Kind::Normal && seen_default)
            {
                return error_at(name, "non-default argument follows default argument");
            }

            params.push_back(std::move(param));
            if (!match(TokenKind::Comma))
            {
                break;
            }
        }

        return params;
    }

    // ---------------------------------------------------------------- expressions

    // Bare tuple (`a, b`) or a single expression; starred elements allowed.
    [[nodiscard]] Result<Expr> parse_star_expressions()
    {
        auto first_res = parse_star_or_expression();
        if (auto* d = std::get_if<Diagnostic>(&first_res))
        {
            return std::move(*d);
        }
        Expr first = std::get<Expr>(std::move(first_res));
        if (!check(TokenKind::Comma))
        {
            return first;
        }

        const Span start = first.span;
        Span end = first.span;
        std::vector<Expr> elements;
        elements.push_back(std::move(first));
        while (match(TokenKind::Comma))
        {
            end = previous().span;
            if (!starts_expression(peek().kind))
            {
                break;
            }
            auto next = parse_star_or_expression();
            if (auto* d = std::get_if<Diagnostic>(&next))
            {
                return std::move(*d);
            }
            end = std::get<Expr>(next).span;
            elements.push_back(std::get<Expr>(std::move(next)));
        }
        return make_expr(cover(start, end), TupleExpr{.elements = std::move(elements)});
    }

    [[nodiscard]] Result<Expr> parse_star_or_expression()
    {
        if (check(TokenKind::Star))
        {
            const Token star = advance();
            auto inner = parse_bitor();
            if (auto* d = std::get_if<Diagnostic>(&inner))
            {
                return std::move(*d);
            }
            Expr value = std::get<Expr>(std::move(inner));
            const Span span = cover(star.span, value.span);
            return make_expr(span, StarredExpr{.value = boxed(std::move(value))});
        }
        return parse_expression();
    }

    // Target list for `for` loops and comprehensions; stops before `in`.
    [[nodiscard]] Result<Expr> parse_target_list()
    {
        std::vector<Expr> elements;
        bool trailing_comma = false;
        const Span start = peek().span;
        Span end = start;
        while (true)
        {
            Result<Expr> element_res = Diagnostic{};
            if (check(TokenKind::Star))
            {
                const Token star = advance();
                auto inner = parse_bitor();
                if (auto* d = std::get_if<Diagnostic>(&inner))
                {
                    return std::move(*d);
                }
                Expr value = std::get<Expr>(std::move(inner));
                const Span span = cover(star.span, value.span);
                element_res = make_expr(span, StarredExpr{.value = boxed(std::move(value))});
            }
            else
            {
                element_res = parse_bitor();
            }
            if (auto* d = std::get_if<Diagnostic>(&element_res))
            {
                return std::move(*d);
            }
            end = std::get<Expr>(element_res).span;
            elements.push_back(std::get<Expr>(std::move(element_res)));

            trailing_comma = false;
            if (!match(TokenKind::Comma))
            {
                break;
            }
            trailing_comma = true;
            if (check(TokenKind::KwIn))
            {
                break;
            }
        }

        Expr target = (elements.size() == 1 && !trailing_comma)
                          ? std::move(elements.front())
                          : make_expr(cover(start, end), TupleExpr{.elements = std::move(elements)});
        if (auto err = validate_target(target, false, false))
        {
            return *err;
        }
        return target;
    }

    [[nodiscard]] Result<Expr> parse_expression()
    {
        NestingGuard guard(*this);
        if (guard.exceeded())
        {
            return error_at(peek(), "too many nested expressions");
        }
        if (check(TokenKind::KwLambda))
        {
            return parse_lambda();
        }

        auto body_res = parse_or();
        if (auto* d = std::get_if<Diagnostic>(&body_res))
        {
            return std::move(*d);
        }
        Expr body = std::get<Expr>(std::move(body_res));

        if (!match(TokenKind::KwIf))
        {
            return body;
        }

        auto cond = parse_or();
        if (auto* d = std::get_if<Diagnostic>(&cond))
        {
            return std::move(*d);
        }
        if (auto err = consume(TokenKind::KwElse, "expected 'else' after 'if' expression"))
        {
            return *err;
        }
        auto else_res = parse_expression();
        if (auto* d = std::get_if<Diagnostic>(&else_res))
        {
            return std::move(*d);
        }
        Expr else_value = std::get<Expr>(std::move(else_res));

        const Span span = cover(body.span, else_value.span);
        return make_expr(span, IfExpr{.cond = boxed(std::get<Expr>(std::move(cond))),
                                      .then_value = boxed(std::move(body)),
                                      .else_value = boxed(std::move(else_value))});
    }

    [[nodiscard]] Result<Expr> parse_lambda()
    {
        const Token kw = advance();
        auto params = parse_params(TokenKind::Colon, false);
        if (auto* d = std::get_if<Diagnostic>(&params))
        {
            return std::move(*d);
        }
        if (auto err = consume(TokenKind::Colon, "expected ':'"))
        {
            return *err;
        }
        auto body = parse_expression();
        if (auto* d = std::get_if<Diagnostic>(&body))
        {
            return std::move(*d);
        }

        LambdaExpr lambda;
        lambda.params = std::get<std::vector<Param>>(std::move(params));
        lambda.body = boxed(std::get<Expr>(std::move(body)));
        lambda.scope = collect_scope(lambda.params, Block{});
        const Span span = cover(kw.span, lambda.body->span);
        return make_expr(span, std::move(lambda));
    }

    [[nodiscard]] Result<Expr> parse_or()
    {
        auto lhs_res = parse_and();
        if (auto* d = std::get_if<Diagnostic>(&lhs_res))
        {
            return std::move(*d);
        }
        Expr expr = std::get<Expr>(std::move(lhs_res));

        while (match(TokenKind::KwOr))
        {
            auto rhs_res = parse_and();
            if (auto* d = std::get_if<Diagnostic>(&rhs_res))
            {
                return std::move(*d);
            }
            Expr rhs = std::get<Expr>(std::move(rhs_res));
            const Span span = cover(expr.span, rhs.span);
            expr = make_expr(span, BoolOpExpr{.op = TokenKind::KwOr,
                                              .lhs = boxed(std::move(expr)),
                                              .rhs = boxed(std::move(rhs))});
            if (expr.height > kMaxNesting)
            {
                return error_at(previous(), "too many nested expressions");
            }
        }
        return expr;
    }

    [[nodiscard]] Result<Expr> parse_and()
    {
        auto lhs_res = parse_not();
        if (auto* d = std::get_if<Diagnostic>(&lhs_res))
        {
            return std::move(*d);
        }
        Expr expr = std::get<Expr>(std::move(lhs_res));

        while (match(TokenKind::KwAnd))
        {
            auto rhs_res = parse_not();
            if (auto* d = std::get_if<Diagnostic>(&rhs_res))
            {
                return std::move(*d);
            }
            Expr rhs = std::get<Expr>(std::move(rhs_res));
            const Span span = cover(expr.span, rhs.span);
            expr = make_expr(span, BoolOpExpr{.op = TokenKind::KwAnd,
                                              .lhs = boxed(std::move(expr)),
                                              .rhs = boxed(std::move(rhs))});
            if (expr.height > kMaxNesting)
            {
                return error_at(previous(), "too many nested expressions");
            }
        }
        return expr;
    }

    [[nodiscard]] Result<Expr> parse_not()
    {
        NestingGuard guard(*this);
        if (guard.exceeded())
        {
            return error_at(peek(), "too many nested expressions");
        }
        if (check(TokenKind::KwNot))
        {
            const Token op = advance();
            auto operand = parse_not();
            if (auto* d = std::get_if<Diagnostic>(&operand))
            {
                return std::move(*d);
            }
            Expr inner = std::get<Expr>(std::move(operand));
            const Span span = cover(op.span, inner.span);
            return make_expr(span, UnaryExpr{.op = TokenKind::KwNot, .operand = boxed(std::move(inner))});
        }
        return parse_comparison();
    }

    [[nodiscard]] std::optional<CompareOp> match_compare_op()
    {
        switch (peek().kind)
        {
        case TokenKind::Less:
            advance();
            return CompareOp::Less;
        case TokenKind::LessEqual:
            advance();
            return CompareOp::LessEqual;
        case TokenKind::Greater:
            advance();
            return CompareOp::Greater;
        case TokenKind::GreaterEqual:
            advance();
            return CompareOp::GreaterEqual;
        case TokenKind::EqualEqual:
            advance();
            return CompareOp::Equal;
        case TokenKind::BangEqual:
            advance();
            return CompareOp::NotEqual;
        case TokenKind::KwIn:
            advance();
            return CompareOp::In;
        case TokenKind::KwNot:
            if (peek_next().kind == TokenKind::KwIn)
            {
                advance();
                advance();
                return CompareOp::NotIn;
            }
            return std::nullopt;
        case TokenKind::KwIs:
            advance();
            if (match(TokenKind::KwNot))
            {
                return CompareOp::IsNot;
            }
            return CompareOp::Is;
        default:
            return std::nullopt;
        }
    }

    [[nodiscard]] Result<Expr> parse_comparison()
    {
        auto first_res = parse_bitor();
        if (auto* d = std::get_if<Diagnostic>(&first_res))
        {
            return std::move(*d);
        }
        Expr first = std::get<Expr>(std::move(first_res));

        std::vector<Comparison> rest;
        Span end = first.span;
        while (auto op = match_compare_op())
        {
            auto rhs_res = parse_bitor();
            if (auto* d = std::get_if<Diagnostic>(&rhs_res))
            {
                return std::move(*d);
            }
            Expr rhs = std::get<Expr>(std::move(rhs_res));
            end = rhs.span;
            rest.push_back(Comparison{.op = *op, .rhs = boxed(std::move(rhs))});
        }

        if (rest.empty())
        {
            return first;
        }
        const Span span = cover(first.span, end);
        return make_expr(span, CompareExpr{.first = boxed(std::move(first)), .rest = std::move(rest)});
    }

    using LevelFn = Result<Expr> (Parser::*)();

    // Left-associative binary level: `next (op next)*` for any op in `ops`.
    [[nodiscard]] Result<Expr> parse_binary_level(LevelFn next, std::initializer_list<TokenKind> ops)
    {
        auto lhs_res = (this->*next)();
        if (auto* d = std::get_if<Diagnostic>(&lhs_res))
        {
            return std::move(*d);
        }
        Expr expr = std::get<Expr>(std::move(lhs_res));

        while (std::find(ops.begin(), ops.end(), peek().kind) != ops.end())
        {
            const Token op = advance();
            auto rhs_res = (this->*next)();
            if (auto* d = std::get_if<Diagnostic>(&rhs_res))
            {
                return std::move(*d);
            }
            Expr rhs = std::get<Expr>(std::move(rhs_res));
            const Span span = cover(expr.span, rhs.span);
            expr = make_expr(span, BinaryExpr{.op = op.kind,
                                              .lhs = boxed(std::move(expr)),
                                              .rhs = boxed(std::move(rhs))});
            if (expr.height > kMaxNesting)
            {
                return error_at(previous(), "too many nested expressions");
            }
        }
        return expr;
    }

    [[nodiscard]] Result<Expr> parse_bitor()
    {
        return parse_binary_level(&Parser::parse_bitxor, {TokenKind::Pipe});
    }

    [[nodiscard]] Result<Expr> parse_bitxor()
    {
        return parse_binary_level(&Parser::parse_bitand, {TokenKind::Caret});
    }

    [[nodiscard]] Result<Expr> parse_bitand()
    {
        return parse_binary_level(&Parser::parse_shift, {TokenKind::Amp});
    }

    [[nodiscard]] Result<Expr> parse_shift()
    {
        return parse_binary_level(&Parser::parse_sum, {TokenKind::LeftShift, TokenKind::RightShift});
    }

    [[nodiscard]] Result<Expr> parse_sum()
    {
        return parse_binary_level(&Parser::parse_term, {TokenKind::Plus, TokenKind::Minus});
    }

    [[nodiscard]] Result<Expr> parse_term()
    {
        return parse_binary_level(&Parser::parse_factor,
                                  {TokenKind::Star, TokenKind::Slash, TokenKind::DoubleSlash,
                                   TokenKind::Percent, TokenKind::At});
    }

    [[nodiscard]] Result<Expr> parse_factor()
    {
        NestingGuard guard(*this);
        if (guard.exceeded())
        {
            return error_at(peek(), "too many nested expressions");
        }
        if (check(TokenKind::Minus) || check(TokenKind::Plus) || check(TokenKind::Tilde))
        {
            const Token op = advance();
            auto operand = parse_factor();
            if (auto* d = std::get_if<Diagnostic>(&operand))
            {
                return std::move(*d);
            }
            Expr inner = std::get<Expr>(std::move(operand));
            const Span span = cover(op.span, inner.span);
            return make_expr(span, UnaryExpr{.op = op.kind, .operand = boxed(std::move(inner))});
        }
        return parse_power();
    }

    [[nodiscard]] Result<Expr> parse_power()
    {
        auto base_res = parse_primary();
        if (auto* d = std::get_if<Diagnostic>(&base_res))
        {
            return std::move(*d);
        }
        Expr base = std::get<Expr>(std::move(base_res));
        if (!match(TokenKind::DoubleStar))
        {
            return base;
        }
        auto exp_res = parse_factor();
        if (auto* d = std::get_if<Diagnostic>(&exp_res))
        {
            return std::move(*d);
        }
        Expr exponent = std::get<Expr>(std::move(exp_res));
        const Span span = cover(base.span, exponent.span);
        return make_expr(span, BinaryExpr{.op = TokenKind::DoubleStar,
                                          .lhs = boxed(std::move(base)),
                                          .rhs = boxed(std::move(exponent))});
    }

    [[nodiscard]] Result<Expr> parse_primary()
    {
        auto atom_res = parse_atom();
        if (auto* d = std::get_if<Diagnostic>(&atom_res))
        {
            return std::move(*d);
        }
        Expr expr = std::get<Expr>(std::move(atom_res));

        while (true)
        {
            if (expr.height > kMaxNesting)
            {
                return error_at(previous(), "too many nested expressions");
            }
            if (match(TokenKind::Dot))
            {
                if (!check(TokenKind::Identifier))
                {
                    return error_at(peek(), "expected identifier after '.'");
                }
                const Token member = advance();
                const Span span = cover(expr.span, member.span);
                expr = make_expr(span, AttributeExpr{.base = boxed(std::move(expr)),
                                                     .name = std::string(member.lexeme)});
                continue;
            }

            if (match(TokenKind::LParen))
            {
                auto args = parse_call_args();
                if (auto* d = std::get_if<Diagnostic>(&args))
                {
                    return std::move(*d);
                }
                const Span span = cover(expr.span, previous().span);
                expr = make_expr(span, CallExpr{.callee = boxed(std::move(expr)),
                                                .args = std::get<std::vector<Argument>>(std::move(args))});
                continue;
            }

            if (match(TokenKind::LBracket))
            {
                auto index = parse_subscript();
                if (auto* d = std::get_if<Diagnostic>(&index))
                {
                    return std::move(*d);
                }
                if (auto err = consume(TokenKind::RBracket, "expected ']'"))
                {
                    return *err;
                }
                const Span span = cover(expr.span, previous().span);
                expr = make_expr(span, SubscriptExpr{.base = boxed(std::move(expr)),
                                                     .index = boxed(std::get<Expr>(std::move(index)))});
                continue;
            }

            break;
        }
        return expr;
    }

    // Arguments after `(`; consumes the closing `)`.
    [[nodiscard]] Result<std::vector<Argument>> parse_call_args()
    {
        std::vector<Argument> args;
        bool seen_keyword = false;

        while (!check(TokenKind::RParen))
        {
            const Token start = peek();
            Argument arg;
            arg.span = start.span;

            if (match(TokenKind::Star))
            {
                arg.kind = ArgKind::Star;
            }
            else if (match(TokenKind::DoubleStar))
            {
                arg.kind = ArgKind::DoubleStar;
                seen_keyword = true;
            }
            else if (check(TokenKind::Identifier) && peek_next().kind == TokenKind::Equal)
            {
                arg.kind = ArgKind::Keyword;
                arg.name = std::string(advance().lexeme);
                advance();
                seen_keyword = true;
                for (const auto& other : args)
                {
                    if (other.kind == ArgKind::Keyword && other.name == arg.name)
                    {
                        return error_at(start, "keyword argument repeated: " + arg.name);
                    }
                }
            }
            else if (seen_keyword)
            {
                return error_at(start, "positional argument follows keyword argument");
            }

            auto value = parse_expression();
            if (auto* d = std::get_if<Diagnostic>(&value))
            {
                return std::move(*d);
            }
            Expr v = std::get<Expr>(std::move(value));

            if (arg.kind == ArgKind::Positional && check(TokenKind::KwFor))
            {
                auto gen = parse_comprehension_tail(ComprehensionExpr::Kind::Generator,
                                                    std::move(v), nullptr, start.span);
                if (auto* d = std::get_if<Diagnostic>(&gen))
                {
                    return std::move(*d);
                }
                v = std::get<Expr>(std::move(gen));
                if (!args.empty() || !check(TokenKind::RParen))
                {
                    return cinder::diag::error_at(
                        v.span, "generator expression must be parenthesized");
                }
            }

            arg.span = cover(start.span, v.span);
            arg.value = boxed(std::move(v));
            args.push_back(std::move(arg));

            if (!match(TokenKind::Comma))
            {
                break;
            }
        }

        if (auto err = consume(TokenKind::RParen, "expected ')' after arguments"))
        {
            return *err;
        }
        return args;
    }

    [[nodiscard]] Result<Expr> parse_slice_item()
    {
        const Span start = peek().span;
        ExprPtr lower;
        if (!check(TokenKind::Colon))
        {
            auto v = parse_expression();
            if (auto* d = std::get_if<Diagnostic>(&v))
            {
                return std::move(*d);
            }
            if (!check(TokenKind::Colon))
            {
                return v;
            }
            lower = boxed(std::get<Expr>(std::move(v)));
        }

        advance(); // ':'
        SliceExpr slice;
        slice.lower = std::move(lower);
        auto is_bound_end = [&]
        {
            return check(TokenKind::Colon) || check(TokenKind::RBracket) || check(TokenKind::Comma);
        };
        if (!is_bound_end())
        {
            auto v = parse_expression();
            if (auto* d = std::get_if<Diagnostic>(&v))
            {
                return std::move(*d);
            }
            slice.upper = boxed(std::get<Expr>(std::move(v)));
        }
        if (match(TokenKind::Colon) && !is_bound_end())
        {
            auto v = parse_expression();
            if (auto* d = std::get_if<Diagnostic>(&v))
            {
                return std::move(*d);
            }
            slice.step = boxed(std::get<Expr>(std::move(v)));
        }
        return make_expr(cover(start, previous().span), std::move(slice));
    }

    [[nodiscard]] Result<Expr> parse_subscript()
    {
        const Span start = peek().span;
        auto first = parse_slice_item();
        if (auto* d = std::get_if<Diagnostic>(&first))
        {
            return std::move(*d);
        }
        if (!check(TokenKind::Comma))
        {
            return first;
        }

        std::vector<Expr> elements;
        elements.push_back(std::get<Expr>(std::move(first)));
        while (match(TokenKind::Comma))
        {
            if (check(TokenKind::RBracket))
            {
                break;
            }
            auto next = parse_slice_item();
            if (auto* d = std::get_if<Diagnostic>(&next))
            {
                return std::move(*d);
            }
            elements.push_back(std::get<Expr>(std::move(next)));
        }
        return make_expr(cover(start, previous().span), TupleExpr{.elements = std::move(elements)});
    }

    // Parses `for ... in ... [if ...]` clauses after the element of a comprehension.
    [[nodiscard]] Result<Expr> parse_comprehension_tail(ComprehensionExpr::Kind kind, Expr element,
                                                        ExprPtr value, Span start)
    {
        ComprehensionExpr comp;
        comp.kind = kind;
        comp.element = boxed(std::move(element));
        comp.value = std::move(value);

        while (match(TokenKind::KwFor))
        {
            auto target = parse_target_list();
            if (auto* d = std::get_if<Diagnostic>(&target))
            {
                return std::move(*d);
            }
            if (auto err = consume(TokenKind::KwIn, "expected 'in'"))
            {
                return *err;
            }
            auto iter = parse_or();
            if (auto* d = std::get_if<Diagnostic>(&iter))
            {
                return std::move(*d);
            }

            ComprehensionClause clause;
            clause.target = boxed(std::get<Expr>(std::move(target)));
            clause.iter = boxed(std::get<Expr>(std::move(iter)));
            while (match(TokenKind::KwIf))
            {
                auto cond = parse_or();
                if (auto* d = std::get_if<Diagnostic>(&cond))
                {
                    return std::move(*d);
                }
                clause.conditions.push_back(std::get<Expr>(std::move(cond)));
            }
            comp.clauses.push_back(std::move(clause));
        }

        return make_expr(cover(start, previous().span), std::move(comp));
    }

    // Elements of a list/set/tuple display after the first; stops at `close`.
    [[nodiscard]] std::optional<Diagnostic> parse_display_rest(std::vector<Expr>& elements,
                                                               TokenKind close)
    {
        while (match(TokenKind::Comma))
        {
            if (check(close))
            {
                break;
            }
            auto next = parse_star_or_expression();
            if (auto* d = std::get_if<Diagnostic>(&next))
            {
                return std::move(*d);
            }
            elements.push_back(std::get<Expr>(std::move(next)));
        }
        return std::nullopt;
    }

    [[nodiscard]] Result<Expr> parse_paren()
    {
        const Token open = advance();
        if (match(TokenKind::RParen))
        {
            return make_expr(cover(open.span, previous().span), TupleExpr{});
        }

        auto first_res = parse_star_or_expression();
        if (auto* d = std::get_if<Diagnostic>(&first_res))
        {
            return std::move(*d);
        }
        Expr first = std::get<Expr>(std::move(first_res));

        if (check(TokenKind::KwFor))
        {
            auto gen = parse_comprehension_tail(ComprehensionExpr::Kind::Generator,
                                                std::move(first), nullptr, open.span);
            if (auto* d = std::get_if<Diagnostic>(&gen))
            {
                return std::move(*d);
            }
            if (auto err = consume(TokenKind::RParen, "expected ')'"))
            {
                return *err;
            }
            Expr e = std::get<Expr>(std::move(gen));
            e.span = cover(open.span, previous().span);
            return e;
        }

        if (!check(TokenKind::Comma))
        {
            if (auto err = consume(TokenKind::RParen, "expected ')' after expression"))
            {
                return *err;
            }
            if (std::holds_alternative<StarredExpr>(first.node))
            {
                return cinder::diag::error_at(first.span, "can't use starred expression here");
            }
            return first;
        }

        std::vector<Expr> elements;
        elements.push_back(std::move(first));
        if (auto err = parse_display_rest(elements, TokenKind::RParen))
        {
            return *err;
        }
        if (auto err = consume(TokenKind::RParen, "expected ')'"))
        {
            return *err;
        }
        return make_expr(cover(open.span, previous().span), TupleExpr{.elements = std::move(elements)});
    }

    [[nodiscard]] Result<Expr> parse_list_display()
    {
        const Token open = advance();
        if (match(TokenKind::RBracket))
        {
            return make_expr(cover(open.span, previous().span), ListExpr{});
        }

        auto first_res = parse_star_or_expression();
        if (auto* d = std::get_if<Diagnostic>(&first_res))
        {
            return std::move(*d);
        }
        Expr first = std::get<Expr>(std::move(first_res));

        if (check(TokenKind::KwFor))
        {
            auto comp = parse_comprehension_tail(ComprehensionExpr::Kind::List, std::move(first),
                                                 nullptr, open.span);
            if (auto* d = std::get_if<Diagnostic>(&comp))
            {
                return std::move(*d);
            }
            if (auto err = consume(TokenKind::RBracket, "expected ']'"))
            {
                return *err;
            }
            Expr e = std::get<Expr>(std::move(comp));
            e.span = cover(open.span, previous().span);
            return e;
        }

        std::vector<Expr> elements;
        elements.push_back(std::move(first));
        if (auto err = parse_display_rest(elements, TokenKind::RBracket))
        {
            return *err;
        }
        if (auto err = consume(TokenKind::RBracket, "expected ']'"))
        {
            return *err;
        }
        return make_expr(cover(open.span, previous().span), ListExpr{.elements = std::move(elements)});
    }

    [[nodiscard]] Result<Expr> parse_brace_display()
    {
        const Token open = advance();
        if (match(TokenKind::RBrace))
        {
            return make_expr(cover(open.span, previous().span), DictExpr{});
        }

        // Dict display or dict comprehension.
        if (check(TokenKind::DoubleStar) || !check(TokenKind::Star))
        {
            ExprPtr first_key;
            ExprPtr first_value;
            if (match(TokenKind::DoubleStar))
            {
                auto m = parse_bitor();
                if (auto* d = std::get_if<Diagnostic>(&m))
                {
                    return std::move(*d);
                }
                first_value = boxed(std::get<Expr>(std::move(m)));
            }
            else
            {
                auto k = parse_expression();
                if (auto* d = std::get_if<Diagnostic>(&k))
                {
                    return std::move(*d);
                }
                Expr key = std::get<Expr>(std::move(k));
                if (!match(TokenKind::Colon))
                {
                    return parse_set_rest(open, std::move(key));
                }
                auto v = parse_expression();
                if (auto* d = std::get_if<Diagnostic>(&v))
                {
                    return std::move(*d);
                }
                first_key = boxed(std::move(key));
                first_value = boxed(std::get<Expr>(std::move(v)));

                if (check(TokenKind::KwFor))
                {
                    auto comp = parse_comprehension_tail(ComprehensionExpr::Kind::Dict,
                                                         std::move(*first_key),
                                                         std::move(first_value), open.span);
                    if (auto* d = std::get_if<Diagnostic>(&comp))
                    {
                        return std::move(*d);
                    }
                    if (auto err = consume(TokenKind::RBrace, "expected '}'"))
                    {
                        return *err;
                    }
                    Expr e = std::get<Expr>(std::move(comp));
                    e.span = cover(open.span, previous().span);
                    return e;
                }
            }

            DictExpr dict;
            dict.entries.push_back(DictEntry{.key = std::move(first_key), .value = std::move(first_value)});
            while (match(TokenKind::Comma))
            {
                if (check(TokenKind::RBrace))
                {
                    break;
                }
                DictEntry entry;
                if (match(TokenKind::DoubleStar))
                {
                    auto m = parse_bitor();
                    if (auto* d = std::get_if<Diagnostic>(&m))
                    {
                        return std::move(*d);
                    }
                    entry.value = boxed(std::get<Expr>(std::move(m)));
                }
                else
                {
                    auto k = parse_expression();
                    if (auto* d = std::get_if<Diagnostic>(&k))
                    {
                        return std::move(*d);
                    }
                    if (auto err = consume(TokenKind::Colon, "expected ':'"))
                    {
                        return *err;
                    }
                    auto v = parse_expression();
                    if (auto* d = std::get_if<Diagnostic>(&v))
                    {
                        return std::move(*d);
                    }
                    entry.key = boxed(std::get<Expr>(std::move(k)));
                    entry.value = boxed(std::get<Expr>(std::move(v)));
                }
                dict.entries.push_back(std::move(entry));
            }
            if (auto err = consume(TokenKind::RBrace, "expected '}'"))
            {
                return *err;
            }
            return make_expr(cover(open.span, previous().span), std::move(dict));
        }

        auto first = parse_star_or_expression();
        if (auto* d = std::get_if<Diagnostic>(&first))
        {
            return std::move(*d);
        }
        return parse_set_rest(open, std::get<Expr>(std::move(first)));
    }

    [[nodiscard]] Result<Expr> parse_set_rest(const Token& open, Expr first)
    {
        if (check(TokenKind::KwFor))
        {
            auto comp = parse_comprehension_tail(ComprehensionExpr::Kind::Set, std::move(first),
                                                 nullptr, open.span);
            if (auto* d = std::get_if<Diagnostic>(&comp))
            {
                return std::move(*d);
            }
            if (auto err = consume(TokenKind::RBrace, "expected '}'"))
            {
                return *err;
            }
            Expr e = std::get<Expr>(std::move(comp));
            e.span = cover(open.span, previous().span);
            return e;
        }

        std::vector<Expr> elements;
        elements.push_back(std::move(first));
        if (auto err = parse_display_rest(elements, TokenKind::RBrace))
        {
            return *err;
        }
        if (auto err = consume(TokenKind::RBrace, "expected '}'"))
        {
            return *err;
        }
        return make_expr(cover(open.span, previous().span), SetExpr{.elements = std::move(elements)});
    }

    [[nodiscard]] Result<Expr> parse_atom()
    {
        const Token& tok = peek();
        switch (tok.kind)
        {
        case TokenKind::Identifier:
            advance();
            return make_expr(tok.span, NameExpr{.name = std::string(tok.lexeme)});
        case TokenKind::KwNone:
            advance();
            return make_expr(tok.span, NoneExpr{});
        case TokenKind::KwTrue:
            advance();
            return make_expr(tok.span, BoolExpr{.value = true});
        case TokenKind::KwFalse:
            advance();
            return make_expr(tok.span, BoolExpr{.value = false});
        case TokenKind::IntLiteral:
        {
            advance();
            auto value = parse_int_literal(tok.lexeme, tok.span);
            if (auto* d = std::get_if<Diagnostic>(&value))
            {
                return std::move(*d);
            }
            return make_expr(tok.span, IntExpr{.value = std::get<std::int64_t>(value)});
        }
        case TokenKind::FloatLiteral:
            advance();
            return make_expr(tok.span, FloatExpr{.value = parse_float_literal(tok.lexeme)});
        case TokenKind::ImagLiteral:
            advance();
            return make_expr(tok.span, ImagExpr{.value = parse_float_literal(tok.lexeme)});
        case TokenKind::StringLiteral:
            return parse_strings();
        case TokenKind::LParen:
            return parse_paren();
        case TokenKind::LBracket:
            return parse_list_display();
        case TokenKind::LBrace:
            return parse_brace_display();
        case TokenKind::KwReserved:
            return error_at(tok, "'" + std::string(tok.lexeme) + "' is not supported");
        default:
            return error_at(tok, "invalid syntax");
        }
    }

    // ---------------------------------------------------------------- strings

    // Adjacent string literals concatenate; any f-string piece makes the result an f-string.
    [[nodiscard]] Result<Expr> parse_strings()
    {
        const Span start = peek().span;
        std::vector<FStringPart> parts;
        bool any_formatted = false;
        std::optional<bool> is_bytes;

        while (check(TokenKind::StringLiteral))
        {
            const Token tok = advance();
            const StringLiteralInfo info = classify_string_literal(tok.lexeme);
            if (is_bytes.has_value() && *is_bytes != info.bytes)
            {
                return error_at(tok, "cannot mix bytes and nonbytes literals");
            }
            is_bytes = info.bytes;

            const std::size_t body_offset = tok.span.start + info.body_offset;
            if (info.formatted)
            {
                any_formatted = true;
                if (auto err = parse_fstring_body(info.body, info.raw, body_offset, parts))
                {
                    return *err;
                }
                continue;
            }

            std::string text;
            if (info.raw)
            {
                text = std::string(info.body);
            }
            else
            {
                auto decoded = decode_escapes(info.body, info.bytes, body_offset);
                if (auto* d = std::get_if<Diagnostic>(&decoded))
                {
                    return std::move(*d);
                }
                text = std::get<std::string>(std::move(decoded));
            }
            append_literal(parts, std::move(text));
        }

        const Span span = cover(start, previous().span);
        if (any_formatted)
        {
            return make_expr(span, FStringExpr{.parts = std::move(parts)});
        }

        std::string value = parts.empty() ? std::string() : std::move(parts.front().literal);
        if (is_bytes.value_or(false))
        {
            return make_expr(span, BytesExpr{.value = std::move(value)});
        }
        return make_expr(span, StrExpr{.value = std::move(value)});
    }

    static void append_literal(std::vector<FStringPart>& parts, std::string text)
    {
        if (!parts.empty() && parts.back().value == nullptr)
        {
            parts.back().literal += text;
            return;
        }
        FStringPart part;
        part.literal = std::move(text);
        parts.push_back(std::move(part));
    }

    // Finds the end of a replacement field's expression: the first top-level `!`, `:`, `=`
    // suffix or `}`.
    static std::size_t scan_field_expression(std::string_view body, std::size_t i)
    {
        int depth = 0;
        char quote = 0;
        for (; i < body.size(); ++i)
        {
            const char c = body[i];
            if (quote != 0)
            {
                if (c == quote)
                {
                    quote = 0;
                }
                continue;
            }
            if (c == '\'' || c == '"')
            {
                quote = c;
                continue;
            }
            if (c == '(' || c == '[' || c == '{')
            {
                ++depth;
                continue;
            }
            if ((c == ')' || c == ']' || c == '}') && depth > 0)
            {
                --depth;
                continue;
            }
            if (depth > 0)
            {
                continue;
            }
            if (c == '}' || c == ':')
            {
                return i;
            }
            if (c == '!' && (i + 1 >= body.size() || body[i + 1] != '='))
            {
                return i;
            }
        }
        return body.size();
    }

    [[nodiscard]] std::optional<Diagnostic> parse_fstring_body(std::string_view body, bool raw,
                                                               std::size_t offset,
                                                               std::vector<FStringPart>& parts)
    {
        std::string literal;
        std::size_t literal_start = 0;

        auto flush_literal = [&]() -> std::optional<Diagnostic>
        {
            if (literal.empty())
            {
                return std::nullopt;
            }
            if (raw)
            {
                append_literal(parts, std::move(literal));
            }
            else
            {
                auto decoded = decode_escapes(literal, false, offset + literal_start);
                if (auto* d = std::get_if<Diagnostic>(&decoded))
                {
                    return std::move(*d);
                }
                append_literal(parts, std::get<std::string>(std::move(decoded)));
            }
            literal.clear();
            return std::nullopt;
        };

        std::size_t i = 0;
        while (i < body.size())
        {
            const char c = body[i];
            if (c == '{' && i + 1 < body.size() && body[i + 1] == '{')
            {
                literal.push_back('{');
                i += 2;
                continue;
            }
            if (c == '}' && i + 1 < body.size() && body[i + 1] == '}')
            {
                literal.push_back('}');
                i += 2;
                continue;
            }
            if (c == '}')
            {
                return cinder::diag::error_at({offset + i, offset + i + 1},
                                              "f-string: single '}' is not allowed");
            }
            if (c != '{')
            {
                if (literal.empty())
                {
                    literal_start = i;
                }
                literal.push_back(c);
                ++i;
                continue;
            }

            if (auto err = flush_literal())
            {
                return err;
            }

            const std::size_t field_start = i + 1;
            std::size_t expr_end = scan_field_expression(body, field_start);
            if (expr_end >= body.size())
            {
                return cinder::diag::error_at({offset + i, offset + body.size()},
                                              "f-string: expecting '}'");
            }

            std::string_view expr_text = body.substr(field_start, expr_end - field_start);

            // `{expr=}` echoes the expression text before its value.
            std::string echo;
            {
                std::size_t trimmed = expr_text.find_last_not_of(" \t");
                if (trimmed != std::string_view::npos && expr_text[trimmed] == '=' &&
                    (trimmed == 0 || std::string_view("=!<>").find(expr_text[trimmed - 1]) ==
                                         std::string_view::npos))
                {
                    echo = std::string(expr_text);
                    expr_text = expr_text.substr(0, trimmed);
                }
            }

            if (expr_text.find_first_not_of(" \t\r\n") == std::string_view::npos)
            {
                return cinder::diag::error_at({offset + i, offset + expr_end + 1},
                                              "f-string: empty expression not allowed");
            }

            auto sub = parse_embedded_expression(expr_text, offset + field_start);
            if (auto* d = std::get_if<Diagnostic>(&sub))
            {
                return std::move(*d);
            }

            FStringPart field;
            field.value = boxed(std::get<Expr>(std::move(sub)));
            if (!echo.empty())
            {
                append_literal(parts, echo);
            }

            std::size_t j = expr_end;
            if (body[j] == '!')
            {
                if (j + 1 >= body.size() || std::string_view("rsa").find(body[j + 1]) ==
                                                std::string_view::npos)
                {
                    return cinder::diag::error_at({offset + j, offset + j + 2},
                                                  "f-string: invalid conversion character");
                }
                field.conversion = body[j + 1];
                j += 2;
            }

            if (j < body.size() && body[j] == ':')
            {
                // Format spec runs to the matching '}' and may hold nested fields.
                const std::size_t spec_start = j + 1;
                int depth = 0;
                std::size_t k = spec_start;
                for (; k < body.size(); ++k)
                {
                    if (body[k] == '{')
                    {
                        ++depth;
                    }
                    else if (body[k] == '}')
                    {
                        if (depth == 0)
                        {
                            break;
                        }
                        --depth;
                    }
                }
                if (k >= body.size())
                {
                    return cinder::diag::error_at({offset + i, offset + body.size()},
                                                  "f-string: expecting '}'");
                }
                if (auto err = parse_fstring_body(body.substr(spec_start, k - spec_start), raw,
                                                  offset + spec_start, field.spec))
                {
                    return err;
                }
                j = k;
            }
            else if (!echo.empty() && field.conversion == 0)
            {
                field.conversion = 'r';
            }

            if (j >= body.size() || body[j] != '}')
            {
                return cinder::diag::error_at({offset + i, offset + j},
                                              "f-string: expecting '}'");
            }

            parts.push_back(std::move(field));
            i = j + 1;
        }

        return flush_literal();
    }

    [[nodiscard]] static Result<Expr> parse_embedded_expression(std::string_view text,
                                                                std::size_t offset)
    {
        auto lexed = cinder::lexer::lex(text);
        if (auto* d = std::get_if<Diagnostic>(&lexed))
        {
            if (d->span.has_value())
            {
                d->span = d->span->shifted(offset);
            }
            d->message = "f-string: " + d->message;
            return std::move(*d);
        }
        auto tokens = std::get<std::vector<Token>>(std::move(lexed));
        for (auto& t : tokens)
        {
            t.span = t.span.shifted(offset);
        }

        Parser sub(tokens);
        auto result = sub.parse_single_expression();
        if (auto* diags = std::get_if<std::vector<Diagnostic>>(&result))
        {
            Diagnostic d = std::move(diags->front());
            d.message = "f-string: " + d.message;
            return d;
        }
        return std::get<Expr>(std::move(result));
    }
};

} // namespace

ParseResult parse(std::span<const cinder::lexer::Token> tokens)
{
    if (tokens.empty())
    {
        return Program{};
    }
    return Parser(tokens).parse_program();
}

ExprResult parse_expression(std::span<const cinder::lexer::Token> tokens)
{
    if (tokens.empty())
    {
        return std::vector<Diagnostic>{
            Diagnostic{.severity = cinder::diag::Severity::Error,
                       .message = "expected expression",
                       .span = std::nullopt,
                       .notes = {}}};
    }
    return Parser(tokens).parse_single_expression();
}

ParseResult parse_source(std::string_view text)
{
    auto lexed = cinder::lexer::lex(text);
    if (auto* d = std::get_if<Diagnostic>(&lexed))
    {
        return std::vector<Diagnostic>{std::move(*d)};
    }
    const auto& tokens = std::get<std::vector<Token>>(lexed);
    return parse(tokens);
}

ExprResult parse_expression_source(std::string_view text)
{
    auto lexed = cinder::lexer::lex(text);
    if (auto* d = std::get_if<Diagnostic>(&lexed))
    {
        return std::vector<Diagnostic>{std::move(*d)};
    }
    const auto& tokens = std::get<std::vector<Token>>(lexed);
    return parse_expression(tokens);
}

} // namespace cinder::parser
