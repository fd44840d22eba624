#pragma once

#include <cinder/lexer/token.h>
#include <cinder/source/span.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * @file ast.h
 * @brief Abstract syntax tree (AST) node types produced by the parser.
 *
 * Nodes own their names and decoded literal values, so a parsed unit stays valid after the
 * token buffer and the source text it was lexed from are gone.
 */

namespace cinder::parser
{

struct Expr;
struct Stmt;

using ExprPtr = std::unique_ptr<Expr>;
using Block = std::vector<Stmt>;

/** @brief `None` literal. */
struct NoneExpr
{
};

/** @brief `True` / `False` literal. */
struct BoolExpr
{
    bool value = false;
};

/** @brief Integer literal, already range-checked. */
struct IntExpr
{
    std::int64_t value = 0;
};

/** @brief Floating point literal. */
struct FloatExpr
{
    double value = 0.0;
};

/** @brief Imaginary literal such as `4j`. */
struct ImagExpr
{
    double value = 0.0;
};

/** @brief String literal after escape decoding and implicit concatenation. */
struct StrExpr
{
    std::string value;
};

/** @brief Bytes literal (`b'...'`), decoded. */
struct BytesExpr
{
    std::string value;
};

/** @brief One piece of an f-string: literal text or a replacement field. */
struct FStringPart
{
    std::string literal;
    ExprPtr value;                     // null for literal pieces
    char conversion = 0;               // 0, 'r', 's' or 'a'
    std::vector<FStringPart> spec;     // nested format spec, may itself contain fields
};

/** @brief Formatted string literal. */
struct FStringExpr
{
    std::vector<FStringPart> parts;
};

/** @brief Simple name expression (identifier). */
struct NameExpr
{
    std::string name;
};

/** @brief Attribute access (`base.name`). */
struct AttributeExpr
{
    ExprPtr base;
    std::string name;
};

/** @brief Slice inside a subscript (`a:b:c`). */
struct SliceExpr
{
    ExprPtr lower;
    ExprPtr upper;
    ExprPtr step;
};

/** @brief Subscript (`base[index]`). */
struct SubscriptExpr
{
    ExprPtr base;
    ExprPtr index;
};

/** @brief How a call argument is passed. */
enum class ArgKind
{
    Positional,
    Star,       // *iterable
    Keyword,    // name=value
    DoubleStar, // **mapping
};

struct Argument
{
    cinder::source::Span span;
    ArgKind kind = ArgKind::Positional;
    std::string name;
    ExprPtr value;
};

/** @brief Function call expression. */
struct CallExpr
{
    ExprPtr callee;
    std::vector<Argument> args;
};

/** @brief Unary expression (`-x`, `+x`, `~x`, `not x`). */
struct UnaryExpr
{
    cinder::lexer::TokenKind op;
    ExprPtr operand;
};

/** @brief Binary arithmetic or bitwise expression. */
struct BinaryExpr
{
    cinder::lexer::TokenKind op;
    ExprPtr lhs;
    ExprPtr rhs;
};

/** @brief Short-circuit `and` / `or`. */
struct BoolOpExpr
{
    cinder::lexer::TokenKind op; // KwAnd or KwOr
    ExprPtr lhs;
    ExprPtr rhs;
};

enum class CompareOp
{
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    Equal,
    NotEqual,
    In,
    NotIn,
    Is,
    IsNot,
};

struct Comparison
{
    CompareOp op = CompareOp::Equal;
    ExprPtr rhs;
};

/** @brief Comparison chain (`a < b <= c`). */
struct CompareExpr
{
    ExprPtr first;
    std::vector<Comparison> rest;
};

/** @brief Conditional expression (`a if cond else b`). */
struct IfExpr
{
    ExprPtr cond;
    ExprPtr then_value;
    ExprPtr else_value;
};

/** @brief Formal parameter of a function or lambda. */
struct Param
{
    enum class Kind
    {
        Normal,
        VarArgs,    // *args
        KwOnly,     // after a bare `*` or *args
        VarKwargs,  // **kwargs
    };

    cinder::source::Span span;
    Kind kind = Kind::Normal;
    std::string name;
    ExprPtr default_value;
};

/**
 * @brief Names bound in a function scope.
 *
 * Computed by the parser once per function body: assigned names are local unless declared
 * `global` or `nonlocal`.
 */
struct ScopeInfo
{
    std::vector<std::string> locals;
    std::vector<std::string> globals;
    std::vector<std::string> nonlocals;
};

/** @brief Lambda expression; the body is a single expression. */
struct LambdaExpr
{
    std::vector<Param> params;
    ExprPtr body;
    ScopeInfo scope;
};

/** @brief Starred element in a display or assignment target (`*rest`). */
struct StarredExpr
{
    ExprPtr value;
};

struct ListExpr
{
    std::vector<Expr> elements;
};

struct TupleExpr
{
    std::vector<Expr> elements;
};

struct SetExpr
{
    std::vector<Expr> elements;
};

/** @brief Dict entry; a null key means `**mapping` unpacking. */
struct DictEntry
{
    ExprPtr key;
    ExprPtr value;
};

struct DictExpr
{
    std::vector<DictEntry> entries;
};

/** @brief One `for target in iter if cond...` clause of a comprehension. */
struct ComprehensionClause
{
    ExprPtr target;
    ExprPtr iter;
    std::vector<Expr> conditions;
};

/** @brief List, set, dict comprehension or generator expression. */
struct ComprehensionExpr
{
    enum class Kind
    {
        List,
        Set,
        Dict,
        Generator,
    };

    Kind kind = Kind::List;
    ExprPtr element; // key for dict comprehensions
    ExprPtr value;   // dict comprehensions only
    std::vector<ComprehensionClause> clauses;
};

/**
 * @brief A general expression node with span and variant payload.
 */
struct Expr
{
    cinder::source::Span span;
    std::size_t height = 1; // nodes on the longest path down to a leaf, this one included
    std::variant<NoneExpr, BoolExpr, IntExpr, FloatExpr, ImagExpr, StrExpr, BytesExpr,
                 FStringExpr, NameExpr, AttributeExpr, SubscriptExpr, SliceExpr, CallExpr,
                 UnaryExpr, BinaryExpr, BoolOpExpr, CompareExpr, IfExpr, LambdaExpr,
                 StarredExpr, ListExpr, TupleExpr, SetExpr, DictExpr, ComprehensionExpr>
        node;
};

/** @brief Expression statement. */
struct ExprStmt
{
    Expr expr;
};

/** @brief Assignment (`a = b = value`); every target receives the value. */
struct AssignStmt
{
    std::vector<Expr> targets;
    Expr value;
};

/** @brief Augmented assignment; `op` is the binary operator (e.g. Plus for `+=`). */
struct AugAssignStmt
{
    Expr target;
    cinder::lexer::TokenKind op;
    Expr value;
};

/** @brief Annotated assignment (`x: int = 1`); the annotation is not evaluated. */
struct AnnAssignStmt
{
    Expr target;
    std::optional<Expr> value;
};

struct IfBranch
{
    Expr cond;
    Block body;
};

/** @brief If statement: `if` and `elif` branches plus an optional else block. */
struct IfStmt
{
    std::vector<IfBranch> branches;
    Block else_body;
};

struct WhileStmt
{
    Expr cond;
    Block body;
    Block else_body;
};

struct ForStmt
{
    Expr target;
    Expr iter;
    Block body;
    Block else_body;
};

struct BreakStmt
{
};

struct ContinueStmt
{
};

struct PassStmt
{
};

/** @brief Function definition. */
struct FunctionDef
{
    std::string name;
    std::vector<Param> params;
    Block body;
    ScopeInfo scope;
};

struct ReturnStmt
{
    std::optional<Expr> value;
};

/** @brief `import a.b.c [as d]` entry. */
struct ImportName
{
    cinder::source::Span span;
    std::vector<std::string> path;
    std::optional<std::string> alias;
};

struct ImportStmt
{
    std::vector<ImportName> names;
};

/** @brief `from a.b import c [as d], ...`; a name of `*` imports every public member. */
struct FromImportStmt
{
    std::vector<std::string> module;
    std::vector<ImportName> names;
};

struct ExceptHandler
{
    cinder::source::Span span;
    std::optional<Expr> type;
    std::optional<std::string> name;
    Block body;
};

struct TryStmt
{
    Block body;
    std::vector<ExceptHandler> handlers;
    Block else_body;
    Block finally_body;
};

struct RaiseStmt
{
    std::optional<Expr> exception;
    std::optional<Expr> cause;
};

struct DelStmt
{
    std::vector<Expr> targets;
};

struct GlobalStmt
{
    std::vector<std::string> names;
};

struct NonlocalStmt
{
    std::vector<std::string> names;
};

struct AssertStmt
{
    Expr test;
    std::optional<Expr> message;
};

/**
 * @brief General statement node with span and variant payload.
 */
struct Stmt
{
    cinder::source::Span span;
    std::variant<ExprStmt, AssignStmt, AugAssignStmt, AnnAssignStmt, IfStmt, WhileStmt, ForStmt,
                 BreakStmt, ContinueStmt, PassStmt, FunctionDef, ReturnStmt, ImportStmt,
                 FromImportStmt, TryStmt, RaiseStmt, DelStmt, GlobalStmt, NonlocalStmt,
                 AssertStmt>
        node;
};

/** @brief Full parsed module: its top-level statements. */
struct Program
{
    Block body;
};

} // namespace cinder::parser
