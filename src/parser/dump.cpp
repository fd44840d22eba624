#include <cinder/parser/parser.h>
#include <sstream>
#include <type_traits>

namespace cinder::parser
{
namespace
{

std::string_view compare_op_string(CompareOp op)
{
    switch (op)
    {
    case CompareOp::Less:
        return "<";
    case CompareOp::LessEqual:
        return "<=";
    case CompareOp::Greater:
        return ">";
    case CompareOp::GreaterEqual:
        return ">=";
    case CompareOp::Equal:
        return "==";
    case CompareOp::NotEqual:
        return "!=";
    case CompareOp::In:
        return "in";
    case CompareOp::NotIn:
        return "not in";
    case CompareOp::Is:
        return "is";
    case CompareOp::IsNot:
        return "is not";
    }
    return "?";
}

std::string_view comprehension_name(ComprehensionExpr::Kind kind)
{
    switch (kind)
    {
    case ComprehensionExpr::Kind::List:
        return "listcomp";
    case ComprehensionExpr::Kind::Set:
        return "setcomp";
    case ComprehensionExpr::Kind::Dict:
        return "dictcomp";
    case ComprehensionExpr::Kind::Generator:
        return "genexpr";
    }
    return "comp";
}

class Dumper
{
  public:
    explicit Dumper(std::ostringstream& out) : out_(out) {}

    void dump_block(const Block& block, int indent)
    {
        for (const auto& stmt : block)
        {
            dump_stmt(stmt, indent);
        }
    }

    void dump_expr(const Expr& expr)
    {
        std::visit([&](const auto& node) { dump_expr_node(node); }, expr.node);
    }

  private:
    std::ostringstream& out_;

    void line(int indent) { out_ << std::string(static_cast<std::size_t>(indent) * 2, ' '); }

    void quoted(std::string_view text)
    {
        out_ << '"';
        for (const char c : text)
        {
            switch (c)
            {
            case '"':
                out_ << "\\\"";
                break;
            case '\\':
                out_ << "\\\\";
                break;
            case '\n':
                out_ << "\\n";
                break;
            case '\t':
                out_ << "\\t";
                break;
            default:
                out_ << c;
                break;
            }
        }
        out_ << '"';
    }

    void dump_opt(const ExprPtr& expr)
    {
        if (expr == nullptr)
        {
            out_ << "_";
            return;
        }
        dump_expr(*expr);
    }

    void dump_list(std::string_view head, const std::vector<Expr>& elements)
    {
        out_ << "(" << head;
        for (const auto& e : elements)
        {
            out_ << " ";
            dump_expr(e);
        }
        out_ << ")";
    }

    void dump_params(const std::vector<Param>& params)
    {
        out_ << "(";
        for (std::size_t i = 0; i < params.size(); ++i)
        {
            const auto& p = params[i];
            if (i > 0)
            {
                out_ << " ";
            }
            if (p.kind == Param::Kind::VarArgs)
            {
                out_ << "*";
            }
            else if (p.kind == Param::Kind::VarKwargs)
            {
                out_ << "**";
            }
            out_ << p.name;
            if (p.default_value != nullptr)
            {
                out_ << "=";
                dump_expr(*p.default_value);
            }
        }
        out_ << ")";
    }

    void dump_fstring_parts(const std::vector<FStringPart>& parts)
    {
        for (const auto& part : parts)
        {
            out_ << " ";
            if (part.value == nullptr)
            {
                quoted(part.literal);
                continue;
            }
            out_ << "(field ";
            dump_expr(*part.value);
            if (part.conversion != 0)
            {
                out_ << " !" << part.conversion;
            }
            if (!part.spec.empty())
            {
                out_ << " (spec";
                dump_fstring_parts(part.spec);
                out_ << ")";
            }
            out_ << ")";
        }
    }

    void dump_expr_node(const NoneExpr&) { out_ << "None"; }
    void dump_expr_node(const BoolExpr& e) { out_ << (e.value ? "True" : "False"); }
    void dump_expr_node(const IntExpr& e) { out_ << e.value; }
    void dump_expr_node(const FloatExpr& e) { out_ << "(float " << e.value << ")"; }
    void dump_expr_node(const ImagExpr& e) { out_ << "(imag " << e.value << ")"; }
    void dump_expr_node(const StrExpr& e) { quoted(e.value); }

    void dump_expr_node(const BytesExpr& e)
    {
        out_ << "(bytes ";
        quoted(e.value);
        out_ << ")";
    }

    void dump_expr_node(const FStringExpr& e)
    {
        out_ << "(fstring";
        dump_fstring_parts(e.parts);
        out_ << ")";
    }

    void dump_expr_node(const NameExpr& e) { out_ << e.name; }

    void dump_expr_node(const AttributeExpr& e)
    {
        out_ << "(. ";
        dump_expr(*e.base);
        out_ << " " << e.name << ")";
    }

    void dump_expr_node(const SubscriptExpr& e)
    {
        out_ << "(index ";
        dump_expr(*e.base);
        out_ << " ";
        dump_expr(*e.index);
        out_ << ")";
    }

    void dump_expr_node(const SliceExpr& e)
    {
        out_ << "(slice ";
        dump_opt(e.lower);
        out_ << " ";
        dump_opt(e.upper);
        out_ << " ";
        dump_opt(e.step);
        out_ << ")";
    }

    void dump_expr_node(const CallExpr& e)
    {
        out_ << "(call ";
        dump_expr(*e.callee);
        for (const auto& arg : e.args)
        {
            out_ << " ";
            switch (arg.kind)
            {
            case ArgKind::Positional:
                dump_expr(*arg.value);
                break;
            case ArgKind::Star:
                out_ << "(* ";
                dump_expr(*arg.value);
                out_ << ")";
                break;
            case ArgKind::Keyword:
                out_ << "(kw " << arg.name << " ";
                dump_expr(*arg.value);
                out_ << ")";
                break;
            case ArgKind::DoubleStar:
                out_ << "(** ";
                dump_expr(*arg.value);
                out_ << ")";
                break;
            }
        }
        out_ << ")";
    }

    void dump_expr_node(const UnaryExpr& e)
    {
        out_ << "(" << cinder::lexer::to_string(e.op) << " ";
        dump_expr(*e.operand);
        out_ << ")";
    }

    void dump_expr_node(const BinaryExpr& e)
    {
        out_ << "(" << cinder::lexer::to_string(e.op) << " ";
        dump_expr(*e.lhs);
        out_ << " ";
        dump_expr(*e.rhs);
        out_ << ")";
    }

    void dump_expr_node(const BoolOpExpr& e)
    {
        out_ << "(" << (e.op == cinder::lexer::TokenKind::KwAnd ? "and" : "or") << " ";
        dump_expr(*e.lhs);
        out_ << " ";
        dump_expr(*e.rhs);
        out_ << ")";
    }

    void dump_expr_node(const CompareExpr& e)
    {
        out_ << "(compare ";
        dump_expr(*e.first);
        for (const auto& c : e.rest)
        {
            out_ << " " << compare_op_string(c.op) << " ";
            dump_expr(*c.rhs);
        }
        out_ << ")";
    }

    void dump_expr_node(const IfExpr& e)
    {
        out_ << "(if ";
        dump_expr(*e.cond);
        out_ << " ";
        dump_expr(*e.then_value);
        out_ << " ";
        dump_expr(*e.else_value);
        out_ << ")";
    }

    void dump_expr_node(const LambdaExpr& e)
    {
        out_ << "(lambda ";
        dump_params(e.params);
        out_ << " ";
        dump_expr(*e.body);
        out_ << ")";
    }

    void dump_expr_node(const StarredExpr& e)
    {
        out_ << "(* ";
        dump_expr(*e.value);
        out_ << ")";
    }

    void dump_expr_node(const ListExpr& e) { dump_list("list", e.elements); }
    void dump_expr_node(const TupleExpr& e) { dump_list("tuple", e.elements); }
    void dump_expr_node(const SetExpr& e) { dump_list("set", e.elements); }

    void dump_expr_node(const DictExpr& e)
    {
        out_ << "(dict";
        for (const auto& entry : e.entries)
        {
            out_ << " (";
            if (entry.key == nullptr)
            {
                out_ << "** ";
            }
            else
            {
                dump_expr(*entry.key);
                out_ << " ";
            }
            dump_expr(*entry.value);
            out_ << ")";
        }
        out_ << ")";
    }

    void dump_expr_node(const ComprehensionExpr& e)
    {
        out_ << "(" << comprehension_name(e.kind) << " ";
        dump_expr(*e.element);
        if (e.value != nullptr)
        {
            out_ << " ";
            dump_expr(*e.value);
        }
        for (const auto& clause : e.clauses)
        {
            out_ << " (for ";
            dump_expr(*clause.target);
            out_ << " ";
            dump_expr(*clause.iter);
            for (const auto& cond : clause.conditions)
            {
                out_ << " (if ";
                dump_expr(cond);
                out_ << ")";
            }
            out_ << ")";
        }
        out_ << ")";
    }

    void dump_suite(std::string_view header, const Block& body, int indent)
    {
        line(indent);
        out_ << header << "\n";
        dump_block(body, indent + 1);
    }

    void dump_stmt(const Stmt& stmt, int indent)
    {
        std::visit([&](const auto& node) { dump_stmt_node(node, indent); }, stmt.node);
    }

    void dump_stmt_node(const ExprStmt& s, int indent)
    {
        line(indent);
        out_ << "(expr ";
        dump_expr(s.expr);
        out_ << ")\n";
    }

    void dump_stmt_node(const AssignStmt& s, int indent)
    {
        line(indent);
        out_ << "(assign";
        for (const auto& t : s.targets)
        {
            out_ << " ";
            dump_expr(t);
        }
        out_ << " ";
        dump_expr(s.value);
        out_ << ")\n";
    }

    void dump_stmt_node(const AugAssignStmt& s, int indent)
    {
        line(indent);
        out_ << "(augassign " << cinder::lexer::to_string(s.op) << " ";
        dump_expr(s.target);
        out_ << " ";
        dump_expr(s.value);
        out_ << ")\n";
    }

    void dump_stmt_node(const AnnAssignStmt& s, int indent)
    {
        line(indent);
        out_ << "(annassign ";
        dump_expr(s.target);
        if (s.value.has_value())
        {
            out_ << " ";
            dump_expr(*s.value);
        }
        out_ << ")\n";
    }

    void dump_stmt_node(const IfStmt& s, int indent)
    {
        for (std::size_t i = 0; i < s.branches.size(); ++i)
        {
            line(indent);
            out_ << (i == 0 ? "if " : "elif ");
            dump_expr(s.branches[i].cond);
            out_ << "\n";
            dump_block(s.branches[i].body, indent + 1);
        }
        if (!s.else_body.empty())
        {
            dump_suite("else", s.else_body, indent);
        }
    }

    void dump_stmt_node(const WhileStmt& s, int indent)
    {
        line(indent);
        out_ << "while ";
        dump_expr(s.cond);
        out_ << "\n";
        dump_block(s.body, indent + 1);
        if (!s.else_body.empty())
        {
            dump_suite("else", s.else_body, indent);
        }
    }

    void dump_stmt_node(const ForStmt& s, int indent)
    {
        line(indent);
        out_ << "for ";
        dump_expr(s.target);
        out_ << " in ";
        dump_expr(s.iter);
        out_ << "\n";
        dump_block(s.body, indent + 1);
        if (!s.else_body.empty())
        {
            dump_suite("else", s.else_body, indent);
        }
    }

    void dump_stmt_node(const BreakStmt&, int indent)
    {
        line(indent);
        out_ << "break\n";
    }

    void dump_stmt_node(const ContinueStmt&, int indent)
    {
        line(indent);
        out_ << "continue\n";
    }

    void dump_stmt_node(const PassStmt&, int indent)
    {
        line(indent);
        out_ << "pass\n";
    }

    void dump_stmt_node(const FunctionDef& s, int indent)
    {
        line(indent);
        out_ << "def " << s.name;
        dump_params(s.params);
        out_ << "\n";
        dump_block(s.body, indent + 1);
    }

    void dump_stmt_node(const ReturnStmt& s, int indent)
    {
        line(indent);
        out_ << "(return";
        if (s.value.has_value())
        {
            out_ << " ";
            dump_expr(*s.value);
        }
        out_ << ")\n";
    }

    void dump_import_names(const std::vector<ImportName>& names)
    {
        for (std::size_t i = 0; i < names.size(); ++i)
        {
            out_ << (i == 0 ? " " : ", ");
            for (std::size_t k = 0; k < names[i].path.size(); ++k)
            {
                out_ << (k == 0 ? "" : ".") << names[i].path[k];
            }
            if (names[i].alias.has_value())
            {
                out_ << " as " << *names[i].alias;
            }
        }
    }

    void dump_stmt_node(const ImportStmt& s, int indent)
    {
        line(indent);
        out_ << "import";
        dump_import_names(s.names);
        out_ << "\n";
    }

    void dump_stmt_node(const FromImportStmt& s, int indent)
    {
        line(indent);
        out_ << "from ";
        for (std::size_t k = 0; k < s.module.size(); ++k)
        {
            out_ << (k == 0 ? "" : ".") << s.module[k];
        }
        out_ << " import";
        dump_import_names(s.names);
        out_ << "\n";
    }

    void dump_stmt_node(const TryStmt& s, int indent)
    {
        dump_suite("try", s.body, indent);
        for (const auto& h : s.handlers)
        {
            line(indent);
            out_ << "except";
            if (h.type.has_value())
            {
                out_ << " ";
                dump_expr(*h.type);
            }
            if (h.name.has_value())
            {
                out_ << " as " << *h.name;
            }
            out_ << "\n";
            dump_block(h.body, indent + 1);
        }
        if (!s.else_body.empty())
        {
            dump_suite("else", s.else_body, indent);
        }
        if (!s.finally_body.empty())
        {
            dump_suite("finally", s.finally_body, indent);
        }
    }

    void dump_stmt_node(const RaiseStmt& s, int indent)
    {
        line(indent);
        out_ << "raise";
        if (s.exception.has_value())
        {
            out_ << " ";
            dump_expr(*s.exception);
        }
        if (s.cause.has_value())
        {
            out_ << " from ";
            dump_expr(*s.cause);
        }
        out_ << "\n";
    }

    void dump_stmt_node(const DelStmt& s, int indent)
    {
        line(indent);
        out_ << "del";
        for (const auto& t : s.targets)
        {
            out_ << " ";
            dump_expr(t);
        }
        out_ << "\n";
    }

    void dump_stmt_node(const GlobalStmt& s, int indent)
    {
        line(indent);
        out_ << "global";
        for (const auto& n : s.names)
        {
            out_ << " " << n;
        }
        out_ << "\n";
    }

    void dump_stmt_node(const NonlocalStmt& s, int indent)
    {
        line(indent);
        out_ << "nonlocal";
        for (const auto& n : s.names)
        {
            out_ << " " << n;
        }
        out_ << "\n";
    }

    void dump_stmt_node(const AssertStmt& s, int indent)
    {
        line(indent);
        out_ << "assert ";
        dump_expr(s.test);
        if (s.message.has_value())
        {
            out_ << " ";
            dump_expr(*s.message);
        }
        out_ << "\n";
    }
};

} // namespace

std::string dump(const Program& program)
{
    std::ostringstream out;
    Dumper d(out);
    d.dump_block(program.body, 0);
    return out.str();
}

std::string dump(const Expr& expr)
{
    std::ostringstream out;
    Dumper d(out);
    d.dump_expr(expr);
    return out.str();
}

} // namespace cinder::parser
