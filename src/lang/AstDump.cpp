//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/AstDump.cpp
// Purpose: Pre-order AST printer used by the AST and Optimized AST stages.
// Key invariants: Field labels follow Python's ast field names.
// Ownership/Lifetime: Stateless aside from the listing under construction.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#include "lang/AstDump.hpp"

#include <string>

namespace stagelens::lang
{
namespace
{
class AstDumper
{
  public:
    explicit AstDumper(Listing &out) : out_(out) {}

    void stmts(const StmtList &list, const char *field, int depth)
    {
        for (size_t i = 0; i < list.size(); ++i)
            stmt(*list[i], std::string(field) + "[" + std::to_string(i) + "]", depth);
    }

    void stmt(const Stmt &s, const std::string &label, int depth)
    {
        switch (s.kind)
        {
            case Stmt::Kind::Assign:
            {
                const auto &a = static_cast<const AssignStmt &>(s);
                emit(label, "Assign", s.loc, depth);
                for (size_t i = 0; i < a.targets.size(); ++i)
                    expr(*a.targets[i], "targets[" + std::to_string(i) + "]", depth + 1);
                expr(*a.value, "value", depth + 1);
                break;
            }
            case Stmt::Kind::Expr:
                emit(label, "Expr", s.loc, depth);
                expr(*static_cast<const ExprStmt &>(s).value, "value", depth + 1);
                break;
            case Stmt::Kind::Del:
            {
                const auto &d = static_cast<const DelStmt &>(s);
                emit(label, "Delete", s.loc, depth);
                for (size_t i = 0; i < d.targets.size(); ++i)
                    expr(*d.targets[i], "targets[" + std::to_string(i) + "]", depth + 1);
                break;
            }
            case Stmt::Kind::Pass:
                emit(label, "Pass", s.loc, depth);
                break;
            case Stmt::Kind::Break:
                emit(label, "Break", s.loc, depth);
                break;
            case Stmt::Kind::Continue:
                emit(label, "Continue", s.loc, depth);
                break;
            case Stmt::Kind::For:
            {
                const auto &f = static_cast<const ForStmt &>(s);
                emit(label, "For", s.loc, depth);
                expr(*f.target, "target", depth + 1);
                expr(*f.iter, "iter", depth + 1);
                stmts(f.body, "body", depth + 1);
                break;
            }
            case Stmt::Kind::While:
            {
                const auto &w = static_cast<const WhileStmt &>(s);
                emit(label, "While", s.loc, depth);
                expr(*w.test, "test", depth + 1);
                stmts(w.body, "body", depth + 1);
                break;
            }
            case Stmt::Kind::If:
            {
                const auto &i = static_cast<const IfStmt &>(s);
                emit(label, "If", s.loc, depth);
                expr(*i.test, "test", depth + 1);
                stmts(i.body, "body", depth + 1);
                stmts(i.orelse, "orelse", depth + 1);
                break;
            }
        }
    }

    void expr(const Expr &e, const std::string &label, int depth)
    {
        switch (e.kind)
        {
            case Expr::Kind::Name:
            {
                const auto &n = static_cast<const NameExpr &>(e);
                emit(label,
                     "Name(id='" + n.id + "', ctx=" + ctxName(n.ctx) + ")",
                     e.loc,
                     depth);
                break;
            }
            case Expr::Kind::Constant:
                emit(label,
                     "Constant(value=" + static_cast<const ConstantExpr &>(e).value.repr() + ")",
                     e.loc,
                     depth);
                break;
            case Expr::Kind::BinOp:
            {
                const auto &b = static_cast<const BinOpExpr &>(e);
                emit(label, std::string("BinOp(op=") + binOpName(b.op) + ")", e.loc, depth);
                expr(*b.left, "left", depth + 1);
                expr(*b.right, "right", depth + 1);
                break;
            }
            case Expr::Kind::UnaryOp:
            {
                const auto &u = static_cast<const UnaryOpExpr &>(e);
                emit(label, std::string("UnaryOp(op=") + unaryOpName(u.op) + ")", e.loc, depth);
                expr(*u.operand, "operand", depth + 1);
                break;
            }
            case Expr::Kind::Compare:
            {
                const auto &c = static_cast<const CompareExpr &>(e);
                emit(label, std::string("Compare(op=") + cmpOpName(c.op) + ")", e.loc, depth);
                expr(*c.left, "left", depth + 1);
                expr(*c.right, "comparator", depth + 1);
                break;
            }
            case Expr::Kind::Call:
            {
                const auto &c = static_cast<const CallExpr &>(e);
                emit(label, "Call", e.loc, depth);
                expr(*c.func, "func", depth + 1);
                for (size_t i = 0; i < c.args.size(); ++i)
                    expr(*c.args[i], "args[" + std::to_string(i) + "]", depth + 1);
                break;
            }
            case Expr::Kind::Tuple:
            {
                const auto &t = static_cast<const TupleExpr &>(e);
                emit(label, std::string("Tuple(ctx=") + ctxName(t.ctx) + ")", e.loc, depth);
                for (size_t i = 0; i < t.elts.size(); ++i)
                    expr(*t.elts[i], "elts[" + std::to_string(i) + "]", depth + 1);
                break;
            }
        }
    }

  private:
    void emit(const std::string &label, const std::string &node, support::SourceLoc loc, int depth)
    {
        out_.push_back(ListingLine{std::string(static_cast<size_t>(depth) * 2, ' ') + label +
                                       ": " + node,
                                   loc.line});
    }

    Listing &out_;
};
} // namespace

Listing dumpAst(const Module &mod)
{
    Listing out;
    out.push_back(ListingLine{"Module", 0});
    AstDumper dumper(out);
    dumper.stmts(mod.body, "body", 1);
    return out;
}

} // namespace stagelens::lang
