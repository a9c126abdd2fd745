//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/ConstFolder.cpp
// Purpose: Bottom-up constant folding over the Pylite AST.
// Key invariants: Integer arithmetic follows Python floor semantics; string
//                 repetition is capped so folding cannot blow up the constant
//                 pool.
// Ownership/Lifetime: See ConstFolder.hpp.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#include "lang/ConstFolder.hpp"

#include "support/diag_expected.hpp"

#include <cstdint>
#include <optional>
#include <utility>

namespace stagelens::lang
{
namespace
{
constexpr size_t kMaxFoldedLength = 4096;

const Value *constantOf(const ExprPtr &e)
{
    if (e && e->kind == Expr::Kind::Constant)
        return &static_cast<const ConstantExpr &>(*e).value;
    return nullptr;
}

bool isIntLike(const Value &v)
{
    return v.kind == Value::Kind::Int || v.kind == Value::Kind::Bool;
}

int64_t floorDiv(int64_t a, int64_t b)
{
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0)))
        --q;
    return q;
}

int64_t floorMod(int64_t a, int64_t b)
{
    int64_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0)))
        r += b;
    return r;
}

std::optional<Value> repeat(const Value &seq, int64_t count)
{
    if (count <= 0)
        return seq.kind == Value::Kind::Str ? Value::string("") : Value::tuple({});
    const size_t len = seq.kind == Value::Kind::Str ? seq.s.size() : seq.elems.size();
    if (len != 0 && static_cast<uint64_t>(count) > kMaxFoldedLength / len)
        return std::nullopt;
    if (seq.kind == Value::Kind::Str)
    {
        std::string out;
        for (int64_t n = 0; n < count; ++n)
            out += seq.s;
        return Value::string(std::move(out));
    }
    std::vector<Value> out;
    for (int64_t n = 0; n < count; ++n)
        out.insert(out.end(), seq.elems.begin(), seq.elems.end());
    return Value::tuple(std::move(out));
}

class Folder
{
  public:
    explicit Folder(support::DiagnosticEngine &diags) : diags_(diags) {}

    void stmts(StmtList &list)
    {
        for (auto &s : list)
            stmt(*s);
    }

    void stmt(Stmt &s)
    {
        switch (s.kind)
        {
            case Stmt::Kind::Assign:
                expr(static_cast<AssignStmt &>(s).value);
                break;
            case Stmt::Kind::Expr:
                expr(static_cast<ExprStmt &>(s).value);
                break;
            case Stmt::Kind::For:
            {
                auto &f = static_cast<ForStmt &>(s);
                expr(f.iter);
                stmts(f.body);
                break;
            }
            case Stmt::Kind::While:
            {
                auto &w = static_cast<WhileStmt &>(s);
                expr(w.test);
                stmts(w.body);
                break;
            }
            case Stmt::Kind::If:
            {
                auto &i = static_cast<IfStmt &>(s);
                expr(i.test);
                stmts(i.body);
                stmts(i.orelse);
                break;
            }
            case Stmt::Kind::Del:
            case Stmt::Kind::Pass:
            case Stmt::Kind::Break:
            case Stmt::Kind::Continue:
                break;
        }
    }

    void expr(ExprPtr &e)
    {
        std::optional<Value> folded;
        switch (e->kind)
        {
            case Expr::Kind::BinOp:
            {
                auto &b = static_cast<BinOpExpr &>(*e);
                expr(b.left);
                expr(b.right);
                folded = foldBinOp(b);
                break;
            }
            case Expr::Kind::UnaryOp:
            {
                auto &u = static_cast<UnaryOpExpr &>(*e);
                expr(u.operand);
                folded = foldUnary(u);
                break;
            }
            case Expr::Kind::Compare:
            {
                auto &c = static_cast<CompareExpr &>(*e);
                expr(c.left);
                expr(c.right);
                folded = foldCompare(c);
                break;
            }
            case Expr::Kind::Call:
            {
                auto &c = static_cast<CallExpr &>(*e);
                for (auto &arg : c.args)
                    expr(arg);
                break;
            }
            case Expr::Kind::Tuple:
            {
                auto &t = static_cast<TupleExpr &>(*e);
                if (t.ctx != Ctx::Load)
                    break;
                std::vector<Value> elems;
                bool allConst = true;
                for (auto &elt : t.elts)
                {
                    expr(elt);
                    if (const Value *v = constantOf(elt))
                        elems.push_back(*v);
                    else
                        allConst = false;
                }
                if (allConst)
                    folded = Value::tuple(std::move(elems));
                break;
            }
            case Expr::Kind::Name:
            case Expr::Kind::Constant:
                break;
        }

        if (folded)
        {
            auto c = std::make_unique<ConstantExpr>();
            c->loc = e->loc;
            c->value = std::move(*folded);
            e = std::move(c);
            ++count_;
        }
    }

    size_t count() const
    {
        return count_;
    }

  private:
    std::optional<Value> foldBinOp(const BinOpExpr &b)
    {
        const Value *l = constantOf(b.left);
        const Value *r = constantOf(b.right);
        if (!l || !r)
            return std::nullopt;

        if (isIntLike(*l) && isIntLike(*r))
        {
            int64_t out = 0;
            switch (b.op)
            {
                case BinOp::Add:
                    if (__builtin_add_overflow(l->i, r->i, &out))
                        return std::nullopt;
                    return Value::integer(out);
                case BinOp::Sub:
                    if (__builtin_sub_overflow(l->i, r->i, &out))
                        return std::nullopt;
                    return Value::integer(out);
                case BinOp::Mult:
                    if (__builtin_mul_overflow(l->i, r->i, &out))
                        return std::nullopt;
                    return Value::integer(out);
                case BinOp::FloorDiv:
                case BinOp::Mod:
                    if (r->i == 0)
                    {
                        diags_.report(support::makeWarning(
                            b.loc,
                            std::string("constant ") + binOpSymbol(b.op) +
                                " by zero left unfolded; it raises at runtime"));
                        return std::nullopt;
                    }
                    if (l->i == INT64_MIN && r->i == -1)
                        return std::nullopt;
                    return Value::integer(b.op == BinOp::FloorDiv ? floorDiv(l->i, r->i)
                                                                  : floorMod(l->i, r->i));
            }
        }

        const bool lSeq = l->kind == Value::Kind::Str || l->kind == Value::Kind::Tuple;
        const bool rSeq = r->kind == Value::Kind::Str || r->kind == Value::Kind::Tuple;
        if (b.op == BinOp::Add && lSeq && l->kind == r->kind)
        {
            if (l->kind == Value::Kind::Str)
            {
                if (l->s.size() + r->s.size() > kMaxFoldedLength)
                    return std::nullopt;
                return Value::string(l->s + r->s);
            }
            std::vector<Value> elems = l->elems;
            elems.insert(elems.end(), r->elems.begin(), r->elems.end());
            return Value::tuple(std::move(elems));
        }
        if (b.op == BinOp::Mult && lSeq && isIntLike(*r))
            return repeat(*l, r->i);
        if (b.op == BinOp::Mult && rSeq && isIntLike(*l))
            return repeat(*r, l->i);
        return std::nullopt;
    }

    std::optional<Value> foldUnary(const UnaryOpExpr &u)
    {
        const Value *v = constantOf(u.operand);
        if (!v)
            return std::nullopt;
        if (u.op == UnaryOp::Not)
            return Value::boolean(!v->truthy());
        if (!isIntLike(*v) || v->i == INT64_MIN)
            return std::nullopt;
        return Value::integer(-v->i);
    }

    std::optional<Value> foldCompare(const CompareExpr &c)
    {
        const Value *l = constantOf(c.left);
        const Value *r = constantOf(c.right);
        if (!l || !r)
            return std::nullopt;

        if (c.op == CmpOp::Eq || c.op == CmpOp::NotEq)
        {
            bool eq = (isIntLike(*l) && isIntLike(*r)) ? l->i == r->i : *l == *r;
            return Value::boolean(c.op == CmpOp::Eq ? eq : !eq);
        }

        int cmp = 0;
        if (isIntLike(*l) && isIntLike(*r))
            cmp = l->i < r->i ? -1 : (l->i > r->i ? 1 : 0);
        else if (l->kind == Value::Kind::Str && r->kind == Value::Kind::Str)
            cmp = l->s.compare(r->s);
        else
            return std::nullopt;

        switch (c.op)
        {
            case CmpOp::Lt:
                return Value::boolean(cmp < 0);
            case CmpOp::LtE:
                return Value::boolean(cmp <= 0);
            case CmpOp::Gt:
                return Value::boolean(cmp > 0);
            case CmpOp::GtE:
                return Value::boolean(cmp >= 0);
            default:
                break;
        }
        return std::nullopt;
    }

    support::DiagnosticEngine &diags_;
    size_t count_ = 0;
};
} // namespace

size_t foldConstants(Module &mod, support::DiagnosticEngine &diags)
{
    Folder folder(diags);
    folder.stmts(mod.body);
    return folder.count();
}

} // namespace stagelens::lang
