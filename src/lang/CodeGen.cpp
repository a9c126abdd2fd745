//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/CodeGen.cpp
// Purpose: AST to pseudo bytecode lowering.
// Key invariants: Loop labels are tracked on a stack so break/continue always
//                 resolve to the innermost enclosing loop.
// Ownership/Lifetime: Generator state lives only for one generatePseudo call.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#include "lang/CodeGen.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace stagelens::lang
{
namespace
{
struct LoopLabels
{
    int32_t start = -1;
    int32_t after = -1;
    bool isFor = false;
};

class Generator
{
  public:
    support::Expected<PseudoCode> run(const Module &mod)
    {
        stmts(mod.body);
        if (error_)
            return *error_;
        // Module epilogue.
        emit(Opcode::LOAD_CONST, pc_.addConst(Value::none()), 0);
        emit(Opcode::RETURN_VALUE, 0, 0);
        return std::move(pc_);
    }

  private:
    int32_t newLabel()
    {
        return pc_.labelCount++;
    }

    void emit(Opcode op, int32_t arg, uint32_t line)
    {
        pc_.code.push_back(Instr{op, arg, -1, line});
    }

    void emitJump(Opcode op, int32_t label, uint32_t line)
    {
        pc_.code.push_back(Instr{op, 0, label, line});
    }

    void placeLabel(int32_t label)
    {
        pc_.code.push_back(Instr{Opcode::LABEL, 0, label, 0});
    }

    void fail(support::SourceLoc loc, std::string msg)
    {
        if (!error_)
            error_ = support::makeError(loc, std::move(msg));
    }

    void stmts(const StmtList &list)
    {
        for (const auto &s : list)
            stmt(*s);
    }

    void stmt(const Stmt &s)
    {
        const uint32_t line = s.loc.line;
        switch (s.kind)
        {
            case Stmt::Kind::Assign:
            {
                const auto &a = static_cast<const AssignStmt &>(s);
                expr(*a.value);
                for (size_t i = 0; i < a.targets.size(); ++i)
                {
                    if (i + 1 < a.targets.size())
                        emit(Opcode::COPY, 1, line);
                    store(*a.targets[i]);
                }
                break;
            }
            case Stmt::Kind::Expr:
                expr(*static_cast<const ExprStmt &>(s).value);
                emit(Opcode::POP_TOP, 0, line);
                break;
            case Stmt::Kind::Del:
                for (const auto &t : static_cast<const DelStmt &>(s).targets)
                    del(*t);
                break;
            case Stmt::Kind::Pass:
                emit(Opcode::NOP, 0, line);
                break;
            case Stmt::Kind::Break:
                if (loops_.empty())
                {
                    fail(s.loc, "'break' outside loop");
                    break;
                }
                if (loops_.back().isFor)
                    emit(Opcode::POP_TOP, 0, line);
                emitJump(Opcode::JUMP, loops_.back().after, line);
                break;
            case Stmt::Kind::Continue:
                if (loops_.empty())
                {
                    fail(s.loc, "'continue' not properly in loop");
                    break;
                }
                emitJump(Opcode::JUMP, loops_.back().start, line);
                break;
            case Stmt::Kind::For:
                forStmt(static_cast<const ForStmt &>(s));
                break;
            case Stmt::Kind::While:
                whileStmt(static_cast<const WhileStmt &>(s));
                break;
            case Stmt::Kind::If:
                ifStmt(static_cast<const IfStmt &>(s));
                break;
        }
    }

    void forStmt(const ForStmt &f)
    {
        const uint32_t line = f.loc.line;
        const int32_t start = newLabel();
        const int32_t exhausted = newLabel();
        const int32_t after = newLabel();

        expr(*f.iter);
        emit(Opcode::GET_ITER, 0, line);
        placeLabel(start);
        emitJump(Opcode::FOR_ITER, exhausted, line);
        store(*f.target);

        loops_.push_back(LoopLabels{start, after, true});
        stmts(f.body);
        loops_.pop_back();

        emitJump(Opcode::JUMP, start, line);
        placeLabel(exhausted);
        emit(Opcode::END_FOR, 0, line);
        placeLabel(after);
    }

    void whileStmt(const WhileStmt &w)
    {
        const int32_t start = newLabel();
        const int32_t after = newLabel();

        placeLabel(start);
        jumpIfFalse(*w.test, after);

        loops_.push_back(LoopLabels{start, after, false});
        stmts(w.body);
        loops_.pop_back();

        emitJump(Opcode::JUMP, start, w.loc.line);
        placeLabel(after);
    }

    void ifStmt(const IfStmt &i)
    {
        const int32_t elseLabel = newLabel();
        jumpIfFalse(*i.test, elseLabel);
        stmts(i.body);
        if (i.orelse.empty())
        {
            placeLabel(elseLabel);
            return;
        }
        const int32_t end = newLabel();
        emitJump(Opcode::JUMP, end, i.loc.line);
        placeLabel(elseLabel);
        stmts(i.orelse);
        placeLabel(end);
    }

    /// Evaluate @p test and jump to @p label when it is falsy; `not x` is
    /// lowered by flipping the jump sense.
    void jumpIfFalse(const Expr &test, int32_t label)
    {
        if (test.kind == Expr::Kind::UnaryOp)
        {
            const auto &u = static_cast<const UnaryOpExpr &>(test);
            if (u.op == UnaryOp::Not)
            {
                expr(*u.operand);
                emitJump(Opcode::POP_JUMP_IF_TRUE, label, test.loc.line);
                return;
            }
        }
        expr(test);
        emitJump(Opcode::POP_JUMP_IF_FALSE, label, test.loc.line);
    }

    void store(const Expr &target)
    {
        const uint32_t line = target.loc.line;
        if (target.kind == Expr::Kind::Tuple)
        {
            const auto &t = static_cast<const TupleExpr &>(target);
            emit(Opcode::UNPACK_SEQUENCE, static_cast<int32_t>(t.elts.size()), line);
            for (const auto &e : t.elts)
                store(*e);
            return;
        }
        const auto &n = static_cast<const NameExpr &>(target);
        emit(Opcode::STORE_NAME, pc_.addName(n.id), line);
    }

    void del(const Expr &target)
    {
        if (target.kind == Expr::Kind::Tuple)
        {
            for (const auto &e : static_cast<const TupleExpr &>(target).elts)
                del(*e);
            return;
        }
        const auto &n = static_cast<const NameExpr &>(target);
        emit(Opcode::DELETE_NAME, pc_.addName(n.id), target.loc.line);
    }

    void expr(const Expr &e)
    {
        const uint32_t line = e.loc.line;
        switch (e.kind)
        {
            case Expr::Kind::Name:
                emit(Opcode::LOAD_NAME, pc_.addName(static_cast<const NameExpr &>(e).id), line);
                break;
            case Expr::Kind::Constant:
                emit(Opcode::LOAD_CONST,
                     pc_.addConst(static_cast<const ConstantExpr &>(e).value),
                     line);
                break;
            case Expr::Kind::BinOp:
            {
                const auto &b = static_cast<const BinOpExpr &>(e);
                expr(*b.left);
                expr(*b.right);
                emit(Opcode::BINARY_OP, static_cast<int32_t>(b.op), line);
                break;
            }
            case Expr::Kind::UnaryOp:
            {
                const auto &u = static_cast<const UnaryOpExpr &>(e);
                expr(*u.operand);
                emit(u.op == UnaryOp::USub ? Opcode::UNARY_NEGATIVE : Opcode::UNARY_NOT, 0, line);
                break;
            }
            case Expr::Kind::Compare:
            {
                const auto &c = static_cast<const CompareExpr &>(e);
                expr(*c.left);
                expr(*c.right);
                emit(Opcode::COMPARE_OP, static_cast<int32_t>(c.op), line);
                break;
            }
            case Expr::Kind::Call:
            {
                const auto &c = static_cast<const CallExpr &>(e);
                expr(*c.func);
                emit(Opcode::PUSH_NULL, 0, line);
                for (const auto &a : c.args)
                    expr(*a);
                emit(Opcode::CALL, static_cast<int32_t>(c.args.size()), line);
                break;
            }
            case Expr::Kind::Tuple:
            {
                const auto &t = static_cast<const TupleExpr &>(e);
                for (const auto &el : t.elts)
                    expr(*el);
                emit(Opcode::BUILD_TUPLE, static_cast<int32_t>(t.elts.size()), line);
                break;
            }
        }
    }

    PseudoCode pc_;
    std::vector<LoopLabels> loops_;
    std::optional<support::Diag> error_;
};
} // namespace

support::Expected<PseudoCode> generatePseudo(const Module &mod)
{
    Generator gen;
    return gen.run(mod);
}

} // namespace stagelens::lang
