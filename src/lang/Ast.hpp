//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Ast.hpp
// Purpose: Abstract syntax tree for Pylite programs.
// Key invariants: Every node except the Module carries the location of its
//                 first token. Child pointers are never null once parsing
//                 succeeded.
// Ownership/Lifetime: Parents own children through unique_ptr; the Module
//                     owns the whole tree.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "lang/Value.hpp"
#include "support/source_loc.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace stagelens::lang
{

/// @brief Expression context, as in Python's ast module.
enum class Ctx : uint8_t
{
    Load,
    Store,
    Del,
};

enum class BinOp : uint8_t
{
    Add,
    Sub,
    Mult,
    FloorDiv,
    Mod,
};

enum class UnaryOp : uint8_t
{
    USub,
    Not,
};

enum class CmpOp : uint8_t
{
    Lt,
    LtE,
    Gt,
    GtE,
    Eq,
    NotEq,
};

const char *ctxName(Ctx ctx);
const char *binOpName(BinOp op);
const char *binOpSymbol(BinOp op);
const char *unaryOpName(UnaryOp op);
const char *cmpOpName(CmpOp op);
const char *cmpOpSymbol(CmpOp op);

struct Expr
{
    enum class Kind : uint8_t
    {
        Name,
        Constant,
        BinOp,
        UnaryOp,
        Compare,
        Call,
        Tuple,
    };

    explicit Expr(Kind k) : kind(k) {}
    virtual ~Expr() = default;

    Kind kind;
    support::SourceLoc loc;
};

using ExprPtr = std::unique_ptr<Expr>;

struct NameExpr : Expr
{
    NameExpr() : Expr(Kind::Name) {}
    std::string id;
    Ctx ctx = Ctx::Load;
};

struct ConstantExpr : Expr
{
    ConstantExpr() : Expr(Kind::Constant) {}
    Value value;
};

struct BinOpExpr : Expr
{
    BinOpExpr() : Expr(Kind::BinOp) {}
    BinOp op = BinOp::Add;
    ExprPtr left;
    ExprPtr right;
};

struct UnaryOpExpr : Expr
{
    UnaryOpExpr() : Expr(Kind::UnaryOp) {}
    UnaryOp op = UnaryOp::USub;
    ExprPtr operand;
};

struct CompareExpr : Expr
{
    CompareExpr() : Expr(Kind::Compare) {}
    CmpOp op = CmpOp::Lt;
    ExprPtr left;
    ExprPtr right;
};

struct CallExpr : Expr
{
    CallExpr() : Expr(Kind::Call) {}
    ExprPtr func;
    std::vector<ExprPtr> args;
};

struct TupleExpr : Expr
{
    TupleExpr() : Expr(Kind::Tuple) {}
    std::vector<ExprPtr> elts;
    Ctx ctx = Ctx::Load;
};

struct Stmt
{
    enum class Kind : uint8_t
    {
        Assign,
        Expr,
        Del,
        Pass,
        Break,
        Continue,
        For,
        While,
        If,
    };

    explicit Stmt(Kind k) : kind(k) {}
    virtual ~Stmt() = default;

    Kind kind;
    support::SourceLoc loc;
};

using StmtPtr = std::unique_ptr<Stmt>;
using StmtList = std::vector<StmtPtr>;

/// @brief `t1 = t2 = value`; each target is a Name or a Tuple of Names.
struct AssignStmt : Stmt
{
    AssignStmt() : Stmt(Kind::Assign) {}
    std::vector<ExprPtr> targets;
    ExprPtr value;
};

struct ExprStmt : Stmt
{
    ExprStmt() : Stmt(Kind::Expr) {}
    ExprPtr value;
};

struct DelStmt : Stmt
{
    DelStmt() : Stmt(Kind::Del) {}
    std::vector<ExprPtr> targets;
};

struct PassStmt : Stmt
{
    PassStmt() : Stmt(Kind::Pass) {}
};

struct BreakStmt : Stmt
{
    BreakStmt() : Stmt(Kind::Break) {}
};

struct ContinueStmt : Stmt
{
    ContinueStmt() : Stmt(Kind::Continue) {}
};

struct ForStmt : Stmt
{
    ForStmt() : Stmt(Kind::For) {}
    ExprPtr target;
    ExprPtr iter;
    StmtList body;
};

struct WhileStmt : Stmt
{
    WhileStmt() : Stmt(Kind::While) {}
    ExprPtr test;
    StmtList body;
};

/// @brief `if`/`elif`/`else`; an elif chain nests an IfStmt in @ref orelse.
struct IfStmt : Stmt
{
    IfStmt() : Stmt(Kind::If) {}
    ExprPtr test;
    StmtList body;
    StmtList orelse;
};

struct Module
{
    StmtList body;
};

} // namespace stagelens::lang
