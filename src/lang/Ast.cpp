//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Ast.cpp
// Purpose: Operator and context names used by the AST dump and disassembly.
// Key invariants: Names match Python's ast module spelling.
// Ownership/Lifetime: Returns string literals with static storage.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#include "lang/Ast.hpp"

namespace stagelens::lang
{

const char *ctxName(Ctx ctx)
{
    switch (ctx)
    {
        case Ctx::Load:
            return "Load";
        case Ctx::Store:
            return "Store";
        case Ctx::Del:
            return "Del";
    }
    return "?";
}

const char *binOpName(BinOp op)
{
    switch (op)
    {
        case BinOp::Add:
            return "Add";
        case BinOp::Sub:
            return "Sub";
        case BinOp::Mult:
            return "Mult";
        case BinOp::FloorDiv:
            return "FloorDiv";
        case BinOp::Mod:
            return "Mod";
    }
    return "?";
}

const char *binOpSymbol(BinOp op)
{
    switch (op)
    {
        case BinOp::Add:
            return "+";
        case BinOp::Sub:
            return "-";
        case BinOp::Mult:
            return "*";
        case BinOp::FloorDiv:
            return "//";
        case BinOp::Mod:
            return "%";
    }
    return "?";
}

const char *unaryOpName(UnaryOp op)
{
    return op == UnaryOp::USub ? "USub" : "Not";
}

const char *cmpOpName(CmpOp op)
{
    switch (op)
    {
        case CmpOp::Lt:
            return "Lt";
        case CmpOp::LtE:
            return "LtE";
        case CmpOp::Gt:
            return "Gt";
        case CmpOp::GtE:
            return "GtE";
        case CmpOp::Eq:
            return "Eq";
        case CmpOp::NotEq:
            return "NotEq";
    }
    return "?";
}

const char *cmpOpSymbol(CmpOp op)
{
    switch (op)
    {
        case CmpOp::Lt:
            return "<";
        case CmpOp::LtE:
            return "<=";
        case CmpOp::Gt:
            return ">";
        case CmpOp::GtE:
            return ">=";
        case CmpOp::Eq:
            return "==";
        case CmpOp::NotEq:
            return "!=";
    }
    return "?";
}

} // namespace stagelens::lang
