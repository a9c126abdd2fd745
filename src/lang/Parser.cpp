//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Parser.cpp
// Purpose: Implement the Pylite recursive-descent parser.
// Key invariants: Every parse function returns nullptr after fail() and the
//                 caller propagates it without consuming further tokens.
// Ownership/Lifetime: See Parser.hpp.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#include "lang/Parser.hpp"

#include "lang/Lexer.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <utility>

namespace stagelens::lang
{
namespace
{
constexpr unsigned kMaxExprDepth = 256;
constexpr unsigned kMaxIfDepth = 1000;

struct DepthGuard
{
    unsigned &d;

    ~DepthGuard()
    {
        --d;
    }
};

constexpr std::array<std::string_view, 19> kKeywords = {
    "and",  "break", "class", "continue", "def", "del",    "elif",  "else", "for",   "if",
    "in",   "not",   "or",    "pass",     "return", "while", "True", "False", "None",
};

/// @brief Decode the escapes of a quoted literal (quotes included in @p raw).
std::string decodeString(const std::string &raw)
{
    std::string out;
    for (size_t i = 1; i + 1 < raw.size(); ++i)
    {
        char c = raw[i];
        if (c != '\\' || i + 2 >= raw.size())
        {
            out += c;
            continue;
        }
        char n = raw[++i];
        switch (n)
        {
            case 'n':
                out += '\n';
                break;
            case 't':
                out += '\t';
                break;
            case '0':
                out += '\0';
                break;
            case '\\':
            case '\'':
            case '"':
                out += n;
                break;
            default:
                out += '\\';
                out += n;
                break;
        }
    }
    return out;
}
} // namespace

bool isKeyword(std::string_view word)
{
    return std::find(kKeywords.begin(), kKeywords.end(), word) != kKeywords.end();
}

Parser::Parser(std::vector<Token> tokens)
{
    toks_.reserve(tokens.size());
    for (auto &t : tokens)
    {
        if (t.kind != TokenKind::Comment)
            toks_.push_back(std::move(t));
    }
    if (toks_.empty() || toks_.back().kind != TokenKind::EndMarker)
        toks_.push_back(Token{});
}

const Token &Parser::peek(size_t ahead) const
{
    const size_t idx = std::min(pos_ + ahead, toks_.size() - 1);
    return toks_[idx];
}

const Token &Parser::advance()
{
    const Token &t = toks_[pos_];
    if (pos_ + 1 < toks_.size())
        ++pos_;
    return t;
}

bool Parser::atOp(const char *op) const
{
    return peek().isOp(op);
}

bool Parser::atKeyword(const char *word) const
{
    return peek().isName(word);
}

bool Parser::acceptOp(const char *op)
{
    if (!atOp(op))
        return false;
    advance();
    return true;
}

bool Parser::expectOp(const char *op)
{
    if (acceptOp(op))
        return true;
    fail(peek().start, std::string("expected '") + op + "'");
    return false;
}

bool Parser::expectKind(TokenKind kind, const char *what)
{
    if (peek().kind == kind)
    {
        advance();
        return true;
    }
    fail(peek().start, std::string("expected ") + what);
    return false;
}

void Parser::fail(support::SourceLoc loc, std::string message)
{
    if (!error_)
        error_ = support::makeError(loc, std::move(message));
}

bool Parser::enterExpr()
{
    if (++exprDepth_ > kMaxExprDepth)
    {
        --exprDepth_;
        fail(peek().start, "expression nesting too deep (limit: 256)");
        return false;
    }
    return true;
}

void Parser::failHere()
{
    const Token &t = peek();
    if (t.kind == TokenKind::EndMarker || t.kind == TokenKind::Newline)
        fail(t.start, "invalid syntax: unexpected end of line");
    else if (t.kind == TokenKind::Indent)
        fail(t.end, "unexpected indent");
    else
        fail(t.start, "invalid syntax near '" + t.text + "'");
}

/// @brief Parse statements until ENDMARKER.
support::Expected<Module> Parser::parseModule()
{
    Module mod;
    while (peek().kind != TokenKind::EndMarker)
    {
        if (peek().kind == TokenKind::Newline)
        {
            advance();
            continue;
        }
        StmtPtr s = parseStatement();
        if (!s)
            break;
        mod.body.push_back(std::move(s));
    }
    if (error_)
        return *error_;
    return mod;
}

StmtPtr Parser::parseStatement()
{
    if (atKeyword("for"))
        return parseFor();
    if (atKeyword("while"))
        return parseWhile();
    if (atKeyword("if"))
        return parseIf();
    if (peek().kind == TokenKind::Indent || peek().kind == TokenKind::Dedent)
    {
        failHere();
        return nullptr;
    }

    StmtPtr s = parseSimpleStatement();
    if (!s)
        return nullptr;
    if (!expectKind(TokenKind::Newline, "end of statement"))
        return nullptr;
    return s;
}

StmtPtr Parser::parseSimpleStatement()
{
    const Token &first = peek();
    const support::SourceLoc loc = first.start;

    if (first.isName("pass") || first.isName("break") || first.isName("continue"))
    {
        StmtPtr s;
        if (first.isName("pass"))
            s = std::make_unique<PassStmt>();
        else if (first.isName("break"))
            s = std::make_unique<BreakStmt>();
        else
            s = std::make_unique<ContinueStmt>();
        s->loc = loc;
        advance();
        return s;
    }

    if (first.isName("del"))
    {
        advance();
        auto del = std::make_unique<DelStmt>();
        del->loc = loc;
        do
        {
            const Token &t = peek();
            if (t.kind != TokenKind::Name || isKeyword(t.text))
            {
                fail(t.start, "cannot delete this expression");
                return nullptr;
            }
            auto name = std::make_unique<NameExpr>();
            name->loc = t.start;
            name->id = t.text;
            name->ctx = Ctx::Del;
            advance();
            del->targets.push_back(std::move(name));
        } while (acceptOp(","));
        return del;
    }

    ExprPtr e = parseExprList();
    if (!e)
        return nullptr;
    if (!atOp("="))
    {
        auto stmt = std::make_unique<ExprStmt>();
        stmt->loc = loc;
        stmt->value = std::move(e);
        return stmt;
    }

    auto assign = std::make_unique<AssignStmt>();
    assign->loc = loc;
    while (acceptOp("="))
    {
        if (!markStoreTarget(*e))
            return nullptr;
        assign->targets.push_back(std::move(e));
        e = parseExprList();
        if (!e)
            return nullptr;
    }
    assign->value = std::move(e);
    return assign;
}

bool Parser::markStoreTarget(Expr &e)
{
    if (e.kind == Expr::Kind::Name)
    {
        static_cast<NameExpr &>(e).ctx = Ctx::Store;
        return true;
    }
    if (e.kind == Expr::Kind::Tuple)
    {
        auto &tuple = static_cast<TupleExpr &>(e);
        if (tuple.elts.empty())
        {
            fail(e.loc, "cannot assign to ()");
            return false;
        }
        for (auto &elt : tuple.elts)
        {
            if (elt->kind != Expr::Kind::Name)
            {
                fail(elt->loc, "cannot assign to expression");
                return false;
            }
            static_cast<NameExpr &>(*elt).ctx = Ctx::Store;
        }
        tuple.ctx = Ctx::Store;
        return true;
    }
    if (e.kind == Expr::Kind::Constant)
        fail(e.loc, "cannot assign to literal");
    else if (e.kind == Expr::Kind::Call)
        fail(e.loc, "cannot assign to function call");
    else
        fail(e.loc, "cannot assign to expression");
    return false;
}

StmtPtr Parser::parseFor()
{
    auto stmt = std::make_unique<ForStmt>();
    stmt->loc = advance().start;

    // Targets stop at 'in', so parse a bare name list rather than expressions.
    std::vector<ExprPtr> names;
    do
    {
        const Token &t = peek();
        if (t.kind != TokenKind::Name || isKeyword(t.text))
        {
            failHere();
            return nullptr;
        }
        auto name = std::make_unique<NameExpr>();
        name->loc = t.start;
        name->id = t.text;
        name->ctx = Ctx::Store;
        advance();
        names.push_back(std::move(name));
    } while (acceptOp(","));

    if (names.size() == 1)
    {
        stmt->target = std::move(names.front());
    }
    else
    {
        auto tuple = std::make_unique<TupleExpr>();
        tuple->loc = names.front()->loc;
        tuple->ctx = Ctx::Store;
        tuple->elts = std::move(names);
        stmt->target = std::move(tuple);
    }

    if (!atKeyword("in"))
    {
        fail(peek().start, "expected 'in'");
        return nullptr;
    }
    advance();
    stmt->iter = parseExprList();
    if (!stmt->iter || !parseBlock(stmt->body))
        return nullptr;
    return stmt;
}

StmtPtr Parser::parseWhile()
{
    auto stmt = std::make_unique<WhileStmt>();
    stmt->loc = advance().start;
    stmt->test = parseExpr();
    if (!stmt->test || !parseBlock(stmt->body))
        return nullptr;
    return stmt;
}

StmtPtr Parser::parseIf()
{
    // Each elif nests one IfStmt deeper in the orelse chain.
    if (++ifDepth_ > kMaxIfDepth)
    {
        --ifDepth_;
        fail(peek().start, "statement nesting too deep (limit: 1000)");
        return nullptr;
    }
    DepthGuard guard{ifDepth_};

    auto stmt = std::make_unique<IfStmt>();
    stmt->loc = advance().start;
    stmt->test = parseExpr();
    if (!stmt->test || !parseBlock(stmt->body))
        return nullptr;

    if (atKeyword("elif"))
    {
        StmtPtr nested = parseIf();
        if (!nested)
            return nullptr;
        stmt->orelse.push_back(std::move(nested));
    }
    else if (atKeyword("else"))
    {
        advance();
        if (!parseBlock(stmt->orelse))
            return nullptr;
    }
    return stmt;
}

/// @brief Parse `: NEWLINE INDENT stmts DEDENT` or `: simple_stmt NEWLINE`.
bool Parser::parseBlock(StmtList &out)
{
    if (!expectOp(":"))
        return false;

    if (peek().kind != TokenKind::Newline)
    {
        StmtPtr s = parseSimpleStatement();
        if (!s || !expectKind(TokenKind::Newline, "end of statement"))
            return false;
        out.push_back(std::move(s));
        return true;
    }
    advance();
    if (peek().kind != TokenKind::Indent)
    {
        fail(peek().start, "expected an indented block");
        return false;
    }
    advance();
    while (peek().kind != TokenKind::Dedent && peek().kind != TokenKind::EndMarker)
    {
        StmtPtr s = parseStatement();
        if (!s)
            return false;
        out.push_back(std::move(s));
    }
    if (peek().kind == TokenKind::Dedent)
        advance();
    return true;
}

/// @brief Parse `expr (',' expr)* [',']`, producing a Tuple when a comma occurs.
ExprPtr Parser::parseExprList()
{
    ExprPtr first = parseExpr();
    if (!first || !atOp(","))
        return first;

    auto tuple = std::make_unique<TupleExpr>();
    tuple->loc = first->loc;
    tuple->elts.push_back(std::move(first));
    while (acceptOp(","))
    {
        const Token &t = peek();
        if (t.kind == TokenKind::Newline || t.isOp("=") || t.isOp(")") || t.isOp(":"))
            break;
        ExprPtr next = parseExpr();
        if (!next)
            return nullptr;
        tuple->elts.push_back(std::move(next));
    }
    return tuple;
}

ExprPtr Parser::parseExpr()
{
    if (atKeyword("not"))
    {
        if (!enterExpr())
            return nullptr;
        DepthGuard guard{exprDepth_};
        auto un = std::make_unique<UnaryOpExpr>();
        un->loc = advance().start;
        un->op = UnaryOp::Not;
        un->operand = parseExpr();
        if (!un->operand)
            return nullptr;
        return un;
    }
    return parseComparison();
}

ExprPtr Parser::parseComparison()
{
    ExprPtr left = parseSum();
    if (!left)
        return nullptr;

    static constexpr std::pair<const char *, CmpOp> kOps[] = {
        {"<", CmpOp::Lt},
        {"<=", CmpOp::LtE},
        {">", CmpOp::Gt},
        {">=", CmpOp::GtE},
        {"==", CmpOp::Eq},
        {"!=", CmpOp::NotEq},
    };
    for (const auto &[sym, op] : kOps)
    {
        if (!atOp(sym))
            continue;
        advance();
        auto cmp = std::make_unique<CompareExpr>();
        cmp->loc = left->loc;
        cmp->op = op;
        cmp->left = std::move(left);
        cmp->right = parseSum();
        if (!cmp->right)
            return nullptr;
        for (const auto &entry : kOps)
        {
            if (atOp(entry.first))
            {
                fail(peek().start, "chained comparisons are not supported");
                return nullptr;
            }
        }
        return cmp;
    }
    return left;
}

ExprPtr Parser::parseSum()
{
    ExprPtr left = parseTerm();
    while (left && (atOp("+") || atOp("-")))
    {
        auto bin = std::make_unique<BinOpExpr>();
        bin->loc = left->loc;
        bin->op = advance().text == "+" ? BinOp::Add : BinOp::Sub;
        bin->left = std::move(left);
        bin->right = parseTerm();
        if (!bin->right)
            return nullptr;
        left = std::move(bin);
    }
    return left;
}

ExprPtr Parser::parseTerm()
{
    ExprPtr left = parseFactor();
    while (left)
    {
        BinOp op;
        if (atOp("*"))
            op = BinOp::Mult;
        else if (atOp("//"))
            op = BinOp::FloorDiv;
        else if (atOp("%"))
            op = BinOp::Mod;
        else if (atOp("/"))
        {
            fail(peek().start, "true division is not supported; use '//'");
            return nullptr;
        }
        else if (atOp("**"))
        {
            fail(peek().start, "'**' is not supported");
            return nullptr;
        }
        else
            break;
        advance();
        auto bin = std::make_unique<BinOpExpr>();
        bin->loc = left->loc;
        bin->op = op;
        bin->left = std::move(left);
        bin->right = parseFactor();
        if (!bin->right)
            return nullptr;
        left = std::move(bin);
    }
    return left;
}

ExprPtr Parser::parseFactor()
{
    if (!enterExpr())
        return nullptr;
    DepthGuard guard{exprDepth_};

    if (atOp("-"))
    {
        auto un = std::make_unique<UnaryOpExpr>();
        un->loc = advance().start;
        un->op = UnaryOp::USub;
        un->operand = parseFactor();
        if (!un->operand)
            return nullptr;
        return un;
    }
    if (atOp("+"))
    {
        advance();
        return parseFactor();
    }
    return parsePostfix();
}

ExprPtr Parser::parsePostfix()
{
    ExprPtr e = parsePrimary();
    while (e && atOp("("))
    {
        advance();
        auto call = std::make_unique<CallExpr>();
        call->loc = e->loc;
        call->func = std::move(e);
        while (!atOp(")"))
        {
            ExprPtr arg = parseExpr();
            if (!arg)
                return nullptr;
            call->args.push_back(std::move(arg));
            if (!acceptOp(","))
                break;
        }
        if (!expectOp(")"))
            return nullptr;
        e = std::move(call);
    }
    return e;
}

ExprPtr Parser::parsePrimary()
{
    const Token &t = peek();
    switch (t.kind)
    {
        case TokenKind::Name:
        {
            if (t.text == "True" || t.text == "False" || t.text == "None")
            {
                auto c = std::make_unique<ConstantExpr>();
                c->loc = t.start;
                c->value = t.text == "None" ? Value::none() : Value::boolean(t.text == "True");
                advance();
                return c;
            }
            if (isKeyword(t.text))
            {
                failHere();
                return nullptr;
            }
            auto n = std::make_unique<NameExpr>();
            n->loc = t.start;
            n->id = t.text;
            advance();
            return n;
        }
        case TokenKind::Number:
        {
            std::string digits;
            for (char ch : t.text)
            {
                if (ch != '_')
                    digits += ch;
            }
            int64_t v = 0;
            auto res = std::from_chars(digits.data(), digits.data() + digits.size(), v);
            if (res.ec != std::errc() || res.ptr != digits.data() + digits.size())
            {
                fail(t.start, "integer literal too large");
                return nullptr;
            }
            auto c = std::make_unique<ConstantExpr>();
            c->loc = t.start;
            c->value = Value::integer(v);
            advance();
            return c;
        }
        case TokenKind::String:
        {
            auto c = std::make_unique<ConstantExpr>();
            c->loc = t.start;
            std::string text;
            while (peek().kind == TokenKind::String)
                text += decodeString(advance().text);
            c->value = Value::string(std::move(text));
            return c;
        }
        case TokenKind::Op:
        {
            if (t.text != "(")
                break;
            const support::SourceLoc open = advance().start;
            if (acceptOp(")"))
            {
                auto tuple = std::make_unique<TupleExpr>();
                tuple->loc = open;
                return tuple;
            }
            ExprPtr inner = parseExprList();
            if (!inner || !expectOp(")"))
                return nullptr;
            return inner;
        }
        default:
            break;
    }
    failHere();
    return nullptr;
}

support::Expected<Module> parse(std::string_view src)
{
    auto toks = tokenize(src);
    if (!toks)
        return toks.error();
    Parser parser(std::move(toks.value()));
    return parser.parseModule();
}

} // namespace stagelens::lang
