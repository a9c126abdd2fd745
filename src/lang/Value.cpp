//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Value.cpp
// Purpose: Constructors, truthiness, equality and repr for compile-time
//          constants.
// Key invariants: repr() matches Python's formatting for the supported kinds.
// Ownership/Lifetime: Value semantics only.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#include "lang/Value.hpp"

#include <utility>

namespace stagelens::lang
{

Value Value::none()
{
    return Value{};
}

Value Value::boolean(bool b)
{
    Value v;
    v.kind = Kind::Bool;
    v.i = b ? 1 : 0;
    return v;
}

Value Value::integer(int64_t n)
{
    Value v;
    v.kind = Kind::Int;
    v.i = n;
    return v;
}

Value Value::string(std::string text)
{
    Value v;
    v.kind = Kind::Str;
    v.s = std::move(text);
    return v;
}

Value Value::tuple(std::vector<Value> elems)
{
    Value v;
    v.kind = Kind::Tuple;
    v.elems = std::move(elems);
    return v;
}

bool Value::truthy() const
{
    switch (kind)
    {
        case Kind::None:
            return false;
        case Kind::Bool:
        case Kind::Int:
            return i != 0;
        case Kind::Str:
            return !s.empty();
        case Kind::Tuple:
            return !elems.empty();
    }
    return false;
}

namespace
{
std::string quote(const std::string &text)
{
    // Python prefers single quotes unless the text contains one and no double.
    const bool hasSingle = text.find('\'') != std::string::npos;
    const bool hasDouble = text.find('"') != std::string::npos;
    const char q = (hasSingle && !hasDouble) ? '"' : '\'';
    std::string out(1, q);
    for (char c : text)
    {
        switch (c)
        {
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\\':
                out += "\\\\";
                break;
            default:
                if (c == q)
                    out += '\\';
                out += c;
                break;
        }
    }
    out += q;
    return out;
}
} // namespace

std::string Value::repr() const
{
    switch (kind)
    {
        case Kind::None:
            return "None";
        case Kind::Bool:
            return i ? "True" : "False";
        case Kind::Int:
            return std::to_string(i);
        case Kind::Str:
            return quote(s);
        case Kind::Tuple:
        {
            std::string out = "(";
            for (size_t n = 0; n < elems.size(); ++n)
            {
                if (n)
                    out += ", ";
                out += elems[n].repr();
            }
            if (elems.size() == 1)
                out += ',';
            out += ')';
            return out;
        }
    }
    return "?";
}

bool Value::operator==(const Value &other) const
{
    if (kind != other.kind)
        return false;
    switch (kind)
    {
        case Kind::None:
            return true;
        case Kind::Bool:
        case Kind::Int:
            return i == other.i;
        case Kind::Str:
            return s == other.s;
        case Kind::Tuple:
            return elems == other.elems;
    }
    return false;
}

} // namespace stagelens::lang
