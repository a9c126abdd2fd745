//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Value.hpp
// Purpose: Compile-time constant values shared by the AST and bytecode.
// Key invariants: Only the member matching @ref Value::kind is meaningful.
//                 Tuple elements are themselves constants.
// Ownership/Lifetime: Plain value type; tuples own their elements.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace stagelens::lang
{

/// @brief Constant known at compile time (literal or folded result).
struct Value
{
    enum class Kind : uint8_t
    {
        None,
        Bool,
        Int,
        Str,
        Tuple,
    };

    Kind kind = Kind::None;
    int64_t i = 0;            ///< Payload for Bool (0/1) and Int.
    std::string s;            ///< Payload for Str.
    std::vector<Value> elems; ///< Payload for Tuple.

    static Value none();
    static Value boolean(bool b);
    static Value integer(int64_t v);
    static Value string(std::string v);
    static Value tuple(std::vector<Value> v);

    /// @brief Python truthiness of the constant.
    [[nodiscard]] bool truthy() const;

    /// @brief Python-style repr: 1, 'text', True, None, (1, 2).
    [[nodiscard]] std::string repr() const;

    bool operator==(const Value &other) const;
    bool operator!=(const Value &other) const
    {
        return !(*this == other);
    }
};

} // namespace stagelens::lang
