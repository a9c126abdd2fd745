//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides diagnostic helpers and a lightweight Expected container.
// Key invariants: An Expected holds exactly one of a value or an error.
// Ownership/Lifetime: Expected owns its value or error payload.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace stagelens::support
{
using Diag = Diagnostic;

/// @brief Expected-style container pairing a value with an error payload.
/// @tparam T Stored value type when the operation succeeds.
/// @tparam E Error payload; diagnostics unless a layer defines its own.
/// @note Mirrors a subset of std::expected until the standard type becomes
///       universally available on our toolchain.
template <class T, class E = Diag> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Enabled only when the provided value does not decay to the
    ///          error type to avoid colliding with the error constructor.
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, E>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return value_.has_value();
    }

    /// @brief Access the stored value; requires a successful result.
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires a successful result.
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the error describing the failure.
    const E &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<E> error_;
};

/// @brief Expected specialization for void success type.
template <class E> class Expected<void, E>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return !error_.has_value();
    }

    /// @brief Access the error describing the failure.
    const E &error() const &
    {
        return *error_;
    }

  private:
    std::optional<E> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic with location and message.
Diag makeError(SourceLoc loc, std::string msg);

/// @brief Create a warning diagnostic with location and message.
Diag makeWarning(SourceLoc loc, std::string msg);

/// @brief Print a single diagnostic to the provided stream.
/// @param diag Diagnostic to format.
/// @param os Output stream receiving the text.
/// @param inputName Name printed in place of a file path.
/// @note Format is `name:line:col: severity: message`; the location prefix is
///       omitted when the diagnostic carries no line.
void printDiag(const Diag &diag, std::ostream &os, const std::string &inputName = "<input>");
} // namespace stagelens::support
