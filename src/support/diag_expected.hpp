//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/diag_expected.hpp
// Purpose: Expected<T> for fallible loaders and the diagnostic printer.
// Key invariants: An Expected holds exactly one of a value or a diagnostic.
// Ownership/Lifetime: Expected owns its value or diagnostic.
// Links: support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace apicheck::support
{
using Diag = Diagnostic;

/// @brief Result of an operation that fails with a single Diag.
/// @details Catalog loading, class-file reading and layout parsing return
///          one of these; callers test it like a pointer and either take the
///          value or forward the diagnostic.
template <class T> class Expected
{
  public:
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : state_(std::in_place_index<0>, std::forward<U>(value))
    {
    }

    Expected(Diag diag) : state_(std::in_place_index<1>, std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return state_.index() == 0;
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @pre hasValue()
    T &value()
    {
        return std::get<0>(state_);
    }

    const T &value() const
    {
        return std::get<0>(state_);
    }

    /// @pre !hasValue()
    const Diag &error() const &
    {
        return std::get<1>(state_);
    }

    Diag takeError() &&
    {
        return std::get<1>(std::move(state_));
    }

  private:
    std::variant<T, Diag> state_;
};

/// @brief Success-or-diagnostic for steps that produce nothing.
template <> class Expected<void>
{
  public:
    Expected() = default;

    Expected(Diag diag) : error_(std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return !error_;
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    const Diag &error() const &
    {
        return *error_;
    }

    Diag takeError() &&
    {
        return std::move(*error_);
    }

  private:
    std::optional<Diag> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic with location and message.
Diag makeError(SourceLoc loc, std::string msg);

/// @brief Create a classified error diagnostic for the artifact at @p path.
/// @param code Failure class (catalog load, unit parse, usage).
/// @param path Path of the catalog, class file, or layout that failed.
/// @param msg Human-readable description of the failure.
Diag makeError(DiagCode code, std::string path, std::string msg);

/// @brief Print a single diagnostic to the provided stream.
/// @details Format: `<path>[:<line>]: <severity>: [<code>: ]<message>`.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm = nullptr);
} // namespace apicheck::support
