#pragma once


/*
    ---------------------------------------------------------
    Stanza::IncludeError - Structured include failure report
    ---------------------------------------------------------
    `Stanza::IncludeError` describes why an include strategy gave up on an
    include directive instead of resolving it or deferring to a fallback

    ------
    Fields
    ------
    - `code errc`:
        * Enumerated error code describing failure category:
            - `invalid_name`
            - `not_found`
            - `io_error`
            - `rejected`
    - `std::string name`:
        * The include name exactly as it appeared in the directive
    - `std::string msg`:
        * Human-readable description of the error
        * Intended for debugging and logging; not stable for programmatic use

    -----
    Usage
    -----
    - Strategies return `IncludeResult`, an alias for
      `std::expected<std::optional<Included>, IncludeError>` (see includer.hpp)
    - Returning an error stops the strategy chain: a fallback strategy is only
      consulted when the primary defers, never when it fails

    This header defines the error reporting structure and its error code
    enum; it does not contain any resolution logic
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "stanza/config.hpp"


/// @defgroup StanzaError Include Errors
/// @ingroup Stanza
/// @brief Error codes and structures produced by include strategies
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Structured error information produced while resolving an include.
    ///
    /// @details
    /// An `IncludeError` is returned by `Includer::include(...)` when a
    /// strategy recognizes an include directive as its own but cannot satisfy
    /// it. Each error contains:
    ///
    /// - **errc** - classification of the failure
    /// - **name** - the include name being resolved
    /// - **msg** - human-readable explanation
    struct IncludeError {
        /// @ingroup StanzaError
        /// @brief Enumeration of include failure categories.
        ///
        /// Members:
        /// - `invalid_name`
        ///     The include name is empty or malformed for this strategy.
        ///
        /// - `not_found`
        ///     No strategy in the chain handled the include. Produced by
        ///     `resolve_include(...)` when the whole chain defers.
        ///
        /// - `io_error`
        ///     The strategy located the source but could not read it.
        ///
        /// - `rejected`
        ///     The strategy refuses the include (policy, sandboxing, ...).
        enum class code : uint8_t {
            invalid_name, ///< Empty or malformed include name.
            not_found,    ///< Nothing in the chain resolved the include.
            io_error,     ///< Source located but unreadable.
            rejected,     ///< Strategy refuses to resolve the include.
        };

        code errc{};          ///< The classification of the failure.
        std::string name{};   ///< Include name as written in the directive.
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @ingroup StanzaError
        /// @brief Constructs a fully-populated `IncludeError` instance.
        ///
        /// Example:
        /// @code
        /// return std::unexpected(IncludeError::make(
        ///     IncludeError::code::rejected, name, "Absolute includes are disabled"));
        /// @endcode
        ///
        /// @param c The error code describing the category of failure.
        /// @param n The include name being resolved.
        /// @param m Human-readable error message.
        /// @return A fully constructed `IncludeError`.
        STANZA_API static IncludeError make(code c, std::string_view n, std::string_view m);
    };

} // namespace Stanza
