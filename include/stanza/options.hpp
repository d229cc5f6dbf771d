#pragma once


/*
    ----------------------------------
    Stanza parse options
    ----------------------------------
    This header defines `Stanza::ParseOptions`, the immutable descriptor a
    parser consults before reading any configuration text

    --------------------------------------
    Parsing Options - Stanza::ParseOptions
    --------------------------------------
    `ParseOptions` tells a parser how to interpret one configuration source:

    - `syntax`:
        * The dialect to assume (`json`, `conf`, `properties`)
        * Unset means the caller guesses from a filename, and falls back to
          `ConfigSyntax::conf` when guessing fails
    - `origin_description`:
        * Human-readable provenance ("application.conf", "stdin", ...) that
          becomes the origin of every parsed value
        * Unset means the caller derives one automatically
    - `allow_missing`:
        * When true (default), a missing root source yields an empty document
        * When false, a missing root source is an error
        * Applies to the root source only; nested includes never inherit it
    - `includer`:
        * The include-resolution strategy, possibly a chain built with
          `prepend_includer` / `append_includer`
        * Unset means the built-in `ResourceIncluder`
    - `load_context`:
        * The resource-loading context used to locate included resources
        * Unset means "the calling thread's ambient context", looked up on
          every read and never stored

    ----------------------
    Copy-on-write handles
    ----------------------
    A `ParseOptions` is a cheap handle onto a shared, immutable state block.
    Every `set_*` function returns a new handle; when the requested value is
    already in place the returned handle shares the receiver's state block
    (`is_same` reports this) and nothing is allocated. No function mutates
    the receiver, so instances can be shared freely between threads.

    -----
    Usage
    -----
        auto opts = Stanza::ParseOptions::defaults()
            .set_syntax(Stanza::ConfigSyntax::json)
            .set_allow_missing(false);
*/


#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/syntax.hpp"

/// @defgroup StanzaOptions Parsing Options
/// @ingroup Stanza
/// @brief Configuration objects controlling how a source is parsed

namespace Stanza {

    class Includer;
    class LoadContext;

    /// @ingroup StanzaOptions
    /// @brief Separator used to render a dotted path `a.b.c` as `a->b->c` in diagnostics
    inline constexpr std::string_view path_token_separator = "->";

    /// @ingroup StanzaOptions
    /// @brief Immutable set of options related to parsing
    ///
    /// @details
    /// Start from `ParseOptions::defaults()` and derive the instance you need.
    /// The "setters" return a new object; the receiver is never modified.
    ///
    /// Example:
    /// @code
    /// auto opts = ParseOptions::defaults()
    ///     .set_syntax(ConfigSyntax::json)
    ///     .set_allow_missing(false);
    /// auto same = opts.set_syntax(ConfigSyntax::json);
    /// // same.is_same(opts) == true
    /// @endcode
    class ParseOptions {
    public:
        /// @ingroup StanzaOptions
        /// @brief Returns options with every field at its default
        ///
        /// @details
        /// Syntax, origin description, includer and load context are unset;
        /// `allow_missing` is `true`.
        [[nodiscard]] STANZA_API static ParseOptions defaults();

        // Copy-only so a handle always refers to a state block.
        ParseOptions(const ParseOptions&) = default;
        ParseOptions& operator=(const ParseOptions&) = default;

        // ------------------------------------------------------------
        // Syntax
        // ------------------------------------------------------------

        /// @ingroup StanzaOptions
        /// @brief Sets the file format
        ///
        /// @param syntax A syntax, or `std::nullopt` to guess from any available
        ///               filename extension (falling back to `conf`)
        /// @return Options with the syntax set
        [[nodiscard]] STANZA_API ParseOptions set_syntax(std::optional<ConfigSyntax> syntax) const;

        /// @ingroup StanzaOptions
        /// @brief Returns the current syntax, or `std::nullopt` for "any"
        [[nodiscard]] std::optional<ConfigSyntax> syntax() const noexcept { return m_State->syntax; }

        // ------------------------------------------------------------
        // Origin description
        // ------------------------------------------------------------

        /// @ingroup StanzaOptions
        /// @brief Sets a description for the thing being parsed
        ///
        /// @details
        /// In most cases a loader sets this to something like the filename.
        /// When parsing a bare stream or string you may want to improve on it.
        /// The description is the basis for the origin of the parsed values.
        /// A description equal to the current one returns the receiver's state.
        ///
        /// @param description Description to use, or `std::nullopt` to let the
        ///                    library come up with one
        /// @return Options with the origin description set
        [[nodiscard]] STANZA_API ParseOptions set_origin_description(std::optional<std::string> description) const;

        /// @ingroup StanzaOptions
        /// @brief Returns the current origin description, or `std::nullopt` for "automatic"
        [[nodiscard]] const std::optional<std::string>& origin_description() const noexcept { return m_State->origin_description; }

        // ------------------------------------------------------------
        // Missing sources
        // ------------------------------------------------------------

        /// @ingroup StanzaOptions
        /// @brief Sets whether a missing root source is tolerated
        ///
        /// @details
        /// Set to `false` to fail when the item being parsed (for example a
        /// file) is missing. Set to `true` to get an empty document instead.
        /// Applies only to fetching the root document; it has no effect on
        /// nested includes.
        [[nodiscard]] STANZA_API ParseOptions set_allow_missing(bool allow_missing) const;

        /// @ingroup StanzaOptions
        /// @brief Returns the current "allow missing" flag
        [[nodiscard]] bool allow_missing() const noexcept { return m_State->allow_missing; }

        // ------------------------------------------------------------
        // Includer
        // ------------------------------------------------------------

        /// @ingroup StanzaOptions
        /// @brief Replaces the include strategy
        ///
        /// @param includer The strategy to use, or `nullptr` for the default
        /// @return Options with the includer set
        [[nodiscard]] STANZA_API ParseOptions set_includer(std::shared_ptr<const Includer> includer) const;

        /// @ingroup StanzaOptions
        /// @brief Puts @p includer in front of the current strategy
        ///
        /// @details
        /// The library calls `includer->with_fallback(current)` so that
        /// @p includer is consulted first and the existing strategy only sees
        /// the includes @p includer defers. With no current strategy,
        /// @p includer is installed as is.
        ///
        /// @param includer The strategy to prepend (must not be null)
        /// @return Options with the composed includer
        /// @throws std::invalid_argument If @p includer is null
        [[nodiscard]] STANZA_API ParseOptions prepend_includer(std::shared_ptr<const Includer> includer) const;

        /// @ingroup StanzaOptions
        /// @brief Puts @p includer behind the current strategy
        ///
        /// @details
        /// The library calls `current->with_fallback(includer)`. With no
        /// current strategy this behaves like `prepend_includer`.
        ///
        /// @param includer The strategy to append (must not be null)
        /// @return Options with the composed includer
        /// @throws std::invalid_argument If @p includer is null
        [[nodiscard]] STANZA_API ParseOptions append_includer(std::shared_ptr<const Includer> includer) const;

        /// @ingroup StanzaOptions
        /// @brief Returns the current includer (`nullptr` for the default includer)
        [[nodiscard]] const std::shared_ptr<const Includer>& includer() const noexcept { return m_State->includer; }

        // ------------------------------------------------------------
        // Load context
        // ------------------------------------------------------------

        /// @ingroup StanzaOptions
        /// @brief Sets the resource-loading context
        ///
        /// @param context A context, or `nullptr` to use the calling thread's
        ///                ambient context at read time
        /// @return Options with the load context set
        [[nodiscard]] STANZA_API ParseOptions set_load_context(std::shared_ptr<const LoadContext> context) const;

        /// @ingroup StanzaOptions
        /// @brief Returns the load context to use; never null
        ///
        /// @details
        /// If a context was set, returns it. Otherwise returns
        /// `LoadContext::current()` as seen by the calling thread right now.
        /// The resolved context is not remembered, so two calls on the same
        /// instance may return different contexts when the ambient context
        /// changes in between (or when called from different threads).
        [[nodiscard]] STANZA_API std::shared_ptr<const LoadContext> load_context() const;

        /// @ingroup StanzaOptions
        /// @brief Returns true if a load context was set explicitly
        [[nodiscard]] bool has_load_context() const noexcept { return m_State->load_context != nullptr; }

        // ------------------------------------------------------------
        // Identity and equality
        // ------------------------------------------------------------

        /// @ingroup StanzaOptions
        /// @brief Returns true if both handles share one state block
        ///
        /// @details
        /// A `set_*` call that changes nothing returns a handle for which
        /// `is_same(receiver)` holds.
        [[nodiscard]] bool is_same(const ParseOptions& other) const noexcept { return m_State == other.m_State; }

        /// @ingroup StanzaOptions
        /// @brief Structural equality over the raw fields
        ///
        /// @details
        /// The includer and load context compare by identity. An unset load
        /// context is compared as unset, not as the ambient context.
        STANZA_API friend bool operator==(const ParseOptions& lhs, const ParseOptions& rhs) noexcept;

    private:
        struct State {
            std::optional<ConfigSyntax> syntax;
            std::optional<std::string> origin_description;
            bool allow_missing = true;
            std::shared_ptr<const Includer> includer;
            std::shared_ptr<const LoadContext> load_context;
        };

        explicit ParseOptions(std::shared_ptr<const State> state) noexcept;

        std::shared_ptr<const State> m_State;
    };

    namespace detail {

        /// @ingroup StanzaOptions
        /// @brief Sets the origin description only if none is set yet
        ///
        /// @details
        /// Lets a loader or includer supply a sensible default without
        /// overriding a description the caller chose. Not part of the public
        /// API.
        [[nodiscard]] STANZA_API ParseOptions with_fallback_origin_description(const ParseOptions& opts, std::string_view description);

    } // namespace detail

} // namespace Stanza
