#pragma once


/*
    -------------------------------------------------
    Stanza::Includer - Include-resolution strategies
    -------------------------------------------------
    An `Includer` turns the name in an `include` directive into the source
    text the parser should read next

    ---------------
    Result states
    ---------------
    `Includer::include(...)` returns an `IncludeResult`, an alias for
    `std::expected<std::optional<Included>, IncludeError>`:
        - value holding `Included`    -> handled; the chain stops here
        - value holding `std::nullopt`-> deferred; the next strategy is asked
        - error                       -> failed; the chain stops here and the
                                         error reaches the caller

    --------
    Chaining
    --------
    - Strategies compose into a linked chain through `with_fallback(...)`
    - The default `with_fallback` wraps the pair in a `FallbackIncluder`,
      which asks the primary first and only asks the fallback when the
      primary defers
    - Implementations may override `with_fallback` to control how they
      delegate
    - `ParseOptions::prepend_includer` / `append_includer` build the chain
    - Strategies are always owned through `std::shared_ptr`; `with_fallback`
      relies on `shared_from_this()`

    -------------------
    Built-in strategy
    -------------------
    `ResourceIncluder` resolves names through the load context of the
    including options. It is what `resolve_include(...)` uses when the
    options carry no includer.
*/

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"

/// @defgroup StanzaIncluder Include Strategies
/// @ingroup Stanza
/// @brief Composable strategies resolving include directives

namespace Stanza {

    class LoadContext;

    /// @ingroup StanzaIncluder
    /// @brief A resolved include: the text to parse and the options to parse it with
    struct Included {
        std::string text;     ///< Source text of the included resource.
        ParseOptions options; ///< Options for the included source; origin description is always set.
    };

    /// @ingroup StanzaIncluder
    /// @brief Three-state outcome of an include strategy (handled, deferred, failed)
    using IncludeResult = std::expected<std::optional<Included>, IncludeError>;

    /// @ingroup StanzaIncluder
    /// @brief What a strategy knows about the directive it is resolving
    class IncludeContext {
    public:
        /// @param including Options of the source containing the directive
        /// @param including_origin Origin description of that source
        STANZA_API IncludeContext(ParseOptions including, std::string including_origin);

        /// @ingroup StanzaIncluder
        /// @brief Options for parsing the included source
        ///
        /// @details
        /// Derived from the including options with the per-source fields
        /// cleared: no syntax, no origin description, and `allow_missing`
        /// back to `true`. The includer and load context carry over.
        [[nodiscard]] STANZA_API ParseOptions parse_options() const;

        /// @ingroup StanzaIncluder
        /// @brief The including options exactly as given
        [[nodiscard]] const ParseOptions& including_options() const noexcept { return m_Including; }

        /// @ingroup StanzaIncluder
        /// @brief Origin description of the source containing the directive
        [[nodiscard]] std::string_view including_origin() const noexcept { return m_IncludingOrigin; }

        /// @ingroup StanzaIncluder
        /// @brief The load context to resolve against; resolved on each call
        [[nodiscard]] STANZA_API std::shared_ptr<const LoadContext> load_context() const;

    private:
        ParseOptions m_Including;
        std::string m_IncludingOrigin;
    };

    /// @ingroup StanzaIncluder
    /// @brief Abstract include-resolution strategy
    class STANZA_API Includer : public std::enable_shared_from_this<Includer> {
    public:
        virtual ~Includer() = default;

        /// @ingroup StanzaIncluder
        /// @brief Resolves include @p name seen while parsing @p context
        ///
        /// @return The resolved source, `std::nullopt` to defer to the next
        ///         strategy, or an `IncludeError` to fail the include
        [[nodiscard]] virtual IncludeResult include(const IncludeContext& context, std::string_view name) const = 0;

        /// @ingroup StanzaIncluder
        /// @brief Returns a strategy that tries this one, then @p fallback
        ///
        /// @details
        /// The default builds `FallbackIncluder(shared_from_this(), fallback)`.
        /// This object must be owned by a `std::shared_ptr`.
        ///
        /// @throws std::invalid_argument If @p fallback is null or is this object
        [[nodiscard]] virtual std::shared_ptr<const Includer> with_fallback(std::shared_ptr<const Includer> fallback) const;
    };

    /// @ingroup StanzaIncluder
    /// @brief Linked `(primary, fallback)` pair produced by `Includer::with_fallback`
    class STANZA_API FallbackIncluder final : public Includer {
    public:
        /// @throws std::invalid_argument If either strategy is null
        FallbackIncluder(std::shared_ptr<const Includer> primary, std::shared_ptr<const Includer> fallback);

        [[nodiscard]] IncludeResult include(const IncludeContext& context, std::string_view name) const override;

        [[nodiscard]] const std::shared_ptr<const Includer>& primary() const noexcept { return m_Primary; }
        [[nodiscard]] const std::shared_ptr<const Includer>& fallback() const noexcept { return m_Fallback; }

    private:
        std::shared_ptr<const Includer> m_Primary;
        std::shared_ptr<const Includer> m_Fallback;
    };

    /// @ingroup StanzaIncluder
    /// @brief Resolves include names as resources of the context's `LoadContext`
    ///
    /// @details
    /// A name the load context knows is handled; the included options get
    /// the origin description `"<name> @ <context name>"` unless one is
    /// already set. Unknown names are deferred. An empty name fails with
    /// `IncludeError::code::invalid_name`.
    class STANZA_API ResourceIncluder final : public Includer {
    public:
        [[nodiscard]] IncludeResult include(const IncludeContext& context, std::string_view name) const override;
    };

    /// @ingroup StanzaIncluder
    /// @brief Resolves a single include directive with the strategy @p opts selects
    ///
    /// @details
    /// Uses `opts.includer()`, or a `ResourceIncluder` when none is set. If
    /// the whole chain defers, the include fails with
    /// `IncludeError::code::not_found`.
    ///
    /// @param opts Options of the including source
    /// @param including_origin Origin description of the including source
    /// @param name Include name as written in the directive
    /// @return The resolved include or the reason it failed
    [[nodiscard]] STANZA_API std::expected<Included, IncludeError> resolve_include(const ParseOptions& opts, std::string_view including_origin, std::string_view name);

} // namespace Stanza
