#pragma once


/*
    ----------------------------------------------------
    Stanza::LoadContext - Where included resources live
    ----------------------------------------------------
    A `LoadContext` locates named resources (the things an `include`
    directive can point at) on behalf of parsers and include strategies

    ----------------
    Ambient context
    ----------------
    - Every thread has an ambient context, returned by `LoadContext::current()`
    - A thread that never installed one sees `LoadContext::system()`, an
      empty process-wide table
    - `ScopedLoadContext` installs a context for the current thread and puts
      the previous one back when it goes out of scope
    - `ParseOptions::load_context()` consults the ambient context on every
      call when no context was set explicitly; nothing caches the result

    -------------
    Thread-Safety
    -------------
    - Implementations must be safe for concurrent `find_resource` calls
    - `ResourceTable` is immutable after construction
    - The ambient context is `thread_local`; installing one on a thread never
      affects any other thread
*/

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "stanza/config.hpp"

/// @defgroup StanzaLoadContext Resource Loading Contexts
/// @ingroup Stanza
/// @brief Abstractions for locating included resources

namespace Stanza {

    /// @ingroup StanzaLoadContext
    /// @brief Locates named resources for parsers and include strategies
    class STANZA_API LoadContext {
    public:
        virtual ~LoadContext() = default;

        /// @ingroup StanzaLoadContext
        /// @brief Short name used when describing where a resource came from
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /// @ingroup StanzaLoadContext
        /// @brief Returns the contents of resource @p resource, or `std::nullopt`
        ///        if this context does not know it
        [[nodiscard]] virtual std::optional<std::string> find_resource(std::string_view resource) const = 0;

        /// @ingroup StanzaLoadContext
        /// @brief Returns the calling thread's ambient context; never null
        [[nodiscard]] static std::shared_ptr<const LoadContext> current();

        /// @ingroup StanzaLoadContext
        /// @brief Installs @p context as the calling thread's ambient context
        ///
        /// @param context New ambient context, or `nullptr` to go back to `system()`
        /// @return The context that was installed before (possibly `nullptr`)
        static std::shared_ptr<const LoadContext> set_current(std::shared_ptr<const LoadContext> context);

        /// @ingroup StanzaLoadContext
        /// @brief Process-wide context seen by threads that installed none
        [[nodiscard]] static std::shared_ptr<const LoadContext> system();
    };

    /// @ingroup StanzaLoadContext
    /// @brief Immutable in-memory `LoadContext` mapping resource names to text
    class STANZA_API ResourceTable final : public LoadContext {
    public:
        using map_type = std::map<std::string, std::string, std::less<>>;

        explicit ResourceTable(std::string name, map_type resources = {});

        [[nodiscard]] std::string_view name() const noexcept override { return m_Name; }
        [[nodiscard]] std::optional<std::string> find_resource(std::string_view resource) const override;

        [[nodiscard]] std::size_t size() const noexcept { return m_Resources.size(); }

    private:
        std::string m_Name;
        map_type m_Resources;
    };

    /// @ingroup StanzaLoadContext
    /// @brief RAII guard installing an ambient context for the current thread
    ///
    /// Example:
    /// @code
    /// {
    ///     ScopedLoadContext scope{ plugin_resources };
    ///     auto ctx = ParseOptions::defaults().load_context(); // plugin_resources
    /// }
    /// // previous ambient context restored
    /// @endcode
    class ScopedLoadContext {
    public:
        STANZA_API explicit ScopedLoadContext(std::shared_ptr<const LoadContext> context);
        STANZA_API ~ScopedLoadContext();

        ScopedLoadContext(const ScopedLoadContext&) = delete;
        ScopedLoadContext& operator=(const ScopedLoadContext&) = delete;

    private:
        std::shared_ptr<const LoadContext> m_Previous;
    };

} // namespace Stanza
