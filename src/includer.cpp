#include "stanza/includer.hpp"

#include <format>
#include <stdexcept>
#include <utility>

#include "stanza/load_context.hpp"


namespace Stanza {

    IncludeContext::IncludeContext(ParseOptions including, std::string including_origin)
        : m_Including{ std::move(including) }, m_IncludingOrigin{ std::move(including_origin) } {}

    ParseOptions IncludeContext::parse_options() const {
        return m_Including
            .set_syntax(std::nullopt)
            .set_origin_description(std::nullopt)
            .set_allow_missing(true);
    }

    std::shared_ptr<const LoadContext> IncludeContext::load_context() const {
        return m_Including.load_context();
    }

    std::shared_ptr<const Includer> Includer::with_fallback(std::shared_ptr<const Includer> fallback) const {
        if (!fallback) throw std::invalid_argument{ "Stanza::Includer::with_fallback: null fallback" };
        if (fallback.get() == this) throw std::invalid_argument{ "Stanza::Includer::with_fallback: includer cannot fall back to itself" };
        return std::make_shared<FallbackIncluder>(shared_from_this(), std::move(fallback));
    }

    FallbackIncluder::FallbackIncluder(std::shared_ptr<const Includer> primary, std::shared_ptr<const Includer> fallback)
        : m_Primary{ std::move(primary) }, m_Fallback{ std::move(fallback) } {
        if (!m_Primary || !m_Fallback) throw std::invalid_argument{ "Stanza::FallbackIncluder: null includer" };
    }

    IncludeResult FallbackIncluder::include(const IncludeContext& context, std::string_view name) const {
        auto res = m_Primary->include(context, name);
        // Failures stop the chain; only a deferral reaches the fallback
        if (!res || res->has_value()) return res;
        return m_Fallback->include(context, name);
    }

    IncludeResult ResourceIncluder::include(const IncludeContext& context, std::string_view name) const {
        if (name.empty()) return std::unexpected(IncludeError::make(IncludeError::code::invalid_name, name, "Include name is empty"));

        auto ctx = context.load_context();
        auto text = ctx->find_resource(name);
        if (!text) return std::optional<Included>{};

        auto opts = detail::with_fallback_origin_description(context.parse_options(), std::format("{} @ {}", name, ctx->name()));
        return Included{ std::move(*text), std::move(opts) };
    }

    std::expected<Included, IncludeError> resolve_include(const ParseOptions& opts, std::string_view including_origin, std::string_view name) {
        static const std::shared_ptr<const Includer> default_includer = std::make_shared<ResourceIncluder>();

        const auto& includer = opts.includer() ? opts.includer() : default_includer;
        IncludeContext context{ opts, std::string{ including_origin } };

        auto res = includer->include(context, name);
        if (!res) return std::unexpected(std::move(res.error()));
        if (!res->has_value()) {
            return std::unexpected(IncludeError::make(IncludeError::code::not_found, name,
                std::format("Could not resolve include '{}' from {}", name, including_origin)));
        }
        return std::move(**res);
    }

} // namespace Stanza
