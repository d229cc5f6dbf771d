#include "stanza/options.hpp"

#include <stdexcept>
#include <utility>

#include "stanza/includer.hpp"
#include "stanza/load_context.hpp"


namespace Stanza {

    ParseOptions::ParseOptions(std::shared_ptr<const State> state) noexcept
        : m_State{ std::move(state) } {}

    ParseOptions ParseOptions::defaults() {
        return ParseOptions{ std::make_shared<State>() };
    }

    ParseOptions ParseOptions::set_syntax(std::optional<ConfigSyntax> syntax) const {
        if (m_State->syntax == syntax) return *this;
        auto next = std::make_shared<State>(*m_State);
        next->syntax = syntax;
        return ParseOptions{ std::move(next) };
    }

    ParseOptions ParseOptions::set_origin_description(std::optional<std::string> description) const {
        // optional== is true for two nullopts and for two equal strings
        if (m_State->origin_description == description) return *this;
        auto next = std::make_shared<State>(*m_State);
        next->origin_description = std::move(description);
        return ParseOptions{ std::move(next) };
    }

    ParseOptions ParseOptions::set_allow_missing(bool allow_missing) const {
        if (m_State->allow_missing == allow_missing) return *this;
        auto next = std::make_shared<State>(*m_State);
        next->allow_missing = allow_missing;
        return ParseOptions{ std::move(next) };
    }

    ParseOptions ParseOptions::set_includer(std::shared_ptr<const Includer> includer) const {
        if (m_State->includer == includer) return *this;
        auto next = std::make_shared<State>(*m_State);
        next->includer = std::move(includer);
        return ParseOptions{ std::move(next) };
    }

    ParseOptions ParseOptions::prepend_includer(std::shared_ptr<const Includer> includer) const {
        if (!includer) throw std::invalid_argument{ "Stanza::ParseOptions::prepend_includer: null includer" };
        if (m_State->includer == includer) return *this;
        if (m_State->includer) return set_includer(includer->with_fallback(m_State->includer));
        return set_includer(std::move(includer));
    }

    ParseOptions ParseOptions::append_includer(std::shared_ptr<const Includer> includer) const {
        if (!includer) throw std::invalid_argument{ "Stanza::ParseOptions::append_includer: null includer" };
        if (m_State->includer == includer) return *this;
        if (m_State->includer) return set_includer(m_State->includer->with_fallback(std::move(includer)));
        return set_includer(std::move(includer));
    }

    ParseOptions ParseOptions::set_load_context(std::shared_ptr<const LoadContext> context) const {
        if (m_State->load_context == context) return *this;
        auto next = std::make_shared<State>(*m_State);
        next->load_context = std::move(context);
        return ParseOptions{ std::move(next) };
    }

    std::shared_ptr<const LoadContext> ParseOptions::load_context() const {
        if (m_State->load_context) return m_State->load_context;
        return LoadContext::current();
    }

    bool operator==(const ParseOptions& lhs, const ParseOptions& rhs) noexcept {
        if (lhs.is_same(rhs)) return true;
        const auto& l = *lhs.m_State;
        const auto& r = *rhs.m_State;
        return l.syntax == r.syntax
            && l.origin_description == r.origin_description
            && l.allow_missing == r.allow_missing
            && l.includer == r.includer
            && l.load_context == r.load_context;
    }

    namespace detail {

        ParseOptions with_fallback_origin_description(const ParseOptions& opts, std::string_view description) {
            if (opts.origin_description()) return opts;
            return opts.set_origin_description(std::string{ description });
        }

    } // namespace detail

} // namespace Stanza
