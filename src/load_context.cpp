#include "stanza/load_context.hpp"

#include <utility>


namespace Stanza {

    namespace detail {
        thread_local std::shared_ptr<const LoadContext> t_AmbientContext;
    } // namespace detail

    std::shared_ptr<const LoadContext> LoadContext::current() {
        if (detail::t_AmbientContext) return detail::t_AmbientContext;
        return system();
    }

    std::shared_ptr<const LoadContext> LoadContext::set_current(std::shared_ptr<const LoadContext> context) {
        return std::exchange(detail::t_AmbientContext, std::move(context));
    }

    std::shared_ptr<const LoadContext> LoadContext::system() {
        static const std::shared_ptr<const LoadContext> sys = std::make_shared<ResourceTable>("system");
        return sys;
    }

    ResourceTable::ResourceTable(std::string name, map_type resources)
        : m_Name{ std::move(name) }, m_Resources{ std::move(resources) } {}

    std::optional<std::string> ResourceTable::find_resource(std::string_view resource) const {
        auto it = m_Resources.find(resource);
        if (it == m_Resources.end()) return std::nullopt;
        return it->second;
    }

    ScopedLoadContext::ScopedLoadContext(std::shared_ptr<const LoadContext> context)
        : m_Previous{ LoadContext::set_current(std::move(context)) } {}

    ScopedLoadContext::~ScopedLoadContext() {
        LoadContext::set_current(std::move(m_Previous));
    }

} // namespace Stanza
