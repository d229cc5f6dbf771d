#pragma once

#include <cstdint>
#include <string_view>

/// @defgroup StanzaSyntax Configuration Syntax
/// @ingroup Stanza
/// @brief Dialects a configuration source can be written in

namespace Stanza {

    /// @ingroup StanzaSyntax
    /// @brief Enumerates the configuration dialects understood by Stanza parsers
    enum class ConfigSyntax : uint8_t {
        json,       ///< Strict JSON (RFC 8259)
        conf,       ///< HOCON, the JSON superset; the fallback when nothing else is known
        properties, ///< Java-style `.properties` key/value files
    };

    /// @ingroup StanzaSyntax
    /// @brief Returns a stable lowercase name for @p s (`"json"`, `"conf"`, `"properties"`)
    [[nodiscard]] constexpr std::string_view to_string(ConfigSyntax s) noexcept {
        switch (s) {
        case ConfigSyntax::json: return "json";
        case ConfigSyntax::conf: return "conf";
        case ConfigSyntax::properties: return "properties";
        }
        return "conf";
    }

} // namespace Stanza
