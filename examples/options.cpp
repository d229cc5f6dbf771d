#include <print>
#include <memory>

#include "stanza/stanza.hpp"

namespace {

    // Answers "override.conf" itself and defers everything else.
    struct OverrideIncluder : Stanza::Includer {
        Stanza::IncludeResult include(const Stanza::IncludeContext& context, std::string_view name) const override {
            if (name != "override.conf") return std::optional<Stanza::Included>{};
            auto opts = Stanza::detail::with_fallback_origin_description(context.parse_options(), "override (built in)");
            return Stanza::Included{ "port = 9090", opts };
        }
    };

    void print_options(const Stanza::ParseOptions& opts) {
        std::println("syntax         : {}", opts.syntax() ? Stanza::to_string(*opts.syntax()) : "(guess)");
        std::println("origin         : {}", opts.origin_description().value_or("(automatic)"));
        std::println("allow missing  : {}", opts.allow_missing());
        std::println("includer       : {}", opts.includer() ? "custom" : "(default)");
        std::println("load context   : {}", opts.load_context()->name());
    }

} // namespace

int main() {
    auto opts = Stanza::ParseOptions::defaults()
        .set_syntax(Stanza::ConfigSyntax::conf)
        .set_origin_description("application.conf")
        .set_allow_missing(false)
        .prepend_includer(std::make_shared<OverrideIncluder>())
        .append_includer(std::make_shared<Stanza::ResourceIncluder>());

    print_options(opts);

    auto resources = std::make_shared<Stanza::ResourceTable>("app-resources", Stanza::ResourceTable::map_type{
        { "defaults.conf", "host = localhost\nport = 8080" },
    });
    Stanza::ScopedLoadContext scope{ resources };

    std::println("\nload context now: {}", opts.load_context()->name());

    for (auto name : { "override.conf", "defaults.conf", "missing.conf" }) {
        auto inc = Stanza::resolve_include(opts, *opts.origin_description(), name);
        if (!inc) {
            std::println("\ninclude {} failed -> {}", name, inc.error().msg);
            continue;
        }
        std::println("\ninclude {} from {}:\n{}", name, inc->options.origin_description().value_or("?"), inc->text);
    }

    return 0;
}
