#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"

#include <memory>
#include <string>
#include <thread>

using namespace Catch;

TEST_CASE("System Context Is the Default Ambient Context") {
    auto sys = Stanza::LoadContext::system();
    REQUIRE(sys);
    REQUIRE(sys == Stanza::LoadContext::system());
    REQUIRE(sys->name() == "system");
    REQUIRE_FALSE(sys->find_resource("application.conf").has_value());
    REQUIRE(Stanza::LoadContext::current() == sys);
}

TEST_CASE("Resource Table Finds Only Known Names") {
    Stanza::ResourceTable table{ "plugins", {
        { "plugin.conf", "enabled = true" },
    } };

    REQUIRE(table.name() == "plugins");
    REQUIRE(table.size() == 1);
    REQUIRE(table.find_resource("plugin.conf") == std::optional<std::string>{ "enabled = true" });
    REQUIRE_FALSE(table.find_resource("plugin").has_value());
    REQUIRE_FALSE(table.find_resource("").has_value());
}

TEST_CASE("Scoped Load Context Restores the Previous Context") {
    auto outer = std::make_shared<Stanza::ResourceTable>("outer");
    auto inner = std::make_shared<Stanza::ResourceTable>("inner");

    {
        Stanza::ScopedLoadContext outer_scope{ outer };
        REQUIRE(Stanza::LoadContext::current() == outer);
        {
            Stanza::ScopedLoadContext inner_scope{ inner };
            REQUIRE(Stanza::LoadContext::current() == inner);
        }
        REQUIRE(Stanza::LoadContext::current() == outer);
    }
    REQUIRE(Stanza::LoadContext::current() == Stanza::LoadContext::system());
}

TEST_CASE("Set Current Returns the Previously Installed Context") {
    auto ctx = std::make_shared<Stanza::ResourceTable>("manual");

    auto previous = Stanza::LoadContext::set_current(ctx);
    REQUIRE(previous == nullptr);
    REQUIRE(Stanza::LoadContext::current() == ctx);

    auto replaced = Stanza::LoadContext::set_current(previous);
    REQUIRE(replaced == ctx);
    REQUIRE(Stanza::LoadContext::current() == Stanza::LoadContext::system());
}

TEST_CASE("Each Thread Resolves Its Own Ambient Context") {
    auto opts = Stanza::ParseOptions::defaults();
    auto main_ctx = std::make_shared<Stanza::ResourceTable>("main-thread");
    Stanza::ScopedLoadContext scope{ main_ctx };

    std::string worker_default;
    std::string worker_scoped;
    std::thread worker{ [&] {
        worker_default = std::string{ opts.load_context()->name() };
        Stanza::ScopedLoadContext worker_scope{ std::make_shared<Stanza::ResourceTable>("worker-thread") };
        worker_scoped = std::string{ opts.load_context()->name() };
    } };
    worker.join();

    REQUIRE(worker_default == "system");
    REQUIRE(worker_scoped == "worker-thread");
    REQUIRE(opts.load_context() == main_ctx);
    REQUIRE_FALSE(opts.has_load_context());
}

TEST_CASE("Explicit Context Is Shared Across Threads") {
    auto pinned = std::make_shared<Stanza::ResourceTable>("pinned");
    auto opts = Stanza::ParseOptions::defaults().set_load_context(pinned);

    std::shared_ptr<const Stanza::LoadContext> seen;
    std::thread worker{ [&] {
        Stanza::ScopedLoadContext worker_scope{ std::make_shared<Stanza::ResourceTable>("worker-thread") };
        seen = opts.load_context();
    } };
    worker.join();

    REQUIRE(seen == pinned);
}
