#pragma once


/*
    --------------------------------------------------------------
    Stanza - Parse options for HOCON-style configuration libraries
    --------------------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - Parse options:                `Stanza::ParseOptions`
        - Configuration dialects:       `Stanza::ConfigSyntax`
        - Include strategies:           `Stanza::Includer`,
                                        `Stanza::FallbackIncluder`,
                                        `Stanza::ResourceIncluder`
        - Resource loading contexts:    `Stanza::LoadContext`,
                                        `Stanza::ResourceTable`,
                                        `Stanza::ScopedLoadContext`
        - Error reporting types:        `Stanza::IncludeError`

    -------------------
    High-Level Overview
    -------------------
    - Options:
        * `ParseOptions` is an immutable value; every `set_*` call returns
          a new handle and leaves the receiver alone
        * Setting a value that is already in place costs nothing and returns
          a handle sharing the receiver's state
    - Includes:
        * Include strategies form a linked chain; each link either handles
          an include, defers it to the next link, or fails it
        * `prepend_includer` / `append_includer` grow the chain in order
    - Loading:
        * When no load context is set, options resolve the calling thread's
          ambient context every time they are asked, so each thread sees
          its own

    ------------
    Design Goals
    ------------
    - Modern C++:
        * Uses C++23 `std::expected` for recoverable failures and standard
          exceptions for broken preconditions
    - Shareable:
        * Options hold no mutable state and can be passed between threads
    - Composability:
        * Strategies and contexts are small virtual interfaces; user types
          slot into the chain next to the built-in ones

    -----
    Usage
    -----
        #include <stanza/stanza.hpp>

        int main() {
            auto opts = Stanza::ParseOptions::defaults()
                .set_syntax(Stanza::ConfigSyntax::json)
                .set_allow_missing(false);

            auto inc = Stanza::resolve_include(opts, "app.conf", "defaults.conf");
            if (!inc) {
                std::println("Include Error: {}", inc.error().msg);
                return 1;
            }
            std::println("{}", inc->text);
        }

    Include this header for the full Stanza API, or include `options.hpp`,
    `includer.hpp`, `load_context.hpp` and `error.hpp` individually.
*/

/// @defgroup Stanza Stanza Parse Options Library
/// @brief Core types and functions for Stanza

#include "stanza/config.hpp"
#include "stanza/syntax.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/load_context.hpp"
#include "stanza/includer.hpp"
