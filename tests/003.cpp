#include "utils.hpp"

#include <thread>

namespace tokensnap::test {

    TEST_CASE("003: defaults apply without frames", "[003][settings]") {
        auto& settings = settings_context::current();
        REQUIRE(settings.depth() == 0U);

        CHECK(settings.format_tokens());
        CHECK(settings.ignore_docs_for_tokens());
        CHECK(settings.prepend_module_to_snapshot());
        CHECK(settings.snapshot_path() == std::filesystem::path{"snapshots"});
        CHECK(settings.snapshot_suffix().empty());
        CHECK(settings.description().empty());
    }

    TEST_CASE("003: nested scopes override and restore", "[003][settings]") {
        auto& settings = settings_context::current();
        {
            settings_scope outer{settings_frame{.format_tokens = false, .snapshot_suffix = "linux"}};
            CHECK_FALSE(settings.format_tokens());
            CHECK(settings.snapshot_suffix() == "linux");
            {
                settings_scope inner{settings_frame{.format_tokens = true}};
                CHECK(settings.format_tokens());
                // unset fields fall through to the outer frame
                CHECK(settings.snapshot_suffix() == "linux");
                CHECK(settings.depth() == 2U);
            }
            CHECK_FALSE(settings.format_tokens());
            CHECK(settings.depth() == 1U);
        }
        CHECK(settings.format_tokens());
        CHECK(settings.snapshot_suffix().empty());
        CHECK(settings.depth() == 0U);
    }

    TEST_CASE("003: with_settings restores on exceptions", "[003][settings]") {
        auto& settings = settings_context::current();
        CHECK_THROWS_AS(
                with_settings(
                        settings_frame{.ignore_docs_for_tokens = false},
                        [&]() -> int {
                            CHECK_FALSE(settings.ignore_docs_for_tokens());
                            throw std::runtime_error("boom");
                        }),
                std::runtime_error);
        CHECK(settings.ignore_docs_for_tokens());
        CHECK(settings.depth() == 0U);

        auto value = with_settings(settings_frame{.description = "described"}, [&] { return settings.description(); });
        CHECK(value == "described");
    }

    TEST_CASE("003: settings are per thread", "[003][settings][threads]") {
        settings_scope scope{settings_frame{.format_tokens = false}};

        bool other_thread_format = false;
        size_t other_thread_depth = 99U;
        std::thread worker{[&] {
            other_thread_format = settings_context::current().format_tokens();
            other_thread_depth = settings_context::current().depth();
        }};
        worker.join();

        CHECK(other_thread_format);
        CHECK(other_thread_depth == 0U);
        CHECK_FALSE(settings_context::current().format_tokens());
    }

}  // namespace tokensnap::test
