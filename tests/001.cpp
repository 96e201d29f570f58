#include "utils.hpp"

namespace tokensnap::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: mode parsing", "[001][config]") {
        output_mode out_mode = output_mode::table;
        color_mode clr_mode = color_mode::automatic;

        REQUIRE(try_parse_output_mode("JSON"sv, out_mode));
        CHECK(out_mode == output_mode::json);
        REQUIRE(try_parse_output_mode("table"sv, out_mode));
        CHECK(out_mode == output_mode::table);
        CHECK_FALSE(try_parse_output_mode("yaml"sv, out_mode));

        REQUIRE(try_parse_color_mode("always"sv, clr_mode));
        CHECK(clr_mode == color_mode::always);
        REQUIRE(try_parse_color_mode("NEVER"sv, clr_mode));
        CHECK(clr_mode == color_mode::never);
        REQUIRE(try_parse_color_mode("auto"sv, clr_mode));
        CHECK(clr_mode == color_mode::automatic);
        CHECK_FALSE(try_parse_color_mode("sometimes"sv, clr_mode));
    }

    TEST_CASE("001: update mode parsing", "[001][config]") {
        update_mode mode = update_mode::no;

        REQUIRE(try_parse_update_mode("new"sv, mode));
        CHECK(mode == update_mode::write_new);
        REQUIRE(try_parse_update_mode("ALWAYS"sv, mode));
        CHECK(mode == update_mode::always);
        REQUIRE(try_parse_update_mode("overwrite"sv, mode));
        CHECK(mode == update_mode::always);
        REQUIRE(try_parse_update_mode("pending"sv, mode));
        CHECK(mode == update_mode::pending);
        REQUIRE(try_parse_update_mode("no"sv, mode));
        CHECK(mode == update_mode::no);
        CHECK_FALSE(try_parse_update_mode("sometimes"sv, mode));

        bool flag = false;
        REQUIRE(try_parse_flag("1"sv, flag));
        CHECK(flag);
        REQUIRE(try_parse_flag("False"sv, flag));
        CHECK_FALSE(flag);
        CHECK_FALSE(try_parse_flag("maybe"sv, flag));
    }

    TEST_CASE("001: enum string conversion", "[001][config]") {
        CHECK(to_string(output_mode::json) == "json"sv);
        CHECK(to_string(color_mode::automatic) == "auto"sv);
        CHECK(to_string(update_mode::write_new) == "new"sv);
        CHECK(to_string(update_mode::pending) == "pending"sv);
        CHECK(to_string(placeholder_form::expanded_brace) == "expanded_brace"sv);

        placeholder_form form = placeholder_form::empty;
        REQUIRE(try_parse_placeholder_form("string_literal"sv, form));
        CHECK(form == placeholder_form::string_literal);
        CHECK_FALSE(try_parse_placeholder_form("brace"sv, form));
    }

    TEST_CASE("001: runtime config reads the environment", "[001][config][env]") {
        SECTION("defaults") {
            detail::scoped_env ci{"CI", nullptr};
            detail::scoped_env update{"TOKENSNAP_UPDATE", nullptr};
            detail::scoped_env force{"TOKENSNAP_FORCE_PASS", nullptr};
            detail::scoped_env workspace{"TOKENSNAP_WORKSPACE", nullptr};

            auto cfg = runtime_config_from_env();
            CHECK(cfg.update == update_mode::write_new);
            CHECK_FALSE(cfg.force_pass);
            CHECK_FALSE(cfg.workspace);
        }

        SECTION("CI disables writes unless overridden") {
            detail::scoped_env ci{"CI", "true"};
            detail::scoped_env update{"TOKENSNAP_UPDATE", nullptr};
            CHECK(runtime_config_from_env().update == update_mode::no);

            detail::scoped_env explicit_update{"TOKENSNAP_UPDATE", "always"};
            CHECK(runtime_config_from_env().update == update_mode::always);
        }

        SECTION("force pass and workspace") {
            detail::scoped_env force{"TOKENSNAP_FORCE_PASS", "1"};
            detail::scoped_env workspace{"TOKENSNAP_WORKSPACE", "/tmp/tokensnap_workspace"};

            auto cfg = runtime_config_from_env();
            CHECK(cfg.force_pass);
            REQUIRE(cfg.workspace);
            CHECK(*cfg.workspace == std::filesystem::path{"/tmp/tokensnap_workspace"});
        }

        SECTION("invalid values are rejected") {
            detail::scoped_env update{"TOKENSNAP_UPDATE", "sometimes"};
            CHECK_THROWS_AS(runtime_config_from_env(), std::runtime_error);
        }
    }

}  // namespace tokensnap::test
