#include "utils.hpp"

#include "tokensnap/cli.hpp"

#include <sstream>
#include <vector>

namespace tokensnap::test {

    namespace detail {
        std::vector<char*> to_argv(std::vector<std::string>& args) {
            std::vector<char*> argv{};
            argv.reserve(args.size());
            for (auto& arg : args) {
                argv.push_back(arg.data());
            }
            return argv;
        }

        std::optional<int> parse(std::vector<std::string> args, startup_config& cfg, cli::command_request& request) {
            auto argv = to_argv(args);
            return cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg, request);
        }
    }  // namespace detail

    TEST_CASE("002: parse_cli accepts global options and subcommands", "[002][cli]") {
        startup_config cfg{};
        cli::command_request request{};

        auto result = detail::parse(
                {"tokensnap", "--output", "json", "--color", "never", "--verbose", "pending", "--root", "/tmp/proj"},
                cfg,
                request);
        CHECK(!result);
        CHECK(cfg.output == output_mode::json);
        CHECK(cfg.color == color_mode::never);
        CHECK(cfg.verbose);
        CHECK(cfg.root == std::filesystem::path{"/tmp/proj"});
        CHECK(request.kind == cli::command_kind::pending);
    }

    TEST_CASE("002: parse_cli maps subcommand arguments", "[002][cli]") {
        startup_config cfg{};
        cli::command_request request{};

        SECTION("pending --json") {
            REQUIRE(!detail::parse({"tokensnap", "pending", "--json"}, cfg, request));
            CHECK(cfg.output == output_mode::json);
        }

        SECTION("fmt with flags") {
            REQUIRE(!detail::parse({"tokensnap", "fmt", "input.rs", "--raw", "--keep-docs"}, cfg, request));
            CHECK(request.kind == cli::command_kind::fmt);
            REQUIRE(request.paths.size() == 1U);
            CHECK(request.paths[0] == "input.rs");
            CHECK(cfg.raw);
            CHECK(cfg.keep_docs);
        }

        SECTION("eq takes two files") {
            detail::temp_dir tmp{"tokensnap_cli_eq"};
            auto a = (tmp.path / "a.rs").string();
            auto b = (tmp.path / "b.rs").string();
            detail::write_text_file(a, "struct A;");
            detail::write_text_file(b, "struct B;");
            REQUIRE(!detail::parse({"tokensnap", "eq", a, b}, cfg, request));
            CHECK(request.kind == cli::command_kind::eq);
            CHECK(request.paths == std::vector<std::string>{a, b});
        }

        SECTION("accept with exclusions and macro") {
            REQUIRE(!detail::parse(
                    {"tokensnap", "--exclude", "vendor", "--macro", "SNAP", "accept", "--root", "."}, cfg, request));
            CHECK(request.kind == cli::command_kind::accept);
            CHECK(cfg.directive_macro == "SNAP");
            CHECK(std::ranges::find(cfg.excluded_dirs, "vendor") != cfg.excluded_dirs.end());
            CHECK(std::ranges::find(cfg.excluded_dirs, ".git") != cfg.excluded_dirs.end());
        }
    }

    TEST_CASE("002: parse_cli rejects invalid combos", "[002][cli]") {
        startup_config cfg{};
        cli::command_request request{};

        auto result = detail::parse({"tokensnap", "--quiet", "--verbose", "pending"}, cfg, request);
        REQUIRE(result);
        CHECK(*result == 2);

        startup_config bad_output{};
        result = detail::parse({"tokensnap", "--output", "yaml", "pending"}, bad_output, request);
        REQUIRE(result);
        CHECK(*result == 2);

        startup_config missing_arg{};
        result = detail::parse({"tokensnap", "eq", "only_one.rs"}, missing_arg, request);
        REQUIRE(result);
        CHECK(*result == 2);

        startup_config missing_file{};
        result = detail::parse(
                {"tokensnap", "eq", "/nonexistent/tokensnap/a.rs", "/nonexistent/tokensnap/b.rs"}, missing_file, request);
        REQUIRE(result);
        CHECK(*result == 2);

        startup_config unknown_flag{};
        result = detail::parse({"tokensnap", "pending", "--frobnicate"}, unknown_flag, request);
        REQUIRE(result);
        CHECK(*result == 2);
    }

    TEST_CASE("002: parse_cli handles one-shot exits", "[002][cli]") {
        startup_config cfg{};
        cli::command_request request{};

        auto result = detail::parse({"tokensnap", "--version"}, cfg, request);
        REQUIRE(result);
        CHECK(*result == 0);

        startup_config print_cfg{};
        result = detail::parse({"tokensnap", "--print-config"}, print_cfg, request);
        REQUIRE(result);
        CHECK(*result == 0);
        CHECK(print_cfg.print_config);

        std::ostringstream os{};
        cli::print_config(print_cfg, os);
        CHECK(os.str().find("directive_macro=TOKENSNAP_ASSERT_SNAPSHOT\n") != std::string::npos);
        CHECK(os.str().find("excluded_dirs=.git,target,build\n") != std::string::npos);
    }

    TEST_CASE("002: fmt eq and diff commands", "[002][cli][commands]") {
        detail::temp_dir tmp{"tokensnap_cli"};
        auto lhs = tmp.path / "a.rs";
        auto rhs = tmp.path / "b.rs";
        detail::write_text_file(lhs, "struct   MyStruct { field : i32 , }");
        detail::write_text_file(rhs, "/// docs\nstruct MyStruct {\n    field: i32,\n}\n");

        startup_config cfg{};
        cfg.color = color_mode::never;
        std::ostringstream out{};
        std::ostringstream err{};

        SECTION("fmt pretty prints") {
            cli::command_request request{.kind = cli::command_kind::fmt, .paths = {lhs.string()}};
            CHECK(cli::run_command(cfg, request, out, err) == 0);
            CHECK(out.str() == "struct MyStruct {\n    field: i32,\n}\n");
        }

        SECTION("fmt raw") {
            cfg.raw = true;
            cli::command_request request{.kind = cli::command_kind::fmt, .paths = {lhs.string()}};
            CHECK(cli::run_command(cfg, request, out, err) == 0);
            CHECK(out.str() == "struct MyStruct { field : i32 , }\n");
        }

        SECTION("eq ignores docs unless asked") {
            cli::command_request request{.kind = cli::command_kind::eq, .paths = {lhs.string(), rhs.string()}};
            CHECK(cli::run_command(cfg, request, out, err) == 0);
            CHECK(out.str() == "equal\n");

            cfg.keep_docs = true;
            std::ostringstream again{};
            CHECK(cli::run_command(cfg, request, again, err) == 1);
            CHECK(again.str() == "different\n");
        }

        SECTION("eq exits 2 when a file cannot be read") {
            cli::command_request request{
                    .kind = cli::command_kind::eq, .paths = {lhs.string(), (tmp.path / "missing.rs").string()}};
            CHECK(cli::run_command(cfg, request, out, err) == 2);
            CHECK(out.str().empty());
            CHECK(err.str().starts_with("error: failed to open "));
        }

        SECTION("malformed input is reported") {
            auto broken = tmp.path / "broken.rs";
            detail::write_text_file(broken, "fn foo( {");
            cli::command_request request{.kind = cli::command_kind::fmt, .paths = {broken.string()}};
            CHECK(cli::run_command(cfg, request, out, err) == 1);
            CHECK(err.str().starts_with("error: "));
        }

        SECTION("diff exits 1 on differences") {
            cli::command_request request{.kind = cli::command_kind::diff, .paths = {lhs.string(), rhs.string()}};
            CHECK(cli::run_command(cfg, request, out, err) == 1);
            CHECK(out.str().starts_with("--- " + lhs.string() + "\n+++ " + rhs.string() + "\n"));

            std::ostringstream same{};
            cli::command_request self{.kind = cli::command_kind::diff, .paths = {lhs.string(), lhs.string()}};
            CHECK(cli::run_command(cfg, self, same, err) == 0);
            CHECK(same.str().empty());
        }
    }

}  // namespace tokensnap::test
