#include "utils.hpp"

#include "tokensnap/cli.hpp"

#include <sstream>

namespace tokensnap::test {
    using namespace std::string_view_literals;
    using namespace tokensnap::literals;
    using cli::command_kind;

    namespace detail {
        runtime_config config_for(update_mode mode, const fs::path& workspace, bool force_pass = false) {
            return runtime_config{.update = mode, .force_pass = force_pass, .workspace = workspace};
        }

        int run(command_kind kind, const fs::path& root, std::ostringstream& out, bool json = false) {
            startup_config cfg{};
            cfg.root = root;
            cfg.color = color_mode::never;
            if (json) {
                cfg.output = output_mode::json;
            }
            std::ostringstream err{};
            return cli::run_command(cfg, cli::command_request{.kind = kind}, out, err);
        }
    }  // namespace detail

    TEST_CASE("010: snapshot files carry a metadata header", "[010][snapshot][files]") {
        snapshot_file snapshot{
                .metadata = {.source = "tests/parse.cpp", .expression = "tokens(\"a\nb\")", .description = "first"},
                .contents = "struct Foo;"};
        auto text = serialize_snapshot(snapshot);
        CHECK(text ==
              "---\n"
              "source: tests/parse.cpp\n"
              "expression: tokens(\"a b\")\n"
              "description: first\n"
              "---\n"
              "struct Foo;\n");

        auto parsed = parse_snapshot(text);
        CHECK(parsed.metadata.source == "tests/parse.cpp");
        CHECK(parsed.metadata.description == "first");
        CHECK(parsed.contents == "struct Foo;");

        auto bare = parse_snapshot("struct Bar;\n\n");
        CHECK(bare.metadata.source.empty());
        CHECK(bare.contents == "struct Bar;");
    }

    TEST_CASE("010: snapshot file names follow the settings", "[010][snapshot][files]") {
        const fs::path source{"/work/tests/parser_test.cpp"};
        CHECK(snapshot_file_path(source, "basic") == fs::path{"/work/tests/snapshots/parser_test__basic.snap"});

        settings_scope scope{settings_frame{
                .snapshot_path = fs::path{"/tmp/snaps"}, .snapshot_suffix = "linux", .prepend_module_to_snapshot = false}};
        CHECK(snapshot_file_path(source, "nested/name") == fs::path{"/tmp/snaps/nested_name@linux.snap"});
    }

    TEST_CASE("010: file snapshots across update modes", "[010][snapshot][assert]") {
        detail::temp_dir tmp{"tokensnap_file_snap"};
        settings_scope scope{settings_frame{.snapshot_path = tmp.path}};
        auto here = std::source_location::current();
        auto path = snapshot_file_path(resolve_source_path(here.file_name(), detail::config_for(update_mode::no, tmp.path)),
                                       "item");
        auto pending = path;
        pending += ".new";

        auto first = detail::tokens("struct Foo { a: i32 }");
        auto changed = detail::tokens("struct Foo { a: i64 }");

        SECTION("missing snapshots are written in new mode and then match") {
            auto config = detail::config_for(update_mode::write_new, tmp.path);
            CHECK(assert_token_snapshot("item", first, "first", here, config) == assertion_status::written);
            CHECK(read_snapshot(path).contents == "struct Foo {\n    a: i32,\n}");
            CHECK(read_snapshot(path).metadata.expression == "first");
            CHECK(assert_token_snapshot("item", detail::tokens("struct Foo{a:i32,}"), "first", here, config) ==
                  assertion_status::matched);

            CHECK_THROWS_AS(assert_token_snapshot("item", changed, "changed", here, config), snapshot_mismatch);
            CHECK(fs::exists(pending));
            CHECK(read_snapshot(path).contents == "struct Foo {\n    a: i32,\n}");

            // a later match removes the stale proposal
            CHECK(assert_token_snapshot("item", first, "first", here, config) == assertion_status::matched);
            CHECK_FALSE(fs::exists(pending));
        }

        SECTION("no mode never writes") {
            auto config = detail::config_for(update_mode::no, tmp.path);
            CHECK_THROWS_AS(assert_token_snapshot("item", first, "first", here, config), snapshot_mismatch);
            CHECK_FALSE(fs::exists(path));
            CHECK_FALSE(fs::exists(pending));

            auto forced = detail::config_for(update_mode::no, tmp.path, true);
            CHECK(assert_token_snapshot("item", first, "first", here, forced) == assertion_status::ignored);
        }

        SECTION("always mode overwrites") {
            auto config = detail::config_for(update_mode::always, tmp.path);
            CHECK(assert_token_snapshot("item", first, "first", here, config) == assertion_status::written);
            CHECK(assert_token_snapshot("item", changed, "changed", here, config) == assertion_status::written);
            CHECK(read_snapshot(path).contents == "struct Foo {\n    a: i64,\n}");
            CHECK_FALSE(fs::exists(pending));
        }

        SECTION("pending mode leaves accepted files alone") {
            auto config = detail::config_for(update_mode::pending, tmp.path, true);
            CHECK(assert_token_snapshot("item", first, "first", here, config) == assertion_status::recorded);
            CHECK_FALSE(fs::exists(path));
            CHECK(read_snapshot(pending).contents == "struct Foo {\n    a: i32,\n}");

            auto found = find_pending(tmp.path);
            REQUIRE(found.new_snapshots.size() == 1U);
            auto record = describe_new_snapshot(found.new_snapshots[0]);
            CHECK(record.file == path);
            CHECK(record.diff.find("+    a: i32,\n") != std::string::npos);
        }
    }

    TEST_CASE("010: inline snapshots compare the literal", "[010][snapshot][inline]") {
        detail::temp_dir tmp{"tokensnap_inline"};
        auto here = std::source_location::current();
        auto strict = detail::config_for(update_mode::no, tmp.path);

        CHECK(assert_inline_token_snapshot(detail::tokens("struct Foo;"), "@{ struct Foo ; }", "v", here, strict) ==
              assertion_status::matched);
        CHECK(assert_inline_token_snapshot(
                      detail::tokens("struct Foo { a: i32 }"),
                      "@{\n            struct Foo {\n                a: i32,\n            }\n        }",
                      "v",
                      here,
                      strict) == assertion_status::matched);
        CHECK(assert_inline_token_snapshot(detail::tokens("1 + 2"), "@\"1 + 2\"", "v", here, strict) ==
              assertion_status::matched);
        CHECK(assert_inline_token_snapshot(token_stream{}, "@{}", "v", here, strict) == assertion_status::matched);

        TOKENSNAP_ASSERT_SNAPSHOT(detail::tokens("struct Foo;"), @{ struct Foo; });

        try {
            assert_inline_token_snapshot(detail::tokens("struct Bar;"), "@{ struct Foo; }", "v", here, strict);
            FAIL("expected a mismatch");
        } catch (const snapshot_mismatch& e) {
            CHECK(e.record().line == here.line());
            CHECK(e.record().proposed == "struct Bar;");
            CHECK(e.record().diff == "--- old snapshot\n+++ new results\n@@ -1,1 +1,1 @@\n-struct Foo;\n+struct Bar;\n");
        }

        auto forced = detail::config_for(update_mode::no, tmp.path, true);
        CHECK(assert_inline_token_snapshot(detail::tokens("struct Bar;"), "@{}", "v", here, forced) ==
              assertion_status::ignored);

        CHECK_THROWS_AS(
                assert_inline_token_snapshot(detail::tokens("struct Bar;"), "{ struct Bar; }", "v", here, strict),
                std::runtime_error);
    }

    TEST_CASE("010: documented items fall back to a string literal", "[010][snapshot][inline]") {
        detail::temp_dir tmp{"tokensnap_inline_docs"};
        auto here = std::source_location::current();
        auto strict = detail::config_for(update_mode::no, tmp.path);
        settings_scope scope{settings_frame{.ignore_docs_for_tokens = false}};

        auto documented = detail::tokens("/// Documented\nstruct Foo;");
        auto proposed = render_for_literal(documented);
        CHECK(proposed.starts_with("\n#[doc = \" Documented\"]\n"));
        CHECK(proposed.find("///") == std::string::npos);

        const token_literal_policy tokens{};
        CHECK(tokens.form_for(proposed) == placeholder_form::string_literal);
        auto literal = tokens.format(proposed, literal_layout{.indentation = "    "});
        CHECK(literal.starts_with("@R\"("));

        CHECK(assert_inline_token_snapshot(documented, literal, "v", here, strict) == assertion_status::matched);
        CHECK_THROWS_AS(
                assert_inline_token_snapshot(detail::tokens("/// Other\nstruct Foo;"), literal, "v", here, strict),
                snapshot_mismatch);

        try {
            assert_inline_token_snapshot(documented, "@{}", "v", here, strict);
            FAIL("expected a mismatch");
        } catch (const snapshot_mismatch& e) {
            CHECK(e.record().proposed == proposed);
        }

        TOKENSNAP_ASSERT_SNAPSHOT(detail::tokens("r#\"a\"b\"#"), @"r#\"a\"b\"#");
    }

    TEST_CASE("010: pending updates are stored as json lines", "[010][snapshot][pending]") {
        detail::temp_dir tmp{"tokensnap_pending"};
        auto source = tmp.path / "src" / "lexer_test.cpp";
        detail::write_text_file(source, "");

        append_pending_update(pending_update{
                .file = source,
                .line = 7U,
                .old_text = "@{}",
                .new_text = "struct Foo;",
                .form = placeholder_form::compact_brace,
                .expression = "tokens(x)"});
        append_pending_update(pending_update{
                .file = source,
                .line = 9U,
                .old_text = "@\"a\"",
                .new_text = "b",
                .form = placeholder_form::string_literal});

        auto updates = read_pending_updates(pending_file_for(source));
        REQUIRE(updates.size() == 2U);
        CHECK(updates[0].file == source);
        CHECK(updates[0].line == 7U);
        CHECK(updates[0].form == placeholder_form::compact_brace);
        CHECK(updates[0].expression == "tokens(x)");
        CHECK(updates[1].form == placeholder_form::string_literal);

        auto record = describe_pending(updates[1]);
        CHECK(record.line == 9U);
        CHECK(record.diff == "--- old snapshot\n+++ new results\n@@ -1,1 +1,1 @@\n-a\n+b\n");

        detail::write_text_file(tmp.path / "target" / "ignored.cpp.pending-snap", "");
        detail::write_text_file(tmp.path / "snapshots" / "a.snap.new", "x");
        detail::write_text_file(tmp.path / "snapshots" / "a.snap", "x");

        auto found = find_pending(tmp.path, {"target"});
        REQUIRE(found.pending_files.size() == 1U);
        CHECK(found.pending_files[0] == pending_file_for(source));
        REQUIRE(found.new_snapshots.size() == 1U);
        CHECK(found.new_snapshots[0].filename() == "a.snap.new");
    }

    TEST_CASE("010: malformed pending lines are reported", "[010][snapshot][pending][errors]") {
        detail::temp_dir tmp{"tokensnap_pending_bad"};
        auto pending = tmp.path / "x.cpp.pending-snap";

        detail::write_text_file(pending, "{not json\n");
        CHECK_THROWS_AS(read_pending_updates(pending), std::runtime_error);

        detail::write_text_file(
                pending,
                R"({"file":"x.cpp","line":1,"old_text":"","new_text":"","form":"sideways","expression":""})"
                "\n");
        CHECK_THROWS_AS(read_pending_updates(pending), std::runtime_error);
    }

    TEST_CASE("010: review commands accept and reject", "[010][snapshot][cli]") {
        detail::temp_dir tmp{"tokensnap_review"};
        auto source = tmp.path / "tests" / "items_test.cpp";
        detail::write_text_file(
                source,
                "TEST_CASE(\"items\") {\n"
                "    TOKENSNAP_ASSERT_SNAPSHOT(value, @{});\n"
                "}\n");
        append_pending_update(pending_update{
                .file = source, .line = 2U, .old_text = "@{}", .new_text = "struct Foo;", .form = placeholder_form::compact_brace});

        auto accepted = tmp.path / "tests" / "snapshots" / "items_test__fn.snap";
        auto proposal = accepted;
        proposal += ".new";
        write_snapshot(proposal, snapshot_file{.metadata = {.source = "tests/items_test.cpp"}, .contents = "fn f() {}"});

        SECTION("pending lists both kinds") {
            std::ostringstream out{};
            CHECK(detail::run(command_kind::pending, tmp.path, out) == 0);
            auto text = out.str();
            CHECK(text.find("{}:2\n"_format(source.string())) != std::string::npos);
            CHECK(text.find("+struct Foo;\n") != std::string::npos);
            CHECK(text.find(accepted.string()) != std::string::npos);
            CHECK(text.ends_with("2 pending snapshot(s)\n"));

            std::ostringstream json{};
            CHECK(detail::run(command_kind::pending, tmp.path, json, true) == 0);
            CHECK(json.str().find("\"kind\":\"inline\"") != std::string::npos);
            CHECK(json.str().find("\"kind\":\"file\"") != std::string::npos);
        }

        SECTION("accept patches sources and promotes proposals") {
            std::ostringstream out{};
            CHECK(detail::run(command_kind::accept, tmp.path, out) == 0);
            CHECK(detail::read_text_file(source) ==
                  "TEST_CASE(\"items\") {\n"
                  "    TOKENSNAP_ASSERT_SNAPSHOT(value, @{ struct Foo; });\n"
                  "}\n");
            CHECK_FALSE(fs::exists(pending_file_for(source)));
            CHECK_FALSE(fs::exists(proposal));
            CHECK(read_snapshot(accepted).contents == "fn f() {}");
            CHECK(out.str().find("accepted {} (1 update(s))"_format(source.string())) != std::string::npos);

            std::ostringstream again{};
            CHECK(detail::run(command_kind::pending, tmp.path, again) == 0);
            CHECK(again.str() == "no pending snapshots\n");
        }

        SECTION("accept keeps the pending file when a source cannot be patched") {
            detail::write_text_file(source, "int main() {}\n");
            std::ostringstream out{};
            CHECK(detail::run(command_kind::accept, tmp.path, out) == 1);
            CHECK(out.str().find("failed {}"_format(source.string())) != std::string::npos);
            CHECK(fs::exists(pending_file_for(source)));
        }

        SECTION("reject discards everything") {
            std::ostringstream out{};
            CHECK(detail::run(command_kind::reject, tmp.path, out) == 0);
            CHECK_FALSE(fs::exists(pending_file_for(source)));
            CHECK_FALSE(fs::exists(proposal));
            CHECK(detail::read_text_file(source).find("@{});") != std::string::npos);
            CHECK(out.str().find("rejected ") == 0U);
        }
    }

}  // namespace tokensnap::test
