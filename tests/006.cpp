#include "utils.hpp"

namespace tokensnap::test {
    using namespace std::string_view_literals;

    TEST_CASE("006: whitespace and layout never matter", "[006][equality]") {
        CHECK(tokens_equal("struct   Foo ;"sv, "struct Foo;"sv));
        CHECK(tokens_equal("struct MyStruct { field: i32, }"sv, "struct MyStruct {\n    field: i32,\n}"sv));
        CHECK(tokens_equal("fn foo() { let x = 1; }"sv, "fn foo() {\n    let x = 1;\n}\n"sv));
        CHECK(tokens_equal("1+2"sv, "1 + 2"sv));
    }

    TEST_CASE("006: structural differences are detected", "[006][equality]") {
        CHECK_FALSE(tokens_equal("struct Foo;"sv, "struct Bar;"sv));
        CHECK_FALSE(tokens_equal("struct Foo { a: i32 }"sv, "struct Foo { a: i64 }"sv));
        CHECK_FALSE(tokens_equal("1 + 2"sv, "1 - 2"sv));
        CHECK_FALSE(tokens_equal("(1 + 2) * 3"sv, "1 + 2 * 3"sv));
        CHECK_FALSE(tokens_equal("struct Foo;"sv, "1 + 2"sv));
    }

    TEST_CASE("006: empty streams only equal empty streams", "[006][equality]") {
        CHECK(tokens_equal(""sv, "   \n"sv));
        CHECK(tokens_equal(""sv, "// just a comment"sv));
        CHECK_FALSE(tokens_equal(""sv, "struct Foo;"sv));
        CHECK_FALSE(tokens_equal("1"sv, ""sv));
    }

    TEST_CASE("006: doc attributes follow ignore_docs_for_tokens", "[006][equality][docs]") {
        constexpr auto documented = "/// Explains Foo\nstruct Foo;"sv;
        constexpr auto bare = "struct Foo;"sv;
        constexpr auto attribute_form = "#[doc = \" Explains Foo\"] struct Foo;"sv;

        CHECK(tokens_equal(documented, bare));
        CHECK(tokens_equal(documented, attribute_form));

        settings_scope keep_docs{settings_frame{.ignore_docs_for_tokens = false}};
        CHECK_FALSE(tokens_equal(documented, bare));
        CHECK(tokens_equal(documented, attribute_form));
    }

    TEST_CASE("006: unparsable input falls back to raw comparison", "[006][equality][raw]") {
        CHECK(tokens_equal("Vec<u8>"sv, "Vec < u8 >"sv));
        CHECK(tokens_equal("a < b < c"sv, "a<b<c"sv));
        CHECK_FALSE(tokens_equal("Vec<u8>"sv, "Vec<u16>"sv));
        // raw comparison keeps joint spacing: `->` is not `- >`
        CHECK_FALSE(tokens_equal("a -> b c"sv, "a - > b c"sv));
    }

    TEST_CASE("006: malformed input throws", "[006][equality][errors]") {
        CHECK_THROWS_AS(tokens_equal("struct Foo {"sv, "struct Foo {}"sv), tokenize_error);
    }

}  // namespace tokensnap::test
