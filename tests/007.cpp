#include "utils.hpp"

namespace tokensnap::test {
    using namespace std::string_view_literals;

    namespace detail {
        std::string pretty(std::string_view source) {
            return render(tokens(source));
        }
    }  // namespace detail

    TEST_CASE("007: items are pretty printed", "[007][printer]") {
        CHECK(detail::pretty("struct MyStruct { field: i32, }") == "struct MyStruct {\n    field: i32,\n}");
        CHECK(detail::pretty("fn foo() { let x = 1; }") == "fn foo() {\n    let x = 1;\n}");
        CHECK(detail::pretty("struct   Foo ;") == "struct Foo;");
        CHECK(detail::pretty("struct A; struct B;") == "struct A;\nstruct B;");
        CHECK(detail::pretty("pub struct Point(pub i32, i32);") == "pub struct Point(pub i32, i32);");
        CHECK(detail::pretty("use std::collections::{HashMap,HashSet};") ==
              "use std::collections::{HashMap, HashSet};");
    }

    TEST_CASE("007: nested bodies indent by four", "[007][printer]") {
        CHECK(detail::pretty("enum E { A, B(i32), C { x: u8 } }") ==
              "enum E {\n    A,\n    B(i32),\n    C {\n        x: u8,\n    },\n}");
        CHECK(detail::pretty("impl Foo { fn get(&self) -> i32 { self.x } }") ==
              "impl Foo {\n    fn get(&self) -> i32 {\n        self.x\n    }\n}");
        CHECK(detail::pretty("fn f<T>(x: T) where T: Clone {}") == "fn f<T>(x: T)\nwhere\n    T: Clone,\n{}");
    }

    TEST_CASE("007: expressions print on one line where possible", "[007][printer][expr]") {
        CHECK(detail::pretty("1 + 2") == "1 + 2");
        CHECK(detail::pretty("1+2*3") == "1 + 2 * 3");
        CHECK(detail::pretty("foo . bar ( 1 , 2 ) ?") == "foo.bar(1, 2)?");
        CHECK(detail::pretty("vec![1,2,3]") == "vec![1, 2, 3]");
        CHECK(detail::pretty("match x { 1 => a, _ => { b } }") ==
              "match x {\n    1 => a,\n    _ => {\n        b\n    }\n}");
    }

    TEST_CASE("007: labels, async blocks and foreign items", "[007][printer]") {
        CHECK(detail::pretty("fn f() { 'outer: loop { break 'outer; } }") ==
              "fn f() {\n    'outer: loop {\n        break 'outer;\n    }\n}");
        CHECK(detail::pretty("'a: for x in xs { continue 'a; }") == "'a: for x in xs {\n    continue 'a;\n}");
        CHECK(detail::pretty("async move { x.await }") == "async move {\n    x.await\n}");
        CHECK(detail::pretty("extern crate serde as s;") == "extern crate serde as s;");
        CHECK(detail::pretty("extern \"C\" { fn abs(x: i32) -> i32; static errno: i32; }") ==
              "extern \"C\" {\n    fn abs(x: i32) -> i32;\n    static errno: i32;\n}");
        CHECK(detail::pretty("pub union Bits { i: u32, f: f32 }") == "pub union Bits {\n    i: u32,\n    f: f32,\n}");
        CHECK(detail::pretty("match x { Some(1|2) | None if y => {} [a, .., b] => {} }") ==
              "match x {\n    Some(1 | 2) | None if y => {}\n    [a, .., b] => {}\n}");
    }

    TEST_CASE("007: empty and unparsable streams", "[007][printer][raw]") {
        CHECK(detail::pretty("").empty());
        CHECK(detail::pretty("Vec<u8>") == "Vec < u8 >");
        CHECK(render_for_literal(token_stream{}).empty());
    }

    TEST_CASE("007: format_tokens off uses the raw rendering", "[007][printer][raw]") {
        settings_scope raw{settings_frame{.format_tokens = false}};
        CHECK(detail::pretty("struct MyStruct { field: i32, }") == "struct MyStruct { field : i32 , }");
        CHECK(detail::pretty("fn foo() { let x = 1; }") == "fn foo () { let x = 1 ; }");
        CHECK(detail::pretty("1 + 2") == "1 + 2");
    }

    TEST_CASE("007: doc comments follow ignore_docs_for_tokens", "[007][printer][docs]") {
        constexpr auto source = "/// Docs\n#[derive(Debug, Clone)]\nstruct Foo;"sv;
        CHECK(detail::pretty(source) == "#[derive(Debug, Clone)]\nstruct Foo;");

        settings_scope keep_docs{settings_frame{.ignore_docs_for_tokens = false}};
        CHECK(detail::pretty(source) == "/// Docs\n#[derive(Debug, Clone)]\nstruct Foo;");
    }

    TEST_CASE("007: literal rendering wraps multi-line output", "[007][printer]") {
        CHECK(render_for_literal(detail::tokens("struct Foo;")) == "struct Foo;");
        CHECK(render_for_literal(detail::tokens("struct MyStruct { field: i32 }")) ==
              "\nstruct MyStruct {\n    field: i32,\n}\n");
    }

    TEST_CASE("007: formatted output re-tokenizes to an equal stream", "[007][printer]") {
        for (auto source : {"struct MyStruct { field: i32, }"sv,
                            "fn foo<'a>(x: &'a mut [u8; 4]) -> Option<&'a u8> { x.first() }"sv,
                            "impl<T: Clone> From<T> for Wrapper<T> { fn from(v: T) -> Self { Wrapper(v) } }"sv,
                            "a.b::<u8>().await?"sv,
                            "fn f() { 'outer: loop { 'inner: while a { continue 'outer; } break 'outer; } }"sv,
                            "extern crate alloc; extern \"C\" { fn abs(x: i32) -> i32; } union U { a: u8, }"sv,
                            "async move { x.await }"sv}) {
            auto original = detail::tokens(source);
            auto printed = render(original);
            CAPTURE(source, printed);
            CHECK(tokens_equal(detail::tokens(printed), original));
        }
    }

}  // namespace tokensnap::test
