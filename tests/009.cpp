#include "utils.hpp"

namespace tokensnap::test {
    using namespace std::string_view_literals;

    namespace detail {
        std::string numbered_lines(size_t first, size_t last) {
            std::string out{};
            for (size_t i = first; i <= last; ++i) {
                out += std::to_string(i) + '\n';
            }
            return out;
        }

        size_t count_hunks(std::string_view diff) {
            size_t count = 0U;
            for (auto line : utils::split_lines(diff)) {
                if (line.starts_with("@@"sv)) {
                    ++count;
                }
            }
            return count;
        }
    }  // namespace detail

    TEST_CASE("009: equal inputs produce no diff", "[009][diff]") {
        CHECK(unified_diff("a\nb\n", "a\nb\n", diff_labels{}).empty());
        CHECK(unified_diff("", "", diff_labels{}).empty());
    }

    TEST_CASE("009: single change with context", "[009][diff]") {
        auto diff = unified_diff("a\nb\nc\n", "a\nB\nc\n", diff_labels{});
        CHECK(diff == "--- Original\n+++ Updated\n@@ -1,3 +1,3 @@\n a\n-b\n+B\n c\n");
    }

    TEST_CASE("009: hunk ranges count context and changes", "[009][diff]") {
        auto before = detail::numbered_lines(1U, 20U);
        auto after = detail::numbered_lines(1U, 12U) + "x1\nx2\nx3\nx4\nx5\nx6\nx7\n" + detail::numbered_lines(14U, 20U);

        auto diff = unified_diff(before, after, diff_labels::for_file("snapshots/a.snap"));
        CHECK(diff.starts_with("--- Original: snapshots/a.snap\n+++ Updated: snapshots/a.snap\n@@ -10,7 +10,13 @@\n"));
        CHECK(diff.find(" 12\n-13\n+x1\n") != std::string::npos);
        CHECK(diff.ends_with("+x7\n 14\n 15\n 16\n"));
    }

    TEST_CASE("009: nearby changes share a hunk and distant ones split", "[009][diff]") {
        auto base = detail::numbered_lines(1U, 30U);

        auto near = base;
        near.replace(near.find("5\n"), 2U, "five\n");
        near.replace(near.find("\n10\n") + 1U, 3U, "ten\n");
        CHECK(detail::count_hunks(unified_diff(base, near, diff_labels{})) == 1U);

        auto far = base;
        far.replace(far.find("2\n"), 2U, "two\n");
        far.replace(far.find("\n25\n") + 1U, 3U, "twenty-five\n");
        CHECK(detail::count_hunks(unified_diff(base, far, diff_labels{})) == 2U);
    }

    TEST_CASE("009: additions to an empty text", "[009][diff]") {
        CHECK(unified_diff("", "a\nb", diff_labels{.before = "old", .after = "new"}) ==
              "--- old\n+++ new\n@@ -0,0 +1,2 @@\n+a\n+b\n");
        CHECK(unified_diff("a\n", "", diff_labels{}) == "--- Original\n+++ Updated\n@@ -1,1 +0,0 @@\n-a\n");
    }

    TEST_CASE("009: tree diff marks added and removed entries", "[009][diff][tree]") {
        detail::temp_dir tmp{"tokensnap_tree"};
        auto before_root = tmp.path / "before";
        auto after_root = tmp.path / "after";
        detail::write_text_file(before_root / "README", "hi");
        detail::write_text_file(before_root / "src" / "lib.rs", "");
        detail::write_text_file(after_root / "src" / "lib.rs", "");
        detail::write_text_file(after_root / "src" / "main.rs", "");
        detail::write_text_file(after_root / "target" / "debug" / "out", "");

        auto before = list_directory(before_root);
        auto after = list_directory(after_root, {"target"});
        CHECK(after.size() == 3U);

        CHECK(tree_diff(before, after) ==
              "--- Original file tree\n"
              "+++ Updated file tree\n"
              "@@ -1,3 +1,3 @@\n"
              "-  README\n"
              "   src\n"
              "     src/lib.rs\n"
              "+    src/main.rs\n");

        CHECK(tree_diff(before, before).empty());
        CHECK(tree_diff({}, directory_listing{"a"}).starts_with(
                "--- Original file tree\n+++ Updated file tree\n@@ -0,0 +1,1 @@\n"));
    }

    TEST_CASE("009: listing a missing directory throws", "[009][diff][tree]") {
        detail::temp_dir tmp{"tokensnap_tree_missing"};
        CHECK_THROWS_AS(list_directory(tmp.path / "nope"), std::runtime_error);
    }

}  // namespace tokensnap::test
