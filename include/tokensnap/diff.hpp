#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tokensnap {

    struct diff_labels {
        std::string before{"Original"};
        std::string after{"Updated"};

        // "Original: <path>" / "Updated: <path>"
        static diff_labels for_file(const std::filesystem::path& path);
    };

    inline constexpr size_t default_diff_context = 3U;

    /*
     * Line-based unified diff with `--- `/`+++ ` headers and `@@ -a,b +c,d @@` hunks carrying `context`
     * unchanged lines around every change. Returns an empty string when both texts are equal.
     */
    std::string unified_diff(
            std::string_view before,
            std::string_view after,
            const diff_labels& labels,
            size_t context = default_diff_context);

    // Relative paths of every file and directory below a root, ordered component-wise
    using directory_listing = std::set<std::filesystem::path>;

    // Walks `root`; directories whose name is in `excluded` are neither listed nor descended into
    directory_listing list_directory(const std::filesystem::path& root, const std::vector<std::string>& excluded = {});

    /*
     * Union of both listings, one entry per line: a `+`, `-` or space prefix, two spaces of indentation
     * per path component, then the relative path. Wrapped in `--- Original file tree`/`+++ Updated file tree`
     * headers and a single hunk. Returns an empty string when the listings are equal.
     */
    std::string tree_diff(const directory_listing& before, const directory_listing& after);

}  // namespace tokensnap
