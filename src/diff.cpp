#include "tokensnap/diff.hpp"

#include "tokensnap/format.hpp"
#include "tokensnap/utils.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <stdexcept>

using namespace tokensnap::literals;
namespace fs = std::filesystem;

namespace tokensnap {

    namespace detail {

        enum class line_op : uint8_t { equal, removed, added };

        struct diff_line {
            line_op op{line_op::equal};
            size_t old_index{};
            size_t new_index{};
        };

        // Longest-common-subsequence walk producing one entry per output line
        static std::vector<diff_line> diff_lines(
                const std::vector<std::string_view>& old_lines, const std::vector<std::string_view>& new_lines) {
            const size_t n = old_lines.size();
            const size_t m = new_lines.size();

            std::vector<std::vector<size_t>> lcs(n + 1U, std::vector<size_t>(m + 1U, 0U));
            for (size_t i = n; i-- > 0U;) {
                for (size_t j = m; j-- > 0U;) {
                    if (old_lines[i] == new_lines[j]) {
                        lcs[i][j] = lcs[i + 1U][j + 1U] + 1U;
                    }
                    else {
                        lcs[i][j] = std::max(lcs[i + 1U][j], lcs[i][j + 1U]);
                    }
                }
            }

            std::vector<diff_line> out{};
            size_t i = 0U;
            size_t j = 0U;
            while (i < n || j < m) {
                if (i < n && j < m && old_lines[i] == new_lines[j]) {
                    out.push_back({line_op::equal, i++, j++});
                }
                else if (i < n && (j == m || lcs[i + 1U][j] >= lcs[i][j + 1U])) {
                    out.push_back({line_op::removed, i++, j});
                }
                else {
                    out.push_back({line_op::added, i, j++});
                }
            }
            return out;
        }

        static std::string hunk_range(size_t first, size_t count) {
            // an empty range names the line before it
            if (count == 0U) {
                return "{},0"_format(first);
            }
            return "{},{}"_format(first + 1U, count);
        }

    }  // namespace detail

    diff_labels diff_labels::for_file(const fs::path& path) {
        return diff_labels{.before = "Original: " + path.generic_string(), .after = "Updated: " + path.generic_string()};
    }

    std::string unified_diff(std::string_view before, std::string_view after, const diff_labels& labels, size_t context) {
        if (before == after) {
            return {};
        }
        auto old_lines = utils::split_lines(before);
        auto new_lines = utils::split_lines(after);
        auto lines = detail::diff_lines(old_lines, new_lines);

        std::string out{"--- {}\n+++ {}\n"_format(labels.before, labels.after)};

        size_t pos = 0U;
        while (pos < lines.size()) {
            auto change = std::ranges::find_if(
                    lines.begin() + static_cast<std::ptrdiff_t>(pos), lines.end(), [](const detail::diff_line& l) {
                        return l.op != detail::line_op::equal;
                    });
            if (change == lines.end()) {
                break;
            }
            size_t first_change = static_cast<size_t>(change - lines.begin());
            size_t start = first_change > context ? first_change - context : 0U;
            start = std::max(start, pos);

            // extend while the next change is close enough to share context
            size_t end = first_change;
            size_t idle = 0U;
            for (size_t k = first_change; k < lines.size(); ++k) {
                if (lines[k].op != detail::line_op::equal) {
                    end = k + 1U;
                    idle = 0U;
                }
                else if (++idle > 2U * context) {
                    break;
                }
            }
            end = std::min(lines.size(), end + context);

            size_t old_count = 0U;
            size_t new_count = 0U;
            std::string body{};
            for (size_t k = start; k < end; ++k) {
                const auto& line = lines[k];
                switch (line.op) {
                    case detail::line_op::equal:
                        body += ' ';
                        body += old_lines[line.old_index];
                        ++old_count;
                        ++new_count;
                        break;
                    case detail::line_op::removed:
                        body += '-';
                        body += old_lines[line.old_index];
                        ++old_count;
                        break;
                    case detail::line_op::added:
                        body += '+';
                        body += new_lines[line.new_index];
                        ++new_count;
                        break;
                }
                body += '\n';
            }

            out += "@@ -{} +{} @@\n"_format(
                    detail::hunk_range(lines[start].old_index, old_count),
                    detail::hunk_range(lines[start].new_index, new_count));
            out += body;
            pos = end;
        }
        return out;
    }

    directory_listing list_directory(const fs::path& root, const std::vector<std::string>& excluded) {
        std::error_code ec{};
        if (!fs::is_directory(root, ec)) {
            throw std::runtime_error("not a directory: {}"_format(root.string()));
        }
        directory_listing listing{};
        fs::recursive_directory_iterator it{root, ec};
        if (ec) {
            throw std::runtime_error("failed to list {}: {}"_format(root.string(), ec.message()));
        }
        for (; it != fs::recursive_directory_iterator{}; it.increment(ec)) {
            if (ec) {
                throw std::runtime_error("failed to list {}: {}"_format(root.string(), ec.message()));
            }
            const auto& entry = *it;
            auto name = entry.path().filename().string();
            if (entry.is_directory(ec) && std::ranges::find(excluded, name) != excluded.end()) {
                it.disable_recursion_pending();
                continue;
            }
            listing.insert(fs::relative(entry.path(), root));
        }
        return listing;
    }

    std::string tree_diff(const directory_listing& before, const directory_listing& after) {
        if (before == after) {
            return {};
        }
        directory_listing all{before};
        all.insert(after.begin(), after.end());

        auto depth = [](const fs::path& p) {
            return static_cast<size_t>(std::distance(p.begin(), p.end()));
        };

        std::string out{"--- Original file tree\n+++ Updated file tree\n"};
        out += "@@ -{} +{} @@\n"_format(detail::hunk_range(0U, before.size()), detail::hunk_range(0U, after.size()));
        for (const auto& entry : all) {
            bool in_before = before.contains(entry);
            bool in_after = after.contains(entry);
            out += in_before && in_after ? ' ' : (in_after ? '+' : '-');
            out.append(2U * depth(entry), ' ');
            out += entry.generic_string();
            out += '\n';
        }
        return out;
    }

}  // namespace tokensnap
