#include "tokensnap/patch.hpp"

#include "tokensnap/format.hpp"
#include "tokensnap/normalize.hpp"
#include "tokensnap/tokens.hpp"
#include "tokensnap/utils.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <stdexcept>

using namespace tokensnap::literals;
namespace fs = std::filesystem;

namespace tokensnap {

    namespace detail {

        constexpr bool is_ident_char(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
        }

        static size_t line_of(std::string_view text, size_t pos) {
            return 1U + static_cast<size_t>(std::ranges::count(text.substr(0U, pos), '\n'));
        }

        static size_t line_start(std::string_view text, size_t pos) {
            if (pos == 0U) {
                return 0U;
            }
            auto nl = text.find_last_of('\n', pos - 1U);
            return nl == std::string_view::npos ? 0U : nl + 1U;
        }

        static literal_layout layout_at(std::string_view text, size_t pos) {
            literal_layout layout{};
            auto begin = line_start(text, pos);
            auto end = begin;
            while (end < text.size() && utils::is_blank(text[end])) {
                ++end;
            }
            layout.indentation = std::string{text.substr(begin, end - begin)};
            auto nl = text.find('\n', pos);
            if (nl != std::string_view::npos && nl > 0U && text[nl - 1U] == '\r') {
                layout.newline = "\r\n";
            }
            return layout;
        }

        // one level deeper than `indentation`, in the same whitespace
        static std::string nested_indentation(const std::string& indentation) {
            return indentation + (indentation.find('\t') != std::string::npos ? "\t" : "    ");
        }

        // ── C++ host text ─────────────────────────────────────────────────

        // `i` at the opening quote; returns the index past the closing one
        static size_t skip_quoted(std::string_view text, size_t i, char quote) {
            for (size_t j = i + 1U; j < text.size(); ++j) {
                if (text[j] == '\\') {
                    ++j;
                }
                else if (text[j] == quote || text[j] == '\n') {
                    return j + 1U;
                }
            }
            return text.size();
        }

        // `i` at the `R` of `R"delim(`; returns the index past the closing `)delim"`
        static size_t skip_raw_string(std::string_view text, size_t i) {
            auto paren = text.find('(', i + 2U);
            if (paren == std::string_view::npos) {
                return text.size();
            }
            std::string terminator{")"};
            terminator += text.substr(i + 2U, paren - (i + 2U));
            terminator += '"';
            auto close = text.find(terminator, paren + 1U);
            return close == std::string_view::npos ? text.size() : close + terminator.size();
        }

        static std::string unescape(std::string_view body) {
            std::string out{};
            out.reserve(body.size());
            for (size_t i = 0U; i < body.size(); ++i) {
                if (body[i] != '\\' || i + 1U == body.size()) {
                    out += body[i];
                    continue;
                }
                switch (body[++i]) {
                    case 'n':
                        out += '\n';
                        break;
                    case 't':
                        out += '\t';
                        break;
                    case 'r':
                        out += '\r';
                        break;
                    case '0':
                        out += '\0';
                        break;
                    default:
                        out += body[i];
                        break;
                }
            }
            return out;
        }

        static std::string escape(std::string_view value) {
            std::string out{};
            out.reserve(value.size());
            for (char c : value) {
                switch (c) {
                    case '"':
                        out += "\\\"";
                        break;
                    case '\\':
                        out += "\\\\";
                        break;
                    case '\t':
                        out += "\\t";
                        break;
                    case '\r':
                        out += "\\r";
                        break;
                    default:
                        out += c;
                        break;
                }
            }
            return out;
        }

        // ── token literal body ────────────────────────────────────────────

        // `open` at '{'; returns the index past the matching '}', skipping strings, chars and comments
        static std::optional<size_t> match_brace(std::string_view text, size_t open) {
            size_t depth = 0U;
            size_t i = open;
            while (i < text.size()) {
                char c = text[i];
                char next = i + 1U < text.size() ? text[i + 1U] : '\0';
                if (c == '/' && next == '/') {
                    auto nl = text.find('\n', i);
                    i = nl == std::string_view::npos ? text.size() : nl;
                    continue;
                }
                if (c == '/' && next == '*') {
                    auto close = text.find("*/"sv, i + 2U);
                    i = close == std::string_view::npos ? text.size() : close + 2U;
                    continue;
                }
                if (c == 'r' && (next == '"' || next == '#') && (i == 0U || !is_ident_char(text[i - 1U]))) {
                    size_t j = i + 1U;
                    while (j < text.size() && text[j] == '#') {
                        ++j;
                    }
                    if (j < text.size() && text[j] == '"') {
                        std::string terminator{"\""};
                        terminator.append(j - (i + 1U), '#');
                        auto close = text.find(terminator, j + 1U);
                        i = close == std::string_view::npos ? text.size() : close + terminator.size();
                        continue;
                    }
                }
                if (c == '"') {
                    size_t j = i + 1U;
                    while (j < text.size() && text[j] != '"') {
                        j += text[j] == '\\' ? 2U : 1U;
                    }
                    i = j + 1U;
                    continue;
                }
                if (c == '\'') {
                    if (i + 2U < text.size() && text[i + 2U] == '\'') {
                        i += 3U;
                        continue;
                    }
                    if (next == '\\') {
                        auto close = text.find('\'', i + 3U);
                        i = close == std::string_view::npos ? text.size() : close + 1U;
                        continue;
                    }
                }
                if (c == '{') {
                    ++depth;
                }
                else if (c == '}') {
                    if (--depth == 0U) {
                        return i + 1U;
                    }
                }
                ++i;
            }
            return std::nullopt;
        }

        static std::string expanded_body(std::string_view content, const literal_layout& layout) {
            auto body = content;
            if (body.starts_with("\r\n"sv)) {
                body.remove_prefix(2U);
            }
            else if (body.starts_with('\n')) {
                body.remove_prefix(1U);
            }
            body = utils::trim_right_view(body);

            auto nested = nested_indentation(layout.indentation);
            std::string out{layout.newline};
            for (auto line : utils::split_lines(body)) {
                if (!utils::trim_view(line).empty()) {
                    out += nested;
                    out += utils::trim_right_view(line);
                }
                out += layout.newline;
            }
            out += layout.indentation;
            return out;
        }

        // `i` at the start of an identifier or pp-number; returns the index past it
        static size_t skip_word(std::string_view text, size_t i) {
            while (i < text.size() && is_ident_char(text[i])) {
                ++i;
            }
            return i;
        }

        static bool is_raw_string_prefix(std::string_view word) {
            // Rust raw strings, then the C++ raw string prefixes a bare `R"` would be read as
            return word == "r"sv || word == "br"sv || word == "cr"sv || word.ends_with('R');
        }

        // Scans one macro invocation from its '('; `pos` is left past the closing ')'
        static std::optional<inline_placeholder> scan_directive(
                std::string_view text, size_t open, size_t name_begin, size_t& pos) {
            std::optional<inline_placeholder> found{};
            size_t depth = 0U;
            size_t i = open;
            while (i < text.size()) {
                char c = text[i];
                char next = i + 1U < text.size() ? text[i + 1U] : '\0';
                if (c == '/' && next == '/') {
                    auto nl = text.find('\n', i);
                    i = nl == std::string_view::npos ? text.size() : nl;
                    continue;
                }
                if (c == '/' && next == '*') {
                    auto close = text.find("*/"sv, i + 2U);
                    i = close == std::string_view::npos ? text.size() : close + 2U;
                    continue;
                }
                if (c == 'R' && next == '"' && !is_ident_char(text[i - 1U])) {
                    i = skip_raw_string(text, i);
                    continue;
                }
                if (c == '"') {
                    i = skip_quoted(text, i, '"');
                    continue;
                }
                if (c == '\'') {
                    // digit separators such as 1'000
                    i = is_ident_char(text[i - 1U]) ? i + 1U : skip_quoted(text, i, '\'');
                    continue;
                }
                if (c == '@' && depth == 1U && !found) {
                    if (auto literal = decode_literal(text.substr(i))) {
                        inline_placeholder placeholder{};
                        placeholder.begin = i;
                        placeholder.end = i + literal->length;
                        placeholder.first_line = line_of(text, i);
                        placeholder.last_line = line_of(text, placeholder.end - 1U);
                        placeholder.directive_first_line = line_of(text, name_begin);
                        placeholder.layout = layout_at(text, i);
                        placeholder.form = literal->form;
                        placeholder.content = std::move(literal->content);
                        found = std::move(placeholder);
                        i += literal->length;
                        continue;
                    }
                }
                if (c == '(' || c == '[' || c == '{') {
                    ++depth;
                }
                else if (c == ')' || c == ']' || c == '}') {
                    if (--depth == 0U) {
                        pos = i + 1U;
                        if (found) {
                            found->directive_last_line = line_of(text, i);
                        }
                        return found;
                    }
                }
                ++i;
            }
            pos = text.size();
            return std::nullopt;
        }

        static bool holds_recorded(const inline_placeholder& placeholder, const decoded_literal& recorded) {
            bool placeholder_string = placeholder.form == placeholder_form::string_literal;
            if (placeholder_string != (recorded.form == placeholder_form::string_literal)) {
                return false;
            }
            return policy_for(placeholder.form).equivalent(placeholder.content, recorded.content);
        }

    }  // namespace detail

    std::optional<decoded_literal> decode_literal(std::string_view text) {
        if (text.size() < 2U || text[0] != '@') {
            return std::nullopt;
        }
        decoded_literal literal{};
        if (text[1] == '{') {
            auto end = detail::match_brace(text, 1U);
            if (!end) {
                return std::nullopt;
            }
            literal.length = *end;
            literal.content = std::string{text.substr(2U, *end - 3U)};
            if (utils::trim_view(literal.content).empty()) {
                literal.form = placeholder_form::empty;
            }
            else if (literal.content.find('\n') != std::string::npos) {
                literal.form = placeholder_form::expanded_brace;
            }
            else {
                literal.form = placeholder_form::compact_brace;
            }
            return literal;
        }
        if (text[1] == '"') {
            auto end = detail::skip_quoted(text, 1U, '"');
            if (end > text.size() || text[end - 1U] != '"' || end < 3U) {
                return std::nullopt;
            }
            literal.length = end;
            literal.content = detail::unescape(text.substr(2U, end - 3U));
            literal.form = placeholder_form::string_literal;
            return literal;
        }
        if (text.size() > 2U && text[1] == 'R' && text[2] == '"') {
            auto paren = text.find('(', 3U);
            if (paren == std::string_view::npos) {
                return std::nullopt;
            }
            auto delim = text.substr(3U, paren - 3U);
            std::string terminator{")"};
            terminator += delim;
            terminator += '"';
            auto close = text.find(terminator, paren + 1U);
            if (close == std::string_view::npos) {
                return std::nullopt;
            }
            literal.length = close + terminator.size();
            literal.content = std::string{text.substr(paren + 1U, close - (paren + 1U))};
            literal.form = placeholder_form::string_literal;
            return literal;
        }
        return std::nullopt;
    }

    std::vector<inline_placeholder> find_placeholders(std::string_view text, std::string_view macro) {
        std::vector<inline_placeholder> out{};
        size_t pos = 0U;
        while ((pos = text.find(macro, pos)) != std::string_view::npos) {
            size_t name_begin = pos;
            pos += macro.size();
            if (name_begin > 0U && detail::is_ident_char(text[name_begin - 1U])) {
                continue;
            }
            if (pos < text.size() && detail::is_ident_char(text[pos])) {
                continue;
            }
            auto prefix = text.substr(detail::line_start(text, name_begin), name_begin - detail::line_start(text, name_begin));
            if (prefix.find("//"sv) != std::string_view::npos || utils::trim_view(prefix).starts_with('#')) {
                continue;
            }
            size_t open = pos;
            while (open < text.size() && (utils::is_blank(text[open]) || text[open] == '\n' || text[open] == '\r')) {
                ++open;
            }
            if (open >= text.size() || text[open] != '(') {
                continue;
            }
            if (auto placeholder = detail::scan_directive(text, open, name_begin, pos)) {
                out.push_back(std::move(*placeholder));
            }
        }
        return out;
    }

    std::optional<inline_placeholder> locate_placeholder(std::string_view text, size_t line, std::string_view macro) {
        auto placeholders = find_placeholders(text, macro);
        const inline_placeholder* nearest = nullptr;
        for (const auto& placeholder : placeholders) {
            if (placeholder.directive_first_line <= line && line <= placeholder.directive_last_line) {
                return placeholder;
            }
            if (placeholder.directive_first_line <= line) {
                nearest = &placeholder;
            }
        }
        if (nearest == nullptr) {
            debug_log{"no inline directive at or before line ", line};
            return std::nullopt;
        }
        debug_log{"line ", line, " resolved to directive at line ", nearest->directive_first_line};
        return *nearest;
    }

    bool survives_stringizing(std::string_view content) {
        // the literal opens mid-line, after `@{`
        bool line_open = true;
        int parens = 0;
        size_t i = 0U;
        while (i < content.size()) {
            char c = content[i];
            char next = i + 1U < content.size() ? content[i + 1U] : '\0';
            if (c == '\n') {
                line_open = false;
                ++i;
                continue;
            }
            if (utils::is_blank(c) || c == '\r') {
                ++i;
                continue;
            }
            if (c == '#' && !line_open) {
                return false;
            }
            line_open = true;
            if (c == '\\' || (c == '/' && (next == '/' || next == '*'))) {
                return false;
            }
            if (detail::is_ident_char(c)) {
                auto end = detail::skip_word(content, i);
                auto word = content.substr(i, end - i);
                char after = end < content.size() ? content[end] : '\0';
                if ((after == '"' || after == '#') && detail::is_raw_string_prefix(word)) {
                    return false;
                }
                // a digit separator would swallow the quote into the pp-number
                if (after == '\'' && word.front() >= '0' && word.front() <= '9') {
                    return false;
                }
                i = end;
                continue;
            }
            if (c == '"') {
                size_t j = i + 1U;
                while (j < content.size() && content[j] != '"') {
                    if (content[j] == '\n') {
                        return false;
                    }
                    if (content[j] == '\\') {
                        if (j + 1U < content.size() && (content[j + 1U] == '\n' || content[j + 1U] == '\r')) {
                            return false;
                        }
                        ++j;
                    }
                    ++j;
                }
                if (j >= content.size()) {
                    return false;
                }
                i = j + 1U;
                continue;
            }
            if (c == '\'') {
                // char literals only; a lifetime leaves the quote open
                auto close = content.find('\'', next == '\\' ? i + 3U : i + 2U);
                if (close == std::string_view::npos) {
                    return false;
                }
                auto body = content.substr(i + 1U, close - i - 1U);
                if (body.find_first_of(" \t\r\n"sv) != std::string_view::npos || (body.front() != '\\' && body.size() > 4U)) {
                    return false;
                }
                i = close + 1U;
                continue;
            }
            if (c == '(') {
                ++parens;
            }
            else if (c == ')' && --parens < 0) {
                return false;
            }
            ++i;
        }
        return parens == 0;
    }

    bool token_literal_policy::equivalent(std::string_view existing, std::string_view proposed) const {
        try {
            return tokens_equal(existing, proposed);
        } catch (const tokenize_error& e) {
            debug_log{"literal content does not tokenize: ", e.what()};
            return false;
        }
    }

    std::string token_literal_policy::format(std::string_view content, const literal_layout& layout) const {
        if (!survives_stringizing(content)) {
            return string_literal_policy{}.format(content, layout);
        }
        if (content.find('\n') == std::string_view::npos) {
            auto trimmed = utils::trim_view(content);
            return trimmed.empty() ? std::string{"@{}"} : "@{ " + std::string{trimmed} + " }";
        }
        return "@{" + detail::expanded_body(content, layout) + "}";
    }

    placeholder_form token_literal_policy::form_for(std::string_view content) const {
        if (!survives_stringizing(content)) {
            return placeholder_form::string_literal;
        }
        if (content.find('\n') != std::string_view::npos) {
            return placeholder_form::expanded_brace;
        }
        return utils::trim_view(content).empty() ? placeholder_form::empty : placeholder_form::compact_brace;
    }

    bool string_literal_policy::equivalent(std::string_view existing, std::string_view proposed) const {
        return normalize_inline_content(existing) == normalize_inline_content(proposed);
    }

    std::string string_literal_policy::format(std::string_view content, const literal_layout& layout) const {
        if (content.find('\n') == std::string_view::npos) {
            return "@\"" + detail::escape(content) + "\"";
        }
        auto body = detail::expanded_body(content, layout);
        std::string delim{};
        while (body.find(")" + delim + "\"") != std::string::npos) {
            delim = delim.empty() ? std::string{"snap"} : delim + "_";
        }
        return "@R\"" + delim + "(" + body + ")" + delim + "\"";
    }

    placeholder_form string_literal_policy::form_for(std::string_view) const {
        return placeholder_form::string_literal;
    }

    const literal_policy& policy_for(placeholder_form form) {
        static const token_literal_policy tokens{};
        static const string_literal_policy strings{};
        if (form == placeholder_form::string_literal) {
            return strings;
        }
        return tokens;
    }

    std::string normalize_inline_content(std::string_view content) {
        if (content.find('\n') == std::string_view::npos) {
            return std::string{content};
        }
        auto lines = utils::split_lines(utils::trim_right_view(content));
        if (!lines.empty() && utils::trim_view(lines.front()).empty()) {
            lines.erase(lines.begin());
        }
        size_t common = std::string_view::npos;
        for (auto line : lines) {
            if (utils::trim_view(line).empty()) {
                continue;
            }
            auto first = line.find_first_not_of(" \t");
            common = std::min(common, first);
        }
        std::string out{};
        for (size_t i = 0U; i < lines.size(); ++i) {
            if (i != 0U) {
                out += '\n';
            }
            auto line = lines[i];
            if (common != std::string_view::npos && line.size() >= common) {
                line.remove_prefix(common);
            }
            out += utils::trim_right_view(line);
        }
        return out;
    }

    std::optional<text_edit> plan_patch(
            std::string_view text,
            const inline_placeholder& placeholder,
            std::string_view new_content,
            const literal_policy& policy) {
        if (placeholder.end > text.size() || placeholder.begin >= placeholder.end || text[placeholder.begin] != '@') {
            throw std::runtime_error(
                    "placeholder span [{}, {}) does not match {}"_format(
                            placeholder.begin, placeholder.end, placeholder.file.string()));
        }
        if (policy.equivalent(placeholder.content, new_content)) {
            debug_log{"placeholder at line ", placeholder.first_line, " already up to date"};
            return std::nullopt;
        }
        return text_edit{
                .begin = placeholder.begin,
                .end = placeholder.end,
                .replacement = policy.format(new_content, placeholder.layout)};
    }

    std::string apply_edits(std::string_view text, std::vector<text_edit> edits) {
        std::ranges::sort(edits, std::ranges::greater{}, &text_edit::begin);
        for (size_t i = 0U; i < edits.size(); ++i) {
            const auto& edit = edits[i];
            if (edit.begin > edit.end || edit.end > text.size()) {
                throw std::runtime_error("edit span [{}, {}) out of range"_format(edit.begin, edit.end));
            }
            if (i > 0U && edit.end > edits[i - 1U].begin) {
                throw std::runtime_error(
                        "overlapping edits at [{}, {}) and [{}, {})"_format(
                                edit.begin, edit.end, edits[i - 1U].begin, edits[i - 1U].end));
            }
        }
        std::string out{text};
        for (const auto& edit : edits) {
            out.replace(edit.begin, edit.end - edit.begin, edit.replacement);
        }
        return out;
    }

    bool patch_report::all_succeeded() const {
        return failure_count() == 0U;
    }

    size_t patch_report::failure_count() const {
        return static_cast<size_t>(std::ranges::count_if(files, [](const file_patch_result& r) { return !r.success; }));
    }

    std::string read_source_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read {}"_format(path.string()));
        }
        return ss.str();
    }

    void write_all(int fd, std::string_view data, const fs::path& path) {
        while (!data.empty()) {
            auto n = ::write(fd, data.data(), data.size());
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::runtime_error("failed to write {}: {}"_format(path.string(), std::strerror(errno)));
            }
            data.remove_prefix(static_cast<size_t>(n));
        }
    }

    void write_file_atomic(const fs::path& path, std::string_view contents) {
        auto tmp = path;
        tmp += ".{}.tmp"_format(::getpid());

        mode_t mode = 0644;
        if (struct stat st{}; ::stat(path.c_str(), &st) == 0) {
            mode = st.st_mode & 07777;
        }

        int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
        if (fd < 0) {
            throw std::runtime_error("failed to open {}: {}"_format(tmp.string(), std::strerror(errno)));
        }
        auto discard = [&tmp] {
            std::error_code ignored{};
            fs::remove(tmp, ignored);
        };
        try {
            write_all(fd, contents, tmp);
            if (::fsync(fd) != 0) {
                throw std::runtime_error("failed to sync {}: {}"_format(tmp.string(), std::strerror(errno)));
            }
        } catch (const std::runtime_error&) {
            ::close(fd);
            discard();
            throw;
        }
        if (::close(fd) != 0) {
            auto reason = std::strerror(errno);
            discard();
            throw std::runtime_error("failed to close {}: {}"_format(tmp.string(), reason));
        }

        std::error_code ec{};
        fs::rename(tmp, path, ec);
        if (ec) {
            discard();
            throw std::runtime_error("failed to replace {}: {}"_format(path.string(), ec.message()));
        }
    }

    patch_report apply_pending_updates(const std::vector<pending_update>& updates, std::string_view macro) {
        std::vector<fs::path> order{};
        std::map<fs::path, std::vector<const pending_update*>> by_file{};
        for (const auto& update : updates) {
            auto [it, inserted] = by_file.try_emplace(update.file);
            if (inserted) {
                order.push_back(update.file);
            }
            it->second.push_back(&update);
        }

        patch_report report{};
        for (const auto& path : order) {
            file_patch_result result{.file = path};
            try {
                auto text = read_source_file(path);
                std::map<size_t, text_edit> edits{};
                for (const auto* update : by_file[path]) {
                    auto placeholder = locate_placeholder(text, update->line, macro);
                    if (!placeholder) {
                        throw std::runtime_error(
                                "no inline snapshot directive near {}:{}"_format(path.string(), update->line));
                    }
                    placeholder->file = path;
                    if (!update->old_text.empty()) {
                        auto recorded = decode_literal(utils::trim_view(update->old_text));
                        if (!recorded || !detail::holds_recorded(*placeholder, *recorded)) {
                            throw std::runtime_error(
                                    "inline snapshot near {}:{} no longer holds the recorded literal"_format(
                                            path.string(), update->line));
                        }
                    }
                    // the latest update of a placeholder wins
                    auto edit = plan_patch(text, *placeholder, update->new_text, policy_for(placeholder->form));
                    if (edit) {
                        edits.insert_or_assign(placeholder->begin, std::move(*edit));
                    }
                    else {
                        edits.erase(placeholder->begin);
                    }
                }

                std::vector<text_edit> combined{};
                for (auto& [begin, edit] : edits) {
                    combined.push_back(std::move(edit));
                }
                result.applied = combined.size();
                if (!combined.empty()) {
                    auto updated = apply_edits(text, std::move(combined));
                    if (updated != text) {
                        write_file_atomic(path, updated);
                        result.changed = true;
                    }
                }
                result.success = true;
                debug_log{"patched ", path.string(), " (", result.applied, " edits)"};
            } catch (const std::exception& e) {
                result.error = e.what();
                debug_log{"failed to patch ", path.string(), ": ", result.error};
            }
            report.files.push_back(std::move(result));
        }
        return report;
    }

}  // namespace tokensnap
