#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tokensnap {

    using namespace std::string_view_literals;

    // Macro name that introduces inline snapshot directives in test sources
    inline constexpr auto default_directive_macro = "TOKENSNAP_ASSERT_SNAPSHOT"sv;

    enum class placeholder_form : uint8_t { empty, compact_brace, expanded_brace, string_literal };

    constexpr std::string_view to_string(placeholder_form form) {
        switch (form) {
            case placeholder_form::empty:
                return "empty"sv;
            case placeholder_form::compact_brace:
                return "compact_brace"sv;
            case placeholder_form::expanded_brace:
                return "expanded_brace"sv;
            case placeholder_form::string_literal:
                return "string_literal"sv;
        }
        return "empty"sv;
    }

    inline constexpr bool try_parse_placeholder_form(std::string_view text, placeholder_form& out) {
        for (auto form : {placeholder_form::empty,
                          placeholder_form::compact_brace,
                          placeholder_form::expanded_brace,
                          placeholder_form::string_literal}) {
            if (utils::str_case_eq(text, to_string(form))) {
                out = form;
                return true;
            }
        }
        return false;
    }

    // Whitespace prefix and line terminator of the source line holding a literal's `@`
    struct literal_layout {
        std::string indentation{};
        std::string newline{"\n"};
    };

    /*
     * The embedded `@...` literal of one inline directive.
     *
     * `begin`/`end` delimit the literal from its `@` through the closing delimiter. Line numbers are
     * 1-based; `directive_first_line`/`directive_last_line` span the whole macro invocation. `layout`
     * is copied from the line holding the `@`. `content` is the captured text:
     * the brace interior verbatim, or the decoded string value.
     */
    struct inline_placeholder {
        std::filesystem::path file{};
        size_t begin{};
        size_t end{};
        size_t first_line{};
        size_t last_line{};
        size_t directive_first_line{};
        size_t directive_last_line{};
        literal_layout layout{};
        placeholder_form form{placeholder_form::empty};
        std::string content{};
    };

    struct decoded_literal {
        placeholder_form form{placeholder_form::empty};
        std::string content{};
        size_t length{};
    };

    // Decodes a literal starting at its `@`; nullopt when the text is not a well-formed literal
    std::optional<decoded_literal> decode_literal(std::string_view text);

    // Every directive of `macro` in `text` that carries an inline literal, in source order
    std::vector<inline_placeholder> find_placeholders(std::string_view text, std::string_view macro);

    // The directive whose line span contains `line`, else the closest one starting before it
    std::optional<inline_placeholder> locate_placeholder(std::string_view text, size_t line, std::string_view macro);

    /*
     * Chooses how new content is written into a literal.
     *
     * `equivalent` decides idempotence: equivalent content produces no edit. `format` returns the complete
     * replacement text for the placeholder, starting with `@`, laid out with the given line prefix and terminator.
     */
    class literal_policy {
      public:
        virtual ~literal_policy() = default;

        virtual bool equivalent(std::string_view existing, std::string_view proposed) const = 0;
        virtual std::string format(std::string_view content, const literal_layout& layout) const = 0;
        virtual placeholder_form form_for(std::string_view content) const = 0;
    };

    /*
     * `@{}`, `@{ content }`, or the expanded brace block; equivalence is `tokens_equal`.
     *
     * The literal reaches the program through `#__VA_ARGS__`, so content that would not survive
     * preprocessing (line comments, unbalanced quotes, a `#` opening a line, Rust raw strings) is written
     * as a string literal instead.
     */
    class token_literal_policy final : public literal_policy {
      public:
        bool equivalent(std::string_view existing, std::string_view proposed) const override;
        std::string format(std::string_view content, const literal_layout& layout) const override;
        placeholder_form form_for(std::string_view content) const override;
    };

    // `@"..."` for single-line values, `@R"(...)"` laid out like the expanded brace block otherwise
    class string_literal_policy final : public literal_policy {
      public:
        bool equivalent(std::string_view existing, std::string_view proposed) const override;
        std::string format(std::string_view content, const literal_layout& layout) const override;
        placeholder_form form_for(std::string_view content) const override;
    };

    // Whether `@{content}` keeps its spelling when a macro argument holding it is stringized
    bool survives_stringizing(std::string_view content);

    // The policy matching an existing placeholder's form
    const literal_policy& policy_for(placeholder_form form);

    // Strips the "\n...\n" wrapper of multi-line literal content and removes the common indentation
    std::string normalize_inline_content(std::string_view content);

    struct text_edit {
        size_t begin{};
        size_t end{};
        std::string replacement{};
    };

    // nullopt when the placeholder already holds equivalent content
    std::optional<text_edit> plan_patch(
            std::string_view text,
            const inline_placeholder& placeholder,
            std::string_view new_content,
            const literal_policy& policy);

    // Applies non-overlapping edits in descending order; throws std::runtime_error on overlap or bad spans
    std::string apply_edits(std::string_view text, std::vector<text_edit> edits);

    struct pending_update {
        std::filesystem::path file{};
        size_t line{};
        std::string old_text{};
        std::string new_text{};
        placeholder_form form{placeholder_form::empty};
        std::string expression{};
    };

    struct file_patch_result {
        std::filesystem::path file{};
        bool success{false};
        bool changed{false};
        size_t applied{};
        std::string error{};
    };

    struct patch_report {
        std::vector<file_patch_result> files{};

        bool all_succeeded() const;
        size_t failure_count() const;
    };

    /*
     * Applies pending inline updates. Updates are grouped per file; every placeholder of a file is located
     * against one read of that file, the edits are combined and the result is written through a temporary
     * file in the same directory followed by a rename. A failure in one file does not stop the others.
     */
    patch_report apply_pending_updates(
            const std::vector<pending_update>& updates, std::string_view macro = default_directive_macro);

    std::string read_source_file(const std::filesystem::path& path);

    // Writes all of `data` to `fd`, retrying on EINTR; throws std::runtime_error naming `path`
    void write_all(int fd, std::string_view data, const std::filesystem::path& path);

    /*
     * Writes `<path>.<pid>.tmp`, syncs and closes it, then renames it over `path`, so readers never observe a
     * partial file. On any failure the temporary file is removed and std::runtime_error is thrown with
     * `path` untouched.
     */
    void write_file_atomic(const std::filesystem::path& path, std::string_view contents);

}  // namespace tokensnap
