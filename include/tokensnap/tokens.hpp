#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tokensnap {

    using namespace std::string_view_literals;

    enum class token_kind : uint8_t { group, ident, punct, literal };
    enum class delimiter : uint8_t { parenthesis, brace, bracket };
    enum class spacing : uint8_t { alone, joint };

    constexpr std::string_view to_string(delimiter delim) {
        switch (delim) {
            case delimiter::parenthesis:
                return "()"sv;
            case delimiter::brace:
                return "{}"sv;
            case delimiter::bracket:
                return "[]"sv;
        }
        return "()"sv;
    }

    constexpr char open_char(delimiter delim) {
        return to_string(delim)[0];
    }

    constexpr char close_char(delimiter delim) {
        return to_string(delim)[1];
    }

    /*
     * One node of a token tree.
     *
     * - ident: identifier or keyword in `text` (raw identifiers keep their `r#` prefix)
     * - punct: a single punctuation character in `text`; `punct_spacing` is joint when the
     *   next source character is punctuation as well (`->` is '-' joint, '>' alone)
     * - literal: verbatim literal text, quotes and suffixes included
     * - group: `delim` plus the nested trees in `children`
     */
    struct token_tree {
        token_kind kind{token_kind::ident};
        std::string text{};
        spacing punct_spacing{spacing::alone};
        delimiter delim{delimiter::parenthesis};
        std::vector<token_tree> children{};

        bool is_ident(std::string_view value) const { return kind == token_kind::ident && text == value; }
        bool is_punct(char c) const { return kind == token_kind::punct && text.size() == 1U && text[0] == c; }
        bool is_group(delimiter d) const { return kind == token_kind::group && delim == d; }
        bool is_joint() const { return kind == token_kind::punct && punct_spacing == spacing::joint; }

        bool operator==(const token_tree&) const = default;
    };

    // Raised when source text cannot be split into balanced token trees
    class tokenize_error : public std::runtime_error {
      public:
        tokenize_error(const std::string& message, size_t line, size_t column);

        size_t line() const noexcept { return line_; }
        size_t column() const noexcept { return column_; }

      private:
        size_t line_;
        size_t column_;
    };

    class token_stream {
      public:
        static constexpr bool to_string_formattable = true;

        token_stream() = default;
        explicit token_stream(std::vector<token_tree> trees) : trees_{std::move(trees)} {}

        // Throws tokenize_error on unterminated literals, comments or unbalanced delimiters
        static token_stream parse(std::string_view source);

        const std::vector<token_tree>& trees() const { return trees_; }
        bool empty() const { return trees_.empty(); }
        size_t size() const { return trees_.size(); }

        // Canonical raw rendering: single spaces between tokens except after joint punctuation
        std::string to_string() const;

        bool operator==(const token_stream&) const = default;

      private:
        std::vector<token_tree> trees_{};
    };

    std::string to_raw_string(const std::vector<token_tree>& trees);

    constexpr bool is_punct_char(char c) {
        return "~!@#$%^&*-=+|;:,<.>/?'"sv.find(c) != std::string_view::npos;
    }

}  // namespace tokensnap
