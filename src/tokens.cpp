#include "tokensnap/tokens.hpp"

#include "tokensnap/format.hpp"

#include <optional>

using namespace tokensnap::literals;

namespace tokensnap {

    tokenize_error::tokenize_error(const std::string& message, size_t line, size_t column)
            : std::runtime_error{"{}:{}: {}"_format(line, column, message)}, line_{line}, column_{column} {}

    namespace detail {

        static constexpr bool is_ident_start(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
                   static_cast<unsigned char>(c) >= 0x80U;
        }

        static constexpr bool is_ident_continue(char c) {
            return is_ident_start(c) || (c >= '0' && c <= '9');
        }

        static constexpr bool is_digit(char c) {
            return c >= '0' && c <= '9';
        }

        static constexpr bool is_whitespace(char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        static std::string escape_doc_text(std::string_view text) {
            std::string out{};
            out.reserve(text.size() + 2U);
            out.push_back('"');
            for (char c : text) {
                switch (c) {
                    case '"':
                        out += "\\\"";
                        break;
                    case '\\':
                        out += "\\\\";
                        break;
                    case '\n':
                        out += "\\n";
                        break;
                    case '\r':
                        out += "\\r";
                        break;
                    case '\t':
                        out += "\\t";
                        break;
                    default:
                        out.push_back(c);
                        break;
                }
            }
            out.push_back('"');
            return out;
        }

        struct open_group {
            delimiter delim{};
            size_t line{};
            size_t column{};
            std::vector<token_tree> trees{};
        };

        class lexer {
          public:
            explicit lexer(std::string_view source) : src_{source} {}

            std::vector<token_tree> run() {
                stack_.push_back(open_group{});
                while (true) {
                    skip_trivia();
                    if (at_end()) {
                        break;
                    }
                    lex_token();
                }
                if (stack_.size() > 1U) {
                    auto& unclosed = stack_.back();
                    throw tokenize_error{
                            "unclosed delimiter `{}`"_format(open_char(unclosed.delim)), unclosed.line, unclosed.column};
                }
                return std::move(stack_.back().trees);
            }

          private:
            bool at_end() const { return pos_ >= src_.size(); }

            char peek(size_t n = 0U) const { return pos_ + n < src_.size() ? src_[pos_ + n] : '\0'; }

            bool starts_with(std::string_view prefix) const { return src_.substr(pos_).starts_with(prefix); }

            void advance(size_t n = 1U) {
                for (size_t i = 0U; i < n && !at_end(); ++i) {
                    if (src_[pos_] == '\n') {
                        ++line_;
                        column_ = 1U;
                    }
                    else {
                        ++column_;
                    }
                    ++pos_;
                }
            }

            [[noreturn]] void fail(std::string_view message, size_t line, size_t column) const {
                throw tokenize_error{std::string{message}, line, column};
            }

            void push(token_tree tree) { stack_.back().trees.push_back(std::move(tree)); }

            void push_punct(char c, spacing s) {
                push(token_tree{.kind = token_kind::punct, .text = std::string(1U, c), .punct_spacing = s});
            }

            void push_doc(std::string_view text, bool inner) {
                push_punct('#', spacing::alone);
                if (inner) {
                    push_punct('!', spacing::alone);
                }
                token_tree group{.kind = token_kind::group, .delim = delimiter::bracket};
                group.children.push_back(token_tree{.kind = token_kind::ident, .text = "doc"});
                group.children.push_back(
                        token_tree{.kind = token_kind::punct, .text = "=", .punct_spacing = spacing::alone});
                group.children.push_back(token_tree{.kind = token_kind::literal, .text = escape_doc_text(text)});
                push(std::move(group));
            }

            void skip_trivia() {
                while (!at_end()) {
                    auto c = peek();
                    if (is_whitespace(c)) {
                        advance();
                        continue;
                    }
                    if (starts_with("//"sv)) {
                        if (lex_line_doc()) {
                            continue;
                        }
                        while (!at_end() && peek() != '\n') {
                            advance();
                        }
                        continue;
                    }
                    if (starts_with("/*"sv)) {
                        lex_block_comment();
                        continue;
                    }
                    return;
                }
            }

            // `///` and `//!` become doc attributes; `////` is an ordinary comment
            bool lex_line_doc() {
                bool outer = starts_with("///"sv) && !starts_with("////"sv);
                bool inner = starts_with("//!"sv);
                if (!outer && !inner) {
                    return false;
                }
                advance(3U);
                auto start = pos_;
                while (!at_end() && peek() != '\n') {
                    advance();
                }
                auto text = src_.substr(start, pos_ - start);
                if (text.ends_with('\r')) {
                    text.remove_suffix(1U);
                }
                push_doc(text, inner);
                return true;
            }

            void lex_block_comment() {
                auto line = line_;
                auto column = column_;
                bool outer = starts_with("/**"sv) && !starts_with("/***"sv) && !starts_with("/**/"sv);
                bool inner = starts_with("/*!"sv);
                advance(2U);
                auto body_start = pos_;
                if (outer || inner) {
                    advance();
                    body_start = pos_;
                }
                size_t depth = 1U;
                size_t body_end = pos_;
                while (depth > 0U) {
                    if (at_end()) {
                        fail("unterminated block comment"sv, line, column);
                    }
                    if (starts_with("/*"sv)) {
                        ++depth;
                        advance(2U);
                        continue;
                    }
                    if (starts_with("*/"sv)) {
                        --depth;
                        body_end = pos_;
                        advance(2U);
                        continue;
                    }
                    advance();
                }
                if (outer || inner) {
                    push_doc(src_.substr(body_start, body_end - body_start), inner);
                }
            }

            void lex_token() {
                auto c = peek();
                switch (c) {
                    case '(':
                        open(delimiter::parenthesis);
                        return;
                    case '[':
                        open(delimiter::bracket);
                        return;
                    case '{':
                        open(delimiter::brace);
                        return;
                    case ')':
                        close(delimiter::parenthesis);
                        return;
                    case ']':
                        close(delimiter::bracket);
                        return;
                    case '}':
                        close(delimiter::brace);
                        return;
                    default:
                        break;
                }

                if (c == '"') {
                    lex_quoted('"', 1U);
                    return;
                }
                if (c == '\'') {
                    lex_quote_or_lifetime();
                    return;
                }
                if (is_digit(c)) {
                    lex_number();
                    return;
                }
                if (lex_prefixed_literal()) {
                    return;
                }
                if (is_ident_start(c)) {
                    lex_ident();
                    return;
                }
                if (is_punct_char(c)) {
                    advance();
                    auto next_is_punct = is_punct_char(peek()) && !starts_with("//"sv) && !starts_with("/*"sv);
                    push_punct(c, next_is_punct ? spacing::joint : spacing::alone);
                    return;
                }
                fail("unknown start of token `{}`"_format(c), line_, column_);
            }

            void open(delimiter delim) {
                stack_.push_back(open_group{.delim = delim, .line = line_, .column = column_});
                advance();
            }

            void close(delimiter delim) {
                if (stack_.size() == 1U) {
                    fail("unexpected closing delimiter `{}`"_format(close_char(delim)), line_, column_);
                }
                if (stack_.back().delim != delim) {
                    fail("mismatched closing delimiter `{}`"_format(close_char(delim)), line_, column_);
                }
                advance();
                auto finished = std::move(stack_.back());
                stack_.pop_back();
                push(token_tree{
                        .kind = token_kind::group, .delim = finished.delim, .children = std::move(finished.trees)});
            }

            // Consumes a quoted literal whose opening quote sits `prefix_len - 1` characters ahead
            void lex_quoted(char quote, size_t prefix_len) {
                auto line = line_;
                auto column = column_;
                auto start = pos_;
                advance(prefix_len);
                while (true) {
                    if (at_end()) {
                        fail(quote == '"' ? "unterminated double quote string"sv : "unterminated character literal"sv,
                             line,
                             column);
                    }
                    auto c = peek();
                    if (c == '\\') {
                        advance(2U);
                        continue;
                    }
                    if (c == quote) {
                        advance();
                        break;
                    }
                    if (quote == '\'' && c == '\n') {
                        fail("unterminated character literal"sv, line, column);
                    }
                    advance();
                }
                lex_suffix();
                push(token_tree{.kind = token_kind::literal, .text = std::string{src_.substr(start, pos_ - start)}});
            }

            // r"..", r#".."#, br"..", cr".."; `prefix_len` covers the letters before the hashes
            void lex_raw_string(size_t prefix_len) {
                auto line = line_;
                auto column = column_;
                auto start = pos_;
                advance(prefix_len);
                size_t hashes = 0U;
                while (peek() == '#') {
                    ++hashes;
                    advance();
                }
                if (peek() != '"') {
                    fail("expected `\"` in raw string literal"sv, line, column);
                }
                advance();
                auto terminator = "\"" + std::string(hashes, '#');
                while (!starts_with(terminator)) {
                    if (at_end()) {
                        fail("unterminated raw string"sv, line, column);
                    }
                    advance();
                }
                advance(terminator.size());
                lex_suffix();
                push(token_tree{.kind = token_kind::literal, .text = std::string{src_.substr(start, pos_ - start)}});
            }

            bool lex_prefixed_literal() {
                auto c = peek();
                auto n1 = peek(1U);
                auto n2 = peek(2U);
                if (c == 'r' && (n1 == '"' || (n1 == '#' && (n2 == '"' || n2 == '#')))) {
                    lex_raw_string(1U);
                    return true;
                }
                if ((c == 'b' || c == 'c') && n1 == 'r' && (n2 == '"' || n2 == '#')) {
                    lex_raw_string(2U);
                    return true;
                }
                if ((c == 'b' || c == 'c') && n1 == '"') {
                    lex_quoted('"', 2U);
                    return true;
                }
                if (c == 'b' && n1 == '\'') {
                    lex_quoted('\'', 2U);
                    return true;
                }
                return false;
            }

            void lex_ident() {
                auto start = pos_;
                if (peek() == 'r' && peek(1U) == '#' && is_ident_start(peek(2U))) {
                    advance(2U);
                }
                while (!at_end() && is_ident_continue(peek())) {
                    advance();
                }
                push(token_tree{.kind = token_kind::ident, .text = std::string{src_.substr(start, pos_ - start)}});
            }

            size_t utf8_length(char lead) const {
                auto byte = static_cast<unsigned char>(lead);
                if (byte >= 0xF0U) {
                    return 4U;
                }
                if (byte >= 0xE0U) {
                    return 3U;
                }
                if (byte >= 0xC0U) {
                    return 2U;
                }
                return 1U;
            }

            // 'x' and '\n' are character literals, 'a without a closing quote is a lifetime
            void lex_quote_or_lifetime() {
                auto next = peek(1U);
                if (next == '\\') {
                    lex_quoted('\'', 1U);
                    return;
                }
                auto width = utf8_length(next);
                if (next != '\0' && next != '\'' && peek(1U + width) == '\'') {
                    lex_quoted('\'', 1U);
                    return;
                }
                if (is_ident_start(next)) {
                    advance();
                    push_punct('\'', spacing::joint);
                    lex_ident();
                    return;
                }
                fail("unterminated character literal"sv, line_, column_);
            }

            void lex_suffix() {
                if (is_ident_start(peek())) {
                    while (!at_end() && is_ident_continue(peek())) {
                        advance();
                    }
                }
            }

            void lex_digits(bool hex) {
                while (!at_end()) {
                    auto c = peek();
                    bool hex_digit = hex && ((c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'));
                    if (!is_digit(c) && c != '_' && !hex_digit) {
                        break;
                    }
                    advance();
                }
            }

            void lex_number() {
                auto start = pos_;
                if (peek() == '0' && (peek(1U) == 'x' || peek(1U) == 'o' || peek(1U) == 'b')) {
                    bool hex = peek(1U) == 'x';
                    advance(2U);
                    lex_digits(hex);
                    lex_suffix();
                    push(token_tree{
                            .kind = token_kind::literal, .text = std::string{src_.substr(start, pos_ - start)}});
                    return;
                }

                lex_digits(false);
                // `1.` is a float unless followed by another dot or an identifier (`1..2`, `1.max(2)`)
                if (peek() == '.' && peek(1U) != '.' && !is_ident_start(peek(1U))) {
                    advance();
                    lex_digits(false);
                }
                if ((peek() == 'e' || peek() == 'E') &&
                    (is_digit(peek(1U)) || ((peek(1U) == '+' || peek(1U) == '-') && is_digit(peek(2U))))) {
                    advance(2U);
                    lex_digits(false);
                }
                lex_suffix();
                push(token_tree{.kind = token_kind::literal, .text = std::string{src_.substr(start, pos_ - start)}});
            }

            std::string_view src_;
            size_t pos_{0U};
            size_t line_{1U};
            size_t column_{1U};
            std::vector<open_group> stack_{};
        };

        static void write_tree(std::string& out, const token_tree& tree);

        static void write_trees(std::string& out, const std::vector<token_tree>& trees) {
            bool joint = false;
            for (size_t i = 0U; i < trees.size(); ++i) {
                if (i != 0U && !joint) {
                    out.push_back(' ');
                }
                write_tree(out, trees[i]);
                joint = trees[i].is_joint();
            }
        }

        static void write_tree(std::string& out, const token_tree& tree) {
            if (tree.kind != token_kind::group) {
                out += tree.text;
                return;
            }
            out.push_back(open_char(tree.delim));
            if (tree.delim == delimiter::brace) {
                out.push_back(' ');
            }
            write_trees(out, tree.children);
            if (tree.delim == delimiter::brace && !tree.children.empty()) {
                out.push_back(' ');
            }
            out.push_back(close_char(tree.delim));
        }

    }  // namespace detail

    token_stream token_stream::parse(std::string_view source) {
        return token_stream{detail::lexer{source}.run()};
    }

    std::string to_raw_string(const std::vector<token_tree>& trees) {
        std::string out{};
        detail::write_trees(out, trees);
        return out;
    }

    std::string token_stream::to_string() const {
        return to_raw_string(trees_);
    }

}  // namespace tokensnap
