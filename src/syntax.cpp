#include "tokensnap/syntax.hpp"

#include "tokensnap/utils.hpp"

#include <algorithm>
#include <array>
#include <span>

namespace tokensnap::syntax {

    namespace detail {

        using namespace std::string_view_literals;

        static constexpr std::array reserved_words{
                "as"sv,    "async"sv,  "await"sv,  "break"sv, "const"sv,  "continue"sv, "dyn"sv,  "else"sv,
                "enum"sv,  "extern"sv, "false"sv,  "fn"sv,    "for"sv,    "if"sv,       "impl"sv, "in"sv,
                "let"sv,   "loop"sv,   "match"sv,  "mod"sv,   "move"sv,   "mut"sv,      "pub"sv,  "ref"sv,
                "return"sv, "static"sv, "struct"sv, "trait"sv, "true"sv,  "type"sv,     "unsafe"sv, "use"sv,
                "where"sv, "while"sv,  "self"sv,   "Self"sv,  "super"sv,  "crate"sv};

        static constexpr std::array path_keywords{"self"sv, "Self"sv, "super"sv, "crate"sv};

        // Binary operators by precedence; `as` (12) is handled separately
        struct binary_op {
            std::string_view text;
            int precedence;
        };

        static constexpr std::array binary_ops{
                binary_op{"||"sv, 3},
                binary_op{"&&"sv, 4},
                binary_op{"=="sv, 5},
                binary_op{"!="sv, 5},
                binary_op{"<="sv, 5},
                binary_op{">="sv, 5},
                binary_op{"<<"sv, 9},
                binary_op{">>"sv, 9},
                binary_op{"<"sv, 5},
                binary_op{">"sv, 5},
                binary_op{"|"sv, 6},
                binary_op{"^"sv, 7},
                binary_op{"&"sv, 8},
                binary_op{"+"sv, 10},
                binary_op{"-"sv, 10},
                binary_op{"*"sv, 11},
                binary_op{"/"sv, 11},
                binary_op{"%"sv, 11},
        };

        static constexpr std::array assign_ops{
                "<<="sv, ">>="sv, "+="sv, "-="sv, "*="sv, "/="sv, "%="sv, "^="sv, "&="sv, "|="sv};

        static constexpr int cast_precedence = 12;
        static constexpr int comparison_precedence = 5;

        static bool is_reserved(std::string_view word) {
            return std::ranges::find(reserved_words, word) != reserved_words.end();
        }

        static bool is_path_keyword(std::string_view word) {
            return std::ranges::find(path_keywords, word) != path_keywords.end();
        }

        static syntax_node make(node_kind kind, std::string text = {}) {
            return syntax_node{.kind = kind, .text = std::move(text)};
        }

        static syntax_node none() {
            return syntax_node{};
        }

        static bool is_block_like(const syntax_node& expr) {
            switch (expr.kind) {
                case node_kind::expr_block:
                case node_kind::expr_if:
                case node_kind::expr_while:
                case node_kind::expr_loop:
                case node_kind::expr_for:
                case node_kind::expr_match:
                    return true;
                default:
                    return false;
            }
        }

        static std::string path_to_string(const syntax_node& path) {
            std::string out = path.modifier;
            for (size_t i = 0U; i < path.children.size(); ++i) {
                if (i != 0U) {
                    out += "::";
                }
                out += path.children[i].text;
            }
            return out;
        }

        struct parse_state {
            std::optional<std::string> error{};
        };

        class parser {
          public:
            parser(std::span<const token_tree> tokens, parse_state& state) : tokens_{tokens}, state_{state} {}

            bool failed() const { return state_.error.has_value(); }
            bool at_end() const { return pos_ >= tokens_.size(); }

            syntax_node parse_file() {
                auto file = make(node_kind::file);
                parse_inner_attrs(file.children);
                while (!at_end() && !failed()) {
                    auto attrs = parse_outer_attrs();
                    file.children.push_back(parse_item(std::move(attrs)));
                }
                return file;
            }

            syntax_node parse_expr(bool no_struct = false) { return parse_assign(no_struct); }

            void finish() {
                if (!at_end() && !state_.error) {
                    state_.error = "unexpected trailing tokens starting at `" + peek()->text + "`";
                    pos_ = tokens_.size();
                }
            }

          private:
            // ── cursor ────────────────────────────────────────────────────

            const token_tree* peek(size_t n = 0U) const {
                return pos_ + n < tokens_.size() ? &tokens_[pos_ + n] : nullptr;
            }

            bool peek_ident(std::string_view word, size_t n = 0U) const {
                auto* t = peek(n);
                return t != nullptr && t->is_ident(word);
            }

            bool peek_any_ident(size_t n = 0U) const {
                auto* t = peek(n);
                return t != nullptr && t->kind == token_kind::ident;
            }

            bool peek_name(size_t n = 0U) const {
                auto* t = peek(n);
                return t != nullptr && t->kind == token_kind::ident && !is_reserved(t->text);
            }

            bool peek_punct(char c, size_t n = 0U) const {
                auto* t = peek(n);
                return t != nullptr && t->is_punct(c);
            }

            bool peek_group(delimiter d, size_t n = 0U) const {
                auto* t = peek(n);
                return t != nullptr && t->is_group(d);
            }

            bool peek_any_group(size_t n = 0U) const {
                auto* t = peek(n);
                return t != nullptr && t->kind == token_kind::group;
            }

            bool peek_literal(size_t n = 0U) const {
                auto* t = peek(n);
                return t != nullptr && t->kind == token_kind::literal;
            }

            // Multi-character operators are runs of joint punctuation
            bool peek_op(std::string_view op, size_t n = 0U) const {
                for (size_t i = 0U; i < op.size(); ++i) {
                    auto* t = peek(n + i);
                    if (t == nullptr || !t->is_punct(op[i])) {
                        return false;
                    }
                    if (i + 1U < op.size() && !t->is_joint()) {
                        return false;
                    }
                }
                return true;
            }

            bool peek_lifetime(size_t n = 0U) const { return peek_punct('\'', n) && peek_any_ident(n + 1U); }

            const token_tree& next() { return tokens_[pos_++]; }

            bool eat_ident(std::string_view word) {
                if (peek_ident(word)) {
                    ++pos_;
                    return true;
                }
                return false;
            }

            bool eat_op(std::string_view op) {
                if (peek_op(op)) {
                    pos_ += op.size();
                    return true;
                }
                return false;
            }

            void expect_op(std::string_view op) {
                if (!eat_op(op)) {
                    fail(op);
                }
            }

            void expect_ident(std::string_view word) {
                if (!eat_ident(word)) {
                    fail(word);
                }
            }

            std::string expect_name() {
                if (!peek_name()) {
                    fail("identifier"sv);
                    return {};
                }
                return next().text;
            }

            const token_tree* expect_group(delimiter d) {
                if (!peek_group(d)) {
                    fail(to_string(d));
                    return nullptr;
                }
                return &next();
            }

            syntax_node fail(std::string_view expected) {
                if (!state_.error) {
                    auto* t = peek();
                    state_.error = "expected " + std::string{expected} + ", found " +
                                   (t == nullptr ? std::string{"end of input"} : "`" + t->text + "`");
                }
                pos_ = tokens_.size();
                return none();
            }

            parser sub(const token_tree* group) {
                static constexpr std::span<const token_tree> empty{};
                return parser{group == nullptr ? empty : std::span<const token_tree>{group->children}, state_};
            }

            // Parses `item (, item)* ,?` until the end of the current group
            template <typename F>
            bool parse_comma_list(F&& each) {
                bool trailing = false;
                while (!at_end() && !failed()) {
                    each();
                    trailing = false;
                    if (at_end()) {
                        break;
                    }
                    if (!eat_op(","sv)) {
                        fail(","sv);
                        break;
                    }
                    trailing = true;
                }
                return trailing;
            }

            // ── attributes and visibility ─────────────────────────────────

            syntax_node parse_attribute(node_kind kind, const token_tree* group) {
                auto p = sub(group);
                auto attr = make(kind);
                if (!p.peek_any_ident()) {
                    return p.fail("attribute path"sv);
                }
                attr.text = p.next().text;
                while (p.peek_op("::"sv) && p.peek_any_ident(2U)) {
                    p.pos_ += 2U;
                    attr.text += "::" + p.tokens_[p.pos_ - 1U].text;
                }
                while (!p.at_end()) {
                    attr.tokens.push_back(p.next());
                }
                return attr;
            }

            syntax_node parse_outer_attrs() {
                auto attrs = make(node_kind::attributes);
                while (!failed() && peek_punct('#') && peek_group(delimiter::bracket, 1U)) {
                    ++pos_;
                    attrs.children.push_back(parse_attribute(node_kind::attribute, &next()));
                }
                return attrs;
            }

            void parse_inner_attrs(std::vector<syntax_node>& out) {
                while (!failed() && peek_punct('#') && peek_punct('!', 1U) && peek_group(delimiter::bracket, 2U)) {
                    pos_ += 2U;
                    out.push_back(parse_attribute(node_kind::inner_attribute, &next()));
                }
            }

            syntax_node parse_visibility() {
                auto vis = make(node_kind::visibility);
                if (!eat_ident("pub"sv)) {
                    return vis;
                }
                vis.text = "pub";
                if (!peek_group(delimiter::parenthesis)) {
                    return vis;
                }
                auto& group = peek()->children;
                bool scoped = group.size() == 1U && (group[0].is_ident("crate"sv) || group[0].is_ident("self"sv) ||
                                                     group[0].is_ident("super"sv));
                bool in_path = !group.empty() && group[0].is_ident("in"sv);
                if (!scoped && !in_path) {
                    return vis;
                }
                auto p = sub(&next());
                if (in_path) {
                    p.expect_ident("in"sv);
                    auto path = p.parse_path(false);
                    p.finish();
                    vis.text += "(in " + path_to_string(path) + ")";
                    return vis;
                }
                vis.text += "(" + group[0].text + ")";
                return vis;
            }

            // ── items ─────────────────────────────────────────────────────

            bool is_item_start() const {
                if (!peek_any_ident()) {
                    return false;
                }
                auto& word = peek()->text;
                if (word == "fn" || word == "struct" || word == "enum" || word == "use" || word == "mod" ||
                    word == "type" || word == "impl" || word == "trait" || word == "pub" || word == "extern") {
                    return true;
                }
                if (word == "static") {
                    return !peek_punct('|', 1U);
                }
                if (word == "const") {
                    return !peek_group(delimiter::brace, 1U);
                }
                if (word == "unsafe") {
                    return peek_ident("fn"sv, 1U) || peek_ident("impl"sv, 1U) || peek_ident("trait"sv, 1U) ||
                           peek_ident("extern"sv, 1U);
                }
                if (word == "async") {
                    return peek_ident("fn"sv, 1U) || peek_ident("unsafe"sv, 1U);
                }
                if (word == "macro_rules") {
                    return peek_punct('!', 1U);
                }
                if (word == "union") {
                    return peek_name(1U);
                }
                return false;
            }

            // `extern "abi" {` or `extern {`, optionally after `unsafe`
            bool peek_foreign_mod() const {
                size_t n = peek_ident("unsafe"sv) ? 1U : 0U;
                if (!peek_ident("extern"sv, n)) {
                    return false;
                }
                ++n;
                if (peek_literal(n)) {
                    ++n;
                }
                return peek_group(delimiter::brace, n);
            }

            syntax_node parse_item(syntax_node attrs) {
                auto vis = parse_visibility();

                if (peek_ident("unsafe"sv) && peek_ident("impl"sv, 1U)) {
                    ++pos_;
                    auto item = parse_impl(std::move(attrs));
                    item.modifier = "unsafe";
                    return item;
                }
                if (peek_ident("impl"sv)) {
                    return parse_impl(std::move(attrs));
                }
                if (peek_ident("unsafe"sv) && peek_ident("trait"sv, 1U)) {
                    ++pos_;
                    auto item = parse_trait(std::move(attrs), std::move(vis));
                    item.modifier = "unsafe";
                    return item;
                }
                if (peek_ident("trait"sv)) {
                    return parse_trait(std::move(attrs), std::move(vis));
                }
                if (peek_ident("struct"sv)) {
                    return parse_struct(std::move(attrs), std::move(vis));
                }
                if (peek_ident("union"sv) && peek_name(1U)) {
                    return parse_union(std::move(attrs), std::move(vis));
                }
                if (peek_ident("extern"sv) && peek_ident("crate"sv, 1U)) {
                    return parse_extern_crate(std::move(attrs), std::move(vis));
                }
                if (peek_foreign_mod()) {
                    return parse_foreign_mod(std::move(attrs));
                }
                if (peek_ident("enum"sv)) {
                    return parse_enum(std::move(attrs), std::move(vis));
                }
                if (peek_ident("use"sv)) {
                    return parse_use(std::move(attrs), std::move(vis));
                }
                if (peek_ident("mod"sv)) {
                    return parse_mod(std::move(attrs), std::move(vis));
                }
                if (peek_ident("static"sv)) {
                    return parse_static(std::move(attrs), std::move(vis));
                }
                if (peek_ident("type"sv)) {
                    return parse_type_alias(std::move(attrs), std::move(vis));
                }
                if (peek_ident("const"sv) && !peek_ident("fn"sv, 1U) && !peek_ident("unsafe"sv, 1U) &&
                    !peek_ident("async"sv, 1U) && !peek_ident("extern"sv, 1U)) {
                    return parse_const(std::move(attrs), std::move(vis));
                }
                if (peek_ident("fn"sv) || peek_ident("const"sv) || peek_ident("async"sv) || peek_ident("unsafe"sv) ||
                    peek_ident("extern"sv)) {
                    return parse_fn(std::move(attrs), std::move(vis));
                }
                if (vis.text.empty() && (peek_name() || peek_ident("macro_rules"sv) || peek_op("::"sv))) {
                    return parse_item_macro(std::move(attrs));
                }
                return fail("item"sv);
            }

            syntax_node parse_fn(syntax_node attrs, syntax_node vis) {
                auto item = make(node_kind::item_fn);
                auto sig = make(node_kind::signature);
                std::vector<std::string> qualifiers{};
                while (!failed()) {
                    if (eat_ident("const"sv)) {
                        qualifiers.emplace_back("const");
                    }
                    else if (eat_ident("async"sv)) {
                        qualifiers.emplace_back("async");
                    }
                    else if (eat_ident("unsafe"sv)) {
                        qualifiers.emplace_back("unsafe");
                    }
                    else if (eat_ident("extern"sv)) {
                        std::string abi{"extern"};
                        if (peek_literal()) {
                            abi += " " + next().text;
                        }
                        qualifiers.push_back(std::move(abi));
                    }
                    else {
                        break;
                    }
                }
                expect_ident("fn"sv);
                sig.modifier = utils::join_with_separator(qualifiers, " "sv);
                item.text = expect_name();

                auto generics = parse_generics();
                auto params = make(node_kind::params);
                auto p = sub(expect_group(delimiter::parenthesis));
                p.parse_comma_list([&] { params.children.push_back(p.parse_fn_param()); });

                auto ret = none();
                if (eat_op("->"sv)) {
                    ret = parse_type();
                }
                parse_where(generics);

                sig.children.push_back(std::move(generics));
                sig.children.push_back(std::move(params));
                sig.children.push_back(std::move(ret));

                item.children.push_back(std::move(attrs));
                item.children.push_back(std::move(vis));
                item.children.push_back(std::move(sig));
                if (eat_op(";"sv)) {
                    item.children.push_back(none());
                }
                else {
                    item.children.push_back(parse_block(expect_group(delimiter::brace)));
                }
                return item;
            }

            syntax_node parse_fn_param() {
                auto self_param = make(node_kind::self_param);
                if (peek_punct('&')) {
                    size_t n = 1U;
                    std::string text{"&"};
                    if (peek_lifetime(n)) {
                        text += "'" + peek(n + 1U)->text + " ";
                        n += 2U;
                    }
                    if (peek_ident("mut"sv, n)) {
                        text += "mut ";
                        ++n;
                    }
                    if (peek_ident("self"sv, n) && !peek_op("::"sv, n + 1U)) {
                        pos_ += n + 1U;
                        self_param.text = text + "self";
                        return self_param;
                    }
                }
                if (peek_ident("mut"sv) && peek_ident("self"sv, 1U)) {
                    pos_ += 2U;
                    self_param.text = "mut self";
                    self_param.children.push_back(eat_op(":"sv) ? parse_type() : none());
                    return self_param;
                }
                if (peek_ident("self"sv) && !peek_op("::"sv, 1U)) {
                    ++pos_;
                    self_param.text = "self";
                    self_param.children.push_back(eat_op(":"sv) ? parse_type() : none());
                    return self_param;
                }

                auto param = make(node_kind::param);
                param.children.push_back(parse_pat_no_alt());
                expect_op(":"sv);
                param.children.push_back(parse_type());
                return param;
            }

            syntax_node parse_struct(syntax_node attrs, syntax_node vis) {
                expect_ident("struct"sv);
                auto item = make(node_kind::item_struct, expect_name());
                auto generics = parse_generics();
                auto fields = make(node_kind::fields_unit);
                if (peek_group(delimiter::parenthesis)) {
                    fields = parse_tuple_fields(&next());
                    parse_where(generics);
                    expect_op(";"sv);
                }
                else {
                    parse_where(generics);
                    if (peek_group(delimiter::brace)) {
                        fields = parse_named_fields(&next());
                    }
                    else {
                        expect_op(";"sv);
                    }
                }
                item.children.push_back(std::move(attrs));
                item.children.push_back(std::move(vis));
                item.children.push_back(std::move(generics));
                item.children.push_back(std::move(fields));
                return item;
            }

            syntax_node parse_union(syntax_node attrs, syntax_node vis) {
                expect_ident("union"sv);
                auto item = make(node_kind::item_union, expect_name());
                auto generics = parse_generics();
                parse_where(generics);
                item.children.push_back(std::move(attrs));
                item.children.push_back(std::move(vis));
                item.children.push_back(std::move(generics));
                item.children.push_back(parse_named_fields(expect_group(delimiter::brace)));
                return item;
            }

            syntax_node parse_extern_crate(syntax_node attrs, syntax_node vis) {
                expect_ident("extern"sv);
                expect_ident("crate"sv);
                auto item = make(node_kind::item_extern_crate);
                item.text = eat_ident("self"sv) ? std::string{"self"} : expect_name();
                if (eat_ident("as"sv)) {
                    item.modifier = eat_ident("_"sv) ? std::string{"_"} : expect_name();
                }
                expect_op(";"sv);
                item.children.push_back(std::move(attrs));
                item.children.push_back(std::move(vis));
                return item;
            }

            syntax_node parse_foreign_mod(syntax_node attrs) {
                auto item = make(node_kind::item_foreign_mod);
                if (eat_ident("unsafe"sv)) {
                    item.modifier = "unsafe";
                }
                expect_ident("extern"sv);
                if (peek_literal()) {
                    item.text = next().text;
                }
                item.children.push_back(std::move(attrs));
                parse_item_body(expect_group(delimiter::brace), item.children);
                return item;
            }

            syntax_node parse_named_fields(const token_tree* group) {
                auto fields = make(node_kind::fields_named);
                auto p = sub(group);
                p.parse_comma_list([&] {
                    auto field = make(node_kind::field);
                    auto attrs = p.parse_outer_attrs();
                    auto vis = p.parse_visibility();
                    field.text = p.expect_name();
                    p.expect_op(":"sv);
                    field.children.push_back(std::move(attrs));
                    field.children.push_back(std::move(vis));
                    field.children.push_back(p.parse_type());
                    fields.children.push_back(std::move(field));
                });
                return fields;
            }

            syntax_node parse_tuple_fields(const token_tree* group) {
                auto fields = make(node_kind::fields_tuple);
                auto p = sub(group);
                p.parse_comma_list([&] {
                    auto field = make(node_kind::field);
                    field.children.push_back(p.parse_outer_attrs());
                    field.children.push_back(p.parse_visibility());
                    field.children.push_back(p.parse_type());
                    fields.children.push_back(std::move(field));
                });
                return fields;
            }

            syntax_node parse_enum(syntax_node attrs, syntax_node vis) {
                expect_ident("enum"sv);
                auto item = make(node_kind::item_enum, expect_name());
                auto generics = parse_generics();
                parse_where(generics);
                item.children.push_back(std::move(attrs));
                item.children.push_back(std::move(vis));
                item.children.push_back(std::move(generics));

                auto p = sub(expect_group(delimiter::brace));
                p.parse_comma_list([&] {
                    auto variant = make(node_kind::variant);
                    auto variant_attrs = p.parse_outer_attrs();
                    variant.text = p.expect_name();
                    auto fields = make(node_kind::fields_unit);
                    if (p.peek_group(delimiter::parenthesis)) {
                        fields = p.parse_tuple_fields(&p.next());
                    }
                    else if (p.peek_group(delimiter::brace)) {
                        fields = p.parse_named_fields(&p.next());
                    }
                    variant.children.push_back(std::move(variant_attrs));
                    variant.children.push_back(std::move(fields));
                    variant.children.push_back(p.eat_op("="sv) ? p.parse_expr() : none());
                    item.children.push_back(std::move(variant));
                });
                return item;
            }

            syntax_node parse_impl(syntax_node attrs) {
                expect_ident("impl"sv);
                auto item = make(node_kind::item_impl);
                auto generics = peek_punct('<') ? parse_generics() : make(node_kind::generics);
                auto first = parse_type();
                auto trait = none();
                if (eat_ident("for"sv)) {
                    if (!first.is(node_kind::type_path)) {
                        return fail("trait path"sv);
                    }
                    trait = std::move(first);
                    first = parse_type();
                }
                parse_where(generics);
                item.children.push_back(std::move(attrs));
                item.children.push_back(std::move(generics));
                item.children.push_back(std::move(trait));
                item.children.push_back(std::move(first));
                parse_item_body(expect_group(delimiter::brace), item.children);
                return item;
            }

            syntax_node parse_trait(syntax_node attrs, syntax_node vis) {
                expect_ident("trait"sv);
                auto item = make(node_kind::item_trait, expect_name());
                auto generics = parse_generics();
                auto supertraits = make(node_kind::bounds);
                if (eat_op(":"sv)) {
                    supertraits = parse_bounds();
                }
                parse_where(generics);
                item.children.push_back(std::move(attrs));
                item.children.push_back(std::move(vis));
                item.children.push_back(std::move(generics));
                item.children.push_back(std::move(supertraits));
                parse_item_body(expect_group(delimiter::brace), item.children);
                return item;
            }

            void parse_item_body(const token_tree* group, std::vector<syntax_node>& out) {
                auto p = sub(group);
                while (!p.at_end() && !p.failed()) {
                    auto attrs = p.parse_outer_attrs();
                    out.push_back(p.parse_item(std::move(attrs)));
                }
            }

            syntax_node parse_use(syntax_node attrs, syntax_node vis) {
                expect_ident("use"sv);
                auto item = make(node_kind::item_use);
                item.children.push_back(std::move(attrs));
                item.children.push_back(std::move(vis));
                item.children.push_back(parse_use_tree());
                expect_op(";"sv);
                return item;
            }

            syntax_node parse_use_tree() {
                if (eat_op("*"sv)) {
                    return make(node_kind::use_glob);
                }
                if (peek_group(delimiter::brace)) {
                    auto group = make(node_kind::use_group);
                    auto p = sub(&next());
                    p.parse_comma_list([&] { group.children.push_back(p.parse_use_tree()); });
                    return group;
                }
                if (peek_op("::"sv)) {
                    pos_ += 2U;
                    auto path = make(node_kind::use_path);
                    path.children.push_back(parse_use_tree());
                    return path;
                }
                if (!peek_name() && !(peek_any_ident() && is_path_keyword(peek()->text))) {
                    return fail("use path"sv);
                }
                auto name = next().text;
                if (eat_op("::"sv)) {
                    auto path = make(node_kind::use_path, std::move(name));
                    path.children.push_back(parse_use_tree());
                    return path;
                }
                if (eat_ident("as"sv)) {
                    auto rename = make(node_kind::use_rename, std::move(name));
                    if (eat_ident("_"sv)) {
                        rename.modifier = "_";
                    }
                    else {
                        rename.modifier = expect_name();
                    }
                    return rename;
                }
                return make(node_kind::use_name, std::move(name));
            }

            syntax_node parse_mod(syntax_node attrs, syntax_node vis) {
                expect_ident("mod"sv);
                auto item = make(node_kind::item_mod, expect_name());
                item.children.push_back(std::move(attrs));
                item.children.push_back(std::move(vis));
                if (eat_op(";"sv)) {
                    item.children.push_back(none());
                    return item;
                }
                auto body = make(node_kind::mod_body);
                auto p = sub(expect_group(delimiter::brace));
                p.parse_inner_attrs(body.children);
                while (!p.at_end() && !p.failed()) {
                    auto item_attrs = p.parse_outer_attrs();
                    body.children.push_back(p.parse_item(std::move(item_attrs)));
                }
                item.children.push_back(std::move(body));
                return item;
            }

            syntax_node parse_const(syntax_node attrs, syntax_node vis) {
                expect_ident("const"sv);
                auto item = make(node_kind::item_const);
                item.text = eat_ident("_"sv) ? std::string{"_"} : expect_name();
                expect_op(":"sv);
                item.children.push_back(std::move(attrs));
                item.children.push_back(std::move(vis));
                item.children.push_back(parse_type());
                item.children.push_back(eat_op("="sv) ? parse_expr() : none());
                expect_op(";"sv);
                return item;
            }

            syntax_node parse_static(syntax_node attrs, syntax_node vis) {
                expect_ident("static"sv);
                auto item = make(node_kind::item_static);
                if (eat_ident("mut"sv)) {
                    item.modifier = "mut";
                }
                item.text = expect_name();
                expect_op(":"sv);
                item.children.push_back(std::move(attrs));
                item.children.push_back(std::move(vis));
                item.children.push_back(parse_type());
                // foreign statics have no initializer
                item.children.push_back(eat_op("="sv) ? parse_expr() : none());
                expect_op(";"sv);
                return item;
            }

            syntax_node parse_type_alias(syntax_node attrs, syntax_node vis) {
                expect_ident("type"sv);
                auto item = make(node_kind::item_type, expect_name());
                auto generics = parse_generics();
                auto bounds = none();
                if (eat_op(":"sv)) {
                    bounds = parse_bounds();
                }
                parse_where(generics);
                item.children.push_back(std::move(attrs));
                item.children.push_back(std::move(vis));
                item.children.push_back(std::move(generics));
                item.children.push_back(std::move(bounds));
                item.children.push_back(eat_op("="sv) ? parse_type() : none());
                expect_op(";"sv);
                return item;
            }

            syntax_node parse_item_macro(syntax_node attrs) {
                auto item = make(node_kind::item_macro);
                auto path = parse_path(true);
                if (!peek_punct('!')) {
                    return fail("!"sv);
                }
                ++pos_;
                auto mac = make(node_kind::macro, path_to_string(path));
                mac.children.push_back(peek_name() ? make(node_kind::ident, next().text) : none());
                if (!peek_any_group()) {
                    return fail("macro delimiter"sv);
                }
                auto& group = next();
                mac.modifier = std::string{to_string(group.delim)};
                mac.tokens = group.children;
                if (group.delim != delimiter::brace) {
                    expect_op(";"sv);
                }
                item.children.push_back(std::move(attrs));
                item.children.push_back(std::move(mac));
                return item;
            }

            // ── generics ──────────────────────────────────────────────────

            syntax_node parse_lifetime() {
                if (!peek_lifetime()) {
                    return fail("lifetime"sv);
                }
                ++pos_;
                return make(node_kind::lifetime, "'" + next().text);
            }

            syntax_node parse_generics() {
                auto generics = make(node_kind::generics);
                if (!eat_op("<"sv)) {
                    return generics;
                }
                while (!failed() && !eat_op(">"sv)) {
                    if (peek_lifetime()) {
                        auto param = make(node_kind::lifetime_param, parse_lifetime().text);
                        if (eat_op(":"sv)) {
                            param.children.push_back(parse_lifetime());
                            while (eat_op("+"sv)) {
                                param.children.push_back(parse_lifetime());
                            }
                        }
                        generics.children.push_back(std::move(param));
                    }
                    else if (eat_ident("const"sv)) {
                        auto param = make(node_kind::const_param, expect_name());
                        expect_op(":"sv);
                        param.children.push_back(parse_type());
                        param.children.push_back(eat_op("="sv) ? parse_const_arg() : none());
                        generics.children.push_back(std::move(param));
                    }
                    else {
                        auto param = make(node_kind::type_param, expect_name());
                        param.children.push_back(eat_op(":"sv) ? parse_bounds() : make(node_kind::bounds));
                        param.children.push_back(eat_op("="sv) ? parse_type() : none());
                        generics.children.push_back(std::move(param));
                    }
                    if (!peek_op(">"sv)) {
                        expect_op(","sv);
                    }
                }
                return generics;
            }

            void parse_where(syntax_node& generics) {
                if (!eat_ident("where"sv)) {
                    return;
                }
                auto clause = make(node_kind::where_clause);
                while (!failed() && !at_end() && !peek_group(delimiter::brace) && !peek_op(";"sv) &&
                       !peek_op("="sv)) {
                    auto predicate = make(node_kind::where_predicate);
                    if (peek_lifetime()) {
                        predicate.children.push_back(parse_lifetime());
                        expect_op(":"sv);
                        auto bounds = make(node_kind::bounds);
                        bounds.children.push_back(parse_lifetime());
                        while (eat_op("+"sv)) {
                            bounds.children.push_back(parse_lifetime());
                        }
                        predicate.children.push_back(std::move(bounds));
                    }
                    else {
                        predicate.children.push_back(parse_type());
                        expect_op(":"sv);
                        predicate.children.push_back(parse_bounds());
                    }
                    clause.children.push_back(std::move(predicate));
                    if (!eat_op(","sv)) {
                        break;
                    }
                }
                generics.children.push_back(std::move(clause));
            }

            syntax_node parse_bounds() {
                auto bounds = make(node_kind::bounds);
                do {
                    if (peek_lifetime()) {
                        bounds.children.push_back(parse_lifetime());
                        continue;
                    }
                    auto bound = make(node_kind::trait_bound);
                    if (eat_op("?"sv)) {
                        bound.modifier = "?";
                    }
                    bound.children.push_back(parse_path(false));
                    bounds.children.push_back(std::move(bound));
                } while (!failed() && eat_op("+"sv));
                return bounds;
            }

            syntax_node parse_const_arg() {
                if (peek_group(delimiter::brace)) {
                    auto expr = make(node_kind::expr_block);
                    expr.children.push_back(parse_block(&next()));
                    return expr;
                }
                if (peek_literal()) {
                    return make(node_kind::expr_lit, next().text);
                }
                if (peek_punct('-') && peek_literal(1U)) {
                    ++pos_;
                    auto neg = make(node_kind::expr_unary, "-");
                    neg.children.push_back(make(node_kind::expr_lit, next().text));
                    return neg;
                }
                return fail("const argument"sv);
            }

            // ── paths and types ───────────────────────────────────────────

            // In expression position generic arguments need a turbofish (`::<`)
            syntax_node parse_path(bool expr_style) {
                auto path = make(node_kind::path);
                if (peek_op("::"sv)) {
                    pos_ += 2U;
                    path.modifier = "::";
                }
                while (!failed()) {
                    if (!peek_any_ident() || (is_reserved(peek()->text) && !is_path_keyword(peek()->text))) {
                        fail("path segment"sv);
                        break;
                    }
                    auto segment = make(node_kind::path_segment, next().text);
                    if (expr_style) {
                        if (peek_op("::"sv) && peek_punct('<', 2U)) {
                            pos_ += 2U;
                            segment.children.push_back(parse_generic_args());
                            segment.children.back().modifier = "::";
                        }
                    }
                    else if (peek_punct('<') && !peek_op("<="sv) && !peek_op("<<"sv)) {
                        segment.children.push_back(parse_generic_args());
                    }
                    else if (peek_op("::"sv) && peek_punct('<', 2U)) {
                        pos_ += 2U;
                        segment.children.push_back(parse_generic_args());
                        segment.children.back().modifier = "::";
                    }
                    else if (peek_group(delimiter::parenthesis)) {
                        auto args = make(node_kind::paren_args);
                        auto p = sub(&next());
                        p.parse_comma_list([&] { args.children.push_back(p.parse_type()); });
                        args.text = eat_op("->"sv) ? "->" : "";
                        if (!args.text.empty()) {
                            args.children.push_back(parse_type_no_bounds());
                        }
                        segment.children.push_back(std::move(args));
                    }
                    path.children.push_back(std::move(segment));
                    if (peek_op("::"sv) && peek_any_ident(2U)) {
                        pos_ += 2U;
                        continue;
                    }
                    break;
                }
                return path;
            }

            syntax_node parse_generic_args() {
                auto args = make(node_kind::generic_args);
                expect_op("<"sv);
                while (!failed() && !eat_op(">"sv)) {
                    if (peek_lifetime()) {
                        args.children.push_back(parse_lifetime());
                    }
                    else if (peek_name() && peek_punct('=', 1U) && !peek_op("=="sv, 1U)) {
                        auto binding = make(node_kind::assoc_type, next().text);
                        ++pos_;
                        binding.children.push_back(parse_type());
                        args.children.push_back(std::move(binding));
                    }
                    else if (peek_literal() || peek_group(delimiter::brace) ||
                             (peek_punct('-') && peek_literal(1U))) {
                        args.children.push_back(parse_const_arg());
                    }
                    else {
                        args.children.push_back(parse_type());
                    }
                    if (!peek_op(">"sv)) {
                        expect_op(","sv);
                    }
                }
                return args;
            }

            syntax_node parse_type() {
                if (peek_ident("impl"sv) || peek_ident("dyn"sv)) {
                    auto ty = make(peek_ident("impl"sv) ? node_kind::type_impl : node_kind::type_dyn);
                    ++pos_;
                    ty.children.push_back(parse_bounds());
                    return ty;
                }
                return parse_type_no_bounds();
            }

            syntax_node parse_type_no_bounds() {
                if (peek_group(delimiter::parenthesis)) {
                    auto p = sub(&next());
                    std::vector<syntax_node> elems{};
                    auto trailing = p.parse_comma_list([&] { elems.push_back(p.parse_type()); });
                    if (elems.size() == 1U && !trailing) {
                        auto ty = make(node_kind::type_paren);
                        ty.children = std::move(elems);
                        return ty;
                    }
                    auto ty = make(node_kind::type_tuple);
                    ty.children = std::move(elems);
                    return ty;
                }
                if (peek_group(delimiter::bracket)) {
                    auto p = sub(&next());
                    auto elem = p.parse_type();
                    if (p.eat_op(";"sv)) {
                        auto ty = make(node_kind::type_array);
                        ty.children.push_back(std::move(elem));
                        ty.children.push_back(p.parse_expr());
                        p.finish();
                        return ty;
                    }
                    p.finish();
                    auto ty = make(node_kind::type_slice);
                    ty.children.push_back(std::move(elem));
                    return ty;
                }
                if (eat_op("&"sv)) {
                    auto ty = make(node_kind::type_ref);
                    ty.children.push_back(peek_lifetime() ? parse_lifetime() : none());
                    if (eat_ident("mut"sv)) {
                        ty.modifier = "mut";
                    }
                    ty.children.push_back(parse_type_no_bounds());
                    return ty;
                }
                if (eat_op("*"sv)) {
                    auto ty = make(node_kind::type_ptr);
                    if (eat_ident("const"sv)) {
                        ty.modifier = "const";
                    }
                    else if (eat_ident("mut"sv)) {
                        ty.modifier = "mut";
                    }
                    else {
                        return fail("const or mut"sv);
                    }
                    ty.children.push_back(parse_type_no_bounds());
                    return ty;
                }
                if (eat_op("!"sv)) {
                    return make(node_kind::type_never);
                }
                if (eat_ident("_"sv)) {
                    return make(node_kind::type_infer);
                }
                if (eat_ident("fn"sv)) {
                    auto ty = make(node_kind::type_fn);
                    auto p = sub(expect_group(delimiter::parenthesis));
                    p.parse_comma_list([&] { ty.children.push_back(p.parse_type()); });
                    ty.text = eat_op("->"sv) ? "->" : "";
                    if (!ty.text.empty()) {
                        ty.children.push_back(parse_type_no_bounds());
                    }
                    return ty;
                }
                auto ty = make(node_kind::type_path);
                ty.children.push_back(parse_path(false));
                return ty;
            }

            // ── patterns ──────────────────────────────────────────────────

            syntax_node parse_pat() {
                if (peek_punct('|') && !peek_op("||"sv)) {
                    ++pos_;
                }
                auto first = parse_pat_no_alt();
                if (!peek_punct('|') || peek_op("||"sv) || peek_op("|="sv)) {
                    return first;
                }
                auto alt = make(node_kind::pat_or);
                alt.children.push_back(std::move(first));
                while (!failed() && peek_punct('|') && !peek_op("||"sv)) {
                    ++pos_;
                    alt.children.push_back(parse_pat_no_alt());
                }
                return alt;
            }

            syntax_node parse_pat_range_end(syntax_node lo) {
                std::string op{};
                if (eat_op("..="sv)) {
                    op = "..=";
                }
                else if (peek_op(".."sv) && !peek_op("..."sv)) {
                    pos_ += 2U;
                    op = "..";
                }
                else {
                    return lo;
                }
                auto range = make(node_kind::pat_range, std::move(op));
                range.children.push_back(std::move(lo));
                if (peek_literal() || (peek_punct('-') && peek_literal(1U))) {
                    range.children.push_back(parse_pat_literal());
                }
                else if (peek_name() || peek_op("::"sv)) {
                    auto hi = make(node_kind::pat_path);
                    hi.children.push_back(parse_path(true));
                    range.children.push_back(std::move(hi));
                }
                else {
                    range.children.push_back(none());
                }
                return range;
            }

            syntax_node parse_pat_literal() {
                auto lit = make(node_kind::pat_lit);
                if (eat_op("-"sv)) {
                    auto neg = make(node_kind::expr_unary, "-");
                    neg.children.push_back(make(node_kind::expr_lit, next().text));
                    lit.children.push_back(std::move(neg));
                }
                else {
                    lit.children.push_back(make(node_kind::expr_lit, next().text));
                }
                return lit;
            }

            syntax_node parse_pat_no_alt() {
                if (eat_ident("_"sv)) {
                    return make(node_kind::pat_wild);
                }
                if (peek_op(".."sv) && !peek_op("..="sv)) {
                    pos_ += 2U;
                    return make(node_kind::pat_rest);
                }
                if (eat_op("&"sv)) {
                    auto pat = make(node_kind::pat_ref);
                    if (eat_ident("mut"sv)) {
                        pat.modifier = "mut";
                    }
                    pat.children.push_back(parse_pat_no_alt());
                    return pat;
                }
                if (peek_group(delimiter::parenthesis)) {
                    auto p = sub(&next());
                    std::vector<syntax_node> elems{};
                    auto trailing = p.parse_comma_list([&] { elems.push_back(p.parse_pat()); });
                    auto pat = make(elems.size() == 1U && !trailing ? node_kind::pat_paren : node_kind::pat_tuple);
                    pat.children = std::move(elems);
                    return pat;
                }
                if (peek_group(delimiter::bracket)) {
                    auto pat = make(node_kind::pat_slice);
                    auto p = sub(&next());
                    p.parse_comma_list([&] { pat.children.push_back(p.parse_pat()); });
                    return pat;
                }
                if (peek_literal() || (peek_punct('-') && peek_literal(1U)) || peek_ident("true"sv) ||
                    peek_ident("false"sv)) {
                    return parse_pat_range_end(parse_pat_literal());
                }
                if (peek_ident("ref"sv) || peek_ident("mut"sv)) {
                    return parse_pat_binding();
                }
                if (peek_name() && !peek_op("::"sv, 1U) && !peek_any_group(1U) && !peek_punct('!', 1U) &&
                    !peek_op(".."sv, 1U)) {
                    return parse_pat_binding();
                }
                if (peek_any_ident() || peek_op("::"sv)) {
                    auto path = parse_path(true);
                    if (peek_group(delimiter::parenthesis)) {
                        auto pat = make(node_kind::pat_tuple_struct);
                        pat.children.push_back(std::move(path));
                        auto p = sub(&next());
                        p.parse_comma_list([&] { pat.children.push_back(p.parse_pat()); });
                        return pat;
                    }
                    if (peek_group(delimiter::brace)) {
                        return parse_pat_struct(std::move(path), &next());
                    }
                    auto pat = make(node_kind::pat_path);
                    pat.children.push_back(std::move(path));
                    return parse_pat_range_end(std::move(pat));
                }
                return fail("pattern"sv);
            }

            syntax_node parse_pat_binding() {
                auto pat = make(node_kind::pat_ident);
                std::vector<std::string> modifiers{};
                if (eat_ident("ref"sv)) {
                    modifiers.emplace_back("ref");
                }
                if (eat_ident("mut"sv)) {
                    modifiers.emplace_back("mut");
                }
                pat.modifier = utils::join_with_separator(modifiers, " "sv);
                if (peek_ident("self"sv)) {
                    pat.text = next().text;
                }
                else {
                    pat.text = expect_name();
                }
                if (peek_punct('@')) {
                    ++pos_;
                    pat.children.push_back(parse_pat_no_alt());
                }
                return pat;
            }

            syntax_node parse_pat_struct(syntax_node path, const token_tree* group) {
                auto pat = make(node_kind::pat_struct);
                pat.children.push_back(std::move(path));
                auto p = sub(group);
                p.parse_comma_list([&] {
                    if (p.peek_op(".."sv)) {
                        p.pos_ += 2U;
                        pat.modifier = "..";
                        return;
                    }
                    auto field = make(node_kind::field_pat);
                    if (p.peek_ident("ref"sv) || p.peek_ident("mut"sv)) {
                        auto binding = p.parse_pat_binding();
                        field.text = binding.text;
                        field.children.push_back(std::move(binding));
                    }
                    else {
                        field.text = p.peek_literal() ? p.next().text : p.expect_name();
                        if (p.eat_op(":"sv)) {
                            field.modifier = ":";
                            field.children.push_back(p.parse_pat());
                        }
                        else {
                            field.children.push_back(make(node_kind::pat_ident, field.text));
                        }
                    }
                    pat.children.push_back(std::move(field));
                });
                return pat;
            }

            // ── statements and blocks ─────────────────────────────────────

            syntax_node parse_block(const token_tree* group) {
                auto block = make(node_kind::block);
                if (group == nullptr) {
                    return block;
                }
                auto p = sub(group);
                while (!p.at_end() && !p.failed()) {
                    if (p.eat_op(";"sv)) {
                        continue;
                    }
                    block.children.push_back(p.parse_stmt());
                }
                return block;
            }

            bool peek_block_like() const {
                return peek_group(delimiter::brace) || peek_ident("if"sv) || peek_ident("match"sv) ||
                       peek_ident("loop"sv) || peek_ident("while"sv) || peek_ident("for"sv) ||
                       (peek_ident("unsafe"sv) && peek_group(delimiter::brace, 1U)) || peek_async_block() ||
                       peek_label();
            }

            bool peek_async_block() const {
                return peek_ident("async"sv) &&
                       (peek_group(delimiter::brace, 1U) ||
                        (peek_ident("move"sv, 1U) && peek_group(delimiter::brace, 2U)));
            }

            // `'label:` ahead of a loop or block
            bool peek_label() const { return peek_lifetime() && peek_punct(':', 2U) && !peek_op("::"sv, 2U); }

            syntax_node parse_stmt() {
                auto attrs = parse_outer_attrs();
                if (eat_ident("let"sv)) {
                    auto local = make(node_kind::stmt_local);
                    local.children.push_back(std::move(attrs));
                    local.children.push_back(parse_pat());
                    local.children.push_back(eat_op(":"sv) ? parse_type() : none());
                    bool has_init = eat_op("="sv);
                    local.children.push_back(has_init ? parse_expr() : none());
                    if (has_init && eat_ident("else"sv)) {
                        local.children.push_back(parse_block(expect_group(delimiter::brace)));
                    }
                    else {
                        local.children.push_back(none());
                    }
                    expect_op(";"sv);
                    return local;
                }
                if (is_item_start()) {
                    return parse_item(std::move(attrs));
                }

                auto stmt = make(node_kind::stmt_expr);
                stmt.children.push_back(std::move(attrs));
                bool block_like = peek_block_like();
                auto expr = block_like ? parse_postfix(false, true) : parse_expr();
                bool brace_macro = expr.is(node_kind::expr_macro) && expr.children[0].modifier == "{}";
                if (eat_op(";"sv)) {
                    stmt.modifier = ";";
                }
                else if (!block_like && !brace_macro && !at_end()) {
                    stmt.children.push_back(std::move(expr));
                    return fail(";"sv);
                }
                stmt.children.push_back(std::move(expr));
                return stmt;
            }

            // ── expressions ───────────────────────────────────────────────

            std::optional<std::string_view> peek_assign_op() const {
                for (auto op : assign_ops) {
                    if (peek_op(op)) {
                        return op;
                    }
                }
                if (peek_punct('=') && !peek_op("=="sv) && !peek_op("=>"sv)) {
                    return "="sv;
                }
                return std::nullopt;
            }

            std::optional<binary_op> peek_binary_op() const {
                for (auto op : assign_ops) {
                    if (peek_op(op)) {
                        return std::nullopt;
                    }
                }
                for (const auto& op : binary_ops) {
                    if (peek_op(op.text)) {
                        return op;
                    }
                }
                return std::nullopt;
            }

            bool can_begin_expr(bool no_struct) const {
                auto* t = peek();
                if (t == nullptr) {
                    return false;
                }
                switch (t->kind) {
                    case token_kind::literal:
                        return true;
                    case token_kind::ident:
                        return t->text != "as" && t->text != "else" && t->text != "in";
                    case token_kind::group:
                        return t->delim != delimiter::brace || !no_struct;
                    case token_kind::punct:
                        return t->is_punct('-') || t->is_punct('!') || t->is_punct('*') || t->is_punct('&') ||
                               t->is_punct('|') || peek_op("::"sv) || peek_label();
                }
                return false;
            }

            syntax_node parse_assign(bool no_struct) {
                auto lhs = parse_range(no_struct);
                if (auto op = peek_assign_op()) {
                    pos_ += op->size();
                    auto expr = make(node_kind::expr_binary, std::string{*op});
                    expr.children.push_back(std::move(lhs));
                    expr.children.push_back(parse_assign(no_struct));
                    return expr;
                }
                return lhs;
            }

            std::optional<std::string> eat_range_op() {
                if (eat_op("..="sv)) {
                    return "..=";
                }
                if (peek_op(".."sv) && !peek_op("..."sv)) {
                    pos_ += 2U;
                    return "..";
                }
                return std::nullopt;
            }

            syntax_node parse_range(bool no_struct) {
                auto lo = none();
                auto op = eat_range_op();
                if (!op) {
                    lo = parse_binary(no_struct, 3);
                    op = eat_range_op();
                    if (!op) {
                        return lo;
                    }
                }
                auto range = make(node_kind::expr_range, std::move(*op));
                range.children.push_back(std::move(lo));
                range.children.push_back(can_begin_expr(no_struct) ? parse_binary(no_struct, 3) : none());
                return range;
            }

            syntax_node parse_binary(bool no_struct, int min_precedence) {
                auto lhs = parse_unary(no_struct);
                bool lhs_is_comparison = false;
                while (!failed()) {
                    if (peek_ident("as"sv) && cast_precedence >= min_precedence) {
                        ++pos_;
                        auto cast = make(node_kind::expr_cast);
                        cast.children.push_back(std::move(lhs));
                        cast.children.push_back(parse_type_no_bounds());
                        lhs = std::move(cast);
                        lhs_is_comparison = false;
                        continue;
                    }
                    auto op = peek_binary_op();
                    if (!op || op->precedence < min_precedence) {
                        break;
                    }
                    bool comparison = op->precedence == comparison_precedence;
                    if (comparison && lhs_is_comparison) {
                        return fail("non-chained comparison"sv);
                    }
                    pos_ += op->text.size();
                    auto expr = make(node_kind::expr_binary, std::string{op->text});
                    expr.children.push_back(std::move(lhs));
                    expr.children.push_back(parse_binary(no_struct, op->precedence + 1));
                    lhs = std::move(expr);
                    lhs_is_comparison = comparison;
                }
                return lhs;
            }

            syntax_node parse_unary(bool no_struct) {
                if (peek_punct('-') || peek_punct('!') || peek_punct('*')) {
                    auto expr = make(node_kind::expr_unary, next().text);
                    expr.children.push_back(parse_unary(no_struct));
                    return expr;
                }
                if (peek_punct('&')) {
                    ++pos_;
                    auto expr = make(node_kind::expr_reference);
                    if (eat_ident("mut"sv)) {
                        expr.modifier = "mut";
                    }
                    expr.children.push_back(parse_unary(no_struct));
                    return expr;
                }
                return parse_postfix(no_struct, false);
            }

            syntax_node parse_call_args(syntax_node node, const token_tree* group) {
                auto p = sub(group);
                p.parse_comma_list([&] { node.children.push_back(p.parse_expr()); });
                return node;
            }

            // Statement-position block expressions only continue with `.` and `?`
            syntax_node parse_postfix(bool no_struct, bool statement_position) {
                auto expr = parse_primary(no_struct);
                while (!failed()) {
                    if (eat_op("?"sv)) {
                        auto wrapped = make(node_kind::expr_try);
                        wrapped.children.push_back(std::move(expr));
                        expr = std::move(wrapped);
                        continue;
                    }
                    if (peek_punct('.') && !peek_op(".."sv)) {
                        ++pos_;
                        expr = parse_dot_suffix(std::move(expr));
                        continue;
                    }
                    if (statement_position) {
                        break;
                    }
                    if (peek_group(delimiter::parenthesis)) {
                        auto call = make(node_kind::expr_call);
                        call.children.push_back(std::move(expr));
                        expr = parse_call_args(std::move(call), &next());
                        continue;
                    }
                    if (peek_group(delimiter::bracket)) {
                        auto index = make(node_kind::expr_index);
                        index.children.push_back(std::move(expr));
                        auto p = sub(&next());
                        index.children.push_back(p.parse_expr());
                        p.finish();
                        expr = std::move(index);
                        continue;
                    }
                    break;
                }
                return expr;
            }

            syntax_node parse_dot_suffix(syntax_node base) {
                if (eat_ident("await"sv)) {
                    auto expr = make(node_kind::expr_await);
                    expr.children.push_back(std::move(base));
                    return expr;
                }
                if (peek_literal()) {
                    // `x.0.1` lexes its indices as the float `0.1`
                    auto text = next().text;
                    auto dot = text.find('.');
                    auto is_index = [](std::string_view s) {
                        return !s.empty() && std::ranges::all_of(s, [](char c) { return c >= '0' && c <= '9'; });
                    };
                    auto field = make(node_kind::expr_field);
                    if (dot == std::string::npos) {
                        if (!is_index(text)) {
                            return fail("tuple index"sv);
                        }
                        field.text = text;
                        field.children.push_back(std::move(base));
                        return field;
                    }
                    auto first = text.substr(0U, dot);
                    auto second = text.substr(dot + 1U);
                    if (!is_index(first) || !is_index(second)) {
                        return fail("tuple index"sv);
                    }
                    auto inner = make(node_kind::expr_field, first);
                    inner.children.push_back(std::move(base));
                    field.text = second;
                    field.children.push_back(std::move(inner));
                    return field;
                }
                auto name = expect_name();
                auto turbofish = none();
                if (peek_op("::"sv) && peek_punct('<', 2U)) {
                    pos_ += 2U;
                    turbofish = parse_generic_args();
                    turbofish.modifier = "::";
                }
                if (peek_group(delimiter::parenthesis)) {
                    auto call = make(node_kind::expr_method_call, std::move(name));
                    call.children.push_back(std::move(base));
                    call.children.push_back(std::move(turbofish));
                    return parse_call_args(std::move(call), &next());
                }
                if (!turbofish.is_none()) {
                    return fail("method call arguments"sv);
                }
                auto field = make(node_kind::expr_field, std::move(name));
                field.children.push_back(std::move(base));
                return field;
            }

            syntax_node parse_primary(bool no_struct) {
                auto* t = peek();
                if (t == nullptr) {
                    return fail("expression"sv);
                }
                if (t->kind == token_kind::literal) {
                    return make(node_kind::expr_lit, next().text);
                }
                if (t->kind == token_kind::group) {
                    return parse_group_expr(&next());
                }
                if (t->kind == token_kind::punct) {
                    if (peek_punct('|') || peek_ident("move"sv)) {
                        return parse_closure(no_struct);
                    }
                    if (peek_label()) {
                        return parse_labeled(no_struct);
                    }
                    if (peek_op("::"sv)) {
                        return parse_path_expr(no_struct);
                    }
                    return fail("expression"sv);
                }

                auto& word = t->text;
                if (word == "true" || word == "false") {
                    return make(node_kind::expr_lit, next().text);
                }
                if (word == "if") {
                    return parse_if();
                }
                if (word == "match") {
                    return parse_match();
                }
                if (word == "loop") {
                    ++pos_;
                    auto expr = make(node_kind::expr_loop);
                    expr.children.push_back(parse_block(expect_group(delimiter::brace)));
                    return expr;
                }
                if (word == "while") {
                    ++pos_;
                    auto expr = make(node_kind::expr_while);
                    expr.children.push_back(parse_expr(true));
                    expr.children.push_back(parse_block(expect_group(delimiter::brace)));
                    return expr;
                }
                if (word == "for") {
                    ++pos_;
                    auto expr = make(node_kind::expr_for);
                    expr.children.push_back(parse_pat());
                    expect_ident("in"sv);
                    expr.children.push_back(parse_expr(true));
                    expr.children.push_back(parse_block(expect_group(delimiter::brace)));
                    return expr;
                }
                if (peek_async_block()) {
                    ++pos_;
                    auto expr = make(node_kind::expr_block);
                    expr.modifier = eat_ident("move"sv) ? "async move" : "async";
                    expr.children.push_back(parse_block(&next()));
                    return expr;
                }
                if (word == "unsafe" && peek_group(delimiter::brace, 1U)) {
                    ++pos_;
                    auto expr = make(node_kind::expr_block);
                    expr.modifier = "unsafe";
                    expr.children.push_back(parse_block(&next()));
                    return expr;
                }
                if (word == "move") {
                    return parse_closure(no_struct);
                }
                if (word == "let" && no_struct) {
                    ++pos_;
                    auto expr = make(node_kind::expr_let);
                    expr.children.push_back(parse_pat());
                    expect_op("="sv);
                    expr.children.push_back(parse_binary(true, comparison_precedence));
                    return expr;
                }
                if (word == "return" || word == "break") {
                    ++pos_;
                    auto expr = make(word == "return" ? node_kind::expr_return : node_kind::expr_break);
                    if (expr.is(node_kind::expr_break) && peek_lifetime()) {
                        expr.text = parse_lifetime().text;
                    }
                    expr.children.push_back(can_begin_expr(no_struct) ? parse_expr(no_struct) : none());
                    return expr;
                }
                if (word == "continue") {
                    ++pos_;
                    auto expr = make(node_kind::expr_continue);
                    if (peek_lifetime()) {
                        expr.text = parse_lifetime().text;
                    }
                    return expr;
                }
                if (is_reserved(word) && !is_path_keyword(word)) {
                    return fail("expression"sv);
                }
                return parse_path_expr(no_struct);
            }

            syntax_node parse_labeled(bool no_struct) {
                auto label = parse_lifetime().text;
                expect_op(":"sv);
                syntax_node expr{};
                if (peek_ident("loop"sv) || peek_ident("while"sv) || peek_ident("for"sv)) {
                    expr = parse_primary(no_struct);
                }
                else if (peek_group(delimiter::brace)) {
                    expr = make(node_kind::expr_block);
                    expr.children.push_back(parse_block(&next()));
                }
                else {
                    return fail("loop or block after label"sv);
                }
                expr.text = std::move(label);
                return expr;
            }

            syntax_node parse_group_expr(const token_tree* group) {
                auto p = sub(group);
                switch (group->delim) {
                    case delimiter::brace:
                    {
                        auto expr = make(node_kind::expr_block);
                        expr.children.push_back(parse_block(group));
                        return expr;
                    }
                    case delimiter::parenthesis:
                    {
                        std::vector<syntax_node> elems{};
                        auto trailing = p.parse_comma_list([&] { elems.push_back(p.parse_expr()); });
                        auto expr = make(
                                elems.size() == 1U && !trailing ? node_kind::expr_paren : node_kind::expr_tuple);
                        expr.children = std::move(elems);
                        return expr;
                    }
                    case delimiter::bracket:
                    {
                        if (p.at_end()) {
                            return make(node_kind::expr_array);
                        }
                        auto first = p.parse_expr();
                        if (p.eat_op(";"sv)) {
                            auto expr = make(node_kind::expr_repeat);
                            expr.children.push_back(std::move(first));
                            expr.children.push_back(p.parse_expr());
                            p.finish();
                            return expr;
                        }
                        auto expr = make(node_kind::expr_array);
                        expr.children.push_back(std::move(first));
                        if (!p.at_end()) {
                            p.expect_op(","sv);
                            p.parse_comma_list([&] { expr.children.push_back(p.parse_expr()); });
                        }
                        return expr;
                    }
                }
                return fail("expression"sv);
            }

            syntax_node parse_path_expr(bool no_struct) {
                auto path = parse_path(true);
                if (peek_punct('!') && peek_any_group(1U)) {
                    ++pos_;
                    auto& group = next();
                    auto mac = make(node_kind::macro, path_to_string(path));
                    mac.modifier = std::string{to_string(group.delim)};
                    mac.tokens = group.children;
                    mac.children.push_back(none());
                    auto expr = make(node_kind::expr_macro);
                    expr.children.push_back(std::move(mac));
                    return expr;
                }
                if (!no_struct && peek_group(delimiter::brace)) {
                    return parse_struct_expr(std::move(path), &next());
                }
                auto expr = make(node_kind::expr_path);
                expr.children.push_back(std::move(path));
                return expr;
            }

            syntax_node parse_struct_expr(syntax_node path, const token_tree* group) {
                auto expr = make(node_kind::expr_struct);
                expr.children.push_back(std::move(path));
                auto p = sub(group);
                p.parse_comma_list([&] {
                    if (p.peek_op(".."sv)) {
                        p.pos_ += 2U;
                        auto base = make(node_kind::struct_base);
                        base.children.push_back(p.parse_expr());
                        expr.children.push_back(std::move(base));
                        return;
                    }
                    auto field = make(node_kind::field_value);
                    field.text = p.peek_literal() ? p.next().text : p.expect_name();
                    if (p.eat_op(":"sv)) {
                        field.modifier = ":";
                        field.children.push_back(p.parse_expr());
                    }
                    else {
                        auto shorthand = make(node_kind::expr_path);
                        auto path_node = make(node_kind::path);
                        path_node.children.push_back(make(node_kind::path_segment, field.text));
                        shorthand.children.push_back(std::move(path_node));
                        field.children.push_back(std::move(shorthand));
                    }
                    expr.children.push_back(std::move(field));
                });
                return expr;
            }

            syntax_node parse_if() {
                expect_ident("if"sv);
                auto expr = make(node_kind::expr_if);
                expr.children.push_back(parse_expr(true));
                expr.children.push_back(parse_block(expect_group(delimiter::brace)));
                if (!eat_ident("else"sv)) {
                    expr.children.push_back(none());
                    return expr;
                }
                if (peek_ident("if"sv)) {
                    expr.children.push_back(parse_if());
                    return expr;
                }
                auto alt = make(node_kind::expr_block);
                alt.children.push_back(parse_block(expect_group(delimiter::brace)));
                expr.children.push_back(std::move(alt));
                return expr;
            }

            syntax_node parse_match() {
                expect_ident("match"sv);
                auto expr = make(node_kind::expr_match);
                expr.children.push_back(parse_expr(true));
                auto p = sub(expect_group(delimiter::brace));
                while (!p.at_end() && !p.failed()) {
                    auto arm = make(node_kind::arm);
                    arm.children.push_back(p.parse_outer_attrs());
                    arm.children.push_back(p.parse_pat());
                    arm.children.push_back(p.eat_ident("if"sv) ? p.parse_expr() : none());
                    p.expect_op("=>"sv);
                    // a block-like body ends the arm, so `{} [a, ..] => ...` starts the next pattern
                    auto body = p.peek_block_like() ? p.parse_postfix(false, true) : p.parse_expr();
                    if (!p.eat_op(","sv) && !is_block_like(body) && !p.at_end()) {
                        p.fail(","sv);
                    }
                    arm.children.push_back(std::move(body));
                    expr.children.push_back(std::move(arm));
                }
                return expr;
            }

            syntax_node parse_closure(bool no_struct) {
                auto expr = make(node_kind::expr_closure);
                if (eat_ident("move"sv)) {
                    expr.modifier = "move";
                }
                auto params = make(node_kind::closure_params);
                if (!eat_op("||"sv)) {
                    expect_op("|"sv);
                    while (!failed() && !eat_op("|"sv)) {
                        auto pat = parse_pat_no_alt();
                        if (eat_op(":"sv)) {
                            auto typed = make(node_kind::pat_type);
                            typed.children.push_back(std::move(pat));
                            typed.children.push_back(parse_type_no_bounds());
                            pat = std::move(typed);
                        }
                        params.children.push_back(std::move(pat));
                        if (!peek_punct('|')) {
                            expect_op(","sv);
                        }
                    }
                }
                expr.children.push_back(std::move(params));
                if (eat_op("->"sv)) {
                    expr.children.push_back(parse_type_no_bounds());
                    auto body = make(node_kind::expr_block);
                    body.children.push_back(parse_block(expect_group(delimiter::brace)));
                    expr.children.push_back(std::move(body));
                    return expr;
                }
                expr.children.push_back(none());
                expr.children.push_back(parse_assign(no_struct));
                return expr;
            }

            std::span<const token_tree> tokens_;
            size_t pos_{0U};
            parse_state& state_;
        };

        template <typename F>
        static std::optional<syntax_node> run_parser(
                const token_stream& tokens, std::string_view tier, F&& entry, std::string* error = nullptr) {
            parse_state state{};
            parser p{tokens.trees(), state};
            auto node = std::forward<F>(entry)(p);
            if (!state.error) {
                p.finish();
            }
            if (state.error) {
                debug_log{"not a ", tier, ": ", *state.error};
                if (error != nullptr) {
                    *error = std::move(*state.error);
                }
                return std::nullopt;
            }
            return node;
        }

        static syntax_node parse_file_entry(parser& p) {
            return p.parse_file();
        }

        static syntax_node parse_expr_entry(parser& p) {
            return p.parse_expr();
        }

    }  // namespace detail

    std::optional<syntax_node> parse_unit(const token_stream& tokens) {
        return detail::run_parser(tokens, "complete unit"sv, detail::parse_file_entry);
    }

    std::optional<syntax_node> parse_expression(const token_stream& tokens) {
        if (tokens.empty()) {
            return std::nullopt;
        }
        return detail::run_parser(tokens, "expression"sv, detail::parse_expr_entry);
    }

    std::optional<std::string> parse_failure(const token_stream& tokens, parse_tier tier) {
        std::string error{};
        switch (tier) {
            case parse_tier::complete_unit:
                if (detail::run_parser(tokens, "complete unit"sv, detail::parse_file_entry, &error)) {
                    return std::nullopt;
                }
                return error;
            case parse_tier::expression:
                if (tokens.empty()) {
                    return std::string{"empty input"};
                }
                if (detail::run_parser(tokens, "expression"sv, detail::parse_expr_entry, &error)) {
                    return std::nullopt;
                }
                return error;
            case parse_tier::unparsed:
                break;
        }
        return std::nullopt;
    }

    parse_result parse_tiered(const token_stream& tokens) {
        if (auto file = parse_unit(tokens)) {
            return complete_unit{std::move(*file)};
        }
        if (auto expr = parse_expression(tokens)) {
            return expression_form{std::move(*expr)};
        }
        return unparsed{tokens.to_string()};
    }

    bool is_doc_attribute(const syntax_node& node) {
        return (node.is(node_kind::attribute) || node.is(node_kind::inner_attribute)) && node.text == "doc";
    }

    syntax_node strip_docs(const syntax_node& node) {
        syntax_node out{.kind = node.kind, .text = node.text, .modifier = node.modifier, .tokens = node.tokens};
        out.children.reserve(node.children.size());
        for (const auto& child : node.children) {
            if (is_doc_attribute(child)) {
                continue;
            }
            out.children.push_back(strip_docs(child));
        }
        return out;
    }

}  // namespace tokensnap::syntax
