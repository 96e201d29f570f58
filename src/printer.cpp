#include "tokensnap/printer.hpp"

#include "tokensnap/settings.hpp"
#include "tokensnap/utils.hpp"

#include <algorithm>
#include <array>

namespace tokensnap {

    namespace syntax { namespace detail {

        using namespace std::string_view_literals;

        static constexpr size_t indent_width = 4U;

        static constexpr std::array keywords{
                "as"sv,     "async"sv, "break"sv, "const"sv, "continue"sv, "dyn"sv,  "else"sv,   "enum"sv,
                "extern"sv, "fn"sv,    "for"sv,   "if"sv,    "impl"sv,     "in"sv,   "let"sv,    "loop"sv,
                "match"sv,  "mod"sv,   "move"sv,  "mut"sv,   "pub"sv,      "ref"sv,  "return"sv, "static"sv,
                "struct"sv, "trait"sv, "type"sv,  "unsafe"sv, "use"sv,     "where"sv, "while"sv};

        static bool is_keyword(const token_tree& t) {
            return t.kind == token_kind::ident && std::ranges::find(keywords, t.text) != keywords.end();
        }

        static bool is_word(const token_tree& t) {
            return t.kind == token_kind::ident || t.kind == token_kind::literal;
        }

        // A prefix operator follows nothing, another operator, or a keyword
        static bool is_prefix_position(const token_tree* before) {
            return before == nullptr || before->kind == token_kind::punct || is_keyword(*before);
        }

        static bool wants_space(const token_tree* before_prev, const token_tree& prev, const token_tree& cur) {
            if (prev.is_joint()) {
                return false;
            }
            if (is_word(prev) && is_word(cur)) {
                return true;
            }
            if (prev.kind == token_kind::punct && cur.kind == token_kind::punct) {
                return true;
            }
            if (cur.is_punct(',') || cur.is_punct(';') || cur.is_punct(':')) {
                return false;
            }
            if (cur.is_punct('.') || cur.is_punct('?')) {
                return prev.kind == token_kind::literal;
            }
            if (cur.is_punct('!') && prev.kind == token_kind::ident) {
                return is_keyword(prev);
            }
            if (prev.kind == token_kind::punct) {
                switch (prev.text[0]) {
                    case ':':
                        return !(before_prev != nullptr && before_prev->is_punct(':') && before_prev->is_joint());
                    case '.':
                    case '#':
                    case '$':
                        return false;
                    case '!':
                    case '-':
                    case '*':
                    case '&':
                        return !is_prefix_position(before_prev) && !cur.is_group(delimiter::parenthesis) &&
                               !cur.is_group(delimiter::bracket);
                    default:
                        return true;
                }
            }
            if (cur.kind == token_kind::group && cur.delim != delimiter::brace) {
                if (prev.kind == token_kind::ident) {
                    return is_keyword(prev);
                }
                return prev.kind != token_kind::group;
            }
            return true;
        }

        static void write_run(std::string& out, const std::vector<token_tree>& tokens) {
            const token_tree* before_prev = nullptr;
            const token_tree* prev = nullptr;
            for (const auto& t : tokens) {
                if (prev != nullptr && wants_space(before_prev, *prev, t)) {
                    out += ' ';
                }
                if (t.kind == token_kind::group) {
                    out += open_char(t.delim);
                    if (t.delim == delimiter::brace && !t.children.empty()) {
                        out += ' ';
                        write_run(out, t.children);
                        out += ' ';
                    }
                    else {
                        write_run(out, t.children);
                    }
                    out += close_char(t.delim);
                }
                else {
                    out += t.text;
                }
                before_prev = prev;
                prev = &t;
            }
        }

        static std::string pad(size_t level) {
            return std::string(level * indent_width, ' ');
        }

        template <typename F>
        static std::string join(const std::vector<syntax_node>& nodes, std::string_view separator, F&& each,
                                size_t first = 0U) {
            std::string out{};
            for (size_t i = first; i < nodes.size(); ++i) {
                if (i != first) {
                    out += separator;
                }
                out += each(nodes[i]);
            }
            return out;
        }

        class printer {
          public:
            printer() = default;
            explicit printer(doc_style docs) : docs_{docs} {}

            std::string file(const syntax_node& file) {
                std::string out{};
                for (const auto& child : file.children) {
                    if (child.is(node_kind::inner_attribute)) {
                        out += attribute_line(child, 0U);
                    }
                    else {
                        out += item(child, 0U);
                    }
                }
                return out;
            }

            // ── attributes ────────────────────────────────────────────────

            std::string attribute(const syntax_node& attr) {
                bool inner = attr.is(node_kind::inner_attribute);
                if (auto doc = doc_text(attr); doc && docs_ == doc_style::comments) {
                    return (inner ? "//!" : "///") + *doc;
                }
                std::string out{inner ? "#![" : "#["};
                out += attr.text;
                if (!attr.tokens.empty()) {
                    if (attr.tokens[0].kind != token_kind::group) {
                        out += ' ';
                    }
                    out += format_token_run(attr.tokens);
                }
                out += ']';
                return out;
            }

            std::string attribute_line(const syntax_node& attr, size_t level) {
                return pad(level) + attribute(attr) + '\n';
            }

            std::string attribute_lines(const syntax_node& attrs, size_t level) {
                std::string out{};
                for (const auto& attr : attrs.children) {
                    out += attribute_line(attr, level);
                }
                return out;
            }

            // `#[doc = "..."]` prints as a line comment when the value is a plain single-line string
            static std::optional<std::string> doc_text(const syntax_node& attr) {
                if (attr.text != "doc" || attr.tokens.size() != 2U || !attr.tokens[0].is_punct('=') ||
                    attr.tokens[1].kind != token_kind::literal) {
                    return std::nullopt;
                }
                std::string_view lit{attr.tokens[1].text};
                if (lit.size() < 2U || lit.front() != '"' || lit.back() != '"') {
                    return std::nullopt;
                }
                auto body = lit.substr(1U, lit.size() - 2U);
                if (body.find_first_of("\\\n\r\"") != std::string_view::npos) {
                    return std::nullopt;
                }
                return std::string{body};
            }

            static std::string visibility(const syntax_node& vis) {
                return vis.text.empty() ? std::string{} : vis.text + ' ';
            }

            // ── items ─────────────────────────────────────────────────────

            std::string item(const syntax_node& node, size_t level) {
                switch (node.kind) {
                    case node_kind::item_struct:
                    case node_kind::item_union:
                        return item_struct(node, level);
                    case node_kind::item_enum:
                        return item_enum(node, level);
                    case node_kind::item_fn:
                        return item_fn(node, level);
                    case node_kind::item_impl:
                        return item_impl(node, level);
                    case node_kind::item_trait:
                        return item_trait(node, level);
                    case node_kind::item_use:
                        return attribute_lines(node.children[0], level) + pad(level) +
                               visibility(node.children[1]) + "use " + use_tree(node.children[2]) + ";\n";
                    case node_kind::item_mod:
                        return item_mod(node, level);
                    case node_kind::item_const:
                    {
                        auto out = attribute_lines(node.children[0], level) + pad(level) +
                                   visibility(node.children[1]) + "const " + node.text + ": " + type(node.children[2]);
                        if (!node.children[3].is_none()) {
                            out += " = " + expr(node.children[3], level);
                        }
                        return out + ";\n";
                    }
                    case node_kind::item_static:
                    {
                        auto out = attribute_lines(node.children[0], level) + pad(level) +
                                   visibility(node.children[1]) + "static ";
                        if (!node.modifier.empty()) {
                            out += node.modifier + ' ';
                        }
                        out += node.text + ": " + type(node.children[2]);
                        if (!node.children[3].is_none()) {
                            out += " = " + expr(node.children[3], level);
                        }
                        return out + ";\n";
                    }
                    case node_kind::item_type:
                    {
                        auto out = attribute_lines(node.children[0], level) + pad(level) +
                                   visibility(node.children[1]) + "type " + node.text +
                                   generic_params(node.children[2]);
                        if (!node.children[3].is_none()) {
                            out += ": " + bounds(node.children[3]);
                        }
                        out += inline_where(node.children[2]);
                        if (!node.children[4].is_none()) {
                            out += " = " + type(node.children[4]);
                        }
                        return out + ";\n";
                    }
                    case node_kind::item_extern_crate:
                    {
                        auto out = attribute_lines(node.children[0], level) + pad(level) +
                                   visibility(node.children[1]) + "extern crate " + node.text;
                        if (!node.modifier.empty()) {
                            out += " as " + node.modifier;
                        }
                        return out + ";\n";
                    }
                    case node_kind::item_foreign_mod:
                    {
                        auto out = attribute_lines(node.children[0], level) + pad(level);
                        if (!node.modifier.empty()) {
                            out += node.modifier + ' ';
                        }
                        out += "extern";
                        if (!node.text.empty()) {
                            out += ' ' + node.text;
                        }
                        return out + item_body(node, 1U, syntax_node{}, level) + '\n';
                    }
                    case node_kind::item_macro:
                    {
                        const auto& mac = node.children[1];
                        return attribute_lines(node.children[0], level) + pad(level) + macro(mac) +
                               (mac.modifier == "{}" ? "" : ";") + '\n';
                    }
                    default:
                        return pad(level) + '\n';
                }
            }

            // Opens a body: ` {` or, with a where clause, the predicates on their own lines then `{`
            std::string open_body(const syntax_node& generics, size_t level) {
                auto* clause = where_clause(generics);
                if (clause == nullptr || clause->children.empty()) {
                    return " {";
                }
                std::string out{"\n" + pad(level) + "where\n"};
                for (const auto& predicate : clause->children) {
                    out += pad(level + 1U) + where_predicate(predicate) + ",\n";
                }
                return out + pad(level) + '{';
            }

            std::string named_fields(const syntax_node& fields, const syntax_node& generics, size_t level) {
                auto out = open_body(generics, level);
                if (fields.children.empty()) {
                    return out + '}';
                }
                out += '\n';
                for (const auto& field : fields.children) {
                    out += attribute_lines(field.children[0], level + 1U) + pad(level + 1U) +
                           visibility(field.children[1]) + field.text + ": " + type(field.children[2]) + ",\n";
                }
                return out + pad(level) + '}';
            }

            std::string tuple_fields(const syntax_node& fields) {
                return '(' + join(fields.children, ", "sv, [&](const syntax_node& field) {
                           std::string out{};
                           for (const auto& attr : field.children[0].children) {
                               out += attribute(attr) + ' ';
                           }
                           return out + visibility(field.children[1]) + type(field.children[2]);
                       }) + ')';
            }

            std::string item_struct(const syntax_node& node, size_t level) {
                const auto& generics = node.children[2];
                const auto& fields = node.children[3];
                auto out = attribute_lines(node.children[0], level) + pad(level) + visibility(node.children[1]) +
                           (node.is(node_kind::item_union) ? "union " : "struct ") + node.text +
                           generic_params(generics);
                if (fields.is(node_kind::fields_named)) {
                    return out + named_fields(fields, generics, level) + '\n';
                }
                if (fields.is(node_kind::fields_tuple)) {
                    out += tuple_fields(fields);
                }
                return out + inline_where(generics) + ";\n";
            }

            std::string item_enum(const syntax_node& node, size_t level) {
                const auto& generics = node.children[2];
                auto out = attribute_lines(node.children[0], level) + pad(level) + visibility(node.children[1]) +
                           "enum " + node.text + generic_params(generics) + open_body(generics, level);
                if (node.children.size() == 3U) {
                    return out + "}\n";
                }
                out += '\n';
                for (size_t i = 3U; i < node.children.size(); ++i) {
                    const auto& variant = node.children[i];
                    const auto& fields = variant.children[1];
                    out += attribute_lines(variant.children[0], level + 1U) + pad(level + 1U) + variant.text;
                    if (fields.is(node_kind::fields_tuple)) {
                        out += tuple_fields(fields);
                    }
                    else if (fields.is(node_kind::fields_named)) {
                        out += named_fields(fields, syntax_node{}, level + 1U);
                    }
                    if (!variant.children[2].is_none()) {
                        out += " = " + expr(variant.children[2], level + 1U);
                    }
                    out += ",\n";
                }
                return out + pad(level) + "}\n";
            }

            std::string signature(const std::string& name, const syntax_node& sig) {
                std::string out{};
                if (!sig.modifier.empty()) {
                    out += sig.modifier + ' ';
                }
                out += "fn " + name + generic_params(sig.children[0]) + '(' +
                       join(sig.children[1].children, ", "sv, [&](const syntax_node& p) { return param(p); }) +
                       ')';
                if (!sig.children[2].is_none()) {
                    out += " -> " + type(sig.children[2]);
                }
                return out;
            }

            std::string param(const syntax_node& p) {
                if (p.is(node_kind::self_param)) {
                    if (!p.children.empty() && !p.children[0].is_none()) {
                        return p.text + ": " + type(p.children[0]);
                    }
                    return p.text;
                }
                return pat(p.children[0]) + ": " + type(p.children[1]);
            }

            std::string item_fn(const syntax_node& node, size_t level) {
                const auto& sig = node.children[2];
                const auto& body = node.children[3];
                auto out = attribute_lines(node.children[0], level) + pad(level) + visibility(node.children[1]) +
                           signature(node.text, sig);
                if (body.is_none()) {
                    return out + inline_where(sig.children[0]) + ";\n";
                }
                // open_body already wrote the opening brace
                out += open_body(sig.children[0], level);
                return out + block_contents(body, level).substr(1U) + '\n';
            }

            // Items of impl/trait/mod bodies starting at `first`
            std::string item_body(const syntax_node& node, size_t first, const syntax_node& generics, size_t level) {
                auto out = open_body(generics, level);
                if (node.children.size() <= first) {
                    return out + '}';
                }
                out += '\n';
                for (size_t i = first; i < node.children.size(); ++i) {
                    out += item(node.children[i], level + 1U);
                }
                return out + pad(level) + '}';
            }

            std::string item_impl(const syntax_node& node, size_t level) {
                auto out = attribute_lines(node.children[0], level) + pad(level);
                if (!node.modifier.empty()) {
                    out += node.modifier + ' ';
                }
                out += "impl" + generic_params(node.children[1]) + ' ';
                if (!node.children[2].is_none()) {
                    out += type(node.children[2]) + " for ";
                }
                out += type(node.children[3]);
                return out + item_body(node, 4U, node.children[1], level) + '\n';
            }

            std::string item_trait(const syntax_node& node, size_t level) {
                auto out = attribute_lines(node.children[0], level) + pad(level) + visibility(node.children[1]);
                if (!node.modifier.empty()) {
                    out += node.modifier + ' ';
                }
                out += "trait " + node.text + generic_params(node.children[2]);
                if (!node.children[3].children.empty()) {
                    out += ": " + bounds(node.children[3]);
                }
                return out + item_body(node, 4U, node.children[2], level) + '\n';
            }

            std::string item_mod(const syntax_node& node, size_t level) {
                auto out = attribute_lines(node.children[0], level) + pad(level) + visibility(node.children[1]) +
                           "mod " + node.text;
                const auto& body = node.children[2];
                if (body.is_none()) {
                    return out + ";\n";
                }
                if (body.children.empty()) {
                    return out + " {}\n";
                }
                out += " {\n";
                for (const auto& child : body.children) {
                    out += child.is(node_kind::inner_attribute) ? attribute_line(child, level + 1U)
                                                                : item(child, level + 1U);
                }
                return out + pad(level) + "}\n";
            }

            std::string use_tree(const syntax_node& tree) {
                switch (tree.kind) {
                    case node_kind::use_path:
                        return tree.text + "::" + use_tree(tree.children[0]);
                    case node_kind::use_rename:
                        return tree.text + " as " + tree.modifier;
                    case node_kind::use_glob:
                        return "*";
                    case node_kind::use_group:
                        return '{' + join(tree.children, ", "sv, [&](const syntax_node& t) { return use_tree(t); }) +
                               '}';
                    default:
                        return tree.text;
                }
            }

            std::string macro(const syntax_node& mac) {
                std::string out{mac.text + '!'};
                if (!mac.children.empty() && !mac.children[0].is_none()) {
                    out += ' ' + mac.children[0].text;
                }
                auto body = format_token_run(mac.tokens);
                if (mac.modifier == "{}") {
                    if (!mac.children.empty() && !mac.children[0].is_none()) {
                        out += ' ';
                    }
                    return out + (body.empty() ? "{}" : "{ " + body + " }");
                }
                return out + mac.modifier[0] + body + mac.modifier[1];
            }

            // ── generics ──────────────────────────────────────────────────

            static const syntax_node* where_clause(const syntax_node& generics) {
                if (!generics.children.empty() && generics.children.back().is(node_kind::where_clause)) {
                    return &generics.children.back();
                }
                return nullptr;
            }

            std::string generic_params(const syntax_node& generics) {
                std::vector<std::string> params{};
                for (const auto& param : generics.children) {
                    switch (param.kind) {
                        case node_kind::lifetime_param:
                        {
                            auto out = param.text;
                            if (!param.children.empty()) {
                                out += ": " + join(param.children, " + "sv, [](const syntax_node& l) { return l.text; });
                            }
                            params.push_back(std::move(out));
                            break;
                        }
                        case node_kind::type_param:
                        {
                            auto out = param.text;
                            if (!param.children[0].children.empty()) {
                                out += ": " + bounds(param.children[0]);
                            }
                            if (!param.children[1].is_none()) {
                                out += " = " + type(param.children[1]);
                            }
                            params.push_back(std::move(out));
                            break;
                        }
                        case node_kind::const_param:
                        {
                            auto out = "const " + param.text + ": " + type(param.children[0]);
                            if (!param.children[1].is_none()) {
                                out += " = " + expr(param.children[1], 0U);
                            }
                            params.push_back(std::move(out));
                            break;
                        }
                        default:
                            break;
                    }
                }
                if (params.empty()) {
                    return {};
                }
                return '<' + utils::join_with_separator(params, ", "sv) + '>';
            }

            std::string where_predicate(const syntax_node& predicate) {
                const auto& target = predicate.children[0];
                auto lhs = target.is(node_kind::lifetime) ? target.text : type(target);
                return lhs + ": " + bounds(predicate.children[1]);
            }

            std::string inline_where(const syntax_node& generics) {
                auto* clause = where_clause(generics);
                if (clause == nullptr || clause->children.empty()) {
                    return {};
                }
                return " where " + join(clause->children, ", "sv,
                                        [&](const syntax_node& p) { return where_predicate(p); });
            }

            std::string bounds(const syntax_node& node) {
                return join(node.children, " + "sv, [&](const syntax_node& bound) {
                    if (bound.is(node_kind::lifetime)) {
                        return bound.text;
                    }
                    return bound.modifier + path(bound.children[0]);
                });
            }

            // ── paths and types ───────────────────────────────────────────

            std::string path(const syntax_node& node) {
                return node.modifier + join(node.children, "::"sv, [&](const syntax_node& segment) {
                           auto out = segment.text;
                           for (const auto& args : segment.children) {
                               out += path_arguments(args);
                           }
                           return out;
                       });
            }

            std::string path_arguments(const syntax_node& args) {
                if (args.is(node_kind::paren_args)) {
                    bool has_return = args.text == "->";
                    size_t count = args.children.size() - (has_return ? 1U : 0U);
                    std::string out{"("};
                    for (size_t i = 0U; i < count; ++i) {
                        if (i != 0U) {
                            out += ", ";
                        }
                        out += type(args.children[i]);
                    }
                    out += ')';
                    if (has_return) {
                        out += " -> " + type(args.children.back());
                    }
                    return out;
                }
                return args.modifier + '<' + join(args.children, ", "sv, [&](const syntax_node& arg) {
                           if (arg.is(node_kind::lifetime)) {
                               return arg.text;
                           }
                           if (arg.is(node_kind::assoc_type)) {
                               return arg.text + " = " + type(arg.children[0]);
                           }
                           if (arg.kind >= node_kind::expr_lit) {
                               return expr(arg, 0U);
                           }
                           return type(arg);
                       }) + '>';
            }

            std::string type(const syntax_node& node) {
                auto types = [&](size_t first = 0U) {
                    return join(node.children, ", "sv, [&](const syntax_node& t) { return type(t); }, first);
                };
                switch (node.kind) {
                    case node_kind::type_path:
                        return path(node.children[0]);
                    case node_kind::type_ref:
                    {
                        std::string out{"&"};
                        if (!node.children[0].is_none()) {
                            out += node.children[0].text + ' ';
                        }
                        if (!node.modifier.empty()) {
                            out += node.modifier + ' ';
                        }
                        return out + type(node.children[1]);
                    }
                    case node_kind::type_ptr:
                        return '*' + node.modifier + ' ' + type(node.children[0]);
                    case node_kind::type_tuple:
                        return '(' + types() + (node.children.size() == 1U ? ",)" : ")");
                    case node_kind::type_paren:
                        return '(' + type(node.children[0]) + ')';
                    case node_kind::type_array:
                        return '[' + type(node.children[0]) + "; " + expr(node.children[1], 0U) + ']';
                    case node_kind::type_slice:
                        return '[' + type(node.children[0]) + ']';
                    case node_kind::type_impl:
                        return "impl " + bounds(node.children[0]);
                    case node_kind::type_dyn:
                        return "dyn " + bounds(node.children[0]);
                    case node_kind::type_fn:
                    {
                        if (node.text != "->") {
                            return "fn(" + types() + ')';
                        }
                        std::string out{"fn("};
                        for (size_t i = 0U; i + 1U < node.children.size(); ++i) {
                            if (i != 0U) {
                                out += ", ";
                            }
                            out += type(node.children[i]);
                        }
                        return out + ") -> " + type(node.children.back());
                    }
                    case node_kind::type_never:
                        return "!";
                    case node_kind::type_infer:
                        return "_";
                    default:
                        return {};
                }
            }

            // ── patterns ──────────────────────────────────────────────────

            std::string pats(const std::vector<syntax_node>& nodes, size_t first = 0U) {
                return join(nodes, ", "sv, [&](const syntax_node& p) { return pat(p); }, first);
            }

            std::string pat(const syntax_node& node) {
                switch (node.kind) {
                    case node_kind::pat_ident:
                    {
                        auto out = node.modifier.empty() ? node.text : node.modifier + ' ' + node.text;
                        if (!node.children.empty()) {
                            out += " @ " + pat(node.children[0]);
                        }
                        return out;
                    }
                    case node_kind::pat_wild:
                        return "_";
                    case node_kind::pat_rest:
                        return "..";
                    case node_kind::pat_lit:
                        return expr(node.children[0], 0U);
                    case node_kind::pat_range:
                    {
                        auto out = pat(node.children[0]) + node.text;
                        if (!node.children[1].is_none()) {
                            out += pat(node.children[1]);
                        }
                        return out;
                    }
                    case node_kind::pat_path:
                        return path(node.children[0]);
                    case node_kind::pat_tuple:
                        return '(' + pats(node.children) + (node.children.size() == 1U ? ",)" : ")");
                    case node_kind::pat_paren:
                        return '(' + pat(node.children[0]) + ')';
                    case node_kind::pat_tuple_struct:
                        return path(node.children[0]) + '(' + pats(node.children, 1U) + ')';
                    case node_kind::pat_struct:
                    {
                        auto fields = join(
                                node.children, ", "sv,
                                [&](const syntax_node& field) {
                                    if (field.modifier == ":") {
                                        return field.text + ": " + pat(field.children[0]);
                                    }
                                    return pat(field.children[0]);
                                },
                                1U);
                        if (!node.modifier.empty()) {
                            fields += fields.empty() ? ".." : ", ..";
                        }
                        if (fields.empty()) {
                            return path(node.children[0]) + " {}";
                        }
                        return path(node.children[0]) + " { " + fields + " }";
                    }
                    case node_kind::pat_ref:
                        return '&' + (node.modifier.empty() ? std::string{} : node.modifier + ' ') +
                               pat(node.children[0]);
                    case node_kind::pat_or:
                        return join(node.children, " | "sv, [&](const syntax_node& p) { return pat(p); });
                    case node_kind::pat_slice:
                        return '[' + pats(node.children) + ']';
                    case node_kind::pat_type:
                        return pat(node.children[0]) + ": " + type(node.children[1]);
                    default:
                        return {};
                }
            }

            // ── statements and blocks ─────────────────────────────────────

            std::string block_contents(const syntax_node& block, size_t level) {
                if (block.children.empty()) {
                    return "{}";
                }
                std::string out{"{\n"};
                for (const auto& stmt : block.children) {
                    out += statement(stmt, level + 1U);
                }
                return out + pad(level) + '}';
            }

            std::string block(const syntax_node& node, size_t level) { return block_contents(node, level); }

            std::string statement(const syntax_node& stmt, size_t level) {
                if (stmt.is(node_kind::stmt_local)) {
                    auto out = attribute_lines(stmt.children[0], level) + pad(level) + "let " + pat(stmt.children[1]);
                    if (!stmt.children[2].is_none()) {
                        out += ": " + type(stmt.children[2]);
                    }
                    if (!stmt.children[3].is_none()) {
                        out += " = " + expr(stmt.children[3], level);
                    }
                    if (!stmt.children[4].is_none()) {
                        out += " else " + block(stmt.children[4], level);
                    }
                    return out + ";\n";
                }
                if (stmt.is(node_kind::stmt_expr)) {
                    return attribute_lines(stmt.children[0], level) + pad(level) + expr(stmt.children[1], level) +
                           stmt.modifier + '\n';
                }
                return item(stmt, level);
            }

            // ── expressions ───────────────────────────────────────────────

            std::string exprs(const std::vector<syntax_node>& nodes, size_t level, size_t first = 0U) {
                return join(nodes, ", "sv, [&](const syntax_node& e) { return expr(e, level); }, first);
            }

            std::string expr(const syntax_node& node, size_t level) {
                switch (node.kind) {
                    case node_kind::expr_lit:
                        return node.text;
                    case node_kind::expr_path:
                        return path(node.children[0]);
                    case node_kind::expr_binary:
                        return expr(node.children[0], level) + ' ' + node.text + ' ' + expr(node.children[1], level);
                    case node_kind::expr_unary:
                        return node.text + expr(node.children[0], level);
                    case node_kind::expr_reference:
                        return '&' + (node.modifier.empty() ? std::string{} : node.modifier + ' ') +
                               expr(node.children[0], level);
                    case node_kind::expr_cast:
                        return expr(node.children[0], level) + " as " + type(node.children[1]);
                    case node_kind::expr_call:
                        return expr(node.children[0], level) + '(' + exprs(node.children, level, 1U) + ')';
                    case node_kind::expr_method_call:
                    {
                        auto out = expr(node.children[0], level) + '.' + node.text;
                        if (!node.children[1].is_none()) {
                            out += path_arguments(node.children[1]);
                        }
                        return out + '(' + exprs(node.children, level, 2U) + ')';
                    }
                    case node_kind::expr_field:
                        return expr(node.children[0], level) + '.' + node.text;
                    case node_kind::expr_index:
                        return expr(node.children[0], level) + '[' + expr(node.children[1], level) + ']';
                    case node_kind::expr_try:
                        return expr(node.children[0], level) + '?';
                    case node_kind::expr_await:
                        return expr(node.children[0], level) + ".await";
                    case node_kind::expr_paren:
                        return '(' + expr(node.children[0], level) + ')';
                    case node_kind::expr_tuple:
                        return '(' + exprs(node.children, level) + (node.children.size() == 1U ? ",)" : ")");
                    case node_kind::expr_array:
                        return '[' + exprs(node.children, level) + ']';
                    case node_kind::expr_repeat:
                        return '[' + expr(node.children[0], level) + "; " + expr(node.children[1], level) + ']';
                    case node_kind::expr_struct:
                        return struct_expr(node, level);
                    case node_kind::expr_block:
                        return label(node) + (node.modifier.empty() ? std::string{} : node.modifier + ' ') +
                               block(node.children[0], level);
                    case node_kind::expr_if:
                    {
                        auto out = "if " + expr(node.children[0], level) + ' ' + block(node.children[1], level);
                        if (!node.children[2].is_none()) {
                            out += " else " + expr(node.children[2], level);
                        }
                        return out;
                    }
                    case node_kind::expr_let:
                        return "let " + pat(node.children[0]) + " = " + expr(node.children[1], level);
                    case node_kind::expr_while:
                        return label(node) + "while " + expr(node.children[0], level) + ' ' +
                               block(node.children[1], level);
                    case node_kind::expr_loop:
                        return label(node) + "loop " + block(node.children[0], level);
                    case node_kind::expr_for:
                        return label(node) + "for " + pat(node.children[0]) + " in " + expr(node.children[1], level) + ' ' +
                               block(node.children[2], level);
                    case node_kind::expr_match:
                        return match_expr(node, level);
                    case node_kind::expr_closure:
                        return closure(node, level);
                    case node_kind::expr_return:
                    case node_kind::expr_break:
                    {
                        std::string out{node.is(node_kind::expr_return) ? "return" : "break"};
                        if (!node.text.empty()) {
                            out += ' ' + node.text;
                        }
                        if (!node.children[0].is_none()) {
                            out += ' ' + expr(node.children[0], level);
                        }
                        return out;
                    }
                    case node_kind::expr_continue:
                        return node.text.empty() ? std::string{"continue"} : "continue " + node.text;
                    case node_kind::expr_range:
                    {
                        std::string out{};
                        if (!node.children[0].is_none()) {
                            out += expr(node.children[0], level);
                        }
                        out += node.text;
                        if (!node.children[1].is_none()) {
                            out += expr(node.children[1], level);
                        }
                        return out;
                    }
                    case node_kind::expr_macro:
                        return macro(node.children[0]);
                    default:
                        return {};
                }
            }

            static std::string label(const syntax_node& node) {
                return node.text.empty() ? std::string{} : node.text + ": ";
            }

            std::string struct_expr(const syntax_node& node, size_t level) {
                auto fields = join(
                        node.children, ", "sv,
                        [&](const syntax_node& field) {
                            if (field.is(node_kind::struct_base)) {
                                return ".." + expr(field.children[0], level);
                            }
                            if (field.modifier == ":") {
                                return field.text + ": " + expr(field.children[0], level);
                            }
                            return field.text;
                        },
                        1U);
                if (fields.empty()) {
                    return path(node.children[0]) + " {}";
                }
                return path(node.children[0]) + " { " + fields + " }";
            }

            std::string match_expr(const syntax_node& node, size_t level) {
                auto out = "match " + expr(node.children[0], level) + " {";
                if (node.children.size() == 1U) {
                    return out + '}';
                }
                out += '\n';
                for (size_t i = 1U; i < node.children.size(); ++i) {
                    const auto& arm = node.children[i];
                    const auto& body = arm.children[3];
                    out += attribute_lines(arm.children[0], level + 1U) + pad(level + 1U) + pat(arm.children[1]);
                    if (!arm.children[2].is_none()) {
                        out += " if " + expr(arm.children[2], level + 1U);
                    }
                    out += " => " + expr(body, level + 1U);
                    if (!body.is(node_kind::expr_block)) {
                        out += ',';
                    }
                    out += '\n';
                }
                return out + pad(level) + '}';
            }

            std::string closure(const syntax_node& node, size_t level) {
                std::string out{};
                if (!node.modifier.empty()) {
                    out += node.modifier + ' ';
                }
                out += '|' + pats(node.children[0].children) + '|';
                if (!node.children[1].is_none()) {
                    out += " -> " + type(node.children[1]);
                }
                return out + ' ' + expr(node.children[2], level);
            }

          private:
            doc_style docs_{doc_style::comments};
        };

    }}  // namespace syntax::detail

    namespace syntax {

        std::string format_unit(const syntax_node& file, doc_style docs) {
            return detail::printer{docs}.file(file);
        }

        std::string format_expr(const syntax_node& expr, doc_style docs) {
            return detail::printer{docs}.expr(expr, 0U);
        }

        std::string format_token_run(const std::vector<token_tree>& tokens) {
            std::string out{};
            detail::write_run(out, tokens);
            return out;
        }

    }  // namespace syntax

    namespace detail {

        static std::string render_with(const token_stream& tokens, syntax::doc_style docs) {
            auto& settings = settings_context::current();
            if (!settings.format_tokens()) {
                return tokens.to_string();
            }
            bool strip = settings.ignore_docs_for_tokens();

            auto parsed = syntax::parse_tiered(tokens);
            if (auto* unit = std::get_if<syntax::complete_unit>(&parsed)) {
                auto text = syntax::format_unit(strip ? syntax::strip_docs(unit->file) : unit->file, docs);
                while (!text.empty() && text.back() == '\n') {
                    text.pop_back();
                }
                return text;
            }
            if (auto* form = std::get_if<syntax::expression_form>(&parsed)) {
                return syntax::format_expr(strip ? syntax::strip_docs(form->expr) : form->expr, docs);
            }
            return std::get<syntax::unparsed>(parsed).text;
        }

    }  // namespace detail

    std::string render(const token_stream& tokens) {
        return detail::render_with(tokens, syntax::doc_style::comments);
    }

    // Line comments do not survive stringizing, so literals keep docs in attribute form
    std::string render_for_literal(const token_stream& tokens) {
        auto pretty = detail::render_with(tokens, syntax::doc_style::attributes);
        if (pretty.find('\n') == std::string::npos) {
            return pretty;
        }
        return "\n" + std::string{utils::trim_right_view(pretty)} + "\n";
    }

}  // namespace tokensnap
