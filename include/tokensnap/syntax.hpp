#pragma once

#include "tokens.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tokensnap::syntax {

    using namespace std::string_view_literals;

    /*
     * Node kinds of the parsed form. Every node carries `text` (name, operator or literal), `modifier`
     * (qualifiers such as "mut", "unsafe", "move", or a macro delimiter), ordered `children`, and verbatim
     * `tokens` for attribute arguments and macro bodies. Optional slots hold a `none` node so that child
     * positions stay fixed per kind:
     *
     *   file             children: inner attributes, items
     *   attributes       children: attribute | inner_attribute         text of attribute: path
     *   visibility       text: "", "pub", "pub(crate)", "pub(in a::b)", ...
     *   generics         children: lifetime_param | type_param | const_param, optional trailing where_clause
     *   item_struct      text: name; children: attributes, visibility, generics, fields_named|fields_tuple|fields_unit
     *   item_union       as item_struct, always fields_named
     *   item_enum        text: name; children: attributes, visibility, generics, variant...
     *   variant          text: name; children: attributes, fields, discriminant expr | none
     *   field            text: name ("" in tuples); children: attributes, visibility, type
     *   item_fn          text: name; children: attributes, visibility, signature, block | none
     *   signature        modifier: "const async unsafe"; children: generics, params, return type | none
     *   item_impl        modifier: "unsafe"; children: attributes, generics, trait path | none, self type, items...
     *   item_trait       text: name; children: attributes, visibility, generics, bounds, items...
     *   item_use         children: attributes, visibility, use tree
     *   item_mod         text: name; children: attributes, visibility, mod_body | none
     *   item_const       text: name; children: attributes, visibility, type, expr | none
     *   item_static      text: name; modifier: "mut"; children: attributes, visibility, type, expr | none
     *   item_type        text: name; children: attributes, visibility, generics, bounds | none, type | none
     *   item_macro       children: attributes, macro
     *   item_extern_crate text: crate name; modifier: rename; children: attributes, visibility
     *   item_foreign_mod text: ABI literal or ""; modifier: "unsafe"; children: attributes, items...
     *   expr_block, expr_loop, expr_while, expr_for
     *                    text: label such as "'outer" or ""; expr_block modifier: "unsafe", "async", "async move"
     *   expr_break, expr_continue
     *                    text: label or ""; expr_break children: value | none
     *   macro            text: path; modifier: delimiter "()" "[]" "{}"; tokens: body; children: ident | none
     */
    enum class node_kind : uint8_t {
        none,
        file,
        attributes,
        attribute,
        inner_attribute,
        visibility,
        ident,
        lifetime,

        generics,
        lifetime_param,
        type_param,
        const_param,
        where_clause,
        where_predicate,
        bounds,
        trait_bound,

        item_struct,
        item_enum,
        item_fn,
        item_impl,
        item_trait,
        item_use,
        item_mod,
        item_const,
        item_static,
        item_type,
        item_macro,
        item_extern_crate,
        item_foreign_mod,
        item_union,
        mod_body,
        fields_named,
        fields_tuple,
        fields_unit,
        field,
        variant,
        signature,
        params,
        self_param,
        param,

        use_path,
        use_name,
        use_rename,
        use_glob,
        use_group,

        path,
        path_segment,
        generic_args,
        paren_args,
        assoc_type,

        type_path,
        type_ref,
        type_ptr,
        type_tuple,
        type_paren,
        type_array,
        type_slice,
        type_impl,
        type_dyn,
        type_fn,
        type_never,
        type_infer,

        pat_ident,
        pat_wild,
        pat_rest,
        pat_lit,
        pat_range,
        pat_path,
        pat_tuple,
        pat_paren,
        pat_tuple_struct,
        pat_struct,
        field_pat,
        pat_ref,
        pat_or,
        pat_slice,
        pat_type,

        block,
        stmt_local,
        stmt_expr,

        expr_lit,
        expr_path,
        expr_binary,
        expr_unary,
        expr_reference,
        expr_cast,
        expr_call,
        expr_method_call,
        expr_field,
        expr_index,
        expr_try,
        expr_await,
        expr_paren,
        expr_tuple,
        expr_array,
        expr_repeat,
        expr_struct,
        field_value,
        struct_base,
        expr_block,
        expr_if,
        expr_let,
        expr_while,
        expr_loop,
        expr_for,
        expr_match,
        arm,
        expr_closure,
        closure_params,
        expr_return,
        expr_break,
        expr_continue,
        expr_range,
        expr_macro,
        macro,
    };

    struct syntax_node {
        node_kind kind{node_kind::none};
        std::string text{};
        std::string modifier{};
        std::vector<syntax_node> children{};
        std::vector<token_tree> tokens{};

        bool is(node_kind k) const { return kind == k; }
        bool is_none() const { return kind == node_kind::none; }

        bool operator==(const syntax_node&) const = default;
    };

    // Tier 1: a whole compilable fragment (items and inner attributes)
    struct complete_unit {
        syntax_node file{};
    };

    // Tier 2: a single expression
    struct expression_form {
        syntax_node expr{};
    };

    // Tier 3: nothing parsed; the canonical raw rendering stands in
    struct unparsed {
        std::string text{};
    };

    using parse_result = std::variant<complete_unit, expression_form, unparsed>;

    enum class parse_tier : uint8_t { complete_unit, expression, unparsed };

    constexpr std::string_view to_string(parse_tier tier) {
        switch (tier) {
            case parse_tier::complete_unit:
                return "complete_unit"sv;
            case parse_tier::expression:
                return "expression"sv;
            case parse_tier::unparsed:
                return "unparsed"sv;
        }
        return "unparsed"sv;
    }

    inline parse_tier tier_of(const parse_result& result) {
        return static_cast<parse_tier>(result.index());
    }

    std::optional<syntax_node> parse_unit(const token_stream& tokens);
    std::optional<syntax_node> parse_expression(const token_stream& tokens);

    // Why `tokens` is rejected at `tier`; nullopt when that tier accepts it
    std::optional<std::string> parse_failure(const token_stream& tokens, parse_tier tier);

    // Tries complete unit, then expression, then gives up with the raw rendering
    parse_result parse_tiered(const token_stream& tokens);

    // Returns a copy of `node` without `doc` attributes at any depth
    syntax_node strip_docs(const syntax_node& node);

    bool is_doc_attribute(const syntax_node& node);

}  // namespace tokensnap::syntax
