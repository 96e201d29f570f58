#pragma once

#include "syntax.hpp"
#include "tokens.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tokensnap {

    /*
     * Renders a token stream for display in a snapshot.
     *
     * With `format_tokens` off this is the canonical raw rendering. Otherwise the stream is parsed as a
     * complete unit, then as an expression, and pretty-printed (docs stripped when `ignore_docs_for_tokens`
     * is set); streams that parse as neither fall back to the raw rendering. The trailing newline of a
     * formatted unit is trimmed.
     */
    std::string render(const token_stream& tokens);

    /*
     * Like `render`, but multi-line output is wrapped as "\n<content>\n" for embedding in an inline literal.
     * Doc attributes stay in `#[doc = "..."]` form.
     */
    std::string render_for_literal(const token_stream& tokens);

    namespace syntax {

        // How `#[doc = "..."]` attributes with a plain single-line value are printed
        enum class doc_style : uint8_t { comments, attributes };

        // One item per line group, each terminated by '\n'
        std::string format_unit(const syntax_node& file, doc_style docs = doc_style::comments);

        std::string format_expr(const syntax_node& expr, doc_style docs = doc_style::comments);

        // Compact spacing for attribute arguments and macro bodies; re-tokenizes to the same trees
        std::string format_token_run(const std::vector<token_tree>& tokens);

    }  // namespace syntax

}  // namespace tokensnap
