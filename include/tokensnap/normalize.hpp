#pragma once

#include "tokens.hpp"

#include <string_view>

namespace tokensnap {

    /*
     * Semantic equality of token streams.
     *
     * Both sides are parsed as complete units and compared structurally; failing that, both are parsed as
     * expressions; failing that, their canonical raw renderings are compared. Doc attributes are ignored
     * in the structural tiers while `ignore_docs_for_tokens` is set. Whitespace never matters, and an
     * empty stream equals only another empty stream.
     */
    bool tokens_equal(const token_stream& a, const token_stream& b);

    // Tokenizes both sides first; throws tokenize_error on malformed input
    bool tokens_equal(std::string_view a, std::string_view b);

}  // namespace tokensnap
