#include "tokensnap/normalize.hpp"

#include "tokensnap/settings.hpp"
#include "tokensnap/syntax.hpp"
#include "tokensnap/utils.hpp"

namespace tokensnap {

    namespace detail {
        static bool structurally_equal(const syntax::syntax_node& a, const syntax::syntax_node& b, bool ignore_docs) {
            if (ignore_docs) {
                return syntax::strip_docs(a) == syntax::strip_docs(b);
            }
            return a == b;
        }
    }  // namespace detail

    bool tokens_equal(const token_stream& a, const token_stream& b) {
        if (a.empty() || b.empty()) {
            return a.empty() && b.empty();
        }
        bool ignore_docs = settings_context::current().ignore_docs_for_tokens();

        auto unit_a = syntax::parse_unit(a);
        auto unit_b = unit_a ? syntax::parse_unit(b) : std::nullopt;
        if (unit_a && unit_b) {
            return detail::structurally_equal(*unit_a, *unit_b, ignore_docs);
        }

        auto expr_a = syntax::parse_expression(a);
        auto expr_b = expr_a ? syntax::parse_expression(b) : std::nullopt;
        if (expr_a && expr_b) {
            return detail::structurally_equal(*expr_a, *expr_b, ignore_docs);
        }

        debug_log{"comparing raw token renderings"};
        return a.to_string() == b.to_string();
    }

    bool tokens_equal(std::string_view a, std::string_view b) {
        return tokens_equal(token_stream::parse(a), token_stream::parse(b));
    }

}  // namespace tokensnap
