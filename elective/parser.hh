/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef ELECTIVE_ALGEBRA_GUARD_ELECTIVE_PARSER_HH
#define ELECTIVE_ALGEBRA_GUARD_ELECTIVE_PARSER_HH

#include <elective/expression.hh>

#include <cstddef>
#include <string_view>

namespace elective
{
    /**
     * \defgroup Parser Reading elective functions from text
     *
     * The notation is deliberately tiny:
     *
     * \code
     * expr     := atom | negation | expr expr
     * atom     := LETTER | 0 | 1
     * negation := "(1-" expr ")"
     * \endcode
     *
     * Writing two terms side by side multiplies them. There is no whitespace,
     * and there are no other operators.
     */

    /**
     * \brief The longest text parse() and parse_equation() will accept.
     * Expressions are trees whose depth can grow with the length of their
     * text, and everything that walks them recurses.
     *
     * \ingroup Parser
     */
    inline constexpr std::size_t max_expression_length = 4096;

    /**
     * \brief Parse an expression, for example `"x(1-y)z"`.
     *
     * Everything in the text must be consumed: there is no partial parse.
     *
     * \throw ParseError for empty text, an unrecognised character, a `(` that
     * is not followed by `1-`, unbalanced parentheses, or text longer than
     * max_expression_length.
     * \ingroup Parser
     */
    [[nodiscard]] auto parse(std::string_view text) -> Expression;

    /**
     * \brief The two sides of `lhs = rhs`.
     *
     * \ingroup Parser
     */
    struct ParsedEquation final
    {
        Expression lhs, rhs;
    };

    /**
     * \brief Parse text of the form `lhs = rhs`. Blanks around either side
     * are ignored.
     *
     * \throw ParseError if there is not exactly one `=`, if either side
     * does not parse, or if the text is longer than max_expression_length.
     * \ingroup Parser
     */
    [[nodiscard]] auto parse_equation(std::string_view text) -> ParsedEquation;
}

#endif
