/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef ELECTIVE_ALGEBRA_GUARD_ELECTIVE_EXPRESSION_HH
#define ELECTIVE_ALGEBRA_GUARD_ELECTIVE_EXPRESSION_HH

#include <elective/assignment.hh>
#include <elective/symbol.hh>

#include <iosfwd>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <fmt/ostream.h>

namespace elective
{
    /**
     * \defgroup Expressions Elective functions: symbols, constants, negation and product.
     */

    struct Expression;

    /**
     * \brief A reference to a single elective symbol.
     *
     * \ingroup Expressions
     */
    struct SymbolRef final
    {
        Symbol symbol;
    };

    /**
     * \brief The constant 0 or the constant 1.
     *
     * \ingroup Expressions
     */
    struct Constant final
    {
        long long value;

        /**
         * \throw InvalidConstant unless v is 0 or 1.
         */
        explicit Constant(long long v);
    };

    /**
     * \brief `(1-body)`, the complement of its body.
     *
     * \ingroup Expressions
     */
    struct Negation final
    {
        std::unique_ptr<Expression> body;
    };

    /**
     * \brief `left right` written side by side, the intersection of the two.
     *
     * \ingroup Expressions
     */
    struct Product final
    {
        std::unique_ptr<Expression> left, right;
    };

    /**
     * \brief An elective function. Each node exclusively owns its children,
     * and nothing modifies a tree once it has been built.
     *
     * Usually built by parse(), or by symbol(), constant(), negation() and
     * product().
     *
     * \ingroup Expressions
     */
    struct Expression final
    {
        std::variant<SymbolRef, Constant, Negation, Product> node;
    };

    [[nodiscard]] auto symbol(const Symbol &) -> Expression;

    /**
     * \throw InvalidConstant unless v is 0 or 1.
     */
    [[nodiscard]] auto constant(long long v) -> Expression;

    [[nodiscard]] auto negation(Expression body) -> Expression;

    [[nodiscard]] auto product(Expression left, Expression right) -> Expression;

    /**
     * \brief Allow `a * b` as shorthand for `product(a, b)`.
     *
     * \ingroup Expressions
     */
    [[nodiscard]] auto operator*(Expression left, Expression right) -> Expression;

    /**
     * \brief Expressions own their children, so copying must be asked for.
     *
     * \ingroup Expressions
     */
    [[nodiscard]] auto clone(const Expression &) -> Expression;

    /**
     * \brief Evaluate using ordinary integer arithmetic: a negation is one
     * minus its body, and a product multiplies.
     *
     * Nothing here checks that results stay inside {0, 1}; that holds
     * because constants are 0 or 1 and assignments only ever bind 0 or 1.
     *
     * \throw UnboundSymbol if the expression mentions a symbol that the
     * assignment does not bind.
     * \ingroup Expressions
     */
    [[nodiscard]] auto evaluate(const Expression &, const Assignment &) -> long long;

    /**
     * \brief The canonical text for this expression, in the same notation
     * that parse() accepts.
     *
     * \ingroup Expressions
     */
    [[nodiscard]] auto to_text(const Expression &) -> std::string;

    /**
     * \brief Every symbol mentioned, each once, in order of first appearance.
     *
     * \ingroup Expressions
     */
    [[nodiscard]] auto symbols_of(const Expression &) -> std::vector<Symbol>;

    /**
     * \brief Structural equality.
     *
     * \ingroup Expressions
     */
    [[nodiscard]] auto operator==(const Expression &, const Expression &) -> bool;

    auto operator<<(std::ostream &, const Expression &) -> std::ostream &;
}

template <>
struct fmt::formatter<elective::Expression> : ostream_formatter
{
};

#endif
