#ifndef ELECTIVE_ALGEBRA_GUARD_ELECTIVE_ELIMINATION_HH
#define ELECTIVE_ALGEBRA_GUARD_ELECTIVE_ELIMINATION_HH

#include <elective/equation.hh>
#include <elective/symbol.hh>

#include <vector>

namespace elective
{
    /**
     * \brief Remove a symbol from an equation's scope, for example to get rid
     * of the middle term of a syllogism.
     *
     * An assignment to the remaining variables is forbidden if and only if it
     * is forbidden whichever value the removed symbol takes, that is, both of
     * its completions are forbidden in eq. The remaining variables keep their
     * order.
     *
     * \throw UnknownVariable if the symbol is not one of eq's variables.
     * \ingroup Equations
     */
    [[nodiscard]] auto eliminate(const Equation & eq, const Symbol & symbol) -> Equation;

    /**
     * \brief Eliminate several symbols, one after another.
     *
     * \throw UnknownVariable if any symbol is not in scope by the time it is
     * reached, including if it appears twice.
     * \ingroup Equations
     */
    [[nodiscard]] auto eliminate(const Equation & eq, const std::vector<Symbol> & symbols) -> Equation;
}

#endif
