#ifndef ELECTIVE_ALGEBRA_GUARD_ELECTIVE_NORMALIZE_HH
#define ELECTIVE_ALGEBRA_GUARD_ELECTIVE_NORMALIZE_HH

#include <elective/equation.hh>
#include <elective/expression.hh>
#include <elective/parser.hh>
#include <elective/variables.hh>

namespace elective
{
    /**
     * \brief Turn `lhs = rhs` into normal form over the given variables.
     *
     * Every assignment of the variables is visited in order, and is
     * forbidden exactly when lhs and rhs evaluate to different values under
     * it. The variables are never inferred from the expressions, and they
     * may include symbols that neither side mentions.
     *
     * \throw UnboundSymbol if either side mentions a symbol that is not one
     * of the variables.
     * \ingroup Equations
     */
    [[nodiscard]] auto normalize(const Expression & lhs, const Expression & rhs, const VariableList & variables) -> Equation;

    /**
     * \brief Normalise the result of parse_equation().
     *
     * \ingroup Equations
     */
    [[nodiscard]] auto normalize(const ParsedEquation & equation, const VariableList & variables) -> Equation;
}

#endif
