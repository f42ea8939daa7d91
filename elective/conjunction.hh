#ifndef ELECTIVE_ALGEBRA_GUARD_ELECTIVE_CONJUNCTION_HH
#define ELECTIVE_ALGEBRA_GUARD_ELECTIVE_CONJUNCTION_HH

#include <elective/equation.hh>

#include <vector>

namespace elective
{
    /**
     * \brief The equation saying that both a and b hold, which forbids
     * everything that either of them forbids.
     *
     * \throw VariableMismatch unless both are over the same variables, in
     * the same order.
     * \ingroup Equations
     */
    [[nodiscard]] auto conjoin(const Equation & a, const Equation & b) -> Equation;

    /**
     * \brief Conjoin a whole list of premises, left to right.
     *
     * \throw VariableMismatch if the list is empty, or if the premises are
     * not all over the same variables.
     * \ingroup Equations
     */
    [[nodiscard]] auto conjoin(const std::vector<Equation> & premises) -> Equation;
}

#endif
