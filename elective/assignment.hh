#ifndef ELECTIVE_ALGEBRA_GUARD_ELECTIVE_ASSIGNMENT_HH
#define ELECTIVE_ALGEBRA_GUARD_ELECTIVE_ASSIGNMENT_HH

#include <elective/symbol.hh>
#include <elective/variables.hh>

#include <cstddef>
#include <vector>

namespace elective
{
    /**
     * \brief A value of 0 or 1 for every symbol in a VariableList.
     *
     * Assignments over a list of n variables are numbered from 0 to 2^n - 1,
     * reading the values as a binary number with the first variable as the
     * most significant bit. Normalisation, rendering and elimination all
     * visit assignments in that order.
     *
     * \ingroup Core
     */
    class Assignment
    {
    private:
        VariableList _variables;
        std::vector<int> _values;

    public:
        /**
         * \brief The assignment with the given number.
         *
         * \throw InvalidAssignment if index is not less than
         * variables.number_of_assignments().
         */
        Assignment(const VariableList & variables, std::size_t index);

        /**
         * \brief An assignment with these values, one per variable, in order.
         *
         * \throw InvalidAssignment if the lengths differ or a value is not 0 or 1.
         */
        Assignment(const VariableList & variables, std::vector<int> values);

        [[nodiscard]] auto variables() const noexcept -> const VariableList &;

        [[nodiscard]] auto values() const noexcept -> const std::vector<int> &;

        /**
         * \brief This assignment's position in the enumeration order.
         */
        [[nodiscard]] auto index() const noexcept -> std::size_t;

        /**
         * \brief The value given to this symbol.
         *
         * \throw UnboundSymbol if the symbol is not one of our variables.
         */
        [[nodiscard]] auto value_of(const Symbol &) const -> int;

        [[nodiscard]] auto value_at(std::size_t pos) const -> int;
    };
}

#endif
