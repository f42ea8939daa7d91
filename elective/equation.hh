/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef ELECTIVE_ALGEBRA_GUARD_ELECTIVE_EQUATION_HH
#define ELECTIVE_ALGEBRA_GUARD_ELECTIVE_EQUATION_HH

#include <elective/assignment.hh>
#include <elective/variables.hh>

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include <fmt/ostream.h>

namespace elective
{
    /**
     * \defgroup Equations Normalised elective equations
     */

    struct Expression;
    class Equation;

    [[nodiscard]] auto normalize(const Expression & lhs, const Expression & rhs, const VariableList & variables) -> Equation;
    [[nodiscard]] auto conjoin(const Equation & a, const Equation & b) -> Equation;
    [[nodiscard]] auto eliminate(const Equation & eq, const Symbol & symbol) -> Equation;

    /**
     * \brief An elective equation in normal form: for every assignment of
     * its variables, whether or not the equation rules that assignment out.
     *
     * The table is complete, with exactly one entry for each of the
     * 2^n assignments, which is what makes the form canonical. Equations are
     * only created by normalize(), and then only transformed into new
     * equations by conjoin() and eliminate().
     *
     * \ingroup Equations
     */
    class Equation
    {
    private:
        VariableList _variables;
        std::vector<bool> _forbidden;

        Equation(VariableList variables, std::vector<bool> forbidden);

        friend auto normalize(const Expression &, const Expression &, const VariableList &) -> Equation;
        friend auto conjoin(const Equation &, const Equation &) -> Equation;
        friend auto eliminate(const Equation &, const Symbol &) -> Equation;

    public:
        [[nodiscard]] auto variables() const noexcept -> const VariableList &;

        [[nodiscard]] auto number_of_assignments() const noexcept -> std::size_t;

        /**
         * \brief Is the assignment with this number ruled out?
         *
         * \sa Assignment for how assignments are numbered.
         */
        [[nodiscard]] auto is_forbidden(std::size_t index) const -> bool;

        /**
         * \throw VariableMismatch if the assignment is over a different list
         * of variables.
         */
        [[nodiscard]] auto is_forbidden(const Assignment &) const -> bool;

        [[nodiscard]] auto number_forbidden() const -> std::size_t;

        /**
         * \brief True if nothing is ruled out, which renders as `0 = 0`.
         */
        [[nodiscard]] auto is_vacuous() const -> bool;

        /**
         * \brief Render as a sum of forbidden constituents equated to zero,
         * for example `(1-x)z = 0`.
         *
         * Each forbidden assignment contributes one term, in assignment
         * order, built from the letter of each variable that is 1 and
         * `(1-letter)` for each variable that is 0. Terms are joined with
         * `" + "`. An equation forbidding nothing is `0 = 0`, and one over no
         * variables that forbids its only assignment is `1 = 0`.
         */
        [[nodiscard]] auto to_string() const -> std::string;

        [[nodiscard]] auto operator==(const Equation &) const -> bool = default;
    };

    auto operator<<(std::ostream &, const Equation &) -> std::ostream &;
}

template <>
struct fmt::formatter<elective::Equation> : ostream_formatter
{
};

#endif
