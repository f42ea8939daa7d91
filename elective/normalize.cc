#include <elective/assignment.hh>
#include <elective/normalize.hh>

#include <vector>

using namespace elective;

using std::size_t;
using std::vector;

auto elective::normalize(const Expression & lhs, const Expression & rhs, const VariableList & variables) -> Equation
{
    vector<bool> forbidden(variables.number_of_assignments(), false);
    for (size_t index = 0; index < forbidden.size(); ++index) {
        Assignment assignment{variables, index};
        forbidden[index] = (0 != evaluate(lhs, assignment) - evaluate(rhs, assignment));
    }

    return Equation{variables, std::move(forbidden)};
}

auto elective::normalize(const ParsedEquation & equation, const VariableList & variables) -> Equation
{
    return normalize(equation.lhs, equation.rhs, variables);
}
