#include <elective/equation.hh>
#include <elective/exception.hh>

#include <algorithm>
#include <ostream>

#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace elective;

using std::count;
using std::none_of;
using std::ostream;
using std::size_t;
using std::string;
using std::vector;

Equation::Equation(VariableList variables, vector<bool> forbidden) :
    _variables(std::move(variables)),
    _forbidden(std::move(forbidden))
{
    if (_forbidden.size() != _variables.number_of_assignments())
        throw UnexpectedException{fmt::format("equation over {} has {} table entries rather than {}",
            _variables, _forbidden.size(), _variables.number_of_assignments())};
}

auto Equation::variables() const noexcept -> const VariableList &
{
    return _variables;
}

auto Equation::number_of_assignments() const noexcept -> size_t
{
    return _forbidden.size();
}

auto Equation::is_forbidden(size_t index) const -> bool
{
    return _forbidden.at(index);
}

auto Equation::is_forbidden(const Assignment & a) const -> bool
{
    if (a.variables() != _variables)
        throw VariableMismatch{fmt::format("assignment is over {} but equation is over {}", a.variables(), _variables)};
    return _forbidden[a.index()];
}

auto Equation::number_forbidden() const -> size_t
{
    return static_cast<size_t>(count(_forbidden.begin(), _forbidden.end(), true));
}

auto Equation::is_vacuous() const -> bool
{
    return none_of(_forbidden.begin(), _forbidden.end(), [](bool f) { return f; });
}

auto Equation::to_string() const -> string
{
    vector<string> terms;
    for (size_t index = 0; index < _forbidden.size(); ++index) {
        if (! _forbidden[index])
            continue;

        Assignment assignment{_variables, index};
        string term;
        for (size_t pos = 0; pos < _variables.size(); ++pos) {
            if (1 == assignment.value_at(pos))
                term += _variables[pos].letter;
            else
                term += fmt::format("(1-{})", _variables[pos]);
        }

        terms.push_back(term.empty() ? "1" : term);
    }

    if (terms.empty())
        return "0 = 0";

    return fmt::format("{} = 0", fmt::join(terms, " + "));
}

auto elective::operator<<(ostream & s, const Equation & eq) -> ostream &
{
    return s << eq.to_string();
}
