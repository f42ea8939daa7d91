#include <elective/conjunction.hh>
#include <elective/exception.hh>

#include <iterator>

#include <fmt/core.h>

using namespace elective;

using std::size_t;
using std::vector;

auto elective::conjoin(const Equation & a, const Equation & b) -> Equation
{
    if (a.variables() != b.variables())
        throw VariableMismatch{fmt::format("cannot conjoin an equation over {} with one over {}", a.variables(), b.variables())};

    vector<bool> forbidden(a.number_of_assignments(), false);
    for (size_t index = 0; index < forbidden.size(); ++index)
        forbidden[index] = a.is_forbidden(index) || b.is_forbidden(index);

    return Equation{a.variables(), std::move(forbidden)};
}

auto elective::conjoin(const vector<Equation> & premises) -> Equation
{
    if (premises.empty())
        throw VariableMismatch{"cannot conjoin an empty list of premises"};

    auto result = premises.front();
    for (auto p = std::next(premises.begin()); p != premises.end(); ++p)
        result = conjoin(result, *p);
    return result;
}
