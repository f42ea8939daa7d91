#include <elective/elimination.hh>
#include <elective/exception.hh>

using namespace elective;

using std::size_t;
using std::vector;

namespace
{
    // Widen an assignment number over the remaining variables into one over
    // all of them, by putting the given bit in at the eliminated position.
    auto insert_bit(size_t index, size_t shift, bool bit) -> size_t
    {
        auto high = (index >> shift) << (shift + 1);
        auto low = index & ((size_t{1} << shift) - 1);
        return high | (static_cast<size_t>(bit) << shift) | low;
    }
}

auto elective::eliminate(const Equation & eq, const Symbol & s) -> Equation
{
    auto pos = eq.variables().position_of(s);
    if (! pos)
        throw UnknownVariable{s.letter};

    auto remaining = eq.variables().without(s);
    auto shift = eq.variables().size() - 1 - *pos;

    vector<bool> forbidden(remaining.number_of_assignments(), false);
    for (size_t index = 0; index < forbidden.size(); ++index)
        forbidden[index] = eq.is_forbidden(insert_bit(index, shift, false)) && eq.is_forbidden(insert_bit(index, shift, true));

    return Equation{std::move(remaining), std::move(forbidden)};
}

auto elective::eliminate(const Equation & eq, const vector<Symbol> & symbols) -> Equation
{
    auto result = eq;
    for (auto & s : symbols)
        result = eliminate(result, s);
    return result;
}
