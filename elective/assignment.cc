#include <elective/assignment.hh>
#include <elective/exception.hh>

#include <fmt/core.h>

using namespace elective;

using std::size_t;
using std::vector;

Assignment::Assignment(const VariableList & variables, size_t index) :
    _variables(variables),
    _values(variables.size(), 0)
{
    if (index >= variables.number_of_assignments())
        throw InvalidAssignment{fmt::format("there is no assignment number {} over {} variables", index, variables.size())};

    auto n = _values.size();
    for (size_t pos = 0; pos < n; ++pos)
        _values[pos] = static_cast<int>((index >> (n - 1 - pos)) & 1);
}

Assignment::Assignment(const VariableList & variables, vector<int> values) :
    _variables(variables),
    _values(std::move(values))
{
    if (_values.size() != _variables.size())
        throw InvalidAssignment{fmt::format("got {} values for {} variables", _values.size(), _variables.size())};

    for (auto & v : _values)
        if (v != 0 && v != 1)
            throw InvalidAssignment{fmt::format("value {} is neither 0 nor 1", v)};
}

auto Assignment::variables() const noexcept -> const VariableList &
{
    return _variables;
}

auto Assignment::values() const noexcept -> const vector<int> &
{
    return _values;
}

auto Assignment::index() const noexcept -> size_t
{
    size_t result = 0;
    for (auto & v : _values)
        result = (result << 1) | static_cast<size_t>(v);
    return result;
}

auto Assignment::value_of(const Symbol & s) const -> int
{
    auto pos = _variables.position_of(s);
    if (! pos)
        throw UnboundSymbol{s.letter};
    return _values[*pos];
}

auto Assignment::value_at(size_t pos) const -> int
{
    return _values.at(pos);
}
