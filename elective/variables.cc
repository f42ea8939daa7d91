#include <elective/exception.hh>
#include <elective/variables.hh>

#include <algorithm>
#include <ostream>

#include <fmt/core.h>

using namespace elective;

using std::find;
using std::nullopt;
using std::optional;
using std::ostream;
using std::size_t;
using std::string_view;
using std::vector;

VariableList::VariableList(vector<Symbol> symbols) :
    _symbols(std::move(symbols))
{
    if (_symbols.size() > max_variables)
        throw TooManyVariables{_symbols.size()};

    for (auto s = _symbols.begin(), s_end = _symbols.end(); s != s_end; ++s)
        if (s_end != find(std::next(s), s_end, *s))
            throw InvalidVariableList{fmt::format("symbol '{}' appears more than once", *s)};
}

namespace
{
    auto symbols_from_letters(string_view letters) -> vector<Symbol>
    {
        vector<Symbol> result;
        for (auto c : letters)
            result.emplace_back(c);
        return result;
    }
}

VariableList::VariableList(string_view letters) :
    VariableList(symbols_from_letters(letters))
{
}

auto VariableList::size() const noexcept -> size_t
{
    return _symbols.size();
}

auto VariableList::empty() const noexcept -> bool
{
    return _symbols.empty();
}

auto VariableList::symbols() const noexcept -> const vector<Symbol> &
{
    return _symbols;
}

auto VariableList::operator[](size_t pos) const -> const Symbol &
{
    return _symbols.at(pos);
}

auto VariableList::position_of(const Symbol & s) const -> optional<size_t>
{
    auto where = find(_symbols.begin(), _symbols.end(), s);
    if (where == _symbols.end())
        return nullopt;
    return static_cast<size_t>(where - _symbols.begin());
}

auto VariableList::contains(const Symbol & s) const -> bool
{
    return position_of(s).has_value();
}

auto VariableList::without(const Symbol & s) const -> VariableList
{
    auto pos = position_of(s);
    if (! pos)
        throw UnknownVariable{s.letter};

    VariableList result;
    result._symbols = _symbols;
    result._symbols.erase(result._symbols.begin() + *pos);
    return result;
}

auto VariableList::number_of_assignments() const noexcept -> size_t
{
    return size_t{1} << _symbols.size();
}

auto VariableList::begin() const noexcept -> vector<Symbol>::const_iterator
{
    return _symbols.begin();
}

auto VariableList::end() const noexcept -> vector<Symbol>::const_iterator
{
    return _symbols.end();
}

auto elective::operator<<(ostream & s, const VariableList & vars) -> ostream &
{
    for (auto & v : vars)
        s << v;
    return s;
}
