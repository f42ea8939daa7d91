#include <elective/symbol.hh>

#include <ostream>

using namespace elective;

using std::ostream;

auto elective::operator<<(ostream & s, const Symbol & sym) -> ostream &
{
    return s << sym.letter;
}
