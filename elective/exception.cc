#include <elective/exception.hh>
#include <elective/variables.hh>

using namespace elective;

using std::size_t;
using std::string;
using std::to_string;

UnexpectedException::UnexpectedException(const string & w) :
    _wat("unexpected problem: " + w)
{
}

auto UnexpectedException::what() const noexcept -> const char *
{
    return _wat.c_str();
}

ElectiveError::ElectiveError(const string & w) :
    _wat(w)
{
}

auto ElectiveError::what() const noexcept -> const char *
{
    return _wat.c_str();
}

ParseError::ParseError(const string & message, size_t position, const string & fragment) :
    ElectiveError("parse error at position " + to_string(position) + ": " + message + " in '" + fragment + "'"),
    _position(position),
    _fragment(fragment)
{
}

auto ParseError::position() const noexcept -> size_t
{
    return _position;
}

auto ParseError::fragment() const -> const string &
{
    return _fragment;
}

UnboundSymbol::UnboundSymbol(char letter) :
    ElectiveError(string{"symbol '"} + letter + "' has no value in this assignment")
{
}

VariableMismatch::VariableMismatch(const string & w) :
    ElectiveError("variable mismatch: " + w)
{
}

UnknownVariable::UnknownVariable(char letter) :
    ElectiveError(string{"symbol '"} + letter + "' is not one of the variables in scope")
{
}

InvalidSymbol::InvalidSymbol(char letter) :
    ElectiveError("'" + string(1, letter) + "' is not a lowercase letter, so cannot be a symbol")
{
}

InvalidConstant::InvalidConstant(long long value) :
    ElectiveError("constant " + to_string(value) + " is neither 0 nor 1")
{
}

InvalidAssignment::InvalidAssignment(const string & w) :
    ElectiveError("invalid assignment: " + w)
{
}

InvalidVariableList::InvalidVariableList(const string & w) :
    ElectiveError("invalid variable list: " + w)
{
}

TooManyVariables::TooManyVariables(size_t how_many) :
    ElectiveError("cannot enumerate " + to_string(how_many) + " variables, at most " + to_string(max_variables) + " are supported")
{
}
