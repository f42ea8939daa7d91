#include <elective/conjunction.hh>
#include <elective/elimination.hh>
#include <elective/exception.hh>
#include <elective/normalize.hh>
#include <elective/parser.hh>

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <vector>

using namespace elective;

using std::size_t;
using std::vector;

TEST_CASE("Eliminate keeps only what is forbidden either way")
{
    VariableList vars{"xy"};

    // x(1-y) = 0: only x = 1, y = 0 is forbidden, so y = 1 rescues x = 1.
    auto eq = normalize(parse("x"), parse("xy"), vars);
    CHECK(eliminate(eq, 'y'_sym).to_string() == "0 = 0");
    CHECK(eliminate(eq, 'y'_sym).variables() == VariableList{"x"});

    // x = 0 does not depend upon y at all.
    auto no_x = normalize(parse("x"), parse("0"), vars);
    CHECK(eliminate(no_x, 'y'_sym).to_string() == "x = 0");
    CHECK(eliminate(no_x, 'x'_sym).to_string() == "0 = 0");
}

TEST_CASE("Eliminate a symbol that makes no difference")
{
    VariableList vars{"xyz"};
    for (auto text : {"xz", "(1-x)", "x(1-z)", "1", "0"}) {
        auto eq = normalize(parse(text), parse("0"), vars);
        auto eliminated = eliminate(eq, 'y'_sym);
        CHECK(eliminated == normalize(parse(text), parse("0"), VariableList{"xz"}));
        CHECK(eliminated.number_forbidden() * 2 == eq.number_forbidden());
    }
}

TEST_CASE("Eliminate keeps the remaining order")
{
    auto eq = normalize(parse("zx"), parse("0"), VariableList{"zyx"});
    auto eliminated = eliminate(eq, 'y'_sym);
    CHECK(eliminated.variables() == VariableList{"zx"});
    CHECK(eliminated.to_string() == "zx = 0");
}

TEST_CASE("Eliminate from the first and last positions")
{
    VariableList vars{"xyz"};
    auto eq = conjoin(normalize(parse("xy"), parse("0"), vars), normalize(parse("(1-x)y"), parse("0"), vars));
    CHECK(eliminate(eq, 'x'_sym).to_string() == "y(1-z) + yz = 0");
    CHECK(eliminate(eq, 'z'_sym).to_string() == "(1-x)y + xy = 0");
    CHECK(eliminate(eq, 'y'_sym).to_string() == "0 = 0");
}

TEST_CASE("Eliminate several symbols")
{
    VariableList vars{"xyz"};
    auto eq = normalize(parse("1"), parse("0"), vars);
    CHECK(eliminate(eq, vector<Symbol>{'x'_sym, 'z'_sym}).to_string() == "(1-y) + y = 0");
    CHECK(eliminate(eq, vector<Symbol>{'x'_sym, 'y'_sym, 'z'_sym}).to_string() == "1 = 0");
    CHECK(eliminate(eq, vector<Symbol>{}) == eq);
    CHECK_THROWS_AS(eliminate(eq, vector<Symbol>{'x'_sym, 'x'_sym}), UnknownVariable);
}

TEST_CASE("Eliminate an unknown symbol")
{
    auto eq = normalize(parse("x"), parse("xy"), VariableList{"xy"});
    CHECK_THROWS_AS(eliminate(eq, 'z'_sym), UnknownVariable);
}
