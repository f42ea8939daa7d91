#include <elective/exception.hh>
#include <elective/normalize.hh>
#include <elective/parser.hh>

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <vector>

#include <fmt/core.h>

using namespace elective;

using std::size_t;
using std::vector;

TEST_CASE("Normalise all xs are ys")
{
    auto eq = normalize(parse("x"), parse("xy"), VariableList{"xy"});
    CHECK(eq.to_string() == "x(1-y) = 0");
    CHECK(eq.number_of_assignments() == 4);
    CHECK(eq.number_forbidden() == 1);
    CHECK(eq.is_forbidden(Assignment{VariableList{"xy"}, vector<int>{1, 0}}));
    CHECK(! eq.is_forbidden(Assignment{VariableList{"xy"}, vector<int>{1, 1}}));
    CHECK(fmt::format("{}", eq) == "x(1-y) = 0");
}

TEST_CASE("Normalised tables are complete")
{
    for (auto vars : {VariableList{}, VariableList{"x"}, VariableList{"xy"}, VariableList{"xyz"}, VariableList{"xyzv"}}) {
        auto eq = normalize(parse("1"), parse("1"), vars);
        CHECK(eq.number_of_assignments() == (size_t{1} << vars.size()));
        CHECK(eq.is_vacuous());
        CHECK(eq.to_string() == "0 = 0");
    }
}

TEST_CASE("Normalise with unmentioned variables")
{
    auto eq = normalize(parse("yz"), parse("0"), VariableList{"xyz"});
    CHECK(eq.to_string() == "(1-x)yz + xyz = 0");

    auto reordered = normalize(parse("yz"), parse("0"), VariableList{"zyx"});
    CHECK(reordered.to_string() == "zy(1-x) + zyx = 0");
    CHECK(eq != reordered);
}

TEST_CASE("Normalise contradictions")
{
    CHECK(normalize(parse("1"), parse("0"), VariableList{"x"}).to_string() == "(1-x) + x = 0");
    CHECK(normalize(parse("1"), parse("0"), VariableList{}).to_string() == "1 = 0");
    CHECK(normalize(parse("x"), parse("(1-x)"), VariableList{"x"}).number_forbidden() == 2);
}

TEST_CASE("Normalise equations from text")
{
    CHECK(normalize(parse_equation("x = xy"), VariableList{"xy"}) == normalize(parse("x"), parse("xy"), VariableList{"xy"}));
    CHECK(normalize(parse_equation("x(1-y) = 0"), VariableList{"xy"}) == normalize(parse("x"), parse("xy"), VariableList{"xy"}));
}

TEST_CASE("Normalise needs every symbol in scope")
{
    CHECK_THROWS_AS(normalize(parse("x"), parse("xy"), VariableList{"x"}), UnboundSymbol);
    CHECK_THROWS_AS(normalize(parse("x"), parse("xz"), VariableList{"xy"}), UnboundSymbol);
}
