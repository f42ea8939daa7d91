#include <elective/elective.hh>

#include <catch2/catch_test_macros.hpp>

#include <vector>

#include <fmt/core.h>

using namespace elective;

using std::vector;

TEST_CASE("Barbara")
{
    // All Ys are Xs, all Zs are Ys, therefore all Zs are Xs.
    VariableList vars{"xyz"};
    auto p1 = normalize(parse("y"), parse("xy"), vars);
    auto p2 = normalize(parse("z"), parse("yz"), vars);
    auto conclusion = eliminate(conjoin(p1, p2), 'y'_sym);
    CHECK(conclusion.to_string() == "(1-x)z = 0");
    CHECK(conclusion.variables() == VariableList{"xz"});
}

TEST_CASE("No valid inference")
{
    // All Ys are Xs, no Zs are Ys: nothing follows about Xs and Zs.
    VariableList vars{"xyz"};
    auto p1 = normalize(parse("y"), parse("xy"), vars);
    auto p2 = normalize(parse("yz"), parse("0"), vars);
    auto conclusion = eliminate(conjoin(p1, p2), 'y'_sym);
    CHECK(conclusion.to_string() == "0 = 0");
    CHECK(conclusion.is_vacuous());
}

TEST_CASE("Some Xs are not Zs")
{
    // All Ys are Xs, written y = vx with v some class that is itself all Xs,
    // and no Zs are Ys.
    VariableList vars{"xyzv"};
    auto p1 = normalize(parse("y"), parse("vx"), vars);
    auto p2 = normalize(parse("yz"), parse("0"), vars);
    auto p3 = normalize(parse("v(1-x)"), parse("0"), vars);
    auto conclusion = eliminate(conjoin(conjoin(p1, p2), p3), 'y'_sym);
    CHECK(conclusion.to_string() == "(1-x)(1-z)v + (1-x)zv + xzv = 0");
}

TEST_CASE("Syllogisms from equation text")
{
    VariableList vars{"xyz"};
    auto conclusion = eliminate(
        conjoin(vector<Equation>{normalize(parse_equation("y = xy"), vars), normalize(parse_equation("z = yz"), vars)}),
        vector<Symbol>{'y'_sym});
    CHECK(fmt::format("{}", conclusion) == "(1-x)z = 0");
}
