#include <elective/assignment.hh>
#include <elective/exception.hh>
#include <elective/expression.hh>

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <vector>

#include <fmt/core.h>

using namespace elective;

using std::size_t;
using std::vector;

TEST_CASE("Render expressions")
{
    CHECK(to_text(symbol('x'_sym)) == "x");
    CHECK(to_text(constant(0)) == "0");
    CHECK(to_text(constant(1)) == "1");
    CHECK(to_text(negation(symbol('y'_sym))) == "(1-y)");
    CHECK(to_text(symbol('x'_sym) * negation(symbol('y'_sym))) == "x(1-y)");
    CHECK(to_text(negation(symbol('x'_sym) * symbol('y'_sym)) * symbol('z'_sym)) == "(1-xy)z");
    CHECK(fmt::format("{}", negation(negation(constant(1)))) == "(1-(1-1))");
}

TEST_CASE("Bad constants")
{
    CHECK_THROWS_AS(constant(2), InvalidConstant);
    CHECK_THROWS_AS(constant(-1), InvalidConstant);
}

TEST_CASE("Evaluate expressions")
{
    VariableList vars{"xy"};
    auto e = symbol('x'_sym) * negation(symbol('y'_sym));

    CHECK(evaluate(e, Assignment{vars, vector<int>{0, 0}}) == 0);
    CHECK(evaluate(e, Assignment{vars, vector<int>{0, 1}}) == 0);
    CHECK(evaluate(e, Assignment{vars, vector<int>{1, 0}}) == 1);
    CHECK(evaluate(e, Assignment{vars, vector<int>{1, 1}}) == 0);

    CHECK(evaluate(constant(1), Assignment{VariableList{}, vector<int>{}}) == 1);
    CHECK(evaluate(negation(constant(0)), Assignment{VariableList{}, vector<int>{}}) == 1);
}

TEST_CASE("Evaluate with an unbound symbol")
{
    VariableList vars{"xy"};
    auto e = symbol('x'_sym) * symbol('z'_sym);
    CHECK_THROWS_AS(evaluate(e, Assignment{vars, vector<int>{1, 1}}), UnboundSymbol);
}

TEST_CASE("Clone and compare expressions")
{
    auto e = negation(symbol('x'_sym) * constant(1)) * symbol('y'_sym);
    auto f = clone(e);
    CHECK(e == f);
    CHECK(to_text(f) == to_text(e));
    CHECK(! (e == symbol('y'_sym)));
    CHECK(! (symbol('x'_sym) == symbol('y'_sym)));
    CHECK(! (constant(0) == constant(1)));
}

TEST_CASE("Symbols of an expression")
{
    auto e = symbol('y'_sym) * negation(symbol('x'_sym) * symbol('y'_sym)) * constant(0) * symbol('v'_sym);
    CHECK(symbols_of(e) == vector<Symbol>{'y'_sym, 'x'_sym, 'v'_sym});
    CHECK(symbols_of(constant(1)).empty());
}

TEST_CASE("Compare expressions of every kind against each other")
{
    vector<Expression> kinds;
    kinds.push_back(symbol('x'_sym));
    kinds.push_back(constant(1));
    kinds.push_back(negation(symbol('x'_sym)));
    kinds.push_back(symbol('x'_sym) * constant(1));

    for (size_t i = 0; i < kinds.size(); ++i)
        for (size_t j = 0; j < kinds.size(); ++j) {
            CHECK((kinds[i] == kinds[j]) == (i == j));
            CHECK((clone(kinds[i]) == kinds[j]) == (i == j));
        }

    CHECK(! (negation(symbol('x'_sym)) == negation(symbol('y'_sym))));
    CHECK(! (symbol('x'_sym) * constant(1) == symbol('x'_sym) * constant(0)));
    CHECK(! (symbol('x'_sym) * constant(1) == constant(1) * symbol('x'_sym)));
}
