#include <elective/exception.hh>
#include <elective/expression.hh>

#include <algorithm>
#include <ostream>
#include <utility>
#include <variant>

using namespace elective;

using std::find;
using std::make_unique;
using std::ostream;
using std::string;
using std::to_string;
using std::visit;
using std::vector;

namespace
{
    template <class... Ts_>
    struct NodeVisitor : Ts_...
    {
        using Ts_::operator()...;
    };

    template <class... Ts_>
    NodeVisitor(Ts_...) -> NodeVisitor<Ts_...>;

    // Every case of the node must be handled, or this does not compile.
    template <typename... Fs_>
    auto visit_node(const Expression & e, Fs_ &&... fs) -> decltype(auto)
    {
        return visit(NodeVisitor{std::forward<Fs_>(fs)...}, e.node);
    }
}

Constant::Constant(long long v) :
    value(v)
{
    if (v != 0 && v != 1)
        throw InvalidConstant{v};
}

auto elective::symbol(const Symbol & s) -> Expression
{
    return Expression{SymbolRef{s}};
}

auto elective::constant(long long v) -> Expression
{
    return Expression{Constant{v}};
}

auto elective::negation(Expression body) -> Expression
{
    return Expression{Negation{make_unique<Expression>(std::move(body))}};
}

auto elective::product(Expression left, Expression right) -> Expression
{
    return Expression{Product{make_unique<Expression>(std::move(left)), make_unique<Expression>(std::move(right))}};
}

auto elective::operator*(Expression left, Expression right) -> Expression
{
    return product(std::move(left), std::move(right));
}

auto elective::clone(const Expression & e) -> Expression
{
    return visit_node(e,
        [&](const SymbolRef & s) -> Expression { return Expression{s}; },
        [&](const Constant & c) -> Expression { return Expression{c}; },
        [&](const Negation & n) -> Expression { return negation(clone(*n.body)); },
        [&](const Product & p) -> Expression { return product(clone(*p.left), clone(*p.right)); });
}

auto elective::evaluate(const Expression & e, const Assignment & assignment) -> long long
{
    return visit_node(e,
        [&](const SymbolRef & s) -> long long { return assignment.value_of(s.symbol); },
        [&](const Constant & c) -> long long { return c.value; },
        [&](const Negation & n) -> long long { return 1 - evaluate(*n.body, assignment); },
        [&](const Product & p) -> long long { return evaluate(*p.left, assignment) * evaluate(*p.right, assignment); });
}

auto elective::to_text(const Expression & e) -> string
{
    return visit_node(e,
        [&](const SymbolRef & s) -> string { return string(1, s.symbol.letter); },
        [&](const Constant & c) -> string { return to_string(c.value); },
        [&](const Negation & n) -> string { return "(1-" + to_text(*n.body) + ")"; },
        [&](const Product & p) -> string { return to_text(*p.left) + to_text(*p.right); });
}

namespace
{
    auto collect_symbols(const Expression & e, vector<Symbol> & into) -> void
    {
        visit_node(e,
            [&](const SymbolRef & s) {
                if (into.end() == find(into.begin(), into.end(), s.symbol))
                    into.push_back(s.symbol);
            },
            [&](const Constant &) {},
            [&](const Negation & n) { collect_symbols(*n.body, into); },
            [&](const Product & p) {
                collect_symbols(*p.left, into);
                collect_symbols(*p.right, into);
            });
    }
}

auto elective::symbols_of(const Expression & e) -> vector<Symbol>
{
    vector<Symbol> result;
    collect_symbols(e, result);
    return result;
}

auto elective::operator==(const Expression & a, const Expression & b) -> bool
{
    if (a.node.index() != b.node.index())
        return false;

    return visit_node(a,
        [&](const SymbolRef & s) -> bool { return s.symbol == std::get<SymbolRef>(b.node).symbol; },
        [&](const Constant & c) -> bool { return c.value == std::get<Constant>(b.node).value; },
        [&](const Negation & n) -> bool { return *n.body == *std::get<Negation>(b.node).body; },
        [&](const Product & p) -> bool {
            auto & q = std::get<Product>(b.node);
            return *p.left == *q.left && *p.right == *q.right;
        });
}

auto elective::operator<<(ostream & s, const Expression & e) -> ostream &
{
    return s << to_text(e);
}
