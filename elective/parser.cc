#include <elective/exception.hh>
#include <elective/parser.hh>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

using namespace elective;

using std::count;
using std::nullopt;
using std::optional;
using std::size_t;
using std::string;
using std::string_view;
using std::vector;

namespace
{
    auto fragment(string_view text, size_t from, size_t to) -> string
    {
        return string{text.substr(from, to - from)};
    }

    auto check_length(string_view text) -> void
    {
        if (text.size() > max_expression_length)
            throw ParseError{fmt::format("text is {} characters long, but at most {} are supported", text.size(), max_expression_length),
                max_expression_length, fragment(text, max_expression_length, std::min(text.size(), max_expression_length + 10))};
    }

    // For every '(' in the text, where its ')' is, if it has one. Built in a
    // single pass so that nesting does not mean rescanning.
    auto match_parentheses(string_view text) -> vector<optional<size_t>>
    {
        vector<optional<size_t>> result(text.size(), nullopt);
        vector<size_t> open;
        for (size_t pos = 0; pos < text.size(); ++pos) {
            if (text[pos] == '(')
                open.push_back(pos);
            else if (text[pos] == ')' && ! open.empty()) {
                result[open.back()] = pos;
                open.pop_back();
            }
        }
        return result;
    }

    struct Parser
    {
        string_view text;
        vector<optional<size_t>> closes;

        // Parses text[begin, end), which must be one complete expr.
        auto parse_range(size_t begin, size_t end) const -> Expression
        {
            if (begin == end)
                throw ParseError{"expected an expression", begin, fragment(text, begin, end)};

            optional<Expression> first;
            size_t after_first;

            if (text[begin] == '(') {
                if (end - begin < 3 || text.substr(begin, 3) != "(1-")
                    throw ParseError{"expected '(1-'", begin, fragment(text, begin, std::min(begin + 3, end))};

                auto close = closes[begin];
                if (! close || *close >= end)
                    throw ParseError{"unbalanced parentheses", begin, fragment(text, begin, end)};

                first = negation(parse_range(begin + 3, *close));
                after_first = *close + 1;
            }
            else {
                auto c = text[begin];
                if (c >= 'a' && c <= 'z')
                    first = symbol(Symbol{c});
                else if (c == '0' || c == '1')
                    first = constant(c - '0');
                else if (c == ')')
                    throw ParseError{"unbalanced parentheses", begin, fragment(text, begin, end)};
                else
                    throw ParseError{"unrecognised character", begin, fragment(text, begin, begin + 1)};
                after_first = begin + 1;
            }

            if (after_first == end)
                return std::move(*first);

            return product(std::move(*first), parse_range(after_first, end));
        }

        auto parse_trimmed(size_t begin, size_t end) const -> Expression
        {
            while (begin < end && is_blank(text[begin]))
                ++begin;
            while (end > begin && is_blank(text[end - 1]))
                --end;
            return parse_range(begin, end);
        }

        static auto is_blank(char c) -> bool
        {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n';
        }
    };
}

auto elective::parse(string_view text) -> Expression
{
    check_length(text);
    Parser parser{text, match_parentheses(text)};
    return parser.parse_range(0, text.size());
}

auto elective::parse_equation(string_view text) -> ParsedEquation
{
    check_length(text);

    auto equals = text.find('=');
    if (equals == string_view::npos)
        throw ParseError{"expected 'lhs = rhs'", 0, string{text}};
    if (1 != count(text.begin(), text.end(), '='))
        throw ParseError{"more than one '='", text.find('=', equals + 1), string{text}};

    Parser parser{text, match_parentheses(text)};
    auto lhs = parser.parse_trimmed(0, equals);
    auto rhs = parser.parse_trimmed(equals + 1, text.size());
    return ParsedEquation{std::move(lhs), std::move(rhs)};
}
