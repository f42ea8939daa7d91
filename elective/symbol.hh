#ifndef ELECTIVE_ALGEBRA_GUARD_ELECTIVE_SYMBOL_HH
#define ELECTIVE_ALGEBRA_GUARD_ELECTIVE_SYMBOL_HH

#include <elective/exception.hh>

#include <iosfwd>

#include <fmt/ostream.h>

namespace elective
{
    /**
     * \defgroup Core Core functionality
     */

    /**
     * \brief An elective symbol, denoting membership of some class.
     *
     * Symbols are single lowercase letters, and two symbols are the same if
     * and only if their letters are. Usually created by writing `'x'_sym`.
     *
     * \ingroup Core
     */
    struct Symbol final
    {
        char letter;

        constexpr explicit Symbol(char c) :
            letter(c)
        {
            if (c < 'a' || c > 'z')
                throw InvalidSymbol{c};
        }

        [[nodiscard]] constexpr auto operator<=>(const Symbol &) const = default;
    };

    /**
     * \brief Create a Symbol from a character literal, for example `'x'_sym`.
     *
     * \ingroup Core
     */
    [[nodiscard]] inline auto operator"" _sym(char c) -> Symbol
    {
        return Symbol{c};
    }

    /**
     * \brief A Symbol is written as its letter.
     *
     * \ingroup Core
     */
    auto operator<<(std::ostream &, const Symbol &) -> std::ostream &;
}

template <>
struct fmt::formatter<elective::Symbol> : ostream_formatter
{
};

#endif
