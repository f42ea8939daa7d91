/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef ELECTIVE_ALGEBRA_GUARD_ELECTIVE_VARIABLES_HH
#define ELECTIVE_ALGEBRA_GUARD_ELECTIVE_VARIABLES_HH

#include <elective/symbol.hh>

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <vector>

#include <fmt/ostream.h>

namespace elective
{
    /**
     * \brief The longest VariableList we are prepared to enumerate. Every
     * Equation holds one entry per assignment, so this caps tables at 2^20
     * entries.
     *
     * \ingroup Core
     */
    inline constexpr std::size_t max_variables = 20;

    /**
     * \brief An ordered list of distinct symbols, giving the scope of an
     * Equation.
     *
     * Position matters: the first symbol is the most significant bit when
     * assignments are numbered.
     *
     * \ingroup Core
     */
    class VariableList
    {
    private:
        std::vector<Symbol> _symbols;

    public:
        /**
         * \brief An empty scope, with exactly one (empty) assignment.
         */
        VariableList() = default;

        /**
         * \throw InvalidVariableList if a symbol appears twice.
         * \throw TooManyVariables if there are more than max_variables symbols.
         */
        explicit VariableList(std::vector<Symbol> symbols);

        /**
         * \brief Convenience constructor, `VariableList{"xyz"}`.
         *
         * \throw InvalidSymbol if a character is not a lowercase letter.
         */
        explicit VariableList(std::string_view letters);

        [[nodiscard]] auto size() const noexcept -> std::size_t;

        [[nodiscard]] auto empty() const noexcept -> bool;

        [[nodiscard]] auto symbols() const noexcept -> const std::vector<Symbol> &;

        [[nodiscard]] auto operator[](std::size_t pos) const -> const Symbol &;

        /**
         * \brief Where is this symbol, if it is here at all?
         */
        [[nodiscard]] auto position_of(const Symbol &) const -> std::optional<std::size_t>;

        [[nodiscard]] auto contains(const Symbol &) const -> bool;

        /**
         * \brief A copy of this list, with the given symbol removed and
         * everything else kept in order.
         *
         * \throw UnknownVariable if the symbol is not present.
         */
        [[nodiscard]] auto without(const Symbol &) const -> VariableList;

        /**
         * \brief How many assignments there are, that is, 2^size().
         */
        [[nodiscard]] auto number_of_assignments() const noexcept -> std::size_t;

        [[nodiscard]] auto begin() const noexcept -> std::vector<Symbol>::const_iterator;

        [[nodiscard]] auto end() const noexcept -> std::vector<Symbol>::const_iterator;

        [[nodiscard]] auto operator==(const VariableList &) const -> bool = default;
    };

    /**
     * \brief A VariableList is written as its letters, in order.
     *
     * \ingroup Core
     */
    auto operator<<(std::ostream &, const VariableList &) -> std::ostream &;
}

template <>
struct fmt::formatter<elective::VariableList> : ostream_formatter
{
};

#endif
