/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef ELECTIVE_ALGEBRA_GUARD_ELECTIVE_EXCEPTION_HH
#define ELECTIVE_ALGEBRA_GUARD_ELECTIVE_EXCEPTION_HH

#include <cstddef>
#include <exception>
#include <string>

namespace elective
{
    /**
     * \brief Thrown if something has gone wrong inside the engine. This
     * indicates a bug, not bad input.
     *
     * \ingroup Core
     */
    class UnexpectedException : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit UnexpectedException(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };

    /**
     * \brief Base class for everything the engine throws because of a bad
     * request from the caller. Each of these is terminal for the call that
     * threw it: nothing is partially built and nothing is retried.
     *
     * \ingroup Core
     */
    class ElectiveError : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit ElectiveError(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };

    /**
     * \brief Thrown by the parser for empty, unbalanced or otherwise
     * malformed expression text.
     *
     * \ingroup Parser
     */
    class ParseError : public ElectiveError
    {
    private:
        std::size_t _position;
        std::string _fragment;

    public:
        /**
         * \param position Offset into the original text where things went wrong.
         * \param fragment The offending piece of text.
         */
        ParseError(const std::string & message, std::size_t position, const std::string & fragment);

        [[nodiscard]] auto position() const noexcept -> std::size_t;

        [[nodiscard]] auto fragment() const -> const std::string &;
    };

    /**
     * \brief Thrown if an expression refers to a symbol that has no value in
     * the assignment it is being evaluated under.
     *
     * \ingroup Core
     */
    class UnboundSymbol : public ElectiveError
    {
    public:
        explicit UnboundSymbol(char letter);
    };

    /**
     * \brief Thrown if two equations over different variable lists are
     * conjoined.
     *
     * \ingroup Equations
     */
    class VariableMismatch : public ElectiveError
    {
    public:
        explicit VariableMismatch(const std::string &);
    };

    /**
     * \brief Thrown if a symbol that is not in scope is eliminated or removed.
     *
     * \ingroup Equations
     */
    class UnknownVariable : public ElectiveError
    {
    public:
        explicit UnknownVariable(char letter);
    };

    /**
     * \brief Thrown when creating a Symbol from something that is not a
     * lowercase letter.
     *
     * \ingroup Core
     */
    class InvalidSymbol : public ElectiveError
    {
    public:
        explicit InvalidSymbol(char letter);
    };

    /**
     * \brief Thrown when creating a Constant that is neither 0 nor 1.
     *
     * \ingroup Core
     */
    class InvalidConstant : public ElectiveError
    {
    public:
        explicit InvalidConstant(long long value);
    };

    /**
     * \brief Thrown when an Assignment would have the wrong length, or a value
     * other than 0 or 1.
     *
     * \ingroup Core
     */
    class InvalidAssignment : public ElectiveError
    {
    public:
        explicit InvalidAssignment(const std::string &);
    };

    /**
     * \brief Thrown when a VariableList would contain the same symbol twice.
     *
     * \ingroup Core
     */
    class InvalidVariableList : public ElectiveError
    {
    public:
        explicit InvalidVariableList(const std::string &);
    };

    /**
     * \brief Thrown when a VariableList would be too long to enumerate.
     *
     * \sa max_variables
     * \ingroup Core
     */
    class TooManyVariables : public ElectiveError
    {
    public:
        explicit TooManyVariables(std::size_t how_many);
    };
}

#endif
