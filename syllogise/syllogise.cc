#include <elective/elective.hh>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

using namespace elective;

using std::cerr;
using std::cout;
using std::endl;
using std::find;
using std::string;
using std::vector;

using fmt::println;

namespace po = boost::program_options;

auto main(int argc, char * argv[]) -> int
{
    po::options_description display_options{"Program options"};
    display_options.add_options()                                                                 //
        ("help", "Display help information")                                                      //
        ("variables", po::value<string>(), "Ordered variable letters, for example xyz (required)") //
        ("eliminate", po::value<string>()->default_value(""), "Letters to eliminate, in order")   //
        ("show-premises", "Also print each premise in normal form")                               //
        ("verbose", "Describe each step on standard error");

    po::options_description all_options{"All options"};
    all_options.add_options() //
        ("premise", po::value<vector<string>>()->composing(), "A premise, written lhs = rhs");

    po::positional_options_description positional_options;
    positional_options
        .add("premise", -1);

    all_options.add(display_options);

    po::variables_map options_vars;

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all_options)
                      .positional(positional_options)
                      .run(),
            options_vars);
        po::notify(options_vars);
    }
    catch (const po::error & e) {
        println(cerr, "Error: {}", e.what());
        println(cerr, "Try {} --help", argv[0]);
        return EXIT_FAILURE;
    }

    if (options_vars.contains("help")) {
        cout << "Usage: " << argv[0] << " [options] --variables xyz premise..." << endl;
        cout << endl;
        cout << display_options << endl;
        cout << "Example: " << argv[0] << " --variables xyz --eliminate y 'y = xy' 'z = yz'" << endl;
        return EXIT_SUCCESS;
    }

    if (! options_vars.contains("variables") || ! options_vars.contains("premise")) {
        println(cerr, "Error: need --variables and at least one premise");
        println(cerr, "Try {} --help", argv[0]);
        return EXIT_FAILURE;
    }

    bool verbose = options_vars.contains("verbose");

    try {
        VariableList vars{options_vars["variables"].as<string>()};

        vector<Symbol> to_eliminate;
        for (auto c : options_vars["eliminate"].as<string>())
            to_eliminate.emplace_back(c);

        vector<Symbol> mentioned;
        vector<Equation> premises;
        for (auto & text : options_vars["premise"].as<vector<string>>()) {
            auto parsed = parse_equation(text);
            for (auto & s : symbols_of(parsed.lhs))
                if (mentioned.end() == find(mentioned.begin(), mentioned.end(), s))
                    mentioned.push_back(s);
            for (auto & s : symbols_of(parsed.rhs))
                if (mentioned.end() == find(mentioned.begin(), mentioned.end(), s))
                    mentioned.push_back(s);

            premises.push_back(normalize(parsed, vars));
            if (verbose)
                println(cerr, "premise {} = {} over {} forbids {} of {} cases", parsed.lhs, parsed.rhs, vars,
                    premises.back().number_forbidden(), premises.back().number_of_assignments());
            if (options_vars.contains("show-premises"))
                println(cout, "{}", premises.back());
        }

        if (verbose)
            for (auto & v : vars)
                if (mentioned.end() == find(mentioned.begin(), mentioned.end(), v))
                    println(cerr, "variable {} is not mentioned by any premise", v);

        auto combined = conjoin(premises);
        if (verbose)
            println(cerr, "conjunction is {}", combined);

        auto conclusion = combined;
        for (auto & s : to_eliminate) {
            conclusion = eliminate(conclusion, s);
            if (verbose)
                println(cerr, "after eliminating {}: {}", s, conclusion);
        }

        println(cout, "{}", conclusion);
        if (verbose && conclusion.is_vacuous())
            println(cerr, "no conclusion follows over {}", conclusion.variables());
    }
    catch (const ElectiveError & e) {
        println(cerr, "Error: {}", e.what());
        return EXIT_FAILURE;
    }
    catch (const std::exception & e) {
        println(cerr, "Error: unexpected exception: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
