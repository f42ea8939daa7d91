#include <elective/elective.hh>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

using namespace elective;

using std::cerr;
using std::cout;
using std::string;
using std::vector;

using fmt::print;
using fmt::println;

namespace po = boost::program_options;

namespace
{
    struct Mood
    {
        string name;
        string description;
        string variables;
        vector<string> premises;
        string middle_term;
    };

    auto moods() -> vector<Mood>
    {
        return {
            {"barbara", "All Ys are Xs, all Zs are Ys", "xyz", {"y = xy", "z = yz"}, "y"},
            {"celarent", "No Ys are Xs, all Zs are Ys", "xyz", {"xy = 0", "z = yz"}, "y"},
            {"illicit-major", "All Ys are Xs, no Zs are Ys", "xyz", {"y = xy", "yz = 0"}, "y"},
            // v is an indefinite class standing for "some": y = vx says that all Ys are
            // some of the Xs, and v(1-x) = 0 keeps v inside the Xs.
            {"ferio", "All Ys are some Xs, no Zs are Ys", "xyzv", {"y = vx", "yz = 0", "v(1-x) = 0"}, "y"}};
    }

    auto run_mood(const Mood & mood, bool show_working) -> void
    {
        VariableList vars{mood.variables};

        println(cout, "{}: {}", mood.name, mood.description);
        vector<Equation> premises;
        for (auto & p : mood.premises) {
            premises.push_back(normalize(parse_equation(p), vars));
            if (show_working)
                println(cout, "    premise {:<12} gives {}", p, premises.back());
        }

        auto combined = conjoin(premises);
        if (show_working)
            println(cout, "    together they give {}", combined);

        println(cout, "    eliminating {} leaves {}", mood.middle_term, eliminate(combined, Symbol{mood.middle_term.at(0)}));
    }
}

auto main(int argc, char * argv[]) -> int
{
    po::options_description display_options{"Program options"};
    display_options.add_options()                              //
        ("help", "Display help information")                   //
        ("mood", po::value<string>(), "Only show this mood")   //
        ("show-working", "Show premises and their conjunction");

    po::options_description all_options{"All options"};

    all_options.add(display_options);

    po::variables_map options_vars;

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all_options)
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
        println("Usage: {} [options]", argv[0]);
        println("");
        display_options.print(cout);
        print("Moods:");
        for (auto & m : moods())
            print(" {}", m.name);
        println("");
        return EXIT_SUCCESS;
    }

    bool found = false;
    for (auto & m : moods()) {
        if (options_vars.contains("mood") && options_vars["mood"].as<string>() != m.name)
            continue;
        found = true;
        run_mood(m, options_vars.contains("show-working"));
    }

    if (! found) {
        println(cerr, "Error: no mood named {}", options_vars["mood"].as<string>());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
