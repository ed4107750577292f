// cli.cpp : Lecture de la ligne de commande avec cxxopts

#include "cli/cli.hpp"

#include <cxxopts.hpp>
#include <exception>
#include <string>

namespace mat_shuffle::cli {

Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text) {
    Options opt;
    want_help = false;

    std::uint32_t seed = 0;

    cxxopts::Options desc("mat_shuffle_cli", "Deal-into-piles instructions for a verifiable manual shuffle");
    desc.add_options()
        ("h,help", "Show this help")
        ("n,cards", "Number of cards to randomise", cxxopts::value<int>(opt.config.num_cards)->default_value("52"))
        ("r,rows", "Mat height (rows A, B, ...)", cxxopts::value<int>(opt.config.rows)->default_value("2"))
        ("c,columns", "Mat width (columns 1, 2, ...)", cxxopts::value<int>(opt.config.columns)->default_value("5"))
        ("i,instruction-rows", "Rows of 5 instructions per page", cxxopts::value<int>(opt.config.instruction_rows)->default_value("2"))
        ("max-passes", "Maximum number of dealing passes", cxxopts::value<int>(opt.config.max_passes)->default_value("10"))
        ("check", "Only print the configuration report", cxxopts::value<bool>(opt.check_only))
        ("insecure-seed", "Use the NON-secure seeded generator (testing only)", cxxopts::value<std::uint32_t>(seed))
        ("v,verbose", "Debug logging", cxxopts::value<bool>(opt.verbose))
    ;
    help_text = desc.help();

    try {
        auto result = desc.parse(argc, argv);
        if (result.count("help")) { want_help = true; return opt; }
        if (result.count("insecure-seed")) {
            opt.insecure_seed = seed;
            opt.config.allow_insecure_entropy = true;
        }
    } catch (const std::exception& e) {
        help_text = std::string("Invalid command line: ") + e.what() + "\n\n" + help_text;
        want_help = true;
        opt.parse_error = true;
    }
    return opt;
}

} // namespace mat_shuffle::cli
