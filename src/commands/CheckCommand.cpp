/**
 * @file CheckCommand.cpp
 * @brief Implementation of the CheckCommand for validating single numbers.
 *
 * Each number given on the command line is validated with the selected
 * algorithm. Invalid ones are reported together with the check digit their
 * payload would need.
 */

#include "CheckCommand.hpp"
#include "utils/common.hpp"
#include "checksum/Checksum.hpp"

#include <algorithm>

REGISTER_COMMAND(CheckCommand);

CheckCommand::CheckCommand(bool reg) : Command(reg, "check", "validate the check digit of numbers") {
    m_parser.add_argument("numbers")
        .help("digit strings, check digit last")
        .nargs(argparse::nargs_pattern::at_least_one);
    add_algorithm_args();
}

/**
 * @brief Prints "<number>  valid" or "<number>  invalid (...)" per number.
 * @return EXIT_OK if all numbers are valid, EXIT_CHECK_FAILED otherwise.
 */
int CheckCommand::run() {
    Checksum::Algorithm algo;
    try {
        algo = get_algorithm();
    } catch( const std::invalid_argument& e ){
        logger->critical("{}", e.what());
        return EXIT_USAGE;
    }

    int result = EXIT_OK;
    for( const auto& number : m_parser.get<std::vector<std::string>>("numbers") ){
        if( Checksum::is_valid(number, algo) ){
            fmt::print("{}  valid\n", number);
            continue;
        }

        result = EXIT_CHECK_FAILED;
        if( number.empty() || !std::all_of(number.begin(), number.end(), Checksum::is_digit) ){
            fmt::print("{}  invalid (not a digit string)\n", filter_unprintable(number));
            continue;
        }
        const std::string_view payload = std::string_view(number).substr(0, number.size() - 1);
        fmt::print("{}  invalid (check digit should be {})\n", number, Checksum::check_digit(payload, algo));
    }
    return result;
}
