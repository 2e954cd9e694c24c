#pragma once
#include <string>
#include <string_view>

namespace Checksum {

    // closed set, dispatched with a switch in is_valid()
    enum class Algorithm {
        Luhn,
        Mod10, // last digit == sum of the others mod 10
    };

    inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

    // the last character is the check digit, the preceding ones are the payload.
    // empty input or any non-digit => false
    bool is_valid(std::string_view digits, Algorithm algo);

    bool mod10_valid(std::string_view digits);
    bool luhn_valid(std::string_view digits);

    // digit that makes payload + digit valid
    // throws std::invalid_argument if payload has non-digits
    char check_digit(std::string_view payload, Algorithm algo);

    const char* algorithm_name(Algorithm algo);

    // "luhn" or "mod10", throws std::invalid_argument otherwise
    Algorithm parse_algorithm(const std::string& name);

} // namespace Checksum
