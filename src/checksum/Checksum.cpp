/**
 * @file Checksum.cpp
 * @brief Check digit validation: Luhn and plain modulus-10 sum.
 *
 * Both algorithms look at ASCII digit strings where the last digit is the
 * check digit. All arithmetic is done on small integers reduced mod 10, so
 * there is no overflow for any input length.
 */

#include "Checksum.hpp"

#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace Checksum {

static bool all_digits(std::string_view s) {
    for( char c : s ){
        if( !is_digit(c) ) return false;
    }
    return true;
}

// payload sum, without the check digit
static int mod10_sum(std::string_view payload) {
    int sum = 0;
    for( char c : payload ){
        sum = (sum + (c - '0')) % 10;
    }
    return sum;
}

// payload sum, without the check digit: the rightmost payload digit is
// doubled, then every second one moving left. doubled values > 9 get 9
// subtracted, which equals the sum of their two digits.
static int luhn_sum(std::string_view payload) {
    int sum = 0;
    bool dbl = true;
    for( auto it = payload.rbegin(); it != payload.rend(); ++it ){
        int d = *it - '0';
        if( dbl ){
            d *= 2;
            if( d > 9 ) d -= 9;
        }
        sum = (sum + d) % 10;
        dbl = !dbl;
    }
    return sum;
}

bool mod10_valid(std::string_view digits) {
    if( digits.empty() || !all_digits(digits) ){
        return false;
    }
    const int check = digits.back() - '0';
    return mod10_sum(digits.substr(0, digits.size() - 1)) == check;
}

bool luhn_valid(std::string_view digits) {
    if( digits.empty() || !all_digits(digits) ){
        return false;
    }
    const int check = digits.back() - '0';
    return (luhn_sum(digits.substr(0, digits.size() - 1)) + check) % 10 == 0;
}

bool is_valid(std::string_view digits, Algorithm algo) {
    switch( algo ){
        case Algorithm::Luhn:
            return luhn_valid(digits);
        case Algorithm::Mod10:
            return mod10_valid(digits);
    }
    throw std::logic_error(fmt::format("unknown checksum algorithm {}", static_cast<int>(algo)));
}

char check_digit(std::string_view payload, Algorithm algo) {
    if( !all_digits(payload) ){
        throw std::invalid_argument(fmt::format("not a digit string: \"{}\"", payload));
    }
    switch( algo ){
        case Algorithm::Luhn:
            return static_cast<char>('0' + (10 - luhn_sum(payload)) % 10);
        case Algorithm::Mod10:
            return static_cast<char>('0' + mod10_sum(payload));
    }
    throw std::logic_error(fmt::format("unknown checksum algorithm {}", static_cast<int>(algo)));
}

const char* algorithm_name(Algorithm algo) {
    switch( algo ){
        case Algorithm::Luhn:  return "luhn";
        case Algorithm::Mod10: return "mod10";
    }
    return "unknown";
}

Algorithm parse_algorithm(const std::string& name) {
    if( name == "luhn" ) return Algorithm::Luhn;
    if( name == "mod10" ) return Algorithm::Mod10;
    throw std::invalid_argument("unknown checksum algorithm: " + name);
}

} // namespace Checksum
