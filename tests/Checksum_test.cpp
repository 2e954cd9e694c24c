#include <gtest/gtest.h>
#include "checksum/Checksum.hpp"

using Checksum::Algorithm;

TEST(Checksum, luhn_known_numbers) {
    EXPECT_TRUE(Checksum::luhn_valid("79927398713"));
    EXPECT_TRUE(Checksum::luhn_valid("4111111111111111"));
    EXPECT_TRUE(Checksum::luhn_valid("1234567812345670"));
    EXPECT_FALSE(Checksum::luhn_valid("79927398710"));
    EXPECT_FALSE(Checksum::luhn_valid("1234567812345678"));
}

TEST(Checksum, luhn_single_digit) {
    // empty payload sums to 0
    EXPECT_TRUE(Checksum::luhn_valid("0"));
    for (char c = '1'; c <= '9'; c++) {
        EXPECT_FALSE(Checksum::luhn_valid(std::string(1, c))) << c;
    }
}

TEST(Checksum, luhn_doubles_rightmost_payload_digit) {
    // payload "5": doubled to 10 -> 1, check digit 9
    EXPECT_TRUE(Checksum::luhn_valid("59"));
    // payload "05": 5 doubled -> 1, 0 as is
    EXPECT_TRUE(Checksum::luhn_valid("059"));
    // mod10 would take 5
    EXPECT_FALSE(Checksum::luhn_valid("55"));
}

TEST(Checksum, mod10_known_numbers) {
    EXPECT_TRUE(Checksum::mod10_valid("123456786"));
    EXPECT_TRUE(Checksum::mod10_valid("99999999990"));
    EXPECT_TRUE(Checksum::mod10_valid("00"));
    EXPECT_TRUE(Checksum::mod10_valid("55"));
    EXPECT_FALSE(Checksum::mod10_valid("123456789"));
    EXPECT_FALSE(Checksum::mod10_valid("99999999991"));
}

TEST(Checksum, rejects_empty_and_non_digits) {
    for (auto algo : { Algorithm::Luhn, Algorithm::Mod10 }) {
        EXPECT_FALSE(Checksum::is_valid("", algo));
        EXPECT_FALSE(Checksum::is_valid("12a4", algo));
        EXPECT_FALSE(Checksum::is_valid("1234 ", algo));
        EXPECT_FALSE(Checksum::is_valid(std::string_view("00\0" "0", 4), algo));
    }
}

TEST(Checksum, is_valid_dispatches) {
    EXPECT_TRUE(Checksum::is_valid("79927398713", Algorithm::Luhn));
    EXPECT_FALSE(Checksum::is_valid("79927398713", Algorithm::Mod10));
    EXPECT_TRUE(Checksum::is_valid("123456786", Algorithm::Mod10));
    EXPECT_FALSE(Checksum::is_valid("123456786", Algorithm::Luhn));
}

TEST(Checksum, unknown_algorithm_is_logic_error) {
    EXPECT_THROW(Checksum::is_valid("00", static_cast<Algorithm>(42)), std::logic_error);
    EXPECT_THROW(Checksum::check_digit("0", static_cast<Algorithm>(42)), std::logic_error);
}

TEST(Checksum, check_digit) {
    EXPECT_EQ('3', Checksum::check_digit("7992739871", Algorithm::Luhn));
    EXPECT_EQ('0', Checksum::check_digit("123456781234567", Algorithm::Luhn));
    EXPECT_EQ('0', Checksum::check_digit("", Algorithm::Luhn));
    EXPECT_EQ('6', Checksum::check_digit("12345678", Algorithm::Mod10));
    EXPECT_EQ('0', Checksum::check_digit("", Algorithm::Mod10));
    EXPECT_THROW(Checksum::check_digit("12x", Algorithm::Luhn), std::invalid_argument);
}

TEST(Checksum, check_digit_makes_payload_valid) {
    const std::string payloads[] = { "", "1", "42", "7992739871", "000000000000000", "987654321098765432" };
    for (auto algo : { Algorithm::Luhn, Algorithm::Mod10 }) {
        for (const auto& payload : payloads) {
            const std::string number = payload + Checksum::check_digit(payload, algo);
            EXPECT_TRUE(Checksum::is_valid(number, algo)) << Checksum::algorithm_name(algo) << " " << number;

            // any other check digit fails
            for (char c = '0'; c <= '9'; c++) {
                if (c != number.back()) {
                    EXPECT_FALSE(Checksum::is_valid(payload + c, algo)) << Checksum::algorithm_name(algo) << " " << payload << c;
                }
            }
        }
    }
}

TEST(Checksum, long_input) {
    // no overflow on inputs way longer than any card number
    const std::string payload(100000, '9');
    const char cd = Checksum::check_digit(payload, Algorithm::Luhn);
    EXPECT_TRUE(Checksum::luhn_valid(payload + cd));
}

TEST(Checksum, algorithm_names) {
    EXPECT_STREQ("luhn", Checksum::algorithm_name(Algorithm::Luhn));
    EXPECT_STREQ("mod10", Checksum::algorithm_name(Algorithm::Mod10));
    EXPECT_EQ(Algorithm::Luhn, Checksum::parse_algorithm("luhn"));
    EXPECT_EQ(Algorithm::Mod10, Checksum::parse_algorithm("mod10"));
    EXPECT_THROW(Checksum::parse_algorithm("crc32"), std::invalid_argument);
    EXPECT_THROW(Checksum::parse_algorithm(""), std::invalid_argument);
}
