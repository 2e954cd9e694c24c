/**
 * @file TestCommand.cpp
 * @brief Implementation of the TestCommand for validator self-testing.
 *
 * Runs the checksum validator over a set of known numbers. It is executed
 * silently before every other command and verbosely when called as "test".
 */

#include "TestCommand.hpp"
#include "utils/common.hpp"
#include "checksum/Checksum.hpp"

#include <array>

REGISTER_COMMAND(TestCommand);

namespace {

struct KnownAnswer {
    const char* digits;
    Checksum::Algorithm algo;
    bool valid;
};

const std::array<KnownAnswer, 10> KNOWN_ANSWERS = {{
    { "79927398713",      Checksum::Algorithm::Luhn,  true  },
    { "79927398710",      Checksum::Algorithm::Luhn,  false },
    { "4111111111111111", Checksum::Algorithm::Luhn,  true  },
    { "1234567812345670", Checksum::Algorithm::Luhn,  true  },
    { "1234567812345678", Checksum::Algorithm::Luhn,  false },
    { "0",                Checksum::Algorithm::Luhn,  true  },
    { "123456786",        Checksum::Algorithm::Mod10, true  },
    { "123456789",        Checksum::Algorithm::Mod10, false },
    { "99999999991",      Checksum::Algorithm::Mod10, false },
    { "99999999990",      Checksum::Algorithm::Mod10, true  },
}};

} // namespace

TestCommand::TestCommand(bool reg) : Command(reg, TEST_CMD_NAME, "self-test") {
}

/**
 * @brief Validates the known numbers and their check digits.
 *
 * Both directions are tested: is_valid() must give the expected answer, and
 * for valid numbers check_digit() of the payload must give back the last digit.
 *
 * @return EXIT_OK if all tests pass, EXIT_SELFTEST otherwise.
 */
int TestCommand::run() {
    for( const auto& ka : KNOWN_ANSWERS ){
        const std::string_view digits(ka.digits);
        const bool valid = Checksum::is_valid(digits, ka.algo);
        logger->trace("selftest: {:<6} {:<16} => {}", Checksum::algorithm_name(ka.algo), ka.digits, valid);

        if( valid != ka.valid ){
            logger->critical("selftest: {}({}) != {}", Checksum::algorithm_name(ka.algo), ka.digits, ka.valid);
            return EXIT_SELFTEST;
        }

        if( ka.valid ){
            const char cd = Checksum::check_digit(digits.substr(0, digits.size() - 1), ka.algo);
            if( cd != digits.back() ){
                logger->critical("selftest: {} check digit of {} is {}, expected {}", Checksum::algorithm_name(ka.algo), ka.digits, cd, digits.back());
                return EXIT_SELFTEST;
            }
        }
    }

    logger->trace("selftest: OK");
    return EXIT_OK;
}
