/**
 * @file FindCommand.cpp
 * @brief Implementation of the FindCommand, the default command.
 *
 * Scans a file or the standard input for runs of ASCII digits of a set length
 * whose last digit is a valid check digit (Luhn or plain modulus 10 sum), and
 * prints every hit as a table row: offset, line number, the number itself.
 */

#include "FindCommand.hpp"
#include "utils/common.hpp"
#include "utils/Progress.hpp"
#include "io/Reader.hpp"
#include "scanning/StreamScanner.hpp"

#include <memory>
#include <unistd.h>

REGISTER_COMMAND(FindCommand);

/**
 * @brief Constructs a FindCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
FindCommand::FindCommand(bool reg) : Command(reg, FIND_CMD_NAME, "find numbers with a valid check digit (default command)") {
    m_parser.add_epilog(
        "Search for sequences of a set number of ascii digits (controllable by -n) that\n"
        "either pass validation with the Luhn algorithm or have a final digit that is\n"
        "equal to the modulus 10 sum of the other digits (with --mod10). If no filename\n"
        "is given, the standard input is used. The offset in the file and line number\n"
        "where the number was found, as well as the number with its check digit are\n"
        "printed in a tabular format, separated by whitespace.\n"
        "\n"
        "The single-dash -mod10 spelling is not accepted, use -m or --mod10.");

    m_parser.add_argument("filename")
        .help("input file [default: stdin]")
        .nargs(argparse::nargs_pattern::any)
        .default_value(std::vector<std::string>{});
    m_parser.add_argument("-n", "--length")
        .help("length of number to find, including the check digit")
        .scan<'i', int>()
        .default_value(16);
    add_algorithm_args();
    m_parser.add_argument("-q", "--quiet")
        .help("be quiet; don't print the header")
        .default_value(false)
        .implicit_value(true);
    m_parser.add_argument("-P", "--progress")
        .help("show progress on stderr")
        .default_value(false)
        .implicit_value(true);
}

/**
 * @brief Reads the scan options from the parsed arguments.
 * @param[out] cfg Window length and algorithm.
 * @return EXIT_OK, or EXIT_USAGE on invalid option values.
 */
int FindCommand::get_config(ScanConfig& cfg) {
    const int length = m_parser.get<int>("--length");
    if( length < 1 || length > FIND_MAX_LENGTH ){
        logger->critical("invalid number length {}, must be between 1 and {}", length, FIND_MAX_LENGTH);
        return EXIT_USAGE;
    }
    cfg.length = static_cast<size_t>(length);

    try {
        cfg.algorithm = get_algorithm();
    } catch( const std::invalid_argument& e ){
        logger->critical("{}", e.what());
        return EXIT_USAGE;
    }
    return EXIT_OK;
}

/**
 * @brief Scans the input and prints every match.
 *
 * Argument errors are detected before anything is printed. A read error
 * aborts the scan, rows printed before it stay valid.
 *
 * @return EXIT_OK after a clean run to end of stream, one of ExitCode otherwise.
 */
int FindCommand::run() {
    const auto fnames = m_parser.get<std::vector<std::string>>("filename");
    if( fnames.size() > 1 ){
        logger->critical("Multiple input files are not supported.");
        return EXIT_MULTIPLE_FILES;
    }

    ScanConfig cfg;
    int rc = get_config(cfg);
    if( rc != EXIT_OK ){
        return rc;
    }

    const std::string fname = fnames.empty() ? "<stdin>" : fnames[0];
    std::unique_ptr<Reader> reader;
    try {
        if( fnames.empty() ){
            reader = std::make_unique<Reader>(STDIN_FILENO, fname);
        } else {
            reader = std::make_unique<Reader>(fname);
        }
    } catch( const std::runtime_error& e ){
        logger->critical("Unable to open {}: {}", fname, e.what());
        return EXIT_OPEN_FAILED;
    }

    return scan(*reader, cfg, reader->size());
}

int FindCommand::run(InputStream& in, uint64_t size) {
    ScanConfig cfg;
    int rc = get_config(cfg);
    if( rc != EXIT_OK ){
        return rc;
    }
    return scan(in, cfg, size);
}

/**
 * @brief Prints the header and one row per match, maps scan errors to exit codes.
 * @param size Input size for the progress line, 0 if unknown.
 */
int FindCommand::scan(InputStream& in, const ScanConfig& cfg, uint64_t size) {
    logger->info("searching {} for {}-digit numbers ({})", in.name(), cfg.length, Checksum::algorithm_name(cfg.algorithm));

    if( !m_parser.get<bool>("--quiet") ){
        fmt::print("{}\n", MATCH_HEADER);
    }

    StreamScanner scanner(in, cfg);
    std::unique_ptr<Progress> progress;
    if( m_parser.get<bool>("--progress") ){
        progress = std::make_unique<Progress>(size);
        scanner.set_progress(progress.get());
    }

    try {
        scanner.scan([](const MatchRecord& m){
            fmt::print("{}\n", m);
        });
    } catch( const Reader::ReadError& e ){
        fflush(stdout);
        logger->critical("Read error: {}", e.what());
        return EXIT_READ_ERROR;
    } catch( const StreamScanner::EmptyReadError& e ){
        fflush(stdout);
        logger->critical("Didn't read anything, but no error detected: {}", e.what());
        return EXIT_EMPTY_READ;
    } catch( const std::logic_error& e ){
        fflush(stdout);
        logger->critical("internal error: {}", e.what());
        return EXIT_UNREACHABLE;
    }

    fflush(stdout);
    logger->info("{}: {} bytes, {} lines, {} matches", in.name(), scanner.bytes_read(), scanner.lines_read(), scanner.matches());
    return EXIT_OK;
}
