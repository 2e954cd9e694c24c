/**
 * @file common.cpp
 * @brief Global state and helpers shared by all commands.
 *
 * Defines the global logger and top-level argument parser, the common
 * command-line arguments every command accepts, log file initialization and
 * the crash handler that prints a stack trace on fatal signals.
 */

#include "common.hpp"
#include "dist/version.h"

#include <spdlog/sinks/stdout_color_sinks.h>

int verbosity = 0;

// console goes to stderr, stdout is reserved for results
std::shared_ptr<Logger> logger = std::make_shared<Logger>(spdlog::stderr_color_mt(APP_NAME));
argparse::ArgumentParser program(APP_NAME, APP_VERSION, argparse::default_arguments::help);

// begin stack trace generation on error
#include <backtrace.h>

/**
 * @brief Backtrace error callback for logging libbacktrace errors.
 * @param msg Error message.
 * @param errnum Error number.
 */
void backtrace_error_cb(void *, const char *msg, int errnum) {
    logger->critical("Error: {} (Error number: {})", msg, errnum);
}

int backtrace_full_cb(void *, uintptr_t pc, const char *filename, int lineno, const char *function) {
    logger->critical("     {} {}:{} ({})", (void *)pc, filename ? filename : "??", lineno, function ? function : "??");
    return 0;
}

void signal_handler(int sig) {
    logger->critical("Signal {} received, printing backtrace...", sig);

    backtrace_state *state = backtrace_create_state(NULL, 0, backtrace_error_cb, NULL);
    backtrace_full(state, 0, backtrace_full_cb, backtrace_error_cb, NULL);

    exit(EXIT_USAGE);
}
// end stack trace generation on error

std::string filter_unprintable(const std::string& str){
    std::string result;
    result.reserve(str.size());
    for( char c : str ){
        if( c >= 0x20 && c <= 0x7e ){
            result += c;
        } else {
            result += '.';
        }
    }
    return result;
}

// not a comprehensive shell-escape function
std::string quote_if_needed(const std::string& arg) {
    if (arg.find(' ') != std::string::npos) {
        return "\"" + arg + "\"";
    }
    return arg;
}

/**
 * @brief Attaches the optional log file and prints the session banner.
 *
 * Runs once per process, later calls are no-ops. An explicitly requested log
 * file that can't be opened is fatal for the caller.
 *
 * @param log_fname Log pathname, empty for console-only logging.
 * @return False if the log file was requested but couldn't be opened.
 */
bool init_log(const fs::path& log_fname){
    static bool inited = false;
    if( inited ){
        return true;
    }

    inited = true;
    if( !log_fname.empty() && !logger->add_file(log_fname) ){
        logger->critical("explicit log pathname is set, refusing to continue without log");
        return false;
    }
    logger->start();
    return true;
}

void register_common_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-v", "--verbose")
        .help("increase verbosity")
        .action([&](const auto &) { ++verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-L", "--log")
        .help("also write a debug log to this file");
    parser.add_argument("--log-dedup-limit")
        .default_value(100)
        .scan<'i', int>()
        .help("limit duplicate log messages, 0 = no limit");
}

void register_program_args(argparse::ArgumentParser &parser) {
    register_common_args(parser);

    parser.add_argument("--version")
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", APP_VERSION);
            exit(EXIT_OK);
        })
        .default_value(false)
        .help("print version information and exit")
        .implicit_value(true)
        .nargs(0);
}
