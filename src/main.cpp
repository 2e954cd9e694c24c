/**
 * @file main.cpp
 * @brief Main entry point for ccfinder.
 *
 * Handles command-line parsing, command registration, logging initialization
 * and command execution. "find" is the implicit command: when no command name
 * is given, all arguments go to it, so "ccfinder -q -n 9 file.txt" and
 * "ccfinder < file.txt" work as expected. A silent self-test runs before any
 * other command.
 */

#include <algorithm>
#include <iostream>

#include <argparse/argparse.hpp>

#include "utils/common.hpp"
#include "dist/version.h"

#include "commands/FindCommand.hpp"
#include "commands/TestCommand.hpp"

extern argparse::ArgumentParser program;

/**
 * @brief Main entry point for ccfinder.
 *
 * @param argc Argument count.
 * @param argv Argument vector.
 * @return Exit code of the executed command, EXIT_USAGE on argument errors.
 */
int main(int argc, char*argv[]) {
    signal(SIGSEGV, signal_handler);
    signal(SIGABRT, signal_handler);

    register_program_args(program);

    for (const auto& [name, cmd] : Command::registry()) {
        program.add_subparser(cmd->parser());
    }

    try {
        std::vector<std::string> unknown_args = program.parse_known_args(argc, argv); // doesnt raise error on unknown args
        const bool no_subcommand_used = std::all_of(Command::registry().begin(), Command::registry().end(), [&](const auto& cmd) { return !program.is_subcommand_used(cmd.first); } );
        if( no_subcommand_used ){
            // no subcommand used => implicit "find" command, reading stdin if there are no args at all
            unknown_args.insert(unknown_args.begin(), FIND_CMD_NAME);
            unknown_args.insert(unknown_args.begin(), argv[0]);
            program.parse_args(unknown_args); // raises error on unknown args
        } else if( unknown_args.size() > 0 ){
            std::cerr << "[?] Unknown arguments: ";
            for (const auto& arg : unknown_args) {
                std::cerr << "\"" << arg << "\" ";
            }
            std::cerr << std::endl;
            return EXIT_USAGE;
        }
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return EXIT_USAGE;
    }

    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    logger->set_verbosity(verbosity); // should be before init_log() call
    logger->set_dedup_limit(program.get<int>("--log-dedup-limit"));

    auto& selfTestCmd = Command::registry()[TEST_CMD_NAME];
    for (const auto& [name, cmd] : Command::registry()) {
        if (program.is_subcommand_used(name)) {
            std::string log_fname;
            if( cmd->parser().is_used("--log") ){
                log_fname = cmd->parser().get<std::string>("--log");
            } else if( program.is_used("--log") ){
                log_fname = program.get<std::string>("--log");
            }
            if( !init_log(log_fname) ){
                return EXIT_USAGE;
            }

            if( name == TEST_CMD_NAME ){
                // explicit self-test, make it visible
                logger->set_verbosity(9);
            } else {
                // implicit self-test, silent unless it fails
                int rc = selfTestCmd->run();
                if( rc != EXIT_OK ){
                    logger->critical("self-test failed, exiting");
                    return rc;
                }
            }

            // warning: only use if all your loggers are thread-safe ("_mt" loggers)
            spdlog::flush_every(std::chrono::seconds(5));

            return cmd->run();
        }
    }

    std::cout << program;
    return EXIT_USAGE;
}
