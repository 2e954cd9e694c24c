#pragma once
#include "io/Logger.hpp"
#include "core/exit_codes.hpp"

#include <string>
#include <filesystem>
#include <vector>
#include <signal.h>

namespace fs = std::filesystem;

#include <argparse/argparse.hpp>

#define APP_NAME "ccfinder"

#define ANSI_COLOR_GREEN   "\x1b[32m"
#define ANSI_COLOR_RED     "\x1b[31m"
#define ANSI_COLOR_RESET   "\x1b[0m"

#define ANSI_CLEAR_EOL     "\x1b[0K"

extern std::shared_ptr<Logger> logger;
extern int verbosity;

bool init_log(const fs::path& log_fname);
void register_program_args(argparse::ArgumentParser &parser);
void register_common_args(argparse::ArgumentParser &parser);
void signal_handler(int sig);

std::string filter_unprintable(const std::string& str);
std::string quote_if_needed(const std::string& arg);
