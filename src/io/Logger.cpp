/**
 * @file Logger.cpp
 * @brief Implementation of the Logger wrapper around spdlog.
 *
 * Console output goes through the sink the wrapped logger was created with,
 * an optional file sink can be added later. Verbosity is counted from the
 * command line (-v), warnings and errors are deduplicated.
 */

#include "Logger.hpp"
#include "utils/common.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/fmt/ranges.h> // for fmt::join()
#include <fstream>

/**
 * @brief Sets the logging verbosity level.
 *
 * Maps integer verbosity to spdlog levels:
 * 0: warn (default), 1: info, 2: debug, 3+: trace, negative: error only.
 *
 * @param verbosity Integer verbosity level.
 */
void Logger::set_verbosity(int verbosity){
    switch( verbosity ){
        case 0:
            m_logger->set_level(spdlog::level::warn);
            break;
        case 1:
            m_logger->set_level(spdlog::level::info);
            break;
        case 2:
            m_logger->set_level(spdlog::level::debug);
            break;
        default:
            m_logger->set_level(verbosity < 0 ? spdlog::level::err : spdlog::level::trace);
            break;
    }
}

void Logger::set_arguments(int argc, char* argv[]){
    m_arguments.clear();
    for( int i = 0; i < argc; ++i ){
        m_arguments.push_back(argv[i]);
    }
}

void Logger::set_arguments(const std::vector<std::string>& args){
    m_arguments = args;
}

/**
 * @brief Adds a file sink to the logger.
 *
 * The file is opened in append mode and receives DEBUG or higher, while the
 * console keeps the level chosen by verbosity. Only one file is supported.
 *
 * @param fname Path to the log file.
 * @return True if file sink was added, false if already logging to a file or on error.
 */
bool Logger::add_file(const std::filesystem::path& fname) {
    if( !m_fname.empty() ){
        return false;
    }

    std::ofstream file(fname, std::ios::app);
    if( !file.is_open() ){
        m_logger->error("Failed to open log file {}, no log will be saved!", fname);
        return false;
    }
    if( file.tellp() != 0 ){
        file.write("\n\n", 2); // visual sessions separator
    }
    file.close();

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fname.string());

    // file gets at least DEBUG, console keeps its own level
    if( m_logger->level() != spdlog::level::debug && m_logger->level() != spdlog::level::trace ){
        file_sink->set_level(spdlog::level::debug);
        set_console_level(m_logger->level());
        m_logger->set_level(spdlog::level::debug);
    }

    m_logger->sinks().push_back(file_sink);
    m_fname = fname;
    return true;
}

/**
 * @brief Logs session start information including banner and arguments.
 */
void Logger::start(){
    if( !m_banner.empty() ){
        m_logger->info("==============================================================");
        m_logger->info("{}", m_banner);
        m_logger->info("==============================================================");
    }

    std::vector<std::string> quoted;
    quoted.reserve(m_arguments.size());
    for( const auto& arg : m_arguments ){
        quoted.push_back(quote_if_needed(arg));
    }
    m_logger->info("started as {}", fmt::join(quoted, " "));
    m_logger->info("logging to {}", m_fname.empty() ? "console only" : m_fname.string());
}

void Logger::set_console_level(spdlog::level::level_enum level) {
    m_logger->sinks().front()->set_level(level); // XXX assuming that first sink is console
}

spdlog::level::level_enum Logger::console_level() const {
    return m_logger->sinks().front()->level();
}
