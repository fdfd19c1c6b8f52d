/**
 * @file Logger.cpp
 * @brief Implementation of the Logger wrapper around spdlog.
 *
 * Console logging goes to stderr so it never interleaves with dump output on
 * stdout. An optional log file receives everything from DEBUG up.
 */

#include "Logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/fmt/ranges.h> // for fmt::join()
#include <fstream>

/**
 * @brief Sets the logging verbosity level.
 *
 * -4 or less: off, -3: critical, -2: error, -1: warn, 0: info, 1: debug, 2+: trace
 *
 * @param verbosity Integer verbosity level.
 */
void Logger::set_verbosity(int verbosity){
    if( verbosity <= -4 ){
        m_logger->set_level(spdlog::level::off);
        return;
    }
    switch( verbosity ){
        case -3:
            m_logger->set_level(spdlog::level::critical);
            break;
        case -2:
            m_logger->set_level(spdlog::level::err);
            break;
        case -1:
            m_logger->set_level(spdlog::level::warn);
            break;
        case 0: // default level
            m_logger->set_level(spdlog::level::info);
            break;
        case 1:
            m_logger->set_level(spdlog::level::debug);
            break;
        default:
            m_logger->set_level(spdlog::level::trace);
            break;
    }
}

/**
 * @brief Stores the command line for start().
 * @param argc Argument count.
 * @param argv Argument vector.
 */
void Logger::set_arguments(int argc, char* argv[]){
    m_arguments.assign(argv, argv + argc);
}

/**
 * @brief Stores the command line for start().
 * @param args Arguments, program name first.
 */
void Logger::set_arguments(const std::vector<std::string>& args){
    m_arguments = args;
}

// not a real shell escape, only enough to copy-paste the command line back
static std::string quote_if_needed(const std::string& arg) {
    if (arg.find(' ') != std::string::npos) {
        return "\"" + arg + "\"";
    }
    return arg;
}

/**
 * @brief Adds a file sink to the logger.
 *
 * The file is opened in append mode and gets DEBUG or higher, whatever the console
 * level is. Only one file can be added.
 *
 * @param fname Path to the log file.
 * @return True if the file sink was added, false if already logging to a file or on error.
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

    // DEBUG and TRACE are inherited by the file, anything quieter stays on the console only
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
 * @brief Logs session start information: banner, command line and log destination.
 */
void Logger::start(){
    if( !m_banner.empty() ){
        m_logger->debug("{}", m_banner);
    }

    std::vector<std::string> quoted;
    quoted.reserve(m_arguments.size());
    for( const auto& arg : m_arguments ){
        quoted.push_back(quote_if_needed(arg));
    }
    m_logger->debug("started as {}", fmt::join(quoted, " "));
    m_logger->debug("logging to {}", m_fname.empty() ? "console only" : m_fname.string());
}

/**
 * @brief Sets the level of the console sink only.
 * @param lvl New console level.
 */
void Logger::set_console_level(level lvl) {
    m_logger->sinks().front()->set_level(lvl); // XXX assuming that first sink is console
}

/**
 * @brief Returns the level of the console sink.
 */
Logger::level Logger::console_level() const {
    return m_logger->sinks().front()->level();
}

/**
 * @brief Raises the logger and all of its sinks to TRACE.
 *
 * set_verbosity() alone is not enough once a log file is added, because add_file()
 * pins the console sink to the previous level.
 */
void Logger::set_trace_all() {
    m_logger->set_level(spdlog::level::trace);
    for( auto& sink : m_logger->sinks() ){
        sink->set_level(spdlog::level::trace);
    }
}
