/**
 * @file common.cpp
 * @brief Global logger, argument parser and shared command line options.
 */

#include "common.hpp"
#include "../../dist/version.h"
#include <spdlog/sinks/stdout_color_sinks.h>

int verbosity = 0;

// console log goes to stderr, stdout is reserved for the dump itself
static std::shared_ptr<spdlog::logger> make_console_logger(){
    auto console = spdlog::stderr_color_mt(APP_NAME);
    spdlog::set_default_logger(console);
    return console;
}

std::shared_ptr<Logger> logger = std::make_shared<Logger>(make_console_logger());
argparse::ArgumentParser program(APP_NAME, APP_VERSION, argparse::default_arguments::help);

/**
 * @brief Adds a log file sink and logs the session header.
 *
 * Runs only once per process. An explicitly requested log that can't be opened
 * is fatal.
 *
 * @param log_fname Log pathname, empty for console only.
 */
void init_log(const std::string& log_fname){
    static bool inited = false;
    if( inited ){
        return;
    }
    inited = true;

    if( !log_fname.empty() && !logger->add_file(log_fname) ){
        logger->critical("explicit log pathname is set, refusing to continue without log");
        exit(1);
    }
    logger->start();
}

/**
 * @brief Adds the options shared by the program and every sub-command: -v, -q, -L.
 * @param parser Parser to extend.
 */
void register_common_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-v", "--verbose")
        .help("increase verbosity")
        .action([&](const auto &) { ++verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-q", "--quiet")
        .help("decrease verbosity")
        .action([&](const auto &) { --verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-L", "--log")
        .help("log pathname [default: no log file]");
}

/**
 * @brief Adds the top-level options: the shared ones plus --version.
 * @param parser Program parser.
 */
void register_program_args(argparse::ArgumentParser &parser) {
    register_common_args(parser);

    parser.add_argument("--version")
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", APP_VERSION);
            exit(0);
        })
        .default_value(false)
        .help("print version information and exit")
        .implicit_value(true)
        .nargs(0);
}
