/**
 * @file main.cpp
 * @brief Main entry point for HexLines application.
 *
 * Parses the command line, selects the sub-command (an existing file as the first
 * argument implies "dump"), sets up logging and runs the silent self-test before
 * the command itself.
 */

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <argparse/argparse.hpp>

#include "utils/common.hpp"
#include "../dist/version.h"

#include "commands/DumpCommand.hpp"
#include "commands/TestCommand.hpp"

extern argparse::ArgumentParser program;
extern int verbosity;

/**
 * @brief Main entry point for HexLines application.
 *
 * @param argc Argument count.
 * @param argv Argument vector.
 * @return EXIT_SUCCESS (0) on success, EXIT_FAILURE (1) on error.
 */
int main(int argc, char*argv[]) {
    register_program_args(program);

    for (const auto& [name, cmd] : Command::registry()) {
        program.add_subparser(cmd->parser());
    }

    try {
        std::vector<std::string> unknown_args = program.parse_known_args(argc, argv); // doesnt raise error on unknown args
        const bool no_subcommand_used = std::all_of(Command::registry().begin(), Command::registry().end(), [&](const auto& cmd) { return !program.is_subcommand_used(cmd.first); } );
        if( unknown_args.size() > 0 ){
            if( no_subcommand_used && (unknown_args[0] == "-" || std::filesystem::exists(unknown_args[0])) ){
                // no subcommand used => implicit "dump" command
                unknown_args.insert(unknown_args.begin(), DUMP_CMD_NAME);
                unknown_args.insert(unknown_args.begin(), argv[0]);
                program.parse_args(unknown_args); // raises error on unknown args
            } else {
                std::cerr << "[?] Unknown arguments: ";
                for (const auto& arg : unknown_args) {
                    std::cerr << "\"" << arg << "\" ";
                }
                std::cerr << std::endl;
                std::exit(1);
            }
        }
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        std::exit(1);
    }

    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    logger->set_verbosity(verbosity); // should be before logger->add_file() call

    auto& selfTestCmd = Command::registry()[TEST_CMD_NAME];
    for (const auto& [name, cmd] : Command::registry()) {
        if (program.is_subcommand_used(name)) {
            std::string log_fname;
            if( cmd->parser().is_used("--log") ){
                log_fname = cmd->parser().get<std::string>("--log");
            } else if( program.is_used("--log") ){
                log_fname = program.get<std::string>("--log");
            }
            init_log(log_fname);

            if( name == TEST_CMD_NAME ){
                // explicit self-test, make it visible
                logger->set_trace_all();
            } else {
                // implicit self-test, make it silent
                if( selfTestCmd->run() != 0 ){
                    logger->critical("self-test failed, exiting");
                    return 1;
                }
            }

            int rc = cmd->run();
            spdlog::default_logger()->flush();
            return rc;
        }
    }

    std::cout << program;
    return 0;
}
