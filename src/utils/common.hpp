#pragma once
#include "io/Logger.hpp"

#include <string>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

#include <argparse/argparse.hpp>

#define APP_NAME "HexLines"

extern std::shared_ptr<Logger> logger;
void init_log(const std::string& log_fname);
void register_program_args(argparse::ArgumentParser &parser);
void register_common_args(argparse::ArgumentParser &parser);
