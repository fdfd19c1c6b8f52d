#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "utils/common.hpp"

using testing::HasSubstr;

std::string capture_stdout(const std::function<void()>& func);
std::vector<std::string> split(const std::string& str, const char delimiter);
std::string trim(const std::string& str);
std::vector<Line> collect(Hexdump hd);
std::filesystem::path write_temp_file(const std::string& name, const std::string& data);

// runs func with stdin replaced by a pipe holding data, data must fit into the pipe buffer
void with_stdin_pipe(const std::string& data, const std::function<void()>& func);

template <typename TCmd>
class CmdTestBase : public ::testing::Test {
    protected:

    // args[0] is the program name, as in argv
    int run_cmd(const std::vector<std::string>& args) {
        TCmd cmd;
        logger->set_arguments(args);
        cmd.parser().parse_args(args);
        return cmd.run();
    }

    std::string run_cmd_output(const std::vector<std::string>& args, int expected_code = 0) {
        int rc = -1;
        std::string output = capture_stdout([&](){
            rc = run_cmd(args);
        });
        EXPECT_EQ(expected_code, rc);
        return output;
    }
};
