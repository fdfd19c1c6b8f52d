#pragma once
#include "Command.hpp"

#include <cstdint>
#include <vector>

#define DUMP_CMD_NAME "dump"

class DumpCommand : public Command {
public:
    int run() override;

private:
    friend class CmdTestBase<DumpCommand>;

    std::vector<uint8_t> load_input();
    void print_reversed(const std::vector<uint8_t>& data) const;

    static DumpCommand instance; // Static instance to trigger registration
    DumpCommand(bool reg=false);
};
