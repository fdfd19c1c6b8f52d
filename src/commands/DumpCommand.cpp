/**
 * @file DumpCommand.cpp
 * @brief Implementation of the DumpCommand for printing a hexdump of a file, stdin or a string.
 *
 * The input is read into memory first, then printed line by line: one line per
 * 16 bytes and a trailing line with the total length. Optionally only a window
 * of the input is dumped, or the lines are printed in reverse order.
 */

#include "DumpCommand.hpp"
#include "io/Reader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <system_error>

REGISTER_COMMAND(DumpCommand);

/**
 * @brief Constructs a DumpCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
DumpCommand::DumpCommand(bool reg) : Command(reg, DUMP_CMD_NAME, "print hexdump of a file") {
    m_parser.add_argument("input").help("file to dump, \"-\" for stdin");
    m_parser.add_argument("--offset").default_value((uint64_t)0ULL).scan<'x', uint64_t>().help("start offset (hex)");
    m_parser.add_argument("--size").default_value((uint64_t)0ULL).scan<'x', uint64_t>().help("size (hex), 0 = up to the end");
    m_parser.add_argument("-s", "--string").default_value(false).implicit_value(true).help("treat input as the data itself, not a filename");
    m_parser.add_argument("-r", "--reverse").default_value(false).implicit_value(true).help("print lines in reverse order, summary first");
}

/**
 * @brief Loads the selected window of the input into memory.
 * @return Bytes to dump.
 * @throws Reader::ReadError if the input file can't be read.
 */
std::vector<uint8_t> DumpCommand::load_input() {
    const std::string input = m_parser.get("input");
    const uint64_t offset = m_parser.get<uint64_t>("--offset");
    const uint64_t size = m_parser.get<uint64_t>("--size");

    if( m_parser.get<bool>("--string") ){
        if( offset >= input.size() ){
            return {};
        }
        uint64_t avail = input.size() - offset;
        uint64_t count = size ? std::min(size, avail) : avail;
        return std::vector<uint8_t>(input.begin() + offset, input.begin() + offset + count);
    }

    Reader reader(input);
    return reader.read_all(offset, size);
}

/**
 * @brief Prints the hexdump back to front: the summary line first, then chunk lines
 *        from the last one down.
 * @param data Bytes to dump.
 * @throws std::system_error if writing to stdout fails.
 */
void DumpCommand::print_reversed(const std::vector<uint8_t>& data) const {
    Hexdump hd = hexdump_iter(data);
    while( auto line = hd.next_back() ){
        fmt::print("{}\n", *line);
    }
}

/**
 * @brief Executes the dump command.
 *
 * @return EXIT_SUCCESS (0) on success, EXIT_FAILURE (1) if the input can't be read
 *         or stdout can't be written.
 */
int DumpCommand::run() {
    std::vector<uint8_t> data;
    try {
        data = load_input();
    } catch( const Reader::ReadError& e ){
        logger->critical("{}", e.what());
        return 1;
    }

    logger->debug("dumping {:x} bytes from offset {:x}", data.size(), m_parser.get<uint64_t>("--offset"));
    logger->trace("first chunk: {}", to_hexdump(data.data(), std::min(data.size(), HEXDUMP_CHUNK_SIZE)));

    try {
        if( m_parser.get<bool>("--reverse") ){
            print_reversed(data);
        } else {
            hexdump(data);
        }
        if( std::fflush(stdout) != 0 ){
            throw std::system_error(errno, std::generic_category(), "fflush(stdout)");
        }
    } catch( const std::system_error& e ){
        logger->critical("write error: {}", e.what());
        return 1;
    }
    return 0;
}
