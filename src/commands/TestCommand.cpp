/**
 * @file TestCommand.cpp
 * @brief Implementation of the TestCommand for formatter self-testing.
 *
 * Renders a few known inputs and compares them against the expected text, so a
 * broken build is caught before any real data is dumped. Runs silently before
 * every other command.
 */

#include "TestCommand.hpp"

#include <set>

REGISTER_COMMAND(TestCommand);

/**
 * @brief Constructs a TestCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
TestCommand::TestCommand(bool reg) : Command(reg, TEST_CMD_NAME, "self-test") {
}

/**
 * @brief Compares a produced line with the expected text, logs a mismatch.
 * @param what Test case name for the log.
 * @param line Line produced by the sequence, empty if it was exhausted.
 * @param expected Expected line text.
 * @return True if the line is present and matches.
 */
static bool check_line(const char* what, const std::optional<Line>& line, const std::string& expected){
    if( !line ){
        logger->critical("selftest: {}: missing line", what);
        return false;
    }
    logger->trace("selftest: {}: \"{}\"", what, *line);
    if( line->str() != expected ){
        logger->critical("selftest: {}: expected \"{}\", got \"{}\"", what, expected, *line);
        return false;
    }
    return true;
}

/**
 * @brief Executes the formatter self-tests.
 *
 * - the 17-byte reference sample renders exactly as documented
 * - a full 16-byte chunk yields one chunk line plus the summary, all 63 columns wide
 * - alternating front/back pulls return every line exactly once
 *
 * @return EXIT_SUCCESS (0) if all tests pass, EXIT_FAILURE (1) if any test fails.
 */
int TestCommand::run() {
    static const std::string sample("12345\0\r\n\t .abcdef", 17);

    Hexdump hd = hexdump_iter(sample);
    if( hd.size() != 3 ){
        logger->critical("selftest: expected 3 lines, got {}", hd.size());
        return 1;
    }

    if( !check_line("line 0", hd.next(),  "|31323334 35000d0a 09202e61 62636465| 12345.... .abcde 00000000") ||
        !check_line("line 1", hd.next(),  "|66|                                  f                00000010") ||
        !check_line("summary", hd.next(), "                                                       00000011") ){
        return 1;
    }
    if( hd.next() ){
        logger->critical("selftest: extra line after summary");
        return 1;
    }

    std::vector<uint8_t> full(HEXDUMP_CHUNK_SIZE, 0xff);
    size_t nlines = 0;
    for( const Line& line : hexdump_iter(full) ){
        if( line.size() != HEXDUMP_LINE_WIDTH ){
            logger->critical("selftest: line width {} != {}", line.size(), HEXDUMP_LINE_WIDTH);
            return 1;
        }
        nlines++;
    }
    if( nlines != 2 ){
        logger->critical("selftest: 16 bytes gave {} lines instead of 2", nlines);
        return 1;
    }

    std::vector<uint8_t> seq(100);
    for( size_t i = 0; i < seq.size(); i++ ){
        seq[i] = (uint8_t)i;
    }
    Hexdump both = hexdump_iter(seq);
    const size_t expected = both.size();
    std::set<std::string> seen;
    for( bool front = true; !both.empty(); front = !front ){
        std::optional<Line> line = front ? both.next() : both.next_back();
        if( !line || !seen.insert(line->str()).second ){
            logger->critical("selftest: front/back interleaving returned a missing or duplicate line");
            return 1;
        }
    }
    if( seen.size() != expected ){
        logger->critical("selftest: front/back interleaving gave {} lines instead of {}", seen.size(), expected);
        return 1;
    }

    logger->trace("selftest: OK");
    return 0;
}
